#include "resource_probe.hpp"

#include <unistd.h>

#include <charconv>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>

#include "internal/observability/logging.hpp"

namespace pagequeue::resources {

namespace {

constexpr uint64_t kUnlimitedSentinel = 1ULL << 60;

std::string_view Trim(std::string_view text) {
  const auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string_view::npos) return {};
  const auto last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}

} // namespace

std::optional<uint64_t> ParseCgroupLimit(std::string_view text) {
  text = Trim(text);
  if (text.empty() || text == "max") {
    return std::nullopt;
  }

  uint64_t value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  if (value >= kUnlimitedSentinel) {
    return std::nullopt;
  }
  return value;
}

SystemResourceProbe::SystemResourceProbe(Options options) : options_(std::move(options)) {
}

uint64_t SystemResourceProbe::FreeDiskBytes() {
  std::error_code ec;
  auto            info = std::filesystem::space(options_.disk_path, ec);
  if (ec) {
    PAGEQUEUE_LOG_WARN("disk space query failed", {observability::StringField("path", options_.disk_path.string()),
                                                   observability::StringField("error", ec.message())});
    return 0;
  }
  return info.available;
}

uint64_t SystemResourceProbe::AvailableMemoryBytes() {
  if (auto ceiling = MemoryCeiling()) {
    const uint64_t rss = ResidentBytes();
    return rss >= *ceiling ? 0 : *ceiling - rss;
  }
  return SystemAvailableBytes();
}

std::optional<uint64_t> SystemResourceProbe::ReadLimitFile(const std::filesystem::path& path) const {
  std::ifstream in(path);
  if (!in) {
    return std::nullopt;
  }
  std::string line;
  std::getline(in, line);
  return ParseCgroupLimit(line);
}

std::optional<uint64_t> SystemResourceProbe::MemoryCeiling() const {
  if (auto limit = ReadLimitFile(options_.cgroup_root / "memory.max")) {
    return limit;
  }
  if (auto limit = ReadLimitFile(options_.cgroup_root / "memory" / "memory.limit_in_bytes")) {
    return limit;
  }
  if (options_.memory_limit_override > 0) {
    return options_.memory_limit_override;
  }
  return std::nullopt;
}

uint64_t SystemResourceProbe::ResidentBytes() const {
  // statm: size resident shared text lib data dt, in pages
  std::ifstream in(options_.proc_root / "self" / "statm");
  uint64_t      size_pages     = 0;
  uint64_t      resident_pages = 0;
  if (!(in >> size_pages >> resident_pages)) {
    return 0;
  }

  const long page_size = ::sysconf(_SC_PAGESIZE);
  return resident_pages * static_cast<uint64_t>(page_size > 0 ? page_size : 4096);
}

uint64_t SystemResourceProbe::SystemAvailableBytes() const {
  std::ifstream in(options_.proc_root / "meminfo");
  std::string   line;
  while (std::getline(in, line)) {
    if (line.rfind("MemAvailable:", 0) != 0) continue;

    std::istringstream fields(line.substr(13));
    uint64_t           kib = 0;
    if (fields >> kib) {
      return kib * 1024;
    }
  }

  PAGEQUEUE_LOG_WARN("MemAvailable not found", {observability::StringField("proc_root", options_.proc_root.string())});
  return 0;
}

} // namespace pagequeue::resources

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>

namespace pagequeue::resources {

/*
  Source of the live free-disk and available-memory figures used by
  admission and dispatch.
*/
class ResourceProbe {
 public:
  virtual ~ResourceProbe() = default;

  virtual uint64_t FreeDiskBytes()        = 0;
  virtual uint64_t AvailableMemoryBytes() = 0;
};

/*
  Probe backed by the host.

  Memory ceiling, first match wins:
      cgroup v2   <cgroup_root>/memory.max
      cgroup v1   <cgroup_root>/memory/memory.limit_in_bytes
      override    memory_limit_override (0 = none)
      none        MemAvailable from <proc_root>/meminfo

  Under a ceiling, available = ceiling - resident size of this process,
  clamped at zero. The system-wide free figure is ignored there because a
  container sees the host's memory.
*/
class SystemResourceProbe final : public ResourceProbe {
 public:
  struct Options {
    std::filesystem::path disk_path             = ".";
    std::filesystem::path cgroup_root           = "/sys/fs/cgroup";
    std::filesystem::path proc_root             = "/proc";
    uint64_t              memory_limit_override = 0;
  };

  explicit SystemResourceProbe(Options options);

  uint64_t FreeDiskBytes() override;
  uint64_t AvailableMemoryBytes() override;

  // Enforced ceiling, or nullopt when unconstrained.
  std::optional<uint64_t> MemoryCeiling() const;

  // Resident set size of the current process.
  uint64_t ResidentBytes() const;

 private:
  std::optional<uint64_t> ReadLimitFile(const std::filesystem::path& path) const;
  uint64_t                SystemAvailableBytes() const;

  Options options_;
};

/*
  Parses the content of a cgroup memory limit file.

  Returns nullopt for "max", for values at or above the v1 "unlimited"
  sentinel (2^60 and up) and for anything unparsable.
*/
std::optional<uint64_t> ParseCgroupLimit(std::string_view text);

} // namespace pagequeue::resources

#include "document_validator.hpp"

#include <algorithm>
#include <system_error>

#include "internal/pipeline/document_codec.hpp"
#include "internal/resources/resource_probe.hpp"
#include "internal/util/errors.hpp"

namespace pagequeue::validation {

namespace {

constexpr uint64_t kMiB = 1024 * 1024;

ValidationResult Reject(std::string message) {
  ValidationResult result;
  result.ok      = false;
  result.message = std::move(message);
  return result;
}

} // namespace

DocumentValidator::DocumentValidator(std::shared_ptr<pipeline::DocumentCodec> codec,
                                     std::shared_ptr<resources::ResourceProbe> probe, ValidatorLimits limits)
    : codec_(std::move(codec)), probe_(std::move(probe)), limits_(limits) {
}

uint64_t DocumentValidator::MaxAllowedSize() {
  const auto ram_allowance =
      static_cast<uint64_t>(static_cast<double>(probe_->AvailableMemoryBytes()) * limits_.ram_safety_margin);
  return std::min(ram_allowance, limits_.max_file_size);
}

ValidationResult DocumentValidator::CheckSizeAllowance(uint64_t size) {
  if (size == 0) {
    return Reject("File is empty");
  }

  const auto allowed = MaxAllowedSize();
  if (allowed == 0) {
    return Reject("Insufficient memory available to accept uploads");
  }
  if (size > allowed) {
    return Reject("File too large: " + std::to_string(size / kMiB) + "MB exceeds the current limit of " +
                  std::to_string(allowed / kMiB) + "MB");
  }

  ValidationResult result;
  result.ok                 = true;
  result.metadata.file_size = size;
  return result;
}

ValidationResult DocumentValidator::ValidateStructure(const std::filesystem::path& path) const {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return Reject("File does not exist");
  }

  const auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    return Reject("Cannot stat file: " + ec.message());
  }
  if (size == 0) {
    return Reject("File is empty");
  }
  if (path.extension() != ".pdoc") {
    return Reject("Not a paged document (.pdoc expected)");
  }

  pipeline::PagedDocument document;
  try {
    document = codec_->Read(path);
  } catch (const util::CorruptDocument& e) {
    return Reject(std::string("Corrupted document: ") + e.what());
  } catch (const std::exception& e) {
    return Reject(std::string("Cannot read document: ") + e.what());
  }

  auto encrypted = document.attributes.find("encrypted");
  if (encrypted != document.attributes.end() && encrypted->second == "true") {
    return Reject("Encrypted documents are not supported");
  }
  if (document.pages.empty()) {
    return Reject("Document has no pages");
  }

  ValidationResult result;
  result.ok                  = true;
  result.message             = "Document is valid";
  result.metadata.page_count = document.pages.size();
  result.metadata.file_size  = size;
  return result;
}

} // namespace pagequeue::validation

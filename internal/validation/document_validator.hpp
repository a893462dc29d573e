#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace pagequeue::pipeline {
class DocumentCodec;
}
namespace pagequeue::resources {
class ResourceProbe;
}

namespace pagequeue::validation {

struct DocumentMetadata {
  size_t   page_count = 0;
  uint64_t file_size  = 0;
};

struct ValidationResult {
  bool             ok = false;
  std::string      message;
  DocumentMetadata metadata;
};

struct ValidatorLimits {
  double   ram_safety_margin = 0.7;
  uint64_t max_file_size     = 0;
};

/*
  Upload-time checks, run before admission. Failures are terminal for the
  upload and never reach the queue.
*/
class DocumentValidator {
 public:
  DocumentValidator(std::shared_ptr<pipeline::DocumentCodec> codec, std::shared_ptr<resources::ResourceProbe> probe,
                    ValidatorLimits limits);

  // Largest accepted upload: min(available RAM * margin, max_file_size).
  uint64_t MaxAllowedSize();

  ValidationResult CheckSizeAllowance(uint64_t size);

  ValidationResult ValidateStructure(const std::filesystem::path& path) const;

 private:
  std::shared_ptr<pipeline::DocumentCodec>  codec_;
  std::shared_ptr<resources::ResourceProbe> probe_;
  ValidatorLimits                           limits_;
};

} // namespace pagequeue::validation

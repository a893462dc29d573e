#pragma once

#include <string>

#include "config/config.pb.h"

namespace pagequeue::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown fields are
  rejected. Defaults are applied and the result is validated before it is
  returned.
*/
class ConfigLoader {
 public:
  static pagequeue::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
};

// Replaces every unset (zero / empty) field with its default.
void ApplyDefaults(pagequeue::runtime::config::RuntimeConfig& config);

// Throws std::invalid_argument on values that cannot work.
void ValidateConfig(const pagequeue::runtime::config::RuntimeConfig& config);

} // namespace pagequeue::config

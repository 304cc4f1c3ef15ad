#pragma once

#include <string>

#include "config/config.pb.h"

namespace mvtracker::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected, defaults are filled in and the group list is validated.
  Every failure surfaces as util::ConfigError.
*/
class ConfigLoader {
 public:
  static mvtracker::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static mvtracker::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void ApplyDefaults(mvtracker::runtime::config::RuntimeConfig& config);
  static void Validate(const mvtracker::runtime::config::RuntimeConfig& config);
};

} // namespace mvtracker::config

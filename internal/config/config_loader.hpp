#pragma once

#include <string>

#include "config/config.pb.h"

namespace batch::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Missing values are filled from ApplyDefaults().
*/
class ConfigLoader {
 public:
  static batch::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static batch::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);

  static void ApplyDefaults(batch::runtime::config::RuntimeConfig& config);
};

} // namespace batch::config

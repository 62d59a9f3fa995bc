#pragma once

#include <string>

#include "config/config.pb.h"

namespace bookrec::config {

/*
  Loads RuntimeConfig from a YAML file.

  YAML is converted to JSON then parsed into protobuf (unknown keys are
  rejected). Defaults are filled in and the result validated; every
  problem is reported as util::ConfigError.
*/
class ConfigLoader {
 public:
  static bookrec::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void ApplyDefaults(bookrec::runtime::config::RuntimeConfig& config);
  static void Validate(const bookrec::runtime::config::RuntimeConfig& config);
};

} // namespace bookrec::config

#pragma once

#include <string>

#include "config/config.pb.h"

namespace heritage::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Fields left empty
  are filled with the built-in defaults and the result is validated.
*/
class ConfigLoader {
 public:
  static heritage::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Configuration used when no file is given.
  static heritage::runtime::config::RuntimeConfig Defaults();

  static void ApplyDefaults(heritage::runtime::config::RuntimeConfig& config);
  static void Validate(const heritage::runtime::config::RuntimeConfig& config);
};

} // namespace heritage::config

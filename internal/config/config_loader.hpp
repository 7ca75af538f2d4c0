#pragma once

#include <string>

#include "config/config.pb.h"

namespace dispatch::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Unknown keys are rejected. Unset (zero) tunables are filled from defaults.
*/
class ConfigLoader {
 public:
  static dispatch::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Fills every zero-valued tunable with its documented default.
  static void ApplyDefaults(dispatch::runtime::config::RuntimeConfig& config);
};

} // namespace dispatch::config

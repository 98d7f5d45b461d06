#pragma once

#include <string>

#include "config/config.pb.h"

namespace rowcast::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Defaults are applied to the result.
*/
class ConfigLoader {
 public:
  static rowcast::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static rowcast::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Fills zero-valued numeric fields and empty strings.
  static void ApplyDefaults(rowcast::runtime::config::RuntimeConfig& config);
};

} // namespace rowcast::config

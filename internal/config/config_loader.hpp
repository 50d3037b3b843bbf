#pragma once

#include <string>

#include "config/config.pb.h"

namespace snapshot::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Missing optional
  sections are filled with defaults and the result is validated before
  anything is built from it.
*/
class ConfigLoader {
 public:
  static snapshot::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void ApplyDefaults(snapshot::runtime::config::RuntimeConfig* config);
  static void Validate(const snapshot::runtime::config::RuntimeConfig& config);
};

} // namespace snapshot::config

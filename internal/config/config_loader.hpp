#pragma once

#include <string>

#include "config/config.pb.h"

namespace kuberoll::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Fields left at zero are filled by ApplyDefaults.
*/
class ConfigLoader {
 public:
  static kuberoll::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static kuberoll::runtime::config::RuntimeConfig Defaults();

  static void ApplyDefaults(kuberoll::runtime::config::RuntimeConfig* config);
};

} // namespace kuberoll::config

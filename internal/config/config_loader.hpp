#pragma once

#include <string>

#include "config/config.pb.h"

namespace jobguard::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected; out-of-range values raise std::invalid_argument.
*/
class ConfigLoader {
 public:
  static jobguard::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void Validate(const jobguard::runtime::config::RuntimeConfig& config);
};

} // namespace jobguard::config

#pragma once

#include <string>

#include "config/config.pb.h"

namespace reservation::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected.
*/
class ConfigLoader {
 public:
  static reservation::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static reservation::runtime::config::RuntimeConfig ParseYaml(const std::string& text);
};

} // namespace reservation::config

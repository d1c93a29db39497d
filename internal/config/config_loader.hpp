#pragma once

#include <string>

#include "config/config.pb.h"

namespace dispatch::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected so typos in a deployment file fail at startup.
*/
class ConfigLoader {
 public:
  static dispatch::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static dispatch::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace dispatch::config

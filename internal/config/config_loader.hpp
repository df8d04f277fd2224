#pragma once

#include <string>

#include "config/config.pb.h"

namespace rollback::config {

/*
  Loads RuntimeConfig from a YAML file.

  YAML is converted to JSON then parsed into protobuf, so unknown keys are
  rejected by the protobuf JSON parser.
*/
class ConfigLoader {
 public:
  static rollback::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static rollback::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace rollback::config

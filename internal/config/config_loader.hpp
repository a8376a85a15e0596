#pragma once

#include <string>

#include "config/config.pb.h"

namespace graphflow::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Unknown fields are
  rejected so typos fail at startup instead of silently using defaults.
*/
class ConfigLoader {
 public:
  static graphflow::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static graphflow::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Range and cross-field checks the schema cannot express. Both loaders
  // run it; throws std::runtime_error naming the offending field.
  static void Validate(const graphflow::runtime::config::RuntimeConfig& config);
};

} // namespace graphflow::config

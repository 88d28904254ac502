#pragma once

#include <string>

#include "config/config.pb.h"

namespace reactor::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so unknown
  keys and type mismatches are rejected by the protobuf parser.
*/
class ConfigLoader {
 public:
  static reactor::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static reactor::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Semantic checks the schema cannot express. Throws util::InvalidArgument.
  static void Validate(const reactor::runtime::config::RuntimeConfig& config);
};

} // namespace reactor::config

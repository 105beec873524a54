#pragma once

#include <string>

#include "config/config.pb.h"

namespace geocache::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown fields are
  rejected. Scalars may reference the environment as ${VAR} or
  ${VAR:default}. Quoted scalars are always strings.

  Errors throw util::ConfigurationError.
*/
class ConfigLoader {
 public:
  static geocache::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static geocache::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);

  // Replaces ${VAR} and ${VAR:default}. An unset variable without default is an error.
  static std::string ExpandEnvironment(const std::string& value);
};

} // namespace geocache::config

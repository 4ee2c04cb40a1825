#pragma once

#include <string>

#include "config/config.pb.h"

namespace flowstore::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Unknown fields are
  rejected.
*/
class ConfigLoader {
 public:
  static flowstore::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static flowstore::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace flowstore::config

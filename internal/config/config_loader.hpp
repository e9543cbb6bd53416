#pragma once

#include <string>

#include "config/config.pb.h"

namespace procdb::config {

/*
  Loads RuntimeConfig from a YAML file or YAML text.

  YAML is converted to JSON then parsed into protobuf. Unknown fields are
  rejected. Errors are std::runtime_error.
*/
class ConfigLoader {
 public:
  static procdb::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static procdb::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace procdb::config

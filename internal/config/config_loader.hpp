#pragma once

#include <string>

#include "config/config.pb.h"

namespace valuegraph::config {

/*
  Loads RuntimeConfig from a YAML file.

  YAML is converted to a protobuf Struct, rendered as JSON, then parsed into the
  config message. Unknown fields are rejected.
*/
class ConfigLoader {
 public:
  static valuegraph::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static valuegraph::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& text);
};

} // namespace valuegraph::config

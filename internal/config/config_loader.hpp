#pragma once

#include <string>

#include "config/config.pb.h"

namespace rackwise::config {

/*
  Loads RuntimeConfig from a YAML file.

  YAML -> google.protobuf.Value -> JSON -> RuntimeConfig, so unknown keys
  are rejected by the protobuf JSON parser. Unset fields get defaults, then
  the result is validated (std::invalid_argument on conflicting settings).
*/
class ConfigLoader {
 public:
  static rackwise::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void ApplyDefaults(rackwise::runtime::config::RuntimeConfig* config);
  static void Validate(const rackwise::runtime::config::RuntimeConfig& config);
};

} // namespace rackwise::config

#pragma once

#include <string>

#include "config/config.pb.h"

namespace flowstore::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unset cache
  limits are filled with their defaults (2000 entries, 120s idle).
*/
class ConfigLoader {
 public:
  static flowstore::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void ApplyDefaults(flowstore::runtime::config::RuntimeConfig* config);
};

} // namespace flowstore::config

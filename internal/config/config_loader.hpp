#pragma once

#include <string>

#include "config/config.pb.h"

namespace framecache::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Unset tunables are filled with their defaults and the
  required paths are validated before the config is returned.
*/
class ConfigLoader {
 public:
  static framecache::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void ApplyDefaults(framecache::runtime::config::RuntimeConfig& config);
  static void Validate(const framecache::runtime::config::RuntimeConfig& config);
};

} // namespace framecache::config

#pragma once

#include <string>

#include "graphingest/config/v1/config.pb.h"

namespace graphingest::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Zero or absent ingest
  tunables are replaced with their defaults, see ApplyDefaults.
*/
class ConfigLoader {
 public:
  static graphingest::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void ApplyDefaults(graphingest::runtime::config::RuntimeConfig& config);
};

} // namespace graphingest::config

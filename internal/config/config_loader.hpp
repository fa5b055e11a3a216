#pragma once

#include <string>

#include "config/config.pb.h"

namespace fraudit::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Zero or absent numeric fields are replaced by their defaults.
*/
class ConfigLoader {
 public:
  static RuntimeConfig LoadFromYaml(const std::string& path);

  // Fills every unset field with its documented default.
  static void ApplyDefaults(RuntimeConfig* config);

  static RuntimeConfig Defaults();
};

} // namespace fraudit::config

#pragma once

#include <string>

#include "config/config.pb.h"

namespace tgstats::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected so that typos in the file do not go unnoticed. The decoded
  values are then checked (log level name, non-negative scale, single line
  marker, known timezone); any failure throws std::runtime_error.
*/
class ConfigLoader {
 public:
  static tgstats::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
};

} // namespace tgstats::config

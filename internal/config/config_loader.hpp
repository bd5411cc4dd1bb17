#pragma once

#include <string>

#include "config/config.pb.h"

namespace torrentfs::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Unknown fields and missing required values are rejected.
*/
class ConfigLoader {
 public:
  static torrentfs::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void Validate(const torrentfs::runtime::config::RuntimeConfig& config);
};

} // namespace torrentfs::config

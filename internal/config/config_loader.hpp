#pragma once

#include <string>

#include "config/config.pb.h"

namespace semconv::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static semconv::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static semconv::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);
};

// Throws util::ConfigError on the first structural problem found.
void ValidateConfig(const semconv::runtime::config::RuntimeConfig& config);

} // namespace semconv::config

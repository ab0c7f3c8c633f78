#pragma once

#include <string>

#include "config/config.pb.h"

namespace caretask::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Unknown fields are rejected; missing sections fall back to defaults.
*/
class ConfigLoader {
 public:
  static caretask::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Fills defaults and rejects unusable values. Throws ValidationError.
  static void Normalize(caretask::runtime::config::RuntimeConfig& config);

  static constexpr const char* kDefaultBindAddress = "0.0.0.0:50061";
};

} // namespace caretask::config

#pragma once

#include <string>

#include "config/config.pb.h"

namespace edgestore::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to a google.protobuf.Value, printed as JSON and parsed
  into the RuntimeConfig message. Unknown fields are rejected.
  Zero-valued tuning knobs are replaced by their defaults.
*/
class ConfigLoader {
 public:
  static edgestore::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static edgestore::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml_text);

  // Fills unset tuning values; keeps everything the caller set explicitly.
  static void ApplyDefaults(edgestore::runtime::config::RuntimeConfig& config);
};

} // namespace edgestore::config

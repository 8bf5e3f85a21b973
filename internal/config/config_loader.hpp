#pragma once

#include <string>

#include "config/config.pb.h"

namespace uplink::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so durations are
  written the protobuf way ("30s", "250ms" is not accepted, "0.25s" is).
  Unknown keys are rejected.
*/
class ConfigLoader {
 public:
  static uplink::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static uplink::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace uplink::config

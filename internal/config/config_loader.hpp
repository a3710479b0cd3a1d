#pragma once

#include <string>

#include "config/config.pb.h"

namespace stagesync::config {

/*
  Loads RuntimeConfig from a YAML file.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Quoted scalars stay strings, so "2024" is an id, not a number.

  STAGESYNC_BIND_ADDRESS, STAGESYNC_EVENT_ID and STAGESYNC_PERFORMANCE_DATE
  override the file. The result is validated (event id without '/',
  performance date as YYYY-MM-DD, object stores with a root path); every
  failure is a std::runtime_error.
*/
class ConfigLoader {
 public:
  static stagesync::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
};

} // namespace stagesync::config

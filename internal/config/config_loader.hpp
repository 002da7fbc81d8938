#pragma once

#include <string>

#include "config/config.pb.h"

namespace resonance::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Load() additionally applies RESONANCE_* environment overrides and
  fills every unset tunable with its documented default.
*/
class ConfigLoader {
 public:
  static resonance::runtime::config::RuntimeConfig Load(const std::string& path);

  static resonance::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Config with nothing but defaults; used when no file is given.
  static resonance::runtime::config::RuntimeConfig Defaults();

  static void ApplyEnvironment(resonance::runtime::config::RuntimeConfig* config);
  static void ApplyDefaults(resonance::runtime::config::RuntimeConfig* config);

  // Throws std::runtime_error on inconsistent thresholds.
  static void Validate(const resonance::runtime::config::RuntimeConfig& config);
};

} // namespace resonance::config

#pragma once

#include <string>

#include "config/config.pb.h"

namespace recon::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Quoted scalars stay strings ("1010" is an account id, not a
  number).
*/
class ConfigLoader {
 public:
  static recon::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Throws std::runtime_error naming the first invalid field.
  static void Validate(const recon::runtime::config::RuntimeConfig& config);
};

} // namespace recon::config

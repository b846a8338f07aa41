#pragma once

#include <string>

#include "config/config.pb.h"

namespace taskvault::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Fields the file
  leaves out take the values of Defaults().
*/
class ConfigLoader {
 public:
  static taskvault::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // vault.root ".", 12h approval ttl, 3 retries, ENFORCE.
  static taskvault::runtime::config::RuntimeConfig Defaults();
};

} // namespace taskvault::config

#pragma once

#include <string>

#include "config/config.pb.h"

namespace ledger::config {

inline constexpr const char* kDefaultVariantSeparator = "BUFFER";

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Unknown fields are
  rejected; defaults are applied and the result validated before it is
  returned.
*/
class ConfigLoader {
 public:
  static ledger::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static ledger::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Fills omitted sections (memory database, default separator).
  static void ApplyDefaults(ledger::runtime::config::RuntimeConfig& config);

  // Throws std::runtime_error describing the first invalid field.
  static void Validate(const ledger::runtime::config::RuntimeConfig& config);
};

} // namespace ledger::config

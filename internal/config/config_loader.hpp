#pragma once

#include <string>

#include "config/config.pb.h"

namespace checkout::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown fields are
  rejected. Environment overrides are applied last:

    CHECKOUT_PAYMENT_API_KEY -> payment.api_key
*/
class ConfigLoader {
 public:
  static checkout::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static checkout::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);

  static void ApplyEnvironmentOverrides(checkout::runtime::config::RuntimeConfig& config);
};

} // namespace checkout::config

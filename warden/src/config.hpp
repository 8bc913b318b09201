#pragma once
#include "guard.hpp"
#include <string>

// YAML protection config:
//
//   key: <base64>          (or key-text: <utf-8 string>, exactly one of them)
//   zeta: 123456789        decimal, any size
//   eta: 32
//   on-tamper: raise       raise | return-sentinel | call-anyway (default raise)
//
// Missing or invalid fields throw ConfigError naming the field.
guard::ProtectionConfig parse_config(const std::string& yaml_text);
guard::ProtectionConfig load_config(const std::string& path);

#pragma once
#include "params.hpp"
#include <string>

// YAML parameter document:
//   ---
//   type: params
//   values: [1, 2, 3, ...]
std::string emit_params_yaml(const ParamList& params);
ParamList   parse_params_yaml(const std::string& yaml_text);

// Load a parameter file, YAML or msgpack (auto-detected by first byte).
ParamList load_params(const std::string& path);

#pragma once

#include <string>
#include <yaml-cpp/yaml.h>
#include <core/types.hpp>

// Parse an extra-variables string (JSON or YAML flow map). An empty or
// blank string is an empty map; anything other than a map is rejected.
Result<YAML::Node> parse_extra_vars(const std::string& vars);

// Overlay `overrides` on `defaults` (top-level keys, overrides win) and
// render the result as a single-line JSON map. Booleans, numbers and null
// stay unquoted.
Result<std::string> merge_extra_vars(const std::string& defaults,
                                     const std::string& overrides);

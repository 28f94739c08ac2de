#pragma once

#include <string>
#include <yaml-cpp/yaml.h>

// Render a YAML node as single-line JSON: {"a": 1, "b": [true, "x"]}.
//
// Plain scalars that read as booleans, null or numbers keep that type;
// quoted scalars and everything else become JSON strings.
std::string yaml_to_json(const YAML::Node& node);

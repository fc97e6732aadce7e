#pragma once

#include <optional>
#include <string>
#include <yaml-cpp/yaml.h>

namespace StepValidator {

// Check a raw step list before it is accepted. Returns the first violation,
// reported against its 1-based step index, or nothing when the list is valid.
std::optional<std::string> validate(const YAML::Node& steps);

// True when the node carries a non-null, non-empty value under key
bool has_field(const YAML::Node& node, const std::string& key);

}

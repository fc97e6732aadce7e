#pragma once

#include "MacroStep.hpp"
#include <optional>
#include <string>
#include <vector>

struct ParameterSpec {
    std::string name;
    std::string description;
    bool required = false;
    std::optional<std::string> default_value;
};

struct MacroDefinition {
    std::string name;
    std::string description;
    int timeout = 0;                       // Seconds; 0 means the executor default
    std::vector<ParameterSpec> parameters;
    std::vector<MacroStep> steps;

    bool has_includes() const;
};

struct LoadError {
    std::string file_path;
    std::string macro_name;
    std::string message;
};

#pragma once

#include "MacroStep.hpp"
#include <functional>
#include <optional>
#include <string>

namespace ParamSubstitution {

using StringTransform = std::function<std::string(const std::string&)>;

// Replace each {{name}} token with its parameter value in one left-to-right scan.
// Unknown tokens are copied through unchanged and replacement text is never rescanned.
std::string substitute(const std::string& text, const ParamMap& params);
std::optional<std::string> substitute(const std::optional<std::string>& text, const ParamMap& params);
inline std::string substitute(const char* text, const ParamMap& params) {
    return substitute(std::string(text), params);
}

// Same scan with case-insensitive token names, used to remap an included
// macro's placeholders onto the values given by the include step
std::string remap(const std::string& text, const ParamMap& mapping);

// Apply fn to every string carried by the step, including path segments and params values
void transform_strings(MacroStep& step, const StringTransform& fn);

}

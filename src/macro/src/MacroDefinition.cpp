#include "MacroDefinition.hpp"
#include <algorithm>

bool MacroDefinition::has_includes() const {
    return std::any_of(steps.begin(), steps.end(),
                       [](const MacroStep& step) { return step.is<IncludeStep>(); });
}

#pragma once

#include "MacroDefinition.hpp"
#include <yaml-cpp/yaml.h>

// Macro documents are lenient: unknown keys are ignored so documents can carry
// annotations for other tools.
namespace YAML {

    template<>
    struct convert<ParameterSpec> {
        static bool decode(const Node& node, ParameterSpec& rhs);
    };

    template<>
    struct convert<ElementCriteria> {
        static bool decode(const Node& node, ElementCriteria& rhs);
    };

    template<>
    struct convert<MacroStep> {
        static bool decode(const Node& node, MacroStep& rhs);
    };

    template<>
    struct convert<MacroDefinition> {
        static bool decode(const Node& node, MacroDefinition& rhs);
    };

}

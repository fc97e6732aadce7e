#include "StepValidator.hpp"
#include "MacroStep.hpp"
#include "StringUtils.hpp"
#include <algorithm>
#include <initializer_list>
#include <vector>

namespace StepValidator {

namespace {

bool has_any(const YAML::Node& node, std::initializer_list<const char*> keys) {
    return std::any_of(keys.begin(), keys.end(), [&node](const char* key) { return has_field(node, key); });
}

std::string step_error(size_t index, const std::string& action, const std::string& reason) {
    return "Step " + std::to_string(index) + " (" + action + "): " + reason;
}

std::optional<std::string> check_required_fields(const YAML::Node& step, size_t index, const std::string& action) {
    if (action == "send_keys" || action == "keys") {
        if (!has_field(step, "keys")) return step_error(index, action, "requires 'keys' field");
    } else if (action == "find") {
        if (!has_any(step, {"automation_id", "name", "control_type", "class_name"})) {
            return step_error(index, action,
                              "requires at least one of 'automation_id', 'name', 'control_type', 'class_name'");
        }
    } else if (action == "find_by_path") {
        if (!has_field(step, "path")) return step_error(index, action, "requires 'path' field");
    } else if (action == "type") {
        if (!has_field(step, "text")) return step_error(index, action, "requires 'text' field");
    } else if (action == "set_value") {
        if (!has_field(step, "ref") || !has_field(step, "value")) {
            return step_error(index, action, "requires 'ref' and 'value' fields");
        }
    } else if (action == "wait") {
        if (!has_field(step, "seconds")) return step_error(index, action, "requires 'seconds' field");
    } else if (action == "macro" || action == "include") {
        if (!has_field(step, "macro_name")) return step_error(index, action, "requires 'macro_name' field");
    } else if (action == "wait_for_window") {
        if (!has_field(step, "title_contains")) return step_error(index, action, "requires 'title_contains' field");
    } else if (action == "wait_for_enabled") {
        if (!has_any(step, {"automation_id", "name", "control_type", "class_name", "ref"})) {
            return step_error(index, action,
                              "requires 'ref' or at least one of 'automation_id', 'name', 'control_type', 'class_name'");
        }
    } else if (action == "file_dialog") {
        if (!has_field(step, "text")) return step_error(index, action, "requires 'text' field");
    } else if (action == "attach") {
        if (!has_any(step, {"process_name", "pid"})) {
            return step_error(index, action, "requires 'process_name' or 'pid' field");
        }
    } else if (action == "verify") {
        if (!has_field(step, "ref") || !has_field(step, "property") || !has_field(step, "expected")) {
            return step_error(index, action, "requires 'ref', 'property' and 'expected' fields");
        }
    }
    return std::nullopt;
}

}

bool has_field(const YAML::Node& node, const std::string& key) {
    const YAML::Node value = node[key];
    if (!value || value.IsNull()) return false;
    if (value.IsScalar()) return !value.Scalar().empty();
    return true;
}

std::optional<std::string> validate(const YAML::Node& steps) {
    if (!steps || !steps.IsSequence() || steps.size() == 0) {
        return std::string("Macro must have at least one step");
    }

    const auto& actions = known_actions();
    for (size_t i = 0; i < steps.size(); ++i) {
        const size_t index = i + 1;
        const YAML::Node step = steps[i];

        if (!step.IsMap()) {
            return "Step " + std::to_string(index) + ": step must be a mapping";
        }
        if (!has_field(step, "action")) {
            return "Step " + std::to_string(index) + ": missing 'action' field";
        }

        const std::string action = StringUtils::to_lower(StringUtils::trimmed(step["action"].as<std::string>()));
        if (std::find(actions.begin(), actions.end(), action) == actions.end()) {
            return "Step " + std::to_string(index) + ": unknown action '" + step["action"].as<std::string>() +
                   "'. Valid actions: " + StringUtils::join(actions, ", ");
        }

        if (auto error = check_required_fields(step, index, action)) {
            return error;
        }
    }
    return std::nullopt;
}

}

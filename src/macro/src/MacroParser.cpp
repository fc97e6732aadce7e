#include "MacroParser.hpp"
#include "StringUtils.hpp"
#include <stdexcept>

namespace {

bool present(const YAML::Node& node, const char* key) {
    const YAML::Node value = node[key];
    return value && !value.IsNull();
}

std::optional<std::string> optional_string(const YAML::Node& node, const char* key) {
    if (!present(node, key)) return std::nullopt;
    return node[key].as<std::string>();
}

std::string required_string(const YAML::Node& node, const char* key, const std::string& action) {
    if (!present(node, key)) {
        throw std::runtime_error("Missing required field '" + std::string(key) + "' for " + action + " step");
    }
    return node[key].as<std::string>();
}

ParamMap parse_params(const YAML::Node& node) {
    ParamMap params;
    if (!present(node, "params")) return params;

    const YAML::Node params_node = node["params"];
    if (!params_node.IsMap()) {
        throw std::runtime_error("'params' must be a mapping");
    }
    for (auto it = params_node.begin(); it != params_node.end(); ++it) {
        params[it->first.as<std::string>()] = it->second.IsNull() ? std::string() : it->second.as<std::string>();
    }
    return params;
}

StepAction parse_action(const std::string& action, const YAML::Node& node) {
    if (action == "focus") {
        return FocusStep{};
    }
    if (action == "attach") {
        AttachStep step;
        step.process_name = optional_string(node, "process_name");
        if (present(node, "pid")) step.pid = node["pid"].as<int>();
        return step;
    }
    if (action == "snapshot") {
        SnapshotStep step;
        if (present(node, "max_depth")) step.max_depth = node["max_depth"].as<int>();
        return step;
    }
    if (action == "find") {
        FindStep step;
        step.criteria = node.as<ElementCriteria>();
        step.save_as = optional_string(node, "save_as");
        return step;
    }
    if (action == "find_by_path") {
        FindByPathStep step;
        if (present(node, "path")) step.path = node["path"].as<std::vector<std::string>>();
        step.save_as = optional_string(node, "save_as");
        return step;
    }
    if (action == "click") {
        return ClickStep{optional_string(node, "ref")};
    }
    if (action == "right_click") {
        return RightClickStep{optional_string(node, "ref")};
    }
    if (action == "type") {
        return TypeStep{required_string(node, "text", action)};
    }
    if (action == "set_value") {
        return SetValueStep{required_string(node, "ref", action), required_string(node, "value", action)};
    }
    if (action == "get_value") {
        return GetValueStep{optional_string(node, "ref")};
    }
    if (action == "send_keys" || action == "keys") {
        return SendKeysStep{required_string(node, "keys", action)};
    }
    if (action == "wait") {
        WaitStep step;
        if (present(node, "seconds")) step.seconds = node["seconds"].as<double>();
        return step;
    }
    if (action == "wait_for_enabled") {
        WaitForEnabledStep step;
        step.criteria = node.as<ElementCriteria>();
        step.ref = optional_string(node, "ref");
        if (present(node, "enabled")) step.enabled = node["enabled"].as<bool>();
        step.save_as = optional_string(node, "save_as");
        return step;
    }
    if (action == "macro") {
        return MacroCallStep{required_string(node, "macro_name", action), parse_params(node)};
    }
    if (action == "include") {
        // A missing macro_name is reported by the include expander
        return IncludeStep{optional_string(node, "macro_name").value_or(""), parse_params(node)};
    }
    if (action == "launch") {
        LaunchStep step;
        step.exe_path = required_string(node, "exe_path", action);
        step.arguments = optional_string(node, "arguments");
        step.working_directory = optional_string(node, "working_directory");
        if (present(node, "if_not_running")) step.if_not_running = node["if_not_running"].as<bool>();
        return step;
    }
    if (action == "wait_for_window") {
        WaitForWindowStep step;
        step.title_contains = required_string(node, "title_contains", action);
        step.criteria = node.as<ElementCriteria>();
        return step;
    }
    if (action == "screenshot") {
        return ScreenshotStep{};
    }
    if (action == "properties") {
        return PropertiesStep{optional_string(node, "ref")};
    }
    if (action == "children") {
        return ChildrenStep{optional_string(node, "ref"), optional_string(node, "save_as")};
    }
    if (action == "file_dialog") {
        return FileDialogStep{required_string(node, "text", action)};
    }
    if (action == "verify") {
        VerifyStep step;
        step.ref = required_string(node, "ref", action);
        step.property = required_string(node, "property", action);
        step.expected = required_string(node, "expected", action);
        if (present(node, "match_mode")) step.match_mode = node["match_mode"].as<std::string>();
        step.message = optional_string(node, "message");
        return step;
    }
    throw std::runtime_error("Unknown action: " + action);
}

}

namespace YAML {

bool convert<ParameterSpec>::decode(const Node& node, ParameterSpec& rhs) {
    if (!node.IsMap()) {
        throw std::runtime_error("Parameter definition must be a mapping");
    }
    if (!present(node, "name")) {
        throw std::runtime_error("Missing required field 'name' in parameter");
    }
    rhs.name = node["name"].as<std::string>();
    rhs.description = optional_string(node, "description").value_or("");
    if (present(node, "required")) rhs.required = node["required"].as<bool>();
    rhs.default_value = optional_string(node, "default");
    return true;
}

bool convert<ElementCriteria>::decode(const Node& node, ElementCriteria& rhs) {
    rhs.automation_id = optional_string(node, "automation_id");
    rhs.name = optional_string(node, "name");
    rhs.class_name = optional_string(node, "class_name");
    rhs.control_type = optional_string(node, "control_type");
    return true;
}

bool convert<MacroStep>::decode(const Node& node, MacroStep& rhs) {
    if (!node.IsMap()) {
        throw std::runtime_error("Step must be a mapping");
    }
    if (!present(node, "action")) {
        throw std::runtime_error("Missing required field 'action' in step");
    }

    const std::string action = StringUtils::to_lower(StringUtils::trimmed(node["action"].as<std::string>()));
    rhs.action = parse_action(action, node);
    rhs.description = optional_string(node, "description");
    if (present(node, "timeout")) rhs.timeout = node["timeout"].as<int>();
    if (present(node, "retry_interval")) rhs.retry_interval = node["retry_interval"].as<double>();
    return true;
}

bool convert<MacroDefinition>::decode(const Node& node, MacroDefinition& rhs) {
    if (!node.IsMap()) {
        throw std::runtime_error("Macro document must be a mapping");
    }

    rhs.name = optional_string(node, "name").value_or("");
    rhs.description = optional_string(node, "description").value_or("");
    if (present(node, "timeout")) rhs.timeout = node["timeout"].as<int>();
    if (present(node, "parameters")) {
        rhs.parameters = node["parameters"].as<std::vector<ParameterSpec>>();
    }
    if (present(node, "steps")) {
        rhs.steps = node["steps"].as<std::vector<MacroStep>>();
    }
    return true;
}

}

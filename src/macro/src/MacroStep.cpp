#include "MacroStep.hpp"
#include "StringUtils.hpp"
#include <algorithm>

namespace {

struct ActionNameVisitor {
    const char* operator()(const FocusStep&) const { return "focus"; }
    const char* operator()(const AttachStep&) const { return "attach"; }
    const char* operator()(const SnapshotStep&) const { return "snapshot"; }
    const char* operator()(const FindStep&) const { return "find"; }
    const char* operator()(const FindByPathStep&) const { return "find_by_path"; }
    const char* operator()(const ClickStep&) const { return "click"; }
    const char* operator()(const RightClickStep&) const { return "right_click"; }
    const char* operator()(const TypeStep&) const { return "type"; }
    const char* operator()(const SetValueStep&) const { return "set_value"; }
    const char* operator()(const GetValueStep&) const { return "get_value"; }
    const char* operator()(const SendKeysStep&) const { return "send_keys"; }
    const char* operator()(const WaitStep&) const { return "wait"; }
    const char* operator()(const WaitForEnabledStep&) const { return "wait_for_enabled"; }
    const char* operator()(const MacroCallStep&) const { return "macro"; }
    const char* operator()(const IncludeStep&) const { return "include"; }
    const char* operator()(const LaunchStep&) const { return "launch"; }
    const char* operator()(const WaitForWindowStep&) const { return "wait_for_window"; }
    const char* operator()(const ScreenshotStep&) const { return "screenshot"; }
    const char* operator()(const PropertiesStep&) const { return "properties"; }
    const char* operator()(const ChildrenStep&) const { return "children"; }
    const char* operator()(const FileDialogStep&) const { return "file_dialog"; }
    const char* operator()(const VerifyStep&) const { return "verify"; }
};

}

std::string MacroStep::action_name() const {
    return std::visit(ActionNameVisitor{}, action);
}

const std::vector<std::string>& known_actions() {
    static const std::vector<std::string> actions = [] {
        std::vector<std::string> names = {
            "attach", "children", "click", "file_dialog", "find", "find_by_path", "focus",
            "get_value", "include", "keys", "launch", "macro", "properties", "right_click",
            "screenshot", "send_keys", "set_value", "snapshot", "type", "verify", "wait",
            "wait_for_enabled", "wait_for_window"
        };
        std::sort(names.begin(), names.end());
        return names;
    }();
    return actions;
}

bool is_attachment_independent(const std::string& action_name) {
    static const std::vector<std::string> independent = {
        "attach", "wait", "macro", "include", "launch", "wait_for_window"
    };
    return std::any_of(independent.begin(), independent.end(),
                       [&action_name](const std::string& a) { return StringUtils::iequals(a, action_name); });
}

#pragma once

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

using ParamMap = std::map<std::string, std::string>;

struct ElementCriteria {
    std::optional<std::string> automation_id;
    std::optional<std::string> name;
    std::optional<std::string> class_name;
    std::optional<std::string> control_type;

    bool empty() const {
        return !automation_id && !name && !class_name && !control_type;
    }
};

struct FocusStep {};

struct AttachStep {
    std::optional<std::string> process_name;
    std::optional<int> pid;
};

struct SnapshotStep {
    std::optional<int> max_depth;
};

struct FindStep {
    ElementCriteria criteria;
    std::optional<std::string> save_as;
};

struct FindByPathStep {
    std::vector<std::string> path;
    std::optional<std::string> save_as;
};

struct ClickStep {
    std::optional<std::string> ref;
};

struct RightClickStep {
    std::optional<std::string> ref;
};

struct TypeStep {
    std::string text;
};

struct SetValueStep {
    std::string ref;
    std::string value;
};

struct GetValueStep {
    std::optional<std::string> ref;
};

struct SendKeysStep {
    std::string keys;
};

struct WaitStep {
    double seconds = 1.0;
};

struct WaitForEnabledStep {
    ElementCriteria criteria;
    std::optional<std::string> ref;
    bool enabled = true;
    std::optional<std::string> save_as;
};

struct MacroCallStep {
    std::string macro_name;
    ParamMap params;
};

// Load-time directive; the include expander replaces it before execution
struct IncludeStep {
    std::string macro_name;
    ParamMap params;
};

struct LaunchStep {
    std::string exe_path;
    std::optional<std::string> arguments;
    std::optional<std::string> working_directory;
    bool if_not_running = true;
};

struct WaitForWindowStep {
    std::string title_contains;
    ElementCriteria criteria;
};

struct ScreenshotStep {};

struct PropertiesStep {
    std::optional<std::string> ref;
};

struct ChildrenStep {
    std::optional<std::string> ref;
    std::optional<std::string> save_as;
};

struct FileDialogStep {
    std::string text;
};

struct VerifyStep {
    std::string ref;
    std::string property;
    std::string expected;
    std::string match_mode = "equals";
    std::optional<std::string> message;
};

using StepAction = std::variant<
    FocusStep,
    AttachStep,
    SnapshotStep,
    FindStep,
    FindByPathStep,
    ClickStep,
    RightClickStep,
    TypeStep,
    SetValueStep,
    GetValueStep,
    SendKeysStep,
    WaitStep,
    WaitForEnabledStep,
    MacroCallStep,
    IncludeStep,
    LaunchStep,
    WaitForWindowStep,
    ScreenshotStep,
    PropertiesStep,
    ChildrenStep,
    FileDialogStep,
    VerifyStep
>;

struct MacroStep {
    StepAction action;
    std::optional<std::string> description;

    // Per-step overrides; absent or zero means the executor default
    std::optional<int> timeout;
    std::optional<double> retry_interval;

    // Canonical action name ("send_keys" for a step written as "keys")
    std::string action_name() const;

    template <typename T>
    bool is() const { return std::holds_alternative<T>(action); }
};

// Canonical action names accepted in documents, sorted
const std::vector<std::string>& known_actions();

// Actions that may run while no target process is attached
bool is_attachment_independent(const std::string& action_name);

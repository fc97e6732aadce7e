#include "MacroExecutor.hpp"
#include "IncludeExpander.hpp"
#include "LogUtils.hpp"
#include "ParamSubstitution.hpp"
#include "StepDispatcher.hpp"
#include "StringUtils.hpp"
#include <fmt/format.h>
#include <vector>

namespace {

void add_field(std::vector<std::string>& parts, const char* key, const std::optional<std::string>& value) {
    if (value) parts.push_back(fmt::format("{}={}", key, *value));
}

void add_criteria(std::vector<std::string>& parts, const ElementCriteria& c) {
    add_field(parts, "automation_id", c.automation_id);
    add_field(parts, "name", c.name);
    add_field(parts, "class_name", c.class_name);
    add_field(parts, "control_type", c.control_type);
}

// Key fields of a step for progress lines
struct SummaryVisitor {
    std::vector<std::string>& parts;

    void operator()(const FocusStep&) const {}
    void operator()(const ScreenshotStep&) const {}
    void operator()(const AttachStep& s) const {
        add_field(parts, "process", s.process_name);
        if (s.pid) parts.push_back(fmt::format("pid={}", *s.pid));
    }
    void operator()(const SnapshotStep& s) const {
        if (s.max_depth) parts.push_back(fmt::format("max_depth={}", *s.max_depth));
    }
    void operator()(const FindStep& s) const {
        add_criteria(parts, s.criteria);
        add_field(parts, "save_as", s.save_as);
    }
    void operator()(const FindByPathStep& s) const {
        parts.push_back(fmt::format("path=[{} segments]", s.path.size()));
        add_field(parts, "save_as", s.save_as);
    }
    void operator()(const ClickStep& s) const { add_field(parts, "ref", s.ref); }
    void operator()(const RightClickStep& s) const { add_field(parts, "ref", s.ref); }
    void operator()(const GetValueStep& s) const { add_field(parts, "ref", s.ref); }
    void operator()(const PropertiesStep& s) const { add_field(parts, "ref", s.ref); }
    void operator()(const TypeStep& s) const { parts.push_back("text=" + s.text); }
    void operator()(const SetValueStep& s) const {
        parts.push_back("ref=" + s.ref);
        parts.push_back("value=" + s.value);
    }
    void operator()(const SendKeysStep& s) const { parts.push_back("keys=" + s.keys); }
    void operator()(const WaitStep& s) const { parts.push_back(fmt::format("seconds={}", s.seconds)); }
    void operator()(const WaitForEnabledStep& s) const {
        add_field(parts, "ref", s.ref);
        add_criteria(parts, s.criteria);
        parts.push_back(fmt::format("enabled={}", s.enabled));
    }
    void operator()(const MacroCallStep& s) const { parts.push_back("macro=" + s.macro_name); }
    void operator()(const IncludeStep& s) const { parts.push_back("macro=" + s.macro_name); }
    void operator()(const LaunchStep& s) const {
        parts.push_back("exe=" + s.exe_path);
        if (s.if_not_running) parts.push_back("if_not_running");
    }
    void operator()(const WaitForWindowStep& s) const {
        parts.push_back("title_contains=" + s.title_contains);
        add_criteria(parts, s.criteria);
    }
    void operator()(const ChildrenStep& s) const {
        add_field(parts, "ref", s.ref);
        add_field(parts, "save_as", s.save_as);
    }
    void operator()(const FileDialogStep& s) const { parts.push_back("path=" + s.text); }
    void operator()(const VerifyStep& s) const {
        parts.push_back("ref=" + s.ref);
        parts.push_back(fmt::format("{} {} \"{}\"", s.property, s.match_mode, s.expected));
    }
};

std::string summarize(const MacroStep& step) {
    const std::string action = step.action_name();
    if (step.description && !step.description->empty()) {
        return action + " — " + *step.description;
    }

    std::vector<std::string> parts;
    std::visit(SummaryVisitor{parts}, step.action);
    if (parts.empty()) return action;
    return action + " " + StringUtils::join(parts, ", ");
}

ExecutionResult failure(size_t index, size_t total, std::string message,
                        const std::string& action, std::string error) {
    ExecutionResult result;
    result.success = false;
    result.steps_executed = index - 1;
    result.total_steps = total;
    result.message = std::move(message);
    result.failed_step = index;
    result.failed_action = action;
    result.error = std::move(error);
    return result;
}

}

MacroExecutor::MacroExecutor(const MacroRegistry& registry, AutomationBackend& backend, ExecutorConfig config)
    : registry_(registry), backend_(backend), config_(config) {}

ExecutionResult MacroExecutor::execute(const std::string& name,
                                       const ParamMap& params,
                                       const CancellationToken& cancel,
                                       const LogSink& log) {
    auto catalog = registry_.snapshot();
    const MacroDefinition* definition = catalog->find(name);
    if (!definition) {
        ExecutionResult result;
        result.message = fmt::format("Macro '{}' not found", name);
        result.error = result.message;
        return result;
    }
    return run(*catalog, *definition, params, cancel, std::nullopt, log, "[Macro] ", {name});
}

ExecutionResult MacroExecutor::execute_definition(const MacroDefinition& definition,
                                                  const ParamMap& params,
                                                  const CancellationToken& cancel,
                                                  const LogSink& log) {
    auto catalog = registry_.snapshot();
    if (!definition.has_includes()) {
        return run(*catalog, definition, params, cancel, std::nullopt, log, "[Macro] ", {definition.name});
    }

    MacroDefinition expanded = definition;
    try {
        expanded.steps = IncludeExpander(catalog->macros).expand_steps(definition.steps);
    } catch (const std::exception& e) {
        ExecutionResult result;
        result.total_steps = definition.steps.size();
        result.message = fmt::format("Macro '{}' could not be expanded: {}", definition.name, e.what());
        result.error = e.what();
        return result;
    }
    return run(*catalog, expanded, params, cancel, std::nullopt, log, "[Macro] ", {definition.name});
}

void MacroExecutor::emit(const LogSink& log, const std::string& line) const {
    LogUtils::info(line);
    if (log) log(line);
}

ExecutionResult MacroExecutor::run(const MacroCatalog& catalog,
                                   const MacroDefinition& definition,
                                   const ParamMap& params,
                                   const CancellationToken& caller,
                                   std::optional<int> timeout_override_sec,
                                   const LogSink& log,
                                   const std::string& prefix,
                                   const std::vector<std::string>& call_chain) {
    const size_t total = definition.steps.size();

    std::vector<std::string> missing;
    for (const auto& spec : definition.parameters) {
        if (spec.required && !spec.default_value && params.count(spec.name) == 0) {
            missing.push_back(spec.name);
        }
    }
    if (!missing.empty()) {
        ExecutionResult result;
        result.total_steps = total;
        result.message = "Missing required parameters: " + StringUtils::join(missing, ", ");
        result.error = result.message;
        return result;
    }

    ParamMap resolved = params;
    for (const auto& spec : definition.parameters) {
        if (spec.default_value && resolved.count(spec.name) == 0) {
            resolved[spec.name] = *spec.default_value;
        }
    }

    const int timeout_sec = timeout_override_sec ? *timeout_override_sec
                          : (definition.timeout > 0 ? definition.timeout : config_.macro_timeout_sec);
    CancellationSource macro_scope(caller, std::chrono::seconds(timeout_sec));
    const CancellationToken macro_token = macro_scope.token();

    AliasTable aliases;
    StepDispatcher dispatcher(*this, catalog, aliases, macro_token, log, prefix, call_chain);

    // Deadline or caller cancellation observed at step `index`
    auto interrupted = [&](size_t index, const std::string& action, const std::string& position) {
        if (macro_token.is_cancelled()) {
            emit(log, position + ": CANCELLED");
            return failure(index, total,
                           fmt::format("Macro '{}' cancelled at step {} ({})", definition.name, index, action),
                           action, "Cancelled");
        }
        emit(log, position + ": TIMEOUT");
        return failure(index, total,
                       fmt::format("Macro '{}' timed out after {}s at step {} ({})",
                                   definition.name, timeout_sec, index, action),
                       action, "Macro timeout exceeded");
    };

    for (size_t i = 0; i < total; ++i) {
        const size_t index = i + 1;
        const std::string action = definition.steps[i].action_name();
        const std::string position = fmt::format("{}Step {}/{}", prefix, index, total);

        if (macro_token.is_cancellation_requested()) {
            return interrupted(index, action, position);
        }

        try {
            if (!is_attachment_independent(action) && !backend_.is_attached()) {
                emit(log, position + ": FAILED — Process is no longer attached");
                return failure(index, total,
                               fmt::format("Target process exited during macro execution at step {} ({})",
                                           index, action),
                               action, "Process is no longer attached");
            }

            MacroStep step = definition.steps[i];
            ParamSubstitution::transform_strings(step, [&resolved](const std::string& text) {
                return ParamSubstitution::substitute(text, resolved);
            });
            emit(log, position + ": " + summarize(step));

            StepResult r = dispatcher.dispatch(step, index);
            if (!r.success) {
                if (macro_token.is_cancellation_requested()) {
                    return interrupted(index, action, position);
                }
                const std::string error = r.error.value_or(r.message);
                emit(log, position + ": FAILED — " + error);
                return failure(index, total, r.message, action, error);
            }
            emit(log, position + ": OK — " + r.message);
        } catch (const OperationCancelled&) {
            if (macro_token.is_cancellation_requested()) {
                return interrupted(index, action, position);
            }
            emit(log, position + ": TIMEOUT");
            return failure(index, total,
                           fmt::format("Step {} ({}) timed out", index, action),
                           action, "Step timeout exceeded");
        } catch (const std::exception& e) {
            emit(log, position + ": ERROR — " + e.what());
            return failure(index, total,
                           fmt::format("Step {} ({}) failed: {}", index, action, e.what()),
                           action, e.what());
        }
    }

    emit(log, fmt::format("{}'{}' completed ({} steps)", prefix, definition.name, total));

    ExecutionResult result;
    result.success = true;
    result.steps_executed = total;
    result.total_steps = total;
    result.message = fmt::format("Macro '{}' completed ({} steps)", definition.name, total);
    return result;
}

#include "StepDispatcher.hpp"
#include "StringUtils.hpp"
#include "VerifyMatcher.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <stdexcept>
#include <vector>

namespace {

StepResult from_backend(const BackendResult& r) {
    return StepResult{r.success, r.message, std::nullopt};
}

StepResult fail(std::string message) {
    return StepResult{false, std::move(message), std::nullopt};
}

std::chrono::milliseconds to_millis(double seconds) {
    return std::chrono::milliseconds(static_cast<long long>(seconds * 1000));
}

}

StepDispatcher::StepDispatcher(MacroExecutor& executor,
                               const MacroCatalog& catalog,
                               AliasTable& aliases,
                               const CancellationToken& macro_token,
                               const LogSink& log,
                               std::string prefix,
                               std::vector<std::string> call_chain)
    : executor_(executor),
      backend_(executor.backend()),
      catalog_(catalog),
      aliases_(aliases),
      macro_token_(macro_token),
      log_(log),
      prefix_(std::move(prefix)),
      call_chain_(std::move(call_chain)),
      token_(macro_token) {}

std::optional<std::chrono::milliseconds> StepDispatcher::step_timeout(const MacroStep& step) const {
    const ExecutorConfig& config = executor_.config();

    // Nested macros run under their own macro deadline
    if (step.is<MacroCallStep>()) return std::nullopt;

    if (step.timeout && *step.timeout > 0) {
        return std::chrono::seconds(*step.timeout);
    }
    if (step.is<LaunchStep>() || step.is<WaitForWindowStep>()) {
        return std::chrono::seconds(config.launch_timeout_sec);
    }

    const std::chrono::milliseconds base = std::chrono::seconds(config.step_timeout_sec);
    if (const auto* wait = std::get_if<WaitStep>(&step.action)) {
        return std::max(base, to_millis(wait->seconds) + std::chrono::seconds(1));
    }
    return base;
}

StepResult StepDispatcher::dispatch(const MacroStep& step, size_t index) {
    step_ = &step;
    index_ = index;
    timeout_ = step_timeout(step);

    CancellationSource scope(macro_token_, timeout_);
    token_ = scope.token();

    return std::visit([this](const auto& action) { return handle(action); }, step.action);
}

template <typename Attempt>
bool StepDispatcher::retry(Attempt attempt) {
    const auto interval = retry_interval();
    while (true) {
        if (attempt()) return true;
        if (token_.is_cancellation_requested() || !token_.sleep_for(interval)) return false;
    }
}

std::chrono::milliseconds StepDispatcher::retry_interval() const {
    if (step_ && step_->retry_interval && *step_->retry_interval > 0) {
        return to_millis(*step_->retry_interval);
    }
    return std::chrono::milliseconds(executor_.config().retry_interval_ms);
}

std::string StepDispatcher::timeout_text() const {
    if (!timeout_) return "the macro deadline";
    return fmt::format("{}s", static_cast<double>(timeout_->count()) / 1000.0);
}

StepResult StepDispatcher::handle(const FocusStep&) {
    return from_backend(backend_.focus());
}

StepResult StepDispatcher::handle(const AttachStep& s) {
    if (s.process_name && !s.process_name->empty()) {
        return from_backend(backend_.attach(*s.process_name));
    }
    if (s.pid) {
        return from_backend(backend_.attach(*s.pid));
    }
    return fail("attach requires process_name or pid");
}

StepResult StepDispatcher::handle(const SnapshotStep& s) {
    ValueResult r = backend_.snapshot(s.max_depth.value_or(executor_.config().snapshot_depth));
    return StepResult{r.success, r.success ? r.value : r.message, std::nullopt};
}

StepResult StepDispatcher::handle(const FindStep& s) {
    ElementResult found;
    bool ok = retry([&] {
        found = backend_.find(s.criteria);
        return found.success;
    });
    if (!ok) return fail("Element not found after " + timeout_text());

    if (s.save_as) aliases_.bind(*s.save_as, found.ref);
    return StepResult{true, fmt::format("Found [{}]: {}", found.ref, found.message), std::nullopt};
}

StepResult StepDispatcher::handle(const FindByPathStep& s) {
    ElementResult found;
    bool ok = retry([&] {
        found = backend_.find_by_path(s.path);
        return found.success;
    });
    if (!ok) return fail("Path element not found after " + timeout_text());

    if (s.save_as) aliases_.bind(*s.save_as, found.ref);
    return StepResult{true, fmt::format("Found [{}]: {}", found.ref, found.message), std::nullopt};
}

StepResult StepDispatcher::handle(const ClickStep& s) {
    auto ref = aliases_.resolve(s.ref);
    if (!ref) return fail("click requires a ref");
    return from_backend(backend_.click(*ref));
}

StepResult StepDispatcher::handle(const RightClickStep& s) {
    auto ref = aliases_.resolve(s.ref);
    if (!ref) return fail("right_click requires a ref");
    return from_backend(backend_.right_click(*ref));
}

StepResult StepDispatcher::handle(const TypeStep& s) {
    return from_backend(backend_.type_text(s.text));
}

StepResult StepDispatcher::handle(const SetValueStep& s) {
    if (s.ref.empty()) return fail("set_value requires a ref");
    return from_backend(backend_.set_value(aliases_.resolve(s.ref), s.value));
}

StepResult StepDispatcher::handle(const GetValueStep& s) {
    auto ref = aliases_.resolve(s.ref);
    if (!ref) return fail("get_value requires a ref");

    ValueResult r = backend_.get_value(*ref);
    if (!r.success) return fail(r.message);
    return StepResult{true, fmt::format("Value: {}", r.value), std::nullopt};
}

StepResult StepDispatcher::handle(const SendKeysStep& s) {
    return from_backend(backend_.send_keys(s.keys));
}

StepResult StepDispatcher::handle(const WaitStep& s) {
    if (!token_.sleep_for(to_millis(s.seconds))) {
        throw OperationCancelled(fmt::format("wait of {}s interrupted", s.seconds));
    }
    return StepResult{true, fmt::format("Waited {}s", s.seconds), std::nullopt};
}

StepResult StepDispatcher::handle(const WaitForEnabledStep& s) {
    if (auto ref = aliases_.resolve(s.ref)) {
        std::optional<bool> state;
        bool ok = retry([&] {
            state = backend_.is_enabled(*ref);
            return !state || *state == s.enabled;
        });
        if (!state) return fail(fmt::format("Unknown ref '{}'", *ref));
        if (!ok) {
            return fail(fmt::format("Element [{}] IsEnabled={} after {} (target={})",
                                    *ref, *state, timeout_text(), s.enabled));
        }
        return StepResult{true, fmt::format("Element [{}] IsEnabled={} (target={})", *ref, *state, s.enabled),
                          std::nullopt};
    }

    if (s.criteria.empty()) return fail("wait_for_enabled requires a ref or element criteria");

    ElementResult found;
    bool ok = retry([&] {
        found = backend_.find(s.criteria);
        if (!found.success) return false;
        auto state = backend_.is_enabled(found.ref);
        return state && *state == s.enabled;
    });
    if (!ok) return fail(fmt::format("Element not enabled={} after {}", s.enabled, timeout_text()));

    if (s.save_as) aliases_.bind(*s.save_as, found.ref);
    return StepResult{true, fmt::format("Element [{}] IsEnabled={}", found.ref, s.enabled), std::nullopt};
}

StepResult StepDispatcher::handle(const MacroCallStep& s) {
    if (s.macro_name.empty()) return fail("macro action requires macro_name");

    const MacroDefinition* nested = catalog_.find(s.macro_name);
    if (!nested) return fail(fmt::format("Macro '{}' not found", s.macro_name));

    std::vector<std::string> chain = call_chain_;
    const bool recursive = std::any_of(chain.begin(), chain.end(), [&s](const std::string& running) {
        return StringUtils::iequals(running, s.macro_name);
    });
    chain.push_back(s.macro_name);
    if (recursive) {
        return fail(fmt::format("Recursive macro call detected: {}", StringUtils::join(chain, " -> ")));
    }

    std::optional<int> timeout_override;
    if (step_->timeout && *step_->timeout > 0) timeout_override = step_->timeout;

    ExecutionResult r = executor_.run(catalog_, *nested, s.params, token_, timeout_override, log_,
                                      fmt::format("{}Step {} > ", prefix_, index_), chain);
    if (r.success) {
        return StepResult{true, fmt::format("Nested macro '{}' completed ({} steps)", s.macro_name, r.steps_executed),
                          std::nullopt};
    }

    std::optional<std::string> error;
    if (!r.error.empty()) error = r.error;
    return StepResult{false, fmt::format("Nested macro '{}' failed: {}", s.macro_name, r.message), error};
}

StepResult StepDispatcher::handle(const IncludeStep& s) {
    return fail(fmt::format("include step was not expanded at load time (macro_name={})", s.macro_name));
}

StepResult StepDispatcher::handle(const LaunchStep& s) {
    if (s.exe_path.empty()) return fail("launch requires exe_path");

    LaunchOptions options;
    options.exe_path = s.exe_path;
    options.arguments = s.arguments;
    options.working_directory = s.working_directory;
    options.if_not_running = s.if_not_running;
    options.timeout_sec = static_cast<int>(std::chrono::duration_cast<std::chrono::seconds>(*timeout_).count());
    return from_backend(backend_.launch_and_attach(options, token_));
}

StepResult StepDispatcher::handle(const WaitForWindowStep& s) {
    WindowCriteria criteria;
    criteria.title_contains = s.title_contains;
    criteria.element = s.criteria;
    criteria.timeout_sec = static_cast<int>(std::chrono::duration_cast<std::chrono::seconds>(*timeout_).count());
    criteria.poll_ms = (step_->retry_interval && *step_->retry_interval > 0)
        ? static_cast<int>(retry_interval().count())
        : executor_.config().window_poll_ms;
    return from_backend(backend_.wait_for_window_ready(criteria, token_));
}

StepResult StepDispatcher::handle(const ScreenshotStep&) {
    ScreenshotResult r = backend_.screenshot();
    if (!r.success) return fail(r.message);
    return StepResult{true, fmt::format("Screenshot captured ({} bytes)", r.png.size()), std::nullopt};
}

StepResult StepDispatcher::handle(const PropertiesStep& s) {
    auto ref = aliases_.resolve(s.ref);
    if (!ref) return fail("properties requires a ref");

    PropertiesResult r = backend_.get_properties(*ref);
    if (!r.success) return fail(r.message);

    std::vector<std::string> pairs;
    for (const auto& [key, value] : r.properties) {
        pairs.push_back(key + "=" + value);
    }
    return StepResult{true, "Properties: " + StringUtils::join(pairs, ", "), std::nullopt};
}

StepResult StepDispatcher::handle(const ChildrenStep& s) {
    ChildrenResult r = backend_.get_children(aliases_.resolve(s.ref));
    if (!r.success) return fail(r.message);

    if (s.save_as && !r.refs.empty()) aliases_.bind(*s.save_as, r.refs.front());
    return StepResult{true, fmt::format("Found {} children", r.refs.size()), std::nullopt};
}

StepResult StepDispatcher::handle(const FileDialogStep& s) {
    if (s.text.empty()) return fail("file_dialog requires text (the file path)");
    return from_backend(backend_.file_dialog(s.text));
}

StepResult StepDispatcher::handle(const VerifyStep& s) {
    if (s.ref.empty()) return fail("verify requires a ref");
    const std::string ref = aliases_.resolve(s.ref);

    ValueResult read = backend_.read_property(ref, s.property);
    if (!read.success) return fail(read.message);

    const std::string mode = StringUtils::to_lower(s.match_mode.empty() ? "equals" : s.match_mode);
    std::optional<bool> matched;
    try {
        matched = VerifyMatcher::match(read.value, s.expected, mode);
    } catch (const std::invalid_argument& e) {
        return fail(e.what());
    }

    if (!matched) {
        return fail(fmt::format("Unknown match_mode '{}'. Valid: {}",
                                s.match_mode, StringUtils::join(VerifyMatcher::modes(), ", ")));
    }
    if (*matched) {
        return StepResult{true, fmt::format("Verify passed ({}): {} = \"{}\"", mode, s.property, read.value),
                          std::nullopt};
    }
    if (s.message) return fail(*s.message);
    return fail(fmt::format("Verify failed ({}): expected {} {} \"{}\" but got \"{}\"",
                            mode, s.property, VerifyMatcher::describe(mode), s.expected, read.value));
}

#pragma once

#include "AliasTable.hpp"
#include "CancellationToken.hpp"
#include "ExecutionResult.hpp"
#include "MacroCatalog.hpp"
#include "MacroExecutor.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

// Executes single steps of one macro invocation. Steps arrive with their
// parameters already substituted; ref arguments resolve through the alias table.
class StepDispatcher {
public:
    StepDispatcher(MacroExecutor& executor,
                   const MacroCatalog& catalog,
                   AliasTable& aliases,
                   const CancellationToken& macro_token,
                   const LogSink& log,
                   std::string prefix,
                   std::vector<std::string> call_chain);

    // Step deadline, or empty when the step runs under the macro deadline alone
    std::optional<std::chrono::milliseconds> step_timeout(const MacroStep& step) const;

    // Throws OperationCancelled when a sleep is cut short by a deadline
    StepResult dispatch(const MacroStep& step, size_t index);

private:
    StepResult handle(const FocusStep& s);
    StepResult handle(const AttachStep& s);
    StepResult handle(const SnapshotStep& s);
    StepResult handle(const FindStep& s);
    StepResult handle(const FindByPathStep& s);
    StepResult handle(const ClickStep& s);
    StepResult handle(const RightClickStep& s);
    StepResult handle(const TypeStep& s);
    StepResult handle(const SetValueStep& s);
    StepResult handle(const GetValueStep& s);
    StepResult handle(const SendKeysStep& s);
    StepResult handle(const WaitStep& s);
    StepResult handle(const WaitForEnabledStep& s);
    StepResult handle(const MacroCallStep& s);
    StepResult handle(const IncludeStep& s);
    StepResult handle(const LaunchStep& s);
    StepResult handle(const WaitForWindowStep& s);
    StepResult handle(const ScreenshotStep& s);
    StepResult handle(const PropertiesStep& s);
    StepResult handle(const ChildrenStep& s);
    StepResult handle(const FileDialogStep& s);
    StepResult handle(const VerifyStep& s);

    // Call attempt until it succeeds or the step deadline passes
    template <typename Attempt>
    bool retry(Attempt attempt);

    std::chrono::milliseconds retry_interval() const;
    std::string timeout_text() const;

    MacroExecutor& executor_;
    AutomationBackend& backend_;
    const MacroCatalog& catalog_;
    AliasTable& aliases_;
    CancellationToken macro_token_;
    const LogSink& log_;
    std::string prefix_;

    // Macros currently running, outermost first
    std::vector<std::string> call_chain_;

    // State of the step being dispatched
    const MacroStep* step_ = nullptr;
    size_t index_ = 0;
    CancellationToken token_;
    std::optional<std::chrono::milliseconds> timeout_;
};

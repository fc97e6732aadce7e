#pragma once

#include "AutomationBackend.hpp"
#include "CancellationToken.hpp"
#include "ExecutionResult.hpp"
#include "ExecutorConfig.hpp"
#include "MacroRegistry.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

// Receives every "[Macro] ..." progress line of an invocation
using LogSink = std::function<void(const std::string&)>;

// Runs macros from the registry against one backend session. Every failure,
// including exceptions thrown by the backend, comes back as an ExecutionResult.
class MacroExecutor {
public:
    MacroExecutor(const MacroRegistry& registry, AutomationBackend& backend, ExecutorConfig config = {});

    ExecutionResult execute(const std::string& name,
                            const ParamMap& params,
                            const CancellationToken& cancel = {},
                            const LogSink& log = nullptr);

    // Run a definition that is not part of the registry, e.g. a single document
    // handed over by a caller. Its include steps expand against the current table.
    ExecutionResult execute_definition(const MacroDefinition& definition,
                                       const ParamMap& params,
                                       const CancellationToken& cancel = {},
                                       const LogSink& log = nullptr);

    const ExecutorConfig& config() const { return config_; }
    AutomationBackend& backend() { return backend_; }

private:
    friend class StepDispatcher;

    ExecutionResult run(const MacroCatalog& catalog,
                        const MacroDefinition& definition,
                        const ParamMap& params,
                        const CancellationToken& caller,
                        std::optional<int> timeout_override_sec,
                        const LogSink& log,
                        const std::string& prefix,
                        const std::vector<std::string>& call_chain);

    void emit(const LogSink& log, const std::string& line) const;

    const MacroRegistry& registry_;
    AutomationBackend& backend_;
    ExecutorConfig config_;
};

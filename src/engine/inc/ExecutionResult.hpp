#pragma once

#include <cstddef>
#include <optional>
#include <string>

struct ExecutionResult {
    bool success = false;
    size_t steps_executed = 0;
    size_t total_steps = 0;
    std::string message;

    // Populated on failure; the step index is 1-based
    std::optional<size_t> failed_step;
    std::string failed_action;
    std::string error;
};

struct StepResult {
    bool success = false;
    std::string message;
    std::optional<std::string> error;
};

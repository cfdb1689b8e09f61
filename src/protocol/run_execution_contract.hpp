#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/ael_errors.hpp"

namespace ael::protocol {

enum class RunStatus {
    Succeeded,
    Failed
};

enum class StepStatus {
    Pending,
    Running,
    Succeeded,
    Failed,
    Skipped
};

struct AttemptRecord {
    std::uint32_t attempt = 0;
    bool success = false;
    std::string error_code;
    std::string diagnostics;
    double duration_ms = 0.0;
};

struct StepResult {
    std::string step_id;
    StepStatus status = StepStatus::Pending;
    nlohmann::json output;
    std::optional<core::errors::AelError> error;
    std::uint32_t attempts = 0;
    std::uint32_t max_attempts = 1;
    std::vector<AttemptRecord> attempt_history;
    std::int64_t started_at_ms = 0;
    std::int64_t completed_at_ms = 0;
    double duration_ms = 0.0;
};

struct ExecutionReport {
    std::string run_id;
    std::string workflow_name;
    RunStatus status = RunStatus::Failed;
    bool cancelled = false;
    std::vector<StepResult> steps;  // declaration order
    std::vector<std::string> failed_steps;
    std::vector<std::string> skipped_steps;
    nlohmann::json outputs = nlohmann::json::object();
    std::optional<core::errors::AelError> error;
    std::size_t steps_succeeded = 0;
    std::size_t steps_failed = 0;
    std::size_t steps_skipped = 0;
    std::int64_t started_at_ms = 0;
    std::int64_t completed_at_ms = 0;
    double duration_ms = 0.0;

    const StepResult* find_step(const std::string& step_id) const {
        for (const auto& step : steps) {
            if (step.step_id == step_id) {
                return &step;
            }
        }
        return nullptr;
    }
};

inline std::string to_string(const RunStatus status) {
    switch (status) {
        case RunStatus::Succeeded:
            return "succeeded";
        case RunStatus::Failed:
            return "failed";
        default:
            return "unknown";
    }
}

inline std::string to_string(const StepStatus status) {
    switch (status) {
        case StepStatus::Pending:
            return "pending";
        case StepStatus::Running:
            return "running";
        case StepStatus::Succeeded:
            return "succeeded";
        case StepStatus::Failed:
            return "failed";
        case StepStatus::Skipped:
            return "skipped";
        default:
            return "unknown";
    }
}

inline bool is_terminal(const StepStatus status) {
    return status == StepStatus::Succeeded || status == StepStatus::Failed ||
           status == StepStatus::Skipped;
}

inline nlohmann::json to_json(const core::errors::AelError& error) {
    nlohmann::json payload;
    payload["category"] = core::errors::to_string(error.category);
    payload["code"] = error.code;
    payload["message"] = error.message;
    if (!error.hint.empty()) {
        payload["hint"] = error.hint;
    }
    return payload;
}

inline nlohmann::json to_json(const StepResult& step) {
    nlohmann::json payload;
    payload["id"] = step.step_id;
    payload["status"] = to_string(step.status);
    payload["output"] = step.output;
    payload["attempts"] = step.attempts;
    payload["max_attempts"] = step.max_attempts;
    payload["duration_ms"] = step.duration_ms;
    payload["error"] = step.error.has_value() ? to_json(step.error.value())
                                              : nlohmann::json();
    return payload;
}

inline nlohmann::json to_json(const ExecutionReport& report) {
    nlohmann::json payload;
    payload["run_id"] = report.run_id;
    payload["workflow"] = report.workflow_name;
    payload["status"] = to_string(report.status);
    payload["cancelled"] = report.cancelled;
    payload["steps"] = nlohmann::json::array();
    for (const auto& step : report.steps) {
        payload["steps"].push_back(to_json(step));
    }
    payload["failed_steps"] = report.failed_steps;
    payload["skipped_steps"] = report.skipped_steps;
    payload["outputs"] = report.outputs;
    payload["steps_succeeded"] = report.steps_succeeded;
    payload["steps_failed"] = report.steps_failed;
    payload["steps_skipped"] = report.steps_skipped;
    payload["duration_ms"] = report.duration_ms;
    payload["error"] = report.error.has_value() ? to_json(report.error.value())
                                                : nlohmann::json();
    return payload;
}

}  // namespace ael::protocol

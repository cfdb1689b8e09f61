#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include "core/errors/ael_errors.hpp"
#include "protocol/event_contract.hpp"
#include "protocol/run_execution_contract.hpp"

namespace ael::session {

// Appends one JSON object per line to <workspace>/<trace dir>/<run_id>.jsonl:
// run_started, step_started, step, run_finished.
class TraceWriter {
public:
    explicit TraceWriter(std::filesystem::path workspace_root,
                         std::filesystem::path trace_subdir = ".ael_runs");

    core::errors::Result<std::filesystem::path> write_run_started(
        const protocol::RunStartedEvent& event) const;

    core::errors::Result<std::filesystem::path> write_step_started(
        const protocol::StepStartedEvent& event) const;

    core::errors::Result<std::filesystem::path> write_step(
        const std::string& run_id, const protocol::StepResult& step) const;

    core::errors::Result<std::filesystem::path> write_run_finished(
        const protocol::ExecutionReport& report) const;

    core::errors::Result<std::filesystem::path> record(
        const protocol::LifecycleEvent& event) const;

    // Event sink for the engine; write failures are logged, not raised.
    protocol::EventSink as_sink() const;

    core::errors::Result<std::filesystem::path> trace_path(const std::string& run_id) const;

private:
    core::errors::Result<std::filesystem::path> append_event(
        const std::string& run_id, const std::string& event_json) const;

    std::filesystem::path workspace_root_;
    std::filesystem::path trace_subdir_;
    mutable std::mutex write_mutex_;
};

}  // namespace ael::session

#include "session/trace_writer.hpp"

#include <chrono>
#include <fstream>
#include <type_traits>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"

namespace ael::session {

using core::errors::AelError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count();
    return static_cast<std::int64_t>(ms);
}

json make_event(const std::string& name, const std::string& run_id, json payload) {
    json event;
    event["ts_unix_ms"] = now_unix_ms();
    event["event"] = name;
    event["run_id"] = run_id;
    event["payload"] = std::move(payload);
    return event;
}

}  // namespace

TraceWriter::TraceWriter(std::filesystem::path workspace_root,
                         std::filesystem::path trace_subdir)
    : workspace_root_(std::move(workspace_root)),
      trace_subdir_(std::move(trace_subdir)) {}

core::errors::Result<std::filesystem::path> TraceWriter::trace_path(
    const std::string& run_id) const {
    if (run_id.empty()) {
        return AelError{ErrorCategory::Input, "Run ID cannot be empty.",
                        "invalid_run_id"};
    }

    std::error_code ec;
    if (!std::filesystem::exists(workspace_root_, ec) || ec) {
        return AelError{ErrorCategory::Input,
                        "Workspace root does not exist: " + workspace_root_.string(),
                        "invalid_workspace_root"};
    }
    if (!std::filesystem::is_directory(workspace_root_, ec) || ec) {
        return AelError{ErrorCategory::Input,
                        "Workspace root is not a directory: " + workspace_root_.string(),
                        "invalid_workspace_root"};
    }

    const auto canonical_root = std::filesystem::weakly_canonical(workspace_root_, ec);
    if (ec) {
        return AelError{ErrorCategory::Input,
                        "Unable to resolve workspace root: " + workspace_root_.string(),
                        "invalid_workspace_root"};
    }

    const auto trace_dir = canonical_root / trace_subdir_;
    std::filesystem::create_directories(trace_dir, ec);
    if (ec) {
        return AelError{ErrorCategory::Internal,
                        "Unable to create trace directory: " + trace_dir.string(),
                        "trace_dir_create_failed"};
    }

    return trace_dir / (run_id + ".jsonl");
}

core::errors::Result<std::filesystem::path> TraceWriter::append_event(
    const std::string& run_id, const std::string& event_json) const {
    auto path_result = trace_path(run_id);
    if (core::errors::is_error(path_result)) {
        return core::errors::get_error(path_result);
    }
    const auto run_path = core::errors::get_value(path_result);

    std::lock_guard<std::mutex> lock(write_mutex_);
    std::ofstream out(run_path, std::ios::app);
    if (!out.is_open()) {
        return AelError{ErrorCategory::Internal,
                        "Unable to open trace file: " + run_path.string(),
                        "trace_open_failed"};
    }

    out << event_json << "\n";
    if (!out.good()) {
        return AelError{ErrorCategory::Internal,
                        "Unable to write trace event: " + run_path.string(),
                        "trace_write_failed"};
    }

    return run_path;
}

core::errors::Result<std::filesystem::path> TraceWriter::write_run_started(
    const protocol::RunStartedEvent& event) const {
    json payload;
    payload["workflow"] = event.workflow_name;
    payload["step_count"] = event.step_count;
    return append_event(event.run_id,
                        make_event("run_started", event.run_id, std::move(payload)).dump());
}

core::errors::Result<std::filesystem::path> TraceWriter::write_step_started(
    const protocol::StepStartedEvent& event) const {
    json payload;
    payload["id"] = event.step_id;
    payload["attempt"] = event.attempt;
    return append_event(event.run_id,
                        make_event("step_started", event.run_id, std::move(payload)).dump());
}

core::errors::Result<std::filesystem::path> TraceWriter::write_step(
    const std::string& run_id, const protocol::StepResult& step) const {
    return append_event(run_id, make_event("step", run_id, protocol::to_json(step)).dump());
}

core::errors::Result<std::filesystem::path> TraceWriter::write_run_finished(
    const protocol::ExecutionReport& report) const {
    json payload;
    payload["status"] = protocol::to_string(report.status);
    payload["cancelled"] = report.cancelled;
    payload["failed_steps"] = report.failed_steps;
    payload["skipped_steps"] = report.skipped_steps;
    payload["outputs"] = report.outputs;
    payload["duration_ms"] = report.duration_ms;
    payload["error"] = report.error.has_value() ? protocol::to_json(report.error.value())
                                                : json();
    return append_event(report.run_id,
                        make_event("run_finished", report.run_id, std::move(payload)).dump());
}

core::errors::Result<std::filesystem::path> TraceWriter::record(
    const protocol::LifecycleEvent& event) const {
    return std::visit(
        [this](const auto& typed) -> core::errors::Result<std::filesystem::path> {
            using T = std::decay_t<decltype(typed)>;
            if constexpr (std::is_same_v<T, protocol::RunStartedEvent>) {
                return write_run_started(typed);
            } else if constexpr (std::is_same_v<T, protocol::StepStartedEvent>) {
                return write_step_started(typed);
            } else if constexpr (std::is_same_v<T, protocol::StepFinishedEvent>) {
                return write_step(typed.run_id, typed.result);
            } else {
                return write_run_finished(typed.report);
            }
        },
        event);
}

protocol::EventSink TraceWriter::as_sink() const {
    return [this](const protocol::LifecycleEvent& event) {
        const auto written = record(event);
        if (core::errors::is_error(written)) {
            AEL_LOG_WARN("TraceWriter: " + core::errors::get_error(written).message);
        }
    };
}

}  // namespace ael::session

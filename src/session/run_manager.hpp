#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/errors/ael_errors.hpp"

namespace ael::session {

enum class RunState {
    Created,
    Running,
    Succeeded,
    Failed,
    Cancelled
};

struct RunRecord {
    std::string run_id;
    std::string workflow_name;
    RunState state = RunState::Created;
    std::optional<std::string> failure_reason;
    std::shared_ptr<std::atomic_bool> cancel_token;
};

// Registry of runs known to one engine. Owns each run's cancellation flag so a
// run can be cancelled by id from any thread.
class RunManager {
public:
    core::errors::Result<std::string> start_run(const std::string& workflow_name);

    // Raises the run's cancellation flag. The run reaches Cancelled once the
    // engine has wound it down.
    core::errors::Result<RunState> cancel_run(const std::string& run_id);

    core::errors::Result<RunState> get_run_state(const std::string& run_id) const;
    core::errors::Result<std::shared_ptr<std::atomic_bool>> get_cancel_token(
        const std::string& run_id) const;

    core::errors::Result<RunState> mark_succeeded(const std::string& run_id);
    core::errors::Result<RunState> mark_failed(const std::string& run_id,
                                               const std::string& reason);
    core::errors::Result<RunState> mark_cancelled(const std::string& run_id);

    std::vector<std::string> active_runs() const;
    std::size_t run_count() const;

    static std::string to_string(RunState state);

private:
    core::errors::Result<RunState> transition_to_terminal(
        const std::string& run_id, RunState next_state,
        const std::optional<std::string>& failure_reason);
    static bool is_terminal(RunState state);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, RunRecord> runs_;
};

}  // namespace ael::session

#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/config/engine_config.hpp"
#include "core/errors/ael_errors.hpp"
#include "protocol/event_contract.hpp"
#include "protocol/run_execution_contract.hpp"
#include "protocol/tool_contract.hpp"
#include "protocol/workflow_contract.hpp"
#include "registry/tool_registry.hpp"
#include "sandbox/step_executor.hpp"
#include "session/run_manager.hpp"
#include "workflow/dag.hpp"
#include "workflow/validator.hpp"

namespace ael::engine {

// Drives a validated workflow DAG to completion. Ready steps run on up to
// `max_parallelism` worker threads, earliest-declared first; a failed step
// skips everything downstream of it and leaves independent branches running.
class ExecutionEngine {
public:
    explicit ExecutionEngine(registry::ToolRegistry& registry,
                             core::config::EngineConfig config = {});

    ExecutionEngine(const ExecutionEngine&) = delete;
    ExecutionEngine& operator=(const ExecutionEngine&) = delete;

    // Called one event at a time. The sink must not call run().
    void set_event_sink(protocol::EventSink sink);

    core::errors::Result<workflow::WorkflowDag> validate(
        const protocol::WorkflowDefinition& definition) const;

    // Blocks until the run is terminal. Never throws; every failure is in
    // the report.
    protocol::ExecutionReport run(const protocol::WorkflowDefinition& definition,
                                  const nlohmann::json& initial_inputs = nlohmann::json::object());

    // Skips steps that have not started and tells running ones to stop at
    // their next checkpoint.
    core::errors::Result<session::RunState> cancel(const std::string& run_id);

    std::vector<std::string> active_runs() const;

    std::vector<protocol::ToolDescriptor> list_tools() const;

    const core::config::EngineConfig& config() const { return config_; }

private:
    struct RunContext;

    void worker_loop(RunContext& run) const;
    // Caller holds the run's state lock. Returns the events to emit.
    std::vector<protocol::LifecycleEvent> skip_pending(RunContext& run,
                                                       const std::string& code,
                                                       const std::string& message) const;
    protocol::StepResult execute_step(RunContext& run,
                                      std::size_t index,
                                      const nlohmann::json& scope) const;
    void emit(const protocol::LifecycleEvent& event) const;

    registry::ToolRegistry& registry_;
    core::config::EngineConfig config_;
    workflow::WorkflowValidator validator_;
    sandbox::SandboxedStepExecutor executor_;
    session::RunManager runs_;
    protocol::EventSink sink_;
};

}  // namespace ael::engine

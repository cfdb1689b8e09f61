#pragma once

#include <mutex>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/ael_errors.hpp"
#include "policy/policy_guard.hpp"
#include "protocol/sandbox_contract.hpp"
#include "protocol/tool_contract.hpp"
#include "protocol/workflow_contract.hpp"
#include "registry/tool_registry.hpp"

namespace ael::sandbox {

// Runs one attempt of one step inside the isolation boundary. Never throws:
// every failure, denial and limit comes back as a failed SandboxResult.
//
// Tool handlers must poll `context.should_stop()`. A call that times out or is
// cancelled raises the handler's stop flag and waits a short grace period for
// it to return; a handler still running after that is joined when the
// executor is destroyed.
class SandboxedStepExecutor {
public:
    explicit SandboxedStepExecutor(registry::ToolRegistry& registry,
                                   policy::PolicyGuard guard = policy::PolicyGuard{});
    ~SandboxedStepExecutor();

    SandboxedStepExecutor(const SandboxedStepExecutor&) = delete;
    SandboxedStepExecutor& operator=(const SandboxedStepExecutor&) = delete;

    // Handlers that ignored their stop flag past the grace period.
    std::size_t lingering_calls() const;

    // `inputs` are the step's resolved inputs: tool arguments for a tool-call
    // step, the `inputs` object for inline code. `dependency_outputs` is
    // exposed to inline code as `steps` ({"<id>": {"output": ...}}).
    protocol::SandboxResult execute(
        const protocol::StepDefinition& step,
        const nlohmann::json& inputs,
        const protocol::SandboxLimits& limits,
        const nlohmann::json& dependency_outputs = nlohmann::json::object()) const;

private:
    protocol::SandboxResult run_tool_call(const protocol::StepDefinition& step,
                                          const nlohmann::json& inputs,
                                          const protocol::SandboxLimits& limits) const;

    protocol::SandboxResult run_inline_code(const protocol::StepDefinition& step,
                                            const nlohmann::json& inputs,
                                            const protocol::SandboxLimits& limits,
                                            const nlohmann::json& dependency_outputs) const;

    // Resolves and invokes a tool on a worker thread, waiting no longer than
    // the context deadline. `stale` is set when the descriptor came from an
    // expired cache entry.
    core::errors::Result<nlohmann::json> invoke_tool(const std::string& name,
                                                     const nlohmann::json& arguments,
                                                     const protocol::ToolCallContext& context,
                                                     bool& stale) const;

    registry::ToolRegistry& registry_;
    policy::PolicyGuard guard_;

    mutable std::mutex lingering_mutex_;
    mutable std::vector<std::thread> lingering_;
};

// Folds a failed SandboxResult into the error recorded on the step.
core::errors::AelError to_error(const protocol::SandboxResult& result);

}  // namespace ael::sandbox

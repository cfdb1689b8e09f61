#include "sandbox/step_executor.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"
#include "sandbox/script_analyzer.hpp"
#include "sandbox/script_interpreter.hpp"
#include "sandbox/script_parser.hpp"

namespace ael::sandbox {

using core::errors::AelError;
using core::errors::ErrorCategory;
using nlohmann::json;
using protocol::SandboxLimits;
using protocol::SandboxResult;
using protocol::StepDefinition;
using protocol::ToolCallContext;
using protocol::ViolationKind;

namespace {

using SteadyClock = std::chrono::steady_clock;

constexpr auto kPollInterval = std::chrono::milliseconds(25);
constexpr auto kStopGrace = std::chrono::milliseconds(500);

struct PendingCall {
    std::mutex mutex;
    std::condition_variable done_cv;
    bool done = false;
    core::errors::Result<json> result{json()};
};

SteadyClock::time_point deadline_after(const std::uint32_t timeout_ms) {
    if (timeout_ms == 0) {
        return SteadyClock::time_point::max();
    }
    return SteadyClock::now() + std::chrono::milliseconds(timeout_ms);
}

double elapsed_since(const SteadyClock::time_point start) {
    return std::chrono::duration<double, std::milli>(SteadyClock::now() - start).count();
}

bool cancelled(const std::shared_ptr<std::atomic_bool>& token) {
    return token && token->load();
}

std::optional<ViolationKind> violation_for_code(const std::string& code) {
    if (code == "forbidden_import") {
        return ViolationKind::ForbiddenImport;
    }
    if (code == "forbidden_eval") {
        return ViolationKind::ForbiddenEval;
    }
    if (code == "forbidden_file_access") {
        return ViolationKind::ForbiddenFileAccess;
    }
    if (code == "resource_limit") {
        return ViolationKind::ResourceLimit;
    }
    return std::nullopt;
}

SandboxResult failed(const std::string& code, const std::string& diagnostics) {
    SandboxResult result;
    result.success = false;
    result.error_code = code;
    result.diagnostics = diagnostics;
    result.violation = violation_for_code(code);
    result.resource_limit_exceeded = result.violation == ViolationKind::ResourceLimit;
    return result;
}

std::optional<std::string> missing_required_argument(const json& schema, const json& arguments) {
    if (!schema.is_object() || !schema.contains("required") || !schema["required"].is_array()) {
        return std::nullopt;
    }
    for (const auto& field : schema["required"]) {
        if (field.is_string() && !arguments.contains(field.get<std::string>())) {
            return field.get<std::string>();
        }
    }
    return std::nullopt;
}

}  // namespace

SandboxedStepExecutor::SandboxedStepExecutor(registry::ToolRegistry& registry,
                                             policy::PolicyGuard guard)
    : registry_(registry), guard_(std::move(guard)) {}

SandboxedStepExecutor::~SandboxedStepExecutor() {
    std::lock_guard<std::mutex> lock(lingering_mutex_);
    for (auto& worker : lingering_) {
        worker.join();
    }
}

std::size_t SandboxedStepExecutor::lingering_calls() const {
    std::lock_guard<std::mutex> lock(lingering_mutex_);
    return lingering_.size();
}

SandboxResult SandboxedStepExecutor::execute(const StepDefinition& step,
                                             const json& inputs,
                                             const SandboxLimits& limits,
                                             const json& dependency_outputs) const {
    const auto start = SteadyClock::now();
    SandboxResult result;
    try {
        if (cancelled(limits.cancel_token)) {
            result = failed("resource_limit", "Execution cancelled before step " + step.id);
        } else if (step.kind() == protocol::StepKind::ToolCall) {
            result = run_tool_call(step, inputs, limits);
        } else {
            result = run_inline_code(step, inputs, limits, dependency_outputs);
        }
    } catch (const std::exception& e) {
        result = failed("internal_error", std::string("Step executor fault: ") + e.what());
    }
    result.elapsed_ms = elapsed_since(start);

    if (result.violation.has_value()) {
        AEL_LOG_WARN("Sandbox: step " + step.id + " denied [" +
                     protocol::to_string(result.violation.value()) + "] " + result.diagnostics);
    } else if (!result.success) {
        AEL_LOG_DEBUG("Sandbox: step " + step.id + " failed [" + result.error_code + "] " +
                      result.diagnostics);
    }
    return result;
}

SandboxResult SandboxedStepExecutor::run_tool_call(const StepDefinition& step,
                                                   const json& inputs,
                                                   const SandboxLimits& limits) const {
    ToolCallContext context;
    context.run_id = limits.run_id;
    context.step_id = step.id;
    context.deadline = deadline_after(limits.timeout_ms);
    context.cancel_token = limits.cancel_token;

    bool stale = false;
    auto outcome = invoke_tool(step.tool, inputs, context, stale);
    if (core::errors::is_error(outcome)) {
        const auto& error = core::errors::get_error(outcome);
        SandboxResult result = failed(error.code, error.message);
        result.stale_tool = stale;
        return result;
    }

    SandboxResult result;
    result.success = true;
    result.output = std::move(core::errors::get_value(outcome));
    result.stale_tool = stale;
    return result;
}

SandboxResult SandboxedStepExecutor::run_inline_code(const StepDefinition& step,
                                                     const json& inputs,
                                                     const SandboxLimits& limits,
                                                     const json& dependency_outputs) const {
    const auto parsed = script::parse_script(step.code);
    if (core::errors::is_error(parsed)) {
        return failed("bad_syntax", core::errors::get_error(parsed).message);
    }
    const auto& program = core::errors::get_value(parsed);

    // Import and eval denials depend only on the code text.
    if (const auto violation = script::find_violation(program, limits.allowed_modules, guard_)) {
        return failed(protocol::to_string(violation->kind),
                      "line " + std::to_string(violation->line) + ": " + violation->message);
    }

    const auto deadline = deadline_after(limits.timeout_ms);
    bool stale = false;
    std::uint32_t tool_calls = 0;

    script::ScriptEnvironment environment;
    environment.inputs = inputs.is_object() ? inputs : json::object();
    environment.steps = dependency_outputs.is_object() ? dependency_outputs : json::object();
    environment.working_directory = limits.working_directory;
    environment.allowed_modules = limits.allowed_modules;
    environment.call_tool = [this, &step, &limits, &stale, &tool_calls, deadline](
                                const std::string& name,
                                const json& arguments) -> core::errors::Result<json> {
        if (std::find(step.granted_tools.begin(), step.granted_tools.end(), name) ==
            step.granted_tools.end()) {
            return AelError{ErrorCategory::Policy,
                            "Tool '" + name + "' is not granted to step " + step.id,
                            "tool_not_granted",
                            "List the tool under the step's `tools`."};
        }
        if (tool_calls >= limits.max_tool_calls) {
            return AelError{ErrorCategory::Sandbox,
                            "Step " + step.id + " exceeded its limit of " +
                                std::to_string(limits.max_tool_calls) + " tool calls",
                            "resource_limit"};
        }
        ++tool_calls;
        ToolCallContext context;
        context.run_id = limits.run_id;
        context.step_id = step.id;
        context.deadline = deadline;
        context.cancel_token = limits.cancel_token;
        bool call_stale = false;
        auto outcome = invoke_tool(name, arguments, context, call_stale);
        stale = stale || call_stale;
        return outcome;
    };

    script::ScriptLimits script_limits;
    script_limits.deadline = deadline;
    script_limits.max_operations = limits.max_operations;
    script_limits.memory_ceiling_bytes = limits.memory_ceiling_bytes;
    script_limits.cancel_token = limits.cancel_token;

    script::ScriptInterpreter interpreter(std::move(environment), script_limits, guard_);
    auto outcome = interpreter.run(program);

    SandboxResult result;
    if (outcome.success) {
        result.success = true;
        result.output = std::move(outcome.result);
    } else {
        result = failed(outcome.error_code, outcome.message);
        if (outcome.violation.has_value()) {
            result.violation = outcome.violation;
            result.resource_limit_exceeded = outcome.violation == ViolationKind::ResourceLimit;
        }
    }
    result.stale_tool = stale;
    return result;
}

core::errors::Result<json> SandboxedStepExecutor::invoke_tool(const std::string& name,
                                                              const json& arguments,
                                                              const ToolCallContext& context,
                                                              bool& stale) const {
    auto resolved = registry_.resolve(name);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const auto descriptor = core::errors::get_value(resolved).descriptor;
    stale = core::errors::get_value(resolved).stale;

    if (!descriptor->handler) {
        return AelError{ErrorCategory::Registry, "Tool has no handler: " + name,
                        "tool_not_found"};
    }
    if (const auto missing = missing_required_argument(descriptor->input_schema, arguments)) {
        return AelError{ErrorCategory::Execution,
                        "Tool " + name + " requires argument '" + missing.value() + "'",
                        "invalid_arguments"};
    }

    // The handler gets its own cancel flag so a timed-out call can be told to
    // stop without touching the run's token.
    ToolCallContext call_context = context;
    auto call_cancel = std::make_shared<std::atomic_bool>(cancelled(context.cancel_token));
    call_context.cancel_token = call_cancel;

    auto pending = std::make_shared<PendingCall>();
    std::thread worker([pending, descriptor, arguments, call_context]() {
        core::errors::Result<json> outcome{json()};
        try {
            outcome = descriptor->handler(arguments, call_context);
        } catch (const std::exception& e) {
            outcome = AelError{ErrorCategory::Execution,
                               "Tool " + descriptor->name + " raised: " + e.what(),
                               "tool_exception"};
        } catch (...) {
            outcome = AelError{ErrorCategory::Execution,
                               "Tool " + descriptor->name + " raised a non-standard exception",
                               "tool_exception"};
        }
        std::lock_guard<std::mutex> lock(pending->mutex);
        pending->result = std::move(outcome);
        pending->done = true;
        pending->done_cv.notify_all();
    });

    std::unique_lock<std::mutex> lock(pending->mutex);
    std::optional<AelError> stopped;
    while (!pending->done) {
        if (cancelled(context.cancel_token)) {
            stopped = AelError{ErrorCategory::Sandbox, "Tool call cancelled: " + name,
                               "resource_limit"};
            break;
        }
        const auto now = SteadyClock::now();
        if (now >= context.deadline) {
            stopped = AelError{ErrorCategory::Sandbox,
                               "Tool " + name + " exceeded its deadline", "resource_limit"};
            break;
        }
        const auto wait_until = std::min(context.deadline, now + kPollInterval);
        pending->done_cv.wait_until(lock, wait_until, [&pending]() { return pending->done; });
    }

    if (!stopped.has_value()) {
        lock.unlock();
        worker.join();
        return pending->result;
    }

    call_cancel->store(true);
    const bool returned =
        pending->done_cv.wait_for(lock, kStopGrace, [&pending]() { return pending->done; });
    lock.unlock();
    if (returned) {
        worker.join();
    } else {
        AEL_LOG_WARN("SandboxedStepExecutor: tool " + name +
                     " ignored its stop flag; it keeps running until it returns");
        std::lock_guard<std::mutex> lingering_lock(lingering_mutex_);
        lingering_.push_back(std::move(worker));
    }
    return stopped.value();
}

AelError to_error(const SandboxResult& result) {
    ErrorCategory category = ErrorCategory::Execution;
    if (result.violation.has_value()) {
        category = ErrorCategory::Sandbox;
    } else if (result.error_code == "tool_not_found" ||
               result.error_code == "source_unreachable") {
        category = ErrorCategory::Registry;
    } else if (result.error_code == "tool_not_granted") {
        category = ErrorCategory::Policy;
    } else if (result.error_code == "bad_syntax") {
        category = ErrorCategory::Validation;
    } else if (result.error_code == "internal_error") {
        category = ErrorCategory::Internal;
    }
    return AelError{category, result.diagnostics,
                    result.error_code.empty() ? "step_failed" : result.error_code};
}

}  // namespace ael::sandbox

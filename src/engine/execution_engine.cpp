#include "engine/execution_engine.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <set>
#include <system_error>
#include <thread>
#include <utility>
#include "core/logging/logger.hpp"
#include "workflow/input_binding.hpp"

namespace ael::engine {

using core::errors::AelError;
using core::errors::ErrorCategory;
using nlohmann::json;
using protocol::AttemptRecord;
using protocol::ExecutionReport;
using protocol::LifecycleEvent;
using protocol::RetryPolicy;
using protocol::StepResult;
using protocol::StepStatus;
using protocol::WorkflowDefinition;

namespace {

using SteadyClock = std::chrono::steady_clock;

constexpr auto kCancelPollInterval = std::chrono::milliseconds(20);
constexpr auto kBackoffSlice = std::chrono::milliseconds(10);

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    return static_cast<std::int64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count());
}

double elapsed_ms(const SteadyClock::time_point start) {
    return std::chrono::duration<double, std::milli>(SteadyClock::now() - start).count();
}

bool is_cancelled(const std::shared_ptr<std::atomic_bool>& token) {
    return token && token->load();
}

// Sleeps for `delay_ms` in short slices; false if cancelled meanwhile.
bool wait_backoff(const std::uint32_t delay_ms, const std::shared_ptr<std::atomic_bool>& token) {
    const auto until = SteadyClock::now() + std::chrono::milliseconds(delay_ms);
    while (SteadyClock::now() < until) {
        if (is_cancelled(token)) {
            return false;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            until - SteadyClock::now());
        std::this_thread::sleep_for(std::min<std::chrono::milliseconds>(
            kBackoffSlice, std::max(remaining, std::chrono::milliseconds(1))));
    }
    return !is_cancelled(token);
}

bool matches_type(const json& value, const std::string& type) {
    if (type == "any") {
        return true;
    }
    if (type == "string") {
        return value.is_string();
    }
    if (type == "number") {
        return value.is_number();
    }
    if (type == "integer") {
        return value.is_number_integer();
    }
    if (type == "boolean") {
        return value.is_boolean();
    }
    if (type == "object") {
        return value.is_object();
    }
    if (type == "array") {
        return value.is_array();
    }
    return false;
}

// Declared inputs get their defaults and are checked for presence and type;
// undeclared inputs pass through unchanged.
core::errors::Result<json> apply_inputs(const WorkflowDefinition& definition,
                                        const json& initial_inputs) {
    if (!initial_inputs.is_null() && !initial_inputs.is_object()) {
        return AelError{ErrorCategory::Input, "Workflow inputs must be an object",
                        "invalid_input"};
    }
    json inputs = initial_inputs.is_object() ? initial_inputs : json::object();
    for (const auto& declared : definition.inputs) {
        if (!inputs.contains(declared.name)) {
            if (declared.default_value.has_value()) {
                inputs[declared.name] = declared.default_value.value();
                continue;
            }
            if (declared.required) {
                return AelError{ErrorCategory::Input,
                                "Missing required workflow input: " + declared.name,
                                "missing_input",
                                "Pass it with --input " + declared.name + "=<value>."};
            }
            continue;
        }
        if (!matches_type(inputs[declared.name], declared.type)) {
            return AelError{ErrorCategory::Input,
                            "Workflow input " + declared.name + " must be of type " +
                                declared.type,
                            "invalid_input"};
        }
    }
    return inputs;
}

RetryPolicy effective_retry(const protocol::StepDefinition& step,
                            const WorkflowDefinition& definition,
                            const core::config::EngineConfig& config) {
    if (step.retry.has_value()) {
        return step.retry.value();
    }
    if (definition.defaults.retry.has_value()) {
        return definition.defaults.retry.value();
    }
    return config.default_retry;
}

std::uint32_t effective_timeout(const protocol::StepDefinition& step,
                                const WorkflowDefinition& definition,
                                const core::config::EngineConfig& config) {
    if (step.timeout_ms.has_value()) {
        return step.timeout_ms.value();
    }
    if (definition.defaults.step_timeout_ms.has_value()) {
        return definition.defaults.step_timeout_ms.value();
    }
    return config.default_step_timeout_ms;
}

StepResult skipped_result(const std::string& step_id,
                          const std::uint32_t max_attempts,
                          const std::string& code,
                          const std::string& message) {
    StepResult result;
    result.step_id = step_id;
    result.status = StepStatus::Skipped;
    result.max_attempts = max_attempts;
    result.error = AelError{ErrorCategory::Execution, message, code};
    result.started_at_ms = now_unix_ms();
    result.completed_at_ms = result.started_at_ms;
    return result;
}

}  // namespace

struct ExecutionEngine::RunContext {
    RunContext(const WorkflowDefinition& definition_in,
               const workflow::WorkflowDag& dag_in,
               std::string run_id_in,
               json inputs_in,
               std::shared_ptr<std::atomic_bool> cancel_token_in)
        : definition(definition_in),
          dag(dag_in),
          run_id(std::move(run_id_in)),
          inputs(std::move(inputs_in)),
          cancel_token(std::move(cancel_token_in)) {}

    const WorkflowDefinition& definition;
    const workflow::WorkflowDag& dag;
    const std::string run_id;
    const json inputs;
    const std::shared_ptr<std::atomic_bool> cancel_token;

    // Guards everything below.
    std::mutex mutex;
    std::condition_variable changed;
    std::vector<StepResult> results;
    std::vector<std::size_t> remaining;
    std::set<std::size_t> ready;
    json step_outputs = json::object();
    std::size_t terminal = 0;
    bool cancelled = false;

    // Taken before the state lock is released so events leave in state order.
    std::mutex event_mutex;
};

ExecutionEngine::ExecutionEngine(registry::ToolRegistry& registry,
                                 core::config::EngineConfig config)
    : registry_(registry),
      config_(std::move(config)),
      validator_(&registry_, config_.defer_unknown_tools),
      executor_(registry_) {}

void ExecutionEngine::set_event_sink(protocol::EventSink sink) {
    sink_ = std::move(sink);
}

core::errors::Result<workflow::WorkflowDag> ExecutionEngine::validate(
    const WorkflowDefinition& definition) const {
    return validator_.validate(definition);
}

core::errors::Result<session::RunState> ExecutionEngine::cancel(const std::string& run_id) {
    return runs_.cancel_run(run_id);
}

std::vector<std::string> ExecutionEngine::active_runs() const {
    return runs_.active_runs();
}

std::vector<protocol::ToolDescriptor> ExecutionEngine::list_tools() const {
    return registry_.list();
}

void ExecutionEngine::emit(const LifecycleEvent& event) const {
    if (sink_) {
        sink_(event);
    }
}

ExecutionReport ExecutionEngine::run(const WorkflowDefinition& definition,
                                     const json& initial_inputs) {
    const auto steady_start = SteadyClock::now();
    ExecutionReport report;
    report.workflow_name = definition.name;
    report.started_at_ms = now_unix_ms();

    auto finish = [&report, steady_start]() {
        report.completed_at_ms = now_unix_ms();
        report.duration_ms = elapsed_ms(steady_start);
    };

    auto started = runs_.start_run(definition.name);
    if (core::errors::is_error(started)) {
        report.error = core::errors::get_error(started);
        finish();
        return report;
    }
    report.run_id = core::errors::get_value(started);
    core::logging::Logger::get().set_run_id(report.run_id);

    auto mark_failed = [this, &report](const std::string& reason) {
        const auto marked = runs_.mark_failed(report.run_id, reason);
        if (core::errors::is_error(marked)) {
            AEL_LOG_WARN("ExecutionEngine: " + core::errors::get_error(marked).message);
        }
    };

    auto dag_result = validate(definition);
    if (core::errors::is_error(dag_result)) {
        report.error = core::errors::get_error(dag_result);
        AEL_LOG_WARN("ExecutionEngine: workflow " + definition.name + " rejected [" +
                     report.error->code + "] " + report.error->message);
        mark_failed(report.error->code);
        finish();
        return report;
    }
    const auto& dag = core::errors::get_value(dag_result);

    auto inputs_result = apply_inputs(definition, initial_inputs);
    if (core::errors::is_error(inputs_result)) {
        report.error = core::errors::get_error(inputs_result);
        for (const auto& step : definition.steps) {
            StepResult skipped;
            skipped.step_id = step.id;
            skipped.status = StepStatus::Skipped;
            skipped.max_attempts = effective_retry(step, definition, config_).max_attempts;
            report.steps.push_back(std::move(skipped));
            report.skipped_steps.push_back(step.id);
        }
        report.steps_skipped = report.steps.size();
        AEL_LOG_WARN("ExecutionEngine: " + report.error->message);
        mark_failed(report.error->code);
        finish();
        return report;
    }

    auto token_result = runs_.get_cancel_token(report.run_id);
    if (core::errors::is_error(token_result)) {
        report.error = core::errors::get_error(token_result);
        finish();
        return report;
    }

    RunContext run(definition, dag, report.run_id,
                   std::move(core::errors::get_value(inputs_result)),
                   core::errors::get_value(token_result));
    const std::size_t total = dag.size();
    run.results.resize(total);
    run.remaining.resize(total);
    for (std::size_t i = 0; i < total; ++i) {
        run.results[i].step_id = dag.id(i);
        run.results[i].max_attempts =
            effective_retry(definition.steps[i], definition, config_).max_attempts;
        run.remaining[i] = dag.predecessors(i).size();
        if (run.remaining[i] == 0) {
            run.ready.insert(i);
        }
    }

    AEL_LOG_INFO("ExecutionEngine: run " + report.run_id + " started for workflow " +
                 definition.name + " (" + std::to_string(total) + " steps)");
    {
        std::lock_guard<std::mutex> event_lock(run.event_mutex);
        emit(protocol::RunStartedEvent{report.run_id, definition.name, total});
    }

    const std::size_t worker_count =
        std::max<std::size_t>(1, std::min(config_.max_parallelism, total));
    std::vector<std::thread> workers;
    try {
        for (std::size_t i = 0; i < worker_count; ++i) {
            workers.emplace_back([this, &run]() { worker_loop(run); });
        }
    } catch (const std::system_error& e) {
        AEL_LOG_ERROR("ExecutionEngine: unable to start worker: " + std::string(e.what()));
        if (workers.empty()) {
            report.error = AelError{ErrorCategory::Internal,
                                    "Unable to start worker threads: " + std::string(e.what()),
                                    "worker_unavailable"};
            std::unique_lock<std::mutex> lock(run.mutex);
            const auto events = skip_pending(run, "worker_unavailable",
                                             "No worker thread available");
            std::unique_lock<std::mutex> event_lock(run.event_mutex);
            lock.unlock();
            for (const auto& event : events) {
                emit(event);
            }
        }
    }

    {
        std::unique_lock<std::mutex> lock(run.mutex);
        while (run.terminal < total) {
            run.changed.wait_for(lock, kCancelPollInterval,
                                 [&run, total]() { return run.terminal >= total; });
            if (run.cancelled || !is_cancelled(run.cancel_token)) {
                continue;
            }
            run.cancelled = true;
            AEL_LOG_INFO("ExecutionEngine: run " + report.run_id + " cancelled");
            const auto events = skip_pending(run, "cancelled", "Run was cancelled");
            std::unique_lock<std::mutex> event_lock(run.event_mutex);
            lock.unlock();
            for (const auto& event : events) {
                emit(event);
            }
            event_lock.unlock();
            lock.lock();
        }
    }
    for (auto& worker : workers) {
        worker.join();
    }

    report.cancelled = run.cancelled || is_cancelled(run.cancel_token);
    report.steps = run.results;
    for (const auto& step : report.steps) {
        if (step.status == StepStatus::Succeeded) {
            ++report.steps_succeeded;
        } else if (step.status == StepStatus::Failed) {
            ++report.steps_failed;
            report.failed_steps.push_back(step.step_id);
        } else {
            ++report.steps_skipped;
            report.skipped_steps.push_back(step.step_id);
        }
    }

    bool succeeded = !report.error.has_value() && !report.cancelled &&
                     report.steps_succeeded == report.steps.size();
    if (succeeded) {
        const json scope = workflow::make_binding_scope(run.inputs, run.step_outputs);
        for (const auto& output : definition.outputs) {
            if (output.value.has_value()) {
                report.outputs[output.name] = output.value.value();
                continue;
            }
            auto reference = workflow::parse_reference(output.from.value_or(""));
            auto resolved = core::errors::is_error(reference)
                                ? core::errors::Result<json>(core::errors::get_error(reference))
                                : workflow::resolve_reference(
                                      core::errors::get_value(reference), scope);
            if (core::errors::is_error(resolved)) {
                report.error = AelError{ErrorCategory::Execution,
                                        "Workflow output " + output.name + ": " +
                                            core::errors::get_error(resolved).message,
                                        "unbound_output"};
                succeeded = false;
                break;
            }
            report.outputs[output.name] = std::move(core::errors::get_value(resolved));
        }
        if (!succeeded) {
            report.outputs = json::object();
        }
    }
    report.status = succeeded ? protocol::RunStatus::Succeeded : protocol::RunStatus::Failed;
    finish();

    core::errors::Result<session::RunState> marked = session::RunState::Failed;
    if (report.cancelled) {
        marked = runs_.mark_cancelled(report.run_id);
    } else if (succeeded) {
        marked = runs_.mark_succeeded(report.run_id);
    } else {
        marked = runs_.mark_failed(report.run_id,
                                   report.error.has_value()
                                       ? report.error->code
                                       : std::to_string(report.steps_failed) + " step(s) failed");
    }
    if (core::errors::is_error(marked)) {
        AEL_LOG_WARN("ExecutionEngine: " + core::errors::get_error(marked).message);
    }

    AEL_LOG_INFO("ExecutionEngine: run " + report.run_id + " " +
                 protocol::to_string(report.status) + " (" +
                 std::to_string(report.steps_succeeded) + " succeeded, " +
                 std::to_string(report.steps_failed) + " failed, " +
                 std::to_string(report.steps_skipped) + " skipped)");
    {
        std::lock_guard<std::mutex> event_lock(run.event_mutex);
        emit(protocol::RunFinishedEvent{report.run_id, report});
    }
    return report;
}

void ExecutionEngine::worker_loop(RunContext& run) const {
    const std::size_t total = run.dag.size();
    std::unique_lock<std::mutex> lock(run.mutex);
    while (true) {
        run.changed.wait(lock, [&run, total]() {
            return !run.ready.empty() || run.terminal >= total;
        });
        if (run.ready.empty()) {
            return;
        }

        const std::size_t index = *run.ready.begin();
        run.ready.erase(run.ready.begin());
        run.results[index].status = StepStatus::Running;
        const json scope = workflow::make_binding_scope(run.inputs, run.step_outputs);
        lock.unlock();

        StepResult result = execute_step(run, index, scope);

        lock.lock();
        std::vector<LifecycleEvent> events;
        events.push_back(protocol::StepFinishedEvent{run.run_id, result});
        const bool succeeded = result.status == StepStatus::Succeeded;
        if (succeeded) {
            run.step_outputs[result.step_id]["output"] = result.output;
        }
        run.results[index] = std::move(result);
        ++run.terminal;

        if (succeeded) {
            for (const std::size_t successor : run.dag.successors(index)) {
                if (--run.remaining[successor] == 0 &&
                    run.results[successor].status == StepStatus::Pending) {
                    run.ready.insert(successor);
                }
            }
        } else {
            const std::string& failed_id = run.dag.id(index);
            for (const std::size_t dependent : run.dag.transitive_dependents(index)) {
                auto& entry = run.results[dependent];
                if (entry.status != StepStatus::Pending) {
                    continue;
                }
                entry = skipped_result(entry.step_id, entry.max_attempts, "upstream_failed",
                                       "Skipped because step " + failed_id + " failed");
                run.ready.erase(dependent);
                ++run.terminal;
                events.push_back(protocol::StepFinishedEvent{run.run_id, entry});
            }
        }
        run.changed.notify_all();

        std::unique_lock<std::mutex> event_lock(run.event_mutex);
        lock.unlock();
        for (const auto& event : events) {
            emit(event);
        }
        event_lock.unlock();
        lock.lock();
    }
}

std::vector<LifecycleEvent> ExecutionEngine::skip_pending(RunContext& run,
                                                          const std::string& code,
                                                          const std::string& message) const {
    std::vector<LifecycleEvent> events;
    for (auto& entry : run.results) {
        if (entry.status != StepStatus::Pending) {
            continue;
        }
        entry = skipped_result(entry.step_id, entry.max_attempts, code, message);
        ++run.terminal;
        events.push_back(protocol::StepFinishedEvent{run.run_id, entry});
    }
    run.ready.clear();
    run.changed.notify_all();
    return events;
}

StepResult ExecutionEngine::execute_step(RunContext& run,
                                         const std::size_t index,
                                         const json& scope) const {
    const auto& step = run.definition.steps[index];
    const auto steady_start = SteadyClock::now();
    const RetryPolicy policy = effective_retry(step, run.definition, config_);

    StepResult result;
    result.step_id = step.id;
    result.status = StepStatus::Running;
    result.max_attempts = policy.max_attempts;
    result.started_at_ms = now_unix_ms();

    auto finish = [&result, steady_start](const StepStatus status) {
        result.status = status;
        result.completed_at_ms = now_unix_ms();
        result.duration_ms = elapsed_ms(steady_start);
        return result;
    };

    auto bound = workflow::bind_step_inputs(step.inputs, scope);
    if (core::errors::is_error(bound)) {
        result.error = core::errors::get_error(bound);
        AEL_LOG_WARN("ExecutionEngine: step " + step.id + " " + result.error->message);
        return finish(StepStatus::Failed);
    }
    json step_inputs = std::move(core::errors::get_value(bound));

    json dependency_outputs = json::object();
    const json& all_outputs = scope["steps"];
    for (const std::size_t predecessor : run.dag.predecessors(index)) {
        const std::string& id = run.dag.id(predecessor);
        if (all_outputs.contains(id)) {
            dependency_outputs[id] = all_outputs[id];
        }
    }

    if (step.kind() == protocol::StepKind::InlineCode) {
        json merged = scope["inputs"];
        for (auto it = step_inputs.begin(); it != step_inputs.end(); ++it) {
            merged[it.key()] = it.value();
        }
        step_inputs = std::move(merged);
    }

    protocol::SandboxLimits limits;
    limits.timeout_ms = effective_timeout(step, run.definition, config_);
    limits.max_operations = config_.max_operations;
    limits.memory_ceiling_bytes = config_.memory_ceiling_bytes;
    limits.max_tool_calls = config_.max_tool_calls;
    limits.working_directory = config_.working_directory;
    limits.allowed_modules = config_.allowed_modules;
    limits.cancel_token = run.cancel_token;
    limits.run_id = run.run_id;

    for (std::uint32_t attempt = 1; attempt <= policy.max_attempts; ++attempt) {
        if (attempt > 1 && !wait_backoff(policy.delay_before(attempt), run.cancel_token)) {
            break;
        }
        if (is_cancelled(run.cancel_token)) {
            break;
        }

        {
            std::lock_guard<std::mutex> event_lock(run.event_mutex);
            emit(protocol::StepStartedEvent{run.run_id, step.id, attempt});
        }
        AEL_LOG_DEBUG("ExecutionEngine: step " + step.id + " attempt " +
                      std::to_string(attempt) + "/" + std::to_string(policy.max_attempts));

        const auto sandbox_result =
            executor_.execute(step, step_inputs, limits, dependency_outputs);

        AttemptRecord record;
        record.attempt = attempt;
        record.success = sandbox_result.success;
        record.error_code = sandbox_result.error_code;
        record.diagnostics = sandbox_result.diagnostics;
        record.duration_ms = sandbox_result.elapsed_ms;
        result.attempt_history.push_back(std::move(record));
        result.attempts = attempt;

        if (sandbox_result.stale_tool) {
            AEL_LOG_WARN("ExecutionEngine: step " + step.id +
                         " used a stale tool descriptor (source unreachable)");
        }
        if (sandbox_result.success) {
            result.output = sandbox_result.output;
            result.error.reset();
            return finish(StepStatus::Succeeded);
        }
        result.error = sandbox::to_error(sandbox_result);
        AEL_LOG_WARN("ExecutionEngine: step " + step.id + " attempt " + std::to_string(attempt) +
                     " failed [" + result.error->code + "] " + result.error->message);
    }

    if (result.attempts == 0) {
        result.error = AelError{ErrorCategory::Execution, "Run was cancelled", "cancelled"};
    }
    return finish(StepStatus::Failed);
}

}  // namespace ael::engine

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include "core/errors/ael_errors.hpp"
#include "engine/execution_engine.hpp"
#include "registry/tool_registry.hpp"
#include "registry/tool_source.hpp"
#include "workflow/workflow_parser.hpp"

namespace {

using ael::core::errors::AelError;
using ael::core::errors::ErrorCategory;
using ael::core::errors::get_error;
using ael::core::errors::get_value;
using ael::core::errors::is_error;
using ael::engine::ExecutionEngine;
using ael::protocol::ExecutionReport;
using ael::protocol::LifecycleEvent;
using ael::protocol::RunStatus;
using ael::protocol::StepStatus;
using ael::protocol::ToolCallContext;
using ael::protocol::ToolDescriptor;
using ael::protocol::WorkflowDefinition;
using ael::registry::StaticToolSource;
using ael::registry::ToolRegistry;
using nlohmann::json;

WorkflowDefinition parse(const std::string& yaml) {
    auto parsed = ael::workflow::parse_workflow(yaml);
    EXPECT_FALSE(is_error(parsed)) << (is_error(parsed) ? get_error(parsed).message : "");
    return is_error(parsed) ? WorkflowDefinition{} : get_value(parsed);
}

// Records lifecycle events as short strings: "run_started", "start:<id>#<n>",
// "finish:<id>:<status>", "run_finished".
class EventLog {
public:
    ael::protocol::EventSink sink() {
        return [this](const LifecycleEvent& event) { record(event); };
    }

    std::vector<std::string> entries() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_;
    }

    std::vector<std::string> started_steps() const {
        std::vector<std::string> ids;
        for (const auto& entry : entries()) {
            if (entry.rfind("start:", 0) == 0) {
                ids.push_back(entry.substr(6, entry.find('#') - 6));
            }
        }
        return ids;
    }

    std::future<std::string> run_id() { return run_id_.get_future(); }

private:
    void record(const LifecycleEvent& event) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (const auto* started = std::get_if<ael::protocol::RunStartedEvent>(&event)) {
            entries_.push_back("run_started");
            run_id_.set_value(started->run_id);
        } else if (const auto* step = std::get_if<ael::protocol::StepStartedEvent>(&event)) {
            entries_.push_back("start:" + step->step_id + "#" + std::to_string(step->attempt));
        } else if (const auto* done = std::get_if<ael::protocol::StepFinishedEvent>(&event)) {
            entries_.push_back("finish:" + done->result.step_id + ":" +
                               ael::protocol::to_string(done->result.status));
        } else {
            entries_.push_back("run_finished");
        }
    }

    mutable std::mutex mutex_;
    std::vector<std::string> entries_;
    std::promise<std::string> run_id_;
};

class ExecutionEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        source_ = std::make_shared<StaticToolSource>("test");

        add_tool("double", [](const json& arguments, const ToolCallContext&)
                               -> ael::core::errors::Result<json> {
            return json{{"value", arguments.value("value", 0) * 2}};
        });

        add_tool("flaky", [this](const json&, const ToolCallContext&)
                              -> ael::core::errors::Result<json> {
            if (++flaky_calls_ <= 2) {
                return AelError{ErrorCategory::Execution, "transient", "tool_failed"};
            }
            return json{{"ok", true}};
        });

        add_tool("always_fails", [](const json&, const ToolCallContext&)
                                     -> ael::core::errors::Result<json> {
            return AelError{ErrorCategory::Execution, "permanent", "tool_failed"};
        });

        add_tool("busy", [this](const json&, const ToolCallContext&)
                             -> ael::core::errors::Result<json> {
            const int now_active = ++active_;
            int seen = max_active_.load();
            while (now_active > seen && !max_active_.compare_exchange_weak(seen, now_active)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            --active_;
            return json{{"done", true}};
        });

        add_tool("wait_for_stop", [](const json&, const ToolCallContext& context)
                                      -> ael::core::errors::Result<json> {
            while (!context.should_stop()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }
            return AelError{ErrorCategory::Execution, "stopped", "cancelled"};
        });

        ASSERT_FALSE(is_error(registry_.add_source(source_)));
        ASSERT_FALSE(is_error(registry_.refresh("test")));
    }

    void add_tool(const std::string& name, ael::protocol::ToolHandler handler) {
        ToolDescriptor tool;
        tool.name = name;
        tool.handler = std::move(handler);
        source_->add_tool(tool);
    }

    static ael::core::config::EngineConfig config_with(const std::size_t parallelism) {
        ael::core::config::EngineConfig config;
        config.max_parallelism = parallelism;
        config.default_step_timeout_ms = 10000;
        return config;
    }

    ToolRegistry registry_;
    std::shared_ptr<StaticToolSource> source_;
    std::atomic<int> flaky_calls_{0};
    std::atomic<int> active_{0};
    std::atomic<int> max_active_{0};
};

const char* kLinear = R"(
name: linear
inputs:
  - { name: seed, type: integer }
steps:
  - id: a
    tool: double
    inputs: { value: "{{ inputs.seed }}" }
  - id: b
    code: result = steps.a.output.value + 1
    depends_on: [a]
  - id: c
    tool: double
    inputs: { value: "{{ steps.b.output }}" }
    depends_on: [b]
outputs:
  - { name: final, from: steps.c.output.value }
)";

TEST_F(ExecutionEngineTest, RunsLinearChainInOrder) {
    ExecutionEngine engine(registry_, config_with(4));
    EventLog log;
    engine.set_event_sink(log.sink());

    const ExecutionReport report = engine.run(parse(kLinear), json{{"seed", 5}});
    ASSERT_EQ(report.status, RunStatus::Succeeded)
        << (report.error ? report.error->message : "");
    EXPECT_EQ(report.outputs["final"], 22);
    EXPECT_EQ(report.steps_succeeded, 3u);
    ASSERT_EQ(report.steps.size(), 3u);
    EXPECT_EQ(report.steps[1].output, 11);
    EXPECT_EQ(report.find_step("c")->attempts, 1u);

    EXPECT_EQ(log.started_steps(), (std::vector<std::string>{"a", "b", "c"}));
    const auto entries = log.entries();
    ASSERT_FALSE(entries.empty());
    EXPECT_EQ(entries.front(), "run_started");
    EXPECT_EQ(entries.back(), "run_finished");
    EXPECT_TRUE(engine.active_runs().empty());
}

TEST_F(ExecutionEngineTest, RetriesUntilSuccess) {
    ExecutionEngine engine(registry_, config_with(2));
    const auto report = engine.run(parse(R"(
name: retry
steps:
  - id: shaky
    tool: flaky
    retry: { max_attempts: 3, backoff: fixed, delay_ms: 5 }
)"));
    ASSERT_EQ(report.status, RunStatus::Succeeded);
    const auto* step = report.find_step("shaky");
    ASSERT_NE(step, nullptr);
    EXPECT_EQ(step->attempts, 3u);
    ASSERT_EQ(step->attempt_history.size(), 3u);
    EXPECT_FALSE(step->attempt_history[0].success);
    EXPECT_TRUE(step->attempt_history[2].success);
    EXPECT_FALSE(step->error.has_value());
}

TEST_F(ExecutionEngineTest, FailureSkipsDependentsButNotSiblings) {
    ExecutionEngine engine(registry_, config_with(2));
    EventLog log;
    engine.set_event_sink(log.sink());

    const auto report = engine.run(parse(R"(
name: partial
steps:
  - id: broken
    tool: always_fails
    retry: { max_attempts: 3 }
  - id: downstream
    code: result = 1
    depends_on: [broken]
  - id: further
    code: result = 2
    depends_on: [downstream]
  - id: independent
    tool: double
    inputs: { value: 2 }
)"));
    EXPECT_EQ(report.status, RunStatus::Failed);
    EXPECT_EQ(report.failed_steps, std::vector<std::string>{"broken"});
    EXPECT_EQ(report.skipped_steps, (std::vector<std::string>{"downstream", "further"}));
    EXPECT_EQ(report.steps_succeeded, 1u);

    const auto* broken = report.find_step("broken");
    EXPECT_EQ(broken->attempts, 3u);
    EXPECT_EQ(broken->error->code, "tool_failed");

    const auto* skipped = report.find_step("further");
    EXPECT_EQ(skipped->status, StepStatus::Skipped);
    EXPECT_EQ(skipped->attempts, 0u);
    EXPECT_EQ(skipped->error->code, "upstream_failed");

    EXPECT_EQ(report.find_step("independent")->output["value"], 4);
    EXPECT_TRUE(report.outputs.empty());

    const auto started = log.started_steps();
    EXPECT_EQ(std::count(started.begin(), started.end(), "broken"), 3);
    EXPECT_EQ(std::count(started.begin(), started.end(), "downstream"), 0);
}

TEST_F(ExecutionEngineTest, SameInputsGiveSameResults) {
    const auto definition = parse(R"(
name: fan
steps:
  - id: root
    tool: double
    inputs: { value: 1 }
  - id: left
    code: result = steps.root.output.value * 10
    depends_on: [root]
  - id: right
    code: result = steps.root.output.value * 100
    depends_on: [root]
  - id: join
    code: result = steps.left.output + steps.right.output
    depends_on: [left, right]
outputs:
  - { name: total, from: steps.join.output }
)");

    std::vector<std::vector<std::string>> orders;
    std::vector<json> outputs;
    for (int i = 0; i < 3; ++i) {
        ExecutionEngine engine(registry_, config_with(1));
        EventLog log;
        engine.set_event_sink(log.sink());
        const auto report = engine.run(definition);
        ASSERT_EQ(report.status, RunStatus::Succeeded);
        orders.push_back(log.started_steps());
        outputs.push_back(report.outputs);
    }
    EXPECT_EQ(orders[0], (std::vector<std::string>{"root", "left", "right", "join"}));
    EXPECT_EQ(orders[0], orders[1]);
    EXPECT_EQ(orders[1], orders[2]);
    EXPECT_EQ(outputs[0]["total"], 220);
    EXPECT_EQ(outputs[0], outputs[2]);
}

TEST_F(ExecutionEngineTest, IndependentStepsRunInParallel) {
    const auto definition = parse(R"(
name: parallel
steps:
  - { id: one, tool: busy }
  - { id: two, tool: busy }
)");

    ExecutionEngine parallel(registry_, config_with(2));
    ASSERT_EQ(parallel.run(definition).status, RunStatus::Succeeded);
    EXPECT_EQ(max_active_.load(), 2);

    max_active_ = 0;
    ExecutionEngine serial(registry_, config_with(1));
    ASSERT_EQ(serial.run(definition).status, RunStatus::Succeeded);
    EXPECT_EQ(max_active_.load(), 1);
}

TEST_F(ExecutionEngineTest, CancelStopsRunningAndSkipsPending) {
    ExecutionEngine engine(registry_, config_with(2));
    EventLog log;
    engine.set_event_sink(log.sink());
    auto run_id = log.run_id();

    const auto definition = parse(R"(
name: cancellable
steps:
  - id: waiting
    tool: wait_for_stop
  - id: after
    code: result = 1
    depends_on: [waiting]
)");

    const auto start = std::chrono::steady_clock::now();
    auto pending = std::async(std::launch::async,
                              [&engine, &definition]() { return engine.run(definition); });

    const std::string id = run_id.get();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    auto cancelled = engine.cancel(id);
    ASSERT_FALSE(is_error(cancelled));

    const auto report = pending.get();
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
    EXPECT_TRUE(report.cancelled);
    EXPECT_EQ(report.status, RunStatus::Failed);
    EXPECT_EQ(report.find_step("waiting")->status, StepStatus::Failed);
    EXPECT_EQ(report.find_step("after")->status, StepStatus::Skipped);
    EXPECT_EQ(report.find_step("after")->error->code, "cancelled");
    EXPECT_TRUE(is_error(engine.cancel(id)));
}

TEST_F(ExecutionEngineTest, MissingInputSkipsEverything) {
    ExecutionEngine engine(registry_, config_with(2));
    EventLog log;
    engine.set_event_sink(log.sink());

    const auto report = engine.run(parse(kLinear));
    EXPECT_EQ(report.status, RunStatus::Failed);
    ASSERT_TRUE(report.error.has_value());
    EXPECT_EQ(report.error->code, "missing_input");
    EXPECT_EQ(report.error->category, ErrorCategory::Input);
    EXPECT_EQ(report.steps_skipped, 3u);
    EXPECT_TRUE(log.started_steps().empty());
}

TEST_F(ExecutionEngineTest, WrongInputTypeIsRejected) {
    ExecutionEngine engine(registry_, config_with(2));
    const auto report = engine.run(parse(kLinear), json{{"seed", "five"}});
    ASSERT_TRUE(report.error.has_value());
    EXPECT_EQ(report.error->code, "invalid_input");
}

TEST_F(ExecutionEngineTest, InvalidWorkflowEmitsNoEvents) {
    ExecutionEngine engine(registry_, config_with(2));
    EventLog log;
    engine.set_event_sink(log.sink());

    const auto report = engine.run(parse(R"(
name: loop
steps:
  - { id: a, code: result = 1, depends_on: [b] }
  - { id: b, code: result = 2, depends_on: [a] }
)"));
    EXPECT_EQ(report.status, RunStatus::Failed);
    ASSERT_TRUE(report.error.has_value());
    EXPECT_EQ(report.error->code, "cyclic_dependency");
    EXPECT_TRUE(report.steps.empty());
    EXPECT_TRUE(log.entries().empty());
}

TEST_F(ExecutionEngineTest, UnresolvableOutputFailsRun) {
    ExecutionEngine engine(registry_, config_with(2));
    const auto report = engine.run(parse(R"(
name: outputs
steps:
  - { id: a, code: "result = {x: 1}" }
outputs:
  - { name: missing, from: steps.a.output.y }
)"));
    EXPECT_EQ(report.status, RunStatus::Failed);
    ASSERT_TRUE(report.error.has_value());
    EXPECT_EQ(report.error->code, "unbound_output");
    EXPECT_EQ(report.steps_succeeded, 1u);
}

TEST_F(ExecutionEngineTest, SandboxViolationFailsStep) {
    ExecutionEngine engine(registry_, config_with(2));
    const auto report = engine.run(parse(R"(
name: denied
steps:
  - id: sneaky
    code: |
      import os
      result = 1
)"));
    EXPECT_EQ(report.status, RunStatus::Failed);
    const auto* step = report.find_step("sneaky");
    ASSERT_NE(step, nullptr);
    EXPECT_EQ(step->error->code, "forbidden_import");
    EXPECT_EQ(step->error->category, ErrorCategory::Sandbox);
}

}  // namespace

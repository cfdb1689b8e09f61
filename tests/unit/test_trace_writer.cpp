#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/run_id.hpp"
#include "core/errors/ael_errors.hpp"
#include "protocol/event_contract.hpp"
#include "protocol/run_execution_contract.hpp"
#include "session/trace_writer.hpp"

namespace {

using ael::core::errors::AelError;
using ael::core::errors::ErrorCategory;
using ael::core::errors::get_error;
using ael::core::errors::get_value;
using ael::core::errors::is_error;
using ael::protocol::ExecutionReport;
using ael::protocol::RunFinishedEvent;
using ael::protocol::RunStartedEvent;
using ael::protocol::RunStatus;
using ael::protocol::StepFinishedEvent;
using ael::protocol::StepResult;
using ael::protocol::StepStartedEvent;
using ael::protocol::StepStatus;
using ael::session::TraceWriter;
using nlohmann::json;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_trace_writer_" + ael::core::config::generate_run_id());
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

std::vector<std::string> read_lines(const std::filesystem::path& file_path) {
    std::vector<std::string> lines;
    std::ifstream in(file_path);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

TEST(TraceWriterTest, WritesRunStepAndFinalEvents) {
    TempWorkspace workspace;
    TraceWriter writer(workspace.root());
    const std::string run_id = "run-trace-1";

    const auto started = writer.write_run_started(RunStartedEvent{run_id, "greet", 2});
    ASSERT_FALSE(is_error(started));
    const auto log_path = get_value(started);
    EXPECT_TRUE(std::filesystem::exists(log_path));
    EXPECT_EQ(log_path.filename().string(), run_id + ".jsonl");
    EXPECT_EQ(log_path.parent_path().filename().string(), ".ael_runs");

    ASSERT_FALSE(is_error(writer.write_step_started(StepStartedEvent{run_id, "hello", 1})));

    StepResult step;
    step.step_id = "hello";
    step.status = StepStatus::Succeeded;
    step.output = json{{"text", "hi"}};
    step.attempts = 1;
    ASSERT_FALSE(is_error(writer.write_step(run_id, step)));

    ExecutionReport report;
    report.run_id = run_id;
    report.workflow_name = "greet";
    report.status = RunStatus::Failed;
    report.failed_steps = {"bye"};
    report.error = AelError{ErrorCategory::Execution, "step bye failed", "step_failed"};
    ASSERT_FALSE(is_error(writer.write_run_finished(report)));

    const auto lines = read_lines(log_path);
    ASSERT_EQ(lines.size(), 4u);

    const auto run_event = json::parse(lines[0]);
    EXPECT_EQ(run_event.at("event").get<std::string>(), "run_started");
    EXPECT_EQ(run_event.at("run_id").get<std::string>(), run_id);
    EXPECT_TRUE(run_event.at("ts_unix_ms").is_number_integer());
    EXPECT_EQ(run_event.at("payload").at("workflow").get<std::string>(), "greet");
    EXPECT_EQ(run_event.at("payload").at("step_count").get<int>(), 2);

    const auto attempt_event = json::parse(lines[1]);
    EXPECT_EQ(attempt_event.at("event").get<std::string>(), "step_started");
    EXPECT_EQ(attempt_event.at("payload").at("attempt").get<int>(), 1);

    const auto step_event = json::parse(lines[2]);
    EXPECT_EQ(step_event.at("event").get<std::string>(), "step");
    EXPECT_EQ(step_event.at("payload").at("id").get<std::string>(), "hello");
    EXPECT_EQ(step_event.at("payload").at("status").get<std::string>(), "succeeded");
    EXPECT_EQ(step_event.at("payload").at("output").at("text").get<std::string>(), "hi");
    EXPECT_TRUE(step_event.at("payload").at("error").is_null());

    const auto final_event = json::parse(lines[3]);
    EXPECT_EQ(final_event.at("event").get<std::string>(), "run_finished");
    EXPECT_EQ(final_event.at("payload").at("status").get<std::string>(), "failed");
    EXPECT_EQ(final_event.at("payload").at("failed_steps"), json::array({"bye"}));
    EXPECT_EQ(final_event.at("payload").at("error").at("code").get<std::string>(),
              "step_failed");
}

TEST(TraceWriterTest, SinkRecordsEveryEventKind) {
    TempWorkspace workspace;
    TraceWriter writer(workspace.root(), "traces");
    const std::string run_id = "run-trace-2";
    const auto sink = writer.as_sink();

    StepResult skipped;
    skipped.step_id = "later";
    skipped.status = StepStatus::Skipped;

    ExecutionReport report;
    report.run_id = run_id;
    report.status = RunStatus::Succeeded;

    sink(RunStartedEvent{run_id, "flow", 1});
    sink(StepStartedEvent{run_id, "later", 1});
    sink(StepFinishedEvent{run_id, skipped});
    sink(RunFinishedEvent{run_id, report});

    const auto path = writer.trace_path(run_id);
    ASSERT_FALSE(is_error(path));
    EXPECT_EQ(get_value(path), std::filesystem::weakly_canonical(workspace.root()) /
                                   "traces" / (run_id + ".jsonl"));

    const auto lines = read_lines(get_value(path));
    ASSERT_EQ(lines.size(), 4u);
    const std::vector<std::string> expected = {"run_started", "step_started", "step",
                                               "run_finished"};
    for (std::size_t i = 0; i < lines.size(); ++i) {
        EXPECT_EQ(json::parse(lines[i]).at("event").get<std::string>(), expected[i]);
    }
    EXPECT_EQ(json::parse(lines[2]).at("payload").at("status").get<std::string>(), "skipped");
}

TEST(TraceWriterTest, RejectsEmptyRunId) {
    TempWorkspace workspace;
    TraceWriter writer(workspace.root());
    auto result = writer.trace_path("");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_run_id");
}

TEST(TraceWriterTest, FailsForInvalidWorkspaceRoot) {
    const auto missing_root =
        std::filesystem::current_path() /
        ("__missing_trace_root__" + ael::core::config::generate_run_id());
    std::error_code ec;
    std::filesystem::remove_all(missing_root, ec);

    TraceWriter writer(missing_root);
    auto result = writer.write_run_started(RunStartedEvent{"run-trace-3", "flow", 0});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_workspace_root");
}

}  // namespace

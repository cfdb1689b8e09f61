#include <filesystem>
#include <fstream>
#include <string>
#include <gtest/gtest.h>
#include "core/config/run_id.hpp"
#include "core/errors/ael_errors.hpp"
#include "workflow/input_binding.hpp"
#include "workflow/workflow_parser.hpp"

namespace {

using ael::core::errors::ErrorCategory;
using ael::core::errors::get_error;
using ael::core::errors::get_value;
using ael::core::errors::is_error;
using ael::protocol::BackoffType;
using ael::protocol::StepKind;
using ael::workflow::bind_step_inputs;
using ael::workflow::load_workflow;
using ael::workflow::make_binding_scope;
using ael::workflow::parse_reference;
using ael::workflow::parse_workflow;
using nlohmann::json;

const char* kGreeting = R"(
name: greet
version: "2"
defaults:
  timeout_ms: 5000
  retry: { max_attempts: 2, backoff: exponential, delay_ms: 10 }
inputs:
  - { name: who, type: string, default: world }
  - { name: count, type: integer, required: false }
steps:
  - id: lookup
    tool: search
    inputs: { pattern: "{{ inputs.who }}", max_matches: 3 }
  - id: hello
    code: |
      result = "hello " + inputs.who
    inputs: { who: "{{ inputs.who }}" }
    depends_on: [lookup]
    timeout_ms: 250
    tools: [read_file]
outputs:
  greeting: steps.hello.output
  fixed: { value: 7 }
)";

TEST(WorkflowParserTest, ParsesFullDocument) {
    auto result = parse_workflow(kGreeting);
    ASSERT_FALSE(is_error(result)) << get_error(result).message;

    const auto& definition = get_value(result);
    EXPECT_EQ(definition.name, "greet");
    EXPECT_EQ(definition.version, "2");
    ASSERT_TRUE(definition.defaults.retry.has_value());
    EXPECT_EQ(definition.defaults.retry->max_attempts, 2u);
    EXPECT_EQ(definition.defaults.retry->backoff, BackoffType::Exponential);
    EXPECT_EQ(definition.defaults.step_timeout_ms, 5000u);

    ASSERT_EQ(definition.inputs.size(), 2u);
    EXPECT_EQ(definition.inputs[0].default_value, json("world"));
    EXPECT_FALSE(definition.inputs[1].required);

    ASSERT_EQ(definition.steps.size(), 2u);
    EXPECT_EQ(definition.steps[0].kind(), StepKind::ToolCall);
    EXPECT_EQ(definition.steps[0].inputs["max_matches"], 3);
    EXPECT_EQ(definition.steps[1].kind(), StepKind::InlineCode);
    EXPECT_EQ(definition.steps[1].depends_on, std::vector<std::string>{"lookup"});
    EXPECT_EQ(definition.steps[1].timeout_ms, 250u);
    EXPECT_EQ(definition.steps[1].granted_tools, std::vector<std::string>{"read_file"});

    ASSERT_EQ(definition.outputs.size(), 2u);
}

TEST(WorkflowParserTest, QuotedScalarsStayStrings) {
    auto result = parse_workflow(
        "name: w\nsteps:\n  - id: a\n    tool: t\n    inputs: { n: \"42\", m: 42, b: true }\n");
    ASSERT_FALSE(is_error(result));
    const auto& inputs = get_value(result).steps[0].inputs;
    EXPECT_TRUE(inputs["n"].is_string());
    EXPECT_TRUE(inputs["m"].is_number_integer());
    EXPECT_TRUE(inputs["b"].is_boolean());
}

TEST(WorkflowParserTest, AcceptsJsonDocuments) {
    auto result = parse_workflow(
        R"({"name": "j", "steps": [{"id": "a", "code": "result = 1"}]})");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).steps[0].code, "result = 1");
}

TEST(WorkflowParserTest, UnknownFieldIsBadSyntax) {
    auto result = parse_workflow("name: w\nsteps:\n  - id: a\n    tool: t\n    retries: 3\n");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "bad_syntax");
    EXPECT_EQ(get_error(result).category, ErrorCategory::Validation);
    EXPECT_NE(get_error(result).message.find("retries"), std::string::npos);
}

TEST(WorkflowParserTest, MalformedYamlIsBadSyntax) {
    auto result = parse_workflow("name: w\nsteps: [\n");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "bad_syntax");
}

TEST(WorkflowParserTest, MissingNameIsBadSyntax) {
    auto result = parse_workflow("steps: []\n");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "bad_syntax");
}

TEST(WorkflowParserTest, LoadsFromFile) {
    const auto path = std::filesystem::current_path() /
                      (".tmp_workflow_" + ael::core::config::generate_run_id() + ".yaml");
    {
        std::ofstream out(path);
        out << kGreeting;
    }
    auto loaded = load_workflow(path);
    std::error_code ec;
    std::filesystem::remove(path, ec);
    ASSERT_FALSE(is_error(loaded));
    EXPECT_EQ(get_value(loaded).name, "greet");

    auto missing = load_workflow("__missing_workflow__.yaml");
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "workflow_not_found");
}

TEST(InputBindingTest, ResolvesNestedReferences) {
    const json scope = make_binding_scope(
        json{{"city", "Oslo"}},
        json{{"fetch", {{"output", {{"items", json::array({{{"name", "first"}}})}}}}}});

    auto bound = bind_step_inputs(
        json{{"where", "{{ inputs.city }}"},
             {"first", "{{steps.fetch.output.items.0.name}}"},
             {"literal", "plain {{ text"},
             {"nested", {"{{ inputs.city }}", 1}}},
        scope);
    ASSERT_FALSE(is_error(bound));
    const auto& value = get_value(bound);
    EXPECT_EQ(value["where"], "Oslo");
    EXPECT_EQ(value["first"], "first");
    EXPECT_EQ(value["literal"], "plain {{ text");
    EXPECT_EQ(value["nested"][0], "Oslo");
}

TEST(InputBindingTest, MissingValueIsUnbound) {
    auto bound = bind_step_inputs(json{{"x", "{{ inputs.absent }}"}},
                                  make_binding_scope(json::object(), json::object()));
    ASSERT_TRUE(is_error(bound));
    EXPECT_EQ(get_error(bound).code, "unbound_input");
}

TEST(InputBindingTest, RejectsMalformedReferences) {
    EXPECT_TRUE(is_error(parse_reference("inputs")));
    EXPECT_TRUE(is_error(parse_reference("steps.fetch.result")));
    EXPECT_TRUE(is_error(parse_reference("env.HOME")));
    EXPECT_TRUE(is_error(parse_reference("inputs..x")));

    auto ok = parse_reference("steps.fetch.output");
    ASSERT_FALSE(is_error(ok));
    EXPECT_EQ(get_value(ok).step_id(), "fetch");
}

}  // namespace

#include <memory>
#include <string>
#include <gtest/gtest.h>
#include "core/errors/ael_errors.hpp"
#include "registry/tool_registry.hpp"
#include "registry/tool_source.hpp"
#include "workflow/dag.hpp"
#include "workflow/validation_error.hpp"
#include "workflow/validator.hpp"

namespace {

using ael::core::errors::get_error;
using ael::core::errors::get_value;
using ael::core::errors::is_error;
using ael::protocol::StepDefinition;
using ael::protocol::ToolDescriptor;
using ael::protocol::WorkflowDefinition;
using ael::registry::StaticToolSource;
using ael::registry::ToolRegistry;
using ael::workflow::ValidationErrorKind;
using ael::workflow::WorkflowDag;
using ael::workflow::WorkflowValidator;

StepDefinition code_step(const std::string& id,
                         const std::vector<std::string>& depends_on = {},
                         const std::string& code = "result = 1") {
    StepDefinition step;
    step.id = id;
    step.code = code;
    step.depends_on = depends_on;
    return step;
}

StepDefinition tool_step(const std::string& id, const std::string& tool) {
    StepDefinition step;
    step.id = id;
    step.tool = tool;
    return step;
}

WorkflowDefinition workflow(std::vector<StepDefinition> steps) {
    WorkflowDefinition definition;
    definition.name = "test";
    definition.steps = std::move(steps);
    return definition;
}

std::string code_of(const ael::core::errors::Result<WorkflowDag>& result) {
    return is_error(result) ? get_error(result).code : std::string("ok");
}

class ValidatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto source = std::make_shared<StaticToolSource>("test");
        ToolDescriptor echo;
        echo.name = "echo";
        source->add_tool(echo);
        ASSERT_FALSE(is_error(registry_.add_source(source)));
        ASSERT_FALSE(is_error(registry_.refresh("test")));
    }

    ToolRegistry registry_;
};

TEST_F(ValidatorTest, AcceptsValidDag) {
    WorkflowValidator validator(&registry_);
    auto result = validator.validate(workflow(
        {tool_step("a", "echo"), code_step("b", {"a"}), code_step("c", {"a", "b"})}));
    ASSERT_FALSE(is_error(result)) << get_error(result).message;
    EXPECT_EQ(get_value(result).size(), 3u);
}

TEST_F(ValidatorTest, EmptyWorkflow) {
    WorkflowValidator validator(&registry_);
    EXPECT_EQ(code_of(validator.validate(workflow({}))), "empty_workflow");
}

TEST_F(ValidatorTest, BadSyntaxCases) {
    WorkflowValidator validator(&registry_);

    EXPECT_EQ(code_of(validator.validate(workflow({code_step("a"), code_step("a")}))),
              "bad_syntax");

    StepDefinition both = code_step("a");
    both.tool = "echo";
    EXPECT_EQ(code_of(validator.validate(workflow({both}))), "bad_syntax");

    StepDefinition retry = code_step("a");
    retry.retry = ael::protocol::RetryPolicy{};
    retry.retry->max_attempts = 0;
    EXPECT_EQ(code_of(validator.validate(workflow({retry}))), "bad_syntax");

    EXPECT_EQ(code_of(validator.validate(workflow({code_step("a", {}, "result = (")}))),
              "bad_syntax");

    StepDefinition bad_ref = tool_step("a", "echo");
    bad_ref.inputs = {{"x", "{{ env.HOME }}"}};
    EXPECT_EQ(code_of(validator.validate(workflow({bad_ref}))), "bad_syntax");

    EXPECT_EQ(code_of(validator.validate(workflow({code_step("bad id")}))), "bad_syntax");
}

TEST_F(ValidatorTest, DeeplyNestedCodeIsBadSyntax) {
    WorkflowValidator validator(&registry_);
    const std::string code =
        "result = " + std::string(100000, '(') + "1" + std::string(100000, ')');
    auto result = validator.validate(workflow({code_step("deep", {}, code)}));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "bad_syntax");
}

TEST_F(ValidatorTest, UnknownTool) {
    WorkflowValidator validator(&registry_);
    auto result = validator.validate(workflow({tool_step("a", "missing_tool")}));
    EXPECT_EQ(code_of(result), "unknown_tool");

    StepDefinition granted = code_step("b");
    granted.granted_tools = {"missing_tool"};
    EXPECT_EQ(code_of(validator.validate(workflow({granted}))), "unknown_tool");
}

TEST_F(ValidatorTest, DeferredToolCheckPasses) {
    WorkflowValidator validator(&registry_, true);
    EXPECT_EQ(code_of(validator.validate(workflow({tool_step("a", "missing_tool")}))), "ok");
}

TEST_F(ValidatorTest, UnknownDependency) {
    WorkflowValidator validator(&registry_);
    EXPECT_EQ(code_of(validator.validate(workflow({code_step("a", {"ghost"})}))),
              "unknown_dependency");

    StepDefinition reads = tool_step("b", "echo");
    reads.inputs = {{"x", "{{ steps.a.output }}"}};
    EXPECT_EQ(code_of(validator.validate(workflow({code_step("a"), reads}))),
              "unknown_dependency");

    EXPECT_EQ(code_of(validator.validate(workflow(
                  {code_step("a"), code_step("b", {}, "result = steps.a.output")}))),
              "unknown_dependency");
}

TEST_F(ValidatorTest, CyclicDependencyNamesThePath) {
    WorkflowValidator validator(&registry_);
    auto result = validator.validate(
        workflow({code_step("a", {"c"}), code_step("b", {"a"}), code_step("c", {"b"})}));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "cyclic_dependency");
    EXPECT_NE(get_error(result).message.find("->"), std::string::npos);
    EXPECT_EQ(ael::workflow::validation_kind(get_error(result)),
              ValidationErrorKind::CyclicDependency);

    EXPECT_EQ(code_of(validator.validate(workflow({code_step("self", {"self"})}))),
              "cyclic_dependency");
}

TEST_F(ValidatorTest, FirstProblemWinsInFixedOrder) {
    WorkflowValidator validator(&registry_);
    // Unknown tool and a cycle: the tool check runs first.
    StepDefinition a = tool_step("a", "missing_tool");
    a.depends_on = {"b"};
    auto result = validator.validate(workflow({a, code_step("b", {"a"})}));
    EXPECT_EQ(code_of(result), "unknown_tool");
}

TEST_F(ValidatorTest, ValidationIsIdempotent) {
    WorkflowValidator validator(&registry_);
    const auto definition = workflow({code_step("a", {"b"}), code_step("b", {"a"})});
    const auto first = validator.validate(definition);
    const auto second = validator.validate(definition);
    ASSERT_TRUE(is_error(first));
    ASSERT_TRUE(is_error(second));
    EXPECT_EQ(get_error(first).code, get_error(second).code);
    EXPECT_EQ(get_error(first).message, get_error(second).message);
}

TEST(WorkflowDagTest, TopologicalOrderPrefersDeclarationOrder) {
    auto result = WorkflowDag::build(workflow(
        {code_step("late", {"root"}), code_step("root"), code_step("early", {"root"}),
         code_step("sink", {"late", "early"})}));
    ASSERT_FALSE(is_error(result));
    const auto& dag = get_value(result);

    std::vector<std::string> order;
    for (const auto index : dag.topological_order()) {
        order.push_back(dag.id(index));
    }
    EXPECT_EQ(order, (std::vector<std::string>{"root", "late", "early", "sink"}));

    std::vector<std::string> dependents;
    for (const auto index : dag.transitive_dependents(dag.index_of("root").value())) {
        dependents.push_back(dag.id(index));
    }
    EXPECT_EQ(dependents, (std::vector<std::string>{"late", "early", "sink"}));
    EXPECT_FALSE(dag.index_of("ghost").has_value());
}

}  // namespace

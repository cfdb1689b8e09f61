#include "workflow/validator.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <string>
#include "sandbox/script_analyzer.hpp"
#include "sandbox/script_parser.hpp"
#include "workflow/input_binding.hpp"
#include "workflow/validation_error.hpp"

namespace ael::workflow {

using core::errors::AelError;
using protocol::RetryPolicy;
using protocol::StepDefinition;
using protocol::WorkflowDefinition;

namespace {

constexpr std::uint32_t kMaxAttempts = 100;

const std::set<std::string>& input_types() {
    static const std::set<std::string> kTypes = {"any",     "string", "number", "integer",
                                                 "boolean", "object", "array"};
    return kTypes;
}

bool is_valid_step_id(const std::string& id) {
    if (id.empty()) {
        return false;
    }
    if (std::isalpha(static_cast<unsigned char>(id.front())) == 0 && id.front() != '_') {
        return false;
    }
    return std::all_of(id.begin(), id.end(), [](const unsigned char c) {
        return std::isalnum(c) != 0 || c == '_' || c == '-';
    });
}

AelError syntax_error(const std::string& message, const std::string& hint = "") {
    return make_validation_error(ValidationErrorKind::BadSyntax, message, hint);
}

core::errors::Result<bool> check_retry(const RetryPolicy& retry, const std::string& where) {
    if (retry.max_attempts < 1 || retry.max_attempts > kMaxAttempts) {
        return syntax_error("retry.max_attempts of " + where + " must be between 1 and " +
                            std::to_string(kMaxAttempts));
    }
    return true;
}

// References used by a step: `{{ ... }}` inputs plus `steps.<id>` reads in
// inline code.
std::vector<std::string> step_references(const StepDefinition& step) {
    std::vector<std::string> ids;
    for (const auto& expression : collect_references(step.inputs)) {
        const auto reference = parse_reference(expression);
        if (!core::errors::is_error(reference) &&
            core::errors::get_value(reference).is_step_output()) {
            ids.push_back(core::errors::get_value(reference).step_id());
        }
    }
    if (step.kind() == protocol::StepKind::InlineCode) {
        const auto program = sandbox::script::parse_script(step.code);
        if (!core::errors::is_error(program)) {
            const auto code_ids =
                sandbox::script::referenced_steps(core::errors::get_value(program));
            ids.insert(ids.end(), code_ids.begin(), code_ids.end());
        }
    }
    return ids;
}

}  // namespace

WorkflowValidator::WorkflowValidator(const registry::ToolRegistry* registry,
                                     const bool defer_unknown_tools)
    : registry_(registry), defer_unknown_tools_(defer_unknown_tools) {}

core::errors::Result<WorkflowDag> WorkflowValidator::validate(
    const WorkflowDefinition& definition) const {
    if (definition.steps.empty()) {
        return make_validation_error(ValidationErrorKind::EmptyWorkflow,
                                     "Workflow " + definition.name + " declares no steps");
    }

    for (const auto& check : {&WorkflowValidator::check_syntax, &WorkflowValidator::check_tools,
                              &WorkflowValidator::check_dependencies}) {
        const auto outcome = (this->*check)(definition);
        if (core::errors::is_error(outcome)) {
            return core::errors::get_error(outcome);
        }
    }

    return WorkflowDag::build(definition);
}

core::errors::Result<bool> WorkflowValidator::check_syntax(
    const WorkflowDefinition& definition) const {
    if (definition.defaults.retry.has_value()) {
        const auto retry = check_retry(definition.defaults.retry.value(), "defaults");
        if (core::errors::is_error(retry)) {
            return retry;
        }
    }
    if (definition.defaults.step_timeout_ms.has_value() &&
        definition.defaults.step_timeout_ms.value() == 0) {
        return syntax_error("defaults.timeout_ms must be positive");
    }

    std::set<std::string> input_names;
    for (const auto& input : definition.inputs) {
        if (input.name.empty()) {
            return syntax_error("Workflow input without a name");
        }
        if (!input_names.insert(input.name).second) {
            return syntax_error("Duplicate workflow input: " + input.name);
        }
        if (input_types().count(input.type) == 0) {
            return syntax_error("Workflow input " + input.name + " has unknown type " +
                                input.type);
        }
    }

    std::set<std::string> step_ids;
    for (const auto& step : definition.steps) {
        if (!is_valid_step_id(step.id)) {
            return syntax_error("Invalid step id '" + step.id + "'",
                                "Step ids match [A-Za-z_][A-Za-z0-9_-]*.");
        }
        if (!step_ids.insert(step.id).second) {
            return syntax_error("Duplicate step id: " + step.id);
        }
        if (step.tool.empty() == step.code.empty()) {
            return syntax_error("Step " + step.id + " must set exactly one of tool or code");
        }
        if (!step.inputs.is_object()) {
            return syntax_error("Inputs of step " + step.id + " must be a mapping");
        }
        if (step.retry.has_value()) {
            const auto retry = check_retry(step.retry.value(), "step " + step.id);
            if (core::errors::is_error(retry)) {
                return retry;
            }
        }
        if (step.timeout_ms.has_value() && step.timeout_ms.value() == 0) {
            return syntax_error("timeout_ms of step " + step.id + " must be positive");
        }
        if (std::any_of(step.depends_on.begin(), step.depends_on.end(),
                        [](const std::string& id) { return id.empty(); })) {
            return syntax_error("Step " + step.id + " has an empty depends_on entry");
        }
        if (!step.granted_tools.empty() && step.kind() == protocol::StepKind::ToolCall) {
            return syntax_error("Step " + step.id + " grants tools but is not inline code");
        }
        if (step.kind() == protocol::StepKind::InlineCode) {
            const auto program = sandbox::script::parse_script(step.code);
            if (core::errors::is_error(program)) {
                return syntax_error("Code of step " + step.id + ": " +
                                    core::errors::get_error(program).message);
            }
        }
        for (const auto& expression : collect_references(step.inputs)) {
            const auto reference = parse_reference(expression);
            if (core::errors::is_error(reference)) {
                const auto& error = core::errors::get_error(reference);
                return syntax_error("Step " + step.id + ": " + error.message, error.hint);
            }
        }
    }

    std::set<std::string> output_names;
    for (const auto& output : definition.outputs) {
        if (output.name.empty()) {
            return syntax_error("Workflow output without a name");
        }
        if (!output_names.insert(output.name).second) {
            return syntax_error("Duplicate workflow output: " + output.name);
        }
        if (output.from.has_value() == output.value.has_value()) {
            return syntax_error("Workflow output " + output.name +
                                " must set exactly one of from or value");
        }
        if (output.from.has_value()) {
            const auto reference = parse_reference(output.from.value());
            if (core::errors::is_error(reference)) {
                return syntax_error("Workflow output " + output.name + ": " +
                                    core::errors::get_error(reference).message);
            }
        }
    }
    return true;
}

core::errors::Result<bool> WorkflowValidator::check_tools(
    const WorkflowDefinition& definition) const {
    if (registry_ == nullptr || defer_unknown_tools_) {
        return true;
    }
    auto is_known = [this](const std::string& name) {
        const auto descriptor = registry_->peek(name);
        return descriptor && descriptor->status == protocol::ToolStatus::Available;
    };
    for (const auto& step : definition.steps) {
        if (step.kind() == protocol::StepKind::ToolCall && !is_known(step.tool)) {
            return make_validation_error(ValidationErrorKind::UnknownTool,
                                         "Step " + step.id + " uses unknown tool " + step.tool,
                                         "Run list-tools to see registered tools.");
        }
        for (const auto& granted : step.granted_tools) {
            if (!is_known(granted)) {
                return make_validation_error(
                    ValidationErrorKind::UnknownTool,
                    "Step " + step.id + " is granted unknown tool " + granted);
            }
        }
    }
    return true;
}

core::errors::Result<bool> WorkflowValidator::check_dependencies(
    const WorkflowDefinition& definition) const {
    std::set<std::string> step_ids;
    for (const auto& step : definition.steps) {
        step_ids.insert(step.id);
    }

    for (const auto& step : definition.steps) {
        for (const auto& dependency : step.depends_on) {
            if (step_ids.count(dependency) == 0) {
                return make_validation_error(
                    ValidationErrorKind::UnknownDependency,
                    "Step " + step.id + " depends on undeclared step " + dependency);
            }
        }
        for (const auto& referenced : step_references(step)) {
            if (std::find(step.depends_on.begin(), step.depends_on.end(), referenced) ==
                step.depends_on.end()) {
                return make_validation_error(
                    ValidationErrorKind::UnknownDependency,
                    "Step " + step.id + " reads steps." + referenced +
                        " without depending on it",
                    "Add " + referenced + " to depends_on.");
            }
        }
    }

    for (const auto& output : definition.outputs) {
        if (!output.from.has_value()) {
            continue;
        }
        const auto reference = parse_reference(output.from.value());
        if (core::errors::is_error(reference)) {
            continue;
        }
        const auto& parsed = core::errors::get_value(reference);
        if (parsed.is_step_output() && step_ids.count(parsed.step_id()) == 0) {
            return make_validation_error(
                ValidationErrorKind::UnknownDependency,
                "Workflow output " + output.name + " reads undeclared step " +
                    parsed.step_id());
        }
    }
    return true;
}

}  // namespace ael::workflow

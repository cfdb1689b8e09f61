#pragma once

#include "core/errors/ael_errors.hpp"
#include "protocol/workflow_contract.hpp"
#include "registry/tool_registry.hpp"
#include "workflow/dag.hpp"

namespace ael::workflow {

// Pure check of a workflow definition. Reports the first problem found, in
// this order: empty_workflow, bad_syntax, unknown_tool, unknown_dependency,
// cyclic_dependency. Tool names are checked against the registry cache only
// (never fetched); with `defer_unknown_tools` that check moves to run time.
class WorkflowValidator {
public:
    explicit WorkflowValidator(const registry::ToolRegistry* registry = nullptr,
                               bool defer_unknown_tools = false);

    core::errors::Result<WorkflowDag> validate(
        const protocol::WorkflowDefinition& definition) const;

private:
    core::errors::Result<bool> check_syntax(const protocol::WorkflowDefinition& definition) const;
    core::errors::Result<bool> check_tools(const protocol::WorkflowDefinition& definition) const;
    core::errors::Result<bool> check_dependencies(
        const protocol::WorkflowDefinition& definition) const;

    const registry::ToolRegistry* registry_;
    bool defer_unknown_tools_;
};

}  // namespace ael::workflow

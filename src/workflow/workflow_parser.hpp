#pragma once

#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>
#include "core/errors/ael_errors.hpp"
#include "protocol/workflow_contract.hpp"

namespace ael::workflow {

// Workflow documents are YAML (JSON is accepted as a YAML subset):
//
//   name: greet
//   defaults: { timeout_ms: 5000, retry: { max_attempts: 2 } }
//   inputs:
//     - { name: who, type: string, default: world }
//   steps:
//     - id: hello
//       code: 'result = "hello " + inputs.who'
//       inputs: { who: "{{ inputs.who }}" }
//   outputs:
//     - { name: greeting, from: steps.hello.output }
//
// Structural problems (wrong types, unknown fields) are bad_syntax.
core::errors::Result<protocol::WorkflowDefinition> parse_workflow(const std::string& document);

core::errors::Result<protocol::WorkflowDefinition> load_workflow(
    const std::filesystem::path& path);

core::errors::Result<protocol::WorkflowDefinition> workflow_from_json(
    const nlohmann::json& document);

// Plain scalars become bool/null/numbers where they parse as such; quoted
// scalars always stay strings.
nlohmann::json yaml_to_json(const YAML::Node& node);

}  // namespace ael::workflow

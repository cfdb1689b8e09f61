#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/ael_errors.hpp"

namespace ael::workflow {

// A step input is a reference when its whole string value is "{{ path }}".
// Paths are rooted at `inputs` (workflow inputs) or `steps.<id>.output`
// (a dependency's output); later segments are object keys or array indices:
//
//   inputs.city
//   steps.fetch.output.items.0.name
struct InputReference {
    std::string expression;
    std::vector<std::string> segments;

    bool is_step_output() const { return !segments.empty() && segments.front() == "steps"; }
    // Step id for a `steps.<id>...` reference, empty otherwise.
    std::string step_id() const { return is_step_output() ? segments.at(1) : std::string(); }
};

// Returns the path inside "{{ ... }}" if `value` is a reference string.
std::optional<std::string> reference_expression(const nlohmann::json& value);

// Checks and splits a path; failures are bad_syntax.
core::errors::Result<InputReference> parse_reference(const std::string& expression);

// Every reference found anywhere in `value`, in document order. Malformed
// references are returned too so callers can report them.
std::vector<std::string> collect_references(const nlohmann::json& value);

// Walks `reference` through {"inputs": ..., "steps": ...}. Missing keys are
// unbound_input.
core::errors::Result<nlohmann::json> resolve_reference(const InputReference& reference,
                                                       const nlohmann::json& scope);

// Replaces every reference in `inputs` with its value from `scope`; literals
// are copied as-is.
core::errors::Result<nlohmann::json> bind_step_inputs(const nlohmann::json& inputs,
                                                      const nlohmann::json& scope);

// {"inputs": run_inputs, "steps": {"<id>": {"output": ...}}}
nlohmann::json make_binding_scope(const nlohmann::json& run_inputs,
                                  const nlohmann::json& step_outputs);

}  // namespace ael::workflow

#pragma once

#include <optional>
#include <string>
#include <vector>
#include "policy/policy_guard.hpp"
#include "protocol/sandbox_contract.hpp"
#include "sandbox/script_ast.hpp"

namespace ael::sandbox::script {

struct Violation {
    protocol::ViolationKind kind;
    std::string message;
    int line = 0;
};

// Static pass run before any statement executes. Reports the first import
// outside `allowed_modules` or reference to an eval primitive, in source order.
std::optional<Violation> find_violation(const Program& program,
                                        const std::vector<std::string>& allowed_modules,
                                        const policy::PolicyGuard& guard);

// Step ids read through `steps.<id>` or `steps["<id>"]`, once each, in order
// of first use.
std::vector<std::string> referenced_steps(const Program& program);

}  // namespace ael::sandbox::script

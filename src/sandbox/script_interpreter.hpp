#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/ael_errors.hpp"
#include "policy/policy_guard.hpp"
#include "protocol/sandbox_contract.hpp"
#include "sandbox/script_ast.hpp"

namespace ael::sandbox::script {

using ToolBridge = std::function<core::errors::Result<nlohmann::json>(
    const std::string& tool_name, const nlohmann::json& arguments)>;

// What a script can see. `inputs` and `steps` are read-only inside the script.
struct ScriptEnvironment {
    nlohmann::json inputs = nlohmann::json::object();
    nlohmann::json steps = nlohmann::json::object();
    std::optional<std::filesystem::path> working_directory;
    std::vector<std::string> allowed_modules;
    ToolBridge call_tool;
};

struct ScriptLimits {
    std::chrono::steady_clock::time_point deadline =
        std::chrono::steady_clock::time_point::max();
    std::uint64_t max_operations = 1000000;
    std::size_t memory_ceiling_bytes = 64u * 1024u * 1024u;
    std::shared_ptr<std::atomic_bool> cancel_token;
};

struct ScriptOutcome {
    bool success = false;
    nlohmann::json result;
    std::optional<protocol::ViolationKind> violation;
    std::string error_code;
    std::string message;
    std::uint64_t operations = 0;
};

// Tree-walking evaluator for a parsed step script. Values are JSON; every
// statement, expression and loop iteration is a checkpoint where the
// deadline, operation budget and cancellation flag are enforced.
class ScriptInterpreter {
public:
    ScriptInterpreter(ScriptEnvironment environment,
                      ScriptLimits limits,
                      const policy::PolicyGuard& guard);

    ScriptOutcome run(const Program& program);

private:
    enum class Flow {
        Normal,
        Break,
        Continue
    };

    Flow exec_block(const std::vector<Stmt>& statements);
    Flow exec(const Stmt& stmt);

    nlohmann::json eval(const Expr& expr);
    nlohmann::json eval_binary(const Expr& expr);
    nlohmann::json eval_unary(const Expr& expr);
    nlohmann::json eval_call(const Expr& expr);
    nlohmann::json eval_member(const Expr& expr);
    nlohmann::json eval_index(const Expr& expr);
    nlohmann::json lookup(const std::string& name, int line) const;

    nlohmann::json call_builtin(const std::string& name,
                                std::vector<nlohmann::json>& args,
                                int line);
    nlohmann::json call_module(const std::string& module,
                               const std::string& function,
                               std::vector<nlohmann::json>& args,
                               int line);
    nlohmann::json open_file(const nlohmann::json& path, int line);

    void assign(const std::string& name, nlohmann::json value, int line);
    void checkpoint(int line);
    void charge(std::size_t bytes, int line) const;

    ScriptEnvironment environment_;
    ScriptLimits limits_;
    const policy::PolicyGuard& guard_;

    std::map<std::string, nlohmann::json> variables_;
    std::map<std::string, std::size_t> variable_sizes_;
    std::map<std::string, std::string> modules_;    // alias -> module
    std::map<std::string, std::string> functions_;  // from-imported name -> module
    std::size_t memory_in_use_ = 0;
    std::uint64_t operations_ = 0;
};

// Rough in-memory footprint of a value, used for the memory ceiling.
std::size_t approximate_size(const nlohmann::json& value);

}  // namespace ael::sandbox::script

#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/ael_errors.hpp"

namespace ael::policy {

struct CommandPolicy {
    std::vector<std::string> blocked_substrings = {
        "sudo",
        "rm -rf",
        "shutdown",
        "reboot",
        "mkfs",
        "dd if=",
        ":(){ :|:& };:"};
};

// Names that evaluate or compile strings as code, or reach the interpreter's
// own namespaces. Never callable from sandboxed code.
struct EvalPolicy {
    std::vector<std::string> denied_names = {
        "eval", "exec", "compile", "__import__", "globals",
        "locals", "getattr", "setattr", "vars"};
};

class PolicyGuard {
public:
    explicit PolicyGuard(CommandPolicy command_policy = {},
                         EvalPolicy eval_policy = {});

    core::errors::Result<std::filesystem::path> validate_path_in_workspace(
        const std::filesystem::path& workspace_root,
        const std::filesystem::path& target_path) const;

    core::errors::Result<std::string> validate_command(
        const std::string& command) const;

    core::errors::Result<std::string> validate_import(
        const std::string& module,
        const std::vector<std::string>& allowed_modules) const;

    bool is_eval_primitive(const std::string& name) const;

private:
    static bool is_within_root(const std::filesystem::path& root,
                               const std::filesystem::path& child);
    static std::string lowercase(std::string value);

    CommandPolicy command_policy_;
    EvalPolicy eval_policy_;
};

}  // namespace ael::policy

#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/ael_errors.hpp"
#include "policy/policy_guard.hpp"
#include "protocol/tool_contract.hpp"
#include "registry/tool_source.hpp"

namespace ael::tools {

// Built-in tools confined to one workspace root by the policy guard.
//
//   read_file    {path}                        -> {path, content, bytes}
//   search       {pattern, scope?, max_matches?} -> {pattern, count, matches[]}
//   run_command  {command, cwd?}               -> {exit_code, stdout, stderr}
class WorkspaceTools {
public:
    explicit WorkspaceTools(std::filesystem::path workspace_root,
                            policy::PolicyGuard guard = policy::PolicyGuard{});

    core::errors::Result<nlohmann::json> read_file(
        const nlohmann::json& arguments, const protocol::ToolCallContext& context) const;

    core::errors::Result<nlohmann::json> search(
        const nlohmann::json& arguments, const protocol::ToolCallContext& context) const;

    core::errors::Result<nlohmann::json> run_command(
        const nlohmann::json& arguments, const protocol::ToolCallContext& context) const;

    const std::filesystem::path& workspace_root() const { return workspace_root_; }

private:
    std::filesystem::path workspace_root_;
    policy::PolicyGuard guard_;
};

// Publishes the workspace tools to the registry under the source name
// "workspace". Unreachable when the workspace root is missing.
class WorkspaceToolSource : public registry::ToolSource {
public:
    explicit WorkspaceToolSource(std::filesystem::path workspace_root);

    std::string name() const override;

    core::errors::Result<std::vector<protocol::ToolDescriptor>> discover() override;

private:
    std::shared_ptr<const WorkspaceTools> tools_;
};

}  // namespace ael::tools

#pragma once

#include <mutex>
#include <string>
#include <vector>
#include "core/errors/ael_errors.hpp"
#include "protocol/tool_contract.hpp"

namespace ael::registry {

// Pluggable discovery contract. The registry depends only on this; how a
// source finds its tools (in-process table, MCP server, manifest) is its own
// business. An unreachable source returns a "source_unreachable" error.
class ToolSource {
public:
    virtual ~ToolSource() = default;

    virtual std::string name() const = 0;

    virtual core::errors::Result<std::vector<protocol::ToolDescriptor>> discover() = 0;
};

// In-memory source for tools registered programmatically.
class StaticToolSource : public ToolSource {
public:
    explicit StaticToolSource(std::string name);

    std::string name() const override;

    core::errors::Result<std::vector<protocol::ToolDescriptor>> discover() override;

    // Adds or replaces a tool; visible to the registry after its next fetch.
    void add_tool(protocol::ToolDescriptor descriptor);
    bool remove_tool(const std::string& tool_name);

private:
    std::string name_;
    mutable std::mutex mutex_;
    std::vector<protocol::ToolDescriptor> tools_;
};

}  // namespace ael::registry

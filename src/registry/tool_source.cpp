#include "registry/tool_source.hpp"

#include <algorithm>
#include <utility>

namespace ael::registry {

StaticToolSource::StaticToolSource(std::string name) : name_(std::move(name)) {}

std::string StaticToolSource::name() const {
    return name_;
}

core::errors::Result<std::vector<protocol::ToolDescriptor>> StaticToolSource::discover() {
    std::lock_guard<std::mutex> lock(mutex_);
    return tools_;
}

void StaticToolSource::add_tool(protocol::ToolDescriptor descriptor) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(tools_.begin(), tools_.end(),
                           [&descriptor](const protocol::ToolDescriptor& existing) {
                               return existing.name == descriptor.name;
                           });
    if (it != tools_.end()) {
        *it = std::move(descriptor);
        return;
    }
    tools_.push_back(std::move(descriptor));
}

bool StaticToolSource::remove_tool(const std::string& tool_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto before = tools_.size();
    tools_.erase(std::remove_if(tools_.begin(), tools_.end(),
                                [&tool_name](const protocol::ToolDescriptor& existing) {
                                    return existing.name == tool_name;
                                }),
                 tools_.end());
    return tools_.size() != before;
}

}  // namespace ael::registry

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/errors/ael_errors.hpp"
#include "protocol/tool_contract.hpp"
#include "registry/tool_source.hpp"

namespace ael::registry {

using Clock = std::function<std::chrono::steady_clock::time_point()>;

struct RegistryOptions {
    std::chrono::milliseconds ttl{300000};
    Clock clock;  // defaults to steady_clock::now
};

struct ResolvedTool {
    std::shared_ptr<const protocol::ToolDescriptor> descriptor;
    bool stale = false;  // past TTL and the owning source could not be reached
};

struct RefreshSummary {
    std::string source;
    std::vector<std::string> added;
    std::vector<std::string> removed;
    std::vector<std::string> updated;
};

// Process-wide tool cache. Owned explicitly and passed to the validator,
// executor and engine.
//
// Entries expire after the TTL. Resolving an expired entry re-fetches its
// source synchronously; concurrent resolves of the same name share one
// in-flight fetch. A failed fetch keeps the old entry and reports it stale.
class ToolRegistry {
public:
    explicit ToolRegistry(RegistryOptions options = {});

    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;

    core::errors::Result<std::string> add_source(std::shared_ptr<ToolSource> source);

    // Discovers every source. One failing source does not affect the others.
    std::vector<core::errors::Result<RefreshSummary>> refresh_all();

    core::errors::Result<RefreshSummary> refresh(const std::string& source_name);

    core::errors::Result<ResolvedTool> resolve(const std::string& name);

    // Cache-only lookup; never fetches, never blocks on a fetch.
    std::shared_ptr<const protocol::ToolDescriptor> peek(const std::string& name) const;

    std::vector<protocol::ToolDescriptor> list(
        const std::optional<std::string>& source_name = std::nullopt) const;

    std::vector<protocol::ToolDescriptor> search(const std::string& query) const;

    std::size_t size() const;

private:
    using FetchOutcome = core::errors::Result<bool>;

    struct SourceSlot {
        std::shared_ptr<ToolSource> source;
        std::shared_ptr<std::mutex> fetch_mutex;
    };

    std::chrono::steady_clock::time_point now() const;
    bool is_expired(const protocol::ToolDescriptor& descriptor) const;

    core::errors::Result<std::vector<protocol::ToolDescriptor>> fetch(
        const SourceSlot& slot) const;

    // Caller holds mutex_.
    RefreshSummary merge_source(const std::string& source_name,
                                std::vector<protocol::ToolDescriptor> descriptors);

    RegistryOptions options_;
    mutable std::mutex mutex_;
    std::map<std::string, SourceSlot> sources_;
    std::map<std::string, std::shared_ptr<const protocol::ToolDescriptor>> entries_;
    std::unordered_map<std::string, std::shared_future<FetchOutcome>> in_flight_;
};

}  // namespace ael::registry

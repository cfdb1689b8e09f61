#include "registry/tool_registry.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <set>
#include <utility>
#include "core/logging/logger.hpp"

namespace ael::registry {

using core::errors::AelError;
using core::errors::ErrorCategory;
using protocol::ToolDescriptor;
using protocol::ToolStatus;

namespace {

AelError tool_not_found(const std::string& name) {
    return AelError{ErrorCategory::Registry, "Tool not found: " + name,
                    "tool_not_found",
                    "Refresh the owning source or check the tool name."};
}

bool descriptor_changed(const ToolDescriptor& before, const ToolDescriptor& after) {
    return before.version != after.version ||
           before.description != after.description ||
           before.input_schema != after.input_schema ||
           before.output_schema != after.output_schema;
}

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

}  // namespace

ToolRegistry::ToolRegistry(RegistryOptions options) : options_(std::move(options)) {
    if (!options_.clock) {
        options_.clock = [] { return std::chrono::steady_clock::now(); };
    }
}

std::chrono::steady_clock::time_point ToolRegistry::now() const {
    return options_.clock();
}

bool ToolRegistry::is_expired(const ToolDescriptor& descriptor) const {
    return now() - descriptor.cached_at >= options_.ttl;
}

core::errors::Result<std::string> ToolRegistry::add_source(
    std::shared_ptr<ToolSource> source) {
    if (!source) {
        return AelError{ErrorCategory::Input, "Tool source cannot be null.",
                        "invalid_source"};
    }
    const std::string source_name = source->name();
    if (source_name.empty()) {
        return AelError{ErrorCategory::Input, "Tool source name cannot be empty.",
                        "invalid_source"};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (sources_.find(source_name) != sources_.end()) {
        return AelError{ErrorCategory::Input,
                        "Tool source already registered: " + source_name,
                        "duplicate_source"};
    }
    sources_.emplace(source_name,
                     SourceSlot{std::move(source), std::make_shared<std::mutex>()});
    AEL_LOG_DEBUG("ToolRegistry: added source " + source_name);
    return source_name;
}

core::errors::Result<std::vector<ToolDescriptor>> ToolRegistry::fetch(
    const SourceSlot& slot) const {
    const std::string source_name = slot.source->name();
    try {
        auto fetched = slot.source->discover();
        if (core::errors::is_error(fetched)) {
            auto error = core::errors::get_error(fetched);
            error.category = ErrorCategory::Registry;
            if (error.code.empty() || error.code == "unknown_error") {
                error.code = "source_unreachable";
            }
            return error;
        }
        return fetched;
    } catch (const std::exception& e) {
        return AelError{ErrorCategory::Registry,
                        "Discovery failed for source " + source_name + ": " + e.what(),
                        "source_unreachable"};
    } catch (...) {
        return AelError{ErrorCategory::Registry,
                        "Discovery failed for source " + source_name +
                            ": non-standard exception",
                        "source_unreachable"};
    }
}

RefreshSummary ToolRegistry::merge_source(const std::string& source_name,
                                          std::vector<ToolDescriptor> descriptors) {
    RefreshSummary summary;
    summary.source = source_name;
    const auto stamp = now();

    std::set<std::string> seen;
    for (auto& descriptor : descriptors) {
        if (descriptor.name.empty()) {
            AEL_LOG_WARN("ToolRegistry: source " + source_name +
                         " reported a tool without a name");
            continue;
        }
        if (!seen.insert(descriptor.name).second) {
            continue;
        }

        auto it = entries_.find(descriptor.name);
        const bool owned_elsewhere = it != entries_.end() &&
                                     it->second->source != source_name &&
                                     it->second->status == ToolStatus::Available;
        if (owned_elsewhere) {
            AEL_LOG_WARN("ToolRegistry: tool " + descriptor.name + " from " +
                         source_name + " shadowed by source " + it->second->source);
            continue;
        }

        descriptor.source = source_name;
        descriptor.cached_at = stamp;
        descriptor.status = ToolStatus::Available;

        if (it == entries_.end() || it->second->source != source_name ||
            it->second->status == ToolStatus::Unavailable) {
            summary.added.push_back(descriptor.name);
        } else if (descriptor_changed(*it->second, descriptor)) {
            summary.updated.push_back(descriptor.name);
        }
        const std::string key = descriptor.name;
        entries_[key] = std::make_shared<const ToolDescriptor>(std::move(descriptor));
    }

    for (auto& [name, entry] : entries_) {
        if (entry->source != source_name || seen.count(name) != 0 ||
            entry->status == ToolStatus::Unavailable) {
            continue;
        }
        auto gone = std::make_shared<ToolDescriptor>(*entry);
        gone->status = ToolStatus::Unavailable;
        gone->cached_at = stamp;
        entry = std::move(gone);
        summary.removed.push_back(name);
    }

    return summary;
}

core::errors::Result<RefreshSummary> ToolRegistry::refresh(const std::string& source_name) {
    SourceSlot slot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sources_.find(source_name);
        if (it == sources_.end()) {
            return AelError{ErrorCategory::Input,
                            "Unknown tool source: " + source_name, "unknown_source"};
        }
        slot = it->second;
    }

    std::lock_guard<std::mutex> fetch_lock(*slot.fetch_mutex);
    auto fetched = fetch(slot);
    if (core::errors::is_error(fetched)) {
        const auto& err = core::errors::get_error(fetched);
        AEL_LOG_WARN("ToolRegistry: refresh of " + source_name + " failed [" +
                     err.code + "]: " + err.message);
        return err;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto summary = merge_source(source_name, std::move(core::errors::get_value(fetched)));
    AEL_LOG_INFO("ToolRegistry: refreshed " + source_name + " (+" +
                 std::to_string(summary.added.size()) + " -" +
                 std::to_string(summary.removed.size()) + " ~" +
                 std::to_string(summary.updated.size()) + ")");
    return summary;
}

std::vector<core::errors::Result<RefreshSummary>> ToolRegistry::refresh_all() {
    std::vector<std::string> names;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [name, _] : sources_) {
            names.push_back(name);
        }
    }

    std::vector<core::errors::Result<RefreshSummary>> results;
    results.reserve(names.size());
    for (const auto& name : names) {
        results.push_back(refresh(name));
    }
    return results;
}

core::errors::Result<ResolvedTool> ToolRegistry::resolve(const std::string& name) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto it = entries_.find(name);
    if (it == entries_.end() || it->second->status == ToolStatus::Unavailable) {
        return tool_not_found(name);
    }
    const auto cached = it->second;
    if (!is_expired(*cached)) {
        return ResolvedTool{cached, false};
    }

    std::shared_future<FetchOutcome> pending;
    std::shared_ptr<std::promise<FetchOutcome>> leader;
    SourceSlot slot;

    auto flight = in_flight_.find(name);
    if (flight != in_flight_.end()) {
        pending = flight->second;
    } else {
        auto source_it = sources_.find(cached->source);
        if (source_it == sources_.end()) {
            return ResolvedTool{cached, true};
        }
        slot = source_it->second;
        leader = std::make_shared<std::promise<FetchOutcome>>();
        pending = leader->get_future().share();
        in_flight_.emplace(name, pending);
    }
    lock.unlock();

    if (leader) {
        FetchOutcome outcome = true;
        try {
            std::lock_guard<std::mutex> fetch_lock(*slot.fetch_mutex);
            auto fetched = fetch(slot);
            std::lock_guard<std::mutex> relock(mutex_);
            if (core::errors::is_error(fetched)) {
                outcome = core::errors::get_error(fetched);
            } else {
                merge_source(cached->source,
                             std::move(core::errors::get_value(fetched)));
            }
        } catch (const std::exception& e) {
            outcome = AelError{ErrorCategory::Internal,
                               "Refreshing " + name + " failed: " + e.what(),
                               "internal_error"};
        }
        // Followers wait on the promise; the entry must go even when the
        // refresh failed.
        {
            std::lock_guard<std::mutex> relock(mutex_);
            in_flight_.erase(name);
        }
        leader->set_value(outcome);
    }

    const FetchOutcome& outcome = pending.get();
    lock.lock();
    it = entries_.find(name);
    if (core::errors::is_error(outcome)) {
        AEL_LOG_WARN("ToolRegistry: serving stale " + name + " [" +
                     core::errors::get_error(outcome).code + "]");
        return ResolvedTool{it != entries_.end() ? it->second : cached, true};
    }
    if (it == entries_.end() || it->second->status == ToolStatus::Unavailable) {
        return tool_not_found(name);
    }
    return ResolvedTool{it->second, false};
}

std::shared_ptr<const ToolDescriptor> ToolRegistry::peek(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(name);
    if (it == entries_.end() || it->second->status == ToolStatus::Unavailable) {
        return nullptr;
    }
    return it->second;
}

std::vector<ToolDescriptor> ToolRegistry::list(
    const std::optional<std::string>& source_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ToolDescriptor> tools;
    tools.reserve(entries_.size());
    for (const auto& [_, entry] : entries_) {
        if (source_name.has_value() && entry->source != source_name.value()) {
            continue;
        }
        tools.push_back(*entry);
    }
    return tools;
}

std::vector<ToolDescriptor> ToolRegistry::search(const std::string& query) const {
    const std::string needle = lowercase(query);
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ToolDescriptor> matches;
    for (const auto& [name, entry] : entries_) {
        if (lowercase(name).find(needle) != std::string::npos ||
            lowercase(entry->description).find(needle) != std::string::npos) {
            matches.push_back(*entry);
        }
    }
    return matches;
}

std::size_t ToolRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

}  // namespace ael::registry

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/ael_errors.hpp"

namespace ael::protocol {

enum class ToolStatus {
    Available,
    Unavailable
};

// What a tool handler may see of the run that invoked it. Handlers are
// expected to poll `should_stop()` in long loops.
struct ToolCallContext {
    std::string run_id;
    std::string step_id;
    std::chrono::steady_clock::time_point deadline =
        std::chrono::steady_clock::time_point::max();
    std::shared_ptr<std::atomic_bool> cancel_token;

    bool should_stop() const {
        if (cancel_token && cancel_token->load()) {
            return true;
        }
        return std::chrono::steady_clock::now() >= deadline;
    }

    std::uint32_t remaining_ms() const {
        if (deadline == std::chrono::steady_clock::time_point::max()) {
            return 0;
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return 1;
        }
        return static_cast<std::uint32_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now)
                .count() + 1);
    }
};

using ToolHandler = std::function<core::errors::Result<nlohmann::json>(
    const nlohmann::json& arguments, const ToolCallContext& context)>;

struct ToolDescriptor {
    std::string name;
    std::string version = "1.0";
    std::string description;
    nlohmann::json input_schema = nlohmann::json::object();
    nlohmann::json output_schema = nlohmann::json::object();
    std::string source;  // name of the owning ToolSource
    std::chrono::steady_clock::time_point cached_at{};
    ToolStatus status = ToolStatus::Available;
    ToolHandler handler;
};

inline std::string to_string(const ToolStatus status) {
    switch (status) {
        case ToolStatus::Available:
            return "available";
        case ToolStatus::Unavailable:
            return "unavailable";
        default:
            return "unknown";
    }
}

inline nlohmann::json to_json(const ToolDescriptor& descriptor) {
    nlohmann::json payload;
    payload["name"] = descriptor.name;
    payload["version"] = descriptor.version;
    payload["description"] = descriptor.description;
    payload["source"] = descriptor.source;
    payload["status"] = to_string(descriptor.status);
    payload["input_schema"] = descriptor.input_schema;
    payload["output_schema"] = descriptor.output_schema;
    return payload;
}

}  // namespace ael::protocol

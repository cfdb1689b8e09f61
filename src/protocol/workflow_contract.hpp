#pragma once

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace ael::protocol {

enum class StepKind {
    ToolCall,
    InlineCode
};

enum class BackoffType {
    Fixed,
    Exponential
};

struct RetryPolicy {
    std::uint32_t max_attempts = 1;
    BackoffType backoff = BackoffType::Fixed;
    std::uint32_t delay_ms = 0;

    // Delay before the given attempt (attempts are 1-based; the first has none).
    std::uint32_t delay_before(const std::uint32_t attempt) const {
        if (attempt <= 1 || delay_ms == 0) {
            return 0;
        }
        if (backoff == BackoffType::Fixed) {
            return delay_ms;
        }
        std::uint64_t delay = delay_ms;
        for (std::uint32_t i = 2; i < attempt && delay < 60000; ++i) {
            delay *= 2;
        }
        return static_cast<std::uint32_t>(std::min<std::uint64_t>(delay, 60000));
    }
};

struct StepDefinition {
    std::string id;
    std::string tool;  // set for tool-call steps
    std::string code;  // set for inline-code steps
    nlohmann::json inputs = nlohmann::json::object();
    std::vector<std::string> depends_on;
    std::optional<RetryPolicy> retry;
    std::optional<std::uint32_t> timeout_ms;
    std::vector<std::string> granted_tools;  // tools inline code may call

    StepKind kind() const {
        return code.empty() ? StepKind::ToolCall : StepKind::InlineCode;
    }
};

struct InputDefinition {
    std::string name;
    std::string type = "any";
    bool required = true;
    std::optional<nlohmann::json> default_value;
    std::string description;
};

// A workflow output is either a reference path ("steps.x.output") or a literal.
struct OutputDefinition {
    std::string name;
    std::optional<std::string> from;
    std::optional<nlohmann::json> value;
};

struct WorkflowDefaults {
    std::optional<std::uint32_t> step_timeout_ms;
    std::optional<RetryPolicy> retry;
};

struct WorkflowDefinition {
    std::string name;
    std::string version = "1.0";
    std::string description;
    std::vector<InputDefinition> inputs;
    std::vector<StepDefinition> steps;
    std::vector<OutputDefinition> outputs;
    WorkflowDefaults defaults;
};

inline std::string to_string(const StepKind kind) {
    switch (kind) {
        case StepKind::ToolCall:
            return "tool_call";
        case StepKind::InlineCode:
            return "inline_code";
        default:
            return "unknown";
    }
}

inline std::string to_string(const BackoffType backoff) {
    switch (backoff) {
        case BackoffType::Fixed:
            return "fixed";
        case BackoffType::Exponential:
            return "exponential";
        default:
            return "unknown";
    }
}

}  // namespace ael::protocol

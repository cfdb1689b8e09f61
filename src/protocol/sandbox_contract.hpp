#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace ael::protocol {

enum class ViolationKind {
    ForbiddenImport,
    ForbiddenEval,
    ForbiddenFileAccess,
    ResourceLimit
};

// Isolation boundary for one step attempt.
struct SandboxLimits {
    std::uint32_t timeout_ms = 30000;
    std::uint64_t max_operations = 1000000;
    std::size_t memory_ceiling_bytes = 64u * 1024u * 1024u;
    std::uint32_t max_tool_calls = 10;  // call_tool() invocations per attempt
    std::optional<std::filesystem::path> working_directory;  // granted scope for open()
    std::vector<std::string> allowed_modules = {"math", "json", "text"};
    std::shared_ptr<std::atomic_bool> cancel_token;
    std::string run_id;
};

struct SandboxResult {
    bool success = false;
    nlohmann::json output;
    std::string diagnostics;
    double elapsed_ms = 0.0;
    bool resource_limit_exceeded = false;
    std::optional<ViolationKind> violation;
    std::string error_code;  // stable kind, empty on success
    bool stale_tool = false;  // resolved from a cache entry past its TTL
};

inline std::string to_string(const ViolationKind kind) {
    switch (kind) {
        case ViolationKind::ForbiddenImport:
            return "forbidden_import";
        case ViolationKind::ForbiddenEval:
            return "forbidden_eval";
        case ViolationKind::ForbiddenFileAccess:
            return "forbidden_file_access";
        case ViolationKind::ResourceLimit:
            return "resource_limit";
        default:
            return "unknown";
    }
}

}  // namespace ael::protocol

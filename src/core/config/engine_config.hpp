#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/ael_errors.hpp"
#include "core/logging/logger.hpp"
#include "protocol/workflow_contract.hpp"

namespace ael::core::config {

// Engine-wide settings. Every field is optional in the YAML file:
//
//   max_parallelism: 8
//   default_step_timeout_ms: 10000
//   default_retry: { max_attempts: 3, backoff: exponential, delay_ms: 200 }
//   registry_ttl_ms: 60000
//   defer_unknown_tools: false
//   sandbox:
//     allowed_modules: [math, json, text]
//     max_operations: 1000000
//     memory_ceiling_bytes: 67108864
//     max_tool_calls: 10
//     working_directory: /srv/data
//   trace_directory: .ael_runs
//   log_level: info
struct EngineConfig {
    std::size_t max_parallelism = 4;
    std::uint32_t default_step_timeout_ms = 30000;
    protocol::RetryPolicy default_retry;
    std::uint32_t registry_ttl_ms = 300000;
    bool defer_unknown_tools = false;
    std::vector<std::string> allowed_modules = {"math", "json", "text"};
    std::uint64_t max_operations = 1000000;
    std::size_t memory_ceiling_bytes = 64u * 1024u * 1024u;
    std::uint32_t max_tool_calls = 10;
    std::optional<std::filesystem::path> working_directory;
    std::filesystem::path trace_directory = ".ael_runs";
    logging::LogLevel log_level = logging::LogLevel::INFO;
};

errors::Result<EngineConfig> parse_engine_config(const std::string& yaml_text);

errors::Result<EngineConfig> load_engine_config(const std::filesystem::path& path);

}  // namespace ael::core::config

#include "core/config/engine_config.hpp"

#include <fstream>
#include <set>
#include <sstream>
#include <yaml-cpp/yaml.h>

namespace ael::core::config {

using errors::AelError;
using errors::ErrorCategory;

namespace {

constexpr std::size_t kMaxParallelism = 256;
constexpr std::uint32_t kMaxAttempts = 100;

struct ConfigError {
    std::string message;
};

[[noreturn]] void reject(const std::string& message) {
    throw ConfigError{message};
}

void expect_keys(const YAML::Node& node,
                 const std::set<std::string>& allowed,
                 const std::string& where) {
    for (const auto& entry : node) {
        const auto key = entry.first.as<std::string>();
        if (allowed.count(key) == 0) {
            reject("Unknown setting '" + key + "' in " + where);
        }
    }
}

template <typename T>
T read_number(const YAML::Node& node, const std::string& key, const T minimum, const T maximum) {
    long long value = 0;
    try {
        value = node.as<long long>();
    } catch (const YAML::Exception&) {
        reject(key + " must be an integer");
    }
    if (value < static_cast<long long>(minimum) ||
        static_cast<unsigned long long>(value) > static_cast<unsigned long long>(maximum)) {
        reject(key + " must be between " + std::to_string(minimum) + " and " +
               std::to_string(maximum));
    }
    return static_cast<T>(value);
}

bool read_bool(const YAML::Node& node, const std::string& key) {
    try {
        return node.as<bool>();
    } catch (const YAML::Exception&) {
        reject(key + " must be true or false");
    }
}

std::string read_string(const YAML::Node& node, const std::string& key) {
    if (!node.IsScalar()) {
        reject(key + " must be a string");
    }
    return node.Scalar();
}

protocol::RetryPolicy read_retry(const YAML::Node& node) {
    if (!node.IsMap()) {
        reject("default_retry must be a mapping");
    }
    expect_keys(node, {"max_attempts", "backoff", "delay_ms"}, "default_retry");
    protocol::RetryPolicy retry;
    if (node["max_attempts"]) {
        retry.max_attempts = read_number<std::uint32_t>(
            node["max_attempts"], "default_retry.max_attempts", 1, kMaxAttempts);
    }
    if (node["delay_ms"]) {
        retry.delay_ms = read_number<std::uint32_t>(node["delay_ms"], "default_retry.delay_ms",
                                                    0, 3600000);
    }
    if (node["backoff"]) {
        const auto backoff = read_string(node["backoff"], "default_retry.backoff");
        if (backoff == "fixed") {
            retry.backoff = protocol::BackoffType::Fixed;
        } else if (backoff == "exponential") {
            retry.backoff = protocol::BackoffType::Exponential;
        } else {
            reject("default_retry.backoff must be fixed or exponential");
        }
    }
    return retry;
}

void read_sandbox(const YAML::Node& node, EngineConfig& config) {
    if (!node.IsMap()) {
        reject("sandbox must be a mapping");
    }
    expect_keys(node,
                {"allowed_modules", "max_operations", "memory_ceiling_bytes", "max_tool_calls",
                 "working_directory"},
                "sandbox");
    if (node["allowed_modules"]) {
        if (!node["allowed_modules"].IsSequence()) {
            reject("sandbox.allowed_modules must be a list");
        }
        config.allowed_modules.clear();
        for (const auto& module : node["allowed_modules"]) {
            config.allowed_modules.push_back(read_string(module, "sandbox.allowed_modules"));
        }
    }
    if (node["max_operations"]) {
        config.max_operations = read_number<std::uint64_t>(
            node["max_operations"], "sandbox.max_operations", 1, 1000000000000ULL);
    }
    if (node["memory_ceiling_bytes"]) {
        config.memory_ceiling_bytes = read_number<std::size_t>(
            node["memory_ceiling_bytes"], "sandbox.memory_ceiling_bytes", 1024,
            std::size_t{16} * 1024u * 1024u * 1024u);
    }
    if (node["max_tool_calls"]) {
        config.max_tool_calls = read_number<std::uint32_t>(
            node["max_tool_calls"], "sandbox.max_tool_calls", 0, 100000);
    }
    if (node["working_directory"]) {
        config.working_directory =
            std::filesystem::path(read_string(node["working_directory"],
                                              "sandbox.working_directory"));
    }
}

EngineConfig read_config(const YAML::Node& root) {
    EngineConfig config;
    if (root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        reject("Engine configuration must be a mapping");
    }
    expect_keys(root,
                {"max_parallelism", "default_step_timeout_ms", "default_retry",
                 "registry_ttl_ms", "defer_unknown_tools", "sandbox", "trace_directory",
                 "log_level"},
                "engine configuration");

    if (root["max_parallelism"]) {
        config.max_parallelism =
            read_number<std::size_t>(root["max_parallelism"], "max_parallelism", 1,
                                     kMaxParallelism);
    }
    if (root["default_step_timeout_ms"]) {
        config.default_step_timeout_ms = read_number<std::uint32_t>(
            root["default_step_timeout_ms"], "default_step_timeout_ms", 1, 86400000);
    }
    if (root["default_retry"]) {
        config.default_retry = read_retry(root["default_retry"]);
    }
    if (root["registry_ttl_ms"]) {
        config.registry_ttl_ms = read_number<std::uint32_t>(root["registry_ttl_ms"],
                                                            "registry_ttl_ms", 0, 86400000);
    }
    if (root["defer_unknown_tools"]) {
        config.defer_unknown_tools = read_bool(root["defer_unknown_tools"], "defer_unknown_tools");
    }
    if (root["sandbox"]) {
        read_sandbox(root["sandbox"], config);
    }
    if (root["trace_directory"]) {
        config.trace_directory = read_string(root["trace_directory"], "trace_directory");
    }
    if (root["log_level"]) {
        const auto level = read_string(root["log_level"], "log_level");
        if (!logging::Logger::parse_level(level, config.log_level)) {
            reject("log_level must be one of debug, info, warn, error");
        }
    }
    return config;
}

}  // namespace

errors::Result<EngineConfig> parse_engine_config(const std::string& yaml_text) {
    try {
        return read_config(YAML::Load(yaml_text));
    } catch (const ConfigError& error) {
        return AelError{ErrorCategory::Input, error.message, "invalid_config"};
    } catch (const YAML::Exception& e) {
        return AelError{ErrorCategory::Input, std::string("Malformed configuration: ") + e.what(),
                        "invalid_config"};
    }
}

errors::Result<EngineConfig> load_engine_config(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        return AelError{ErrorCategory::Input, "Unable to open configuration: " + path.string(),
                        "config_not_found"};
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return parse_engine_config(buffer.str());
}

}  // namespace ael::core::config

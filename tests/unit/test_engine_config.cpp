#include <filesystem>
#include <string>
#include <gtest/gtest.h>
#include "core/config/engine_config.hpp"
#include "core/errors/ael_errors.hpp"

namespace {

using ael::core::config::EngineConfig;
using ael::core::config::load_engine_config;
using ael::core::config::parse_engine_config;
using ael::core::errors::ErrorCategory;
using ael::core::errors::get_error;
using ael::core::errors::get_value;
using ael::core::errors::is_error;

TEST(EngineConfigTest, EmptyDocumentGivesDefaults) {
    auto result = parse_engine_config("");
    ASSERT_FALSE(is_error(result));
    const EngineConfig& config = get_value(result);
    EXPECT_EQ(config.max_parallelism, 4u);
    EXPECT_EQ(config.default_step_timeout_ms, 30000u);
    EXPECT_EQ(config.default_retry.max_attempts, 1u);
    EXPECT_FALSE(config.working_directory.has_value());
}

TEST(EngineConfigTest, ParsesNestedSettings) {
    auto result = parse_engine_config(
        "max_parallelism: 8\n"
        "default_retry: { max_attempts: 3, backoff: exponential, delay_ms: 20 }\n"
        "defer_unknown_tools: true\n"
        "sandbox:\n"
        "  allowed_modules: [math]\n"
        "  max_operations: 5000\n"
        "  max_tool_calls: 4\n"
        "log_level: debug\n");
    ASSERT_FALSE(is_error(result));
    const EngineConfig& config = get_value(result);
    EXPECT_EQ(config.max_parallelism, 8u);
    EXPECT_EQ(config.default_retry.max_attempts, 3u);
    EXPECT_EQ(config.default_retry.backoff, ael::protocol::BackoffType::Exponential);
    EXPECT_TRUE(config.defer_unknown_tools);
    EXPECT_EQ(config.allowed_modules, std::vector<std::string>{"math"});
    EXPECT_EQ(config.max_operations, 5000u);
    EXPECT_EQ(config.max_tool_calls, 4u);
    EXPECT_EQ(config.log_level, ael::core::logging::LogLevel::DEBUG);
}

TEST(EngineConfigTest, RejectsUnknownKeysAndBadBounds) {
    auto unknown = parse_engine_config("max_paralellism: 2\n");
    ASSERT_TRUE(is_error(unknown));
    EXPECT_EQ(get_error(unknown).code, "invalid_config");
    EXPECT_EQ(get_error(unknown).category, ErrorCategory::Input);

    auto zero = parse_engine_config("max_parallelism: 0\n");
    ASSERT_TRUE(is_error(zero));
    EXPECT_EQ(get_error(zero).code, "invalid_config");

    auto level = parse_engine_config("log_level: loud\n");
    ASSERT_TRUE(is_error(level));
}

TEST(EngineConfigTest, MalformedYamlIsInvalidConfig) {
    auto result = parse_engine_config("max_parallelism: [1, 2\n");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_config");
}

TEST(EngineConfigTest, MissingFileIsReported) {
    auto result = load_engine_config("__no_such_config__.yaml");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "config_not_found");
}

}  // namespace

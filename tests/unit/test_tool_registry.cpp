#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include <gtest/gtest.h>
#include "core/errors/ael_errors.hpp"
#include "registry/tool_registry.hpp"
#include "registry/tool_source.hpp"

namespace {

using ael::core::errors::AelError;
using ael::core::errors::ErrorCategory;
using ael::core::errors::get_error;
using ael::core::errors::get_value;
using ael::core::errors::is_error;
using ael::protocol::ToolDescriptor;
using ael::protocol::ToolStatus;
using ael::registry::RegistryOptions;
using ael::registry::StaticToolSource;
using ael::registry::ToolRegistry;
using ael::registry::ToolSource;

ToolDescriptor make_tool(const std::string& name, const std::string& description = "") {
    ToolDescriptor tool;
    tool.name = name;
    tool.description = description;
    tool.handler = [name](const nlohmann::json&, const ael::protocol::ToolCallContext&)
        -> ael::core::errors::Result<nlohmann::json> { return nlohmann::json{{"tool", name}}; };
    return tool;
}

// Source whose discovery can be switched off and whose calls are counted.
class CountingSource : public ToolSource {
public:
    explicit CountingSource(std::string name) : name_(std::move(name)) {}

    std::string name() const override { return name_; }

    ael::core::errors::Result<std::vector<ToolDescriptor>> discover() override {
        ++calls;
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        if (throws_non_standard.load()) {
            throw 7;
        }
        if (!reachable.load()) {
            return AelError{ErrorCategory::Registry, name_ + " is down", "source_unreachable"};
        }
        return std::vector<ToolDescriptor>{make_tool("counted", "counted tool")};
    }

    std::atomic<int> calls{0};
    std::atomic_bool reachable{true};
    std::atomic_bool throws_non_standard{false};
    std::chrono::milliseconds delay{0};

private:
    std::string name_;
};

class ManualClock {
public:
    std::chrono::steady_clock::time_point now() const { return now_; }
    void advance(const std::chrono::milliseconds step) { now_ += step; }

    RegistryOptions options(const std::chrono::milliseconds ttl) {
        RegistryOptions options;
        options.ttl = ttl;
        options.clock = [this] { return now_; };
        return options;
    }

private:
    std::chrono::steady_clock::time_point now_ = std::chrono::steady_clock::now();
};

TEST(ToolRegistryTest, RefreshReportsAddedRemovedUpdated) {
    auto source = std::make_shared<StaticToolSource>("local");
    source->add_tool(make_tool("alpha", "first"));
    source->add_tool(make_tool("beta"));

    ToolRegistry registry;
    ASSERT_FALSE(is_error(registry.add_source(source)));

    auto first = registry.refresh("local");
    ASSERT_FALSE(is_error(first));
    EXPECT_EQ(get_value(first).added, (std::vector<std::string>{"alpha", "beta"}));

    source->add_tool(make_tool("alpha", "changed"));
    source->remove_tool("beta");
    source->add_tool(make_tool("gamma"));

    auto second = registry.refresh("local");
    ASSERT_FALSE(is_error(second));
    EXPECT_EQ(get_value(second).added, std::vector<std::string>{"gamma"});
    EXPECT_EQ(get_value(second).removed, std::vector<std::string>{"beta"});
    EXPECT_EQ(get_value(second).updated, std::vector<std::string>{"alpha"});

    auto removed = registry.resolve("beta");
    ASSERT_TRUE(is_error(removed));
    EXPECT_EQ(get_error(removed).code, "tool_not_found");
    EXPECT_EQ(registry.peek("beta"), nullptr);
}

TEST(ToolRegistryTest, RejectsDuplicateSource) {
    ToolRegistry registry;
    ASSERT_FALSE(is_error(registry.add_source(std::make_shared<StaticToolSource>("a"))));
    auto again = registry.add_source(std::make_shared<StaticToolSource>("a"));
    ASSERT_TRUE(is_error(again));
    EXPECT_EQ(get_error(again).code, "duplicate_source");
}

TEST(ToolRegistryTest, UnreachableSourceDoesNotAffectOthers) {
    auto healthy = std::make_shared<StaticToolSource>("healthy");
    healthy->add_tool(make_tool("echo"));
    auto broken = std::make_shared<CountingSource>("broken");
    broken->reachable = false;

    ToolRegistry registry;
    ASSERT_FALSE(is_error(registry.add_source(healthy)));
    ASSERT_FALSE(is_error(registry.add_source(broken)));

    const auto results = registry.refresh_all();
    ASSERT_EQ(results.size(), 2u);
    int failures = 0;
    for (const auto& result : results) {
        if (is_error(result)) {
            ++failures;
            EXPECT_EQ(get_error(result).code, "source_unreachable");
        }
    }
    EXPECT_EQ(failures, 1);
    EXPECT_FALSE(is_error(registry.resolve("echo")));
}

TEST(ToolRegistryTest, FreshEntryIsServedFromCache) {
    ManualClock clock;
    auto source = std::make_shared<CountingSource>("counting");
    ToolRegistry registry(clock.options(std::chrono::milliseconds(1000)));
    ASSERT_FALSE(is_error(registry.add_source(source)));
    ASSERT_FALSE(is_error(registry.refresh("counting")));
    EXPECT_EQ(source->calls.load(), 1);

    clock.advance(std::chrono::milliseconds(500));
    auto resolved = registry.resolve("counted");
    ASSERT_FALSE(is_error(resolved));
    EXPECT_FALSE(get_value(resolved).stale);
    EXPECT_EQ(source->calls.load(), 1);
}

TEST(ToolRegistryTest, ExpiredEntryIsRefetched) {
    ManualClock clock;
    auto source = std::make_shared<CountingSource>("counting");
    ToolRegistry registry(clock.options(std::chrono::milliseconds(1000)));
    ASSERT_FALSE(is_error(registry.add_source(source)));
    ASSERT_FALSE(is_error(registry.refresh("counting")));

    clock.advance(std::chrono::milliseconds(1500));
    auto resolved = registry.resolve("counted");
    ASSERT_FALSE(is_error(resolved));
    EXPECT_FALSE(get_value(resolved).stale);
    EXPECT_EQ(source->calls.load(), 2);
}

TEST(ToolRegistryTest, ExpiredEntryServedStaleWhenSourceDown) {
    ManualClock clock;
    auto source = std::make_shared<CountingSource>("counting");
    ToolRegistry registry(clock.options(std::chrono::milliseconds(1000)));
    ASSERT_FALSE(is_error(registry.add_source(source)));
    ASSERT_FALSE(is_error(registry.refresh("counting")));

    source->reachable = false;
    clock.advance(std::chrono::milliseconds(1500));
    auto resolved = registry.resolve("counted");
    ASSERT_FALSE(is_error(resolved));
    EXPECT_TRUE(get_value(resolved).stale);
    EXPECT_EQ(get_value(resolved).descriptor->name, "counted");
}

TEST(ToolRegistryTest, ThrowingSourceDoesNotWedgeLaterResolves) {
    ManualClock clock;
    auto source = std::make_shared<CountingSource>("counting");
    ToolRegistry registry(clock.options(std::chrono::milliseconds(1000)));
    ASSERT_FALSE(is_error(registry.add_source(source)));
    ASSERT_FALSE(is_error(registry.refresh("counting")));

    source->throws_non_standard = true;
    clock.advance(std::chrono::milliseconds(1500));
    for (int i = 0; i < 2; ++i) {
        auto resolved = registry.resolve("counted");
        ASSERT_FALSE(is_error(resolved));
        EXPECT_TRUE(get_value(resolved).stale);
    }
    EXPECT_EQ(source->calls.load(), 3);

    auto refreshed = registry.refresh("counting");
    ASSERT_TRUE(is_error(refreshed));
    EXPECT_EQ(get_error(refreshed).code, "source_unreachable");

    source->throws_non_standard = false;
    auto recovered = registry.resolve("counted");
    ASSERT_FALSE(is_error(recovered));
    EXPECT_FALSE(get_value(recovered).stale);
}

TEST(ToolRegistryTest, ConcurrentResolvesShareOneFetch) {
    ManualClock clock;
    auto source = std::make_shared<CountingSource>("counting");
    ToolRegistry registry(clock.options(std::chrono::milliseconds(1000)));
    ASSERT_FALSE(is_error(registry.add_source(source)));
    ASSERT_FALSE(is_error(registry.refresh("counting")));

    source->delay = std::chrono::milliseconds(100);
    clock.advance(std::chrono::milliseconds(1500));

    std::atomic<int> resolved_ok{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&registry, &resolved_ok] {
            if (!is_error(registry.resolve("counted"))) {
                ++resolved_ok;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(resolved_ok.load(), 8);
    EXPECT_EQ(source->calls.load(), 2);
}

TEST(ToolRegistryTest, ListAndSearchByName) {
    auto source = std::make_shared<StaticToolSource>("local");
    source->add_tool(make_tool("read_file", "Read a file"));
    source->add_tool(make_tool("search", "Grep the workspace"));

    ToolRegistry registry;
    ASSERT_FALSE(is_error(registry.add_source(source)));
    ASSERT_FALSE(is_error(registry.refresh("local")));

    EXPECT_EQ(registry.list().size(), 2u);
    EXPECT_EQ(registry.list(std::string("other")).size(), 0u);

    const auto matches = registry.search("GREP");
    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(matches[0].name, "search");
    EXPECT_EQ(matches[0].source, "local");
    EXPECT_EQ(matches[0].status, ToolStatus::Available);
}

TEST(ToolRegistryTest, RefreshUnknownSourceFails) {
    ToolRegistry registry;
    auto result = registry.refresh("nope");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_source");
}

}  // namespace

#include <algorithm>
#include <string>
#include <gtest/gtest.h>
#include "core/errors/ael_errors.hpp"
#include "session/run_manager.hpp"

namespace {

using ael::core::errors::get_error;
using ael::core::errors::get_value;
using ael::core::errors::is_error;
using ael::session::RunManager;
using ael::session::RunState;

TEST(RunManagerTest, StartRunMovesToRunning) {
    RunManager manager;
    auto start = manager.start_run("build");
    ASSERT_FALSE(is_error(start));

    const std::string run_id = get_value(start);
    auto state = manager.get_run_state(run_id);
    ASSERT_FALSE(is_error(state));
    EXPECT_EQ(get_value(state), RunState::Running);
    EXPECT_EQ(manager.active_runs().size(), 1u);
}

TEST(RunManagerTest, CancelRunRaisesTokenWithoutFinishing) {
    RunManager manager;
    auto start = manager.start_run("build");
    ASSERT_FALSE(is_error(start));
    const std::string run_id = get_value(start);

    auto token = manager.get_cancel_token(run_id);
    ASSERT_FALSE(is_error(token));
    EXPECT_FALSE(get_value(token)->load());

    auto cancel = manager.cancel_run(run_id);
    ASSERT_FALSE(is_error(cancel));
    EXPECT_EQ(get_value(cancel), RunState::Running);
    EXPECT_TRUE(get_value(token)->load());

    auto cancelled = manager.mark_cancelled(run_id);
    ASSERT_FALSE(is_error(cancelled));
    EXPECT_EQ(get_value(cancelled), RunState::Cancelled);
}

TEST(RunManagerTest, TerminalStateRejectsFurtherTransitions) {
    RunManager manager;
    auto start = manager.start_run("build");
    ASSERT_FALSE(is_error(start));
    const std::string run_id = get_value(start);

    auto failed = manager.mark_failed(run_id, "step_failed");
    ASSERT_FALSE(is_error(failed));
    EXPECT_EQ(get_value(failed), RunState::Failed);

    auto again = manager.mark_succeeded(run_id);
    ASSERT_TRUE(is_error(again));
    EXPECT_EQ(get_error(again).code, "invalid_state_transition");

    auto cancel = manager.cancel_run(run_id);
    ASSERT_TRUE(is_error(cancel));
    EXPECT_EQ(get_error(cancel).code, "invalid_state_transition");
    EXPECT_TRUE(manager.active_runs().empty());
}

TEST(RunManagerTest, UnknownRunIsReported) {
    RunManager manager;
    auto state = manager.get_run_state("missing");
    ASSERT_TRUE(is_error(state));
    EXPECT_EQ(get_error(state).code, "run_not_found");
    EXPECT_TRUE(is_error(manager.cancel_run("missing")));
}

TEST(RunManagerTest, RunIdsAreUniqueAndSorted) {
    RunManager manager;
    for (int i = 0; i < 5; ++i) {
        ASSERT_FALSE(is_error(manager.start_run("wf")));
    }
    EXPECT_EQ(manager.run_count(), 5u);
    const auto active = manager.active_runs();
    ASSERT_EQ(active.size(), 5u);
    EXPECT_TRUE(std::is_sorted(active.begin(), active.end()));
    EXPECT_EQ(RunManager::to_string(RunState::Succeeded), "succeeded");
}

}  // namespace

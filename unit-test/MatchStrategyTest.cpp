#include <thread>
#include "common/exceptions.hpp"
#include "gtest/gtest.h"
#include "sandbox/match_strategy.hpp"
#include "test/fake_runtime.hpp"

using namespace std;
using namespace arena;
using namespace arena::test;

class MatchStrategyTest : public ::testing::Test {
protected:
    void SetUp() override {
        runtime.add_image("agent-alice:1", {{"org.gameai.kind", "agent"}});
        runtime.add_image("agent-bob:1", {{"org.gameai.kind", "agent"}});
    }

    void script(const string &image, chrono::milliseconds duration, const string &output = "") {
        agent_script s;
        s.runtime = duration;
        s.late_output = output;
        runtime.scripts[image] = s;
    }

    match_run make_run(const vector<string> &images, chrono::seconds budget = chrono::seconds(0)) {
        match_run run;
        run.policy = policy;
        for (size_t i = 0; i < images.size(); ++i) {
            agent_launch launch;
            launch.image = images[i];
            launch.request.agent_id = "agent-" + std::to_string(i + 1);
            launch.request.match_id = "m-1";
            launch.request.time_budget = budget;
            run.launches.push_back(launch);
        }
        return run;
    }

    fake_runtime runtime;
    sandbox_policy policy;
};

TEST_F(MatchStrategyTest, MakeStrategyTest) {
    sandbox_runner runner(runtime);
    EXPECT_EQ(make_match_strategy("", runner)->name(), "concurrent");
    EXPECT_EQ(make_match_strategy("concurrent", runner)->name(), "concurrent");
    EXPECT_EQ(make_match_strategy("sequential", runner)->name(), "sequential");
    EXPECT_THROW(make_match_strategy("round-robin", runner), invalid_argument);
}

TEST_F(MatchStrategyTest, ConcurrentTest) {
    script("agent-alice:1", chrono::milliseconds(300), "alice\n");
    script("agent-bob:1", chrono::milliseconds(300), "bob\n");

    sandbox_runner runner(runtime, chrono::milliseconds(50));
    concurrent_strategy strategy(runner);
    match_run run = make_run({"agent-alice:1", "agent-bob:1"});

    elapsed_time timer;
    vector<run_result> results = strategy.run(run, nullptr);
    EXPECT_LT(timer.duration<chrono::milliseconds>().count(), 550);

    ASSERT_EQ(results.size(), 2);
    EXPECT_EQ(results[0].agent_id, "agent-1");
    EXPECT_EQ(results[0].output, "alice\n");
    EXPECT_EQ(results[1].agent_id, "agent-2");
    EXPECT_EQ(results[1].output, "bob\n");
    for (auto &result : results) EXPECT_EQ(result.reason, termination_reason::COMPLETED);
    EXPECT_EQ(runtime.container_count(), 0);
}

TEST_F(MatchStrategyTest, ConcurrentSharedDeadlineTest) {
    script("agent-alice:1", chrono::milliseconds(100));
    script("agent-bob:1", chrono::seconds(10));

    sandbox_runner runner(runtime, chrono::milliseconds(50));
    concurrent_strategy strategy(runner);
    match_run run = make_run({"agent-alice:1", "agent-bob:1"}, chrono::seconds(1));

    vector<run_result> results = strategy.run(run, nullptr);
    ASSERT_EQ(results.size(), 2);
    EXPECT_EQ(results[0].reason, termination_reason::COMPLETED);
    EXPECT_EQ(results[1].reason, termination_reason::TIMED_OUT);
    EXPECT_EQ(results[1].exit_code, 124);
}

TEST_F(MatchStrategyTest, SequentialTest) {
    script("agent-alice:1", chrono::milliseconds(300));
    script("agent-bob:1", chrono::milliseconds(300));

    sandbox_runner runner(runtime, chrono::milliseconds(50));
    sequential_strategy strategy(runner);
    match_run run = make_run({"agent-alice:1", "agent-bob:1"});

    elapsed_time timer;
    vector<run_result> results = strategy.run(run, nullptr);
    EXPECT_GE(timer.duration<chrono::milliseconds>().count(), 600);
    ASSERT_EQ(results.size(), 2);
    for (auto &result : results) EXPECT_EQ(result.reason, termination_reason::COMPLETED);

    auto specs = runtime.created_specs();
    ASSERT_EQ(specs.size(), 2);
    EXPECT_EQ(specs[0].image, "agent-alice:1");
    EXPECT_EQ(specs[1].image, "agent-bob:1");
}

TEST_F(MatchStrategyTest, SequentialCancelTest) {
    script("agent-alice:1", chrono::seconds(10));
    script("agent-bob:1", chrono::seconds(10));

    cancellation_token token;
    thread canceller([&] {
        this_thread::sleep_for(chrono::milliseconds(200));
        token.cancel();
    });

    sandbox_runner runner(runtime, chrono::milliseconds(50));
    sequential_strategy strategy(runner);
    match_run run = make_run({"agent-alice:1", "agent-bob:1"});
    vector<run_result> results = strategy.run(run, &token);
    canceller.join();

    ASSERT_EQ(results.size(), 2);
    EXPECT_EQ(results[0].reason, termination_reason::CANCELLED);
    EXPECT_EQ(results[1].reason, termination_reason::CANCELLED);
    EXPECT_EQ(results[1].detail, "agent was not started");
    EXPECT_EQ(runtime.created_specs().size(), 1);
    EXPECT_EQ(runtime.container_count(), 0);
}

TEST_F(MatchStrategyTest, FailedStartRemovesContainersTest) {
    script("agent-alice:1", chrono::seconds(10));

    sandbox_runner runner(runtime, chrono::milliseconds(50));
    concurrent_strategy strategy(runner);
    match_run run = make_run({"agent-alice:1", "agent-missing:1"});
    EXPECT_THROW(strategy.run(run, nullptr), engine_error);
    EXPECT_EQ(runtime.container_count(), 0);
}

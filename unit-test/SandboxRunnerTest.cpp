#include <algorithm>
#include <thread>
#include "common/exceptions.hpp"
#include "gtest/gtest.h"
#include "sandbox/runner.hpp"
#include "test/fake_runtime.hpp"

using namespace std;
using namespace arena;
using namespace arena::test;

class SandboxRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        runtime.add_image("agent-alice:0123456789abcdef", {{"org.gameai.kind", "agent"}, {"org.gameai.owner_id", "alice"}});
        policy.env = {{"PYTHONUNBUFFERED", "1"}, {"HOME", "/tmp/home"}};
    }

    run_request make_request(chrono::seconds budget = chrono::seconds(0)) {
        run_request request;
        request.agent_id = "alice";
        request.match_id = "m-1";
        request.owner_id = "alice";
        request.time_budget = budget;
        request.env = {{"MATCH_SEED", "42"}, {"PYTHONUNBUFFERED", "0"}};
        return request;
    }

    void script(const agent_script &s) {
        runtime.scripts[image] = s;
    }

    const string image = "agent-alice:0123456789abcdef";
    fake_runtime runtime;
    sandbox_policy policy;
};

TEST_F(SandboxRunnerTest, HardenedSpecTest) {
    sandbox_runner runner(runtime, chrono::milliseconds(50));
    container_spec spec = runner.make_spec(image, policy, make_request());

    EXPECT_EQ(spec.image, image);
    EXPECT_EQ(spec.network_mode, "none");
    EXPECT_TRUE(spec.read_only_rootfs);
    EXPECT_EQ(spec.cap_drop, vector<string>{"ALL"});
    EXPECT_EQ(spec.security_opt, vector<string>{"no-new-privileges:true"});
    EXPECT_EQ(spec.user, "65534:65534");
    EXPECT_EQ(spec.memory, policy.memory_limit);
    EXPECT_EQ(spec.memory_swap, policy.memory_limit);
    EXPECT_EQ(spec.nano_cpus, 1000000000);
    EXPECT_EQ(spec.pids_limit, 64);
    ASSERT_EQ(spec.ulimits.size(), 1);
    EXPECT_EQ(spec.ulimits[0].name, "nofile");
    EXPECT_EQ(spec.ulimits[0].hard, 256);
    ASSERT_EQ(spec.tmpfs.count("/tmp"), 1);
    EXPECT_NE(spec.tmpfs.at("/tmp").find("noexec"), string::npos);
    EXPECT_EQ(spec.stop_timeout, 2);

    EXPECT_EQ(spec.labels.at("org.gameai.kind"), "agent-container");
    EXPECT_EQ(spec.labels.at("org.gameai.match_id"), "m-1");
    EXPECT_EQ(spec.labels.at("org.gameai.agent_id"), "alice");
    EXPECT_EQ(spec.labels.at("org.gameai.owner_id"), "alice");
    EXPECT_EQ(spec.name.rfind("agent-m-1-alice-", 0), 0);

    // 策略中的环境变量优先于请求中的同名变量
    auto has_env = [&](const string &item) { return find(spec.env.begin(), spec.env.end(), item) != spec.env.end(); };
    EXPECT_TRUE(has_env("MATCH_SEED=42"));
    EXPECT_TRUE(has_env("PYTHONUNBUFFERED=1"));
    EXPECT_TRUE(has_env("HOME=/tmp/home"));
    EXPECT_FALSE(has_env("PYTHONUNBUFFERED=0"));
}

TEST_F(SandboxRunnerTest, EveryContainerHasNoNetworkTest) {
    sandbox_runner runner(runtime, chrono::milliseconds(50));
    policy.network_mode = "bridge";  // 即使策略对象被篡改，运行器也不会放开网络
    for (int i = 0; i < 3; ++i) runner.run(image, policy, make_request());

    auto specs = runtime.created_specs();
    ASSERT_EQ(specs.size(), 3);
    for (auto &spec : specs) {
        EXPECT_EQ(spec.network_mode, "none");
        EXPECT_TRUE(spec.read_only_rootfs);
        EXPECT_EQ(spec.cap_drop, vector<string>{"ALL"});
    }
}

TEST_F(SandboxRunnerTest, CompletedTest) {
    agent_script s;
    s.runtime = chrono::milliseconds(100);
    s.exit_code = 3;
    s.early_output = "hello\n";
    s.late_output = "bye\n";
    script(s);

    sandbox_runner runner(runtime, chrono::milliseconds(50));
    run_result result = runner.run(image, policy, make_request());
    EXPECT_EQ(result.reason, termination_reason::COMPLETED);
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.output, "hello\nbye\n");
    EXPECT_FALSE(result.output_truncated);
    EXPECT_GE(result.duration.count(), 90);
    EXPECT_EQ(result.agent_id, "alice");

    EXPECT_EQ(runtime.container_count(), 0);
    EXPECT_EQ(runtime.removed_containers().size(), 1);
}

TEST_F(SandboxRunnerTest, OutOfMemoryTest) {
    agent_script s;
    s.runtime = chrono::milliseconds(50);
    s.oom_killed = true;
    script(s);

    sandbox_runner runner(runtime, chrono::milliseconds(50));
    run_result result = runner.run(image, policy, make_request());
    EXPECT_EQ(result.reason, termination_reason::KILLED_OOM);
    EXPECT_EQ(result.exit_code, 137);
}

TEST_F(SandboxRunnerTest, KilledBySignalTest) {
    agent_script s;
    s.exit_code = 139;
    script(s);

    sandbox_runner runner(runtime, chrono::milliseconds(50));
    EXPECT_EQ(runner.run(image, policy, make_request()).reason, termination_reason::KILLED_POLICY_VIOLATION);
}

TEST_F(SandboxRunnerTest, TimeBudgetTest) {
    agent_script s;
    s.runtime = chrono::seconds(10);
    s.early_output = "thinking...\n";
    s.late_output = "never printed\n";
    script(s);

    sandbox_runner runner(runtime, chrono::milliseconds(200));
    elapsed_time timer;
    run_result result = runner.run(image, policy, make_request(chrono::seconds(5)));
    EXPECT_EQ(result.reason, termination_reason::TIMED_OUT);
    EXPECT_EQ(result.exit_code, 124);
    EXPECT_EQ(result.output, "thinking...\n");
    EXPECT_GE(result.duration.count(), 5000);
    EXPECT_LT(timer.duration<chrono::milliseconds>().count(), 9000);
    EXPECT_EQ(runtime.container_count(), 0);
}

TEST_F(SandboxRunnerTest, DefaultTimeBudgetTest) {
    policy.default_time_budget = chrono::seconds(7);
    EXPECT_EQ(sandbox_runner::effective_budget(policy, make_request()).count(), 7);
    EXPECT_EQ(sandbox_runner::effective_budget(policy, make_request(chrono::seconds(3))).count(), 3);
}

TEST_F(SandboxRunnerTest, CancelTest) {
    agent_script s;
    s.runtime = chrono::seconds(10);
    script(s);

    cancellation_token token;
    thread canceller([&] {
        this_thread::sleep_for(chrono::milliseconds(200));
        token.cancel();
    });

    sandbox_runner runner(runtime, chrono::milliseconds(50));
    elapsed_time timer;
    run_result result = runner.run(image, policy, make_request(), &token);
    canceller.join();
    EXPECT_EQ(result.reason, termination_reason::CANCELLED);
    EXPECT_LT(timer.duration<chrono::milliseconds>().count(), 2000);
    EXPECT_EQ(runtime.container_count(), 0);
}

TEST_F(SandboxRunnerTest, OutputLimitTest) {
    agent_script s;
    s.early_output = string(100, 'x');
    script(s);
    policy.log_byte_limit = 16;

    sandbox_runner runner(runtime, chrono::milliseconds(50));
    run_result result = runner.run(image, policy, make_request());
    EXPECT_TRUE(result.output_truncated);
    EXPECT_EQ(result.output, string(16, 'x') + truncation_marker);
    EXPECT_EQ(result.reason, termination_reason::COMPLETED);
}

TEST_F(SandboxRunnerTest, MissingImageTest) {
    sandbox_runner runner(runtime, chrono::milliseconds(50));
    EXPECT_THROW(runner.run("agent-nobody:ffff", policy, make_request()), engine_error);
    EXPECT_EQ(runtime.container_count(), 0);
}

TEST_F(SandboxRunnerTest, ClassifyTest) {
    container_state exited;
    exited.status = "exited";
    exited.exit_code = 0;
    EXPECT_EQ(sandbox_runner::classify(nullopt, exited), termination_reason::COMPLETED);

    container_state oom = exited;
    oom.oom_killed = true;
    oom.exit_code = 137;
    EXPECT_EQ(sandbox_runner::classify(nullopt, oom), termination_reason::KILLED_OOM);

    // 无法确定的状态一律视为违反策略
    container_state running;
    running.status = "running";
    running.running = true;
    EXPECT_EQ(sandbox_runner::classify(nullopt, running), termination_reason::KILLED_POLICY_VIOLATION);
    EXPECT_EQ(sandbox_runner::classify(nullopt, nullopt), termination_reason::KILLED_POLICY_VIOLATION);

    container_state dead = exited;
    dead.status = "dead";
    EXPECT_EQ(sandbox_runner::classify(nullopt, dead), termination_reason::KILLED_POLICY_VIOLATION);

    EXPECT_EQ(sandbox_runner::classify(termination_reason::TIMED_OUT, exited), termination_reason::TIMED_OUT);
}

TEST_F(SandboxRunnerTest, ResultJsonTest) {
    run_result result;
    result.agent_id = "alice";
    result.reason = termination_reason::TIMED_OUT;
    result.exit_code = 124;
    result.duration = chrono::milliseconds(5000);
    nlohmann::json j = result;
    EXPECT_EQ(j["termination_reason"], "TIMED_OUT");
    EXPECT_EQ(j["exit_code"], 124);
    EXPECT_EQ(j["duration_ms"], 5000);
    EXPECT_FALSE(j.contains("detail"));
}

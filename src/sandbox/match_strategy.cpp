#include "sandbox/match_strategy.hpp"
#include <glog/logging.h>
#include <stdexcept>
#include "common/defer.hpp"

namespace arena {
using namespace std;

match_strategy::match_strategy(sandbox_runner &runner) : runner(runner) {}

match_strategy::~match_strategy() {}

vector<run_result> match_strategy::collect_all(match_run &run) {
    vector<run_result> results;
    for (auto &agent : run.agents)
        results.push_back(runner.collect(agent));
    for (size_t i = run.agents.size(); i < run.launches.size(); ++i) {
        run_result skipped;
        skipped.agent_id = run.launches[i].request.agent_id;
        skipped.image = run.launches[i].image;
        skipped.reason = termination_reason::CANCELLED;
        skipped.detail = "agent was not started";
        results.push_back(move(skipped));
    }
    return results;
}

vector<run_result> match_strategy::run(match_run &run, const cancellation_token *token) {
    defer {
        for (auto &agent : run.agents) runner.teardown(agent);
    };
    start_all(run);
    await_all(run, token);
    return collect_all(run);
}

string concurrent_strategy::name() const {
    return "concurrent";
}

void concurrent_strategy::start_all(match_run &run) {
    for (auto &launch : run.launches)
        run.agents.push_back(runner.start(launch.image, run.policy, launch.request));
}

void concurrent_strategy::await_all(match_run &run, const cancellation_token *token) {
    // 所有 agent 共享比赛的时间预算，取最长的预算作为共同的截止时间
    chrono::seconds budget{0};
    for (auto &launch : run.launches)
        budget = max(budget, sandbox_runner::effective_budget(run.policy, launch.request));
    auto deadline = chrono::steady_clock::now() + budget;

    // 取消后 await 会立刻杀死剩下的每个容器
    for (auto &agent : run.agents)
        runner.await(agent, deadline, token);
}

string sequential_strategy::name() const {
    return "sequential";
}

void sequential_strategy::start_all(match_run &run) {
    if (!run.launches.empty())
        run.agents.push_back(runner.start(run.launches[0].image, run.policy, run.launches[0].request));
}

void sequential_strategy::await_all(match_run &run, const cancellation_token *token) {
    for (size_t i = 0; i < run.launches.size(); ++i) {
        if (i >= run.agents.size()) {
            if (token && token->cancelled()) break;
            run.agents.push_back(runner.start(run.launches[i].image, run.policy, run.launches[i].request));
        }
        auto &agent = run.agents[i];
        runner.await(agent, chrono::steady_clock::now() + sandbox_runner::effective_budget(run.policy, agent.request), token);
    }
}

unique_ptr<match_strategy> make_match_strategy(const string &mode, sandbox_runner &runner) {
    if (mode.empty() || mode == "concurrent")
        return make_unique<concurrent_strategy>(runner);
    else if (mode == "sequential")
        return make_unique<sequential_strategy>(runner);
    else
        throw invalid_argument("Unrecognized match mode " + mode);
}

}  // namespace arena

#include "worker/match_worker.hpp"
#include <glog/logging.h>
#include <fmt/core.h>
#include "common/defer.hpp"
#include "common/exceptions.hpp"

namespace arena {
using namespace std;
using namespace nlohmann;

static job_outcome terminal(const string &detail) {
    job_outcome outcome;
    outcome.detail = detail;
    return outcome;
}

match_worker::match_worker(int id, const settings &config, job_queue &queue, backend_client &backend,
                           container_runtime &runtime, resource_manager &manager, chrono::milliseconds slice)
    : worker(id, config, queue), backend(backend), runtime(runtime), manager(manager), runner(runtime, slice) {}

string match_worker::group() const {
    return MATCH_GROUP;
}

job_outcome match_worker::handle(job_context &context) {
    const match_job &job = get<match_job>(context.held.payload);
    notify("match " + job.match_id, [&] { backend.update_match(job.match_id, {"running", nullopt, nullopt}); });

    sandbox_policy policy = config.policy.tightened(job.policy_override);

    unique_ptr<match_strategy> strategy;
    try {
        strategy = make_match_strategy(job.mode, runner);
    } catch (invalid_argument &ex) {
        return terminal(ex.what());
    }

    // 任何容器启动之前必须确认所有镜像都存在
    match_run run;
    run.policy = policy;
    for (size_t i = 0; i < job.image_refs.size(); ++i) {
        const string &ref = job.image_refs[i];
        auto image = runtime.inspect_image(ref);
        if (!image) return terminal("image not found: " + ref);
        // 只运行本系统构建的镜像
        auto kind = image->labels.find("org.gameai.kind");
        if (kind == image->labels.end() || kind->second != "agent")
            return terminal("not an agent image: " + ref);

        agent_launch launch;
        launch.image = ref;
        launch.request.agent_id = job.agent_ids.empty() ? "agent-" + std::to_string(i + 1) : job.agent_ids[i];
        launch.request.match_id = job.match_id;
        auto owner = image->labels.find("org.gameai.owner_id");
        if (owner != image->labels.end()) launch.request.owner_id = owner->second;
        launch.request.time_budget = job.time_budget;
        run.launches.push_back(move(launch));
    }

    defer { manager.reclaim_match(job.match_id); };

    vector<run_result> results;
    try {
        results = strategy->run(run, &context.token);
    } catch (engine_error &ex) {
        LOG(WARNING) << "Worker " << id << ": container runtime rejected match " << job.match_id << ", " << ex.what();
        return terminal(string("match failed: ") + ex.what());
    }

    if (context.token.cancelled()) return terminal("cancelled");

    json agents = json::array();
    for (auto &result : results) agents.push_back(result);

    job_outcome outcome;
    outcome.succeeded = true;
    outcome.detail = "Match completed successfully.";
    outcome.result = {{"match_id", job.match_id},
                      {"mode", strategy->name()},
                      {"policy_version", policy.version},
                      {"agents", agents}};
    if (!job.config.is_null()) outcome.result["config"] = job.config;
    return outcome;
}

void match_worker::report(const job_context &context, job_state state, const job_outcome &outcome) {
    const match_job &job = get<match_job>(context.held.payload);
    match_update update;
    switch (state) {
        case job_state::SUCCEEDED:
            update.status = "completed";
            update.logs = outcome.detail;
            update.result = outcome.result;
            break;
        case job_state::ENQUEUED:
            update.status = "queued";
            update.logs = fmt::format("attempt {} failed, retrying: {}", context.attempt(), outcome.detail);
            break;
        case job_state::FAILED:
            update.status = "failed";
            update.logs = outcome.infrastructure ? "try again later" : outcome.detail;
            break;
        case job_state::CANCELLED:
            // 取消由后端发起，后端已经知道比赛的状态
            return;
        case job_state::CLAIMED:
            return;
    }
    notify("match " + job.match_id, [&] { backend.update_match(job.match_id, update); });
}

}  // namespace arena

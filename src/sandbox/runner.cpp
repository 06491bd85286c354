#include "sandbox/runner.hpp"
#include <glog/logging.h>
#include <fmt/core.h>
#include <algorithm>
#include <thread>
#include "build/image_builder.hpp"
#include "common/defer.hpp"
#include "common/exceptions.hpp"

namespace arena {
using namespace std;

/**
 * @brief 超时终止时上报的退出码，与 timeout(1) 一致
 */
static const int64_t TIMEOUT_EXIT_CODE = 124;

const char *to_string(termination_reason reason) {
    switch (reason) {
        case termination_reason::COMPLETED: return "COMPLETED";
        case termination_reason::TIMED_OUT: return "TIMED_OUT";
        case termination_reason::KILLED_OOM: return "KILLED_OOM";
        case termination_reason::KILLED_POLICY_VIOLATION: return "KILLED_POLICY_VIOLATION";
        case termination_reason::CANCELLED: return "CANCELLED";
    }
    return "UNKNOWN";
}

void to_json(nlohmann::json &j, const run_result &result) {
    j = {{"agent_id", result.agent_id},
         {"image", result.image},
         {"container_id", result.container_id},
         {"termination_reason", to_string(result.reason)},
         {"exit_code", result.exit_code},
         {"duration_ms", result.duration.count()},
         {"output", result.output},
         {"output_truncated", result.output_truncated}};
    if (!result.detail.empty()) j["detail"] = result.detail;
}

sandbox_runner::sandbox_runner(container_runtime &runtime, chrono::milliseconds slice)
    : runtime(runtime), slice(slice) {}

chrono::seconds sandbox_runner::effective_budget(const sandbox_policy &policy, const run_request &request) {
    return request.time_budget.count() > 0 ? request.time_budget : policy.default_time_budget;
}

container_spec sandbox_runner::make_spec(const string &image, const sandbox_policy &policy, const run_request &request) const {
    container_spec spec;
    spec.image = image;
    spec.cmd = request.args;
    spec.user = policy.run_user;

    string name = "agent";
    if (!request.match_id.empty()) name += "-" + sanitize_repository(request.match_id);
    if (!request.agent_id.empty()) name += "-" + sanitize_repository(request.agent_id);
    spec.name = name + "-" + random_uuid().substr(0, 8);

    map<string, string> env = request.env;
    env["HOME"] = "/tmp";
    for (auto &[key, value] : policy.env) env[key] = value;
    for (auto &[key, value] : env) spec.env.push_back(key + "=" + value);

    spec.labels = request.labels;
    spec.labels["org.gameai.kind"] = "agent-container";
    spec.labels["org.gameai.match_id"] = request.match_id;
    spec.labels["org.gameai.agent_id"] = request.agent_id;
    spec.labels["org.gameai.owner_id"] = request.owner_id;
    spec.labels["org.gameai.policy_version"] = std::to_string(policy.version);

    // 以下选项不受策略文件影响，policy.validate 已经拒绝了放宽它们的配置
    spec.read_only_rootfs = true;
    spec.network_mode = "none";
    spec.cap_drop = {"ALL"};
    spec.security_opt = {"no-new-privileges:true"};
    spec.tmpfs = {{"/tmp", fmt::format("rw,noexec,nosuid,nodev,size={}", policy.tmpfs_size)}};

    spec.memory = policy.memory_limit;
    spec.memory_swap = policy.memory_limit;
    spec.nano_cpus = (int64_t)(policy.cpu_limit * 1e9);
    spec.pids_limit = policy.pids_limit;
    spec.ulimits = {{"nofile", policy.fd_limit, policy.fd_limit}};
    spec.log_driver = "json-file";
    spec.log_options = {{"max-size", std::to_string(policy.log_byte_limit)}, {"max-file", "1"}};
    spec.stop_timeout = (int)policy.stop_timeout.count();
    return spec;
}

running_agent sandbox_runner::start(const string &image, const sandbox_policy &policy, const run_request &request) {
    running_agent agent;
    agent.image = image;
    agent.request = request;
    agent.policy = policy;
    agent.container_id = runtime.create_container(make_spec(image, policy, request));

    scoped_guard cleanup = scoped_guard() + [&] { teardown(agent); };
    runtime.start_container(agent.container_id);
    agent.timer = elapsed_time();
    cleanup.dismiss();

    LOG(INFO) << "Sandbox: started container " << agent.container_id << " from " << image
              << " for agent " << request.agent_id << " of match " << request.match_id;
    return agent;
}

void sandbox_runner::await(running_agent &agent, chrono::steady_clock::time_point deadline, const cancellation_token *token) {
    while (!agent.exited) {
        if (token && token->cancelled()) {
            LOG(INFO) << "Sandbox: cancelling container " << agent.container_id;
            runtime.kill_container(agent.container_id);
            agent.forced = termination_reason::CANCELLED;
            break;
        }

        auto now = chrono::steady_clock::now();
        if (now >= deadline) {
            LOG(INFO) << "Sandbox: container " << agent.container_id << " exceeded its time budget";
            try {
                runtime.stop_container(agent.container_id, agent.policy.stop_timeout);
            } catch (engine_error &ex) {
                LOG(WARNING) << "Sandbox: unable to stop container " << agent.container_id << ", killing it, " << ex.what();
                runtime.kill_container(agent.container_id);
            }
            agent.forced = termination_reason::TIMED_OUT;
            break;
        }

        auto wait = min(slice, chrono::duration_cast<chrono::milliseconds>(deadline - now) + chrono::milliseconds(1));
        wait_result result = runtime.wait_container(agent.container_id, wait);
        if (result.exited) {
            agent.exited = true;
            agent.exit_code = result.status_code;
        }
    }
    agent.duration = agent.timer.duration<chrono::milliseconds>();
}

termination_reason sandbox_runner::classify(const optional<termination_reason> &forced, const optional<container_state> &state) {
    if (forced) return *forced;
    if (!state) return termination_reason::KILLED_POLICY_VIOLATION;
    if (state->oom_killed) return termination_reason::KILLED_OOM;
    if (!state->running && state->status == "exited" && state->exit_code >= 0 && state->exit_code < 128)
        return termination_reason::COMPLETED;
    return termination_reason::KILLED_POLICY_VIOLATION;
}

run_result sandbox_runner::collect(running_agent &agent) {
    defer { teardown(agent); };

    run_result result;
    result.agent_id = agent.request.agent_id;
    result.image = agent.image;
    result.container_id = agent.container_id;
    result.duration = agent.duration;

    log_output logs = runtime.container_logs(agent.container_id, (size_t)agent.policy.log_byte_limit);
    result.output = logs.text;
    result.output_truncated = logs.truncated || truncate_output(result.output, (size_t)agent.policy.log_byte_limit);
    if (logs.truncated) result.output += truncation_marker;

    optional<container_state> state;
    try {
        state = runtime.inspect_container(agent.container_id);
    } catch (engine_error &ex) {
        LOG(WARNING) << "Sandbox: unable to inspect container " << agent.container_id << ", " << ex.what();
    }

    result.reason = classify(agent.forced, state);
    if (state) {
        result.exit_code = state->exit_code;
        result.detail = state->error;
    } else if (agent.exited) {
        result.exit_code = agent.exit_code;
    }
    if (result.reason == termination_reason::TIMED_OUT) result.exit_code = TIMEOUT_EXIT_CODE;

    LOG(INFO) << "Sandbox: container " << agent.container_id << " of agent " << agent.request.agent_id
              << " finished as " << to_string(result.reason) << " with exit code " << result.exit_code
              << " in " << result.duration.count() << "ms";
    return result;
}

void sandbox_runner::teardown(running_agent &agent) noexcept {
    if (agent.collected) return;
    try {
        runtime.remove_container(agent.container_id, true);
        agent.collected = true;
    } catch (std::exception &ex) {
        LOG(ERROR) << "Sandbox: unable to remove container " << agent.container_id << ", " << ex.what();
    }
}

run_result sandbox_runner::run(const string &image, const sandbox_policy &policy, const run_request &request,
                               const cancellation_token *token) {
    running_agent agent = start(image, policy, request);
    defer { teardown(agent); };
    await(agent, chrono::steady_clock::now() + effective_budget(policy, request), token);
    return collect(agent);
}

}  // namespace arena

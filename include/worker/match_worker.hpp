#pragma once

#include "backend/backend_client.hpp"
#include "manager/resource_manager.hpp"
#include "sandbox/match_strategy.hpp"
#include "worker/worker.hpp"

namespace arena {

/**
 * @brief 比赛 worker，消费 matches 组
 * 后端状态 running -> 确认所有镜像存在 -> 按比赛模式运行所有容器 ->
 * completed（每个 agent 的结果）或 failed -> 回收比赛的容器。
 */
struct match_worker : public worker {
    match_worker(int id, const settings &config, job_queue &queue, backend_client &backend,
                 container_runtime &runtime, resource_manager &manager,
                 std::chrono::milliseconds slice = std::chrono::milliseconds(1000));

    std::string group() const override;

protected:
    job_outcome handle(job_context &context) override;
    void report(const job_context &context, job_state state, const job_outcome &outcome) override;

private:
    backend_client &backend;
    container_runtime &runtime;
    resource_manager &manager;
    sandbox_runner runner;
};

}  // namespace arena

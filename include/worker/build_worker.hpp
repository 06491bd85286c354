#pragma once

#include "archive/validator.hpp"
#include "backend/backend_client.hpp"
#include "build/image_builder.hpp"
#include "worker/worker.hpp"

namespace arena {

/**
 * @brief 构建 worker，消费 builds 组
 * 后端状态 building -> 读取压缩包 -> 校验 -> 构建 -> completed 或 failed。
 * 校验失败是终止的失败；可重试的构建失败重新入队，直到达到重试上限。
 */
struct build_worker : public worker {
    build_worker(int id, const settings &config, job_queue &queue, backend_client &backend, image_builder &builder);

    std::string group() const override;

    /**
     * @brief 构建任务的压缩包路径，任务没有给出时为 archive.store_dir/<submission_id>.zip
     */
    std::filesystem::path archive_path_of(const build_job &job) const;

protected:
    job_outcome handle(job_context &context) override;
    void report(const job_context &context, job_state state, const job_outcome &outcome) override;
    std::chrono::steady_clock::time_point deadline_of(const lease &held) const override;

private:
    backend_client &backend;
    image_builder &builder;
    archive_validator validator;
};

}  // namespace arena

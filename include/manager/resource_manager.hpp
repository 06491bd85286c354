#pragma once

#include <chrono>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "config.hpp"
#include "queue/job_queue.hpp"
#include "runtime/container_runtime.hpp"

namespace arena {

/**
 * @brief 列出 agent 容器时的过滤条件，未给出的条件不参与过滤
 */
struct container_filter {
    std::optional<std::string> match_id;
    std::optional<std::string> owner_id;
    std::optional<std::string> agent_id;

    /**
     * @brief 是否包括已经退出的容器
     */
    bool include_exited = true;
};

/**
 * @brief 一次垃圾回收的结果
 */
struct gc_report {
    std::vector<std::string> removed_containers;
    std::vector<std::string> removed_images;

    /**
     * @brief 因为仍被租约或者容器引用而跳过的资源
     */
    std::vector<std::string> skipped;

    /**
     * @brief 删除失败的资源及原因
     */
    std::vector<std::string> errors;
};

void to_json(nlohmann::json &j, const gc_report &report);

/**
 * @brief 管理 agent 镜像和容器
 * 除了创建它们的 worker 之外，资源管理器是唯一会删除镜像和容器的组件。
 * 所有删除操作都会先查询任务队列中尚未过期的租约，
 * 任何仍被租约引用的比赛容器和镜像都不会被删除，因此可以与 worker 并发运行。
 */
struct resource_manager {
    resource_manager(container_runtime &runtime, job_queue &queue);

    /**
     * @param owner_id 为空时列出所有用户的镜像
     */
    std::vector<image_info> list_agent_images(const std::optional<std::string> &owner_id);

    std::vector<container_info> list_agent_containers(const container_filter &filter);

    /**
     * @param tail 只读取最后 tail 行，小于 0 表示全部
     */
    log_output container_logs(const std::string &id, int tail, std::size_t max_bytes = 5 << 20);

    arena::container_stats container_stats(const std::string &id);

    void stop_container(const std::string &id, std::chrono::seconds timeout = std::chrono::seconds(2));

    void delete_container(const std::string &id);

    /**
     * @brief 删除一个镜像
     * @return 镜像仍被租约引用时拒绝删除，返回 false
     * @throw engine_error 镜像不存在或者引擎拒绝删除
     */
    bool delete_image(const std::string &ref, bool force);

    /**
     * @brief 删除某个用户的所有 agent 镜像，跳过仍被租约引用的镜像
     * @return 被删除的镜像数
     */
    std::size_t delete_images_for_owner(const std::string &owner_id);

    /**
     * @brief 删除一场比赛的所有容器，比赛任务结束后调用
     * @return 被删除的容器数
     */
    std::size_t reclaim_match(const std::string &match_id);

    /**
     * @brief 回收过期的容器和镜像
     * 删除创建时间早于 now - container_age 的 agent 容器（包括 worker 崩溃后遗留的
     * 运行中容器）、早于 now - image_age 且没有被任何容器使用的 agent 镜像，
     * 以及带有 org.gameai.remove=true 标签的容器和镜像。
     * 每删除一个资源之前都会重新查询租约，仍被租约引用的资源总是被跳过。
     */
    gc_report collect_garbage(const retention_config &retention, std::chrono::system_clock::time_point now);

private:
    /**
     * @brief 尚未过期的租约引用的资源
     */
    struct lease_references {
        std::set<std::string> match_ids;
        std::set<std::string> image_refs;
        std::set<std::string> submission_ids;
    };

    lease_references live_references();

    static bool image_matches(const image_info &image, const std::set<std::string> &refs);

    static bool image_leased(const image_info &image, const lease_references &refs);

    container_runtime &runtime;
    job_queue &queue;
};

}  // namespace arena

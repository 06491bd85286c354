#pragma once

#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace arena {

/**
 * @brief 构建任务：将一份提交构建为镜像
 */
struct build_job {
    std::string submission_id;
    std::string owner_id;

    /**
     * @brief 压缩包的路径，为空时从 archive.store_dir 中按提交 id 查找
     */
    std::optional<std::string> archive_path;
};

/**
 * @brief 比赛任务：在沙箱中运行若干个 agent 镜像
 */
struct match_job {
    std::string match_id;

    /**
     * @brief 参赛的镜像，id 或标签
     */
    std::vector<std::string> image_refs;

    /**
     * @brief 与 image_refs 一一对应的 agent 编号，为空时使用 agent-<序号>
     */
    std::vector<std::string> agent_ids;

    /**
     * @brief 只能收紧沙箱策略的覆盖项
     */
    nlohmann::json policy_override;

    /**
     * @brief 每个 agent 的时间预算，为 0 时使用策略的默认值
     */
    std::chrono::seconds time_budget{0};

    /**
     * @brief concurrent 或 sequential
     */
    std::string mode = "concurrent";

    /**
     * @brief 原样传给比赛引擎的配置
     */
    nlohmann::json config;
};

/**
 * @brief 任务的内容，封闭的变体类型，处理时必须覆盖所有的任务类型
 */
using job_payload = std::variant<build_job, match_job>;

void from_json(const nlohmann::json &j, build_job &job);
void to_json(nlohmann::json &j, const build_job &job);
void from_json(const nlohmann::json &j, match_job &job);
void to_json(nlohmann::json &j, const match_job &job);

/**
 * @brief 根据 type 字段解析任务
 * @throw std::invalid_argument 未知的任务类型或者缺少字段
 */
job_payload parse_job(const nlohmann::json &j);

nlohmann::json dump_job(const job_payload &payload);

/**
 * @brief 任务所在的消费组，构建任务为 builds，比赛任务为 matches
 * 两类任务使用不同的队列，一类任务堆积时不会饿死另一类
 */
std::string group_of(const job_payload &payload);

extern const char *const BUILD_GROUP;
extern const char *const MATCH_GROUP;

/**
 * @brief 任务的状态
 * enqueued -> claimed -> succeeded | failed（可重试时回到 enqueued）；
 * 比赛任务可以被后端取消，进入 cancelled
 */
enum class job_state {
    ENQUEUED,
    CLAIMED,
    SUCCEEDED,
    FAILED,
    CANCELLED
};

const char *to_string(job_state state);

job_state parse_job_state(const std::string &text);

/**
 * @brief 任务的完整记录
 */
struct job_record {
    std::string id;
    std::string group;
    job_state state = job_state::ENQUEUED;
    job_payload payload;
    int attempts = 0;
    std::string enqueued_at;

    /**
     * @brief 最近一次完成或失败时的说明
     */
    std::string detail;

    bool cancel_requested = false;
};

/**
 * @brief 租约，持有租约的 worker 独占地处理任务
 * 租约到期而没有续约时，任务重新入队，由其他 worker 处理。
 */
struct lease {
    std::string job_id;
    std::string group;
    std::string worker_id;

    /**
     * @brief 每次领取任务生成的随机串，用于识别已经失效的租约
     */
    std::string token;

    /**
     * @brief 包括本次在内，任务已经被领取的次数
     */
    int attempts = 0;

    job_payload payload;
    std::chrono::system_clock::time_point expires_at;
};

}  // namespace arena

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "common/cancellation.hpp"
#include "common/utils.hpp"
#include "runtime/container_runtime.hpp"
#include "sandbox/policy.hpp"

namespace arena {

/**
 * @brief 容器结束运行的原因
 */
enum class termination_reason {
    COMPLETED,                // 正常退出，退出码小于 128
    TIMED_OUT,                // 超过时间预算被终止
    KILLED_OOM,               // 超过内存限制被内核杀死
    KILLED_POLICY_VIOLATION,  // 被信号杀死，或者无法确定的状态
    CANCELLED                 // 比赛被取消
};

const char *to_string(termination_reason reason);

/**
 * @brief 启动一个 agent 容器所需的参数
 */
struct run_request {
    std::string agent_id;
    std::string match_id;
    std::string owner_id;

    /**
     * @brief 墙上时间预算，为 0 时使用策略中的默认值
     */
    std::chrono::seconds time_budget{0};

    /**
     * @brief 追加在镜像入口命令之后的参数
     */
    std::vector<std::string> args;

    /**
     * @brief 额外的环境变量，与策略中的环境变量合并，同名时策略优先
     */
    std::map<std::string, std::string> env;

    std::map<std::string, std::string> labels;
};

/**
 * @brief 单个容器的运行结果
 */
struct run_result {
    std::string agent_id;
    std::string image;
    std::string container_id;
    termination_reason reason = termination_reason::KILLED_POLICY_VIOLATION;
    std::int64_t exit_code = -1;

    /**
     * @brief stdout 和 stderr 的输出，最多 policy.log_byte_limit 字节
     */
    std::string output;

    bool output_truncated = false;

    std::chrono::milliseconds duration{0};

    /**
     * @brief 附加的说明，如容器引擎报告的错误
     */
    std::string detail;
};

void to_json(nlohmann::json &j, const run_result &result);

/**
 * @brief 已经启动的 agent 容器
 */
struct running_agent {
    std::string container_id;
    std::string image;
    run_request request;
    sandbox_policy policy;
    elapsed_time timer;

    /**
     * @brief 容器是否已经退出，以及等待得到的退出码
     */
    bool exited = false;
    std::int64_t exit_code = -1;

    /**
     * @brief 由运行器主动终止时的原因
     */
    std::optional<termination_reason> forced;

    /**
     * @brief 从启动到退出（或被终止）的时长
     */
    std::chrono::milliseconds duration{0};

    bool collected = false;
};

/**
 * @brief 沙箱运行器
 * 以完全相同的隔离策略运行每一个 agent 容器：非 root 用户、丢弃所有 capabilities、
 * 禁止提升权限、只读根文件系统、只有 /tmp 可写、没有网络，并限制内存、CPU、
 * 进程数、文件描述符和输出字节数。
 */
struct sandbox_runner {
    /**
     * @param runtime 容器运行时
     * @param slice 等待容器退出时每个等待片段的最大长度，片段之间检查取消标记
     */
    explicit sandbox_runner(container_runtime &runtime, std::chrono::milliseconds slice = std::chrono::milliseconds(1000));

    /**
     * @brief 运行单个容器直到退出、超时或被取消，结束后删除容器
     * @throw network_error 容器引擎不可达
     * @throw engine_error 无法创建容器，如镜像不存在
     */
    run_result run(const std::string &image, const sandbox_policy &policy, const run_request &request,
                   const cancellation_token *token = nullptr);

    /**
     * @brief 根据策略生成容器参数
     */
    container_spec make_spec(const std::string &image, const sandbox_policy &policy, const run_request &request) const;

    /**
     * @brief 创建并启动容器，启动失败时删除已经创建的容器
     */
    running_agent start(const std::string &image, const sandbox_policy &policy, const run_request &request);

    /**
     * @brief 分片等待容器退出
     * 到达 deadline 时先发送 SIGTERM，等待 policy.stop_timeout 后强制杀死；
     * 发现取消标记时立刻杀死。
     */
    void await(running_agent &agent, std::chrono::steady_clock::time_point deadline,
               const cancellation_token *token = nullptr);

    /**
     * @brief 收集输出并判定结束原因，之后删除容器
     */
    run_result collect(running_agent &agent);

    /**
     * @brief 删除容器，出错时只记录日志
     */
    void teardown(running_agent &agent) noexcept;

    /**
     * @brief 根据主动终止的原因和容器最终状态判定结束原因
     */
    static termination_reason classify(const std::optional<termination_reason> &forced,
                                       const std::optional<container_state> &state);

    /**
     * @brief 计算生效的时间预算
     */
    static std::chrono::seconds effective_budget(const sandbox_policy &policy, const run_request &request);

private:
    container_runtime &runtime;
    std::chrono::milliseconds slice;
};

}  // namespace arena

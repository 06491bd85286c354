#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>
#include "config.hpp"
#include "monitor/monitor.hpp"
#include "queue/job_queue.hpp"
#include "worker/job_context.hpp"

/**
 * worker 相关函数
 * 每个 worker 线程从自己的消费组领取任务，一次只处理一个任务：
 * 领取任务 -> 创建 job_context 并启动心跳 -> 处理 -> 在队列中结算 -> 回调后端。
 *
 * worker 之间没有共享的可变状态，多个 worker 可以运行在不同的线程、进程
 * 甚至不同的主机上，只通过任务队列的租约协调。
 */
namespace arena {

/**
 * @brief 停止所有的 worker
 * 调用该函数后，将 worker 状态标记为停止。worker 循环时会检查标记，
 * 如果停止，则在处理完当前任务后不再领取新任务并退出。
 */
void stop_workers();

/**
 * @brief worker 是否被要求停止
 */
bool workers_stopping();

/**
 * @brief 注册监控器，必须在 worker 启动之前完成
 */
void register_monitor(std::unique_ptr<monitor> &&monitor);

/**
 * @brief 向所有的监控器报错
 */
void report_error(const std::string &message);

/**
 * @brief 一次任务处理的结果
 */
struct job_outcome {
    bool succeeded = false;

    /**
     * @brief 失败时是否可以重试，重试次数受 queue.max_attempts 限制
     */
    bool retryable = false;

    /**
     * @brief 失败是否由基础设施（容器引擎、队列、网络）导致
     * 这类失败的次数用尽后统一报告为 "try again later"，worker 在领取下一个任务前退避
     */
    bool infrastructure = false;

    /**
     * @brief 简短的说明，记录在任务上，失败时作为失败原因
     */
    std::string detail;

    /**
     * @brief 完整的日志，失败时随状态一起上报
     */
    std::string logs;

    /**
     * @brief 成功时上报给后端的数据
     */
    nlohmann::json result;
};

/**
 * @brief 消费任务队列的 worker
 * 子类决定消费哪个组，以及如何处理一个任务和如何上报结果。
 */
struct worker {
    worker(int id, const settings &config, job_queue &queue);
    virtual ~worker();

    /**
     * @brief 消费组名，即 builds 或 matches
     */
    virtual std::string group() const = 0;

    /**
     * @brief 在队列中标识持有租约的 worker，形如 <host>-<pid>-<group>-<id>
     */
    std::string worker_id() const;

    /**
     * @brief 领取并处理一个任务
     * @param wait 领取任务时最长的等待时间
     * @return 是否处理了一个任务
     * @throw queue_error 任务队列不可用
     */
    bool run_once(std::chrono::milliseconds wait);

    /**
     * @brief 不断领取任务直到 stop_workers 被调用
     */
    void loop();

    /**
     * @brief 在新线程中运行 loop
     */
    std::thread start();

protected:
    /**
     * @brief 处理一个任务
     * 预期之内的失败通过 job_outcome 返回，基础设施错误以 network_error 或 queue_error 抛出
     */
    virtual job_outcome handle(job_context &context) = 0;

    /**
     * @brief 任务在队列中结算后向后端上报结果
     * @param state 任务在队列中的新状态，ENQUEUED 表示将会重试
     */
    virtual void report(const job_context &context, job_state state, const job_outcome &outcome) = 0;

    /**
     * @brief 任务处理的截止时间，默认没有截止时间
     */
    virtual std::chrono::steady_clock::time_point deadline_of(const lease &held) const;

    /**
     * @brief 执行回调后端的操作，后端不可达时只记录日志
     * 后端的错误永远不会把一次成功的处理变为失败
     */
    void notify(const std::string &what, const std::function<void()> &callback);

    /**
     * @brief 基础设施错误后等待一段时间，每次连续失败等待时间加倍
     * 等待期间 stop_workers 被调用时立刻返回
     */
    void backoff();

    int id;
    const settings &config;
    job_queue &queue;

private:
    job_state settle(job_context &context, const job_outcome &outcome);

    unsigned consecutive_failures = 0;
    std::string hostname;
};

}  // namespace arena

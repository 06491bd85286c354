#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>
#include "common/cancellation.hpp"
#include "queue/job_queue.hpp"

namespace arena {

/**
 * @brief 一次任务处理的上下文
 * 由 worker 在领取任务后创建，在任务处理结束前一直有效
 */
struct job_context {
    job_context(const lease &held, std::chrono::steady_clock::time_point deadline);

    /**
     * @brief 任务的租约，心跳线程会更新其中的到期时间
     */
    lease held;

    /**
     * @brief 任务被取消或者租约丢失时被设置
     */
    cancellation_token token;

    /**
     * @brief 任务处理的截止时间
     */
    std::chrono::steady_clock::time_point deadline;

    /**
     * @brief 租约是否已经丢失
     * 丢失租约后任务可能已经被其他 worker 领取，当前的处理结果必须丢弃
     */
    std::atomic<bool> lost{false};

    int attempt() const;
};

/**
 * @brief 任务处理期间的心跳
 * 每隔租约时长的三分之一续约一次，同时检查任务是否被取消。
 * 续约失败（租约已被回收）或任务被取消时设置 context.token。
 * 析构时停止心跳线程。
 */
struct heartbeat {
    heartbeat(job_queue &queue, job_context &context, std::chrono::seconds lease_duration);
    heartbeat(const heartbeat &) = delete;
    ~heartbeat();

    void stop();

private:
    void loop();

    /**
     * @brief 续约一次并检查取消标记
     * @return 是否需要继续心跳
     */
    bool beat();

    job_queue &queue;
    job_context &context;
    std::chrono::seconds lease_duration;
    std::chrono::milliseconds period;

    std::mutex mut;
    std::condition_variable cv;
    bool stopping = false;
    std::thread thd;
};

}  // namespace arena

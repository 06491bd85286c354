#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "config.hpp"
#include "queue/job.hpp"

namespace arena {

/**
 * @brief 基于租约的持久任务队列
 * 同一时刻一个任务只有一个持有者。worker 崩溃后租约到期，任务自动回到队列，
 * 因此任务最终一定会被完成或者因为重试次数耗尽而失败。
 * 实现必须是线程安全的；存储出错时抛出 queue_error。
 */
struct job_queue {
    virtual ~job_queue();

    /**
     * @brief 将任务放入对应的消费组
     * @return 任务 id
     */
    virtual std::string enqueue(const job_payload &payload) = 0;

    /**
     * @brief 从消费组中领取一个任务，同时回收所有过期的租约
     * @param group builds 或 matches
     * @param worker_id 领取任务的 worker，仅用于记录
     * @param lease_duration 租约时长
     * @param wait 队列为空时最多等待多久
     * @return 等待超时时返回 nullopt
     */
    virtual std::optional<lease> claim(const std::string &group, const std::string &worker_id,
                                       std::chrono::seconds lease_duration, std::chrono::milliseconds wait) = 0;

    /**
     * @brief 续约
     * @return 租约已经失效（过期后被其他 worker 领取，或者任务已经结束）时返回 false
     */
    virtual bool renew(lease &l, std::chrono::seconds lease_duration) = 0;

    /**
     * @brief 任务成功
     * @return 租约已经失效时返回 false，此时任务的状态不变
     */
    virtual bool complete(const lease &l, const std::string &detail) = 0;

    /**
     * @brief 任务失败
     * 可重试且尝试次数未达上限时任务重新入队，否则进入终止的失败状态。
     * 已经被取消的任务进入 cancelled。
     * @return 任务的新状态；租约已经失效时返回任务当前的状态
     */
    virtual job_state fail(const lease &l, bool retryable, const std::string &detail) = 0;

    /**
     * @brief 将所有在 now 之前到期的租约对应的任务放回队列
     * @return 放回的任务数
     */
    virtual std::size_t requeue_expired(std::chrono::system_clock::time_point now) = 0;

    /**
     * @brief 取消任务
     * 排队中的任务直接进入 cancelled；已经被领取的任务只做标记，
     * 持有者在下一次心跳时发现并终止任务。
     * @return 任务不存在或者已经结束时返回 false
     */
    virtual bool cancel(const std::string &job_id) = 0;

    virtual bool is_cancelled(const std::string &job_id) = 0;

    /**
     * @return 任务不存在时返回 nullopt
     */
    virtual std::optional<job_record> find(const std::string &job_id) = 0;

    /**
     * @brief 任务的状态
     * @throw std::out_of_range 任务不存在
     */
    job_state state(const std::string &job_id);

    /**
     * @brief 消费组中排队的任务数
     */
    virtual std::size_t length(const std::string &group) = 0;

    /**
     * @brief 所有尚未过期的租约，资源回收时据此跳过仍在使用的资源
     */
    virtual std::vector<lease> live_leases() = 0;
};

/**
 * @brief 根据 queue.type 创建任务队列
 * @throw std::invalid_argument 未知的队列类型
 */
std::unique_ptr<job_queue> make_job_queue(const settings &config);

}  // namespace arena

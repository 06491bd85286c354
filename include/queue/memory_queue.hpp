#pragma once

#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include "config.hpp"
#include "queue/job_queue.hpp"

namespace arena {

/**
 * @brief 进程内的任务队列
 * 不持久化，只用于单进程部署（arenactl 的本地模式）和测试。
 * 终止状态的任务记录在 queue.record_ttl 后被丢弃，find 不再能查到它们。
 */
struct memory_queue : public job_queue {
    explicit memory_queue(const queue_config &config);

    std::string enqueue(const job_payload &payload) override;
    std::optional<lease> claim(const std::string &group, const std::string &worker_id,
                               std::chrono::seconds lease_duration, std::chrono::milliseconds wait) override;
    bool renew(lease &l, std::chrono::seconds lease_duration) override;
    bool complete(const lease &l, const std::string &detail) override;
    job_state fail(const lease &l, bool retryable, const std::string &detail) override;
    std::size_t requeue_expired(std::chrono::system_clock::time_point now) override;
    bool cancel(const std::string &job_id) override;
    bool is_cancelled(const std::string &job_id) override;
    std::optional<job_record> find(const std::string &job_id) override;
    std::size_t length(const std::string &group) override;
    std::vector<lease> live_leases() override;

private:
    struct entry {
        job_record record;
        std::optional<lease> holder;

        /**
         * @brief 进入终止状态的时间
         */
        std::chrono::system_clock::time_point finished_at;
    };

    /**
     * @brief 将任务置于终止状态并记录时间
     */
    static void finish(entry &e, job_state state, std::chrono::system_clock::time_point now);

    /**
     * @brief 丢弃超过保留时间的终止任务记录，调用者必须持有 mut
     */
    void drop_finished_nolock(std::chrono::system_clock::time_point now);

    /**
     * @brief 租约是否仍然有效，调用者必须持有 mut
     */
    entry *holder_of(const lease &l);

    std::size_t requeue_expired_nolock(std::chrono::system_clock::time_point now);

    queue_config config;
    std::mutex mut;
    std::condition_variable cv;
    std::map<std::string, entry> jobs;
    std::map<std::string, std::deque<std::string>> queues;
};

}  // namespace arena

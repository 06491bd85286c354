#pragma once

#include "config.hpp"
#include "queue/job_queue.hpp"
#include "queue/redis_conn.hpp"

namespace arena {

/**
 * @brief 基于 Redis 的持久任务队列
 * 键的布局（<prefix> 为 redis.key_prefix）：
 *   <prefix>:queue:<group>   排队中的任务 id 列表，从左端领取
 *   <prefix>:leases:<group>  有序集合，成员为被领取的任务 id，分数为租约到期的毫秒时间戳
 *   <prefix>:job:<id>        哈希表，任务的完整记录，进入终止状态后在 queue.record_ttl 后过期
 * 所有改变任务状态的操作都由 Lua 脚本原子地完成，多个进程、多台机器上的 worker
 * 可以共用一个队列。
 * 列表中直接出现的 JSON 任务（由后端直接 RPUSH）在领取时会被转换为完整的记录。
 */
struct redis_queue : public job_queue {
    redis_queue(const redis_config &redis, const queue_config &config);

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
    std::string queue_key(const std::string &group) const;
    std::string leases_key(const std::string &group) const;
    std::string job_key(const std::string &id) const;
    std::string job_prefix() const;

    /**
     * @brief 终止任务记录的过期时间，以毫秒为单位的字符串，直接作为脚本参数
     */
    std::string record_ttl() const;

    /**
     * @brief 执行一个 Lua 脚本并返回结果
     */
    cpp_redis::reply eval(const std::string &script, const std::vector<std::string> &keys,
                          const std::vector<std::string> &args);

    std::string prefix;
    queue_config config;
    redis_conn conn;
};

}  // namespace arena

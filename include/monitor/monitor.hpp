#pragma once

#include <string>
#include "queue/job.hpp"

namespace arena {

enum class worker_state {
    START,
    WORKING,
    IDLE,
    STOPPED,
    CRASHED
};

const char *to_string(worker_state state);

/**
 * @brief 执行监控行为
 * 所有回调都有空的默认实现，监控器只需要覆盖关心的事件。
 * 回调中抛出的异常会被 worker 记录后忽略，不会影响任务的处理。
 */
struct monitor {
    virtual ~monitor();

    /**
     * @brief 监控上报某个 worker 已经领取到一个任务
     * @param worker_id 领取任务的 Worker 编号
     * @param held 任务的租约
     */
    virtual void start_job(int worker_id, const lease &held);

    /**
     * @brief 监控上报某个任务已经处理结束
     * @param worker_id 处理任务的 Worker 编号
     * @param held 任务的租约
     * @param state 任务处理结束后在队列中的状态
     */
    virtual void end_job(int worker_id, const lease &held, job_state state);

    /**
     * @brief 监控上报当前某个 Worker 的状态
     * @param worker_id Worker 编号
     * @param state Worker 的新状态
     * @param information 如果 Worker 崩溃，则为错误原因，用于日志记录
     */
    virtual void worker_state_changed(int worker_id, worker_state state, const std::string &information);

    /**
     * @brief 上报与具体任务无关的错误，如容器引擎不可达
     */
    virtual void report_error(const std::string &message);
};

/**
 * @brief 将所有事件写入日志的监控器
 */
struct log_monitor : public monitor {
    void start_job(int worker_id, const lease &held) override;
    void end_job(int worker_id, const lease &held, job_state state) override;
    void worker_state_changed(int worker_id, worker_state state, const std::string &information) override;
    void report_error(const std::string &message) override;
};

}  // namespace arena

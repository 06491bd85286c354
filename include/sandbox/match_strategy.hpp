#pragma once

#include <memory>
#include <string>
#include <vector>
#include "sandbox/runner.hpp"

namespace arena {

/**
 * @brief 比赛中的一个参赛 agent
 */
struct agent_launch {
    std::string image;
    run_request request;
};

/**
 * @brief 一场比赛的运行状态，由 match_strategy 推进
 */
struct match_run {
    std::vector<agent_launch> launches;
    sandbox_policy policy;

    /**
     * @brief 与 launches 一一对应，尚未启动的 agent 没有对应项
     */
    std::vector<running_agent> agents;
};

/**
 * @brief 多容器协同的策略
 * 一场比赛的所有容器按 start_all、await_all、collect_all 的顺序推进。
 * 不同的策略决定容器是同时运行还是依次运行。
 */
struct match_strategy {
    explicit match_strategy(sandbox_runner &runner);
    virtual ~match_strategy();

    /**
     * @brief 策略的名称，对应比赛任务中的 mode
     */
    virtual std::string name() const = 0;

    /**
     * @brief 启动比赛开始时就需要运行的容器
     */
    virtual void start_all(match_run &run) = 0;

    /**
     * @brief 等待所有容器运行结束
     */
    virtual void await_all(match_run &run, const cancellation_token *token) = 0;

    /**
     * @brief 收集所有容器的结果并删除容器，结果的顺序与 launches 一致
     */
    virtual std::vector<run_result> collect_all(match_run &run);

    /**
     * @brief 完整地运行一场比赛，无论成功与否都会删除所有容器
     * @throw network_error 容器引擎不可达
     * @throw engine_error 无法创建容器
     */
    std::vector<run_result> run(match_run &run, const cancellation_token *token);

protected:
    sandbox_runner &runner;
};

/**
 * @brief 所有容器同时启动，共享同一个截止时间
 */
struct concurrent_strategy : public match_strategy {
    using match_strategy::match_strategy;

    std::string name() const override;
    void start_all(match_run &run) override;
    void await_all(match_run &run, const cancellation_token *token) override;
};

/**
 * @brief 按声明的顺序依次运行每个容器，每个容器都有完整的时间预算
 * 前一个容器结束后才启动下一个容器。
 */
struct sequential_strategy : public match_strategy {
    using match_strategy::match_strategy;

    std::string name() const override;
    void start_all(match_run &run) override;
    void await_all(match_run &run, const cancellation_token *token) override;
};

/**
 * @brief 根据比赛任务的 mode 选择策略
 * @param mode concurrent 或 sequential，为空时使用 concurrent
 * @throw std::invalid_argument 未知的 mode
 */
std::unique_ptr<match_strategy> make_match_strategy(const std::string &mode, sandbox_runner &runner);

}  // namespace arena

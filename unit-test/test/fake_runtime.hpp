#pragma once

#include <chrono>
#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "runtime/container_runtime.hpp"

namespace arena::test {

/**
 * @brief 假的容器中运行的程序的行为
 */
struct agent_script {
    /**
     * @brief 程序自然结束所需的时间
     */
    std::chrono::milliseconds runtime{0};

    int exit_code = 0;

    /**
     * @brief 结束时是否被内核因为内存不足杀死
     */
    bool oom_killed = false;

    /**
     * @brief 程序启动后立刻输出的内容
     */
    std::string early_output;

    /**
     * @brief 程序自然结束前输出的内容，被提前终止时不会输出
     */
    std::string late_output;
};

/**
 * @brief 内存中的容器运行时，按 agent_script 模拟容器的行为
 * 时间是真实的：一个运行 10 秒的脚本确实需要 10 秒才会结束。
 */
struct fake_runtime : public container_runtime {
    struct container {
        container_spec spec;
        std::string image_id;
        agent_script script;
        container_state state;
        bool started = false;
        std::chrono::steady_clock::time_point started_at;
        std::string output;
        std::chrono::system_clock::time_point created;
    };

    /**
     * @brief 引擎不可达时所有调用都抛出 network_error
     */
    std::atomic<bool> available{true};

    /**
     * @brief 每次构建花费的时间
     */
    std::chrono::milliseconds build_delay{0};

    /**
     * @brief 自定义构建结果，为空时构建总是成功
     */
    std::function<build_output(const build_request &)> on_build;

    /**
     * @brief 镜像名或 id 到脚本的映射，没有映射的镜像立刻以 0 退出
     */
    std::map<std::string, agent_script> scripts;

    image_info add_image(const std::string &tag, const std::map<std::string, std::string> &labels,
                         std::chrono::system_clock::time_point created = std::chrono::system_clock::now());

    /**
     * @brief 直接放入一个已经退出的容器，用于测试资源回收
     */
    std::string add_exited_container(const std::string &image, const std::map<std::string, std::string> &labels,
                                     std::chrono::system_clock::time_point created);

    void ping() override;
    build_output build_image(const build_request &request) override;
    std::optional<image_info> inspect_image(const std::string &ref) override;
    std::vector<image_info> list_images(const std::vector<std::string> &label_filters) override;
    void remove_image(const std::string &ref, bool force) override;
    std::string create_container(const container_spec &spec) override;
    void start_container(const std::string &id) override;
    wait_result wait_container(const std::string &id, std::chrono::milliseconds timeout) override;
    log_output container_logs(const std::string &id, std::size_t max_bytes, int tail) override;
    void kill_container(const std::string &id) override;
    void stop_container(const std::string &id, std::chrono::seconds timeout) override;
    void remove_container(const std::string &id, bool force) override;
    std::optional<container_state> inspect_container(const std::string &id) override;
    std::vector<container_info> list_containers(const std::vector<std::string> &label_filters, bool all) override;
    container_stats stats(const std::string &id) override;

    int build_count() const;
    std::vector<build_request> build_requests() const;
    std::vector<container_spec> created_specs() const;
    std::vector<std::string> removed_containers() const;
    std::vector<std::string> removed_images() const;
    std::size_t container_count() const;
    bool has_image(const std::string &ref) const;

private:
    void check_available() const;
    image_info *find_image(const std::string &ref);
    container &find_container(const std::string &id);

    /**
     * @brief 按真实时间推进容器的状态
     */
    void advance(container &c);

    void terminate(container &c, int exit_code);

    mutable std::mutex mut;
    std::vector<image_info> images;
    std::map<std::string, container> containers;
    std::vector<build_request> builds;
    std::vector<container_spec> specs;
    std::vector<std::string> removed_container_ids;
    std::vector<std::string> removed_image_ids;
    int next_id = 0;
};

}  // namespace arena::test

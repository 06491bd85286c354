#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include "config.hpp"
#include "runtime/container_runtime.hpp"

namespace arena {

/**
 * @brief 解析 Docker 非 TTY 容器的日志流
 * 日志流由若干帧组成，每帧有 8 字节的头部：第 0 字节为流的类型（1 为 stdout，
 * 2 为 stderr），第 4 到 7 字节为大端序的帧长度。数据可能在任意位置被切开，
 * 因此需要保存跨越多次 feed 的状态。
 */
struct frame_demuxer {
    explicit frame_demuxer(std::size_t max_bytes);

    /**
     * @brief 输入一段原始数据
     * @return 已收集的输出超过上限时返回 false，调用者可以停止读取
     */
    bool feed(const char *data, std::size_t size);

    log_output result() const;

private:
    std::size_t max_bytes;
    std::string header;
    std::size_t remaining = 0;
    log_output output;
};

/**
 * @brief 通过 Docker Engine REST API 访问容器引擎
 * 默认通过 unix socket 连接本机的 dockerd，每个请求使用独立的 CURL 句柄，
 * 因此可以被多个线程同时使用。
 */
struct docker_engine : public container_runtime {
    explicit docker_engine(const docker_config &config);

    void ping() override;
    build_output build_image(const build_request &request) override;
    std::optional<image_info> inspect_image(const std::string &ref) override;
    std::vector<image_info> list_images(const std::vector<std::string> &label_filters) override;
    void remove_image(const std::string &ref, bool force) override;
    std::string create_container(const container_spec &spec) override;
    void start_container(const std::string &id) override;
    wait_result wait_container(const std::string &id, std::chrono::milliseconds timeout) override;
    log_output container_logs(const std::string &id, std::size_t max_bytes, int tail = -1) override;
    void kill_container(const std::string &id) override;
    void stop_container(const std::string &id, std::chrono::seconds timeout) override;
    void remove_container(const std::string &id, bool force) override;
    std::optional<container_state> inspect_container(const std::string &id) override;
    std::vector<container_info> list_containers(const std::vector<std::string> &label_filters, bool all) override;
    container_stats stats(const std::string &id) override;

private:
    struct response {
        long status = 0;
        std::string body;

        /**
         * @brief 请求是否因为超时而中止
         */
        bool timed_out = false;
    };

    /**
     * @brief 发送 HTTP 请求
     * @param on_data 若不为空，响应体交给 on_data 处理而不保存在 body 中；
     * on_data 返回 false 时中止请求
     * @throw network_error 无法连接到引擎
     */
    response request(const std::string &method, const std::string &path,
                     const std::string &body = "", const std::string &content_type = "application/json",
                     long timeout_ms = -1,
                     const std::function<bool(const char *, std::size_t)> &on_data = nullptr);

    /**
     * @brief 检查响应的状态码，不在 accepted 中时抛出 engine_error
     */
    static void expect(const response &res, std::initializer_list<long> accepted, const std::string &action);

    std::string url_of(const std::string &path) const;

    docker_config config;
};

}  // namespace arena

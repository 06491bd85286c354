#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace arena {

/**
 * @brief 镜像的元数据
 */
struct image_info {
    std::string id;
    std::vector<std::string> tags;
    std::map<std::string, std::string> labels;
    std::chrono::system_clock::time_point created;
    std::int64_t size = 0;
};

/**
 * @brief 容器列表中的一项
 */
struct container_info {
    std::string id;
    std::string name;
    std::string image;

    /**
     * @brief created、running、exited 等
     */
    std::string state;

    /**
     * @brief 人类可读的状态，如 "Exited (0) 5 minutes ago"
     */
    std::string status;

    std::map<std::string, std::string> labels;
    std::chrono::system_clock::time_point created;
};

/**
 * @brief 容器的运行状态，来自 inspect
 */
struct container_state {
    std::string status;
    bool running = false;
    bool oom_killed = false;
    int exit_code = 0;

    /**
     * @brief 容器引擎报告的错误，如启动失败的原因
     */
    std::string error;

    std::chrono::system_clock::time_point started_at;
    std::chrono::system_clock::time_point finished_at;
};

struct ulimit {
    std::string name;
    std::int64_t soft;
    std::int64_t hard;
};

/**
 * @brief 创建容器所需的全部参数
 * 沙箱运行器根据策略填写这个结构，容器运行时只负责忠实地传给引擎
 */
struct container_spec {
    std::string image;
    std::string name;
    std::vector<std::string> cmd;
    std::vector<std::string> env;
    std::map<std::string, std::string> labels;
    std::string user;

    bool read_only_rootfs = true;

    /**
     * @brief 挂载点到挂载参数，如 /tmp -> rw,noexec,nosuid,nodev,size=67108864
     */
    std::map<std::string, std::string> tmpfs;

    std::string network_mode = "none";
    std::vector<std::string> cap_drop;
    std::vector<std::string> security_opt;

    /**
     * @brief 内存上限，单位字节，0 表示不限制
     */
    std::int64_t memory = 0;

    /**
     * @brief 内存加 swap 的上限，等于 memory 时禁止使用 swap
     */
    std::int64_t memory_swap = 0;

    /**
     * @brief CPU 份额，单位为 10^-9 个核心
     */
    std::int64_t nano_cpus = 0;

    std::int64_t pids_limit = 0;
    std::vector<ulimit> ulimits;

    std::string log_driver = "json-file";
    std::map<std::string, std::string> log_options;

    /**
     * @brief docker stop 时 SIGTERM 之后等待多少秒发送 SIGKILL
     */
    int stop_timeout = 2;
};

/**
 * @brief 等待容器退出的结果
 */
struct wait_result {
    /**
     * @brief 为 false 表示等待超时，容器仍在运行
     */
    bool exited = false;

    std::int64_t status_code = 0;
    std::string error;
};

/**
 * @brief 收集到的容器输出
 */
struct log_output {
    std::string text;

    /**
     * @brief 输出是否超过了收集的字节数上限
     */
    bool truncated = false;
};

struct container_stats {
    std::int64_t memory_usage = 0;
    std::int64_t memory_limit = 0;
    double cpu_percent = 0;
    std::int64_t pids = 0;
};

/**
 * @brief 构建镜像的请求
 */
struct build_request {
    /**
     * @brief tar 格式的构建上下文
     */
    std::string context;

    std::string tag;
    std::string dockerfile = "Dockerfile";
    std::map<std::string, std::string> labels;

    /**
     * @brief 构建时 RUN 步骤使用的网络模式
     */
    std::string network_mode = "default";

    std::chrono::seconds timeout{600};
};

/**
 * @brief 构建镜像的原始输出，由镜像构建器负责分类
 */
struct build_output {
    bool success = false;
    bool timed_out = false;
    std::string image_id;

    /**
     * @brief 构建过程的全部输出
     */
    std::string log;

    /**
     * @brief 构建失败时引擎报告的错误
     */
    std::string error;
};

/**
 * @brief 容器运行时接口
 * 所有对容器引擎的访问都经过这个接口，便于在测试中替换为假的实现。
 * 实现必须是线程安全的：所有 worker 线程共用一个实例。
 * 引擎不可达时抛出 network_error，引擎拒绝请求时抛出 engine_error。
 */
struct container_runtime {
    virtual ~container_runtime();

    /**
     * @brief 检查引擎是否可用
     * @throw network_error 引擎不可达
     */
    virtual void ping() = 0;

    /**
     * @brief 构建镜像，在 request.timeout 之后放弃
     */
    virtual build_output build_image(const build_request &request) = 0;

    /**
     * @brief 查询镜像
     * @param ref 镜像 id 或者标签
     * @return 镜像不存在时返回 nullopt
     */
    virtual std::optional<image_info> inspect_image(const std::string &ref) = 0;

    /**
     * @brief 列出镜像
     * @param label_filters 标签过滤器，形如 key 或 key=value，多个过滤器同时满足
     */
    virtual std::vector<image_info> list_images(const std::vector<std::string> &label_filters) = 0;

    virtual void remove_image(const std::string &ref, bool force) = 0;

    /**
     * @brief 创建容器
     * @return 容器 id
     */
    virtual std::string create_container(const container_spec &spec) = 0;

    virtual void start_container(const std::string &id) = 0;

    /**
     * @brief 等待容器退出，最多等待 timeout
     */
    virtual wait_result wait_container(const std::string &id, std::chrono::milliseconds timeout) = 0;

    /**
     * @brief 读取容器的 stdout 和 stderr
     * @param max_bytes 最多收集的字节数
     * @param tail 只读取最后 tail 行，小于 0 表示全部
     */
    virtual log_output container_logs(const std::string &id, std::size_t max_bytes, int tail = -1) = 0;

    /**
     * @brief 立刻杀死容器，容器已经退出时什么都不做
     */
    virtual void kill_container(const std::string &id) = 0;

    /**
     * @brief 先发送 SIGTERM，timeout 之后发送 SIGKILL
     */
    virtual void stop_container(const std::string &id, std::chrono::seconds timeout) = 0;

    /**
     * @brief 删除容器，容器不存在时什么都不做
     */
    virtual void remove_container(const std::string &id, bool force) = 0;

    /**
     * @return 容器不存在时返回 nullopt
     */
    virtual std::optional<container_state> inspect_container(const std::string &id) = 0;

    /**
     * @param label_filters 标签过滤器，形如 key 或 key=value
     * @param all 是否包含已经退出的容器
     */
    virtual std::vector<container_info> list_containers(const std::vector<std::string> &label_filters, bool all) = 0;

    virtual container_stats stats(const std::string &id) = 0;
};

}  // namespace arena

#pragma once

#include <chrono>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "sandbox/policy.hpp"

namespace arena {

/**
 * @brief Redis 的连接配置，任务队列存放在 Redis 中
 */
struct redis_config {
    /**
     * @brief redis 服务器地址
     */
    std::string host = "redis";

    /**
     * @brief redis 服务器端口
     */
    int port = 6379;

    /**
     * @brief 重试时间间隔，单位毫秒
     */
    unsigned retry_interval = 1000;

    /**
     * @brief 密码，若不为空，则使用该密码登录
     */
    std::string password;

    /**
     * @brief 所有键的前缀，允许多套环境共用一个 Redis
     */
    std::string key_prefix = "arena";
};

void from_json(const nlohmann::json &j, redis_config &config);

/**
 * @brief 容器引擎（Docker Engine API）的连接配置
 */
struct docker_config {
    /**
     * @brief 本地 unix socket 路径，url 为空时使用
     */
    std::string socket = "/var/run/docker.sock";

    /**
     * @brief 远程引擎的地址，如 http://10.0.0.2:2375，不为空时优先于 socket
     */
    std::string url;

    std::string api_version = "v1.41";

    /**
     * @brief 普通请求的超时时间，单位毫秒
     * 构建和等待容器的请求有各自的期限，不受此限制
     */
    long request_timeout = 30000;
};

void from_json(const nlohmann::json &j, docker_config &config);

/**
 * @brief 外部后端 API 的配置，worker 通过它上报构建和比赛的结果
 */
struct backend_config {
    std::string url = "http://backend:8000/api/v1";

    /**
     * @brief 单次请求超时，单位毫秒
     */
    long timeout = 30000;

    /**
     * @brief 上报失败时的重试次数
     */
    int retries = 3;

    /**
     * @brief 重试时间间隔，单位毫秒
     */
    unsigned retry_interval = 1000;
};

void from_json(const nlohmann::json &j, backend_config &config);

/**
 * @brief 提交压缩包的校验约束
 */
struct archive_config {
    /**
     * @brief 压缩包本身的字节数上限
     */
    std::uintmax_t max_archive_bytes = 50ull << 20;

    /**
     * @brief 压缩包内的条目数上限
     */
    std::size_t max_entries = 1000;

    /**
     * @brief 解压后的总字节数上限，防止压缩炸弹
     */
    std::uintmax_t max_extracted_bytes = 200ull << 20;

    /**
     * @brief 入口文件允许的扩展名
     */
    std::vector<std::string> entrypoint_extensions = {".py"};

    /**
     * @brief 依赖清单的文件名，位于压缩包根目录
     */
    std::string manifest_name = "requirements.txt";

    /**
     * @brief 构建任务没有给出 archive_path 时，从这里按 <submission_id>.zip 查找压缩包
     */
    std::filesystem::path store_dir = "/var/lib/arena/submissions";
};

void from_json(const nlohmann::json &j, archive_config &config);

/**
 * @brief 镜像构建配置
 */
struct build_config {
    /**
     * @brief 加固过的基础镜像，由独立的流程构建和刷新
     */
    std::string base_image = "agent-base:latest";

    /**
     * @brief 镜像名前缀，最终镜像名为 <repo_prefix>-<owner>:<content hash>
     */
    std::string repo_prefix = "agent";

    /**
     * @brief 每个构建任务的临时目录所在的文件夹
     */
    std::filesystem::path scratch_dir = "/tmp/arena-build";

    /**
     * @brief 构建上下文（忽略规则生效后）的字节数上限
     */
    std::uintmax_t max_context_bytes = 100ull << 20;

    /**
     * @brief 构建时限，单位秒
     */
    std::chrono::seconds timeout{600};

    /**
     * @brief 构建时的网络模式。安装依赖需要网络，运行时则永远没有网络
     */
    std::string network_mode = "default";

    /**
     * @brief 镜像内的入口解释器
     */
    std::vector<std::string> interpreter = {"python", "-u"};

    /**
     * @brief 以基础镜像的默认用户安装依赖清单的命令，{manifest} 将被替换为清单路径
     */
    std::string install_command = "pip install --no-cache-dir --disable-pip-version-check -r {manifest}";

    /**
     * @brief 镜像内运行 agent 的非 root 用户
     */
    std::string run_user = "65534:65534";

    /**
     * @brief 提交中没有 .dockerignore 时使用的忽略规则，语法与 .dockerignore 相同
     */
    std::vector<std::string> default_ignore = {
        "**/.git", "**/.gitignore", "**/__pycache__", "**/*.pyc", "**/*.pyo", "**/.venv", "**/venv",
        "**/.env", "**/.DS_Store", "__MACOSX", "**/*.log", "**/.idea", "**/.vscode", "**/node_modules"};

    /**
     * @brief 是否保留构建临时目录，用于调试
     */
    bool keep_scratch = false;
};

void from_json(const nlohmann::json &j, build_config &config);

/**
 * @brief 任务队列配置
 */
struct queue_config {
    /**
     * @brief redis 或 memory，memory 只能用于单进程部署和测试
     */
    std::string type = "redis";

    /**
     * @brief 任务最多被尝试的次数，超过后进入终止失败状态
     */
    int max_attempts = 3;

    /**
     * @brief 租约时长，worker 崩溃后任务最迟在这么长时间后重新入队
     */
    std::chrono::seconds lease{60};

    /**
     * @brief 每次领取任务时最长的阻塞时间
     */
    std::chrono::seconds claim_wait{5};

    /**
     * @brief 基础设施错误时 worker 的退避时间上限
     */
    std::chrono::seconds max_backoff{30};

    /**
     * @brief 任务进入终止状态（成功、失败、取消）后记录保留多久，为 0 时永久保留
     */
    std::chrono::seconds record_ttl{7 * 24 * 3600};
};

void from_json(const nlohmann::json &j, queue_config &config);

/**
 * @brief 资源回收策略
 */
struct retention_config {
    /**
     * @brief agent 容器保留多久，超过后没有租约引用的容器即使仍在运行也会被删除
     */
    std::chrono::seconds container_age{3600};

    /**
     * @brief 没有被任何容器使用的 agent 镜像保留多久
     */
    std::chrono::seconds image_age{30 * 24 * 3600};

    /**
     * @brief worker 进程内定期回收的间隔，0 表示不启用
     */
    std::chrono::seconds interval{600};
};

void from_json(const nlohmann::json &j, retention_config &config);

/**
 * @brief 整个系统的配置，启动时从 JSON 文件读入，之后只读
 */
struct settings {
    redis_config redis;
    docker_config docker;
    backend_config backend;
    archive_config archive;
    build_config build;
    queue_config queue;
    retention_config retention;
    sandbox_policy policy;

    /**
     * @brief 构建 worker 的线程数
     */
    unsigned build_workers = 1;

    /**
     * @brief 比赛 worker 的线程数
     */
    unsigned match_workers = 1;

    /**
     * @brief 是否开启 DEBUG 模式
     * 开启后不删除构建临时目录，以便手动检查构建上下文
     */
    bool debug = false;
};

void from_json(const nlohmann::json &j, settings &config);

/**
 * @brief 读入配置文件
 * 配置中的 policy 可以是内联的对象，也可以是指向独立策略文件的路径（相对于配置文件）。
 * 随后用环境变量 REDIS_HOST、REDIS_PORT、BACKEND_URL、DOCKER_HOST 覆盖对应配置。
 * @throw std::runtime_error 配置文件不存在
 * @throw std::invalid_argument 配置内容不合法
 */
settings load_settings(const std::filesystem::path &config_path);

/**
 * @brief 只用环境变量和默认值构造配置，没有配置文件时使用
 */
settings default_settings();

}  // namespace arena

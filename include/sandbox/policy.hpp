#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <string>

namespace arena {

/**
 * @brief 沙箱策略，所有容器都按这份策略运行
 * 策略是运维配置，启动时读入后只读，任何提交者和 agent 都无法影响它。
 * 文件系统、网络、特权相关的选项只有一种合法取值，之所以仍然出现在
 * 配置文件中，是为了让策略文件完整地描述容器的运行环境；
 * 读入时会拒绝任何放宽这些选项的配置。
 */
struct sandbox_policy {
    /**
     * @brief 策略文件的版本，随结果一起上报，便于审计
     */
    int version = 1;

    /**
     * @brief 内存上限，单位字节，同时作为内存加 swap 的上限
     */
    std::int64_t memory_limit = 512ll << 20;

    /**
     * @brief CPU 份额，单位为核心数，如 1.0 表示一个核心
     */
    double cpu_limit = 1.0;

    /**
     * @brief 容器内的进程数上限
     */
    std::int64_t pids_limit = 64;

    /**
     * @brief 打开文件描述符的数量上限
     */
    std::int64_t fd_limit = 256;

    /**
     * @brief 收集的输出字节数上限，超出的部分被截断
     */
    std::int64_t log_byte_limit = 5ll << 20;

    /**
     * @brief /tmp 临时存储的大小，单位字节
     */
    std::int64_t tmpfs_size = 64ll << 20;

    /**
     * @brief 根文件系统的挂载方式，只能为 read-only
     */
    std::string filesystem_mode = "read-only";

    /**
     * @brief 网络模式，只能为 none
     */
    std::string network_mode = "none";

    /**
     * @brief Linux capabilities 的处理方式，只能为 drop-all
     */
    std::string capabilities = "drop-all";

    /**
     * @brief 是否禁止提升权限，只能为 true
     */
    bool no_new_privileges = true;

    /**
     * @brief 容器内进程的用户，格式为 uid:gid，不允许为 root
     */
    std::string run_user = "65534:65534";

    /**
     * @brief 超时后先发送 SIGTERM，等待这么长时间后发送 SIGKILL
     */
    std::chrono::seconds stop_timeout{2};

    /**
     * @brief 没有指定时间预算时使用的默认值
     */
    std::chrono::seconds default_time_budget{30};

    /**
     * @brief 注入到所有容器中的环境变量
     */
    std::map<std::string, std::string> env;

    /**
     * @brief 检查策略是否满足沙箱的最低要求
     * @throw std::invalid_argument 任何放宽隔离的配置
     */
    void validate() const;

    /**
     * @brief 根据比赛任务携带的 policy_override 计算生效的策略
     * override 只能收紧数值类型的限制（取较小值），其余字段一律忽略。
     * @param override_json 比赛任务中的 policy_override，可以为 null
     * @return 生效的策略
     */
    sandbox_policy tightened(const nlohmann::json &override_json) const;
};

void from_json(const nlohmann::json &j, sandbox_policy &policy);

void to_json(nlohmann::json &j, const sandbox_policy &policy);

/**
 * @brief 读入并检查独立的策略文件
 */
sandbox_policy load_policy(const std::filesystem::path &path);

/**
 * @brief 解析带单位的字节数，如 "512m"、"64k"、"1g"、"1048576" 或整数
 * @throw std::invalid_argument 格式不正确
 */
std::int64_t parse_byte_size(const nlohmann::json &value);

}  // namespace arena

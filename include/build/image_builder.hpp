#pragma once

#include <chrono>
#include <string>
#include "archive/validator.hpp"
#include "config.hpp"
#include "runtime/container_runtime.hpp"

namespace arena {

/**
 * @brief 构建结果的分类
 */
enum class build_status {
    SUCCEEDED,
    VALIDATION_FAILED,          // 提交没有通过校验，不可重试
    CONTEXT_TOO_LARGE,          // 忽略规则生效后构建上下文仍然过大，不可重试
    DEPENDENCY_INSTALL_FAILED,  // 安装依赖清单失败，可能是镜像源暂时不可用
    BUILD_FAILED,               // 其他构建错误
    BUILD_TIMEOUT,              // 构建超时
    RUNTIME_UNAVAILABLE,        // 容器引擎不可达
    SCRATCH_UNAVAILABLE         // 构建目录无法读写，如磁盘已满或权限错误
};

const char *to_string(build_status status);

struct build_result {
    build_status status = build_status::BUILD_FAILED;

    std::string image_id;
    std::string image_tag;
    std::string content_sha256;

    /**
     * @brief 面向提交者的说明
     */
    std::string detail;

    /**
     * @brief 构建工具的原始输出，只用于展示，调用者不应该解析它
     */
    std::string logs;

    /**
     * @brief 相同内容的镜像已经存在，没有重新构建
     */
    bool cached = false;

    bool succeeded() const;

    /**
     * @brief 失败是否可能是暂时的，worker 据此决定是否重新入队
     */
    bool is_retryable() const;

    /**
     * @brief 失败是否由本机的基础设施导致，与提交的内容无关
     */
    bool is_infrastructure() const;
};

/**
 * @brief 单次构建的参数
 */
struct build_context {
    /**
     * @brief 构建必须在这个时刻之前完成，与 build.timeout 取较早者
     */
    std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::time_point::max();
};

/**
 * @brief 将镜像仓库名中不合法的字符替换为 -，如 "Alice Smith" -> "alice-smith"
 */
std::string sanitize_repository(const std::string &name);

/**
 * @brief 计算镜像标签 <repo_prefix>-<owner>:<sha 前 16 位>
 */
std::string image_tag(const std::string &repo_prefix, const std::string &owner_id, const std::string &sha256);

/**
 * @brief 镜像构建器
 * 将通过校验的提交构建为基于加固基础镜像的 agent 镜像。镜像标签由内容哈希决定，
 * 因此相同的提交总是得到相同的标签，已经存在的标签不会被重新构建。
 */
struct image_builder {
    image_builder(const build_config &config, const archive_config &archive, container_runtime &runtime);

    build_result build(const submission &submit, const build_context &context = {});

    /**
     * @brief 生成 Dockerfile
     * @param entrypoint 入口文件名，位于构建上下文根目录
     * @param has_manifest 是否需要安装依赖清单
     */
    std::string render_dockerfile(const std::string &entrypoint, bool has_manifest) const;

    /**
     * @brief 生成的 Dockerfile 在构建上下文中的文件名
     */
    static const char *const dockerfile_name;

private:
    /**
     * @brief 在 scratch 目录中完成解压、生成构建上下文和构建
     * @throw std::system_error 读写 scratch 目录失败
     */
    build_result build_in_scratch(const submission &submit, const build_context &context);

    build_result classify(const build_output &output, build_result result) const;

    build_config config;
    std::string manifest_name;
    archive_validator validator;
    container_runtime &runtime;
};

}  // namespace arena

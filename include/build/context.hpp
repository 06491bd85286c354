#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "build/ignore_rules.hpp"

namespace arena {

/**
 * @brief 构建上下文中的一个条目
 */
struct context_entry {
    /**
     * @brief 相对于上下文根目录的路径，以 / 分隔
     */
    std::string path;

    std::filesystem::file_type type;
    std::uintmax_t size = 0;

    /**
     * @brief 符号链接的目标
     */
    std::string link_target;

    bool executable = false;
};

/**
 * @brief 忽略规则生效后的构建上下文，条目按路径排序
 */
struct build_context_files {
    std::vector<context_entry> entries;

    /**
     * @brief 所有普通文件的字节数之和
     */
    std::uintmax_t bytes = 0;
};

/**
 * @brief 收集 root 下未被忽略的文件，不跟随符号链接
 * .dockerignore 本身以及空文件夹也会被收集
 */
build_context_files collect_context(const std::filesystem::path &root, const ignore_rules &rules);

/**
 * @brief 计算构建上下文的内容哈希
 * 按排序后的相对路径依次加入路径和文件内容（符号链接则为链接目标），
 * 因此与文件的修改时间、压缩包内条目的顺序无关。
 * @return 小写十六进制的 SHA-256
 */
std::string content_sha256(const std::filesystem::path &root, const build_context_files &context);

/**
 * @brief 将构建上下文打包为 tar，作为构建镜像请求的请求体
 * 所有条目的修改时间和属主都被固定，相同的内容总是得到相同的 tar。
 */
std::string pack_context(const std::filesystem::path &root, const build_context_files &context);

}  // namespace arena

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "config.hpp"

namespace arena {

/**
 * @brief 压缩包校验的结果分类
 */
enum class validation_status {
    ACCEPTED,
    MALFORMED_ARCHIVE,       // 不是合法的 zip 文件
    TOO_LARGE,               // 压缩包或者解压后的总大小超出限制
    TOO_MANY_ENTRIES,        // 条目过多
    PATH_TRAVERSAL,          // 条目路径为绝对路径或跳出解压根目录
    UNSAFE_LINK,             // 符号链接或硬链接指向解压根目录之外
    UNSUPPORTED_ENTRY,       // 设备文件、管道、套接字等特殊文件
    MISSING_ENTRYPOINT,      // 没有入口文件
    AMBIGUOUS_ENTRYPOINT,    // 根目录下有多个入口文件
    ENTRYPOINT_NOT_AT_ROOT   // 入口文件不在根目录
};

const char *to_string(validation_status status);

/**
 * @brief 压缩包校验的结果
 * 校验失败是预期内的结果，不会抛出异常，而是通过 status 和 reason 返回
 */
struct validation_result {
    validation_status status = validation_status::ACCEPTED;

    /**
     * @brief 拒绝的原因，面向提交者，可以直接展示
     */
    std::string reason;

    /**
     * @brief 入口文件名，如 agent.py，只有通过校验时有效
     */
    std::string entrypoint;

    /**
     * @brief 根目录下是否有依赖清单
     */
    bool has_manifest = false;

    /**
     * @brief 规范化后的所有条目路径，目录以 / 结尾
     */
    std::vector<std::string> entries;

    /**
     * @brief 解压后的总字节数（根据条目头部声明）
     */
    std::uintmax_t extracted_bytes = 0;

    bool accepted() const;
};

/**
 * @brief 一份提交
 * 提交在上传时创建，校验通过后不再修改；重新提交产生新的 submission
 */
struct submission {
    std::string id;
    std::string owner_id;

    /**
     * @brief 压缩包的原始字节
     */
    std::string archive;

    validation_result validation;
};

/**
 * @brief 不可信压缩包的校验器
 * 校验器没有副作用，只读取压缩包的内容并给出结论。
 * extract 只在镜像构建器的临时目录中使用，写入前会再次检查每个条目。
 */
struct archive_validator {
    explicit archive_validator(const archive_config &config);

    /**
     * @brief 校验压缩包
     * 依次检查：(a) zip 格式、大小、条目数、解压后的大小；
     * (b) 条目不会跳出解压根目录，不含特殊文件；
     * (c) 根目录下恰好有一个入口文件。
     * @param bytes 压缩包的内容
     */
    validation_result validate(const std::string &bytes) const;

    /**
     * @brief 将压缩包解压到 root
     * 写入每个条目前都会重新检查路径，实际写入的字节数超过限制时立刻停止。
     * 不跟随任何符号链接写入文件。
     * @param bytes 压缩包的内容
     * @param root 解压根目录，必须已经存在
     * @return 解压结果，失败时 root 下可能留有部分文件，由调用者清理
     */
    validation_result extract(const std::string &bytes, const std::filesystem::path &root) const;

    /**
     * @brief 判断根目录下的文件名是否是合法的入口文件名
     * agent<ext> 或者 <name>_agent<ext>
     */
    bool is_entrypoint_name(const std::string &filename) const;

private:
    archive_config config;
};

}  // namespace arena

#pragma once

#include <boost/interprocess/sync/file_lock.hpp>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace arena {

/**
 * @brief 读取文件的全部内容
 * @param path 文件路径
 * @return 文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文件的全部内容
 * @param path 文件路径
 * @param def 若文件不存在，返回 def
 * @return 文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path, const std::string &def);

void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 将压缩包内的条目路径规范化为相对于解压根目录的路径
 * 这里用于确保计算目录时不会出现目录遍历攻击：绝对路径、包含反斜杠
 * 或盘符的路径、以及通过 ".." 跳出根目录的路径都会被拒绝。
 * 注意只做字面上的计算，不会访问文件系统。
 * @param entry 压缩包内的条目名，如 "src/../agent.py"
 * @return 规范化后的路径，如 "agent.py"；路径不安全时返回 nullopt
 */
std::optional<std::string> normalize_entry_path(const std::string &entry);

/**
 * @brief 判断位于 entry 的符号链接指向 target 时是否会跳出解压根目录
 * 绝对路径的链接目标一律视为越界。
 */
bool link_escapes_root(const std::string &entry, const std::string &target);

/**
 * @brief 统计文件夹内所有普通文件的字节数（不跟随符号链接）
 */
std::uintmax_t directory_size(const std::filesystem::path &dir);

/**
 * @brief 在 parent 下创建一个唯一的临时文件夹，析构时递归删除
 * 每个构建任务独占一个 scratch 目录，任务结束后不留下任何解压内容
 */
struct scoped_temp_directory {
    scoped_temp_directory(const std::filesystem::path &parent, const std::string &prefix);
    scoped_temp_directory(const scoped_temp_directory &) = delete;
    ~scoped_temp_directory();

    const std::filesystem::path &path() const;

    /**
     * @brief 保留目录不删除，DEBUG 模式下用于人工检查构建上下文
     */
    void keep();

private:
    std::filesystem::path dir;
    bool keep_dir = false;
};

/**
 * @brief 锁文件
 * 通过在 dir 下创建名为 name 的锁文件并加锁实现，可以配合
 * boost::interprocess::scoped_lock 使用。同一主机上的多个 worker 进程
 * 借此串行化对同一镜像标签的构建。
 * @param dir 锁文件所在的文件夹，不存在时自动创建
 * @param name 锁文件名
 */
boost::interprocess::file_lock lock_file(const std::filesystem::path &dir, const std::string &name);

}  // namespace arena

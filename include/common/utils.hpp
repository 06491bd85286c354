#pragma once

#include <chrono>
#include <string>

namespace arena {

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 设置环境变量
 * @param key 环境变量的键
 * @param value 环境变量的值
 * @param replace 若为真，则覆盖已有的环境变量值
 */
void set_env(const std::string &key, const std::string &value, bool replace = true);

/**
 * @brief 计时器，用于统计容器运行的墙上时间
 * 使用单调时钟，避免系统时间被调整时统计出负数
 */
struct elapsed_time {
    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};

/**
 * @brief 当前时间的 ISO 8601 (UTC) 表示，如 2024-01-01T00:00:00Z
 */
std::string iso8601_now();

/**
 * @brief 解析 ISO 8601 (UTC) 时间，支持带小数秒以及 Z 后缀
 * @return 解析失败时返回 epoch（time_point 的默认值）
 */
std::chrono::system_clock::time_point parse_iso8601(const std::string &text);

/**
 * @brief 生成随机的 uuid 字符串
 */
std::string random_uuid();

/**
 * @brief 输出被截断时附加在末尾的提示
 */
extern const char *const truncation_marker;

/**
 * @brief 将 text 截断到 limit 字节，截断时在末尾附加 truncation_marker
 * @return 是否发生了截断
 */
bool truncate_output(std::string &text, std::size_t limit);

}  // namespace arena

#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace arena {

/**
 * @brief .dockerignore 规则
 * 每条规则是一个相对于构建上下文根目录的通配符，支持 *、?、[...] 以及
 * 匹配任意层目录的 **。以 ! 开头的规则表示例外，后出现的规则优先。
 * 规则匹配一个文件夹时，文件夹下的所有内容都被忽略。
 */
struct ignore_rules {
    /**
     * @brief 规则条数和单条规则长度的上限，规则来自不可信的提交
     */
    static constexpr std::size_t MAX_RULES = 256;
    static constexpr std::size_t MAX_PATTERN_LENGTH = 256;

    ignore_rules() = default;

    /**
     * @throw std::invalid_argument 规则超过 MAX_RULES 条或者单条规则超过 MAX_PATTERN_LENGTH
     */
    explicit ignore_rules(const std::vector<std::string> &patterns);

    /**
     * @brief 从 .dockerignore 的内容解析规则，忽略空行和 # 开头的注释
     * @throw std::invalid_argument 同构造函数
     */
    static ignore_rules parse(const std::string &content);

    /**
     * @brief 判断相对路径 path 是否被忽略
     */
    bool excluded(const std::string &path) const;

    /**
     * @brief 输出为 .dockerignore 格式
     */
    std::string to_string() const;

private:
    struct rule {
        std::string pattern;
        bool negated;

        /**
         * @brief 按 / 切分的规则段，连续的 ** 已经合并
         */
        std::vector<std::string> segments;
    };

    std::vector<rule> rules;
};

}  // namespace arena

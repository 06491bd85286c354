#include "build/ignore_rules.hpp"
#include <boost/algorithm/string.hpp>
#include <algorithm>
#include <fmt/core.h>
#include <sstream>
#include <stdexcept>
#include "common/io_utils.hpp"

namespace arena {
using namespace std;

ignore_rules::ignore_rules(const vector<string> &patterns) {
    for (auto pattern : patterns) {
        boost::trim(pattern);
        if (pattern.empty() || pattern[0] == '#') continue;
        bool negated = pattern[0] == '!';
        if (negated) pattern = boost::trim_copy(pattern.substr(1));
        while (!pattern.empty() && pattern.front() == '/') pattern.erase(0, 1);
        while (!pattern.empty() && pattern.back() == '/') pattern.pop_back();
        if (pattern.empty()) continue;
        if (pattern.size() > MAX_PATTERN_LENGTH)
            throw invalid_argument(fmt::format("ignore rule '{}...' is longer than {} characters",
                                               pattern.substr(0, 32), MAX_PATTERN_LENGTH));
        if (rules.size() >= MAX_RULES)
            throw invalid_argument(fmt::format("more than {} ignore rules", MAX_RULES));

        rule r;
        r.pattern = pattern;
        r.negated = negated;
        boost::split(r.segments, pattern, boost::is_any_of("/"));
        // 连续的 ** 与单个 ** 等价
        r.segments.erase(unique(r.segments.begin(), r.segments.end(),
                                [](const string &a, const string &b) { return a == "**" && b == "**"; }),
                         r.segments.end());
        rules.push_back(move(r));
    }
}

ignore_rules ignore_rules::parse(const string &content) {
    vector<string> lines;
    boost::split(lines, content, boost::is_any_of("\n"));
    for (auto &line : lines) boost::trim_right_if(line, boost::is_any_of("\r"));
    return ignore_rules(lines);
}

/**
 * @brief 匹配通配符中位于 pos 的单个字符：?、[...]、\x 或者普通字符
 * @param length 该单元在 pattern 中占用的字符数
 */
static bool match_one(const string &pattern, size_t pos, char c, size_t &length) {
    char head = pattern[pos];
    if (head == '?') {
        length = 1;
        return true;
    }
    if (head == '\\' && pos + 1 < pattern.size()) {
        length = 2;
        return pattern[pos + 1] == c;
    }
    if (head == '[') {
        size_t i = pos + 1;
        bool negated = i < pattern.size() && (pattern[i] == '!' || pattern[i] == '^');
        if (negated) ++i;
        size_t first = i;
        bool found = false;
        while (i < pattern.size() && (pattern[i] != ']' || i == first)) {
            char low = pattern[i], high = low;
            if (i + 2 < pattern.size() && pattern[i + 1] == '-' && pattern[i + 2] != ']') {
                high = pattern[i + 2];
                i += 3;
            } else {
                ++i;
            }
            if (low <= c && c <= high) found = true;
        }
        if (i < pattern.size()) {
            length = i + 1 - pos;
            return found != negated;
        }
        // 没有闭合的 [ 按普通字符处理
    }
    length = 1;
    return head == c;
}

/**
 * @brief 单个路径段的通配符匹配，* 不跨越 /
 * 回溯时只记录最近一个 *，时间复杂度为 O(|pattern| * |name|)
 */
static bool match_glob(const string &pattern, const string &name) {
    size_t p = 0, n = 0;
    size_t star = string::npos, mark = 0;
    while (n < name.size()) {
        size_t length;
        if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            mark = n;
        } else if (p < pattern.size() && match_one(pattern, p, name[n], length)) {
            p += length;
            ++n;
        } else if (star != string::npos) {
            p = star + 1;
            n = ++mark;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') ++p;
    return p == pattern.size();
}

/**
 * @brief 规则匹配 path 本身或者 path 的任意一个祖先目录
 * reach[i] 表示已经处理的规则段恰好可以匹配 path 的前 i 段，** 可以匹配零个或多个目录。
 * 时间复杂度为 O(规则段数 * 路径段数) 次单段匹配。
 */
static bool matches(const vector<string> &pattern, const vector<string> &path) {
    vector<char> reach(path.size() + 1, 0), next(path.size() + 1);
    reach[0] = 1;
    for (auto &segment : pattern) {
        fill(next.begin(), next.end(), 0);
        if (segment == "**") {
            char any = 0;
            for (size_t i = 0; i <= path.size(); ++i) {
                any |= reach[i];
                next[i] = any;
            }
        } else {
            for (size_t i = 0; i < path.size(); ++i)
                if (reach[i] && match_glob(segment, path[i])) next[i + 1] = 1;
        }
        reach.swap(next);
    }
    for (size_t i = 1; i <= path.size(); ++i)
        if (reach[i]) return true;
    return false;
}

bool ignore_rules::excluded(const string &path) const {
    auto normalized = normalize_entry_path(path);
    if (!normalized) return false;
    vector<string> segments;
    boost::split(segments, *normalized, boost::is_any_of("/"));
    bool result = false;
    for (auto &r : rules)
        if (matches(r.segments, segments)) result = !r.negated;
    return result;
}

string ignore_rules::to_string() const {
    ostringstream out;
    for (auto &r : rules) out << (r.negated ? "!" : "") << r.pattern << "\n";
    return out.str();
}

}  // namespace arena

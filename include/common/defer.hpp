#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)
#define defer auto DEFER_0(_defered_option) = arena::scoped_guard() + [&]

namespace arena {

/**
 * @brief 在作用域结束时执行回调
 * 配合 defer 宏使用，保证容器、临时目录等资源即使在异常路径上也会被回收
 */
struct scoped_guard {
    std::function<void()> f;
    scoped_guard();
    scoped_guard(const std::function<void()> &f);
    scoped_guard(scoped_guard &&other);
    ~scoped_guard();

    scoped_guard operator+(const std::function<void()> &f) const;

    /**
     * @brief 放弃执行回调
     */
    void dismiss();
};

}  // namespace arena

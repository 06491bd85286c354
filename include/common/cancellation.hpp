#pragma once

#include <atomic>

namespace arena {

/**
 * @brief 取消标记
 * 由心跳线程或信号处理设置，运行中的任务在每个等待片段之间检查
 */
struct cancellation_token {
    void cancel() noexcept { flag = true; }

    bool cancelled() const noexcept { return flag; }

private:
    std::atomic<bool> flag{false};
};

}  // namespace arena

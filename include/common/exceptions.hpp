#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <boost/throw_exception.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace arena {

struct arena_exception : std::exception {
    arena_exception();
    explicit arena_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const arena_exception &ex);

    template <typename T>
    arena_exception operator<<(const T &t) const {
        return arena_exception(message + boost::lexical_cast<std::string>(t));
    }

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示调用方违反了接口约定
 * 比如把未通过校验的提交交给镜像构建器，这类错误不应该被重试
 */
struct internal_error : public arena_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示网络错误，通常由 CURL 产生
 * 容器引擎或者后端服务器不可达时抛出，worker 会退避后重试
 */
struct network_error : public arena_exception {
    network_error();
    explicit network_error(const std::string &message);
};

/**
 * @brief 表示任务队列的存储（Redis）操作失败
 */
struct queue_error : public arena_exception {
    queue_error();
    explicit queue_error(const std::string &message);
};

/**
 * @brief 表示容器引擎拒绝了请求，如镜像不存在、镜像仍在使用中
 */
struct engine_error : public arena_exception {
    engine_error(long status_code, const std::string &message);

    long status_code;
};

}  // namespace arena

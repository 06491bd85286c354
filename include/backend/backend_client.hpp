#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "config.hpp"

namespace arena {

/**
 * @brief 提交状态的更新
 * status 为 queued、building、completed、failed 之一
 */
struct submission_update {
    std::string status;
    std::optional<std::string> logs;
    std::optional<std::string> image_id;
    std::optional<std::string> image_tag;
};

void to_json(nlohmann::json &j, const submission_update &update);

/**
 * @brief 比赛状态的更新
 * status 为 queued、running、completed、failed 之一
 */
struct match_update {
    std::string status;
    std::optional<std::string> logs;
    std::optional<nlohmann::json> result;
};

void to_json(nlohmann::json &j, const match_update &update);

/**
 * @brief 外部后端的回调接口
 * worker 只通过这个接口告知后端构建和比赛的进展，不直接访问后端的数据库。
 */
struct backend_client {
    virtual ~backend_client();

    /**
     * @throw network_error 多次重试后仍然无法送达
     */
    virtual void update_submission(const std::string &submission_id, const submission_update &update) = 0;

    /**
     * @throw network_error 多次重试后仍然无法送达
     */
    virtual void update_match(const std::string &match_id, const match_update &update) = 0;
};

/**
 * @brief 通过 HTTP PATCH 回调后端
 * PATCH {url}/submissions/{id} 和 PATCH {url}/matches/{id}，请求体为 JSON。
 * 网络错误和 5xx 响应会按配置重试，4xx 响应不重试。
 */
struct http_backend : public backend_client {
    explicit http_backend(const backend_config &config);

    void update_submission(const std::string &submission_id, const submission_update &update) override;
    void update_match(const std::string &match_id, const match_update &update) override;

private:
    /**
     * @return HTTP 状态码
     * @throw network_error 请求没有得到响应
     */
    long patch(const std::string &endpoint, const nlohmann::json &body);

    void patch_with_retry(const std::string &endpoint, const nlohmann::json &body);

    backend_config config;
};

}  // namespace arena

#include "backend/backend_client.hpp"
#include <curl/curl.h>
#include <glog/logging.h>
#include <fmt/core.h>
#include <boost/algorithm/string/trim.hpp>
#include <thread>
#include "common/defer.hpp"
#include "common/exceptions.hpp"

namespace arena {
using namespace std;
using namespace nlohmann;

void to_json(json &j, const submission_update &update) {
    j = {{"status", update.status}};
    if (update.logs) j["logs"] = *update.logs;
    if (update.image_id) j["image_id"] = *update.image_id;
    if (update.image_tag) j["image_tag"] = *update.image_tag;
}

void to_json(json &j, const match_update &update) {
    j = {{"status", update.status}};
    if (update.logs) j["logs"] = *update.logs;
    if (update.result) j["result"] = *update.result;
}

backend_client::~backend_client() {}

static size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
    static_cast<string *>(userdata)->append(ptr, size * nmemb);
    return size * nmemb;
}

http_backend::http_backend(const backend_config &config) : config(config) {
    this->config.url = boost::trim_right_copy_if(config.url, [](char c) { return c == '/'; });
}

long http_backend::patch(const string &endpoint, const json &body) {
    CURL *curl = curl_easy_init();
    if (!curl) BOOST_THROW_EXCEPTION(network_error("Backend: unable to initialize curl"));
    struct curl_slist *headers = nullptr;
    defer {
        curl_slist_free_all(headers);
        curl_easy_cleanup(curl);
    };

    string url = config.url + endpoint;
    string payload = body.dump();
    string response;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "PATCH");
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.data());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, (curl_off_t)payload.size());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, config.timeout);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);

    CURLcode code = curl_easy_perform(curl);
    if (code != CURLE_OK)
        BOOST_THROW_EXCEPTION(network_error(fmt::format("Backend: PATCH {} failed: {}", url, curl_easy_strerror(code))));

    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    if (status >= 400)
        LOG(ERROR) << "Backend: HTTP error " << status << " for PATCH " << url << ": " << response;
    return status;
}

void http_backend::patch_with_retry(const string &endpoint, const json &body) {
    for (int attempt = 0;; ++attempt) {
        long status = 0;
        try {
            status = patch(endpoint, body);
        } catch (network_error &ex) {
            if (attempt >= config.retries) throw;
            LOG(WARNING) << "Backend: " << ex.what() << ", retrying (" << attempt + 1 << "/" << config.retries << ")";
        }
        if (status != 0 && status < 400) return;
        // 4xx 说明后端不接受这次更新，重试不会有不同的结果
        if (status >= 400 && status < 500)
            BOOST_THROW_EXCEPTION(network_error(fmt::format("Backend: PATCH {} rejected with {}", endpoint, status)));
        if (status >= 500 && attempt >= config.retries)
            BOOST_THROW_EXCEPTION(network_error(fmt::format("Backend: PATCH {} failed with {}", endpoint, status)));
        this_thread::sleep_for(chrono::milliseconds(config.retry_interval * (1u << min(attempt, 5))));
    }
}

void http_backend::update_submission(const string &submission_id, const submission_update &update) {
    LOG(INFO) << "Backend: submission " << submission_id << " -> " << update.status;
    patch_with_retry("/submissions/" + submission_id, update);
}

void http_backend::update_match(const string &match_id, const match_update &update) {
    LOG(INFO) << "Backend: match " << match_id << " -> " << update.status;
    patch_with_retry("/matches/" + match_id, update);
}

}  // namespace arena

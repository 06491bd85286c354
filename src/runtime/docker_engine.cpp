#include "runtime/docker_engine.hpp"
#include <curl/curl.h>
#include <glog/logging.h>
#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <boost/throw_exception.hpp>
#include <sstream>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"
#include "common/utils.hpp"

namespace arena {
using namespace std;
using namespace nlohmann;

container_runtime::~container_runtime() {}

frame_demuxer::frame_demuxer(size_t max_bytes) : max_bytes(max_bytes) {}

bool frame_demuxer::feed(const char *data, size_t size) {
    while (size > 0) {
        if (remaining == 0) {
            size_t take = min(size, 8 - header.size());
            header.append(data, take);
            data += take, size -= take;
            if (header.size() < 8) break;
            remaining = ((size_t)(unsigned char)header[4] << 24) |
                        ((size_t)(unsigned char)header[5] << 16) |
                        ((size_t)(unsigned char)header[6] << 8) |
                        (size_t)(unsigned char)header[7];
            header.clear();
            continue;
        }

        size_t take = min(size, remaining);
        size_t room = max_bytes - output.text.size();
        if (take > room) {
            output.text.append(data, room);
            output.truncated = true;
            return false;
        }
        output.text.append(data, take);
        data += take, size -= take, remaining -= take;
    }
    return true;
}

log_output frame_demuxer::result() const {
    return output;
}

static string escape(const string &value) {
    CURL *curl = curl_easy_init();
    if (!curl) BOOST_THROW_EXCEPTION(network_error("Docker: unable to initialize curl"));
    defer { curl_easy_cleanup(curl); };
    char *escaped = curl_easy_escape(curl, value.c_str(), (int)value.size());
    string result = escaped;
    curl_free(escaped);
    return result;
}

static string label_filters_query(const vector<string> &label_filters) {
    if (label_filters.empty()) return "";
    json filters = {{"label", label_filters}};
    return "filters=" + escape(filters.dump());
}

static size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
    auto &sink = *static_cast<function<bool(const char *, size_t)> *>(userdata);
    size_t length = size * nmemb;
    return sink(ptr, length) ? length : 0;
}

docker_engine::docker_engine(const docker_config &config)
    : config(config) {}

string docker_engine::url_of(const string &path) const {
    if (config.url.empty())
        return "http://localhost/" + config.api_version + path;
    else
        return config.url + "/" + config.api_version + path;
}

docker_engine::response docker_engine::request(const string &method, const string &path,
                                               const string &body, const string &content_type,
                                               long timeout_ms,
                                               const function<bool(const char *, size_t)> &on_data) {
    CURL *curl = curl_easy_init();
    if (!curl) BOOST_THROW_EXCEPTION(network_error("Docker: unable to initialize curl"));
    struct curl_slist *headers = nullptr;
    defer {
        curl_slist_free_all(headers);
        curl_easy_cleanup(curl);
    };

    response res;
    bool aborted = false;
    function<bool(const char *, size_t)> sink = [&](const char *data, size_t size) {
        if (!on_data) {
            res.body.append(data, size);
            return true;
        }
        if (!on_data(data, size)) aborted = true;
        return !aborted;
    };

    string url = url_of(path);
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    if (config.url.empty())
        curl_easy_setopt(curl, CURLOPT_UNIX_SOCKET_PATH, config.socket.c_str());
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &sink);
    if (method == "POST") {
        headers = curl_slist_append(headers, ("Content-Type: " + content_type).c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.data());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, (curl_off_t)body.size());
    }
    if (timeout_ms < 0) timeout_ms = config.request_timeout;
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms);

    CURLcode code = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &res.status);
    if (code == CURLE_OPERATION_TIMEDOUT) {
        res.timed_out = true;
    } else if (code == CURLE_WRITE_ERROR && aborted) {
        // 调用者主动中止了读取
    } else if (code != CURLE_OK) {
        BOOST_THROW_EXCEPTION(network_error(
            fmt::format("Docker: {} {} failed: {}", method, path, curl_easy_strerror(code))));
    }
    return res;
}

void docker_engine::expect(const response &res, initializer_list<long> accepted, const string &action) {
    for (long status : accepted)
        if (res.status == status) return;
    if (res.timed_out)
        BOOST_THROW_EXCEPTION(network_error("Docker: timed out when trying to " + action));

    string message = res.body;
    json body = json::parse(res.body, nullptr, false);
    if (!body.is_discarded() && exists(body, "message"))
        message = body.at("message").get<string>();
    BOOST_THROW_EXCEPTION(engine_error(res.status, fmt::format("Docker: unable to {}: {} {}", action, res.status, message)));
}

void docker_engine::ping() {
    expect(request("GET", "/_ping"), {200}, "ping");
}

build_output docker_engine::build_image(const build_request &req) {
    json labels = req.labels;
    string path = fmt::format("/build?t={}&dockerfile={}&labels={}&networkmode={}&rm=1&forcerm=1",
                              escape(req.tag), escape(req.dockerfile), escape(labels.dump()), escape(req.network_mode));

    LOG(INFO) << "Docker: building image " << req.tag << " with " << req.context.size() << " bytes of context";
    response res = request("POST", path, req.context, "application/x-tar",
                           chrono::duration_cast<chrono::milliseconds>(req.timeout).count());

    build_output output;
    output.timed_out = res.timed_out;
    if (res.status != 200 && !res.timed_out) {
        output.error = res.body;
        json body = json::parse(res.body, nullptr, false);
        if (!body.is_discarded() && exists(body, "message"))
            output.error = body.at("message").get<string>();
        return output;
    }

    // 构建输出是逐行的 JSON 对象：stream 为构建日志，error 为构建失败原因，aux.ID 为镜像 id
    istringstream lines(res.body);
    string line;
    while (getline(lines, line)) {
        json message = json::parse(line, nullptr, false);
        if (message.is_discarded() || !message.is_object()) continue;
        if (exists(message, "stream")) output.log += message.at("stream").get<string>();
        if (exists(message, "error")) {
            output.error = message.at("error").get<string>();
            output.log += output.error + "\n";
        }
        if (exists(message, "aux", "ID")) output.image_id = message.at("aux").at("ID").get<string>();
    }

    if (output.timed_out || !output.error.empty()) return output;
    if (output.image_id.empty()) {
        auto image = inspect_image(req.tag);
        if (!image) {
            output.error = "image " + req.tag + " is missing after build";
            return output;
        }
        output.image_id = image->id;
    }
    output.success = true;
    return output;
}

static image_info parse_image(const json &j) {
    image_info image;
    image.id = get_value_def<string>(j, "", "Id");
    if (exists(j, "RepoTags")) image.tags = j.at("RepoTags").get<vector<string>>();
    if (exists(j, "Labels")) image.labels = j.at("Labels").get<map<string, string>>();
    if (exists(j, "Config", "Labels")) image.labels = j.at("Config").at("Labels").get<map<string, string>>();
    if (exists(j, "Created")) {
        auto &created = j.at("Created");
        if (created.is_number())
            image.created = chrono::system_clock::from_time_t(created.get<time_t>());
        else if (created.is_string())
            image.created = parse_iso8601(created.get<string>());
    }
    image.size = get_value_def<int64_t>(j, 0, "Size");
    return image;
}

optional<image_info> docker_engine::inspect_image(const string &ref) {
    response res = request("GET", "/images/" + escape(ref) + "/json");
    if (res.status == 404) return nullopt;
    expect(res, {200}, "inspect image " + ref);
    return parse_image(json::parse(res.body));
}

vector<image_info> docker_engine::list_images(const vector<string> &label_filters) {
    response res = request("GET", "/images/json?" + label_filters_query(label_filters));
    expect(res, {200}, "list images");
    vector<image_info> images;
    for (auto &item : json::parse(res.body))
        images.push_back(parse_image(item));
    return images;
}

void docker_engine::remove_image(const string &ref, bool force) {
    response res = request("DELETE", fmt::format("/images/{}?force={}", escape(ref), force ? 1 : 0));
    expect(res, {200}, "remove image " + ref);
    LOG(INFO) << "Docker: removed image " << ref;
}

string docker_engine::create_container(const container_spec &spec) {
    json ulimits = json::array();
    for (auto &limit : spec.ulimits)
        ulimits.push_back({{"Name", limit.name}, {"Soft", limit.soft}, {"Hard", limit.hard}});

    json body = {
        {"Image", spec.image},
        {"Cmd", spec.cmd},
        {"Env", spec.env},
        {"Labels", spec.labels},
        {"User", spec.user},
        {"NetworkDisabled", spec.network_mode == "none"},
        {"StopTimeout", spec.stop_timeout},
        {"HostConfig",
         {{"NetworkMode", spec.network_mode},
          {"ReadonlyRootfs", spec.read_only_rootfs},
          {"Tmpfs", spec.tmpfs},
          {"CapDrop", spec.cap_drop},
          {"SecurityOpt", spec.security_opt},
          {"Memory", spec.memory},
          {"MemorySwap", spec.memory_swap},
          {"NanoCpus", spec.nano_cpus},
          {"PidsLimit", spec.pids_limit},
          {"Ulimits", ulimits},
          {"LogConfig", {{"Type", spec.log_driver}, {"Config", spec.log_options}}}}}};

    string path = "/containers/create";
    if (!spec.name.empty()) path += "?name=" + escape(spec.name);
    response res = request("POST", path, body.dump());
    expect(res, {201}, "create container from " + spec.image);
    string id = json::parse(res.body).at("Id").get<string>();
    DLOG(INFO) << "Docker: created container " << id << " from " << spec.image;
    return id;
}

void docker_engine::start_container(const string &id) {
    expect(request("POST", "/containers/" + id + "/start"), {204, 304}, "start container " + id);
}

wait_result docker_engine::wait_container(const string &id, chrono::milliseconds timeout) {
    response res = request("POST", "/containers/" + id + "/wait?condition=not-running", "", "application/json", timeout.count());
    wait_result result;
    if (res.timed_out) return result;
    expect(res, {200}, "wait container " + id);

    json body = json::parse(res.body);
    result.exited = true;
    result.status_code = get_value_def<int64_t>(body, 0, "StatusCode");
    if (exists(body, "Error", "Message"))
        result.error = body.at("Error").at("Message").get<string>();
    return result;
}

log_output docker_engine::container_logs(const string &id, size_t max_bytes, int tail) {
    string path = "/containers/" + id + "/logs?stdout=1&stderr=1";
    path += "&tail=" + (tail < 0 ? string("all") : std::to_string(tail));

    frame_demuxer demuxer(max_bytes);
    response res = request("GET", path, "", "application/json", -1,
                           [&](const char *data, size_t size) { return demuxer.feed(data, size); });
    if (res.status != 200) {
        // 响应体没有保存下来，无法给出引擎的错误信息
        BOOST_THROW_EXCEPTION(engine_error(res.status, fmt::format("Docker: unable to read logs of {}: {}", id, res.status)));
    }
    return demuxer.result();
}

void docker_engine::kill_container(const string &id) {
    // 409 表示容器已经不在运行
    expect(request("POST", "/containers/" + id + "/kill?signal=SIGKILL"), {204, 404, 409}, "kill container " + id);
}

void docker_engine::stop_container(const string &id, chrono::seconds timeout) {
    response res = request("POST", fmt::format("/containers/{}/stop?t={}", id, timeout.count()), "", "application/json",
                           config.request_timeout + timeout.count() * 1000);
    expect(res, {204, 304}, "stop container " + id);
}

void docker_engine::remove_container(const string &id, bool force) {
    response res = request("DELETE", fmt::format("/containers/{}?v=1&force={}", id, force ? 1 : 0));
    expect(res, {204, 404}, "remove container " + id);
}

optional<container_state> docker_engine::inspect_container(const string &id) {
    response res = request("GET", "/containers/" + id + "/json");
    if (res.status == 404) return nullopt;
    expect(res, {200}, "inspect container " + id);

    json state = json::parse(res.body).at("State");
    container_state result;
    result.status = get_value_def<string>(state, "", "Status");
    result.running = get_value_def<bool>(state, false, "Running");
    result.oom_killed = get_value_def<bool>(state, false, "OOMKilled");
    result.exit_code = get_value_def<int>(state, 0, "ExitCode");
    result.error = get_value_def<string>(state, "", "Error");
    result.started_at = parse_iso8601(get_value_def<string>(state, "", "StartedAt"));
    result.finished_at = parse_iso8601(get_value_def<string>(state, "", "FinishedAt"));
    return result;
}

vector<container_info> docker_engine::list_containers(const vector<string> &label_filters, bool all) {
    string query = "/containers/json?all=" + string(all ? "1" : "0");
    if (!label_filters.empty()) query += "&" + label_filters_query(label_filters);
    response res = request("GET", query);
    expect(res, {200}, "list containers");

    vector<container_info> containers;
    for (auto &item : json::parse(res.body)) {
        container_info info;
        info.id = item.at("Id").get<string>();
        if (exists(item, "Names") && !item.at("Names").empty()) {
            info.name = item.at("Names").at(0).get<string>();
            if (!info.name.empty() && info.name.front() == '/') info.name.erase(0, 1);
        }
        info.image = get_value_def<string>(item, "", "Image");
        info.state = get_value_def<string>(item, "", "State");
        info.status = get_value_def<string>(item, "", "Status");
        if (exists(item, "Labels")) info.labels = item.at("Labels").get<map<string, string>>();
        info.created = chrono::system_clock::from_time_t(get_value_def<time_t>(item, 0, "Created"));
        containers.push_back(move(info));
    }
    return containers;
}

container_stats docker_engine::stats(const string &id) {
    response res = request("GET", "/containers/" + id + "/stats?stream=false");
    expect(res, {200}, "read stats of container " + id);

    json body = json::parse(res.body);
    container_stats result;
    result.memory_usage = get_value_def<int64_t>(body, 0, "memory_stats", "usage");
    result.memory_limit = get_value_def<int64_t>(body, 0, "memory_stats", "limit");
    result.pids = get_value_def<int64_t>(body, 0, "pids_stats", "current");

    double cpu_delta = get_value_def<double>(body, 0, "cpu_stats", "cpu_usage", "total_usage") -
                       get_value_def<double>(body, 0, "precpu_stats", "cpu_usage", "total_usage");
    double system_delta = get_value_def<double>(body, 0, "cpu_stats", "system_cpu_usage") -
                          get_value_def<double>(body, 0, "precpu_stats", "system_cpu_usage");
    double online_cpus = get_value_def<double>(body, 0, "cpu_stats", "online_cpus");
    if (online_cpus <= 0 && exists(body, "cpu_stats", "cpu_usage", "percpu_usage"))
        online_cpus = body.at("cpu_stats").at("cpu_usage").at("percpu_usage").size();
    if (online_cpus <= 0) online_cpus = 1;
    if (cpu_delta > 0 && system_delta > 0)
        result.cpu_percent = cpu_delta / system_delta * online_cpus * 100.0;
    return result;
}

}  // namespace arena

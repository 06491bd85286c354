#include "config.hpp"
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <fstream>
#include "common/json_utils.hpp"
#include "common/utils.hpp"

namespace arena {
using namespace std;
using namespace nlohmann;

static chrono::seconds seconds_of(const json &j, const char *key, chrono::seconds def) {
    return chrono::seconds(get_value_def<int64_t>(j, def.count(), key));
}

void from_json(const json &j, redis_config &config) {
    assign_optional(j, config.host, "host");
    assign_optional(j, config.port, "port");
    assign_optional(j, config.password, "password");
    assign_optional(j, config.retry_interval, "retry_interval");
    assign_optional(j, config.key_prefix, "key_prefix");
}

void from_json(const json &j, docker_config &config) {
    assign_optional(j, config.socket, "socket");
    assign_optional(j, config.url, "url");
    assign_optional(j, config.api_version, "api_version");
    assign_optional(j, config.request_timeout, "request_timeout");
}

void from_json(const json &j, backend_config &config) {
    assign_optional(j, config.url, "url");
    assign_optional(j, config.timeout, "timeout");
    assign_optional(j, config.retries, "retries");
    assign_optional(j, config.retry_interval, "retry_interval");
}

void from_json(const json &j, archive_config &config) {
    assign_optional(j, config.max_archive_bytes, "max_archive_bytes");
    assign_optional(j, config.max_entries, "max_entries");
    assign_optional(j, config.max_extracted_bytes, "max_extracted_bytes");
    assign_optional(j, config.entrypoint_extensions, "entrypoint_extensions");
    assign_optional(j, config.manifest_name, "manifest_name");
    if (exists(j, "store_dir")) config.store_dir = get_value<string>(j, "store_dir");
}

void from_json(const json &j, build_config &config) {
    assign_optional(j, config.base_image, "base_image");
    assign_optional(j, config.repo_prefix, "repo_prefix");
    if (exists(j, "scratch_dir")) config.scratch_dir = get_value<string>(j, "scratch_dir");
    assign_optional(j, config.max_context_bytes, "max_context_bytes");
    config.timeout = seconds_of(j, "timeout", config.timeout);
    assign_optional(j, config.network_mode, "network_mode");
    assign_optional(j, config.interpreter, "interpreter");
    assign_optional(j, config.install_command, "install_command");
    assign_optional(j, config.run_user, "run_user");
    assign_optional(j, config.default_ignore, "default_ignore");
    assign_optional(j, config.keep_scratch, "keep_scratch");
}

void from_json(const json &j, queue_config &config) {
    assign_optional(j, config.type, "type");
    assign_optional(j, config.max_attempts, "max_attempts");
    config.lease = seconds_of(j, "lease", config.lease);
    config.claim_wait = seconds_of(j, "claim_wait", config.claim_wait);
    config.max_backoff = seconds_of(j, "max_backoff", config.max_backoff);
    config.record_ttl = seconds_of(j, "record_ttl", config.record_ttl);
    if (config.type != "redis" && config.type != "memory")
        throw invalid_argument("Unrecognized queue type " + config.type);
    if (config.max_attempts < 1)
        throw invalid_argument("queue.max_attempts must be at least 1");
    if (config.lease.count() < 3)
        throw invalid_argument("queue.lease must be at least 3 seconds");
    if (config.record_ttl.count() < 0)
        throw invalid_argument("queue.record_ttl must not be negative");
}

void from_json(const json &j, retention_config &config) {
    config.container_age = seconds_of(j, "container_age", config.container_age);
    config.image_age = seconds_of(j, "image_age", config.image_age);
    config.interval = seconds_of(j, "interval", config.interval);
}

void from_json(const json &j, settings &config) {
    if (exists(j, "redis")) j.at("redis").get_to(config.redis);
    if (exists(j, "docker")) j.at("docker").get_to(config.docker);
    if (exists(j, "backend")) j.at("backend").get_to(config.backend);
    if (exists(j, "archive")) j.at("archive").get_to(config.archive);
    if (exists(j, "build")) j.at("build").get_to(config.build);
    if (exists(j, "queue")) j.at("queue").get_to(config.queue);
    if (exists(j, "retention")) j.at("retention").get_to(config.retention);
    if (exists(j, "policy") && j.at("policy").is_object()) j.at("policy").get_to(config.policy);
    assign_optional(j, config.build_workers, "workers", "build");
    assign_optional(j, config.match_workers, "workers", "match");
    assign_optional(j, config.debug, "debug");
}

static void apply_environment(settings &config) {
    config.redis.host = get_env("REDIS_HOST", config.redis.host);
    string port = get_env("REDIS_PORT", "");
    if (!port.empty()) config.redis.port = boost::lexical_cast<int>(port);
    config.backend.url = get_env("BACKEND_URL", config.backend.url);

    // DOCKER_HOST 与 docker 命令行的约定一致：unix:///path 或 tcp://host:port
    string docker_host = get_env("DOCKER_HOST", "");
    if (docker_host.rfind("unix://", 0) == 0) {
        config.docker.socket = docker_host.substr(7);
        config.docker.url.clear();
    } else if (docker_host.rfind("tcp://", 0) == 0) {
        config.docker.url = "http://" + docker_host.substr(6);
    }

    if (!get_env("DEBUG", "").empty()) config.debug = true;
    if (config.debug) config.build.keep_scratch = true;
}

settings load_settings(const filesystem::path &config_path) {
    if (!filesystem::exists(config_path))
        throw runtime_error("Unable to find configuration file " + config_path.string());
    ifstream fin(config_path);
    json j;
    fin >> j;

    settings config = j.get<settings>();
    if (exists(j, "policy") && j.at("policy").is_string()) {
        filesystem::path policy_path = j.at("policy").get<string>();
        if (policy_path.is_relative()) policy_path = config_path.parent_path() / policy_path;
        config.policy = load_policy(policy_path);
    }
    config.policy.validate();
    apply_environment(config);
    return config;
}

settings default_settings() {
    settings config;
    config.policy.validate();
    apply_environment(config);
    return config;
}

}  // namespace arena

#include "queue/job.hpp"
#include <stdexcept>
#include "common/json_utils.hpp"
#include "common/stl_utils.hpp"

namespace arena {
using namespace std;
using namespace nlohmann;

const char *const BUILD_GROUP = "builds";
const char *const MATCH_GROUP = "matches";

void from_json(const json &j, build_job &job) {
    job.submission_id = get_value<string>(j, "submission_id");
    job.owner_id = get_value_def<string>(j, "", "owner_id");
    if (exists(j, "archive_path")) job.archive_path = get_value<string>(j, "archive_path");
    // 兼容旧版本的任务格式
    else if (exists(j, "zip_path")) job.archive_path = get_value<string>(j, "zip_path");
}

void to_json(json &j, const build_job &job) {
    j = {{"type", "build"}, {"submission_id", job.submission_id}, {"owner_id", job.owner_id}};
    if (job.archive_path) j["archive_path"] = *job.archive_path;
}

void from_json(const json &j, match_job &job) {
    job.match_id = get_value<string>(j, "match_id");
    if (exists(j, "config")) job.config = j.at("config");

    // 后端直接入队的比赛任务只有 config，参赛的镜像等信息在 config 中
    const json &source = !exists(j, "image_refs") && exists(j, "config", "image_refs") ? job.config : j;
    job.image_refs = get_value<vector<string>>(source, "image_refs");
    assign_optional(source, job.agent_ids, "agent_ids");
    if (exists(source, "policy_override")) job.policy_override = source.at("policy_override");
    job.time_budget = chrono::seconds(get_value_def<int64_t>(source, 0, "time_budget"));
    assign_optional(source, job.mode, "mode");

    if (job.image_refs.empty())
        throw invalid_argument("match " + job.match_id + " has no agents");
    if (!job.agent_ids.empty() && job.agent_ids.size() != job.image_refs.size())
        throw invalid_argument("match " + job.match_id + " has mismatched image_refs and agent_ids");
    if (job.time_budget.count() < 0)
        throw invalid_argument("match " + job.match_id + " has a negative time budget");
}

void to_json(json &j, const match_job &job) {
    j = {{"type", "match"},
         {"match_id", job.match_id},
         {"image_refs", job.image_refs},
         {"time_budget", job.time_budget.count()},
         {"mode", job.mode}};
    if (!job.agent_ids.empty()) j["agent_ids"] = job.agent_ids;
    if (!job.policy_override.is_null()) j["policy_override"] = job.policy_override;
    if (!job.config.is_null()) j["config"] = job.config;
}

job_payload parse_job(const json &j) {
    string type = get_value<string>(j, "type");
    if (type == "build")
        return j.get<build_job>();
    else if (type == "match")
        return j.get<match_job>();
    else
        throw invalid_argument("Unrecognized job type " + type);
}

json dump_job(const job_payload &payload) {
    return visit([](auto &job) { return json(job); }, payload);
}

string group_of(const job_payload &payload) {
    return visit(overloaded{
                     [](const build_job &) { return string(BUILD_GROUP); },
                     [](const match_job &) { return string(MATCH_GROUP); }},
                 payload);
}

const char *to_string(job_state state) {
    switch (state) {
        case job_state::ENQUEUED: return "enqueued";
        case job_state::CLAIMED: return "claimed";
        case job_state::SUCCEEDED: return "succeeded";
        case job_state::FAILED: return "failed";
        case job_state::CANCELLED: return "cancelled";
    }
    return "unknown";
}

job_state parse_job_state(const string &text) {
    if (text == "enqueued") return job_state::ENQUEUED;
    if (text == "claimed") return job_state::CLAIMED;
    if (text == "succeeded") return job_state::SUCCEEDED;
    if (text == "failed") return job_state::FAILED;
    if (text == "cancelled") return job_state::CANCELLED;
    throw invalid_argument("Unrecognized job state " + text);
}

}  // namespace arena

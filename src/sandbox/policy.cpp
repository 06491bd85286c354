#include "sandbox/policy.hpp"
#include <glog/logging.h>
#include <algorithm>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <fstream>
#include "common/json_utils.hpp"

namespace arena {
using namespace std;
using namespace nlohmann;

int64_t parse_byte_size(const json &value) {
    if (value.is_number_integer()) {
        int64_t bytes = value.get<int64_t>();
        if (bytes <= 0) throw invalid_argument("byte size must be positive");
        return bytes;
    }
    if (!value.is_string()) throw invalid_argument("byte size must be an integer or a string like 512m");

    string text = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(value.get<string>()));
    if (text.empty()) throw invalid_argument("empty byte size");
    if (text.back() == 'b') text.pop_back();

    int64_t unit = 1;
    switch (text.empty() ? '\0' : text.back()) {
        case 'k': unit = 1ll << 10; break;
        case 'm': unit = 1ll << 20; break;
        case 'g': unit = 1ll << 30; break;
        default: break;
    }
    if (unit != 1) text.pop_back();

    try {
        int64_t number = boost::lexical_cast<int64_t>(text);
        if (number <= 0) throw invalid_argument("byte size must be positive: " + value.get<string>());
        return number * unit;
    } catch (boost::bad_lexical_cast &) {
        throw invalid_argument("malformed byte size: " + value.get<string>());
    }
}

void from_json(const json &j, sandbox_policy &policy) {
    assign_optional(j, policy.version, "version");
    if (exists(j, "memory_limit")) policy.memory_limit = parse_byte_size(j.at("memory_limit"));
    assign_optional(j, policy.cpu_limit, "cpu_limit");
    assign_optional(j, policy.pids_limit, "pids_limit");
    assign_optional(j, policy.fd_limit, "fd_limit");
    if (exists(j, "log_byte_limit")) policy.log_byte_limit = parse_byte_size(j.at("log_byte_limit"));
    if (exists(j, "tmpfs_size")) policy.tmpfs_size = parse_byte_size(j.at("tmpfs_size"));
    assign_optional(j, policy.filesystem_mode, "filesystem_mode");
    assign_optional(j, policy.network_mode, "network_mode");
    assign_optional(j, policy.capabilities, "capabilities");
    assign_optional(j, policy.no_new_privileges, "no_new_privileges");
    assign_optional(j, policy.run_user, "run_user");
    if (exists(j, "stop_timeout")) policy.stop_timeout = chrono::seconds(j.at("stop_timeout").get<int64_t>());
    if (exists(j, "time_limit")) policy.default_time_budget = chrono::seconds(j.at("time_limit").get<int64_t>());
    assign_optional(j, policy.env, "env");
}

void to_json(json &j, const sandbox_policy &policy) {
    j = {{"version", policy.version},
         {"memory_limit", policy.memory_limit},
         {"cpu_limit", policy.cpu_limit},
         {"pids_limit", policy.pids_limit},
         {"fd_limit", policy.fd_limit},
         {"log_byte_limit", policy.log_byte_limit},
         {"tmpfs_size", policy.tmpfs_size},
         {"filesystem_mode", policy.filesystem_mode},
         {"network_mode", policy.network_mode},
         {"capabilities", policy.capabilities},
         {"no_new_privileges", policy.no_new_privileges},
         {"run_user", policy.run_user},
         {"stop_timeout", policy.stop_timeout.count()},
         {"time_limit", policy.default_time_budget.count()},
         {"env", policy.env}};
}

static bool is_root_user(const string &user) {
    string uid = boost::trim_copy(user.substr(0, user.find(':')));
    if (uid.empty() || uid == "root") return true;
    // "00"、"0000:0" 同样是 uid 0，数字很长时也不会溢出
    if (boost::all(uid, boost::is_digit())) return uid.find_first_not_of('0') == string::npos;
    return false;
}

void sandbox_policy::validate() const {
    if (filesystem_mode != "read-only")
        throw invalid_argument("sandbox policy: filesystem_mode must be read-only, got " + filesystem_mode);
    if (network_mode != "none")
        throw invalid_argument("sandbox policy: network_mode must be none, got " + network_mode);
    if (capabilities != "drop-all")
        throw invalid_argument("sandbox policy: capabilities must be drop-all, got " + capabilities);
    if (!no_new_privileges)
        throw invalid_argument("sandbox policy: no_new_privileges must be true");
    if (is_root_user(run_user))
        throw invalid_argument("sandbox policy: run_user must not be root");
    if (memory_limit <= 0 || pids_limit <= 0 || fd_limit <= 0 || log_byte_limit <= 0 || tmpfs_size <= 0)
        throw invalid_argument("sandbox policy: every resource ceiling must be positive");
    if (cpu_limit <= 0)
        throw invalid_argument("sandbox policy: cpu_limit must be positive");
    if (default_time_budget.count() <= 0)
        throw invalid_argument("sandbox policy: time_limit must be positive");
}

template <typename T>
static void tighten(T &value, const json &j, const char *key) {
    if (!exists(j, key)) return;
    T requested = j.at(key).get<T>();
    if (requested > 0 && requested < value) value = requested;
}

sandbox_policy sandbox_policy::tightened(const json &override_json) const {
    sandbox_policy effective = *this;
    if (override_json.is_null()) return effective;
    if (!override_json.is_object()) {
        LOG(WARNING) << "Sandbox: ignoring policy_override that is not an object: " << override_json.dump();
        return effective;
    }

    try {
        if (exists(override_json, "memory_limit")) {
            int64_t requested = parse_byte_size(override_json.at("memory_limit"));
            effective.memory_limit = min(effective.memory_limit, requested);
        }
        if (exists(override_json, "log_byte_limit")) {
            int64_t requested = parse_byte_size(override_json.at("log_byte_limit"));
            effective.log_byte_limit = min(effective.log_byte_limit, requested);
        }
        tighten(effective.cpu_limit, override_json, "cpu_limit");
        tighten(effective.pids_limit, override_json, "pids_limit");
        tighten(effective.fd_limit, override_json, "fd_limit");
    } catch (exception &ex) {
        LOG(WARNING) << "Sandbox: ignoring malformed policy_override " << override_json.dump() << ": " << ex.what();
        return *this;
    }

    for (auto &[key, value] : override_json.items()) {
        if (key != "memory_limit" && key != "log_byte_limit" && key != "cpu_limit" &&
            key != "pids_limit" && key != "fd_limit")
            LOG(WARNING) << "Sandbox: policy_override cannot change " << key << ", ignored";
    }
    return effective;
}

sandbox_policy load_policy(const filesystem::path &path) {
    if (!filesystem::exists(path))
        throw runtime_error("Unable to find sandbox policy file " + path.string());
    ifstream fin(path);
    json j;
    fin >> j;
    sandbox_policy policy = j.get<sandbox_policy>();
    policy.validate();
    return policy;
}

}  // namespace arena

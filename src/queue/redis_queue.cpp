#include "queue/redis_queue.hpp"
#include <glog/logging.h>
#include <thread>
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace arena {
using namespace std;
using namespace nlohmann;

static const char *const GROUPS[] = {BUILD_GROUP, MATCH_GROUP};

/**
 * @brief 所有脚本共用的函数
 * finish 让进入终止状态的任务记录在 ttl 毫秒后过期，ttl 为 0 时永久保留。
 * requeue_expired 将 KEYS[2] 中到期的租约对应的任务放回 KEYS[1] 的左端，
 * 已经用完尝试次数的任务进入终止的失败状态，持有者反复崩溃的任务不会无限重试。
 */
static const char *const SHARED_FUNCTIONS = R"lua(
local function finish(key, ttl)
    if tonumber(ttl) > 0 then redis.call('PEXPIRE', key, ttl) end
end

local function requeue_expired(queue, leases, now, job_prefix, max_attempts, ttl)
    local expired = redis.call('ZRANGEBYSCORE', leases, '-inf', now)
    local count = 0
    for _, id in ipairs(expired) do
        redis.call('ZREM', leases, id)
        local key = job_prefix .. id
        if redis.call('HGET', key, 'cancel') == '1' then
            redis.call('HSET', key, 'state', 'cancelled', 'token', '')
            finish(key, ttl)
        elseif tonumber(redis.call('HGET', key, 'attempts') or '0') >= tonumber(max_attempts) then
            redis.call('HSET', key, 'state', 'failed', 'token', '', 'detail', 'lease expired on the last attempt')
            finish(key, ttl)
        else
            redis.call('HSET', key, 'state', 'enqueued', 'token', '')
            redis.call('LPUSH', queue, id)
            count = count + 1
        end
    end
    return count
end
)lua";

static const char *const REQUEUE_SCRIPT = R"lua(
return requeue_expired(KEYS[1], KEYS[2], ARGV[1], ARGV[2], ARGV[3], ARGV[4])
)lua";

// KEYS: queue, leases, seq; ARGV: now, job_prefix, lease_ms, token, worker, group, enqueued_at, max_attempts, ttl_ms
static const char *const CLAIM_SCRIPT = R"lua(
requeue_expired(KEYS[1], KEYS[2], ARGV[1], ARGV[2], ARGV[8], ARGV[9])
local id = redis.call('LPOP', KEYS[1])
if not id then return nil end
if string.sub(id, 1, 1) == '{' then
    local payload = id
    id = 'legacy-' .. redis.call('INCR', KEYS[3])
    redis.call('HSET', ARGV[2] .. id, 'id', id, 'group', ARGV[6], 'state', 'enqueued', 'payload', payload,
               'attempts', 0, 'enqueued_at', ARGV[7], 'cancel', '0', 'detail', '')
end
local key = ARGV[2] .. id
if redis.call('EXISTS', key) == 0 then return nil end
local attempts = redis.call('HINCRBY', key, 'attempts', 1)
local expires = tonumber(ARGV[1]) + tonumber(ARGV[3])
redis.call('HSET', key, 'state', 'claimed', 'token', ARGV[4], 'worker', ARGV[5], 'expires_at', expires)
redis.call('ZADD', KEYS[2], expires, id)
return {id, redis.call('HGET', key, 'payload'), attempts, expires}
)lua";

// KEYS: job, queue; ARGV: id, group, payload, enqueued_at
static const char *const ENQUEUE_SCRIPT = R"lua(
redis.call('HSET', KEYS[1], 'id', ARGV[1], 'group', ARGV[2], 'state', 'enqueued', 'payload', ARGV[3],
           'attempts', 0, 'enqueued_at', ARGV[4], 'cancel', '0', 'detail', '')
redis.call('RPUSH', KEYS[2], ARGV[1])
return 1
)lua";

// KEYS: job, leases; ARGV: id, token, now, lease_ms
static const char *const RENEW_SCRIPT = R"lua(
if redis.call('HGET', KEYS[1], 'state') ~= 'claimed' or redis.call('HGET', KEYS[1], 'token') ~= ARGV[2] then
    return 0
end
local expires = tonumber(ARGV[3]) + tonumber(ARGV[4])
redis.call('HSET', KEYS[1], 'expires_at', expires)
redis.call('ZADD', KEYS[2], expires, ARGV[1])
return expires
)lua";

// KEYS: job, leases; ARGV: id, token, detail, ttl_ms
static const char *const COMPLETE_SCRIPT = R"lua(
if redis.call('HGET', KEYS[1], 'state') ~= 'claimed' or redis.call('HGET', KEYS[1], 'token') ~= ARGV[2] then
    return 0
end
redis.call('ZREM', KEYS[2], ARGV[1])
local state = 'succeeded'
if redis.call('HGET', KEYS[1], 'cancel') == '1' then state = 'cancelled' end
redis.call('HSET', KEYS[1], 'state', state, 'token', '', 'detail', ARGV[3])
finish(KEYS[1], ARGV[4])
return 1
)lua";

// KEYS: job, leases, queue; ARGV: id, token, retryable, max_attempts, detail, ttl_ms
static const char *const FAIL_SCRIPT = R"lua(
local state = redis.call('HGET', KEYS[1], 'state')
if not state then return nil end
if state ~= 'claimed' or redis.call('HGET', KEYS[1], 'token') ~= ARGV[2] then
    return state
end
redis.call('ZREM', KEYS[2], ARGV[1])
local attempts = tonumber(redis.call('HGET', KEYS[1], 'attempts'))
if redis.call('HGET', KEYS[1], 'cancel') == '1' then
    state = 'cancelled'
elseif ARGV[3] == '1' and attempts < tonumber(ARGV[4]) then
    state = 'enqueued'
    redis.call('RPUSH', KEYS[3], ARGV[1])
else
    state = 'failed'
end
redis.call('HSET', KEYS[1], 'state', state, 'token', '', 'detail', ARGV[5])
if state ~= 'enqueued' then finish(KEYS[1], ARGV[6]) end
return state
)lua";

// KEYS: job, queue; ARGV: id, ttl_ms
static const char *const CANCEL_SCRIPT = R"lua(
local state = redis.call('HGET', KEYS[1], 'state')
if state == 'enqueued' then
    redis.call('LREM', KEYS[2], 0, ARGV[1])
    redis.call('HSET', KEYS[1], 'state', 'cancelled', 'cancel', '1')
    finish(KEYS[1], ARGV[2])
    return 1
elseif state == 'claimed' then
    redis.call('HSET', KEYS[1], 'cancel', '1')
    return 1
end
return 0
)lua";

static int64_t to_millis(chrono::system_clock::time_point time) {
    return chrono::duration_cast<chrono::milliseconds>(time.time_since_epoch()).count();
}

static chrono::system_clock::time_point from_millis(int64_t millis) {
    return chrono::system_clock::time_point(chrono::milliseconds(millis));
}

static int64_t integer_of(const cpp_redis::reply &reply) {
    if (reply.is_integer()) return reply.as_integer();
    if (reply.is_string()) return stoll(reply.as_string());
    return 0;
}

redis_queue::redis_queue(const redis_config &redis, const queue_config &config)
    : prefix(redis.key_prefix), config(config) {
    conn.init(redis);
}

string redis_queue::record_ttl() const {
    return std::to_string(chrono::duration_cast<chrono::milliseconds>(config.record_ttl).count());
}

string redis_queue::queue_key(const string &group) const {
    return prefix + ":queue:" + group;
}

string redis_queue::leases_key(const string &group) const {
    return prefix + ":leases:" + group;
}

string redis_queue::job_prefix() const {
    return prefix + ":job:";
}

string redis_queue::job_key(const string &id) const {
    return job_prefix() + id;
}

cpp_redis::reply redis_queue::eval(const string &script, const vector<string> &keys, const vector<string> &args) {
    vector<string> command = {"EVAL", string(SHARED_FUNCTIONS) + script, std::to_string(keys.size())};
    command.insert(command.end(), keys.begin(), keys.end());
    command.insert(command.end(), args.begin(), args.end());
    auto replies = conn.execute([&](cpp_redis::client &redis, vector<future<cpp_redis::reply>> &futures) {
        futures.push_back(redis.send(command));
    });
    return replies.at(0);
}

string redis_queue::enqueue(const job_payload &payload) {
    string id = random_uuid();
    string group = group_of(payload);
    eval(ENQUEUE_SCRIPT, {job_key(id), queue_key(group)}, {id, group, dump_job(payload).dump(), iso8601_now()});
    LOG(INFO) << "Queue: enqueued job " << id << " into " << group;
    return id;
}

optional<lease> redis_queue::claim(const string &group, const string &worker_id,
                                   chrono::seconds lease_duration, chrono::milliseconds wait) {
    auto until = chrono::steady_clock::now() + wait;
    while (true) {
        string token = random_uuid();
        int64_t lease_ms = chrono::duration_cast<chrono::milliseconds>(lease_duration).count();
        cpp_redis::reply reply = eval(CLAIM_SCRIPT, {queue_key(group), leases_key(group), prefix + ":seq"},
                                      {std::to_string(to_millis(chrono::system_clock::now())), job_prefix(),
                                       std::to_string(lease_ms), token, worker_id, group, iso8601_now(),
                                       std::to_string(config.max_attempts), record_ttl()});
        if (reply.is_array()) {
            auto &fields = reply.as_array();
            lease l;
            l.job_id = fields.at(0).as_string();
            l.group = group;
            l.worker_id = worker_id;
            l.token = token;
            l.attempts = (int)integer_of(fields.at(2));
            l.expires_at = from_millis(integer_of(fields.at(3)));
            try {
                l.payload = parse_job(json::parse(fields.at(1).as_string()));
            } catch (std::exception &ex) {
                // 无法解析的任务不可能成功，直接进入终止的失败状态
                LOG(ERROR) << "Queue: job " << l.job_id << " has a malformed payload, " << ex.what();
                eval(FAIL_SCRIPT, {job_key(l.job_id), leases_key(group), queue_key(group)},
                     {l.job_id, token, "0", std::to_string(config.max_attempts), string("malformed payload: ") + ex.what(),
                      record_ttl()});
                continue;
            }
            return l;
        }

        auto now = chrono::steady_clock::now();
        if (now >= until) return nullopt;
        this_thread::sleep_for(min<chrono::steady_clock::duration>(chrono::milliseconds(200), until - now));
    }
}

bool redis_queue::renew(lease &l, chrono::seconds lease_duration) {
    int64_t lease_ms = chrono::duration_cast<chrono::milliseconds>(lease_duration).count();
    cpp_redis::reply reply = eval(RENEW_SCRIPT, {job_key(l.job_id), leases_key(l.group)},
                                  {l.job_id, l.token, std::to_string(to_millis(chrono::system_clock::now())), std::to_string(lease_ms)});
    int64_t expires = integer_of(reply);
    if (expires == 0) return false;
    l.expires_at = from_millis(expires);
    return true;
}

bool redis_queue::complete(const lease &l, const string &detail) {
    return integer_of(eval(COMPLETE_SCRIPT, {job_key(l.job_id), leases_key(l.group)},
                           {l.job_id, l.token, detail, record_ttl()})) == 1;
}

job_state redis_queue::fail(const lease &l, bool retryable, const string &detail) {
    cpp_redis::reply reply = eval(FAIL_SCRIPT, {job_key(l.job_id), leases_key(l.group), queue_key(l.group)},
                                  {l.job_id, l.token, retryable ? "1" : "0", std::to_string(config.max_attempts), detail,
                                   record_ttl()});
    if (!reply.is_string()) throw out_of_range("Unknown job " + l.job_id);
    return parse_job_state(reply.as_string());
}

size_t redis_queue::requeue_expired(chrono::system_clock::time_point now) {
    size_t count = 0;
    for (const char *group : GROUPS)
        count += (size_t)integer_of(eval(REQUEUE_SCRIPT, {queue_key(group), leases_key(group)},
                                         {std::to_string(to_millis(now)), job_prefix(), std::to_string(config.max_attempts),
                                          record_ttl()}));
    return count;
}

bool redis_queue::cancel(const string &job_id) {
    auto record = find(job_id);
    if (!record) return false;
    return integer_of(eval(CANCEL_SCRIPT, {job_key(job_id), queue_key(record->group)}, {job_id, record_ttl()})) == 1;
}

bool redis_queue::is_cancelled(const string &job_id) {
    auto replies = conn.execute([&](cpp_redis::client &redis, vector<future<cpp_redis::reply>> &futures) {
        futures.push_back(redis.hget(job_key(job_id), "cancel"));
    });
    return replies.at(0).is_string() && replies.at(0).as_string() == "1";
}

optional<job_record> redis_queue::find(const string &job_id) {
    auto replies = conn.execute([&](cpp_redis::client &redis, vector<future<cpp_redis::reply>> &futures) {
        futures.push_back(redis.hgetall(job_key(job_id)));
    });
    auto &fields = replies.at(0);
    if (!fields.is_array() || fields.as_array().empty()) return nullopt;

    map<string, string> hash;
    auto &items = fields.as_array();
    for (size_t i = 0; i + 1 < items.size(); i += 2)
        hash[items[i].as_string()] = items[i + 1].as_string();

    job_record record;
    record.id = job_id;
    record.group = hash["group"];
    record.state = parse_job_state(hash["state"]);
    record.payload = parse_job(json::parse(hash["payload"]));
    record.attempts = hash["attempts"].empty() ? 0 : stoi(hash["attempts"]);
    record.enqueued_at = hash["enqueued_at"];
    record.detail = hash["detail"];
    record.cancel_requested = hash["cancel"] == "1";
    return record;
}

size_t redis_queue::length(const string &group) {
    auto replies = conn.execute([&](cpp_redis::client &redis, vector<future<cpp_redis::reply>> &futures) {
        futures.push_back(redis.llen(queue_key(group)));
    });
    return (size_t)integer_of(replies.at(0));
}

vector<lease> redis_queue::live_leases() {
    vector<lease> leases;
    string now = std::to_string(to_millis(chrono::system_clock::now()));
    for (const char *group : GROUPS) {
        auto replies = conn.execute([&](cpp_redis::client &redis, vector<future<cpp_redis::reply>> &futures) {
            futures.push_back(redis.send({"ZRANGEBYSCORE", leases_key(group), "(" + now, "+inf"}));
        });
        if (!replies.at(0).is_array()) continue;
        for (auto &id : replies.at(0).as_array()) {
            auto fields = conn.execute([&](cpp_redis::client &redis, vector<future<cpp_redis::reply>> &futures) {
                futures.push_back(redis.hmget(job_key(id.as_string()), {"payload", "token", "worker", "attempts", "expires_at"}));
            });
            auto &values = fields.at(0).as_array();
            if (values.size() < 5 || !values[0].is_string()) continue;

            lease l;
            l.job_id = id.as_string();
            l.group = group;
            try {
                l.payload = parse_job(json::parse(values[0].as_string()));
            } catch (std::exception &ex) {
                LOG(WARNING) << "Queue: skipping lease of malformed job " << l.job_id << ", " << ex.what();
                continue;
            }
            l.token = values[1].is_string() ? values[1].as_string() : "";
            l.worker_id = values[2].is_string() ? values[2].as_string() : "";
            l.attempts = (int)integer_of(values[3]);
            l.expires_at = from_millis(integer_of(values[4]));
            leases.push_back(move(l));
        }
    }
    return leases;
}

}  // namespace arena

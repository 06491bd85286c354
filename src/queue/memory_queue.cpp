#include "queue/memory_queue.hpp"
#include <glog/logging.h>
#include <algorithm>
#include <stdexcept>
#include "common/utils.hpp"

namespace arena {
using namespace std;

memory_queue::memory_queue(const queue_config &config) : config(config) {}

void memory_queue::finish(entry &e, job_state state, chrono::system_clock::time_point now) {
    e.holder.reset();
    e.record.state = state;
    e.finished_at = now;
}

void memory_queue::drop_finished_nolock(chrono::system_clock::time_point now) {
    if (config.record_ttl.count() <= 0) return;
    for (auto it = jobs.begin(); it != jobs.end();) {
        const job_record &record = it->second.record;
        bool finished = record.state == job_state::SUCCEEDED || record.state == job_state::FAILED ||
                        record.state == job_state::CANCELLED;
        if (finished && it->second.finished_at + config.record_ttl <= now)
            it = jobs.erase(it);
        else
            ++it;
    }
}

string memory_queue::enqueue(const job_payload &payload) {
    entry e;
    e.record.id = random_uuid();
    e.record.group = group_of(payload);
    e.record.payload = payload;
    e.record.enqueued_at = iso8601_now();

    string id = e.record.id;
    {
        unique_lock<mutex> mlock(mut);
        drop_finished_nolock(chrono::system_clock::now());
        queues[e.record.group].push_back(id);
        jobs.emplace(id, move(e));
    }
    cv.notify_all();
    return id;
}

size_t memory_queue::requeue_expired_nolock(chrono::system_clock::time_point now) {
    size_t count = 0;
    for (auto &[id, e] : jobs) {
        if (e.record.state != job_state::CLAIMED || !e.holder || e.holder->expires_at > now) continue;
        LOG(WARNING) << "Queue: lease of job " << id << " held by " << e.holder->worker_id << " expired";
        if (e.record.cancel_requested) {
            finish(e, job_state::CANCELLED, now);
            continue;
        }
        if (e.record.attempts >= config.max_attempts) {
            finish(e, job_state::FAILED, now);
            e.record.detail = "lease expired on the last attempt";
            continue;
        }
        e.holder.reset();
        e.record.state = job_state::ENQUEUED;
        queues[e.record.group].push_front(id);
        ++count;
    }
    return count;
}

size_t memory_queue::requeue_expired(chrono::system_clock::time_point now) {
    size_t count;
    {
        unique_lock<mutex> mlock(mut);
        count = requeue_expired_nolock(now);
        drop_finished_nolock(now);
    }
    if (count) cv.notify_all();
    return count;
}

optional<lease> memory_queue::claim(const string &group, const string &worker_id,
                                    chrono::seconds lease_duration, chrono::milliseconds wait) {
    auto until = chrono::steady_clock::now() + wait;
    unique_lock<mutex> mlock(mut);
    while (true) {
        requeue_expired_nolock(chrono::system_clock::now());
        auto &q = queues[group];
        if (!q.empty()) {
            string id = q.front();
            q.pop_front();
            entry &e = jobs.at(id);
            e.record.state = job_state::CLAIMED;
            e.record.attempts++;

            lease l;
            l.job_id = id;
            l.group = group;
            l.worker_id = worker_id;
            l.token = random_uuid();
            l.attempts = e.record.attempts;
            l.payload = e.record.payload;
            l.expires_at = chrono::system_clock::now() + lease_duration;
            e.holder = l;
            return l;
        }
        if (cv.wait_until(mlock, until) == cv_status::timeout && queues[group].empty())
            return nullopt;
    }
}

memory_queue::entry *memory_queue::holder_of(const lease &l) {
    auto it = jobs.find(l.job_id);
    if (it == jobs.end()) return nullptr;
    entry &e = it->second;
    if (e.record.state != job_state::CLAIMED || !e.holder || e.holder->token != l.token) return nullptr;
    return &e;
}

bool memory_queue::renew(lease &l, chrono::seconds lease_duration) {
    unique_lock<mutex> mlock(mut);
    entry *e = holder_of(l);
    if (!e) return false;
    l.expires_at = chrono::system_clock::now() + lease_duration;
    e->holder->expires_at = l.expires_at;
    return true;
}

bool memory_queue::complete(const lease &l, const string &detail) {
    unique_lock<mutex> mlock(mut);
    entry *e = holder_of(l);
    if (!e) return false;
    finish(*e, e->record.cancel_requested ? job_state::CANCELLED : job_state::SUCCEEDED, chrono::system_clock::now());
    e->record.detail = detail;
    return true;
}

job_state memory_queue::fail(const lease &l, bool retryable, const string &detail) {
    job_state result;
    {
        unique_lock<mutex> mlock(mut);
        entry *e = holder_of(l);
        if (!e) {
            auto it = jobs.find(l.job_id);
            if (it == jobs.end()) throw out_of_range("Unknown job " + l.job_id);
            return it->second.record.state;
        }
        e->record.detail = detail;
        if (e->record.cancel_requested) {
            finish(*e, job_state::CANCELLED, chrono::system_clock::now());
        } else if (retryable && e->record.attempts < config.max_attempts) {
            e->holder.reset();
            e->record.state = job_state::ENQUEUED;
            queues[e->record.group].push_back(l.job_id);
        } else {
            finish(*e, job_state::FAILED, chrono::system_clock::now());
        }
        result = e->record.state;
    }
    if (result == job_state::ENQUEUED) cv.notify_all();
    return result;
}

bool memory_queue::cancel(const string &job_id) {
    unique_lock<mutex> mlock(mut);
    auto it = jobs.find(job_id);
    if (it == jobs.end()) return false;
    job_record &record = it->second.record;
    if (record.state == job_state::ENQUEUED) {
        auto &q = queues[record.group];
        q.erase(remove(q.begin(), q.end(), job_id), q.end());
        finish(it->second, job_state::CANCELLED, chrono::system_clock::now());
        record.cancel_requested = true;
        return true;
    }
    if (record.state == job_state::CLAIMED) {
        record.cancel_requested = true;
        return true;
    }
    return false;
}

bool memory_queue::is_cancelled(const string &job_id) {
    unique_lock<mutex> mlock(mut);
    auto it = jobs.find(job_id);
    return it != jobs.end() && it->second.record.cancel_requested;
}

optional<job_record> memory_queue::find(const string &job_id) {
    unique_lock<mutex> mlock(mut);
    auto it = jobs.find(job_id);
    if (it == jobs.end()) return nullopt;
    return it->second.record;
}

size_t memory_queue::length(const string &group) {
    unique_lock<mutex> mlock(mut);
    return queues[group].size();
}

vector<lease> memory_queue::live_leases() {
    unique_lock<mutex> mlock(mut);
    vector<lease> leases;
    auto now = chrono::system_clock::now();
    for (auto &[id, e] : jobs)
        if (e.record.state == job_state::CLAIMED && e.holder && e.holder->expires_at > now)
            leases.push_back(*e.holder);
    return leases;
}

}  // namespace arena

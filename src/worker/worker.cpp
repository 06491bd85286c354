#include "worker/worker.hpp"
#include <glog/logging.h>
#include <unistd.h>
#include <atomic>
#include <boost/exception/diagnostic_information.hpp>
#include <fmt/core.h>
#include <vector>
#include "common/defer.hpp"
#include "common/exceptions.hpp"

namespace arena {
using namespace std;

// 停止 worker 的标记
static atomic<bool> stop{false};

void stop_workers() {
    stop = true;
}

bool workers_stopping() {
    return stop;
}

static vector<unique_ptr<monitor>> monitors;

void register_monitor(unique_ptr<monitor> &&monitor) {
    monitors.push_back(move(monitor));
}

static void call_monitor(int worker_id, const function<void(monitor &)> &callback) {
    try {
        for (auto &monitor : monitors) callback(*monitor);
    } catch (std::exception &ex) {
        LOG(ERROR) << "Worker " << worker_id << " has crashed when reporting monitoring information, " << ex.what();
    }
}

void report_error(const string &message) {
    call_monitor(-1, [&](monitor &m) { m.report_error(message); });
}

worker::worker(int id, const settings &config, job_queue &queue)
    : id(id), config(config), queue(queue) {
    char name[256] = {0};
    if (gethostname(name, sizeof(name) - 1) != 0) name[0] = 0;
    hostname = name[0] ? name : "localhost";
}

worker::~worker() {}

string worker::worker_id() const {
    return fmt::format("{}-{}-{}-{}", hostname, getpid(), group(), id);
}

chrono::steady_clock::time_point worker::deadline_of(const lease &) const {
    return chrono::steady_clock::time_point::max();
}

void worker::notify(const string &what, const function<void()> &callback) {
    try {
        callback();
    } catch (network_error &ex) {
        LOG(ERROR) << "Worker " << id << ": unable to report " << what << " to the backend, " << ex.what();
        report_error(string("backend unreachable: ") + ex.what());
    }
}

void worker::backoff() {
    unsigned shift = min(consecutive_failures, 10u);
    ++consecutive_failures;
    auto wait = min<chrono::milliseconds>(config.queue.max_backoff, chrono::milliseconds(500) * (1u << shift));
    auto until = chrono::steady_clock::now() + wait;
    LOG(INFO) << "Worker " << id << ": backing off for " << wait.count() << "ms";
    while (!workers_stopping() && chrono::steady_clock::now() < until)
        this_thread::sleep_for(min<chrono::steady_clock::duration>(chrono::milliseconds(100), until - chrono::steady_clock::now()));
}

job_state worker::settle(job_context &context, const job_outcome &outcome) {
    if (outcome.succeeded) {
        if (!queue.complete(context.held, outcome.detail)) {
            LOG(WARNING) << "Worker " << id << ": lease of job " << context.held.job_id << " was lost before completion";
            context.lost = true;
            return job_state::CLAIMED;
        }
        return queue.state(context.held.job_id);
    }

    job_state state = queue.fail(context.held, outcome.retryable, outcome.detail);
    if (state == job_state::CLAIMED) context.lost = true;
    return state;
}

bool worker::run_once(chrono::milliseconds wait) {
    auto claimed = queue.claim(group(), worker_id(), config.queue.lease, wait);
    if (!claimed) return false;

    job_context context(*claimed, deadline_of(*claimed));
    call_monitor(id, [&](monitor &m) { m.start_job(id, context.held); });
    call_monitor(id, [&](monitor &m) { m.worker_state_changed(id, worker_state::WORKING, ""); });
    defer { call_monitor(id, [&](monitor &m) { m.worker_state_changed(id, worker_state::IDLE, ""); }); };

    job_outcome outcome;
    {
        heartbeat beat(queue, context, config.queue.lease);
        try {
            outcome = handle(context);
        } catch (network_error &ex) {
            LOG(WARNING) << "Worker " << id << ": infrastructure unavailable while processing job "
                         << context.held.job_id << ", " << ex.what();
            outcome.retryable = outcome.infrastructure = true;
            outcome.detail = ex.what();
        } catch (queue_error &ex) {
            LOG(WARNING) << "Worker " << id << ": queue unavailable while processing job "
                         << context.held.job_id << ", " << ex.what();
            outcome.retryable = outcome.infrastructure = true;
            outcome.detail = ex.what();
        } catch (std::exception &ex) {
            LOG(ERROR) << "Worker " << id << ": job " << context.held.job_id << " crashed, " << ex.what() << endl
                       << boost::diagnostic_information(ex);
            outcome.detail = string("internal error: ") + ex.what();
        }
    }

    if (context.lost) {
        LOG(WARNING) << "Worker " << id << ": discarding the result of job " << context.held.job_id << ", its lease was lost";
        return true;
    }

    job_state state = settle(context, outcome);
    call_monitor(id, [&](monitor &m) { m.end_job(id, context.held, state); });
    if (context.lost) return true;

    report(context, state, outcome);
    if (outcome.infrastructure)
        backoff();
    else
        consecutive_failures = 0;
    return true;
}

void worker::loop() {
    call_monitor(id, [&](monitor &m) { m.worker_state_changed(id, worker_state::START, ""); });

    auto wait = chrono::duration_cast<chrono::milliseconds>(config.queue.claim_wait);
    while (!workers_stopping()) {
        try {
            run_once(wait);
        } catch (queue_error &ex) {
            LOG(ERROR) << "Worker " << id << ": queue unavailable, " << ex.what();
            report_error(string("queue unavailable: ") + ex.what());
            backoff();
        } catch (std::exception &ex) {
            LOG(ERROR) << "Worker " << id << " has crashed, " << ex.what() << endl
                       << boost::diagnostic_information(ex);
            call_monitor(id, [&](monitor &m) { m.worker_state_changed(id, worker_state::CRASHED, ex.what()); });
            backoff();
        }
    }

    call_monitor(id, [&](monitor &m) { m.worker_state_changed(id, worker_state::STOPPED, ""); });
}

thread worker::start() {
    return thread([this] { loop(); });
}

}  // namespace arena

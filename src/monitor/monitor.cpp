#include "monitor/monitor.hpp"
#include <glog/logging.h>

namespace arena {
using namespace std;

const char *to_string(worker_state state) {
    switch (state) {
        case worker_state::START: return "start";
        case worker_state::WORKING: return "working";
        case worker_state::IDLE: return "idle";
        case worker_state::STOPPED: return "stopped";
        case worker_state::CRASHED: return "crashed";
    }
    return "unknown";
}

monitor::~monitor() {}

void monitor::start_job(int, const lease &) {}

void monitor::end_job(int, const lease &, job_state) {}

void monitor::worker_state_changed(int, worker_state, const string &) {}

void monitor::report_error(const string &) {}

void log_monitor::start_job(int worker_id, const lease &held) {
    LOG(INFO) << "Worker " << worker_id << ": claimed job " << held.job_id << " from " << held.group
              << " (attempt " << held.attempts << ")";
}

void log_monitor::end_job(int worker_id, const lease &held, job_state state) {
    LOG(INFO) << "Worker " << worker_id << ": job " << held.job_id << " is now " << to_string(state);
}

void log_monitor::worker_state_changed(int worker_id, worker_state state, const string &information) {
    if (state == worker_state::CRASHED)
        LOG(ERROR) << "Worker " << worker_id << " has crashed, " << information;
    else
        DLOG(INFO) << "Worker " << worker_id << " is " << to_string(state);
}

void log_monitor::report_error(const string &message) {
    LOG(ERROR) << "Error reported: " << message;
}

}  // namespace arena

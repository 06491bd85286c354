#include "worker/job_context.hpp"
#include <glog/logging.h>
#include "common/exceptions.hpp"

namespace arena {
using namespace std;

job_context::job_context(const lease &held, chrono::steady_clock::time_point deadline)
    : held(held), deadline(deadline) {}

int job_context::attempt() const {
    return held.attempts;
}

heartbeat::heartbeat(job_queue &queue, job_context &context, chrono::seconds lease_duration)
    : queue(queue), context(context), lease_duration(lease_duration),
      period(max<chrono::milliseconds>(chrono::milliseconds(200), chrono::duration_cast<chrono::milliseconds>(lease_duration) / 3)) {
    thd = thread([this] { loop(); });
}

heartbeat::~heartbeat() {
    stop();
}

void heartbeat::stop() {
    {
        unique_lock<mutex> mlock(mut);
        stopping = true;
    }
    cv.notify_all();
    if (thd.joinable()) thd.join();
}

bool heartbeat::beat() {
    try {
        if (!queue.renew(context.held, lease_duration)) {
            LOG(WARNING) << "Heartbeat: lost the lease of job " << context.held.job_id;
            context.lost = true;
            context.token.cancel();
            return false;
        }
        if (!context.token.cancelled() && queue.is_cancelled(context.held.job_id)) {
            LOG(INFO) << "Heartbeat: job " << context.held.job_id << " has been cancelled";
            context.token.cancel();
        }
    } catch (queue_error &ex) {
        // 续约失败不是致命的，租约到期前还有两次机会
        LOG(WARNING) << "Heartbeat: unable to renew the lease of job " << context.held.job_id << ", " << ex.what();
    }
    return true;
}

void heartbeat::loop() {
    unique_lock<mutex> mlock(mut);
    while (!stopping) {
        if (cv.wait_for(mlock, period, [this] { return stopping; })) break;
        mlock.unlock();
        bool keep_going = beat();
        mlock.lock();
        if (!keep_going) break;
    }
}

}  // namespace arena

#include "queue/job_queue.hpp"
#include <glog/logging.h>
#include <stdexcept>
#include "queue/memory_queue.hpp"
#include "queue/redis_queue.hpp"

namespace arena {
using namespace std;

job_queue::~job_queue() {}

job_state job_queue::state(const string &job_id) {
    auto record = find(job_id);
    if (!record) throw out_of_range("Unknown job " + job_id);
    return record->state;
}

unique_ptr<job_queue> make_job_queue(const settings &config) {
    if (config.queue.type == "redis") {
        LOG(INFO) << "Queue: using redis at " << config.redis.host << ":" << config.redis.port;
        return make_unique<redis_queue>(config.redis, config.queue);
    } else if (config.queue.type == "memory") {
        LOG(INFO) << "Queue: using the in-process queue, jobs will not survive a restart";
        return make_unique<memory_queue>(config.queue);
    }
    throw invalid_argument("Unrecognized queue type " + config.queue.type);
}

}  // namespace arena

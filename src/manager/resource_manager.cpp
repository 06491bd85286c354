#include "manager/resource_manager.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string/predicate.hpp>
#include "common/exceptions.hpp"
#include "common/stl_utils.hpp"

namespace arena {
using namespace std;

static const char *const IMAGE_KIND = "org.gameai.kind=agent";
static const char *const CONTAINER_KIND = "org.gameai.kind=agent-container";
static const char *const REMOVE_LABEL = "org.gameai.remove";

void to_json(nlohmann::json &j, const gc_report &report) {
    j = {{"removed_containers", report.removed_containers},
         {"removed_images", report.removed_images},
         {"skipped", report.skipped},
         {"errors", report.errors}};
}

static string label_of(const map<string, string> &labels, const string &key) {
    auto it = labels.find(key);
    return it == labels.end() ? "" : it->second;
}

static bool marked_for_removal(const map<string, string> &labels) {
    return label_of(labels, REMOVE_LABEL) == "true";
}

resource_manager::resource_manager(container_runtime &runtime, job_queue &queue)
    : runtime(runtime), queue(queue) {}

resource_manager::lease_references resource_manager::live_references() {
    lease_references refs;
    for (auto &l : queue.live_leases()) {
        visit(overloaded{
                  [&](const build_job &job) {
                      refs.submission_ids.insert(job.submission_id);
                  },
                  [&](const match_job &job) {
                      refs.match_ids.insert(job.match_id);
                      refs.image_refs.insert(job.image_refs.begin(), job.image_refs.end());
                  }},
              l.payload);
    }
    return refs;
}

bool resource_manager::image_matches(const image_info &image, const set<string> &refs) {
    for (const string &ref : refs) {
        if (ref.empty()) continue;
        if (ref == image.id) return true;
        // 短 id 或者省略了 sha256: 前缀的 id
        string id = boost::starts_with(image.id, "sha256:") ? image.id.substr(7) : image.id;
        string short_ref = boost::starts_with(ref, "sha256:") ? ref.substr(7) : ref;
        if (short_ref.size() >= 12 && boost::starts_with(id, short_ref)) return true;
        for (const string &tag : image.tags)
            if (tag == ref || tag == ref + ":latest") return true;
    }
    return false;
}

bool resource_manager::image_leased(const image_info &image, const lease_references &refs) {
    if (image_matches(image, refs.image_refs)) return true;
    return refs.submission_ids.count(label_of(image.labels, "org.gameai.submission_id")) > 0;
}

vector<image_info> resource_manager::list_agent_images(const optional<string> &owner_id) {
    vector<string> filters = {IMAGE_KIND};
    if (owner_id) filters.push_back("org.gameai.owner_id=" + *owner_id);
    return runtime.list_images(filters);
}

vector<container_info> resource_manager::list_agent_containers(const container_filter &filter) {
    vector<string> filters = {CONTAINER_KIND};
    if (filter.match_id) filters.push_back("org.gameai.match_id=" + *filter.match_id);
    if (filter.owner_id) filters.push_back("org.gameai.owner_id=" + *filter.owner_id);
    if (filter.agent_id) filters.push_back("org.gameai.agent_id=" + *filter.agent_id);
    return runtime.list_containers(filters, filter.include_exited);
}

log_output resource_manager::container_logs(const string &id, int tail, size_t max_bytes) {
    return runtime.container_logs(id, max_bytes, tail);
}

arena::container_stats resource_manager::container_stats(const string &id) {
    return runtime.stats(id);
}

void resource_manager::stop_container(const string &id, chrono::seconds timeout) {
    LOG(INFO) << "Manager: stopping container " << id;
    runtime.stop_container(id, timeout);
}

void resource_manager::delete_container(const string &id) {
    LOG(INFO) << "Manager: removing container " << id;
    runtime.remove_container(id, true);
}

bool resource_manager::delete_image(const string &ref, bool force) {
    auto image = runtime.inspect_image(ref);
    if (!image) BOOST_THROW_EXCEPTION(engine_error(404, "Image " + ref + " not found"));

    lease_references refs = live_references();
    if (image_leased(*image, refs)) {
        LOG(WARNING) << "Manager: refusing to remove image " << ref << ", it is referenced by a live lease";
        return false;
    }

    LOG(INFO) << "Manager: removing image " << ref;
    runtime.remove_image(ref, force);
    return true;
}

size_t resource_manager::delete_images_for_owner(const string &owner_id) {
    size_t count = 0;
    for (auto &image : list_agent_images(owner_id)) {
        if (image_leased(image, live_references())) {
            LOG(WARNING) << "Manager: keeping image " << image.id << " of " << owner_id << ", it is referenced by a live lease";
            continue;
        }
        try {
            runtime.remove_image(image.id, true);
            ++count;
        } catch (engine_error &ex) {
            LOG(WARNING) << "Manager: unable to remove image " << image.id << ", " << ex.what();
        }
    }
    LOG(INFO) << "Manager: removed " << count << " images of " << owner_id;
    return count;
}

size_t resource_manager::reclaim_match(const string &match_id) {
    container_filter filter;
    filter.match_id = match_id;

    size_t count = 0;
    for (auto &container : list_agent_containers(filter)) {
        try {
            runtime.remove_container(container.id, true);
            ++count;
        } catch (engine_error &ex) {
            LOG(WARNING) << "Manager: unable to remove container " << container.id << " of match " << match_id << ", " << ex.what();
        }
    }
    if (count) LOG(INFO) << "Manager: reclaimed " << count << " containers of match " << match_id;
    return count;
}

gc_report resource_manager::collect_garbage(const retention_config &retention, chrono::system_clock::time_point now) {
    gc_report report;

    vector<container_info> containers = runtime.list_containers({CONTAINER_KIND}, true);
    vector<container_info> kept;
    for (auto &container : containers) {
        // 运行中的容器超过保留时间仍然没有租约引用时，说明它的 worker 已经不在了
        bool expired = container.created + retention.container_age <= now;
        if (!expired && !marked_for_removal(container.labels)) {
            kept.push_back(container);
            continue;
        }
        // 每次删除之前重新读取租约，期间被领取的比赛不会失去它的容器
        lease_references refs = live_references();
        if (refs.match_ids.count(label_of(container.labels, "org.gameai.match_id"))) {
            report.skipped.push_back(container.id);
            kept.push_back(container);
            continue;
        }
        bool running = container.state == "running" || container.state == "restarting";
        if (running)
            LOG(WARNING) << "Manager: removing abandoned running container " << container.id << " of match "
                         << label_of(container.labels, "org.gameai.match_id");
        try {
            runtime.remove_container(container.id, true);
            report.removed_containers.push_back(container.id);
        } catch (arena_exception &ex) {
            report.errors.push_back(container.id + ": " + ex.what());
            kept.push_back(container);
        }
    }

    // 剩下的容器无论是否在运行都仍在使用它们的镜像
    set<string> used;
    for (auto &container : kept) used.insert(container.image);

    for (auto &image : runtime.list_images({IMAGE_KIND})) {
        bool expired = image.created + retention.image_age <= now;
        if (!expired && !marked_for_removal(image.labels)) continue;
        lease_references refs = live_references();
        if (image_leased(image, refs) || image_matches(image, used)) {
            report.skipped.push_back(image.id);
            continue;
        }
        try {
            runtime.remove_image(image.id, true);
            report.removed_images.push_back(image.id);
        } catch (arena_exception &ex) {
            report.errors.push_back(image.id + ": " + ex.what());
        }
    }

    LOG(INFO) << "Manager: garbage collection removed " << report.removed_containers.size() << " containers and "
              << report.removed_images.size() << " images, skipped " << report.skipped.size();
    return report;
}

}  // namespace arena

#include "test/fake_runtime.hpp"
#include <algorithm>
#include <thread>
#include "common/exceptions.hpp"

namespace arena::test {
using namespace std;

static bool match_labels(const map<string, string> &labels, const vector<string> &filters) {
    for (auto &filter : filters) {
        auto eq = filter.find('=');
        if (eq == string::npos) {
            if (!labels.count(filter)) return false;
        } else {
            auto it = labels.find(filter.substr(0, eq));
            if (it == labels.end() || it->second != filter.substr(eq + 1)) return false;
        }
    }
    return true;
}

void fake_runtime::check_available() const {
    if (!available) BOOST_THROW_EXCEPTION(network_error("fake runtime is unavailable"));
}

image_info *fake_runtime::find_image(const string &ref) {
    for (auto &image : images) {
        if (image.id == ref) return &image;
        for (auto &tag : image.tags)
            if (tag == ref || tag == ref + ":latest") return &image;
    }
    return nullptr;
}

fake_runtime::container &fake_runtime::find_container(const string &id) {
    auto it = containers.find(id);
    if (it == containers.end()) BOOST_THROW_EXCEPTION(engine_error(404, "no such container: " + id));
    return it->second;
}

image_info fake_runtime::add_image(const string &tag, const map<string, string> &labels, chrono::system_clock::time_point created) {
    lock_guard<mutex> guard(mut);
    image_info image;
    image.id = "sha256:" + std::to_string(1000 + next_id++) + string(60, 'a');
    image.tags = {tag};
    image.labels = labels;
    image.created = created;
    image.size = 1 << 20;
    images.push_back(image);
    return image;
}

string fake_runtime::add_exited_container(const string &image, const map<string, string> &labels, chrono::system_clock::time_point created) {
    lock_guard<mutex> guard(mut);
    string id = "container-" + std::to_string(next_id++);
    container c;
    c.spec.image = image;
    c.spec.labels = labels;
    c.image_id = image;
    c.created = created;
    c.started = true;
    c.state.status = "exited";
    c.state.running = false;
    c.state.exit_code = 0;
    containers[id] = c;
    return id;
}

void fake_runtime::ping() {
    check_available();
}

build_output fake_runtime::build_image(const build_request &request) {
    check_available();
    {
        lock_guard<mutex> guard(mut);
        builds.push_back(request);
    }
    if (build_delay.count() > 0) this_thread::sleep_for(build_delay);

    build_output output;
    if (on_build) {
        output = on_build(request);
    } else {
        output.success = true;
        output.log = "Step 1/1 : FROM base\nSuccessfully built\n";
    }
    if (output.success) {
        output.image_id = add_image(request.tag, request.labels).id;
    }
    return output;
}

optional<image_info> fake_runtime::inspect_image(const string &ref) {
    check_available();
    lock_guard<mutex> guard(mut);
    if (auto image = find_image(ref)) return *image;
    return nullopt;
}

vector<image_info> fake_runtime::list_images(const vector<string> &label_filters) {
    check_available();
    lock_guard<mutex> guard(mut);
    vector<image_info> result;
    for (auto &image : images)
        if (match_labels(image.labels, label_filters)) result.push_back(image);
    return result;
}

void fake_runtime::remove_image(const string &ref, bool force) {
    check_available();
    lock_guard<mutex> guard(mut);
    image_info *image = find_image(ref);
    if (!image) BOOST_THROW_EXCEPTION(engine_error(404, "no such image: " + ref));
    if (!force) {
        for (auto &[id, c] : containers)
            if (c.image_id == image->id || find(image->tags.begin(), image->tags.end(), c.spec.image) != image->tags.end())
                BOOST_THROW_EXCEPTION(engine_error(409, "image is being used by container " + id));
    }
    removed_image_ids.push_back(image->id);
    images.erase(images.begin() + (image - images.data()));
}

string fake_runtime::create_container(const container_spec &spec) {
    check_available();
    lock_guard<mutex> guard(mut);
    image_info *image = find_image(spec.image);
    if (!image) BOOST_THROW_EXCEPTION(engine_error(404, "no such image: " + spec.image));

    container c;
    c.spec = spec;
    c.image_id = image->id;
    c.created = chrono::system_clock::now();
    c.state.status = "created";
    if (scripts.count(spec.image))
        c.script = scripts[spec.image];
    else if (scripts.count(image->id))
        c.script = scripts[image->id];

    string id = "container-" + std::to_string(next_id++);
    containers[id] = c;
    specs.push_back(spec);
    return id;
}

void fake_runtime::start_container(const string &id) {
    check_available();
    lock_guard<mutex> guard(mut);
    container &c = find_container(id);
    c.started = true;
    c.started_at = chrono::steady_clock::now();
    c.state.status = "running";
    c.state.running = true;
    c.state.started_at = chrono::system_clock::now();
    c.output = c.script.early_output;
}

void fake_runtime::terminate(container &c, int exit_code) {
    c.state.running = false;
    c.state.status = "exited";
    c.state.exit_code = exit_code;
    c.state.finished_at = chrono::system_clock::now();
}

void fake_runtime::advance(container &c) {
    if (!c.state.running) return;
    if (chrono::steady_clock::now() - c.started_at < c.script.runtime) return;
    if (c.script.oom_killed) {
        c.state.oom_killed = true;
        terminate(c, 137);
    } else {
        c.output += c.script.late_output;
        terminate(c, c.script.exit_code);
    }
}

wait_result fake_runtime::wait_container(const string &id, chrono::milliseconds timeout) {
    check_available();
    auto deadline = chrono::steady_clock::now() + timeout;
    while (true) {
        {
            lock_guard<mutex> guard(mut);
            container &c = find_container(id);
            advance(c);
            if (c.started && !c.state.running) {
                wait_result result;
                result.exited = true;
                result.status_code = c.state.exit_code;
                return result;
            }
        }
        if (chrono::steady_clock::now() >= deadline) return wait_result{};
        this_thread::sleep_for(min(chrono::milliseconds(10),
                                   chrono::duration_cast<chrono::milliseconds>(deadline - chrono::steady_clock::now()) + chrono::milliseconds(1)));
    }
}

log_output fake_runtime::container_logs(const string &id, size_t max_bytes, int tail) {
    check_available();
    lock_guard<mutex> guard(mut);
    container &c = find_container(id);
    advance(c);

    log_output result;
    result.text = c.output;
    if (tail >= 0) {
        size_t pos = result.text.size();
        if (pos > 0 && result.text.back() == '\n') --pos;
        for (int i = 0; i < tail && pos != string::npos && pos > 0; ++i)
            pos = result.text.rfind('\n', pos - 1);
        if (tail == 0)
            result.text.clear();
        else if (pos != string::npos && pos > 0)
            result.text = result.text.substr(pos + 1);
    }
    if (result.text.size() > max_bytes) {
        result.text.resize(max_bytes);
        result.truncated = true;
    }
    return result;
}

void fake_runtime::kill_container(const string &id) {
    check_available();
    lock_guard<mutex> guard(mut);
    container &c = find_container(id);
    advance(c);
    if (c.state.running) terminate(c, 137);
}

void fake_runtime::stop_container(const string &id, chrono::seconds) {
    check_available();
    lock_guard<mutex> guard(mut);
    container &c = find_container(id);
    advance(c);
    if (c.state.running) terminate(c, 143);
}

void fake_runtime::remove_container(const string &id, bool force) {
    check_available();
    lock_guard<mutex> guard(mut);
    auto it = containers.find(id);
    if (it == containers.end()) return;
    advance(it->second);
    if (it->second.state.running && !force)
        BOOST_THROW_EXCEPTION(engine_error(409, "container " + id + " is running"));
    removed_container_ids.push_back(id);
    containers.erase(it);
}

optional<container_state> fake_runtime::inspect_container(const string &id) {
    check_available();
    lock_guard<mutex> guard(mut);
    auto it = containers.find(id);
    if (it == containers.end()) return nullopt;
    advance(it->second);
    return it->second.state;
}

vector<container_info> fake_runtime::list_containers(const vector<string> &label_filters, bool all) {
    check_available();
    lock_guard<mutex> guard(mut);
    vector<container_info> result;
    for (auto &[id, c] : containers) {
        advance(c);
        if (!all && !c.state.running) continue;
        if (!match_labels(c.spec.labels, label_filters)) continue;
        container_info info;
        info.id = id;
        info.name = c.spec.name;
        info.image = c.spec.image;
        info.state = c.state.status;
        info.status = c.state.running ? "Up" : "Exited (" + std::to_string(c.state.exit_code) + ")";
        info.labels = c.spec.labels;
        info.created = c.created;
        result.push_back(info);
    }
    return result;
}

container_stats fake_runtime::stats(const string &id) {
    check_available();
    lock_guard<mutex> guard(mut);
    container &c = find_container(id);
    container_stats result;
    result.memory_limit = c.spec.memory;
    result.memory_usage = c.state.running ? 16 << 20 : 0;
    result.pids = c.state.running ? 1 : 0;
    return result;
}

int fake_runtime::build_count() const {
    lock_guard<mutex> guard(mut);
    return (int)builds.size();
}

vector<build_request> fake_runtime::build_requests() const {
    lock_guard<mutex> guard(mut);
    return builds;
}

vector<container_spec> fake_runtime::created_specs() const {
    lock_guard<mutex> guard(mut);
    return specs;
}

vector<string> fake_runtime::removed_containers() const {
    lock_guard<mutex> guard(mut);
    return removed_container_ids;
}

vector<string> fake_runtime::removed_images() const {
    lock_guard<mutex> guard(mut);
    return removed_image_ids;
}

size_t fake_runtime::container_count() const {
    lock_guard<mutex> guard(mut);
    return containers.size();
}

bool fake_runtime::has_image(const string &ref) const {
    lock_guard<mutex> guard(mut);
    for (auto &image : images) {
        if (image.id == ref) return true;
        for (auto &tag : image.tags)
            if (tag == ref || tag == ref + ":latest") return true;
    }
    return false;
}

}  // namespace arena::test

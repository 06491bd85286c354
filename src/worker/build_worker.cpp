#include "worker/build_worker.hpp"
#include <glog/logging.h>
#include <fmt/core.h>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace arena {
using namespace std;
namespace fs = std::filesystem;

static job_outcome terminal(const string &detail, const string &logs = "") {
    job_outcome outcome;
    outcome.detail = detail;
    outcome.logs = logs;
    return outcome;
}

build_worker::build_worker(int id, const settings &config, job_queue &queue, backend_client &backend, image_builder &builder)
    : worker(id, config, queue), backend(backend), builder(builder), validator(config.archive) {}

string build_worker::group() const {
    return BUILD_GROUP;
}

chrono::steady_clock::time_point build_worker::deadline_of(const lease &) const {
    return chrono::steady_clock::now() + config.build.timeout;
}

fs::path build_worker::archive_path_of(const build_job &job) const {
    if (job.archive_path) return *job.archive_path;
    return config.archive.store_dir / (job.submission_id + ".zip");
}

job_outcome build_worker::handle(job_context &context) {
    const build_job &job = get<build_job>(context.held.payload);
    notify("submission " + job.submission_id, [&] {
        backend.update_submission(job.submission_id, {"building", nullopt, nullopt, nullopt});
    });

    fs::path path = archive_path_of(job);
    error_code ec;
    if (!fs::is_regular_file(path, ec))
        return terminal("validation failed: archive " + path.string() + " not found");
    uintmax_t size = fs::file_size(path, ec);
    if (ec || size > config.archive.max_archive_bytes)
        return terminal(fmt::format("validation failed: archive is {} bytes, the limit is {}", size, config.archive.max_archive_bytes));

    submission submit;
    submit.id = job.submission_id;
    submit.owner_id = job.owner_id;
    submit.archive = read_file_content(path);
    submit.validation = validator.validate(submit.archive);
    if (!submit.validation.accepted()) {
        LOG(INFO) << "Worker " << id << ": submission " << job.submission_id << " rejected, "
                  << to_string(submit.validation.status) << ": " << submit.validation.reason;
        return terminal("validation failed: " + submit.validation.reason);
    }

    build_context build;
    build.deadline = context.deadline;
    build_result result = builder.build(submit, build);

    job_outcome outcome;
    outcome.logs = result.logs;
    if (result.succeeded()) {
        outcome.succeeded = true;
        outcome.detail = result.image_tag;
        outcome.result = {{"image_id", result.image_id}, {"image_tag", result.image_tag}};
        return outcome;
    }

    outcome.retryable = result.is_retryable();
    outcome.infrastructure = result.is_infrastructure();
    if (result.status == build_status::VALIDATION_FAILED)
        outcome.detail = result.detail;
    else
        outcome.detail = fmt::format("build failed: {}: {}", to_string(result.status), result.detail);
    return outcome;
}

void build_worker::report(const job_context &context, job_state state, const job_outcome &outcome) {
    const build_job &job = get<build_job>(context.held.payload);
    submission_update update;
    switch (state) {
        case job_state::SUCCEEDED:
            update.status = "completed";
            update.logs = outcome.logs;
            update.image_id = outcome.result.at("image_id").get<string>();
            update.image_tag = outcome.result.at("image_tag").get<string>();
            break;
        case job_state::ENQUEUED:
            update.status = "queued";
            update.logs = fmt::format("attempt {} failed, retrying: {}", context.attempt(), outcome.detail);
            break;
        case job_state::FAILED:
            update.status = "failed";
            if (outcome.infrastructure)
                update.logs = "try again later";
            else
                update.logs = outcome.logs.empty() ? outcome.detail : outcome.detail + "\n\n" + outcome.logs;
            break;
        case job_state::CANCELLED:
            update.status = "failed";
            update.logs = "cancelled";
            break;
        case job_state::CLAIMED:
            return;
    }
    notify("submission " + job.submission_id, [&] { backend.update_submission(job.submission_id, update); });
}

}  // namespace arena

#include "build/image_builder.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <boost/interprocess/exceptions.hpp>
#include <boost/interprocess/sync/scoped_lock.hpp>
#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <array>
#include <functional>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include "build/context.hpp"
#include "build/ignore_rules.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace arena {
using namespace std;
namespace fs = std::filesystem;
namespace ip = boost::interprocess;

const char *const image_builder::dockerfile_name = ".arena.Dockerfile";

const char *to_string(build_status status) {
    switch (status) {
        case build_status::SUCCEEDED: return "SUCCEEDED";
        case build_status::VALIDATION_FAILED: return "VALIDATION_FAILED";
        case build_status::CONTEXT_TOO_LARGE: return "CONTEXT_TOO_LARGE";
        case build_status::DEPENDENCY_INSTALL_FAILED: return "DEPENDENCY_INSTALL_FAILED";
        case build_status::BUILD_FAILED: return "BUILD_FAILED";
        case build_status::BUILD_TIMEOUT: return "BUILD_TIMEOUT";
        case build_status::RUNTIME_UNAVAILABLE: return "RUNTIME_UNAVAILABLE";
        case build_status::SCRATCH_UNAVAILABLE: return "SCRATCH_UNAVAILABLE";
    }
    return "UNKNOWN";
}

bool build_result::succeeded() const {
    return status == build_status::SUCCEEDED;
}

bool build_result::is_retryable() const {
    return status == build_status::DEPENDENCY_INSTALL_FAILED ||
           status == build_status::BUILD_TIMEOUT ||
           is_infrastructure();
}

bool build_result::is_infrastructure() const {
    return status == build_status::RUNTIME_UNAVAILABLE ||
           status == build_status::SCRATCH_UNAVAILABLE;
}

string sanitize_repository(const string &name) {
    string result;
    for (char c : name) {
        if (isalnum((unsigned char)c))
            result += (char)tolower((unsigned char)c);
        else if (!result.empty() && result.back() != '-')
            result += '-';
    }
    while (!result.empty() && result.back() == '-') result.pop_back();
    return result.empty() ? "unknown" : result;
}

string image_tag(const string &repo_prefix, const string &owner_id, const string &sha256) {
    return fmt::format("{}-{}:{}", sanitize_repository(repo_prefix), sanitize_repository(owner_id), sha256.substr(0, 16));
}

/**
 * @brief 同一进程内对同一标签的构建互斥
 * 文件锁只在进程之间互斥，同一进程的多个线程需要额外的互斥量
 */
static mutex &tag_mutex(const string &tag) {
    static array<mutex, 64> mutexes;
    return mutexes[hash<string>()(tag) % mutexes.size()];
}

static build_result failure(build_status status, const string &detail) {
    build_result result;
    result.status = status;
    result.detail = detail;
    return result;
}

image_builder::image_builder(const build_config &config, const archive_config &archive, container_runtime &runtime)
    : config(config), manifest_name(archive.manifest_name), validator(archive), runtime(runtime) {}

string image_builder::render_dockerfile(const string &entrypoint, bool has_manifest) const {
    nlohmann::json command = config.interpreter;
    command.push_back("/agent/" + entrypoint);

    ostringstream out;
    out << "FROM " << config.base_image << "\n"
        << "WORKDIR /agent\n";
    if (has_manifest) {
        out << "COPY " << manifest_name << " /agent/" << manifest_name << "\n"
            << "RUN " << boost::replace_all_copy(config.install_command, "{manifest}", "/agent/" + manifest_name) << "\n";
    }
    out << "COPY . /agent\n"
        << "ENV PYTHONDONTWRITEBYTECODE=1 PYTHONUNBUFFERED=1\n"
        << "USER " << config.run_user << "\n"
        << "ENTRYPOINT " << command.dump() << "\n";
    return out.str();
}

build_result image_builder::classify(const build_output &output, build_result result) const {
    result.logs = output.log;
    truncate_output(result.logs, 5 << 20);

    if (output.success) {
        result.status = build_status::SUCCEEDED;
        result.image_id = output.image_id;
        return result;
    }

    if (output.timed_out) {
        result.status = build_status::BUILD_TIMEOUT;
        result.detail = fmt::format("build did not finish within {} seconds", config.timeout.count());
        return result;
    }

    // 依赖安装是 Dockerfile 中唯一的 RUN 步骤，失败信息中会出现它的命令行
    string install = boost::replace_all_copy(config.install_command, "{manifest}", "/agent/" + manifest_name);
    if (output.error.find(install) != string::npos ||
        output.log.find("No matching distribution found") != string::npos ||
        output.log.find("Could not find a version that satisfies") != string::npos) {
        result.status = build_status::DEPENDENCY_INSTALL_FAILED;
        result.detail = "failed to install dependencies from " + manifest_name;
    } else {
        result.status = build_status::BUILD_FAILED;
        result.detail = output.error.empty() ? "image build failed" : output.error;
    }
    return result;
}

build_result image_builder::build(const submission &submit, const build_context &context) {
    if (!submit.validation.accepted())
        return failure(build_status::VALIDATION_FAILED, "validation failed: " + submit.validation.reason);

    try {
        return build_in_scratch(submit, context);
    } catch (system_error &ex) {
        LOG(ERROR) << "Builder: scratch directory " << config.scratch_dir << " unavailable while building submission "
                   << submit.id << ", " << ex.what();
        return failure(build_status::SCRATCH_UNAVAILABLE, "scratch directory unavailable");
    } catch (ip::interprocess_exception &ex) {
        LOG(ERROR) << "Builder: unable to lock the build of submission " << submit.id << ", " << ex.what();
        return failure(build_status::SCRATCH_UNAVAILABLE, "scratch directory unavailable");
    }
}

build_result image_builder::build_in_scratch(const submission &submit, const build_context &context) {
    scoped_temp_directory scratch(config.scratch_dir, "build-" + sanitize_repository(submit.id) + "-");
    if (config.keep_scratch) scratch.keep();
    fs::path root = scratch.path() / "context";
    fs::create_directory(root);

    validation_result extracted = validator.extract(submit.archive, root);
    if (!extracted.accepted())
        return failure(build_status::VALIDATION_FAILED, "validation failed: " + extracted.reason);

    fs::path dockerignore = root / ".dockerignore";
    vector<string> patterns;
    if (fs::is_regular_file(fs::symlink_status(dockerignore))) {
        string content = read_file_content(dockerignore);
        boost::split(patterns, content, boost::is_any_of("\n"));
    } else {
        fs::remove(dockerignore);
        patterns = config.default_ignore;
        write_file_content(dockerignore, ignore_rules(patterns).to_string());
    }
    // 生成的 Dockerfile、入口文件和依赖清单无论如何都必须在构建上下文中
    patterns.push_back(string("!") + dockerfile_name);
    patterns.push_back("!" + extracted.entrypoint);
    if (extracted.has_manifest) patterns.push_back("!" + manifest_name);

    fs::remove(root / dockerfile_name);
    write_file_content(root / dockerfile_name, render_dockerfile(extracted.entrypoint, extracted.has_manifest));

    ignore_rules rules;
    try {
        rules = ignore_rules(patterns);
    } catch (invalid_argument &ex) {
        return failure(build_status::VALIDATION_FAILED, string("validation failed: .dockerignore: ") + ex.what());
    }

    build_context_files files = collect_context(root, rules);
    if (files.bytes > config.max_context_bytes)
        return failure(build_status::CONTEXT_TOO_LARGE,
                       fmt::format("build context is {} bytes, the limit is {}", files.bytes, config.max_context_bytes));

    build_result result;
    result.content_sha256 = content_sha256(root, files);
    result.image_tag = image_tag(config.repo_prefix, submit.owner_id, result.content_sha256);

    scoped_lock guard(tag_mutex(result.image_tag));
    ip::file_lock lock = lock_file(config.scratch_dir / "locks", boost::replace_all_copy(result.image_tag, ":", "_") + ".lock");
    ip::scoped_lock<ip::file_lock> file_guard(lock);

    try {
        if (auto existing = runtime.inspect_image(result.image_tag)) {
            LOG(INFO) << "Builder: image " << result.image_tag << " already exists, skipping build of submission " << submit.id;
            result.status = build_status::SUCCEEDED;
            result.image_id = existing->id;
            result.cached = true;
            return result;
        }

        auto now = chrono::steady_clock::now();
        chrono::seconds timeout = config.timeout;
        if (context.deadline != chrono::steady_clock::time_point::max())
            timeout = min(timeout, chrono::duration_cast<chrono::seconds>(context.deadline - now));
        if (timeout.count() <= 0)
            return failure(build_status::BUILD_TIMEOUT, "no time left to build the image");

        build_request request;
        request.context = pack_context(root, files);
        request.tag = result.image_tag;
        request.dockerfile = dockerfile_name;
        request.network_mode = config.network_mode;
        request.timeout = timeout;
        request.labels = {
            {"org.gameai.kind", "agent"},
            {"org.gameai.owner_id", submit.owner_id},
            {"org.gameai.submission_id", submit.id},
            {"org.gameai.content_sha256", result.content_sha256},
            {"org.gameai.entrypoint", extracted.entrypoint},
            {"org.gameai.created_at", iso8601_now()}};

        elapsed_time timer;
        result = classify(runtime.build_image(request), result);
        LOG(INFO) << "Builder: submission " << submit.id << " finished as " << to_string(result.status)
                  << " in " << timer.duration<chrono::seconds>().count() << "s, tag " << result.image_tag;
        return result;
    } catch (network_error &ex) {
        LOG(WARNING) << "Builder: container runtime unavailable, " << ex.what();
        result.status = build_status::RUNTIME_UNAVAILABLE;
        result.detail = "container runtime unavailable";
        return result;
    } catch (engine_error &ex) {
        LOG(WARNING) << "Builder: container runtime rejected the build, " << ex.what();
        result.status = build_status::BUILD_FAILED;
        result.detail = ex.what();
        return result;
    }
}

}  // namespace arena

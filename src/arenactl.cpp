#include <curl/curl.h>
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include <map>
#include <nlohmann/json.hpp>
#include "archive/validator.hpp"
#include "build/image_builder.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "manager/resource_manager.hpp"
#include "queue/job_queue.hpp"
#include "runtime/docker_engine.hpp"
#include "sandbox/runner.hpp"
using namespace std;
using nlohmann::json;
namespace po = boost::program_options;

static const char *const USAGE = R"(Usage: arenactl [options] <command> [arguments]

Commands:
  validate <zip>                      check an agent archive without building it
  build <zip> --owner <id>            validate and build an archive into an image
  run <image> [--time-budget <s>]     run an agent image once in the sandbox
  images [--owner <id>]               list agent images
  containers [--match <id>]           list agent containers
  logs <container> [--tail <n>]       print the output of a container
  stats <container>                   print resource usage of a container
  rm <container>                      remove a container
  rmi <image> [--force]               remove an image unless a live job uses it
  gc                                  remove expired containers and images
  enqueue-build --submission <id> --owner <id> [--archive <path>]
  enqueue-match --match <id> --image <ref>... [--agent <id>...] [--mode <mode>] [--time-budget <s>]
  cancel <job>                        cancel a queued or running job
  status <job>                        print the record of a job
)";

/**
 * @brief 命令行工具的运行环境，容器引擎和任务队列在第一次使用时才连接
 */
struct arenactl {
    arena::settings config;
    po::variables_map vm;
    vector<string> args;

    arena::container_runtime &runtime() {
        if (!engine) engine = make_unique<arena::docker_engine>(config.docker);
        return *engine;
    }

    arena::job_queue &queue() {
        if (!jobs) jobs = arena::make_job_queue(config);
        return *jobs;
    }

    arena::resource_manager &manager() {
        if (!resources) resources = make_unique<arena::resource_manager>(runtime(), queue());
        return *resources;
    }

    const string &arg(size_t index, const string &name) const {
        if (index >= args.size()) throw invalid_argument("missing argument <" + name + ">");
        return args[index];
    }

    string option(const string &name) const {
        if (!vm.count(name)) throw invalid_argument("missing option --" + name);
        return vm.at(name).as<string>();
    }

    int validate();
    int build();
    int run();
    int images();
    int containers();
    int logs();
    int stats();
    int rm();
    int rmi();
    int gc();
    int enqueue_build();
    int enqueue_match();
    int cancel();
    int status();

private:
    unique_ptr<arena::container_runtime> engine;
    unique_ptr<arena::job_queue> jobs;
    unique_ptr<arena::resource_manager> resources;
};

static string format_time(chrono::system_clock::time_point time) {
    time_t t = chrono::system_clock::to_time_t(time);
    char buffer[32];
    strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", gmtime(&t));
    return buffer;
}

int arenactl::validate() {
    arena::archive_validator validator(config.archive);
    arena::validation_result result = validator.validate(arena::read_file_content(arg(0, "zip")));
    json j = {{"status", arena::to_string(result.status)},
              {"reason", result.reason},
              {"entrypoint", result.entrypoint},
              {"has_manifest", result.has_manifest},
              {"entries", result.entries},
              {"extracted_bytes", result.extracted_bytes}};
    cout << j.dump(2) << endl;
    return result.accepted() ? EXIT_SUCCESS : EXIT_FAILURE;
}

int arenactl::build() {
    arena::archive_validator validator(config.archive);
    arena::submission submit;
    submit.id = vm.count("submission") ? vm.at("submission").as<string>() : arena::random_uuid();
    submit.owner_id = option("owner");
    submit.archive = arena::read_file_content(arg(0, "zip"));
    submit.validation = validator.validate(submit.archive);

    arena::image_builder builder(config.build, config.archive, runtime());
    arena::build_result result = builder.build(submit, arena::build_context());
    json j = {{"status", arena::to_string(result.status)},
              {"image_id", result.image_id},
              {"image_tag", result.image_tag},
              {"content_sha256", result.content_sha256},
              {"cached", result.cached},
              {"detail", result.detail}};
    cerr << result.logs;
    cout << j.dump(2) << endl;
    return result.succeeded() ? EXIT_SUCCESS : EXIT_FAILURE;
}

int arenactl::run() {
    string image = arg(0, "image");
    arena::sandbox_runner runner(runtime());
    arena::run_request request;
    request.agent_id = vm.count("agent") ? vm.at("agent").as<vector<string>>().front() : "agent-1";
    if (vm.count("time-budget")) request.time_budget = chrono::seconds(vm.at("time-budget").as<int>());
    request.args.assign(args.begin() + 1, args.end());

    arena::run_result result = runner.run(image, config.policy, request, nullptr);
    cout << json(result).dump(2) << endl;
    return result.reason == arena::termination_reason::COMPLETED ? EXIT_SUCCESS : EXIT_FAILURE;
}

int arenactl::images() {
    optional<string> owner;
    if (vm.count("owner")) owner = option("owner");
    json list = json::array();
    for (auto &image : manager().list_agent_images(owner)) {
        list.push_back({{"id", image.id},
                        {"tags", image.tags},
                        {"labels", image.labels},
                        {"created", format_time(image.created)},
                        {"size", image.size}});
    }
    cout << list.dump(2) << endl;
    return EXIT_SUCCESS;
}

int arenactl::containers() {
    arena::container_filter filter;
    if (vm.count("match")) filter.match_id = option("match");
    if (vm.count("owner")) filter.owner_id = option("owner");
    json list = json::array();
    for (auto &container : manager().list_agent_containers(filter)) {
        list.push_back({{"id", container.id},
                        {"name", container.name},
                        {"image", container.image},
                        {"state", container.state},
                        {"status", container.status},
                        {"labels", container.labels},
                        {"created", format_time(container.created)}});
    }
    cout << list.dump(2) << endl;
    return EXIT_SUCCESS;
}

int arenactl::logs() {
    int tail = vm.count("tail") ? vm.at("tail").as<int>() : -1;
    arena::log_output output = manager().container_logs(arg(0, "container"), tail);
    cout << output.text;
    if (output.truncated) cout << arena::truncation_marker;
    return EXIT_SUCCESS;
}

int arenactl::stats() {
    arena::container_stats usage = manager().container_stats(arg(0, "container"));
    json j = {{"memory_usage", usage.memory_usage},
              {"memory_limit", usage.memory_limit},
              {"cpu_percent", usage.cpu_percent},
              {"pids", usage.pids}};
    cout << j.dump(2) << endl;
    return EXIT_SUCCESS;
}

int arenactl::rm() {
    manager().delete_container(arg(0, "container"));
    return EXIT_SUCCESS;
}

int arenactl::rmi() {
    if (!manager().delete_image(arg(0, "image"), vm.count("force") > 0)) {
        cerr << "Image " << args[0] << " is used by a running job" << endl;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

int arenactl::gc() {
    arena::gc_report report = manager().collect_garbage(config.retention, chrono::system_clock::now());
    cout << json(report).dump(2) << endl;
    return report.errors.empty() ? EXIT_SUCCESS : EXIT_FAILURE;
}

int arenactl::enqueue_build() {
    arena::build_job job;
    job.submission_id = option("submission");
    job.owner_id = option("owner");
    if (vm.count("archive")) job.archive_path = option("archive");
    cout << queue().enqueue(job) << endl;
    return EXIT_SUCCESS;
}

int arenactl::enqueue_match() {
    arena::match_job job;
    job.match_id = option("match");
    if (!vm.count("image")) throw invalid_argument("missing option --image");
    job.image_refs = vm.at("image").as<vector<string>>();
    if (vm.count("agent")) job.agent_ids = vm.at("agent").as<vector<string>>();
    if (!job.agent_ids.empty() && job.agent_ids.size() != job.image_refs.size())
        throw invalid_argument("--agent must be given once for every --image");
    if (vm.count("mode")) job.mode = option("mode");
    if (vm.count("time-budget")) job.time_budget = chrono::seconds(vm.at("time-budget").as<int>());
    cout << queue().enqueue(job) << endl;
    return EXIT_SUCCESS;
}

int arenactl::cancel() {
    if (!queue().cancel(arg(0, "job"))) {
        cerr << "Job " << args[0] << " does not exist or has already finished" << endl;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

int arenactl::status() {
    auto record = queue().find(arg(0, "job"));
    if (!record) {
        cerr << "Job " << args[0] << " does not exist" << endl;
        return EXIT_FAILURE;
    }
    json j = {{"id", record->id},
              {"group", record->group},
              {"state", arena::to_string(record->state)},
              {"attempts", record->attempts},
              {"enqueued_at", record->enqueued_at},
              {"detail", record->detail},
              {"cancel_requested", record->cancel_requested},
              {"payload", arena::dump_job(record->payload)}};
    cout << j.dump(2) << endl;
    return EXIT_SUCCESS;
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;

    po::options_description desc("arenactl options");
    po::options_description hidden;
    po::positional_options_description positional;
    arenactl ctl;

    // clang-format off
    desc.add_options()
        ("config", po::value<string>(), "set the settings file. You can either pass it from environ ARENA_CONFIG")
        ("owner", po::value<string>(), "owner of the submission or images")
        ("submission", po::value<string>(), "submission id")
        ("archive", po::value<string>(), "path of the submission archive")
        ("match", po::value<string>(), "match id")
        ("image", po::value<vector<string>>(), "image id or tag of an agent, repeatable")
        ("agent", po::value<vector<string>>(), "agent id, repeatable, in the same order as --image")
        ("mode", po::value<string>(), "match mode, concurrent or sequential")
        ("time-budget", po::value<int>(), "time budget of every agent in seconds")
        ("tail", po::value<int>(), "only print the last lines of the logs")
        ("force", "remove the image even if containers use it")
        ("help", "display this help text");
    hidden.add_options()
        ("command", po::value<string>(), "command")
        ("args", po::value<vector<string>>(), "arguments");
    // clang-format on
    positional.add("command", 1).add("args", -1);

    po::options_description all;
    all.add(desc).add(hidden);
    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(all)
                      .positional(positional)
                      .run(),
                  ctl.vm);
        po::notify(ctl.vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl
             << USAGE << endl
             << desc << endl;
        return EXIT_FAILURE;
    }

    if (ctl.vm.count("help") || !ctl.vm.count("command")) {
        cout << USAGE << endl
             << desc << endl;
        return ctl.vm.count("help") ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    if (ctl.vm.count("args")) ctl.args = ctl.vm.at("args").as<vector<string>>();

    map<string, int (arenactl::*)()> commands = {
        {"validate", &arenactl::validate},
        {"build", &arenactl::build},
        {"run", &arenactl::run},
        {"images", &arenactl::images},
        {"containers", &arenactl::containers},
        {"logs", &arenactl::logs},
        {"stats", &arenactl::stats},
        {"rm", &arenactl::rm},
        {"rmi", &arenactl::rmi},
        {"gc", &arenactl::gc},
        {"enqueue-build", &arenactl::enqueue_build},
        {"enqueue-match", &arenactl::enqueue_match},
        {"cancel", &arenactl::cancel},
        {"status", &arenactl::status}};

    string command = ctl.vm.at("command").as<string>();
    auto it = commands.find(command);
    if (it == commands.end()) {
        cerr << "Unknown command " << command << endl
             << USAGE << endl;
        return EXIT_FAILURE;
    }

    curl_global_init(CURL_GLOBAL_ALL);
    try {
        if (ctl.vm.count("config"))
            ctl.config = arena::load_settings(ctl.vm.at("config").as<string>());
        else if (getenv("ARENA_CONFIG"))
            ctl.config = arena::load_settings(getenv("ARENA_CONFIG"));
        else
            ctl.config = arena::default_settings();

        int code = (ctl.*(it->second))();
        curl_global_cleanup();
        return code;
    } catch (invalid_argument& ex) {
        cerr << command << ": " << ex.what() << endl;
    } catch (std::exception& ex) {
        cerr << command << ": " << ex.what() << endl;
        LOG(ERROR) << boost::diagnostic_information(ex);
    }
    curl_global_cleanup();
    return EXIT_FAILURE;
}

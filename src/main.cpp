#include <curl/curl.h>
#include <glog/logging.h>
#include <signal.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/program_options.hpp>
#include <filesystem>
#include <iostream>
#include <thread>
#include "backend/backend_client.hpp"
#include "build/image_builder.hpp"
#include "common/exceptions.hpp"
#include "config.hpp"
#include "manager/resource_manager.hpp"
#include "monitor/monitor.hpp"
#include "queue/job_queue.hpp"
#include "runtime/docker_engine.hpp"
#include "worker/build_worker.hpp"
#include "worker/match_worker.hpp"
using namespace std;

void signalHandler(int /* signum */) {
    arena::stop_workers();
}

/**
 * @brief 定期回收过期的容器和镜像，并将到期的租约重新入队
 * 在 worker 都停止后退出
 */
static void maintenance_loop(const arena::settings &config, arena::job_queue &queue, arena::resource_manager &manager) {
    auto next_gc = chrono::steady_clock::now() + config.retention.interval;
    while (!arena::workers_stopping()) {
        this_thread::sleep_for(chrono::seconds(1));
        try {
            size_t requeued = queue.requeue_expired(chrono::system_clock::now());
            if (requeued) LOG(INFO) << "Maintenance: requeued " << requeued << " jobs with expired leases";

            if (config.retention.interval.count() > 0 && chrono::steady_clock::now() >= next_gc) {
                next_gc = chrono::steady_clock::now() + config.retention.interval;
                manager.collect_garbage(config.retention, chrono::system_clock::now());
            }
        } catch (arena::arena_exception &ex) {
            LOG(WARNING) << "Maintenance: " << ex.what();
        }
    }
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    namespace po = boost::program_options;
    po::options_description desc("arena-worker options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("config", po::value<string>(), "set the settings file. You can either pass it from environ ARENA_CONFIG")
        ("build-workers", po::value<unsigned>(), "set the number of build workers, overriding workers.build in the settings")
        ("match-workers", po::value<unsigned>(), "set the number of match workers, overriding workers.match in the settings")
        ("debug", "turn on the debug mode to keep build scratch directories for inspection. You can either pass it from environ DEBUG")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "arena-worker: build agent images and run matches from the job queue" << endl
             << "Requires access to the Docker Engine API and Redis" << endl
             << "Usage: " << argv[0] << " [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "arena-worker 1.0" << endl;
        return EXIT_SUCCESS;
    }

    arena::settings config;
    try {
        if (vm.count("config"))
            config = arena::load_settings(vm.at("config").as<string>());
        else if (getenv("ARENA_CONFIG"))
            config = arena::load_settings(getenv("ARENA_CONFIG"));
        else
            config = arena::default_settings();
    } catch (std::exception& ex) {
        LOG(FATAL) << "Unable to load settings, " << ex.what();
    }

    if (vm.count("build-workers")) config.build_workers = vm.at("build-workers").as<unsigned>();
    if (vm.count("match-workers")) config.match_workers = vm.at("match-workers").as<unsigned>();
    if (vm.count("debug")) config.debug = config.build.keep_scratch = true;

    CHECK(curl_global_init(CURL_GLOBAL_ALL) == CURLE_OK) << "Unable to initialize curl";

    arena::docker_engine runtime(config.docker);
    try {
        runtime.ping();
    } catch (arena::network_error& ex) {
        // 引擎稍后可能恢复，worker 会在处理任务时退避重试
        LOG(WARNING) << "Container runtime is not reachable yet, " << ex.what();
    }

    unique_ptr<arena::job_queue> queue;
    try {
        queue = arena::make_job_queue(config);
    } catch (std::exception& ex) {
        LOG(FATAL) << "Unable to create the job queue, " << ex.what() << endl
                   << boost::diagnostic_information(ex);
    }

    arena::http_backend backend(config.backend);
    arena::image_builder builder(config.build, config.archive, runtime);
    arena::resource_manager manager(runtime, *queue);

    arena::register_monitor(make_unique<arena::log_monitor>());

    vector<unique_ptr<arena::worker>> workers;
    int worker_id = 0;
    for (unsigned i = 0; i < config.build_workers; ++i)
        workers.push_back(make_unique<arena::build_worker>(worker_id++, config, *queue, backend, builder));
    for (unsigned i = 0; i < config.match_workers; ++i)
        workers.push_back(make_unique<arena::match_worker>(worker_id++, config, *queue, backend, runtime, manager));

    LOG(INFO) << "Starting " << config.build_workers << " build workers and " << config.match_workers << " match workers";

    vector<thread> worker_threads;
    for (auto& w : workers)
        worker_threads.push_back(w->start());
    thread maintenance([&] { maintenance_loop(config, *queue, manager); });

    for (auto& th : worker_threads)
        th.join();
    maintenance.join();

    LOG(INFO) << "All workers stopped";
    curl_global_cleanup();
    return 0;
}

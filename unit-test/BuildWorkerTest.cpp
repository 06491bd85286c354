#include <filesystem>
#include <thread>
#include "common/io_utils.hpp"
#include "gtest/gtest.h"
#include "queue/memory_queue.hpp"
#include "test/fake_backend.hpp"
#include "test/fake_runtime.hpp"
#include "test/zip_builder.hpp"
#include "worker/build_worker.hpp"

using namespace std;
using namespace std::filesystem;
using namespace arena;
using namespace arena::test;

class BuildWorkerTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = make_unique<scoped_temp_directory>(temp_directory_path(), "arena-build-worker-");
        config.queue.type = "memory";
        config.queue.lease = chrono::seconds(3);
        config.queue.max_attempts = 2;
        config.queue.max_backoff = chrono::seconds(0);
        config.archive.store_dir = dir->path() / "submissions";
        config.build.scratch_dir = dir->path() / "scratch";
        create_directories(config.archive.store_dir);

        queue = make_unique<memory_queue>(config.queue);
        builder = make_unique<image_builder>(config.build, config.archive, runtime);
    }

    string store(const string &submission_id, const string &archive) {
        write_file_content(config.archive.store_dir / (submission_id + ".zip"), archive);
        return submission_id;
    }

    string enqueue(const string &submission_id, optional<string> archive_path = nullopt) {
        build_job job;
        job.submission_id = submission_id;
        job.owner_id = "alice";
        job.archive_path = archive_path;
        return queue->enqueue(job);
    }

    build_worker make_worker() {
        return build_worker(0, config, *queue, backend, *builder);
    }

    unique_ptr<scoped_temp_directory> dir;
    settings config;
    fake_runtime runtime;
    fake_backend backend;
    unique_ptr<memory_queue> queue;
    unique_ptr<image_builder> builder;
};

TEST_F(BuildWorkerTest, EmptyQueueTest) {
    build_worker worker = make_worker();
    EXPECT_FALSE(worker.run_once(chrono::milliseconds(50)));
    EXPECT_TRUE(backend.submissions().empty());
}

TEST_F(BuildWorkerTest, BuildSucceededTest) {
    string job_id = enqueue(store("s-1", simple_agent_zip()));
    build_worker worker = make_worker();
    ASSERT_TRUE(worker.run_once(chrono::milliseconds(0)));

    EXPECT_EQ(queue->state(job_id), job_state::SUCCEEDED);
    EXPECT_EQ(backend.submission_statuses("s-1"), (vector<string>{"building", "completed"}));

    auto updates = backend.submissions();
    auto &completed = updates.back().second;
    ASSERT_TRUE(completed.image_tag);
    ASSERT_TRUE(completed.image_id);
    EXPECT_EQ(completed.image_tag->rfind("agent-alice:", 0), 0);
    EXPECT_TRUE(runtime.has_image(*completed.image_tag));
    EXPECT_EQ(queue->find(job_id)->detail, *completed.image_tag);
}

TEST_F(BuildWorkerTest, ExplicitArchivePathTest) {
    path archive = dir->path() / "upload.zip";
    write_file_content(archive, simple_agent_zip());
    string job_id = enqueue("s-2", archive.string());

    build_worker worker = make_worker();
    ASSERT_TRUE(worker.run_once(chrono::milliseconds(0)));
    EXPECT_EQ(queue->state(job_id), job_state::SUCCEEDED);
    EXPECT_EQ(worker.archive_path_of(get<build_job>(queue->find(job_id)->payload)), archive);
}

TEST_F(BuildWorkerTest, ValidationFailureIsTerminalTest) {
    string job_id = enqueue(store("s-1", make_zip({zip_entry::file("agent.py", "x"), zip_entry::file("../evil", "x")})));
    build_worker worker = make_worker();
    ASSERT_TRUE(worker.run_once(chrono::milliseconds(0)));

    auto record = queue->find(job_id);
    EXPECT_EQ(record->state, job_state::FAILED);
    EXPECT_EQ(record->attempts, 1);
    EXPECT_EQ(backend.submission_statuses("s-1"), (vector<string>{"building", "failed"}));
    auto logs = backend.submissions().back().second.logs.value_or("");
    EXPECT_EQ(logs.rfind("validation failed: ", 0), 0);
    EXPECT_NE(logs.find("../evil"), string::npos);
    EXPECT_EQ(runtime.build_count(), 0);
}

TEST_F(BuildWorkerTest, MissingArchiveTest) {
    string job_id = enqueue("s-404");
    build_worker worker = make_worker();
    ASSERT_TRUE(worker.run_once(chrono::milliseconds(0)));
    EXPECT_EQ(queue->state(job_id), job_state::FAILED);
    EXPECT_EQ(backend.submissions().back().second.logs.value_or("").rfind("validation failed: ", 0), 0);
}

TEST_F(BuildWorkerTest, RetryableFailureTest) {
    runtime.on_build = [](const build_request &) {
        build_output output;
        output.log = "ERROR: No matching distribution found for numpy==99\n";
        return output;
    };
    string job_id = enqueue(store("s-1", simple_agent_zip()));
    build_worker worker = make_worker();

    ASSERT_TRUE(worker.run_once(chrono::milliseconds(0)));
    EXPECT_EQ(queue->state(job_id), job_state::ENQUEUED);
    ASSERT_TRUE(worker.run_once(chrono::milliseconds(0)));
    EXPECT_EQ(queue->state(job_id), job_state::FAILED);

    EXPECT_EQ(backend.submission_statuses("s-1"), (vector<string>{"building", "queued", "building", "failed"}));
    auto logs = backend.submissions().back().second.logs.value_or("");
    EXPECT_EQ(logs.rfind("build failed: DEPENDENCY_INSTALL_FAILED", 0), 0);
    EXPECT_NE(logs.find("No matching distribution"), string::npos);
    EXPECT_EQ(runtime.build_count(), 2);
}

TEST_F(BuildWorkerTest, InfrastructureFailureTest) {
    runtime.available = false;
    string job_id = enqueue(store("s-1", simple_agent_zip()));
    build_worker worker = make_worker();

    ASSERT_TRUE(worker.run_once(chrono::milliseconds(0)));
    EXPECT_EQ(queue->state(job_id), job_state::ENQUEUED);
    ASSERT_TRUE(worker.run_once(chrono::milliseconds(0)));
    EXPECT_EQ(queue->state(job_id), job_state::FAILED);

    // 基础设施错误不会以构建失败的形式暴露给提交者
    EXPECT_EQ(backend.submissions().back().second.logs.value_or(""), "try again later");
}

TEST_F(BuildWorkerTest, ScratchFailureIsRetriedTest) {
    write_file_content(dir->path() / "occupied", "");
    config.build.scratch_dir = dir->path() / "occupied" / "scratch";
    builder = make_unique<image_builder>(config.build, config.archive, runtime);
    string job_id = enqueue(store("s-1", simple_agent_zip()));
    build_worker worker = make_worker();

    ASSERT_TRUE(worker.run_once(chrono::milliseconds(0)));
    EXPECT_EQ(queue->state(job_id), job_state::ENQUEUED);
    ASSERT_TRUE(worker.run_once(chrono::milliseconds(0)));
    EXPECT_EQ(queue->state(job_id), job_state::FAILED);

    // 磁盘故障不会以提交本身的错误展示给提交者
    EXPECT_EQ(backend.submission_statuses("s-1"), (vector<string>{"building", "queued", "building", "failed"}));
    EXPECT_EQ(backend.submissions().back().second.logs.value_or(""), "try again later");
}

TEST_F(BuildWorkerTest, BackendFailureDoesNotFailBuildTest) {
    backend.failing = true;
    string job_id = enqueue(store("s-1", simple_agent_zip()));
    build_worker worker = make_worker();
    ASSERT_TRUE(worker.run_once(chrono::milliseconds(0)));
    EXPECT_EQ(queue->state(job_id), job_state::SUCCEEDED);
}

TEST_F(BuildWorkerTest, CancelledBuildTest) {
    runtime.build_delay = chrono::milliseconds(1500);
    string job_id = enqueue(store("s-1", simple_agent_zip()));
    build_worker worker = make_worker();

    thread canceller([&] {
        this_thread::sleep_for(chrono::milliseconds(200));
        queue->cancel(job_id);
    });
    ASSERT_TRUE(worker.run_once(chrono::milliseconds(0)));
    canceller.join();

    EXPECT_EQ(queue->state(job_id), job_state::CANCELLED);
    EXPECT_EQ(backend.submissions().back().second.status, "failed");
    EXPECT_EQ(backend.submissions().back().second.logs.value_or(""), "cancelled");
}

TEST_F(BuildWorkerTest, WorkerIdTest) {
    build_worker worker = make_worker();
    EXPECT_EQ(worker.group(), BUILD_GROUP);
    EXPECT_NE(worker.worker_id().find("-builds-0"), string::npos);
}

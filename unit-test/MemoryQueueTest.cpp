#include <atomic>
#include <set>
#include <thread>
#include "gtest/gtest.h"
#include "queue/memory_queue.hpp"

using namespace std;
using namespace arena;

class MemoryQueueTest : public ::testing::Test {
protected:
    queue_config config;

    static build_job make_build(const string &submission_id) {
        build_job job;
        job.submission_id = submission_id;
        job.owner_id = "alice";
        return job;
    }

    static match_job make_match(const string &match_id) {
        match_job job;
        job.match_id = match_id;
        job.image_refs = {"agent-alice:0123456789abcdef"};
        return job;
    }
};

TEST_F(MemoryQueueTest, EnqueueClaimCompleteTest) {
    memory_queue queue(config);
    string id = queue.enqueue(make_build("s-1"));
    EXPECT_EQ(queue.state(id), job_state::ENQUEUED);
    EXPECT_EQ(queue.length(BUILD_GROUP), 1);

    auto l = queue.claim(BUILD_GROUP, "worker-a", chrono::seconds(60), chrono::milliseconds(0));
    ASSERT_TRUE(l);
    EXPECT_EQ(l->job_id, id);
    EXPECT_EQ(l->attempts, 1);
    EXPECT_EQ(get<build_job>(l->payload).submission_id, "s-1");
    EXPECT_EQ(queue.state(id), job_state::CLAIMED);
    EXPECT_EQ(queue.length(BUILD_GROUP), 0);

    EXPECT_TRUE(queue.complete(*l, "agent-alice:0123"));
    auto record = queue.find(id);
    ASSERT_TRUE(record);
    EXPECT_EQ(record->state, job_state::SUCCEEDED);
    EXPECT_EQ(record->detail, "agent-alice:0123");
    EXPECT_THROW(queue.state("missing"), out_of_range);
}

TEST_F(MemoryQueueTest, ClaimTimesOutTest) {
    memory_queue queue(config);
    auto start = chrono::steady_clock::now();
    EXPECT_FALSE(queue.claim(BUILD_GROUP, "worker-a", chrono::seconds(60), chrono::milliseconds(100)));
    EXPECT_GE(chrono::steady_clock::now() - start, chrono::milliseconds(100));
}

TEST_F(MemoryQueueTest, ClaimWakesUpOnEnqueueTest) {
    memory_queue queue(config);
    thread producer([&] {
        this_thread::sleep_for(chrono::milliseconds(50));
        queue.enqueue(make_match("m-1"));
    });
    auto l = queue.claim(MATCH_GROUP, "worker-a", chrono::seconds(60), chrono::milliseconds(5000));
    producer.join();
    ASSERT_TRUE(l);
    EXPECT_EQ(get<match_job>(l->payload).match_id, "m-1");
}

TEST_F(MemoryQueueTest, GroupsAreSeparateTest) {
    memory_queue queue(config);
    queue.enqueue(make_build("s-1"));
    EXPECT_FALSE(queue.claim(MATCH_GROUP, "worker-a", chrono::seconds(60), chrono::milliseconds(0)));
    EXPECT_TRUE(queue.claim(BUILD_GROUP, "worker-a", chrono::seconds(60), chrono::milliseconds(0)));
}

TEST_F(MemoryQueueTest, SingleHolderTest) {
    memory_queue queue(config);
    queue.enqueue(make_build("s-1"));
    EXPECT_TRUE(queue.claim(BUILD_GROUP, "worker-a", chrono::seconds(60), chrono::milliseconds(0)));
    EXPECT_FALSE(queue.claim(BUILD_GROUP, "worker-b", chrono::seconds(60), chrono::milliseconds(0)));
    EXPECT_EQ(queue.live_leases().size(), 1);
}

TEST_F(MemoryQueueTest, ExpiredLeaseIsCompletedByAnotherWorkerTest) {
    memory_queue queue(config);
    string id = queue.enqueue(make_build("s-1"));

    // worker-a 领取任务后崩溃，不再续约
    auto crashed = queue.claim(BUILD_GROUP, "worker-a", chrono::seconds(1), chrono::milliseconds(0));
    ASSERT_TRUE(crashed);
    EXPECT_FALSE(queue.claim(BUILD_GROUP, "worker-b", chrono::seconds(60), chrono::milliseconds(0)));

    this_thread::sleep_for(chrono::milliseconds(1100));
    auto l = queue.claim(BUILD_GROUP, "worker-b", chrono::seconds(60), chrono::milliseconds(1000));
    ASSERT_TRUE(l);
    EXPECT_EQ(l->job_id, id);
    EXPECT_EQ(l->attempts, 2);
    EXPECT_NE(l->token, crashed->token);

    // 失效的租约不能再改变任务的状态
    EXPECT_FALSE(queue.renew(*crashed, chrono::seconds(60)));
    EXPECT_FALSE(queue.complete(*crashed, "stale"));
    EXPECT_EQ(queue.fail(*crashed, false, "stale"), job_state::CLAIMED);

    EXPECT_TRUE(queue.complete(*l, "done"));
    EXPECT_EQ(queue.state(id), job_state::SUCCEEDED);
}

TEST_F(MemoryQueueTest, RequeueExpiredTest) {
    memory_queue queue(config);
    string id = queue.enqueue(make_build("s-1"));
    auto l = queue.claim(BUILD_GROUP, "worker-a", chrono::seconds(60), chrono::milliseconds(0));
    ASSERT_TRUE(l);

    EXPECT_EQ(queue.requeue_expired(chrono::system_clock::now()), 0);
    EXPECT_EQ(queue.requeue_expired(chrono::system_clock::now() + chrono::seconds(61)), 1);
    EXPECT_EQ(queue.state(id), job_state::ENQUEUED);
    EXPECT_EQ(queue.length(BUILD_GROUP), 1);
}

TEST_F(MemoryQueueTest, RenewExtendsLeaseTest) {
    memory_queue queue(config);
    queue.enqueue(make_build("s-1"));
    auto l = queue.claim(BUILD_GROUP, "worker-a", chrono::seconds(5), chrono::milliseconds(0));
    ASSERT_TRUE(l);
    auto before = l->expires_at;
    this_thread::sleep_for(chrono::milliseconds(20));
    EXPECT_TRUE(queue.renew(*l, chrono::seconds(60)));
    EXPECT_GT(l->expires_at, before);
    EXPECT_EQ(queue.requeue_expired(chrono::system_clock::now() + chrono::seconds(10)), 0);
}

TEST_F(MemoryQueueTest, RetryCeilingTest) {
    config.max_attempts = 3;
    memory_queue queue(config);
    string id = queue.enqueue(make_build("s-1"));

    vector<job_state> states;
    for (int i = 0; i < 3; ++i) {
        auto l = queue.claim(BUILD_GROUP, "worker-a", chrono::seconds(60), chrono::milliseconds(0));
        ASSERT_TRUE(l);
        EXPECT_EQ(l->attempts, i + 1);
        states.push_back(queue.fail(*l, true, "dependency install failed"));
    }
    EXPECT_EQ(states, (vector<job_state>{job_state::ENQUEUED, job_state::ENQUEUED, job_state::FAILED}));
    EXPECT_FALSE(queue.claim(BUILD_GROUP, "worker-a", chrono::seconds(60), chrono::milliseconds(0)));
    EXPECT_EQ(queue.find(id)->attempts, 3);
}

TEST_F(MemoryQueueTest, TerminalFailureTest) {
    memory_queue queue(config);
    string id = queue.enqueue(make_build("s-1"));
    auto l = queue.claim(BUILD_GROUP, "worker-a", chrono::seconds(60), chrono::milliseconds(0));
    ASSERT_TRUE(l);
    EXPECT_EQ(queue.fail(*l, false, "validation failed: no entrypoint"), job_state::FAILED);
    EXPECT_EQ(queue.find(id)->detail, "validation failed: no entrypoint");
}

TEST_F(MemoryQueueTest, ExpiryOnLastAttemptFailsTest) {
    config.max_attempts = 1;
    memory_queue queue(config);
    string id = queue.enqueue(make_build("s-1"));
    ASSERT_TRUE(queue.claim(BUILD_GROUP, "worker-a", chrono::seconds(60), chrono::milliseconds(0)));
    EXPECT_EQ(queue.requeue_expired(chrono::system_clock::now() + chrono::seconds(61)), 0);
    EXPECT_EQ(queue.state(id), job_state::FAILED);
}

TEST_F(MemoryQueueTest, CancelTest) {
    memory_queue queue(config);
    string queued = queue.enqueue(make_match("m-1"));
    string running = queue.enqueue(make_match("m-2"));

    auto l = queue.claim(MATCH_GROUP, "worker-a", chrono::seconds(60), chrono::milliseconds(0));
    ASSERT_TRUE(l);
    ASSERT_EQ(l->job_id, queued);

    EXPECT_TRUE(queue.cancel(running));
    EXPECT_EQ(queue.state(running), job_state::CANCELLED);
    EXPECT_FALSE(queue.claim(MATCH_GROUP, "worker-b", chrono::seconds(60), chrono::milliseconds(0)));

    EXPECT_FALSE(queue.is_cancelled(queued));
    EXPECT_TRUE(queue.cancel(queued));
    EXPECT_TRUE(queue.is_cancelled(queued));
    EXPECT_EQ(queue.state(queued), job_state::CLAIMED);
    EXPECT_EQ(queue.fail(*l, true, "cancelled"), job_state::CANCELLED);

    EXPECT_FALSE(queue.cancel(queued));
    EXPECT_FALSE(queue.cancel("missing"));
}

TEST_F(MemoryQueueTest, FinishedRecordsAreDroppedTest) {
    config.record_ttl = chrono::hours(1);
    memory_queue queue(config);
    string done = queue.enqueue(make_build("s-1"));
    string failed = queue.enqueue(make_build("s-2"));
    string cancelled = queue.enqueue(make_build("s-3"));
    string waiting = queue.enqueue(make_build("s-4"));
    auto first = queue.claim(BUILD_GROUP, "worker-a", chrono::seconds(60), chrono::milliseconds(0));
    auto second = queue.claim(BUILD_GROUP, "worker-a", chrono::seconds(60), chrono::milliseconds(0));
    ASSERT_TRUE(first && second);
    EXPECT_TRUE(queue.complete(*first, "agent-alice:0123"));
    EXPECT_EQ(queue.fail(*second, false, "bad archive"), job_state::FAILED);
    EXPECT_TRUE(queue.cancel(cancelled));

    queue.requeue_expired(chrono::system_clock::now() + chrono::minutes(30));
    EXPECT_TRUE(queue.find(done));
    EXPECT_TRUE(queue.find(cancelled));

    queue.requeue_expired(chrono::system_clock::now() + chrono::hours(2));
    EXPECT_FALSE(queue.find(done));
    EXPECT_FALSE(queue.find(failed));
    EXPECT_FALSE(queue.find(cancelled));
    EXPECT_EQ(queue.state(waiting), job_state::ENQUEUED);
    EXPECT_EQ(queue.length(BUILD_GROUP), 1);
}

TEST_F(MemoryQueueTest, ConcurrentClaimsTest) {
    memory_queue queue(config);
    const int jobs = 200;
    for (int i = 0; i < jobs; ++i) queue.enqueue(make_build("s-" + std::to_string(i)));

    mutex mut;
    multiset<string> claimed;
    vector<thread> workers;
    for (int w = 0; w < 4; ++w) {
        workers.emplace_back([&, w] {
            while (auto l = queue.claim(BUILD_GROUP, "worker-" + std::to_string(w), chrono::seconds(60), chrono::milliseconds(0))) {
                queue.complete(*l, "");
                lock_guard<mutex> guard(mut);
                claimed.insert(l->job_id);
            }
        });
    }
    for (auto &t : workers) t.join();

    EXPECT_EQ(claimed.size(), jobs);
    EXPECT_EQ(set<string>(claimed.begin(), claimed.end()).size(), jobs);
}

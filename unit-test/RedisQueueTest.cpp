#include <atomic>
#include <thread>
#include "common/utils.hpp"
#include "gtest/gtest.h"
#include "queue/redis_queue.hpp"

using namespace std;
using namespace arena;

// 以下测试需要 localhost:6379 上运行的 Redis，每个测试使用独立的键前缀

class RedisQueueTest : public ::testing::Test {
protected:
    void SetUp() override {
        redis.host = "127.0.0.1";
        redis.port = 6379;
        redis.key_prefix = "arena-test-" + random_uuid();
        config.type = "redis";
        config.max_attempts = 2;
        queue = make_unique<redis_queue>(redis, config);
    }

    build_job make_job(const string &submission_id) {
        build_job job;
        job.submission_id = submission_id;
        job.owner_id = "alice";
        return job;
    }

    redis_config redis;
    queue_config config;
    unique_ptr<redis_queue> queue;
};

TEST_F(RedisQueueTest, DISABLED_EnqueueClaimCompleteTest) {
    string id = queue->enqueue(make_job("s-1"));
    EXPECT_EQ(queue->length(BUILD_GROUP), 1);
    EXPECT_EQ(queue->state(id), job_state::ENQUEUED);

    auto held = queue->claim(BUILD_GROUP, "worker-1", chrono::seconds(30), chrono::milliseconds(0));
    ASSERT_TRUE(held);
    EXPECT_EQ(held->job_id, id);
    EXPECT_EQ(held->attempts, 1);
    EXPECT_EQ(get<build_job>(held->payload).submission_id, "s-1");
    EXPECT_EQ(queue->state(id), job_state::CLAIMED);
    EXPECT_EQ(queue->live_leases().size(), 1);

    EXPECT_TRUE(queue->renew(*held, chrono::seconds(30)));
    EXPECT_TRUE(queue->complete(*held, "agent-alice:0123"));
    EXPECT_EQ(queue->state(id), job_state::SUCCEEDED);
    EXPECT_EQ(queue->find(id)->detail, "agent-alice:0123");
    EXPECT_FALSE(queue->complete(*held, "again"));
}

TEST_F(RedisQueueTest, DISABLED_TerminalRecordsExpireTest) {
    config.record_ttl = chrono::seconds(1);
    queue = make_unique<redis_queue>(redis, config);

    string done = queue->enqueue(make_job("s-1"));
    string failed = queue->enqueue(make_job("s-2"));
    string cancelled = queue->enqueue(make_job("s-3"));
    string waiting = queue->enqueue(make_job("s-4"));
    auto first = queue->claim(BUILD_GROUP, "worker-1", chrono::seconds(30), chrono::milliseconds(0));
    auto second = queue->claim(BUILD_GROUP, "worker-1", chrono::seconds(30), chrono::milliseconds(0));
    ASSERT_TRUE(first && second);
    EXPECT_TRUE(queue->complete(*first, "agent-alice:0123"));
    EXPECT_EQ(queue->fail(*second, false, "bad archive"), job_state::FAILED);
    EXPECT_TRUE(queue->cancel(cancelled));

    this_thread::sleep_for(chrono::milliseconds(1500));
    EXPECT_FALSE(queue->find(done));
    EXPECT_FALSE(queue->find(failed));
    EXPECT_FALSE(queue->find(cancelled));
    ASSERT_TRUE(queue->find(waiting));
    EXPECT_EQ(queue->state(waiting), job_state::ENQUEUED);
}

TEST_F(RedisQueueTest, DISABLED_ClaimTimeoutTest) {
    auto begin = chrono::steady_clock::now();
    EXPECT_FALSE(queue->claim(BUILD_GROUP, "worker-1", chrono::seconds(30), chrono::milliseconds(300)));
    EXPECT_GE(chrono::steady_clock::now() - begin, chrono::milliseconds(250));
}

TEST_F(RedisQueueTest, DISABLED_RetryTest) {
    string id = queue->enqueue(make_job("s-1"));
    auto first = queue->claim(BUILD_GROUP, "worker-1", chrono::seconds(30), chrono::milliseconds(0));
    ASSERT_TRUE(first);
    EXPECT_EQ(queue->fail(*first, true, "flaky"), job_state::ENQUEUED);

    auto second = queue->claim(BUILD_GROUP, "worker-2", chrono::seconds(30), chrono::milliseconds(0));
    ASSERT_TRUE(second);
    EXPECT_EQ(second->attempts, 2);
    EXPECT_EQ(queue->fail(*second, true, "flaky"), job_state::FAILED);
    EXPECT_EQ(queue->find(id)->detail, "flaky");
}

TEST_F(RedisQueueTest, DISABLED_ExpiredLeaseTest) {
    string id = queue->enqueue(make_job("s-1"));
    auto stale = queue->claim(BUILD_GROUP, "worker-1", chrono::seconds(1), chrono::milliseconds(0));
    ASSERT_TRUE(stale);
    this_thread::sleep_for(chrono::milliseconds(1100));

    auto fresh = queue->claim(BUILD_GROUP, "worker-2", chrono::seconds(30), chrono::milliseconds(0));
    ASSERT_TRUE(fresh);
    EXPECT_EQ(fresh->job_id, id);
    EXPECT_NE(fresh->token, stale->token);

    EXPECT_FALSE(queue->renew(*stale, chrono::seconds(30)));
    EXPECT_FALSE(queue->complete(*stale, ""));
    EXPECT_TRUE(queue->complete(*fresh, ""));
    EXPECT_EQ(queue->state(id), job_state::SUCCEEDED);
}

TEST_F(RedisQueueTest, DISABLED_CancelTest) {
    string queued = queue->enqueue(make_job("s-1"));
    EXPECT_TRUE(queue->cancel(queued));
    EXPECT_EQ(queue->state(queued), job_state::CANCELLED);
    EXPECT_EQ(queue->length(BUILD_GROUP), 0);

    string running = queue->enqueue(make_job("s-2"));
    auto held = queue->claim(BUILD_GROUP, "worker-1", chrono::seconds(30), chrono::milliseconds(0));
    ASSERT_TRUE(held);
    EXPECT_TRUE(queue->cancel(running));
    EXPECT_TRUE(queue->is_cancelled(running));
    EXPECT_EQ(queue->fail(*held, true, "cancelled"), job_state::CANCELLED);
    EXPECT_FALSE(queue->cancel(running));
}

TEST_F(RedisQueueTest, DISABLED_ConcurrentClaimTest) {
    const int jobs = 50;
    for (int i = 0; i < jobs; ++i) queue->enqueue(make_job("s-" + std::to_string(i)));

    atomic<int> claimed{0};
    vector<thread> workers;
    for (int w = 0; w < 4; ++w) {
        workers.emplace_back([&, w] {
            redis_queue own(redis, config);
            while (auto held = own.claim(BUILD_GROUP, "worker-" + std::to_string(w), chrono::seconds(30), chrono::milliseconds(0))) {
                ++claimed;
                own.complete(*held, "");
            }
        });
    }
    for (auto &t : workers) t.join();
    EXPECT_EQ(claimed.load(), jobs);
}

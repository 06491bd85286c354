#include <cstdlib>
#include <filesystem>
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace std::filesystem;
using namespace arena;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (auto key : {"REDIS_HOST", "REDIS_PORT", "BACKEND_URL", "DOCKER_HOST", "DEBUG"}) unsetenv(key);
    }

    void TearDown() override {
        SetUp();
    }
};

TEST_F(ConfigTest, ShippedSettingsTest) {
    settings config = load_settings("../config/settings.json");
    EXPECT_EQ(config.redis.host, "redis");
    EXPECT_EQ(config.queue.type, "redis");
    EXPECT_EQ(config.queue.lease.count(), 60);
    EXPECT_EQ(config.queue.record_ttl.count(), 7 * 24 * 3600);
    EXPECT_EQ(config.build.timeout.count(), 600);
    EXPECT_EQ(config.build_workers, 2);
    EXPECT_EQ(config.match_workers, 2);
    EXPECT_EQ(config.policy.memory_limit, 512ll << 20);
    EXPECT_EQ(config.policy.default_time_budget.count(), 30);
    EXPECT_EQ(config.policy.env.at("PYTHONUNBUFFERED"), "1");
}

TEST_F(ConfigTest, InlinePolicyAndDefaultsTest) {
    scoped_temp_directory dir(temp_directory_path(), "arena-config-");
    write_file_content(dir.path() / "settings.json", R"({
        "queue": {"type": "memory", "lease": 10},
        "policy": {"memory_limit": "128m", "time_limit": 5}
    })");

    settings config = load_settings(dir.path() / "settings.json");
    EXPECT_EQ(config.queue.type, "memory");
    EXPECT_EQ(config.queue.lease.count(), 10);
    EXPECT_EQ(config.queue.max_attempts, 3);
    EXPECT_EQ(config.queue.record_ttl, chrono::hours(24 * 7));
    EXPECT_EQ(config.policy.memory_limit, 128ll << 20);
    EXPECT_EQ(config.policy.default_time_budget.count(), 5);
    EXPECT_EQ(config.archive.manifest_name, "requirements.txt");
    EXPECT_EQ(config.build_workers, 1);
}

TEST_F(ConfigTest, RejectsInvalidSettingsTest) {
    scoped_temp_directory dir(temp_directory_path(), "arena-config-");
    write_file_content(dir.path() / "queue.json", R"({"queue": {"type": "kafka"}})");
    EXPECT_THROW(load_settings(dir.path() / "queue.json"), invalid_argument);

    write_file_content(dir.path() / "ttl.json", R"({"queue": {"record_ttl": -1}})");
    EXPECT_THROW(load_settings(dir.path() / "ttl.json"), invalid_argument);

    write_file_content(dir.path() / "policy.json", R"({"policy": {"network_mode": "bridge"}})");
    EXPECT_THROW(load_settings(dir.path() / "policy.json"), invalid_argument);

    write_file_content(dir.path() / "type.json", R"({"redis": {"port": "six"}})");
    EXPECT_THROW(load_settings(dir.path() / "type.json"), invalid_argument);

    EXPECT_THROW(load_settings(dir.path() / "missing.json"), runtime_error);
}

TEST_F(ConfigTest, EnvironmentOverrideTest) {
    set_env("REDIS_HOST", "redis.test");
    set_env("REDIS_PORT", "6380");
    set_env("BACKEND_URL", "http://backend.test/api");
    set_env("DOCKER_HOST", "tcp://10.0.0.2:2375");

    settings config = default_settings();
    EXPECT_EQ(config.redis.host, "redis.test");
    EXPECT_EQ(config.redis.port, 6380);
    EXPECT_EQ(config.backend.url, "http://backend.test/api");
    EXPECT_EQ(config.docker.url, "http://10.0.0.2:2375");

    set_env("DOCKER_HOST", "unix:///run/docker.sock");
    config = default_settings();
    EXPECT_EQ(config.docker.socket, "/run/docker.sock");
    EXPECT_TRUE(config.docker.url.empty());
}

TEST_F(ConfigTest, DebugKeepsScratchTest) {
    EXPECT_FALSE(default_settings().build.keep_scratch);
    set_env("DEBUG", "1");
    settings config = default_settings();
    EXPECT_TRUE(config.debug);
    EXPECT_TRUE(config.build.keep_scratch);
}

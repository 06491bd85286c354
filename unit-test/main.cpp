#include <glog/logging.h>
#include "gtest/gtest.h"

/**
 * @brief 测试期间只输出警告以上的日志，全部写到 stderr
 * 测试中大量的失败路径是预期之内的，INFO 日志会淹没真正的失败信息
 */
class ArenaTestEnvironment : public ::testing::Environment {
public:
    void SetUp() override {
        FLAGS_logtostderr = true;
        FLAGS_colorlogtostderr = true;
        FLAGS_minloglevel = google::WARNING;
    }
};

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);
    google::InstallFailureSignalHandler();
    ::testing::InitGoogleTest(&argc, argv);
    ::testing::AddGlobalTestEnvironment(new ArenaTestEnvironment);
    return RUN_ALL_TESTS();
}

#include <gtest/gtest.h>
#include <thread>
#include <vector>
#include "../../src/core/logger/logger.hpp"

using namespace Porter::Core;

TEST(LoggerTest, SetLevel) {
    Logger::set_level(LOG_NONE);
    EXPECT_EQ(Logger::level(), LOG_NONE);
    Logger::info("Test info message - hidden");
    Logger::set_level(LOG_ALL);
}

TEST(LoggerTest, ErrorsGoToStderrWithPrefix) {
    Logger::set_level(LOG_ALL);
    testing::internal::CaptureStderr();
    Logger::error("disk full");
    Logger::warn("slow mirror");
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_NE(err.find("[ERROR] disk full"), std::string::npos);
    EXPECT_NE(err.find("[WARN] slow mirror"), std::string::npos);
}

TEST(LoggerTest, QuietHidesInfoButKeepsReport) {
    Logger::set_level(LOG_QUIET);
    testing::internal::CaptureStdout();
    Logger::info("hidden");
    Logger::success("hidden too");
    Logger::print("  /path/to/report");
    std::string out = testing::internal::GetCapturedStdout();
    Logger::set_level(LOG_ALL);

    EXPECT_EQ(out.find("hidden"), std::string::npos);
    EXPECT_NE(out.find("/path/to/report"), std::string::npos);
}

TEST(LoggerTest, DebugOnlyWhenVerbose) {
    Logger::set_level(LOG_ALL);
    testing::internal::CaptureStdout();
    Logger::debug("exec curl");
    EXPECT_EQ(testing::internal::GetCapturedStdout().find("exec curl"), std::string::npos);

    Logger::set_level(LOG_VERBOSE);
    testing::internal::CaptureStdout();
    Logger::debug("exec curl");
    EXPECT_NE(testing::internal::GetCapturedStdout().find("[DEBUG] exec curl"), std::string::npos);
    Logger::set_level(LOG_ALL);
}

TEST(LoggerTest, StressTest) {
    Logger::set_level(LOG_NONE);
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([]() {
            for (int j = 0; j < 100; ++j) {
                Logger::info("Logging from worker");
            }
        });
    }
    for (auto& t : threads)
        t.join();
    Logger::set_level(LOG_ALL);
}

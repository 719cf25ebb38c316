/**
 * @file test_logger.cpp
 * @brief Unit tests for the Logger infrastructure
 * @author ClipGuard Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 ClipGuard. All rights reserved.
 */

#include <gtest/gtest.h>
#include "ClipGuard/Core/Logger.hpp"
#include "TestHarness.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace ClipGuard::Core;
using namespace ClipGuard::Testing;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        testLogPath_ = tempDir_.file("clipguard_test_logger.log");
    }

    TempDirectory tempDir_;
    std::string testLogPath_;
};

TEST_F(LoggerTest, InitializeAndShutdown) {
    Logger logger;

    EXPECT_TRUE(logger.Initialize(LogLevel::Info, LogOutput::Console));
    EXPECT_TRUE(logger.IsLevelEnabled(LogLevel::Info));
    EXPECT_FALSE(logger.IsLevelEnabled(LogLevel::Debug));

    logger.Shutdown();
    EXPECT_FALSE(logger.IsLevelEnabled(LogLevel::Info));
}

TEST_F(LoggerTest, SecondInitializeIsRejected) {
    Logger logger;

    EXPECT_TRUE(logger.Initialize(LogLevel::Info, LogOutput::Console));
    EXPECT_FALSE(logger.Initialize(LogLevel::Debug, LogOutput::Console));
    EXPECT_EQ(logger.GetMinLevel(), LogLevel::Info);
}

TEST_F(LoggerTest, LogLevelFiltering) {
    Logger logger;
    logger.Initialize(LogLevel::Warning, LogOutput::Console);

    EXPECT_FALSE(logger.IsLevelEnabled(LogLevel::Trace));
    EXPECT_FALSE(logger.IsLevelEnabled(LogLevel::Debug));
    EXPECT_FALSE(logger.IsLevelEnabled(LogLevel::Info));
    EXPECT_TRUE(logger.IsLevelEnabled(LogLevel::Warning));
    EXPECT_TRUE(logger.IsLevelEnabled(LogLevel::Error));
    EXPECT_TRUE(logger.IsLevelEnabled(LogLevel::Critical));
}

TEST_F(LoggerTest, UninitializedLoggerDropsMessages) {
    Logger logger;

    CLIPGUARD_LOG_ERROR(logger, "nobody listens");

    auto stats = logger.GetStatistics();
    EXPECT_EQ(stats.error, 0u);
    EXPECT_EQ(stats.dropped, 1u);
}

TEST_F(LoggerTest, FileOutput) {
    Logger logger;
    ASSERT_TRUE(logger.Initialize(LogLevel::Debug, LogOutput::File, testLogPath_));

    logger.Log(LogLevel::Info, "Test message 1");
    logger.Log(LogLevel::Error, "Test message 2");
    logger.Flush();

    std::ifstream in(testLogPath_);
    ASSERT_TRUE(in.good());
    std::stringstream content;
    content << in.rdbuf();

    EXPECT_NE(content.str().find("Test message 1"), std::string::npos);
    EXPECT_NE(content.str().find("Test message 2"), std::string::npos);
}

TEST_F(LoggerTest, CallbackReceivesFormattedMessages) {
    Logger logger;
    std::vector<std::pair<LogLevel, std::string>> received;
    logger.SetCallback([&](LogLevel level, std::string_view message,
                           std::chrono::system_clock::time_point) {
        received.emplace_back(level, std::string(message));
    });
    ASSERT_TRUE(logger.Initialize(LogLevel::Info, LogOutput::Callback));

    CLIPGUARD_LOG_WARNING_F(logger, "Item %s failed (%d)", "abc", 42);
    CLIPGUARD_LOG_DEBUG(logger, "filtered");

    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0].first, LogLevel::Warning);
    EXPECT_NE(received[0].second.find("Item abc failed (42)"), std::string::npos);
}

TEST_F(LoggerTest, StatisticsCountPerLevel) {
    Logger logger;
    logger.Initialize(LogLevel::Info, LogOutput::Callback);

    logger.Log(LogLevel::Info, "a");
    logger.Log(LogLevel::Info, "b");
    logger.Log(LogLevel::Error, "c");
    logger.Log(LogLevel::Debug, "d");

    auto stats = logger.GetStatistics();
    EXPECT_EQ(stats.info, 2u);
    EXPECT_EQ(stats.error, 1u);
    EXPECT_EQ(stats.debug, 0u);
    EXPECT_EQ(stats.dropped, 1u);

    logger.ResetStatistics();
    EXPECT_EQ(logger.GetStatistics().info, 0u);
}

TEST_F(LoggerTest, SetMinLevelAtRuntime) {
    Logger logger;
    logger.Initialize(LogLevel::Error, LogOutput::Callback);
    EXPECT_FALSE(logger.IsLevelEnabled(LogLevel::Info));

    logger.SetMinLevel(LogLevel::Debug);
    EXPECT_TRUE(logger.IsLevelEnabled(LogLevel::Debug));
    EXPECT_EQ(logger.GetMinLevel(), LogLevel::Debug);
}

TEST(LogLevelParsing, KnownNamesAnyCase) {
    EXPECT_EQ(parseLogLevel("trace"), LogLevel::Trace);
    EXPECT_EQ(parseLogLevel("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parseLogLevel("Warning"), LogLevel::Warning);
    EXPECT_EQ(parseLogLevel("warn"), LogLevel::Warning);
    EXPECT_EQ(parseLogLevel("error"), LogLevel::Error);
    EXPECT_EQ(parseLogLevel("critical"), LogLevel::Critical);
    EXPECT_EQ(parseLogLevel("off"), LogLevel::Off);
}

TEST(LogLevelParsing, UnknownNameFallsBackToInfo) {
    EXPECT_EQ(parseLogLevel("verbose"), LogLevel::Info);
    EXPECT_EQ(parseLogLevel(""), LogLevel::Info);
}

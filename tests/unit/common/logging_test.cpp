/// @file logging_test.cpp
/// @brief Tests for driftwatch logging utilities

#include <gtest/gtest.h>

#include "common/logging.h"

namespace driftwatch {
namespace {

TEST(LoggingTest, InitializeLogging) {
    LogConfig config;
    config.name = "test-logger";
    config.level = LogLevel::kDebug;

    EXPECT_NO_THROW(InitLogging(config));
    EXPECT_NE(GetLogger(), nullptr);
}

TEST(LoggingTest, ParseLogLevel) {
    EXPECT_EQ(ParseLogLevel("trace"), LogLevel::kTrace);
    EXPECT_EQ(ParseLogLevel("DEBUG"), LogLevel::kDebug);
    EXPECT_EQ(ParseLogLevel("warning"), LogLevel::kWarn);
    EXPECT_EQ(ParseLogLevel("error"), LogLevel::kError);
    EXPECT_EQ(ParseLogLevel("off"), LogLevel::kOff);
    EXPECT_EQ(ParseLogLevel("verbose"), LogLevel::kInfo);
}

TEST(LoggingTest, LogLevelChange) {
    InitLogging();

    EXPECT_NO_THROW(SetLogLevel(LogLevel::kWarn));
    EXPECT_EQ(GetLogger()->level(), spdlog::level::warn);
    EXPECT_NO_THROW(SetLogLevel(LogLevel::kDebug));
    EXPECT_EQ(GetLogger()->level(), spdlog::level::debug);
}

TEST(LoggingTest, LoggingMacros) {
    InitLogging();

    // These should not throw
    EXPECT_NO_THROW({
        DRIFTWATCH_LOG_TRACE("Trace message: {}", 1);
        DRIFTWATCH_LOG_DEBUG("Debug message: {}", 2);
        DRIFTWATCH_LOG_INFO("Info message: {}", 3);
        DRIFTWATCH_LOG_WARN("Warn message: {}", 4);
        DRIFTWATCH_LOG_ERROR("Error message: {}", 5);
    });
}

TEST(LoggingTest, FlushLogs) {
    InitLogging();
    DRIFTWATCH_LOG_INFO("Test message");
    EXPECT_NO_THROW(FlushLogs());
}

TEST(LoggingTest, ReinitializeAfterShutdown) {
    InitLogging();
    ShutdownLogging();

    EXPECT_NE(GetLogger(), nullptr);
    EXPECT_NO_THROW(DRIFTWATCH_LOG_INFO("Logging after shutdown"));
}

}  // namespace
}  // namespace driftwatch

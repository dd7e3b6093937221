#include "utils/black_bars_logger.hpp"
#include "utils/logging.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace {

namespace logger = black_bars::logger;

std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    std::stringstream contents;
    contents << file.rdbuf();
    return contents.str();
}

class LoggerTest : public ::testing::Test {
   protected:
    void SetUp() override {
        log_path_ = std::filesystem::temp_directory_path() / "black_bars_logger_test" / "BlackBars.log";
        std::filesystem::remove_all(log_path_.parent_path());

        logger::SetConsoleEcho(false);
        logger::SetMinLevel(logger::LogLevel::Debug);
        logger::Initialize(log_path_.string());
    }

    void TearDown() override {
        logger::Shutdown();
        logger::SetMinLevel(logger::LogLevel::Info);
        logger::SetConsoleEcho(true);
        std::filesystem::remove_all(log_path_.parent_path());
    }

    std::filesystem::path log_path_;
};

TEST_F(LoggerTest, CreatesDirectoryAndFile) {
    EXPECT_TRUE(logger::BlackBarsLogger::GetInstance().IsInitialized());
    logger::FlushLogs();
    EXPECT_TRUE(std::filesystem::exists(log_path_));
}

TEST_F(LoggerTest, WritesFormattedLines) {
    LogInfo("Monitoring for window: '%s'", "Game");
    LogWarn("Poll interval %d clamped", 5);
    LogError("Failed: %lu", 87ul);
    logger::FlushLogs();

    const std::string contents = ReadFile(log_path_);
    EXPECT_NE(contents.find("| INFO  | Monitoring for window: 'Game'\r\n"), std::string::npos);
    EXPECT_NE(contents.find("| WARN  | Poll interval 5 clamped\r\n"), std::string::npos);
    EXPECT_NE(contents.find("| ERROR | Failed: 87\r\n"), std::string::npos);
}

TEST_F(LoggerTest, MinLevelFiltersMessages) {
    logger::SetMinLevel(logger::LogLevel::Warning);
    LogDebug("debug line");
    LogInfo("info line");
    LogWarn("warn line");
    logger::FlushLogs();

    const std::string contents = ReadFile(log_path_);
    EXPECT_EQ(contents.find("debug line"), std::string::npos);
    EXPECT_EQ(contents.find("info line"), std::string::npos);
    EXPECT_NE(contents.find("warn line"), std::string::npos);
}

TEST_F(LoggerTest, DebugWrittenWhenEnabled) {
    LogDebug("overlay %p", static_cast<void*>(nullptr));
    logger::FlushLogs();

    EXPECT_NE(ReadFile(log_path_).find("| DEBUG | overlay"), std::string::npos);
}

TEST_F(LoggerTest, EmbeddedNewlinesBecomeCrlf) {
    LogInfo("first\nsecond");
    logger::FlushLogs();

    const std::string contents = ReadFile(log_path_);
    EXPECT_NE(contents.find("first\r\nsecond\r\n"), std::string::npos);
}

TEST_F(LoggerTest, ShutdownFlushesAndAppendsOnReinitialize) {
    LogInfo("before shutdown");
    logger::Shutdown();
    EXPECT_FALSE(logger::BlackBarsLogger::GetInstance().IsInitialized());

    const std::string after_shutdown = ReadFile(log_path_);
    EXPECT_NE(after_shutdown.find("before shutdown"), std::string::npos);
    EXPECT_NE(after_shutdown.find("BlackBars Logger shutting down"), std::string::npos);

    // Dropped: not initialized
    LogInfo("while stopped");

    logger::Initialize(log_path_.string());
    LogInfo("after restart");
    logger::FlushLogs();

    const std::string contents = ReadFile(log_path_);
    EXPECT_EQ(contents.find("while stopped"), std::string::npos);
    EXPECT_EQ(contents.rfind(after_shutdown, 0), 0u);
    EXPECT_NE(contents.find("after restart"), std::string::npos);
}

TEST_F(LoggerTest, ThrottledDebugStopsAfterLimit) {
    for (int i = 0; i < 5; ++i) {
        LogDebugThrottled(2, "throttled debug %d", i);
    }
    logger::FlushLogs();

    const std::string contents = ReadFile(log_path_);
    EXPECT_NE(contents.find("throttled debug 0"), std::string::npos);
    EXPECT_NE(contents.find("throttled debug 1"), std::string::npos);
    EXPECT_EQ(contents.find("throttled debug 2"), std::string::npos);
    EXPECT_NE(contents.find("Suppressing further occurrences"), std::string::npos);
}

TEST(LogLevelTest, ParsesNamesCaseInsensitively) {
    EXPECT_EQ(logger::ParseLogLevel("DEBUG"), logger::LogLevel::Debug);
    EXPECT_EQ(logger::ParseLogLevel("Info"), logger::LogLevel::Info);
    EXPECT_EQ(logger::ParseLogLevel("warning"), logger::LogLevel::Warning);
    EXPECT_EQ(logger::ParseLogLevel("warn"), logger::LogLevel::Warning);
    EXPECT_EQ(logger::ParseLogLevel("error"), logger::LogLevel::Error);
    EXPECT_FALSE(logger::ParseLogLevel("").has_value());
}

}  // anonymous namespace

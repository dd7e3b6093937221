#include "config/black_bars_config.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

namespace {

using black_bars::config::BlackBarsConfig;
using black_bars::config::LoadConfig;
using black_bars::config::ParseConfig;
using black_bars::logger::LogLevel;
namespace config = black_bars::config;

void ExpectDefaults(const BlackBarsConfig& cfg) {
    EXPECT_EQ(cfg.target_window_title, config::kDefaultTargetWindowTitle);
    EXPECT_EQ(cfg.poll_interval_ms, config::kDefaultPollIntervalMs);
    EXPECT_TRUE(cfg.hide_launcher_control);
    EXPECT_EQ(cfg.log_level, LogLevel::Info);
}

TEST(ConfigTest, DefaultsMatchBuiltInValues) {
    BlackBarsConfig cfg;
    EXPECT_EQ(cfg.target_window_title, "League of Legends (TM) Client");
    EXPECT_EQ(cfg.poll_interval_ms, 100u);
}

TEST(ConfigTest, ReadsAllKeys) {
    const auto cfg = ParseConfig(R"(
[BlackBars]
TargetWindowTitle = "Dota 2"
PollIntervalMs = 250
HideLauncherControl = false
LogLevel = "debug"
)",
                                 "test.toml");

    EXPECT_EQ(cfg.target_window_title, "Dota 2");
    EXPECT_EQ(cfg.poll_interval_ms, 250u);
    EXPECT_FALSE(cfg.hide_launcher_control);
    EXPECT_EQ(cfg.log_level, LogLevel::Debug);
}

TEST(ConfigTest, MissingKeysKeepDefaults) {
    const auto cfg = ParseConfig("[BlackBars]\nPollIntervalMs = 40\n", "test.toml");

    EXPECT_EQ(cfg.poll_interval_ms, 40u);
    EXPECT_EQ(cfg.target_window_title, config::kDefaultTargetWindowTitle);
    EXPECT_TRUE(cfg.hide_launcher_control);
}

TEST(ConfigTest, MissingSectionUsesDefaults) {
    ExpectDefaults(ParseConfig("[Other]\nPollIntervalMs = 40\n", "test.toml"));
    ExpectDefaults(ParseConfig("", "test.toml"));
}

TEST(ConfigTest, MalformedDocumentUsesDefaults) {
    ExpectDefaults(ParseConfig("[BlackBars\nPollIntervalMs = = 5\n", "broken.toml"));
}

TEST(ConfigTest, PollIntervalIsClamped) {
    EXPECT_EQ(ParseConfig("[BlackBars]\nPollIntervalMs = 1\n", "t").poll_interval_ms, config::kMinPollIntervalMs);
    EXPECT_EQ(ParseConfig("[BlackBars]\nPollIntervalMs = -50\n", "t").poll_interval_ms, config::kMinPollIntervalMs);
    EXPECT_EQ(ParseConfig("[BlackBars]\nPollIntervalMs = 60000\n", "t").poll_interval_ms, config::kMaxPollIntervalMs);
}

TEST(ConfigTest, InvalidValuesFallBackPerKey) {
    const auto cfg = ParseConfig(R"(
[BlackBars]
TargetWindowTitle = ""
PollIntervalMs = "fast"
HideLauncherControl = "no"
LogLevel = "verbose"
)",
                                 "test.toml");

    ExpectDefaults(cfg);
}

TEST(ConfigTest, LogLevelNames) {
    EXPECT_EQ(ParseConfig("[BlackBars]\nLogLevel = \"WARN\"\n", "t").log_level, LogLevel::Warning);
    EXPECT_EQ(ParseConfig("[BlackBars]\nLogLevel = \"Error\"\n", "t").log_level, LogLevel::Error);
    EXPECT_FALSE(black_bars::logger::ParseLogLevel("trace").has_value());
}

TEST(ConfigTest, MissingFileUsesDefaults) {
    const auto path = std::filesystem::temp_directory_path() / "black_bars_config_test_missing.toml";
    std::filesystem::remove(path);

    ExpectDefaults(LoadConfig(path.string()));
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST(ConfigTest, LoadsFileFromDisk) {
    const auto path = std::filesystem::temp_directory_path() / "black_bars_config_test.toml";
    {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        file << "[BlackBars]\nTargetWindowTitle = \"Valorant\"\n";
    }

    const auto cfg = LoadConfig(path.string());
    std::filesystem::remove(path);

    EXPECT_EQ(cfg.target_window_title, "Valorant");
    EXPECT_EQ(cfg.poll_interval_ms, config::kDefaultPollIntervalMs);
}

TEST(ConfigTest, DefaultPathIsBesideExecutable) {
    const std::filesystem::path path = config::GetDefaultConfigPath();

    EXPECT_EQ(path.filename().string(), config::kConfigFileName);
    EXPECT_EQ(path.parent_path().string(), config::GetExecutableDirectory());
}

}  // anonymous namespace

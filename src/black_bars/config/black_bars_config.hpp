#pragma once

#include "../utils/black_bars_logger.hpp"

#include <cstdint>
#include <string>

namespace black_bars::config {

// Built-in defaults, used when no settings file is present
constexpr const char* kDefaultTargetWindowTitle = "League of Legends (TM) Client";
constexpr uint32_t kDefaultPollIntervalMs = 100;
constexpr uint32_t kMinPollIntervalMs = 10;
constexpr uint32_t kMaxPollIntervalMs = 5000;

constexpr const char* kConfigSection = "BlackBars";
constexpr const char* kConfigFileName = "BlackBars.toml";
constexpr const char* kLogFileName = "BlackBars.log";

struct BlackBarsConfig {
    std::string target_window_title = kDefaultTargetWindowTitle;
    uint32_t poll_interval_ms = kDefaultPollIntervalMs;
    bool hide_launcher_control = true;
    logger::LogLevel log_level = logger::LogLevel::Info;
};

// Directory containing the running executable (current directory if unknown)
std::string GetExecutableDirectory();

// <exe dir>/BlackBars.toml
std::string GetDefaultConfigPath();

// Reads the [BlackBars] section of a TOML file. The file is optional and never written:
// a missing file yields the defaults, a malformed file or value is logged and replaced by its default.
BlackBarsConfig LoadConfig(const std::string& path);

// Same as LoadConfig, from an in-memory document (source_name is used in log messages)
BlackBarsConfig ParseConfig(const std::string& toml_text, const std::string& source_name);

}  // namespace black_bars::config

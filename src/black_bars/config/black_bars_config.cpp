#include "black_bars_config.hpp"
#include "../utils/logging.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <toml++/toml.hpp>

#ifdef _WIN32
#include <windows.h>
#endif

namespace black_bars::config {

namespace {

void ApplySection(const toml::table& section, const std::string& source_name, BlackBarsConfig& config) {
    if (auto node = section["TargetWindowTitle"]) {
        auto title = node.value<std::string>();
        if (title && !title->empty()) {
            config.target_window_title = *title;
        } else {
            LogWarn("%s: TargetWindowTitle must be a non-empty string, using \"%s\"", source_name.c_str(),
                    config.target_window_title.c_str());
        }
    }

    if (auto node = section["PollIntervalMs"]) {
        auto interval = node.value<int64_t>();
        if (!interval) {
            LogWarn("%s: PollIntervalMs must be an integer, using %u", source_name.c_str(), config.poll_interval_ms);
        } else if (*interval < kMinPollIntervalMs || *interval > kMaxPollIntervalMs) {
            int64_t clamped = *interval < kMinPollIntervalMs ? kMinPollIntervalMs : kMaxPollIntervalMs;
            LogWarn("%s: PollIntervalMs %lld out of range [%u, %u], clamped to %lld", source_name.c_str(),
                    static_cast<long long>(*interval), kMinPollIntervalMs, kMaxPollIntervalMs,
                    static_cast<long long>(clamped));
            config.poll_interval_ms = static_cast<uint32_t>(clamped);
        } else {
            config.poll_interval_ms = static_cast<uint32_t>(*interval);
        }
    }

    if (auto node = section["HideLauncherControl"]) {
        if (auto hide = node.value<bool>()) {
            config.hide_launcher_control = *hide;
        } else {
            LogWarn("%s: HideLauncherControl must be true or false", source_name.c_str());
        }
    }

    if (auto node = section["LogLevel"]) {
        auto name = node.value<std::string>();
        auto level = name ? logger::ParseLogLevel(*name) : std::nullopt;
        if (level) {
            config.log_level = *level;
        } else {
            LogWarn("%s: LogLevel must be one of debug, info, warning, error", source_name.c_str());
        }
    }
}

}  // anonymous namespace

std::string GetExecutableDirectory() {
#ifdef _WIN32
    char exe_path[MAX_PATH];
    DWORD path_length = GetModuleFileNameA(nullptr, exe_path, MAX_PATH);
    if (path_length > 0 && path_length < MAX_PATH) {
        return std::filesystem::path(exe_path).parent_path().string();
    }
#else
    std::error_code ec;
    auto exe_path = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (!ec) {
        return exe_path.parent_path().string();
    }
#endif
    return std::filesystem::current_path().string();
}

std::string GetDefaultConfigPath() { return (std::filesystem::path(GetExecutableDirectory()) / kConfigFileName).string(); }

BlackBarsConfig ParseConfig(const std::string& toml_text, const std::string& source_name) {
    BlackBarsConfig config;
    try {
        toml::table tbl = toml::parse(toml_text, source_name);
        const toml::table* section = tbl[kConfigSection].as_table();
        if (section == nullptr) {
            LogWarn("%s: no [%s] section, using defaults", source_name.c_str(), kConfigSection);
            return config;
        }
        ApplySection(*section, source_name, config);
    } catch (const toml::parse_error& e) {
        LogWarn("%s: parse error at line %u: %s, using defaults", source_name.c_str(),
                static_cast<unsigned>(e.source().begin.line), std::string(e.description()).c_str());
        return BlackBarsConfig{};
    }
    return config;
}

BlackBarsConfig LoadConfig(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        LogDebug("Config file %s not found, using built-in defaults", path.c_str());
        return BlackBarsConfig{};
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        LogWarn("Failed to open config file %s, using built-in defaults", path.c_str());
        return BlackBarsConfig{};
    }

    std::stringstream contents;
    contents << file.rdbuf();
    LogInfo("Loaded settings from %s", path.c_str());
    return ParseConfig(contents.str(), path);
}

}  // namespace black_bars::config

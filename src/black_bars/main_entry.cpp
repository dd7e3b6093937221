#include "command_line.hpp"
#include "config/black_bars_config.hpp"
#include "continuous_monitoring.hpp"
#include "focus/focus_state_machine.hpp"
#include "overlay/overlay_surface.hpp"
#include "process_exit_hooks.hpp"
#include "taskbar/taskbar_visibility.hpp"
#include "utils/black_bars_logger.hpp"
#include "utils/logging.hpp"
#include "version.hpp"
#include "window_api/win32_window_api.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include <windows.h>

namespace {

// Only touched from atexit / the unhandled exception filter while the monitoring objects are alive
std::atomic<black_bars::taskbar::TaskbarVisibility*> g_emergency_taskbar{nullptr};

void EmergencyRestore() {
    if (auto* taskbar = g_emergency_taskbar.load()) {
        taskbar->Show();
    }
}

void PrintBanner(const black_bars::config::BlackBarsConfig& config) {
    const std::string rule(40, '=');
    LogInfo("%s", BLACK_BARS_FULL_VERSION);
    LogInfo("%s", rule.c_str());
    LogInfo("Monitoring for window: '%s'", config.target_window_title.c_str());
    LogInfo("Poll interval: %ums", config.poll_interval_ms);
    LogInfo("Press Ctrl+C to exit");
    LogInfo("%s", rule.c_str());
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    black_bars::CommandLineOptions options;
    if (!black_bars::ParseCommandLine(std::vector<std::string>(argv + 1, argv + argc), options, std::cerr)) {
        return 1;
    }
    if (options.show_help) {
        black_bars::PrintUsage(std::cout);
        return 0;
    }
    if (options.show_version) {
        std::cout << BLACK_BARS_FULL_VERSION << std::endl;
        return 0;
    }

    const std::string exe_dir = black_bars::config::GetExecutableDirectory();
    black_bars::logger::Initialize((std::filesystem::path(exe_dir) / black_bars::config::kLogFileName).string());

    const std::string config_path =
        options.config_path.empty() ? black_bars::config::GetDefaultConfigPath() : options.config_path;
    const black_bars::config::BlackBarsConfig config = black_bars::config::LoadConfig(config_path);
    black_bars::logger::SetMinLevel(config.log_level);

    black_bars::window_api::SetMonitorDpiAwareness();

    int exit_code = continuous_monitoring::kExitClean;
    {
        black_bars::window_api::Win32WindowApi api;
        black_bars::overlay::OverlaySurface overlay(api);
        black_bars::taskbar::TaskbarVisibility taskbar(api, config.hide_launcher_control);
        black_bars::focus::FocusStateMachine state_machine(api, overlay, taskbar, config.target_window_title);

        g_emergency_taskbar.store(&taskbar);
        process_exit_hooks::Initialize(&EmergencyRestore);

        PrintBanner(config);

        exit_code = continuous_monitoring::Run(api, state_machine, overlay, taskbar,
                                               process_exit_hooks::ShutdownRequestedFlag(),
                                               std::chrono::milliseconds(config.poll_interval_ms));

        process_exit_hooks::Shutdown();
        g_emergency_taskbar.store(nullptr);
    }

    if (process_exit_hooks::IsShutdownRequested()) {
        LogDebug("Shutdown requested by %s",
                 process_exit_hooks::GetExitSourceString(process_exit_hooks::GetShutdownSource()));
    }

    black_bars::logger::Shutdown();

    // Releases a console close handler waiting for the desktop to be restored
    process_exit_hooks::NotifyRestoreComplete();
    return exit_code;
}

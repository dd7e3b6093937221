#include "continuous_monitoring.hpp"
#include "desktop_restore.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <exception>
#include <thread>

namespace continuous_monitoring {

using black_bars::focus::FocusState;

bool SleepUnlessStopped(std::chrono::milliseconds duration, const std::atomic<bool>& stop_requested) {
    auto remaining = duration;
    while (remaining.count() > 0) {
        if (stop_requested.load()) {
            return false;
        }
        auto slice = std::min(remaining, kMaxSleepSlice);
        std::this_thread::sleep_for(slice);
        remaining -= slice;
    }
    return !stop_requested.load();
}

int Run(black_bars::window_api::WindowApi& api, black_bars::focus::FocusStateMachine& state_machine,
        black_bars::overlay::OverlaySurface& overlay, black_bars::taskbar::TaskbarVisibility& taskbar,
        const std::atomic<bool>& stop_requested, std::chrono::milliseconds poll_interval, MonitoringStats* stats) {
    MonitoringStats local_stats;
    MonitoringStats& s = stats != nullptr ? *stats : local_stats;

    desktop_restore::DesktopRestoreGuard restore_guard(overlay, taskbar, &state_machine);
    int exit_code = kExitClean;

    LogDebug("Continuous monitoring started (interval %lld ms)", static_cast<long long>(poll_interval.count()));

    try {
        while (!stop_requested.load()) {
            api.PumpMessages();

            const FocusState before = state_machine.State();
            const FocusState after = state_machine.Tick(api.GetForegroundWindow());
            ++s.ticks;
            if (before != after) {
                if (after == FocusState::Active) {
                    ++s.activations;
                } else {
                    ++s.deactivations;
                }
            }

            SleepUnlessStopped(poll_interval, stop_requested);
        }
    } catch (const std::exception& e) {
        LogError("%s", e.what());
        exit_code = kExitError;
    } catch (...) {
        LogError("Unknown error in monitoring loop");
        exit_code = kExitError;
    }

    LogDebug("Continuous monitoring stopped after %llu ticks (%llu activations, %llu deactivations)",
             static_cast<unsigned long long>(s.ticks), static_cast<unsigned long long>(s.activations),
             static_cast<unsigned long long>(s.deactivations));

    restore_guard.Restore();
    return exit_code;
}

}  // namespace continuous_monitoring

#pragma once

#include "focus/focus_state_machine.hpp"
#include "overlay/overlay_surface.hpp"
#include "taskbar/taskbar_visibility.hpp"
#include "window_api/window_api.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>

namespace continuous_monitoring {

// Exit codes returned by Run()
constexpr int kExitClean = 0;
constexpr int kExitError = 1;

// Longest single sleep between shutdown flag checks
constexpr std::chrono::milliseconds kMaxSleepSlice{50};

struct MonitoringStats {
    uint64_t ticks = 0;
    uint64_t activations = 0;
    uint64_t deactivations = 0;
};

// Sleeps for duration in slices of at most kMaxSleepSlice, returning early once stop_requested is set.
// Returns true if the full duration elapsed.
bool SleepUnlessStopped(std::chrono::milliseconds duration, const std::atomic<bool>& stop_requested);

// Polls the foreground window every poll_interval on the calling thread and feeds it to state_machine
// until stop_requested is set. The desktop is restored (task bar shown, overlay destroyed) on every
// exit path. Returns kExitClean after a shutdown request, kExitError after an unhandled error.
int Run(black_bars::window_api::WindowApi& api, black_bars::focus::FocusStateMachine& state_machine,
        black_bars::overlay::OverlaySurface& overlay, black_bars::taskbar::TaskbarVisibility& taskbar,
        const std::atomic<bool>& stop_requested, std::chrono::milliseconds poll_interval,
        MonitoringStats* stats = nullptr);

}  // namespace continuous_monitoring

#pragma once

#include "../overlay/overlay_surface.hpp"
#include "../taskbar/taskbar_visibility.hpp"
#include "../window_api/window_api.hpp"

#include <string>

namespace black_bars::focus {

enum class FocusState { Inactive, Active };

const char* FocusStateName(FocusState state);

// Two-state controller synchronizing the overlay and task bar with the target window's focus.
//
// Inactive -> Active when the foreground window is the target and not minimized (and its
// monitor rect resolves); Active -> Inactive on any other sample. While Inactive the overlay
// (if any) is hidden and the task bar shown; while Active the overlay sits behind the target
// and the task bar is hidden.
class FocusStateMachine {
   public:
    FocusStateMachine(window_api::WindowApi& api, overlay::OverlaySurface& overlay,
                      taskbar::TaskbarVisibility& taskbar, std::string target_title);

    // Samples the given foreground window and transitions if needed. Returns the resulting state.
    FocusState Tick(window_api::WindowHandle foreground_hwnd);

    // Enters Active for target_hwnd. Stays Inactive (returns false) if the monitor rect
    // cannot be resolved or the overlay cannot be created or placed.
    bool Activate(window_api::WindowHandle target_hwnd);

    // Hides the overlay and shows the task bar. Idempotent.
    void Deactivate();

    // Back to Inactive without touching the desktop (after the desktop was restored elsewhere)
    void Reset();

    bool IsTargetWindow(window_api::WindowHandle hwnd);

    bool IsActive() const { return state_ == FocusState::Active; }
    FocusState State() const { return state_; }
    const std::string& TargetTitle() const { return target_title_; }
    int MonitorWarningsLogged() const { return monitor_failures_; }

   private:
    window_api::WindowApi& api_;
    overlay::OverlaySurface& overlay_;
    taskbar::TaskbarVisibility& taskbar_;
    const std::string target_title_;
    FocusState state_ = FocusState::Inactive;
    int monitor_failures_ = 0;
};

}  // namespace black_bars::focus

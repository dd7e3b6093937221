#include "focus_state_machine.hpp"
#include "../utils/logging.hpp"

#include <utility>

namespace black_bars::focus {

namespace {

// Monitor lookup warnings per focus episode
constexpr int kMaxMonitorWarnings = 10;

}  // anonymous namespace

using window_api::kNullWindow;
using window_api::WindowHandle;

const char* FocusStateName(FocusState state) {
    switch (state) {
        case FocusState::Inactive: return "Inactive";
        case FocusState::Active:   return "Active";
        default:                   return "Unknown";
    }
}

FocusStateMachine::FocusStateMachine(window_api::WindowApi& api, overlay::OverlaySurface& overlay,
                                     taskbar::TaskbarVisibility& taskbar, std::string target_title)
    : api_(api), overlay_(overlay), taskbar_(taskbar), target_title_(std::move(target_title)) {}

bool FocusStateMachine::IsTargetWindow(WindowHandle hwnd) {
    if (hwnd == kNullWindow) {
        return false;
    }
    return api_.GetWindowTitle(hwnd) == target_title_;
}

FocusState FocusStateMachine::Tick(WindowHandle foreground_hwnd) {
    const bool target_focused = IsTargetWindow(foreground_hwnd) && !api_.IsMinimized(foreground_hwnd);

    if (target_focused) {
        if (state_ == FocusState::Inactive) {
            Activate(foreground_hwnd);
        }
    } else {
        monitor_failures_ = 0;
        if (state_ == FocusState::Active) {
            Deactivate();
        }
    }
    return state_;
}

bool FocusStateMachine::Activate(WindowHandle target_hwnd) {
    auto monitor_rect = api_.GetMonitorRect(target_hwnd);
    if (!monitor_rect) {
        if (monitor_failures_ < kMaxMonitorWarnings) {
            ++monitor_failures_;
            LogWarn("Could not determine monitor for window '%s'", target_title_.c_str());
            if (monitor_failures_ == kMaxMonitorWarnings) {
                LogWarn("(Suppressing further monitor lookup warnings until focus changes)");
            }
        }
        return false;
    }
    monitor_failures_ = 0;

    if (!overlay_.EnsureCreated(*monitor_rect)) {
        return false;
    }

    if (!overlay_.PlaceBehind(target_hwnd)) {
        // Keep the Inactive invariant: nothing visible, task bar untouched
        overlay_.Hide();
        return false;
    }

    taskbar_.Hide();
    state_ = FocusState::Active;
    LogInfo("Black bars activated on monitor: (%ld, %ld, %ld, %ld)", monitor_rect->left, monitor_rect->top,
            monitor_rect->right, monitor_rect->bottom);
    return true;
}

void FocusStateMachine::Deactivate() {
    overlay_.Hide();
    taskbar_.Show();
    if (state_ == FocusState::Active) {
        state_ = FocusState::Inactive;
        LogInfo("Black bars deactivated");
    }
}

void FocusStateMachine::Reset() {
    state_ = FocusState::Inactive;
    monitor_failures_ = 0;
}

}  // namespace black_bars::focus

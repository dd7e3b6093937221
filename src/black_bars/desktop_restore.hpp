#pragma once

#include "focus/focus_state_machine.hpp"
#include "overlay/overlay_surface.hpp"
#include "taskbar/taskbar_visibility.hpp"

namespace desktop_restore {

// Unconditional restoration: show the task bar, destroy the overlay (if any) and clear its handle.
// Safe to call any number of times, with or without an overlay.
void RestoreDesktop(black_bars::overlay::OverlaySurface& overlay, black_bars::taskbar::TaskbarVisibility& taskbar);

// Scoped guard around the monitoring loop: runs RestoreDesktop() exactly once, either on an explicit
// Restore() or when the guard goes out of scope (normal return, shutdown request or exception unwinding).
// A state machine passed in is reset to Inactive once the desktop is restored.
class DesktopRestoreGuard {
   public:
    DesktopRestoreGuard(black_bars::overlay::OverlaySurface& overlay, black_bars::taskbar::TaskbarVisibility& taskbar,
                        black_bars::focus::FocusStateMachine* state_machine = nullptr);
    ~DesktopRestoreGuard();

    DesktopRestoreGuard(const DesktopRestoreGuard&) = delete;
    DesktopRestoreGuard& operator=(const DesktopRestoreGuard&) = delete;

    void Restore();
    bool IsRestored() const { return restored_; }

   private:
    black_bars::overlay::OverlaySurface& overlay_;
    black_bars::taskbar::TaskbarVisibility& taskbar_;
    black_bars::focus::FocusStateMachine* state_machine_;
    bool restored_ = false;
};

}  // namespace desktop_restore

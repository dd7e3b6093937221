#include "desktop_restore.hpp"
#include "utils/logging.hpp"

namespace desktop_restore {

void RestoreDesktop(black_bars::overlay::OverlaySurface& overlay, black_bars::taskbar::TaskbarVisibility& taskbar) {
    LogInfo("Cleaning up...");

    taskbar.Show();
    overlay.Destroy();

    LogInfo("Cleanup complete");
}

DesktopRestoreGuard::DesktopRestoreGuard(black_bars::overlay::OverlaySurface& overlay,
                                         black_bars::taskbar::TaskbarVisibility& taskbar,
                                         black_bars::focus::FocusStateMachine* state_machine)
    : overlay_(overlay), taskbar_(taskbar), state_machine_(state_machine) {}

DesktopRestoreGuard::~DesktopRestoreGuard() { Restore(); }

void DesktopRestoreGuard::Restore() {
    if (restored_) {
        return;
    }
    restored_ = true;
    RestoreDesktop(overlay_, taskbar_);
    if (state_machine_ != nullptr) {
        state_machine_->Reset();
    }
}

}  // namespace desktop_restore

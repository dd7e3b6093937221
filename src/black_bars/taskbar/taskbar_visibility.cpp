#include "taskbar_visibility.hpp"
#include "../utils/logging.hpp"

namespace black_bars::taskbar {

TaskbarVisibility::TaskbarVisibility(window_api::WindowApi& api, bool include_launcher)
    : api_(api), include_launcher_(include_launcher) {}

void TaskbarVisibility::Hide() { SetVisible(false); }

void TaskbarVisibility::Show() { SetVisible(true); }

void TaskbarVisibility::SetVisible(bool visible) {
    auto taskbar = api_.FindTaskbar();
    if (!taskbar) {
        LogDebugThrottled(5, "Task bar not found, skipping %s", visible ? "show" : "hide");
        return;
    }

    if (visible) {
        api_.ShowWindow(*taskbar);
    } else {
        api_.HideWindow(*taskbar);
    }

    if (!include_launcher_) {
        return;
    }

    // Not every shell exposes a separate Start button window
    if (auto launcher = api_.FindLauncherControl()) {
        if (visible) {
            api_.ShowWindow(*launcher);
        } else {
            api_.HideWindow(*launcher);
        }
    }
}

}  // namespace black_bars::taskbar

#pragma once

#include "../window_api/window_api.hpp"

namespace black_bars::taskbar {

// Hides / restores the task bar and its launcher (Start) control.
// Both operations are idempotent and never fail: missing chrome is skipped.
class TaskbarVisibility {
   public:
    explicit TaskbarVisibility(window_api::WindowApi& api, bool include_launcher = true);

    void Hide();
    void Show();

   private:
    void SetVisible(bool visible);

    window_api::WindowApi& api_;
    bool include_launcher_;
};

}  // namespace black_bars::taskbar

#include "overlay_surface.hpp"
#include "../utils/logging.hpp"

namespace black_bars::overlay {

using window_api::kNullWindow;
using window_api::MonitorRect;
using window_api::WindowHandle;

OverlaySurface::OverlaySurface(window_api::WindowApi& api) : api_(api) {}

std::optional<WindowHandle> OverlaySurface::EnsureCreated(const MonitorRect& monitor_rect) {
    if (overlay_hwnd_ != kNullWindow) {
        if (monitor_rect != overlay_rect_) {
            LogDebug("Overlay already exists at (%ld, %ld, %ld, %ld), not resizing", overlay_rect_.left,
                     overlay_rect_.top, overlay_rect_.right, overlay_rect_.bottom);
        }
        return overlay_hwnd_;
    }

    if (monitor_rect.IsEmpty()) {
        LogError("Refusing to create overlay with empty rect (%ld, %ld, %ld, %ld)", monitor_rect.left,
                 monitor_rect.top, monitor_rect.right, monitor_rect.bottom);
        return std::nullopt;
    }

    auto hwnd = api_.CreateOverlay(monitor_rect, window_api::kOverlayStyleDefault);
    if (!hwnd || *hwnd == kNullWindow) {
        LogError("Failed to create overlay window");
        return std::nullopt;
    }

    // Layered windows stay invisible until their attributes are set
    if (!api_.SetOverlayOpacity(*hwnd, window_api::kOpaqueAlpha)) {
        LogError("Failed to set overlay opacity, discarding overlay");
        api_.DestroyWindow(*hwnd);
        return std::nullopt;
    }

    overlay_hwnd_ = *hwnd;
    overlay_rect_ = monitor_rect;
    visible_ = false;
    ++creation_count_;
    LogDebug("Overlay created: %p (%ldx%ld)", overlay_hwnd_, monitor_rect.Width(), monitor_rect.Height());
    return overlay_hwnd_;
}

bool OverlaySurface::PlaceBehind(WindowHandle reference_hwnd) {
    if (overlay_hwnd_ == kNullWindow) {
        return false;
    }

    const uint32_t flags = window_api::kZOrderNoMove | window_api::kZOrderNoSize | window_api::kZOrderNoActivate
                           | window_api::kZOrderShowWindow;
    if (!api_.SetWindowZOrder(overlay_hwnd_, reference_hwnd, flags)) {
        LogWarn("Failed to place overlay behind %p", reference_hwnd);
        return false;
    }
    visible_ = true;
    return true;
}

void OverlaySurface::Hide() {
    if (overlay_hwnd_ == kNullWindow) {
        return;
    }
    api_.HideWindow(overlay_hwnd_);
    visible_ = false;
}

void OverlaySurface::Destroy() {
    if (overlay_hwnd_ == kNullWindow) {
        return;
    }
    api_.DestroyWindow(overlay_hwnd_);
    LogDebug("Overlay destroyed: %p", overlay_hwnd_);
    overlay_hwnd_ = kNullWindow;
    overlay_rect_ = MonitorRect{};
    visible_ = false;
}

}  // namespace black_bars::overlay

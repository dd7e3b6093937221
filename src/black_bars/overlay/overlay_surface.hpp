#pragma once

#include "../window_api/window_api.hpp"

#include <cstddef>
#include <optional>

namespace black_bars::overlay {

// Owns the single full-monitor black surface placed behind the target window.
// The surface is created lazily on first use and kept (hidden) across activation cycles;
// only Destroy() releases it.
class OverlaySurface {
   public:
    explicit OverlaySurface(window_api::WindowApi& api);
    ~OverlaySurface() = default;

    OverlaySurface(const OverlaySurface&) = delete;
    OverlaySurface& operator=(const OverlaySurface&) = delete;

    // Creates the surface sized to monitor_rect if it does not exist yet; otherwise returns the
    // existing handle unchanged (no resize). std::nullopt if native creation or making it opaque failed.
    std::optional<window_api::WindowHandle> EnsureCreated(const window_api::MonitorRect& monitor_rect);

    // Restack immediately below reference_hwnd and show, without moving, resizing or activating
    bool PlaceBehind(window_api::WindowHandle reference_hwnd);

    // Best-effort; no-op without a surface
    void Hide();

    // Best-effort; clears the stored handle
    void Destroy();

    bool Exists() const { return overlay_hwnd_ != window_api::kNullWindow; }
    bool IsVisible() const { return visible_; }
    window_api::WindowHandle Handle() const { return overlay_hwnd_; }
    const window_api::MonitorRect& Rect() const { return overlay_rect_; }
    size_t CreationCount() const { return creation_count_; }

   private:
    window_api::WindowApi& api_;
    window_api::WindowHandle overlay_hwnd_ = window_api::kNullWindow;
    window_api::MonitorRect overlay_rect_;
    bool visible_ = false;
    size_t creation_count_ = 0;
};

}  // namespace black_bars::overlay

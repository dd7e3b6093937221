#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace black_bars::window_api {

// Opaque native window handle (HWND on Windows)
using WindowHandle = void*;

constexpr WindowHandle kNullWindow = nullptr;

// Absolute pixel rectangle (left, top, right, bottom), same layout as RECT
struct MonitorRect {
    long left = 0;
    long top = 0;
    long right = 0;
    long bottom = 0;

    long Width() const { return right - left; }
    long Height() const { return bottom - top; }
    bool IsEmpty() const { return right <= left || bottom <= top; }

    bool operator==(const MonitorRect& other) const {
        return left == other.left && top == other.top && right == other.right && bottom == other.bottom;
    }
    bool operator!=(const MonitorRect& other) const { return !(*this == other); }
};

// Window style requested for the overlay surface
enum OverlayStyle : uint32_t {
    kOverlayStyleNone = 0,
    kOverlayStyleLayered = 1u << 0,      // composited with per-window alpha
    kOverlayStyleToolWindow = 1u << 1,   // no task bar / Alt+Tab presence
    kOverlayStyleClickThrough = 1u << 2, // transparent to mouse and keyboard input
    kOverlayStyleNoActivate = 1u << 3,   // never becomes the foreground window
};

constexpr uint32_t kOverlayStyleDefault =
    kOverlayStyleLayered | kOverlayStyleToolWindow | kOverlayStyleClickThrough | kOverlayStyleNoActivate;

// Flags for SetWindowZOrder
enum ZOrderFlags : uint32_t {
    kZOrderNone = 0,
    kZOrderNoMove = 1u << 0,
    kZOrderNoSize = 1u << 1,
    kZOrderNoActivate = 1u << 2,
    kZOrderShowWindow = 1u << 3,
};

constexpr uint8_t kOpaqueAlpha = 255;

// Desktop window primitives consumed by the overlay, task bar and focus logic.
// Queries never throw; failures surface as empty / false / std::nullopt.
class WindowApi {
   public:
    virtual ~WindowApi() = default;

    // Queries
    virtual WindowHandle GetForegroundWindow() = 0;
    virtual std::string GetWindowTitle(WindowHandle hwnd) = 0;
    virtual bool IsMinimized(WindowHandle hwnd) = 0;
    virtual std::optional<WindowHandle> FindWindowByTitle(const std::string& title) = 0;
    virtual std::optional<MonitorRect> GetMonitorRect(WindowHandle hwnd) = 0;

    // Overlay primitives
    virtual std::optional<WindowHandle> CreateOverlay(const MonitorRect& rect, uint32_t style) = 0;
    virtual bool SetOverlayOpacity(WindowHandle hwnd, uint8_t alpha) = 0;
    virtual bool SetWindowZOrder(WindowHandle hwnd, WindowHandle insert_after, uint32_t flags) = 0;

    // Visibility primitives (best-effort)
    virtual void ShowWindow(WindowHandle hwnd) = 0;
    virtual void HideWindow(WindowHandle hwnd) = 0;
    virtual void DestroyWindow(WindowHandle hwnd) = 0;

    // Desktop chrome lookup
    virtual std::optional<WindowHandle> FindTaskbar() = 0;
    virtual std::optional<WindowHandle> FindLauncherControl() = 0;

    // Dispatch pending messages for windows owned by the calling thread
    virtual void PumpMessages() = 0;
};

}  // namespace black_bars::window_api

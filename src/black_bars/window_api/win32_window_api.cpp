#include "win32_window_api.hpp"
#include "../utils/logging.hpp"

#include <vector>

namespace black_bars::window_api {

namespace {

HWND ToHwnd(WindowHandle handle) { return static_cast<HWND>(handle); }

DWORD ToExStyle(uint32_t style) {
    DWORD ex_style = 0;
    if (style & kOverlayStyleLayered) ex_style |= WS_EX_LAYERED;
    if (style & kOverlayStyleToolWindow) ex_style |= WS_EX_TOOLWINDOW;
    if (style & kOverlayStyleClickThrough) ex_style |= WS_EX_TRANSPARENT;
    if (style & kOverlayStyleNoActivate) ex_style |= WS_EX_NOACTIVATE;
    return ex_style;
}

UINT ToSetWindowPosFlags(uint32_t flags) {
    UINT swp = 0;
    if (flags & kZOrderNoMove) swp |= SWP_NOMOVE;
    if (flags & kZOrderNoSize) swp |= SWP_NOSIZE;
    if (flags & kZOrderNoActivate) swp |= SWP_NOACTIVATE;
    if (flags & kZOrderShowWindow) swp |= SWP_SHOWWINDOW;
    return swp;
}

std::optional<WindowHandle> ToOptional(HWND hwnd) {
    if (hwnd == nullptr) {
        return std::nullopt;
    }
    return static_cast<WindowHandle>(hwnd);
}

// Function pointer type for the Windows 10 DPI awareness API
using SetProcessDpiAwarenessContext_pfn = BOOL(WINAPI*)(DPI_AWARENESS_CONTEXT);

}  // anonymous namespace

void SetMonitorDpiAwareness() {
    HMODULE user32 = GetModuleHandleW(L"user32.dll");
    if (user32 != nullptr) {
        auto set_context = reinterpret_cast<SetProcessDpiAwarenessContext_pfn>(
            GetProcAddress(user32, "SetProcessDpiAwarenessContext"));
        if (set_context != nullptr) {
            if (set_context(DPI_AWARENESS_CONTEXT_PER_MONITOR_AWARE_V2)) {
                LogDebug("DPI awareness: per-monitor v2");
                return;
            }
            // ERROR_ACCESS_DENIED: already set by the manifest
            LogDebug("SetProcessDpiAwarenessContext failed: %lu", GetLastError());
            return;
        }
    }

    if (!SetProcessDPIAware()) {
        LogDebug("SetProcessDPIAware failed");
    }
}

std::string WideToUtf8(const std::wstring& wide) {
    if (wide.empty()) {
        return {};
    }
    int size_needed =
        WideCharToMultiByte(CP_UTF8, 0, wide.data(), static_cast<int>(wide.size()), nullptr, 0, nullptr, nullptr);
    if (size_needed <= 0) {
        return {};
    }
    std::string result(static_cast<size_t>(size_needed), '\0');
    WideCharToMultiByte(CP_UTF8, 0, wide.data(), static_cast<int>(wide.size()), result.data(), size_needed, nullptr,
                        nullptr);
    return result;
}

std::wstring Utf8ToWide(const std::string& utf8) {
    if (utf8.empty()) {
        return {};
    }
    int size_needed = MultiByteToWideChar(CP_UTF8, 0, utf8.data(), static_cast<int>(utf8.size()), nullptr, 0);
    if (size_needed <= 0) {
        return {};
    }
    std::wstring result(static_cast<size_t>(size_needed), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, utf8.data(), static_cast<int>(utf8.size()), result.data(), size_needed);
    return result;
}

Win32WindowApi::Win32WindowApi(HINSTANCE instance) : instance_(instance) {}

Win32WindowApi::~Win32WindowApi() {
    if (class_registered_) {
        UnregisterClassW(OVERLAY_WINDOW_CLASS, instance_);
        class_registered_ = false;
    }
}

WindowHandle Win32WindowApi::GetForegroundWindow() { return static_cast<WindowHandle>(::GetForegroundWindow()); }

std::string Win32WindowApi::GetWindowTitle(WindowHandle hwnd) {
    if (hwnd == kNullWindow || !IsWindow(ToHwnd(hwnd))) {
        return {};
    }
    int length = GetWindowTextLengthW(ToHwnd(hwnd));
    if (length <= 0) {
        return {};
    }
    std::vector<wchar_t> buffer(static_cast<size_t>(length) + 1, L'\0');
    int copied = GetWindowTextW(ToHwnd(hwnd), buffer.data(), static_cast<int>(buffer.size()));
    if (copied <= 0) {
        return {};
    }
    return WideToUtf8(std::wstring(buffer.data(), static_cast<size_t>(copied)));
}

bool Win32WindowApi::IsMinimized(WindowHandle hwnd) {
    if (hwnd == kNullWindow) {
        return false;
    }
    return IsIconic(ToHwnd(hwnd)) != FALSE;
}

std::optional<WindowHandle> Win32WindowApi::FindWindowByTitle(const std::string& title) {
    std::wstring wide_title = Utf8ToWide(title);
    return ToOptional(FindWindowW(nullptr, wide_title.c_str()));
}

std::optional<MonitorRect> Win32WindowApi::GetMonitorRect(WindowHandle hwnd) {
    if (hwnd == kNullWindow || !IsWindow(ToHwnd(hwnd))) {
        return std::nullopt;
    }
    HMONITOR monitor = MonitorFromWindow(ToHwnd(hwnd), MONITOR_DEFAULTTONEAREST);
    if (monitor == nullptr) {
        return std::nullopt;
    }

    MONITORINFO mi = {};
    mi.cbSize = sizeof(mi);
    if (!GetMonitorInfoW(monitor, &mi)) {
        LogDebug("GetMonitorInfoW failed: %lu", GetLastError());
        return std::nullopt;
    }

    // Full monitor bounds (rcMonitor), not the work area
    return MonitorRect{mi.rcMonitor.left, mi.rcMonitor.top, mi.rcMonitor.right, mi.rcMonitor.bottom};
}

bool Win32WindowApi::RegisterOverlayClass() {
    if (class_registered_) {
        return true;
    }

    WNDCLASSEXW wc = {};
    wc.cbSize = sizeof(WNDCLASSEXW);
    wc.lpfnWndProc = OverlayWindowProc;
    wc.hInstance = instance_;
    wc.lpszClassName = OVERLAY_WINDOW_CLASS;
    wc.hbrBackground = static_cast<HBRUSH>(GetStockObject(BLACK_BRUSH));
    wc.hCursor = LoadCursor(nullptr, IDC_ARROW);

    if (!RegisterClassExW(&wc) && GetLastError() != ERROR_CLASS_ALREADY_EXISTS) {
        LogError("Failed to register overlay window class: %lu", GetLastError());
        return false;
    }

    class_registered_ = true;
    return true;
}

std::optional<WindowHandle> Win32WindowApi::CreateOverlay(const MonitorRect& rect, uint32_t style) {
    if (!RegisterOverlayClass()) {
        return std::nullopt;
    }

    HWND hwnd = CreateWindowExW(ToExStyle(style), OVERLAY_WINDOW_CLASS, OVERLAY_WINDOW_TITLE, WS_POPUP, rect.left,
                                rect.top, rect.Width(), rect.Height(), nullptr, nullptr, instance_, nullptr);
    if (hwnd == nullptr) {
        LogError("CreateWindowExW failed for overlay: %lu", GetLastError());
        return std::nullopt;
    }
    return static_cast<WindowHandle>(hwnd);
}

bool Win32WindowApi::SetOverlayOpacity(WindowHandle hwnd, uint8_t alpha) {
    if (!SetLayeredWindowAttributes(ToHwnd(hwnd), 0, alpha, LWA_ALPHA)) {
        LogError("SetLayeredWindowAttributes failed: %lu", GetLastError());
        return false;
    }
    return true;
}

bool Win32WindowApi::SetWindowZOrder(WindowHandle hwnd, WindowHandle insert_after, uint32_t flags) {
    if (!SetWindowPos(ToHwnd(hwnd), ToHwnd(insert_after), 0, 0, 0, 0, ToSetWindowPosFlags(flags))) {
        LogDebug("SetWindowPos failed: %lu", GetLastError());
        return false;
    }
    return true;
}

void Win32WindowApi::ShowWindow(WindowHandle hwnd) {
    if (hwnd == kNullWindow || !IsWindow(ToHwnd(hwnd))) {
        return;
    }
    ::ShowWindow(ToHwnd(hwnd), SW_SHOW);
}

void Win32WindowApi::HideWindow(WindowHandle hwnd) {
    if (hwnd == kNullWindow || !IsWindow(ToHwnd(hwnd))) {
        return;
    }
    ::ShowWindow(ToHwnd(hwnd), SW_HIDE);
}

void Win32WindowApi::DestroyWindow(WindowHandle hwnd) {
    if (hwnd == kNullWindow || !IsWindow(ToHwnd(hwnd))) {
        return;
    }
    if (!::DestroyWindow(ToHwnd(hwnd))) {
        LogDebug("DestroyWindow failed: %lu", GetLastError());
    }
}

std::optional<WindowHandle> Win32WindowApi::FindTaskbar() {
    return ToOptional(FindWindowW(TASKBAR_WINDOW_CLASS, nullptr));
}

std::optional<WindowHandle> Win32WindowApi::FindLauncherControl() {
    return ToOptional(FindWindowExW(nullptr, nullptr, LAUNCHER_WINDOW_CLASS, LAUNCHER_WINDOW_TITLE));
}

void Win32WindowApi::PumpMessages() {
    MSG msg;
    while (PeekMessageW(&msg, nullptr, 0, 0, PM_REMOVE)) {
        if (msg.message == WM_QUIT) {
            LogDebug("WM_QUIT received while pumping overlay messages");
            continue;
        }
        TranslateMessage(&msg);
        DispatchMessageW(&msg);
    }
}

LRESULT CALLBACK Win32WindowApi::OverlayWindowProc(HWND hwnd, UINT uMsg, WPARAM wParam, LPARAM lParam) {
    switch (uMsg) {
    case WM_PAINT: {
        PAINTSTRUCT ps;
        HDC hdc = BeginPaint(hwnd, &ps);

        // Fill with black
        RECT rect;
        GetClientRect(hwnd, &rect);
        FillRect(hdc, &rect, static_cast<HBRUSH>(GetStockObject(BLACK_BRUSH)));

        EndPaint(hwnd, &ps);
    }
        return 0;

    case WM_ERASEBKGND:
        return 1; // We handle background in WM_PAINT

    case WM_MOUSEACTIVATE:
        return MA_NOACTIVATE;

    case WM_NCHITTEST:
        return HTTRANSPARENT;

    default:
        break;
    }

    return DefWindowProcW(hwnd, uMsg, wParam, lParam);
}

}  // namespace black_bars::window_api

#pragma once

#include "window_api.hpp"

#include <windows.h>

#include <string>

namespace black_bars::window_api {

// user32-backed implementation used by the executable
class Win32WindowApi : public WindowApi {
   public:
    explicit Win32WindowApi(HINSTANCE instance = GetModuleHandleW(nullptr));
    ~Win32WindowApi() override;

    Win32WindowApi(const Win32WindowApi&) = delete;
    Win32WindowApi& operator=(const Win32WindowApi&) = delete;

    WindowHandle GetForegroundWindow() override;
    std::string GetWindowTitle(WindowHandle hwnd) override;
    bool IsMinimized(WindowHandle hwnd) override;
    std::optional<WindowHandle> FindWindowByTitle(const std::string& title) override;
    std::optional<MonitorRect> GetMonitorRect(WindowHandle hwnd) override;

    std::optional<WindowHandle> CreateOverlay(const MonitorRect& rect, uint32_t style) override;
    bool SetOverlayOpacity(WindowHandle hwnd, uint8_t alpha) override;
    bool SetWindowZOrder(WindowHandle hwnd, WindowHandle insert_after, uint32_t flags) override;

    void ShowWindow(WindowHandle hwnd) override;
    void HideWindow(WindowHandle hwnd) override;
    void DestroyWindow(WindowHandle hwnd) override;

    std::optional<WindowHandle> FindTaskbar() override;
    std::optional<WindowHandle> FindLauncherControl() override;

    void PumpMessages() override;

   private:
    bool RegisterOverlayClass();

    // Window procedure for the overlay window
    static LRESULT CALLBACK OverlayWindowProc(HWND hwnd, UINT uMsg, WPARAM wParam, LPARAM lParam);

    HINSTANCE instance_;
    bool class_registered_ = false;

    static constexpr const wchar_t* OVERLAY_WINDOW_CLASS = L"BlackBarsOverlayWindow";
    static constexpr const wchar_t* OVERLAY_WINDOW_TITLE = L"Black Background";
    static constexpr const wchar_t* TASKBAR_WINDOW_CLASS = L"Shell_TrayWnd";
    static constexpr const wchar_t* LAUNCHER_WINDOW_CLASS = L"Button";
    static constexpr const wchar_t* LAUNCHER_WINDOW_TITLE = L"Start";
};

// Makes the process per-monitor DPI aware so monitor rects are in physical pixels.
// Uses SetProcessDpiAwarenessContext when available (Windows 10 1703+), SetProcessDPIAware otherwise.
void SetMonitorDpiAwareness();

// UTF-16 <-> UTF-8 helpers
std::string WideToUtf8(const std::wstring& wide);
std::wstring Utf8ToWide(const std::string& utf8);

}  // namespace black_bars::window_api

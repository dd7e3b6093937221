#include "process_exit_hooks.hpp"
#include "utils/logging.hpp"

#include <csignal>
#include <cstdio>
#include <cstdlib>

#ifdef _WIN32
#include <windows.h>
#endif

namespace process_exit_hooks {

namespace {

std::atomic<bool> g_installed{false};
std::atomic<bool> g_shutdown_requested{false};
std::atomic<std::uint8_t> g_shutdown_source{static_cast<std::uint8_t>(ExitSource::NONE)};
std::atomic<EmergencyRestoreFn> g_emergency_restore{nullptr};
std::atomic<bool> g_emergency_restore_done{false};

using SignalHandlerFn = void (*)(int);
SignalHandlerFn g_previous_sigint = SIG_DFL;
SignalHandlerFn g_previous_sigterm = SIG_DFL;

#ifdef _WIN32
HANDLE g_restore_complete_event = nullptr;
LPTOP_LEVEL_EXCEPTION_FILTER g_previous_exception_filter = nullptr;

// Console close / logoff / shutdown terminate the process as soon as the handler returns
constexpr DWORD kConsoleCloseWaitMs = 5000;
#endif

// Bypasses the logger: the crashing thread may hold its lock
void EmergencyTrace(const char* message) {
#ifdef _WIN32
    OutputDebugStringA(message);
#else
    std::fputs(message, stderr);
#endif
}

// Runs the emergency restore at most once per process
void RunEmergencyRestore(ExitSource source) {
    bool expected = false;
    if (!g_emergency_restore_done.compare_exchange_strong(expected, true)) {
        return;
    }
    EmergencyRestoreFn restore = g_emergency_restore.load();
    if (restore == nullptr) {
        return;
    }
    char buffer[128];
    std::snprintf(buffer, sizeof(buffer), "[Exit Handler] Emergency desktop restore from %s\n",
                  GetExitSourceString(source));
    EmergencyTrace(buffer);
    restore();
}

void SignalHandler(int signum) {
    RequestShutdown(signum == SIGTERM ? ExitSource::SIGNAL_TERMINATE : ExitSource::SIGNAL_INTERRUPT);
    // Some C runtimes reset the disposition to SIG_DFL on delivery
    std::signal(signum, SignalHandler);
}

void AtExitHandler() { RunEmergencyRestore(ExitSource::ATEXIT); }

#ifdef _WIN32
BOOL WINAPI ConsoleCtrlHandler(DWORD ctrl_type) {
    switch (ctrl_type) {
        case CTRL_C_EVENT:
        case CTRL_BREAK_EVENT:
            RequestShutdown(ExitSource::CONSOLE_CTRL);
            return TRUE;
        case CTRL_CLOSE_EVENT:
        case CTRL_LOGOFF_EVENT:
        case CTRL_SHUTDOWN_EVENT:
            RequestShutdown(ExitSource::CONSOLE_CTRL);
            // Hold the process open until the main thread has restored the desktop
            if (g_restore_complete_event != nullptr) {
                WaitForSingleObject(g_restore_complete_event, kConsoleCloseWaitMs);
            }
            return TRUE;
        default:
            return FALSE;
    }
}

LONG WINAPI UnhandledExceptionHandler(EXCEPTION_POINTERS* exception_info) {
    if (exception_info != nullptr && exception_info->ExceptionRecord != nullptr) {
        char buffer[128];
        std::snprintf(buffer, sizeof(buffer), "[Exit Handler] Unhandled exception 0x%08lX at %p\n",
                      exception_info->ExceptionRecord->ExceptionCode,
                      exception_info->ExceptionRecord->ExceptionAddress);
        EmergencyTrace(buffer);
    }
    RunEmergencyRestore(ExitSource::UNHANDLED_EXCEPTION);

    if (g_previous_exception_filter != nullptr) {
        return g_previous_exception_filter(exception_info);
    }
    return EXCEPTION_CONTINUE_SEARCH;
}
#endif

}  // anonymous namespace

const char* GetExitSourceString(ExitSource source) {
    switch (source) {
        case ExitSource::NONE:                return "NONE";
        case ExitSource::SIGNAL_INTERRUPT:    return "SIGINT";
        case ExitSource::SIGNAL_TERMINATE:    return "SIGTERM";
        case ExitSource::CONSOLE_CTRL:        return "CONSOLE_CTRL";
        case ExitSource::ATEXIT:              return "ATEXIT";
        case ExitSource::UNHANDLED_EXCEPTION: return "UNHANDLED_EXCEPTION";
        default:                              return "UNKNOWN";
    }
}

void Initialize(EmergencyRestoreFn emergency_restore) {
    bool expected = false;
    if (!g_installed.compare_exchange_strong(expected, true)) {
        return;
    }

    g_emergency_restore.store(emergency_restore);
    g_emergency_restore_done.store(false);

    g_previous_sigint = std::signal(SIGINT, SignalHandler);
    g_previous_sigterm = std::signal(SIGTERM, SignalHandler);
    if (g_previous_sigint == SIG_ERR || g_previous_sigterm == SIG_ERR) {
        LogError("Failed to install termination signal handlers");
    }

    // atexit registrations can't be removed; the handler is a no-op once Shutdown() clears the callback
    static bool atexit_registered = false;
    if (!atexit_registered) {
        atexit_registered = std::atexit(&AtExitHandler) == 0;
        if (!atexit_registered) {
            LogError("Failed to register atexit handler");
        }
    }

#ifdef _WIN32
    if (g_restore_complete_event == nullptr) {
        g_restore_complete_event = CreateEventW(nullptr, TRUE, FALSE, nullptr);
        if (g_restore_complete_event == nullptr) {
            LogError("Failed to create restore event: %lu", GetLastError());
        }
    }

    if (!SetConsoleCtrlHandler(&ConsoleCtrlHandler, TRUE)) {
        LogError("Failed to install console control handler: %lu", GetLastError());
    }

    g_previous_exception_filter = ::SetUnhandledExceptionFilter(&UnhandledExceptionHandler);
#endif

    LogDebug("Process exit hooks installed");
}

void Shutdown() {
    bool expected = true;
    if (!g_installed.compare_exchange_strong(expected, false)) {
        return;
    }

    g_emergency_restore.store(nullptr);

    std::signal(SIGINT, g_previous_sigint == SIG_ERR ? SIG_DFL : g_previous_sigint);
    std::signal(SIGTERM, g_previous_sigterm == SIG_ERR ? SIG_DFL : g_previous_sigterm);

#ifdef _WIN32
    ::SetUnhandledExceptionFilter(g_previous_exception_filter);
    g_previous_exception_filter = nullptr;
    SetConsoleCtrlHandler(&ConsoleCtrlHandler, FALSE);
    // The event is left open: a console close handler may still be waiting on it
#endif

    LogDebug("Process exit hooks removed");
}

void RequestShutdown(ExitSource source) {
    std::uint8_t none = static_cast<std::uint8_t>(ExitSource::NONE);
    g_shutdown_source.compare_exchange_strong(none, static_cast<std::uint8_t>(source));
    g_shutdown_requested.store(true);
}

bool IsShutdownRequested() { return g_shutdown_requested.load(); }

ExitSource GetShutdownSource() { return static_cast<ExitSource>(g_shutdown_source.load()); }

const std::atomic<bool>& ShutdownRequestedFlag() { return g_shutdown_requested; }

void ClearShutdownRequest() {
    g_shutdown_source.store(static_cast<std::uint8_t>(ExitSource::NONE));
    g_shutdown_requested.store(false);
}

void NotifyRestoreComplete() {
#ifdef _WIN32
    if (g_restore_complete_event != nullptr) {
        SetEvent(g_restore_complete_event);
    }
#endif
}

}  // namespace process_exit_hooks

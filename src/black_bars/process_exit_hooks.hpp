#pragma once

#include <atomic>
#include <cstdint>

// Process-exit safety hooks. Termination signals (SIGINT, SIGTERM and, on Windows, console control
// events) only request that the monitoring loop stop; the loop then restores the desktop on the main
// thread. atexit and the unhandled exception filter run a best-effort emergency restore for exits that
// bypass the loop. This cannot handle hard kills (e.g. external TerminateProcess).
namespace process_exit_hooks {

// Where a shutdown request or exit was detected
enum class ExitSource : std::uint8_t {
    NONE,
    SIGNAL_INTERRUPT,     // SIGINT
    SIGNAL_TERMINATE,     // SIGTERM
    CONSOLE_CTRL,         // SetConsoleCtrlHandler() handler
    ATEXIT,               // std::atexit() handler
    UNHANDLED_EXCEPTION,  // SetUnhandledExceptionFilter() handler
};

const char* GetExitSourceString(ExitSource source);

// Called at most once from atexit / the unhandled exception filter. Must not allocate heavily or block.
using EmergencyRestoreFn = void (*)();

// Install signal, console control, atexit and unhandled exception handlers.
void Initialize(EmergencyRestoreFn emergency_restore);

// Remove handlers and forget the emergency restore callback (best-effort, safe to call multiple times).
void Shutdown();

// Async-signal-safe: only stores to lock-free atomics
void RequestShutdown(ExitSource source);

bool IsShutdownRequested();
ExitSource GetShutdownSource();
const std::atomic<bool>& ShutdownRequestedFlag();

// Re-arms the shutdown flag (tests)
void ClearShutdownRequest();

// Called by the main thread once the desktop has been restored; releases a console close / logoff /
// shutdown handler that is holding the process open.
void NotifyRestoreComplete();

}  // namespace process_exit_hooks

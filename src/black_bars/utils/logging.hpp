#pragma once

#include <cstdarg>

// Logging function declarations (printf-style, routed to black_bars::logger)
void LogInfo(const char *msg, ...);
void LogWarn(const char *msg, ...);
void LogError(const char *msg, ...);
void LogDebug(const char *msg, ...);

// Throttled debug logging macro
// Usage: LogDebugThrottled(5, "Debug message %p", ptr);
#define LogDebugThrottled(throttle_count, ...) \
    do { \
        static int _dbg_throttle_counter = 0; \
        if (_dbg_throttle_counter < (throttle_count)) { \
            _dbg_throttle_counter++; \
            LogDebug(__VA_ARGS__); \
            if (_dbg_throttle_counter == (throttle_count)) { \
                LogDebug("(Suppressing further occurrences of this debug log)"); \
            } \
        } \
    } while(0)

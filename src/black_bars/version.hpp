#pragma once

// Version information for Black Bars

#ifndef BLACK_BARS_VERSION_HPP
#define BLACK_BARS_VERSION_HPP

// String conversion macro (used for version string)
#define BLACK_BARS_STRINGIFY(x)  BLACK_BARS_STRINGIFY_(x)
#define BLACK_BARS_STRINGIFY_(x) #x

// Version numbers (major.minor.patch) - set by CMake from CMakeLists.txt; fallbacks for non-CMake use (e.g. IDE)
#ifndef BLACK_BARS_VERSION_MAJOR
#define BLACK_BARS_VERSION_MAJOR 1
#endif
#ifndef BLACK_BARS_VERSION_MINOR
#define BLACK_BARS_VERSION_MINOR 0
#endif
#ifndef BLACK_BARS_VERSION_PATCH
#define BLACK_BARS_VERSION_PATCH 0
#endif

#define BLACK_BARS_VERSION_STRING                     \
    BLACK_BARS_STRINGIFY(BLACK_BARS_VERSION_MAJOR) "." \
    BLACK_BARS_STRINGIFY(BLACK_BARS_VERSION_MINOR) "." \
    BLACK_BARS_STRINGIFY(BLACK_BARS_VERSION_PATCH)

// Build date and time (set by CMake)
#ifndef BUILD_DATE
#define BLACK_BARS_BUILD_DATE "unknown"
#else
#define BLACK_BARS_BUILD_DATE BUILD_DATE
#endif

#ifndef BUILD_TIME
#define BLACK_BARS_BUILD_TIME "unknown"
#else
#define BLACK_BARS_BUILD_TIME BUILD_TIME
#endif

// Full version info string
#define BLACK_BARS_FULL_VERSION \
    "Black Bars v" BLACK_BARS_VERSION_STRING " (Build: " BLACK_BARS_BUILD_DATE " " BLACK_BARS_BUILD_TIME ")"

#endif  // BLACK_BARS_VERSION_HPP

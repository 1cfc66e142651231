#pragma once
/**
 * @file nb_platform.hpp
 * @brief Layer 0: Platform detection and platform utility declarations.
 *
 * Every file that needs platform macros (NODEBUS_PLATFORM_LINUX, NODEBUS_IS_POSIX, etc.)
 * or Windows headers should include this. It is self-contained and can be included at
 * any point.
 *
 * Prefer build-system macros (PLATFORM_WIN64, etc.); fall back to compiler predefined macros.
 */
#include <cstddef>
#include <cstdint>
#include <string>

#if defined(PLATFORM_WIN64)

#define NODEBUS_PLATFORM_WIN64 1
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

#elif defined(PLATFORM_APPLE)
#define NODEBUS_PLATFORM_APPLE 1
#elif defined(PLATFORM_FREEBSD)
#define NODEBUS_PLATFORM_FREEBSD 1
#elif defined(PLATFORM_LINUX)
#define NODEBUS_PLATFORM_LINUX 1
#elif defined(PLATFORM_UNKNOWN)
#define NODEBUS_PLATFORM_UNKNOWN 1

#else
// Fallback detection
#if defined(_WIN64)
#define NODEBUS_PLATFORM_WIN64 1
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#elif defined(__APPLE__) && defined(__MACH__)
#define NODEBUS_PLATFORM_APPLE 1
#elif defined(__FreeBSD__)
#define NODEBUS_PLATFORM_FREEBSD 1
#elif defined(__linux__)
#define NODEBUS_PLATFORM_LINUX 1
#else
#define NODEBUS_PLATFORM_UNKNOWN 1
#endif
#endif

// Convenience booleans for source code usage:
#if defined(NODEBUS_PLATFORM_WIN64)
#define NODEBUS_IS_WINDOWS 1
#elif defined(NODEBUS_PLATFORM_APPLE) || defined(NODEBUS_PLATFORM_FREEBSD) ||                      \
    defined(NODEBUS_PLATFORM_LINUX)
#define NODEBUS_IS_POSIX 1
#endif

// --- Require C++20 or later --------------------------------------------------
// For MSVC use _MSVC_LANG (MSVC sets __cplusplus only when /Zc:__cplusplus is enabled).
#if defined(_MSC_VER)
#if !defined(_MSVC_LANG) || (_MSVC_LANG < 202002L)
#error "This project requires C++20 or later. Please compile with /std:c++20 or newer (MSVC)."
#endif
#else
#if __cplusplus < 202002L
#error "This project requires C++20 or later. Please compile with -std=c++20 or newer."
#endif
#endif

#include "nodebus_utils_export.h"

namespace nodebus::platform
{

/**
 * @brief Gets the native thread ID for the calling thread.
 * @return A 64-bit unsigned integer representing the thread ID.
 */
NODEBUS_UTILS_EXPORT uint64_t get_native_thread_id() noexcept;
/**
 * @brief Gets the process ID (PID) for the current process.
 */
NODEBUS_UTILS_EXPORT uint64_t get_pid();
/**
 * @brief Gets the name of the current executable.
 * @param include_path If `true`, returns the full absolute path to the executable.
 *                     If `false` (default), returns only the filename.
 * @return The name of the executable, or "unknown" on failure.
 */
NODEBUS_UTILS_EXPORT std::string get_executable_name(bool include_path = false) noexcept;

NODEBUS_UTILS_EXPORT int get_version_major() noexcept;
NODEBUS_UTILS_EXPORT int get_version_minor() noexcept;
NODEBUS_UTILS_EXPORT int get_version_rolling() noexcept;
/**
 * @brief Gets the full version string (major.minor.rolling), e.g. "0.3.0".
 */
NODEBUS_UTILS_EXPORT const char *get_version_string() noexcept;

/**
 * @brief Gets a monotonic timestamp in nanoseconds.
 * @note The absolute value is meaningless; use for computing time deltas only.
 */
NODEBUS_UTILS_EXPORT uint64_t monotonic_time_ns() noexcept;

/**
 * @brief Computes elapsed time in nanoseconds since a start timestamp.
 * @note If start_ns is in the future, returns 0.
 */
NODEBUS_UTILS_EXPORT uint64_t elapsed_time_ns(uint64_t start_ns) noexcept;

} // namespace nodebus::platform

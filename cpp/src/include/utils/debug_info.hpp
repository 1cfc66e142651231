/**
 * @file debug_info.hpp
 * @brief Debugging utilities: stack trace printing, panic handling for fatal errors,
 *        and compile-time gated debug messages.
 *
 * Everything here writes straight to `stderr` and never goes through the Logger, so it
 * is safe to use before the Logger module is started or after it has shut down.
 */
#pragma once

#include <cstdio>
#include <cstdlib>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "nodebus_utils_export.h"
#include "utils/format_tools.hpp"

inline std::string SRCLOC_TO_STR(std::source_location loc)
{
    return fmt::format("{}:{}:{}", nodebus::format_tools::filename_only(loc.file_name()),
                       loc.line(), loc.function_name());
}

namespace nodebus::debug
{

/**
 * @brief Prints the current call stack (stack trace) to `stderr`.
 *
 * On POSIX systems it uses `backtrace` and `backtrace_symbols_fd`; on Windows it uses
 * `CaptureStackBackTrace`. Failures to capture are reported to `stderr`.
 */
NODEBUS_UTILS_EXPORT void print_stack_trace() noexcept;

/**
 * @brief Halts program execution with a fatal error message and prints a stack trace.
 *
 * Intended for unrecoverable errors only (broken internal invariants, lifecycle misuse).
 * The format string is checked at compile time.
 *
 * @param loc The source location where `panic` was called.
 * @param fmt_str The `fmt`-style format string for the error message.
 * @param args The arguments to be formatted into `fmt_str`.
 */
template <typename... Args>
[[noreturn]] inline void panic(std::source_location loc, fmt::format_string<Args...> fmt_str,
                               Args &&...args) noexcept
{
    try
    {
        const auto body = fmt::format(fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "[PANIC] {} -- {}\n", SRCLOC_TO_STR(loc), body);
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "[PANIC] FATAL FORMAT ERROR WHEN PANIC: %s\n", e.what());
    }
    std::fflush(stderr);
    print_stack_trace();
    std::abort();
}

/**
 * @brief Prints a debug message to `stderr` with compile-time format string checking.
 */
template <typename... Args>
inline void debug_msg(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    try
    {
        const auto body = fmt::format(fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "[DBG]  {}\n", body);
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "[DBG]  FATAL FORMAT ERROR DURING DEBUG_MSG: %s\n", e.what());
        std::fflush(stderr);
    }
}

} // namespace nodebus::debug

/**
 * @brief Calls `nodebus::debug::panic` with the current source location.
 */
#ifndef NB_PANIC
#define NB_PANIC(fmt, ...)                                                                         \
    ::nodebus::debug::panic(std::source_location::current(),                                      \
                            FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#endif

/**
 * @brief Prints a debug message; compiled out unless NODEBUS_ENABLE_DEBUG_MESSAGES is set.
 */
#ifndef NB_DEBUG
#if defined(NODEBUS_ENABLE_DEBUG_MESSAGES)
#define NB_DEBUG(fmt, ...) ::nodebus::debug::debug_msg(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#else
#define NB_DEBUG(fmt, ...)                                                                         \
    do                                                                                             \
    {                                                                                              \
    } while (0)
#endif
#endif

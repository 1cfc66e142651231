/*******************************************************************************
 * @file logger.hpp
 * @brief Asynchronous, thread-safe logging utility.
 *
 * **Command-Queue Pattern**
 * Calls from application threads (e.g. `LOGGER_INFO(...)`) format the message and
 * push a command onto a queue. A single worker thread is the sole consumer of the
 * queue; it performs all I/O and owns the active `Sink`. Configuration changes
 * (switching sinks, flushing) are commands too, so they are serialized with the
 * log messages around them.
 *
 * The Logger is a lifecycle module. Register `Logger::GetLifecycleModule()` with the
 * LifecycleManager before use. Logging macros called before the module started are
 * silently discarded; configuration calls before that point are fatal (NB_PANIC).
 *
 * **Usage**
 * ```cpp
 * LOGGER_INFO("[nodebus/router] delivered {} to {}", signal, target_id);
 *
 * auto &logger = Logger::instance();
 * logger.set_logfile("/var/log/nodebus.log");
 * logger.set_level(Logger::Level::L_DEBUG);
 * ```
 ******************************************************************************/
#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "nodebus_utils_export.h"
#include "utils/module_def.hpp"

#ifndef LOGGER_FMT_BUFFER_RESERVE
#define LOGGER_FMT_BUFFER_RESERVE (1024u)
#endif

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace nodebus::utils
{

class NODEBUS_UTILS_EXPORT Logger
{
  public:
    enum class Level : int
    {
        L_TRACE = 0,
        L_DEBUG = 1,
        L_INFO = 2,
        L_WARNING = 3,
        L_ERROR = 4,
        L_SYSTEM = 5,
    };

    static Logger &instance();

    /// Lifecycle module definition ("nodebus::utils::Logger").
    static ModuleDef GetLifecycleModule();

    /// True once the Logger module has been started (stays true after shutdown).
    static bool lifecycle_initialized() noexcept;

    /// Parses "trace", "debug", "info", "warn"/"warning", "error", "system".
    static std::optional<Level> parse_level(std::string_view name) noexcept;

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;

    ~Logger();

    // --- Sinks ---
    // Each call blocks until the worker has switched sinks; returns false on failure.

    /// Switch logging to the console (stderr).
    bool set_console();

    /// Switch logging to a file (appending).
    bool set_logfile(const std::string &utf8_path);

    /// Blocks until every message queued before this call has been written.
    void flush();

    /// Drains the queue and stops the worker. Called by the lifecycle shutdown.
    void shutdown();

    void set_level(Level lvl);
    [[nodiscard]] Level level() const;

    /**
     * @brief Sets a callback invoked (off the worker thread) when a sink fails.
     */
    void set_write_error_callback(std::function<void(const std::string &)> cb);

    // --- Formatting API (header-only templates) ---
    template <Level lvl, typename... Args>
    void log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept;

    template <typename... Args>
    void trace_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_TRACE>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void debug_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_DEBUG>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void info_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_INFO>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void warn_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_WARNING>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void error_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_ERROR>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void system_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_SYSTEM>(fmt_str, std::forward<Args>(args)...);
    }

    [[nodiscard]] bool should_log(Level lvl) const noexcept;

    struct Impl;

  private:
    Logger();

    bool enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept;

    friend void do_logger_startup(const char *arg);

    std::unique_ptr<Impl> pImpl;
};

#ifndef LOGGER_COMPILE_LEVEL
#define LOGGER_COMPILE_LEVEL 0 // 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error
#endif

template <Logger::Level lvl, typename... Args>
void Logger::log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    if constexpr (static_cast<int>(lvl) >= LOGGER_COMPILE_LEVEL)
    {
        if (!should_log(lvl))
            return;

        try
        {
            fmt::memory_buffer mb;
            mb.reserve(LOGGER_FMT_BUFFER_RESERVE);
            fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
            enqueue_log(lvl, std::move(mb));
        }
        catch (const std::exception &ex)
        {
            fmt::memory_buffer mb;
            fmt::format_to(std::back_inserter(mb), "[FORMAT ERROR] {}", ex.what());
            enqueue_log(lvl, std::move(mb));
        }
    }
}

} // namespace nodebus::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif

#define LOGGER_TRACE(fmt, ...)                                                                     \
    ::nodebus::utils::Logger::instance().trace_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_DEBUG(fmt, ...)                                                                     \
    ::nodebus::utils::Logger::instance().debug_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_INFO(fmt, ...)                                                                      \
    ::nodebus::utils::Logger::instance().info_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_WARN(fmt, ...)                                                                      \
    ::nodebus::utils::Logger::instance().warn_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR(fmt, ...)                                                                     \
    ::nodebus::utils::Logger::instance().error_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_SYSTEM(fmt, ...)                                                                    \
    ::nodebus::utils::Logger::instance().system_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)

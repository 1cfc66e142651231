/*******************************************************************************
 * @file logger.cpp
 * @brief Implementation of the asynchronous logger.
 ******************************************************************************/

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <stdexcept>
#include <variant>
#include <vector>

#include "nb_service.hpp"

#include "utils/logger_sinks/console_sink.hpp"
#include "utils/logger_sinks/file_sink.hpp"
#include "utils/logger_sinks/sink.hpp"

using namespace nodebus::format_tools;

namespace nodebus::utils
{

enum class LoggerState
{
    Uninitialized,
    Initialized,
    ShuttingDown,
    Shutdown
};

static std::atomic<LoggerState> g_logger_state{LoggerState::Uninitialized};

// Configuration calls before the lifecycle started the logger are a programming error.
static bool logger_is_loggable(const char *function_name)
{
    const auto state = g_logger_state.load(std::memory_order_acquire);
    if (state == LoggerState::Uninitialized)
    {
        NB_PANIC("Logger method '{}' was called before the Logger module was "
                 "initialized via LifecycleManager. Aborting.",
                 function_name);
    }
    return state == LoggerState::Initialized;
}

// Command Definitions
struct SetSinkCommand
{
    std::unique_ptr<Sink> new_sink;
    std::shared_ptr<std::promise<bool>> promise;
};
struct FlushCommand
{
    std::shared_ptr<std::promise<bool>> promise;
};
struct SetErrorCallbackCommand
{
    std::function<void(const std::string &)> callback;
    std::shared_ptr<std::promise<bool>> promise;
};

using Command = std::variant<LogMessage, SetSinkCommand, FlushCommand, SetErrorCallbackCommand>;

namespace
{
void promise_set_safe(const std::shared_ptr<std::promise<bool>> &p, bool value)
{
    if (!p)
        return;
    try
    {
        p->set_value(value);
    }
    catch (const std::future_error &e)
    {
        // Already satisfied: only possible if a command was rejected twice.
        NB_DEBUG("Logger: promise already satisfied: {}", e.what());
    }
}

LogMessage make_system_message(Logger::Level lvl, fmt::memory_buffer &&body)
{
    return LogMessage{.timestamp = std::chrono::system_clock::now(),
                      .process_id = nodebus::platform::get_pid(),
                      .thread_id = nodebus::platform::get_native_thread_id(),
                      .level = static_cast<int>(lvl),
                      .body = std::move(body)};
}
} // namespace

struct Logger::Impl
{
    Impl() : sink_(std::make_unique<ConsoleSink>()) {}
    ~Impl();

    void start_worker();
    void worker_loop();
    bool enqueue_command(Command &&cmd);
    void reject_command(Command &cmd);
    void report_sink_error(const std::string &msg);
    void shutdown();

    std::function<void(const std::string &)> error_callback_;
    std::thread worker_thread_;
    std::unique_ptr<Sink> sink_;
    size_t max_queue_size_{10000};
    std::vector<Command> queue_;
    std::condition_variable cv_;
    std::mutex queue_mutex_;
    CallbackDispatcher callback_dispatcher_;
    std::atomic<Logger::Level> level_{Logger::Level::L_INFO};
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> shutdown_completed_{false};
    std::atomic<size_t> messages_dropped_{0};
};

Logger::Impl::~Impl()
{
    if (worker_thread_.joinable() && !shutdown_requested_.load())
    {
        NB_DEBUG("**HIGH ALERT: Logger Impl destructor called without prior shutdown. Check "
                 "LifeCycle management.**");
        shutdown();
    }
}

void Logger::Impl::start_worker()
{
    if (!worker_thread_.joinable())
    {
        worker_thread_ = std::thread(&Logger::Impl::worker_loop, this);
    }
}

void Logger::Impl::reject_command(Command &cmd)
{
    std::visit(
        [](auto &&arg)
        {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (!std::is_same_v<T, LogMessage>)
            {
                promise_set_safe(arg.promise, false);
            }
        },
        cmd);
}

bool Logger::Impl::enqueue_command(Command &&cmd)
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (shutdown_requested_.load(std::memory_order_acquire))
        {
            reject_command(cmd);
            return false;
        }
        // Log messages are dropped once the soft limit is hit; control commands are not.
        if (queue_.size() >= max_queue_size_ && std::holds_alternative<LogMessage>(cmd))
        {
            messages_dropped_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }
        queue_.emplace_back(std::move(cmd));
    }
    cv_.notify_one();
    return true;
}

void Logger::Impl::report_sink_error(const std::string &msg)
{
    if (error_callback_)
    {
        auto cb = error_callback_;
        callback_dispatcher_.post([cb, msg]() { cb(msg); });
    }
    else
    {
        NB_DEBUG("Logger sink error with no error callback installed: {}", msg);
    }
}

void Logger::Impl::worker_loop()
{
    std::vector<Command> local_queue;

    while (true)
    {
        bool stop_after_batch = false;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || shutdown_requested_.load(); });
            local_queue.swap(queue_);
            stop_after_batch = shutdown_requested_.load() && queue_.empty();
        }

        const size_t dropped = messages_dropped_.exchange(0, std::memory_order_relaxed);
        if (dropped > 0 && sink_)
        {
            sink_->write(make_system_message(
                Logger::Level::L_WARNING,
                make_buffer("Logger queue overflow: {} messages were dropped.", dropped)));
        }

        for (auto &item : local_queue)
        {
            try
            {
                if (auto *msg = std::get_if<LogMessage>(&item))
                {
                    if (sink_ &&
                        msg->level >= static_cast<int>(level_.load(std::memory_order_relaxed)))
                    {
                        sink_->write(*msg);
                    }
                    continue;
                }

                std::visit(
                    [this](auto &&arg)
                    {
                        using T = std::decay_t<decltype(arg)>;
                        if constexpr (std::is_same_v<T, SetSinkCommand>)
                        {
                            const std::string old_desc = sink_ ? sink_->description() : "null";
                            const std::string new_desc =
                                arg.new_sink ? arg.new_sink->description() : "null";
                            if (sink_)
                            {
                                sink_->write(make_system_message(
                                    Logger::Level::L_SYSTEM,
                                    make_buffer("Switching log sink to: {}", new_desc)));
                                sink_->flush();
                            }
                            sink_ = std::move(arg.new_sink);
                            if (sink_)
                            {
                                sink_->write(make_system_message(
                                    Logger::Level::L_SYSTEM,
                                    make_buffer("Log sink switched from: {}", old_desc)));
                            }
                            promise_set_safe(arg.promise, true);
                        }
                        else if constexpr (std::is_same_v<T, FlushCommand>)
                        {
                            if (sink_)
                            {
                                sink_->flush();
                            }
                            promise_set_safe(arg.promise, true);
                        }
                        else if constexpr (std::is_same_v<T, SetErrorCallbackCommand>)
                        {
                            error_callback_ = std::move(arg.callback);
                            promise_set_safe(arg.promise, true);
                        }
                    },
                    item);
            }
            catch (const std::exception &e)
            {
                report_sink_error(fmt::format("Logger worker error: {}", e.what()));
            }
        }
        local_queue.clear();

        if (stop_after_batch)
        {
            if (sink_)
            {
                sink_->write(make_system_message(Logger::Level::L_SYSTEM,
                                                 make_buffer("Logger is shutting down.")));
                sink_->flush();
            }
            g_logger_state.store(LoggerState::Shutdown, std::memory_order_release);
            break;
        }
    }
}

void Logger::Impl::shutdown()
{
    if (shutdown_completed_.load() || shutdown_requested_.exchange(true))
    {
        return;
    }
    cv_.notify_one();
    if (worker_thread_.joinable())
    {
        worker_thread_.join();
    }
    callback_dispatcher_.shutdown();
    shutdown_completed_.store(true);
}

// Logger Public API Implementation
Logger::Logger() : pImpl(std::make_unique<Impl>()) {}
Logger::~Logger() = default;

Logger &Logger::instance()
{
    static Logger instance;
    return instance;
}

bool Logger::lifecycle_initialized() noexcept
{
    return g_logger_state.load(std::memory_order_acquire) != LoggerState::Uninitialized;
}

std::optional<Logger::Level> Logger::parse_level(std::string_view name) noexcept
{
    if (name == "trace")
        return Level::L_TRACE;
    if (name == "debug")
        return Level::L_DEBUG;
    if (name == "info")
        return Level::L_INFO;
    if (name == "warn" || name == "warning")
        return Level::L_WARNING;
    if (name == "error")
        return Level::L_ERROR;
    if (name == "system")
        return Level::L_SYSTEM;
    return std::nullopt;
}

bool Logger::set_console()
{
    if (!logger_is_loggable("Logger::set_console"))
        return false;
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(SetSinkCommand{std::make_unique<ConsoleSink>(), promise});
    return future.get();
}

bool Logger::set_logfile(const std::string &utf8_path)
{
    if (!logger_is_loggable("Logger::set_logfile"))
        return false;
    std::unique_ptr<Sink> sink;
    try
    {
        sink = std::make_unique<FileSink>(utf8_path);
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("Failed to create FileSink: {}", e.what());
        return false;
    }
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(SetSinkCommand{std::move(sink), promise});
    return future.get();
}

void Logger::shutdown()
{
    if (!lifecycle_initialized())
    {
        return;
    }
    pImpl->shutdown();
}

void Logger::flush()
{
    if (!logger_is_loggable("Logger::flush"))
        return;
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(FlushCommand{promise});
    (void)future.get();
}

void Logger::set_level(Level lvl)
{
    if (!logger_is_loggable("Logger::set_level"))
        return;
    pImpl->level_.store(lvl, std::memory_order_relaxed);
}

Logger::Level Logger::level() const
{
    if (!logger_is_loggable("Logger::level"))
        return Level::L_INFO;
    return pImpl->level_.load(std::memory_order_relaxed);
}

void Logger::set_write_error_callback(std::function<void(const std::string &)> cb)
{
    if (!logger_is_loggable("Logger::set_write_error_callback"))
        return;
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(SetErrorCallbackCommand{std::move(cb), promise});
    (void)future.get();
}

bool Logger::should_log(Level lvl) const noexcept
{
    if (g_logger_state.load(std::memory_order_acquire) != LoggerState::Initialized)
        return false;
    return static_cast<int>(lvl) >=
           static_cast<int>(pImpl->level_.load(std::memory_order_relaxed));
}

bool Logger::enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept
{
    if (g_logger_state.load(std::memory_order_acquire) != LoggerState::Initialized)
        return false;
    try
    {
        return pImpl->enqueue_command(make_system_message(lvl, std::move(body)));
    }
    catch (const std::exception &e)
    {
        NB_DEBUG("Logger::enqueue_log failed: {}", e.what());
        return false;
    }
}

// C-style callbacks for the lifecycle API.
void do_logger_startup(const char *arg)
{
    (void)arg;
    Logger::instance().pImpl->start_worker();
    g_logger_state.store(LoggerState::Initialized, std::memory_order_release);
}

void do_logger_shutdown(const char *arg)
{
    (void)arg;
    LoggerState expected = LoggerState::Initialized;
    if (g_logger_state.compare_exchange_strong(expected, LoggerState::ShuttingDown,
                                               std::memory_order_acq_rel))
    {
        Logger::instance().shutdown();
        g_logger_state.store(LoggerState::Shutdown, std::memory_order_release);
    }
}

ModuleDef Logger::GetLifecycleModule()
{
    ModuleDef module("nodebus::utils::Logger");
    module.set_startup(&do_logger_startup);
    module.set_shutdown(&do_logger_shutdown, std::chrono::milliseconds(5000));
    return module;
}

} // namespace nodebus::utils

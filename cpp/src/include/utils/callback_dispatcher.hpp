#pragma once
/**
 * @file callback_dispatcher.hpp
 * @brief Runs posted callbacks on one dedicated worker thread, in post order.
 *
 * Used by the Logger to deliver write-error callbacks and by the ErrorCollector to
 * deliver telemetry records without blocking the posting thread.
 */
#include "nodebus_utils_export.h"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace nodebus::utils
{

class NODEBUS_UTILS_EXPORT CallbackDispatcher
{
  public:
    /// Receives the message of any exception thrown by a posted callback.
    using FailureHandler = std::function<void(const std::string &)>;

    CallbackDispatcher();
    explicit CallbackDispatcher(FailureHandler on_failure);
    ~CallbackDispatcher();

    CallbackDispatcher(const CallbackDispatcher &) = delete;
    CallbackDispatcher &operator=(const CallbackDispatcher &) = delete;

    /// Queues `fn`; returns false once shutdown has been requested.
    bool post(std::function<void()> fn);

    /// Blocks until every callback posted before this call has run.
    void drain();

    /// Runs the remaining queue, then joins the worker. Idempotent.
    void shutdown();

    [[nodiscard]] bool is_running() const noexcept
    {
        return !shutdown_requested_.load(std::memory_order_acquire);
    }

  private:
    void run();

    FailureHandler on_failure_;
    std::deque<std::function<void()>> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::thread worker_;
    std::atomic<bool> shutdown_requested_{false};
};

} // namespace nodebus::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif

#pragma once
/**
 * @file event_loop.hpp
 * @brief Task inbox and timer wheel pumped by the bus thread.
 *
 * `post()` is the only member that may be called from other threads. Everything
 * else, including running tasks and timers, happens on the bus thread inside
 * `run_once()`.
 */
#include "ipc/node_types.hpp"
#include "nodebus_utils_export.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <string_view>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace nodebus::ipc
{

class NODEBUS_UTILS_EXPORT EventLoop
{
  public:
    using Clock = std::chrono::steady_clock;
    using Task = std::function<void()>;
    /// Receives the message of an exception thrown by a task or timer.
    using FailureHandler = std::function<void(const std::string &what)>;

    EventLoop() = default;
    explicit EventLoop(FailureHandler on_failure);

    EventLoop(const EventLoop &) = delete;
    EventLoop &operator=(const EventLoop &) = delete;

    /// Thread-safe.
    void post(Task task);

    TimerId schedule(std::string owner, std::chrono::milliseconds interval, bool repeat,
                     Task fn);
    bool cancel(TimerId id);
    /// Cancels `id` only if it belongs to `owner`.
    bool cancel(TimerId id, std::string_view owner);
    /// Cancels every timer scheduled for `owner`; returns how many.
    std::size_t cancel_owner(std::string_view owner);

    /**
     * @brief Waits until a task is posted, a timer is due or `deadline` passes,
     *        then runs everything that is ready.
     * @return true if at least one task or timer ran.
     */
    bool run_once(Clock::time_point deadline);

    /// Runs ready tasks and due timers without waiting.
    bool run_ready() { return run_once(Clock::now()); }

    [[nodiscard]] std::size_t pending_tasks() const;
    [[nodiscard]] std::size_t timer_count() const;
    [[nodiscard]] std::size_t timer_count(std::string_view owner) const;

    void set_failure_handler(FailureHandler on_failure);

    /// Drops every queued task and timer.
    void clear();

  private:
    struct TimerEntry
    {
        std::string owner;
        std::chrono::milliseconds interval;
        bool repeat;
        Clock::time_point due;
        Task fn;
    };

    void run_guarded(const Task &task);

    FailureHandler m_on_failure;
    std::deque<Task> m_tasks;
    std::map<TimerId, TimerEntry> m_timers;
    TimerId m_next_timer_id{1};
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
};

} // namespace nodebus::ipc

#if defined(_MSC_VER)
#pragma warning(pop)
#endif

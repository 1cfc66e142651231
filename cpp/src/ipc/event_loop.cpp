#include "nb_service.hpp"

#include "ipc/event_loop.hpp"

#include <algorithm>
#include <vector>

namespace nodebus::ipc
{

EventLoop::EventLoop(FailureHandler on_failure) : m_on_failure(std::move(on_failure)) {}

void EventLoop::set_failure_handler(FailureHandler on_failure)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_on_failure = std::move(on_failure);
}

void EventLoop::post(Task task)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_tasks.push_back(std::move(task));
    }
    m_cv.notify_one();
}

TimerId EventLoop::schedule(std::string owner, std::chrono::milliseconds interval, bool repeat,
                            Task fn)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const TimerId id = m_next_timer_id++;
    m_timers.emplace(id, TimerEntry{std::move(owner), interval, repeat, Clock::now() + interval,
                                    std::move(fn)});
    return id;
}

bool EventLoop::cancel(TimerId id)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_timers.erase(id) > 0;
}

bool EventLoop::cancel(TimerId id, std::string_view owner)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_timers.find(id);
    if (it == m_timers.end() || it->second.owner != owner)
    {
        return false;
    }
    m_timers.erase(it);
    return true;
}

std::size_t EventLoop::cancel_owner(std::string_view owner)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return std::erase_if(m_timers, [owner](const auto &entry) { return entry.second.owner == owner; });
}

void EventLoop::run_guarded(const Task &task)
{
    auto report = [this](const char *what)
    {
        FailureHandler on_failure;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            on_failure = m_on_failure;
        }
        if (on_failure)
        {
            on_failure(what);
        }
        else
        {
            LOGGER_ERROR("[nodebus/loop] task threw: {}", what);
        }
    };

    try
    {
        task();
    }
    catch (const std::exception &e)
    {
        report(e.what());
    }
    catch (...)
    {
        report("non-standard exception");
    }
}

bool EventLoop::run_once(Clock::time_point deadline)
{
    std::deque<Task> tasks;
    std::vector<TimerId> due;
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        while (true)
        {
            const auto now = Clock::now();
            const bool timer_due = std::any_of(m_timers.begin(), m_timers.end(),
                                               [now](const auto &e) { return e.second.due <= now; });
            if (!m_tasks.empty() || timer_due || now >= deadline)
            {
                break;
            }
            auto wake = deadline;
            for (const auto &[id, entry] : m_timers)
            {
                wake = std::min(wake, entry.due);
            }
            m_cv.wait_until(lock, wake);
        }

        tasks.swap(m_tasks);
        const auto now = Clock::now();
        for (const auto &[id, entry] : m_timers)
        {
            if (entry.due <= now)
            {
                due.push_back(id);
            }
        }
    }

    for (const auto &task : tasks)
    {
        run_guarded(task);
    }

    // A callback may cancel a later timer of the same batch; re-check each one.
    std::size_t timers_run = 0;
    for (TimerId id : due)
    {
        Task fn;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_timers.find(id);
            if (it == m_timers.end())
            {
                continue;
            }
            fn = it->second.fn;
            if (it->second.repeat)
            {
                it->second.due = Clock::now() + it->second.interval;
            }
            else
            {
                m_timers.erase(it);
            }
        }
        run_guarded(fn);
        ++timers_run;
    }
    return !tasks.empty() || timers_run > 0;
}

std::size_t EventLoop::pending_tasks() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tasks.size();
}

std::size_t EventLoop::timer_count() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_timers.size();
}

std::size_t EventLoop::timer_count(std::string_view owner) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<std::size_t>(
        std::count_if(m_timers.begin(), m_timers.end(),
                      [owner](const auto &entry) { return entry.second.owner == owner; }));
}

void EventLoop::clear()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_tasks.clear();
    m_timers.clear();
}

} // namespace nodebus::ipc

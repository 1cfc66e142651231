#include "nb_service.hpp"

#include <future>

namespace nodebus::utils
{

CallbackDispatcher::CallbackDispatcher() : CallbackDispatcher(FailureHandler{}) {}

CallbackDispatcher::CallbackDispatcher(FailureHandler on_failure)
    : on_failure_(std::move(on_failure))
{
    worker_ = std::thread([this] { this->run(); });
}

CallbackDispatcher::~CallbackDispatcher()
{
    shutdown();
}

bool CallbackDispatcher::post(std::function<void()> fn)
{
    if (shutdown_requested_.load(std::memory_order_relaxed))
        return false;
    {
        std::lock_guard<std::mutex> lg(mutex_);
        queue_.push_back(std::move(fn));
    }
    cv_.notify_one();
    return true;
}

void CallbackDispatcher::drain()
{
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();
    if (!post([promise] { promise->set_value(); }))
    {
        return;
    }
    future.wait();
}

void CallbackDispatcher::shutdown()
{
    if (shutdown_requested_.exchange(true))
    {
        return;
    }
    cv_.notify_one();
    if (worker_.joinable())
    {
        worker_.join();
    }
}

void CallbackDispatcher::run()
{
    for (;;)
    {
        std::function<void()> fn;
        {
            std::unique_lock<std::mutex> ul(mutex_);
            cv_.wait(ul, [this] { return shutdown_requested_.load() || !queue_.empty(); });
            if (shutdown_requested_.load() && queue_.empty())
            {
                return;
            }
            fn = std::move(queue_.front());
            queue_.pop_front();
        }
        try
        {
            fn();
        }
        catch (const std::exception &e)
        {
            if (on_failure_)
            {
                on_failure_(e.what());
            }
            else
            {
                NB_DEBUG("CallbackDispatcher: callback threw: {}", e.what());
            }
        }
    }
}

} // namespace nodebus::utils

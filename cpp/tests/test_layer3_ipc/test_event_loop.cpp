/**
 * @file test_event_loop.cpp
 * @brief Posted tasks, timers, cancellation and failure reporting of the bus loop.
 */
#include "shared_test_helpers.h"

#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace nodebus::ipc;
using namespace std::chrono_literals;
using ::testing::ElementsAre;

namespace
{
EventLoop::Clock::time_point in(std::chrono::milliseconds d)
{
    return EventLoop::Clock::now() + d;
}
} // namespace

TEST(EventLoopTest, PostedTasksRunInOrder)
{
    EventLoop loop;
    std::vector<int> order;
    loop.post([&order] { order.push_back(1); });
    loop.post([&order] { order.push_back(2); });
    EXPECT_EQ(loop.pending_tasks(), 2u);

    EXPECT_TRUE(loop.run_ready());
    EXPECT_THAT(order, ElementsAre(1, 2));
    EXPECT_FALSE(loop.run_ready());
}

TEST(EventLoopTest, TaskPostedFromTaskRunsOnNextPass)
{
    EventLoop loop;
    std::vector<std::string> order;
    loop.post(
        [&]
        {
            order.push_back("outer");
            loop.post([&order] { order.push_back("inner"); });
        });

    loop.run_ready();
    EXPECT_THAT(order, ElementsAre("outer"));
    loop.run_ready();
    EXPECT_THAT(order, ElementsAre("outer", "inner"));
}

TEST(EventLoopTest, PostFromAnotherThreadWakesTheLoop)
{
    EventLoop loop;
    bool ran = false;
    std::thread producer(
        [&loop, &ran]
        {
            std::this_thread::sleep_for(10ms);
            loop.post([&ran] { ran = true; });
        });

    const auto started = EventLoop::Clock::now();
    EXPECT_TRUE(loop.run_once(in(5s)));
    producer.join();
    EXPECT_TRUE(ran);
    EXPECT_LT(EventLoop::Clock::now() - started, 4s);
}

TEST(EventLoopTest, RunOnceReturnsFalseAtDeadline)
{
    EventLoop loop;
    EXPECT_FALSE(loop.run_once(in(5ms)));
}

TEST(EventLoopTest, OneShotAndRepeatingTimers)
{
    EventLoop loop;
    int once = 0;
    int repeated = 0;
    loop.schedule("a", 1ms, false, [&once] { ++once; });
    loop.schedule("b", 1ms, true, [&repeated] { ++repeated; });
    EXPECT_EQ(loop.timer_count(), 2u);

    const auto deadline = in(2s);
    while (repeated < 3 && EventLoop::Clock::now() < deadline)
    {
        loop.run_once(in(20ms));
    }
    EXPECT_EQ(once, 1);
    EXPECT_GE(repeated, 3);
    EXPECT_EQ(loop.timer_count(), 1u);
    EXPECT_EQ(loop.timer_count("b"), 1u);
}

TEST(EventLoopTest, CancellationRespectsOwner)
{
    EventLoop loop;
    const TimerId a1 = loop.schedule("a", 1h, false, [] {});
    loop.schedule("a", 1h, true, [] {});
    const TimerId b1 = loop.schedule("b", 1h, false, [] {});

    EXPECT_FALSE(loop.cancel(b1, "a"));
    EXPECT_TRUE(loop.cancel(b1, "b"));
    EXPECT_TRUE(loop.cancel(a1));
    EXPECT_FALSE(loop.cancel(a1));
    EXPECT_EQ(loop.cancel_owner("a"), 1u);
    EXPECT_EQ(loop.timer_count(), 0u);
}

TEST(EventLoopTest, TimerCanCancelLaterTimerInSameBatch)
{
    EventLoop loop;
    TimerId second = 0;
    bool second_ran = false;
    loop.schedule("x", 0ms, false, [&] { loop.cancel(second); });
    second = loop.schedule("x", 0ms, false, [&second_ran] { second_ran = true; });

    std::this_thread::sleep_for(2ms);
    loop.run_ready();
    EXPECT_FALSE(second_ran);
}

TEST(EventLoopTest, FailuresGoToTheHandlerAndLoopContinues)
{
    std::vector<std::string> failures;
    EventLoop loop([&failures](const std::string &what) { failures.push_back(what); });
    bool after = false;
    loop.post([] { throw std::runtime_error("first"); });
    loop.post([&after] { after = true; });
    loop.schedule("t", 0ms, false, [] { throw std::logic_error("second"); });

    std::this_thread::sleep_for(2ms);
    loop.run_ready();
    EXPECT_TRUE(after);
    EXPECT_THAT(failures, ElementsAre("first", "second"));
}

TEST(EventLoopTest, NonStandardThrowIsReportedToo)
{
    std::vector<std::string> failures;
    EventLoop loop([&failures](const std::string &what) { failures.push_back(what); });
    bool after = false;
    loop.post([] { throw 42; });
    loop.post([&after] { after = true; });

    EXPECT_NO_THROW(loop.run_ready());
    EXPECT_TRUE(after);
    EXPECT_THAT(failures, ElementsAre("non-standard exception"));
}

TEST(EventLoopTest, ClearDropsEverything)
{
    EventLoop loop;
    loop.post([] { FAIL() << "cleared"; });
    loop.schedule("t", 0ms, true, [] { FAIL() << "cleared"; });
    loop.clear();
    EXPECT_EQ(loop.pending_tasks(), 0u);
    EXPECT_EQ(loop.timer_count(), 0u);
    EXPECT_FALSE(loop.run_ready());
}

TEST(EventLoopTest, BusReportsLoopFailures)
{
    NodeBus bus;
    bus.post([] { throw std::runtime_error("posted task failed"); });
    EXPECT_TRUE(bus.poll());

    const auto events = bus.errors().recent();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].handler, "<loop>");
    EXPECT_EQ(events[0].error, "posted task failed");
}

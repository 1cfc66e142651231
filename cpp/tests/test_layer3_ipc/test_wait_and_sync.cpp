/**
 * @file test_wait_and_sync.cpp
 * @brief Instance locking while waiting for a signal, in-order replay of held
 *        messages, and synchronous sends acknowledged by the receiver.
 */
#include "shared_test_helpers.h"

#include <chrono>
#include <stdexcept>
#include <string>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace nodebus::ipc;
using namespace nodebus::tests::helper;
using namespace std::chrono_literals;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::StartsWith;

namespace
{
std::vector<std::string> trace(const Journal &journal)
{
    std::vector<std::string> out;
    for (const auto &d : *journal)
    {
        out.push_back(d.payload.contains("n")
                          ? fmt::format("{}:{}:{}", d.instance, d.signal, d.payload.at("n").dump())
                          : fmt::format("{}:{}", d.instance, d.signal));
    }
    return out;
}
} // namespace

class WaitForSignalTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        journal = make_journal();
        bus.define_class(NodeClassDef("Ctrl"));
        bus.define_class(
            NodeClassDef("Waiter")
                .on(Channel::Input, "onGo",
                    [this](NodeInstance &self, const Message &msg)
                    {
                        journal->push_back(Delivery{self.id(), msg.signal, msg.id, {}});
                        const auto timeout =
                            std::chrono::milliseconds(self.attribute_or<int>("timeout_ms", 1000));
                        auto resumed = self.wait_for_signal("resume", timeout);
                        locked_after_wait = self.is_locked();
                        journal->push_back(Delivery{self.id(),
                                                    resumed ? "resumed" : "timed-out",
                                                    resumed ? resumed->id : kInvalidMessageId,
                                                    resumed ? resumed->payload : Payload()});
                    })
                .on(Channel::Input, "onData", recorder(journal)));
        bus.define_class(recording_class("Sink", journal, {"data"}));
        bus.define_mode("main", wiring_mode({{"Ctrl", {"Waiter", "Sink"}}}));
        bus.switch_mode("main");
    }

    void boot()
    {
        bus.init();
        bus.start();
    }

    NodeBus bus;
    Journal journal;
    bool locked_after_wait{true};
};

// Messages for a waiting instance are held; everyone else keeps receiving.
TEST_F(WaitForSignalTest, HeldMessagesReplayInOrderAfterResume)
{
    bus.create_instance({"Ctrl", "ctrl"});
    bus.create_instance({"Waiter", "waiter"});
    bus.create_instance({"Sink", "sink"});
    boot();

    bus.post(
        [this]
        {
            bus.send("ctrl", "data", {{"n", 1}});
            bus.send("ctrl", "data", {{"n", 2}});
            bus.send("ctrl", "resume", {{"n", 3}});
        });
    bus.send("ctrl", "go");

    EXPECT_THAT(trace(journal),
                ElementsAre("waiter:go", "sink:data:1", "sink:data:2", "waiter:resumed:3",
                            "waiter:data:1", "waiter:data:2"));
    EXPECT_FALSE(locked_after_wait);
    EXPECT_EQ(bus.router().stats().queued_while_locked, 2u);
    EXPECT_EQ(bus.find_instance("waiter")->queued_count(), 0u);
}

TEST_F(WaitForSignalTest, HeldMessagesReplayAfterTimeout)
{
    bus.create_instance({"Ctrl", "ctrl"});
    bus.create_instance({"Waiter", "waiter", {{"timeout_ms", 30}}});
    boot();

    bus.post(
        [this]
        {
            bus.send("ctrl", "data", {{"n", 1}});
            bus.send("ctrl", "data", {{"n", 2}});
        });
    bus.send("ctrl", "go");

    EXPECT_THAT(trace(journal), ElementsAre("waiter:go", "waiter:timed-out", "waiter:data:1",
                                            "waiter:data:2"));
    EXPECT_FALSE(bus.find_instance("waiter")->is_locked());
}

TEST_F(WaitForSignalTest, ResumeCanComeFromATimer)
{
    bus.create_instance({"Ctrl", "ctrl"});
    bus.create_instance({"Waiter", "waiter"});
    boot();

    bus.find_instance("ctrl")->schedule(
        10ms, [](NodeInstance &self) { self.send("resume", {{"n", 9}}); });
    bus.send("ctrl", "go");

    EXPECT_THAT(trace(journal), ElementsAre("waiter:go", "waiter:resumed:9"));
}

TEST_F(WaitForSignalTest, WaitingTwiceIsAnError)
{
    bus.create_instance({"Ctrl", "ctrl"});
    bus.create_instance({"Waiter", "waiter", {{"timeout_ms", 200}}});
    boot();

    bus.post(
        [this]
        {
            bus.find_instance("waiter")->wait_for_signal("other", 10ms);
        });
    bus.post([this] { bus.send("ctrl", "resume"); });
    bus.send("ctrl", "go");

    EXPECT_THAT(trace(journal), ElementsAre("waiter:go", "waiter:resumed"));
    const auto events = bus.errors().recent();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].handler, "<loop>");
    EXPECT_THAT(events[0].error, HasSubstr("already waiting for 'resume'"));
}

class SyncSendTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        journal = make_journal();
        bus.define_class(NodeClassDef("Requester")
                             .on(Channel::Input, "onAck", recorder(journal))
                             .map_signal("_ack", "onAck"));
        bus.define_class(recording_class("Worker", journal, {"job"}));
        bus.define_class(NodeClassDef("Deaf"));
        bus.define_class(NodeClassDef("Broken").on(Channel::Input, "onJob",
                                                   [](NodeInstance &, const Message &)
                                                   { throw std::runtime_error("no capacity"); }));
    }

    void start_with(const std::string &target_class)
    {
        bus.define_mode("main", wiring_mode({{"Requester", {target_class}}}));
        bus.switch_mode("main");
        bus.init();
        bus.start();
    }

    NodeBus bus;
    Journal journal;
};

TEST_F(SyncSendTest, ReceiverAcknowledgesAfterHandlerReturns)
{
    auto *req = bus.create_instance({"Requester", "req"});
    bus.create_instance({"Worker", "worker"});
    start_with("Worker");

    auto ack = req->send_sync("job", {{"task", "build"}}, 500ms);

    ASSERT_TRUE(ack.has_value());
    EXPECT_EQ(ack->signal, "_ack");
    EXPECT_EQ(ack->source_id, "worker");
    EXPECT_EQ(ack->payload.at("_ackFor"), "job");
    EXPECT_EQ(ack->payload.at("targetId"), "worker");
    EXPECT_THAT(ack->payload.at("_correlationId").get<std::string>(), StartsWith("sync_"));

    ASSERT_THAT(receivers_of(journal, "job"), ElementsAre("worker"));
    const auto &job = journal->front().payload;
    EXPECT_EQ(job.at("task"), "build");
    EXPECT_EQ(job.at("_sync").at("replyTo"), "req");
    EXPECT_EQ(job.at("_sync").at("id"), ack->payload.at("_correlationId"));
    EXPECT_FALSE(req->is_locked());
}

TEST_F(SyncSendTest, SyncFromInsideAHandler)
{
    std::optional<Message> ack;
    bus.define_class(NodeClassDef("Starter")
                         .on(Channel::Input, "onKick",
                             [&ack](NodeInstance &self, const Message &)
                             { ack = self.send_sync("job", {{"task", "lint"}}, 500ms); }));
    bus.create_instance({"Starter", "starter"});
    bus.create_instance({"Worker", "worker"});
    bus.define_mode("main", wiring_mode({{"Starter", {"Worker"}}}));
    bus.switch_mode("main");
    bus.init();
    bus.start();

    bus.send_to("starter", "kick");
    ASSERT_TRUE(ack.has_value());
    EXPECT_EQ(ack->payload.at("_ackFor"), "job");
}

TEST_F(SyncSendTest, StrayAckDoesNotEndTheWait)
{
    bus.define_class(NodeClassDef("Chatty").on(
        Channel::Input, "onJob",
        [](NodeInstance &self, const Message &msg)
        { self.send_to(msg.source_id, "_ack", {{"_correlationId", "other"}}); }));
    auto *req = bus.create_instance({"Requester", "req"});
    bus.create_instance({"Chatty", "chatty"});
    start_with("Chatty");

    auto ack = req->send_sync("job", {}, 500ms);

    ASSERT_TRUE(ack.has_value());
    EXPECT_THAT(ack->payload.at("_correlationId").get<std::string>(), StartsWith("sync_"));
    EXPECT_EQ(bus.router().stats().queued_while_locked, 1u);
    ASSERT_THAT(receivers_of(journal, "_ack"), ElementsAre("req"));
    EXPECT_EQ(journal->back().payload.at("_correlationId"), "other");
}

TEST_F(SyncSendTest, NonObjectPayloadIsWrapped)
{
    auto *req = bus.create_instance({"Requester", "req"});
    bus.create_instance({"Worker", "worker"});
    start_with("Worker");

    ASSERT_TRUE(req->send_sync("job", 17, 500ms).has_value());
    EXPECT_EQ(journal->front().payload.at("value"), 17);
}

TEST_F(SyncSendTest, TimesOutWithoutAHandler)
{
    auto *req = bus.create_instance({"Requester", "req"});
    bus.create_instance({"Deaf", "deaf"});
    start_with("Deaf");

    EXPECT_FALSE(req->send_sync("job", {}, 30ms).has_value());
    EXPECT_FALSE(req->is_locked());
}

TEST_F(SyncSendTest, FailedHandlerSendsNoAck)
{
    auto *req = bus.create_instance({"Requester", "req"});
    bus.create_instance({"Broken", "broken"});
    start_with("Broken");

    EXPECT_FALSE(req->send_sync("job", {}, 30ms).has_value());
    EXPECT_EQ(bus.errors().total_count(), 1u);
}

TEST_F(SyncSendTest, PlainMessagesAreNotAcknowledged)
{
    bus.create_instance({"Requester", "req"});
    bus.create_instance({"Worker", "worker"});
    start_with("Worker");

    bus.send("req", "job", {{"task", "plain"}});
    EXPECT_THAT(receivers_of(journal, "_ack"), ::testing::IsEmpty());

    // Any message carrying `_sync` metadata is acknowledged, even without a waiter.
    bus.send("req", "job", {{"_sync", {{"id", "manual-1"}, {"replyTo", "req"}}}});
    ASSERT_THAT(receivers_of(journal, "_ack"), ElementsAre("req"));
    EXPECT_EQ(journal->back().payload.at("_correlationId"), "manual-1");
}

TEST_F(SyncSendTest, SendBeforeStartFailsImmediately)
{
    auto *req = bus.create_instance({"Requester", "req"});
    bus.create_instance({"Worker", "worker"});

    const auto started = std::chrono::steady_clock::now();
    EXPECT_FALSE(req->send_sync("job", {}, 2s).has_value());
    EXPECT_LT(std::chrono::steady_clock::now() - started, 1s);
}

/**
 * @file test_message_router.cpp
 * @brief Wired delivery: message identity, fan-out, cycle suppression, failure
 *        isolation and routing anomalies.
 */
#include "shared_test_helpers.h"

#include <stdexcept>
#include <string>
#include <vector>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace nodebus::ipc;
using namespace nodebus::tests::helper;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;

class MessageRouterTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        journal = make_journal();
        bus.define_class(NodeClassDef("Source").output("ping"));
        bus.define_class(recording_class("Sink", journal, {"ping", "direct"}));
        bus.define_class(recording_class("Other", journal, {"ping"}));
    }

    void wire(WiringTable wiring)
    {
        bus.define_mode("test", wiring_mode(std::move(wiring)));
        bus.switch_mode("test");
    }

    void boot()
    {
        bus.init();
        bus.start();
    }

    NodeBus bus;
    Journal journal;
};

TEST_F(MessageRouterTest, MessageIdsAreStrictlyIncreasing)
{
    bus.create_instance({"Source", "src"});
    bus.create_instance({"Sink", "sink"});
    wire({{"Source", {"Sink"}}});
    boot();

    MessageId previous = kInvalidMessageId;
    for (int i = 0; i < 20; ++i)
    {
        const MessageId id = bus.send("src", "ping", {{"n", i}});
        ASSERT_NE(id, kInvalidMessageId);
        EXPECT_GT(id, previous);
        previous = id;
    }
    ASSERT_EQ(journal->size(), 20u);
    EXPECT_EQ(journal->back().payload.at("n"), 19);
}

TEST_F(MessageRouterTest, FanOutDeliversOnceToEachTargetUnderOneId)
{
    bus.create_instance({"Source", "src"});
    bus.create_instance({"Sink", "sink-1"});
    bus.create_instance({"Sink", "sink-2"});
    bus.create_instance({"Other", "other-1"});
    wire({{"Source", {"Sink", "Other"}}});
    boot();

    const MessageId id = bus.send("src", "ping", {{"value", 7}});

    EXPECT_THAT(receivers_of(journal, "ping"), ElementsAre("sink-1", "sink-2", "other-1"));
    for (const auto &d : *journal)
    {
        EXPECT_EQ(d.id, id);
        EXPECT_EQ(d.payload.at("value"), 7);
    }
    EXPECT_EQ(bus.router().stats().delivered, 3u);
}

TEST_F(MessageRouterTest, SourceSeesSenderIdentity)
{
    std::string seen_source;
    std::string seen_class;
    bus.define_class(NodeClassDef("Probe").on(Channel::Input, "onPing",
                                              [&](NodeInstance &, const Message &msg)
                                              {
                                                  seen_source = msg.source_id;
                                                  seen_class = msg.source_class;
                                              }));
    bus.create_instance({"Source", "src"});
    bus.create_instance({"Probe", "probe"});
    wire({{"Source", {"Probe"}}});
    boot();

    bus.send("src", "ping");
    EXPECT_EQ(seen_source, "src");
    EXPECT_EQ(seen_class, "Source");
}

// A relays to B, B relays back to A: A already handled that id and is skipped.
TEST_F(MessageRouterTest, RelayCycleIsCutAtFirstRevisit)
{
    auto relay = [this](NodeInstance &self, const Message &msg)
    {
        journal->push_back(Delivery{self.id(), msg.signal, msg.id, msg.payload});
        self.relay(msg);
    };
    bus.define_class(NodeClassDef("Ping").on(Channel::Input, "onBall", relay));
    bus.define_class(NodeClassDef("Pong").on(Channel::Input, "onBall", relay));
    bus.create_instance({"Ping", "a"});
    bus.create_instance({"Pong", "b"});
    wire({{"Ping", {"Pong"}}, {"Pong", {"Ping"}}});
    boot();

    const MessageId id = bus.send("a", "ball");

    EXPECT_THAT(receivers_of(journal, "ball"), ElementsAre("b"));
    EXPECT_EQ(journal->front().id, id);
    EXPECT_EQ(bus.router().stats().cycle_drops, 1u);
    EXPECT_EQ(bus.router().pending(), 0u);
}

TEST_F(MessageRouterTest, LongerCycleVisitsEachInstanceOnce)
{
    auto relay = [this](NodeInstance &self, const Message &msg)
    {
        journal->push_back(Delivery{self.id(), msg.signal, msg.id, msg.payload});
        self.relay(msg);
    };
    bus.define_class(NodeClassDef("A").on(Channel::Input, "onBall", relay));
    bus.define_class(NodeClassDef("B").on(Channel::Input, "onBall", relay));
    bus.define_class(NodeClassDef("C").on(Channel::Input, "onBall", relay));
    bus.create_instance({"A", "a"});
    bus.create_instance({"B", "b"});
    bus.create_instance({"C", "c"});
    wire({{"A", {"B"}}, {"B", {"C"}}, {"C", {"A"}}});
    boot();

    // The entry point is a direct delivery, so `a` handles the ball once too.
    bus.send_to("a", "ball");

    EXPECT_THAT(receivers_of(journal, "ball"), ElementsAre("a", "b", "c"));
    EXPECT_EQ(bus.router().stats().cycle_drops, 1u);
}

// A fresh send from inside a handler starts a new message id.
TEST_F(MessageRouterTest, NewSendFromHandlerGetsNewId)
{
    int bounces = 0;
    bus.define_class(NodeClassDef("Bouncer").on(Channel::Input, "onBall",
                                                [&](NodeInstance &self, const Message &msg)
                                                {
                                                    journal->push_back(Delivery{
                                                        self.id(), msg.signal, msg.id, msg.payload});
                                                    if (++bounces < 3)
                                                    {
                                                        self.send("ball");
                                                    }
                                                }));
    bus.create_instance({"Source", "src"});
    bus.create_instance({"Bouncer", "x"});
    bus.create_instance({"Bouncer", "y"});
    wire({{"Source", {"Bouncer"}}, {"Bouncer", {"Bouncer"}}});
    boot();

    bus.send("src", "ball");

    ASSERT_GE(journal->size(), 3u);
    EXPECT_EQ((*journal)[0].id, (*journal)[1].id);
    EXPECT_NE((*journal)[0].id, (*journal)[2].id);
}

TEST_F(MessageRouterTest, NestedSendsAreDeliveredBreadthFirst)
{
    bus.define_class(NodeClassDef("Forwarder").on(Channel::Input, "onPing",
                                                  [this](NodeInstance &self, const Message &msg)
                                                  {
                                                      journal->push_back(Delivery{
                                                          self.id(), msg.signal, msg.id, {}});
                                                      self.send("ping");
                                                  }));
    bus.create_instance({"Source", "src"});
    bus.create_instance({"Forwarder", "fwd"});
    bus.create_instance({"Sink", "sink"});
    bus.create_instance({"Other", "other"});
    wire({{"Source", {"Forwarder", "Sink"}}, {"Forwarder", {"Other"}}});
    boot();

    bus.send("src", "ping");

    EXPECT_THAT(receivers_of(journal, "ping"), ElementsAre("fwd", "sink", "other"));
}

TEST_F(MessageRouterTest, ThrowingHandlerIsIsolatedAndReported)
{
    bus.define_class(NodeClassDef("Faulty").on(Channel::Input, "onPing",
                                               [](NodeInstance &, const Message &)
                                               { throw std::runtime_error("sensor offline"); }));
    auto sink = std::make_shared<RecordingSink>();
    bus.errors().add_sink(sink);

    bus.create_instance({"Source", "src"});
    bus.create_instance({"Faulty", "faulty"});
    bus.create_instance({"Sink", "sink"});
    wire({{"Source", {"Faulty", "Sink"}}});
    boot();

    EXPECT_NO_THROW(bus.send("src", "ping", {{"reading", 42}}));
    EXPECT_THAT(receivers_of(journal, "ping"), ElementsAre("sink"));

    EXPECT_EQ(bus.errors().total_count(), 1u);
    const auto events = bus.errors().recent();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].node_id, "faulty");
    EXPECT_EQ(events[0].class_name, "Faulty");
    EXPECT_EQ(events[0].handler, "In.onPing");
    EXPECT_EQ(events[0].error, "sensor offline");
    EXPECT_EQ(events[0].data.at("reading"), 42);
    EXPECT_EQ(bus.router().stats().handler_failures, 1u);

    bus.errors().flush();
    ASSERT_EQ(sink->events().size(), 1u);
    EXPECT_EQ(sink->events()[0].handler, "In.onPing");
}

TEST_F(MessageRouterTest, SendsBeforeStartAreDropped)
{
    bus.create_instance({"Source", "src"});
    bus.create_instance({"Sink", "sink"});
    wire({{"Source", {"Sink"}}});

    EXPECT_EQ(bus.send("src", "ping"), kInvalidMessageId);
    bus.init();
    EXPECT_EQ(bus.send("src", "ping"), kInvalidMessageId);
    EXPECT_EQ(bus.send_to("sink", "direct"), kInvalidMessageId);
    EXPECT_THAT(*journal, IsEmpty());
    EXPECT_EQ(bus.router().stats().dropped_not_started, 3u);

    bus.start();
    EXPECT_NE(bus.send("src", "ping"), kInvalidMessageId);
    EXPECT_EQ(journal->size(), 1u);

    bus.stop();
    EXPECT_EQ(bus.send("src", "ping"), kInvalidMessageId);
    EXPECT_EQ(journal->size(), 1u);
}

TEST_F(MessageRouterTest, UnknownSourceIsARoutingAnomaly)
{
    boot();
    EXPECT_EQ(bus.send("ghost", "ping"), kInvalidMessageId);
    const auto events = bus.errors().recent();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].handler, MessageRouter::kRouterHandler);
    EXPECT_EQ(events[0].node_id, "ghost");
    EXPECT_THAT(events[0].error, HasSubstr("unknown source"));
}

TEST_F(MessageRouterTest, UnknownDirectTargetIsARoutingAnomaly)
{
    boot();
    EXPECT_EQ(bus.send_to("nobody", "direct"), kInvalidMessageId);
    const auto events = bus.errors().recent();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_THAT(events[0].error, HasSubstr("unknown target instance 'nobody'"));
}

TEST_F(MessageRouterTest, DirectSendBypassesWiring)
{
    bus.create_instance({"Sink", "sink"});
    boot();
    const MessageId id = bus.send_to("sink", "direct", {{"k", "v"}});
    ASSERT_EQ(journal->size(), 1u);
    EXPECT_EQ((*journal)[0].id, id);
    EXPECT_EQ((*journal)[0].signal, "direct");
}

TEST_F(MessageRouterTest, UnwiredOrUnhandledSignalsAreSkippedQuietly)
{
    bus.create_instance({"Source", "src"});
    bus.create_instance({"Sink", "sink"});
    wire({{"Source", {"Sink", "Unregistered"}}});
    boot();

    EXPECT_NE(bus.send("src", "unheard"), kInvalidMessageId);
    EXPECT_NE(bus.send("sink", "ping"), kInvalidMessageId) << "Sink has no wiring entry";
    EXPECT_THAT(*journal, IsEmpty());
    EXPECT_EQ(bus.errors().total_count(), 0u);
}

TEST_F(MessageRouterTest, ModeOverrideHandlerIsUsedWhileModeIsActive)
{
    bus.define_class(
        NodeClassDef("Lamp")
            .on(Channel::Input, "onPing",
                [this](NodeInstance &self, const Message &msg)
                { journal->push_back(Delivery{self.id(), "day:" + msg.signal, msg.id, {}}); })
            .on_mode("night", Channel::Input, "onPing",
                     [this](NodeInstance &self, const Message &msg) {
                         journal->push_back(Delivery{self.id(), "night:" + msg.signal, msg.id, {}});
                     }));
    bus.create_instance({"Source", "src"});
    bus.create_instance({"Lamp", "lamp"});
    bus.define_mode("day", wiring_mode({{"Source", {"Lamp"}}}));
    ModeConfig night;
    night.base = "day";
    bus.define_mode("night", night);
    bus.switch_mode("day");
    boot();

    bus.send("src", "ping");
    bus.switch_mode("night");
    bus.send("src", "ping");

    ASSERT_EQ(journal->size(), 2u);
    EXPECT_EQ((*journal)[0].signal, "day:ping");
    EXPECT_EQ((*journal)[1].signal, "night:ping");
}

TEST_F(MessageRouterTest, DespawnedTargetIsSkippedMidPropagation)
{
    bus.define_class(NodeClassDef("Reaper").on(Channel::Input, "onPing",
                                               [this](NodeInstance &self, const Message &msg)
                                               {
                                                   journal->push_back(
                                                       Delivery{self.id(), msg.signal, msg.id, {}});
                                                   self.bus().despawn("sink");
                                               }));
    bus.create_instance({"Source", "src"});
    bus.create_instance({"Reaper", "reaper"});
    bus.create_instance({"Sink", "sink"});
    wire({{"Source", {"Reaper", "Sink"}}});
    boot();

    bus.send("src", "ping");
    EXPECT_THAT(receivers_of(journal, "ping"), ElementsAre("reaper"));
    EXPECT_EQ(bus.find_instance("sink"), nullptr);
    EXPECT_EQ(bus.errors().total_count(), 0u);
}

TEST_F(MessageRouterTest, BroadcastReachesEverySystemHandler)
{
    auto sys = make_journal();
    bus.define_class(NodeClassDef("Listener").on(Channel::System, "onAlarm", recorder(sys)));
    bus.create_instance({"Listener", "l-1"});
    bus.create_instance({"Listener", "l-2"});
    bus.create_instance({"Sink", "sink"});

    const MessageId id = bus.broadcast("alarm", {{"level", 3}});
    EXPECT_THAT(receivers_of(sys, "alarm"), ElementsAre("l-1", "l-2"));
    EXPECT_EQ((*sys)[0].id, id);
    EXPECT_EQ((*sys)[1].payload.at("level"), 3);
}

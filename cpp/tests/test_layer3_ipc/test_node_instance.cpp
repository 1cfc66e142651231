/**
 * @file test_node_instance.cpp
 * @brief Attributes, private state and the messaging shortcuts of a live instance.
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

namespace
{
struct TurretState
{
    int shots{0};
    std::vector<std::string> targets;
};
} // namespace

class NodeInstanceTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        journal = make_journal();
        bus.define_class(NodeClassDef("Turret")
                             .attribute("ammo", 10)
                             .attribute("name", "east")
                             .on(Channel::Input, "onFire",
                                 [](NodeInstance &self, const Message &msg)
                                 {
                                     auto &state = self.private_state<TurretState>();
                                     ++state.shots;
                                     state.targets.push_back(msg.payload.value("at", "?"));
                                     self.set_attribute("ammo",
                                                        self.attribute_or<int>("ammo", 0) - 1);
                                     self.relay(msg, "fired");
                                 }));
        bus.define_class(recording_class("Scoreboard", journal, {"fired", "fire"}));
        bus.define_mode("main", wiring_mode({{"Turret", {"Scoreboard"}}}));
        bus.switch_mode("main");
        turret = bus.create_instance({"Turret", "turret"});
        bus.create_instance({"Scoreboard", "score"});
        bus.init();
        bus.start();
    }

    NodeBus bus;
    Journal journal;
    NodeInstance *turret{nullptr};
};

TEST_F(NodeInstanceTest, AttributeAccessors)
{
    EXPECT_EQ(turret->attribute("ammo").value(), Payload(10));
    EXPECT_FALSE(turret->attribute("missing").has_value());
    EXPECT_EQ(turret->attribute_or<int>("missing", 3), 3);
    EXPECT_EQ(turret->attribute_or<int>("name", -1), -1) << "wrong type falls back";

    turret->set_attribute("name", nullptr);
    EXPECT_EQ(turret->attribute_or<std::string>("name", "unnamed"), "unnamed");

    turret->merge_attributes({{"ammo", 4}, {"armor", {{"front", 2}}}});
    EXPECT_EQ(turret->attribute_or<int>("ammo", 0), 4);
    EXPECT_EQ(turret->attributes().at("armor").at("front"), 2);
}

TEST_F(NodeInstanceTest, PrivateStatePersistsAcrossDeliveries)
{
    bus.send_to("turret", "fire", {{"at", "north"}});
    bus.send_to("turret", "fire", {{"at", "west"}});

    auto &state = turret->private_state<TurretState>();
    EXPECT_EQ(state.shots, 2);
    EXPECT_THAT(state.targets, ElementsAre("north", "west"));
    EXPECT_EQ(turret->attribute_or<int>("ammo", 0), 8);
    EXPECT_THROW(turret->private_state<int>(), std::logic_error);
}

TEST_F(NodeInstanceTest, RelayRenamesButKeepsTheId)
{
    const MessageId id = bus.send_to("turret", "fire", {{"at", "north"}});

    ASSERT_EQ(journal->size(), 1u);
    EXPECT_EQ((*journal)[0].signal, "fired");
    EXPECT_EQ((*journal)[0].id, id);
    EXPECT_EQ((*journal)[0].payload.at("at"), "north");
}

TEST_F(NodeInstanceTest, SendUsesWiringAndSendToBypassesIt)
{
    const MessageId wired = turret->send("fire", {{"at", "sky"}});
    const MessageId direct = turret->send_to("score", "fired");

    EXPECT_THAT(receivers_of(journal, "fire"), ElementsAre("score"));
    EXPECT_THAT(receivers_of(journal, "fired"), ElementsAre("score"));
    EXPECT_LT(wired, direct);
    EXPECT_EQ(journal->back().instance, "score");
}

TEST_F(NodeInstanceTest, StateFollowsTheBus)
{
    EXPECT_EQ(turret->state(), LifecycleState::Started);
    EXPECT_EQ(to_string(turret->state()), "Started");
    EXPECT_EQ(turret->class_name(), "Turret");
    EXPECT_TRUE(turret->node_class().is_a("Node"));
    EXPECT_EQ(&turret->bus(), &bus);
    EXPECT_FALSE(turret->is_locked());
    EXPECT_EQ(turret->queued_count(), 0u);
}

TEST_F(NodeInstanceTest, RelayToKeepsTheIdSoCyclesAreCaught)
{
    int pings = 0;
    bus.define_class(NodeClassDef("Echo").on(
        Channel::Input, "onPing",
        [&pings](NodeInstance &self, const Message &msg)
        {
            ++pings;
            self.relay_to(self.attribute_or<std::string>("peer", ""), msg);
        }));
    bus.create_instance({"Echo", "left", {{"peer", "right"}}});
    bus.create_instance({"Echo", "right", {{"peer", "left"}}});

    bus.send_to("left", "ping");
    EXPECT_EQ(pings, 2);
    EXPECT_EQ(bus.router().stats().cycle_drops, 1u) << "the bounce back to 'left' is dropped";
}

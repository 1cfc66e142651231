/**
 * @file test_mode_manager.cpp
 * @brief Mode inheritance, wiring resolution, attribute overlays and mode switching.
 */
#include "shared_test_helpers.h"

#include <string>
#include <vector>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace nodebus::ipc;
using namespace nodebus::tests::helper;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

namespace
{
ModeConfig mode(std::optional<std::string> base, WiringTable wiring,
                std::vector<std::string> nodes = {}, AttributeOverlay attributes = {})
{
    ModeConfig cfg;
    cfg.base = std::move(base);
    cfg.wiring = std::move(wiring);
    cfg.nodes = std::move(nodes);
    cfg.attributes = std::move(attributes);
    return cfg;
}
} // namespace

class ModeManagerTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        bus.define_class(NodeClassDef("Trigger"));
        bus.define_class(NodeClassDef("Door"));
        bus.define_class(NodeClassDef("Light"));
        bus.define_class(NodeClassDef("Alarm"));
    }

    ModeManager &modes() { return bus.modes(); }

    NodeBus bus;
};

TEST_F(ModeManagerTest, ChainFollowsBaseToRoot)
{
    modes().define_mode("base", mode(std::nullopt, {}));
    modes().define_mode("night", mode("base", {}));
    modes().define_mode("storm", mode("night", {}));

    EXPECT_THAT(modes().mode_chain("storm"), ElementsAre("storm", "night", "base"));
    EXPECT_THAT(modes().mode_chain("base"), ElementsAre("base"));
    EXPECT_THAT(modes().mode_names(), ElementsAre("base", "night", "storm"));
}

TEST_F(ModeManagerTest, UnknownModeAndUnknownBaseThrow)
{
    modes().define_mode("broken", mode("missing", {}));
    EXPECT_THROW((void)modes().mode_chain("nowhere"), UnknownMode);
    EXPECT_THROW((void)modes().resolve_wiring("broken"), UnknownMode);
    EXPECT_THROW(modes().switch_mode("nowhere"), UnknownMode);
    EXPECT_FALSE(modes().active_mode().has_value());
}

TEST_F(ModeManagerTest, InheritanceCycleIsReportedWithChain)
{
    modes().define_mode("a", mode("b", {}));
    modes().define_mode("b", mode("a", {}));
    try
    {
        (void)modes().mode_chain("a");
        FAIL() << "expected ModeInheritanceCycle";
    }
    catch (const ModeInheritanceCycle &e)
    {
        EXPECT_THAT(std::string(e.what()), HasSubstr("a -> b -> a"));
    }
}

// A derived mode's entry for a source class replaces the base entry outright.
TEST_F(ModeManagerTest, DerivedWiringReplacesBaseEntryWithoutMerging)
{
    modes().define_mode("base", mode(std::nullopt, {{"Trigger", {"Door", "Light"}},
                                                    {"Door", {"Light"}}}));
    modes().define_mode("lockdown", mode("base", {{"Trigger", {"Alarm"}}}));

    const auto wiring = modes().resolve_wiring("lockdown");
    ASSERT_EQ(wiring.size(), 2u);
    EXPECT_THAT(wiring.at("Trigger"), ElementsAre("Alarm"));
    EXPECT_THAT(wiring.at("Door"), ElementsAre("Light")) << "untouched entries are inherited";

    EXPECT_THAT(modes().resolve_wiring("base").at("Trigger"), ElementsAre("Door", "Light"));
}

TEST_F(ModeManagerTest, NodesAreUnionedBaseFirst)
{
    modes().define_mode("base", mode(std::nullopt, {}, {"Trigger", "Door"}));
    modes().define_mode("night", mode("base", {}, {"Light", "Door"}));
    EXPECT_THAT(modes().resolve_nodes("night"), ElementsAre("Trigger", "Door", "Light"));
}

TEST_F(ModeManagerTest, SwitchAppliesAttributeOverlayToActiveInstances)
{
    bus.create_instance({"Light", "hall", {{"brightness", 100}, {"color", "white"}}});
    bus.create_instance({"Light", "porch", {{"brightness", 80}}});
    bus.create_instance({"Door", "front"});

    AttributeOverlay day;
    day["Light"] = Payload{{"color", "white"}};
    AttributeOverlay night;
    night["Light"] = Payload{{"brightness", 20}};
    night["Door"] = Payload{{"locked", true}};
    modes().define_mode("day", mode(std::nullopt, {}, {}, day));
    modes().define_mode("night", mode("day", {}, {}, night));
    modes().switch_mode("night");

    const auto *hall = bus.find_instance("hall");
    EXPECT_EQ(hall->attribute_or<int>("brightness", -1), 20);
    EXPECT_EQ(hall->attribute_or<std::string>("color", ""), "white");
    EXPECT_EQ(bus.find_instance("porch")->attribute_or<int>("brightness", -1), 20);
    EXPECT_TRUE(bus.find_instance("front")->attribute_or<bool>("locked", false));
}

TEST_F(ModeManagerTest, SwitchBroadcastsModeChangeWithOldAndNewMode)
{
    auto journal = make_journal();
    bus.define_class(NodeClassDef("Watcher").on(Channel::System, "onModeChange",
                                                recorder(journal)));
    bus.create_instance({"Watcher", "w"});

    modes().define_mode("day", mode(std::nullopt, {}));
    modes().define_mode("night", mode(std::nullopt, {}));
    modes().switch_mode("day");
    modes().switch_mode("night");

    ASSERT_EQ(journal->size(), 2u);
    EXPECT_TRUE((*journal)[0].payload.at("oldMode").is_null());
    EXPECT_EQ((*journal)[0].payload.at("newMode"), "day");
    EXPECT_EQ((*journal)[1].payload.at("oldMode"), "day");
    EXPECT_EQ((*journal)[1].payload.at("newMode"), "night");
    EXPECT_EQ(modes().active_mode(), "night");
}

TEST_F(ModeManagerTest, SwitchingToActiveModeReappliesOverlayAndBroadcasts)
{
    auto journal = make_journal();
    bus.define_class(NodeClassDef("Watcher").on(Channel::System, "onModeChange",
                                                recorder(journal)));
    bus.create_instance({"Watcher", "w"});
    auto *hall = bus.create_instance({"Light", "hall"});

    AttributeOverlay fast;
    fast["Light"] = Payload{{"speed", 9}};
    modes().define_mode("fast", mode(std::nullopt, {}, {}, fast));
    modes().switch_mode("fast");
    hall->set_attribute("speed", 3);

    modes().switch_mode("fast");

    EXPECT_EQ(hall->attribute_or<int>("speed", -1), 9);
    ASSERT_EQ(journal->size(), 2u);
    EXPECT_EQ((*journal)[1].payload.at("oldMode"), "fast");
    EXPECT_EQ((*journal)[1].payload.at("newMode"), "fast");
    EXPECT_EQ(modes().active_mode(), "fast");
}

// Handlers for the mode change already see the previous mode's wiring.
TEST_F(ModeManagerTest, ActiveStateCommitsAfterBroadcast)
{
    std::optional<std::string> seen;
    bus.define_class(NodeClassDef("Watcher").on(
        Channel::System, "onModeChange",
        [&](NodeInstance &self, const Message &)
        { seen = self.bus().modes().active_mode().value_or("<none>"); }));
    bus.create_instance({"Watcher", "w"});

    modes().define_mode("day", mode(std::nullopt, {}));
    modes().switch_mode("day");
    EXPECT_EQ(seen, "<none>");
}

TEST_F(ModeManagerTest, FailedSwitchLeavesActiveModeUntouched)
{
    modes().define_mode("day", mode(std::nullopt, {{"Trigger", {"Door"}}}));
    modes().define_mode("broken", mode("ghost", {}));
    modes().switch_mode("day");

    EXPECT_THROW(modes().switch_mode("broken"), UnknownMode);
    EXPECT_EQ(modes().active_mode(), "day");
    ASSERT_NE(modes().targets_for("Trigger"), nullptr);
    EXPECT_THAT(*modes().targets_for("Trigger"), ElementsAre("Door"));
}

TEST_F(ModeManagerTest, RedefiningActiveModeRefreshesWiring)
{
    modes().define_mode("base", mode(std::nullopt, {{"Trigger", {"Door"}}}));
    modes().define_mode("night", mode("base", {}));
    modes().switch_mode("night");
    EXPECT_THAT(*modes().targets_for("Trigger"), ElementsAre("Door"));

    modes().define_mode("base", mode(std::nullopt, {{"Trigger", {"Light"}}}));
    EXPECT_THAT(*modes().targets_for("Trigger"), ElementsAre("Light"));
    EXPECT_THAT(modes().active_chain(), ElementsAre("night", "base"));
}

TEST_F(ModeManagerTest, TargetsForUnwiredClassIsNull)
{
    modes().define_mode("day", mode(std::nullopt, {{"Trigger", {"Door"}}}));
    EXPECT_EQ(modes().targets_for("Trigger"), nullptr) << "nothing is active yet";
    modes().switch_mode("day");
    EXPECT_EQ(modes().targets_for("Door"), nullptr);
}

TEST(ModeConfigTest, ParsesAndRejectsJson)
{
    const auto j = nlohmann::json::parse(R"({
        "base": "day",
        "nodes": ["Trigger", "Door"],
        "wiring": {"Trigger": ["Door", "Alarm"]},
        "attributes": {"Door": {"locked": true}}
    })");
    const auto cfg = ModeConfig::from_json(j, "night");
    EXPECT_EQ(cfg.base, "day");
    EXPECT_THAT(cfg.nodes, ElementsAre("Trigger", "Door"));
    EXPECT_THAT(cfg.wiring.at("Trigger"), ElementsAre("Door", "Alarm"));
    EXPECT_EQ(cfg.attributes.at("Door").at("locked"), true);
    EXPECT_EQ(cfg.to_json().at("wiring"), j.at("wiring"));

    try
    {
        (void)ModeConfig::from_json(nlohmann::json::parse(R"({"wiring": {"A": "B"}})"), "bad");
        FAIL() << "expected a config error";
    }
    catch (const std::runtime_error &e)
    {
        EXPECT_THAT(std::string(e.what()), HasSubstr("mode 'bad'"));
        EXPECT_THAT(std::string(e.what()), HasSubstr("wiring.A"));
    }
    EXPECT_THROW((void)ModeConfig::from_json(nlohmann::json::array(), "arr"), std::runtime_error);
    EXPECT_THROW((void)ModeConfig::from_json(nlohmann::json::parse(R"({"base": 3})"), "num"),
                 std::runtime_error);
}

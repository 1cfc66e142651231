/**
 * @file nodebus_demo.cpp
 * @brief Example: a small facility wired through the node bus.
 *
 * A pressure plate triggers doors and lights during the day. Switching to the
 * "lockdown" mode rewires the plate to the alarm and locks every door through the
 * mode's attribute overlay. The alarm asks the guard post for a synchronous
 * acknowledgement and a failing sensor shows how handler errors are collected.
 *
 * Usage:
 *   nodebus_demo [config.json]
 *
 * Without an argument the embedded configuration below is used; pass
 * `examples/nodebus_demo.json` to load the same setup from disk.
 */
#include "nb_ipc.hpp"

#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>

using namespace nodebus::ipc;
using namespace nodebus::utils;
using namespace std::chrono_literals;

namespace
{

constexpr const char *kEmbeddedConfig = R"({
    "bus": {"domain": "server", "wait_timeout_ms": 500, "error_history": 32},
    "modes": {
        "day": {
            "nodes": ["Plate", "Door", "Light"],
            "wiring": {"Plate": ["Door", "Light"], "Sensor": ["Light"]}
        },
        "lockdown": {
            "base": "day",
            "nodes": ["Alarm", "GuardPost"],
            "wiring": {"Plate": ["Alarm", "Door"], "Alarm": ["GuardPost"]},
            "attributes": {"Door": {"locked": true}}
        }
    },
    "initial_mode": "day"
})";

// ─── Telemetry ────────────────────────────────────────────────────────────────

class ConsoleTelemetry : public TelemetrySink
{
  public:
    void record(const ErrorEvent &event) override
    {
        std::cout << "[telemetry] "
                  << event.to_json().dump(-1, ' ', false,
                                          nlohmann::json::error_handler_t::replace)
                  << "\n";
    }
};

// ─── Node classes ─────────────────────────────────────────────────────────────

void define_classes(NodeBus &bus)
{
    bus.define_class(NodeClassDef("Device")
                         .abstract_class()
                         .attribute("room", "hall")
                         .require(Channel::Input, "onActivate")
                         .on(Channel::System, "onModeChange",
                             [](NodeInstance &self, const Message &msg)
                             {
                                 LOGGER_INFO("[demo] {} sees mode {}", self.id(),
                                             msg.payload.at("newMode").dump());
                             }));

    bus.define_class(NodeClassDef("Plate").output("activate").on(
        Channel::Input, "onStep",
        [](NodeInstance &self, const Message &msg)
        {
            std::cout << self.id() << ": stepped on by " << msg.payload.value("who", "?") << "\n";
            self.send("activate", msg.payload);
        }));

    bus.define_class(NodeClassDef("Door")
                         .extends("Device")
                         .attribute("locked", false)
                         .on(Channel::Input, "onActivate",
                             [](NodeInstance &self, const Message &)
                             {
                                 const bool locked = self.attribute_or<bool>("locked", false);
                                 std::cout << self.id() << ": " << (locked ? "stays shut" : "opens")
                                           << "\n";
                             }));

    bus.define_class(NodeClassDef("Light")
                         .extends("Device")
                         .on(Channel::Input, "onActivate",
                             [](NodeInstance &self, const Message &)
                             {
                                 auto &count = self.private_state<int>();
                                 std::cout << self.id() << ": on (" << ++count << ")\n";
                             }));

    bus.define_class(NodeClassDef("Alarm")
                         .extends("Device")
                         .output("alert")
                         .on(Channel::Input, "onActivate",
                             [](NodeInstance &self, const Message &msg)
                             {
                                 std::cout << self.id() << ": ringing, asking the guard post\n";
                                 auto ack = self.send_sync("alert", msg.payload, 200ms);
                                 std::cout << self.id() << ": "
                                           << (ack ? "acknowledged by " + ack->source_id
                                                   : std::string("no acknowledgement"))
                                           << "\n";
                             }));

    bus.define_class(NodeClassDef("GuardPost").on(Channel::Input, "onAlert",
                                                  [](NodeInstance &self, const Message &msg)
                                                  {
                                                      std::cout << self.id() << ": alert from "
                                                                << msg.source_id << "\n";
                                                  }));

    bus.define_class(NodeClassDef("Sensor").on(
        Channel::System, "onStart",
        [](NodeInstance &self, const Message &)
        {
            self.schedule(
                20ms,
                [](NodeInstance &sensor)
                {
                    if (sensor.attribute_or<bool>("faulty", false))
                    {
                        throw std::runtime_error("reading out of range");
                    }
                    sensor.send("activate");
                });
        }));
}

BusConfig load_config(int argc, char **argv)
{
    if (argc > 1)
    {
        return BusConfig::from_json_file(argv[1]);
    }
    return BusConfig::from_json(nlohmann::json::parse(kEmbeddedConfig));
}

} // namespace

int main(int argc, char **argv)
{
    LifecycleGuard app_lifecycle(MakeModDefList(Logger::GetLifecycleModule()));

    try
    {
        NodeBus bus(load_config(argc, argv));
        bus.errors().add_sink(std::make_shared<ConsoleTelemetry>());
        define_classes(bus);

        bus.create_instance({"Plate", "plate"});
        bus.create_instance({"Door", "front-door"});
        bus.create_instance({"Door", "back-door", {{"room", "yard"}}});
        bus.create_instance({"Light", "hall-light"});
        bus.create_instance({"Alarm", "alarm"});
        bus.create_instance({"GuardPost", "guard"});
        bus.create_instance({"Sensor", "motion", {{"faulty", true}}});
        bus.init();
        bus.start();

        std::cout << "--- day ---\n";
        bus.send_to("plate", "step", {{"who", "visitor"}});
        bus.run_for(50ms);

        std::cout << "--- lockdown ---\n";
        bus.switch_mode("lockdown");
        bus.send_to("plate", "step", {{"who", "intruder"}});

        bus.stop();
        bus.errors().flush();
        std::cout << "routed " << bus.router().stats().delivered << " deliveries, "
                  << bus.errors().total_count() << " error(s)\n";
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("[demo] {}", e.what());
        std::cerr << "nodebus_demo: " << e.what() << "\n";
        return 1;
    }
    return 0;
}

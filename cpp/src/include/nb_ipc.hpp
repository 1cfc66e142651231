#pragma once
/**
 * @file nb_ipc.hpp
 * @brief Layer 3: The node bus (class registry, instances, modes, router, lifecycle).
 *
 * Most applications only need this header and a NodeBus object:
 *
 * ```cpp
 * nodebus::ipc::NodeBus bus(nodebus::ipc::BusConfig::from_json_file("bus.json"));
 * bus.define_class(nodebus::ipc::NodeClassDef("Sensor").output("reading"));
 * bus.create_instance({"Sensor", "sensor-1"});
 * bus.init();
 * bus.start();
 * ```
 */
#include "nb_service.hpp"

#include "ipc/bus_errors.hpp"
#include "ipc/node_types.hpp"
#include "ipc/node_class.hpp"
#include "ipc/class_registry.hpp"
#include "ipc/node_instance.hpp"
#include "ipc/instance_table.hpp"
#include "ipc/mode_config.hpp"
#include "ipc/mode_manager.hpp"
#include "ipc/event_loop.hpp"
#include "ipc/cross_boundary.hpp"
#include "ipc/error_collector.hpp"
#include "ipc/message_router.hpp"
#include "ipc/lifecycle_orchestrator.hpp"
#include "ipc/bus_config.hpp"
#include "ipc/node_bus.hpp"

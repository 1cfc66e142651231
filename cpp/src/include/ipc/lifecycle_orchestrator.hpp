#pragma once
/**
 * @file lifecycle_orchestrator.hpp
 * @brief Creates, starts, stops and removes node instances.
 *
 * Per-instance states: Created -> Initialized -> Started -> Stopped.
 *
 * Routing is enabled only between `start()` and `stop()`, so signals sent from
 * `onInit` are dropped with a warning while `onStart` hooks may send freely.
 * `spawn_group()` instantiates and wires every child before any of them starts.
 */
#include "ipc/node_types.hpp"
#include "nodebus_utils_export.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace nodebus::ipc
{

class ClassRegistry;
class EventLoop;
class InstanceTable;
class MessageRouter;
class ModeManager;
class NodeBus;
class NodeClass;
class NodeInstance;

struct SpawnSpec
{
    std::string class_name;
    std::string id;
    Payload attributes = Payload::object();
};

class NODEBUS_UTILS_EXPORT LifecycleOrchestrator
{
  public:
    LifecycleOrchestrator(NodeBus &bus, ClassRegistry &classes, InstanceTable &instances,
                          ModeManager &modes, MessageRouter &router, EventLoop &loop);

    LifecycleOrchestrator(const LifecycleOrchestrator &) = delete;
    LifecycleOrchestrator &operator=(const LifecycleOrchestrator &) = delete;

    /**
     * @brief Instantiates a node. Runs onInit/onStart when the bus is already
     *        initialized/started.
     * @return The instance, or null when the class belongs to the other domain.
     * @throws ClassNotFound, DuplicateInstance, std::invalid_argument (empty id).
     */
    NodeInstance *create_instance(const SpawnSpec &spec);

    /// Like create_instance, with onSpawned before onInit.
    NodeInstance *spawn(const SpawnSpec &spec);

    /// onStop (if started), onDespawning, timer cancellation, removal.
    /// Returns false for an unknown id.
    bool despawn(std::string_view id);

    /**
     * @brief Spawns a set of nodes in phases: instantiate all, switch to `mode`,
     *        onSpawned + onInit on all, then onStart on all.
     * @return The created instances (domain-skipped specs are omitted).
     * @throws ClassNotFound, DuplicateInstance, UnknownMode or ModeInheritanceCycle before
     *         anything is created.
     */
    std::vector<NodeInstance *> spawn_group(const std::vector<SpawnSpec> &specs,
                                            const std::optional<std::string> &mode = std::nullopt);

    /// Idempotent. Routing stays disabled.
    void init();
    /// @throws LifecycleOrderError if init() has not run.
    void start();
    void stop();

    /// Stops the bus and drops instances, modes and pending work. Classes are kept
    /// unless `clear_classes`.
    void reset(bool clear_classes = false);

    [[nodiscard]] bool is_initialized() const noexcept { return m_initialized; }
    [[nodiscard]] bool is_started() const noexcept { return m_started; }

  private:
    /// Throws for an unknown or abstract class, an empty id or an id already in use.
    const NodeClass &validate(const SpawnSpec &spec) const;
    NodeInstance *instantiate(const SpawnSpec &spec);
    void run_init(NodeInstance &instance);
    void run_start(NodeInstance &instance);
    void run_stop(NodeInstance &instance);

    NodeBus &m_bus;
    ClassRegistry &m_classes;
    InstanceTable &m_instances;
    ModeManager &m_modes;
    MessageRouter &m_router;
    EventLoop &m_loop;

    bool m_initialized{false};
    bool m_started{false};
};

} // namespace nodebus::ipc

#if defined(_MSC_VER)
#pragma warning(pop)
#endif

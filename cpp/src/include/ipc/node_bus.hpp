#pragma once
/**
 * @file node_bus.hpp
 * @brief The bus context: owns the registry, instances, modes, router,
 *        orchestrator, error collector and event loop of one bus.
 *
 * There is no global bus. Several NodeBus objects can coexist in one process,
 * e.g. a server bus and a client bus linked by an InProcessBoundary.
 *
 * All members except `post()` must be called from the thread that pumps the bus.
 *
 * @code
 * NodeBus bus(BusConfig::from_json_file("bus.json"));
 * bus.define_class(NodeClassDef("Sensor").output("reading"));
 * bus.create_instance({"Sensor", "sensor-1"});
 * bus.init();
 * bus.start();
 * bus.run_for(std::chrono::seconds(1));
 * @endcode
 */
#include "ipc/bus_config.hpp"
#include "ipc/cross_boundary.hpp"
#include "ipc/lifecycle_orchestrator.hpp"
#include "ipc/mode_config.hpp"
#include "ipc/node_class.hpp"
#include "ipc/node_types.hpp"
#include "nodebus_utils_export.h"

#include <chrono>
#include <functional>
#include <memory>
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
class ErrorCollector;
class EventLoop;
class InstanceTable;
class MessageRouter;
class ModeManager;
class NodeInstance;
class NodeBusImpl;

class NODEBUS_UTILS_EXPORT NodeBus
{
  public:
    NodeBus();
    /// Defines the configured modes and switches to `initial_mode` when set.
    explicit NodeBus(BusConfig config);
    ~NodeBus();

    NodeBus(const NodeBus &) = delete;
    NodeBus &operator=(const NodeBus &) = delete;

    // --- Classes and modes ---
    const NodeClass &define_class(NodeClassDef def);
    void define_mode(std::string name, ModeConfig config);
    void switch_mode(std::string_view name);

    // --- Lifecycle ---
    NodeInstance *create_instance(const SpawnSpec &spec);
    NodeInstance *spawn(const SpawnSpec &spec);
    bool despawn(std::string_view id);
    std::vector<NodeInstance *> spawn_group(const std::vector<SpawnSpec> &specs,
                                            const std::optional<std::string> &mode = std::nullopt);
    void init();
    void start();
    void stop();
    void reset(bool clear_classes = false);

    // --- Messaging ---
    MessageId send(std::string_view source_id, std::string_view signal,
                   Payload payload = Payload::object());
    MessageId send_to(std::string_view target_id, std::string_view signal,
                      Payload payload = Payload::object());
    MessageId broadcast(std::string_view signal, const Payload &payload = Payload::object());

    void set_boundary(std::shared_ptr<CrossBoundaryChannel> channel);
    void receive_from_boundary(const BoundaryEnvelope &envelope);

    // --- Pumping ---
    /// Thread-safe. `task` runs on the bus thread during the next pump.
    void post(std::function<void()> task);
    /// Runs posted tasks and due timers without waiting. Returns true if anything ran.
    bool poll();
    /// Pumps for `duration`.
    void run_for(std::chrono::milliseconds duration);
    /// Pumps until `done()` is true or `timeout` passes; returns the last `done()`.
    bool run_until(const std::function<bool()> &done, std::chrono::milliseconds timeout);

    // --- Queries ---
    [[nodiscard]] NodeInstance *find_instance(std::string_view id) const noexcept;
    [[nodiscard]] std::vector<NodeInstance *> instances_of(std::string_view class_name) const;
    [[nodiscard]] std::size_t instance_count() const noexcept;
    [[nodiscard]] std::vector<std::string> class_names() const;
    [[nodiscard]] std::vector<std::string> mode_names() const;
    [[nodiscard]] Domain local_domain() const noexcept;
    [[nodiscard]] const BusConfig &config() const noexcept;

    // --- Components ---
    [[nodiscard]] ClassRegistry &classes() noexcept;
    [[nodiscard]] InstanceTable &instances() noexcept;
    [[nodiscard]] ModeManager &modes() noexcept;
    [[nodiscard]] MessageRouter &router() noexcept;
    [[nodiscard]] LifecycleOrchestrator &lifecycle() noexcept;
    [[nodiscard]] ErrorCollector &errors() noexcept;
    [[nodiscard]] EventLoop &loop() noexcept;

  private:
    std::unique_ptr<NodeBusImpl> pImpl;
};

} // namespace nodebus::ipc

#if defined(_MSC_VER)
#pragma warning(pop)
#endif

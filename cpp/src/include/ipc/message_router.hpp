#pragma once
/**
 * @file message_router.hpp
 * @brief Delivers signals between instances through the active wiring.
 *
 * **Work queue**
 * Every send appends deliveries to a FIFO queue. The outermost caller drains the
 * queue before returning, so signals sent from inside a handler are delivered in
 * the order they were sent, after the current handler returns.
 *
 * **Cycle safety**
 * Each message id carries a visited set of instance ids. A message that reaches
 * an instance it already visited is dropped and counted. The sets are discarded
 * when the outermost dispatch finishes.
 *
 * **Locking**
 * While an instance waits in `wait_for_signal`, messages addressed to it are held
 * in its replay queue. The awaited signal resolves the wait. On resume the held
 * messages go back to the front of the work queue in arrival order.
 *
 * **Isolation**
 * A throwing handler never stops routing; the failure becomes one ErrorEvent.
 */
#include "ipc/node_types.hpp"
#include "nodebus_utils_export.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
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
class CrossBoundaryChannel;
class ErrorCollector;
class EventLoop;
class InstanceTable;
class ModeManager;
class NodeInstance;
struct BoundaryEnvelope;

struct RouterStats
{
    std::uint64_t delivered{0};
    std::uint64_t cycle_drops{0};
    std::uint64_t queued_while_locked{0};
    std::uint64_t handler_failures{0};
    std::uint64_t boundary_handoffs{0};
    std::uint64_t dropped_not_started{0};
};

class NODEBUS_UTILS_EXPORT MessageRouter
{
  public:
    /// Handler name recorded for routing anomalies.
    static constexpr std::string_view kRouterHandler = "<router>";

    /**
     * @brief Marks a dispatch in progress for its lifetime.
     *
     * Despawned instances stay alive, and visited records are kept, until the
     * outermost scope ends. Callers that run hooks on an instance and touch it
     * afterwards hold one of these.
     */
    class DispatchScope
    {
      public:
        explicit DispatchScope(MessageRouter &router) noexcept : m_router(router)
        {
            ++m_router.m_dispatch_depth;
        }
        ~DispatchScope() { m_router.leave_dispatch(); }

        DispatchScope(const DispatchScope &) = delete;
        DispatchScope &operator=(const DispatchScope &) = delete;

      private:
        MessageRouter &m_router;
    };

    MessageRouter(const ClassRegistry &classes, InstanceTable &instances, const ModeManager &modes,
                  ErrorCollector &errors, EventLoop &loop, Domain local_domain);
    ~MessageRouter();

    MessageRouter(const MessageRouter &) = delete;
    MessageRouter &operator=(const MessageRouter &) = delete;

    /// Strictly increasing, starting at 1.
    MessageId next_message_id() noexcept;

    /**
     * @brief Sends `signal` from `source_id` to every wired target.
     * @param carried_id Reuse an existing id (relay); a new one is minted when zero.
     * @return The message id, or zero if the send was dropped.
     */
    MessageId send(std::string_view source_id, std::string_view signal, Payload payload,
                   MessageId carried_id = kInvalidMessageId);

    /// Direct delivery that bypasses the wiring. Unknown targets are routing anomalies.
    MessageId send_to(std::string_view target_id, std::string_view signal, Payload payload,
                      std::string_view source_id = {}, MessageId carried_id = kInvalidMessageId);

    /// Calls the System handler for `signal` on every live instance.
    MessageId broadcast(std::string_view signal, const Payload &payload);

    /// Calls one instance's System handler. Returns true if a handler ran and returned.
    bool invoke_system(NodeInstance &instance, std::string_view signal, const Payload &payload,
                       MessageId id = kInvalidMessageId);

    /// Inbound cross-boundary delivery. Local targets only, never forwarded again.
    void receive_from_boundary(const BoundaryEnvelope &envelope);

    /// Runs after the instance is locked, before pumping; false abandons the wait.
    using WaitTrigger = std::function<bool()>;
    /// Narrows which message named `signal` ends the wait; the rest are held.
    using WaitMatch = std::function<bool(const Message &)>;

    /// @see NodeInstance::wait_for_signal
    std::optional<Message> wait_for_signal(NodeInstance &instance, std::string_view signal,
                                           std::chrono::milliseconds timeout,
                                           const WaitTrigger &trigger = {},
                                           WaitMatch match = {});

    /// Takes ownership of a despawned instance; it is destroyed once no dispatch is active.
    void retire(std::unique_ptr<NodeInstance> instance);

    void set_routing_enabled(bool enabled) noexcept { m_routing_enabled = enabled; }
    [[nodiscard]] bool routing_enabled() const noexcept { return m_routing_enabled; }

    void set_boundary(std::shared_ptr<CrossBoundaryChannel> channel);
    [[nodiscard]] CrossBoundaryChannel *boundary() const noexcept { return m_boundary.get(); }

    [[nodiscard]] Domain local_domain() const noexcept { return m_local_domain; }
    [[nodiscard]] const RouterStats &stats() const noexcept { return m_stats; }
    [[nodiscard]] std::size_t pending() const noexcept { return m_pending.size(); }
    [[nodiscard]] bool is_dispatching() const noexcept { return m_dispatch_depth > 0; }

    /// Drops pending deliveries, visited records and statistics.
    void clear();

  private:
    struct Delivery
    {
        std::string target_id;
        Message msg;
    };

    void enqueue(const NodeInstance &target, const Message &msg);
    void drain();
    bool process_next();
    void deliver(Delivery &delivery);
    bool run_handler(NodeInstance &instance, Channel channel, const std::string &handler_name,
                     const Message &msg);
    void send_ack(const NodeInstance &instance, const Message &msg);
    void forward_to_domain(const Message &msg, Domain domain);
    void report_anomaly(std::string node_id, std::string class_name, std::string error,
                        Payload data);
    void requeue_held(NodeInstance &instance) noexcept;
    void leave_dispatch() noexcept;

    const ClassRegistry &m_classes;
    InstanceTable &m_instances;
    const ModeManager &m_modes;
    ErrorCollector &m_errors;
    EventLoop &m_loop;
    const Domain m_local_domain;

    std::atomic<MessageId> m_next_id{1};
    std::deque<Delivery> m_pending;
    std::map<MessageId, std::set<std::string, std::less<>>> m_visited;
    std::vector<std::unique_ptr<NodeInstance>> m_retired;
    std::shared_ptr<CrossBoundaryChannel> m_boundary;
    bool m_routing_enabled{false};
    bool m_draining{false};
    int m_dispatch_depth{0};
    RouterStats m_stats;
};

} // namespace nodebus::ipc

#if defined(_MSC_VER)
#pragma warning(pop)
#endif

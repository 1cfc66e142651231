#pragma once
/**
 * @file node_instance.hpp
 * @brief A live node: identity, attributes, private state, timers and lock state.
 *
 * Instances are created by the LifecycleOrchestrator and owned by the bus's
 * InstanceTable. Handlers receive the instance as `self` and use it to emit
 * signals, read attributes and suspend on `wait_for_signal`.
 *
 * All members must be used from the bus thread.
 */
#include "ipc/node_class.hpp"
#include "ipc/node_types.hpp"
#include "nodebus_utils_export.h"

#include <any>
#include <chrono>
#include <deque>
#include <fmt/format.h>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <typeinfo>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace nodebus::ipc
{

class NodeBus;

class NODEBUS_UTILS_EXPORT NodeInstance
{
  public:
    using TimerCallback = std::function<void(NodeInstance &self)>;

    NodeInstance(std::string id, const NodeClass &node_class, Payload attributes, NodeBus &bus);
    ~NodeInstance();

    NodeInstance(const NodeInstance &) = delete;
    NodeInstance &operator=(const NodeInstance &) = delete;

    [[nodiscard]] const std::string &id() const noexcept { return m_id; }
    [[nodiscard]] const NodeClass &node_class() const noexcept { return m_class; }
    [[nodiscard]] const std::string &class_name() const noexcept { return m_class.name(); }
    [[nodiscard]] LifecycleState state() const noexcept { return m_state; }

    // --- Attributes ---

    [[nodiscard]] std::optional<Payload> attribute(std::string_view key) const;

    /// Returns `fallback` when the key is absent, null or of another type.
    template <typename T> [[nodiscard]] T attribute_or(std::string_view key, T fallback) const
    {
        auto it = m_attributes.find(std::string(key));
        if (it == m_attributes.end() || it->is_null())
        {
            return fallback;
        }
        try
        {
            return it->template get<T>();
        }
        catch (const nlohmann::json::exception &)
        {
            return fallback;
        }
    }

    void set_attribute(std::string_view key, Payload value);
    /// JSON merge-patch into the attribute object.
    void merge_attributes(const Payload &patch);
    [[nodiscard]] const Payload &attributes() const noexcept { return m_attributes; }

    /**
     * @brief Per-instance state of type `T`, default-constructed on first use.
     * @throws std::logic_error if the state was first created with another type.
     */
    template <typename T> T &private_state()
    {
        if (!m_private_state.has_value())
        {
            return m_private_state.emplace<T>();
        }
        T *state = std::any_cast<T>(&m_private_state);
        if (state == nullptr)
        {
            throw std::logic_error(fmt::format("instance '{}': private state holds {}, not {}",
                                               m_id, m_private_state.type().name(),
                                               typeid(T).name()));
        }
        return *state;
    }

    // --- Messaging ---

    /// Emits `signal` through the active wiring with a new message id.
    MessageId send(std::string_view signal, Payload payload = Payload::object());

    /// Forwards `msg` through the wiring under its original id. An empty `signal`
    /// keeps the original signal name.
    MessageId relay(const Message &msg, std::string_view signal = {});

    /// Delivers directly to another instance, bypassing the wiring.
    MessageId send_to(std::string_view target_id, std::string_view signal,
                      Payload payload = Payload::object());

    /// Direct delivery of `msg` under its original id, so cycle detection still
    /// applies. An empty `signal` keeps the original signal name.
    MessageId relay_to(std::string_view target_id, const Message &msg,
                       std::string_view signal = {});

    /**
     * @brief Emits `signal` with `_sync` metadata and waits for the receiver's `_ack`.
     * Acks carrying another `_correlationId` are held and replayed after the wait.
     * @return The ack message, or std::nullopt on timeout.
     */
    std::optional<Message> send_sync(std::string_view signal, Payload payload = Payload::object(),
                                     std::optional<std::chrono::milliseconds> timeout = {});

    /// Err pin: forwards a failure to the bus's ErrorCollector.
    void report_error(std::string_view handler, std::string_view error, Payload data = {});

    /**
     * @brief Locks this instance and pumps the bus until `signal` arrives.
     *
     * Other messages addressed to this instance are queued while it waits and
     * replayed in arrival order once it resumes. The bus configuration supplies
     * the timeout when none is given.
     *
     * @return The awaited message, or std::nullopt on timeout.
     * @throws BusError if this instance is already waiting.
     */
    std::optional<Message> wait_for_signal(std::string_view signal,
                                           std::optional<std::chrono::milliseconds> timeout = {});

    // --- Timers ---

    /// Runs `fn` on the bus thread after `interval` (every `interval` if `repeat`).
    TimerId schedule(std::chrono::milliseconds interval, TimerCallback fn, bool repeat = false);
    bool cancel_timer(TimerId id);
    /// Timers of this instance still scheduled.
    [[nodiscard]] std::size_t timer_count() const;

    [[nodiscard]] bool is_locked() const noexcept { return m_locked; }
    [[nodiscard]] std::size_t queued_count() const noexcept { return m_replay_queue.size(); }
    [[nodiscard]] NodeBus &bus() noexcept { return m_bus; }

  private:
    friend class MessageRouter;
    friend class LifecycleOrchestrator;

    void cancel_all_timers();

    std::string m_id;
    const NodeClass &m_class;
    Payload m_attributes;
    NodeBus &m_bus;
    LifecycleState m_state{LifecycleState::Created};
    std::any m_private_state;

    bool m_locked{false};
    std::string m_awaited_signal;
    std::function<bool(const Message &)> m_wait_match;
    std::optional<Message> m_wait_result;
    std::deque<Message> m_replay_queue;
    bool m_retired{false};
};

} // namespace nodebus::ipc

#if defined(_MSC_VER)
#pragma warning(pop)
#endif

#include "nb_service.hpp"

#include "ipc/error_collector.hpp"
#include "ipc/event_loop.hpp"
#include "ipc/instance_table.hpp"
#include "ipc/message_router.hpp"
#include "ipc/node_bus.hpp"
#include "ipc/node_instance.hpp"

#include <atomic>

namespace nodebus::ipc
{

namespace
{
std::string next_correlation_id()
{
    static std::atomic<std::uint64_t> counter{0};
    return fmt::format("sync_{}_{}", counter.fetch_add(1, std::memory_order_relaxed) + 1,
                       nodebus::platform::monotonic_time_ns());
}
} // namespace

NodeInstance::NodeInstance(std::string id, const NodeClass &node_class, Payload attributes,
                           NodeBus &bus)
    : m_id(std::move(id)), m_class(node_class), m_attributes(std::move(attributes)), m_bus(bus)
{
    if (!m_attributes.is_object())
    {
        m_attributes = Payload::object();
    }
}

NodeInstance::~NodeInstance() = default;

std::optional<Payload> NodeInstance::attribute(std::string_view key) const
{
    auto it = m_attributes.find(std::string(key));
    if (it == m_attributes.end())
    {
        return std::nullopt;
    }
    return *it;
}

void NodeInstance::set_attribute(std::string_view key, Payload value)
{
    m_attributes[std::string(key)] = std::move(value);
}

void NodeInstance::merge_attributes(const Payload &patch)
{
    m_attributes.merge_patch(patch);
}

MessageId NodeInstance::send(std::string_view signal, Payload payload)
{
    return m_bus.router().send(m_id, signal, std::move(payload));
}

MessageId NodeInstance::relay(const Message &msg, std::string_view signal)
{
    return m_bus.router().send(m_id, signal.empty() ? std::string_view(msg.signal) : signal,
                               msg.payload, msg.id);
}

MessageId NodeInstance::send_to(std::string_view target_id, std::string_view signal,
                                Payload payload)
{
    return m_bus.router().send_to(target_id, signal, std::move(payload), m_id);
}

MessageId NodeInstance::relay_to(std::string_view target_id, const Message &msg,
                                 std::string_view signal)
{
    return m_bus.router().send_to(target_id,
                                  signal.empty() ? std::string_view(msg.signal) : signal,
                                  msg.payload, m_id, msg.id);
}

std::optional<Message> NodeInstance::send_sync(std::string_view signal, Payload payload,
                                               std::optional<std::chrono::milliseconds> timeout)
{
    if (!payload.is_object())
    {
        payload = Payload{{"value", std::move(payload)}};
    }
    const std::string correlation_id = next_correlation_id();
    payload["_sync"] = Payload{{"id", correlation_id}, {"replyTo", m_id}};

    auto ack = m_bus.router().wait_for_signal(
        *this, "_ack", timeout.value_or(m_bus.config().wait_timeout),
        [this, signal, &payload]()
        { return send(signal, std::move(payload)) != kInvalidMessageId; },
        [&correlation_id](const Message &msg)
        {
            const auto it = msg.payload.find("_correlationId");
            return it != msg.payload.end() && *it == correlation_id;
        });
    if (!ack)
    {
        LOGGER_DEBUG("[nodebus/instance] '{}': sync '{}' was not acknowledged", m_id, signal);
        return std::nullopt;
    }
    return ack;
}

void NodeInstance::report_error(std::string_view handler, std::string_view error, Payload data)
{
    m_bus.errors().handle_error(ErrorEvent{m_id, class_name(), fmt::format("Err.{}", handler),
                                           std::string(error), std::move(data)});
}

std::optional<Message> NodeInstance::wait_for_signal(std::string_view signal,
                                                     std::optional<std::chrono::milliseconds> timeout)
{
    return m_bus.router().wait_for_signal(*this, signal,
                                          timeout.value_or(m_bus.config().wait_timeout));
}

TimerId NodeInstance::schedule(std::chrono::milliseconds interval, TimerCallback fn, bool repeat)
{
    // Looked up on every tick: the instance may be gone by then.
    NodeBus *bus = &m_bus;
    std::string id = m_id;
    return m_bus.loop().schedule(
        m_id, interval, repeat,
        [bus, id, fn = std::move(fn)]()
        {
            NodeInstance *self = bus->find_instance(id);
            if (self == nullptr)
            {
                return;
            }
            MessageRouter::DispatchScope scope(bus->router());
            try
            {
                fn(*self);
            }
            catch (const std::exception &e)
            {
                bus->errors().handle_error(
                    ErrorEvent{self->id(), self->class_name(), "Sys.timer", e.what(), Payload()});
            }
            catch (...)
            {
                bus->errors().handle_error(ErrorEvent{self->id(), self->class_name(), "Sys.timer",
                                                      "non-standard exception", Payload()});
            }
        });
}

bool NodeInstance::cancel_timer(TimerId id)
{
    return m_bus.loop().cancel(id, m_id);
}

std::size_t NodeInstance::timer_count() const
{
    return m_bus.loop().timer_count(m_id);
}

void NodeInstance::cancel_all_timers()
{
    const auto cancelled = m_bus.loop().cancel_owner(m_id);
    if (cancelled > 0)
    {
        LOGGER_DEBUG("[nodebus/instance] '{}': cancelled {} timer(s)", m_id, cancelled);
    }
}

} // namespace nodebus::ipc

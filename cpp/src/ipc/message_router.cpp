#include "nb_service.hpp"

#include "ipc/bus_errors.hpp"
#include "ipc/class_registry.hpp"
#include "ipc/cross_boundary.hpp"
#include "ipc/error_collector.hpp"
#include "ipc/event_loop.hpp"
#include "ipc/instance_table.hpp"
#include "ipc/message_router.hpp"
#include "ipc/mode_manager.hpp"

#include <utility>

namespace nodebus::ipc
{

MessageRouter::MessageRouter(const ClassRegistry &classes, InstanceTable &instances,
                             const ModeManager &modes, ErrorCollector &errors, EventLoop &loop,
                             Domain local_domain)
    : m_classes(classes), m_instances(instances), m_modes(modes), m_errors(errors), m_loop(loop),
      m_local_domain(local_domain)
{
}

MessageRouter::~MessageRouter() = default;

MessageId MessageRouter::next_message_id() noexcept
{
    return m_next_id.fetch_add(1, std::memory_order_relaxed);
}

void MessageRouter::set_boundary(std::shared_ptr<CrossBoundaryChannel> channel)
{
    if (channel)
    {
        LOGGER_INFO("[nodebus/router] cross-boundary channel installed: {}",
                    channel->description());
    }
    m_boundary = std::move(channel);
}

MessageId MessageRouter::send(std::string_view source_id, std::string_view signal,
                              Payload payload, MessageId carried_id)
{
    if (!m_routing_enabled)
    {
        ++m_stats.dropped_not_started;
        LOGGER_WARN("[nodebus/router] dropped '{}' from '{}': bus is not started", signal,
                    source_id);
        return kInvalidMessageId;
    }

    const NodeInstance *source = m_instances.find(source_id);
    if (source == nullptr)
    {
        report_anomaly(std::string(source_id), {},
                       fmt::format("send '{}' from unknown source instance", signal),
                       std::move(payload));
        return kInvalidMessageId;
    }

    const MessageId id = carried_id != kInvalidMessageId ? carried_id : next_message_id();
    m_visited[id].insert(source->id());

    const Message msg{id, std::string(signal), std::move(payload), source->id(),
                      source->class_name()};

    std::set<Domain> remote_domains;
    if (const auto *targets = m_modes.targets_for(source->class_name()))
    {
        for (const auto &target_class : *targets)
        {
            const NodeClass *cls = m_classes.find(target_class);
            if (cls == nullptr)
            {
                LOGGER_WARN("[nodebus/router] '{}' from '{}': target class '{}' is not registered",
                            signal, source->id(), target_class);
                continue;
            }
            if (crosses_boundary(m_local_domain, cls->domain()))
            {
                remote_domains.insert(cls->domain());
                continue;
            }
            for (const NodeInstance *target : m_instances.by_class(target_class))
            {
                enqueue(*target, msg);
            }
        }
    }
    else
    {
        LOGGER_TRACE("[nodebus/router] '{}' from '{}': no wiring for class '{}'", signal,
                     source->id(), source->class_name());
    }

    for (Domain domain : remote_domains)
    {
        forward_to_domain(msg, domain);
    }

    drain();
    return id;
}

MessageId MessageRouter::send_to(std::string_view target_id, std::string_view signal,
                                 Payload payload, std::string_view source_id,
                                 MessageId carried_id)
{
    if (!m_routing_enabled)
    {
        ++m_stats.dropped_not_started;
        LOGGER_WARN("[nodebus/router] dropped direct '{}' to '{}': bus is not started", signal,
                    target_id);
        return kInvalidMessageId;
    }

    const NodeInstance *source = source_id.empty() ? nullptr : m_instances.find(source_id);
    const NodeInstance *target = m_instances.find(target_id);
    if (target == nullptr)
    {
        report_anomaly(std::string(source_id), source ? source->class_name() : std::string{},
                       fmt::format("send_to '{}': unknown target instance '{}'", signal, target_id),
                       std::move(payload));
        return kInvalidMessageId;
    }

    const MessageId id = carried_id != kInvalidMessageId ? carried_id : next_message_id();
    if (source != nullptr)
    {
        m_visited[id].insert(source->id());
    }

    enqueue(*target, Message{id, std::string(signal), std::move(payload), std::string(source_id),
                             source ? source->class_name() : std::string{}});
    drain();
    return id;
}

MessageId MessageRouter::broadcast(std::string_view signal, const Payload &payload)
{
    const MessageId id = next_message_id();
    DispatchScope scope(*this);

    LOGGER_DEBUG("[nodebus/router] broadcast '{}' (id {}) to {} instance(s)", signal, id,
                 m_instances.size());
    for (NodeInstance *inst : m_instances.all())
    {
        // Earlier handlers may have despawned it; retired objects are still alive here.
        if (!inst->m_retired)
        {
            invoke_system(*inst, signal, payload, id);
        }
    }
    return id;
}

bool MessageRouter::invoke_system(NodeInstance &instance, std::string_view signal,
                                  const Payload &payload, MessageId id)
{
    auto handler_name = instance.node_class().handler_for_signal(Channel::System, signal);
    if (!handler_name)
    {
        LOGGER_TRACE("[nodebus/router] '{}' has no Sys handler for '{}'", instance.id(), signal);
        return false;
    }

    DispatchScope scope(*this);
    const Message msg{id != kInvalidMessageId ? id : next_message_id(), std::string(signal),
                      payload, {}, {}};
    return run_handler(instance, Channel::System, *handler_name, msg);
}

void MessageRouter::receive_from_boundary(const BoundaryEnvelope &envelope)
{
    if (!m_routing_enabled)
    {
        ++m_stats.dropped_not_started;
        LOGGER_WARN("[nodebus/router] dropped boundary '{}' from class '{}': bus is not started",
                    envelope.signal, envelope.source_class);
        return;
    }

    const Message msg{next_message_id(), envelope.signal, envelope.payload, {},
                      envelope.source_class};
    LOGGER_DEBUG("[nodebus/router] boundary '{}' from '{}' (origin id {}) as id {}",
                 envelope.signal, envelope.source_class, envelope.origin_id, msg.id);

    if (const auto *targets = m_modes.targets_for(envelope.source_class))
    {
        for (const auto &target_class : *targets)
        {
            const NodeClass *cls = m_classes.find(target_class);
            if (cls == nullptr)
            {
                LOGGER_WARN("[nodebus/router] boundary '{}': target class '{}' is not registered",
                            envelope.signal, target_class);
                continue;
            }
            if (crosses_boundary(m_local_domain, cls->domain()))
            {
                continue;
            }
            for (const NodeInstance *target : m_instances.by_class(target_class))
            {
                enqueue(*target, msg);
            }
        }
    }
    drain();
}

std::optional<Message> MessageRouter::wait_for_signal(NodeInstance &instance,
                                                      std::string_view signal,
                                                      std::chrono::milliseconds timeout,
                                                      const WaitTrigger &trigger,
                                                      WaitMatch match)
{
    if (instance.m_locked)
    {
        throw BusError(fmt::format("instance '{}' is already waiting for '{}'", instance.id(),
                                   instance.m_awaited_signal));
    }

    // Keeps `instance` alive even if something despawns it while we pump.
    DispatchScope scope(*this);

    const bool was_draining = std::exchange(m_draining, true);
    instance.m_locked = true;
    instance.m_awaited_signal = std::string(signal);
    instance.m_wait_match = std::move(match);
    instance.m_wait_result.reset();

    LOGGER_DEBUG("[nodebus/router] '{}' waiting for '{}' (timeout {}ms)", instance.id(), signal,
                 timeout.count());

    std::optional<Message> result;
    {
        auto unlock = basics::make_scope_guard(
            [this, &instance, was_draining]() noexcept
            {
                instance.m_locked = false;
                instance.m_awaited_signal.clear();
                instance.m_wait_match = nullptr;
                m_draining = was_draining;
                requeue_held(instance);
            });

        // Anything the trigger sends is only queued: the reply cannot overtake the lock.
        const bool triggered = !trigger || trigger();
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (triggered && !instance.m_wait_result)
        {
            if (process_next())
            {
                continue;
            }
            if (std::chrono::steady_clock::now() >= deadline)
            {
                break;
            }
            m_loop.run_once(deadline);
        }
        result = std::move(instance.m_wait_result);
        instance.m_wait_result.reset();
    }

    if (result)
    {
        LOGGER_DEBUG("[nodebus/router] '{}' resumed by '{}' (id {})", instance.id(), signal,
                     result->id);
    }
    else
    {
        LOGGER_DEBUG("[nodebus/router] '{}' timed out waiting for '{}'", instance.id(), signal);
    }

    drain();
    return result;
}

void MessageRouter::retire(std::unique_ptr<NodeInstance> instance)
{
    if (!instance)
    {
        return;
    }
    instance->m_retired = true;
    if (m_dispatch_depth > 0)
    {
        m_retired.push_back(std::move(instance));
    }
}

void MessageRouter::clear()
{
    m_pending.clear();
    m_visited.clear();
    if (m_dispatch_depth == 0)
    {
        m_retired.clear();
    }
    m_stats = RouterStats{};
}

void MessageRouter::enqueue(const NodeInstance &target, const Message &msg)
{
    m_pending.push_back(Delivery{target.id(), msg});
}

void MessageRouter::drain()
{
    if (m_draining)
    {
        return;
    }
    m_draining = true;
    ++m_dispatch_depth;
    auto leave = basics::make_scope_guard(
        [this]() noexcept
        {
            m_draining = false;
            leave_dispatch();
        });

    while (process_next())
    {
    }
}

bool MessageRouter::process_next()
{
    if (m_pending.empty())
    {
        return false;
    }
    Delivery delivery = std::move(m_pending.front());
    m_pending.pop_front();
    deliver(delivery);
    return true;
}

void MessageRouter::deliver(Delivery &delivery)
{
    NodeInstance *inst = m_instances.find(delivery.target_id);
    if (inst == nullptr)
    {
        LOGGER_DEBUG("[nodebus/router] '{}' (id {}) for '{}' discarded: instance is gone",
                     delivery.msg.signal, delivery.msg.id, delivery.target_id);
        return;
    }

    auto &visited = m_visited[delivery.msg.id];
    if (visited.contains(inst->id()))
    {
        ++m_stats.cycle_drops;
        LOGGER_WARN("[nodebus/router] cycle: '{}' (id {}) already visited '{}', dropped",
                    delivery.msg.signal, delivery.msg.id, inst->id());
        return;
    }

    if (inst->m_locked)
    {
        if (!inst->m_wait_result && delivery.msg.signal == inst->m_awaited_signal &&
            (!inst->m_wait_match || inst->m_wait_match(delivery.msg)))
        {
            visited.insert(inst->id());
            inst->m_wait_result = std::move(delivery.msg);
            return;
        }
        ++m_stats.queued_while_locked;
        inst->m_replay_queue.push_back(std::move(delivery.msg));
        return;
    }

    visited.insert(inst->id());

    auto handler_name = inst->node_class().handler_for_signal(Channel::Input, delivery.msg.signal);
    if (!handler_name)
    {
        LOGGER_DEBUG("[nodebus/router] '{}' ({}) has no In handler for '{}'", inst->id(),
                     inst->class_name(), delivery.msg.signal);
        return;
    }

    if (run_handler(*inst, Channel::Input, *handler_name, delivery.msg))
    {
        ++m_stats.delivered;
        send_ack(*inst, delivery.msg);
    }
}

bool MessageRouter::run_handler(NodeInstance &instance, Channel channel,
                                const std::string &handler_name, const Message &msg)
{
    auto resolved =
        instance.node_class().resolve_handler(channel, handler_name, m_modes.active_chain());
    if (resolved.is_error())
    {
        LOGGER_DEBUG("[nodebus/router] '{}' ({}): no handler {}.{} in the active mode chain",
                     instance.id(), instance.class_name(), to_string(channel), handler_name);
        return false;
    }

    const Handler *handler = resolved.content();
    const std::string pin = fmt::format("{}.{}", to_string(channel), handler_name);
    try
    {
        (*handler)(instance, msg);
        return true;
    }
    catch (const std::exception &e)
    {
        ++m_stats.handler_failures;
        m_errors.handle_error(
            ErrorEvent{instance.id(), instance.class_name(), pin, e.what(), msg.payload});
    }
    catch (...)
    {
        ++m_stats.handler_failures;
        m_errors.handle_error(ErrorEvent{instance.id(), instance.class_name(), pin,
                                         "non-standard exception", msg.payload});
    }
    return false;
}

void MessageRouter::send_ack(const NodeInstance &instance, const Message &msg)
{
    if (!msg.payload.is_object())
    {
        return;
    }
    auto sync = msg.payload.find("_sync");
    if (sync == msg.payload.end() || !sync->is_object())
    {
        return;
    }
    auto reply_to = sync->find("replyTo");
    if (reply_to == sync->end() || !reply_to->is_string())
    {
        return;
    }

    const auto requester = reply_to->get<std::string>();
    if (!m_instances.contains(requester))
    {
        LOGGER_DEBUG("[nodebus/router] ack for '{}' skipped: '{}' is gone", msg.signal, requester);
        return;
    }
    auto correlation = sync->find("id");
    Payload ack = {{"_correlationId", correlation != sync->end() ? *correlation : Payload()},
                   {"_ackFor", msg.signal},
                   {"targetId", instance.id()}};
    send_to(requester, "_ack", std::move(ack), instance.id());
}

void MessageRouter::forward_to_domain(const Message &msg, Domain domain)
{
    if (!m_boundary)
    {
        report_anomaly(msg.source_id, msg.source_class,
                       fmt::format("'{}' targets the {} domain but no cross-boundary channel is "
                                   "installed",
                                   msg.signal, to_string(domain)),
                       msg.payload);
        return;
    }

    BoundaryEnvelope envelope{msg.source_class, msg.signal, msg.payload, domain, msg.id};
    try
    {
        m_boundary->forward(envelope);
        ++m_stats.boundary_handoffs;
        LOGGER_DEBUG("[nodebus/router] '{}' (id {}) handed to {} via {}", msg.signal, msg.id,
                     to_string(domain), m_boundary->description());
    }
    catch (const std::exception &e)
    {
        report_anomaly(msg.source_id, msg.source_class,
                       fmt::format("cross-boundary forward of '{}' failed: {}", msg.signal,
                                   e.what()),
                       msg.payload);
    }
}

void MessageRouter::report_anomaly(std::string node_id, std::string class_name, std::string error,
                                   Payload data)
{
    m_errors.handle_error(ErrorEvent{std::move(node_id), std::move(class_name),
                                     std::string(kRouterHandler), std::move(error),
                                     std::move(data)});
}

void MessageRouter::requeue_held(NodeInstance &instance) noexcept
{
    try
    {
        while (!instance.m_replay_queue.empty())
        {
            m_pending.push_front(Delivery{instance.id(), std::move(instance.m_replay_queue.back())});
            instance.m_replay_queue.pop_back();
        }
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("[nodebus/router] '{}': failed to replay held messages: {}", instance.id(),
                     e.what());
    }
}

void MessageRouter::leave_dispatch() noexcept
{
    if (--m_dispatch_depth == 0)
    {
        m_visited.clear();
        m_retired.clear();
    }
}

} // namespace nodebus::ipc

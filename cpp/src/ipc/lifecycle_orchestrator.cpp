#include "nb_service.hpp"

#include "ipc/bus_errors.hpp"
#include "ipc/class_registry.hpp"
#include "ipc/event_loop.hpp"
#include "ipc/instance_table.hpp"
#include "ipc/lifecycle_orchestrator.hpp"
#include "ipc/message_router.hpp"
#include "ipc/mode_manager.hpp"

#include <stdexcept>
#include <unordered_set>

namespace nodebus::ipc
{

LifecycleOrchestrator::LifecycleOrchestrator(NodeBus &bus, ClassRegistry &classes,
                                             InstanceTable &instances, ModeManager &modes,
                                             MessageRouter &router, EventLoop &loop)
    : m_bus(bus), m_classes(classes), m_instances(instances), m_modes(modes), m_router(router),
      m_loop(loop)
{
}

const NodeClass &LifecycleOrchestrator::validate(const SpawnSpec &spec) const
{
    const NodeClass &cls = m_classes.get(spec.class_name);
    if (cls.is_abstract())
    {
        throw BusError(fmt::format("class '{}' is abstract and cannot be instantiated",
                                   spec.class_name));
    }
    if (spec.id.empty())
    {
        throw std::invalid_argument(
            fmt::format("instance of class '{}' needs a non-empty id", spec.class_name));
    }
    if (m_instances.contains(spec.id))
    {
        throw DuplicateInstance(spec.id);
    }
    return cls;
}

NodeInstance *LifecycleOrchestrator::instantiate(const SpawnSpec &spec)
{
    const NodeClass &cls = validate(spec);
    if (crosses_boundary(m_router.local_domain(), cls.domain()))
    {
        LOGGER_DEBUG("[nodebus/lifecycle] skipped '{}': class '{}' runs on the {} domain, this "
                     "bus is {}",
                     spec.id, cls.name(), to_string(cls.domain()),
                     to_string(m_router.local_domain()));
        return nullptr;
    }

    Payload attributes = cls.default_attributes();
    if (spec.attributes.is_object())
    {
        attributes.update(spec.attributes);
    }

    auto &inst = m_instances.insert(
        std::make_unique<NodeInstance>(spec.id, cls, std::move(attributes), m_bus));
    LOGGER_DEBUG("[nodebus/lifecycle] created '{}' ({})", inst.id(), inst.class_name());
    return &inst;
}

void LifecycleOrchestrator::run_init(NodeInstance &instance)
{
    if (instance.m_state != LifecycleState::Created && instance.m_state != LifecycleState::Stopped)
    {
        return;
    }
    m_router.invoke_system(instance, "init", Payload::object());
    instance.m_state = LifecycleState::Initialized;
}

void LifecycleOrchestrator::run_start(NodeInstance &instance)
{
    if (instance.m_state != LifecycleState::Initialized)
    {
        return;
    }
    // The instance already counts as Started while onStart runs.
    instance.m_state = LifecycleState::Started;
    m_router.invoke_system(instance, "start", Payload::object());
}

void LifecycleOrchestrator::run_stop(NodeInstance &instance)
{
    if (instance.m_state == LifecycleState::Started)
    {
        m_router.invoke_system(instance, "stop", Payload::object());
        instance.m_state = LifecycleState::Stopped;
    }
    instance.cancel_all_timers();
}

NodeInstance *LifecycleOrchestrator::create_instance(const SpawnSpec &spec)
{
    MessageRouter::DispatchScope scope(m_router);
    NodeInstance *inst = instantiate(spec);
    if (inst == nullptr)
    {
        return nullptr;
    }
    if (m_initialized && !inst->m_retired)
    {
        run_init(*inst);
    }
    if (m_started && !inst->m_retired)
    {
        run_start(*inst);
    }
    return inst->m_retired ? nullptr : inst;
}

NodeInstance *LifecycleOrchestrator::spawn(const SpawnSpec &spec)
{
    MessageRouter::DispatchScope scope(m_router);
    NodeInstance *inst = instantiate(spec);
    if (inst == nullptr)
    {
        return nullptr;
    }
    m_router.invoke_system(*inst, "spawned", Payload::object());
    if (m_initialized && !inst->m_retired)
    {
        run_init(*inst);
    }
    if (m_started && !inst->m_retired)
    {
        run_start(*inst);
    }
    LOGGER_INFO("[nodebus/lifecycle] spawned '{}' ({})", spec.id, spec.class_name);
    return inst->m_retired ? nullptr : inst;
}

bool LifecycleOrchestrator::despawn(std::string_view id)
{
    NodeInstance *inst = m_instances.find(id);
    if (inst == nullptr)
    {
        LOGGER_WARN("[nodebus/lifecycle] despawn: unknown instance '{}'", id);
        return false;
    }

    MessageRouter::DispatchScope scope(m_router);
    const std::string owned_id = inst->id();

    if (inst->m_state == LifecycleState::Started)
    {
        m_router.invoke_system(*inst, "stop", Payload::object());
        inst->m_state = LifecycleState::Stopped;
    }
    if (!inst->m_retired)
    {
        m_router.invoke_system(*inst, "despawning", Payload::object());
    }
    if (inst->m_retired)
    {
        // A hook despawned it already.
        return true;
    }

    inst->cancel_all_timers();
    inst->m_replay_queue.clear();
    m_router.retire(m_instances.remove(owned_id));
    LOGGER_INFO("[nodebus/lifecycle] despawned '{}'", owned_id);
    return true;
}

std::vector<NodeInstance *> LifecycleOrchestrator::spawn_group(const std::vector<SpawnSpec> &specs,
                                                               const std::optional<std::string> &mode)
{
    // A group is created whole or not at all.
    std::unordered_set<std::string_view> group_ids;
    for (const auto &spec : specs)
    {
        (void)validate(spec);
        if (!group_ids.insert(spec.id).second)
        {
            throw DuplicateInstance(spec.id);
        }
    }
    if (mode)
    {
        (void)m_modes.mode_chain(*mode);
    }

    MessageRouter::DispatchScope scope(m_router);

    // Phase 1: instantiate every child.
    std::vector<NodeInstance *> children;
    children.reserve(specs.size());
    for (const auto &spec : specs)
    {
        if (NodeInstance *inst = instantiate(spec))
        {
            children.push_back(inst);
        }
    }

    // Phase 2: wiring.
    if (mode)
    {
        m_modes.switch_mode(*mode);
    }

    // Phase 3: spawn and init hooks.
    for (NodeInstance *inst : children)
    {
        if (inst->m_retired)
        {
            continue;
        }
        m_router.invoke_system(*inst, "spawned", Payload::object());
        if (m_initialized && !inst->m_retired)
        {
            run_init(*inst);
        }
    }

    // Phase 4: start, now that every sibling exists and is wired.
    if (m_started)
    {
        for (NodeInstance *inst : children)
        {
            if (!inst->m_retired)
            {
                run_start(*inst);
            }
        }
    }

    LOGGER_INFO("[nodebus/lifecycle] spawned group of {} node(s){}", children.size(),
                mode ? fmt::format(" in mode '{}'", *mode) : std::string{});
    std::erase_if(children, [](const NodeInstance *inst) { return inst->m_retired; });
    return children;
}

void LifecycleOrchestrator::init()
{
    if (m_initialized)
    {
        return;
    }
    MessageRouter::DispatchScope scope(m_router);
    m_initialized = true;
    LOGGER_INFO("[nodebus/lifecycle] init: {} instance(s)", m_instances.size());
    for (NodeInstance *inst : m_instances.all())
    {
        if (!inst->m_retired)
        {
            run_init(*inst);
        }
    }
}

void LifecycleOrchestrator::start()
{
    if (!m_initialized)
    {
        throw LifecycleOrderError("start() called before init()");
    }
    if (m_started)
    {
        return;
    }
    MessageRouter::DispatchScope scope(m_router);
    m_started = true;
    m_router.set_routing_enabled(true);
    LOGGER_INFO("[nodebus/lifecycle] start: {} instance(s)", m_instances.size());
    for (NodeInstance *inst : m_instances.all())
    {
        if (!inst->m_retired)
        {
            run_start(*inst);
        }
    }
}

void LifecycleOrchestrator::stop()
{
    if (!m_initialized && !m_started)
    {
        return;
    }
    MessageRouter::DispatchScope scope(m_router);
    LOGGER_INFO("[nodebus/lifecycle] stop: {} instance(s)", m_instances.size());
    for (NodeInstance *inst : m_instances.all())
    {
        if (!inst->m_retired)
        {
            run_stop(*inst);
        }
    }
    m_router.set_routing_enabled(false);
    m_initialized = false;
    m_started = false;
}

void LifecycleOrchestrator::reset(bool clear_classes)
{
    stop();
    {
        MessageRouter::DispatchScope scope(m_router);
        for (NodeInstance *inst : m_instances.all())
        {
            m_router.retire(m_instances.remove(inst->id()));
        }
        m_router.clear();
    }
    m_loop.clear();
    m_modes.clear();
    if (clear_classes)
    {
        m_classes.clear();
    }
    LOGGER_INFO("[nodebus/lifecycle] reset{}", clear_classes ? " (classes cleared)" : "");
}

} // namespace nodebus::ipc

#include "nb_service.hpp"

#include "ipc/class_registry.hpp"
#include "ipc/error_collector.hpp"
#include "ipc/event_loop.hpp"
#include "ipc/instance_table.hpp"
#include "ipc/message_router.hpp"
#include "ipc/mode_manager.hpp"
#include "ipc/node_bus.hpp"

namespace nodebus::ipc
{

class NodeBusImpl
{
  public:
    NodeBusImpl(NodeBus &owner, BusConfig cfg)
        : config(std::move(cfg)), errors(config.error_history),
          // The mode manager and the router refer to each other; neither touches the
          // other during construction.
          modes(classes, instances, router),
          router(classes, instances, modes, errors, loop, config.local_domain),
          lifecycle(owner, classes, instances, modes, router, loop)
    {
        loop.set_failure_handler(
            [this](const std::string &what)
            {
                errors.handle_error(ErrorEvent{{}, {}, "<loop>", what, Payload()});
            });
    }

    BusConfig config;
    ClassRegistry classes;
    InstanceTable instances;
    ErrorCollector errors;
    EventLoop loop;
    ModeManager modes;
    MessageRouter router;
    LifecycleOrchestrator lifecycle;
};

NodeBus::NodeBus() : NodeBus(BusConfig{}) {}

NodeBus::NodeBus(BusConfig config)
{
    if (config.log_level && utils::Logger::lifecycle_initialized())
    {
        if (auto level = utils::Logger::parse_level(*config.log_level))
        {
            utils::Logger::instance().set_level(*level);
        }
    }

    auto modes = std::move(config.modes);
    auto initial_mode = std::move(config.initial_mode);
    pImpl = std::make_unique<NodeBusImpl>(*this, std::move(config));

    for (auto &[name, mode] : modes)
    {
        pImpl->modes.define_mode(name, std::move(mode));
    }
    if (initial_mode)
    {
        pImpl->modes.switch_mode(*initial_mode);
    }
    LOGGER_INFO("[nodebus/bus] {} bus ready ({} mode(s))", to_string(pImpl->config.local_domain),
                pImpl->modes.mode_names().size());
}

NodeBus::~NodeBus()
{
    if (pImpl)
    {
        pImpl->lifecycle.reset();
        pImpl->errors.flush();
    }
}

const NodeClass &NodeBus::define_class(NodeClassDef def)
{
    return pImpl->classes.define(std::move(def));
}

void NodeBus::define_mode(std::string name, ModeConfig config)
{
    pImpl->modes.define_mode(std::move(name), std::move(config));
}

void NodeBus::switch_mode(std::string_view name)
{
    pImpl->modes.switch_mode(name);
}

NodeInstance *NodeBus::create_instance(const SpawnSpec &spec)
{
    return pImpl->lifecycle.create_instance(spec);
}

NodeInstance *NodeBus::spawn(const SpawnSpec &spec)
{
    return pImpl->lifecycle.spawn(spec);
}

bool NodeBus::despawn(std::string_view id)
{
    return pImpl->lifecycle.despawn(id);
}

std::vector<NodeInstance *> NodeBus::spawn_group(const std::vector<SpawnSpec> &specs,
                                                 const std::optional<std::string> &mode)
{
    return pImpl->lifecycle.spawn_group(specs, mode);
}

void NodeBus::init()
{
    pImpl->lifecycle.init();
}

void NodeBus::start()
{
    pImpl->lifecycle.start();
}

void NodeBus::stop()
{
    pImpl->lifecycle.stop();
}

void NodeBus::reset(bool clear_classes)
{
    pImpl->lifecycle.reset(clear_classes);
}

MessageId NodeBus::send(std::string_view source_id, std::string_view signal, Payload payload)
{
    return pImpl->router.send(source_id, signal, std::move(payload));
}

MessageId NodeBus::send_to(std::string_view target_id, std::string_view signal, Payload payload)
{
    return pImpl->router.send_to(target_id, signal, std::move(payload));
}

MessageId NodeBus::broadcast(std::string_view signal, const Payload &payload)
{
    return pImpl->router.broadcast(signal, payload);
}

void NodeBus::set_boundary(std::shared_ptr<CrossBoundaryChannel> channel)
{
    pImpl->router.set_boundary(std::move(channel));
}

void NodeBus::receive_from_boundary(const BoundaryEnvelope &envelope)
{
    pImpl->router.receive_from_boundary(envelope);
}

void NodeBus::post(std::function<void()> task)
{
    pImpl->loop.post(std::move(task));
}

bool NodeBus::poll()
{
    return pImpl->loop.run_ready();
}

void NodeBus::run_for(std::chrono::milliseconds duration)
{
    const auto deadline = EventLoop::Clock::now() + duration;
    while (EventLoop::Clock::now() < deadline)
    {
        pImpl->loop.run_once(deadline);
    }
}

bool NodeBus::run_until(const std::function<bool()> &done, std::chrono::milliseconds timeout)
{
    const auto deadline = EventLoop::Clock::now() + timeout;
    while (!done())
    {
        if (EventLoop::Clock::now() >= deadline)
        {
            return false;
        }
        pImpl->loop.run_once(deadline);
    }
    return true;
}

NodeInstance *NodeBus::find_instance(std::string_view id) const noexcept
{
    return pImpl->instances.find(id);
}

std::vector<NodeInstance *> NodeBus::instances_of(std::string_view class_name) const
{
    return pImpl->instances.by_class(class_name);
}

std::size_t NodeBus::instance_count() const noexcept
{
    return pImpl->instances.size();
}

std::vector<std::string> NodeBus::class_names() const
{
    return pImpl->classes.class_names();
}

std::vector<std::string> NodeBus::mode_names() const
{
    return pImpl->modes.mode_names();
}

Domain NodeBus::local_domain() const noexcept
{
    return pImpl->config.local_domain;
}

const BusConfig &NodeBus::config() const noexcept
{
    return pImpl->config;
}

ClassRegistry &NodeBus::classes() noexcept
{
    return pImpl->classes;
}

InstanceTable &NodeBus::instances() noexcept
{
    return pImpl->instances;
}

ModeManager &NodeBus::modes() noexcept
{
    return pImpl->modes;
}

MessageRouter &NodeBus::router() noexcept
{
    return pImpl->router;
}

LifecycleOrchestrator &NodeBus::lifecycle() noexcept
{
    return pImpl->lifecycle;
}

ErrorCollector &NodeBus::errors() noexcept
{
    return pImpl->errors;
}

EventLoop &NodeBus::loop() noexcept
{
    return pImpl->loop;
}

} // namespace nodebus::ipc

#include "nb_service.hpp"

#include "ipc/bus_errors.hpp"
#include "ipc/class_registry.hpp"
#include "ipc/instance_table.hpp"
#include "ipc/message_router.hpp"
#include "ipc/mode_manager.hpp"

#include <algorithm>

namespace nodebus::ipc
{

ModeManager::ModeManager(const ClassRegistry &classes, InstanceTable &instances,
                         MessageRouter &router)
    : m_classes(classes), m_instances(instances), m_router(router)
{
}

void ModeManager::define_mode(std::string name, ModeConfig config)
{
    LOGGER_DEBUG("[nodebus/modes] defined mode '{}'{}", name,
                 config.base ? fmt::format(" (base '{}')", *config.base) : std::string{});
    const bool affects_active =
        std::find(m_active_chain.begin(), m_active_chain.end(), name) != m_active_chain.end();
    m_modes.insert_or_assign(std::move(name), std::move(config));

    // A redefinition inside the active chain refreshes the cached wiring.
    if (affects_active && m_active)
    {
        try
        {
            auto chain = mode_chain(*m_active);
            auto wiring = resolve_wiring(*m_active);
            m_active_chain = std::move(chain);
            m_active_wiring = std::move(wiring);
        }
        catch (const BusError &e)
        {
            LOGGER_WARN("[nodebus/modes] active mode '{}' no longer resolves ({}); keeping the "
                        "previous wiring until the next switch",
                        *m_active, e.what());
        }
    }
}

bool ModeManager::has_mode(std::string_view name) const noexcept
{
    return m_modes.find(name) != m_modes.end();
}

const ModeConfig *ModeManager::find_mode(std::string_view name) const noexcept
{
    auto it = m_modes.find(name);
    return it == m_modes.end() ? nullptr : &it->second;
}

std::vector<std::string> ModeManager::mode_names() const
{
    std::vector<std::string> names;
    names.reserve(m_modes.size());
    for (const auto &[name, cfg] : m_modes)
    {
        names.push_back(name);
    }
    return names;
}

std::vector<std::string> ModeManager::mode_chain(std::string_view name) const
{
    std::vector<std::string> chain;
    std::string current(name);
    while (true)
    {
        if (std::find(chain.begin(), chain.end(), current) != chain.end())
        {
            chain.push_back(current);
            throw ModeInheritanceCycle(chain);
        }
        const ModeConfig *cfg = find_mode(current);
        if (cfg == nullptr)
        {
            throw UnknownMode(current);
        }
        chain.push_back(current);
        if (!cfg->base)
        {
            break;
        }
        current = *cfg->base;
    }
    return chain;
}

WiringTable ModeManager::resolve_wiring(std::string_view name) const
{
    const auto chain = mode_chain(name);
    WiringTable wiring;
    for (auto it = chain.rbegin(); it != chain.rend(); ++it)
    {
        for (const auto &[source, targets] : m_modes.find(*it)->second.wiring)
        {
            wiring.insert_or_assign(source, targets);
        }
    }
    return wiring;
}

std::vector<std::string> ModeManager::resolve_nodes(std::string_view name) const
{
    const auto chain = mode_chain(name);
    std::vector<std::string> nodes;
    for (auto it = chain.rbegin(); it != chain.rend(); ++it)
    {
        for (const auto &cls : m_modes.find(*it)->second.nodes)
        {
            if (std::find(nodes.begin(), nodes.end(), cls) == nodes.end())
            {
                nodes.push_back(cls);
            }
        }
    }
    return nodes;
}

AttributeOverlay ModeManager::resolve_attributes(std::string_view name) const
{
    const auto chain = mode_chain(name);
    AttributeOverlay overlay;
    for (auto it = chain.rbegin(); it != chain.rend(); ++it)
    {
        for (const auto &[cls, attrs] : m_modes.find(*it)->second.attributes)
        {
            auto entry = overlay.try_emplace(cls, Payload::object()).first;
            entry->second.merge_patch(attrs);
        }
    }
    return overlay;
}

const std::vector<std::string> *ModeManager::targets_for(std::string_view source_class) const
{
    auto it = m_active_wiring.find(source_class);
    return it == m_active_wiring.end() ? nullptr : &it->second;
}

void ModeManager::switch_mode(std::string_view name)
{
    // Everything that can throw happens before any state changes.
    auto chain = mode_chain(name);
    auto wiring = resolve_wiring(name);
    auto overlay = resolve_attributes(name);

    Payload change = Payload::object();
    change["oldMode"] = m_active ? Payload(*m_active) : Payload(nullptr);
    change["newMode"] = std::string(name);

    LOGGER_INFO("[nodebus/modes] switching mode: {} -> {}", m_active.value_or("<none>"), name);
    m_router.broadcast("modeChange", change);

    for (const auto &[cls, attrs] : overlay)
    {
        for (NodeInstance *inst : m_instances.by_class(cls))
        {
            inst->merge_attributes(attrs);
        }
    }

    m_active = std::string(name);
    m_active_chain = std::move(chain);
    m_active_wiring = std::move(wiring);
    warn_unregistered(m_active_wiring, name);
}

void ModeManager::warn_unregistered(const WiringTable &wiring, std::string_view mode) const
{
    for (const auto &[source, targets] : wiring)
    {
        if (!m_classes.contains(source))
        {
            LOGGER_WARN("[nodebus/modes] mode '{}': wiring source '{}' is not a registered class",
                        mode, source);
        }
        for (const auto &target : targets)
        {
            if (!m_classes.contains(target))
            {
                LOGGER_WARN("[nodebus/modes] mode '{}': wiring target '{}' (from '{}') is not a "
                            "registered class",
                            mode, target, source);
            }
        }
    }
}

void ModeManager::clear()
{
    m_modes.clear();
    m_active.reset();
    m_active_chain.clear();
    m_active_wiring.clear();
}

} // namespace nodebus::ipc

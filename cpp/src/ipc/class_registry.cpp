#include "nb_service.hpp"

#include "ipc/class_registry.hpp"

#include <algorithm>

namespace nodebus::ipc
{

namespace
{
void noop_handler(NodeInstance & /*self*/, const Message & /*msg*/) {}

// Child entries replace parent entries with the same name.
void overlay(HandlerTable &into, const HandlerTable &from)
{
    for (std::size_t i = 0; i < kChannelCount; ++i)
    {
        for (const auto &[name, fn] : from[i])
        {
            into[i].insert_or_assign(name, fn);
        }
    }
}

void add_signal_entries(std::map<std::string, std::string, std::less<>> &table,
                        const ChannelHandlers &handlers)
{
    for (const auto &[name, fn] : handlers)
    {
        std::string signal = signal_for_handler_name(name);
        if (!signal.empty())
        {
            table.try_emplace(std::move(signal), name);
        }
    }
}
} // namespace

ClassRegistry::ClassRegistry()
{
    seed_root();
}

ClassRegistry::~ClassRegistry() = default;

void ClassRegistry::seed_root()
{
    NodeClassDef root{std::string(kRootClass)};
    root.domain(Domain::Shared);
    for (const char *name : {"onInit", "onStart", "onStop"})
    {
        root.require(Channel::System, name);
    }
    for (const char *name :
         {"onInit", "onStart", "onStop", "onModeChange", "onSpawned", "onDespawning"})
    {
        root.on_default(Channel::System, name, &noop_handler);
    }
    auto cls = flatten(root, nullptr);
    std::string name = cls->name();
    m_classes.emplace(std::move(name), std::move(cls));
}

std::unique_ptr<NodeClass> ClassRegistry::flatten(NodeClassDef &def, const NodeClass *parent)
{
    auto cls = std::make_unique<NodeClass>(NodeClass::Passkey{});
    cls->m_name = def.m_name;
    cls->m_abstract = def.m_abstract;
    cls->m_lineage.push_back(def.m_name);

    if (parent != nullptr)
    {
        cls->m_lineage.insert(cls->m_lineage.end(), parent->m_lineage.begin(),
                              parent->m_lineage.end());
        cls->m_domain = parent->m_domain;
        cls->m_required = parent->m_required;
        cls->m_handlers = parent->m_handlers;
        cls->m_defaults = parent->m_defaults;
        cls->m_mode_handlers = parent->m_mode_handlers;
        cls->m_signal_table = parent->m_signal_table;
        cls->m_outputs = parent->m_outputs;
        cls->m_attributes = parent->m_attributes;
    }
    if (def.m_domain)
    {
        cls->m_domain = *def.m_domain;
    }

    // The first class in the chain to demand a handler is reported as its origin.
    for (auto &[channel, handler] : def.m_required)
    {
        const bool known = std::any_of(cls->m_required.begin(), cls->m_required.end(),
                                       [&](const RequiredHandler &r)
                                       { return r.channel == channel && r.handler == handler; });
        if (!known)
        {
            cls->m_required.push_back(RequiredHandler{channel, handler, def.m_name});
        }
    }

    overlay(cls->m_handlers, def.m_handlers);
    overlay(cls->m_defaults, def.m_defaults);
    for (auto &[mode, table] : def.m_mode_handlers)
    {
        overlay(cls->m_mode_handlers[mode], table);
    }

    for (std::size_t i = 0; i < kChannelCount; ++i)
    {
        for (const auto &[signal, handler] : def.m_signal_map[i])
        {
            cls->m_signal_table[i].insert_or_assign(signal, handler);
        }
        add_signal_entries(cls->m_signal_table[i], cls->m_handlers[i]);
        add_signal_entries(cls->m_signal_table[i], cls->m_defaults[i]);
        for (const auto &[mode, table] : cls->m_mode_handlers)
        {
            add_signal_entries(cls->m_signal_table[i], table[i]);
        }
    }

    for (auto &signal : def.m_outputs)
    {
        if (std::find(cls->m_outputs.begin(), cls->m_outputs.end(), signal) ==
            cls->m_outputs.end())
        {
            cls->m_outputs.push_back(signal);
        }
    }
    cls->m_attributes.update(def.m_attributes);
    return cls;
}

const NodeClass &ClassRegistry::define(NodeClassDef def)
{
    if (def.m_name.empty())
    {
        throw BusError("node class name must not be empty");
    }
    if (contains(def.m_name))
    {
        throw DuplicateClass(def.m_name);
    }
    const std::string parent_name = def.m_parent.value_or(std::string(kRootClass));
    const NodeClass &parent = get(parent_name);

    auto cls = flatten(def, &parent);

    std::vector<MissingHandler> missing;
    for (const auto &req : cls->m_required)
    {
        if (!cls->is_abstract() && !cls->has_handler(req.channel, req.handler))
        {
            missing.push_back(MissingHandler{req.channel, req.handler, req.required_by});
        }
    }
    if (!missing.empty())
    {
        LOGGER_ERROR("[nodebus/registry] class '{}' rejected: {} required handler(s) missing",
                     cls->name(), missing.size());
        throw ContractViolation(cls->name(), std::move(missing));
    }

    LOGGER_DEBUG("[nodebus/registry] defined class '{}' (extends '{}', domain {})", cls->name(),
                 parent_name, to_string(cls->domain()));
    std::string name = cls->name();
    auto it = m_classes.emplace(std::move(name), std::move(cls)).first;
    return *it->second;
}

const NodeClass *ClassRegistry::find(std::string_view name) const noexcept
{
    auto it = m_classes.find(name);
    return it == m_classes.end() ? nullptr : it->second.get();
}

const NodeClass &ClassRegistry::get(std::string_view name) const
{
    const NodeClass *cls = find(name);
    if (cls == nullptr)
    {
        throw ClassNotFound(std::string(name));
    }
    return *cls;
}

bool ClassRegistry::contains(std::string_view name) const noexcept
{
    return m_classes.find(name) != m_classes.end();
}

std::vector<std::string> ClassRegistry::class_names() const
{
    std::vector<std::string> names;
    names.reserve(m_classes.size());
    for (const auto &[name, cls] : m_classes)
    {
        names.push_back(name);
    }
    return names;
}

void ClassRegistry::clear()
{
    m_classes.clear();
    seed_root();
}

} // namespace nodebus::ipc

#include "ipc/node_class.hpp"

#include <algorithm>

namespace nodebus::ipc
{

NodeClassDef::NodeClassDef(std::string name) : m_name(std::move(name)) {}

NodeClassDef &NodeClassDef::extends(std::string parent)
{
    m_parent = std::move(parent);
    return *this;
}

NodeClassDef &NodeClassDef::domain(Domain domain)
{
    m_domain = domain;
    return *this;
}

NodeClassDef &NodeClassDef::require(Channel channel, std::string handler)
{
    m_required.emplace_back(channel, std::move(handler));
    return *this;
}

NodeClassDef &NodeClassDef::on(Channel channel, std::string handler, Handler fn)
{
    m_handlers[channel_index(channel)].insert_or_assign(std::move(handler), std::move(fn));
    return *this;
}

NodeClassDef &NodeClassDef::on_default(Channel channel, std::string handler, Handler fn)
{
    m_defaults[channel_index(channel)].insert_or_assign(std::move(handler), std::move(fn));
    return *this;
}

NodeClassDef &NodeClassDef::on_mode(std::string mode, Channel channel, std::string handler,
                                    Handler fn)
{
    m_mode_handlers[std::move(mode)][channel_index(channel)].insert_or_assign(std::move(handler),
                                                                             std::move(fn));
    return *this;
}

NodeClassDef &NodeClassDef::output(std::string signal)
{
    if (std::find(m_outputs.begin(), m_outputs.end(), signal) == m_outputs.end())
    {
        m_outputs.push_back(std::move(signal));
    }
    return *this;
}

NodeClassDef &NodeClassDef::map_signal(std::string signal, std::string handler, Channel channel)
{
    m_signal_map[channel_index(channel)].insert_or_assign(std::move(signal), std::move(handler));
    return *this;
}

NodeClassDef &NodeClassDef::attribute(std::string key, Payload value)
{
    m_attributes[key] = std::move(value);
    return *this;
}

NodeClassDef &NodeClassDef::abstract_class(bool is_abstract)
{
    m_abstract = is_abstract;
    return *this;
}

bool NodeClass::is_a(std::string_view class_name) const noexcept
{
    return std::find(m_lineage.begin(), m_lineage.end(), class_name) != m_lineage.end();
}

bool NodeClass::has_handler(Channel channel, std::string_view handler) const noexcept
{
    const auto idx = channel_index(channel);
    return m_handlers[idx].find(handler) != m_handlers[idx].end() ||
           m_defaults[idx].find(handler) != m_defaults[idx].end();
}

utils::Result<const Handler *, ResolveError>
NodeClass::resolve_handler(Channel channel, std::string_view handler,
                           const std::vector<std::string> &mode_chain) const
{
    const auto idx = channel_index(channel);

    for (const auto &mode : mode_chain)
    {
        auto mode_it = m_mode_handlers.find(mode);
        if (mode_it == m_mode_handlers.end())
        {
            continue;
        }
        auto it = mode_it->second[idx].find(handler);
        if (it != mode_it->second[idx].end())
        {
            return utils::Result<const Handler *, ResolveError>::ok(&it->second);
        }
    }

    if (auto it = m_handlers[idx].find(handler); it != m_handlers[idx].end())
    {
        return utils::Result<const Handler *, ResolveError>::ok(&it->second);
    }
    if (auto it = m_defaults[idx].find(handler); it != m_defaults[idx].end())
    {
        return utils::Result<const Handler *, ResolveError>::ok(&it->second);
    }
    return utils::Result<const Handler *, ResolveError>::error(ResolveError::HandlerNotFound);
}

std::optional<std::string> NodeClass::handler_for_signal(Channel channel,
                                                         std::string_view signal) const
{
    const auto &table = m_signal_table[channel_index(channel)];
    auto it = table.find(signal);
    if (it == table.end())
    {
        return std::nullopt;
    }
    return it->second;
}

} // namespace nodebus::ipc

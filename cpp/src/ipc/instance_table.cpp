#include "ipc/instance_table.hpp"
#include "ipc/bus_errors.hpp"

#include <algorithm>

namespace nodebus::ipc
{

NodeInstance &InstanceTable::insert(std::unique_ptr<NodeInstance> instance)
{
    if (m_index.find(instance->id()) != m_index.end())
    {
        throw DuplicateInstance(instance->id());
    }
    NodeInstance *raw = instance.get();
    m_index.emplace(raw->id(), raw);
    m_instances.push_back(std::move(instance));
    return *raw;
}

NodeInstance *InstanceTable::find(std::string_view id) const noexcept
{
    auto it = m_index.find(id);
    return it == m_index.end() ? nullptr : it->second;
}

std::unique_ptr<NodeInstance> InstanceTable::remove(std::string_view id)
{
    auto idx_it = m_index.find(id);
    if (idx_it == m_index.end())
    {
        return nullptr;
    }
    NodeInstance *raw = idx_it->second;
    m_index.erase(idx_it);

    auto it = std::find_if(m_instances.begin(), m_instances.end(),
                           [raw](const auto &p) { return p.get() == raw; });
    std::unique_ptr<NodeInstance> owned = std::move(*it);
    m_instances.erase(it);
    return owned;
}

std::vector<NodeInstance *> InstanceTable::by_class(std::string_view class_name) const
{
    std::vector<NodeInstance *> out;
    for (const auto &inst : m_instances)
    {
        if (inst->class_name() == class_name)
        {
            out.push_back(inst.get());
        }
    }
    return out;
}

std::size_t InstanceTable::count_by_class(std::string_view class_name) const noexcept
{
    return static_cast<std::size_t>(
        std::count_if(m_instances.begin(), m_instances.end(),
                      [class_name](const auto &inst) { return inst->class_name() == class_name; }));
}

std::vector<NodeInstance *> InstanceTable::all() const
{
    std::vector<NodeInstance *> out;
    out.reserve(m_instances.size());
    for (const auto &inst : m_instances)
    {
        out.push_back(inst.get());
    }
    return out;
}

void InstanceTable::clear()
{
    m_index.clear();
    m_instances.clear();
}

} // namespace nodebus::ipc

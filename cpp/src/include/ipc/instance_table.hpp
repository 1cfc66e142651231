#pragma once
/**
 * @file instance_table.hpp
 * @brief Owns the live NodeInstances of one bus, in creation order.
 */
#include "ipc/node_instance.hpp"
#include "nodebus_utils_export.h"

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace nodebus::ipc
{

class NODEBUS_UTILS_EXPORT InstanceTable
{
  public:
    InstanceTable() = default;
    InstanceTable(const InstanceTable &) = delete;
    InstanceTable &operator=(const InstanceTable &) = delete;

    /// @throws DuplicateInstance if the id is taken.
    NodeInstance &insert(std::unique_ptr<NodeInstance> instance);

    [[nodiscard]] NodeInstance *find(std::string_view id) const noexcept;
    [[nodiscard]] bool contains(std::string_view id) const noexcept { return find(id) != nullptr; }

    /// Detaches the instance; returns null for an unknown id.
    std::unique_ptr<NodeInstance> remove(std::string_view id);

    /// Instances whose class is exactly `class_name`, in creation order.
    [[nodiscard]] std::vector<NodeInstance *> by_class(std::string_view class_name) const;
    [[nodiscard]] std::size_t count_by_class(std::string_view class_name) const noexcept;

    /// Snapshot in creation order.
    [[nodiscard]] std::vector<NodeInstance *> all() const;
    [[nodiscard]] std::size_t size() const noexcept { return m_instances.size(); }

    void clear();

  private:
    std::vector<std::unique_ptr<NodeInstance>> m_instances;
    std::map<std::string, NodeInstance *, std::less<>> m_index;
};

} // namespace nodebus::ipc

#if defined(_MSC_VER)
#pragma warning(pop)
#endif

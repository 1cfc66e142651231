#pragma once
/**
 * @file class_registry.hpp
 * @brief Owns the registered node classes and validates their contracts.
 *
 * The registry always contains the root class "Node", which requires
 * `Sys.onInit`, `Sys.onStart` and `Sys.onStop` and provides no-op defaults for
 * those and for `Sys.onModeChange`, `Sys.onSpawned` and `Sys.onDespawning`.
 */
#include "ipc/node_class.hpp"
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

class NODEBUS_UTILS_EXPORT ClassRegistry
{
  public:
    static constexpr std::string_view kRootClass = "Node";

    ClassRegistry();
    ~ClassRegistry();

    ClassRegistry(const ClassRegistry &) = delete;
    ClassRegistry &operator=(const ClassRegistry &) = delete;

    /**
     * @brief Flattens and registers a class.
     * @throws DuplicateClass    if the name is taken.
     * @throws ClassNotFound     if the parent is not registered.
     * @throws ContractViolation listing every required handler left unimplemented.
     * The registry is unchanged when this throws.
     */
    const NodeClass &define(NodeClassDef def);

    [[nodiscard]] const NodeClass *find(std::string_view name) const noexcept;
    /// @throws ClassNotFound
    [[nodiscard]] const NodeClass &get(std::string_view name) const;
    [[nodiscard]] bool contains(std::string_view name) const noexcept;

    /// Sorted.
    [[nodiscard]] std::vector<std::string> class_names() const;
    [[nodiscard]] std::size_t size() const noexcept { return m_classes.size(); }

    /// Removes every class except the root.
    void clear();

  private:
    void seed_root();
    static std::unique_ptr<NodeClass> flatten(NodeClassDef &def, const NodeClass *parent);

    std::map<std::string, std::unique_ptr<NodeClass>, std::less<>> m_classes;
};

} // namespace nodebus::ipc

#if defined(_MSC_VER)
#pragma warning(pop)
#endif

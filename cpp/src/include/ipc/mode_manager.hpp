#pragma once
/**
 * @file mode_manager.hpp
 * @brief Named wiring configurations, mode inheritance and mode switching.
 *
 * Resolving a mode resolves its base first and overlays the mode's own entries
 * key by key. An entry replaces the base entry for that key entirely; target
 * lists are never merged.
 */
#include "ipc/mode_config.hpp"
#include "nodebus_utils_export.h"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace nodebus::ipc
{

class ClassRegistry;
class InstanceTable;
class MessageRouter;

class NODEBUS_UTILS_EXPORT ModeManager
{
  public:
    ModeManager(const ClassRegistry &classes, InstanceTable &instances, MessageRouter &router);

    ModeManager(const ModeManager &) = delete;
    ModeManager &operator=(const ModeManager &) = delete;

    /// Stores `config` without validating it. Redefining a mode replaces it.
    void define_mode(std::string name, ModeConfig config);

    [[nodiscard]] bool has_mode(std::string_view name) const noexcept;
    [[nodiscard]] const ModeConfig *find_mode(std::string_view name) const noexcept;
    /// Sorted.
    [[nodiscard]] std::vector<std::string> mode_names() const;

    /**
     * @brief [name, base, base-of-base, ...].
     * @throws UnknownMode          for an undefined mode or base.
     * @throws ModeInheritanceCycle if the base chain loops.
     */
    [[nodiscard]] std::vector<std::string> mode_chain(std::string_view name) const;

    [[nodiscard]] WiringTable resolve_wiring(std::string_view name) const;
    /// Union of the node lists along the chain, base entries first.
    [[nodiscard]] std::vector<std::string> resolve_nodes(std::string_view name) const;
    [[nodiscard]] AttributeOverlay resolve_attributes(std::string_view name) const;

    /**
     * @brief Activates `name`.
     *
     * Broadcasts `modeChange` ({"oldMode", "newMode"}) to every instance, merges
     * the resolved attribute overlay into the instances of each listed class, then
     * commits the mode. Switching to the active mode repeats the broadcast and
     * the overlay.
     *
     * @throws UnknownMode / ModeInheritanceCycle; nothing changes in that case.
     */
    void switch_mode(std::string_view name);

    [[nodiscard]] const std::optional<std::string> &active_mode() const noexcept
    {
        return m_active;
    }
    [[nodiscard]] const std::vector<std::string> &active_chain() const noexcept
    {
        return m_active_chain;
    }
    [[nodiscard]] const WiringTable &active_wiring() const noexcept { return m_active_wiring; }

    /// Targets of `source_class` under the active mode, or null.
    [[nodiscard]] const std::vector<std::string> *targets_for(std::string_view source_class) const;

    /// Forgets every mode and the active one.
    void clear();

  private:
    void warn_unregistered(const WiringTable &wiring, std::string_view mode) const;

    const ClassRegistry &m_classes;
    InstanceTable &m_instances;
    MessageRouter &m_router;

    std::map<std::string, ModeConfig, std::less<>> m_modes;
    std::optional<std::string> m_active;
    std::vector<std::string> m_active_chain;
    WiringTable m_active_wiring;
};

} // namespace nodebus::ipc

#if defined(_MSC_VER)
#pragma warning(pop)
#endif

#pragma once
/**
 * @file mode_config.hpp
 * @brief Declarative wiring for one mode, and its JSON form.
 *
 * JSON layout:
 * @code{.json}
 * {
 *   "base": "Lobby",
 *   "nodes": ["Turret", "Scoreboard"],
 *   "wiring": { "Turret": ["Scoreboard", "HudClient"] },
 *   "attributes": { "Turret": { "fireRate": 2.5 } }
 * }
 * @endcode
 */
#include "ipc/node_types.hpp"
#include "nodebus_utils_export.h"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace nodebus::ipc
{

/// Source class -> ordered target classes.
using WiringTable = std::map<std::string, std::vector<std::string>, std::less<>>;

/// Class name -> attribute overrides applied on activation.
using AttributeOverlay = std::map<std::string, Payload, std::less<>>;

struct NODEBUS_UTILS_EXPORT ModeConfig
{
    std::optional<std::string> base;
    std::vector<std::string> nodes;
    WiringTable wiring;
    AttributeOverlay attributes;

    /// @throws std::runtime_error naming the mode and the offending key.
    static ModeConfig from_json(const nlohmann::json &j, std::string_view mode_name);
    [[nodiscard]] nlohmann::json to_json() const;
};

} // namespace nodebus::ipc

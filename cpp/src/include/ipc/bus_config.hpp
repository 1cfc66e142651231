#pragma once
/**
 * @file bus_config.hpp
 * @brief Bus settings and predefined modes, loaded from JSON.
 *
 * @code{.json}
 * {
 *   "bus": { "domain": "server", "wait_timeout_ms": 5000,
 *            "error_history": 256, "log_level": "info" },
 *   "modes": { "Lobby": { "nodes": ["Door"], "wiring": { "Door": ["Hud"] } } },
 *   "initial_mode": "Lobby"
 * }
 * @endcode
 */
#include "ipc/error_collector.hpp"
#include "ipc/mode_config.hpp"
#include "ipc/node_types.hpp"
#include "nodebus_utils_export.h"

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace nodebus::ipc
{

struct NODEBUS_UTILS_EXPORT BusConfig
{
    Domain local_domain{Domain::Server};
    /// Used by wait_for_signal when the caller gives no timeout.
    std::chrono::milliseconds wait_timeout{5000};
    std::size_t error_history{ErrorCollector::kDefaultHistory};
    /// Applied to the Logger when set (see Logger::parse_level).
    std::optional<std::string> log_level;
    std::map<std::string, ModeConfig, std::less<>> modes;
    std::optional<std::string> initial_mode;

    /// @throws std::runtime_error with the offending key in the message.
    static BusConfig from_json(const nlohmann::json &j);
    /// @throws std::runtime_error if the file cannot be read or parsed.
    static BusConfig from_json_file(const std::filesystem::path &path);
};

} // namespace nodebus::ipc

#if defined(_MSC_VER)
#pragma warning(pop)
#endif

#pragma once
/**
 * @file node_types.hpp
 * @brief Vocabulary types shared by every bus component.
 *
 * A signal named `fired` is handled by a pin handler named `onFired`; the
 * conversion helpers below implement that naming rule in both directions.
 */
#include "nodebus_utils_export.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace nodebus::ipc
{

using Payload = nlohmann::json;

/// Monotonic message identity. Zero is never issued.
using MessageId = std::uint64_t;
inline constexpr MessageId kInvalidMessageId = 0;

using TimerId = std::uint64_t;
inline constexpr TimerId kInvalidTimerId = 0;

/// Pin groups of a node.
enum class Channel : std::uint8_t
{
    System, ///< lifecycle and broadcast signals ("Sys")
    Input,  ///< wired signals ("In")
    Output, ///< declared emitted signals ("Out")
    Error,  ///< error reporting ("Err")
};
inline constexpr std::size_t kChannelCount = 4;

/// Execution context a node class belongs to.
enum class Domain : std::uint8_t
{
    Server,
    Client,
    Shared,
};

enum class LifecycleState : std::uint8_t
{
    Created,
    Initialized,
    Started,
    Stopped,
};

/// "Sys", "In", "Out", "Err".
NODEBUS_UTILS_EXPORT std::string_view to_string(Channel channel) noexcept;
NODEBUS_UTILS_EXPORT std::string_view to_string(Domain domain) noexcept;
NODEBUS_UTILS_EXPORT std::string_view to_string(LifecycleState state) noexcept;

/// Parses "server", "client" or "shared".
NODEBUS_UTILS_EXPORT std::optional<Domain> domain_from_string(std::string_view name) noexcept;

constexpr std::size_t channel_index(Channel channel) noexcept
{
    return static_cast<std::size_t>(channel);
}

/// "fired" -> "onFired".
NODEBUS_UTILS_EXPORT std::string handler_name_for_signal(std::string_view signal);

/// "onFired" -> "fired". Returns an empty string for names without the "on" prefix.
NODEBUS_UTILS_EXPORT std::string signal_for_handler_name(std::string_view handler);

/// True when a class of `target` domain cannot run on a bus of `local` domain.
/// Only a server/client pair crosses; `Shared` runs everywhere.
NODEBUS_UTILS_EXPORT bool crosses_boundary(Domain local, Domain target) noexcept;

struct Message
{
    MessageId id{kInvalidMessageId};
    std::string signal;
    Payload payload;
    std::string source_id;
    std::string source_class;
};

} // namespace nodebus::ipc

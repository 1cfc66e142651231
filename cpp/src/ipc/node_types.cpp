#include "ipc/node_types.hpp"

#include <cctype>

namespace nodebus::ipc
{

std::string_view to_string(Channel channel) noexcept
{
    switch (channel)
    {
    case Channel::System:
        return "Sys";
    case Channel::Input:
        return "In";
    case Channel::Output:
        return "Out";
    case Channel::Error:
        return "Err";
    }
    return "?";
}

std::string_view to_string(Domain domain) noexcept
{
    switch (domain)
    {
    case Domain::Server:
        return "server";
    case Domain::Client:
        return "client";
    case Domain::Shared:
        return "shared";
    }
    return "?";
}

std::string_view to_string(LifecycleState state) noexcept
{
    switch (state)
    {
    case LifecycleState::Created:
        return "Created";
    case LifecycleState::Initialized:
        return "Initialized";
    case LifecycleState::Started:
        return "Started";
    case LifecycleState::Stopped:
        return "Stopped";
    }
    return "?";
}

std::optional<Domain> domain_from_string(std::string_view name) noexcept
{
    if (name == "server")
        return Domain::Server;
    if (name == "client")
        return Domain::Client;
    if (name == "shared")
        return Domain::Shared;
    return std::nullopt;
}

std::string handler_name_for_signal(std::string_view signal)
{
    std::string name = "on";
    name.append(signal);
    if (name.size() > 2)
    {
        name[2] = static_cast<char>(std::toupper(static_cast<unsigned char>(name[2])));
    }
    return name;
}

std::string signal_for_handler_name(std::string_view handler)
{
    if (handler.size() <= 2 || handler.substr(0, 2) != "on")
    {
        return {};
    }
    std::string signal(handler.substr(2));
    signal[0] = static_cast<char>(std::tolower(static_cast<unsigned char>(signal[0])));
    return signal;
}

bool crosses_boundary(Domain local, Domain target) noexcept
{
    return (local == Domain::Server && target == Domain::Client) ||
           (local == Domain::Client && target == Domain::Server);
}

} // namespace nodebus::ipc

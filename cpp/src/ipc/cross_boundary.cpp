#include "nb_service.hpp"

#include "ipc/cross_boundary.hpp"
#include "ipc/node_bus.hpp"

#include <stdexcept>

namespace nodebus::ipc
{

nlohmann::json BoundaryEnvelope::to_json() const
{
    return nlohmann::json{{"source_class", source_class},
                          {"signal", signal},
                          {"payload", payload},
                          {"target_domain", std::string(to_string(target_domain))},
                          {"origin_id", origin_id}};
}

BoundaryEnvelope BoundaryEnvelope::from_json(const nlohmann::json &j)
{
    BoundaryEnvelope env;
    try
    {
        env.source_class = j.at("source_class").get<std::string>();
        env.signal = j.at("signal").get<std::string>();
        env.payload = j.value("payload", nlohmann::json::object());
        env.origin_id = j.value("origin_id", kInvalidMessageId);
        const auto domain_name = j.at("target_domain").get<std::string>();
        auto domain = domain_from_string(domain_name);
        if (!domain)
        {
            throw std::runtime_error(
                fmt::format("boundary envelope: unknown target_domain '{}'", domain_name));
        }
        env.target_domain = *domain;
    }
    catch (const nlohmann::json::exception &e)
    {
        throw std::runtime_error(fmt::format("boundary envelope: {}", e.what()));
    }
    return env;
}

void InProcessBoundary::forward(const BoundaryEnvelope &envelope)
{
    NodeBus *peer = &m_peer;
    m_peer.post([peer, envelope]() { peer->receive_from_boundary(envelope); });
}

std::string InProcessBoundary::description() const
{
    return fmt::format("in-process -> {} bus", to_string(m_peer.local_domain()));
}

} // namespace nodebus::ipc

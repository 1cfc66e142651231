#pragma once
/**
 * @file cross_boundary.hpp
 * @brief Transport seam between buses of different domains.
 *
 * When a wired target class lives in the other domain (server/client), the
 * router hands the message to the installed CrossBoundaryChannel exactly once
 * per target domain. The receiving side feeds it to
 * `NodeBus::receive_from_boundary`, which delivers to local classes only.
 *
 * The concrete transport is up to the embedder; `InProcessBoundary` links two
 * buses living in one process through the peer's event loop.
 */
#include "ipc/node_types.hpp"
#include "nodebus_utils_export.h"

#include <string>

namespace nodebus::ipc
{

class NodeBus;

struct NODEBUS_UTILS_EXPORT BoundaryEnvelope
{
    std::string source_class;
    std::string signal;
    Payload payload;
    Domain target_domain{Domain::Shared};
    MessageId origin_id{kInvalidMessageId};

    [[nodiscard]] nlohmann::json to_json() const;
    /// @throws std::runtime_error on a missing or mistyped field.
    static BoundaryEnvelope from_json(const nlohmann::json &j);
};

class NODEBUS_UTILS_EXPORT CrossBoundaryChannel
{
  public:
    virtual ~CrossBoundaryChannel() = default;

    /// Called on the sending bus thread. Must not block on the receiving side.
    virtual void forward(const BoundaryEnvelope &envelope) = 0;
    [[nodiscard]] virtual std::string description() const = 0;
};

/**
 * @brief Delivers envelopes to a peer bus in the same process.
 *
 * Delivery is posted to the peer's event loop, so it happens the next time the
 * peer is pumped. The peer must outlive this channel.
 */
class NODEBUS_UTILS_EXPORT InProcessBoundary : public CrossBoundaryChannel
{
  public:
    explicit InProcessBoundary(NodeBus &peer) : m_peer(peer) {}

    void forward(const BoundaryEnvelope &envelope) override;
    [[nodiscard]] std::string description() const override;

  private:
    NodeBus &m_peer;
};

} // namespace nodebus::ipc

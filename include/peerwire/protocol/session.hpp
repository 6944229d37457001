#pragma once
#include "peerwire/core/failures.hpp"
#include "peerwire/core/result.hpp"
#include "peerwire/models/capability.hpp"
#include "peerwire/protocol/frame_transport.hpp"
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

namespace peerwire::protocol {

/// An established peer connection: authenticated node id, the peer's Hello,
/// the negotiated capabilities and the live frame transport.
///
/// Thread Safety: one thread may send while another receives.
class Session {
public:
    Session(
        std::unique_ptr<FrameTransport> transport,
        models::HelloMessage peer_hello,
        std::vector<models::Capability> capabilities,
        std::vector<uint8_t> remote_node_id);

    /// Sorted by name; one entry per shared name at the highest shared version.
    [[nodiscard]] const std::vector<models::Capability>& Capabilities() const noexcept {
        return capabilities_;
    }

    [[nodiscard]] const models::HelloMessage& PeerHello() const noexcept {
        return peer_hello_;
    }

    /// Static public key proven by the handshake.
    [[nodiscard]] const std::vector<uint8_t>& RemoteNodeId() const noexcept {
        return remote_node_id_;
    }

    [[nodiscard]] Result<Unit, SessionFailure> SendMessage(
        uint8_t message_id,
        std::span<const uint8_t> payload,
        Deadline deadline);

    [[nodiscard]] Result<FrameMessage, SessionFailure> ReceiveMessage(Deadline deadline);

    /// Sends a Disconnect frame, then closes the transport whether or not the
    /// send succeeded. The returned result is that of the send.
    Result<Unit, SessionFailure> Disconnect(models::DisconnectReason reason, Deadline deadline);

    void Close() noexcept;

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;
    Session(Session&&) = delete;
    Session& operator=(Session&&) = delete;
    ~Session() = default;

private:
    std::unique_ptr<FrameTransport> transport_;
    models::HelloMessage peer_hello_;
    std::vector<models::Capability> capabilities_;
    std::vector<uint8_t> remote_node_id_;
};

}  // namespace peerwire::protocol

#include "peerwire/protocol/session.hpp"
#include "peerwire/core/constants.hpp"
#include "peerwire/protocol/capability_negotiator.hpp"

namespace peerwire::protocol {

    Session::Session(
        std::unique_ptr<FrameTransport> transport,
        models::HelloMessage peer_hello,
        std::vector<models::Capability> capabilities,
        std::vector<uint8_t> remote_node_id)
        : transport_(std::move(transport))
          , peer_hello_(std::move(peer_hello))
          , capabilities_(std::move(capabilities))
          , remote_node_id_(std::move(remote_node_id)) {
    }

    Result<Unit, SessionFailure> Session::SendMessage(
        const uint8_t message_id,
        std::span<const uint8_t> payload,
        const Deadline deadline) {
        return transport_->SendMessage(message_id, payload, deadline);
    }

    Result<FrameMessage, SessionFailure> Session::ReceiveMessage(const Deadline deadline) {
        return transport_->ReceiveMessage(deadline);
    }

    Result<Unit, SessionFailure> Session::Disconnect(
        const models::DisconnectReason reason,
        const Deadline deadline) {
        auto payload = CapabilityNegotiator::EncodeDisconnect(reason);
        if (payload.IsErr()) {
            transport_->Close();
            return Result<Unit, SessionFailure>::Err(std::move(payload).UnwrapErr());
        }
        auto sent = transport_->SendMessage(kDisconnectMessageId, payload.Unwrap(), deadline);
        transport_->Close();
        return sent;
    }

    void Session::Close() noexcept {
        transport_->Close();
    }
}

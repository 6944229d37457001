#include "peerwire/models/capability.hpp"

namespace peerwire::models {
    bool IsKnownDisconnectReason(const uint32_t code) noexcept {
        return code <= static_cast<uint32_t>(DisconnectReason::Timeout) ||
               code == static_cast<uint32_t>(DisconnectReason::SubprotocolError);
    }

    std::string_view ToString(const DisconnectReason reason) noexcept {
        switch (reason) {
            case DisconnectReason::Requested: return "disconnect requested";
            case DisconnectReason::TcpError: return "network error";
            case DisconnectReason::BreachOfProtocol: return "breach of protocol";
            case DisconnectReason::UselessPeer: return "useless peer";
            case DisconnectReason::TooManyPeers: return "too many peers";
            case DisconnectReason::AlreadyConnected: return "already connected";
            case DisconnectReason::IncompatibleVersion: return "incompatible p2p protocol version";
            case DisconnectReason::InvalidIdentity: return "invalid node identity";
            case DisconnectReason::ClientQuitting: return "client quitting";
            case DisconnectReason::UnexpectedIdentity: return "unexpected identity";
            case DisconnectReason::ConnectedToSelf: return "connected to self";
            case DisconnectReason::Timeout: return "read timeout";
            case DisconnectReason::SubprotocolError: return "subprotocol error";
        }
        return "unknown";
    }
}

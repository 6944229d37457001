#include "peerwire/core/failures.hpp"

namespace peerwire {

std::string_view ToString(const SessionFailureType type) noexcept {
    switch (type) {
        case SessionFailureType::CryptoFailure: return "CryptoFailure";
        case SessionFailureType::MalformedHandshake: return "MalformedHandshake";
        case SessionFailureType::MalformedFrame: return "MalformedFrame";
        case SessionFailureType::MalformedHello: return "MalformedHello";
        case SessionFailureType::HandshakeFailure: return "HandshakeFailure";
        case SessionFailureType::MacMismatch: return "MacMismatch";
        case SessionFailureType::UnsupportedVersion: return "UnsupportedVersion";
        case SessionFailureType::NoSharedCapabilities: return "NoSharedCapabilities";
        case SessionFailureType::IoFailure: return "IoFailure";
        case SessionFailureType::HandshakeTimeout: return "HandshakeTimeout";
        case SessionFailureType::PeerDisconnected: return "PeerDisconnected";
        case SessionFailureType::Cancelled: return "Cancelled";
        case SessionFailureType::InvalidState: return "InvalidState";
        case SessionFailureType::InvalidConfig: return "InvalidConfig";
        case SessionFailureType::Encode: return "Encode";
    }
    return "Unknown";
}

std::string_view ToString(const FailureStage stage) noexcept {
    switch (stage) {
        case FailureStage::Unspecified: return "unspecified";
        case FailureStage::Handshake: return "handshake";
        case FailureStage::Frame: return "frame";
        case FailureStage::Capability: return "capability";
    }
    return "unknown";
}

}  // namespace peerwire

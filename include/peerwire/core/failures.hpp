#pragma once
#include <cstdint>
#include <string>
#include <string_view>
namespace peerwire {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    BufferTooLarge,
    SecureWipeFailed,
    AllocationFailed,
    InvalidOperation
};
enum class SessionFailureType {
    CryptoFailure,
    MalformedHandshake,
    MalformedFrame,
    MalformedHello,
    HandshakeFailure,
    MacMismatch,
    UnsupportedVersion,
    NoSharedCapabilities,
    IoFailure,
    HandshakeTimeout,
    PeerDisconnected,
    Cancelled,
    InvalidState,
    InvalidConfig,
    Encode
};
/// Phase of session establishment in which a failure surfaced.
enum class FailureStage : uint8_t {
    Unspecified,
    Handshake,
    Frame,
    Capability
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure SecureWipeFailed(std::string msg) {
        return {SodiumFailureType::SecureWipeFailed, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};
class SessionFailure {
public:
    SessionFailureType type;
    std::string message;
    FailureStage stage = FailureStage::Unspecified;
    SessionFailure(const SessionFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SessionFailure CryptoFailure(std::string msg) {
        return {SessionFailureType::CryptoFailure, std::move(msg)};
    }
    static SessionFailure MalformedHandshake(std::string msg) {
        return {SessionFailureType::MalformedHandshake, std::move(msg)};
    }
    static SessionFailure MalformedFrame(std::string msg) {
        return {SessionFailureType::MalformedFrame, std::move(msg)};
    }
    static SessionFailure MalformedHello(std::string msg) {
        return {SessionFailureType::MalformedHello, std::move(msg)};
    }
    static SessionFailure HandshakeFailure(std::string msg) {
        return {SessionFailureType::HandshakeFailure, std::move(msg)};
    }
    static SessionFailure MacMismatch(std::string msg) {
        return {SessionFailureType::MacMismatch, std::move(msg)};
    }
    static SessionFailure UnsupportedVersion(std::string msg) {
        return {SessionFailureType::UnsupportedVersion, std::move(msg)};
    }
    static SessionFailure NoSharedCapabilities(std::string msg) {
        return {SessionFailureType::NoSharedCapabilities, std::move(msg)};
    }
    static SessionFailure IoFailure(std::string msg) {
        return {SessionFailureType::IoFailure, std::move(msg)};
    }
    static SessionFailure HandshakeTimeout(std::string msg) {
        return {SessionFailureType::HandshakeTimeout, std::move(msg)};
    }
    static SessionFailure PeerDisconnected(std::string msg) {
        return {SessionFailureType::PeerDisconnected, std::move(msg)};
    }
    static SessionFailure Cancelled(std::string msg) {
        return {SessionFailureType::Cancelled, std::move(msg)};
    }
    static SessionFailure InvalidState(std::string msg) {
        return {SessionFailureType::InvalidState, std::move(msg)};
    }
    static SessionFailure InvalidConfig(std::string msg) {
        return {SessionFailureType::InvalidConfig, std::move(msg)};
    }
    static SessionFailure Encode(std::string msg) {
        return {SessionFailureType::Encode, std::move(msg)};
    }
    static SessionFailure FromSodiumFailure(const SodiumFailure& sf) {
        return CryptoFailure(sf.message);
    }
    /// Same failure tagged with the stage it surfaced in. An already tagged
    /// failure keeps its original stage.
    [[nodiscard]] SessionFailure AtStage(FailureStage s) && {
        if (stage == FailureStage::Unspecified) {
            stage = s;
        }
        return std::move(*this);
    }
    /// Transport-level or deadline failures; a fresh session may succeed.
    [[nodiscard]] bool IsRetryable() const noexcept {
        return type == SessionFailureType::IoFailure ||
               type == SessionFailureType::HandshakeTimeout;
    }
    /// Structurally invalid or unauthenticated data from the peer.
    [[nodiscard]] bool IsPeerMisbehaviour() const noexcept {
        switch (type) {
            case SessionFailureType::MalformedHandshake:
            case SessionFailureType::MalformedFrame:
            case SessionFailureType::MalformedHello:
            case SessionFailureType::HandshakeFailure:
            case SessionFailureType::MacMismatch:
                return true;
            default:
                return false;
        }
    }
};
[[nodiscard]] std::string_view ToString(SessionFailureType type) noexcept;
[[nodiscard]] std::string_view ToString(FailureStage stage) noexcept;
}

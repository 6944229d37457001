#pragma once
#include "peerwire/core/failures.hpp"
#include "peerwire/core/result.hpp"
#include "peerwire/interfaces/i_byte_channel.hpp"
#include "peerwire/models/key_materials/static_identity.hpp"
#include "peerwire/protocol/frame_keys.hpp"
#include <spdlog/logger.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <variant>
#include <vector>

namespace peerwire::protocol {

enum class InitiatorState : uint8_t {
    Idle,
    AuthSent,
    AckReceived,
    Established,
    Failed
};

enum class RecipientState : uint8_t {
    Idle,
    AuthReceived,
    AckSent,
    Established,
    Failed
};

/**
 * Initiator side of the auth/ack exchange.
 *
 * Idle -> BuildAuth -> AuthSent -> ReadAck -> AckReceived
 *      -> DeriveFrameKeys -> Established
 *
 * A call made in the wrong state fails with InvalidState. Any failure moves
 * the engine to Failed, wipes its secrets, and makes every later call fail
 * with InvalidState; a new attempt needs a new engine.
 */
class HandshakeInitiator {
public:
    /**
     * @param identity Local static identity, shared read-only
     * @param remote_node_id Recipient's 64-byte static public key
     * @param logger Optional; receives message sizes and state changes at debug level
     */
    [[nodiscard]] static Result<HandshakeInitiator, SessionFailure> Create(
        std::shared_ptr<const models::StaticIdentity> identity,
        std::span<const uint8_t> remote_node_id,
        std::shared_ptr<spdlog::logger> logger = nullptr);

    /// Returns auth-wire: 2-byte size prefix followed by the ECIES message.
    [[nodiscard]] Result<std::vector<uint8_t>, SessionFailure> BuildAuth();

    [[nodiscard]] Result<Unit, SessionFailure> ReadAck(std::span<const uint8_t> ack_wire);

    /// Wipes the ephemeral private key and the intermediate secrets.
    [[nodiscard]] Result<FrameKeys, SessionFailure> DeriveFrameKeys();

    [[nodiscard]] InitiatorState GetState() const noexcept;
    [[nodiscard]] const std::vector<uint8_t>& RemoteNodeId() const noexcept;

    HandshakeInitiator(const HandshakeInitiator&) = delete;
    HandshakeInitiator& operator=(const HandshakeInitiator&) = delete;
    HandshakeInitiator(HandshakeInitiator&&) noexcept;
    HandshakeInitiator& operator=(HandshakeInitiator&&) noexcept;
    ~HandshakeInitiator();

private:
    HandshakeInitiator();

    struct Context;
    std::unique_ptr<Context> context_{};
};

/**
 * Recipient side of the auth/ack exchange.
 *
 * Idle -> ReadAuth -> AuthReceived -> BuildAck -> AckSent
 *      -> DeriveFrameKeys -> Established
 *
 * Same failure rules as HandshakeInitiator. The initiator's static key is
 * learned from the auth message and is authenticated once ReadAuth succeeds.
 */
class HandshakeRecipient {
public:
    [[nodiscard]] static Result<HandshakeRecipient, SessionFailure> Create(
        std::shared_ptr<const models::StaticIdentity> identity,
        std::shared_ptr<spdlog::logger> logger = nullptr);

    [[nodiscard]] Result<Unit, SessionFailure> ReadAuth(std::span<const uint8_t> auth_wire);

    [[nodiscard]] Result<std::vector<uint8_t>, SessionFailure> BuildAck();

    [[nodiscard]] Result<FrameKeys, SessionFailure> DeriveFrameKeys();

    [[nodiscard]] RecipientState GetState() const noexcept;

    /// Empty until ReadAuth succeeds.
    [[nodiscard]] const std::vector<uint8_t>& RemoteNodeId() const noexcept;

    HandshakeRecipient(const HandshakeRecipient&) = delete;
    HandshakeRecipient& operator=(const HandshakeRecipient&) = delete;
    HandshakeRecipient(HandshakeRecipient&&) noexcept;
    HandshakeRecipient& operator=(HandshakeRecipient&&) noexcept;
    ~HandshakeRecipient();

private:
    HandshakeRecipient();

    struct Context;
    std::unique_ptr<Context> context_{};
};

using HandshakeEngine = std::variant<HandshakeInitiator, HandshakeRecipient>;

/// Output of one Advance call.
struct HandshakeStep {
    /// Bytes to write to the peer; empty when nothing is due.
    std::vector<uint8_t> outgoing;
    bool established = false;
    /// Set exactly when `established` is.
    std::optional<FrameKeys> frame_keys;
};

/**
 * Moves either role forward by one network round.
 *
 * Initiator: Advance(engine, {}) yields the auth message; Advance(engine, ack)
 * reads the ack and completes. Recipient: Advance(engine, auth) reads the
 * auth and yields the ack together with the frame keys. Passing incoming
 * bytes the current state does not expect fails with InvalidState.
 */
[[nodiscard]] Result<HandshakeStep, SessionFailure> Advance(
    HandshakeEngine& engine,
    std::span<const uint8_t> incoming);

[[nodiscard]] bool IsEstablished(const HandshakeEngine& engine) noexcept;

[[nodiscard]] const std::vector<uint8_t>& RemoteNodeId(const HandshakeEngine& engine) noexcept;

/**
 * Reads one size-prefixed handshake message from `channel`.
 *
 * Returns the full wire form (prefix included). Fails with
 * MalformedHandshake when the prefix announces less than the ECIES overhead
 * or more than the handshake size limit; channel errors pass through.
 */
[[nodiscard]] Result<std::vector<uint8_t>, SessionFailure> ReadHandshakeMessage(
    IByteChannel& channel,
    Deadline deadline);

}  // namespace peerwire::protocol

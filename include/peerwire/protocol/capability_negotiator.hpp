#pragma once
#include "peerwire/configuration/session_config.hpp"
#include "peerwire/core/failures.hpp"
#include "peerwire/core/result.hpp"
#include "peerwire/models/capability.hpp"
#include "peerwire/models/key_materials/static_identity.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace peerwire::protocol {

/**
 * Base-protocol Hello and Disconnect messages and the capability
 * intersection performed once both Hellos are known.
 */
class CapabilityNegotiator {
public:
    /// Local Hello for `config`; node id is the identity's public key.
    [[nodiscard]] static models::HelloMessage BuildHello(
        const models::StaticIdentity& identity,
        const configuration::SessionConfig& config);

    [[nodiscard]] static Result<std::vector<uint8_t>, SessionFailure> EncodeHello(
        const models::HelloMessage& hello);

    /**
     * Decodes and validates a peer Hello.
     *
     * MalformedHello: unparseable bytes, empty client id, node id not 64
     * bytes, a capability name empty or longer than 8 characters, listen port
     * above 65535. UnsupportedVersion: protocol version below `min_version`.
     */
    [[nodiscard]] static Result<models::HelloMessage, SessionFailure> ParseHello(
        std::span<const uint8_t> payload,
        uint32_t min_version);

    /**
     * For every name both sides advertise, picks the highest version both
     * advertise under that name. The result is sorted by name.
     * Fails with NoSharedCapabilities when nothing matches.
     */
    [[nodiscard]] static Result<std::vector<models::Capability>, SessionFailure> Negotiate(
        std::span<const models::Capability> local,
        std::span<const models::Capability> remote);

    [[nodiscard]] static Result<std::vector<uint8_t>, SessionFailure> EncodeDisconnect(
        models::DisconnectReason reason);

    /// MalformedFrame when the payload does not parse or carries an unknown code.
    [[nodiscard]] static Result<models::DisconnectReason, SessionFailure> ParseDisconnect(
        std::span<const uint8_t> payload);

private:
    CapabilityNegotiator() = delete;
};

}  // namespace peerwire::protocol

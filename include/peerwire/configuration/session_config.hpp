#pragma once

#include "peerwire/core/constants.hpp"
#include "peerwire/core/result.hpp"
#include "peerwire/core/failures.hpp"
#include "peerwire/models/capability.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace peerwire::configuration {

/// Local policy for one handshake run.
///
/// Passed to the orchestrator by value at construction; nothing in the
/// library reads configuration from global state.
///
/// @example
/// ```cpp
/// SessionConfig config;
/// config.capabilities = {{"eth", 67}, {"snap", 1}};
/// config.listen_port = 30303;
/// if (auto valid = config.Validate(); valid.IsErr()) { ... }
/// ```
struct SessionConfig {
    /// Advertised in the Hello; must be non-empty.
    std::string client_id{kDefaultClientId};

    /// Version this node speaks.
    uint32_t protocol_version = kBaseProtocolVersion;

    /// Lowest peer Hello version accepted.
    uint32_t min_protocol_version = kBaseProtocolVersion;

    std::vector<models::Capability> capabilities;

    uint16_t listen_port = 0;

    /// Bounds the whole run: handshake and capability exchange together.
    std::chrono::milliseconds handshake_timeout = kDefaultHandshakeTimeout;

    size_t max_frame_size = kMaxFrameSize;

    /**
     * Fails with InvalidConfig when the client id is empty, the timeout is
     * not positive, min_protocol_version exceeds protocol_version, a
     * capability name is empty or longer than 8 characters, the same
     * (name, version) appears twice, or max_frame_size is zero or above the
     * 24-bit frame limit.
     */
    [[nodiscard]] Result<Unit, SessionFailure> Validate() const;
};

}  // namespace peerwire::configuration

#pragma once
#include "peerwire/configuration/session_config.hpp"
#include "peerwire/core/failures.hpp"
#include "peerwire/core/result.hpp"
#include "peerwire/interfaces/i_byte_channel.hpp"
#include "peerwire/models/key_materials/static_identity.hpp"
#include "peerwire/models/peer_address.hpp"
#include "peerwire/protocol/handshake.hpp"
#include "peerwire/protocol/session.hpp"
#include <spdlog/logger.h>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <vector>

namespace peerwire::protocol {

/**
 * Runs one complete session establishment over a byte channel.
 *
 * A run performs the auth/ack handshake, switches the channel to framed
 * transport, exchanges Hello messages and negotiates capabilities. A single
 * deadline of `config.handshake_timeout` bounds the whole run.
 *
 * Every failure closes the channel, is logged at error level and comes back
 * with its stage set (Handshake, Frame or Capability). Where the peer is
 * still reachable over frames, a Disconnect with a matching reason is sent
 * first.
 *
 * Runs on one orchestrator are sequential; a second concurrent run fails
 * with InvalidState. Cancel() may be called from any thread.
 *
 * @example
 * ```cpp
 * auto identity = std::make_shared<const StaticIdentity>(StaticIdentity::Generate().Unwrap());
 * HandshakeOrchestrator orchestrator(identity, config, logging::CreateLogger("p2p"));
 * auto session = orchestrator.Connect(channel, PeerAddress{remote_id, "10.0.0.2", 30303});
 * ```
 */
class HandshakeOrchestrator {
public:
    /// A null logger is replaced with one that discards everything.
    HandshakeOrchestrator(
        std::shared_ptr<const models::StaticIdentity> identity,
        configuration::SessionConfig config,
        std::shared_ptr<spdlog::logger> logger);

    /// Initiator role towards `peer.node_id`.
    [[nodiscard]] Result<std::unique_ptr<Session>, SessionFailure> Connect(
        std::shared_ptr<IByteChannel> channel,
        const models::PeerAddress& peer);

    /// Recipient role; the peer's identity is learned from its auth message.
    [[nodiscard]] Result<std::unique_ptr<Session>, SessionFailure> Accept(
        std::shared_ptr<IByteChannel> channel);

    /// Aborts the run in progress, if any: closes its channel and makes it
    /// fail with Cancelled.
    void Cancel() noexcept;

    HandshakeOrchestrator(const HandshakeOrchestrator&) = delete;
    HandshakeOrchestrator& operator=(const HandshakeOrchestrator&) = delete;

private:
    /// Initiator when `remote_node_id` is set, recipient otherwise.
    [[nodiscard]] Result<std::unique_ptr<Session>, SessionFailure> Run(
        std::shared_ptr<IByteChannel> channel,
        std::optional<std::span<const uint8_t>> remote_node_id);

    [[nodiscard]] Result<std::unique_ptr<Session>, SessionFailure> Establish(
        const std::shared_ptr<IByteChannel>& channel,
        std::optional<std::span<const uint8_t>> remote_node_id,
        Deadline deadline) const;

    [[nodiscard]] Result<HandshakeEngine, SessionFailure> CreateEngine(
        std::optional<std::span<const uint8_t>> remote_node_id) const;

    [[nodiscard]] Result<FrameKeys, SessionFailure> ExchangeHandshake(
        HandshakeEngine& engine,
        IByteChannel& channel,
        Deadline deadline) const;

    [[nodiscard]] Result<std::unique_ptr<Session>, SessionFailure> ExchangeCapabilities(
        std::unique_ptr<FrameTransport> transport,
        const std::vector<uint8_t>& remote_node_id,
        Deadline deadline) const;

    /// Best effort; a failed send is logged.
    void SendDisconnect(
        FrameTransport& transport,
        models::DisconnectReason reason,
        Deadline deadline) const;

    Result<Unit, SessionFailure> BeginRun(const std::shared_ptr<IByteChannel>& channel);

    /// Returns whether Cancel() hit this run.
    bool EndRun() noexcept;

    std::shared_ptr<const models::StaticIdentity> identity_;
    configuration::SessionConfig config_;
    std::shared_ptr<spdlog::logger> logger_;

    std::mutex run_mutex_;
    std::shared_ptr<IByteChannel> active_channel_;
    bool running_ = false;
    bool cancelled_ = false;
};

}  // namespace peerwire::protocol

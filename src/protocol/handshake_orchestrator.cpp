#include "peerwire/protocol/handshake_orchestrator.hpp"
#include "peerwire/core/constants.hpp"
#include "peerwire/crypto/sodium_interop.hpp"
#include "peerwire/logging/logger.hpp"
#include "peerwire/protocol/capability_negotiator.hpp"
#include <chrono>
#include <format>
#include <string>

namespace peerwire::protocol {
    using crypto::SodiumInterop;
    using models::DisconnectReason;

    namespace {
        using SessionResult = Result<std::unique_ptr<Session>, SessionFailure>;
        using KeysResult = Result<FrameKeys, SessionFailure>;
        using EngineResult = Result<HandshakeEngine, SessionFailure>;

        DisconnectReason ReasonFor(const SessionFailure& failure) noexcept {
            switch (failure.type) {
                case SessionFailureType::UnsupportedVersion:
                    return DisconnectReason::IncompatibleVersion;
                case SessionFailureType::NoSharedCapabilities:
                    return DisconnectReason::UselessPeer;
                case SessionFailureType::HandshakeFailure:
                    return DisconnectReason::UnexpectedIdentity;
                default:
                    return DisconnectReason::BreachOfProtocol;
            }
        }

        std::string DescribeCapabilities(const std::vector<models::Capability>& capabilities) {
            std::string described;
            for (const auto& capability : capabilities) {
                if (!described.empty()) {
                    described += ", ";
                }
                described += std::format("{}/{}", capability.name, capability.version);
            }
            return described;
        }
    }

    HandshakeOrchestrator::HandshakeOrchestrator(
        std::shared_ptr<const models::StaticIdentity> identity,
        configuration::SessionConfig config,
        std::shared_ptr<spdlog::logger> logger)
        : identity_(std::move(identity))
          , config_(std::move(config))
          , logger_(logger ? std::move(logger) : logging::CreateNullLogger("peerwire")) {
    }

    Result<std::unique_ptr<Session>, SessionFailure> HandshakeOrchestrator::Connect(
        std::shared_ptr<IByteChannel> channel,
        const models::PeerAddress& peer) {
        logger_->debug("Connecting to {} at {}:{}", logging::ShortId(peer.node_id), peer.host, peer.port);
        return Run(std::move(channel), std::span<const uint8_t>(peer.node_id));
    }

    Result<std::unique_ptr<Session>, SessionFailure> HandshakeOrchestrator::Accept(
        std::shared_ptr<IByteChannel> channel) {
        return Run(std::move(channel), std::nullopt);
    }

    void HandshakeOrchestrator::Cancel() noexcept {
        std::shared_ptr<IByteChannel> channel;
        {
            std::lock_guard<std::mutex> lock(run_mutex_);
            if (!running_) {
                return;
            }
            cancelled_ = true;
            channel = active_channel_;
        }
        if (channel) {
            channel->Close();
        }
        logger_->info("Handshake run cancelled");
    }

    Result<Unit, SessionFailure> HandshakeOrchestrator::BeginRun(const std::shared_ptr<IByteChannel>& channel) {
        std::lock_guard<std::mutex> lock(run_mutex_);
        if (running_) {
            return Result<Unit, SessionFailure>::Err(
                SessionFailure::InvalidState("Another run is in progress on this orchestrator"));
        }
        running_ = true;
        cancelled_ = false;
        active_channel_ = channel;
        return Result<Unit, SessionFailure>::Ok(unit);
    }

    bool HandshakeOrchestrator::EndRun() noexcept {
        std::lock_guard<std::mutex> lock(run_mutex_);
        const bool cancelled = cancelled_;
        running_ = false;
        cancelled_ = false;
        active_channel_.reset();
        return cancelled;
    }

    Result<std::unique_ptr<Session>, SessionFailure> HandshakeOrchestrator::Run(
        std::shared_ptr<IByteChannel> channel,
        std::optional<std::span<const uint8_t>> remote_node_id) {
        const std::string_view role = remote_node_id ? "initiator" : "recipient";
        const std::string peer_label = remote_node_id ? logging::ShortId(*remote_node_id) : "inbound peer";
        if (!channel) {
            return SessionResult::Err(SessionFailure::InvalidState("A byte channel is required"));
        }

        const auto fail_run = [&](SessionFailure failure) {
            channel->Close();
            logger_->error("{} run with {} failed at {} stage: {}: {}",
                           role, peer_label, ToString(failure.stage), ToString(failure.type), failure.message);
            return SessionResult::Err(std::move(failure));
        };

        if (!identity_) {
            return fail_run(SessionFailure::InvalidConfig("Orchestrator has no local identity"));
        }
        if (auto valid = config_.Validate(); valid.IsErr()) {
            return fail_run(std::move(valid).UnwrapErr());
        }
        if (auto initialized = SodiumInterop::Initialize(); initialized.IsErr()) {
            return fail_run(SessionFailure::FromSodiumFailure(initialized.UnwrapErr()));
        }
        if (auto begun = BeginRun(channel); begun.IsErr()) {
            return fail_run(std::move(begun).UnwrapErr());
        }

        const Deadline deadline = std::chrono::steady_clock::now() + config_.handshake_timeout;
        auto outcome = Establish(channel, remote_node_id, deadline);
        const bool cancelled = EndRun();

        if (outcome.IsOk() && !cancelled) {
            const Session& session = *outcome.Unwrap();
            logger_->info("Session established as {} with {} ({}), capabilities: {}",
                          role, logging::ShortId(session.RemoteNodeId()),
                          session.PeerHello().client_id, DescribeCapabilities(session.Capabilities()));
            return outcome;
        }
        if (outcome.IsOk()) {
            outcome.Unwrap()->Close();
            return fail_run(SessionFailure::Cancelled("Run was cancelled after the session was established")
                             .AtStage(FailureStage::Capability));
        }

        SessionFailure failure = std::move(outcome).UnwrapErr();
        if (cancelled && failure.type != SessionFailureType::Cancelled) {
            failure = SessionFailure::Cancelled(std::format("Run was cancelled ({})", failure.message))
                          .AtStage(failure.stage);
        }
        return fail_run(std::move(failure));
    }

    Result<std::unique_ptr<Session>, SessionFailure> HandshakeOrchestrator::Establish(
        const std::shared_ptr<IByteChannel>& channel,
        std::optional<std::span<const uint8_t>> remote_node_id,
        const Deadline deadline) const {
        auto engine = CreateEngine(remote_node_id);
        if (engine.IsErr()) {
            return SessionResult::Err(std::move(engine).UnwrapErr().AtStage(FailureStage::Handshake));
        }
        auto keys = ExchangeHandshake(engine.Unwrap(), *channel, deadline);
        if (keys.IsErr()) {
            return SessionResult::Err(std::move(keys).UnwrapErr());
        }
        logger_->debug("Handshake complete with {}", logging::ShortId(RemoteNodeId(engine.Unwrap())));

        auto transport = FrameTransport::Create(channel, std::move(keys).Unwrap(), config_.max_frame_size);
        if (transport.IsErr()) {
            return SessionResult::Err(std::move(transport).UnwrapErr().AtStage(FailureStage::Frame));
        }
        return ExchangeCapabilities(std::move(transport).Unwrap(), RemoteNodeId(engine.Unwrap()), deadline);
    }

    Result<HandshakeEngine, SessionFailure> HandshakeOrchestrator::CreateEngine(
        std::optional<std::span<const uint8_t>> remote_node_id) const {
        if (remote_node_id) {
            auto initiator = HandshakeInitiator::Create(identity_, *remote_node_id, logger_);
            if (initiator.IsErr()) {
                return EngineResult::Err(std::move(initiator).UnwrapErr());
            }
            return EngineResult::Ok(HandshakeEngine(std::in_place_type<HandshakeInitiator>,
                                                    std::move(initiator).Unwrap()));
        }
        auto recipient = HandshakeRecipient::Create(identity_, logger_);
        if (recipient.IsErr()) {
            return EngineResult::Err(std::move(recipient).UnwrapErr());
        }
        return EngineResult::Ok(HandshakeEngine(std::in_place_type<HandshakeRecipient>,
                                                std::move(recipient).Unwrap()));
    }

    Result<FrameKeys, SessionFailure> HandshakeOrchestrator::ExchangeHandshake(
        HandshakeEngine& engine,
        IByteChannel& channel,
        const Deadline deadline) const {
        const auto fail = [](SessionFailure failure) {
            return KeysResult::Err(std::move(failure).AtStage(FailureStage::Handshake));
        };

        std::vector<uint8_t> incoming;
        if (std::holds_alternative<HandshakeRecipient>(engine)) {
            auto auth = ReadHandshakeMessage(channel, deadline);
            if (auth.IsErr()) {
                return fail(std::move(auth).UnwrapErr());
            }
            incoming = std::move(auth).Unwrap();
        }

        for (;;) {
            auto step = Advance(engine, incoming);
            if (step.IsErr()) {
                return fail(std::move(step).UnwrapErr());
            }
            HandshakeStep& current = step.Unwrap();
            if (!current.outgoing.empty()) {
                if (auto written = channel.WriteAll(current.outgoing, deadline); written.IsErr()) {
                    return fail(std::move(written).UnwrapErr());
                }
                logger_->debug("Sent {} byte handshake message", current.outgoing.size());
            }
            if (current.established) {
                return KeysResult::Ok(std::move(*current.frame_keys));
            }
            auto reply = ReadHandshakeMessage(channel, deadline);
            if (reply.IsErr()) {
                return fail(std::move(reply).UnwrapErr());
            }
            incoming = std::move(reply).Unwrap();
        }
    }

    Result<std::unique_ptr<Session>, SessionFailure> HandshakeOrchestrator::ExchangeCapabilities(
        std::unique_ptr<FrameTransport> transport,
        const std::vector<uint8_t>& remote_node_id,
        const Deadline deadline) const {
        const auto local_hello = CapabilityNegotiator::BuildHello(*identity_, config_);
        auto encoded = CapabilityNegotiator::EncodeHello(local_hello);
        if (encoded.IsErr()) {
            return SessionResult::Err(std::move(encoded).UnwrapErr().AtStage(FailureStage::Capability));
        }
        if (auto sent = transport->SendMessage(kHelloMessageId, encoded.Unwrap(), deadline); sent.IsErr()) {
            return SessionResult::Err(std::move(sent).UnwrapErr().AtStage(FailureStage::Frame));
        }

        auto received = transport->ReceiveMessage(deadline);
        if (received.IsErr()) {
            return SessionResult::Err(std::move(received).UnwrapErr().AtStage(FailureStage::Frame));
        }
        FrameMessage& first = received.Unwrap();

        if (first.id == kDisconnectMessageId) {
            auto reason = CapabilityNegotiator::ParseDisconnect(first.payload);
            if (reason.IsErr()) {
                return SessionResult::Err(std::move(reason).UnwrapErr().AtStage(FailureStage::Capability));
            }
            return SessionResult::Err(SessionFailure::PeerDisconnected(
                std::format("Peer disconnected: {}", models::ToString(reason.Unwrap())))
                .AtStage(FailureStage::Capability));
        }

        const auto reject = [&](SessionFailure failure) {
            SendDisconnect(*transport, ReasonFor(failure), deadline);
            return SessionResult::Err(std::move(failure).AtStage(FailureStage::Capability));
        };

        if (first.id != kHelloMessageId) {
            return reject(SessionFailure::MalformedHello(
                std::format("Expected Hello, got message id 0x{:02x}", first.id)));
        }
        auto hello = CapabilityNegotiator::ParseHello(first.payload, config_.min_protocol_version);
        if (hello.IsErr()) {
            return reject(std::move(hello).UnwrapErr());
        }
        if (hello.Unwrap().node_id != remote_node_id) {
            return reject(SessionFailure::HandshakeFailure(
                "Hello node id differs from the key authenticated by the handshake"));
        }
        auto shared = CapabilityNegotiator::Negotiate(config_.capabilities, hello.Unwrap().capabilities);
        if (shared.IsErr()) {
            return reject(std::move(shared).UnwrapErr());
        }

        return SessionResult::Ok(std::make_unique<Session>(
            std::move(transport), std::move(hello).Unwrap(), std::move(shared).Unwrap(), remote_node_id));
    }

    void HandshakeOrchestrator::SendDisconnect(
        FrameTransport& transport,
        const DisconnectReason reason,
        const Deadline deadline) const {
        auto payload = CapabilityNegotiator::EncodeDisconnect(reason);
        if (payload.IsErr()) {
            logger_->warn("Could not encode Disconnect: {}", payload.UnwrapErr().message);
            return;
        }
        if (auto sent = transport.SendMessage(kDisconnectMessageId, payload.Unwrap(), deadline); sent.IsErr()) {
            logger_->warn("Disconnect ({}) was not delivered: {}", models::ToString(reason), sent.UnwrapErr().message);
        }
    }
}

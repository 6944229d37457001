#include <catch2/catch_test_macros.hpp>
#include "peerwire/core/constants.hpp"
#include "peerwire/crypto/sodium_interop.hpp"
#include "peerwire/logging/logger.hpp"
#include "peerwire/protocol/capability_negotiator.hpp"
#include "peerwire/protocol/handshake_orchestrator.hpp"
#include "helpers/handshake_pair.hpp"
#include "helpers/memory_channel.hpp"
#include <future>
#include <optional>
#include <thread>
using namespace peerwire;
using namespace peerwire::crypto;
using namespace peerwire::models;
using namespace peerwire::protocol;
using namespace peerwire::test;
using namespace std::chrono_literals;
namespace {
    using SessionResult = Result<std::unique_ptr<Session>, SessionFailure>;

    configuration::SessionConfig ConfigWith(std::vector<Capability> capabilities) {
        configuration::SessionConfig config;
        config.capabilities = std::move(capabilities);
        config.handshake_timeout = 2s;
        return config;
    }

    struct RunOutcome {
        SessionResult initiator;
        SessionResult recipient;
    };

    RunOutcome RunBoth(
        HandshakeOrchestrator& initiator,
        HandshakeOrchestrator& recipient,
        const std::shared_ptr<const StaticIdentity>& recipient_identity,
        const std::shared_ptr<MemoryChannel>& initiator_channel,
        const std::shared_ptr<MemoryChannel>& recipient_channel) {
        auto accepted = std::async(std::launch::async, [&recipient, recipient_channel] {
            return recipient.Accept(recipient_channel);
        });
        auto connected = initiator.Connect(
            initiator_channel, PeerAddress{recipient_identity->PublicKey(), "127.0.0.1", 30303});
        auto accept_result = accepted.get();
        return RunOutcome{std::move(connected), std::move(accept_result)};
    }

    size_t AuthWireSize(const std::vector<uint8_t>& written) {
        return kHandshakeSizePrefixBytes + ((static_cast<size_t>(written[0]) << 8) | written[1]);
    }
}
TEST_CASE("Orchestrator - Successful establishment", "[orchestrator][integration]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto alice = MakeIdentity();
    auto bob = MakeIdentity();
    auto alice_config = ConfigWith({{"eth", 66}, {"eth", 67}, {"snap", 1}});
    alice_config.client_id = "alice/1.0";
    alice_config.listen_port = 30301;
    auto bob_config = ConfigWith({{"eth", 67}, {"les", 3}, {"snap", 1}});
    bob_config.client_id = "bob/1.0";
    HandshakeOrchestrator initiator(alice, alice_config, nullptr);
    HandshakeOrchestrator recipient(bob, bob_config, nullptr);
    auto [a, b] = MemoryChannel::CreatePair();

    auto outcome = RunBoth(initiator, recipient, bob, a, b);
    REQUIRE(outcome.initiator.IsOk());
    REQUIRE(outcome.recipient.IsOk());
    auto& alice_session = *outcome.initiator.Unwrap();
    auto& bob_session = *outcome.recipient.Unwrap();

    SECTION("Both sides agree on identities and capabilities") {
        const std::vector<Capability> expected = {{"eth", 67}, {"snap", 1}};
        REQUIRE(alice_session.Capabilities() == expected);
        REQUIRE(bob_session.Capabilities() == expected);
        REQUIRE(alice_session.RemoteNodeId() == bob->PublicKey());
        REQUIRE(bob_session.RemoteNodeId() == alice->PublicKey());
        REQUIRE(alice_session.PeerHello().client_id == "bob/1.0");
        REQUIRE(bob_session.PeerHello().client_id == "alice/1.0");
        REQUIRE(bob_session.PeerHello().listen_port == 30301);
    }
    SECTION("Sessions carry application messages both ways") {
        const std::vector<uint8_t> request = {'p', 'i', 'n', 'g'};
        const std::vector<uint8_t> response = {'p', 'o', 'n', 'g'};
        REQUIRE(alice_session.SendMessage(0x10, request, DeadlineIn(1s)).IsOk());
        auto received = bob_session.ReceiveMessage(DeadlineIn(1s)).Unwrap();
        REQUIRE(received.id == 0x10);
        REQUIRE(received.payload == request);
        REQUIRE(bob_session.SendMessage(0x11, response, DeadlineIn(1s)).IsOk());
        REQUIRE(alice_session.ReceiveMessage(DeadlineIn(1s)).Unwrap().payload == response);
    }
    SECTION("Disconnect reaches the peer with its reason") {
        REQUIRE(alice_session.Disconnect(DisconnectReason::ClientQuitting, DeadlineIn(1s)).IsOk());
        auto received = bob_session.ReceiveMessage(DeadlineIn(1s)).Unwrap();
        REQUIRE(received.id == kDisconnectMessageId);
        REQUIRE(CapabilityNegotiator::ParseDisconnect(received.payload).Unwrap() ==
                DisconnectReason::ClientQuitting);
        REQUIRE(alice_session.SendMessage(0x10, {}, DeadlineIn(1s)).UnwrapErr().type ==
                SessionFailureType::InvalidState);
    }
    SECTION("The orchestrator can run again after a session is established") {
        auto [c, d] = MemoryChannel::CreatePair();
        auto again = RunBoth(initiator, recipient, bob, c, d);
        REQUIRE(again.initiator.IsOk());
        REQUIRE(again.recipient.IsOk());
    }
}
TEST_CASE("Orchestrator - Every run uses fresh keys", "[orchestrator][integration][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto alice = MakeIdentity();
    auto bob = MakeIdentity();
    HandshakeOrchestrator initiator(alice, ConfigWith({{"eth", 67}}), nullptr);
    HandshakeOrchestrator recipient(bob, ConfigWith({{"eth", 67}}), nullptr);

    auto [a1, b1] = MemoryChannel::CreatePair();
    REQUIRE(RunBoth(initiator, recipient, bob, a1, b1).initiator.IsOk());
    auto [a2, b2] = MemoryChannel::CreatePair();
    REQUIRE(RunBoth(initiator, recipient, bob, a2, b2).initiator.IsOk());

    // Identical Hello plaintext on both runs; the framed bytes must differ.
    const auto first = a1->Written();
    const auto second = a2->Written();
    const std::vector<uint8_t> first_hello(first.begin() + static_cast<std::ptrdiff_t>(AuthWireSize(first)), first.end());
    const std::vector<uint8_t> second_hello(second.begin() + static_cast<std::ptrdiff_t>(AuthWireSize(second)), second.end());
    REQUIRE(first_hello.size() == second_hello.size());
    REQUIRE(first_hello != second_hello);
}
TEST_CASE("Orchestrator - Negotiation failures", "[orchestrator][integration]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto alice = MakeIdentity();
    auto bob = MakeIdentity();
    auto [a, b] = MemoryChannel::CreatePair();

    SECTION("No shared capability fails both sides at the capability stage") {
        HandshakeOrchestrator initiator(alice, ConfigWith({{"eth", 67}}), nullptr);
        HandshakeOrchestrator recipient(bob, ConfigWith({{"les", 3}}), nullptr);
        auto outcome = RunBoth(initiator, recipient, bob, a, b);
        for (auto* result : {&outcome.initiator, &outcome.recipient}) {
            REQUIRE(result->IsErr());
            REQUIRE(result->UnwrapErr().type == SessionFailureType::NoSharedCapabilities);
            REQUIRE(result->UnwrapErr().stage == FailureStage::Capability);
        }
    }
    SECTION("Peer below the minimum version is told why") {
        auto strict = ConfigWith({{"eth", 67}});
        strict.protocol_version = kBaseProtocolVersion + 1;
        strict.min_protocol_version = kBaseProtocolVersion + 1;
        HandshakeOrchestrator initiator(alice, strict, nullptr);
        HandshakeOrchestrator recipient(bob, ConfigWith({{"eth", 67}}), nullptr);
        auto outcome = RunBoth(initiator, recipient, bob, a, b);

        REQUIRE(outcome.initiator.IsErr());
        REQUIRE(outcome.initiator.UnwrapErr().type == SessionFailureType::UnsupportedVersion);
        REQUIRE(outcome.initiator.UnwrapErr().stage == FailureStage::Capability);

        REQUIRE(outcome.recipient.IsOk());
        auto& session = *outcome.recipient.Unwrap();
        REQUIRE(session.PeerHello().protocol_version == kBaseProtocolVersion + 1);
        auto notice = session.ReceiveMessage(DeadlineIn(1s)).Unwrap();
        REQUIRE(notice.id == kDisconnectMessageId);
        REQUIRE(CapabilityNegotiator::ParseDisconnect(notice.payload).Unwrap() ==
                DisconnectReason::IncompatibleVersion);
    }
}
TEST_CASE("Orchestrator - Peer disconnects instead of sending Hello", "[orchestrator][integration]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto alice = MakeIdentity();
    auto bob = MakeIdentity();
    HandshakeOrchestrator initiator(alice, ConfigWith({{"eth", 67}}), nullptr);
    auto [a, b] = MemoryChannel::CreatePair();

    auto refusing_peer = std::async(std::launch::async, [bob, channel = b]() -> bool {
        HandshakeEngine engine{HandshakeRecipient::Create(bob).Unwrap()};
        auto auth = ReadHandshakeMessage(*channel, DeadlineIn(2s));
        if (auth.IsErr()) {
            return false;
        }
        auto step = Advance(engine, auth.Unwrap());
        if (step.IsErr() || channel->WriteAll(step.Unwrap().outgoing, DeadlineIn(2s)).IsErr()) {
            return false;
        }
        auto transport = FrameTransport::Create(channel, std::move(*step.Unwrap().frame_keys)).Unwrap();
        auto hello = transport->ReceiveMessage(DeadlineIn(2s));
        if (hello.IsErr() || hello.Unwrap().id != kHelloMessageId) {
            return false;
        }
        auto reason = CapabilityNegotiator::EncodeDisconnect(DisconnectReason::TooManyPeers).Unwrap();
        return transport->SendMessage(kDisconnectMessageId, reason, DeadlineIn(2s)).IsOk();
    });
    auto result = initiator.Connect(a, PeerAddress{bob->PublicKey(), "127.0.0.1", 30303});
    REQUIRE(refusing_peer.get());
    REQUIRE(result.IsErr());
    REQUIRE(result.UnwrapErr().type == SessionFailureType::PeerDisconnected);
    REQUIRE(result.UnwrapErr().stage == FailureStage::Capability);
}
TEST_CASE("Orchestrator - Hello from a different identity is rejected", "[orchestrator][integration][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto alice = MakeIdentity();
    auto bob = MakeIdentity();
    auto carol = MakeIdentity();
    const auto config = ConfigWith({{"eth", 67}});
    HandshakeOrchestrator initiator(alice, config, nullptr);
    auto [a, b] = MemoryChannel::CreatePair();

    // Bob completes the handshake, then announces Carol's node id in his Hello.
    auto impostor = std::async(std::launch::async, [bob, carol, config, channel = b]() -> std::optional<DisconnectReason> {
        HandshakeEngine engine{HandshakeRecipient::Create(bob).Unwrap()};
        auto auth = ReadHandshakeMessage(*channel, DeadlineIn(2s));
        if (auth.IsErr()) {
            return std::nullopt;
        }
        auto step = Advance(engine, auth.Unwrap());
        if (step.IsErr() || channel->WriteAll(step.Unwrap().outgoing, DeadlineIn(2s)).IsErr()) {
            return std::nullopt;
        }
        auto transport = FrameTransport::Create(channel, std::move(*step.Unwrap().frame_keys)).Unwrap();
        auto hello = transport->ReceiveMessage(DeadlineIn(2s));
        if (hello.IsErr() || hello.Unwrap().id != kHelloMessageId) {
            return std::nullopt;
        }
        auto forged = CapabilityNegotiator::EncodeHello(CapabilityNegotiator::BuildHello(*carol, config)).Unwrap();
        if (transport->SendMessage(kHelloMessageId, forged, DeadlineIn(2s)).IsErr()) {
            return std::nullopt;
        }
        auto notice = transport->ReceiveMessage(DeadlineIn(2s));
        if (notice.IsErr() || notice.Unwrap().id != kDisconnectMessageId) {
            return std::nullopt;
        }
        auto reason = CapabilityNegotiator::ParseDisconnect(notice.Unwrap().payload);
        if (reason.IsErr()) {
            return std::nullopt;
        }
        return reason.Unwrap();
    });
    auto result = initiator.Connect(a, PeerAddress{bob->PublicKey(), "127.0.0.1", 30303});
    const auto reason = impostor.get();

    REQUIRE(result.IsErr());
    REQUIRE(result.UnwrapErr().type == SessionFailureType::HandshakeFailure);
    REQUIRE(result.UnwrapErr().stage == FailureStage::Capability);
    REQUIRE(result.UnwrapErr().IsPeerMisbehaviour());
    REQUIRE(reason.has_value());
    REQUIRE(*reason == DisconnectReason::UnexpectedIdentity);
    REQUIRE_FALSE(a->IsOpen());
}
TEST_CASE("Orchestrator - Deadlines and cancellation", "[orchestrator][integration]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto alice = MakeIdentity();
    auto bob = MakeIdentity();
    auto [a, b] = MemoryChannel::CreatePair();

    SECTION("Silent peer runs into the handshake timeout") {
        auto config = ConfigWith({{"eth", 67}});
        config.handshake_timeout = 100ms;
        HandshakeOrchestrator recipient(bob, config, nullptr);
        const auto started = std::chrono::steady_clock::now();
        auto result = recipient.Accept(b);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == SessionFailureType::HandshakeTimeout);
        REQUIRE(result.UnwrapErr().stage == FailureStage::Handshake);
        REQUIRE(result.UnwrapErr().IsRetryable());
        REQUIRE(std::chrono::steady_clock::now() - started < 2s);
        REQUIRE_FALSE(b->IsOpen());
    }
    SECTION("Cancel aborts a blocked run") {
        auto config = ConfigWith({{"eth", 67}});
        config.handshake_timeout = 10s;
        HandshakeOrchestrator recipient(bob, config, nullptr);
        auto pending = std::async(std::launch::async, [&recipient, channel = b] {
            return recipient.Accept(channel);
        });
        while (pending.wait_for(10ms) != std::future_status::ready) {
            recipient.Cancel();
        }
        auto result = pending.get();
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == SessionFailureType::Cancelled);
        REQUIRE(result.UnwrapErr().stage == FailureStage::Handshake);
    }
    SECTION("Cancel with no run in progress does nothing") {
        HandshakeOrchestrator initiator(alice, ConfigWith({{"eth", 67}}), nullptr);
        initiator.Cancel();
        HandshakeOrchestrator recipient(bob, ConfigWith({{"eth", 67}}), nullptr);
        auto outcome = RunBoth(initiator, recipient, bob, a, b);
        REQUIRE(outcome.initiator.IsOk());
        REQUIRE(outcome.recipient.IsOk());
    }
    SECTION("A second concurrent run is refused") {
        auto config = ConfigWith({{"eth", 67}});
        config.handshake_timeout = 10s;
        HandshakeOrchestrator initiator(alice, config, nullptr);
        auto pending = std::async(std::launch::async, [&initiator, &bob, channel = a] {
            return initiator.Connect(channel, PeerAddress{bob->PublicKey(), "127.0.0.1", 30303});
        });
        while (a->Written().empty()) {
            std::this_thread::sleep_for(1ms);
        }
        auto [c, d] = MemoryChannel::CreatePair();
        auto second = initiator.Connect(c, PeerAddress{bob->PublicKey(), "127.0.0.1", 30303});
        REQUIRE(second.IsErr());
        REQUIRE(second.UnwrapErr().type == SessionFailureType::InvalidState);
        REQUIRE_FALSE(c->IsOpen());

        initiator.Cancel();
        REQUIRE(pending.get().UnwrapErr().type == SessionFailureType::Cancelled);
    }
}
TEST_CASE("Orchestrator - Configuration problems", "[orchestrator][integration]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto alice = MakeIdentity();
    auto [a, b] = MemoryChannel::CreatePair();

    SECTION("Invalid config fails before anything is sent") {
        auto config = ConfigWith({{"eth", 67}});
        config.client_id.clear();
        HandshakeOrchestrator initiator(alice, config, nullptr);
        auto result = initiator.Connect(a, PeerAddress{MakeIdentity()->PublicKey(), "127.0.0.1", 30303});
        REQUIRE(result.UnwrapErr().type == SessionFailureType::InvalidConfig);
        REQUIRE(result.UnwrapErr().stage == FailureStage::Unspecified);
        REQUIRE(a->Written().empty());
        REQUIRE_FALSE(a->IsOpen());
    }
    SECTION("Missing identity") {
        HandshakeOrchestrator initiator(nullptr, ConfigWith({{"eth", 67}}), nullptr);
        auto result = initiator.Accept(b);
        REQUIRE(result.UnwrapErr().type == SessionFailureType::InvalidConfig);
    }
    SECTION("Remote node id that is not a curve point") {
        HandshakeOrchestrator initiator(alice, ConfigWith({{"eth", 67}}), nullptr);
        auto result = initiator.Connect(a, PeerAddress{std::vector<uint8_t>(kNodeIdBytes, 0x01), "h", 1});
        REQUIRE(result.UnwrapErr().type == SessionFailureType::InvalidConfig);
        REQUIRE(result.UnwrapErr().stage == FailureStage::Handshake);
    }
    SECTION("Missing channel") {
        HandshakeOrchestrator initiator(alice, ConfigWith({{"eth", 67}}), logging::CreateNullLogger());
        auto result = initiator.Accept(nullptr);
        REQUIRE(result.UnwrapErr().type == SessionFailureType::InvalidState);
    }
}

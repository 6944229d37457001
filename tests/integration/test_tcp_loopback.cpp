#include <catch2/catch_test_macros.hpp>
#include "peerwire/crypto/sodium_interop.hpp"
#include "peerwire/protocol/handshake_orchestrator.hpp"
#include "peerwire/transport/tcp_channel.hpp"
#include "helpers/handshake_pair.hpp"
#include "helpers/memory_channel.hpp"
#include <future>
using namespace peerwire;
using namespace peerwire::crypto;
using namespace peerwire::models;
using namespace peerwire::protocol;
using namespace peerwire::test;
using namespace peerwire::transport;
using namespace std::chrono_literals;
TEST_CASE("TcpChannel - Raw byte transfer", "[tcp][integration]") {
    auto listener = TcpListener::Bind("127.0.0.1", 0).Unwrap();
    REQUIRE(listener->Port() != 0);
    auto accepted = std::async(std::launch::async, [&listener] {
        return listener->Accept(DeadlineIn(2s));
    });
    auto client = TcpChannel::Connect("127.0.0.1", listener->Port(), DeadlineIn(2s)).Unwrap();
    auto server = accepted.get().Unwrap();

    SECTION("Bytes arrive in order") {
        std::vector<uint8_t> data(100000);
        for (size_t i = 0; i < data.size(); ++i) {
            data[i] = static_cast<uint8_t>(i % 251);
        }
        auto writer = std::async(std::launch::async, [&client, &data] {
            return client->WriteAll(data, DeadlineIn(2s)).IsOk();
        });
        std::vector<uint8_t> received(data.size());
        REQUIRE(server->ReadExact(received, DeadlineIn(2s)).IsOk());
        REQUIRE(writer.get());
        REQUIRE(received == data);
    }
    SECTION("Read times out when nothing arrives") {
        std::vector<uint8_t> buffer(4);
        auto result = server->ReadExact(buffer, DeadlineIn(50ms));
        REQUIRE(result.UnwrapErr().type == SessionFailureType::HandshakeTimeout);
    }
    SECTION("Peer close is an I/O failure") {
        client->Close();
        std::vector<uint8_t> buffer(4);
        auto result = server->ReadExact(buffer, DeadlineIn(2s));
        REQUIRE(result.UnwrapErr().type == SessionFailureType::IoFailure);
    }
    SECTION("Local close fails later calls") {
        server->Close();
        REQUIRE_FALSE(server->IsOpen());
        const std::vector<uint8_t> data = {1};
        REQUIRE(server->WriteAll(data, DeadlineIn(1s)).IsErr());
    }
}
TEST_CASE("TcpChannel - Connection refused", "[tcp][integration]") {
    auto listener = TcpListener::Bind("127.0.0.1", 0).Unwrap();
    const uint16_t port = listener->Port();
    listener.reset();
    auto result = TcpChannel::Connect("127.0.0.1", port, DeadlineIn(2s));
    REQUIRE(result.IsErr());
    REQUIRE(result.UnwrapErr().type == SessionFailureType::IoFailure);
}
TEST_CASE("TcpChannel - Orchestrated session over loopback", "[tcp][orchestrator][integration]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto alice = MakeIdentity();
    auto bob = MakeIdentity();
    configuration::SessionConfig config;
    config.capabilities = {{"eth", 67}, {"snap", 1}};
    config.handshake_timeout = 5s;
    HandshakeOrchestrator initiator(alice, config, nullptr);
    HandshakeOrchestrator recipient(bob, config, nullptr);

    auto listener = TcpListener::Bind("127.0.0.1", 0).Unwrap();
    auto accepted = std::async(std::launch::async, [&listener, &recipient] {
        auto channel = listener->Accept(DeadlineIn(5s));
        if (channel.IsErr()) {
            return Result<std::unique_ptr<Session>, SessionFailure>::Err(std::move(channel).UnwrapErr());
        }
        return recipient.Accept(std::move(channel).Unwrap());
    });
    auto channel = TcpChannel::Connect("127.0.0.1", listener->Port(), DeadlineIn(5s)).Unwrap();
    auto connected = initiator.Connect(channel, PeerAddress{bob->PublicKey(), "127.0.0.1", listener->Port()});
    auto accept_result = accepted.get();

    REQUIRE(connected.IsOk());
    REQUIRE(accept_result.IsOk());
    auto& alice_session = *connected.Unwrap();
    auto& bob_session = *accept_result.Unwrap();
    REQUIRE(alice_session.Capabilities() == bob_session.Capabilities());
    REQUIRE(bob_session.RemoteNodeId() == alice->PublicKey());

    const std::vector<uint8_t> large(200000, 0x7E);
    auto sender = std::async(std::launch::async, [&alice_session, &large] {
        return alice_session.SendMessage(0x20, large, DeadlineIn(5s)).IsOk();
    });
    auto received = bob_session.ReceiveMessage(DeadlineIn(5s)).Unwrap();
    REQUIRE(sender.get());
    REQUIRE(received.id == 0x20);
    REQUIRE(received.payload == large);

    REQUIRE(bob_session.Disconnect(DisconnectReason::Requested, DeadlineIn(1s)).IsOk());
    auto notice = alice_session.ReceiveMessage(DeadlineIn(2s)).Unwrap();
    REQUIRE(notice.id == kDisconnectMessageId);
}

/**
 * @file loopback_handshake_example.cpp
 * @brief Two nodes establish a session over a TCP loopback connection
 */

#include "peerwire/crypto/sodium_interop.hpp"
#include "peerwire/logging/logger.hpp"
#include "peerwire/protocol/handshake_orchestrator.hpp"
#include "peerwire/transport/tcp_channel.hpp"

#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <string>

using namespace peerwire;
using namespace peerwire::protocol;

namespace {
    constexpr uint8_t kPingMessageId = 0x02;

    configuration::SessionConfig MakeConfig(const std::string& client_id,
                                            std::vector<models::Capability> capabilities) {
        configuration::SessionConfig config;
        config.client_id = client_id;
        config.capabilities = std::move(capabilities);
        config.handshake_timeout = std::chrono::seconds(5);
        return config;
    }
}

int main() {
    std::cout << "=== peerwire - Loopback Handshake Example ===" << std::endl;
    std::cout << std::endl;

    if (auto init_result = crypto::SodiumInterop::Initialize(); init_result.IsErr()) {
        std::cerr << "Failed to initialize: " << init_result.UnwrapErr().message << std::endl;
        return 1;
    }

    std::cout << "1. Generating node identities..." << std::endl;
    auto alice_identity = models::StaticIdentity::Generate();
    auto bob_identity = models::StaticIdentity::Generate();
    if (alice_identity.IsErr() || bob_identity.IsErr()) {
        std::cerr << "Failed to generate identities" << std::endl;
        return 1;
    }
    auto alice = std::make_shared<const models::StaticIdentity>(std::move(alice_identity).Unwrap());
    auto bob = std::make_shared<const models::StaticIdentity>(std::move(bob_identity).Unwrap());
    std::cout << "   Alice: " << logging::ShortId(alice->PublicKey()) << std::endl;
    std::cout << "   Bob:   " << logging::ShortId(bob->PublicKey()) << std::endl;
    std::cout << std::endl;

    std::cout << "2. Bob listens on 127.0.0.1..." << std::endl;
    auto listener_result = transport::TcpListener::Bind("127.0.0.1", 0);
    if (listener_result.IsErr()) {
        std::cerr << "Failed to listen: " << listener_result.UnwrapErr().message << std::endl;
        return 1;
    }
    auto listener = std::move(listener_result).Unwrap();
    std::cout << "   Port " << listener->Port() << std::endl;
    std::cout << std::endl;

    HandshakeOrchestrator bob_node(bob, MakeConfig("bob/1.0", {{"eth", 66}, {"eth", 67}, {"snap", 1}}),
                                   logging::CreateLogger("bob"));
    HandshakeOrchestrator alice_node(alice, MakeConfig("alice/1.0", {{"eth", 67}, {"les", 3}}),
                                     logging::CreateLogger("alice"));

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    auto accepted = std::async(std::launch::async, [&]() -> Result<std::unique_ptr<Session>, SessionFailure> {
        auto channel = listener->Accept(deadline);
        if (channel.IsErr()) {
            return Result<std::unique_ptr<Session>, SessionFailure>::Err(std::move(channel).UnwrapErr());
        }
        return bob_node.Accept(std::move(channel).Unwrap());
    });

    std::cout << "3. Alice connects and runs the handshake..." << std::endl;
    auto channel = transport::TcpChannel::Connect("127.0.0.1", listener->Port(), deadline);
    if (channel.IsErr()) {
        std::cerr << "Failed to connect: " << channel.UnwrapErr().message << std::endl;
        return 1;
    }
    auto alice_session = alice_node.Connect(
        std::move(channel).Unwrap(), models::PeerAddress{bob->PublicKey(), "127.0.0.1", listener->Port()});
    auto bob_session = accepted.get();
    if (alice_session.IsErr() || bob_session.IsErr()) {
        const auto& failure = alice_session.IsErr() ? alice_session.UnwrapErr() : bob_session.UnwrapErr();
        std::cerr << "Session setup failed: " << ToString(failure.type) << ": " << failure.message << std::endl;
        return 1;
    }
    std::cout << "   Negotiated:";
    for (const auto& capability : alice_session.Unwrap()->Capabilities()) {
        std::cout << " " << capability.name << "/" << capability.version;
    }
    std::cout << std::endl;
    std::cout << "   Bob sees client: " << bob_session.Unwrap()->PeerHello().client_id << std::endl;
    std::cout << std::endl;

    std::cout << "4. Alice sends a framed message..." << std::endl;
    const std::string text = "ping";
    const std::vector<uint8_t> payload(text.begin(), text.end());
    const auto message_deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    if (auto sent = alice_session.Unwrap()->SendMessage(kPingMessageId, payload, message_deadline); sent.IsErr()) {
        std::cerr << "Send failed: " << sent.UnwrapErr().message << std::endl;
        return 1;
    }
    auto received = bob_session.Unwrap()->ReceiveMessage(message_deadline);
    if (received.IsErr()) {
        std::cerr << "Receive failed: " << received.UnwrapErr().message << std::endl;
        return 1;
    }
    const auto& message = received.Unwrap();
    std::cout << "   Bob received id " << static_cast<int>(message.id) << ": "
              << std::string(message.payload.begin(), message.payload.end()) << std::endl;
    std::cout << std::endl;

    std::cout << "5. Alice disconnects..." << std::endl;
    if (auto closed = alice_session.Unwrap()->Disconnect(models::DisconnectReason::ClientQuitting,
                                                        message_deadline); closed.IsErr()) {
        std::cerr << "Disconnect was not delivered: " << closed.UnwrapErr().message << std::endl;
    }
    auto goodbye = bob_session.Unwrap()->ReceiveMessage(message_deadline);
    if (goodbye.IsOk() && goodbye.Unwrap().id == kDisconnectMessageId) {
        std::cout << "   Bob received Disconnect" << std::endl;
    }
    bob_session.Unwrap()->Close();

    std::cout << std::endl << "=== Done ===" << std::endl;
    return 0;
}

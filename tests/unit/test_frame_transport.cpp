#include <catch2/catch_test_macros.hpp>
#include "peerwire/core/constants.hpp"
#include "peerwire/crypto/sodium_interop.hpp"
#include "peerwire/protocol/frame_transport.hpp"
#include "helpers/handshake_pair.hpp"
#include <atomic>
#include <thread>
using namespace peerwire;
using namespace peerwire::crypto;
using namespace peerwire::protocol;
using namespace peerwire::test;
using namespace std::chrono_literals;
namespace {
    std::vector<uint8_t> Pattern(size_t size) {
        std::vector<uint8_t> bytes(size);
        for (size_t i = 0; i < size; ++i) {
            bytes[i] = static_cast<uint8_t>((i * 31 + 7) & 0xFF);
        }
        return bytes;
    }
}
TEST_CASE("FrameTransport - Round trip", "[frame][protocol]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto pair = MakeTransportPair();
    SECTION("Payload sizes around block boundaries") {
        for (size_t size : {size_t{0}, size_t{1}, size_t{15}, size_t{16}, size_t{17}, size_t{1000}, size_t{65536}}) {
            const auto payload = Pattern(size);
            REQUIRE(pair.initiator->SendFrame(payload, DeadlineIn(1s)).IsOk());
            REQUIRE(pair.recipient->ReceiveFrame(DeadlineIn(1s)).Unwrap() == payload);
        }
    }
    SECTION("Both directions interleave") {
        for (int round = 0; round < 5; ++round) {
            const auto ping = Pattern(10 + round);
            const auto pong = Pattern(100 + round);
            REQUIRE(pair.initiator->SendFrame(ping, DeadlineIn(1s)).IsOk());
            REQUIRE(pair.recipient->ReceiveFrame(DeadlineIn(1s)).Unwrap() == ping);
            REQUIRE(pair.recipient->SendFrame(pong, DeadlineIn(1s)).IsOk());
            REQUIRE(pair.initiator->ReceiveFrame(DeadlineIn(1s)).Unwrap() == pong);
        }
    }
    SECTION("Several frames queued before reading") {
        REQUIRE(pair.initiator->SendFrame(Pattern(3), DeadlineIn(1s)).IsOk());
        REQUIRE(pair.initiator->SendFrame(Pattern(40), DeadlineIn(1s)).IsOk());
        REQUIRE(pair.initiator->SendFrame(Pattern(0), DeadlineIn(1s)).IsOk());
        REQUIRE(pair.recipient->ReceiveFrame(DeadlineIn(1s)).Unwrap() == Pattern(3));
        REQUIRE(pair.recipient->ReceiveFrame(DeadlineIn(1s)).Unwrap() == Pattern(40));
        REQUIRE(pair.recipient->ReceiveFrame(DeadlineIn(1s)).Unwrap().empty());
    }
    SECTION("One mebibyte frame") {
        const auto payload = Pattern(1 << 20);
        REQUIRE(pair.recipient->SendFrame(payload, DeadlineIn(5s)).IsOk());
        REQUIRE(pair.initiator->ReceiveFrame(DeadlineIn(5s)).Unwrap() == payload);
    }
    SECTION("Wire size is header, header MAC, padded body and frame MAC") {
        REQUIRE(pair.initiator->SendFrame(Pattern(17), DeadlineIn(1s)).IsOk());
        REQUIRE(pair.initiator_channel->Written().size() ==
                kFrameHeaderBytes + kFrameMacBytes + 2 * kFrameBlockBytes + kFrameMacBytes);
    }
    SECTION("Plaintext does not appear on the wire") {
        const std::vector<uint8_t> payload(64, 0x00);
        REQUIRE(pair.initiator->SendFrame(payload, DeadlineIn(1s)).IsOk());
        const auto written = pair.initiator_channel->Written();
        const std::vector<uint8_t> body(written.begin() + 32, written.begin() + 96);
        REQUIRE(body != payload);
    }
}
TEST_CASE("FrameTransport - Concurrent send and receive", "[frame][protocol][concurrency]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto pair = MakeTransportPair();
    constexpr int kFrames = 50;
    std::atomic<int> send_failures{0};
    std::thread sender([&] {
        for (int i = 0; i < kFrames; ++i) {
            if (pair.initiator->SendFrame(Pattern(static_cast<size_t>(i) * 13), DeadlineIn(5s)).IsErr()) {
                send_failures.fetch_add(1);
            }
        }
    });
    int mismatches = 0;
    for (int i = 0; i < kFrames; ++i) {
        auto frame = pair.recipient->ReceiveFrame(DeadlineIn(5s));
        if (frame.IsErr() || frame.Unwrap() != Pattern(static_cast<size_t>(i) * 13)) {
            ++mismatches;
        }
    }
    sender.join();
    REQUIRE(send_failures.load() == 0);
    REQUIRE(mismatches == 0);
}
TEST_CASE("FrameTransport - Messages", "[frame][protocol]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto pair = MakeTransportPair();
    SECTION("Id and payload are split on receipt") {
        const std::vector<uint8_t> payload = {0xDE, 0xAD, 0xBE, 0xEF};
        REQUIRE(pair.initiator->SendMessage(0x10, payload, DeadlineIn(1s)).IsOk());
        auto message = pair.recipient->ReceiveMessage(DeadlineIn(1s)).Unwrap();
        REQUIRE(message.id == 0x10);
        REQUIRE(message.payload == payload);
    }
    SECTION("Message with an empty payload") {
        REQUIRE(pair.initiator->SendMessage(kDisconnectMessageId, {}, DeadlineIn(1s)).IsOk());
        auto message = pair.recipient->ReceiveMessage(DeadlineIn(1s)).Unwrap();
        REQUIRE(message.id == kDisconnectMessageId);
        REQUIRE(message.payload.empty());
    }
    SECTION("Empty frame is not a message") {
        REQUIRE(pair.initiator->SendFrame({}, DeadlineIn(1s)).IsOk());
        auto message = pair.recipient->ReceiveMessage(DeadlineIn(1s));
        REQUIRE(message.UnwrapErr().type == SessionFailureType::MalformedFrame);
        REQUIRE(pair.recipient->IsPoisoned());
    }
}
TEST_CASE("FrameTransport - Size limits", "[frame][protocol]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Oversized send fails without poisoning") {
        auto pair = MakeTransportPair(1024, 1024);
        auto result = pair.initiator->SendFrame(Pattern(1025), DeadlineIn(1s));
        REQUIRE(result.UnwrapErr().type == SessionFailureType::MalformedFrame);
        REQUIRE_FALSE(pair.initiator->IsPoisoned());
        REQUIRE(pair.initiator->SendFrame(Pattern(1024), DeadlineIn(1s)).IsOk());
        REQUIRE(pair.recipient->ReceiveFrame(DeadlineIn(1s)).Unwrap() == Pattern(1024));
    }
    SECTION("Frame above the receiver's limit poisons the receiver") {
        auto pair = MakeTransportPair(kMaxFrameSize, 512);
        REQUIRE(pair.initiator->SendFrame(Pattern(513), DeadlineIn(1s)).IsOk());
        auto result = pair.recipient->ReceiveFrame(DeadlineIn(1s));
        REQUIRE(result.UnwrapErr().type == SessionFailureType::MalformedFrame);
        REQUIRE(pair.recipient->IsPoisoned());
        auto after = pair.recipient->ReceiveFrame(DeadlineIn(1s));
        REQUIRE(after.UnwrapErr().type == SessionFailureType::InvalidState);
        REQUIRE(pair.recipient->SendFrame(Pattern(1), DeadlineIn(1s)).UnwrapErr().type ==
                SessionFailureType::InvalidState);
    }
    SECTION("Limits outside the 24-bit range are rejected") {
        auto keys = RunHandshake(MakeIdentity(), MakeIdentity());
        auto [a, b] = MemoryChannel::CreatePair();
        auto zero = FrameTransport::Create(a, std::move(keys.initiator), 0);
        REQUIRE(zero.UnwrapErr().type == SessionFailureType::InvalidConfig);
        auto huge = FrameTransport::Create(b, std::move(keys.recipient), kMaxFrameSize + 1);
        REQUIRE(huge.UnwrapErr().type == SessionFailureType::InvalidConfig);
    }
    SECTION("Missing channel is rejected") {
        auto keys = RunHandshake(MakeIdentity(), MakeIdentity());
        auto result = FrameTransport::Create(nullptr, std::move(keys.initiator));
        REQUIRE(result.UnwrapErr().type == SessionFailureType::InvalidState);
    }
}
TEST_CASE("FrameTransport - Close and channel failures", "[frame][protocol]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto pair = MakeTransportPair();
    SECTION("Calls after Close fail with InvalidState") {
        pair.initiator->Close();
        REQUIRE(pair.initiator->SendFrame(Pattern(4), DeadlineIn(1s)).UnwrapErr().type ==
                SessionFailureType::InvalidState);
        REQUIRE(pair.initiator->ReceiveFrame(DeadlineIn(1s)).UnwrapErr().type ==
                SessionFailureType::InvalidState);
        REQUIRE_FALSE(pair.initiator_channel->IsOpen());
    }
    SECTION("Peer closing is an I/O failure for the reader") {
        pair.initiator->Close();
        auto result = pair.recipient->ReceiveFrame(DeadlineIn(1s));
        REQUIRE(result.UnwrapErr().type == SessionFailureType::IoFailure);
        REQUIRE(pair.recipient->IsPoisoned());
    }
    SECTION("Nothing to read before the deadline") {
        auto result = pair.recipient->ReceiveFrame(DeadlineIn(30ms));
        REQUIRE(result.UnwrapErr().type == SessionFailureType::HandshakeTimeout);
    }
    SECTION("Close is idempotent") {
        pair.recipient->Close();
        pair.recipient->Close();
        REQUIRE_FALSE(pair.recipient->IsPoisoned());
    }
}

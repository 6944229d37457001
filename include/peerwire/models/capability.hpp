#pragma once
#include <compare>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
namespace peerwire::models {
/// A named, versioned sub-protocol. Ordered by name, then version.
struct Capability {
    std::string name;
    uint32_t version = 0;
    auto operator<=>(const Capability&) const = default;
};
/// Decoded base-protocol Hello.
struct HelloMessage {
    uint32_t protocol_version = 0;
    std::string client_id;
    std::vector<Capability> capabilities;
    uint16_t listen_port = 0;
    std::vector<uint8_t> node_id;
    bool operator==(const HelloMessage&) const = default;
};
/// devp2p disconnect reason codes.
enum class DisconnectReason : uint8_t {
    Requested = 0x00,
    TcpError = 0x01,
    BreachOfProtocol = 0x02,
    UselessPeer = 0x03,
    TooManyPeers = 0x04,
    AlreadyConnected = 0x05,
    IncompatibleVersion = 0x06,
    InvalidIdentity = 0x07,
    ClientQuitting = 0x08,
    UnexpectedIdentity = 0x09,
    ConnectedToSelf = 0x0a,
    Timeout = 0x0b,
    SubprotocolError = 0x10
};
[[nodiscard]] bool IsKnownDisconnectReason(uint32_t code) noexcept;
[[nodiscard]] std::string_view ToString(DisconnectReason reason) noexcept;
}

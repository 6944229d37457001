#include "peerwire/protocol/capability_negotiator.hpp"
#include "peerwire/core/constants.hpp"
#include "peerwire/utilities/proto_codec.hpp"
#include "protocol/p2p.pb.h"
#include <algorithm>
#include <format>
#include <limits>
#include <map>
#include <optional>

namespace peerwire::protocol {
    using models::Capability;
    using models::DisconnectReason;
    using models::HelloMessage;
    using utilities::ProtoCodec;

    namespace {
        using HelloResult = Result<HelloMessage, SessionFailure>;

        std::map<std::string, std::vector<uint32_t>> VersionsByName(
            std::span<const Capability> capabilities) {
            std::map<std::string, std::vector<uint32_t>> versions;
            for (const auto& capability : capabilities) {
                versions[capability.name].push_back(capability.version);
            }
            return versions;
        }
    }

    HelloMessage CapabilityNegotiator::BuildHello(
        const models::StaticIdentity& identity,
        const configuration::SessionConfig& config) {
        HelloMessage hello;
        hello.protocol_version = config.protocol_version;
        hello.client_id = config.client_id;
        hello.capabilities = config.capabilities;
        hello.listen_port = config.listen_port;
        hello.node_id = identity.PublicKey();
        return hello;
    }

    Result<std::vector<uint8_t>, SessionFailure> CapabilityNegotiator::EncodeHello(
        const HelloMessage& hello) {
        proto::protocol::Hello message;
        message.set_protocol_version(hello.protocol_version);
        message.set_client_id(hello.client_id);
        for (const auto& capability : hello.capabilities) {
            auto* entry = message.add_capabilities();
            entry->set_name(capability.name);
            entry->set_version(capability.version);
        }
        message.set_listen_port(hello.listen_port);
        message.set_node_id(hello.node_id.data(), hello.node_id.size());
        return ProtoCodec::SerializeDeterministic(message);
    }

    Result<HelloMessage, SessionFailure> CapabilityNegotiator::ParseHello(
        std::span<const uint8_t> payload,
        const uint32_t min_version) {
        auto parsed = ProtoCodec::Parse<proto::protocol::Hello>(
            payload, SessionFailure::MalformedHello("Hello does not parse"));
        if (parsed.IsErr()) {
            return HelloResult::Err(std::move(parsed).UnwrapErr());
        }
        const proto::protocol::Hello& message = parsed.Unwrap();
        if (message.client_id().empty()) {
            return HelloResult::Err(SessionFailure::MalformedHello("Hello carries an empty client id"));
        }
        if (message.node_id().size() != kNodeIdBytes) {
            return HelloResult::Err(SessionFailure::MalformedHello(
                std::format("Hello node id must be {} bytes, got {}", kNodeIdBytes, message.node_id().size())));
        }
        if (message.listen_port() > std::numeric_limits<uint16_t>::max()) {
            return HelloResult::Err(SessionFailure::MalformedHello(
                std::format("Hello listen port {} is out of range", message.listen_port())));
        }

        HelloMessage hello;
        hello.capabilities.reserve(static_cast<size_t>(message.capabilities_size()));
        for (const auto& entry : message.capabilities()) {
            if (entry.name().empty() || entry.name().size() > kMaxCapabilityNameLength) {
                return HelloResult::Err(SessionFailure::MalformedHello(
                    std::format("Capability name '{}' must be 1 to {} characters",
                                entry.name(), kMaxCapabilityNameLength)));
            }
            hello.capabilities.push_back(Capability{entry.name(), entry.version()});
        }
        if (message.protocol_version() < min_version) {
            return HelloResult::Err(SessionFailure::UnsupportedVersion(
                std::format("Peer speaks protocol version {}, minimum is {}",
                            message.protocol_version(), min_version)));
        }

        hello.protocol_version = message.protocol_version();
        hello.client_id = message.client_id();
        hello.listen_port = static_cast<uint16_t>(message.listen_port());
        const auto node_id = ProtoCodec::AsBytes(message.node_id());
        hello.node_id.assign(node_id.begin(), node_id.end());
        return HelloResult::Ok(std::move(hello));
    }

    Result<std::vector<Capability>, SessionFailure> CapabilityNegotiator::Negotiate(
        std::span<const Capability> local,
        std::span<const Capability> remote) {
        using NegotiateResult = Result<std::vector<Capability>, SessionFailure>;
        const auto remote_versions = VersionsByName(remote);

        // std::map iterates in name order, so the result comes out sorted.
        std::vector<Capability> shared;
        for (const auto& [name, versions] : VersionsByName(local)) {
            const auto match = remote_versions.find(name);
            if (match == remote_versions.end()) {
                continue;
            }
            std::optional<uint32_t> best;
            for (const uint32_t version : versions) {
                const bool in_both = std::find(match->second.begin(), match->second.end(), version) !=
                                     match->second.end();
                if (in_both && (!best || version > *best)) {
                    best = version;
                }
            }
            if (best) {
                shared.push_back(Capability{name, *best});
            }
        }
        if (shared.empty()) {
            return NegotiateResult::Err(SessionFailure::NoSharedCapabilities(
                std::format("No shared capability among {} local and {} remote entries",
                            local.size(), remote.size())));
        }
        return NegotiateResult::Ok(std::move(shared));
    }

    Result<std::vector<uint8_t>, SessionFailure> CapabilityNegotiator::EncodeDisconnect(
        const DisconnectReason reason) {
        proto::protocol::Disconnect message;
        message.set_reason(static_cast<uint32_t>(reason));
        return ProtoCodec::SerializeDeterministic(message);
    }

    Result<DisconnectReason, SessionFailure> CapabilityNegotiator::ParseDisconnect(
        std::span<const uint8_t> payload) {
        using ReasonResult = Result<DisconnectReason, SessionFailure>;
        auto parsed = ProtoCodec::Parse<proto::protocol::Disconnect>(
            payload, SessionFailure::MalformedFrame("Disconnect does not parse"));
        if (parsed.IsErr()) {
            return ReasonResult::Err(std::move(parsed).UnwrapErr());
        }
        const proto::protocol::Disconnect& message = parsed.Unwrap();
        if (!models::IsKnownDisconnectReason(message.reason())) {
            return ReasonResult::Err(SessionFailure::MalformedFrame(
                std::format("Unknown disconnect reason 0x{:02x}", message.reason())));
        }
        return ReasonResult::Ok(static_cast<DisconnectReason>(message.reason()));
    }
}

#include "peerwire/protocol/handshake.hpp"
#include "peerwire/core/constants.hpp"
#include "peerwire/crypto/ecies.hpp"
#include "peerwire/crypto/hash.hpp"
#include "peerwire/crypto/secp256k1.hpp"
#include "peerwire/crypto/sodium_interop.hpp"
#include "peerwire/models/key_materials/ephemeral_key_pair.hpp"
#include "peerwire/utilities/proto_codec.hpp"
#include "protocol/handshake.pb.h"
#include <algorithm>
#include <array>
#include <format>
#include <initializer_list>

namespace peerwire::protocol {
    using crypto::Ecies;
    using crypto::Hash;
    using crypto::RollingHash;
    using crypto::Secp256k1;
    using crypto::SecureMemoryHandle;
    using crypto::SodiumInterop;
    using utilities::ProtoCodec;

    namespace detail {
        struct HandshakeContext {
            std::shared_ptr<const models::StaticIdentity> identity;
            std::shared_ptr<spdlog::logger> logger;
            models::EphemeralKeyPair ephemeral;
            std::vector<uint8_t> remote_static;
            std::vector<uint8_t> remote_ephemeral;
            std::vector<uint8_t> initiator_nonce;
            std::vector<uint8_t> recipient_nonce;
            std::vector<uint8_t> auth_wire;
            std::vector<uint8_t> ack_wire;

            HandshakeContext(
                std::shared_ptr<const models::StaticIdentity> local_identity,
                std::shared_ptr<spdlog::logger> progress_logger,
                models::EphemeralKeyPair ephemeral_pair)
                : identity(std::move(local_identity))
                  , logger(std::move(progress_logger))
                  , ephemeral(std::move(ephemeral_pair)) {
            }

            HandshakeContext(const HandshakeContext&) = delete;
            HandshakeContext& operator=(const HandshakeContext&) = delete;

            ~HandshakeContext() {
                WipeSecrets();
            }

            void WipeSecrets() noexcept {
                ephemeral.Wipe();
                SodiumInterop::SecureZero(initiator_nonce);
                SodiumInterop::SecureZero(recipient_nonce);
                initiator_nonce.clear();
                recipient_nonce.clear();
                auth_wire.clear();
                ack_wire.clear();
            }
        };
    }

    struct HandshakeInitiator::Context : detail::HandshakeContext {
        using HandshakeContext::HandshakeContext;
        InitiatorState state = InitiatorState::Idle;

        SessionFailure Fail(SessionFailure failure) noexcept {
            state = InitiatorState::Failed;
            WipeSecrets();
            return failure;
        }
    };

    struct HandshakeRecipient::Context : detail::HandshakeContext {
        using HandshakeContext::HandshakeContext;
        RecipientState state = RecipientState::Idle;

        SessionFailure Fail(SessionFailure failure) noexcept {
            state = RecipientState::Failed;
            WipeSecrets();
            return failure;
        }
    };

    namespace {
        using BytesResult = Result<std::vector<uint8_t>, SessionFailure>;
        using UnitResult = Result<Unit, SessionFailure>;

        const std::vector<uint8_t> kNoNodeId{};

        class ScopedWipe {
        public:
            ScopedWipe(std::initializer_list<std::vector<uint8_t>*> targets)
                : targets_(targets) {
            }
            ScopedWipe(const ScopedWipe&) = delete;
            ScopedWipe& operator=(const ScopedWipe&) = delete;
            ~ScopedWipe() {
                for (auto* target : targets_) {
                    SodiumInterop::SecureZero(*target);
                }
            }
        private:
            std::vector<std::vector<uint8_t>*> targets_;
        };

        template<typename T>
        Result<T, SessionFailure> Flatten(Result<Result<T, SessionFailure>, SessionFailure> nested) {
            if (nested.IsErr()) {
                return Result<T, SessionFailure>::Err(std::move(nested).UnwrapErr());
            }
            return std::move(nested).Unwrap();
        }

        std::vector<uint8_t> Xor(std::span<const uint8_t> a, std::span<const uint8_t> b) {
            std::vector<uint8_t> out(a.size());
            for (size_t i = 0; i < a.size(); ++i) {
                out[i] = a[i] ^ b[i];
            }
            return out;
        }

        BytesResult RandomBytes(size_t size) {
            auto bytes = SodiumInterop::GetRandomBytes(size);
            if (bytes.IsErr()) {
                return BytesResult::Err(SessionFailure::FromSodiumFailure(bytes.UnwrapErr()));
            }
            return BytesResult::Ok(std::move(bytes).Unwrap());
        }

        BytesResult RandomPadding() {
            return RandomBytes(kMinHandshakePaddingBytes +
                               SodiumInterop::RandomUniform(static_cast<uint32_t>(kHandshakePaddingRangeBytes)));
        }

        std::array<uint8_t, kHandshakeSizePrefixBytes> EncodeSizePrefix(size_t size) {
            return {static_cast<uint8_t>((size >> 8) & 0xFF), static_cast<uint8_t>(size & 0xFF)};
        }

        Result<size_t, SessionFailure> DecodeSizePrefix(std::span<const uint8_t> prefix) {
            const size_t announced = (static_cast<size_t>(prefix[0]) << 8) | prefix[1];
            if (announced < kEciesOverheadBytes || announced > kMaxHandshakeMessageBytes) {
                return Result<size_t, SessionFailure>::Err(SessionFailure::MalformedHandshake(
                    std::format("Handshake message size {} outside [{}, {}]",
                        announced, kEciesOverheadBytes, kMaxHandshakeMessageBytes)));
            }
            return Result<size_t, SessionFailure>::Ok(announced);
        }

        /// size-prefix || ECIES(remote, body, size-prefix)
        BytesResult SealMessage(
            const google::protobuf::Message& body_message,
            std::span<const uint8_t> remote_static) {
            auto body = ProtoCodec::SerializeDeterministic(body_message);
            if (body.IsErr()) {
                return body;
            }
            const size_t sealed_size = body.Unwrap().size() + kEciesOverheadBytes;
            if (sealed_size > kMaxHandshakeMessageBytes) {
                return BytesResult::Err(SessionFailure::Encode(
                    std::format("Handshake message of {} bytes exceeds {}", sealed_size, kMaxHandshakeMessageBytes)));
            }
            const auto prefix = EncodeSizePrefix(sealed_size);
            auto sealed = Ecies::Encrypt(remote_static, body.Unwrap(), prefix);
            if (sealed.IsErr()) {
                return sealed;
            }
            std::vector<uint8_t> wire;
            wire.reserve(kHandshakeSizePrefixBytes + sealed_size);
            wire.insert(wire.end(), prefix.begin(), prefix.end());
            wire.insert(wire.end(), sealed.Unwrap().begin(), sealed.Unwrap().end());
            return BytesResult::Ok(std::move(wire));
        }

        BytesResult OpenMessage(
            const models::StaticIdentity& identity,
            std::span<const uint8_t> wire) {
            if (wire.size() < kHandshakeSizePrefixBytes) {
                return BytesResult::Err(SessionFailure::MalformedHandshake(
                    "Handshake message is missing its size prefix"));
            }
            const auto prefix = wire.first(kHandshakeSizePrefixBytes);
            auto announced = DecodeSizePrefix(prefix);
            if (announced.IsErr()) {
                return BytesResult::Err(std::move(announced).UnwrapErr());
            }
            const auto sealed = wire.subspan(kHandshakeSizePrefixBytes);
            if (sealed.size() != announced.Unwrap()) {
                return BytesResult::Err(SessionFailure::MalformedHandshake(
                    std::format("Handshake size prefix announces {} bytes, got {}",
                        announced.Unwrap(), sealed.size())));
            }
            return Flatten(identity.WithPrivateKey([&](std::span<const uint8_t> private_key) {
                return Ecies::Decrypt(private_key, sealed, prefix);
            }));
        }

        UnitResult CheckPeerPoint(std::span<const uint8_t> node_id, const char* field) {
            if (node_id.size() != kNodeIdBytes || Secp256k1::ValidatePublicKey(node_id).IsErr()) {
                return UnitResult::Err(SessionFailure::MalformedHandshake(
                    std::format("{} is not a valid secp256k1 public key", field)));
            }
            return UnitResult::Ok(unit);
        }

        /// ECDH(local static, remote static) XOR nonce: the value the
        /// initiator's ephemeral key signs.
        BytesResult SignedPayload(
            const models::StaticIdentity& identity,
            std::span<const uint8_t> remote_static,
            std::span<const uint8_t> initiator_nonce) {
            auto static_shared = Flatten(identity.WithPrivateKey([&](std::span<const uint8_t> private_key) {
                return Secp256k1::Ecdh(private_key, remote_static);
            }));
            if (static_shared.IsErr()) {
                return static_shared;
            }
            std::vector<uint8_t> shared = std::move(static_shared).Unwrap();
            std::vector<uint8_t> payload = Xor(shared, initiator_nonce);
            SodiumInterop::SecureZero(shared);
            return BytesResult::Ok(std::move(payload));
        }

        Result<FrameKeys, SessionFailure> DeriveKeys(
            detail::HandshakeContext& ctx,
            const bool is_initiator) {
            using KeysResult = Result<FrameKeys, SessionFailure>;

            std::vector<uint8_t> ephemeral_key;
            std::vector<uint8_t> shared_secret;
            std::vector<uint8_t> aes_secret;
            std::vector<uint8_t> mac_secret;
            std::vector<uint8_t> egress_seed;
            std::vector<uint8_t> ingress_seed;
            ScopedWipe wipe{&ephemeral_key, &shared_secret, &aes_secret, &mac_secret, &egress_seed, &ingress_seed};

            auto ecdh = Flatten(ctx.ephemeral.WithPrivateKey([&](std::span<const uint8_t> private_key) {
                return Secp256k1::Ecdh(private_key, ctx.remote_ephemeral);
            }));
            if (ecdh.IsErr()) {
                return KeysResult::Err(std::move(ecdh).UnwrapErr());
            }
            ephemeral_key = std::move(ecdh).Unwrap();

            auto nonce_hash = Hash::Sha3({ctx.recipient_nonce, ctx.initiator_nonce});
            if (nonce_hash.IsErr()) {
                return KeysResult::Err(std::move(nonce_hash).UnwrapErr());
            }
            auto shared = Hash::Sha3({ephemeral_key, nonce_hash.Unwrap()});
            if (shared.IsErr()) {
                return KeysResult::Err(std::move(shared).UnwrapErr());
            }
            shared_secret = std::move(shared).Unwrap();
            auto aes = Hash::Sha3({ephemeral_key, shared_secret});
            if (aes.IsErr()) {
                return KeysResult::Err(std::move(aes).UnwrapErr());
            }
            aes_secret = std::move(aes).Unwrap();
            auto mac = Hash::Sha3({ephemeral_key, aes_secret});
            if (mac.IsErr()) {
                return KeysResult::Err(std::move(mac).UnwrapErr());
            }
            mac_secret = std::move(mac).Unwrap();

            egress_seed = Xor(mac_secret, is_initiator ? ctx.recipient_nonce : ctx.initiator_nonce);
            ingress_seed = Xor(mac_secret, is_initiator ? ctx.initiator_nonce : ctx.recipient_nonce);
            const std::vector<uint8_t>& egress_message = is_initiator ? ctx.auth_wire : ctx.ack_wire;
            const std::vector<uint8_t>& ingress_message = is_initiator ? ctx.ack_wire : ctx.auth_wire;

            auto egress = RollingHash::Create();
            if (egress.IsErr()) {
                return KeysResult::Err(std::move(egress).UnwrapErr());
            }
            auto ingress = RollingHash::Create();
            if (ingress.IsErr()) {
                return KeysResult::Err(std::move(ingress).UnwrapErr());
            }
            for (auto* step : {&egress, &ingress}) {
                const bool is_egress = step == &egress;
                auto seeded = step->Unwrap().Update(is_egress ? egress_seed : ingress_seed);
                if (seeded.IsErr()) {
                    return KeysResult::Err(std::move(seeded).UnwrapErr());
                }
                auto absorbed = step->Unwrap().Update(is_egress ? egress_message : ingress_message);
                if (absorbed.IsErr()) {
                    return KeysResult::Err(std::move(absorbed).UnwrapErr());
                }
            }

            if (ctx.logger) {
                ctx.logger->debug("{} derived frame keys", is_initiator ? "Initiator" : "Recipient");
            }

            auto aes_handle = SecureMemoryHandle::FromBytes(aes_secret);
            if (aes_handle.IsErr()) {
                return KeysResult::Err(SessionFailure::FromSodiumFailure(aes_handle.UnwrapErr()));
            }
            auto mac_handle = SecureMemoryHandle::FromBytes(mac_secret);
            if (mac_handle.IsErr()) {
                return KeysResult::Err(SessionFailure::FromSodiumFailure(mac_handle.UnwrapErr()));
            }
            return KeysResult::Ok(FrameKeys{
                std::move(aes_handle).Unwrap(),
                std::move(mac_handle).Unwrap(),
                std::move(egress).Unwrap(),
                std::move(ingress).Unwrap()
            });
        }
    }

    HandshakeInitiator::HandshakeInitiator() = default;
    HandshakeInitiator::HandshakeInitiator(HandshakeInitiator&&) noexcept = default;
    HandshakeInitiator& HandshakeInitiator::operator=(HandshakeInitiator&&) noexcept = default;
    HandshakeInitiator::~HandshakeInitiator() = default;

    Result<HandshakeInitiator, SessionFailure> HandshakeInitiator::Create(
        std::shared_ptr<const models::StaticIdentity> identity,
        std::span<const uint8_t> remote_node_id,
        std::shared_ptr<spdlog::logger> logger) {
        using CreateResult = Result<HandshakeInitiator, SessionFailure>;
        if (!identity) {
            return CreateResult::Err(SessionFailure::InvalidConfig("Local identity is required"));
        }
        if (remote_node_id.size() != kNodeIdBytes || Secp256k1::ValidatePublicKey(remote_node_id).IsErr()) {
            return CreateResult::Err(SessionFailure::InvalidConfig(
                "Remote node id is not a valid secp256k1 public key"));
        }
        auto ephemeral = models::EphemeralKeyPair::Generate();
        if (ephemeral.IsErr()) {
            return CreateResult::Err(std::move(ephemeral).UnwrapErr());
        }
        HandshakeInitiator initiator;
        initiator.context_ = std::make_unique<Context>(
            std::move(identity), std::move(logger), std::move(ephemeral).Unwrap());
        initiator.context_->remote_static.assign(remote_node_id.begin(), remote_node_id.end());
        return CreateResult::Ok(std::move(initiator));
    }

    Result<std::vector<uint8_t>, SessionFailure> HandshakeInitiator::BuildAuth() {
        if (!context_) {
            return BytesResult::Err(SessionFailure::InvalidState("Handshake engine has been moved from"));
        }
        Context& ctx = *context_;
        if (ctx.state != InitiatorState::Idle) {
            return BytesResult::Err(ctx.Fail(SessionFailure::InvalidState("BuildAuth requires the Idle state")));
        }

        auto nonce = RandomBytes(kNonceBytes);
        if (nonce.IsErr()) {
            return BytesResult::Err(ctx.Fail(std::move(nonce).UnwrapErr()));
        }
        ctx.initiator_nonce = std::move(nonce).Unwrap();

        auto payload = SignedPayload(*ctx.identity, ctx.remote_static, ctx.initiator_nonce);
        if (payload.IsErr()) {
            return BytesResult::Err(ctx.Fail(std::move(payload).UnwrapErr()));
        }
        std::vector<uint8_t> signed_payload = std::move(payload).Unwrap();
        ScopedWipe wipe{&signed_payload};
        auto signature = Flatten(ctx.ephemeral.WithPrivateKey([&](std::span<const uint8_t> private_key) {
            return Secp256k1::Sign(private_key, signed_payload);
        }));
        if (signature.IsErr()) {
            return BytesResult::Err(ctx.Fail(std::move(signature).UnwrapErr()));
        }
        auto padding = RandomPadding();
        if (padding.IsErr()) {
            return BytesResult::Err(ctx.Fail(std::move(padding).UnwrapErr()));
        }

        proto::protocol::AuthBody body;
        body.set_signature(signature.Unwrap().data(), signature.Unwrap().size());
        body.set_initiator_static_public(ctx.identity->PublicKey().data(), ctx.identity->PublicKey().size());
        body.set_initiator_ephemeral_public(ctx.ephemeral.PublicKey().data(), ctx.ephemeral.PublicKey().size());
        body.set_initiator_nonce(ctx.initiator_nonce.data(), ctx.initiator_nonce.size());
        body.set_version(kHandshakeVersion);
        body.set_padding(padding.Unwrap().data(), padding.Unwrap().size());

        auto wire = SealMessage(body, ctx.remote_static);
        if (wire.IsErr()) {
            return BytesResult::Err(ctx.Fail(std::move(wire).UnwrapErr()));
        }
        ctx.auth_wire = wire.Unwrap();
        ctx.state = InitiatorState::AuthSent;
        return wire;
    }

    Result<Unit, SessionFailure> HandshakeInitiator::ReadAck(std::span<const uint8_t> ack_wire) {
        if (!context_) {
            return UnitResult::Err(SessionFailure::InvalidState("Handshake engine has been moved from"));
        }
        Context& ctx = *context_;
        if (ctx.state != InitiatorState::AuthSent) {
            return UnitResult::Err(ctx.Fail(SessionFailure::InvalidState("ReadAck requires the AuthSent state")));
        }

        auto plaintext = OpenMessage(*ctx.identity, ack_wire);
        if (plaintext.IsErr()) {
            return UnitResult::Err(ctx.Fail(std::move(plaintext).UnwrapErr()));
        }
        auto parsed = ProtoCodec::Parse<proto::protocol::AckBody>(
            plaintext.Unwrap(), SessionFailure::MalformedHandshake("Failed to parse ack body"));
        if (parsed.IsErr()) {
            return UnitResult::Err(ctx.Fail(std::move(parsed).UnwrapErr()));
        }
        // version is not compared: newer peers stay accepted, as in RLPx.
        const proto::protocol::AckBody& ack = parsed.Unwrap();
        if (ack.recipient_nonce().size() != kNonceBytes) {
            return UnitResult::Err(ctx.Fail(SessionFailure::MalformedHandshake(
                std::format("Ack nonce must be {} bytes, got {}", kNonceBytes, ack.recipient_nonce().size()))));
        }
        const auto remote_ephemeral = ProtoCodec::AsBytes(ack.recipient_ephemeral_public());
        if (auto check = CheckPeerPoint(remote_ephemeral, "Ack ephemeral key"); check.IsErr()) {
            return UnitResult::Err(ctx.Fail(std::move(check).UnwrapErr()));
        }

        ctx.remote_ephemeral.assign(remote_ephemeral.begin(), remote_ephemeral.end());
        const auto nonce = ProtoCodec::AsBytes(ack.recipient_nonce());
        ctx.recipient_nonce.assign(nonce.begin(), nonce.end());
        ctx.ack_wire.assign(ack_wire.begin(), ack_wire.end());
        ctx.state = InitiatorState::AckReceived;
        if (ctx.logger) {
            ctx.logger->debug("Initiator read ack ({} bytes)", ack_wire.size());
        }
        return UnitResult::Ok(unit);
    }

    Result<FrameKeys, SessionFailure> HandshakeInitiator::DeriveFrameKeys() {
        if (!context_) {
            return Result<FrameKeys, SessionFailure>::Err(
                SessionFailure::InvalidState("Handshake engine has been moved from"));
        }
        Context& ctx = *context_;
        if (ctx.state != InitiatorState::AckReceived) {
            return Result<FrameKeys, SessionFailure>::Err(
                ctx.Fail(SessionFailure::InvalidState("DeriveFrameKeys requires the AckReceived state")));
        }
        auto keys = DeriveKeys(ctx, true);
        if (keys.IsErr()) {
            return Result<FrameKeys, SessionFailure>::Err(ctx.Fail(std::move(keys).UnwrapErr()));
        }
        ctx.WipeSecrets();
        ctx.state = InitiatorState::Established;
        return keys;
    }

    InitiatorState HandshakeInitiator::GetState() const noexcept {
        return context_ ? context_->state : InitiatorState::Failed;
    }

    const std::vector<uint8_t>& HandshakeInitiator::RemoteNodeId() const noexcept {
        return context_ ? context_->remote_static : kNoNodeId;
    }

    HandshakeRecipient::HandshakeRecipient() = default;
    HandshakeRecipient::HandshakeRecipient(HandshakeRecipient&&) noexcept = default;
    HandshakeRecipient& HandshakeRecipient::operator=(HandshakeRecipient&&) noexcept = default;
    HandshakeRecipient::~HandshakeRecipient() = default;

    Result<HandshakeRecipient, SessionFailure> HandshakeRecipient::Create(
        std::shared_ptr<const models::StaticIdentity> identity,
        std::shared_ptr<spdlog::logger> logger) {
        using CreateResult = Result<HandshakeRecipient, SessionFailure>;
        if (!identity) {
            return CreateResult::Err(SessionFailure::InvalidConfig("Local identity is required"));
        }
        auto ephemeral = models::EphemeralKeyPair::Generate();
        if (ephemeral.IsErr()) {
            return CreateResult::Err(std::move(ephemeral).UnwrapErr());
        }
        HandshakeRecipient recipient;
        recipient.context_ = std::make_unique<Context>(
            std::move(identity), std::move(logger), std::move(ephemeral).Unwrap());
        return CreateResult::Ok(std::move(recipient));
    }

    Result<Unit, SessionFailure> HandshakeRecipient::ReadAuth(std::span<const uint8_t> auth_wire) {
        if (!context_) {
            return UnitResult::Err(SessionFailure::InvalidState("Handshake engine has been moved from"));
        }
        Context& ctx = *context_;
        if (ctx.state != RecipientState::Idle) {
            return UnitResult::Err(ctx.Fail(SessionFailure::InvalidState("ReadAuth requires the Idle state")));
        }

        auto plaintext = OpenMessage(*ctx.identity, auth_wire);
        if (plaintext.IsErr()) {
            return UnitResult::Err(ctx.Fail(std::move(plaintext).UnwrapErr()));
        }
        auto parsed = ProtoCodec::Parse<proto::protocol::AuthBody>(
            plaintext.Unwrap(), SessionFailure::MalformedHandshake("Failed to parse auth body"));
        if (parsed.IsErr()) {
            return UnitResult::Err(ctx.Fail(std::move(parsed).UnwrapErr()));
        }
        // version is accepted as sent for forward compatibility, as in RLPx.
        const proto::protocol::AuthBody& auth = parsed.Unwrap();
        if (auth.signature().size() != kSignatureBytes || auth.initiator_nonce().size() != kNonceBytes) {
            return UnitResult::Err(ctx.Fail(SessionFailure::MalformedHandshake(
                "Auth signature or nonce has the wrong size")));
        }
        const auto remote_static = ProtoCodec::AsBytes(auth.initiator_static_public());
        const auto remote_ephemeral = ProtoCodec::AsBytes(auth.initiator_ephemeral_public());
        if (auto check = CheckPeerPoint(remote_static, "Auth static key"); check.IsErr()) {
            return UnitResult::Err(ctx.Fail(std::move(check).UnwrapErr()));
        }
        if (auto check = CheckPeerPoint(remote_ephemeral, "Auth ephemeral key"); check.IsErr()) {
            return UnitResult::Err(ctx.Fail(std::move(check).UnwrapErr()));
        }

        const auto nonce = ProtoCodec::AsBytes(auth.initiator_nonce());
        auto payload = SignedPayload(*ctx.identity, remote_static, nonce);
        if (payload.IsErr()) {
            return UnitResult::Err(ctx.Fail(std::move(payload).UnwrapErr()));
        }
        std::vector<uint8_t> signed_payload = std::move(payload).Unwrap();
        ScopedWipe wipe{&signed_payload};
        auto verified = Secp256k1::Verify(remote_ephemeral, signed_payload, ProtoCodec::AsBytes(auth.signature()));
        if (verified.IsErr()) {
            return UnitResult::Err(ctx.Fail(std::move(verified).UnwrapErr()));
        }
        if (!verified.Unwrap()) {
            return UnitResult::Err(ctx.Fail(SessionFailure::HandshakeFailure(
                "Auth signature does not match the initiator's keys")));
        }

        ctx.remote_static.assign(remote_static.begin(), remote_static.end());
        ctx.remote_ephemeral.assign(remote_ephemeral.begin(), remote_ephemeral.end());
        ctx.initiator_nonce.assign(nonce.begin(), nonce.end());
        ctx.auth_wire.assign(auth_wire.begin(), auth_wire.end());
        ctx.state = RecipientState::AuthReceived;
        return UnitResult::Ok(unit);
    }

    Result<std::vector<uint8_t>, SessionFailure> HandshakeRecipient::BuildAck() {
        if (!context_) {
            return BytesResult::Err(SessionFailure::InvalidState("Handshake engine has been moved from"));
        }
        Context& ctx = *context_;
        if (ctx.state != RecipientState::AuthReceived) {
            return BytesResult::Err(ctx.Fail(SessionFailure::InvalidState("BuildAck requires the AuthReceived state")));
        }

        auto nonce = RandomBytes(kNonceBytes);
        if (nonce.IsErr()) {
            return BytesResult::Err(ctx.Fail(std::move(nonce).UnwrapErr()));
        }
        ctx.recipient_nonce = std::move(nonce).Unwrap();
        auto padding = RandomPadding();
        if (padding.IsErr()) {
            return BytesResult::Err(ctx.Fail(std::move(padding).UnwrapErr()));
        }

        proto::protocol::AckBody body;
        body.set_recipient_ephemeral_public(ctx.ephemeral.PublicKey().data(), ctx.ephemeral.PublicKey().size());
        body.set_recipient_nonce(ctx.recipient_nonce.data(), ctx.recipient_nonce.size());
        body.set_version(kHandshakeVersion);
        body.set_padding(padding.Unwrap().data(), padding.Unwrap().size());

        auto wire = SealMessage(body, ctx.remote_static);
        if (wire.IsErr()) {
            return BytesResult::Err(ctx.Fail(std::move(wire).UnwrapErr()));
        }
        ctx.ack_wire = wire.Unwrap();
        ctx.state = RecipientState::AckSent;
        if (ctx.logger) {
            ctx.logger->debug("Recipient built ack ({} bytes)", ctx.ack_wire.size());
        }
        return wire;
    }

    Result<FrameKeys, SessionFailure> HandshakeRecipient::DeriveFrameKeys() {
        if (!context_) {
            return Result<FrameKeys, SessionFailure>::Err(
                SessionFailure::InvalidState("Handshake engine has been moved from"));
        }
        Context& ctx = *context_;
        if (ctx.state != RecipientState::AckSent) {
            return Result<FrameKeys, SessionFailure>::Err(
                ctx.Fail(SessionFailure::InvalidState("DeriveFrameKeys requires the AckSent state")));
        }
        auto keys = DeriveKeys(ctx, false);
        if (keys.IsErr()) {
            return Result<FrameKeys, SessionFailure>::Err(ctx.Fail(std::move(keys).UnwrapErr()));
        }
        ctx.WipeSecrets();
        ctx.state = RecipientState::Established;
        return keys;
    }

    RecipientState HandshakeRecipient::GetState() const noexcept {
        return context_ ? context_->state : RecipientState::Failed;
    }

    const std::vector<uint8_t>& HandshakeRecipient::RemoteNodeId() const noexcept {
        return context_ ? context_->remote_static : kNoNodeId;
    }

    namespace {
        using StepResult = Result<HandshakeStep, SessionFailure>;

        StepResult AdvanceRole(HandshakeInitiator& initiator, std::span<const uint8_t> incoming) {
            switch (initiator.GetState()) {
                case InitiatorState::Idle: {
                    if (!incoming.empty()) {
                        return StepResult::Err(SessionFailure::InvalidState(
                            "Initiator expects no input before sending auth"));
                    }
                    auto auth = initiator.BuildAuth();
                    if (auth.IsErr()) {
                        return StepResult::Err(std::move(auth).UnwrapErr());
                    }
                    HandshakeStep step;
                    step.outgoing = std::move(auth).Unwrap();
                    return StepResult::Ok(std::move(step));
                }
                case InitiatorState::AuthSent: {
                    PEERWIRE_TRY(StepResult, initiator.ReadAck(incoming));
                    auto keys = initiator.DeriveFrameKeys();
                    if (keys.IsErr()) {
                        return StepResult::Err(std::move(keys).UnwrapErr());
                    }
                    HandshakeStep step;
                    step.established = true;
                    step.frame_keys.emplace(std::move(keys).Unwrap());
                    return StepResult::Ok(std::move(step));
                }
                default:
                    return StepResult::Err(SessionFailure::InvalidState(
                        "Initiator has no further handshake step"));
            }
        }

        StepResult AdvanceRole(HandshakeRecipient& recipient, std::span<const uint8_t> incoming) {
            if (recipient.GetState() != RecipientState::Idle) {
                return StepResult::Err(SessionFailure::InvalidState(
                    "Recipient has no further handshake step"));
            }
            PEERWIRE_TRY(StepResult, recipient.ReadAuth(incoming));
            auto ack = recipient.BuildAck();
            if (ack.IsErr()) {
                return StepResult::Err(std::move(ack).UnwrapErr());
            }
            auto keys = recipient.DeriveFrameKeys();
            if (keys.IsErr()) {
                return StepResult::Err(std::move(keys).UnwrapErr());
            }
            HandshakeStep step;
            step.outgoing = std::move(ack).Unwrap();
            step.established = true;
            step.frame_keys.emplace(std::move(keys).Unwrap());
            return StepResult::Ok(std::move(step));
        }
    }

    Result<HandshakeStep, SessionFailure> Advance(
        HandshakeEngine& engine,
        std::span<const uint8_t> incoming) {
        return std::visit([incoming](auto& role) { return AdvanceRole(role, incoming); }, engine);
    }

    bool IsEstablished(const HandshakeEngine& engine) noexcept {
        if (const auto* initiator = std::get_if<HandshakeInitiator>(&engine)) {
            return initiator->GetState() == InitiatorState::Established;
        }
        return std::get<HandshakeRecipient>(engine).GetState() == RecipientState::Established;
    }

    const std::vector<uint8_t>& RemoteNodeId(const HandshakeEngine& engine) noexcept {
        return std::visit([](const auto& role) -> const std::vector<uint8_t>& {
            return role.RemoteNodeId();
        }, engine);
    }

    Result<std::vector<uint8_t>, SessionFailure> ReadHandshakeMessage(
        IByteChannel& channel,
        Deadline deadline) {
        std::array<uint8_t, kHandshakeSizePrefixBytes> prefix{};
        PEERWIRE_TRY(BytesResult, channel.ReadExact(prefix, deadline));
        auto announced = DecodeSizePrefix(prefix);
        if (announced.IsErr()) {
            return BytesResult::Err(std::move(announced).UnwrapErr());
        }
        std::vector<uint8_t> wire(kHandshakeSizePrefixBytes + announced.Unwrap());
        std::copy(prefix.begin(), prefix.end(), wire.begin());
        PEERWIRE_TRY(BytesResult, channel.ReadExact(std::span(wire).subspan(kHandshakeSizePrefixBytes), deadline));
        return BytesResult::Ok(std::move(wire));
    }
}

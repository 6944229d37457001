#include "peerwire/crypto/ecies.hpp"
#include "peerwire/crypto/aes_ctr.hpp"
#include "peerwire/crypto/concat_kdf.hpp"
#include "peerwire/crypto/hash.hpp"
#include "peerwire/crypto/secp256k1.hpp"
#include "peerwire/crypto/sodium_interop.hpp"
#include "peerwire/core/constants.hpp"

#include <format>

namespace peerwire::crypto {

namespace {
    using BytesResult = Result<std::vector<uint8_t>, SessionFailure>;

    struct EciesKeys {
        std::vector<uint8_t> cipher_key;
        std::vector<uint8_t> mac_key;

        EciesKeys() = default;
        EciesKeys(EciesKeys&&) noexcept = default;
        EciesKeys& operator=(EciesKeys&&) noexcept = default;
        ~EciesKeys() {
            SodiumInterop::SecureZero(cipher_key);
            SodiumInterop::SecureZero(mac_key);
        }
    };

    Result<EciesKeys, SessionFailure> DeriveKeys(
        std::span<const uint8_t> private_key,
        std::span<const uint8_t> remote_node_id) {
        auto z = Secp256k1::Ecdh(private_key, remote_node_id);
        if (z.IsErr()) {
            return Result<EciesKeys, SessionFailure>::Err(std::move(z).UnwrapErr());
        }
        std::vector<uint8_t> shared = std::move(z).Unwrap();
        auto k = ConcatKdf::DeriveKeyBytes(shared, kEciesCipherKeyBytes * 2);
        SodiumInterop::SecureZero(shared);
        if (k.IsErr()) {
            return Result<EciesKeys, SessionFailure>::Err(std::move(k).UnwrapErr());
        }
        std::vector<uint8_t> key_material = std::move(k).Unwrap();
        const std::span<const uint8_t> material(key_material);

        auto mac_key = Hash::Sha256(material.subspan(kEciesCipherKeyBytes));
        EciesKeys keys;
        keys.cipher_key.assign(material.begin(), material.begin() + kEciesCipherKeyBytes);
        SodiumInterop::SecureZero(key_material);
        if (mac_key.IsErr()) {
            return Result<EciesKeys, SessionFailure>::Err(std::move(mac_key).UnwrapErr());
        }
        keys.mac_key = std::move(mac_key).Unwrap();
        return Result<EciesKeys, SessionFailure>::Ok(std::move(keys));
    }
}

Result<std::vector<uint8_t>, SessionFailure> Ecies::Encrypt(
    std::span<const uint8_t> recipient_node_id,
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> shared_mac_data) {

    auto ephemeral = Secp256k1::GenerateKeyPair();
    if (ephemeral.IsErr()) {
        return BytesResult::Err(std::move(ephemeral).UnwrapErr());
    }
    auto [ephemeral_private, ephemeral_public] = std::move(ephemeral).Unwrap();

    auto derived = ephemeral_private.WithReadAccess([&](std::span<const uint8_t> scalar) {
        return DeriveKeys(scalar, recipient_node_id);
    });
    if (derived.IsErr()) {
        return BytesResult::Err(SessionFailure::FromSodiumFailure(derived.UnwrapErr()));
    }
    auto keys_result = std::move(derived).Unwrap();
    if (keys_result.IsErr()) {
        return BytesResult::Err(std::move(keys_result).UnwrapErr());
    }
    const EciesKeys keys = std::move(keys_result).Unwrap();

    auto iv = SodiumInterop::GetRandomBytes(kEciesIvBytes);
    if (iv.IsErr()) {
        return BytesResult::Err(SessionFailure::FromSodiumFailure(iv.UnwrapErr()));
    }
    auto ciphertext = AesCtr::Apply(keys.cipher_key, iv.Unwrap(), plaintext);
    if (ciphertext.IsErr()) {
        return BytesResult::Err(std::move(ciphertext).UnwrapErr());
    }
    auto tag = Hash::HmacSha256(keys.mac_key, {iv.Unwrap(), ciphertext.Unwrap(), shared_mac_data});
    if (tag.IsErr()) {
        return BytesResult::Err(std::move(tag).UnwrapErr());
    }

    std::vector<uint8_t> output;
    output.reserve(kEciesOverheadBytes + plaintext.size());
    const std::vector<uint8_t> r = Secp256k1::ToUncompressed(ephemeral_public);
    output.insert(output.end(), r.begin(), r.end());
    output.insert(output.end(), iv.Unwrap().begin(), iv.Unwrap().end());
    output.insert(output.end(), ciphertext.Unwrap().begin(), ciphertext.Unwrap().end());
    output.insert(output.end(), tag.Unwrap().begin(), tag.Unwrap().end());
    return BytesResult::Ok(std::move(output));
}

Result<std::vector<uint8_t>, SessionFailure> Ecies::Decrypt(
    std::span<const uint8_t> private_key,
    std::span<const uint8_t> ciphertext,
    std::span<const uint8_t> shared_mac_data) {

    if (ciphertext.size() < kEciesOverheadBytes) {
        return BytesResult::Err(SessionFailure::MalformedHandshake(
            std::format("ECIES message of {} bytes is shorter than the {} byte overhead",
                ciphertext.size(), kEciesOverheadBytes)));
    }
    if (ciphertext[0] != kUncompressedPointTag) {
        return BytesResult::Err(SessionFailure::MalformedHandshake(
            "ECIES ephemeral key is not an uncompressed point"));
    }
    const auto remote_ephemeral = ciphertext.subspan(1, kNodeIdBytes);
    if (Secp256k1::ValidatePublicKey(remote_ephemeral).IsErr()) {
        return BytesResult::Err(SessionFailure::MalformedHandshake(
            "ECIES ephemeral key is not on secp256k1"));
    }
    const auto iv = ciphertext.subspan(kUncompressedPublicKeyBytes, kEciesIvBytes);
    const size_t body_size = ciphertext.size() - kEciesOverheadBytes;
    const auto body = ciphertext.subspan(kUncompressedPublicKeyBytes + kEciesIvBytes, body_size);
    const auto tag = ciphertext.subspan(ciphertext.size() - kEciesMacBytes);

    auto keys_result = DeriveKeys(private_key, remote_ephemeral);
    if (keys_result.IsErr()) {
        return BytesResult::Err(std::move(keys_result).UnwrapErr());
    }
    const EciesKeys keys = std::move(keys_result).Unwrap();

    auto expected = Hash::HmacSha256(keys.mac_key, {iv, body, shared_mac_data});
    if (expected.IsErr()) {
        return BytesResult::Err(std::move(expected).UnwrapErr());
    }
    if (!SodiumInterop::ConstantTimeEquals(expected.Unwrap(), tag)) {
        return BytesResult::Err(SessionFailure::HandshakeFailure(
            "ECIES authentication tag mismatch"));
    }
    return AesCtr::Apply(keys.cipher_key, iv, body);
}

}  // namespace peerwire::crypto

#include "peerwire/models/key_materials/static_identity.hpp"
#include "peerwire/crypto/secp256k1.hpp"
#include "peerwire/core/constants.hpp"
#include <format>

namespace peerwire::models {
    StaticIdentity::StaticIdentity(
        crypto::SecureMemoryHandle private_key,
        std::vector<uint8_t> public_key)
        : private_key_(std::move(private_key))
          , public_key_(std::move(public_key)) {
    }

    Result<StaticIdentity, SessionFailure> StaticIdentity::Generate() {
        auto pair = crypto::Secp256k1::GenerateKeyPair();
        if (pair.IsErr()) {
            return Result<StaticIdentity, SessionFailure>::Err(std::move(pair).UnwrapErr());
        }
        auto [private_key, public_key] = std::move(pair).Unwrap();
        return Result<StaticIdentity, SessionFailure>::Ok(
            StaticIdentity(std::move(private_key), std::move(public_key)));
    }

    Result<StaticIdentity, SessionFailure> StaticIdentity::FromPrivateKey(
        std::span<const uint8_t> private_key) {
        if (private_key.size() != kPrivateKeyBytes) {
            return Result<StaticIdentity, SessionFailure>::Err(
                SessionFailure::CryptoFailure(
                    std::format("Static private key must be {} bytes, got {}",
                        kPrivateKeyBytes, private_key.size())));
        }
        auto public_key = crypto::Secp256k1::DerivePublicKey(private_key);
        if (public_key.IsErr()) {
            return Result<StaticIdentity, SessionFailure>::Err(std::move(public_key).UnwrapErr());
        }
        auto handle = crypto::SecureMemoryHandle::FromBytes(private_key);
        if (handle.IsErr()) {
            return Result<StaticIdentity, SessionFailure>::Err(
                SessionFailure::FromSodiumFailure(handle.UnwrapErr()));
        }
        return Result<StaticIdentity, SessionFailure>::Ok(
            StaticIdentity(std::move(handle).Unwrap(), std::move(public_key).Unwrap()));
    }
}

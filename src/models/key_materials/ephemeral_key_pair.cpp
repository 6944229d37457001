#include "peerwire/models/key_materials/ephemeral_key_pair.hpp"
#include "peerwire/crypto/secp256k1.hpp"

namespace peerwire::models {
    EphemeralKeyPair::EphemeralKeyPair(
        crypto::SecureMemoryHandle private_key,
        std::vector<uint8_t> public_key)
        : private_key_(std::move(private_key))
          , public_key_(std::move(public_key)) {
    }

    Result<EphemeralKeyPair, SessionFailure> EphemeralKeyPair::Generate() {
        auto pair = crypto::Secp256k1::GenerateKeyPair();
        if (pair.IsErr()) {
            return Result<EphemeralKeyPair, SessionFailure>::Err(std::move(pair).UnwrapErr());
        }
        auto [private_key, public_key] = std::move(pair).Unwrap();
        return Result<EphemeralKeyPair, SessionFailure>::Ok(
            EphemeralKeyPair(std::move(private_key), std::move(public_key)));
    }
}

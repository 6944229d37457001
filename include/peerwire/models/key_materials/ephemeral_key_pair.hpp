#pragma once
#include "peerwire/core/result.hpp"
#include "peerwire/core/failures.hpp"
#include "peerwire/crypto/secure_memory_handle.hpp"
#include <cstdint>
#include <span>
#include <type_traits>
#include <vector>
namespace peerwire::models {
/**
 * Per-handshake secp256k1 key pair. Owned by exactly one handshake engine
 * and wiped once frame keys are derived; a wiped pair rejects every
 * further private-key access.
 */
class EphemeralKeyPair {
public:
    [[nodiscard]] static Result<EphemeralKeyPair, SessionFailure> Generate();
    EphemeralKeyPair(EphemeralKeyPair&&) noexcept = default;
    EphemeralKeyPair& operator=(EphemeralKeyPair&&) noexcept = default;
    EphemeralKeyPair(const EphemeralKeyPair&) = delete;
    EphemeralKeyPair& operator=(const EphemeralKeyPair&) = delete;
    [[nodiscard]] const std::vector<uint8_t>& PublicKey() const noexcept {
        return public_key_;
    }
    template<typename F>
    auto WithPrivateKey(F&& func) const
        -> Result<std::invoke_result_t<F, std::span<const uint8_t>>, SessionFailure> {
        using T = std::invoke_result_t<F, std::span<const uint8_t>>;
        if (private_key_.IsInvalid()) {
            return Result<T, SessionFailure>::Err(
                SessionFailure::InvalidState("Ephemeral private key has been wiped"));
        }
        auto result = private_key_.WithReadAccess(std::forward<F>(func));
        if (result.IsErr()) {
            return Result<T, SessionFailure>::Err(
                SessionFailure::FromSodiumFailure(result.UnwrapErr()));
        }
        return Result<T, SessionFailure>::Ok(std::move(result).Unwrap());
    }
    void Wipe() noexcept {
        private_key_.Reset();
    }
    [[nodiscard]] bool IsWiped() const noexcept {
        return private_key_.IsInvalid();
    }
private:
    EphemeralKeyPair(
        crypto::SecureMemoryHandle private_key,
        std::vector<uint8_t> public_key);
    crypto::SecureMemoryHandle private_key_;
    std::vector<uint8_t> public_key_;
};
}

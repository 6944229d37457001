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
 * Long-lived secp256k1 key pair identifying this node.
 *
 * The private scalar lives in guarded memory and is only reachable through
 * WithPrivateKey for the duration of a single derivation.
 */
class StaticIdentity {
public:
    [[nodiscard]] static Result<StaticIdentity, SessionFailure> Generate();
    [[nodiscard]] static Result<StaticIdentity, SessionFailure> FromPrivateKey(
        std::span<const uint8_t> private_key);
    StaticIdentity(StaticIdentity&&) noexcept = default;
    StaticIdentity& operator=(StaticIdentity&&) noexcept = default;
    StaticIdentity(const StaticIdentity&) = delete;
    StaticIdentity& operator=(const StaticIdentity&) = delete;
    /// 64-byte node id.
    [[nodiscard]] const std::vector<uint8_t>& PublicKey() const noexcept {
        return public_key_;
    }
    template<typename F>
    auto WithPrivateKey(F&& func) const
        -> Result<std::invoke_result_t<F, std::span<const uint8_t>>, SessionFailure> {
        using T = std::invoke_result_t<F, std::span<const uint8_t>>;
        auto result = private_key_.WithReadAccess(std::forward<F>(func));
        if (result.IsErr()) {
            return Result<T, SessionFailure>::Err(
                SessionFailure::FromSodiumFailure(result.UnwrapErr()));
        }
        return Result<T, SessionFailure>::Ok(std::move(result).Unwrap());
    }
private:
    StaticIdentity(
        crypto::SecureMemoryHandle private_key,
        std::vector<uint8_t> public_key);
    crypto::SecureMemoryHandle private_key_;
    std::vector<uint8_t> public_key_;
};
}

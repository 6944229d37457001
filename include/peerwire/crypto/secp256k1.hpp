#pragma once

#include "peerwire/core/result.hpp"
#include "peerwire/core/failures.hpp"
#include "peerwire/crypto/secure_memory_handle.hpp"

#include <cstdint>
#include <span>
#include <utility>
#include <vector>

namespace peerwire::crypto {

/**
 * @brief secp256k1 operations backed by the OpenSSL 3 EVP API
 *
 * Public keys cross this interface as 64-byte node ids (X || Y, without the
 * 0x04 uncompressed-point prefix). Private keys are 32-byte big-endian
 * scalars; callers keep them in SecureMemoryHandle and pass a span only for
 * the duration of one call.
 *
 * All failures are reported as CryptoFailure. Callers that validate
 * peer-supplied keys map invalid points to their own failure kind.
 */
class Secp256k1 {
public:
    /**
     * @brief Generate a key pair from the libsodium CSPRNG
     * @return Ok((private scalar in secure memory, node id)) or Err
     */
    [[nodiscard]] static Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, SessionFailure>
    GenerateKeyPair();

    /**
     * @brief Compute the node id for a private scalar
     *
     * Fails when the scalar is zero or not below the group order.
     */
    [[nodiscard]] static Result<std::vector<uint8_t>, SessionFailure> DerivePublicKey(
        std::span<const uint8_t> private_key);

    /**
     * @brief Check that a node id is a point on the curve
     */
    [[nodiscard]] static Result<Unit, SessionFailure> ValidatePublicKey(
        std::span<const uint8_t> node_id);

    /**
     * @brief ECDH; returns the 32-byte X coordinate of the shared point
     */
    [[nodiscard]] static Result<std::vector<uint8_t>, SessionFailure> Ecdh(
        std::span<const uint8_t> private_key,
        std::span<const uint8_t> remote_node_id);

    /**
     * @brief ECDSA over a 32-byte digest; returns the compact r || s form
     */
    [[nodiscard]] static Result<std::vector<uint8_t>, SessionFailure> Sign(
        std::span<const uint8_t> private_key,
        std::span<const uint8_t> digest);

    /**
     * @brief Verify a compact r || s signature
     * @return Ok(true) when valid, Ok(false) when not, Err on malformed input
     */
    [[nodiscard]] static Result<bool, SessionFailure> Verify(
        std::span<const uint8_t> node_id,
        std::span<const uint8_t> digest,
        std::span<const uint8_t> signature);

    /**
     * @brief Prefix a node id with 0x04 to form the 65-byte SEC1 encoding
     */
    [[nodiscard]] static std::vector<uint8_t> ToUncompressed(std::span<const uint8_t> node_id);

private:
    Secp256k1() = delete;
};

}  // namespace peerwire::crypto

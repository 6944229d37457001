#pragma once

#include "peerwire/core/result.hpp"
#include "peerwire/core/failures.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace peerwire::crypto {

/**
 * @brief ECIES over secp256k1 as used by the auth/ack exchange
 *
 * Ciphertext layout:
 *   R (65, uncompressed ephemeral public key) || iv (16) || c || d (32)
 *
 * where z = ECDH(r, recipient), k = ConcatKdf(z, 32), kE = k[0:16],
 * kM = SHA-256(k[16:32]), c = AES-128-CTR(kE, iv, m) and
 * d = HMAC-SHA256(kM, iv || c || shared_mac_data).
 *
 * `shared_mac_data` binds data sent in the clear (the 2-byte size prefix of
 * a handshake message) into the tag.
 */
class Ecies {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, SessionFailure> Encrypt(
        std::span<const uint8_t> recipient_node_id,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> shared_mac_data);

    /**
     * @brief Decrypt with the recipient's private scalar
     *
     * Fails with MalformedHandshake when the input is shorter than the ECIES
     * overhead or R is not a curve point, and with HandshakeFailure when the
     * tag does not verify.
     */
    [[nodiscard]] static Result<std::vector<uint8_t>, SessionFailure> Decrypt(
        std::span<const uint8_t> private_key,
        std::span<const uint8_t> ciphertext,
        std::span<const uint8_t> shared_mac_data);

private:
    Ecies() = delete;
};

}  // namespace peerwire::crypto

#pragma once

#include "peerwire/core/result.hpp"
#include "peerwire/core/failures.hpp"

#include <span>
#include <vector>
#include <cstdint>

namespace peerwire::crypto {

/**
 * @brief Concatenation KDF (NIST SP 800-56A single-step KDF) over SHA-256
 *
 * Output block i is SHA-256(counter_i || z || other_info), with a 32-bit
 * big-endian counter starting at 1. ECIES uses it to stretch the ECDH
 * result into a cipher key and a MAC key.
 */
class ConcatKdf {
public:
    /**
     * @brief Derive `output.size()` bytes from shared secret `z`
     *
     * @param z Shared secret (ECDH X coordinate)
     * @param output Buffer to fill with derived key material
     * @param other_info Optional context bytes appended after `z`
     * @return Ok on success, Err(CryptoFailure) on failure
     */
    static Result<Unit, SessionFailure> DeriveKey(
        std::span<const uint8_t> z,
        std::span<uint8_t> output,
        std::span<const uint8_t> other_info = {});

    static Result<std::vector<uint8_t>, SessionFailure> DeriveKeyBytes(
        std::span<const uint8_t> z,
        size_t output_size,
        std::span<const uint8_t> other_info = {});

    static constexpr size_t HASH_LEN = 32;
    static constexpr size_t MAX_OUTPUT_LEN = 1024;

private:
    ConcatKdf() = delete;
};

}  // namespace peerwire::crypto

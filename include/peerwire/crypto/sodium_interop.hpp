#pragma once

#include "peerwire/core/result.hpp"
#include "peerwire/core/failures.hpp"

#include <sodium.h>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <vector>

namespace peerwire::crypto {

/**
 * @brief Interop layer for libsodium
 *
 * Covers library initialisation, the CSPRNG, guarded allocations and the
 * constant-time helpers used by the handshake and frame layers.
 */
class SodiumInterop {
public:
    /**
     * @brief Initialize libsodium. Thread-safe and idempotent.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    /**
     * @brief Zero a buffer with sodium_memzero (never optimised away)
     */
    static void SecureZero(std::span<uint8_t> buffer) noexcept;

    /**
     * @brief Constant-time comparison; buffers of different size compare unequal
     */
    static bool ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b) noexcept;

    /**
     * @brief Fill a buffer from the CSPRNG
     *
     * @return Err when libsodium is not initialized (no entropy source)
     */
    static Result<Unit, SodiumFailure> FillRandom(std::span<uint8_t> output);

    static Result<std::vector<uint8_t>, SodiumFailure> GetRandomBytes(size_t size);

    /**
     * @brief Uniform random value in [0, upper_bound)
     */
    static uint32_t RandomUniform(uint32_t upper_bound);

    static void* AllocateSecure(size_t size) noexcept;
    static void FreeSecure(void* ptr) noexcept;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

}  // namespace peerwire::crypto

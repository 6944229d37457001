#include "peerwire/crypto/sodium_interop.hpp"

#include <string>

namespace peerwire::crypto {

namespace {
    constexpr std::string_view kNotInitialized = "libsodium not initialized";
}

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
        initialized_.store(sodium_init() >= 0, std::memory_order_release);
    });

    if (!initialized_.load(std::memory_order_acquire)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed("Failed to initialize libsodium"));
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

void SodiumInterop::SecureZero(std::span<uint8_t> buffer) noexcept {
    if (!buffer.empty()) {
        sodium_memzero(buffer.data(), buffer.size());
    }
}

bool SodiumInterop::ConstantTimeEquals(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

Result<Unit, SodiumFailure> SodiumInterop::FillRandom(std::span<uint8_t> output) {
    if (!IsInitialized()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(std::string(kNotInitialized)));
    }
    randombytes_buf(output.data(), output.size());
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, SodiumFailure> SodiumInterop::GetRandomBytes(size_t size) {
    std::vector<uint8_t> buffer(size);
    auto fill = FillRandom(buffer);
    if (fill.IsErr()) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(std::move(fill).UnwrapErr());
    }
    return Result<std::vector<uint8_t>, SodiumFailure>::Ok(std::move(buffer));
}

uint32_t SodiumInterop::RandomUniform(uint32_t upper_bound) {
    return randombytes_uniform(upper_bound);
}

void* SodiumInterop::AllocateSecure(size_t size) noexcept {
    if (!IsInitialized()) {
        return nullptr;
    }
    return sodium_malloc(size);
}

void SodiumInterop::FreeSecure(void* ptr) noexcept {
    if (ptr != nullptr) {
        sodium_free(ptr);
    }
}

}  // namespace peerwire::crypto

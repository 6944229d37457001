#pragma once
#include "peerwire/core/result.hpp"
#include "peerwire/core/failures.hpp"
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

struct evp_cipher_ctx_st;

namespace peerwire::crypto {

/**
 * AES in counter mode as a continuous keystream.
 *
 * The frame layer keeps one AesCtr per direction for the lifetime of a
 * connection: the counter carries over from one frame to the next, so both
 * ends must process frames in the same order. Key size selects AES-128 (16
 * bytes) or AES-256 (32 bytes).
 */
class AesCtr {
public:
    [[nodiscard]] static Result<AesCtr, SessionFailure> Create(
        std::span<const uint8_t> key,
        std::span<const uint8_t> iv);

    /// One-shot encryption or decryption with a fresh keystream.
    [[nodiscard]] static Result<std::vector<uint8_t>, SessionFailure> Apply(
        std::span<const uint8_t> key,
        std::span<const uint8_t> iv,
        std::span<const uint8_t> input);

    /// XORs the next `data.size()` keystream bytes into `data`.
    [[nodiscard]] Result<Unit, SessionFailure> Process(std::span<uint8_t> data);

    AesCtr(AesCtr&&) noexcept;
    AesCtr& operator=(AesCtr&&) noexcept;
    AesCtr(const AesCtr&) = delete;
    AesCtr& operator=(const AesCtr&) = delete;
    ~AesCtr();

private:
    struct CtxDeleter {
        void operator()(evp_cipher_ctx_st* ctx) const;
    };
    explicit AesCtr(std::unique_ptr<evp_cipher_ctx_st, CtxDeleter> ctx) noexcept;
    std::unique_ptr<evp_cipher_ctx_st, CtxDeleter> ctx_;
};

/**
 * Single-block AES-256 encryption (ECB, no padding), used to whiten the
 * rolling MAC digests of the frame layer.
 */
class AesBlock {
public:
    static constexpr size_t BLOCK_SIZE = 16;

    [[nodiscard]] static Result<AesBlock, SessionFailure> Create(std::span<const uint8_t> key);

    [[nodiscard]] Result<Unit, SessionFailure> EncryptBlock(
        std::span<const uint8_t> input,
        std::span<uint8_t> output);

    AesBlock(AesBlock&&) noexcept;
    AesBlock& operator=(AesBlock&&) noexcept;
    AesBlock(const AesBlock&) = delete;
    AesBlock& operator=(const AesBlock&) = delete;
    ~AesBlock();

private:
    struct CtxDeleter {
        void operator()(evp_cipher_ctx_st* ctx) const;
    };
    explicit AesBlock(std::unique_ptr<evp_cipher_ctx_st, CtxDeleter> ctx) noexcept;
    std::unique_ptr<evp_cipher_ctx_st, CtxDeleter> ctx_;
};

}  // namespace peerwire::crypto

#pragma once
#include "peerwire/core/result.hpp"
#include "peerwire/core/failures.hpp"
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <span>
#include <vector>

struct evp_md_ctx_st;

namespace peerwire::crypto {

class Hash {
public:
    static constexpr size_t DIGEST_SIZE = 32;

    /// SHA3-256 over the concatenation of `parts`.
    [[nodiscard]] static Result<std::vector<uint8_t>, SessionFailure> Sha3(
        std::initializer_list<std::span<const uint8_t>> parts);

    [[nodiscard]] static Result<std::vector<uint8_t>, SessionFailure> Sha256(
        std::span<const uint8_t> data);

    /// HMAC-SHA256 over the concatenation of `parts`.
    [[nodiscard]] static Result<std::vector<uint8_t>, SessionFailure> HmacSha256(
        std::span<const uint8_t> key,
        std::initializer_list<std::span<const uint8_t>> parts);

private:
    Hash() = delete;
};

/**
 * A SHA3-256 state that absorbs data across many frames.
 *
 * Digest() returns the hash of everything absorbed so far without
 * finalising the state, so further Update() calls continue the same
 * stream. Each frame direction owns exactly one RollingHash.
 */
class RollingHash {
public:
    [[nodiscard]] static Result<RollingHash, SessionFailure> Create();

    [[nodiscard]] Result<Unit, SessionFailure> Update(std::span<const uint8_t> data);

    [[nodiscard]] Result<std::vector<uint8_t>, SessionFailure> Digest() const;

    RollingHash(RollingHash&&) noexcept;
    RollingHash& operator=(RollingHash&&) noexcept;
    RollingHash(const RollingHash&) = delete;
    RollingHash& operator=(const RollingHash&) = delete;
    ~RollingHash();

private:
    struct CtxDeleter {
        void operator()(evp_md_ctx_st* ctx) const;
    };
    explicit RollingHash(std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx) noexcept;
    std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
};

}  // namespace peerwire::crypto

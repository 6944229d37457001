#include "peerwire/crypto/hash.hpp"
#include "openssl_helpers.hpp"
#include <openssl/core_names.h>
#include <format>

namespace peerwire::crypto {
using namespace detail;

namespace {
    using BytesResult = Result<std::vector<uint8_t>, SessionFailure>;

    BytesResult DigestParts(const EVP_MD* md, std::initializer_list<std::span<const uint8_t>> parts) {
        EvpMdCtxPtr ctx(EVP_MD_CTX_new());
        if (!ctx || EVP_DigestInit_ex(ctx.get(), md, nullptr) != kOpenSslSuccess) {
            return BytesResult::Err(SessionFailure::CryptoFailure(
                std::format("Failed to initialise digest: {}", GetOpenSSLError())));
        }
        for (const auto& part : parts) {
            if (EVP_DigestUpdate(ctx.get(), part.data(), part.size()) != kOpenSslSuccess) {
                return BytesResult::Err(SessionFailure::CryptoFailure(
                    std::format("Digest update failed: {}", GetOpenSSLError())));
            }
        }
        std::vector<uint8_t> digest(Hash::DIGEST_SIZE);
        unsigned int digest_len = 0;
        if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_len) != kOpenSslSuccess ||
            digest_len != Hash::DIGEST_SIZE) {
            return BytesResult::Err(SessionFailure::CryptoFailure(
                std::format("Digest finalisation failed: {}", GetOpenSSLError())));
        }
        return BytesResult::Ok(std::move(digest));
    }
}

Result<std::vector<uint8_t>, SessionFailure> Hash::Sha3(
    std::initializer_list<std::span<const uint8_t>> parts) {
    return DigestParts(EVP_sha3_256(), parts);
}

Result<std::vector<uint8_t>, SessionFailure> Hash::Sha256(std::span<const uint8_t> data) {
    return DigestParts(EVP_sha256(), {data});
}

Result<std::vector<uint8_t>, SessionFailure> Hash::HmacSha256(
    std::span<const uint8_t> key,
    std::initializer_list<std::span<const uint8_t>> parts) {
    EvpMacPtr mac(EVP_MAC_fetch(nullptr, "HMAC", nullptr));
    if (!mac) {
        return BytesResult::Err(SessionFailure::CryptoFailure(
            std::format("Failed to fetch HMAC: {}", GetOpenSSLError())));
    }
    EvpMacCtxPtr ctx(EVP_MAC_CTX_new(mac.get()));
    if (!ctx) {
        return BytesResult::Err(SessionFailure::CryptoFailure(
            std::format("Failed to create HMAC context: {}", GetOpenSSLError())));
    }
    OSSL_PARAM params[2];
    params[0] = OSSL_PARAM_construct_utf8_string(
        OSSL_MAC_PARAM_DIGEST, const_cast<char*>("SHA256"), 0);
    params[1] = OSSL_PARAM_construct_end();
    if (EVP_MAC_init(ctx.get(), key.data(), key.size(), params) != kOpenSslSuccess) {
        return BytesResult::Err(SessionFailure::CryptoFailure(
            std::format("Failed to initialise HMAC: {}", GetOpenSSLError())));
    }
    for (const auto& part : parts) {
        if (EVP_MAC_update(ctx.get(), part.data(), part.size()) != kOpenSslSuccess) {
            return BytesResult::Err(SessionFailure::CryptoFailure(
                std::format("HMAC update failed: {}", GetOpenSSLError())));
        }
    }
    std::vector<uint8_t> tag(DIGEST_SIZE);
    size_t tag_len = 0;
    if (EVP_MAC_final(ctx.get(), tag.data(), &tag_len, tag.size()) != kOpenSslSuccess ||
        tag_len != DIGEST_SIZE) {
        return BytesResult::Err(SessionFailure::CryptoFailure(
            std::format("HMAC finalisation failed: {}", GetOpenSSLError())));
    }
    return BytesResult::Ok(std::move(tag));
}

void RollingHash::CtxDeleter::operator()(evp_md_ctx_st* ctx) const {
    EVP_MD_CTX_free(ctx);
}

RollingHash::RollingHash(std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx) noexcept
    : ctx_(std::move(ctx)) {}
RollingHash::RollingHash(RollingHash&&) noexcept = default;
RollingHash& RollingHash::operator=(RollingHash&&) noexcept = default;
RollingHash::~RollingHash() = default;

Result<RollingHash, SessionFailure> RollingHash::Create() {
    std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha3_256(), nullptr) != kOpenSslSuccess) {
        return Result<RollingHash, SessionFailure>::Err(SessionFailure::CryptoFailure(
            std::format("Failed to initialise rolling hash: {}", GetOpenSSLError())));
    }
    return Result<RollingHash, SessionFailure>::Ok(RollingHash(std::move(ctx)));
}

Result<Unit, SessionFailure> RollingHash::Update(std::span<const uint8_t> data) {
    if (EVP_DigestUpdate(ctx_.get(), data.data(), data.size()) != kOpenSslSuccess) {
        return Result<Unit, SessionFailure>::Err(SessionFailure::CryptoFailure(
            std::format("Rolling hash update failed: {}", GetOpenSSLError())));
    }
    return Result<Unit, SessionFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, SessionFailure> RollingHash::Digest() const {
    EvpMdCtxPtr snapshot(EVP_MD_CTX_new());
    if (!snapshot || EVP_MD_CTX_copy_ex(snapshot.get(), ctx_.get()) != kOpenSslSuccess) {
        return BytesResult::Err(SessionFailure::CryptoFailure(
            std::format("Failed to snapshot rolling hash: {}", GetOpenSSLError())));
    }
    std::vector<uint8_t> digest(Hash::DIGEST_SIZE);
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(snapshot.get(), digest.data(), &digest_len) != kOpenSslSuccess ||
        digest_len != Hash::DIGEST_SIZE) {
        return BytesResult::Err(SessionFailure::CryptoFailure(
            std::format("Rolling hash digest failed: {}", GetOpenSSLError())));
    }
    return BytesResult::Ok(std::move(digest));
}

}  // namespace peerwire::crypto

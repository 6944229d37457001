#include "peerwire/crypto/aes_ctr.hpp"
#include "openssl_helpers.hpp"
#include <format>
#include <limits>

namespace peerwire::crypto {
using namespace detail;

namespace {
    constexpr size_t kAes128KeyBytes = 16;
    constexpr size_t kAes256KeyBytes = 32;
    constexpr size_t kCtrIvBytes = 16;

    const EVP_CIPHER* SelectCtrCipher(size_t key_size) {
        switch (key_size) {
            case kAes128KeyBytes: return EVP_aes_128_ctr();
            case kAes256KeyBytes: return EVP_aes_256_ctr();
            default: return nullptr;
        }
    }
}

void AesCtr::CtxDeleter::operator()(evp_cipher_ctx_st* ctx) const {
    EVP_CIPHER_CTX_free(ctx);
}

AesCtr::AesCtr(std::unique_ptr<evp_cipher_ctx_st, CtxDeleter> ctx) noexcept
    : ctx_(std::move(ctx)) {}
AesCtr::AesCtr(AesCtr&&) noexcept = default;
AesCtr& AesCtr::operator=(AesCtr&&) noexcept = default;
AesCtr::~AesCtr() = default;

Result<AesCtr, SessionFailure> AesCtr::Create(
    std::span<const uint8_t> key,
    std::span<const uint8_t> iv) {
    const EVP_CIPHER* cipher = SelectCtrCipher(key.size());
    if (cipher == nullptr) {
        return Result<AesCtr, SessionFailure>::Err(
            SessionFailure::CryptoFailure(
                std::format("AES-CTR key must be 16 or 32 bytes, got {}", key.size())));
    }
    if (iv.size() != kCtrIvBytes) {
        return Result<AesCtr, SessionFailure>::Err(
            SessionFailure::CryptoFailure(
                std::format("AES-CTR IV must be {} bytes, got {}", kCtrIvBytes, iv.size())));
    }
    std::unique_ptr<evp_cipher_ctx_st, CtxDeleter> ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return Result<AesCtr, SessionFailure>::Err(
            SessionFailure::CryptoFailure(
                std::format("Failed to create cipher context: {}", GetOpenSSLError())));
    }
    if (EVP_EncryptInit_ex(ctx.get(), cipher, nullptr, key.data(), iv.data()) != kOpenSslSuccess) {
        return Result<AesCtr, SessionFailure>::Err(
            SessionFailure::CryptoFailure(
                std::format("Failed to initialize AES-CTR: {}", GetOpenSSLError())));
    }
    return Result<AesCtr, SessionFailure>::Ok(AesCtr(std::move(ctx)));
}

Result<std::vector<uint8_t>, SessionFailure> AesCtr::Apply(
    std::span<const uint8_t> key,
    std::span<const uint8_t> iv,
    std::span<const uint8_t> input) {
    auto stream = Create(key, iv);
    if (stream.IsErr()) {
        return Result<std::vector<uint8_t>, SessionFailure>::Err(std::move(stream).UnwrapErr());
    }
    std::vector<uint8_t> output(input.begin(), input.end());
    auto processed = stream.Unwrap().Process(output);
    if (processed.IsErr()) {
        return Result<std::vector<uint8_t>, SessionFailure>::Err(std::move(processed).UnwrapErr());
    }
    return Result<std::vector<uint8_t>, SessionFailure>::Ok(std::move(output));
}

Result<Unit, SessionFailure> AesCtr::Process(std::span<uint8_t> data) {
    if (data.empty()) {
        return Result<Unit, SessionFailure>::Ok(unit);
    }
    if (data.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
        return Result<Unit, SessionFailure>::Err(
            SessionFailure::CryptoFailure("AES-CTR input too large"));
    }
    int out_len = 0;
    // CTR mode permits in-place operation.
    if (EVP_EncryptUpdate(ctx_.get(), data.data(), &out_len,
                          data.data(), static_cast<int>(data.size())) != kOpenSslSuccess ||
        static_cast<size_t>(out_len) != data.size()) {
        return Result<Unit, SessionFailure>::Err(
            SessionFailure::CryptoFailure(
                std::format("AES-CTR keystream failure: {}", GetOpenSSLError())));
    }
    return Result<Unit, SessionFailure>::Ok(unit);
}

void AesBlock::CtxDeleter::operator()(evp_cipher_ctx_st* ctx) const {
    EVP_CIPHER_CTX_free(ctx);
}

AesBlock::AesBlock(std::unique_ptr<evp_cipher_ctx_st, CtxDeleter> ctx) noexcept
    : ctx_(std::move(ctx)) {}
AesBlock::AesBlock(AesBlock&&) noexcept = default;
AesBlock& AesBlock::operator=(AesBlock&&) noexcept = default;
AesBlock::~AesBlock() = default;

Result<AesBlock, SessionFailure> AesBlock::Create(std::span<const uint8_t> key) {
    if (key.size() != kAes256KeyBytes) {
        return Result<AesBlock, SessionFailure>::Err(
            SessionFailure::CryptoFailure(
                std::format("AES-256 block key must be {} bytes, got {}", kAes256KeyBytes, key.size())));
    }
    std::unique_ptr<evp_cipher_ctx_st, CtxDeleter> ctx(EVP_CIPHER_CTX_new());
    if (!ctx ||
        EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_ecb(), nullptr, key.data(), nullptr) != kOpenSslSuccess ||
        EVP_CIPHER_CTX_set_padding(ctx.get(), 0) != kOpenSslSuccess) {
        return Result<AesBlock, SessionFailure>::Err(
            SessionFailure::CryptoFailure(
                std::format("Failed to initialize AES-256-ECB: {}", GetOpenSSLError())));
    }
    return Result<AesBlock, SessionFailure>::Ok(AesBlock(std::move(ctx)));
}

Result<Unit, SessionFailure> AesBlock::EncryptBlock(
    std::span<const uint8_t> input,
    std::span<uint8_t> output) {
    if (input.size() != BLOCK_SIZE || output.size() != BLOCK_SIZE) {
        return Result<Unit, SessionFailure>::Err(
            SessionFailure::CryptoFailure("AES block input and output must be 16 bytes"));
    }
    int out_len = 0;
    if (EVP_EncryptUpdate(ctx_.get(), output.data(), &out_len,
                          input.data(), static_cast<int>(BLOCK_SIZE)) != kOpenSslSuccess ||
        out_len != static_cast<int>(BLOCK_SIZE)) {
        return Result<Unit, SessionFailure>::Err(
            SessionFailure::CryptoFailure(
                std::format("AES block encryption failed: {}", GetOpenSSLError())));
    }
    return Result<Unit, SessionFailure>::Ok(unit);
}

}  // namespace peerwire::crypto

#include "peerwire/crypto/concat_kdf.hpp"
#include "openssl_helpers.hpp"

#include <openssl/core_names.h>
#include <openssl/kdf.h>
#include <openssl/params.h>

#include <format>

namespace peerwire::crypto {
using namespace detail;

Result<Unit, SessionFailure> ConcatKdf::DeriveKey(
    std::span<const uint8_t> z,
    std::span<uint8_t> output,
    std::span<const uint8_t> other_info) {

    if (output.empty() || output.size() > MAX_OUTPUT_LEN) {
        return Result<Unit, SessionFailure>::Err(
            SessionFailure::CryptoFailure(
                std::format("Concat KDF output size {} outside (0, {}]", output.size(), MAX_OUTPUT_LEN)));
    }
    if (z.empty()) {
        return Result<Unit, SessionFailure>::Err(
            SessionFailure::CryptoFailure("Concat KDF shared secret cannot be empty"));
    }

    EVP_KDF* kdf = EVP_KDF_fetch(nullptr, OSSL_KDF_NAME_SSKDF, nullptr);
    if (kdf == nullptr) {
        return Result<Unit, SessionFailure>::Err(
            SessionFailure::CryptoFailure(
                std::format("Failed to fetch SSKDF: {}", GetOpenSSLError())));
    }
    EvpKdfCtxPtr kctx(EVP_KDF_CTX_new(kdf));
    EVP_KDF_free(kdf);
    if (!kctx) {
        return Result<Unit, SessionFailure>::Err(
            SessionFailure::CryptoFailure(
                std::format("Failed to create SSKDF context: {}", GetOpenSSLError())));
    }

    OSSL_PARAM params[4];
    int param_idx = 0;
    params[param_idx++] = OSSL_PARAM_construct_utf8_string(
        OSSL_KDF_PARAM_DIGEST, const_cast<char*>("SHA256"), 0);
    params[param_idx++] = OSSL_PARAM_construct_octet_string(
        OSSL_KDF_PARAM_KEY, const_cast<uint8_t*>(z.data()), z.size());
    if (!other_info.empty()) {
        params[param_idx++] = OSSL_PARAM_construct_octet_string(
            OSSL_KDF_PARAM_INFO, const_cast<uint8_t*>(other_info.data()), other_info.size());
    }
    params[param_idx] = OSSL_PARAM_construct_end();

    if (EVP_KDF_derive(kctx.get(), output.data(), output.size(), params) != kOpenSslSuccess) {
        return Result<Unit, SessionFailure>::Err(
            SessionFailure::CryptoFailure(
                std::format("Concat KDF derivation failed: {}", GetOpenSSLError())));
    }
    return Result<Unit, SessionFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, SessionFailure> ConcatKdf::DeriveKeyBytes(
    std::span<const uint8_t> z,
    size_t output_size,
    std::span<const uint8_t> other_info) {

    std::vector<uint8_t> output(output_size);
    auto result = DeriveKey(z, output, other_info);
    if (result.IsErr()) {
        return Result<std::vector<uint8_t>, SessionFailure>::Err(
            std::move(result).UnwrapErr());
    }
    return Result<std::vector<uint8_t>, SessionFailure>::Ok(std::move(output));
}

}  // namespace peerwire::crypto

#include "peerwire/crypto/secp256k1.hpp"
#include "peerwire/crypto/sodium_interop.hpp"
#include "peerwire/core/constants.hpp"
#include "openssl_helpers.hpp"

#include <openssl/core_names.h>
#include <openssl/ecdsa.h>
#include <openssl/obj_mac.h>

#include <array>
#include <format>

namespace peerwire::crypto {
using namespace detail;

namespace {
    using BytesResult = Result<std::vector<uint8_t>, SessionFailure>;
    using UnitResult = Result<Unit, SessionFailure>;
    using PkeyResult = Result<EvpPkeyPtr, SessionFailure>;

    constexpr size_t kMaxKeyGenerationAttempts = 16;

    EcGroupPtr NewGroup() {
        return EcGroupPtr(EC_GROUP_new_by_curve_name(NID_secp256k1));
    }

    Result<BignumPtr, SessionFailure> ScalarFromBytes(
        const EC_GROUP* group,
        std::span<const uint8_t> private_key) {
        if (private_key.size() != kPrivateKeyBytes) {
            return Result<BignumPtr, SessionFailure>::Err(
                SessionFailure::CryptoFailure(
                    std::format("Private key must be {} bytes, got {}",
                        kPrivateKeyBytes, private_key.size())));
        }
        BignumPtr scalar(BN_secure_new());
        if (!scalar || BN_bin2bn(private_key.data(), static_cast<int>(private_key.size()),
                                 scalar.get()) == nullptr) {
            return Result<BignumPtr, SessionFailure>::Err(
                SessionFailure::CryptoFailure(
                    std::format("Failed to load private scalar: {}", GetOpenSSLError())));
        }
        BN_set_flags(scalar.get(), BN_FLG_CONSTTIME);
        if (BN_is_zero(scalar.get()) || BN_cmp(scalar.get(), EC_GROUP_get0_order(group)) >= 0) {
            return Result<BignumPtr, SessionFailure>::Err(
                SessionFailure::CryptoFailure("Private scalar out of range for secp256k1"));
        }
        return Result<BignumPtr, SessionFailure>::Ok(std::move(scalar));
    }

    Result<EcPointPtr, SessionFailure> PointFromNodeId(
        const EC_GROUP* group,
        std::span<const uint8_t> node_id) {
        if (node_id.size() != kNodeIdBytes) {
            return Result<EcPointPtr, SessionFailure>::Err(
                SessionFailure::CryptoFailure(
                    std::format("Public key must be {} bytes, got {}", kNodeIdBytes, node_id.size())));
        }
        const std::vector<uint8_t> encoded = Secp256k1::ToUncompressed(node_id);
        EcPointPtr point(EC_POINT_new(group));
        if (!point ||
            EC_POINT_oct2point(group, point.get(), encoded.data(), encoded.size(), nullptr) != kOpenSslSuccess ||
            EC_POINT_is_at_infinity(group, point.get()) ||
            EC_POINT_is_on_curve(group, point.get(), nullptr) != kOpenSslSuccess) {
            ERR_clear_error();
            return Result<EcPointPtr, SessionFailure>::Err(
                SessionFailure::CryptoFailure("Public key is not a valid secp256k1 point"));
        }
        return Result<EcPointPtr, SessionFailure>::Ok(std::move(point));
    }

    PkeyResult BuildKey(const BIGNUM* scalar, std::span<const uint8_t> node_id) {
        const std::vector<uint8_t> encoded = Secp256k1::ToUncompressed(node_id);
        ParamBldPtr bld(OSSL_PARAM_BLD_new());
        if (!bld ||
            OSSL_PARAM_BLD_push_utf8_string(bld.get(), OSSL_PKEY_PARAM_GROUP_NAME, kCurveName, 0) != kOpenSslSuccess ||
            OSSL_PARAM_BLD_push_octet_string(bld.get(), OSSL_PKEY_PARAM_PUB_KEY,
                                             encoded.data(), encoded.size()) != kOpenSslSuccess) {
            return PkeyResult::Err(SessionFailure::CryptoFailure(
                std::format("Failed to build key parameters: {}", GetOpenSSLError())));
        }
        if (scalar != nullptr &&
            OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_PRIV_KEY, scalar) != kOpenSslSuccess) {
            return PkeyResult::Err(SessionFailure::CryptoFailure(
                std::format("Failed to push private scalar: {}", GetOpenSSLError())));
        }
        ParamPtr params(OSSL_PARAM_BLD_to_param(bld.get()));
        EvpPkeyCtxPtr ctx(EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr));
        if (!params || !ctx || EVP_PKEY_fromdata_init(ctx.get()) != kOpenSslSuccess) {
            return PkeyResult::Err(SessionFailure::CryptoFailure(
                std::format("Failed to create EC key context: {}", GetOpenSSLError())));
        }
        EVP_PKEY* raw = nullptr;
        const int selection = scalar != nullptr ? EVP_PKEY_KEYPAIR : EVP_PKEY_PUBLIC_KEY;
        if (EVP_PKEY_fromdata(ctx.get(), &raw, selection, params.get()) != kOpenSslSuccess) {
            return PkeyResult::Err(SessionFailure::CryptoFailure(
                std::format("Failed to import EC key: {}", GetOpenSSLError())));
        }
        return PkeyResult::Ok(EvpPkeyPtr(raw));
    }

    PkeyResult LoadPrivateKey(std::span<const uint8_t> private_key) {
        EcGroupPtr group = NewGroup();
        if (!group) {
            return PkeyResult::Err(SessionFailure::CryptoFailure(
                std::format("secp256k1 unavailable: {}", GetOpenSSLError())));
        }
        auto scalar = ScalarFromBytes(group.get(), private_key);
        if (scalar.IsErr()) {
            return PkeyResult::Err(std::move(scalar).UnwrapErr());
        }
        auto node_id = Secp256k1::DerivePublicKey(private_key);
        if (node_id.IsErr()) {
            return PkeyResult::Err(std::move(node_id).UnwrapErr());
        }
        return BuildKey(scalar.Unwrap().get(), node_id.Unwrap());
    }

    PkeyResult LoadPublicKey(std::span<const uint8_t> node_id) {
        auto valid = Secp256k1::ValidatePublicKey(node_id);
        if (valid.IsErr()) {
            return PkeyResult::Err(std::move(valid).UnwrapErr());
        }
        return BuildKey(nullptr, node_id);
    }
}

std::vector<uint8_t> Secp256k1::ToUncompressed(std::span<const uint8_t> node_id) {
    std::vector<uint8_t> encoded;
    encoded.reserve(kUncompressedPublicKeyBytes);
    encoded.push_back(kUncompressedPointTag);
    encoded.insert(encoded.end(), node_id.begin(), node_id.end());
    return encoded;
}

Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, SessionFailure>
Secp256k1::GenerateKeyPair() {
    using PairResult = Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, SessionFailure>;

    auto handle_result = SecureMemoryHandle::Allocate(kPrivateKeyBytes);
    if (handle_result.IsErr()) {
        return PairResult::Err(SessionFailure::FromSodiumFailure(handle_result.UnwrapErr()));
    }
    SecureMemoryHandle handle = std::move(handle_result).Unwrap();

    for (size_t attempt = 0; attempt < kMaxKeyGenerationAttempts; ++attempt) {
        auto fill = handle.WithWriteAccess([](std::span<uint8_t> scalar) {
            return SodiumInterop::FillRandom(scalar);
        });
        if (fill.IsErr()) {
            return PairResult::Err(SessionFailure::FromSodiumFailure(fill.UnwrapErr()));
        }
        if (fill.Unwrap().IsErr()) {
            return PairResult::Err(SessionFailure::FromSodiumFailure(fill.Unwrap().UnwrapErr()));
        }
        auto derived = handle.WithReadAccess([](std::span<const uint8_t> scalar) {
            return DerivePublicKey(scalar);
        });
        if (derived.IsErr()) {
            return PairResult::Err(SessionFailure::FromSodiumFailure(derived.UnwrapErr()));
        }
        auto node_id = std::move(derived).Unwrap();
        if (node_id.IsOk()) {
            return PairResult::Ok(std::make_pair(std::move(handle), std::move(node_id).Unwrap()));
        }
        // Scalar outside [1, n): draw again.
    }
    return PairResult::Err(SessionFailure::CryptoFailure(
        "Failed to draw a valid secp256k1 scalar"));
}

Result<std::vector<uint8_t>, SessionFailure> Secp256k1::DerivePublicKey(
    std::span<const uint8_t> private_key) {
    EcGroupPtr group = NewGroup();
    if (!group) {
        return BytesResult::Err(SessionFailure::CryptoFailure(
            std::format("secp256k1 unavailable: {}", GetOpenSSLError())));
    }
    auto scalar = ScalarFromBytes(group.get(), private_key);
    if (scalar.IsErr()) {
        return BytesResult::Err(std::move(scalar).UnwrapErr());
    }
    EcPointPtr point(EC_POINT_new(group.get()));
    if (!point ||
        EC_POINT_mul(group.get(), point.get(), scalar.Unwrap().get(), nullptr, nullptr, nullptr) != kOpenSslSuccess) {
        return BytesResult::Err(SessionFailure::CryptoFailure(
            std::format("Public key derivation failed: {}", GetOpenSSLError())));
    }
    std::array<uint8_t, kUncompressedPublicKeyBytes> encoded{};
    if (EC_POINT_point2oct(group.get(), point.get(), POINT_CONVERSION_UNCOMPRESSED,
                           encoded.data(), encoded.size(), nullptr) != encoded.size()) {
        return BytesResult::Err(SessionFailure::CryptoFailure(
            std::format("Public key encoding failed: {}", GetOpenSSLError())));
    }
    return BytesResult::Ok(std::vector<uint8_t>(encoded.begin() + 1, encoded.end()));
}

Result<Unit, SessionFailure> Secp256k1::ValidatePublicKey(std::span<const uint8_t> node_id) {
    EcGroupPtr group = NewGroup();
    if (!group) {
        return UnitResult::Err(SessionFailure::CryptoFailure(
            std::format("secp256k1 unavailable: {}", GetOpenSSLError())));
    }
    auto point = PointFromNodeId(group.get(), node_id);
    if (point.IsErr()) {
        return UnitResult::Err(std::move(point).UnwrapErr());
    }
    return UnitResult::Ok(unit);
}

Result<std::vector<uint8_t>, SessionFailure> Secp256k1::Ecdh(
    std::span<const uint8_t> private_key,
    std::span<const uint8_t> remote_node_id) {
    auto local = LoadPrivateKey(private_key);
    if (local.IsErr()) {
        return BytesResult::Err(std::move(local).UnwrapErr());
    }
    auto remote = LoadPublicKey(remote_node_id);
    if (remote.IsErr()) {
        return BytesResult::Err(std::move(remote).UnwrapErr());
    }

    EvpPkeyCtxPtr ctx(EVP_PKEY_CTX_new_from_pkey(nullptr, local.Unwrap().get(), nullptr));
    if (!ctx || EVP_PKEY_derive_init(ctx.get()) != kOpenSslSuccess ||
        EVP_PKEY_derive_set_peer(ctx.get(), remote.Unwrap().get()) != kOpenSslSuccess) {
        return BytesResult::Err(SessionFailure::CryptoFailure(
            std::format("Failed to initialise ECDH: {}", GetOpenSSLError())));
    }
    size_t shared_len = 0;
    if (EVP_PKEY_derive(ctx.get(), nullptr, &shared_len) != kOpenSslSuccess ||
        shared_len != kSharedSecretBytes) {
        return BytesResult::Err(SessionFailure::CryptoFailure(
            std::format("Unexpected ECDH output size: {}", GetOpenSSLError())));
    }
    std::vector<uint8_t> shared(shared_len);
    if (EVP_PKEY_derive(ctx.get(), shared.data(), &shared_len) != kOpenSslSuccess) {
        SodiumInterop::SecureZero(shared);
        return BytesResult::Err(SessionFailure::CryptoFailure(
            std::format("ECDH derivation failed: {}", GetOpenSSLError())));
    }
    return BytesResult::Ok(std::move(shared));
}

Result<std::vector<uint8_t>, SessionFailure> Secp256k1::Sign(
    std::span<const uint8_t> private_key,
    std::span<const uint8_t> digest) {
    if (digest.size() != kHashBytes) {
        return BytesResult::Err(SessionFailure::CryptoFailure(
            std::format("Digest must be {} bytes, got {}", kHashBytes, digest.size())));
    }
    auto key = LoadPrivateKey(private_key);
    if (key.IsErr()) {
        return BytesResult::Err(std::move(key).UnwrapErr());
    }
    EvpPkeyCtxPtr ctx(EVP_PKEY_CTX_new_from_pkey(nullptr, key.Unwrap().get(), nullptr));
    if (!ctx || EVP_PKEY_sign_init(ctx.get()) != kOpenSslSuccess) {
        return BytesResult::Err(SessionFailure::CryptoFailure(
            std::format("Failed to initialise ECDSA: {}", GetOpenSSLError())));
    }
    size_t der_len = 0;
    if (EVP_PKEY_sign(ctx.get(), nullptr, &der_len, digest.data(), digest.size()) != kOpenSslSuccess) {
        return BytesResult::Err(SessionFailure::CryptoFailure(
            std::format("Failed to size ECDSA signature: {}", GetOpenSSLError())));
    }
    std::vector<uint8_t> der(der_len);
    if (EVP_PKEY_sign(ctx.get(), der.data(), &der_len, digest.data(), digest.size()) != kOpenSslSuccess) {
        return BytesResult::Err(SessionFailure::CryptoFailure(
            std::format("ECDSA signing failed: {}", GetOpenSSLError())));
    }

    const unsigned char* cursor = der.data();
    std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)> sig(
        d2i_ECDSA_SIG(nullptr, &cursor, static_cast<long>(der_len)), &ECDSA_SIG_free);
    if (!sig) {
        return BytesResult::Err(SessionFailure::CryptoFailure(
            std::format("Failed to decode ECDSA signature: {}", GetOpenSSLError())));
    }
    const BIGNUM* r = nullptr;
    const BIGNUM* s = nullptr;
    ECDSA_SIG_get0(sig.get(), &r, &s);
    std::vector<uint8_t> compact(kSignatureBytes);
    if (BN_bn2binpad(r, compact.data(), kSignatureBytes / 2) < 0 ||
        BN_bn2binpad(s, compact.data() + kSignatureBytes / 2, kSignatureBytes / 2) < 0) {
        return BytesResult::Err(SessionFailure::CryptoFailure("ECDSA component exceeds 32 bytes"));
    }
    return BytesResult::Ok(std::move(compact));
}

Result<bool, SessionFailure> Secp256k1::Verify(
    std::span<const uint8_t> node_id,
    std::span<const uint8_t> digest,
    std::span<const uint8_t> signature) {
    if (digest.size() != kHashBytes || signature.size() != kSignatureBytes) {
        return Result<bool, SessionFailure>::Err(SessionFailure::CryptoFailure(
            "Invalid digest or signature size for ECDSA verification"));
    }
    auto key = LoadPublicKey(node_id);
    if (key.IsErr()) {
        return Result<bool, SessionFailure>::Err(std::move(key).UnwrapErr());
    }

    std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)> sig(ECDSA_SIG_new(), &ECDSA_SIG_free);
    BIGNUM* r = BN_bin2bn(signature.data(), kSignatureBytes / 2, nullptr);
    BIGNUM* s = BN_bin2bn(signature.data() + kSignatureBytes / 2, kSignatureBytes / 2, nullptr);
    if (!sig || r == nullptr || s == nullptr || ECDSA_SIG_set0(sig.get(), r, s) != kOpenSslSuccess) {
        BN_free(r);
        BN_free(s);
        return Result<bool, SessionFailure>::Err(SessionFailure::CryptoFailure(
            std::format("Failed to load ECDSA signature: {}", GetOpenSSLError())));
    }
    const int der_len = i2d_ECDSA_SIG(sig.get(), nullptr);
    if (der_len <= 0) {
        return Result<bool, SessionFailure>::Err(SessionFailure::CryptoFailure(
            std::format("Failed to encode ECDSA signature: {}", GetOpenSSLError())));
    }
    std::vector<uint8_t> der(static_cast<size_t>(der_len));
    unsigned char* out = der.data();
    i2d_ECDSA_SIG(sig.get(), &out);

    EvpPkeyCtxPtr ctx(EVP_PKEY_CTX_new_from_pkey(nullptr, key.Unwrap().get(), nullptr));
    if (!ctx || EVP_PKEY_verify_init(ctx.get()) != kOpenSslSuccess) {
        return Result<bool, SessionFailure>::Err(SessionFailure::CryptoFailure(
            std::format("Failed to initialise ECDSA verification: {}", GetOpenSSLError())));
    }
    const int verdict = EVP_PKEY_verify(ctx.get(), der.data(), der.size(), digest.data(), digest.size());
    ERR_clear_error();
    return Result<bool, SessionFailure>::Ok(verdict == kOpenSslSuccess);
}

}  // namespace peerwire::crypto

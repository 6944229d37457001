#include <catch2/catch_test_macros.hpp>
#include "peerwire/core/constants.hpp"
#include "peerwire/crypto/ecies.hpp"
#include "peerwire/crypto/sodium_interop.hpp"
#include "peerwire/models/key_materials/static_identity.hpp"
using namespace peerwire;
using namespace peerwire::crypto;
using namespace peerwire::models;
namespace {
    Result<std::vector<uint8_t>, SessionFailure> DecryptWith(
        const StaticIdentity& identity,
        std::span<const uint8_t> ciphertext,
        std::span<const uint8_t> shared_mac_data) {
        auto result = identity.WithPrivateKey([&](std::span<const uint8_t> key) {
            return Ecies::Decrypt(key, ciphertext, shared_mac_data);
        });
        if (result.IsErr()) {
            return Result<std::vector<uint8_t>, SessionFailure>::Err(std::move(result).UnwrapErr());
        }
        return std::move(result).Unwrap();
    }
}
TEST_CASE("ECIES - Round trip", "[ecies][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto recipient = StaticIdentity::Generate().Unwrap();
    const std::vector<uint8_t> plaintext = {'a', 'u', 't', 'h', ' ', 'b', 'o', 'd', 'y'};
    const std::vector<uint8_t> prefix = {0x01, 0x2C};
    SECTION("Decrypts to the original plaintext") {
        auto ciphertext = Ecies::Encrypt(recipient.PublicKey(), plaintext, prefix).Unwrap();
        REQUIRE(ciphertext.size() == plaintext.size() + kEciesOverheadBytes);
        REQUIRE(ciphertext[0] == kUncompressedPointTag);
        REQUIRE(DecryptWith(recipient, ciphertext, prefix).Unwrap() == plaintext);
    }
    SECTION("Empty plaintext") {
        auto ciphertext = Ecies::Encrypt(recipient.PublicKey(), {}, prefix).Unwrap();
        REQUIRE(ciphertext.size() == kEciesOverheadBytes);
        REQUIRE(DecryptWith(recipient, ciphertext, prefix).Unwrap().empty());
    }
    SECTION("Each encryption uses a fresh ephemeral key and IV") {
        auto first = Ecies::Encrypt(recipient.PublicKey(), plaintext, prefix).Unwrap();
        auto second = Ecies::Encrypt(recipient.PublicKey(), plaintext, prefix).Unwrap();
        REQUIRE(first != second);
    }
    SECTION("Invalid recipient key is rejected") {
        std::vector<uint8_t> bogus(kNodeIdBytes, 0x07);
        REQUIRE(Ecies::Encrypt(bogus, plaintext, prefix).IsErr());
    }
}
TEST_CASE("ECIES - Authentication failures", "[ecies][crypto][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto recipient = StaticIdentity::Generate().Unwrap();
    auto stranger = StaticIdentity::Generate().Unwrap();
    const std::vector<uint8_t> plaintext(64, 0x42);
    const std::vector<uint8_t> prefix = {0x00, 0xF1};
    auto ciphertext = Ecies::Encrypt(recipient.PublicKey(), plaintext, prefix).Unwrap();
    SECTION("Tampered body") {
        auto tampered = ciphertext;
        tampered[kUncompressedPublicKeyBytes + kEciesIvBytes + 3] ^= 0x01;
        auto result = DecryptWith(recipient, tampered, prefix);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == SessionFailureType::HandshakeFailure);
    }
    SECTION("Tampered tag") {
        auto tampered = ciphertext;
        tampered.back() ^= 0x80;
        auto result = DecryptWith(recipient, tampered, prefix);
        REQUIRE(result.UnwrapErr().type == SessionFailureType::HandshakeFailure);
    }
    SECTION("Different shared MAC data") {
        const std::vector<uint8_t> other_prefix = {0x00, 0xF2};
        auto result = DecryptWith(recipient, ciphertext, other_prefix);
        REQUIRE(result.UnwrapErr().type == SessionFailureType::HandshakeFailure);
    }
    SECTION("Wrong private key") {
        auto result = DecryptWith(stranger, ciphertext, prefix);
        REQUIRE(result.UnwrapErr().type == SessionFailureType::HandshakeFailure);
    }
    SECTION("Truncated below the overhead") {
        std::vector<uint8_t> truncated(ciphertext.begin(), ciphertext.begin() + kEciesOverheadBytes - 1);
        auto result = DecryptWith(recipient, truncated, prefix);
        REQUIRE(result.UnwrapErr().type == SessionFailureType::MalformedHandshake);
    }
    SECTION("Point prefix byte is not 0x04") {
        auto tampered = ciphertext;
        tampered[0] = 0x02;
        auto result = DecryptWith(recipient, tampered, prefix);
        REQUIRE(result.UnwrapErr().type == SessionFailureType::MalformedHandshake);
    }
}

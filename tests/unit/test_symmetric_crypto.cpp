#include <catch2/catch_test_macros.hpp>
#include "peerwire/crypto/aes_ctr.hpp"
#include "peerwire/crypto/concat_kdf.hpp"
#include "peerwire/crypto/hash.hpp"
#include "peerwire/crypto/sodium_interop.hpp"
#include <string>
using namespace peerwire;
using namespace peerwire::crypto;
namespace {
    std::vector<uint8_t> FromHex(const std::string& hex) {
        std::vector<uint8_t> bytes;
        for (size_t i = 0; i + 1 < hex.size(); i += 2) {
            bytes.push_back(static_cast<uint8_t>(std::stoi(hex.substr(i, 2), nullptr, 16)));
        }
        return bytes;
    }
    std::vector<uint8_t> Bytes(const std::string& text) {
        return {text.begin(), text.end()};
    }
}
TEST_CASE("Hash - Known answers", "[hash][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("SHA3-256 of the empty string") {
        auto digest = Hash::Sha3({});
        REQUIRE(digest.IsOk());
        REQUIRE(digest.Unwrap() == FromHex("a7ffc6f8bf1ed76651c14756a061d662f580ff4de43b49fa82d80a4b80f8434a"));
    }
    SECTION("SHA3-256 over parts equals SHA3-256 over the concatenation") {
        const auto left = Bytes("hello ");
        const auto right = Bytes("world");
        const auto whole = Bytes("hello world");
        REQUIRE(Hash::Sha3({left, right}).Unwrap() == Hash::Sha3({whole}).Unwrap());
    }
    SECTION("SHA-256 of abc") {
        REQUIRE(Hash::Sha256(Bytes("abc")).Unwrap() ==
                FromHex("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"));
    }
    SECTION("HMAC-SHA256 RFC 4231 case 2") {
        const auto key = Bytes("Jefe");
        const auto data = Bytes("what do ya want for nothing?");
        REQUIRE(Hash::HmacSha256(key, {data}).Unwrap() ==
                FromHex("5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843"));
    }
}
TEST_CASE("RollingHash - Digest does not finalise", "[hash][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto first = Bytes("first frame");
    const auto second = Bytes("second frame");
    auto rolling = RollingHash::Create().Unwrap();
    REQUIRE(rolling.Update(first).IsOk());
    REQUIRE(rolling.Digest().Unwrap() == Hash::Sha3({first}).Unwrap());
    REQUIRE(rolling.Digest().Unwrap() == Hash::Sha3({first}).Unwrap());
    REQUIRE(rolling.Update(second).IsOk());
    REQUIRE(rolling.Digest().Unwrap() == Hash::Sha3({first, second}).Unwrap());
}
TEST_CASE("ConcatKdf - Single-step derivation", "[kdf][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> z(32, 0x5A);
    SECTION("First block is SHA-256(counter 1 || z)") {
        std::vector<uint8_t> block_input = {0x00, 0x00, 0x00, 0x01};
        block_input.insert(block_input.end(), z.begin(), z.end());
        auto derived = ConcatKdf::DeriveKeyBytes(z, 32);
        REQUIRE(derived.IsOk());
        REQUIRE(derived.Unwrap() == Hash::Sha256(block_input).Unwrap());
    }
    SECTION("Longer output extends the first block") {
        auto short_key = ConcatKdf::DeriveKeyBytes(z, 32).Unwrap();
        auto long_key = ConcatKdf::DeriveKeyBytes(z, 48).Unwrap();
        REQUIRE(long_key.size() == 48);
        REQUIRE(std::vector<uint8_t>(long_key.begin(), long_key.begin() + 32) == short_key);
    }
    SECTION("Different secrets give different keys") {
        const std::vector<uint8_t> other(32, 0xA5);
        REQUIRE(ConcatKdf::DeriveKeyBytes(z, 32).Unwrap() != ConcatKdf::DeriveKeyBytes(other, 32).Unwrap());
    }
    SECTION("Oversized output is rejected") {
        REQUIRE(ConcatKdf::DeriveKeyBytes(z, ConcatKdf::MAX_OUTPUT_LEN + 1).IsErr());
    }
}
TEST_CASE("AesBlock - FIPS-197 AES-256 vector", "[aes][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto key = FromHex("000102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f");
    const auto plaintext = FromHex("00112233445566778899aabbccddeeff");
    auto block = AesBlock::Create(key).Unwrap();
    std::vector<uint8_t> output(AesBlock::BLOCK_SIZE);
    REQUIRE(block.EncryptBlock(plaintext, output).IsOk());
    REQUIRE(output == FromHex("8ea2b7ca516745bfeafc49904b496089"));
}
TEST_CASE("AesCtr - Stream cipher", "[aes][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> key(32, 0x11);
    const std::vector<uint8_t> iv(16, 0x00);
    std::vector<uint8_t> message(100);
    for (size_t i = 0; i < message.size(); ++i) {
        message[i] = static_cast<uint8_t>(i);
    }
    SECTION("Encrypting in pieces continues one keystream") {
        auto whole = AesCtr::Apply(key, iv, message).Unwrap();
        auto stream = AesCtr::Create(key, iv).Unwrap();
        auto pieces = message;
        REQUIRE(stream.Process(std::span(pieces).first(16)).IsOk());
        REQUIRE(stream.Process(std::span(pieces).subspan(16, 7)).IsOk());
        REQUIRE(stream.Process(std::span(pieces).subspan(23)).IsOk());
        REQUIRE(pieces == whole);
    }
    SECTION("Applying twice restores the plaintext") {
        auto encrypted = AesCtr::Apply(key, iv, message).Unwrap();
        REQUIRE(encrypted != message);
        REQUIRE(AesCtr::Apply(key, iv, encrypted).Unwrap() == message);
    }
    SECTION("AES-128 keys are accepted") {
        const std::vector<uint8_t> short_key(16, 0x22);
        REQUIRE(AesCtr::Apply(short_key, iv, message).IsOk());
    }
    SECTION("Bad key or IV sizes are rejected") {
        const std::vector<uint8_t> bad_key(20, 0x22);
        const std::vector<uint8_t> bad_iv(12, 0x00);
        REQUIRE(AesCtr::Create(bad_key, iv).IsErr());
        REQUIRE(AesCtr::Create(key, bad_iv).IsErr());
    }
}

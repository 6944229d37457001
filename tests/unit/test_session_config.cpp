#include <catch2/catch_test_macros.hpp>
#include "peerwire/configuration/session_config.hpp"
using namespace peerwire;
using namespace peerwire::configuration;
using namespace std::chrono_literals;
TEST_CASE("SessionConfig - Defaults", "[config]") {
    SessionConfig config;
    REQUIRE(config.client_id == kDefaultClientId);
    REQUIRE(config.protocol_version == kBaseProtocolVersion);
    REQUIRE(config.min_protocol_version == kBaseProtocolVersion);
    REQUIRE(config.handshake_timeout == kDefaultHandshakeTimeout);
    REQUIRE(config.max_frame_size == kMaxFrameSize);
    REQUIRE(config.Validate().IsOk());
}
TEST_CASE("SessionConfig - Validation", "[config]") {
    SessionConfig config;
    config.capabilities = {{"eth", 66}, {"eth", 67}, {"snap", 1}};
    REQUIRE(config.Validate().IsOk());
    auto expect_invalid = [](const SessionConfig& candidate) {
        auto result = candidate.Validate();
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == SessionFailureType::InvalidConfig);
    };
    SECTION("Empty client id") {
        config.client_id.clear();
        expect_invalid(config);
    }
    SECTION("Non-positive timeout") {
        config.handshake_timeout = 0ms;
        expect_invalid(config);
        config.handshake_timeout = -5ms;
        expect_invalid(config);
    }
    SECTION("Minimum version above own version") {
        config.min_protocol_version = config.protocol_version + 1;
        expect_invalid(config);
    }
    SECTION("Frame size limit out of range") {
        config.max_frame_size = 0;
        expect_invalid(config);
        config.max_frame_size = kMaxFrameSize + 1;
        expect_invalid(config);
    }
    SECTION("Capability name too long") {
        config.capabilities.push_back({"ninechars", 1});
        expect_invalid(config);
    }
    SECTION("Capability name empty") {
        config.capabilities.push_back({"", 1});
        expect_invalid(config);
    }
    SECTION("Duplicate capability") {
        config.capabilities.push_back({"eth", 67});
        expect_invalid(config);
    }
    SECTION("Eight-character name is allowed") {
        config.capabilities.push_back({"abcdefgh", 1});
        REQUIRE(config.Validate().IsOk());
    }
}

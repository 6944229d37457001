#pragma once
#include <cstddef>
#include <cstdint>
#include <chrono>
#include <string_view>

namespace peerwire {

inline constexpr uint32_t kBaseProtocolVersion = 5;
inline constexpr uint32_t kHandshakeVersion = 5;

inline constexpr size_t kPrivateKeyBytes = 32;
inline constexpr size_t kNodeIdBytes = 64;
inline constexpr size_t kUncompressedPublicKeyBytes = 65;
inline constexpr uint8_t kUncompressedPointTag = 0x04;
inline constexpr size_t kSharedSecretBytes = 32;
inline constexpr size_t kSignatureBytes = 64;
inline constexpr size_t kNonceBytes = 32;
inline constexpr size_t kHashBytes = 32;

inline constexpr size_t kEciesIvBytes = 16;
inline constexpr size_t kEciesCipherKeyBytes = 16;
inline constexpr size_t kEciesMacBytes = 32;
inline constexpr size_t kEciesOverheadBytes =
    kUncompressedPublicKeyBytes + kEciesIvBytes + kEciesMacBytes;

inline constexpr size_t kHandshakeSizePrefixBytes = 2;
inline constexpr size_t kMaxHandshakeMessageBytes = 2048;
inline constexpr size_t kMinHandshakePaddingBytes = 100;
inline constexpr size_t kHandshakePaddingRangeBytes = 200;

inline constexpr size_t kFrameSecretBytes = 32;
inline constexpr size_t kFrameBlockBytes = 16;
inline constexpr size_t kFrameHeaderBytes = 16;
inline constexpr size_t kFrameMacBytes = 16;
inline constexpr size_t kFrameSizeFieldBytes = 3;
inline constexpr size_t kMaxFrameSize = (size_t{1} << 24) - 1;
// RLP list [0, 0]: capability id and context id, both unused.
inline constexpr uint8_t kFrameHeaderData[] = {0xC2, 0x80, 0x80};

inline constexpr uint8_t kHelloMessageId = 0x00;
inline constexpr uint8_t kDisconnectMessageId = 0x01;
inline constexpr size_t kMaxCapabilityNameLength = 8;

inline constexpr std::chrono::seconds kDefaultHandshakeTimeout{10};
inline constexpr std::string_view kDefaultClientId = "peerwire/1.0";

}  // namespace peerwire

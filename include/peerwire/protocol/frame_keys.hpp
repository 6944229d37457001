#pragma once
#include "peerwire/crypto/hash.hpp"
#include "peerwire/crypto/secure_memory_handle.hpp"

namespace peerwire::protocol {

/**
 * Symmetric state produced by a completed handshake and consumed by
 * FrameTransport.
 *
 * aes_secret keys both AES-256-CTR streams; mac_secret keys the AES block
 * cipher that whitens the rolling MAC digests. egress_mac has absorbed
 * (mac_secret ^ remote nonce) || message-sent and ingress_mac
 * (mac_secret ^ local nonce) || message-received, so one side's egress
 * state always mirrors the other side's ingress state.
 */
struct FrameKeys {
    crypto::SecureMemoryHandle aes_secret;
    crypto::SecureMemoryHandle mac_secret;
    crypto::RollingHash egress_mac;
    crypto::RollingHash ingress_mac;
};

}  // namespace peerwire::protocol

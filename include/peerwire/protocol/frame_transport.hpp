#pragma once
#include "peerwire/core/constants.hpp"
#include "peerwire/core/failures.hpp"
#include "peerwire/core/result.hpp"
#include "peerwire/crypto/aes_ctr.hpp"
#include "peerwire/crypto/hash.hpp"
#include "peerwire/interfaces/i_byte_channel.hpp"
#include "peerwire/protocol/frame_keys.hpp"
#include <array>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <span>
#include <vector>

namespace peerwire::protocol {

/// One base-protocol message: a one-byte id followed by its payload.
struct FrameMessage {
    uint8_t id = 0;
    std::vector<uint8_t> payload;
};

/**
 * Encrypted, authenticated framing over an IByteChannel.
 *
 * Wire layout per frame:
 *   header-ct(16) || header-mac(16) || frame-ct(padded to 16) || frame-mac(16)
 *
 * Each direction has its own cipher stream, rolling MAC and mutex, so one
 * thread may send while another receives. A MAC mismatch or a malformed
 * header poisons the transport: the channel is closed and every later call
 * fails with InvalidState. A channel error or deadline expiry in the middle
 * of a frame does the same, since the two stream positions can no longer be
 * kept in step.
 */
class FrameTransport {
public:
    [[nodiscard]] static Result<std::unique_ptr<FrameTransport>, SessionFailure> Create(
        std::shared_ptr<IByteChannel> channel,
        FrameKeys keys,
        size_t max_frame_size = kMaxFrameSize);

    /**
     * Fails with MalformedFrame (transport stays usable) when the payload is
     * longer than the frame size limit.
     */
    [[nodiscard]] Result<Unit, SessionFailure> SendFrame(
        std::span<const uint8_t> payload,
        Deadline deadline);

    [[nodiscard]] Result<std::vector<uint8_t>, SessionFailure> ReceiveFrame(Deadline deadline);

    [[nodiscard]] Result<Unit, SessionFailure> SendMessage(
        uint8_t message_id,
        std::span<const uint8_t> payload,
        Deadline deadline);

    /// MalformedFrame when the frame carries no message id.
    [[nodiscard]] Result<FrameMessage, SessionFailure> ReceiveMessage(Deadline deadline);

    void Close() noexcept;

    [[nodiscard]] bool IsPoisoned() const noexcept {
        return poisoned_.load(std::memory_order_acquire);
    }

    FrameTransport(const FrameTransport&) = delete;
    FrameTransport& operator=(const FrameTransport&) = delete;
    FrameTransport(FrameTransport&&) = delete;
    FrameTransport& operator=(FrameTransport&&) = delete;
    ~FrameTransport();

private:
    struct Direction {
        Direction(crypto::AesCtr stream, crypto::AesBlock block, crypto::RollingHash rolling)
            : cipher(std::move(stream))
              , mac_cipher(std::move(block))
              , mac(std::move(rolling)) {
        }
        std::mutex mutex;
        crypto::AesCtr cipher;
        crypto::AesBlock mac_cipher;
        crypto::RollingHash mac;
    };

    using MacBlock = std::array<uint8_t, kFrameMacBytes>;

    FrameTransport(
        std::shared_ptr<IByteChannel> channel,
        std::unique_ptr<Direction> egress,
        std::unique_ptr<Direction> ingress,
        size_t max_frame_size) noexcept;

    /// Absorbs AES(mac-secret, digest[:16]) ^ header-ct; returns digest[:16].
    static Result<MacBlock, SessionFailure> UpdateHeaderMac(
        Direction& direction,
        std::span<const uint8_t> header_ciphertext);

    /// Absorbs frame-ct, then AES(mac-secret, seed) ^ seed; returns digest[:16].
    static Result<MacBlock, SessionFailure> UpdateFrameMac(
        Direction& direction,
        std::span<const uint8_t> frame_ciphertext);

    /// Marks the transport unusable and closes the channel.
    SessionFailure Poison(SessionFailure failure) noexcept;

    Result<Unit, SessionFailure> CheckUsable() const;

    std::shared_ptr<IByteChannel> channel_;
    std::unique_ptr<Direction> egress_;
    std::unique_ptr<Direction> ingress_;
    size_t max_frame_size_;
    std::atomic<bool> poisoned_{false};
    std::atomic<bool> closed_{false};
};

}  // namespace peerwire::protocol

#include "peerwire/protocol/frame_transport.hpp"
#include "peerwire/crypto/sodium_interop.hpp"
#include <algorithm>
#include <format>

namespace peerwire::protocol {
    using crypto::AesBlock;
    using crypto::AesCtr;
    using crypto::SodiumInterop;

    namespace {
        using UnitResult = Result<Unit, SessionFailure>;
        using BytesResult = Result<std::vector<uint8_t>, SessionFailure>;

        constexpr std::array<uint8_t, kFrameBlockBytes> kZeroIv{};
        constexpr size_t kFramePrefixBytes = kFrameHeaderBytes + kFrameMacBytes;

        constexpr size_t PaddedSize(const size_t size) noexcept {
            return (size + kFrameBlockBytes - 1) / kFrameBlockBytes * kFrameBlockBytes;
        }

        Result<AesCtr, SessionFailure> OpenStream(const crypto::SecureMemoryHandle& aes_secret) {
            auto stream = aes_secret.WithReadAccess([](std::span<const uint8_t> key) {
                return AesCtr::Create(key, kZeroIv);
            });
            if (stream.IsErr()) {
                return Result<AesCtr, SessionFailure>::Err(
                    SessionFailure::FromSodiumFailure(stream.UnwrapErr()));
            }
            return std::move(stream).Unwrap();
        }

        Result<AesBlock, SessionFailure> OpenMacCipher(const crypto::SecureMemoryHandle& mac_secret) {
            auto block = mac_secret.WithReadAccess([](std::span<const uint8_t> key) {
                return AesBlock::Create(key);
            });
            if (block.IsErr()) {
                return Result<AesBlock, SessionFailure>::Err(
                    SessionFailure::FromSodiumFailure(block.UnwrapErr()));
            }
            return std::move(block).Unwrap();
        }
    }

    FrameTransport::FrameTransport(
        std::shared_ptr<IByteChannel> channel,
        std::unique_ptr<Direction> egress,
        std::unique_ptr<Direction> ingress,
        const size_t max_frame_size) noexcept
        : channel_(std::move(channel))
          , egress_(std::move(egress))
          , ingress_(std::move(ingress))
          , max_frame_size_(max_frame_size) {
    }

    FrameTransport::~FrameTransport() {
        Close();
    }

    Result<std::unique_ptr<FrameTransport>, SessionFailure> FrameTransport::Create(
        std::shared_ptr<IByteChannel> channel,
        FrameKeys keys,
        const size_t max_frame_size) {
        using CreateResult = Result<std::unique_ptr<FrameTransport>, SessionFailure>;
        if (!channel) {
            return CreateResult::Err(SessionFailure::InvalidState("Frame transport needs a channel"));
        }
        if (max_frame_size == 0 || max_frame_size > kMaxFrameSize) {
            return CreateResult::Err(SessionFailure::InvalidConfig(
                std::format("Frame size limit must be in [1, {}], got {}", kMaxFrameSize, max_frame_size)));
        }

        auto egress_stream = OpenStream(keys.aes_secret);
        if (egress_stream.IsErr()) {
            return CreateResult::Err(std::move(egress_stream).UnwrapErr());
        }
        auto ingress_stream = OpenStream(keys.aes_secret);
        if (ingress_stream.IsErr()) {
            return CreateResult::Err(std::move(ingress_stream).UnwrapErr());
        }
        auto egress_block = OpenMacCipher(keys.mac_secret);
        if (egress_block.IsErr()) {
            return CreateResult::Err(std::move(egress_block).UnwrapErr());
        }
        auto ingress_block = OpenMacCipher(keys.mac_secret);
        if (ingress_block.IsErr()) {
            return CreateResult::Err(std::move(ingress_block).UnwrapErr());
        }

        auto egress = std::make_unique<Direction>(
            std::move(egress_stream).Unwrap(),
            std::move(egress_block).Unwrap(),
            std::move(keys.egress_mac));
        auto ingress = std::make_unique<Direction>(
            std::move(ingress_stream).Unwrap(),
            std::move(ingress_block).Unwrap(),
            std::move(keys.ingress_mac));
        return CreateResult::Ok(std::unique_ptr<FrameTransport>(new FrameTransport(
            std::move(channel), std::move(egress), std::move(ingress), max_frame_size)));
    }

    Result<FrameTransport::MacBlock, SessionFailure> FrameTransport::UpdateHeaderMac(
        Direction& direction,
        std::span<const uint8_t> header_ciphertext) {
        using MacResult = Result<MacBlock, SessionFailure>;
        auto digest = direction.mac.Digest();
        if (digest.IsErr()) {
            return MacResult::Err(std::move(digest).UnwrapErr());
        }
        MacBlock seed{};
        PEERWIRE_TRY(MacResult, direction.mac_cipher.EncryptBlock(
            std::span<const uint8_t>(digest.Unwrap()).first(kFrameMacBytes), seed));
        for (size_t i = 0; i < seed.size(); ++i) {
            seed[i] ^= header_ciphertext[i];
        }
        PEERWIRE_TRY(MacResult, direction.mac.Update(seed));
        auto updated = direction.mac.Digest();
        if (updated.IsErr()) {
            return MacResult::Err(std::move(updated).UnwrapErr());
        }
        MacBlock tag{};
        std::copy_n(updated.Unwrap().begin(), kFrameMacBytes, tag.begin());
        return MacResult::Ok(tag);
    }

    Result<FrameTransport::MacBlock, SessionFailure> FrameTransport::UpdateFrameMac(
        Direction& direction,
        std::span<const uint8_t> frame_ciphertext) {
        using MacResult = Result<MacBlock, SessionFailure>;
        PEERWIRE_TRY(MacResult, direction.mac.Update(frame_ciphertext));
        auto digest = direction.mac.Digest();
        if (digest.IsErr()) {
            return MacResult::Err(std::move(digest).UnwrapErr());
        }
        const auto seed = std::span<const uint8_t>(digest.Unwrap()).first(kFrameMacBytes);
        MacBlock whitened{};
        PEERWIRE_TRY(MacResult, direction.mac_cipher.EncryptBlock(seed, whitened));
        for (size_t i = 0; i < whitened.size(); ++i) {
            whitened[i] ^= seed[i];
        }
        PEERWIRE_TRY(MacResult, direction.mac.Update(whitened));
        auto updated = direction.mac.Digest();
        if (updated.IsErr()) {
            return MacResult::Err(std::move(updated).UnwrapErr());
        }
        MacBlock tag{};
        std::copy_n(updated.Unwrap().begin(), kFrameMacBytes, tag.begin());
        return MacResult::Ok(tag);
    }

    SessionFailure FrameTransport::Poison(SessionFailure failure) noexcept {
        poisoned_.store(true, std::memory_order_release);
        channel_->Close();
        return failure;
    }

    Result<Unit, SessionFailure> FrameTransport::CheckUsable() const {
        if (closed_.load(std::memory_order_acquire)) {
            return UnitResult::Err(SessionFailure::InvalidState("Frame transport is closed"));
        }
        if (poisoned_.load(std::memory_order_acquire)) {
            return UnitResult::Err(SessionFailure::InvalidState(
                "Frame transport was poisoned by an earlier failure"));
        }
        return UnitResult::Ok(unit);
    }

    Result<Unit, SessionFailure> FrameTransport::SendFrame(
        std::span<const uint8_t> payload,
        const Deadline deadline) {
        PEERWIRE_TRY(UnitResult, CheckUsable());
        if (payload.size() > max_frame_size_) {
            return UnitResult::Err(SessionFailure::MalformedFrame(
                std::format("Frame payload of {} bytes exceeds the {} byte limit", payload.size(), max_frame_size_)));
        }

        std::lock_guard<std::mutex> lock(egress_->mutex);
        PEERWIRE_TRY(UnitResult, CheckUsable());
        Direction& out = *egress_;

        const size_t padded = PaddedSize(payload.size());
        std::vector<uint8_t> wire(kFramePrefixBytes + padded + kFrameMacBytes, 0);
        const std::span<uint8_t> header = std::span(wire).first(kFrameHeaderBytes);
        header[0] = static_cast<uint8_t>((payload.size() >> 16) & 0xFF);
        header[1] = static_cast<uint8_t>((payload.size() >> 8) & 0xFF);
        header[2] = static_cast<uint8_t>(payload.size() & 0xFF);
        std::copy(std::begin(kFrameHeaderData), std::end(kFrameHeaderData), header.begin() + kFrameSizeFieldBytes);

        if (auto encrypted = out.cipher.Process(header); encrypted.IsErr()) {
            return UnitResult::Err(Poison(std::move(encrypted).UnwrapErr()));
        }
        auto header_mac = UpdateHeaderMac(out, header);
        if (header_mac.IsErr()) {
            return UnitResult::Err(Poison(std::move(header_mac).UnwrapErr()));
        }
        std::copy(header_mac.Unwrap().begin(), header_mac.Unwrap().end(), wire.begin() + kFrameHeaderBytes);

        const std::span<uint8_t> body = std::span(wire).subspan(kFramePrefixBytes, padded);
        std::copy(payload.begin(), payload.end(), body.begin());
        if (auto encrypted = out.cipher.Process(body); encrypted.IsErr()) {
            return UnitResult::Err(Poison(std::move(encrypted).UnwrapErr()));
        }
        auto frame_mac = UpdateFrameMac(out, body);
        if (frame_mac.IsErr()) {
            return UnitResult::Err(Poison(std::move(frame_mac).UnwrapErr()));
        }
        std::copy(frame_mac.Unwrap().begin(), frame_mac.Unwrap().end(), wire.end() - kFrameMacBytes);

        if (auto written = channel_->WriteAll(wire, deadline); written.IsErr()) {
            return UnitResult::Err(Poison(std::move(written).UnwrapErr()));
        }
        return UnitResult::Ok(unit);
    }

    Result<std::vector<uint8_t>, SessionFailure> FrameTransport::ReceiveFrame(const Deadline deadline) {
        PEERWIRE_TRY(BytesResult, CheckUsable());
        std::lock_guard<std::mutex> lock(ingress_->mutex);
        PEERWIRE_TRY(BytesResult, CheckUsable());
        Direction& in = *ingress_;

        std::array<uint8_t, kFramePrefixBytes> prefix{};
        if (auto read = channel_->ReadExact(prefix, deadline); read.IsErr()) {
            return BytesResult::Err(Poison(std::move(read).UnwrapErr()));
        }
        const auto header_ciphertext = std::span<const uint8_t>(prefix).first(kFrameHeaderBytes);
        const auto received_header_mac = std::span<const uint8_t>(prefix).last(kFrameMacBytes);

        auto expected_header_mac = UpdateHeaderMac(in, header_ciphertext);
        if (expected_header_mac.IsErr()) {
            return BytesResult::Err(Poison(std::move(expected_header_mac).UnwrapErr()));
        }
        if (!SodiumInterop::ConstantTimeEquals(expected_header_mac.Unwrap(), received_header_mac)) {
            return BytesResult::Err(Poison(SessionFailure::MacMismatch("Frame header MAC mismatch")));
        }

        std::array<uint8_t, kFrameHeaderBytes> header{};
        std::copy(header_ciphertext.begin(), header_ciphertext.end(), header.begin());
        if (auto decrypted = in.cipher.Process(header); decrypted.IsErr()) {
            return BytesResult::Err(Poison(std::move(decrypted).UnwrapErr()));
        }
        const size_t frame_size = (static_cast<size_t>(header[0]) << 16) |
                                  (static_cast<size_t>(header[1]) << 8) |
                                  static_cast<size_t>(header[2]);
        if (frame_size > max_frame_size_) {
            return BytesResult::Err(Poison(SessionFailure::MalformedFrame(
                std::format("Frame of {} bytes exceeds the {} byte limit", frame_size, max_frame_size_))));
        }

        const size_t padded = PaddedSize(frame_size);
        std::vector<uint8_t> body(padded + kFrameMacBytes);
        if (auto read = channel_->ReadExact(body, deadline); read.IsErr()) {
            return BytesResult::Err(Poison(std::move(read).UnwrapErr()));
        }
        const std::span<uint8_t> frame_ciphertext = std::span(body).first(padded);
        const auto received_frame_mac = std::span<const uint8_t>(body).last(kFrameMacBytes);

        auto expected_frame_mac = UpdateFrameMac(in, frame_ciphertext);
        if (expected_frame_mac.IsErr()) {
            return BytesResult::Err(Poison(std::move(expected_frame_mac).UnwrapErr()));
        }
        if (!SodiumInterop::ConstantTimeEquals(expected_frame_mac.Unwrap(), received_frame_mac)) {
            return BytesResult::Err(Poison(SessionFailure::MacMismatch("Frame body MAC mismatch")));
        }
        if (auto decrypted = in.cipher.Process(frame_ciphertext); decrypted.IsErr()) {
            return BytesResult::Err(Poison(std::move(decrypted).UnwrapErr()));
        }
        body.resize(frame_size);
        return BytesResult::Ok(std::move(body));
    }

    Result<Unit, SessionFailure> FrameTransport::SendMessage(
        const uint8_t message_id,
        std::span<const uint8_t> payload,
        const Deadline deadline) {
        std::vector<uint8_t> frame;
        frame.reserve(payload.size() + 1);
        frame.push_back(message_id);
        frame.insert(frame.end(), payload.begin(), payload.end());
        return SendFrame(frame, deadline);
    }

    Result<FrameMessage, SessionFailure> FrameTransport::ReceiveMessage(const Deadline deadline) {
        using MessageResult = Result<FrameMessage, SessionFailure>;
        auto frame = ReceiveFrame(deadline);
        if (frame.IsErr()) {
            return MessageResult::Err(std::move(frame).UnwrapErr());
        }
        std::vector<uint8_t> bytes = std::move(frame).Unwrap();
        if (bytes.empty()) {
            return MessageResult::Err(Poison(SessionFailure::MalformedFrame("Frame carries no message id")));
        }
        FrameMessage message;
        message.id = bytes.front();
        message.payload.assign(bytes.begin() + 1, bytes.end());
        return MessageResult::Ok(std::move(message));
    }

    void FrameTransport::Close() noexcept {
        closed_.store(true, std::memory_order_release);
        channel_->Close();
    }
}

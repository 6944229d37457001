#pragma once
#include "peerwire/core/failures.hpp"
#include "peerwire/core/result.hpp"
#include "peerwire/interfaces/i_byte_channel.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace peerwire::transport {

/**
 * IByteChannel over a connected, non-blocking POSIX TCP socket.
 *
 * Reads and writes wait in poll() until the deadline. Close() shuts the
 * socket down, which wakes any thread blocked in ReadExact or WriteAll; the
 * descriptor itself is released by the destructor.
 */
class TcpChannel final : public IByteChannel {
public:
    /// Resolves `host` and connects, bounded by `deadline`.
    [[nodiscard]] static Result<std::shared_ptr<TcpChannel>, SessionFailure> Connect(
        const std::string& host,
        uint16_t port,
        Deadline deadline);

    /// Takes ownership of an already connected socket.
    [[nodiscard]] static Result<std::shared_ptr<TcpChannel>, SessionFailure> Adopt(int fd);

    [[nodiscard]] Result<Unit, SessionFailure> ReadExact(
        std::span<uint8_t> buffer,
        Deadline deadline) override;

    [[nodiscard]] Result<Unit, SessionFailure> WriteAll(
        std::span<const uint8_t> data,
        Deadline deadline) override;

    void Close() noexcept override;

    [[nodiscard]] bool IsOpen() const noexcept override;

    TcpChannel(const TcpChannel&) = delete;
    TcpChannel& operator=(const TcpChannel&) = delete;
    ~TcpChannel() override;

private:
    explicit TcpChannel(int fd) noexcept;

    int fd_;
    std::atomic<bool> closed_{false};
};

/// Listening TCP socket handing out TcpChannels.
class TcpListener {
public:
    /// Port 0 picks an ephemeral port; see Port().
    [[nodiscard]] static Result<std::unique_ptr<TcpListener>, SessionFailure> Bind(
        const std::string& host,
        uint16_t port);

    [[nodiscard]] Result<std::shared_ptr<TcpChannel>, SessionFailure> Accept(Deadline deadline);

    [[nodiscard]] uint16_t Port() const noexcept {
        return port_;
    }

    void Close() noexcept;

    TcpListener(const TcpListener&) = delete;
    TcpListener& operator=(const TcpListener&) = delete;
    ~TcpListener();

private:
    TcpListener(int fd, uint16_t port) noexcept;

    int fd_;
    uint16_t port_;
    std::atomic<bool> closed_{false};
};

}  // namespace peerwire::transport

#include "peerwire/transport/tcp_channel.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <climits>
#include <format>
#include <string>
#include <system_error>

namespace peerwire::transport {

    namespace {
        using UnitResult = Result<Unit, SessionFailure>;
        using ChannelResult = Result<std::shared_ptr<TcpChannel>, SessionFailure>;

        constexpr int kListenBacklog = 16;

        std::string ErrnoMessage(const int error) {
            return std::error_code(error, std::generic_category()).message();
        }

        bool SetNonBlocking(const int fd) noexcept {
            const int flags = fcntl(fd, F_GETFL, 0);
            return flags != -1 && fcntl(fd, F_SETFL, flags | O_NONBLOCK) != -1;
        }

        /// Milliseconds until `deadline`, rounded up so poll never spins; -1 once it has passed.
        int PollTimeout(const Deadline deadline) noexcept {
            const auto remaining = deadline - std::chrono::steady_clock::now();
            if (remaining <= Deadline::duration::zero()) {
                return -1;
            }
            const auto ms = std::chrono::ceil<std::chrono::milliseconds>(remaining).count();
            return ms > INT_MAX ? INT_MAX : static_cast<int>(ms);
        }

        /// Waits for `events` on `fd`; Ok(true) when ready, Ok(false) on timeout.
        Result<bool, SessionFailure> WaitFor(const int fd, const short events, const Deadline deadline) {
            for (;;) {
                const int timeout = PollTimeout(deadline);
                if (timeout < 0) {
                    return Result<bool, SessionFailure>::Ok(false);
                }
                pollfd descriptor{fd, events, 0};
                const int rc = ::poll(&descriptor, 1, timeout);
                if (rc > 0) {
                    return Result<bool, SessionFailure>::Ok(true);
                }
                if (rc < 0 && errno != EINTR) {
                    return Result<bool, SessionFailure>::Err(
                        SessionFailure::IoFailure(std::format("poll failed: {}", ErrnoMessage(errno))));
                }
            }
        }

        struct AddrInfoDeleter {
            void operator()(addrinfo* info) const noexcept {
                freeaddrinfo(info);
            }
        };
        using AddrInfoPtr = std::unique_ptr<addrinfo, AddrInfoDeleter>;

        Result<AddrInfoPtr, SessionFailure> Resolve(const std::string& host, const uint16_t port, const bool passive) {
            addrinfo hints{};
            hints.ai_family = AF_UNSPEC;
            hints.ai_socktype = SOCK_STREAM;
            if (passive) {
                hints.ai_flags = AI_PASSIVE;
            }
            addrinfo* found = nullptr;
            const std::string service = std::to_string(port);
            const int rc = getaddrinfo(host.empty() ? nullptr : host.c_str(), service.c_str(), &hints, &found);
            if (rc != 0) {
                return Result<AddrInfoPtr, SessionFailure>::Err(SessionFailure::IoFailure(
                    std::format("Cannot resolve {}:{}: {}", host, port, gai_strerror(rc))));
            }
            return Result<AddrInfoPtr, SessionFailure>::Ok(AddrInfoPtr(found));
        }
    }

    TcpChannel::TcpChannel(const int fd) noexcept
        : fd_(fd) {
    }

    TcpChannel::~TcpChannel() {
        Close();
        ::close(fd_);
    }

    Result<std::shared_ptr<TcpChannel>, SessionFailure> TcpChannel::Adopt(const int fd) {
        if (fd < 0) {
            return ChannelResult::Err(SessionFailure::InvalidState("Invalid socket descriptor"));
        }
        if (!SetNonBlocking(fd)) {
            const int error = errno;
            ::close(fd);
            return ChannelResult::Err(SessionFailure::IoFailure(
                std::format("Cannot make socket non-blocking: {}", ErrnoMessage(error))));
        }
        const int enabled = 1;
        if (setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &enabled, sizeof(enabled)) == -1) {
            const int error = errno;
            ::close(fd);
            return ChannelResult::Err(SessionFailure::IoFailure(
                std::format("Cannot set TCP_NODELAY: {}", ErrnoMessage(error))));
        }
        return ChannelResult::Ok(std::shared_ptr<TcpChannel>(new TcpChannel(fd)));
    }

    Result<std::shared_ptr<TcpChannel>, SessionFailure> TcpChannel::Connect(
        const std::string& host,
        const uint16_t port,
        const Deadline deadline) {
        auto resolved = Resolve(host, port, false);
        if (resolved.IsErr()) {
            return ChannelResult::Err(std::move(resolved).UnwrapErr());
        }

        std::string last_error = "no usable address";
        for (const addrinfo* candidate = resolved.Unwrap().get(); candidate; candidate = candidate->ai_next) {
            const int fd = ::socket(candidate->ai_family, candidate->ai_socktype, candidate->ai_protocol);
            if (fd == -1) {
                last_error = ErrnoMessage(errno);
                continue;
            }
            if (!SetNonBlocking(fd)) {
                last_error = ErrnoMessage(errno);
                ::close(fd);
                continue;
            }
            if (::connect(fd, candidate->ai_addr, candidate->ai_addrlen) == -1 && errno != EINPROGRESS) {
                last_error = ErrnoMessage(errno);
                ::close(fd);
                continue;
            }

            auto writable = WaitFor(fd, POLLOUT, deadline);
            if (writable.IsErr()) {
                ::close(fd);
                return ChannelResult::Err(std::move(writable).UnwrapErr());
            }
            if (!writable.Unwrap()) {
                ::close(fd);
                return ChannelResult::Err(SessionFailure::HandshakeTimeout(
                    std::format("Connecting to {}:{} timed out", host, port)));
            }
            int error = 0;
            socklen_t length = sizeof(error);
            if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &error, &length) == -1) {
                error = errno;
            }
            if (error != 0) {
                last_error = ErrnoMessage(error);
                ::close(fd);
                continue;
            }
            return Adopt(fd);
        }
        return ChannelResult::Err(SessionFailure::IoFailure(
            std::format("Cannot connect to {}:{}: {}", host, port, last_error)));
    }

    Result<Unit, SessionFailure> TcpChannel::ReadExact(std::span<uint8_t> buffer, const Deadline deadline) {
        size_t offset = 0;
        while (offset < buffer.size()) {
            if (closed_.load(std::memory_order_acquire)) {
                return UnitResult::Err(SessionFailure::IoFailure("Channel is closed"));
            }
            auto readable = WaitFor(fd_, POLLIN, deadline);
            if (readable.IsErr()) {
                return UnitResult::Err(std::move(readable).UnwrapErr());
            }
            if (!readable.Unwrap()) {
                return UnitResult::Err(SessionFailure::HandshakeTimeout(
                    std::format("Read timed out with {} of {} bytes received", offset, buffer.size())));
            }
            const ssize_t n = ::recv(fd_, buffer.data() + offset, buffer.size() - offset, 0);
            if (n > 0) {
                offset += static_cast<size_t>(n);
                continue;
            }
            if (n == 0) {
                return UnitResult::Err(SessionFailure::IoFailure(closed_.load(std::memory_order_acquire)
                                                                     ? "Channel is closed"
                                                                     : "Connection closed by peer"));
            }
            if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                return UnitResult::Err(SessionFailure::IoFailure(
                    std::format("recv failed: {}", ErrnoMessage(errno))));
            }
        }
        return UnitResult::Ok(unit);
    }

    Result<Unit, SessionFailure> TcpChannel::WriteAll(std::span<const uint8_t> data, const Deadline deadline) {
        size_t offset = 0;
        while (offset < data.size()) {
            if (closed_.load(std::memory_order_acquire)) {
                return UnitResult::Err(SessionFailure::IoFailure("Channel is closed"));
            }
            auto writable = WaitFor(fd_, POLLOUT, deadline);
            if (writable.IsErr()) {
                return UnitResult::Err(std::move(writable).UnwrapErr());
            }
            if (!writable.Unwrap()) {
                return UnitResult::Err(SessionFailure::HandshakeTimeout(
                    std::format("Write timed out with {} of {} bytes sent", offset, data.size())));
            }
            const ssize_t n = ::send(fd_, data.data() + offset, data.size() - offset, MSG_NOSIGNAL);
            if (n >= 0) {
                offset += static_cast<size_t>(n);
                continue;
            }
            if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                return UnitResult::Err(SessionFailure::IoFailure(
                    std::format("send failed: {}", ErrnoMessage(errno))));
            }
        }
        return UnitResult::Ok(unit);
    }

    void TcpChannel::Close() noexcept {
        if (!closed_.exchange(true, std::memory_order_acq_rel)) {
            static_cast<void>(::shutdown(fd_, SHUT_RDWR));
        }
    }

    bool TcpChannel::IsOpen() const noexcept {
        return !closed_.load(std::memory_order_acquire);
    }

    TcpListener::TcpListener(const int fd, const uint16_t port) noexcept
        : fd_(fd)
          , port_(port) {
    }

    TcpListener::~TcpListener() {
        Close();
        ::close(fd_);
    }

    Result<std::unique_ptr<TcpListener>, SessionFailure> TcpListener::Bind(
        const std::string& host,
        const uint16_t port) {
        using ListenerResult = Result<std::unique_ptr<TcpListener>, SessionFailure>;
        auto resolved = Resolve(host, port, true);
        if (resolved.IsErr()) {
            return ListenerResult::Err(std::move(resolved).UnwrapErr());
        }

        std::string last_error = "no usable address";
        for (const addrinfo* candidate = resolved.Unwrap().get(); candidate; candidate = candidate->ai_next) {
            const int fd = ::socket(candidate->ai_family, candidate->ai_socktype, candidate->ai_protocol);
            if (fd == -1) {
                last_error = ErrnoMessage(errno);
                continue;
            }
            const int enabled = 1;
            if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &enabled, sizeof(enabled)) == -1 ||
                ::bind(fd, candidate->ai_addr, candidate->ai_addrlen) == -1 ||
                ::listen(fd, kListenBacklog) == -1 ||
                !SetNonBlocking(fd)) {
                last_error = ErrnoMessage(errno);
                ::close(fd);
                continue;
            }

            sockaddr_storage bound{};
            socklen_t length = sizeof(bound);
            if (getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &length) == -1) {
                last_error = ErrnoMessage(errno);
                ::close(fd);
                continue;
            }
            const uint16_t bound_port = bound.ss_family == AF_INET6
                                            ? ntohs(reinterpret_cast<const sockaddr_in6*>(&bound)->sin6_port)
                                            : ntohs(reinterpret_cast<const sockaddr_in*>(&bound)->sin_port);
            return ListenerResult::Ok(std::unique_ptr<TcpListener>(new TcpListener(fd, bound_port)));
        }
        return ListenerResult::Err(SessionFailure::IoFailure(
            std::format("Cannot listen on {}:{}: {}", host, port, last_error)));
    }

    Result<std::shared_ptr<TcpChannel>, SessionFailure> TcpListener::Accept(const Deadline deadline) {
        for (;;) {
            if (closed_.load(std::memory_order_acquire)) {
                return ChannelResult::Err(SessionFailure::IoFailure("Listener is closed"));
            }
            auto readable = WaitFor(fd_, POLLIN, deadline);
            if (readable.IsErr()) {
                return ChannelResult::Err(std::move(readable).UnwrapErr());
            }
            if (!readable.Unwrap()) {
                return ChannelResult::Err(SessionFailure::HandshakeTimeout("No inbound connection before the deadline"));
            }
            const int fd = ::accept(fd_, nullptr, nullptr);
            if (fd >= 0) {
                return TcpChannel::Adopt(fd);
            }
            if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR && errno != ECONNABORTED) {
                return ChannelResult::Err(SessionFailure::IoFailure(
                    std::format("accept failed: {}", ErrnoMessage(errno))));
            }
        }
    }

    void TcpListener::Close() noexcept {
        if (!closed_.exchange(true, std::memory_order_acq_rel)) {
            static_cast<void>(::shutdown(fd_, SHUT_RDWR));
        }
    }
}

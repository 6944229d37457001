#pragma once
#include "peerwire/core/result.hpp"
#include "peerwire/core/failures.hpp"
#include <chrono>
#include <cstdint>
#include <span>
namespace peerwire {
using Deadline = std::chrono::steady_clock::time_point;
/**
 * Duplex byte stream consumed by the handshake and frame layers.
 *
 * ReadExact and WriteAll report HandshakeTimeout when `deadline` passes
 * first and IoFailure on EOF, reset or a closed channel. Close() must be
 * safe to call from another thread while a read or write is blocked, and
 * must make that call return promptly.
 */
class IByteChannel {
public:
    virtual ~IByteChannel() = default;
    virtual Result<Unit, SessionFailure> ReadExact(std::span<uint8_t> buffer, Deadline deadline) = 0;
    virtual Result<Unit, SessionFailure> WriteAll(std::span<const uint8_t> data, Deadline deadline) = 0;
    virtual void Close() noexcept = 0;
    [[nodiscard]] virtual bool IsOpen() const noexcept = 0;
};
}

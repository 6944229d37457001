#pragma once
#include "peerwire/interfaces/i_byte_channel.hpp"
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace peerwire::test {

/// One direction of an in-memory connection.
struct BytePipe {
    std::mutex mutex;
    std::condition_variable ready;
    std::deque<uint8_t> bytes;
    bool closed = false;
};

/**
 * In-process IByteChannel. Two channels made by CreatePair() are connected
 * back to back. Every write is recorded, and an optional filter may rewrite
 * the bytes before they reach the peer.
 */
class MemoryChannel final : public IByteChannel {
public:
    using WriteFilter = std::function<void(std::vector<uint8_t>&)>;

    static std::pair<std::shared_ptr<MemoryChannel>, std::shared_ptr<MemoryChannel>> CreatePair() {
        auto forward = std::make_shared<BytePipe>();
        auto backward = std::make_shared<BytePipe>();
        return {
            std::make_shared<MemoryChannel>(backward, forward),
            std::make_shared<MemoryChannel>(forward, backward)
        };
    }

    MemoryChannel(std::shared_ptr<BytePipe> inbound, std::shared_ptr<BytePipe> outbound)
        : inbound_(std::move(inbound)), outbound_(std::move(outbound)) {}

    Result<Unit, SessionFailure> ReadExact(std::span<uint8_t> buffer, Deadline deadline) override {
        std::unique_lock<std::mutex> lock(inbound_->mutex);
        const bool ready = inbound_->ready.wait_until(lock, deadline, [&] {
            return inbound_->bytes.size() >= buffer.size() || inbound_->closed || IsClosedLocally();
        });
        if (IsClosedLocally()) {
            return Result<Unit, SessionFailure>::Err(SessionFailure::IoFailure("Channel is closed"));
        }
        if (inbound_->bytes.size() < buffer.size()) {
            if (!ready) {
                return Result<Unit, SessionFailure>::Err(SessionFailure::HandshakeTimeout("Read deadline passed"));
            }
            return Result<Unit, SessionFailure>::Err(SessionFailure::IoFailure("Peer closed the channel"));
        }
        for (auto& byte : buffer) {
            byte = inbound_->bytes.front();
            inbound_->bytes.pop_front();
        }
        return Result<Unit, SessionFailure>::Ok(unit);
    }

    Result<Unit, SessionFailure> WriteAll(std::span<const uint8_t> data, Deadline) override {
        std::vector<uint8_t> bytes(data.begin(), data.end());
        {
            std::lock_guard<std::mutex> lock(record_mutex_);
            if (filter_) {
                filter_(bytes);
            }
            written_.insert(written_.end(), data.begin(), data.end());
        }
        std::lock_guard<std::mutex> lock(outbound_->mutex);
        if (IsClosedLocally() || outbound_->closed) {
            return Result<Unit, SessionFailure>::Err(SessionFailure::IoFailure("Channel is closed"));
        }
        outbound_->bytes.insert(outbound_->bytes.end(), bytes.begin(), bytes.end());
        outbound_->ready.notify_all();
        return Result<Unit, SessionFailure>::Ok(unit);
    }

    void Close() noexcept override {
        {
            std::lock_guard<std::mutex> lock(record_mutex_);
            closed_ = true;
        }
        for (const auto& pipe : {inbound_, outbound_}) {
            std::lock_guard<std::mutex> lock(pipe->mutex);
            pipe->closed = true;
            pipe->ready.notify_all();
        }
    }

    [[nodiscard]] bool IsOpen() const noexcept override {
        return !IsClosedLocally();
    }

    void SetWriteFilter(WriteFilter filter) {
        std::lock_guard<std::mutex> lock(record_mutex_);
        filter_ = std::move(filter);
    }

    /// Everything handed to WriteAll so far, before filtering.
    std::vector<uint8_t> Written() const {
        std::lock_guard<std::mutex> lock(record_mutex_);
        return written_;
    }

private:
    bool IsClosedLocally() const noexcept {
        std::lock_guard<std::mutex> lock(record_mutex_);
        return closed_;
    }

    std::shared_ptr<BytePipe> inbound_;
    std::shared_ptr<BytePipe> outbound_;
    mutable std::mutex record_mutex_;
    WriteFilter filter_;
    std::vector<uint8_t> written_;
    bool closed_ = false;
};

inline Deadline DeadlineIn(std::chrono::milliseconds timeout) {
    return std::chrono::steady_clock::now() + timeout;
}

}  // namespace peerwire::test

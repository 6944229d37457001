#pragma once
#include "peerwire/core/result.hpp"
#include "peerwire/core/failures.hpp"
#include <cstdint>
#include <limits>
#include <span>
#include <string>
#include <utility>
#include <vector>
namespace google::protobuf {
    class Message;
}
namespace peerwire::utilities {
class ProtoCodec {
public:
    /// Serialises with deterministic field and map ordering so equal messages
    /// always produce equal bytes.
    [[nodiscard]] static Result<std::vector<uint8_t>, SessionFailure> SerializeDeterministic(
        const google::protobuf::Message& message);
    [[nodiscard]] static std::span<const uint8_t> AsBytes(const std::string& field) noexcept {
        return {reinterpret_cast<const uint8_t*>(field.data()), field.size()};
    }
    /// Parses a generated message; `on_failure` is returned when the bytes
    /// are not a valid encoding.
    template<typename Message>
    [[nodiscard]] static Result<Message, SessionFailure> Parse(
        std::span<const uint8_t> bytes,
        SessionFailure on_failure) {
        Message message;
        if (bytes.size() > static_cast<size_t>(std::numeric_limits<int>::max()) ||
            !message.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
            return Result<Message, SessionFailure>::Err(std::move(on_failure));
        }
        return Result<Message, SessionFailure>::Ok(std::move(message));
    }
private:
    ProtoCodec() = delete;
};
}

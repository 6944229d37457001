#include "peerwire/configuration/session_config.hpp"

#include <algorithm>
#include <format>

namespace peerwire::configuration {

Result<Unit, SessionFailure> SessionConfig::Validate() const {
    using UnitResult = Result<Unit, SessionFailure>;

    if (client_id.empty()) {
        return UnitResult::Err(SessionFailure::InvalidConfig("client_id must not be empty"));
    }
    if (handshake_timeout.count() <= 0) {
        return UnitResult::Err(SessionFailure::InvalidConfig(
            std::format("handshake_timeout must be positive, got {}ms", handshake_timeout.count())));
    }
    if (min_protocol_version > protocol_version) {
        return UnitResult::Err(SessionFailure::InvalidConfig(
            std::format("min_protocol_version {} exceeds protocol_version {}",
                min_protocol_version, protocol_version)));
    }
    if (max_frame_size == 0 || max_frame_size > kMaxFrameSize) {
        return UnitResult::Err(SessionFailure::InvalidConfig(
            std::format("max_frame_size must be in [1, {}], got {}", kMaxFrameSize, max_frame_size)));
    }
    for (const auto& capability : capabilities) {
        if (capability.name.empty() || capability.name.size() > kMaxCapabilityNameLength) {
            return UnitResult::Err(SessionFailure::InvalidConfig(
                std::format("capability name '{}' must be 1 to {} characters",
                    capability.name, kMaxCapabilityNameLength)));
        }
    }
    std::vector<models::Capability> sorted = capabilities;
    std::sort(sorted.begin(), sorted.end());
    if (const auto dup = std::adjacent_find(sorted.begin(), sorted.end()); dup != sorted.end()) {
        return UnitResult::Err(SessionFailure::InvalidConfig(
            std::format("capability {}/{} listed twice", dup->name, dup->version)));
    }
    return UnitResult::Ok(unit);
}

}  // namespace peerwire::configuration

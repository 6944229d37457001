#pragma once

#include <spdlog/spdlog.h>

#include <cstdint>
#include <memory>
#include <span>
#include <string>

namespace peerwire::logging {

/**
 * Creates a console logger. The logger is not registered in spdlog's global
 * registry; callers hand it to whatever needs it.
 */
std::shared_ptr<spdlog::logger> CreateLogger(
    const std::string& name,
    spdlog::level::level_enum level = spdlog::level::info);

/// A logger that discards everything.
std::shared_ptr<spdlog::logger> CreateNullLogger(const std::string& name = "null");

/// First four bytes of a node id as hex, followed by "..".
std::string ShortId(std::span<const uint8_t> node_id);

}  // namespace peerwire::logging

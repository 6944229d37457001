#include "peerwire/logging/logger.hpp"

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>

namespace peerwire::logging {

namespace {
    constexpr size_t kShortIdBytes = 4;
    constexpr char kConsolePattern[] = "[%H:%M:%S.%e] [%n] [%^%l%$] %v";
}

std::shared_ptr<spdlog::logger> CreateLogger(
    const std::string& name,
    spdlog::level::level_enum level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern(kConsolePattern);
    auto logger = std::make_shared<spdlog::logger>(name, std::move(console_sink));
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    return logger;
}

std::shared_ptr<spdlog::logger> CreateNullLogger(const std::string& name) {
    return std::make_shared<spdlog::logger>(name, std::make_shared<spdlog::sinks::null_sink_mt>());
}

std::string ShortId(std::span<const uint8_t> node_id) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string result;
    const size_t count = std::min(node_id.size(), kShortIdBytes);
    result.reserve(count * 2 + 2);
    for (size_t i = 0; i < count; ++i) {
        result.push_back(hex_chars[(node_id[i] >> 4) & 0x0F]);
        result.push_back(hex_chars[node_id[i] & 0x0F]);
    }
    result += "..";
    return result;
}

}  // namespace peerwire::logging

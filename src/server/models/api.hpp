#ifndef TYPHON_SERVER_MODELS_API_HPP
#define TYPHON_SERVER_MODELS_API_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

#include <fmt/format.h>
#include "atom/type/json.hpp"

namespace typhon::models::api {

using json = nlohmann::json;

/**
 * @brief Generate a unique request ID for tracking
 * Format: {timestamp_hex}-{counter_hex}
 */
inline auto generateRequestId() -> std::string {
    static std::atomic<uint64_t> counter{0};
    auto now = std::chrono::system_clock::now();
    auto timestamp = std::chrono::duration_cast<std::chrono::milliseconds>(
                         now.time_since_epoch())
                         .count();
    return fmt::format("{:x}-{:04x}", timestamp, ++counter & 0xFFFF);
}

/**
 * @brief Create the gateway's error body
 */
inline auto makeError(const std::string& message) -> json {
    return json{{"ok", false}, {"error", message}};
}

/**
 * @brief Health check body
 */
inline auto makeHealth(const std::string& service) -> json {
    return json{{"ok", true}, {"service", service}};
}

}  // namespace typhon::models::api

#endif  // TYPHON_SERVER_MODELS_API_HPP

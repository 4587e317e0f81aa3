/*
 * normalizer.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file normalizer.hpp
 * @brief Builds the canonical ExecutionRequest from raw client input
 * @date 2024
 * @version 1.0.0
 */

#ifndef TYPHON_GATEWAY_NORMALIZER_HPP
#define TYPHON_GATEWAY_NORMALIZER_HPP

#include "types.hpp"

#include "atom/type/json.hpp"

namespace typhon::gateway {

/**
 * @brief Validates and normalizes client requests
 *
 * Normalization is a pure transform. It fails with ValidationError only when
 * the mode is unknown, the mode-specific required field is blank, read mode
 * names an unknown rce_method, or local_scope is not an object. Every other
 * field is coerced and silently defaulted.
 */
class RequestNormalizer {
public:
    /**
     * @brief Build an ExecutionRequest
     * @param input Raw client body; a non-object is treated as `{}`
     * @return Fully populated request with timeout in [5, 600]
     * @throws ValidationError on the conditions listed above
     */
    [[nodiscard]] static auto normalize(const nlohmann::json& input)
        -> ExecutionRequest;

    /**
     * @brief Clamp a requested timeout into the supported interval
     */
    [[nodiscard]] static constexpr auto clampTimeout(std::int64_t seconds) noexcept
        -> std::int64_t {
        if (seconds < RequestDefaults::MIN_TIMEOUT_SEC) {
            return RequestDefaults::MIN_TIMEOUT_SEC;
        }
        if (seconds > RequestDefaults::MAX_TIMEOUT_SEC) {
            return RequestDefaults::MAX_TIMEOUT_SEC;
        }
        return seconds;
    }
};

}  // namespace typhon::gateway

#endif  // TYPHON_GATEWAY_NORMALIZER_HPP

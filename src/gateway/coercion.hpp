/*
 * coercion.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file coercion.hpp
 * @brief Best-effort conversion of loosely typed client fields
 *
 * Every function here is total except parseScope: a value that cannot be
 * converted falls back to the supplied default instead of failing.
 */

#ifndef TYPHON_GATEWAY_COERCION_HPP
#define TYPHON_GATEWAY_COERCION_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "atom/type/json.hpp"

namespace typhon::gateway::coerce {

/**
 * @brief Strip leading and trailing whitespace
 */
[[nodiscard]] auto trim(std::string_view text) -> std::string;

[[nodiscard]] auto toLower(std::string_view text) -> std::string;
[[nodiscard]] auto toUpper(std::string_view text) -> std::string;

/**
 * @brief Render any JSON value as text
 *
 * Strings are returned unquoted, null becomes the empty string and every
 * other value uses its compact JSON form.
 */
[[nodiscard]] auto stringify(const nlohmann::json& value) -> std::string;

/**
 * @brief Coerce to boolean
 *
 * Booleans pass through, numbers are true when non-zero and strings are
 * true when they read "1", "true", "yes" or "on" (case-insensitive).
 * Null and any other type yield @p fallback.
 */
[[nodiscard]] auto toBool(const nlohmann::json& value, bool fallback) -> bool;

/**
 * @brief Coerce to an integer, or nullopt when no integer can be derived
 */
[[nodiscard]] auto toOptionalInt(const nlohmann::json& value)
    -> std::optional<std::int64_t>;

/**
 * @brief Coerce to an integer with @p fallback
 */
[[nodiscard]] auto toInt(const nlohmann::json& value, std::int64_t fallback)
    -> std::int64_t;

/**
 * @brief Parse a list of trimmed, non-empty strings
 *
 * Arrays are stringified element-wise, strings are split on line breaks
 * and commas, other scalars become a single element.
 */
[[nodiscard]] auto parseList(const nlohmann::json& value)
    -> std::vector<std::string>;

/**
 * @brief Parse the evaluator's local scope
 * @return The object, or nullopt for null / blank text
 * @throws ValidationError when the value is not an object or an
 *         object-encoded string
 */
[[nodiscard]] auto parseScope(const nlohmann::json& value)
    -> std::optional<nlohmann::json>;

}  // namespace typhon::gateway::coerce

#endif  // TYPHON_GATEWAY_COERCION_HPP

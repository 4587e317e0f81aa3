/*
 * coercion.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "coercion.hpp"
#include "exception.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <limits>

namespace typhon::gateway::coerce {

namespace {

constexpr std::array<std::string_view, 4> TRUTHY_WORDS = {"1", "true", "yes",
                                                          "on"};

auto isSpace(char c) -> bool {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

auto parseInteger(std::string_view text) -> std::optional<std::int64_t> {
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
        if (!text.empty() && text.front() == '-') {
            return std::nullopt;
        }
    }
    if (text.empty()) {
        return std::nullopt;
    }

    std::int64_t result = 0;
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, result);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return result;
}

void appendToken(std::vector<std::string>& items, std::string_view token) {
    auto cleaned = trim(token);
    if (!cleaned.empty()) {
        items.push_back(std::move(cleaned));
    }
}

}  // namespace

auto trim(std::string_view text) -> std::string {
    auto begin = std::find_if_not(text.begin(), text.end(), isSpace);
    auto end = std::find_if_not(text.rbegin(), text.rend(), isSpace).base();
    if (begin >= end) {
        return {};
    }
    return std::string(begin, end);
}

auto toLower(std::string_view text) -> std::string {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

auto toUpper(std::string_view text) -> std::string {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return result;
}

auto stringify(const nlohmann::json& value) -> std::string {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_null()) {
        return {};
    }
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

auto toBool(const nlohmann::json& value, bool fallback) -> bool {
    if (value.is_boolean()) {
        return value.get<bool>();
    }
    if (value.is_number_integer()) {
        return value.get<std::int64_t>() != 0;
    }
    if (value.is_number_float()) {
        return value.get<double>() != 0.0;
    }
    if (value.is_string()) {
        auto word = toLower(trim(value.get_ref<const std::string&>()));
        return std::find(TRUTHY_WORDS.begin(), TRUTHY_WORDS.end(), word) !=
               TRUTHY_WORDS.end();
    }
    return fallback;
}

auto toOptionalInt(const nlohmann::json& value) -> std::optional<std::int64_t> {
    if (value.is_number_unsigned()) {
        auto raw = value.get<std::uint64_t>();
        if (raw > static_cast<std::uint64_t>(
                      std::numeric_limits<std::int64_t>::max())) {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(raw);
    }
    if (value.is_number_integer()) {
        return value.get<std::int64_t>();
    }
    if (value.is_number_float()) {
        auto raw = std::trunc(value.get<double>());
        // 2^63 is exactly representable; anything at or above it overflows.
        if (!std::isfinite(raw) || raw >= 9223372036854775808.0 ||
            raw < -9223372036854775808.0) {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(raw);
    }
    if (value.is_string()) {
        return parseInteger(trim(value.get_ref<const std::string&>()));
    }
    return std::nullopt;
}

auto toInt(const nlohmann::json& value, std::int64_t fallback)
    -> std::int64_t {
    return toOptionalInt(value).value_or(fallback);
}

auto parseList(const nlohmann::json& value) -> std::vector<std::string> {
    std::vector<std::string> items;
    if (value.is_null()) {
        return items;
    }

    if (value.is_array()) {
        for (const auto& element : value) {
            appendToken(items, stringify(element));
        }
        return items;
    }

    if (value.is_string()) {
        const auto& text = value.get_ref<const std::string&>();
        std::string_view rest(text);
        while (!rest.empty()) {
            auto cut = rest.find_first_of("\r\n,");
            appendToken(items, rest.substr(0, cut));
            if (cut == std::string_view::npos) {
                break;
            }
            rest.remove_prefix(cut + 1);
        }
        return items;
    }

    appendToken(items, stringify(value));
    return items;
}

auto parseScope(const nlohmann::json& value) -> std::optional<nlohmann::json> {
    if (value.is_null()) {
        return std::nullopt;
    }
    if (value.is_object()) {
        return value;
    }
    if (!value.is_string()) {
        THROW_REQUEST_VALIDATION_ERROR(
            "local_scope", "local_scope must be a JSON object or empty.");
    }

    const auto& text = value.get_ref<const std::string&>();
    if (trim(text).empty()) {
        return std::nullopt;
    }

    nlohmann::json loaded;
    try {
        loaded = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        THROW_REQUEST_VALIDATION_ERROR(
            "local_scope",
            std::string("local_scope must be valid JSON: ") + e.what());
    }
    if (!loaded.is_object()) {
        THROW_REQUEST_VALIDATION_ERROR("local_scope",
                                       "local_scope must be a JSON object.");
    }
    return loaded;
}

}  // namespace typhon::gateway::coerce

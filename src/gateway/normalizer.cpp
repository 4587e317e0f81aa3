/*
 * normalizer.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "normalizer.hpp"
#include "coercion.hpp"
#include "exception.hpp"

#include <spdlog/spdlog.h>

#include <string>
#include <string_view>

namespace typhon::gateway {

namespace {

const nlohmann::json NULL_FIELD = nullptr;

auto field(const nlohmann::json& input, std::string_view key)
    -> const nlohmann::json& {
    if (!input.is_object()) {
        return NULL_FIELD;
    }
    auto it = input.find(std::string(key));
    return it == input.end() ? NULL_FIELD : *it;
}

// Absent (or null) text fields take the default; everything else is
// stringified and trimmed.
auto textField(const nlohmann::json& input, std::string_view key,
               std::string_view fallback = {}) -> std::string {
    const auto& value = field(input, key);
    if (value.is_null()) {
        return std::string(fallback);
    }
    return coerce::trim(coerce::stringify(value));
}

auto parseMode(const nlohmann::json& input) -> Mode {
    auto mode = coerce::toLower(
        textField(input, "mode", modeToString(RequestDefaults::MODE)));
    if (mode == "rce") {
        return Mode::Rce;
    }
    if (mode == "read") {
        return Mode::Read;
    }
    THROW_REQUEST_VALIDATION_ERROR("mode", "mode must be 'rce' or 'read'.");
}

auto parseLogLevel(const nlohmann::json& input) -> LogLevel {
    auto level = coerce::toUpper(
        textField(input, "log_level",
                  logLevelToString(RequestDefaults::LOG_LEVEL)));
    if (level == "DEBUG") {
        return LogLevel::Debug;
    }
    if (level == "QUIET") {
        return LogLevel::Quiet;
    }
    return LogLevel::Info;
}

}  // namespace

auto RequestNormalizer::normalize(const nlohmann::json& input)
    -> ExecutionRequest {
    ExecutionRequest request;

    request.mode = parseMode(input);
    request.cmd = textField(input, "cmd");
    request.filepath = textField(input, "filepath");
    // Read mode needs an explicit rce_method; rce mode falls back to exec.
    const bool hasRceMethod = !field(input, "rce_method").is_null();
    request.rceMethod = coerce::toLower(textField(
        input, "rce_method",
        request.mode == Mode::Rce ? RequestDefaults::RCE_METHOD
                                  : std::string_view{}));

    if (request.mode == Mode::Rce && request.cmd.empty()) {
        THROW_REQUEST_VALIDATION_ERROR("cmd", "cmd is required in rce mode.");
    }
    if (request.mode == Mode::Read) {
        if (request.filepath.empty()) {
            THROW_REQUEST_VALIDATION_ERROR(
                "filepath", "filepath is required in read mode.");
        }
        // rce_method is only checked in read mode; rce mode passes it through.
        if (!hasRceMethod ||
            (request.rceMethod != "exec" && request.rceMethod != "eval")) {
            THROW_REQUEST_VALIDATION_ERROR(
                "rce_method", "rce_method must be 'exec' or 'eval'.");
        }
    }

    request.isAllowExceptionLeak =
        coerce::toBool(field(input, "is_allow_exception_leak"),
                       RequestDefaults::ALLOW_EXCEPTION_LEAK);

    auto& options = request.options;
    options.localScope = coerce::parseScope(field(input, "local_scope"));
    options.bannedChr = coerce::parseList(field(input, "banned_chr"));
    options.allowedChr = coerce::parseList(field(input, "allowed_chr"));
    options.bannedAst = coerce::parseList(field(input, "banned_ast"));
    options.bannedRe = coerce::parseList(field(input, "banned_re"));
    options.maxLength = coerce::toOptionalInt(field(input, "max_length"));
    options.allowUnicodeBypass =
        coerce::toBool(field(input, "allow_unicode_bypass"),
                       RequestDefaults::ALLOW_UNICODE_BYPASS);
    options.printAllPayload = coerce::toBool(
        field(input, "print_all_payload"), RequestDefaults::PRINT_ALL_PAYLOAD);
    options.interactive = coerce::toBool(field(input, "interactive"),
                                         RequestDefaults::INTERACTIVE);
    options.depth =
        coerce::toInt(field(input, "depth"), RequestDefaults::DEPTH);
    options.recursionLimit = coerce::toInt(field(input, "recursion_limit"),
                                           RequestDefaults::RECURSION_LIMIT);
    options.logLevel = parseLogLevel(input);

    request.timeoutSec = clampTimeout(
        coerce::toInt(field(input, "timeout_sec"), RequestDefaults::TIMEOUT_SEC));

    spdlog::debug("Normalized {} request (timeout {}s)",
                  modeToString(request.mode), request.timeoutSec);
    return request;
}

}  // namespace typhon::gateway

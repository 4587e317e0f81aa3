/*
 * types.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "types.hpp"

#include <string>

namespace typhon::gateway {

auto ExecutionOptions::toJson() const -> nlohmann::json {
    nlohmann::json json = {
        {"local_scope", localScope.value_or(nullptr)},
        {"banned_chr", bannedChr},
        {"allowed_chr", allowedChr},
        {"banned_ast", bannedAst},
        {"banned_re", bannedRe},
        {"max_length", nullptr},
        {"allow_unicode_bypass", allowUnicodeBypass},
        {"print_all_payload", printAllPayload},
        {"interactive", interactive},
        {"depth", depth},
        {"recursion_limit", recursionLimit},
        {"log_level", std::string(logLevelToString(logLevel))}};
    if (maxLength) {
        json["max_length"] = *maxLength;
    }
    return json;
}

auto ExecutionRequest::toEvaluatorPayload() const -> nlohmann::json {
    return {{"mode", std::string(modeToString(mode))},
            {"cmd", cmd},
            {"filepath", filepath},
            {"rce_method", rceMethod},
            {"is_allow_exception_leak", isAllowExceptionLeak},
            {"options", options.toJson()}};
}

}  // namespace typhon::gateway

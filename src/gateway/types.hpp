/*
 * types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file types.hpp
 * @brief Canonical execution request handed to the evaluator
 * @date 2024
 * @version 1.0.0
 */

#ifndef TYPHON_GATEWAY_TYPES_HPP
#define TYPHON_GATEWAY_TYPES_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "atom/type/json.hpp"

namespace typhon::gateway {

/**
 * @brief Evaluation mode selected by the client
 */
enum class Mode {
    Rce,   ///< Evaluate the `cmd` payload
    Read   ///< Read `filepath` through the evaluator
};

[[nodiscard]] constexpr std::string_view modeToString(Mode mode) noexcept {
    switch (mode) {
        case Mode::Rce: return "rce";
        case Mode::Read: return "read";
    }
    return "rce";
}

/**
 * @brief Evaluator log verbosity
 */
enum class LogLevel {
    Debug,
    Info,
    Quiet
};

[[nodiscard]] constexpr std::string_view logLevelToString(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Quiet: return "QUIET";
    }
    return "INFO";
}

/**
 * @brief Every default and bound applied during normalization
 */
struct RequestDefaults {
    static constexpr Mode MODE = Mode::Rce;
    static constexpr std::string_view RCE_METHOD = "exec";
    static constexpr bool ALLOW_EXCEPTION_LEAK = true;
    static constexpr bool ALLOW_UNICODE_BYPASS = false;
    static constexpr bool PRINT_ALL_PAYLOAD = false;
    static constexpr bool INTERACTIVE = true;
    static constexpr std::int64_t DEPTH = 5;
    static constexpr std::int64_t RECURSION_LIMIT = 200;
    static constexpr LogLevel LOG_LEVEL = LogLevel::Info;
    static constexpr std::int64_t TIMEOUT_SEC = 90;
    static constexpr std::int64_t MIN_TIMEOUT_SEC = 5;
    static constexpr std::int64_t MAX_TIMEOUT_SEC = 600;
};

/**
 * @brief Evaluator options nested under `options` in the payload
 */
struct ExecutionOptions {
    std::optional<nlohmann::json> localScope;   ///< JSON object or absent
    std::vector<std::string> bannedChr;
    std::vector<std::string> allowedChr;
    std::vector<std::string> bannedAst;
    std::vector<std::string> bannedRe;
    std::optional<std::int64_t> maxLength;      ///< Absent means no limit
    bool allowUnicodeBypass{RequestDefaults::ALLOW_UNICODE_BYPASS};
    bool printAllPayload{RequestDefaults::PRINT_ALL_PAYLOAD};
    bool interactive{RequestDefaults::INTERACTIVE};
    std::int64_t depth{RequestDefaults::DEPTH};
    std::int64_t recursionLimit{RequestDefaults::RECURSION_LIMIT};
    LogLevel logLevel{RequestDefaults::LOG_LEVEL};

    [[nodiscard]] auto toJson() const -> nlohmann::json;
};

/**
 * @brief Canonical, bounded request for one evaluator invocation
 *
 * `rceMethod` is only guaranteed to be "exec" or "eval" in read mode; in rce
 * mode it is lowercased but otherwise passed through.
 */
struct ExecutionRequest {
    Mode mode{RequestDefaults::MODE};
    std::string cmd;
    std::string filepath;
    std::string rceMethod{RequestDefaults::RCE_METHOD};
    bool isAllowExceptionLeak{RequestDefaults::ALLOW_EXCEPTION_LEAK};
    ExecutionOptions options;
    std::int64_t timeoutSec{RequestDefaults::TIMEOUT_SEC};  ///< Never sent to the evaluator

    /**
     * @brief Document written to the evaluator's input channel
     *
     * Contains every field except the timeout.
     */
    [[nodiscard]] auto toEvaluatorPayload() const -> nlohmann::json;
};

}  // namespace typhon::gateway

#endif  // TYPHON_GATEWAY_TYPES_HPP

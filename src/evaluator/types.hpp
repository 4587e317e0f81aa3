/*
 * types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file types.hpp
 * @brief Evaluator supervision type definitions
 * @date 2024
 * @version 1.0.0
 */

#ifndef TYPHON_EVALUATOR_TYPES_HPP
#define TYPHON_EVALUATOR_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "atom/type/json.hpp"

namespace typhon::evaluator {

/**
 * @brief Internal supervisor failures
 *
 * These describe problems of the gateway itself, never misbehaviour of the
 * evaluator, which is always reported as an ExecutionOutcome.
 */
enum class RunnerError {
    Success = 0,
    InvalidConfiguration,
    PipeCreationFailed,
    ProcessSpawnFailed,
    WaitFailed,
    UnknownError
};

[[nodiscard]] constexpr std::string_view runnerErrorToString(RunnerError error) noexcept {
    switch (error) {
        case RunnerError::Success: return "Success";
        case RunnerError::InvalidConfiguration: return "Invalid configuration";
        case RunnerError::PipeCreationFailed: return "Pipe creation failed";
        case RunnerError::ProcessSpawnFailed: return "Process spawn failed";
        case RunnerError::WaitFailed: return "Wait for process failed";
        case RunnerError::UnknownError: return "Unknown error";
    }
    return "Unknown error";
}

template<typename T>
using Result = std::expected<T, RunnerError>;

/**
 * @brief How the evaluator process is launched
 */
struct EvaluatorConfig {
    std::vector<std::string> command{"python3", "webui/runner.py"};  ///< argv, resolved via PATH
    std::filesystem::path workingDirectory;  ///< Project root; empty keeps the gateway's cwd
};

// ============================================================================
// Outcomes
// ============================================================================

/**
 * @brief The evaluator exited and printed one JSON object
 */
struct Completed {
    nlohmann::json document;
    int exitCode{0};
    std::string stderrText;
    std::chrono::milliseconds elapsed{0};
};

/**
 * @brief The deadline fired before the evaluator finished
 */
struct TimedOut {
    std::chrono::milliseconds elapsed{0};
    std::int64_t timeoutSec{0};
};

/**
 * @brief The evaluator exited without writing anything on stdout
 */
struct EmptyOutput {
    int exitCode{0};
    std::string stderrText;
    std::chrono::milliseconds elapsed{0};
};

/**
 * @brief The evaluator's stdout was not a JSON object
 */
struct MalformedOutput {
    int exitCode{0};
    std::string stdoutText;
    std::string stderrText;
    std::chrono::milliseconds elapsed{0};
};

/**
 * @brief The supervisor could not start or track the evaluator
 */
struct LaunchFailed {
    std::string message;
    std::chrono::milliseconds elapsed{0};
};

using ExecutionOutcome =
    std::variant<Completed, TimedOut, EmptyOutput, MalformedOutput, LaunchFailed>;

}  // namespace typhon::evaluator

#endif  // TYPHON_EVALUATOR_TYPES_HPP

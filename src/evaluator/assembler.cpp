/*
 * assembler.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "assembler.hpp"

#include "gateway/coercion.hpp"

#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>

namespace typhon::evaluator {

AssembledResponse ResultAssembler::assemble(const ExecutionOutcome& outcome) {
    return std::visit(
        [](const auto& o) -> AssembledResponse {
            using T = std::decay_t<decltype(o)>;

            if constexpr (std::is_same_v<T, TimedOut>) {
                nlohmann::json body = {
                    {"ok", false},
                    {"error", "Execution timed out after " +
                                  std::to_string(o.timeoutSec) + " seconds."},
                    {"duration_ms", o.elapsed.count()}};
                return {std::move(body), 408};
            } else if constexpr (std::is_same_v<T, EmptyOutput>) {
                nlohmann::json body = {
                    {"ok", false},
                    {"error", "Runner returned empty output."},
                    {"runner_exit_code", o.exitCode},
                    {"runner_stderr", o.stderrText},
                    {"duration_ms", o.elapsed.count()}};
                return {std::move(body), 500};
            } else if constexpr (std::is_same_v<T, MalformedOutput>) {
                nlohmann::json body = {
                    {"ok", false},
                    {"error", "Failed to parse runner output as JSON."},
                    {"runner_exit_code", o.exitCode},
                    {"runner_stdout", o.stdoutText},
                    {"runner_stderr", o.stderrText},
                    {"duration_ms", o.elapsed.count()}};
                return {std::move(body), 500};
            } else if constexpr (std::is_same_v<T, LaunchFailed>) {
                nlohmann::json body = {
                    {"ok", false},
                    {"error", "Failed to launch runner: " + o.message},
                    {"duration_ms", o.elapsed.count()}};
                return {std::move(body), 500};
            } else {
                static_assert(std::is_same_v<T, Completed>);
                auto body = o.document;
                body["duration_ms"] = o.elapsed.count();
                body["runner_exit_code"] = o.exitCode;
                if (!gateway::coerce::trim(o.stderrText).empty()) {
                    body["runner_stderr"] = o.stderrText;
                }
                auto ok = o.document.find("ok");
                bool passed = ok != o.document.end() && isTruthy(*ok);
                return {std::move(body), passed ? 200 : 500};
            }
        },
        outcome);
}

bool ResultAssembler::isTruthy(const nlohmann::json& value) noexcept {
    switch (value.type()) {
        case nlohmann::json::value_t::boolean:
            return value.get<bool>();
        case nlohmann::json::value_t::number_integer:
            return value.get<std::int64_t>() != 0;
        case nlohmann::json::value_t::number_unsigned:
            return value.get<std::uint64_t>() != 0;
        case nlohmann::json::value_t::number_float:
            return value.get<double>() != 0.0;
        case nlohmann::json::value_t::string:
            return !value.get_ref<const std::string&>().empty();
        case nlohmann::json::value_t::array:
        case nlohmann::json::value_t::object:
            return !value.empty();
        default:
            return false;
    }
}

}  // namespace typhon::evaluator

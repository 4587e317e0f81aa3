/*
 * assembler.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef TYPHON_EVALUATOR_ASSEMBLER_HPP
#define TYPHON_EVALUATOR_ASSEMBLER_HPP

#include "types.hpp"

namespace typhon::evaluator {

/**
 * @brief Final client-facing body and HTTP status of one run
 */
struct AssembledResponse {
    nlohmann::json body;
    int status{500};
};

/**
 * @brief Maps an ExecutionOutcome onto the response contract
 *
 * | outcome         | status                       |
 * |-----------------|------------------------------|
 * | TimedOut        | 408                          |
 * | EmptyOutput     | 500                          |
 * | MalformedOutput | 500                          |
 * | LaunchFailed    | 500                          |
 * | Completed       | 200 if `ok` is truthy else 500 |
 */
class ResultAssembler {
public:
    [[nodiscard]] static AssembledResponse assemble(const ExecutionOutcome& outcome);

    /**
     * @brief Truthiness of the evaluator's `ok` value
     *
     * Null, false, zero and empty strings/containers are false.
     */
    [[nodiscard]] static bool isTruthy(const nlohmann::json& value) noexcept;
};

}  // namespace typhon::evaluator

#endif  // TYPHON_EVALUATOR_ASSEMBLER_HPP

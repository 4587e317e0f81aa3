/*
 * client.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file client.hpp
 * @brief Supervised one-shot evaluator invocation
 * @date 2024
 * @version 1.0.0
 */

#ifndef TYPHON_EVALUATOR_CLIENT_HPP
#define TYPHON_EVALUATOR_CLIENT_HPP

#include "types.hpp"

#include "gateway/types.hpp"

namespace typhon::evaluator {

/**
 * @brief Runs one evaluator process per request under a wall-clock deadline
 *
 * Orchestrates a single invocation:
 * - Serialize the request (without its timeout)
 * - Spawn the evaluator in its own process group
 * - Stream the document in, drain both output channels
 * - Kill the whole group when the deadline fires
 * - Classify the outcome
 *
 * The client holds no per-request state and may be shared between threads.
 */
class EvaluatorClient {
public:
    explicit EvaluatorClient(EvaluatorConfig config);

    [[nodiscard]] const EvaluatorConfig& getConfig() const noexcept {
        return config_;
    }

    /**
     * @brief Execute a normalized request
     * @param request Canonical request; its timeoutSec bounds the call
     * @return Exactly one outcome, never throws for evaluator misbehaviour
     */
    [[nodiscard]] ExecutionOutcome execute(
        const gateway::ExecutionRequest& request) const;

    /**
     * @brief Classify what an exited evaluator printed
     *
     * Trims @p stdoutText; empty text is EmptyOutput, text that does not
     * parse as a JSON object is MalformedOutput, anything else Completed.
     */
    [[nodiscard]] static ExecutionOutcome classify(
        int exitCode, std::string_view stdoutText, std::string stderrText,
        std::chrono::milliseconds elapsed);

private:
    EvaluatorConfig config_;
};

}  // namespace typhon::evaluator

#endif  // TYPHON_EVALUATOR_CLIENT_HPP

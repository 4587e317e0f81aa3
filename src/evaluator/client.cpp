/*
 * client.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "client.hpp"
#include "process_spawning.hpp"
#include "stream_pump.hpp"

#include "gateway/coercion.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <optional>
#include <thread>

namespace typhon::evaluator {

namespace {

using Clock = std::chrono::steady_clock;

constexpr auto POLL_SLICE = std::chrono::milliseconds{100};
constexpr auto EXIT_POLL_INTERVAL = std::chrono::milliseconds{10};

auto elapsedSince(Clock::time_point start) -> std::chrono::milliseconds {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() -
                                                                 start);
}

}  // namespace

EvaluatorClient::EvaluatorClient(EvaluatorConfig config)
    : config_(std::move(config)) {}

ExecutionOutcome EvaluatorClient::execute(
    const gateway::ExecutionRequest& request) const {
    auto payload = request.toEvaluatorPayload().dump(
        -1, ' ', false, nlohmann::json::error_handler_t::replace);

    auto startTime = Clock::now();
    auto deadline = startTime + std::chrono::seconds{request.timeoutSec};

    auto spawnResult = ProcessSpawner::spawn(config_);
    if (!spawnResult) {
        return LaunchFailed{std::string(runnerErrorToString(spawnResult.error())),
                            elapsedSince(startTime)};
    }

    const int pid = spawnResult->pid;
    StreamPump pump(*spawnResult, std::move(payload));

    std::optional<int> exitCode;
    while (!exitCode) {
        auto now = Clock::now();
        if (now >= deadline) {
            pump.close();
            ProcessSpawner::killProcessGroup(pid);
            auto reaped = ProcessSpawner::reap(pid);
            auto elapsed = elapsedSince(startTime);
            spdlog::warn("Evaluator {} timed out after {}s and was killed{}",
                         pid, request.timeoutSec,
                         reaped ? "" : " (reap failed)");
            return TimedOut{elapsed, request.timeoutSec};
        }

        auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);

        if (!pump.drained()) {
            pump.poll(std::min(remaining + std::chrono::milliseconds{1},
                               POLL_SLICE));
            continue;
        }

        // Both output channels closed; wait for the leader to exit.
        auto exited = ProcessSpawner::hasExited(pid);
        if (!exited) {
            ProcessSpawner::killProcessGroup(pid);
            (void)ProcessSpawner::reap(pid);
            return LaunchFailed{
                std::string(runnerErrorToString(exited.error())),
                elapsedSince(startTime)};
        }
        if (!*exited) {
            std::this_thread::sleep_for(std::min(remaining, EXIT_POLL_INTERVAL));
            continue;
        }

        // The unreaped leader still pins the group id, so stragglers can be
        // killed before the id is released.
        ProcessSpawner::killProcessGroup(pid);
        auto reaped = ProcessSpawner::reap(pid);
        if (!reaped) {
            return LaunchFailed{
                std::string(runnerErrorToString(reaped.error())),
                elapsedSince(startTime)};
        }
        exitCode = *reaped;
    }

    auto outcome = classify(*exitCode, pump.stdoutText(), pump.stderrText(),
                            elapsedSince(startTime));
    spdlog::debug("Evaluator {} exited with code {} ({} stdout bytes)", pid,
                  *exitCode, pump.stdoutText().size());
    return outcome;
}

ExecutionOutcome EvaluatorClient::classify(int exitCode,
                                           std::string_view stdoutText,
                                           std::string stderrText,
                                           std::chrono::milliseconds elapsed) {
    auto text = gateway::coerce::trim(stdoutText);
    if (text.empty()) {
        return EmptyOutput{exitCode, std::move(stderrText), elapsed};
    }

    auto document = nlohmann::json::parse(text, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        return MalformedOutput{exitCode, std::move(text), std::move(stderrText),
                               elapsed};
    }
    return Completed{std::move(document), exitCode, std::move(stderrText),
                     elapsed};
}

}  // namespace typhon::evaluator

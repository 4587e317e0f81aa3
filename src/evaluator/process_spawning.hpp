/*
 * process_spawning.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef TYPHON_EVALUATOR_PROCESS_SPAWNING_HPP
#define TYPHON_EVALUATOR_PROCESS_SPAWNING_HPP

#include "types.hpp"


namespace typhon::evaluator {

/**
 * @brief A launched evaluator and the parent ends of its standard streams
 *
 * The stream descriptors are non-blocking; ownership passes to the caller.
 */
struct SpawnedProcess {
    int pid{-1};
    int stdinFd{-1};
    int stdoutFd{-1};
    int stderrFd{-1};
};

/**
 * @brief POSIX process spawning for the evaluator
 *
 * The child is placed in its own process group so the whole tree can be
 * terminated with a single signal.
 */
class ProcessSpawner {
public:
    /**
     * @brief Spawn the evaluator with piped stdin/stdout/stderr
     * @param config Command line and working directory
     * @return Spawned process on success, or error
     */
    [[nodiscard]] static Result<SpawnedProcess> spawn(const EvaluatorConfig& config);

    /**
     * @brief Poll for exit without blocking or reaping
     *
     * The exited leader stays a zombie until reap(), so its process group
     * can still be signalled.
     */
    [[nodiscard]] static Result<bool> hasExited(int processId);

    /**
     * @brief Block until the process exits and reap it
     */
    [[nodiscard]] static Result<int> reap(int processId);

    /**
     * @brief SIGKILL every process in the evaluator's group
     * @return True if at least one process was signalled
     */
    static bool killProcessGroup(int processId);

    /**
     * @brief Convert a waitpid status to an exit code
     *
     * Normal exit yields the exit status, death by signal N yields -N.
     */
    [[nodiscard]] static int decodeExitStatus(int status) noexcept;
};

}  // namespace typhon::evaluator

#endif  // TYPHON_EVALUATOR_PROCESS_SPAWNING_HPP

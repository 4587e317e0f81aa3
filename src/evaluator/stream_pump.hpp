/*
 * stream_pump.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef TYPHON_EVALUATOR_STREAM_PUMP_HPP
#define TYPHON_EVALUATOR_STREAM_PUMP_HPP

#include "process_spawning.hpp"

#include <chrono>
#include <string>

namespace typhon::evaluator {

/**
 * @brief Moves data between the gateway and the evaluator's standard streams
 *
 * Feeds the request document to stdin and closes it once written, while
 * draining stdout and stderr as data arrives so the child never blocks on a
 * full pipe. All descriptors are owned and closed by the pump.
 */
class StreamPump {
public:
    StreamPump(const SpawnedProcess& process, std::string input);
    ~StreamPump();

    // Non-copyable
    StreamPump(const StreamPump&) = delete;
    StreamPump& operator=(const StreamPump&) = delete;

    /**
     * @brief Wait up to @p timeout for stream activity and service it
     */
    void poll(std::chrono::milliseconds timeout);

    /**
     * @brief True once both output channels reached end of file
     */
    [[nodiscard]] bool drained() const noexcept;

    [[nodiscard]] const std::string& stdoutText() const noexcept { return stdout_; }
    [[nodiscard]] const std::string& stderrText() const noexcept { return stderr_; }

    /**
     * @brief Number of input bytes still waiting to be written
     */
    [[nodiscard]] std::size_t pendingInput() const noexcept {
        return input_.size() - written_;
    }

    void close();

private:
    void writeInput();
    void readInto(int& fd, std::string& buffer);
    static void closeFd(int& fd);

    int stdinFd_{-1};
    int stdoutFd_{-1};
    int stderrFd_{-1};
    std::string input_;
    std::size_t written_{0};
    std::string stdout_;
    std::string stderr_;
};

}  // namespace typhon::evaluator

#endif  // TYPHON_EVALUATOR_STREAM_PUMP_HPP

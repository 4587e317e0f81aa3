/*
 * process_spawning_unix.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef _WIN32

#include "process_spawning.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>
#include <string>
#include <vector>

#include <fcntl.h>
#include <signal.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

namespace typhon::evaluator {

namespace {

using PipePair = std::array<int, 2>;

void closePipe(PipePair& fds) {
    for (auto& fd : fds) {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }
}

bool setNonBlocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL);
    return flags >= 0 && ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

// Writing to an evaluator that stopped reading must surface as EPIPE
// instead of terminating the gateway.
void ignoreBrokenPipes() {
    static std::once_flag once;
    std::call_once(once, [] { ::signal(SIGPIPE, SIG_IGN); });
}

// Leaves only the standard streams open in the child. Log files and
// listening sockets of the gateway are not always close-on-exec.
void closeInheritedDescriptors() {
#ifdef SYS_close_range
    if (::syscall(SYS_close_range, 3U, ~0U, 0U) == 0) {
        return;
    }
#endif
    long maxFd = ::sysconf(_SC_OPEN_MAX);
    if (maxFd < 0) {
        maxFd = 1024;
    }
    for (int fd = 3; fd < maxFd; ++fd) {
        ::close(fd);
    }
}

[[noreturn]] void childFail(const char* message) {
    auto written = ::write(STDERR_FILENO, message, std::strlen(message));
    (void)written;
    ::_exit(127);
}

}  // namespace

Result<SpawnedProcess> ProcessSpawner::spawn(const EvaluatorConfig& config) {
    if (config.command.empty() || config.command.front().empty()) {
        spdlog::error("Evaluator command is empty");
        return std::unexpected(RunnerError::InvalidConfiguration);
    }

    ignoreBrokenPipes();

    // Everything the child touches is prepared before fork.
    std::vector<char*> argv;
    argv.reserve(config.command.size() + 1);
    for (const auto& arg : config.command) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    const std::string workdir = config.workingDirectory.string();

    PipePair stdinPipe{-1, -1};
    PipePair stdoutPipe{-1, -1};
    PipePair stderrPipe{-1, -1};
    if (::pipe2(stdinPipe.data(), O_CLOEXEC) != 0 ||
        ::pipe2(stdoutPipe.data(), O_CLOEXEC) != 0 ||
        ::pipe2(stderrPipe.data(), O_CLOEXEC) != 0) {
        spdlog::error("Failed to create evaluator pipes: {}",
                      std::strerror(errno));
        closePipe(stdinPipe);
        closePipe(stdoutPipe);
        closePipe(stderrPipe);
        return std::unexpected(RunnerError::PipeCreationFailed);
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        spdlog::error("Fork failed: {}", std::strerror(errno));
        closePipe(stdinPipe);
        closePipe(stdoutPipe);
        closePipe(stderrPipe);
        return std::unexpected(RunnerError::ProcessSpawnFailed);
    }

    if (pid == 0) {
        // Child process
        ::setpgid(0, 0);

        if (::dup2(stdinPipe[0], STDIN_FILENO) < 0 ||
            ::dup2(stdoutPipe[1], STDOUT_FILENO) < 0 ||
            ::dup2(stderrPipe[1], STDERR_FILENO) < 0) {
            ::_exit(127);
        }

        ::signal(SIGPIPE, SIG_DFL);
        closeInheritedDescriptors();

        if (!workdir.empty() && ::chdir(workdir.c_str()) != 0) {
            childFail("typhon: cannot enter evaluator working directory\n");
        }

        ::execvp(argv[0], argv.data());

        // If we get here, exec failed
        childFail("typhon: failed to execute evaluator\n");
    }

    // Parent process; repeat setpgid so the group exists before we return.
    ::setpgid(pid, pid);

    ::close(stdinPipe[0]);
    ::close(stdoutPipe[1]);
    ::close(stderrPipe[1]);

    SpawnedProcess process;
    process.pid = static_cast<int>(pid);
    process.stdinFd = stdinPipe[1];
    process.stdoutFd = stdoutPipe[0];
    process.stderrFd = stderrPipe[0];

    if (!setNonBlocking(process.stdinFd) || !setNonBlocking(process.stdoutFd) ||
        !setNonBlocking(process.stderrFd)) {
        spdlog::error("Failed to make evaluator pipes non-blocking");
        ::close(process.stdinFd);
        ::close(process.stdoutFd);
        ::close(process.stderrFd);
        killProcessGroup(process.pid);
        (void)reap(process.pid);
        return std::unexpected(RunnerError::PipeCreationFailed);
    }

    spdlog::debug("Spawned evaluator '{}' with PID {}", config.command.front(),
                  pid);
    return process;
}

Result<bool> ProcessSpawner::hasExited(int processId) {
    siginfo_t info{};
    // WNOWAIT keeps the zombie, so the group id stays reserved until reap().
    if (::waitid(P_PID, static_cast<id_t>(processId), &info,
                 WEXITED | WNOHANG | WNOWAIT) < 0) {
        if (errno == EINTR) {
            return false;
        }
        spdlog::error("waitid({}) failed: {}", processId, std::strerror(errno));
        return std::unexpected(RunnerError::WaitFailed);
    }
    return info.si_pid == processId;
}

Result<int> ProcessSpawner::reap(int processId) {
    int status = 0;
    while (::waitpid(processId, &status, 0) < 0) {
        if (errno != EINTR) {
            spdlog::error("waitpid({}) failed: {}", processId,
                          std::strerror(errno));
            return std::unexpected(RunnerError::WaitFailed);
        }
    }
    return decodeExitStatus(status);
}

bool ProcessSpawner::killProcessGroup(int processId) {
    if (processId <= 0) {
        return false;
    }
    // Both sides call setpgid before spawn() returns, so the group exists
    // for as long as any member is alive.
    return ::kill(-processId, SIGKILL) == 0;
}

int ProcessSpawner::decodeExitStatus(int status) noexcept {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return -WTERMSIG(status);
    }
    return -1;
}

}  // namespace typhon::evaluator

#endif  // !_WIN32

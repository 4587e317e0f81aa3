/*
 * test_process_spawning.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file test_process_spawning.cpp
 * @brief Tests for evaluator process spawning and stream pumping
 */

#include <gtest/gtest.h>
#include "evaluator/process_spawning.hpp"
#include "evaluator/stream_pump.hpp"

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <thread>

using namespace typhon::evaluator;
namespace fs = std::filesystem;

namespace {

EvaluatorConfig shellConfig(const std::string& script) {
    EvaluatorConfig config;
    config.command = {"/bin/sh", "-c", script};
    return config;
}

// Pump until both output channels close or the budget runs out.
void pumpToEnd(StreamPump& pump,
               std::chrono::milliseconds budget = std::chrono::seconds{10}) {
    auto deadline = std::chrono::steady_clock::now() + budget;
    while (!pump.drained() && std::chrono::steady_clock::now() < deadline) {
        pump.poll(std::chrono::milliseconds{50});
    }
}

}  // namespace

// =============================================================================
// Exit Status Decoding
// =============================================================================

TEST(ProcessSpawnerStatusTest, DecodeNormalExit) {
    int status = 0;
    pid_t pid = ::fork();
    ASSERT_GE(pid, 0);
    if (pid == 0) {
        ::_exit(3);
    }
    ASSERT_EQ(::waitpid(pid, &status, 0), pid);
    EXPECT_EQ(ProcessSpawner::decodeExitStatus(status), 3);
}

TEST(ProcessSpawnerStatusTest, DecodeSignalDeath) {
    int status = 0;
    pid_t pid = ::fork();
    ASSERT_GE(pid, 0);
    if (pid == 0) {
        ::raise(SIGKILL);
        ::_exit(0);
    }
    ASSERT_EQ(::waitpid(pid, &status, 0), pid);
    EXPECT_EQ(ProcessSpawner::decodeExitStatus(status), -SIGKILL);
}

// =============================================================================
// Spawning
// =============================================================================

TEST(ProcessSpawnerTest, EmptyCommandIsRejected) {
    EvaluatorConfig config;
    config.command.clear();
    auto result = ProcessSpawner::spawn(config);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), RunnerError::InvalidConfiguration);
}

TEST(ProcessSpawnerTest, SpawnedProcessLeadsItsOwnGroup) {
    auto result = ProcessSpawner::spawn(shellConfig("sleep 5"));
    ASSERT_TRUE(result.has_value());

    EXPECT_EQ(::getpgid(result->pid), result->pid);
    EXPECT_EQ(::kill(result->pid, 0), 0);

    StreamPump pump(*result, "");
    EXPECT_TRUE(ProcessSpawner::killProcessGroup(result->pid));
    auto code = ProcessSpawner::reap(result->pid);
    ASSERT_TRUE(code.has_value());
    EXPECT_EQ(*code, -SIGKILL);
}

TEST(ProcessSpawnerTest, HasExitedLeavesLeaderForReap) {
    auto result = ProcessSpawner::spawn(shellConfig("read line; exit 4"));
    ASSERT_TRUE(result.has_value());
    StreamPump pump(*result, "go\n");

    auto early = ProcessSpawner::hasExited(result->pid);
    ASSERT_TRUE(early.has_value());

    pumpToEnd(pump);
    bool exited = false;
    for (int i = 0; i < 500 && !exited; ++i) {
        auto polled = ProcessSpawner::hasExited(result->pid);
        ASSERT_TRUE(polled.has_value());
        exited = *polled;
        if (!exited) {
            std::this_thread::sleep_for(std::chrono::milliseconds{10});
        }
    }
    ASSERT_TRUE(exited);

    // Still a zombie: polling again sees it and the group id is held.
    auto again = ProcessSpawner::hasExited(result->pid);
    ASSERT_TRUE(again.has_value());
    EXPECT_TRUE(*again);
    EXPECT_EQ(::getpgid(result->pid), result->pid);

    auto code = ProcessSpawner::reap(result->pid);
    ASSERT_TRUE(code.has_value());
    EXPECT_EQ(*code, 4);
}

TEST(ProcessSpawnerTest, ChildInheritsOnlyStandardStreams) {
    int devNull = ::open("/dev/null", O_RDONLY);
    ASSERT_GE(devNull, 0);
    // F_DUPFD does not set close-on-exec.
    int inherited = ::fcntl(devNull, F_DUPFD, 100);
    ASSERT_GE(inherited, 100);
    ASSERT_EQ(::fcntl(inherited, F_GETFD) & FD_CLOEXEC, 0);

    auto result = ProcessSpawner::spawn(shellConfig(
        "if [ -e /proc/$$/fd/" + std::to_string(inherited) +
        " ]; then echo leaked; else echo clean; fi; "
        "for fd in 3 4 5 6 7 8 9; do "
        "[ -e /proc/$$/fd/$fd ] && echo \"open $fd\"; done; true"));
    ::close(inherited);
    ::close(devNull);
    ASSERT_TRUE(result.has_value());

    StreamPump pump(*result, "");
    pumpToEnd(pump);
    auto code = ProcessSpawner::reap(result->pid);
    ASSERT_TRUE(code.has_value());
    EXPECT_EQ(*code, 0);
    EXPECT_EQ(pump.stdoutText(), "clean\n");
}

TEST(ProcessSpawnerTest, MissingExecutableExitsWith127) {
    EvaluatorConfig config;
    config.command = {"/nonexistent/typhon-evaluator"};
    auto result = ProcessSpawner::spawn(config);
    ASSERT_TRUE(result.has_value());

    StreamPump pump(*result, "");
    pumpToEnd(pump);
    auto code = ProcessSpawner::reap(result->pid);
    ASSERT_TRUE(code.has_value());
    EXPECT_EQ(*code, 127);
    EXPECT_NE(pump.stderrText().find("failed to execute evaluator"),
              std::string::npos);
}

TEST(ProcessSpawnerTest, MissingWorkingDirectoryExitsWith127) {
    auto config = shellConfig("echo unreachable");
    config.workingDirectory = "/nonexistent/typhon-project-root";
    auto result = ProcessSpawner::spawn(config);
    ASSERT_TRUE(result.has_value());

    StreamPump pump(*result, "");
    pumpToEnd(pump);
    auto code = ProcessSpawner::reap(result->pid);
    ASSERT_TRUE(code.has_value());
    EXPECT_EQ(*code, 127);
    EXPECT_TRUE(pump.stdoutText().empty());
}

TEST(ProcessSpawnerTest, KillOfUnknownGroupFails) {
    EXPECT_FALSE(ProcessSpawner::killProcessGroup(0));
    EXPECT_FALSE(ProcessSpawner::killProcessGroup(-1));
}

// =============================================================================
// Stream Pump
// =============================================================================

TEST(StreamPumpTest, EchoesInputAndSeparatesChannels) {
    auto result = ProcessSpawner::spawn(shellConfig("cat; echo oops >&2"));
    ASSERT_TRUE(result.has_value());

    StreamPump pump(*result, "hello world");
    pumpToEnd(pump);
    ASSERT_TRUE(ProcessSpawner::reap(result->pid).has_value());

    EXPECT_TRUE(pump.drained());
    EXPECT_EQ(pump.pendingInput(), 0u);
    EXPECT_EQ(pump.stdoutText(), "hello world");
    EXPECT_EQ(pump.stderrText(), "oops\n");
}

TEST(StreamPumpTest, LargeInputAndOutputDoNotDeadlock) {
    // Well above the pipe buffer size in both directions.
    std::string input(1 << 20, 'x');
    auto result = ProcessSpawner::spawn(shellConfig("cat"));
    ASSERT_TRUE(result.has_value());

    StreamPump pump(*result, input);
    pumpToEnd(pump, std::chrono::seconds{30});
    ASSERT_TRUE(ProcessSpawner::reap(result->pid).has_value());

    EXPECT_EQ(pump.stdoutText().size(), input.size());
    EXPECT_EQ(pump.stdoutText(), input);
}

TEST(StreamPumpTest, ChildIgnoringInputDoesNotBlockWriter) {
    std::string input(1 << 20, 'y');
    auto result = ProcessSpawner::spawn(shellConfig("exec 0<&-; echo done"));
    ASSERT_TRUE(result.has_value());

    StreamPump pump(*result, input);
    pumpToEnd(pump);
    ASSERT_TRUE(ProcessSpawner::reap(result->pid).has_value());

    EXPECT_TRUE(pump.drained());
    EXPECT_EQ(pump.stdoutText(), "done\n");
}

TEST(StreamPumpTest, CloseReleasesDescriptors) {
    auto result = ProcessSpawner::spawn(shellConfig("cat"));
    ASSERT_TRUE(result.has_value());

    StreamPump pump(*result, "");
    pump.close();
    EXPECT_TRUE(pump.drained());
    ProcessSpawner::killProcessGroup(result->pid);
    ASSERT_TRUE(ProcessSpawner::reap(result->pid).has_value());
}

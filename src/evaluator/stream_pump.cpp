/*
 * stream_pump.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "stream_pump.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <utility>

#include <poll.h>
#include <unistd.h>

namespace typhon::evaluator {

namespace {
constexpr std::size_t READ_CHUNK = 8192;
constexpr int MAX_READS_PER_POLL = 32;  // keeps the deadline check responsive
}

StreamPump::StreamPump(const SpawnedProcess& process, std::string input)
    : stdinFd_(process.stdinFd),
      stdoutFd_(process.stdoutFd),
      stderrFd_(process.stderrFd),
      input_(std::move(input)) {
    if (input_.empty()) {
        closeFd(stdinFd_);
    }
}

StreamPump::~StreamPump() { close(); }

void StreamPump::close() {
    closeFd(stdinFd_);
    closeFd(stdoutFd_);
    closeFd(stderrFd_);
}

bool StreamPump::drained() const noexcept {
    return stdoutFd_ < 0 && stderrFd_ < 0;
}

void StreamPump::poll(std::chrono::milliseconds timeout) {
    std::array<struct pollfd, 3> fds{};
    nfds_t count = 0;
    int* owners[3] = {nullptr, nullptr, nullptr};

    if (stdinFd_ >= 0) {
        fds[count] = {stdinFd_, POLLOUT, 0};
        owners[count++] = &stdinFd_;
    }
    if (stdoutFd_ >= 0) {
        fds[count] = {stdoutFd_, POLLIN, 0};
        owners[count++] = &stdoutFd_;
    }
    if (stderrFd_ >= 0) {
        fds[count] = {stderrFd_, POLLIN, 0};
        owners[count++] = &stderrFd_;
    }
    if (count == 0) {
        return;
    }

    int ready = ::poll(fds.data(), count, static_cast<int>(timeout.count()));
    if (ready <= 0) {
        if (ready < 0 && errno != EINTR) {
            spdlog::warn("poll on evaluator streams failed: {}",
                         std::strerror(errno));
        }
        return;
    }

    for (nfds_t i = 0; i < count; ++i) {
        if (fds[i].revents == 0) {
            continue;
        }
        if (owners[i] == &stdinFd_) {
            if (fds[i].revents & POLLOUT) {
                writeInput();
            } else {
                // POLLERR/POLLHUP: the evaluator closed its end.
                closeFd(stdinFd_);
            }
        } else if (owners[i] == &stdoutFd_) {
            readInto(stdoutFd_, stdout_);
        } else {
            readInto(stderrFd_, stderr_);
        }
    }
}

void StreamPump::writeInput() {
    while (written_ < input_.size()) {
        auto n = ::write(stdinFd_, input_.data() + written_,
                         input_.size() - written_);
        if (n > 0) {
            written_ += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        spdlog::debug("Evaluator stopped reading input after {} of {} bytes",
                      written_, input_.size());
        break;
    }
    closeFd(stdinFd_);
}

void StreamPump::readInto(int& fd, std::string& buffer) {
    std::array<char, READ_CHUNK> chunk{};
    for (int reads = 0; fd >= 0 && reads < MAX_READS_PER_POLL; ++reads) {
        auto n = ::read(fd, chunk.data(), chunk.size());
        if (n > 0) {
            buffer.append(chunk.data(), static_cast<std::size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        // End of file or a hard error ends the channel.
        closeFd(fd);
    }
}

void StreamPump::closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

}  // namespace typhon::evaluator

/**
 * @file command_runner.cpp
 * @brief fork/exec command runner with timeout
 *
 * TokenRouter - Token-addressed port routing for container gateways
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "tokenrouter/command_runner.hpp"
#include "tokenrouter/utilities.hpp"

#include <array>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace tokenrouter {

using namespace tokenrouter::utilities;

namespace {

// Exit status used by the child when execvp fails
constexpr int EXEC_FAILURE_STATUS = 127;

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Read whatever is available on fd into out; returns false on EOF/error
bool drain(int fd, std::string& out) {
    std::array<char, 4096> buffer;
    ssize_t n = ::read(fd, buffer.data(), buffer.size());
    if (n > 0) {
        out.append(buffer.data(), static_cast<size_t>(n));
        return true;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
        return true;
    }
    return false;
}

int decode_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    return -1;
}

} // namespace

std::string format_command(const std::vector<std::string>& args) {
    std::string rendered;
    for (const auto& arg : args) {
        if (!rendered.empty()) {
            rendered += ' ';
        }
        rendered += arg;
    }
    return rendered;
}

CommandResult ProcessCommandRunner::run(
    const std::vector<std::string>& args,
    std::chrono::milliseconds timeout
) {
    CommandResult result;

    if (args.empty()) {
        result.spawn_failed = true;
        result.error_output = "empty command";
        return result;
    }

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (::pipe2(stdout_pipe, O_CLOEXEC) != 0) {
        result.spawn_failed = true;
        result.error_output = std::string("pipe failed: ") + std::strerror(errno);
        return result;
    }
    if (::pipe2(stderr_pipe, O_CLOEXEC) != 0) {
        result.spawn_failed = true;
        result.error_output = std::string("pipe failed: ") + std::strerror(errno);
        close_fd(stdout_pipe[0]);
        close_fd(stdout_pipe[1]);
        return result;
    }

    // argv must be built before fork: no allocation in the child
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        result.spawn_failed = true;
        result.error_output = std::string("fork failed: ") + std::strerror(errno);
        close_fd(stdout_pipe[0]);
        close_fd(stdout_pipe[1]);
        close_fd(stderr_pipe[0]);
        close_fd(stderr_pipe[1]);
        return result;
    }

    if (pid == 0) {
        ::dup2(stdout_pipe[1], STDOUT_FILENO);
        ::dup2(stderr_pipe[1], STDERR_FILENO);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
        }
        ::execvp(argv[0], argv.data());
        ::_exit(EXEC_FAILURE_STATUS);
    }

    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    bool stdout_open = true;
    bool stderr_open = true;

    while (stdout_open || stderr_open) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            result.timed_out = true;
            break;
        }

        std::array<pollfd, 2> fds{};
        nfds_t count = 0;
        if (stdout_open) {
            fds[count++] = pollfd{stdout_pipe[0], POLLIN, 0};
        }
        if (stderr_open) {
            fds[count++] = pollfd{stderr_pipe[0], POLLIN, 0};
        }

        int ready = ::poll(fds.data(), count, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            log_error("poll failed while running '" + format_command(args) + "': " +
                      std::strerror(errno));
            break;
        }
        if (ready == 0) {
            continue;
        }

        for (nfds_t i = 0; i < count; ++i) {
            if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                continue;
            }
            if (fds[i].fd == stdout_pipe[0]) {
                stdout_open = drain(stdout_pipe[0], result.output);
            } else {
                stderr_open = drain(stderr_pipe[0], result.error_output);
            }
        }
    }

    close_fd(stdout_pipe[0]);
    close_fd(stderr_pipe[0]);

    int status = 0;
    pid_t waited = 0;

    // Pipes can close before the child exits; keep honoring the deadline
    if (!result.timed_out && !stdout_open && !stderr_open) {
        while (true) {
            waited = ::waitpid(pid, &status, WNOHANG);
            if (waited < 0 && errno == EINTR) {
                waited = 0;
            } else if (waited != 0) {
                break;
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                result.timed_out = true;
                break;
            }
            ::usleep(10 * 1000);
        }
    }

    if (waited == 0) {
        // Timed out or poll broke: make sure the child does not linger
        ::kill(pid, SIGKILL);
        do {
            waited = ::waitpid(pid, &status, 0);
        } while (waited < 0 && errno == EINTR);
    }

    if (waited == pid) {
        result.exit_code = result.timed_out ? -1 : decode_status(status);
    }

    if (result.exit_code == EXEC_FAILURE_STATUS && result.output.empty()) {
        log_debug("Command may not exist: " + args[0]);
    }

    return result;
}

} // namespace tokenrouter

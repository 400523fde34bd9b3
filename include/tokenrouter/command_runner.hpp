/**
 * @file command_runner.hpp
 * @brief External command execution with bounded latency
 *
 * TokenRouter - Token-addressed port routing for container gateways
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Discovery and gateway reload both shell out to the container runtime.
 * CommandRunner is the seam between the routing core and that runtime:
 * - ProcessCommandRunner forks/execs with a hard timeout
 * - Tests substitute a scripted runner
 */

#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace tokenrouter {

/**
 * @brief Outcome of one external command
 */
struct CommandResult {
    int exit_code = -1;         ///< Process exit status (-1 if not exited normally)
    std::string output;         ///< Captured stdout
    std::string error_output;   ///< Captured stderr
    bool timed_out = false;     ///< Killed after exceeding the timeout
    bool spawn_failed = false;  ///< Could not start the process at all

    bool succeeded() const { return !timed_out && !spawn_failed && exit_code == 0; }
};

/**
 * @brief CommandRunner - abstract command execution capability
 */
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    /**
     * @brief Run a command and wait for it to finish
     * @param args Program and arguments (args[0] is looked up on PATH)
     * @param timeout Upper bound on wall-clock time
     * @return Result; never throws for process-level failures
     */
    virtual CommandResult run(
        const std::vector<std::string>& args,
        std::chrono::milliseconds timeout
    ) = 0;
};

/**
 * @brief ProcessCommandRunner - fork/exec implementation
 *
 * stdout and stderr are captured through pipes and drained with poll() so
 * a chatty child cannot deadlock on a full pipe. On timeout the child is
 * sent SIGKILL and reaped.
 */
class ProcessCommandRunner : public CommandRunner {
public:
    CommandResult run(
        const std::vector<std::string>& args,
        std::chrono::milliseconds timeout
    ) override;
};

/**
 * @brief Render argv for log messages
 */
std::string format_command(const std::vector<std::string>& args);

} // namespace tokenrouter

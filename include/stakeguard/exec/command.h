// STAKEGUARD - External Command Execution
// Copyright (c) 2024 STAKEGUARD Developers
// MIT License
//
// Runs the wallet and chain-query command-line tools as child processes.
// Failure of an external command is an ordinary result value: executors
// never throw for a non-zero exit, a launch error or a timeout.

#ifndef STAKEGUARD_EXEC_COMMAND_H
#define STAKEGUARD_EXEC_COMMAND_H

#include <chrono>
#include <set>
#include <string>
#include <vector>

namespace stakeguard {
namespace exec {

/// Exit code reported when the process could not be started
constexpr int EXIT_LAUNCH_FAILED = -1;

/// Exit code reported when the process was killed after its deadline
constexpr int EXIT_TIMED_OUT = -2;

// ============================================================================
// Command Line
// ============================================================================

/**
 * An argument vector. Arguments added with SecretArg() are masked in
 * ToString() so the command can be logged or reported safely.
 */
class CommandLine {
public:
    CommandLine() = default;
    explicit CommandLine(std::vector<std::string> args);

    CommandLine& Arg(const std::string& arg);
    CommandLine& SecretArg(const std::string& arg);

    /**
     * Mark as a periodic read-only query. Routine commands and their output
     * are logged at Trace so they do not crowd wallet actions out of the
     * action log.
     */
    CommandLine& Routine();
    bool IsRoutine() const { return routine_; }

    const std::vector<std::string>& Args() const { return args_; }
    bool Empty() const { return args_.empty(); }

    /// Program name (first argument), or empty
    std::string Program() const;

    /// True if any argument equals `word`
    bool Contains(const std::string& word) const;

    /// Space-joined rendering with secret arguments masked
    std::string ToString() const;

private:
    std::vector<std::string> args_;
    std::set<size_t> secretIndices_;
    bool routine_{false};
};

// ============================================================================
// Command Result
// ============================================================================

/**
 * Outcome of one external command.
 */
struct CommandResult {
    bool success{false};
    int exitCode{0};
    std::string output;   // Trimmed standard output
    std::string error;    // Trimmed standard error or launch/timeout reason

    static CommandResult Success(const std::string& out) {
        return {true, 0, out, ""};
    }

    static CommandResult Failure(int code, const std::string& err) {
        return {false, code, "", err};
    }
};

// ============================================================================
// Executor Interface
// ============================================================================

class ICommandExecutor {
public:
    virtual ~ICommandExecutor() = default;

    /// Run the command to completion and capture its output
    virtual CommandResult Run(const CommandLine& command) = 0;
};

// ============================================================================
// Process Executor
// ============================================================================

/**
 * Executes commands with fork/exec, capturing stdout and stderr through
 * pipes. Each child leads its own process group, so terminal signals aimed
 * at the daemon never interrupt it. A process that outlives the timeout is
 * killed along with its group.
 */
class ProcessExecutor : public ICommandExecutor {
public:
    explicit ProcessExecutor(std::chrono::seconds timeout = std::chrono::seconds(120));

    CommandResult Run(const CommandLine& command) override;

    std::chrono::seconds GetTimeout() const { return timeout_; }

private:
    std::chrono::seconds timeout_;
};

} // namespace exec
} // namespace stakeguard

#endif // STAKEGUARD_EXEC_COMMAND_H

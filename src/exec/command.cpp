// STAKEGUARD - External Command Execution Implementation
// Copyright (c) 2024 STAKEGUARD Developers
// MIT License

#include "stakeguard/exec/command.h"
#include "stakeguard/util/format.h"
#include "stakeguard/util/logging.h"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <sstream>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace stakeguard {
namespace exec {

// ============================================================================
// CommandLine Implementation
// ============================================================================

CommandLine::CommandLine(std::vector<std::string> args) : args_(std::move(args)) {}

CommandLine& CommandLine::Arg(const std::string& arg) {
    args_.push_back(arg);
    return *this;
}

CommandLine& CommandLine::SecretArg(const std::string& arg) {
    secretIndices_.insert(args_.size());
    args_.push_back(arg);
    return *this;
}

std::string CommandLine::Program() const {
    return args_.empty() ? std::string() : args_.front();
}

CommandLine& CommandLine::Routine() {
    routine_ = true;
    return *this;
}

bool CommandLine::Contains(const std::string& word) const {
    return std::find(args_.begin(), args_.end(), word) != args_.end();
}

std::string CommandLine::ToString() const {
    std::ostringstream ss;
    for (size_t i = 0; i < args_.size(); ++i) {
        if (i > 0) ss << ' ';
        if (secretIndices_.count(i)) {
            ss << util::REDACTED_TEXT;
        } else {
            ss << args_[i];
        }
    }
    return ss.str();
}

// ============================================================================
// ProcessExecutor Implementation
// ============================================================================

namespace {

struct Pipe {
    int fds[2]{-1, -1};

    ~Pipe() {
        CloseRead();
        CloseWrite();
    }

    // Close-on-exec so a child forked by another thread cannot inherit it
    bool Open() { return pipe2(fds, O_CLOEXEC) == 0; }

    void CloseRead() {
        if (fds[0] >= 0) {
            close(fds[0]);
            fds[0] = -1;
        }
    }

    void CloseWrite() {
        if (fds[1] >= 0) {
            close(fds[1]);
            fds[1] = -1;
        }
    }
};

/// Read whatever is available; returns false once the pipe reached EOF
bool DrainInto(int fd, std::string& sink) {
    char buffer[4096];
    ssize_t n = read(fd, buffer, sizeof(buffer));
    if (n > 0) {
        sink.append(buffer, static_cast<size_t>(n));
        return true;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
        return true;
    }
    return false;
}

int WaitForChild(pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return EXIT_LAUNCH_FAILED;
        }
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return EXIT_LAUNCH_FAILED;
}

} // namespace

ProcessExecutor::ProcessExecutor(std::chrono::seconds timeout) : timeout_(timeout) {}

CommandResult ProcessExecutor::Run(const CommandLine& command) {
    if (command.Empty()) {
        return CommandResult::Failure(EXIT_LAUNCH_FAILED, "empty command");
    }

    if (command.IsRoutine()) {
        LOG_TRACE(util::LogCategory::EXEC) << "Executing command: " << command.ToString();
    } else {
        LOG_DEBUG(util::LogCategory::EXEC) << "Executing command: " << command.ToString();
    }

    // Build argv before forking; the child must not allocate
    std::vector<char*> argv;
    argv.reserve(command.Args().size() + 1);
    for (const auto& arg : command.Args()) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    Pipe outPipe;
    Pipe errPipe;
    Pipe execPipe;  // Closed on exec; carries errno if exec fails
    if (!outPipe.Open() || !errPipe.Open() || !execPipe.Open()) {
        return CommandResult::Failure(EXIT_LAUNCH_FAILED,
                                      std::string("pipe failed: ") + std::strerror(errno));
    }

    pid_t pid = fork();
    if (pid < 0) {
        return CommandResult::Failure(EXIT_LAUNCH_FAILED,
                                      std::string("fork failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        // Own process group: a terminal Ctrl-C reaches the daemon only, and
        // a wallet action in flight runs to completion
        setpgid(0, 0);
        signal(SIGPIPE, SIG_DFL);

        dup2(outPipe.fds[1], STDOUT_FILENO);
        dup2(errPipe.fds[1], STDERR_FILENO);
        int devNull = open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (devNull >= 0) {
            dup2(devNull, STDIN_FILENO);
        }
        close(outPipe.fds[0]);
        close(errPipe.fds[0]);
        close(execPipe.fds[0]);
        execvp(argv[0], argv.data());
        int err = errno;
        ssize_t ignored = write(execPipe.fds[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // Also set from this side so the group exists before any signal can arrive.
    // EACCES means the child already exec'd, having set it itself.
    if (setpgid(pid, pid) < 0 && errno != EACCES) {
        LOG_DEBUG(util::LogCategory::EXEC) << "setpgid failed: " << std::strerror(errno);
    }

    outPipe.CloseWrite();
    errPipe.CloseWrite();
    execPipe.CloseWrite();

    int execErrno = 0;
    ssize_t n;
    do {
        n = read(execPipe.fds[0], &execErrno, sizeof(execErrno));
    } while (n < 0 && errno == EINTR);
    if (n == static_cast<ssize_t>(sizeof(execErrno))) {
        WaitForChild(pid);
        return CommandResult::Failure(EXIT_LAUNCH_FAILED,
                                      "cannot execute " + command.Program() + ": " +
                                      std::strerror(execErrno));
    }

    std::string out;
    std::string err;
    bool outOpen = true;
    bool errOpen = true;
    auto deadline = std::chrono::steady_clock::now() + timeout_;

    while (outOpen || errOpen) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            kill(-pid, SIGKILL);
            WaitForChild(pid);
            LOG_WARN(util::LogCategory::EXEC) << "Command timed out after "
                                              << timeout_.count() << "s: " << command.ToString();
            return CommandResult::Failure(EXIT_TIMED_OUT, "timed out");
        }

        pollfd fds[2];
        nfds_t count = 0;
        if (outOpen) fds[count++] = {outPipe.fds[0], POLLIN, 0};
        if (errOpen) fds[count++] = {errPipe.fds[0], POLLIN, 0};

        int ready = poll(fds, count, static_cast<int>(std::min<int64_t>(remaining.count(), 1000)));
        if (ready < 0) {
            if (errno == EINTR) continue;
            kill(-pid, SIGKILL);
            WaitForChild(pid);
            return CommandResult::Failure(EXIT_LAUNCH_FAILED,
                                          std::string("poll failed: ") + std::strerror(errno));
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) {
                continue;
            }
            if (fds[i].fd == outPipe.fds[0]) {
                outOpen = DrainInto(fds[i].fd, out);
            } else {
                errOpen = DrainInto(fds[i].fd, err);
            }
        }
    }

    int exitCode = WaitForChild(pid);
    out = util::Trim(out);
    err = util::Trim(err);

    if (exitCode != 0) {
        LOG_ERROR(util::LogCategory::EXEC) << "Command failed with return code " << exitCode
                                           << ": " << command.ToString()
                                           << (err.empty() ? "" : "\n" + err);
        CommandResult result = CommandResult::Failure(exitCode, err);
        result.output = out;
        return result;
    }

    if (!out.empty()) {
        if (command.IsRoutine()) {
            LOG_TRACE(util::LogCategory::EXEC) << "Command output: " << out;
        } else {
            LOG_DEBUG(util::LogCategory::EXEC) << "Command output: " << out;
        }
    }
    return CommandResult::Success(out);
}

} // namespace exec
} // namespace stakeguard

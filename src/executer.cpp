// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "triage/executer.h"

#include <algorithm>
#include <chrono>
#include <cstring>
#include <thread>

#include <cerrno>
#include <fcntl.h>
#include <signal.h>
#include <sys/select.h>
#include <sys/wait.h>
#include <unistd.h>

namespace triage {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r\f\v");
    return s.substr(start, end - start + 1);
}

// Poll interval while waiting for output, so cancellation is noticed even
// when the command is silent.
constexpr long kPollMicros = 100000;

// SIGTERM the process group, give it up to 2 seconds, then SIGKILL.
int terminateGroup(pid_t pid) {
    int status = 0;
    kill(-pid, SIGTERM);
    for (int i = 0; i < 20; ++i) {
        if (waitpid(pid, &status, WNOHANG) != 0) return status;
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    kill(-pid, SIGKILL);
    waitpid(pid, &status, 0);
    return status;
}

} // namespace

// ---- ProcessOutput ----

std::string ProcessOutput::describe() const {
    if (!error.empty()) return error;
    if (termSignal != 0) return "signal: " + std::to_string(termSignal);
    return "exit status " + std::to_string(exitCode);
}

// ---- ShellRunner ----

ProcessOutput ShellRunner::run(const Context& ctx, const std::string& command) {
    ProcessOutput result;

    int outPipe[2];
    if (pipe(outPipe) != 0) {
        result.error = std::string("failed to create pipe: ") + std::strerror(errno);
        return result;
    }

    pid_t pid = fork();
    if (pid < 0) {
        close(outPipe[0]);
        close(outPipe[1]);
        result.error = std::string("failed to fork: ") + std::strerror(errno);
        return result;
    }

    if (pid == 0) {
        // Child
        setpgid(0, 0);
        int devNull = open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            dup2(devNull, STDIN_FILENO);
            close(devNull);
        }
        dup2(outPipe[1], STDOUT_FILENO);
        dup2(outPipe[1], STDERR_FILENO);
        close(outPipe[0]);
        close(outPipe[1]);

        execl("/bin/sh", "sh", "-c", command.c_str(), nullptr);
        _exit(127);
    }

    // Parent
    setpgid(pid, pid);
    close(outPipe[1]);
    int fd = outPipe[0];

    char buffer[4096];
    bool killed = false;
    int status = 0;

    while (true) {
        if (ctx.done()) {
            status = terminateGroup(pid);
            killed = true;
            result.timedOut = true;
            break;
        }

        long waitMicros = kPollMicros;
        auto remaining = ctx.remaining();
        if (remaining != std::chrono::milliseconds::max()) {
            waitMicros = std::min<long>(waitMicros, static_cast<long>(remaining.count()) * 1000);
        }

        fd_set readfds;
        FD_ZERO(&readfds);
        FD_SET(fd, &readfds);

        struct timeval tv;
        tv.tv_sec  = waitMicros / 1000000;
        tv.tv_usec = waitMicros % 1000000;

        int ret = select(fd + 1, &readfds, nullptr, nullptr, &tv);
        if (ret < 0) {
            if (errno == EINTR) continue;
            result.error = std::string("failed to read command output: ") + std::strerror(errno);
            status = terminateGroup(pid);
            killed = true;
            break;
        }
        if (ret == 0) continue;

        ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR) continue;
            result.error = std::string("failed to read command output: ") + std::strerror(errno);
            status = terminateGroup(pid);
            killed = true;
            break;
        }
        if (n == 0) break; // EOF: every writer closed the pipe
        result.output.append(buffer, static_cast<size_t>(n));
    }
    close(fd);

    if (!killed) {
        while (waitpid(pid, &status, 0) < 0) {
            if (errno != EINTR) {
                result.error = std::string("failed to wait for command: ") + std::strerror(errno);
                return result;
            }
        }
    }

    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.termSignal = WTERMSIG(status);
    }
    return result;
}

// ---- TerminalExecuter ----

TerminalExecuter::TerminalExecuter()
    : runner_(std::make_unique<ShellRunner>()) {}

TerminalExecuter::TerminalExecuter(std::unique_ptr<CommandRunner> runner)
    : runner_(std::move(runner)) {}

bool TerminalExecuter::isCached(const std::string& command) const {
    return cache_.find(command) != cache_.end();
}

ExecutionResult TerminalExecuter::run(const Context& ctx, const std::string& command) {
    auto it = cache_.find(command);
    if (it != cache_.end()) {
        return ExecutionResult{it->second, std::nullopt};
    }

    ProcessOutput process = runner_->run(ctx, command);

    ExecutionResult result;
    result.output = trim(process.output);

    if (process.succeeded()) {
        cache_[command] = result.output;
        return result;
    }

    ExecutionError error;
    error.exitCode = process.termSignal == 0 && process.error.empty() ? process.exitCode : -1;
    if (ctx.expired()) {
        error.kind = ExecutionErrorKind::TIMEOUT;
        error.message = "command execution timed out: context deadline exceeded";
    } else if (process.timedOut) {
        error.kind = ExecutionErrorKind::EXECUTION_FAILURE;
        error.message = "command execution failed: " + ctx.errorText();
    } else {
        error.kind = ExecutionErrorKind::EXECUTION_FAILURE;
        error.message = "command execution failed: " + process.describe();
    }
    result.error = error;
    return result;
}

} // namespace triage

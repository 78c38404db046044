// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Command execution with a per-instance result cache.
//
// CommandRunner is the raw system-call boundary: it runs one command line
// through /bin/sh and reports what happened. TerminalExecuter sits on top of
// it, memoizes successful results by the exact command string and turns
// raw process outcomes into ExecutionResult values. Callers are expected to
// have validated the command already.

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>

#include "context.h"
#include "triage/export.h"

namespace triage {

enum class ExecutionErrorKind {
    TIMEOUT,
    EXECUTION_FAILURE
};

inline std::string executionErrorKindToString(ExecutionErrorKind k) {
    switch (k) {
        case ExecutionErrorKind::TIMEOUT:           return "timeout";
        case ExecutionErrorKind::EXECUTION_FAILURE: return "execution_failure";
    }
    return "unknown";
}

struct ExecutionError {
    ExecutionErrorKind kind = ExecutionErrorKind::EXECUTION_FAILURE;
    std::string message;
    int exitCode = -1;  // -1 when the process did not exit normally
};

struct ExecutionResult {
    std::string output;                  // combined stdout/stderr, trimmed
    std::optional<ExecutionError> error;

    bool ok() const { return !error.has_value(); }
};

/// What a single shell invocation produced.
struct ProcessOutput {
    std::string output;     // combined stdout and stderr, untrimmed
    int exitCode = -1;      // valid when the process exited normally
    int termSignal = 0;     // non-zero when the process was killed by a signal
    bool timedOut = false;  // killed because the context ended
    std::string error;      // launch failure, empty otherwise

    bool succeeded() const {
        return error.empty() && !timedOut && termSignal == 0 && exitCode == 0;
    }

    /// Go-style exit description: "exit status 2", "signal: 9".
    std::string describe() const;
};

/// Runs one command line through a shell.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;
    virtual ProcessOutput run(const Context& ctx, const std::string& command) = 0;
};

/// POSIX runner: fork + /bin/sh -c with stdout and stderr on one pipe.
/// The child gets its own process group so the whole pipeline can be
/// killed when the context ends.
class TRIAGE_API ShellRunner : public CommandRunner {
public:
    ProcessOutput run(const Context& ctx, const std::string& command) override;
};

/// Interface used by the session to execute approved commands.
class Executer {
public:
    virtual ~Executer() = default;
    virtual ExecutionResult run(const Context& ctx, const std::string& command) = 0;
};

/// Shell executer with memoization keyed by the literal command string.
/// Only successful results are cached; a failed command can be retried.
/// A cache hit never touches the runner, whatever context is passed.
class TRIAGE_API TerminalExecuter : public Executer {
public:
    TerminalExecuter();
    explicit TerminalExecuter(std::unique_ptr<CommandRunner> runner);

    ExecutionResult run(const Context& ctx, const std::string& command) override;

    bool isCached(const std::string& command) const;
    size_t cacheSize() const { return cache_.size(); }

private:
    std::unique_ptr<CommandRunner> runner_;
    std::map<std::string, std::string> cache_;
};

} // namespace triage

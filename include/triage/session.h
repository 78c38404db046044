// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Diagnostic session state machine.
//
//   QUERYING --> DECIDING_ON_COMMAND --> EXECUTING --> QUERYING ...
//       |               |  (cached / rejected)            |
//       |               +--------> QUERYING               |
//       +--> TERMINAL (answer | max iterations | error) <-+
//
// One Session runs one query to completion and is then spent. It owns its
// iteration counter and its command result cache; nothing is shared with
// other sessions. Exactly one blocking step (a model call or a command
// execution) is in flight at any time, all bound to the caller's Context.

#pragma once

#include <map>
#include <string>

#include "approver.h"
#include "command_validator.h"
#include "console.h"
#include "context.h"
#include "executer.h"
#include "llm_client.h"
#include "types.h"
#include "triage/export.h"

namespace triage {

struct SessionConfig {
    int maxIterations = 7;
    int correctionAttempts = 3;
    bool showPrompts = false;
};

struct SessionResult {
    SessionOutcome outcome = SessionOutcome::PENDING;
    std::string text;    // answer, incomplete-analysis notice or error message
    int iterations = 0;

    bool ok() const { return outcome == SessionOutcome::ANSWER ||
                             outcome == SessionOutcome::MAX_ITERATIONS; }

    json toJson() const {
        return json{
            {"outcome", outcomeToString(outcome)},
            {"result", text},
            {"iterations", iterations}
        };
    }
};

class TRIAGE_API Session {
public:
    static const std::string MORE_DATA_PROMPT;
    static const std::string MAX_ITERATIONS_MESSAGE;
    static const std::string NO_OUTPUT;
    static const std::string COMMAND_FAILED_PREFIX;

    /// @param console may be null; nothing is printed then
    Session(ModelTransport& model, Approver& approver, Executer& executer,
            Policy policy, SessionConfig config = {}, OutputHandler* console = nullptr);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /// Drive the state machine from the user's query to a terminal outcome.
    /// Transport and schema failures end the session with
    /// SessionOutcome::ERROR; they are not thrown.
    /// @throws std::logic_error if the session already ran
    SessionResult run(const Context& ctx, const std::string& query);

    SessionState state() const { return state_; }
    int iterations() const { return iterations_; }

    /// Prompt that will be (or last was) sent to the model.
    const std::string& currentPrompt() const { return prompt_; }

    /// Command string -> text fed back to the model, successful runs only.
    const std::map<std::string, std::string>& resultCache() const { return resultCache_; }

private:
    void stepQuerying(const Context& ctx);
    void stepDecidingOnCommand(const Context& ctx);
    void stepExecuting(const Context& ctx);

    /// Hand text back to the model on the next query.
    void resumeQuerying(std::string nextPrompt);
    void finish(SessionOutcome outcome, const std::string& text);

    ModelTransport& model_;
    Approver& approver_;
    Executer& executer_;
    const CommandValidator validator_;
    const SessionConfig config_;

    SilentConsole silentConsole_{true};
    OutputHandler* console_;

    SessionState state_ = SessionState::QUERYING;
    int iterations_ = 0;
    std::string prompt_;
    std::string pendingCommand_;
    std::map<std::string, std::string> resultCache_;
    SessionResult result_;
    bool started_ = false;
};

/// Run one session to completion with a fresh Session.
TRIAGE_API SessionResult startSession(const Context& ctx, ModelTransport& model,
                                      Approver& approver, Executer& executer,
                                      const Policy& policy, const std::string& query,
                                      const SessionConfig& config = {},
                                      OutputHandler* console = nullptr);

} // namespace triage

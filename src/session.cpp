// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "triage/session.h"

#include <stdexcept>

#include "triage/errors.h"
#include "triage/guided_ask.h"

namespace triage {

const std::string Session::MORE_DATA_PROMPT =
    "Please suggest a command to run or end the session.";
const std::string Session::MAX_ITERATIONS_MESSAGE =
    "Analysis incomplete. Reached maximum number of queries.";
const std::string Session::NO_OUTPUT = "No output";
const std::string Session::COMMAND_FAILED_PREFIX = "Command failed: ";

Session::Session(ModelTransport& model, Approver& approver, Executer& executer,
                 Policy policy, SessionConfig config, OutputHandler* console)
    : model_(model),
      approver_(approver),
      executer_(executer),
      validator_(std::move(policy)),
      config_(config),
      console_(console != nullptr ? console : &silentConsole_) {}

SessionResult Session::run(const Context& ctx, const std::string& query) {
    if (started_) {
        throw std::logic_error("session already ran; start a new session for a new query");
    }
    started_ = true;
    prompt_ = query;

    console_->printSessionStart(query, config_.maxIterations, model_.modelName());

    while (state_ != SessionState::TERMINAL) {
        switch (state_) {
            case SessionState::QUERYING:
                stepQuerying(ctx);
                break;
            case SessionState::DECIDING_ON_COMMAND:
                stepDecidingOnCommand(ctx);
                break;
            case SessionState::EXECUTING:
                stepExecuting(ctx);
                break;
            case SessionState::TERMINAL:
                break;
        }
    }

    console_->printCompletion(iterations_, config_.maxIterations);
    return result_;
}

void Session::stepQuerying(const Context& ctx) {
    if (ctx.done()) {
        finish(SessionOutcome::ERROR, ctx.errorText());
        return;
    }
    if (iterations_ >= config_.maxIterations) {
        finish(SessionOutcome::MAX_ITERATIONS, MAX_ITERATIONS_MESSAGE);
        return;
    }

    ++iterations_;
    console_->printIterationHeader(iterations_, config_.maxIterations);
    if (config_.showPrompts) {
        console_->printPrompt(prompt_);
    }

    AgentResponse response;
    console_->startProgress("Thinking");
    try {
        response = guidedAsk<AgentResponse>(
            model_, ctx, prompt_, config_.correctionAttempts,
            [this](int attempt, const std::string& error) {
                console_->printWarning("Reply " + std::to_string(attempt) +
                                       " did not match the response format: " + error);
            });
    } catch (const TransportError& e) {
        console_->stopProgress();
        finish(SessionOutcome::ERROR, e.what());
        return;
    } catch (const SchemaError& e) {
        console_->stopProgress();
        finish(SessionOutcome::ERROR, e.what());
        return;
    }
    console_->stopProgress();

    if (config_.showPrompts) {
        console_->printResponse(response.toJson().dump(2));
    }
    console_->printReason(response.reasonForCommand);

    if (!response.needsMoreData()) {
        finish(SessionOutcome::ANSWER, response.answer.value_or(""));
        return;
    }

    if (auto command = response.proposedCommand()) {
        pendingCommand_ = command.value();
        state_ = SessionState::DECIDING_ON_COMMAND;
        return;
    }

    resumeQuerying(MORE_DATA_PROMPT);
}

void Session::stepDecidingOnCommand(const Context& ctx) {
    const std::string& command = pendingCommand_;

    auto cached = resultCache_.find(command);
    if (cached != resultCache_.end()) {
        console_->printStateInfo("Command already executed: " + command);
        resumeQuerying(cached->second);
        return;
    }

    console_->printCommandProposal(command);

    ValidationResult validation = validator_.validate(command);
    if (!validation.accepted()) {
        console_->printCommandRejected(validation.message());
        resumeQuerying(validation.message());
        return;
    }

    ApprovalDecision decision;
    try {
        decision = approver_.validate(ctx, command);
    } catch (const std::exception& e) {
        std::string message = std::string("Failed to validate command: ") + e.what();
        console_->printWarning(message);
        resumeQuerying(message);
        return;
    }

    if (!decision.approved) {
        std::string reason = decision.reason.empty()
            ? "The command `" + command + "` was not approved."
            : decision.reason;
        console_->printCommandRejected(reason);
        resumeQuerying(reason);
        return;
    }

    state_ = SessionState::EXECUTING;
}

void Session::stepExecuting(const Context& ctx) {
    const std::string command = pendingCommand_;

    console_->startProgress("Running " + command);
    ExecutionResult result = executer_.run(ctx, command);
    console_->stopProgress();

    if (!result.ok()) {
        std::string message = COMMAND_FAILED_PREFIX + result.error->message;
        if (!result.output.empty()) {
            message += "\n" + result.output;
        }
        console_->printWarning(message);
        resumeQuerying(message);
        return;
    }

    std::string output = result.output.empty() ? NO_OUTPUT : result.output;
    console_->printCommandOutput(output);
    resultCache_[command] = output;
    resumeQuerying(output);
}

void Session::resumeQuerying(std::string nextPrompt) {
    prompt_ = std::move(nextPrompt);
    pendingCommand_.clear();
    state_ = SessionState::QUERYING;
}

void Session::finish(SessionOutcome outcome, const std::string& text) {
    result_.outcome = outcome;
    result_.text = text;
    result_.iterations = iterations_;
    state_ = SessionState::TERMINAL;

    switch (outcome) {
        case SessionOutcome::ANSWER:
            console_->printFinalAnswer(text);
            break;
        case SessionOutcome::MAX_ITERATIONS:
            console_->printIncomplete(text);
            break;
        case SessionOutcome::ERROR:
            console_->printError(text);
            break;
        case SessionOutcome::PENDING:
            break;
    }
}

SessionResult startSession(const Context& ctx, ModelTransport& model,
                           Approver& approver, Executer& executer,
                           const Policy& policy, const std::string& query,
                           const SessionConfig& config, OutputHandler* console) {
    Session session(model, approver, executer, policy, config, console);
    return session.run(ctx, query);
}

} // namespace triage

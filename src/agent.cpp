// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "triage/agent.h"

#include <iostream>
#include <sstream>
#include <stdexcept>

namespace triage {

// Response format template. The JSON block is the exact wire schema parsed
// into AgentResponse.
const std::string Agent::RESPONSE_FORMAT_TEMPLATE = R"(
==== RESPONSE FORMAT ====
You must respond ONLY in valid JSON. No text before { or after }.

{
  "answer": string,
  "run_command": string,
  "reason_for_command": string,
  "need_more_data": bool
}

**To gather data:**
{"run_command": "one command", "reason_for_command": "why this command helps", "need_more_data": true}

**To provide a final answer:**
{"answer": "response to user", "reason_for_command": "", "need_more_data": false}

**RULES:**
1. ALWAYS run commands for real data - NEVER guess cluster state
2. Propose ONE command at a time; its output arrives as the next message
3. Only read-only commands are allowed - no chaining, redirection or substitution
4. If a command is rejected or fails, the reason arrives instead; propose a different command
5. Do not repeat a command that already ran; its output will not change
6. When you have enough data, answer and set "need_more_data" to false
)";

Agent::Agent(std::unique_ptr<ModelTransport> model, const AgentConfig& config)
    : config_(config), model_(std::move(model)) {
    if (!model_) {
        throw std::invalid_argument("Agent requires a model transport");
    }

    // Create console based on config
    if (config_.silentMode) {
        console_ = std::make_unique<SilentConsole>();
    } else {
        console_ = std::make_unique<TerminalConsole>();
    }

    // NOTE: getSystemPrompt() and commandPolicy() are not called here.
    // Virtual dispatch does not work during base class construction.
}

void Agent::init() {
    ensureInitialized();
}

void Agent::ensureInitialized() const {
    if (initialized_) {
        return;
    }
    cachedSystemPrompt_ = composeSystemPrompt();
    policy_ = commandPolicy();
    model_->setSystemPrompt(cachedSystemPrompt_);
    initialized_ = true;

    if (config_.debug) {
        std::cerr << "[AGENT] System prompt installed (" << cachedSystemPrompt_.size()
                  << " chars), " << policy_.allowedCommands.size()
                  << " allowed command(s)" << std::endl;
    }
}

void Agent::setOutputHandler(std::unique_ptr<OutputHandler> handler) {
    console_ = std::move(handler);
}

std::string Agent::systemPrompt() const {
    ensureInitialized();
    return cachedSystemPrompt_;
}

const Policy& Agent::policy() const {
    ensureInitialized();
    return policy_;
}

std::string Agent::composeSystemPrompt() const {
    std::ostringstream oss;

    // Agent-specific prompt
    std::string custom = getSystemPrompt();
    if (!custom.empty()) {
        oss << custom << "\n\n";
    }

    // Response format
    oss << RESPONSE_FORMAT_TEMPLATE;

    return oss.str();
}

SessionResult Agent::startSession(const Context& ctx, Approver& approver,
                                  Executer& executer, const std::string& query) {
    ensureInitialized();

    SessionConfig sessionConfig;
    sessionConfig.maxIterations = config_.maxIterations;
    sessionConfig.correctionAttempts = config_.correctionAttempts;
    sessionConfig.showPrompts = config_.showPrompts;

    Session session(*model_, approver, executer, policy_, sessionConfig, console_.get());
    SessionResult result = session.run(ctx, query);

    if (config_.debug) {
        std::cerr << "[AGENT] Session ended: " << result.toJson().dump() << std::endl;
    }
    return result;
}

SessionResult Agent::startSession(const Context& ctx, Approver& approver,
                                  std::unique_ptr<CommandRunner> runner,
                                  const std::string& query) {
    TerminalExecuter executer(std::move(runner));
    return startSession(ctx, approver, executer, query);
}

void Agent::reset() {
    model_->resetHistory();
}

std::string Agent::logUsage() const {
    return model_->usageSummary();
}

} // namespace triage

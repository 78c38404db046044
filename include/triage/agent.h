// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Diagnostic agent.
//
// The Agent owns the agent model transport, the console and the command
// policy, and composes the system prompt that teaches the model the
// response format. Each query runs in a fresh Session; the model's
// conversation history carries over between queries until reset().

#pragma once

#include <memory>
#include <string>

#include "approver.h"
#include "command_validator.h"
#include "console.h"
#include "context.h"
#include "executer.h"
#include "llm_client.h"
#include "session.h"
#include "types.h"
#include "triage/export.h"

namespace triage {

/// Base Agent class. Subclass and override getSystemPrompt() and
/// commandPolicy() for a domain.
class TRIAGE_API Agent {
public:
    /// @throws std::invalid_argument if model is null
    explicit Agent(std::unique_ptr<ModelTransport> model, const AgentConfig& config = {});
    virtual ~Agent() = default;

    // Non-copyable
    Agent(const Agent&) = delete;
    Agent& operator=(const Agent&) = delete;

    /// Run one query to a terminal outcome.
    /// The policy validator always runs before the approver.
    SessionResult startSession(const Context& ctx, Approver& approver,
                               Executer& executer, const std::string& query);

    /// Run one query with a TerminalExecuter built for this session alone,
    /// so no command output is carried over from an earlier session.
    SessionResult startSession(const Context& ctx, Approver& approver,
                               std::unique_ptr<CommandRunner> runner,
                               const std::string& query);

    /// Forget the conversation. The system prompt stays installed.
    void reset();

    /// One-line usage and cost summary of the agent model.
    std::string logUsage() const;

    /// Get the output handler.
    OutputHandler& console() { return *console_; }

    /// Set a custom output handler.
    void setOutputHandler(std::unique_ptr<OutputHandler> handler);

    /// Get the composed system prompt.
    std::string systemPrompt() const;

    /// Allow-list policy proposed commands are checked against.
    const Policy& policy() const;

    ModelTransport& model() { return *model_; }
    const AgentConfig& config() const { return config_; }

protected:
    /// Compose the system prompt, install it on the model and fetch the
    /// policy. Virtual dispatch does not work from the base constructor,
    /// so this runs lazily on first use; subclasses may call it at the end
    /// of their constructor.
    void init();

    /// Return agent-specific system prompt additions.
    virtual std::string getSystemPrompt() const { return ""; }

    /// Return the command allow-list. The default allows nothing.
    virtual Policy commandPolicy() const { return Policy{}; }

private:
    void ensureInitialized() const;
    std::string composeSystemPrompt() const;

    AgentConfig config_;
    std::unique_ptr<ModelTransport> model_;
    std::unique_ptr<OutputHandler> console_;

    mutable Policy policy_;
    mutable std::string cachedSystemPrompt_;
    mutable bool initialized_ = false;

    // Response format template (shared across all agents)
    static const std::string RESPONSE_FORMAT_TEMPLATE;
};

} // namespace triage

// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Approval of model-proposed commands.
//
// An Approver decides whether a command may run and, when it may not, says
// why. The reason is fed back to the agent model verbatim, so it should be
// phrased for the model. Decisions are never cached: a command rejected
// once is asked about again if the model proposes it again.

#pragma once

#include <iosfwd>
#include <string>

#include "command_validator.h"
#include "context.h"
#include "llm_client.h"
#include "triage/export.h"

namespace triage {

struct ApprovalDecision {
    bool approved = false;
    std::string reason;
};

class Approver {
public:
    virtual ~Approver() = default;

    /// @throws std::runtime_error (or a subclass) if the decision could not
    ///         be made; the session reports this to the model and carries on
    virtual ApprovalDecision validate(const Context& ctx, const std::string& command) = 0;
};

/// Approves exactly the commands the allow-list policy accepts.
class TRIAGE_API PolicyApprover : public Approver {
public:
    explicit PolicyApprover(Policy policy);

    ApprovalDecision validate(const Context& ctx, const std::string& command) override;

private:
    CommandValidator validator_;
};

/// Asks a human on a terminal.
class TRIAGE_API UserApprover : public Approver {
public:
    /// Streams default to std::cin / std::cout.
    UserApprover();
    UserApprover(std::istream& in, std::ostream& out);

    ApprovalDecision validate(const Context& ctx, const std::string& command) override;

    /// Reason reported to the model when the user says no.
    static std::string rejectionReason(const std::string& command);

private:
    std::istream& in_;
    std::ostream& out_;
};

/// Asks a secondary model whether the command is read-only.
class TRIAGE_API ModelApprover : public Approver {
public:
    /// Installs the classification system prompt on the model.
    explicit ModelApprover(ModelTransport& model, int correctionAttempts = 3);

    /// @throws TransportError or SchemaError from the validation model
    ApprovalDecision validate(const Context& ctx, const std::string& command) override;

    static const std::string SYSTEM_PROMPT;

private:
    ModelTransport& model_;
    int correctionAttempts_;
};

} // namespace triage

// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "triage/approver.h"

#include <algorithm>
#include <cctype>
#include <iostream>

#include "triage/guided_ask.h"

namespace triage {

// ---- PolicyApprover ----

PolicyApprover::PolicyApprover(Policy policy)
    : validator_(std::move(policy)) {}

ApprovalDecision PolicyApprover::validate(const Context& /*ctx*/, const std::string& command) {
    ValidationResult result = validator_.validate(command);
    if (result.accepted()) {
        return {true, ""};
    }
    return {false, result.message()};
}

// ---- UserApprover ----

UserApprover::UserApprover()
    : in_(std::cin), out_(std::cout) {}

UserApprover::UserApprover(std::istream& in, std::ostream& out)
    : in_(in), out_(out) {}

std::string UserApprover::rejectionReason(const std::string& command) {
    return "The user rejected the command `" + command + "`. "
           "Suggest a different command or end the session.";
}

ApprovalDecision UserApprover::validate(const Context& /*ctx*/, const std::string& command) {
    out_ << "Run command `" << command << "`? [y/N]: " << std::flush;

    std::string answer;
    if (!std::getline(in_, answer)) {
        return {false, rejectionReason(command)};
    }

    auto start = answer.find_first_not_of(" \t\r");
    auto end = answer.find_last_not_of(" \t\r");
    answer = start == std::string::npos ? "" : answer.substr(start, end - start + 1);
    std::transform(answer.begin(), answer.end(), answer.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (answer == "y" || answer == "yes") {
        return {true, ""};
    }
    return {false, rejectionReason(command)};
}

// ---- ModelApprover ----

const std::string ModelApprover::SYSTEM_PROMPT = R"(
You are a command safety classifier. You will be given a single shell command.
Decide whether running it could modify any state: files, processes, cluster
resources, configuration or remote systems.

Respond ONLY with this JSON object and nothing else:
{"is_read_only": bool, "reason": string}

Rules:
1. "is_read_only" is true only if the command exclusively reads or lists data.
2. Any create, update, patch, delete, apply, edit, scale, exec, port-forward,
   cordon, drain, label or annotate operation is NOT read-only.
3. Commands that reveal secrets or credentials are NOT read-only.
4. When unsure, answer false.
5. "reason" explains the decision in one sentence addressed to the assistant
   that proposed the command.
)";

ModelApprover::ModelApprover(ModelTransport& model, int correctionAttempts)
    : model_(model), correctionAttempts_(correctionAttempts) {
    model_.setSystemPrompt(SYSTEM_PROMPT);
}

ApprovalDecision ModelApprover::validate(const Context& ctx, const std::string& command) {
    CommandVerdict verdict = guidedAsk<CommandVerdict>(
        model_, ctx, "Command: " + command, correctionAttempts_);
    return {verdict.isReadOnly, verdict.reason};
}

} // namespace triage

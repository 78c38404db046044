// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Static shell command validation against an allow-list policy.
//
// Validation is purely syntactic. A command line is split into pipe
// separated stages and each stage into quote-aware tokens. The first stage
// must start with an allowed primary command (and sub-command, when a
// sub-command list is configured); every later stage must start with an
// allowed piped command. Any unquoted chaining, substitution or redirection
// operator rejects the whole command. Unknown constructs fail closed.

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "triage/export.h"

namespace triage {

/// Allow-lists governing which commands a session may run.
/// Built once and only read afterwards.
struct Policy {
    std::vector<std::string> allowedCommands;
    std::vector<std::string> allowedSubCommands;   // empty = no sub-command check
    std::vector<std::string> allowedPipedCommands;

    bool checksSubCommands() const { return !allowedSubCommands.empty(); }

    /// Read-only kubectl inspection with common text filters.
    static Policy kubernetes();
};

enum class RejectionKind {
    EMPTY_COMMAND,
    COMMAND_CHAINING,
    COMMAND_SUBSTITUTION,
    REDIRECTION,
    UNMATCHED_QUOTE,
    INVALID_MAIN_COMMAND,
    COMMAND_NOT_ALLOWED,
    SUB_COMMAND_NOT_ALLOWED
};

TRIAGE_API std::string rejectionToString(RejectionKind kind);

/// One pipe-delimited segment of a command line.
struct Stage {
    std::string text;                 // trimmed segment, quotes preserved
    std::vector<std::string> tokens;  // whitespace split, quotes preserved
};

struct ValidationResult {
    std::optional<RejectionKind> rejection;
    std::string detail;          // offending token for allow-list rejections
    std::vector<Stage> stages;

    bool accepted() const { return !rejection.has_value(); }

    /// Human readable reason, e.g. "command is not allowed: rm".
    /// Empty when the command was accepted.
    std::string message() const;
};

/// Split a command line on unquoted '|'.
/// Quotes and backslash escapes are kept verbatim in the stage text.
/// A backslash escapes the next character even inside single quotes, where
/// /bin/sh takes it literally; quote tracking can therefore disagree with
/// the shell for input such as '\'.
/// A trailing '|' yields a trailing empty stage.
TRIAGE_API std::vector<std::string> splitPipeline(const std::string& command);

/// Split one stage on unquoted whitespace. Quotes are kept in the tokens.
TRIAGE_API std::vector<std::string> splitTokens(const std::string& stage);

/// Split a command line into stages and tokens.
TRIAGE_API std::vector<Stage> parseCommand(const std::string& command);

class TRIAGE_API CommandValidator {
public:
    explicit CommandValidator(Policy policy);

    /// Validate a command line. Shell operators are looked for first, in
    /// every stage (unquoted line breaks) and every token; then empty
    /// stages; then the allow-lists, stage by stage. The first violation
    /// found is the one reported.
    ValidationResult validate(const std::string& command) const;

    const Policy& policy() const { return policy_; }

private:
    std::optional<RejectionKind> checkStage(const Stage& stage, bool isMain,
                                            std::string& detail) const;

    /// Scan a single token for operators outside quotes.
    static std::optional<RejectionKind> scanToken(const std::string& token);

    /// An unquoted '\n' or '\r' separates commands for /bin/sh.
    static std::optional<RejectionKind> scanLineBreaks(const std::string& text);

    const Policy policy_;
};

/// Convenience wrapper around CommandValidator.
TRIAGE_API ValidationResult validateCommand(const std::string& command, const Policy& policy);

} // namespace triage

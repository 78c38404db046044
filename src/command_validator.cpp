// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "triage/command_validator.h"

#include <algorithm>
#include <cctype>

namespace triage {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r\f\v");
    return s.substr(start, end - start + 1);
}

bool contains(const std::vector<std::string>& list, const std::string& value) {
    return std::find(list.begin(), list.end(), value) != list.end();
}

} // namespace

// ---- Policy ----

Policy Policy::kubernetes() {
    Policy policy;
    policy.allowedCommands = {"kubectl"};
    policy.allowedSubCommands = {"get", "describe", "logs", "top", "explain"};
    policy.allowedPipedCommands = {"grep", "awk", "sort", "uniq", "head", "tail", "cut", "wc"};
    return policy;
}

// ---- Rejections ----

std::string rejectionToString(RejectionKind kind) {
    switch (kind) {
        case RejectionKind::EMPTY_COMMAND:           return "command is empty";
        case RejectionKind::COMMAND_CHAINING:        return "command chaining is not allowed";
        case RejectionKind::COMMAND_SUBSTITUTION:    return "command substitution is not allowed";
        case RejectionKind::REDIRECTION:             return "redirection is not allowed";
        case RejectionKind::UNMATCHED_QUOTE:         return "unmatched quote in argument";
        case RejectionKind::INVALID_MAIN_COMMAND:    return "main command is not valid";
        case RejectionKind::COMMAND_NOT_ALLOWED:     return "command is not allowed";
        case RejectionKind::SUB_COMMAND_NOT_ALLOWED: return "sub command is not allowed";
    }
    return "command rejected";
}

std::string ValidationResult::message() const {
    if (!rejection.has_value()) return "";
    std::string text = rejectionToString(rejection.value());
    if (!detail.empty()) {
        text += ": " + detail;
    }
    return text;
}

// ---- Splitting ----

std::vector<std::string> splitPipeline(const std::string& command) {
    std::vector<std::string> stages;
    if (command.empty()) return stages;

    std::string current;
    bool inSingleQuote = false;
    bool inDoubleQuote = false;
    bool escaped = false;

    for (char c : command) {
        if (escaped) {
            current += c;
            escaped = false;
            continue;
        }

        switch (c) {
            case '\\':
                escaped = true;
                current += c;
                break;
            case '\'':
                if (!inDoubleQuote) inSingleQuote = !inSingleQuote;
                current += c;
                break;
            case '"':
                if (!inSingleQuote) inDoubleQuote = !inDoubleQuote;
                current += c;
                break;
            case '|':
                if (!inSingleQuote && !inDoubleQuote) {
                    stages.push_back(trim(current));
                    current.clear();
                } else {
                    current += c;
                }
                break;
            default:
                current += c;
                break;
        }
    }

    stages.push_back(trim(current));
    return stages;
}

std::vector<std::string> splitTokens(const std::string& stage) {
    std::vector<std::string> tokens;
    std::string current;
    char inQuote = 0;
    bool escaped = false;

    for (char c : stage) {
        if (escaped) {
            current += c;
            escaped = false;
            continue;
        }

        if (c == '\\') {
            escaped = true;
            current += c;
            continue;
        }

        if (inQuote != 0) {
            if (c == inQuote) inQuote = 0;
            current += c;
        } else if (c == '\'' || c == '"') {
            inQuote = c;
            current += c;
        } else if (std::isspace(static_cast<unsigned char>(c))) {
            if (!current.empty()) {
                tokens.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }

    if (!current.empty()) {
        tokens.push_back(current);
    }
    return tokens;
}

std::vector<Stage> parseCommand(const std::string& command) {
    std::vector<Stage> stages;
    for (auto& text : splitPipeline(command)) {
        Stage stage;
        stage.tokens = splitTokens(text);
        stage.text = std::move(text);
        stages.push_back(std::move(stage));
    }
    return stages;
}

// ---- CommandValidator ----

CommandValidator::CommandValidator(Policy policy)
    : policy_(std::move(policy)) {}

std::optional<RejectionKind> CommandValidator::scanToken(const std::string& token) {
    bool inSingleQuote = false;
    bool inDoubleQuote = false;
    bool escaped = false;

    for (size_t i = 0; i < token.size(); ++i) {
        char c = token[i];
        if (escaped) {
            escaped = false;
            continue;
        }

        bool quoted = inSingleQuote || inDoubleQuote;
        switch (c) {
            case '\\':
                escaped = true;
                break;
            case '\'':
                if (!inDoubleQuote) inSingleQuote = !inSingleQuote;
                break;
            case '"':
                if (!inSingleQuote) inDoubleQuote = !inDoubleQuote;
                break;
            case ';':
            case '&':
                if (!quoted) return RejectionKind::COMMAND_CHAINING;
                break;
            case '`':
                if (!quoted) return RejectionKind::COMMAND_SUBSTITUTION;
                break;
            case '$':
                if (!quoted && i + 1 < token.size() && token[i + 1] == '(') {
                    return RejectionKind::COMMAND_SUBSTITUTION;
                }
                break;
            case '>':
            case '<':
                if (!quoted) return RejectionKind::REDIRECTION;
                break;
            default:
                break;
        }
    }

    if (inSingleQuote || inDoubleQuote) {
        return RejectionKind::UNMATCHED_QUOTE;
    }
    return std::nullopt;
}

std::optional<RejectionKind> CommandValidator::scanLineBreaks(const std::string& text) {
    char inQuote = 0;
    bool escaped = false;

    for (char c : text) {
        if (escaped) {
            escaped = false;
            continue;
        }
        if (c == '\\') {
            escaped = true;
        } else if (inQuote != 0) {
            if (c == inQuote) inQuote = 0;
        } else if (c == '\'' || c == '"') {
            inQuote = c;
        } else if (c == '\n' || c == '\r') {
            return RejectionKind::COMMAND_CHAINING;
        }
    }
    return std::nullopt;
}

std::optional<RejectionKind> CommandValidator::checkStage(const Stage& stage, bool isMain,
                                                          std::string& detail) const {
    const auto& tokens = stage.tokens;

    if (isMain) {
        size_t minTokens = policy_.checksSubCommands() ? 2 : 1;
        if (tokens.size() < minTokens) {
            detail = stage.text;
            return RejectionKind::INVALID_MAIN_COMMAND;
        }
        if (!contains(policy_.allowedCommands, tokens[0])) {
            detail = tokens[0];
            return RejectionKind::COMMAND_NOT_ALLOWED;
        }
        if (policy_.checksSubCommands() && !contains(policy_.allowedSubCommands, tokens[1])) {
            detail = tokens[1];
            return RejectionKind::SUB_COMMAND_NOT_ALLOWED;
        }
    } else if (!contains(policy_.allowedPipedCommands, tokens[0])) {
        detail = tokens[0];
        return RejectionKind::COMMAND_NOT_ALLOWED;
    }

    return std::nullopt;
}

ValidationResult CommandValidator::validate(const std::string& command) const {
    ValidationResult result;
    if (command.empty()) {
        result.rejection = RejectionKind::EMPTY_COMMAND;
        return result;
    }

    result.stages = parseCommand(command);

    // Shell operators are rejected wherever they appear, before structure
    // and allow-lists are consulted.
    for (const auto& stage : result.stages) {
        if (auto kind = scanLineBreaks(stage.text)) {
            result.rejection = kind;
            return result;
        }
        for (const auto& token : stage.tokens) {
            if (auto kind = scanToken(token)) {
                result.rejection = kind;
                return result;
            }
        }
    }

    // Structure: every stage needs at least one token.
    for (const auto& stage : result.stages) {
        if (stage.tokens.empty()) {
            result.rejection = RejectionKind::EMPTY_COMMAND;
            return result;
        }
    }

    for (size_t i = 0; i < result.stages.size(); ++i) {
        std::string detail;
        if (auto kind = checkStage(result.stages[i], i == 0, detail)) {
            result.rejection = kind;
            result.detail = detail;
            return result;
        }
    }

    return result;
}

ValidationResult validateCommand(const std::string& command, const Policy& policy) {
    return CommandValidator(policy).validate(command);
}

} // namespace triage

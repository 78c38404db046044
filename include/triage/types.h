// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Common types for the triage diagnostic assistant.

#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace triage {

using json = nlohmann::json;

// ---- Session States ----

enum class SessionState {
    QUERYING,
    DECIDING_ON_COMMAND,
    EXECUTING,
    TERMINAL
};

inline std::string sessionStateToString(SessionState s) {
    switch (s) {
        case SessionState::QUERYING:            return "QUERYING";
        case SessionState::DECIDING_ON_COMMAND: return "DECIDING_ON_COMMAND";
        case SessionState::EXECUTING:           return "EXECUTING";
        case SessionState::TERMINAL:            return "TERMINAL";
    }
    return "UNKNOWN";
}

enum class SessionOutcome {
    PENDING,
    ANSWER,
    MAX_ITERATIONS,
    ERROR
};

inline std::string outcomeToString(SessionOutcome o) {
    switch (o) {
        case SessionOutcome::PENDING:        return "pending";
        case SessionOutcome::ANSWER:         return "answer";
        case SessionOutcome::MAX_ITERATIONS: return "max_iterations";
        case SessionOutcome::ERROR:          return "error";
    }
    return "unknown";
}

// ---- Agent Configuration ----

struct AgentConfig {
    int maxIterations = 7;       // model queries per session
    int correctionAttempts = 3;  // replies allowed per query before giving up
    bool debug = false;
    bool showPrompts = false;
    bool silentMode = false;
};

// ---- Message Types ----

enum class MessageRole {
    SYSTEM,
    USER,
    ASSISTANT
};

inline std::string roleToString(MessageRole r) {
    switch (r) {
        case MessageRole::SYSTEM:    return "system";
        case MessageRole::USER:      return "user";
        case MessageRole::ASSISTANT: return "assistant";
    }
    return "unknown";
}

struct Message {
    MessageRole role;
    std::string content;

    json toJson() const {
        return json{{"role", roleToString(role)}, {"content", content}};
    }
};

/// Token accounting reported by the chat completions endpoint.
struct Usage {
    int promptTokens = 0;
    int completionTokens = 0;
    int totalTokens = 0;

    void add(const Usage& other) {
        promptTokens += other.promptTokens;
        completionTokens += other.completionTokens;
        totalTokens += other.totalTokens;
    }
};

// ---- Wire Schemas ----
//
// Both schemas are parsed through nlohmann's from_json hooks below. A field of
// the wrong JSON type throws json::type_error, so a reply either becomes a
// complete value or is rejected as a whole. null is treated as absent.

/// Structured reply of the diagnostic agent.
/// {"answer": string?, "run_command": string?, "reason_for_command": string,
///  "need_more_data": bool?}
struct AgentResponse {
    std::optional<std::string> answer;
    std::optional<std::string> runCommand;
    std::string reasonForCommand;
    std::optional<bool> needMoreData;

    /// True when the model still wants data before answering.
    /// An explicit need_more_data wins; otherwise a proposed command implies it.
    bool needsMoreData() const {
        if (needMoreData.has_value()) return needMoreData.value();
        return proposedCommand().has_value();
    }

    /// The proposed command, if a non-empty one was given.
    std::optional<std::string> proposedCommand() const {
        if (runCommand.has_value() && !runCommand->empty()) return runCommand;
        return std::nullopt;
    }

    json toJson() const {
        json j = json::object();
        if (answer.has_value()) j["answer"] = answer.value();
        if (runCommand.has_value()) j["run_command"] = runCommand.value();
        j["reason_for_command"] = reasonForCommand;
        if (needMoreData.has_value()) j["need_more_data"] = needMoreData.value();
        return j;
    }
};

/// Classification returned by a validation model.
/// {"is_read_only": bool, "reason": string}
struct CommandVerdict {
    bool isReadOnly = false;
    std::string reason;

    json toJson() const {
        return json{{"is_read_only", isReadOnly}, {"reason", reason}};
    }
};

namespace detail {

template <typename T>
std::optional<T> optionalField(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    return it->template get<T>();
}

// get_ref throws json::type_error for anything but an object.
inline void requireObject(const json& j) {
    (void)j.get_ref<const json::object_t&>();
}

} // namespace detail

inline void from_json(const json& j, AgentResponse& r) {
    detail::requireObject(j);
    r.answer = detail::optionalField<std::string>(j, "answer");
    r.runCommand = detail::optionalField<std::string>(j, "run_command");
    r.reasonForCommand = detail::optionalField<std::string>(j, "reason_for_command").value_or("");
    r.needMoreData = detail::optionalField<bool>(j, "need_more_data");
}

inline void from_json(const json& j, CommandVerdict& v) {
    detail::requireObject(j);
    v.isReadOnly = detail::optionalField<bool>(j, "is_read_only").value_or(false);
    v.reason = detail::optionalField<std::string>(j, "reason").value_or("");
}

} // namespace triage

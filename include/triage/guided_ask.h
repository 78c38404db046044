// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Structured replies with bounded self-correction.
//
// guidedAsk<T>() sends a prompt, parses the reply as JSON into T through
// nlohmann's from_json, and on failure re-asks with a corrective prompt
// that quotes the parse error. The schema is whatever T's from_json
// accepts; the loop itself knows nothing about it.

#pragma once

#include <functional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "context.h"
#include "errors.h"
#include "json_utils.h"
#include "llm_client.h"
#include "triage/export.h"

namespace triage {

using json = nlohmann::json;

/// Called before each corrective retry with the attempt that failed.
using RetryCallback = std::function<void(int failedAttempt, const std::string& error)>;

/// Prompt sent after an unparseable reply.
TRIAGE_API std::string correctionPrompt(const std::string& parseError,
                                        const std::string& originalPrompt);

/// Ask until the reply parses as T, at most maxAttempts model calls.
///
/// @throws TransportError if a model call fails (no retry)
/// @throws SchemaError after maxAttempts unparseable replies; the malformed
///         payload is not returned
/// @throws std::invalid_argument if maxAttempts < 1
template <typename T>
T guidedAsk(ModelTransport& model, const Context& ctx, const std::string& prompt,
            int maxAttempts, const RetryCallback& onRetry = nullptr) {
    if (maxAttempts < 1) {
        throw std::invalid_argument("maxAttempts must be at least 1");
    }

    std::string current = prompt;
    std::string lastError;

    for (int attempt = 1; attempt <= maxAttempts; ++attempt) {
        std::string reply;
        try {
            reply = model.ask(ctx, current);
        } catch (const TransportError& e) {
            throw TransportError(std::string("failed to interact with the model: ") + e.what());
        }

        try {
            return parseModelReply(reply).get<T>();
        } catch (const json::exception& e) {
            lastError = e.what();
        }

        if (attempt < maxAttempts) {
            if (onRetry) onRetry(attempt, lastError);
            current = correctionPrompt(lastError, prompt);
        }
    }

    throw SchemaError("failed to parse model response after " + std::to_string(maxAttempts) +
                      " attempts: " + lastError, maxAttempts);
}

} // namespace triage

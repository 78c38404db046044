// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// JSON helpers for model replies.
//
// Parsing is deliberately strict: the reply must be one JSON document. The
// only tolerance is for a reply wrapped entirely in a markdown code fence,
// which many chat models emit even when told not to.

#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "triage/export.h"

namespace triage {

using json = nlohmann::json;

/// Remove one surrounding ``` or ```json fence if it encloses the whole text.
/// Text that is not fully fenced is returned trimmed but otherwise unchanged.
TRIAGE_API std::string stripCodeFence(const std::string& text);

/// Parse a model reply as a single JSON document.
/// @throws json::parse_error with the parser's message on malformed input
TRIAGE_API json parseModelReply(const std::string& reply);

/// Shorten long text for display, keeping its head and tail.
TRIAGE_API std::string truncateMiddle(const std::string& text, size_t maxLen,
                                      size_t headLen, size_t tailLen);

} // namespace triage

// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "triage/json_utils.h"

#include <regex>

namespace triage {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r");
    return s.substr(start, end - start + 1);
}

} // namespace

std::string stripCodeFence(const std::string& text) {
    std::string trimmed = trim(text);

    static const std::regex fence(R"(^```[A-Za-z]*[ \t]*\r?\n([\s\S]*?)\r?\n?```$)");
    std::smatch match;
    if (std::regex_match(trimmed, match, fence)) {
        return trim(match[1].str());
    }
    return trimmed;
}

json parseModelReply(const std::string& reply) {
    return json::parse(stripCodeFence(reply));
}

std::string truncateMiddle(const std::string& text, size_t maxLen,
                           size_t headLen, size_t tailLen) {
    if (text.size() <= maxLen || headLen + tailLen >= text.size()) {
        return text;
    }
    return text.substr(0, headLen) + "\n...[truncated]...\n" +
           text.substr(text.size() - tailLen);
}

} // namespace triage

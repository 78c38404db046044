// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "triage/guided_ask.h"

namespace triage {

std::string correctionPrompt(const std::string& parseError, const std::string& originalPrompt) {
    return "Error: Failed to parse your response. Answer only with the requested JSON format. "
           "The error was: " + parseError + "\n\n"
           "Original prompt: " + originalPrompt + "\n"
           "Do not apologize or mention the formatting error in your response";
}

} // namespace triage

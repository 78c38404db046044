// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "triage/console.h"

#include <iostream>

#include "triage/json_utils.h"

namespace triage {

// ---- TerminalConsole ----

void TerminalConsole::printSessionStart(const std::string& query, int maxIterations,
                                        const std::string& modelId) {
    std::cout << "\n" << BOLD << CYAN << "Analyzing" << RESET << ": " << query << "\n";
    std::cout << DIM << "Max queries: " << maxIterations;
    if (!modelId.empty()) {
        std::cout << " | Model: " << modelId;
    }
    std::cout << RESET << "\n\n";
}

void TerminalConsole::printIterationHeader(int iteration, int limit) {
    std::cout << BOLD << BLUE << "--- Query " << iteration << "/" << limit
              << " ---" << RESET << "\n";
}

void TerminalConsole::printStateInfo(const std::string& message) {
    std::cout << DIM << "[" << message << "]" << RESET << "\n";
}

void TerminalConsole::printReason(const std::string& reason) {
    if (!reason.empty()) {
        std::cout << MAGENTA << "Reason: " << RESET << reason << "\n";
    }
}

void TerminalConsole::printCommandProposal(const std::string& command) {
    std::cout << YELLOW << "Model asks to run: " << BOLD << command << RESET << "\n";
}

void TerminalConsole::printCommandRejected(const std::string& reason) {
    std::cout << RED << "Rejected: " << RESET << reason << "\n";
}

void TerminalConsole::printCommandOutput(const std::string& output) {
    // Display only; the model always receives the full output.
    std::cout << DIM << truncateMiddle(output, 2000, 1000, 500) << RESET << "\n";
}

void TerminalConsole::printError(const std::string& message) {
    std::cout << RED << "ERROR: " << RESET << message << "\n";
}

void TerminalConsole::printWarning(const std::string& message) {
    std::cout << YELLOW << "WARNING: " << RESET << message << "\n";
}

void TerminalConsole::printInfo(const std::string& message) {
    std::cout << BLUE << "INFO: " << RESET << message << "\n";
}

void TerminalConsole::startProgress(const std::string& message) {
    std::cout << DIM << message << "..." << RESET << std::flush;
}

void TerminalConsole::stopProgress() {
    std::cout << "\n";
}

void TerminalConsole::printFinalAnswer(const std::string& answer) {
    std::cout << "\n" << BOLD << GREEN << "Result:" << RESET << "\n" << answer << "\n";
}

void TerminalConsole::printCompletion(int iterations, int limit) {
    std::cout << "\n" << DIM << "Completed in " << iterations << "/" << limit
              << " queries." << RESET << "\n";
}

void TerminalConsole::printPrompt(const std::string& prompt, const std::string& title) {
    std::cout << DIM << title << ":" << RESET << "\n" << prompt << "\n";
}

void TerminalConsole::printResponse(const std::string& response, const std::string& title) {
    std::cout << DIM << title << ":" << RESET << "\n" << response << "\n";
}

void TerminalConsole::printHeader(const std::string& text) {
    std::cout << "\n" << BOLD << text << RESET << "\n";
}

void TerminalConsole::printSeparator(int length) {
    std::cout << std::string(static_cast<size_t>(length), '-') << "\n";
}

void TerminalConsole::printUsage(const std::string& summary) {
    std::cout << CYAN << "Usage: " << RESET << summary << "\n";
}

// ---- SilentConsole ----

void SilentConsole::printFinalAnswer(const std::string& answer) {
    if (!silenceFinalAnswer_) {
        std::cout << answer << "\n";
    }
}

void SilentConsole::printIncomplete(const std::string& notice) {
    printFinalAnswer(notice);
}

} // namespace triage

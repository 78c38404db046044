// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Console output for diagnostic sessions.
//
// Sessions report progress through the abstract OutputHandler. The terminal
// implementation prints ANSI-coloured lines; the silent one prints nothing
// but, optionally, the final answer.

#pragma once

#include <string>

#include "triage/export.h"

namespace triage {

/// Abstract output handler interface.
class OutputHandler {
public:
    virtual ~OutputHandler() = default;

    // === Core Progress/State Methods ===
    virtual void printSessionStart(const std::string& query, int maxIterations,
                                   const std::string& modelId = "") = 0;
    virtual void printIterationHeader(int iteration, int limit) = 0;
    virtual void printStateInfo(const std::string& message) = 0;
    virtual void printReason(const std::string& reason) = 0;

    // === Command Methods ===
    virtual void printCommandProposal(const std::string& command) = 0;
    virtual void printCommandRejected(const std::string& reason) = 0;
    virtual void printCommandOutput(const std::string& output) = 0;

    // === Status Messages ===
    virtual void printError(const std::string& message) = 0;
    virtual void printWarning(const std::string& message) = 0;
    virtual void printInfo(const std::string& message) = 0;

    // === Progress Indicators ===
    virtual void startProgress(const std::string& message) = 0;
    virtual void stopProgress() = 0;

    // === Completion Methods ===
    virtual void printFinalAnswer(const std::string& answer) = 0;
    virtual void printCompletion(int iterations, int limit) = 0;

    /// Notice for a session that ran out of queries without an answer.
    virtual void printIncomplete(const std::string& notice) { printWarning(notice); }

    // === Optional Methods (default no-op) ===
    virtual void printPrompt(const std::string& /*prompt*/, const std::string& /*title*/ = "Prompt") {}
    virtual void printResponse(const std::string& /*response*/, const std::string& /*title*/ = "Response") {}
    virtual void printHeader(const std::string& /*text*/) {}
    virtual void printSeparator(int /*length*/ = 50) {}
    virtual void printUsage(const std::string& /*summary*/) {}
};

/// Terminal console with ANSI color output.
class TRIAGE_API TerminalConsole : public OutputHandler {
public:
    void printSessionStart(const std::string& query, int maxIterations,
                           const std::string& modelId = "") override;
    void printIterationHeader(int iteration, int limit) override;
    void printStateInfo(const std::string& message) override;
    void printReason(const std::string& reason) override;
    void printCommandProposal(const std::string& command) override;
    void printCommandRejected(const std::string& reason) override;
    void printCommandOutput(const std::string& output) override;
    void printError(const std::string& message) override;
    void printWarning(const std::string& message) override;
    void printInfo(const std::string& message) override;
    void startProgress(const std::string& message) override;
    void stopProgress() override;
    void printFinalAnswer(const std::string& answer) override;
    void printCompletion(int iterations, int limit) override;
    void printPrompt(const std::string& prompt, const std::string& title = "Prompt") override;
    void printResponse(const std::string& response, const std::string& title = "Response") override;
    void printHeader(const std::string& text) override;
    void printSeparator(int length = 50) override;
    void printUsage(const std::string& summary) override;

private:
    // ANSI color codes
    static constexpr const char* RESET   = "\033[0m";
    static constexpr const char* BOLD    = "\033[1m";
    static constexpr const char* DIM     = "\033[90m";
    static constexpr const char* RED     = "\033[91m";
    static constexpr const char* GREEN   = "\033[92m";
    static constexpr const char* YELLOW  = "\033[93m";
    static constexpr const char* BLUE    = "\033[94m";
    static constexpr const char* MAGENTA = "\033[95m";
    static constexpr const char* CYAN    = "\033[96m";
};

/// Silent console that prints only the session outcome (the final answer or
/// the incomplete-analysis notice), or nothing at all when silenced.
/// Used for testing and scripted operation.
class TRIAGE_API SilentConsole : public OutputHandler {
public:
    explicit SilentConsole(bool silenceFinalAnswer = false)
        : silenceFinalAnswer_(silenceFinalAnswer) {}

    void printSessionStart(const std::string&, int, const std::string&) override {}
    void printIterationHeader(int, int) override {}
    void printStateInfo(const std::string&) override {}
    void printReason(const std::string&) override {}
    void printCommandProposal(const std::string&) override {}
    void printCommandRejected(const std::string&) override {}
    void printCommandOutput(const std::string&) override {}
    void printError(const std::string&) override {}
    void printWarning(const std::string&) override {}
    void printInfo(const std::string&) override {}
    void startProgress(const std::string&) override {}
    void stopProgress() override {}
    void printFinalAnswer(const std::string& answer) override;
    void printIncomplete(const std::string& notice) override;
    void printCompletion(int, int) override {}

private:
    bool silenceFinalAnswer_;
};

} // namespace triage

// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Interactive Kubernetes troubleshooting assistant.
//
// Usage:
//   ./k8s_triage                          # interactive
//   ./k8s_triage --query "why is my pod pending?"
//
// Configuration is read from $XDG_CONFIG_HOME/triage/config.json (created
// with defaults on first run) unless --config is given. Commands proposed
// by the model are checked against the kubectl allow-list, then approved
// by the validation model if one is configured, otherwise by you.

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include <triage/approver.h>
#include <triage/config.h>
#include <triage/errors.h>
#include <triage/executer.h>
#include <triage/kubernetes_agent.h>
#include <triage/llm_client.h>

#ifndef TRIAGE_VERSION
#define TRIAGE_VERSION "0.0.0"
#endif

namespace {

struct Options {
    std::string configPath;
    std::string query;
    int timeoutSeconds = 0;  // 0 = use the config file value
    bool debug = false;
    bool usage = false;
    bool silent = false;
    bool help = false;
    bool version = false;
};

void printHelp() {
    std::cout <<
        "k8s_triage - Kubernetes troubleshooting with a language model\n"
        "\n"
        "Usage: k8s_triage [options]\n"
        "\n"
        "Options:\n"
        "  --config <path>     config file (default: $XDG_CONFIG_HOME/triage/config.json)\n"
        "  --query <text>      answer one question and exit\n"
        "  --timeout <sec>     deadline for each session\n"
        "  --debug             print transport and agent diagnostics to stderr\n"
        "  --usage             print token usage and cost at exit\n"
        "  --silent            print only the final answer\n"
        "  --version           print the version and exit\n"
        "  --help              print this help and exit\n"
        "\n"
        "Interactive commands: reset, quit, exit, q\n";
}

/// @throws std::invalid_argument on unknown flags or missing values
Options parseArgs(int argc, char** argv) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument(arg + " requires a value");
            }
            return argv[++i];
        };

        if (arg == "--config") {
            opts.configPath = value();
        } else if (arg == "--query") {
            opts.query = value();
        } else if (arg == "--timeout") {
            std::string v = value();
            try {
                opts.timeoutSeconds = std::stoi(v);
            } catch (const std::exception&) {
                throw std::invalid_argument("--timeout expects seconds, got '" + v + "'");
            }
            if (opts.timeoutSeconds <= 0) {
                throw std::invalid_argument("--timeout must be positive");
            }
        } else if (arg == "--debug") {
            opts.debug = true;
        } else if (arg == "--usage") {
            opts.usage = true;
        } else if (arg == "--silent") {
            opts.silent = true;
        } else if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg == "--version") {
            opts.version = true;
        } else {
            throw std::invalid_argument("unknown option: " + arg);
        }
    }
    return opts;
}

triage::AgentConfig makeAgentConfig(const triage::TriageConfig& config) {
    triage::AgentConfig agentConfig;
    agentConfig.maxIterations = config.maxIterations;
    agentConfig.correctionAttempts = config.correctionAttempts;
    agentConfig.debug = config.debug;
    agentConfig.showPrompts = config.showPrompts;
    agentConfig.silentMode = config.silentMode;
    return agentConfig;
}

/// Returns false when the session ended in an error.
/// Every query gets its own executer, so no command output outlives it.
bool runQuery(triage::KubernetesAgent& agent, triage::Approver& approver,
              const std::string& query, int timeoutSeconds, bool silent) {
    auto ctx = triage::Context::withTimeout(std::chrono::seconds(timeoutSeconds));
    triage::SessionResult result = agent.startSession(
        ctx, approver, std::make_unique<triage::ShellRunner>(), query);

    if (result.outcome == triage::SessionOutcome::ERROR && silent) {
        std::cerr << "error: " << result.text << std::endl;
    }
    return result.outcome != triage::SessionOutcome::ERROR;
}

} // namespace

int main(int argc, char** argv) {
    Options opts;
    try {
        opts = parseArgs(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "k8s_triage: " << e.what() << "\n\n";
        printHelp();
        return 2;
    }

    if (opts.help) {
        printHelp();
        return 0;
    }
    if (opts.version) {
        std::cout << "k8s_triage " << TRIAGE_VERSION << std::endl;
        return 0;
    }

    triage::TriageConfig config;
    try {
        config = triage::loadConfig(opts.configPath);
    } catch (const triage::ConfigError& e) {
        std::cerr << "k8s_triage: " << e.what() << std::endl;
        return 1;
    }

    if (opts.debug) {
        config.debug = true;
        config.agent.debug = true;
        if (config.validation) config.validation->debug = true;
    }
    if (opts.usage) config.showUsage = true;
    if (opts.silent) config.silentMode = true;
    if (opts.timeoutSeconds > 0) config.sessionTimeoutSeconds = opts.timeoutSeconds;

    try {
        auto agentModel = std::make_unique<triage::LlmClient>(config.agent);
        triage::KubernetesAgent agent(std::move(agentModel), makeAgentConfig(config));

        std::unique_ptr<triage::LlmClient> validationModel;
        std::unique_ptr<triage::Approver> approver;
        if (config.useModelForValidation()) {
            validationModel = std::make_unique<triage::LlmClient>(config.validation.value());
            approver = std::make_unique<triage::ModelApprover>(*validationModel,
                                                               config.correctionAttempts);
        } else {
            approver = std::make_unique<triage::UserApprover>();
        }

        auto printUsage = [&]() {
            if (!config.showUsage) return;
            agent.console().printUsage(agent.logUsage());
            if (validationModel) {
                agent.console().printUsage(validationModel->usageSummary());
            }
        };

        if (!opts.query.empty()) {
            bool ok = runQuery(agent, *approver, opts.query,
                               config.sessionTimeoutSeconds, config.silentMode);
            printUsage();
            return ok ? 0 : 1;
        }

        std::cout << "\nKubernetes triage assistant ready. Type 'quit' to exit, "
                     "'reset' to start over." << std::endl;
        std::cout << "Try: 'Why is the pod in namespace shop crash looping?'\n" << std::endl;

        std::string userInput;
        while (true) {
            std::cout << "You: " << std::flush;
            if (!std::getline(std::cin, userInput)) break;

            if (userInput.empty()) continue;
            if (userInput == "quit" || userInput == "exit" || userInput == "q") break;
            if (userInput == "reset") {
                agent.reset();
                std::cout << "Conversation cleared.\n" << std::endl;
                continue;
            }

            runQuery(agent, *approver, userInput,
                     config.sessionTimeoutSeconds, config.silentMode);
            std::cout << std::endl;
        }
        printUsage();

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}

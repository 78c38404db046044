// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include <gtest/gtest.h>
#include <triage/agent.h>
#include <triage/kubernetes_agent.h>

#include "test_doubles.h"

using namespace triage;
using namespace triage::testing;

namespace {

// ---- Test Agent subclass with an echo-only policy ----

class EchoAgent : public Agent {
public:
    EchoAgent(std::unique_ptr<ModelTransport> model, const AgentConfig& config)
        : Agent(std::move(model), config) {}

protected:
    std::string getSystemPrompt() const override {
        return "You are a test agent that may only run echo.";
    }

    Policy commandPolicy() const override {
        Policy policy;
        policy.allowedCommands = {"echo"};
        return policy;
    }
};

AgentConfig silentConfig() {
    AgentConfig config;
    config.silentMode = true;
    return config;
}

/// Builds an agent around a ScriptedModel and keeps a handle to the model.
template <typename AgentT>
std::unique_ptr<AgentT> makeAgent(ScriptedModel*& model, AgentConfig config = silentConfig()) {
    auto m = std::make_unique<ScriptedModel>();
    model = m.get();
    return std::make_unique<AgentT>(std::move(m), config);
}

class SilentExecuter : public Executer {
public:
    ExecutionResult run(const Context&, const std::string& command) override {
        commands.push_back(command);
        return ExecutionResult{"out: " + command, std::nullopt};
    }
    std::vector<std::string> commands;
};

} // namespace

// ---- Tests ----

TEST(AgentTest, NullModelRejected) {
    EXPECT_THROW(EchoAgent(nullptr, silentConfig()), std::invalid_argument);
}

TEST(AgentTest, SystemPromptComposition) {
    ScriptedModel* model = nullptr;
    auto agent = makeAgent<EchoAgent>(model);

    std::string prompt = agent->systemPrompt();
    EXPECT_NE(prompt.find("You are a test agent that may only run echo."), std::string::npos);
    EXPECT_NE(prompt.find("RESPONSE FORMAT"), std::string::npos);
    EXPECT_NE(prompt.find("\"answer\": string"), std::string::npos);
    EXPECT_NE(prompt.find("\"run_command\": string"), std::string::npos);
    EXPECT_NE(prompt.find("\"reason_for_command\": string"), std::string::npos);
    EXPECT_NE(prompt.find("\"need_more_data\": bool"), std::string::npos);

    // The composed prompt is what the model receives.
    EXPECT_EQ(model->systemPrompt, prompt);
}

TEST(AgentTest, PolicyComesFromSubclass) {
    ScriptedModel* model = nullptr;
    auto agent = makeAgent<EchoAgent>(model);

    ASSERT_EQ(agent->policy().allowedCommands.size(), 1u);
    EXPECT_EQ(agent->policy().allowedCommands[0], "echo");
}

TEST(AgentTest, SessionRunsThroughPolicyApproverAndExecuter) {
    ScriptedModel* model = nullptr;
    auto agent = makeAgent<EchoAgent>(model);
    model->push(commandReply("rm -rf /"));
    model->push(commandReply("echo hi"));
    model->push(answerReply("done"));

    FixedApprover approver;
    SilentExecuter executer;
    SessionResult result = agent->startSession(Context(), approver, executer, "go");

    EXPECT_EQ(result.outcome, SessionOutcome::ANSWER);
    EXPECT_EQ(result.text, "done");
    EXPECT_EQ(result.iterations, 3);
    // rm never reaches the approver; echo does.
    EXPECT_EQ(approver.seen, (std::vector<std::string>{"echo hi"}));
    EXPECT_EQ(executer.commands, (std::vector<std::string>{"echo hi"}));
    EXPECT_EQ(model->prompts[1], "command is not allowed: rm");
    EXPECT_EQ(model->prompts[2], "out: echo hi");
}

TEST(AgentTest, MaxIterationsFromConfig) {
    ScriptedModel* model = nullptr;
    AgentConfig config = silentConfig();
    config.maxIterations = 3;
    auto agent = makeAgent<EchoAgent>(model, config);
    for (int i = 0; i < 5; ++i) model->push(commandReply("echo " + std::to_string(i)));

    FixedApprover approver;
    SilentExecuter executer;
    SessionResult result = agent->startSession(Context(), approver, executer, "go");

    EXPECT_EQ(result.outcome, SessionOutcome::MAX_ITERATIONS);
    EXPECT_EQ(model->prompts.size(), 3u);
}

TEST(AgentTest, EachSessionStartsFresh) {
    ScriptedModel* model = nullptr;
    auto agent = makeAgent<EchoAgent>(model);
    model->push(commandReply("echo a"));
    model->push(answerReply("first"));
    model->push(commandReply("echo a"));
    model->push(answerReply("second"));

    FixedApprover approver;
    SilentExecuter executer;
    SessionResult first = agent->startSession(Context(), approver, executer, "one");
    SessionResult second = agent->startSession(Context(), approver, executer, "two");

    EXPECT_EQ(first.iterations, 2);
    EXPECT_EQ(second.iterations, 2);
    // The session cache does not survive, so approval is asked again.
    EXPECT_EQ(approver.seen.size(), 2u);
}

TEST(AgentTest, RunnerSessionsDoNotShareCommandOutput) {
    ScriptedModel* model = nullptr;
    auto agent = makeAgent<EchoAgent>(model);
    model->push(commandReply("echo state"));
    model->push(answerReply("first"));
    model->push(commandReply("echo state"));
    model->push(answerReply("second"));

    FixedApprover approver;
    auto before = std::make_unique<CountingRunner>();
    before->outputs["echo state"] = exited(0, "v1\n");
    auto after = std::make_unique<CountingRunner>();
    after->outputs["echo state"] = exited(0, "v2\n");

    SessionResult first = agent->startSession(Context(), approver, std::move(before), "one");
    SessionResult second = agent->startSession(Context(), approver, std::move(after), "two");

    EXPECT_EQ(first.outcome, SessionOutcome::ANSWER);
    EXPECT_EQ(second.outcome, SessionOutcome::ANSWER);
    ASSERT_EQ(model->prompts.size(), 4u);
    EXPECT_EQ(model->prompts[1], "v1");
    EXPECT_EQ(model->prompts[3], "v2");
}

TEST(AgentTest, ResetClearsModelHistory) {
    ScriptedModel* model = nullptr;
    auto agent = makeAgent<EchoAgent>(model);

    agent->reset();
    EXPECT_EQ(model->resets, 1);
}

TEST(AgentTest, LogUsageDelegatesToModel) {
    ScriptedModel* model = nullptr;
    auto agent = makeAgent<EchoAgent>(model);
    EXPECT_EQ(agent->logUsage(), "");
}

TEST(AgentTest, CustomOutputHandler) {
    ScriptedModel* model = nullptr;
    auto agent = makeAgent<EchoAgent>(model);
    agent->setOutputHandler(std::make_unique<SilentConsole>(true));
    model->push(answerReply("quiet"));

    FixedApprover approver;
    SilentExecuter executer;
    EXPECT_EQ(agent->startSession(Context(), approver, executer, "q").text, "quiet");
}

// ---- KubernetesAgent ----

TEST(KubernetesAgentTest, InstallsPromptOnConstruction) {
    ScriptedModel* model = nullptr;
    auto agent = makeAgent<KubernetesAgent>(model);

    EXPECT_NE(model->systemPrompt.find("Kubernetes"), std::string::npos);
    EXPECT_NE(model->systemPrompt.find("\"need_more_data\": bool"), std::string::npos);
}

TEST(KubernetesAgentTest, UsesKubectlPolicy) {
    ScriptedModel* model = nullptr;
    auto agent = makeAgent<KubernetesAgent>(model);
    const Policy& policy = agent->policy();

    EXPECT_EQ(policy.allowedCommands, (std::vector<std::string>{"kubectl"}));
    EXPECT_TRUE(policy.checksSubCommands());
    EXPECT_TRUE(CommandValidator(policy).validate("kubectl get pods -A | grep -v Running").accepted());
    EXPECT_FALSE(CommandValidator(policy).validate("kubectl delete ns prod").accepted());
}

TEST(KubernetesAgentTest, MutatingCommandNeverExecuted) {
    ScriptedModel* model = nullptr;
    auto agent = makeAgent<KubernetesAgent>(model);
    model->push(commandReply("kubectl delete pod web-0"));
    model->push(commandReply("kubectl get pods -A"));
    model->push(answerReply("web-0 is crash looping"));

    FixedApprover approver;
    SilentExecuter executer;
    SessionResult result = agent->startSession(Context(), approver, executer,
                                               "fix my pod by deleting it");

    EXPECT_EQ(result.outcome, SessionOutcome::ANSWER);
    EXPECT_EQ(executer.commands, (std::vector<std::string>{"kubectl get pods -A"}));
    EXPECT_EQ(model->prompts[1], "sub command is not allowed: delete");
}

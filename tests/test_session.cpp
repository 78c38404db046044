// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include <gtest/gtest.h>
#include <triage/session.h>

#include <chrono>
#include <iostream>
#include <sstream>

#include "test_doubles.h"

using namespace triage;
using namespace triage::testing;

namespace {

Policy echoPolicy() {
    Policy policy;
    policy.allowedCommands = {"echo"};
    policy.allowedPipedCommands = {"grep"};
    return policy;
}

struct Fixture {
    ScriptedModel model;
    FixedApprover approver;
    CountingRunner* runner = nullptr;
    std::unique_ptr<TerminalExecuter> executer;

    Fixture() {
        auto r = std::make_unique<CountingRunner>();
        runner = r.get();
        executer = std::make_unique<TerminalExecuter>(std::move(r));
    }

    SessionResult run(const std::string& query, SessionConfig config = {},
                      const Context& ctx = Context()) {
        Session session(model, approver, *executer, echoPolicy(), config);
        return session.run(ctx, query);
    }
};

} // namespace

// ---- Termination ----

TEST(SessionTest, AnswerOnFirstReply) {
    Fixture f;
    f.model.push(answerReply("The pod is healthy."));

    SessionResult result = f.run("is my pod ok?");

    EXPECT_EQ(result.outcome, SessionOutcome::ANSWER);
    EXPECT_EQ(result.text, "The pod is healthy.");
    EXPECT_EQ(result.iterations, 1);
    EXPECT_TRUE(result.ok());
    ASSERT_EQ(f.model.prompts.size(), 1u);
    EXPECT_EQ(f.model.prompts[0], "is my pod ok?");
    EXPECT_EQ(f.runner->totalCalls(), 0);
}

TEST(SessionTest, MaxIterationsAfterExactlySevenModelCalls) {
    Fixture f;
    for (int i = 0; i < 10; ++i) {
        f.model.push(commandReply("echo step" + std::to_string(i)));
    }

    SessionResult result = f.run("keep digging");

    EXPECT_EQ(result.outcome, SessionOutcome::MAX_ITERATIONS);
    EXPECT_EQ(result.text, Session::MAX_ITERATIONS_MESSAGE);
    EXPECT_EQ(result.text, "Analysis incomplete. Reached maximum number of queries.");
    EXPECT_EQ(result.iterations, 7);
    EXPECT_EQ(f.model.prompts.size(), 7u);
    EXPECT_EQ(f.runner->totalCalls(), 7);
    EXPECT_TRUE(result.ok());
}

TEST(SessionTest, MaxIterationsNoticeReachesSilentConsole) {
    Fixture f;
    for (int i = 0; i < 3; ++i) {
        f.model.push(commandReply("echo " + std::to_string(i)));
    }
    SessionConfig config;
    config.maxIterations = 2;
    SilentConsole console(false);

    std::ostringstream captured;
    std::streambuf* oldBuf = std::cout.rdbuf(captured.rdbuf());
    Session session(f.model, f.approver, *f.executer, echoPolicy(), config, &console);
    SessionResult result = session.run(Context(), "q");
    std::cout.rdbuf(oldBuf);

    EXPECT_EQ(result.outcome, SessionOutcome::MAX_ITERATIONS);
    EXPECT_EQ(captured.str(), Session::MAX_ITERATIONS_MESSAGE + "\n");
}

TEST(SessionTest, MaxIterationsHonorsConfiguredLimit) {
    Fixture f;
    for (int i = 0; i < 5; ++i) {
        f.model.push(commandReply("echo " + std::to_string(i)));
    }
    SessionConfig config;
    config.maxIterations = 2;

    SessionResult result = f.run("q", config);

    EXPECT_EQ(result.outcome, SessionOutcome::MAX_ITERATIONS);
    EXPECT_EQ(f.model.prompts.size(), 2u);
}

TEST(SessionTest, AnswerOnLastAllowedIteration) {
    Fixture f;
    f.model.push(commandReply("echo a"));
    f.model.push(answerReply("done"));
    SessionConfig config;
    config.maxIterations = 2;

    SessionResult result = f.run("q", config);

    EXPECT_EQ(result.outcome, SessionOutcome::ANSWER);
    EXPECT_EQ(result.text, "done");
    EXPECT_EQ(result.iterations, 2);
}

// ---- Command feedback ----

TEST(SessionTest, CommandOutputBecomesNextPrompt) {
    Fixture f;
    f.runner->outputs["echo hi"] = exited(0, "  hi\n");
    f.model.push(commandReply("echo hi"));
    f.model.push(answerReply("said hi"));

    SessionResult result = f.run("say hi");

    EXPECT_EQ(result.outcome, SessionOutcome::ANSWER);
    ASSERT_EQ(f.model.prompts.size(), 2u);
    EXPECT_EQ(f.model.prompts[1], "hi");
    ASSERT_EQ(f.approver.seen.size(), 1u);
    EXPECT_EQ(f.approver.seen[0], "echo hi");
}

TEST(SessionTest, EmptyOutputReportedAsNoOutput) {
    Fixture f;
    f.runner->outputs["echo"] = exited(0, "   \n");
    f.model.push(commandReply("echo"));
    f.model.push(answerReply("nothing"));

    f.run("q");

    ASSERT_EQ(f.model.prompts.size(), 2u);
    EXPECT_EQ(f.model.prompts[1], "No output");
}

TEST(SessionTest, FailedCommandReportsErrorAndOutput) {
    Fixture f;
    f.runner->outputs["echo boom"] = exited(2, "boom happened\n");
    f.model.push(commandReply("echo boom"));
    f.model.push(answerReply("it failed"));

    SessionResult result = f.run("q");

    EXPECT_EQ(result.outcome, SessionOutcome::ANSWER);
    ASSERT_EQ(f.model.prompts.size(), 2u);
    EXPECT_EQ(f.model.prompts[1],
              "Command failed: command execution failed: exit status 2\nboom happened");
}

TEST(SessionTest, FailedCommandIsNotCachedAndRunsAgain) {
    Fixture f;
    f.runner->outputs["echo flaky"] = exited(1, "");
    f.model.push(commandReply("echo flaky"));
    f.model.push(commandReply("echo flaky"));
    f.model.push(answerReply("gave up"));

    Session session(f.model, f.approver, *f.executer, echoPolicy());
    session.run(Context(), "q");

    EXPECT_EQ(f.runner->calls["echo flaky"], 2);
    EXPECT_TRUE(session.resultCache().empty());
    EXPECT_EQ(f.model.prompts[1], "Command failed: command execution failed: exit status 1");
}

TEST(SessionTest, RepeatedCommandServedFromCache) {
    Fixture f;
    f.runner->outputs["echo once"] = exited(0, "first run");
    f.model.push(commandReply("echo once"));
    f.model.push(commandReply("echo once"));
    f.model.push(answerReply("ok"));

    Session session(f.model, f.approver, *f.executer, echoPolicy());
    SessionResult result = session.run(Context(), "q");

    EXPECT_EQ(result.outcome, SessionOutcome::ANSWER);
    EXPECT_EQ(f.runner->calls["echo once"], 1);
    // The cached result skips validation and approval entirely.
    EXPECT_EQ(f.approver.seen.size(), 1u);
    ASSERT_EQ(f.model.prompts.size(), 3u);
    EXPECT_EQ(f.model.prompts[1], "first run");
    EXPECT_EQ(f.model.prompts[2], "first run");
    ASSERT_EQ(session.resultCache().count("echo once"), 1u);
}

TEST(SessionTest, NeedMoreDataWithoutCommandAsksForCommand) {
    Fixture f;
    f.model.push(R"({"reason_for_command": "thinking", "need_more_data": true})");
    f.model.push(answerReply("fine"));

    SessionResult result = f.run("q");

    EXPECT_EQ(result.outcome, SessionOutcome::ANSWER);
    ASSERT_EQ(f.model.prompts.size(), 2u);
    EXPECT_EQ(f.model.prompts[1], "Please suggest a command to run or end the session.");
    EXPECT_EQ(result.iterations, 2);
}

TEST(SessionTest, ImplicitCompletionWhenNoCommandAndNoFlag) {
    Fixture f;
    f.model.push(R"({"answer": "all good", "run_command": "", "reason_for_command": ""})");

    SessionResult result = f.run("q");

    EXPECT_EQ(result.outcome, SessionOutcome::ANSWER);
    EXPECT_EQ(result.text, "all good");
}

TEST(SessionTest, ImplicitContinuationWhenCommandAndNoFlag) {
    Fixture f;
    f.model.push(R"({"run_command": "echo x", "reason_for_command": "look"})");
    f.model.push(answerReply("seen"));

    SessionResult result = f.run("q");

    EXPECT_EQ(result.outcome, SessionOutcome::ANSWER);
    EXPECT_EQ(f.runner->calls["echo x"], 1);
}

// ---- Rejections ----

TEST(SessionTest, ApproverRejectionReasonIsNextPromptVerbatim) {
    Fixture f;
    f.approver = FixedApprover(false, "Not while the on-call is asleep.");
    f.model.push(commandReply("echo risky"));
    f.model.push(answerReply("ok then"));

    SessionResult result = f.run("q");

    EXPECT_EQ(result.outcome, SessionOutcome::ANSWER);
    ASSERT_EQ(f.model.prompts.size(), 2u);
    EXPECT_NE(f.model.prompts[1].find("Not while the on-call is asleep."), std::string::npos);
    EXPECT_EQ(f.runner->totalCalls(), 0);
}

TEST(SessionTest, PolicyRejectionNeverReachesApproverOrRunner) {
    Fixture f;
    f.model.push(commandReply("echo hi; rm -rf /"));
    f.model.push(commandReply("rm -rf /"));
    f.model.push(answerReply("stopped"));

    SessionResult result = f.run("q");

    EXPECT_EQ(result.outcome, SessionOutcome::ANSWER);
    EXPECT_TRUE(f.approver.seen.empty());
    EXPECT_EQ(f.runner->totalCalls(), 0);
    ASSERT_EQ(f.model.prompts.size(), 3u);
    EXPECT_EQ(f.model.prompts[1], "command chaining is not allowed");
    EXPECT_EQ(f.model.prompts[2], "command is not allowed: rm");
}

TEST(SessionTest, ApproverFailureIsReportedToModel) {
    Fixture f;
    f.approver.failWith = "validator unreachable";
    f.model.push(commandReply("echo hi"));
    f.model.push(answerReply("fine"));

    SessionResult result = f.run("q");

    EXPECT_EQ(result.outcome, SessionOutcome::ANSWER);
    ASSERT_EQ(f.model.prompts.size(), 2u);
    EXPECT_EQ(f.model.prompts[1], "Failed to validate command: validator unreachable");
    EXPECT_EQ(f.runner->totalCalls(), 0);
}

TEST(SessionTest, RejectionsAreNotCached) {
    Fixture f;
    f.approver = FixedApprover(false, "no");
    f.model.push(commandReply("echo a"));
    f.model.push(commandReply("echo a"));
    f.model.push(answerReply("done"));

    f.run("q");

    EXPECT_EQ(f.approver.seen.size(), 2u);
}

// ---- Errors ----

TEST(SessionTest, TransportFailureEndsSessionWithError) {
    Fixture f;
    f.model.push("!transport:connection refused");

    SessionResult result = f.run("q");

    EXPECT_EQ(result.outcome, SessionOutcome::ERROR);
    EXPECT_FALSE(result.ok());
    EXPECT_NE(result.text.find("failed to interact with the model"), std::string::npos);
    EXPECT_NE(result.text.find("connection refused"), std::string::npos);
}

TEST(SessionTest, SchemaFailureEndsSessionWithError) {
    Fixture f;
    f.model.push("not json");
    f.model.push("still not json");
    f.model.push("{broken");

    SessionResult result = f.run("q");

    EXPECT_EQ(result.outcome, SessionOutcome::ERROR);
    EXPECT_NE(result.text.find("after 3 attempts"), std::string::npos);
    EXPECT_EQ(result.iterations, 1);
}

TEST(SessionTest, ExpiredContextEndsBeforeAnyModelCall) {
    Fixture f;
    f.model.push(answerReply("never"));
    auto ctx = Context::withTimeout(std::chrono::milliseconds(0));

    SessionResult result = f.run("q", {}, ctx);

    EXPECT_EQ(result.outcome, SessionOutcome::ERROR);
    EXPECT_EQ(result.text, "context deadline exceeded");
    EXPECT_TRUE(f.model.prompts.empty());
}

TEST(SessionTest, CancelledContextEndsSession) {
    Fixture f;
    f.model.push(answerReply("never"));
    Context ctx;
    ctx.cancel();

    SessionResult result = f.run("q", {}, ctx);

    EXPECT_EQ(result.outcome, SessionOutcome::ERROR);
    EXPECT_EQ(result.text, "context canceled");
}

// ---- Lifecycle ----

TEST(SessionTest, SessionRunsOnlyOnce) {
    Fixture f;
    f.model.push(answerReply("a"));
    Session session(f.model, f.approver, *f.executer, echoPolicy());
    session.run(Context(), "q");

    EXPECT_EQ(session.state(), SessionState::TERMINAL);
    EXPECT_THROW(session.run(Context(), "again"), std::logic_error);
}

TEST(SessionTest, FreshSessionsDoNotShareCounters) {
    Fixture f;
    f.model.push(commandReply("echo a"));
    f.model.push(answerReply("one"));
    f.model.push(answerReply("two"));

    SessionResult first = startSession(Context(), f.model, f.approver, *f.executer,
                                       echoPolicy(), "first");
    SessionResult second = startSession(Context(), f.model, f.approver, *f.executer,
                                        echoPolicy(), "second");

    EXPECT_EQ(first.iterations, 2);
    EXPECT_EQ(second.iterations, 1);
    EXPECT_EQ(second.text, "two");
}

TEST(SessionTest, ResultSerializesToJson) {
    SessionResult result;
    result.outcome = SessionOutcome::MAX_ITERATIONS;
    result.text = "x";
    result.iterations = 7;

    json j = result.toJson();
    EXPECT_EQ(j["outcome"], "max_iterations");
    EXPECT_EQ(j["result"], "x");
    EXPECT_EQ(j["iterations"], 7);
}

#include <gtest/gtest.h>

#include <algorithm>
#include <thread>

#include "test_helpers.hpp"
#include "turnloop/session/orchestrator.hpp"

using namespace turnloop;
using namespace turnloop::testing;

class OrchestratorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    provider_ = std::make_shared<ScriptedProvider>();
    config_.tool_policy.default_decision = Decision::Allow;
  }

  std::shared_ptr<Orchestrator> make(OrchestratorOptions options = {}) {
    if (!options.provider) {
      options.provider = provider_;
    }
    if (!options.retry_sleeper) {
      options.retry_sleeper = [this](Milliseconds delay) { sleeps_.push_back(delay); };
    }
    auto created = Orchestrator::create(io_ctx_, config_, std::move(options));
    EXPECT_TRUE(created.ok()) << created.message();
    return created.ok() ? *created.value : nullptr;
  }

  // Tool result messages in history order
  static std::vector<const ToolResultPart*> tool_results(const std::vector<Message>& messages) {
    std::vector<const ToolResultPart*> results;
    for (const auto& msg : messages) {
      for (const auto* tr : msg.tool_results()) {
        results.push_back(tr);
      }
    }
    return results;
  }

  static std::future<bool> answer(bool approved) {
    std::promise<bool> promise;
    promise.set_value(approved);
    return promise.get_future();
  }

  asio::io_context io_ctx_;
  Config config_;
  std::shared_ptr<ScriptedProvider> provider_;
  std::vector<Milliseconds> sleeps_;
};

TEST_F(OrchestratorTest, SimpleTurn) {
  auto session = make();
  provider_->push_text("Hello!");

  std::vector<TurnState> states;
  session->on_state_change([&states](TurnState, TurnState to) { states.push_back(to); });

  auto outcome = session->run_turn("hi");
  ASSERT_TRUE(outcome.ok()) << outcome.message();
  EXPECT_EQ(outcome.value->turn, 1u);
  EXPECT_EQ(outcome.value->text, "Hello!");
  EXPECT_EQ(outcome.value->tool_loops, 0);
  EXPECT_EQ(outcome.value->usage.total(), 15);
  EXPECT_EQ(session->total_usage().total(), 15);
  EXPECT_EQ(session->state(), TurnState::Idle);
  EXPECT_EQ(session->turn_number(), 1u);

  auto messages = session->history().messages();
  ASSERT_EQ(messages.size(), 2u);
  EXPECT_EQ(messages[0].role(), Role::User);
  EXPECT_EQ(messages[1].role(), Role::Assistant);
  EXPECT_EQ(messages[1].text(), "Hello!");

  ASSERT_GE(states.size(), 4u);
  EXPECT_EQ(states.front(), TurnState::Routing);
  EXPECT_EQ(states.back(), TurnState::Idle);
  EXPECT_NE(std::find(states.begin(), states.end(), TurnState::AwaitingProvider), states.end());
  EXPECT_NE(std::find(states.begin(), states.end(), TurnState::Snapshotting), states.end());
}

TEST_F(OrchestratorTest, SystemPromptIsKeptInHistoryAndRequest) {
  OrchestratorOptions options;
  options.system_prompt = "You are terse.";
  auto session = make(std::move(options));

  ASSERT_TRUE(session->run_turn("hi").ok());

  auto messages = session->history().messages();
  ASSERT_FALSE(messages.empty());
  EXPECT_EQ(messages[0].role(), Role::System);
  EXPECT_EQ(messages[0].priority(), Priority::Critical);
  EXPECT_EQ(provider_->requests().front().system_prompt, "You are terse.");
}

TEST_F(OrchestratorTest, ToolResultsFollowRequestOrder) {
  auto session = make();
  auto a = std::make_shared<CountingTool>("alpha", "A");
  auto b = std::make_shared<CountingTool>("beta", "B");
  session->register_tool(a);
  session->register_tool(b);

  provider_->push_tool_calls({call("c1", "beta", {{"x", 1}}), call("c2", "alpha")});
  provider_->push_text("all done");

  std::vector<std::string> reported;
  session->on_tool_result([&reported](const std::string& id, const std::string&, const std::string&, bool) { reported.push_back(id); });

  auto outcome = session->run_turn("run both");
  ASSERT_TRUE(outcome.ok()) << outcome.message();
  EXPECT_EQ(outcome.value->text, "all done");
  EXPECT_EQ(outcome.value->tool_loops, 1);
  EXPECT_EQ(outcome.value->tool_calls, 2u);
  EXPECT_EQ(a->calls.load(), 1);
  EXPECT_EQ(b->calls.load(), 1);
  EXPECT_EQ(b->last_args["x"], 1);

  auto messages = session->history().messages();
  auto results = tool_results(messages);
  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0]->tool_call_id, "c1");
  EXPECT_EQ(results[0]->output, "B");
  EXPECT_EQ(results[1]->tool_call_id, "c2");
  EXPECT_EQ(results[1]->output, "A");
  EXPECT_EQ(reported, (std::vector<std::string>{"c1", "c2"}));

  // The second request carries the tool results
  auto requests = provider_->requests();
  ASSERT_EQ(requests.size(), 2u);
  EXPECT_EQ(tool_results(requests[1].messages).size(), 2u);
  EXPECT_EQ(requests[0].tools.size(), 2u);
}

TEST_F(OrchestratorTest, DeniedToolNeverRuns) {
  config_.tool_policy.tools["rm"] = Decision::Deny;
  auto session = make();
  auto rm = std::make_shared<CountingTool>("rm");
  session->register_tool(rm);

  provider_->push_tool_calls({call("c1", "rm", {{"path", "/"}})});
  provider_->push_text("ok");

  std::vector<ErrorKind> errors;
  session->on_error([&errors](const Error& error) { errors.push_back(error.kind); });

  ASSERT_TRUE(session->run_turn("clean up").ok());
  EXPECT_EQ(rm->calls.load(), 0);
  EXPECT_EQ(errors, (std::vector<ErrorKind>{ErrorKind::PolicyDenied}));

  auto messages = session->history().messages();
  auto results = tool_results(messages);
  ASSERT_EQ(results.size(), 1u);
  EXPECT_TRUE(results[0]->is_error);
  EXPECT_NE(results[0]->output.find("Permission denied"), std::string::npos);
  EXPECT_NE(results[0]->output.find("tool policy"), std::string::npos);
}

TEST_F(OrchestratorTest, UnrestrictedModeSkipsPolicy) {
  config_.tool_policy.tools["rm"] = Decision::Deny;
  config_.permission_mode = PermissionMode::Unrestricted;
  auto session = make();
  auto rm = std::make_shared<CountingTool>("rm");
  session->register_tool(rm);

  provider_->push_tool_calls({call("c1", "rm")});
  ASSERT_TRUE(session->run_turn("clean up").ok());
  EXPECT_EQ(rm->calls.load(), 1);
}

TEST_F(OrchestratorTest, PromptApprovedRunsTool) {
  config_.tool_policy.tools["bash"] = Decision::Prompt;
  auto session = make();
  auto bash = std::make_shared<CountingTool>("bash");
  session->register_tool(bash);

  std::string asked;
  session->set_confirmation_handler([&asked](const std::string& tool, const std::string&) {
    asked = tool;
    return answer(true);
  });

  provider_->push_tool_calls({call("c1", "bash")});
  ASSERT_TRUE(session->run_turn("build").ok());
  EXPECT_EQ(asked, "bash");
  EXPECT_EQ(bash->calls.load(), 1);
}

TEST_F(OrchestratorTest, PromptRejectedOrUnansweredSkipsTool) {
  config_.tool_policy.tools["bash"] = Decision::Prompt;
  auto session = make();
  auto bash = std::make_shared<CountingTool>("bash");
  session->register_tool(bash);

  // No handler: rejected
  provider_->push_tool_calls({call("c1", "bash")});
  ASSERT_TRUE(session->run_turn("build").ok());

  session->set_confirmation_handler([](const std::string&, const std::string&) { return answer(false); });
  provider_->push_tool_calls({call("c2", "bash")});
  ASSERT_TRUE(session->run_turn("build again").ok());

  EXPECT_EQ(bash->calls.load(), 0);
  auto messages = session->history().messages();
  auto results = tool_results(messages);
  ASSERT_EQ(results.size(), 2u);
  for (const auto* result : results) {
    EXPECT_TRUE(result->is_error);
    EXPECT_NE(result->output.find("user rejected"), std::string::npos);
  }
}

TEST_F(OrchestratorTest, UnknownToolReportsError) {
  auto session = make();
  provider_->push_tool_calls({call("c1", "missing")});

  ASSERT_TRUE(session->run_turn("go").ok());
  auto messages = session->history().messages();
  auto results = tool_results(messages);
  ASSERT_EQ(results.size(), 1u);
  EXPECT_TRUE(results[0]->is_error);
  EXPECT_EQ(results[0]->output, "Tool not found: missing");
}

TEST_F(OrchestratorTest, SessionToolCapRefusesExtraCalls) {
  config_.session_tools.max_sessions = 1;
  config_.session_tools.tools = {"terminal"};
  auto session = make();
  auto terminal = std::make_shared<SlowTool>("terminal", std::chrono::milliseconds(50));
  session->register_tool(terminal);
  EXPECT_TRUE(session->tools().is_session_based("terminal"));

  provider_->push_tool_calls({call("c1", "terminal", {{"n", 1}}), call("c2", "terminal", {{"n", 2}})});
  ASSERT_TRUE(session->run_turn("open two terminals").ok());

  EXPECT_EQ(terminal->started.load(), 1);
  auto messages = session->history().messages();
  auto results = tool_results(messages);
  ASSERT_EQ(results.size(), 2u);
  EXPECT_FALSE(results[0]->is_error);
  EXPECT_TRUE(results[1]->is_error);
  EXPECT_NE(results[1]->output.find("Maximum concurrent tool sessions reached (1)"), std::string::npos);
  EXPECT_EQ(session->tools().guard().current_active(), 0u);
}

TEST_F(OrchestratorTest, SlowToolTimesOut) {
  config_.tool_timeout = Milliseconds(50);
  auto session = make();
  auto slow = std::make_shared<SlowTool>("slow", std::chrono::seconds(5));
  session->register_tool(slow);

  provider_->push_tool_calls({call("c1", "slow")});
  provider_->push_text("moving on");

  auto start = std::chrono::steady_clock::now();
  auto outcome = session->run_turn("wait for it");
  ASSERT_TRUE(outcome.ok()) << outcome.message();
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(4));
  EXPECT_EQ(outcome.value->text, "moving on");

  auto messages = session->history().messages();
  auto results = tool_results(messages);
  ASSERT_EQ(results.size(), 1u);
  EXPECT_TRUE(results[0]->is_error);
  EXPECT_EQ(results[0]->output, "Tool 'slow' timed out after 50ms");
}

TEST_F(OrchestratorTest, ToolLoopLimitEndsTurn) {
  config_.max_tool_loops = 2;
  auto session = make();
  auto tool = std::make_shared<CountingTool>("step");
  session->register_tool(tool);

  for (int i = 0; i < 3; ++i) {
    provider_->push_tool_calls({call("c" + std::to_string(i), "step", {{"i", i}})});
  }

  auto outcome = session->run_turn("keep going");
  ASSERT_TRUE(outcome.ok()) << outcome.message();
  EXPECT_TRUE(outcome.value->loop_limit_reached);
  EXPECT_EQ(outcome.value->tool_loops, 2);
  EXPECT_EQ(outcome.value->finish_reason, FinishReason::Length);
  EXPECT_NE(outcome.value->text.find("Stopped after 2 rounds"), std::string::npos);
  EXPECT_EQ(tool->calls.load(), 2);
  EXPECT_EQ(provider_->remaining(), 1u);

  auto messages = session->history().messages();
  EXPECT_EQ(messages.back().role(), Role::Assistant);
  EXPECT_EQ(messages.back().text(), outcome.value->text);
  EXPECT_EQ(session->state(), TurnState::Idle);
}

TEST_F(OrchestratorTest, TransientFailureIsRetried) {
  auto session = make();
  provider_->push_error("connection reset by peer");
  provider_->push_text("recovered");

  std::vector<ErrorKind> errors;
  session->on_error([&errors](const Error& error) { errors.push_back(error.kind); });

  auto outcome = session->run_turn("hi");
  ASSERT_TRUE(outcome.ok()) << outcome.message();
  EXPECT_EQ(outcome.value->text, "recovered");
  ASSERT_EQ(sleeps_.size(), 1u);
  EXPECT_EQ(sleeps_[0], Milliseconds(500));
  EXPECT_EQ(session->retry().stats().successful_retries, 1u);
  EXPECT_EQ(errors, (std::vector<ErrorKind>{ErrorKind::ProviderTransient}));
}

TEST_F(OrchestratorTest, FallbackModelAnswersAfterRetriesRunOut) {
  config_.retry.fallback_model = "backup-model";
  auto session = make();
  for (int i = 0; i < 3; ++i) {
    provider_->push_error("request timed out");
  }
  provider_->push_text("from fallback");

  std::vector<ErrorKind> errors;
  session->on_error([&errors](const Error& error) { errors.push_back(error.kind); });

  auto outcome = session->run_turn("hi");
  ASSERT_TRUE(outcome.ok()) << outcome.message();
  EXPECT_EQ(outcome.value->text, "from fallback");
  EXPECT_EQ(session->state(), TurnState::Idle);
  EXPECT_EQ(session->retry().stats().fallback_activations, 1u);
  EXPECT_EQ(errors, (std::vector<ErrorKind>{ErrorKind::ProviderTransient}));

  auto requests = provider_->requests();
  ASSERT_EQ(requests.size(), 4u);
  EXPECT_EQ(requests[0].model, config_.default_model);
  EXPECT_EQ(requests[2].model, config_.default_model);
  EXPECT_EQ(requests[3].model, "backup-model");

  // Failing on the fallback too is fatal
  provider_->push_error("invalid api key", true);
  provider_->push_error("invalid api key", true);
  auto failed = session->run_turn("again");
  ASSERT_TRUE(failed.failed());
  EXPECT_EQ(failed.kind(), ErrorKind::ProviderFailure);
  EXPECT_EQ(session->state(), TurnState::Fatal);
  EXPECT_EQ(session->retry().stats().fallback_activations, 2u);
}

TEST_F(OrchestratorTest, ContextOverflowCompactsAndRetriesOnce) {
  auto session = make();
  for (int i = 0; i < 6; ++i) {
    provider_->push_text("reply " + std::to_string(i));
    ASSERT_TRUE(session->run_turn("question number " + std::to_string(i)).ok());
  }
  size_t before = session->history().size();

  std::vector<ErrorKind> errors;
  session->on_error([&errors](const Error& error) { errors.push_back(error.kind); });

  provider_->push_error("This model's maximum context length is 8192 tokens");
  provider_->push_text("fits now");

  auto outcome = session->run_turn("one more");
  ASSERT_TRUE(outcome.ok()) << outcome.message();
  EXPECT_EQ(outcome.value->text, "fits now");
  EXPECT_LT(session->history().size(), before);
  EXPECT_TRUE(session->history().summary().has_value());
  EXPECT_EQ(errors, (std::vector<ErrorKind>{ErrorKind::ContextOverflow}));
}

TEST_F(OrchestratorTest, RepeatedOverflowIsFatal) {
  auto session = make();
  provider_->push_error("context length exceeded");
  provider_->push_error("context length exceeded");

  auto outcome = session->run_turn("hi");
  ASSERT_TRUE(outcome.failed());
  EXPECT_EQ(outcome.kind(), ErrorKind::ProviderFailure);
  EXPECT_EQ(session->state(), TurnState::Fatal);
}

TEST_F(OrchestratorTest, ProviderFailureIsFatal) {
  auto session = make();
  std::vector<ErrorKind> errors;
  session->on_error([&errors](const Error& error) { errors.push_back(error.kind); });

  provider_->push_error("invalid api key");
  auto outcome = session->run_turn("hi");
  ASSERT_TRUE(outcome.failed());
  EXPECT_EQ(outcome.kind(), ErrorKind::ProviderFailure);
  EXPECT_EQ(session->state(), TurnState::Fatal);
  EXPECT_EQ(errors, (std::vector<ErrorKind>{ErrorKind::ProviderFailure}));
  EXPECT_TRUE(sleeps_.empty());

  auto next = session->run_turn("again");
  ASSERT_TRUE(next.failed());
  EXPECT_EQ(next.kind(), ErrorKind::ProviderFailure);
  EXPECT_EQ(provider_->requests().size(), 1u);
}

TEST_F(OrchestratorTest, TerminateRejectsFurtherTurns) {
  auto session = make();
  ASSERT_TRUE(session->run_turn("hi").ok());

  session->terminate();
  EXPECT_EQ(session->state(), TurnState::Terminated);

  auto outcome = session->run_turn("hello?");
  ASSERT_TRUE(outcome.failed());
  EXPECT_EQ(outcome.kind(), ErrorKind::Cancelled);
  EXPECT_EQ(session->rollback(1).error->kind, ErrorKind::Cancelled);
  EXPECT_GE(provider_->cancels_.load(), 1);
}

TEST_F(OrchestratorTest, CancelKeepsOnlyCommittedResults) {
  auto session = make();
  auto writer = std::make_shared<SlowTool>("write", std::chrono::milliseconds(1), true);
  auto sleeper = std::make_shared<SlowTool>("sleep", std::chrono::seconds(5));
  session->register_tool(writer);
  session->register_tool(sleeper);

  provider_->push_tool_calls({call("c1", "write"), call("c2", "sleep")});

  auto turn = std::async(std::launch::async, [session]() { return session->run_turn("do both"); });
  while (sleeper->started.load() == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  session->cancel();

  auto outcome = turn.get();
  ASSERT_TRUE(outcome.failed());
  EXPECT_EQ(outcome.kind(), ErrorKind::Cancelled);
  EXPECT_EQ(session->state(), TurnState::Idle);

  auto messages = session->history().messages();
  auto results = tool_results(messages);
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0]->tool_call_id, "c1");
  EXPECT_EQ(results[0]->output, "written");

  // The session stays usable
  provider_->push_text("back");
  auto next = session->run_turn("still there?");
  ASSERT_TRUE(next.ok()) << next.message();
  EXPECT_EQ(next.value->text, "back");
}

TEST_F(OrchestratorTest, SnapshotTakenEveryTurn) {
  auto session = make();
  provider_->push_text("one");
  auto first = session->run_turn("first");
  provider_->push_text("two");
  auto second = session->run_turn("second");

  ASSERT_TRUE(first.ok());
  ASSERT_TRUE(second.ok());
  ASSERT_TRUE(first.value->snapshot.has_value());
  EXPECT_EQ(first.value->snapshot->turn_number, 1u);
  EXPECT_EQ(second.value->snapshot->metadata["model"], config_.default_model);

  ASSERT_NE(session->snapshots(), nullptr);
  auto listed = session->snapshots()->list();
  ASSERT_EQ(listed.size(), 2u);
  EXPECT_EQ(listed[1].turn_number, 2u);
}

TEST_F(OrchestratorTest, RollbackRestoresHistory) {
  auto session = make();
  provider_->push_text("one");
  ASSERT_TRUE(session->run_turn("first").ok());
  auto after_first = session->history().messages();
  auto usage_after_first = session->total_usage();

  provider_->push_text("two");
  ASSERT_TRUE(session->run_turn("second").ok());
  EXPECT_GT(session->history().size(), after_first.size());

  ASSERT_TRUE(session->rollback(1).ok());
  auto restored = session->history().messages();
  ASSERT_EQ(restored.size(), after_first.size());
  for (size_t i = 0; i < restored.size(); ++i) {
    EXPECT_EQ(restored[i].id(), after_first[i].id());
  }
  EXPECT_EQ(session->turn_number(), 1u);
  EXPECT_EQ(session->total_usage().total(), usage_after_first.total());

  provider_->push_text("two again");
  auto again = session->run_turn("second, take two");
  ASSERT_TRUE(again.ok());
  EXPECT_EQ(again.value->turn, 2u);

  EXPECT_EQ(session->rollback(99).error->kind, ErrorKind::NotFound);
}

TEST_F(OrchestratorTest, RollbackRecoversFromFatal) {
  auto session = make();
  ASSERT_TRUE(session->run_turn("first").ok());

  provider_->push_error("invalid api key");
  ASSERT_TRUE(session->run_turn("second").failed());
  ASSERT_EQ(session->state(), TurnState::Fatal);

  ASSERT_TRUE(session->rollback(1).ok());
  EXPECT_EQ(session->state(), TurnState::Idle);
  EXPECT_TRUE(session->run_turn("third").ok());
}

TEST_F(OrchestratorTest, InvalidUtf8TextIsSnapshotted) {
  auto session = make();
  provider_->push_text(std::string("d\xe9j\xe0 vu"));

  auto outcome = session->run_turn(std::string("caf\xe9 menu"));
  ASSERT_TRUE(outcome.ok()) << outcome.message();
  EXPECT_EQ(session->state(), TurnState::Idle);
  ASSERT_TRUE(outcome.value->snapshot.has_value());

  auto messages = session->history().messages();
  ASSERT_EQ(messages.size(), 2u);
  EXPECT_EQ(messages[0].text(), "caf\xEF\xBF\xBD menu");
  EXPECT_EQ(messages[1].text(), "d\xEF\xBF\xBDj\xEF\xBF\xBD vu");

  EXPECT_TRUE(session->run_turn("hello").ok());
  EXPECT_EQ(session->state(), TurnState::Idle);
  ASSERT_TRUE(session->rollback(1).ok());
  EXPECT_EQ(session->history().size(), 2u);
}

TEST_F(OrchestratorTest, RollbackWithoutSnapshots) {
  config_.snapshots.enabled = false;
  auto session = make();
  auto outcome = session->run_turn("hi");
  ASSERT_TRUE(outcome.ok());
  EXPECT_FALSE(outcome.value->snapshot.has_value());
  EXPECT_EQ(session->snapshots(), nullptr);
  EXPECT_EQ(session->rollback(1).error->kind, ErrorKind::NotFound);
}

TEST_F(OrchestratorTest, RouterPicksModelPerRequest) {
  config_.router.enabled = true;
  config_.router.models[TaskClass::CodegenHeavy] = "code-model";
  config_.router.budgets[TaskClass::CodegenHeavy] = 8000;
  auto session = make();

  auto outcome = session->run_turn("fix this\n```\nint main() {}\n```");
  ASSERT_TRUE(outcome.ok());
  EXPECT_EQ(outcome.value->route.task_class, TaskClass::CodegenHeavy);

  ASSERT_TRUE(session->run_turn("thanks").ok());

  auto requests = provider_->requests();
  ASSERT_EQ(requests.size(), 2u);
  EXPECT_EQ(requests[0].model, "code-model");
  ASSERT_TRUE(requests[0].max_tokens.has_value());
  EXPECT_EQ(*requests[0].max_tokens, 8000);
  EXPECT_EQ(requests[1].model, config_.default_model);
  EXPECT_FALSE(requests[1].max_tokens.has_value());
}

TEST_F(OrchestratorTest, CreateRejectsBadConfiguration) {
  config_.max_tool_loops = 0;
  OrchestratorOptions options;
  options.provider = provider_;
  auto created = Orchestrator::create(io_ctx_, config_, options);
  ASSERT_TRUE(created.failed());
  EXPECT_EQ(created.kind(), ErrorKind::ConfigurationError);

  auto no_provider = Orchestrator::create(io_ctx_, Config{}, OrchestratorOptions{});
  ASSERT_TRUE(no_provider.failed());
  EXPECT_EQ(no_provider.kind(), ErrorKind::ConfigurationError);
}

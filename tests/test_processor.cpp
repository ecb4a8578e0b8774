#include <gtest/gtest.h>

#include <asio.hpp>
#include <thread>

#include "bus/bus.hpp"
#include "llm/scripted.hpp"
#include "session/processor.hpp"

using namespace coderun;
using namespace std::chrono_literals;

namespace {

using llm::ScriptStep;

// Approval gate that records every request and answers with a fixed reply
class ScriptedGate : public PermissionGate {
 public:
  explicit ScriptedGate(bool reject) : reject_(reject) {}

  void ask(const PermissionRequest &request, AbortSignal *) override {
    requests.push_back(request);
    if (reject_) {
      throw PermissionRejectedError(request.permission);
    }
  }

  std::vector<PermissionRequest> requests;

 private:
  bool reject_;
};

class Recorder : public Summarizer {
 public:
  void summarize(const SessionId &, const MessageId &message_id) override {
    summarized.push_back(message_id);
  }

  std::vector<MessageId> summarized;
};

std::exception_ptr provider_error(ProviderError::Kind kind, const std::string &message) {
  return std::make_exception_ptr(ProviderError(kind, message));
}

// A complete single-step text reply
llm::Script hello_script(const std::string &id = "t1") {
  return {
      ScriptStep::emit(llm::Start{}),
      ScriptStep::emit(llm::StartStep{}),
      ScriptStep::emit(llm::TextStart{id, json()}),
      ScriptStep::emit(llm::TextDelta{id, "Hel", json()}),
      ScriptStep::emit(llm::TextDelta{id, "lo ", json()}, 5ms),
      ScriptStep::emit(llm::TextEnd{id, json()}),
      ScriptStep::emit(llm::FinishStep{FinishReason::Stop, {{"inputTokens", 1000}, {"outputTokens", 500}}, json::object()}),
      ScriptStep::emit(llm::Finish{FinishReason::Stop}),
  };
}

// Tool call "c<n>" for `tool` that completes immediately
void append_tool_call(llm::Script &script, const std::string &call_id, const std::string &tool, const json &input) {
  script.push_back(ScriptStep::emit(llm::ToolInputStart{call_id, tool}));
  script.push_back(ScriptStep::emit(llm::ToolCall{call_id, tool, input, json()}));
  script.push_back(ScriptStep::emit(llm::ToolResult{call_id, {"done", tool, json::object(), {}}, json()}));
}

}  // namespace

class ProcessorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    work_guard_.emplace(asio::make_work_guard(io_ctx_));
    io_thread_ = std::thread([this] {
      io_ctx_.run();
    });

    store_ = std::make_shared<InMemorySessionStore>();

    config_.snapshot = false;
    config_.experimental.stream_idle_timeout = 500ms;
    config_.streaming.delta_flush_interval = 20ms;
    config_.retry.initial_delay = 5ms;

    model_.id = "test-model";
    model_.provider_id = "scripted";
    model_.limit.context = 100000;
    model_.limit.output = 4000;
    ModelInfo::Cost cost;
    cost.input = 1;
    cost.output = 2;
    model_.cost = cost;

    subscriptions_.emplace_back(Bus::instance().subscribe<events::PartUpdated>([this](const events::PartUpdated &e) {
      updates_.push_back(e);
    }));
    subscriptions_.emplace_back(Bus::instance().subscribe<events::SessionError>([this](const events::SessionError &e) {
      session_errors_.push_back(e);
    }));
    subscriptions_.emplace_back(Bus::instance().subscribe<events::SessionStatusChanged>([this](const events::SessionStatusChanged &e) {
      statuses_.push_back(e);
    }));
  }

  void TearDown() override {
    subscriptions_.clear();
    work_guard_.reset();
    io_ctx_.stop();
    io_thread_.join();
  }

  std::shared_ptr<llm::ScriptedProvider> provider(std::vector<llm::Script> attempts) {
    provider_ = std::make_shared<llm::ScriptedProvider>(io_ctx_, std::move(attempts));
    return provider_;
  }

  TurnDependencies deps() {
    TurnDependencies deps;
    deps.provider = provider_;
    deps.store = store_;
    deps.permission = gate_;
    deps.summarizer = summarizer_;
    deps.status = &status_;
    return deps;
  }

  std::unique_ptr<TurnProcessor> make_turn() {
    AssistantMessage message("ses_test", "msg_user");
    return std::make_unique<TurnProcessor>(message, model_, deps(), config_);
  }

  TurnResult run(std::vector<llm::Script> attempts) {
    provider(std::move(attempts));
    turn_ = make_turn();
    llm::StreamRequest request;
    request.model = model_;
    return turn_->process(request);
  }

  std::vector<Part> parts() {
    return store_->list_parts(turn_->message().id());
  }

  template <typename T>
  std::vector<T> parts_of() {
    std::vector<T> found;
    for (const auto &part : parts()) {
      if (auto *p = std::get_if<T>(&part)) {
        found.push_back(*p);
      }
    }
    return found;
  }

  std::vector<events::SessionStatusChanged> retries() const {
    std::vector<events::SessionStatusChanged> found;
    for (const auto &status : statuses_) {
      if (status.type == "retry") {
        found.push_back(status);
      }
    }
    return found;
  }

  asio::io_context io_ctx_;
  std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_;
  std::thread io_thread_;

  Config config_;
  ModelInfo model_;
  std::shared_ptr<InMemorySessionStore> store_;
  std::shared_ptr<llm::ScriptedProvider> provider_;
  std::shared_ptr<PermissionGate> gate_;
  std::shared_ptr<Recorder> summarizer_ = std::make_shared<Recorder>();
  SessionStatus status_;
  std::unique_ptr<TurnProcessor> turn_;

  std::vector<ScopedSubscription> subscriptions_;
  std::vector<events::PartUpdated> updates_;
  std::vector<events::SessionError> session_errors_;
  std::vector<events::SessionStatusChanged> statuses_;
};

// --- Happy path ---

TEST_F(ProcessorTest, HelloTurn) {
  auto result = run({hello_script()});

  EXPECT_EQ(result, TurnResult::Continue);
  EXPECT_EQ(turn_->state(), TurnState::Done);

  auto all = parts();
  ASSERT_EQ(all.size(), 3u);
  EXPECT_EQ(part_type(all[0]), "step-start");
  EXPECT_EQ(part_type(all[1]), "text");
  EXPECT_EQ(part_type(all[2]), "step-finish");

  const auto &text = std::get<TextPart>(all[1]);
  EXPECT_EQ(text.text, "Hello");
  ASSERT_TRUE(text.time.has_value());
  EXPECT_TRUE(text.time->end.has_value());

  const auto &finish = std::get<StepFinishPart>(all[2]);
  EXPECT_EQ(finish.reason, "stop");
  EXPECT_EQ(finish.tokens.input, 1000);
  EXPECT_EQ(finish.tokens.output, 500);
  EXPECT_NEAR(finish.cost, 0.002, 1e-12);

  const auto &message = turn_->message();
  ASSERT_TRUE(message.finish().has_value());
  EXPECT_EQ(*message.finish(), FinishReason::Stop);
  EXPECT_NEAR(message.cost(), 0.002, 1e-12);
  EXPECT_EQ(message.tokens().output, 500);
  EXPECT_FALSE(message.error().has_value());
  EXPECT_TRUE(message.completed_at().has_value());
  EXPECT_EQ(message.model_id(), "test-model");

  auto stored = store_->get_message(message.id());
  ASSERT_TRUE(stored.has_value());
  EXPECT_TRUE(stored->completed_at().has_value());

  EXPECT_EQ(summarizer_->summarized, std::vector<MessageId>{"msg_user"});
  ASSERT_FALSE(statuses_.empty());
  EXPECT_EQ(statuses_.front().type, "busy");
  EXPECT_EQ(provider_->streams_started(), 1);
}

TEST_F(ProcessorTest, StreamRequestCarriesTurnIdentity) {
  run({hello_script()});

  auto requests = provider_->requests();
  ASSERT_EQ(requests.size(), 1u);
  EXPECT_EQ(requests[0].session_id, "ses_test");
  EXPECT_EQ(requests[0].message_id, turn_->message().id());
  EXPECT_EQ(requests[0].attempt, 0);
}

TEST_F(ProcessorTest, DeltasAreCoalescedAndComplete) {
  llm::Script script = {ScriptStep::emit(llm::StartStep{}), ScriptStep::emit(llm::TextStart{"t1", json()})};
  std::string expected;
  for (int i = 0; i < 100; ++i) {
    auto word = "w" + std::to_string(i) + " ";
    expected += word;
    script.push_back(ScriptStep::emit(llm::TextDelta{"t1", word, json()}, 1ms));
  }
  script.push_back(ScriptStep::emit(llm::TextEnd{"t1", json()}));
  script.push_back(ScriptStep::emit(llm::FinishStep{FinishReason::Stop, json::object(), json::object()}));

  EXPECT_EQ(run({script}), TurnResult::Continue);

  std::string streamed;
  size_t delta_updates = 0;
  for (const auto &update : updates_) {
    if (update.delta) {
      ++delta_updates;
      streamed += *update.delta;
    }
  }

  // Far fewer writes than deltas, and nothing lost
  EXPECT_GT(delta_updates, 0u);
  EXPECT_LT(delta_updates, 50u);
  EXPECT_EQ(expected.rfind(streamed, 0), 0u);

  auto texts = parts_of<TextPart>();
  ASSERT_EQ(texts.size(), 1u);
  EXPECT_EQ(texts[0].text, trim_end(expected));
}

TEST_F(ProcessorTest, ReasoningParts) {
  llm::Script script = {
      ScriptStep::emit(llm::ReasoningStart{"r1", json()}),
      ScriptStep::emit(llm::ReasoningDelta{"r1", "Thinking about it\n", json()}),
      ScriptStep::emit(llm::ReasoningEnd{"r1", {{"signature", "abc"}}}),
      ScriptStep::emit(llm::FinishStep{FinishReason::Stop, json::object(), json::object()}),
  };

  EXPECT_EQ(run({script}), TurnResult::Continue);

  auto reasoning = parts_of<ReasoningPart>();
  ASSERT_EQ(reasoning.size(), 1u);
  EXPECT_EQ(reasoning[0].text, "Thinking about it");
  EXPECT_TRUE(reasoning[0].time.end.has_value());
  EXPECT_EQ(reasoning[0].metadata["signature"], "abc");
}

TEST_F(ProcessorTest, TextCompleteHookRewritesText) {
  auto id = plugin::Hooks::instance().on_text_complete([](const plugin::TextCompleteInput &, json output) {
    output["text"] = output["text"].get<std::string>() + " world";
    return output;
  });

  run({hello_script()});
  plugin::Hooks::instance().remove(id);

  auto texts = parts_of<TextPart>();
  ASSERT_EQ(texts.size(), 1u);
  EXPECT_EQ(texts[0].text, "Hello world");
}

TEST_F(ProcessorTest, UnknownEventsAreSkipped) {
  auto script = hello_script();
  script.insert(script.begin() + 2, ScriptStep::emit(llm::Unknown{"source", {{"url", "https://example.com"}}}));

  EXPECT_EQ(run({script}), TurnResult::Continue);
  EXPECT_EQ(parts_of<TextPart>().size(), 1u);
}

// --- Tools ---

TEST_F(ProcessorTest, ToolCallLifecycle) {
  llm::Script script = {ScriptStep::emit(llm::StartStep{})};
  append_tool_call(script, "c1", "read", {{"path", "README.md"}});
  script.push_back(ScriptStep::emit(llm::FinishStep{FinishReason::ToolCalls, json::object(), json::object()}));

  EXPECT_EQ(run({script}), TurnResult::Continue);

  auto tools = parts_of<ToolPart>();
  ASSERT_EQ(tools.size(), 1u);
  EXPECT_EQ(tools[0].call_id, "c1");
  EXPECT_EQ(tools[0].status(), ToolStatus::Completed);
  EXPECT_EQ(tools[0].input()["path"], "README.md");

  // pending -> running -> completed, all on the same part
  std::vector<ToolStatus> seen;
  for (const auto &update : updates_) {
    if (auto *tool = std::get_if<ToolPart>(&update.part)) {
      EXPECT_EQ(tool->id, tools[0].id);
      seen.push_back(tool->status());
    }
  }
  EXPECT_EQ(seen, (std::vector<ToolStatus>{ToolStatus::Pending, ToolStatus::Running, ToolStatus::Completed}));
}

TEST_F(ProcessorTest, DanglingToolCallsAreMarkedAborted) {
  llm::Script script;
  append_tool_call(script, "c0", "read", {{"path", "Makefile"}});
  script.push_back(ScriptStep::emit(llm::ToolInputStart{"c1", "bash"}));
  script.push_back(ScriptStep::emit(llm::ToolCall{"c1", "bash", {{"command", "make"}}, json()}));
  script.push_back(ScriptStep::emit(llm::ToolInputStart{"c2", "write"}));
  script.push_back(ScriptStep::emit(llm::FinishStep{FinishReason::ToolCalls, json::object(), json::object()}));

  EXPECT_EQ(run({script}), TurnResult::Continue);

  auto tools = parts_of<ToolPart>();
  ASSERT_EQ(tools.size(), 3u);

  // The finished call keeps the state it completed with
  std::optional<ToolStateCompleted> recorded;
  int writes_after_completion = 0;
  for (const auto &update : updates_) {
    auto *tool = std::get_if<ToolPart>(&update.part);
    if (!tool || tool->call_id != "c0") continue;
    if (recorded) {
      ++writes_after_completion;
    } else if (auto *done = std::get_if<ToolStateCompleted>(&tool->state)) {
      recorded = *done;
    }
  }
  ASSERT_TRUE(recorded.has_value());
  EXPECT_EQ(writes_after_completion, 0);

  ASSERT_EQ(tools[0].call_id, "c0");
  ASSERT_EQ(tools[0].status(), ToolStatus::Completed);
  const auto &completed = std::get<ToolStateCompleted>(tools[0].state);
  EXPECT_EQ(completed.output, "done");
  EXPECT_EQ(completed.output, recorded->output);
  EXPECT_EQ(completed.start, recorded->start);
  EXPECT_EQ(completed.end, recorded->end);

  // Running and pending calls are swept
  for (size_t i = 1; i < tools.size(); ++i) {
    ASSERT_EQ(tools[i].status(), ToolStatus::Error);
    const auto &state = std::get<ToolStateError>(tools[i].state);
    EXPECT_EQ(state.error, "Tool execution aborted");
    EXPECT_EQ(state.start, state.end);
  }
  EXPECT_EQ(tools[1].input()["command"], "make");
}

TEST_F(ProcessorTest, ToolErrorIsRecorded) {
  llm::Script script = {
      ScriptStep::emit(llm::ToolInputStart{"c1", "bash"}),
      ScriptStep::emit(llm::ToolCall{"c1", "bash", {{"command", "false"}}, json()}),
      ScriptStep::emit(llm::ToolError{"c1", std::make_exception_ptr(std::runtime_error("exit code 1")), json()}),
      ScriptStep::emit(llm::FinishStep{FinishReason::ToolCalls, json::object(), json::object()}),
  };

  EXPECT_EQ(run({script}), TurnResult::Continue);

  auto tools = parts_of<ToolPart>();
  ASSERT_EQ(tools.size(), 1u);
  EXPECT_EQ(std::get<ToolStateError>(tools[0].state).error, "exit code 1");
  EXPECT_FALSE(turn_->blocked());
}

TEST_F(ProcessorTest, RejectedToolStopsTheTurn) {
  llm::Script script = {
      ScriptStep::emit(llm::ToolInputStart{"c1", "bash"}),
      ScriptStep::emit(llm::ToolCall{"c1", "bash", {{"command", "rm -rf /"}}, json()}),
      ScriptStep::emit(llm::ToolError{"c1", std::make_exception_ptr(PermissionRejectedError("bash")), json()}),
      ScriptStep::emit(llm::FinishStep{FinishReason::ToolCalls, json::object(), json::object()}),
  };

  EXPECT_EQ(run({script}), TurnResult::Stop);
  EXPECT_TRUE(turn_->blocked());
  EXPECT_FALSE(turn_->message().error().has_value());
}

TEST_F(ProcessorTest, RejectedToolContinuesWhenConfigured) {
  config_.experimental.continue_loop_on_deny = true;
  llm::Script script = {
      ScriptStep::emit(llm::ToolInputStart{"c1", "bash"}),
      ScriptStep::emit(llm::ToolCall{"c1", "bash", {{"command", "rm -rf /"}}, json()}),
      ScriptStep::emit(llm::ToolError{"c1", std::make_exception_ptr(PermissionRejectedError("bash")), json()}),
  };

  EXPECT_EQ(run({script}), TurnResult::Continue);
  EXPECT_FALSE(turn_->blocked());
}

TEST_F(ProcessorTest, DoomLoopAsksOnThirdIdenticalCall) {
  auto gate = std::make_shared<ScriptedGate>(false);
  gate_ = gate;

  llm::Script script;
  json input = {{"path", "src/main.cpp"}};
  append_tool_call(script, "c1", "read", input);
  append_tool_call(script, "c2", "read", input);
  EXPECT_EQ(run({script}), TurnResult::Continue);
  EXPECT_TRUE(gate->requests.empty());

  append_tool_call(script, "c3", "read", input);
  EXPECT_EQ(run({script}), TurnResult::Continue);
  ASSERT_EQ(gate->requests.size(), 1u);
  EXPECT_EQ(gate->requests[0].permission, "doom_loop");
  EXPECT_EQ(gate->requests[0].patterns, std::vector<std::string>{"read"});
}

TEST_F(ProcessorTest, RejectedDoomLoopBlocks) {
  gate_ = std::make_shared<ScriptedGate>(true);

  llm::Script script;
  for (int i = 0; i < 4; ++i) {
    append_tool_call(script, "c" + std::to_string(i), "grep", {{"pattern", "TODO"}});
  }

  EXPECT_EQ(run({script}), TurnResult::Stop);
  EXPECT_TRUE(turn_->blocked());

  // The third call stays unfinished and is swept at finalization
  auto tools = parts_of<ToolPart>();
  ASSERT_EQ(tools.size(), 3u);
  EXPECT_EQ(tools[2].status(), ToolStatus::Error);
  EXPECT_EQ(std::get<ToolStateError>(tools[2].state).error, "Tool execution aborted");

  // Calls that finished before the refusal are left alone
  for (size_t i = 0; i < 2; ++i) {
    ASSERT_EQ(tools[i].status(), ToolStatus::Completed);
    const auto &done = std::get<ToolStateCompleted>(tools[i].state);
    EXPECT_EQ(done.output, "done");
    EXPECT_LE(done.start, done.end);
  }
}

// --- Idle timeouts and retries ---

TEST_F(ProcessorTest, IdleTimeoutRetriesThenSucceeds) {
  config_.experimental.stream_idle_timeout = 50ms;

  auto result = run({{ScriptStep::emit(llm::Start{}), ScriptStep::hang()}, hello_script()});

  EXPECT_EQ(result, TurnResult::Continue);
  EXPECT_EQ(provider_->streams_started(), 2);
  auto retry = retries();
  ASSERT_EQ(retry.size(), 1u);
  EXPECT_EQ(retry[0].attempt, 1);
  EXPECT_EQ(retry[0].message, "Stream idle timeout (attempt 1/3)");
  ASSERT_TRUE(retry[0].next.has_value());
  EXPECT_EQ(provider_->requests()[1].attempt, 1);
  EXPECT_FALSE(turn_->message().error().has_value());
}

TEST_F(ProcessorTest, IdleTimeoutCapEndsTheTurn) {
  config_.experimental.stream_idle_timeout = 30ms;

  std::vector<llm::Script> stalls(5, llm::Script{ScriptStep::hang()});
  auto result = run(stalls);

  EXPECT_EQ(result, TurnResult::Stop);
  EXPECT_EQ(provider_->streams_started(), 4);
  EXPECT_EQ(retries().size(), 3u);

  const auto &error = turn_->message().error();
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->name, "UnknownError");
  EXPECT_NE(error->message.find("Stream timed out 4 times after 3 retries (30ms idle)"), std::string::npos);

  ASSERT_EQ(session_errors_.size(), 1u);
  EXPECT_EQ(session_errors_[0].error.name, "UnknownError");
  EXPECT_EQ(status_.get("ses_test").type, StatusInfo::Type::Idle);
}

TEST_F(ProcessorTest, PendingToolInputExtendsTheDeadline) {
  config_.experimental.stream_idle_timeout = 50ms;
  config_.experimental.tool_input_pending_timeout = 1000ms;

  llm::Script script = {
      ScriptStep::emit(llm::ToolInputStart{"c1", "write"}),
      ScriptStep::emit(llm::ToolCall{"c1", "write", {{"file", "big.txt"}}, json()}, 200ms),
      ScriptStep::emit(llm::ToolResult{"c1", {"written", "big.txt", json::object(), {}}, json()}),
      ScriptStep::emit(llm::FinishStep{FinishReason::ToolCalls, json::object(), json::object()}),
  };

  EXPECT_EQ(run({script}), TurnResult::Continue);
  EXPECT_EQ(provider_->streams_started(), 1);
  EXPECT_TRUE(retries().empty());

  auto tools = parts_of<ToolPart>();
  ASSERT_EQ(tools.size(), 1u);
  EXPECT_EQ(tools[0].status(), ToolStatus::Completed);
}

TEST_F(ProcessorTest, StallWithPendingInputTimesOutOnExtendedDeadline) {
  config_.experimental.stream_idle_timeout = 30ms;
  config_.experimental.tool_input_pending_timeout = 120ms;
  config_.retry.max_idle_timeout_retries = 0;

  auto start = std::chrono::steady_clock::now();
  auto result = run({{ScriptStep::emit(llm::ToolInputStart{"c1", "write"}), ScriptStep::hang()}});
  auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_EQ(result, TurnResult::Stop);
  EXPECT_GE(elapsed, 120ms);

  const auto &error = turn_->message().error();
  ASSERT_TRUE(error.has_value());
  EXPECT_NE(error->message.find("(120ms idle)"), std::string::npos);

  auto tools = parts_of<ToolPart>();
  ASSERT_EQ(tools.size(), 1u);
  EXPECT_EQ(std::get<ToolStateError>(tools[0].state).error, "Tool execution aborted");
}

TEST_F(ProcessorTest, DisabledWatchdogNeverTimesOut) {
  config_.experimental.stream_idle_timeout = 0ms;

  llm::Script script = hello_script();
  script.insert(script.begin() + 1, ScriptStep::emit(llm::StartStep{}, 100ms));
  EXPECT_EQ(run({script}), TurnResult::Continue);
  EXPECT_EQ(turn_->idle_timeout(), 0ms);
}

TEST_F(ProcessorTest, TransientErrorRetries) {
  auto result = run({{ScriptStep::emit(llm::ErrorEvent{provider_error(ProviderError::Kind::Transient, "Service Unavailable")})},
                     hello_script()});

  EXPECT_EQ(result, TurnResult::Continue);
  auto retry = retries();
  ASSERT_EQ(retry.size(), 1u);
  EXPECT_EQ(retry[0].message, "Service Unavailable");
  EXPECT_EQ(retry[0].attempt, 1);
  EXPECT_FALSE(turn_->message().error().has_value());
}

TEST_F(ProcessorTest, PartsSurviveRetries) {
  llm::Script first = {
      ScriptStep::emit(llm::StartStep{}),
      ScriptStep::emit(llm::TextStart{"t1", json()}),
      ScriptStep::emit(llm::TextDelta{"t1", "partial", json()}),
      ScriptStep::emit(llm::ErrorEvent{provider_error(ProviderError::Kind::Transient, "connection reset")}),
  };

  EXPECT_EQ(run({first, hello_script("t2")}), TurnResult::Continue);

  auto texts = parts_of<TextPart>();
  ASSERT_EQ(texts.size(), 2u);
  EXPECT_EQ(texts[0].text, "partial");
  EXPECT_EQ(texts[1].text, "Hello");
}

TEST_F(ProcessorTest, TerminalErrorStops) {
  auto result = run({{ScriptStep::emit(llm::ErrorEvent{provider_error(ProviderError::Kind::Auth, "invalid x-api-key")})}});

  EXPECT_EQ(result, TurnResult::Stop);
  EXPECT_EQ(provider_->streams_started(), 1);
  ASSERT_TRUE(turn_->message().error().has_value());
  EXPECT_EQ(turn_->message().error()->name, "ProviderAuthError");
  ASSERT_EQ(session_errors_.size(), 1u);
  EXPECT_EQ(session_errors_[0].message_id, turn_->message().id());
}

TEST_F(ProcessorTest, EmptyErrorEventFailsTheTurn) {
  auto result = run({{ScriptStep::emit(llm::Start{}), ScriptStep::emit(llm::ErrorEvent{})}});

  EXPECT_EQ(result, TurnResult::Stop);
  EXPECT_EQ(provider_->streams_started(), 1);
  ASSERT_TRUE(turn_->message().error().has_value());
  EXPECT_EQ(turn_->message().error()->name, "APIError");
  EXPECT_EQ(turn_->message().error()->message, "Stream error");
  EXPECT_FALSE(turn_->message().error()->retryable);
}

// --- Compaction ---

TEST_F(ProcessorTest, ContextOverflowErrorRequestsCompaction) {
  auto result = run({{ScriptStep::emit(llm::ErrorEvent{provider_error(ProviderError::Kind::ContextOverflow, "prompt is too long")})}});

  EXPECT_EQ(result, TurnResult::Compact);
  EXPECT_TRUE(turn_->needs_compaction());
  EXPECT_FALSE(turn_->message().error().has_value());
  EXPECT_TRUE(session_errors_.empty());
}

TEST_F(ProcessorTest, TokenOverflowStopsConsumingEarly) {
  llm::Script script = {
      ScriptStep::emit(llm::StartStep{}),
      ScriptStep::emit(llm::FinishStep{FinishReason::ToolCalls, {{"inputTokens", 99000}, {"outputTokens", 10}}, json::object()}),
      ScriptStep::emit(llm::TextStart{"late", json()}, 20ms),
  };

  EXPECT_EQ(run({script}), TurnResult::Compact);
  EXPECT_TRUE(parts_of<TextPart>().empty());
}

// --- Abort ---

TEST_F(ProcessorTest, AbortEndsTheTurnAndKeepsPartialText) {
  llm::Script script = {
      ScriptStep::emit(llm::StartStep{}),
      ScriptStep::emit(llm::TextStart{"t1", json()}),
      ScriptStep::emit(llm::TextDelta{"t1", "partial answer", json()}),
      ScriptStep::emit(llm::ToolInputStart{"c1", "bash"}),
      ScriptStep::hang(),
  };
  provider({script});
  turn_ = make_turn();

  std::thread aborter([this] {
    std::this_thread::sleep_for(100ms);
    turn_->abort_signal()->abort();
  });

  auto start = std::chrono::steady_clock::now();
  llm::StreamRequest request;
  auto result = turn_->process(request);
  aborter.join();

  EXPECT_EQ(result, TurnResult::Stop);
  EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
  ASSERT_TRUE(turn_->message().error().has_value());
  EXPECT_EQ(turn_->message().error()->name, "MessageAbortedError");
  EXPECT_TRUE(session_errors_.empty());

  auto texts = parts_of<TextPart>();
  ASSERT_EQ(texts.size(), 1u);
  EXPECT_EQ(texts[0].text, "partial answer");

  auto tools = parts_of<ToolPart>();
  ASSERT_EQ(tools.size(), 1u);
  EXPECT_EQ(tools[0].status(), ToolStatus::Error);
}

TEST_F(ProcessorTest, AbortBeforeStartOpensNoStream) {
  provider({hello_script()});
  turn_ = make_turn();
  turn_->abort_signal()->abort();

  EXPECT_EQ(turn_->process({}), TurnResult::Stop);
  EXPECT_EQ(provider_->streams_started(), 0);
  EXPECT_EQ(turn_->message().error()->name, "MessageAbortedError");
}

TEST(TurnProcessorTest, RequiresProviderAndStore) {
  TurnDependencies deps;
  EXPECT_THROW(TurnProcessor(AssistantMessage("s", "m"), ModelInfo{}, deps), std::invalid_argument);
}

TEST(TurnProcessorTest, EnumNames) {
  EXPECT_EQ(to_string(TurnResult::Compact), "compact");
  EXPECT_EQ(to_string(TurnState::Retrying), "retrying");
}

#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "core/abort.hpp"
#include "core/config.hpp"
#include "core/message.hpp"
#include "core/store.hpp"
#include "llm/provider.hpp"
#include "permission/permission.hpp"
#include "plugin/hooks.hpp"
#include "session/doom_loop.hpp"
#include "session/flush_buffer.hpp"
#include "session/retry.hpp"
#include "session/status.hpp"
#include "session/summary.hpp"
#include "session/tool_ledger.hpp"
#include "snapshot/snapshot.hpp"

namespace coderun {

enum class TurnResult { Continue, Stop, Compact };

enum class TurnState { Idle, Streaming, Retrying, Finalizing, Done };

std::string to_string(TurnResult result);
std::string to_string(TurnState state);

// Collaborators a turn talks to. Only provider and store are required.
struct TurnDependencies {
  std::shared_ptr<llm::Provider> provider;
  std::shared_ptr<SessionStore> store;
  std::shared_ptr<Snapshot> snapshot;
  std::shared_ptr<PermissionGate> permission;
  std::shared_ptr<RetryBackoff> retry;  // SessionRetry when empty
  std::shared_ptr<Summarizer> summarizer;
  SessionStatus *status = &SessionStatus::instance();
  plugin::Hooks *hooks = &plugin::Hooks::instance();
};

// Drives one assistant turn: consumes the model stream, materializes parts,
// tracks tool calls, retries failed attempts and finalizes the message.
//
// Usage:
//   TurnProcessor turn(message, model, deps, config, abort);
//   auto result = turn.process(request);
class TurnProcessor {
 public:
  TurnProcessor(AssistantMessage message, ModelInfo model, TurnDependencies deps, Config config = {},
                std::shared_ptr<AbortSignal> abort = AbortSignal::create());

  TurnProcessor(const TurnProcessor &) = delete;
  TurnProcessor &operator=(const TurnProcessor &) = delete;

  // Run the turn to completion. Only persistence failures escape.
  TurnResult process(llm::StreamRequest request);

  const AssistantMessage &message() const {
    return message_;
  }

  TurnState state() const {
    return state_;
  }

  // Agent permission rules passed to approval requests
  void set_ruleset(Ruleset ruleset) {
    ruleset_ = std::move(ruleset);
  }

  const std::shared_ptr<AbortSignal> &abort_signal() const {
    return abort_;
  }

  bool blocked() const {
    return blocked_;
  }

  bool needs_compaction() const {
    return needs_compaction_;
  }

  // Deadline the watchdog uses right now
  std::chrono::milliseconds idle_timeout() const;

 private:
  // One stream attempt; throws on any failure
  void run_attempt(const llm::StreamRequest &request);

  // Returns true when another attempt should be made
  bool handle_failure(const std::exception_ptr &error);

  void record_error(const MessageError &error, bool publish);

  void handle_event(const llm::StreamEvent &event);

  void on_text_start(const llm::TextStart &event);
  void on_text_delta(const llm::TextDelta &event);
  void on_text_end(const llm::TextEnd &event);
  void on_reasoning_start(const llm::ReasoningStart &event);
  void on_reasoning_delta(const llm::ReasoningDelta &event);
  void on_reasoning_end(const llm::ReasoningEnd &event);
  void on_tool_call(const llm::ToolCall &event);
  void on_tool_error(const llm::ToolError &event);
  void on_start_step();
  void on_finish_step(const llm::FinishStep &event);

  // Flush callback of the delta buffer
  void flush_part(const PartId &id, const std::string &text, const std::string &delta);

  // Persist a patch part for the outstanding snapshot, if any
  void emit_patch();

  std::optional<std::string> track();

  // Flush partial text and forget open text/reasoning parts
  void end_attempt();

  void finalize();

  TurnResult result() const;

  AssistantMessage message_;
  ModelInfo model_;
  TurnDependencies deps_;
  Config config_;
  std::shared_ptr<AbortSignal> abort_;
  Ruleset ruleset_;

  TurnState state_ = TurnState::Idle;
  RetryPolicy retry_policy_;

  ToolCallLedger ledger_;
  DeltaFlushBuffer flush_;
  DoomLoopDetector doom_loop_;

  // Text and reasoning parts still streaming, by part id
  std::map<PartId, Part> live_parts_;
  // Provider stream ids -> part ids
  std::map<std::string, PartId> text_ids_;
  std::map<std::string, PartId> reasoning_ids_;

  std::optional<std::string> snapshot_;
  bool blocked_ = false;
  bool needs_compaction_ = false;
};

}  // namespace coderun

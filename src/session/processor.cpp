#include "session/processor.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

#include "bus/bus.hpp"
#include "core/channel.hpp"
#include "core/uuid.hpp"
#include "session/compaction.hpp"
#include "session/usage.hpp"
#include "session/watchdog.hpp"

namespace coderun {

std::string to_string(TurnResult result) {
  switch (result) {
    case TurnResult::Continue:
      return "continue";
    case TurnResult::Stop:
      return "stop";
    case TurnResult::Compact:
      return "compact";
  }
  return "stop";
}

std::string to_string(TurnState state) {
  switch (state) {
    case TurnState::Idle:
      return "idle";
    case TurnState::Streaming:
      return "streaming";
    case TurnState::Retrying:
      return "retrying";
    case TurnState::Finalizing:
      return "finalizing";
    case TurnState::Done:
      return "done";
  }
  return "idle";
}

namespace {

TurnDependencies with_defaults(TurnDependencies deps, const Config &config) {
  if (!deps.retry) {
    deps.retry = std::make_shared<SessionRetry>(config.retry);
  }
  if (!deps.provider || !deps.store) {
    throw std::invalid_argument("TurnProcessor requires a provider and a store");
  }
  return deps;
}

// Cancels the provider if the attempt is left before the stream finished
class StreamGuard {
 public:
  StreamGuard(llm::Provider &provider, std::shared_ptr<Channel<llm::StreamEvent>> channel)
      : provider_(provider), channel_(std::move(channel)) {}

  ~StreamGuard() {
    if (!channel_->closed()) {
      provider_.cancel();
      channel_->close();
    }
  }

  StreamGuard(const StreamGuard &) = delete;
  StreamGuard &operator=(const StreamGuard &) = delete;

 private:
  llm::Provider &provider_;
  std::shared_ptr<Channel<llm::StreamEvent>> channel_;
};

}  // namespace

TurnProcessor::TurnProcessor(AssistantMessage message, ModelInfo model, TurnDependencies deps, Config config,
                             std::shared_ptr<AbortSignal> abort)
    : message_(std::move(message)),
      model_(std::move(model)),
      deps_(with_defaults(std::move(deps), config)),
      config_(std::move(config)),
      abort_(abort ? std::move(abort) : AbortSignal::create()),
      ruleset_(config_.permission),
      retry_policy_(config_.retry, *deps_.retry),
      ledger_(message_.session_id(), message_.id()),
      flush_(config_.streaming.delta_flush_interval,
             [this](const PartId &id, const std::string &text, const std::string &delta) {
               flush_part(id, text, delta);
             }) {
  if (message_.provider_id().empty() && message_.model_id().empty()) {
    message_.set_model(model_.provider_id, model_.id);
  }
}

std::chrono::milliseconds TurnProcessor::idle_timeout() const {
  const auto base = config_.experimental.stream_idle_timeout;
  if (base.count() <= 0) {
    return std::chrono::milliseconds(0);
  }
  return ledger_.has_pending_input() ? config_.experimental.tool_input_pending_timeout : base;
}

TurnResult TurnProcessor::process(llm::StreamRequest request) {
  spdlog::info("[Turn {}] Processing (session {}, model {})", message_.id(), message_.session_id(), model_.id);
  request.session_id = message_.session_id();
  request.message_id = message_.id();

  while (true) {
    state_ = TurnState::Streaming;
    try {
      abort_->throw_if_aborted();
      run_attempt(request);
      break;
    } catch (const AbortError &) {
      spdlog::info("[Turn {}] Aborted", message_.id());
      record_error(errors::from_exception(std::current_exception(), model_.provider_id), false);
      break;
    } catch (const PermissionRejectedError &e) {
      // Doom-loop approval was refused
      spdlog::info("[Turn {}] {}", message_.id(), e.what());
      blocked_ = !config_.experimental.continue_loop_on_deny;
      break;
    } catch (const PermissionDeniedError &e) {
      spdlog::info("[Turn {}] {}", message_.id(), e.what());
      blocked_ = !config_.experimental.continue_loop_on_deny;
      break;
    } catch (const std::exception &e) {
      spdlog::warn("[Turn {}] Stream attempt failed: {}", message_.id(), e.what());
      if (!handle_failure(std::current_exception())) {
        break;
      }
      ++request.attempt;
    }
  }

  finalize();

  auto outcome = result();
  spdlog::info("[Turn {}] Finished: {}", message_.id(), to_string(outcome));
  return outcome;
}

void TurnProcessor::run_attempt(const llm::StreamRequest &request) {
  auto channel = std::make_shared<Channel<llm::StreamEvent>>();
  ledger_.clear_pending_input();

  spdlog::debug("[Turn {}] Opening stream (attempt {})", message_.id(), request.attempt + 1);
  deps_.provider->stream(
      request,
      [channel](const llm::StreamEvent &event) {
        channel->push(event);
      },
      [channel] {
        channel->close();
      });
  StreamGuard guard(*deps_.provider, channel);

  IdleWatchdog<llm::StreamEvent> watchdog(
      *channel,
      [this] {
        return idle_timeout();
      },
      abort_);

  try {
    while (true) {
      abort_->throw_if_aborted();

      auto next = watchdog.next(flush_.next_flush_at());
      if (next.status == WatchStatus::Tick) {
        flush_.flush_due();
        continue;
      }
      if (next.status == WatchStatus::Done) {
        break;
      }

      handle_event(*next.value);
      flush_.flush_due();

      if (needs_compaction_) {
        spdlog::info("[Turn {}] Context overflow, stopping stream for compaction", message_.id());
        break;
      }
    }
  } catch (const std::exception &) {
    end_attempt();
    throw;
  }
  end_attempt();
}

void TurnProcessor::end_attempt() {
  flush_.flush_all();
  flush_.clear();
  live_parts_.clear();
  text_ids_.clear();
  reasoning_ids_.clear();
}

bool TurnProcessor::handle_failure(const std::exception_ptr &error) {
  // Context overflow becomes a compaction request rather than an error
  if (errors::from_exception(error, model_.provider_id).name == "ContextOverflowError") {
    spdlog::info("[Turn {}] Provider reported context overflow: {}", message_.id(), errors::describe(error));
    needs_compaction_ = true;
    return false;
  }

  auto decision = retry_policy_.on_failure(error, model_.provider_id);
  if (decision.action == RetryPolicy::Action::Fail) {
    record_error(decision.error, true);
    return false;
  }

  state_ = TurnState::Retrying;
  auto next = std::chrono::system_clock::now() + decision.delay;
  if (deps_.status) {
    deps_.status->set(message_.session_id(), StatusInfo::retry(decision.attempt, decision.message, next));
  }

  try {
    deps_.retry->sleep(decision.delay, *abort_);
  } catch (const AbortError &) {
    // Surfaces as an abort at the top of the next attempt
    spdlog::info("[Turn {}] Aborted during retry backoff", message_.id());
  }
  return true;
}

void TurnProcessor::record_error(const MessageError &error, bool publish) {
  message_.set_error(error);
  if (publish) {
    Bus::instance().publish(events::SessionError{message_.session_id(), message_.id(), error});
  }
  if (deps_.status) {
    deps_.status->set(message_.session_id(), StatusInfo::idle());
  }
}

void TurnProcessor::handle_event(const llm::StreamEvent &event) {
  std::visit(
      [this](const auto &e) {
        using T = std::decay_t<decltype(e)>;

        if constexpr (std::is_same_v<T, llm::Start>) {
          if (deps_.status) {
            deps_.status->set(message_.session_id(), StatusInfo::busy());
          }
        } else if constexpr (std::is_same_v<T, llm::ReasoningStart>) {
          on_reasoning_start(e);
        } else if constexpr (std::is_same_v<T, llm::ReasoningDelta>) {
          on_reasoning_delta(e);
        } else if constexpr (std::is_same_v<T, llm::ReasoningEnd>) {
          on_reasoning_end(e);
        } else if constexpr (std::is_same_v<T, llm::ToolInputStart>) {
          if (auto part = ledger_.on_input_start(e.id, e.tool)) {
            deps_.store->update_part(*part);
          }
        } else if constexpr (std::is_same_v<T, llm::ToolInputDelta> || std::is_same_v<T, llm::ToolInputEnd>) {
          // Arguments are only recorded once complete
        } else if constexpr (std::is_same_v<T, llm::ToolCall>) {
          on_tool_call(e);
        } else if constexpr (std::is_same_v<T, llm::ToolResult>) {
          if (auto part = ledger_.on_tool_result(e.id, e.output, e.input)) {
            deps_.store->update_part(*part);
          }
        } else if constexpr (std::is_same_v<T, llm::ToolError>) {
          on_tool_error(e);
        } else if constexpr (std::is_same_v<T, llm::ErrorEvent>) {
          if (!e.error) {
            throw ProviderError(ProviderError::Kind::Terminal, "Stream error");
          }
          std::rethrow_exception(e.error);
        } else if constexpr (std::is_same_v<T, llm::StartStep>) {
          on_start_step();
        } else if constexpr (std::is_same_v<T, llm::FinishStep>) {
          on_finish_step(e);
        } else if constexpr (std::is_same_v<T, llm::TextStart>) {
          on_text_start(e);
        } else if constexpr (std::is_same_v<T, llm::TextDelta>) {
          on_text_delta(e);
        } else if constexpr (std::is_same_v<T, llm::TextEnd>) {
          on_text_end(e);
        } else if constexpr (std::is_same_v<T, llm::Finish>) {
          spdlog::debug("[Turn {}] Stream finished ({})", message_.id(), to_string(e.finish_reason));
        } else {
          spdlog::info("[Turn {}] Unhandled stream event: {}", message_.id(), e.type);
        }
      },
      event);
}

// --- Text and reasoning ---

void TurnProcessor::on_text_start(const llm::TextStart &event) {
  if (text_ids_.count(event.id)) {
    spdlog::debug("[Turn {}] Duplicate text-start {}", message_.id(), event.id);
    return;
  }

  TextPart part;
  part.id = Identifier::ascending("part");
  part.message_id = message_.id();
  part.session_id = message_.session_id();
  part.time = TimeRange{};
  part.metadata = event.metadata;

  text_ids_[event.id] = part.id;
  live_parts_[part.id] = part;
  deps_.store->update_part(part);
}

void TurnProcessor::on_text_delta(const llm::TextDelta &event) {
  auto it = text_ids_.find(event.id);
  if (it == text_ids_.end()) {
    spdlog::debug("[Turn {}] text-delta for unknown id {}", message_.id(), event.id);
    return;
  }

  if (!event.metadata.is_null()) {
    std::get<TextPart>(live_parts_[it->second]).metadata = event.metadata;
  }
  flush_.append(it->second, event.text);
}

void TurnProcessor::on_text_end(const llm::TextEnd &event) {
  auto it = text_ids_.find(event.id);
  if (it == text_ids_.end()) {
    spdlog::debug("[Turn {}] text-end for unknown id {}", message_.id(), event.id);
    return;
  }

  auto part_id = it->second;
  auto part = std::get<TextPart>(live_parts_[part_id]);
  text_ids_.erase(it);
  live_parts_.erase(part_id);

  auto text = trim_end(flush_.finalize(part_id));
  if (deps_.hooks) {
    text = deps_.hooks->trigger_text_complete({message_.session_id(), message_.id(), part_id}, text);
  }

  part.text = std::move(text);
  auto now = std::chrono::system_clock::now();
  part.time = TimeRange{part.time ? part.time->start : now, now};
  if (!event.metadata.is_null()) {
    part.metadata = event.metadata;
  }
  deps_.store->update_part(part);
}

void TurnProcessor::on_reasoning_start(const llm::ReasoningStart &event) {
  if (reasoning_ids_.count(event.id)) {
    return;
  }

  ReasoningPart part;
  part.id = Identifier::ascending("part");
  part.message_id = message_.id();
  part.session_id = message_.session_id();
  part.metadata = event.metadata;

  reasoning_ids_[event.id] = part.id;
  live_parts_[part.id] = part;
  deps_.store->update_part(part);
}

void TurnProcessor::on_reasoning_delta(const llm::ReasoningDelta &event) {
  auto it = reasoning_ids_.find(event.id);
  if (it == reasoning_ids_.end()) {
    return;
  }

  if (!event.metadata.is_null()) {
    std::get<ReasoningPart>(live_parts_[it->second]).metadata = event.metadata;
  }
  flush_.append(it->second, event.text);
}

void TurnProcessor::on_reasoning_end(const llm::ReasoningEnd &event) {
  auto it = reasoning_ids_.find(event.id);
  if (it == reasoning_ids_.end()) {
    return;
  }

  auto part_id = it->second;
  auto part = std::get<ReasoningPart>(live_parts_[part_id]);
  reasoning_ids_.erase(it);
  live_parts_.erase(part_id);

  part.text = trim_end(flush_.finalize(part_id));
  part.time.end = std::chrono::system_clock::now();
  if (!event.metadata.is_null()) {
    part.metadata = event.metadata;
  }
  deps_.store->update_part(part);
}

void TurnProcessor::flush_part(const PartId &id, const std::string &text, const std::string &delta) {
  auto it = live_parts_.find(id);
  if (it == live_parts_.end()) {
    return;
  }

  std::visit(
      [&text](auto &part) {
        using T = std::decay_t<decltype(part)>;
        if constexpr (std::is_same_v<T, TextPart> || std::is_same_v<T, ReasoningPart>) {
          part.text = text;
        }
      },
      it->second);
  deps_.store->update_part(it->second, delta);
}

// --- Tools ---

void TurnProcessor::on_tool_call(const llm::ToolCall &event) {
  auto part = ledger_.on_tool_call(event.id, event.tool, event.input, event.metadata);
  if (!part) {
    return;
  }
  deps_.store->update_part(*part);

  if (!deps_.permission) {
    return;
  }
  doom_loop_.check(deps_.store->list_parts(message_.id()), *part, *deps_.permission, ruleset_, abort_.get());
}

void TurnProcessor::on_tool_error(const llm::ToolError &event) {
  auto part = ledger_.on_tool_error(event.id, errors::describe(event.error), event.input);
  if (!part) {
    return;
  }
  deps_.store->update_part(*part);

  if (errors::is_rejection(event.error)) {
    spdlog::info("[Turn {}] Tool {} was rejected", message_.id(), part->tool);
    blocked_ = !config_.experimental.continue_loop_on_deny;
  }
}

// --- Steps ---

std::optional<std::string> TurnProcessor::track() {
  if (!deps_.snapshot || !config_.snapshot) {
    return std::nullopt;
  }
  return deps_.snapshot->track();
}

void TurnProcessor::on_start_step() {
  snapshot_ = track();

  StepStartPart part;
  part.id = Identifier::ascending("part");
  part.message_id = message_.id();
  part.session_id = message_.session_id();
  part.snapshot = snapshot_;
  deps_.store->update_part(part);
}

void TurnProcessor::on_finish_step(const llm::FinishStep &event) {
  auto step = usage::compute(model_, event.usage, event.provider_metadata);

  message_.set_finish(event.finish_reason);
  message_.add_cost(step.cost);
  message_.add_tokens(step.tokens);

  StepFinishPart part;
  part.id = Identifier::ascending("part");
  part.message_id = message_.id();
  part.session_id = message_.session_id();
  part.reason = to_string(event.finish_reason);
  part.snapshot = track();
  part.cost = step.cost;
  part.tokens = step.tokens;
  deps_.store->update_part(part);
  deps_.store->update_message(message_);

  emit_patch();

  if (deps_.summarizer) {
    deps_.summarizer->summarize(message_.session_id(), message_.parent_id());
  }

  if (compaction::is_overflow(step.tokens, model_, config_.compaction)) {
    needs_compaction_ = true;
  }
}

void TurnProcessor::emit_patch() {
  if (!snapshot_ || !deps_.snapshot) {
    return;
  }

  auto patch = deps_.snapshot->patch(*snapshot_);
  snapshot_.reset();
  if (patch.files.empty()) {
    return;
  }

  PatchPart part;
  part.id = Identifier::ascending("part");
  part.message_id = message_.id();
  part.session_id = message_.session_id();
  part.hash = patch.hash;
  part.files = std::move(patch.files);
  deps_.store->update_part(part);
}

// --- Finalization ---

void TurnProcessor::finalize() {
  state_ = TurnState::Finalizing;

  end_attempt();
  emit_patch();

  auto now = std::chrono::system_clock::now();
  for (const auto &part : deps_.store->list_parts(message_.id())) {
    auto *tool = std::get_if<ToolPart>(&part);
    if (!tool || tool->is_finalized()) {
      continue;
    }

    ToolPart aborted = *tool;
    aborted.state = ToolStateError{tool->input(), "Tool execution aborted", json::object(), now, now};
    deps_.store->update_part(aborted);
    spdlog::info("[Turn {}] Marked {} call {} as aborted", message_.id(), tool->tool, tool->call_id);
  }
  ledger_.clear();

  message_.set_completed(std::chrono::system_clock::now());
  deps_.store->update_message(message_);

  state_ = TurnState::Done;
}

TurnResult TurnProcessor::result() const {
  if (needs_compaction_) return TurnResult::Compact;
  if (blocked_) return TurnResult::Stop;
  if (message_.error()) return TurnResult::Stop;
  return TurnResult::Continue;
}

}  // namespace coderun

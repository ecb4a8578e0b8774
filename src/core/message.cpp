#include "core/message.hpp"

#include <spdlog/spdlog.h>

#include "core/uuid.hpp"

namespace coderun {

std::string to_string(ToolStatus status) {
  switch (status) {
    case ToolStatus::Pending:
      return "pending";
    case ToolStatus::Running:
      return "running";
    case ToolStatus::Completed:
      return "completed";
    case ToolStatus::Error:
      return "error";
  }
  return "pending";
}

ToolStatus ToolPart::status() const {
  return static_cast<ToolStatus>(state.index());
}

const json& ToolPart::input() const {
  return std::visit(
      [](const auto& s) -> const json& {
        return s.input;
      },
      state);
}

const PartId& part_id(const Part& part) {
  return std::visit(
      [](const auto& p) -> const PartId& {
        return p.id;
      },
      part);
}

const MessageId& part_message_id(const Part& part) {
  return std::visit(
      [](const auto& p) -> const MessageId& {
        return p.message_id;
      },
      part);
}

std::string part_type(const Part& part) {
  if (std::holds_alternative<TextPart>(part)) return "text";
  if (std::holds_alternative<ReasoningPart>(part)) return "reasoning";
  if (std::holds_alternative<ToolPart>(part)) return "tool";
  if (std::holds_alternative<StepStartPart>(part)) return "step-start";
  if (std::holds_alternative<StepFinishPart>(part)) return "step-finish";
  return "patch";
}

namespace {

json time_to_json(const TimeRange& time) {
  json j = {{"start", to_epoch_ms(time.start)}};
  if (time.end) {
    j["end"] = to_epoch_ms(*time.end);
  }
  return j;
}

TimeRange time_from_json(const json& j) {
  TimeRange time;
  time.start = from_epoch_ms(j.value("start", int64_t(0)));
  if (j.contains("end")) {
    time.end = from_epoch_ms(j["end"].get<int64_t>());
  }
  return time;
}

json tool_state_to_json(const ToolState& state) {
  json j;
  if (auto* pending = std::get_if<ToolStatePending>(&state)) {
    j["status"] = "pending";
    j["input"] = pending->input;
    j["raw"] = pending->raw;
  } else if (auto* running = std::get_if<ToolStateRunning>(&state)) {
    j["status"] = "running";
    j["input"] = running->input;
    if (running->title) {
      j["title"] = *running->title;
    }
    j["metadata"] = running->metadata;
    j["time"] = {{"start", to_epoch_ms(running->start)}};
  } else if (auto* completed = std::get_if<ToolStateCompleted>(&state)) {
    j["status"] = "completed";
    j["input"] = completed->input;
    j["output"] = completed->output;
    j["title"] = completed->title;
    j["metadata"] = completed->metadata;
    json attachments = json::array();
    for (const auto& a : completed->attachments) {
      attachments.push_back({{"id", a.id}, {"mime", a.mime}, {"filename", a.filename}, {"url", a.url}});
    }
    j["attachments"] = attachments;
    j["time"] = {{"start", to_epoch_ms(completed->start)}, {"end", to_epoch_ms(completed->end)}};
  } else if (auto* error = std::get_if<ToolStateError>(&state)) {
    j["status"] = "error";
    j["input"] = error->input;
    j["error"] = error->error;
    j["metadata"] = error->metadata;
    j["time"] = {{"start", to_epoch_ms(error->start)}, {"end", to_epoch_ms(error->end)}};
  }
  return j;
}

ToolState tool_state_from_json(const json& j) {
  std::string status = j.value("status", "pending");
  json input = j.value("input", json::object());
  json time = j.value("time", json::object());
  auto start = from_epoch_ms(time.value("start", int64_t(0)));
  auto end = from_epoch_ms(time.value("end", int64_t(0)));

  if (status == "running") {
    ToolStateRunning running{input, std::nullopt, j.value("metadata", json()), start};
    if (j.contains("title")) {
      running.title = j["title"].get<std::string>();
    }
    return running;
  }
  if (status == "completed") {
    ToolStateCompleted completed{input, j.value("output", ""), j.value("title", ""), j.value("metadata", json()), {}, start, end};
    for (const auto& a : j.value("attachments", json::array())) {
      completed.attachments.push_back({a.value("id", ""), a.value("mime", ""), a.value("filename", ""), a.value("url", "")});
    }
    return completed;
  }
  if (status == "error") {
    return ToolStateError{input, j.value("error", ""), j.value("metadata", json()), start, end};
  }
  return ToolStatePending{input, j.value("raw", "")};
}

}  // namespace

json part_to_json(const Part& part) {
  json j;
  j["type"] = part_type(part);

  std::visit(
      [&j](const auto& p) {
        j["id"] = p.id;
        j["message_id"] = p.message_id;
        j["session_id"] = p.session_id;
      },
      part);

  if (auto* text = std::get_if<TextPart>(&part)) {
    j["text"] = text->text;
    if (text->synthetic) {
      j["synthetic"] = true;
    }
    if (text->time) {
      j["time"] = time_to_json(*text->time);
    }
    if (!text->metadata.is_null()) {
      j["metadata"] = text->metadata;
    }
  } else if (auto* reasoning = std::get_if<ReasoningPart>(&part)) {
    j["text"] = reasoning->text;
    j["time"] = time_to_json(reasoning->time);
    if (!reasoning->metadata.is_null()) {
      j["metadata"] = reasoning->metadata;
    }
  } else if (auto* tool = std::get_if<ToolPart>(&part)) {
    j["call_id"] = tool->call_id;
    j["tool"] = tool->tool;
    j["state"] = tool_state_to_json(tool->state);
    if (!tool->metadata.is_null()) {
      j["metadata"] = tool->metadata;
    }
  } else if (auto* step_start = std::get_if<StepStartPart>(&part)) {
    if (step_start->snapshot) {
      j["snapshot"] = *step_start->snapshot;
    }
  } else if (auto* step_finish = std::get_if<StepFinishPart>(&part)) {
    j["reason"] = step_finish->reason;
    if (step_finish->snapshot) {
      j["snapshot"] = *step_finish->snapshot;
    }
    j["cost"] = step_finish->cost;
    j["tokens"] = step_finish->tokens.to_json();
  } else if (auto* patch = std::get_if<PatchPart>(&part)) {
    j["hash"] = patch->hash;
    j["files"] = patch->files;
  }

  return j;
}

Part part_from_json(const json& j) {
  std::string type = j.value("type", "");
  std::string id = j.value("id", "");
  std::string message_id = j.value("message_id", "");
  std::string session_id = j.value("session_id", "");

  if (type == "text") {
    TextPart part{id, message_id, session_id, j.value("text", ""), j.value("synthetic", false), std::nullopt, j.value("metadata", json())};
    if (j.contains("time")) {
      part.time = time_from_json(j["time"]);
    }
    return part;
  }
  if (type == "reasoning") {
    return ReasoningPart{id, message_id, session_id, j.value("text", ""), time_from_json(j.value("time", json::object())),
                         j.value("metadata", json())};
  }
  if (type == "tool") {
    return ToolPart{id,
                    message_id,
                    session_id,
                    j.value("call_id", ""),
                    j.value("tool", ""),
                    tool_state_from_json(j.value("state", json::object())),
                    j.value("metadata", json())};
  }
  if (type == "step-start") {
    StepStartPart part{id, message_id, session_id, std::nullopt};
    if (j.contains("snapshot")) {
      part.snapshot = j["snapshot"].get<std::string>();
    }
    return part;
  }
  if (type == "step-finish") {
    StepFinishPart part{id, message_id, session_id, j.value("reason", ""), std::nullopt, j.value("cost", 0.0),
                        Tokens::from_json(j.value("tokens", json::object()))};
    if (j.contains("snapshot")) {
      part.snapshot = j["snapshot"].get<std::string>();
    }
    return part;
  }
  if (type == "patch") {
    return PatchPart{id, message_id, session_id, j.value("hash", ""), j.value("files", std::vector<std::string>{})};
  }

  throw std::invalid_argument("Unknown part type: " + type);
}

// AssistantMessage

AssistantMessage::AssistantMessage(SessionId session_id, MessageId parent_id)
    : id_(Identifier::ascending("msg")), session_id_(std::move(session_id)), parent_id_(std::move(parent_id)) {}

void AssistantMessage::add_cost(double cost) {
  if (cost < 0) {
    spdlog::warn("[Message {}] Ignoring negative cost {}", id_, cost);
    return;
  }
  cost_ += cost;
}

void AssistantMessage::add_tokens(const Tokens& tokens) {
  if (tokens.input < 0 || tokens.output < 0 || tokens.reasoning < 0 || tokens.cache.read < 0 || tokens.cache.write < 0) {
    spdlog::warn("[Message {}] Ignoring negative token usage", id_);
    return;
  }
  tokens_ += tokens;
}

bool AssistantMessage::set_error(MessageError error) {
  if (error_) {
    spdlog::warn("[Message {}] Error already recorded ({}), dropping {}", id_, error_->name, error.name);
    return false;
  }
  error_ = std::move(error);
  return true;
}

json AssistantMessage::to_json() const {
  json j;
  j["id"] = id_;
  j["role"] = "assistant";
  j["session_id"] = session_id_;
  j["parent_id"] = parent_id_;
  j["provider_id"] = provider_id_;
  j["model_id"] = model_id_;
  j["agent"] = agent_;
  if (finish_) {
    j["finish"] = to_string(*finish_);
  }
  j["cost"] = cost_;
  j["tokens"] = tokens_.to_json();
  if (error_) {
    j["error"] = error_->to_json();
  }
  j["time"] = {{"created", to_epoch_ms(created_at_)}};
  if (completed_at_) {
    j["time"]["completed"] = to_epoch_ms(*completed_at_);
  }
  return j;
}

AssistantMessage AssistantMessage::from_json(const json& j) {
  AssistantMessage msg;
  msg.id_ = j.value("id", Identifier::ascending("msg"));
  msg.session_id_ = j.value("session_id", "");
  msg.parent_id_ = j.value("parent_id", "");
  msg.provider_id_ = j.value("provider_id", "");
  msg.model_id_ = j.value("model_id", "");
  msg.agent_ = j.value("agent", "build");
  if (j.contains("finish")) {
    msg.finish_ = finish_reason_from_string(j["finish"].get<std::string>());
  }
  msg.cost_ = j.value("cost", 0.0);
  msg.tokens_ = Tokens::from_json(j.value("tokens", json::object()));
  if (j.contains("error")) {
    msg.error_ = MessageError::from_json(j["error"]);
  }
  if (j.contains("time")) {
    const auto& time = j["time"];
    msg.created_at_ = from_epoch_ms(time.value("created", int64_t(0)));
    if (time.contains("completed")) {
      msg.completed_at_ = from_epoch_ms(time["completed"].get<int64_t>());
    }
  }
  return msg;
}

}  // namespace coderun

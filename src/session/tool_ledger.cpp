#include "session/tool_ledger.hpp"

#include <spdlog/spdlog.h>

#include "core/uuid.hpp"

namespace coderun {

ToolCallLedger::ToolCallLedger(SessionId session_id, MessageId message_id)
    : session_id_(std::move(session_id)), message_id_(std::move(message_id)) {}

const ToolPart *ToolCallLedger::find(const CallId &call_id) const {
  auto it = entries_.find(call_id);
  return it == entries_.end() ? nullptr : &it->second;
}

void ToolCallLedger::clear() {
  entries_.clear();
  pending_input_.clear();
}

std::optional<ToolPart> ToolCallLedger::on_input_start(const CallId &call_id, const std::string &tool) {
  auto it = entries_.find(call_id);
  if (it != entries_.end() && it->second.status() != ToolStatus::Pending) {
    spdlog::debug("[Ledger] Ignoring input start for {} call {}", to_string(it->second.status()), call_id);
    return std::nullopt;
  }

  ToolPart part;
  part.id = it != entries_.end() ? it->second.id : Identifier::ascending("part");
  part.message_id = message_id_;
  part.session_id = session_id_;
  part.call_id = call_id;
  part.tool = tool;
  part.state = ToolStatePending{};

  entries_[call_id] = part;
  pending_input_.insert(call_id);
  return part;
}

std::optional<ToolPart> ToolCallLedger::on_tool_call(const CallId &call_id, const std::string &tool, const json &input,
                                                     const json &metadata) {
  pending_input_.erase(call_id);

  auto it = entries_.find(call_id);
  if (it == entries_.end()) {
    spdlog::debug("[Ledger] Dropping tool call for unknown id {}", call_id);
    return std::nullopt;
  }

  auto &part = it->second;
  if (part.status() != ToolStatus::Pending) {
    spdlog::debug("[Ledger] Duplicate tool call for {} ({})", call_id, to_string(part.status()));
    return std::nullopt;
  }

  part.tool = tool;
  part.state = ToolStateRunning{input, std::nullopt, json::object(), std::chrono::system_clock::now()};
  if (!metadata.is_null()) {
    part.metadata = metadata;
  }
  return part;
}

std::optional<ToolPart> ToolCallLedger::on_tool_result(const CallId &call_id, const llm::ToolOutput &output, const json &input) {
  auto it = entries_.find(call_id);
  if (it == entries_.end() || it->second.status() != ToolStatus::Running) {
    spdlog::debug("[Ledger] Ignoring result for call {}", call_id);
    return std::nullopt;
  }

  auto part = std::move(it->second);
  entries_.erase(it);

  const auto &running = std::get<ToolStateRunning>(part.state);
  part.state = ToolStateCompleted{input.is_null() ? running.input : input,
                                  sanitize_utf8(output.output),
                                  output.title,
                                  output.metadata,
                                  output.attachments,
                                  running.start,
                                  std::chrono::system_clock::now()};
  return part;
}

std::optional<ToolPart> ToolCallLedger::on_tool_error(const CallId &call_id, const std::string &error, const json &input) {
  auto it = entries_.find(call_id);
  if (it == entries_.end() || it->second.status() != ToolStatus::Running) {
    spdlog::debug("[Ledger] Ignoring error for call {}", call_id);
    return std::nullopt;
  }

  auto part = std::move(it->second);
  entries_.erase(it);

  const auto &running = std::get<ToolStateRunning>(part.state);
  part.state = ToolStateError{input.is_null() ? running.input : input, error, running.metadata, running.start,
                              std::chrono::system_clock::now()};
  return part;
}

}  // namespace coderun

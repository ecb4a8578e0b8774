#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>

#include "core/message.hpp"
#include "llm/stream.hpp"

namespace coderun {

// In-flight tool calls of one turn, keyed by provider call id.
// Each operation returns the part to persist, or nullopt when the event
// does not apply (unknown id, wrong state, duplicate delivery).
class ToolCallLedger {
 public:
  ToolCallLedger(SessionId session_id, MessageId message_id);

  // Create or reuse a pending part and mark its input as still arriving
  std::optional<ToolPart> on_input_start(const CallId &call_id, const std::string &tool);

  // pending -> running
  std::optional<ToolPart> on_tool_call(const CallId &call_id, const std::string &tool, const json &input, const json &metadata);

  // running -> completed; the entry leaves the ledger
  std::optional<ToolPart> on_tool_result(const CallId &call_id, const llm::ToolOutput &output, const json &input = json());

  // running -> error; the entry leaves the ledger
  std::optional<ToolPart> on_tool_error(const CallId &call_id, const std::string &error, const json &input = json());

  // Calls whose arguments have not fully arrived
  bool has_pending_input() const {
    return !pending_input_.empty();
  }

  bool is_pending_input(const CallId &call_id) const {
    return pending_input_.count(call_id) > 0;
  }

  void clear_pending_input() {
    pending_input_.clear();
  }

  const ToolPart *find(const CallId &call_id) const;

  size_t size() const {
    return entries_.size();
  }

  void clear();

 private:
  SessionId session_id_;
  MessageId message_id_;

  std::map<CallId, ToolPart> entries_;
  std::set<CallId> pending_input_;
};

}  // namespace coderun

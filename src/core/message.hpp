#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "core/errors.hpp"
#include "core/types.hpp"

namespace coderun {

struct TimeRange {
  Timestamp start = std::chrono::system_clock::now();
  std::optional<Timestamp> end;
};

// File attached to a completed tool result
struct Attachment {
  std::string id;
  std::string mime;
  std::string filename;
  std::string url;
};

// Message part types. Every part carries its own identity plus the ids of
// the message and session that own it.
struct TextPart {
  PartId id;
  MessageId message_id;
  SessionId session_id;
  std::string text;
  bool synthetic = false;
  std::optional<TimeRange> time;
  json metadata;
};

struct ReasoningPart {
  PartId id;
  MessageId message_id;
  SessionId session_id;
  std::string text;
  TimeRange time;
  json metadata;
};

// Tool part states: pending -> running -> completed | error
struct ToolStatePending {
  json input = json::object();
  std::string raw;
};

struct ToolStateRunning {
  json input = json::object();
  std::optional<std::string> title;
  json metadata;
  Timestamp start = std::chrono::system_clock::now();
};

struct ToolStateCompleted {
  json input = json::object();
  std::string output;
  std::string title;
  json metadata;
  std::vector<Attachment> attachments;
  Timestamp start;
  Timestamp end;
};

struct ToolStateError {
  json input = json::object();
  std::string error;
  json metadata;
  Timestamp start;
  Timestamp end;
};

using ToolState = std::variant<ToolStatePending, ToolStateRunning, ToolStateCompleted, ToolStateError>;

enum class ToolStatus { Pending, Running, Completed, Error };

std::string to_string(ToolStatus status);

struct ToolPart {
  PartId id;
  MessageId message_id;
  SessionId session_id;
  CallId call_id;
  std::string tool;
  ToolState state;
  json metadata;

  ToolStatus status() const;

  // Input recorded by whichever state the part is in
  const json& input() const;

  bool is_finalized() const {
    auto s = status();
    return s == ToolStatus::Completed || s == ToolStatus::Error;
  }
};

struct StepStartPart {
  PartId id;
  MessageId message_id;
  SessionId session_id;
  std::optional<std::string> snapshot;
};

struct StepFinishPart {
  PartId id;
  MessageId message_id;
  SessionId session_id;
  std::string reason;
  std::optional<std::string> snapshot;
  double cost = 0;
  Tokens tokens;
};

struct PatchPart {
  PartId id;
  MessageId message_id;
  SessionId session_id;
  std::string hash;
  std::vector<std::string> files;
};

using Part = std::variant<TextPart, ReasoningPart, ToolPart, StepStartPart, StepFinishPart, PatchPart>;

// Accessors common to every part alternative
const PartId& part_id(const Part& part);
const MessageId& part_message_id(const Part& part);
std::string part_type(const Part& part);

json part_to_json(const Part& part);
Part part_from_json(const json& j);

// One assistant turn's output envelope
class AssistantMessage {
 public:
  AssistantMessage() = default;
  AssistantMessage(SessionId session_id, MessageId parent_id);

  const MessageId& id() const {
    return id_;
  }

  const SessionId& session_id() const {
    return session_id_;
  }

  const MessageId& parent_id() const {
    return parent_id_;
  }

  const std::string& provider_id() const {
    return provider_id_;
  }

  const std::string& model_id() const {
    return model_id_;
  }

  void set_model(const std::string& provider_id, const std::string& model_id) {
    provider_id_ = provider_id;
    model_id_ = model_id;
  }

  const std::string& agent() const {
    return agent_;
  }

  void set_agent(const std::string& agent) {
    agent_ = agent;
  }

  const std::optional<FinishReason>& finish() const {
    return finish_;
  }

  void set_finish(FinishReason reason) {
    finish_ = reason;
  }

  // Cost and tokens only accumulate
  double cost() const {
    return cost_;
  }

  void add_cost(double cost);

  const Tokens& tokens() const {
    return tokens_;
  }

  void add_tokens(const Tokens& tokens);

  // The error is terminal: a second call keeps the first error and returns false
  const std::optional<MessageError>& error() const {
    return error_;
  }

  bool set_error(MessageError error);

  Timestamp created_at() const {
    return created_at_;
  }

  const std::optional<Timestamp>& completed_at() const {
    return completed_at_;
  }

  void set_completed(Timestamp at) {
    completed_at_ = at;
  }

  json to_json() const;
  static AssistantMessage from_json(const json& j);

 private:
  MessageId id_;
  SessionId session_id_;
  MessageId parent_id_;
  std::string provider_id_;
  std::string model_id_;
  std::string agent_ = "build";

  std::optional<FinishReason> finish_;
  double cost_ = 0;
  Tokens tokens_;
  std::optional<MessageError> error_;

  Timestamp created_at_ = std::chrono::system_clock::now();
  std::optional<Timestamp> completed_at_;
};

}  // namespace coderun

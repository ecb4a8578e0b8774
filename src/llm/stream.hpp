#pragma once

#include <exception>
#include <string>
#include <variant>
#include <vector>

#include "core/message.hpp"
#include "core/types.hpp"

namespace coderun::llm {

// Typed events produced by a model stream

struct Start {};

struct StartStep {};

struct TextStart {
  std::string id;
  json metadata;
};

struct TextDelta {
  std::string id;
  std::string text;
  json metadata;
};

struct TextEnd {
  std::string id;
  json metadata;
};

struct ReasoningStart {
  std::string id;
  json metadata;
};

struct ReasoningDelta {
  std::string id;
  std::string text;
  json metadata;
};

struct ReasoningEnd {
  std::string id;
  json metadata;
};

struct ToolInputStart {
  CallId id;
  std::string tool;
};

struct ToolInputDelta {
  CallId id;
  std::string delta;
};

struct ToolInputEnd {
  CallId id;
};

// Arguments are complete and the tool is about to run
struct ToolCall {
  CallId id;
  std::string tool;
  json input;
  json metadata;
};

struct ToolOutput {
  std::string output;
  std::string title;
  json metadata;
  std::vector<Attachment> attachments;
};

struct ToolResult {
  CallId id;
  ToolOutput output;
  json input;
};

struct ToolError {
  CallId id;
  std::exception_ptr error;
  json input;
};

// Stream-level failure; the consumer rethrows it
struct ErrorEvent {
  std::exception_ptr error;
};

struct FinishStep {
  FinishReason finish_reason = FinishReason::Unknown;
  json usage;  // raw provider usage: inputTokens, outputTokens, reasoningTokens, cachedInputTokens
  json provider_metadata;
};

struct Finish {
  FinishReason finish_reason = FinishReason::Unknown;
};

// Anything the decoder does not recognize
struct Unknown {
  std::string type;
  json raw;
};

using StreamEvent = std::variant<Start, StartStep, TextStart, TextDelta, TextEnd, ReasoningStart, ReasoningDelta, ReasoningEnd,
                                 ToolInputStart, ToolInputDelta, ToolInputEnd, ToolCall, ToolResult, ToolError, ErrorEvent,
                                 FinishStep, Finish, Unknown>;

// Wire name of an event ("text-delta", "finish-step", ...)
std::string event_type(const StreamEvent& event);

// Decode one event from its JSON form. Errors are described as
// {"name": "ProviderError", "kind": "transient", "message": ..., "status": 503, "headers": {...}}
// or {"name": "PermissionRejectedError", "message": ...}.
StreamEvent event_from_json(const json& j);

// Build the exception described by an error object
std::exception_ptr error_from_json(const json& j);

}  // namespace coderun::llm

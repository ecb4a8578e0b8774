#include "llm/stream.hpp"

#include "core/errors.hpp"

namespace coderun::llm {

std::string event_type(const StreamEvent& event) {
  return std::visit(
      [](const auto& e) -> std::string {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, Start>) {
          return "start";
        } else if constexpr (std::is_same_v<T, StartStep>) {
          return "start-step";
        } else if constexpr (std::is_same_v<T, TextStart>) {
          return "text-start";
        } else if constexpr (std::is_same_v<T, TextDelta>) {
          return "text-delta";
        } else if constexpr (std::is_same_v<T, TextEnd>) {
          return "text-end";
        } else if constexpr (std::is_same_v<T, ReasoningStart>) {
          return "reasoning-start";
        } else if constexpr (std::is_same_v<T, ReasoningDelta>) {
          return "reasoning-delta";
        } else if constexpr (std::is_same_v<T, ReasoningEnd>) {
          return "reasoning-end";
        } else if constexpr (std::is_same_v<T, ToolInputStart>) {
          return "tool-input-start";
        } else if constexpr (std::is_same_v<T, ToolInputDelta>) {
          return "tool-input-delta";
        } else if constexpr (std::is_same_v<T, ToolInputEnd>) {
          return "tool-input-end";
        } else if constexpr (std::is_same_v<T, ToolCall>) {
          return "tool-call";
        } else if constexpr (std::is_same_v<T, ToolResult>) {
          return "tool-result";
        } else if constexpr (std::is_same_v<T, ToolError>) {
          return "tool-error";
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          return "error";
        } else if constexpr (std::is_same_v<T, FinishStep>) {
          return "finish-step";
        } else if constexpr (std::is_same_v<T, Finish>) {
          return "finish";
        } else {
          return e.type;
        }
      },
      event);
}

std::exception_ptr error_from_json(const json& j) {
  if (j.is_string()) {
    return std::make_exception_ptr(std::runtime_error(j.get<std::string>()));
  }

  std::string name = j.value("name", "Error");
  std::string message = j.value("message", "");

  if (name == "ProviderError") {
    std::optional<int> status;
    if (j.contains("status")) {
      status = j["status"].get<int>();
    }
    std::map<std::string, std::string> headers;
    if (j.contains("headers")) {
      for (auto& [k, v] : j["headers"].items()) {
        headers[k] = v.get<std::string>();
      }
    }
    return std::make_exception_ptr(
        ProviderError(provider_error_kind_from_string(j.value("kind", "terminal")), message, status, headers, j.value("body", "")));
  }
  if (name == "PermissionRejectedError") {
    return std::make_exception_ptr(PermissionRejectedError(j.value("permission", "")));
  }
  if (name == "PermissionDeniedError") {
    return std::make_exception_ptr(PermissionDeniedError(j.value("permission", "")));
  }
  if (name == "QuestionRejectedError") {
    return std::make_exception_ptr(QuestionRejectedError());
  }
  if (name == "StreamIdleTimeoutError") {
    return std::make_exception_ptr(StreamIdleTimeoutError(std::chrono::milliseconds(j.value("timeout_ms", int64_t(60000)))));
  }
  if (name == "AbortError") {
    return std::make_exception_ptr(AbortError());
  }
  return std::make_exception_ptr(std::runtime_error(message));
}

namespace {

ToolOutput tool_output_from_json(const json& j) {
  ToolOutput out;
  if (j.is_string()) {
    out.output = j.get<std::string>();
    return out;
  }
  out.output = j.value("output", "");
  out.title = j.value("title", "");
  out.metadata = j.value("metadata", json::object());
  for (const auto& a : j.value("attachments", json::array())) {
    out.attachments.push_back({a.value("id", ""), a.value("mime", ""), a.value("filename", ""), a.value("url", "")});
  }
  return out;
}

}  // namespace

StreamEvent event_from_json(const json& j) {
  std::string type = j.value("type", "");

  if (type == "start") return Start{};
  if (type == "start-step") return StartStep{};

  if (type == "text-start") return TextStart{j.value("id", ""), j.value("providerMetadata", json())};
  if (type == "text-delta") return TextDelta{j.value("id", ""), j.value("text", ""), j.value("providerMetadata", json())};
  if (type == "text-end") return TextEnd{j.value("id", ""), j.value("providerMetadata", json())};

  if (type == "reasoning-start") return ReasoningStart{j.value("id", ""), j.value("providerMetadata", json())};
  if (type == "reasoning-delta") return ReasoningDelta{j.value("id", ""), j.value("text", ""), j.value("providerMetadata", json())};
  if (type == "reasoning-end") return ReasoningEnd{j.value("id", ""), j.value("providerMetadata", json())};

  if (type == "tool-input-start") return ToolInputStart{j.value("id", ""), j.value("toolName", "")};
  if (type == "tool-input-delta") return ToolInputDelta{j.value("id", ""), j.value("delta", "")};
  if (type == "tool-input-end") return ToolInputEnd{j.value("id", "")};

  if (type == "tool-call") {
    return ToolCall{j.value("toolCallId", ""), j.value("toolName", ""), j.value("input", json::object()), j.value("providerMetadata", json())};
  }
  if (type == "tool-result") {
    return ToolResult{j.value("toolCallId", ""), tool_output_from_json(j.value("output", json::object())), j.value("input", json())};
  }
  if (type == "tool-error") {
    return ToolError{j.value("toolCallId", ""), error_from_json(j.value("error", json("Tool failed"))), j.value("input", json())};
  }
  if (type == "error") {
    return ErrorEvent{error_from_json(j.value("error", json("Stream error")))};
  }

  if (type == "finish-step") {
    return FinishStep{finish_reason_from_string(j.value("finishReason", "unknown")), j.value("usage", json::object()),
                      j.value("providerMetadata", json::object())};
  }
  if (type == "finish") {
    return Finish{finish_reason_from_string(j.value("finishReason", "unknown"))};
  }

  return Unknown{type, j};
}

}  // namespace coderun::llm

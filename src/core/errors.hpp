#pragma once

#include <chrono>
#include <exception>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

#include "core/types.hpp"

namespace coderun {

// Thrown at any suspension point once the turn's abort signal fired
class AbortError : public std::runtime_error {
 public:
  AbortError() : std::runtime_error("Aborted") {}
};

// The stream produced no event within the idle deadline
class StreamIdleTimeoutError : public std::runtime_error {
 public:
  explicit StreamIdleTimeoutError(std::chrono::milliseconds timeout);

  std::chrono::milliseconds timeout() const {
    return timeout_;
  }

 private:
  std::chrono::milliseconds timeout_;
};

// Failure reported by a model provider
class ProviderError : public std::runtime_error {
 public:
  enum class Kind {
    Transient,        // network, 5xx, rate limit
    Terminal,         // invalid request, unsupported
    Auth,             // missing or rejected credentials
    ContextOverflow,  // prompt exceeds the model's context window
  };

  ProviderError(Kind kind, const std::string& message, std::optional<int> status_code = std::nullopt,
                std::map<std::string, std::string> response_headers = {}, std::string response_body = "");

  Kind kind() const {
    return kind_;
  }

  std::optional<int> status_code() const {
    return status_code_;
  }

  const std::map<std::string, std::string>& response_headers() const {
    return response_headers_;
  }

  const std::string& response_body() const {
    return response_body_;
  }

  bool is_retryable() const {
    return kind_ == Kind::Transient;
  }

 private:
  Kind kind_;
  std::optional<int> status_code_;
  std::map<std::string, std::string> response_headers_;
  std::string response_body_;
};

std::string to_string(ProviderError::Kind kind);
ProviderError::Kind provider_error_kind_from_string(const std::string& str);

// The user rejected an approval request (tool permission or doom loop)
class PermissionRejectedError : public std::runtime_error {
 public:
  explicit PermissionRejectedError(const std::string& permission)
      : std::runtime_error("The user rejected permission to use this specific tool call: " + permission) {}
};

// A configured rule denied the request without asking
class PermissionDeniedError : public std::runtime_error {
 public:
  explicit PermissionDeniedError(const std::string& permission)
      : std::runtime_error("A rule prevents you from using this specific tool call: " + permission) {}
};

// The user dismissed a question asked by a tool
class QuestionRejectedError : public std::runtime_error {
 public:
  QuestionRejectedError() : std::runtime_error("The user dismissed this question") {}
};

// Persisted error recorded on an assistant message
struct MessageError {
  std::string name;  // MessageAbortedError, ProviderAuthError, APIError, ContextOverflowError, UnknownError
  std::string message;
  bool retryable = false;
  std::optional<int> status_code;
  std::map<std::string, std::string> response_headers;
  std::optional<std::string> response_body;
  json metadata = json::object();

  json to_json() const;
  static MessageError from_json(const json& j);
};

namespace errors {

// Convert a caught exception into the persisted error form
MessageError from_exception(const std::exception_ptr& error, const std::string& provider_id);

// Approval rejections end the turn as "blocked"
bool is_rejection(const std::exception_ptr& error);

// Human readable text of any exception
std::string describe(const std::exception_ptr& error);

}  // namespace errors

}  // namespace coderun

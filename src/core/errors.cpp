#include "core/errors.hpp"

namespace coderun {

StreamIdleTimeoutError::StreamIdleTimeoutError(std::chrono::milliseconds timeout)
    : std::runtime_error("Stream idle timeout: no data received for " + std::to_string(timeout.count()) + "ms"), timeout_(timeout) {}

ProviderError::ProviderError(Kind kind, const std::string& message, std::optional<int> status_code,
                             std::map<std::string, std::string> response_headers, std::string response_body)
    : std::runtime_error(message),
      kind_(kind),
      status_code_(status_code),
      response_headers_(std::move(response_headers)),
      response_body_(std::move(response_body)) {}

std::string to_string(ProviderError::Kind kind) {
  switch (kind) {
    case ProviderError::Kind::Transient:
      return "transient";
    case ProviderError::Kind::Terminal:
      return "terminal";
    case ProviderError::Kind::Auth:
      return "auth";
    case ProviderError::Kind::ContextOverflow:
      return "context_overflow";
  }
  return "terminal";
}

ProviderError::Kind provider_error_kind_from_string(const std::string& str) {
  if (str == "transient") return ProviderError::Kind::Transient;
  if (str == "auth") return ProviderError::Kind::Auth;
  if (str == "context_overflow") return ProviderError::Kind::ContextOverflow;
  return ProviderError::Kind::Terminal;
}

json MessageError::to_json() const {
  json j;
  j["name"] = name;
  j["message"] = message;
  j["retryable"] = retryable;
  if (status_code) {
    j["status_code"] = *status_code;
  }
  if (!response_headers.empty()) {
    j["response_headers"] = response_headers;
  }
  if (response_body) {
    j["response_body"] = *response_body;
  }
  j["metadata"] = metadata;
  return j;
}

MessageError MessageError::from_json(const json& j) {
  MessageError error;
  error.name = j.value("name", "UnknownError");
  error.message = j.value("message", "");
  error.retryable = j.value("retryable", false);
  if (j.contains("status_code")) {
    error.status_code = j["status_code"].get<int>();
  }
  if (j.contains("response_headers")) {
    error.response_headers = j["response_headers"].get<std::map<std::string, std::string>>();
  }
  if (j.contains("response_body")) {
    error.response_body = j["response_body"].get<std::string>();
  }
  error.metadata = j.value("metadata", json::object());
  return error;
}

namespace errors {

MessageError from_exception(const std::exception_ptr& error, const std::string& provider_id) {
  MessageError result;
  result.metadata["providerID"] = provider_id;

  if (!error) {
    result.name = "UnknownError";
    return result;
  }

  try {
    std::rethrow_exception(error);
  } catch (const AbortError& e) {
    result.name = "MessageAbortedError";
    result.message = e.what();
  } catch (const StreamIdleTimeoutError& e) {
    result.name = "APIError";
    result.message = e.what();
    result.retryable = true;
    result.metadata["timeoutMs"] = std::to_string(e.timeout().count());
  } catch (const ProviderError& e) {
    switch (e.kind()) {
      case ProviderError::Kind::Auth:
        result.name = "ProviderAuthError";
        break;
      case ProviderError::Kind::ContextOverflow:
        result.name = "ContextOverflowError";
        break;
      case ProviderError::Kind::Transient:
      case ProviderError::Kind::Terminal:
        result.name = "APIError";
        break;
    }
    result.message = e.what();
    result.retryable = e.is_retryable();
    result.status_code = e.status_code();
    result.response_headers = e.response_headers();
    if (!e.response_body().empty()) {
      result.response_body = e.response_body();
    }
  } catch (const std::exception& e) {
    result.name = "UnknownError";
    result.message = e.what();
  }

  return result;
}

bool is_rejection(const std::exception_ptr& error) {
  if (!error) return false;
  try {
    std::rethrow_exception(error);
  } catch (const PermissionRejectedError&) {
    return true;
  } catch (const QuestionRejectedError&) {
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

std::string describe(const std::exception_ptr& error) {
  if (!error) return "";
  try {
    std::rethrow_exception(error);
  } catch (const std::exception& e) {
    return e.what();
  }
}

}  // namespace errors

}  // namespace coderun

#include "session/retry.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace coderun {

namespace {

// Clamp in the floating-point domain; converting an out-of-range double is undefined
std::chrono::milliseconds clamp_delay(double ms) {
  if (std::isnan(ms) || ms <= 0) {
    return std::chrono::milliseconds(0);
  }
  if (ms >= static_cast<double>(retry::kMaxDelay.count())) {
    return retry::kMaxDelay;
  }
  return std::chrono::milliseconds(static_cast<int64_t>(ms));
}

std::optional<double> parse_number(const std::string &value) {
  try {
    size_t consumed = 0;
    double parsed = std::stod(value, &consumed);
    if (consumed == 0 || !std::isfinite(parsed)) {
      return std::nullopt;
    }
    return parsed;
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

std::optional<std::string> header(const std::map<std::string, std::string> &headers, const std::string &name) {
  for (const auto &[key, value] : headers) {
    if (key.size() != name.size()) continue;
    bool equal = true;
    for (size_t i = 0; i < key.size(); ++i) {
      if (std::tolower(static_cast<unsigned char>(key[i])) != name[i]) {
        equal = false;
        break;
      }
    }
    if (equal) return value;
  }
  return std::nullopt;
}

bool contains(const json &j, const char *key, const std::string &needle) {
  return j.is_object() && j.contains(key) && j[key].is_string() && j[key].get<std::string>().find(needle) != std::string::npos;
}

// Provider error bodies that arrive as JSON text in the message
std::optional<std::string> classify_json_message(const std::string &message) {
  json body = json::parse(message, nullptr, false);
  if (body.is_discarded() || !body.is_object()) {
    return std::nullopt;
  }

  bool is_error = body.value("type", "") == "error";
  const json error = body.value("error", json());

  if (is_error && error.is_object() && error.value("type", "") == "too_many_requests") {
    return "Too Many Requests";
  }
  if (!body.contains("code") || !body["code"].is_string()) {
    return std::nullopt;
  }
  if (contains(body, "code", "exhausted") || contains(body, "code", "unavailable")) {
    return "Provider is overloaded";
  }
  if (is_error && contains(error, "code", "rate_limit")) {
    return "Rate Limited";
  }
  if (contains(error, "message", "no_kv_space") || (is_error && error.is_object() && error.value("type", "") == "server_error") ||
      !error.is_null()) {
    return "Provider Server Error";
  }
  return body.dump();
}

std::optional<std::chrono::milliseconds> idle_timeout_of(const std::exception_ptr &error) {
  if (!error) return std::nullopt;
  try {
    std::rethrow_exception(error);
  } catch (const StreamIdleTimeoutError &e) {
    return e.timeout();
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

}  // namespace

namespace retry {

std::optional<Timestamp> parse_http_date(const std::string &value) {
  std::tm tm{};
  std::istringstream ss(value);
  ss >> std::get_time(&tm, "%a, %d %b %Y %H:%M:%S");
  if (ss.fail()) {
    return std::nullopt;
  }
  auto seconds = timegm(&tm);
  if (seconds == -1) {
    return std::nullopt;
  }
  return std::chrono::system_clock::from_time_t(seconds);
}

}  // namespace retry

SessionRetry::SessionRetry(Config::Retry config) : config_(config) {}

std::optional<std::string> SessionRetry::retryable(const MessageError &error) {
  if (error.name == "ContextOverflowError" || error.name == "MessageAbortedError" || error.name == "ProviderAuthError") {
    return std::nullopt;
  }
  if (error.name == "APIError") {
    if (!error.retryable) {
      return std::nullopt;
    }
    if (error.message.find("Overloaded") != std::string::npos) {
      return "Provider is overloaded";
    }
    return error.message;
  }
  return classify_json_message(error.message);
}

std::chrono::milliseconds SessionRetry::delay(int attempt, const MessageError *hint) {
  auto exponential = [&] {
    double ms = static_cast<double>(config_.initial_delay.count()) * std::pow(config_.backoff_factor, std::max(attempt - 1, 0));
    return clamp_delay(ms);
  };

  if (hint && !hint->response_headers.empty()) {
    const auto &headers = hint->response_headers;

    if (auto retry_after_ms = header(headers, "retry-after-ms")) {
      if (auto parsed = parse_number(*retry_after_ms)) {
        return clamp_delay(*parsed);
      }
    }

    if (auto retry_after = header(headers, "retry-after")) {
      if (auto seconds = parse_number(*retry_after)) {
        return clamp_delay(std::ceil(*seconds * 1000));
      }
      if (auto date = retry::parse_http_date(*retry_after)) {
        auto until = std::chrono::duration_cast<std::chrono::milliseconds>(*date - std::chrono::system_clock::now());
        if (until.count() > 0) {
          return clamp_delay(static_cast<double>(until.count()));
        }
      }
    }

    return exponential();
  }

  return std::min(exponential(), config_.max_delay_no_headers);
}

void SessionRetry::sleep(std::chrono::milliseconds duration, AbortSignal &abort) {
  spdlog::debug("[Retry] Sleeping {}ms", duration.count());
  if (abort.wait_for(duration)) {
    throw AbortError();
  }
}

// --- RetryPolicy ---

RetryPolicy::RetryPolicy(Config::Retry config, RetryBackoff &backoff) : config_(config), backoff_(backoff) {}

RetryPolicy::Decision RetryPolicy::on_idle_timeout(std::chrono::milliseconds timeout, const std::string &provider_id) {
  Decision decision;
  auto timeout_ms = timeout.count();

  if (idle_timeout_retries_ >= config_.max_idle_timeout_retries) {
    int timeouts = idle_timeout_retries_ + 1;
    decision.action = Action::Fail;
    decision.attempt = idle_timeout_retries_;
    decision.error.name = "UnknownError";
    decision.error.message = "Stream timed out " + std::to_string(timeouts) + " times after " + std::to_string(idle_timeout_retries_) +
                             " retries (" + std::to_string(timeout_ms) +
                             "ms idle). The model may be generating content that exceeds output limits or the connection is "
                             "unstable. Try breaking the task into smaller pieces or check your network connection.";
    decision.error.metadata = {{"providerID", provider_id}, {"retries", idle_timeout_retries_}, {"timeoutMs", timeout_ms}};
    spdlog::error("[Retry] Giving up after {} idle timeout retries", idle_timeout_retries_);
    return decision;
  }

  ++idle_timeout_retries_;
  decision.action = Action::Retry;
  decision.attempt = idle_timeout_retries_;
  decision.message = "Stream idle timeout (attempt " + std::to_string(idle_timeout_retries_) + "/" +
                     std::to_string(config_.max_idle_timeout_retries) + ")";
  decision.delay = backoff_.delay(idle_timeout_retries_);
  spdlog::warn("[Retry] {} after {}ms idle, retrying in {}ms", decision.message, timeout_ms, decision.delay.count());
  return decision;
}

RetryPolicy::Decision RetryPolicy::on_failure(const std::exception_ptr &error, const std::string &provider_id) {
  if (auto timeout = idle_timeout_of(error)) {
    return on_idle_timeout(*timeout, provider_id);
  }

  Decision decision;
  decision.error = errors::from_exception(error, provider_id);

  auto message = backoff_.retryable(decision.error);
  if (!message) {
    decision.action = Action::Fail;
    decision.attempt = attempt_;
    spdlog::error("[Retry] {} is not retryable: {}", decision.error.name, decision.error.message);
    return decision;
  }

  ++attempt_;
  decision.action = Action::Retry;
  decision.attempt = attempt_;
  decision.message = *message;
  decision.delay = backoff_.delay(attempt_, decision.error.name == "APIError" ? &decision.error : nullptr);
  spdlog::warn("[Retry] {} (attempt {}), retrying in {}ms", decision.message, attempt_, decision.delay.count());
  return decision;
}

}  // namespace coderun

#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "core/abort.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"

namespace coderun {

// Backoff policy consulted when a stream attempt fails
class RetryBackoff {
 public:
  virtual ~RetryBackoff() = default;

  // Status message when the error is worth retrying, nullopt when terminal
  virtual std::optional<std::string> retryable(const MessageError &error) = 0;

  // Delay before the given attempt (1-based); hint carries provider headers
  virtual std::chrono::milliseconds delay(int attempt, const MessageError *hint = nullptr) = 0;

  // Throws AbortError when the signal fires first
  virtual void sleep(std::chrono::milliseconds duration, AbortSignal &abort) = 0;
};

// Exponential backoff honouring retry-after-ms / retry-after headers
class SessionRetry : public RetryBackoff {
 public:
  explicit SessionRetry(Config::Retry config = {});

  std::optional<std::string> retryable(const MessageError &error) override;
  std::chrono::milliseconds delay(int attempt, const MessageError *hint = nullptr) override;
  void sleep(std::chrono::milliseconds duration, AbortSignal &abort) override;

 private:
  Config::Retry config_;
};

// Turn-scoped retry decisions. Idle timeouts have their own counter and
// cap; every other failure goes through the backoff policy.
class RetryPolicy {
 public:
  enum class Action { Retry, Fail };

  struct Decision {
    Action action = Action::Fail;
    int attempt = 0;  // counter value reported in the retry status
    std::string message;
    std::chrono::milliseconds delay{0};
    MessageError error;  // recorded on the message when failing
  };

  RetryPolicy(Config::Retry config, RetryBackoff &backoff);

  Decision on_failure(const std::exception_ptr &error, const std::string &provider_id);

  int attempt() const {
    return attempt_;
  }

  int idle_timeout_retries() const {
    return idle_timeout_retries_;
  }

 private:
  Decision on_idle_timeout(std::chrono::milliseconds timeout, const std::string &provider_id);

  Config::Retry config_;
  RetryBackoff &backoff_;

  int attempt_ = 0;
  int idle_timeout_retries_ = 0;
};

namespace retry {

// Upper bound of any single backoff (2^31 - 1 ms)
constexpr std::chrono::milliseconds kMaxDelay{2147483647};

// Parse an HTTP date ("Wed, 21 Oct 2015 07:28:00 GMT")
std::optional<Timestamp> parse_http_date(const std::string &value);

}  // namespace retry

}  // namespace coderun

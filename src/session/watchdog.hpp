#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>

#include "core/abort.hpp"
#include "core/channel.hpp"
#include "core/errors.hpp"

namespace coderun {

enum class WatchStatus {
  Event,  // an element arrived
  Done,   // the source was closed and drained
  Tick,   // the caller's wake time passed first; the idle deadline is untouched
};

template <typename T>
struct Watched {
  WatchStatus status;
  std::optional<T> value;
};

// Liveness wrapper around a Channel. Each wait for the next element races
// the idle deadline; the deadline is rearmed from the timeout function's
// current value before the first wait and after every delivered element.
// A timeout of zero disables the deadline.
template <typename T>
class IdleWatchdog {
 public:
  using Clock = std::chrono::steady_clock;
  using TimeoutFn = std::function<std::chrono::milliseconds()>;

  IdleWatchdog(Channel<T> &source, TimeoutFn timeout_fn, std::shared_ptr<AbortSignal> abort)
      : source_(source), timeout_fn_(std::move(timeout_fn)), abort_(std::move(abort)) {}

  // Throws AbortError once the signal fired (checked before the deadline)
  // and StreamIdleTimeoutError when the deadline passes without an element.
  Watched<T> next(std::optional<Clock::time_point> wake_at = std::nullopt) {
    if (abort_ && abort_->aborted()) {
      throw AbortError();
    }

    if (!armed_) {
      rearm();
    }

    auto wait_until = deadline_;
    if (wake_at && (!wait_until || *wake_at < *wait_until)) {
      wait_until = wake_at;
    }

    auto received = source_.receive_until(wait_until, abort_.get());
    switch (received.status) {
      case Channel<T>::Status::Aborted:
        throw AbortError();
      case Channel<T>::Status::Value:
        armed_ = false;
        return {WatchStatus::Event, std::move(received.value)};
      case Channel<T>::Status::Closed:
        return {WatchStatus::Done, std::nullopt};
      case Channel<T>::Status::Timeout:
        break;
    }

    if (deadline_ && Clock::now() >= *deadline_) {
      throw StreamIdleTimeoutError(timeout_);
    }
    return {WatchStatus::Tick, std::nullopt};
  }

  // Timeout the current deadline was armed with
  std::chrono::milliseconds current_timeout() const {
    return timeout_;
  }

  std::optional<Clock::time_point> deadline() const {
    return deadline_;
  }

 private:
  void rearm() {
    timeout_ = timeout_fn_ ? timeout_fn_() : std::chrono::milliseconds(0);
    if (timeout_.count() > 0) {
      deadline_ = Clock::now() + timeout_;
    } else {
      deadline_.reset();
    }
    armed_ = true;
  }

  Channel<T> &source_;
  TimeoutFn timeout_fn_;
  std::shared_ptr<AbortSignal> abort_;

  bool armed_ = false;
  std::chrono::milliseconds timeout_{0};
  std::optional<Clock::time_point> deadline_;
};

}  // namespace coderun

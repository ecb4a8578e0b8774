#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>

#include "core/abort.hpp"

namespace coderun {

// Unbounded multi-producer queue with a single blocking consumer.
// Producers (provider callbacks) may run on any thread.
template <typename T>
class Channel {
 public:
  using Clock = std::chrono::steady_clock;

  enum class Status { Value, Closed, Timeout, Aborted };

  struct Received {
    Status status;
    std::optional<T> value;
  };

  Channel() : state_(std::make_shared<State>()) {}

  // Ignored once closed
  void push(T value) {
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      if (state_->closed) return;
      state_->queue.push_back(std::move(value));
    }
    state_->cv.notify_one();
  }

  // Queued values are still delivered before Closed
  void close() {
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      state_->closed = true;
    }
    state_->cv.notify_all();
  }

  bool closed() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->closed;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->queue.size();
  }

  // Wait for the next value until the deadline or abort, whichever comes first
  Received receive_until(std::optional<Clock::time_point> deadline, AbortSignal* abort = nullptr) {
    std::weak_ptr<State> weak = state_;
    AbortSignal::Subscription subscription(abort, [weak] {
      if (auto state = weak.lock()) {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->cv.notify_all();
      }
    });

    std::unique_lock<std::mutex> lock(state_->mutex);
    auto ready = [this, abort] {
      return !state_->queue.empty() || state_->closed || (abort && abort->aborted());
    };

    if (deadline) {
      state_->cv.wait_until(lock, *deadline, ready);
    } else {
      state_->cv.wait(lock, ready);
    }

    if (abort && abort->aborted()) {
      return {Status::Aborted, std::nullopt};
    }
    if (!state_->queue.empty()) {
      Received received{Status::Value, std::move(state_->queue.front())};
      state_->queue.pop_front();
      return received;
    }
    if (state_->closed) {
      return {Status::Closed, std::nullopt};
    }
    return {Status::Timeout, std::nullopt};
  }

  Received receive(AbortSignal* abort = nullptr) {
    return receive_until(std::nullopt, abort);
  }

 private:
  struct State {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<T> queue;
    bool closed = false;
  };

  std::shared_ptr<State> state_;
};

}  // namespace coderun

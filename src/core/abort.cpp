#include "core/abort.hpp"

#include <vector>

#include "core/errors.hpp"

namespace coderun {

void AbortSignal::abort() {
  std::vector<Listener> to_call;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (aborted_.exchange(true)) return;
    for (auto& [id, listener] : listeners_) {
      to_call.push_back(std::move(listener));
    }
    listeners_.clear();
  }
  cv_.notify_all();

  // Call listeners outside the lock
  for (const auto& listener : to_call) {
    listener();
  }
}

void AbortSignal::throw_if_aborted() const {
  if (aborted_.load()) {
    throw AbortError();
  }
}

AbortSignal::ListenerId AbortSignal::add_listener(Listener listener) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!aborted_.load()) {
      auto id = next_id_++;
      listeners_[id] = std::move(listener);
      return id;
    }
  }
  listener();
  return 0;
}

void AbortSignal::remove_listener(ListenerId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  listeners_.erase(id);
}

bool AbortSignal::wait_for(std::chrono::milliseconds duration) {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, duration, [this] {
    return aborted_.load();
  });
}

AbortSignal::Subscription::Subscription(AbortSignal* signal, Listener listener) : signal_(signal) {
  if (signal_) {
    id_ = signal_->add_listener(std::move(listener));
  }
}

AbortSignal::Subscription::~Subscription() {
  if (signal_ && id_ != 0) {
    signal_->remove_listener(id_);
  }
}

}  // namespace coderun

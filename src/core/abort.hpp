#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace coderun {

// Cooperative cancellation shared by everything a turn waits on.
// Listeners run once, on the thread that calls abort().
class AbortSignal {
 public:
  using Listener = std::function<void()>;
  using ListenerId = uint64_t;

  static std::shared_ptr<AbortSignal> create() {
    return std::make_shared<AbortSignal>();
  }

  void abort();

  bool aborted() const {
    return aborted_.load();
  }

  // Throws AbortError once aborted
  void throw_if_aborted() const;

  // Listener is invoked immediately if the signal already fired
  ListenerId add_listener(Listener listener);

  void remove_listener(ListenerId id);

  // Sleep for the given duration; returns true if woken by abort()
  bool wait_for(std::chrono::milliseconds duration);

  // Removes its listener when destroyed
  class Subscription {
   public:
    Subscription(AbortSignal* signal, Listener listener);
    ~Subscription();

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

   private:
    AbortSignal* signal_;
    ListenerId id_ = 0;
  };

 private:
  std::atomic<bool> aborted_{false};

  std::mutex mutex_;
  std::condition_variable cv_;
  ListenerId next_id_ = 1;
  std::map<ListenerId, Listener> listeners_;
};

}  // namespace coderun

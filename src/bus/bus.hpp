#pragma once

#include <any>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <typeindex>
#include <vector>

#include "core/message.hpp"

namespace coderun {

// Type-safe event bus for broadcasting turn progress
class Bus {
 public:
  using SubscriptionId = uint64_t;

  static Bus &instance();

  // Subscribe to events of type T
  template <typename T>
  SubscriptionId subscribe(std::function<void(const T &)> handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto id = next_id_++;
    auto type_idx = std::type_index(typeid(T));

    handlers_[type_idx].push_back({id, [handler](const std::any &event) {
                                     handler(std::any_cast<const T &>(event));
                                   }});

    return id;
  }

  // Unsubscribe
  void unsubscribe(SubscriptionId id);

  // Publish an event
  template <typename T>
  void publish(const T &event) {
    std::vector<std::function<void(const std::any &)>> to_call;

    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto type_idx = std::type_index(typeid(T));
      auto it = handlers_.find(type_idx);
      if (it != handlers_.end()) {
        for (const auto &entry : it->second) {
          to_call.push_back(entry.handler);
        }
      }
    }

    // Call handlers outside the lock
    std::any wrapped = event;
    for (const auto &handler : to_call) {
      handler(wrapped);
    }
  }

 private:
  Bus() = default;

  struct HandlerEntry {
    SubscriptionId id;
    std::function<void(const std::any &)> handler;
  };

  std::mutex mutex_;
  SubscriptionId next_id_ = 1;
  std::map<std::type_index, std::vector<HandlerEntry>> handlers_;
};

// Unsubscribes when destroyed
class ScopedSubscription {
 public:
  ScopedSubscription() = default;
  explicit ScopedSubscription(Bus::SubscriptionId id) : id_(id) {}
  ~ScopedSubscription();

  ScopedSubscription(const ScopedSubscription &) = delete;
  ScopedSubscription &operator=(const ScopedSubscription &) = delete;

  ScopedSubscription(ScopedSubscription &&other) noexcept;
  ScopedSubscription &operator=(ScopedSubscription &&other) noexcept;

  void reset();

 private:
  Bus::SubscriptionId id_ = 0;
};

// Broadcast events
namespace events {

// A part was created or changed; delta carries only the newly streamed text
struct PartUpdated {
  Part part;
  std::optional<std::string> delta;
};

struct MessageUpdated {
  AssistantMessage message;
};

struct SessionError {
  SessionId session_id;
  std::optional<MessageId> message_id;
  MessageError error;
};

struct SessionStatusChanged {
  SessionId session_id;
  std::string type;  // "busy", "retry" or "idle"
  int attempt = 0;
  std::string message;
  std::optional<Timestamp> next;
};

// Background summary of what a message changed
struct MessageSummarized {
  SessionId session_id;
  MessageId message_id;
  std::vector<std::string> files;
  int tool_calls = 0;
};

struct PermissionAsked {
  std::string request_id;
  SessionId session_id;
  std::string permission;
  std::vector<std::string> patterns;
  json metadata;
};

struct PermissionReplied {
  std::string request_id;
  SessionId session_id;
  std::string reply;  // "once", "always" or "reject"
};

}  // namespace events

}  // namespace coderun

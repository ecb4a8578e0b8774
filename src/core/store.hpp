#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/message.hpp"
#include "core/types.hpp"

namespace coderun {

// Persistence and broadcast of assistant messages and their parts.
// Every write is also published on the Bus.
class SessionStore {
 public:
  virtual ~SessionStore() = default;

  // Insert or replace a part. The delta, when given, is the text appended
  // since the previous update and is forwarded to subscribers unchanged.
  virtual void update_part(const Part &part, const std::optional<std::string> &delta = std::nullopt) = 0;

  virtual void update_message(const AssistantMessage &message) = 0;

  // All parts of a message in creation order
  virtual std::vector<Part> list_parts(const MessageId &message_id) = 0;

  virtual std::optional<AssistantMessage> get_message(const MessageId &message_id) = 0;

  // Assistant messages answering the given user message, oldest first
  virtual std::vector<AssistantMessage> list_children(const SessionId &session_id, const MessageId &parent_id) = 0;

 protected:
  void broadcast_part(const Part &part, const std::optional<std::string> &delta);
  void broadcast_message(const AssistantMessage &message);
};

// Keeps everything in memory; used by tests and the replay example
class InMemorySessionStore : public SessionStore {
 public:
  void update_part(const Part &part, const std::optional<std::string> &delta = std::nullopt) override;
  void update_message(const AssistantMessage &message) override;
  std::vector<Part> list_parts(const MessageId &message_id) override;
  std::optional<AssistantMessage> get_message(const MessageId &message_id) override;
  std::vector<AssistantMessage> list_children(const SessionId &session_id, const MessageId &parent_id) override;

  // Number of update_part calls, including deltas
  size_t part_writes() const;

 private:
  struct MessageRecord {
    std::optional<AssistantMessage> message;
    std::vector<Part> parts;
  };

  mutable std::mutex mutex_;
  std::map<MessageId, MessageRecord> records_;
  size_t part_writes_ = 0;
};

}  // namespace coderun

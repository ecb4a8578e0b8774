#include "core/store.hpp"

#include <algorithm>

#include "bus/bus.hpp"

namespace coderun {

void SessionStore::broadcast_part(const Part &part, const std::optional<std::string> &delta) {
  Bus::instance().publish(events::PartUpdated{part, delta});
}

void SessionStore::broadcast_message(const AssistantMessage &message) {
  Bus::instance().publish(events::MessageUpdated{message});
}

// --- InMemorySessionStore ---

void InMemorySessionStore::update_part(const Part &part, const std::optional<std::string> &delta) {
  {
    std::lock_guard lock(mutex_);
    auto &parts = records_[part_message_id(part)].parts;
    auto it = std::find_if(parts.begin(), parts.end(), [&](const Part &existing) {
      return part_id(existing) == part_id(part);
    });
    if (it != parts.end()) {
      *it = part;
    } else {
      parts.push_back(part);
    }
    ++part_writes_;
  }
  broadcast_part(part, delta);
}

void InMemorySessionStore::update_message(const AssistantMessage &message) {
  {
    std::lock_guard lock(mutex_);
    records_[message.id()].message = message;
  }
  broadcast_message(message);
}

std::vector<Part> InMemorySessionStore::list_parts(const MessageId &message_id) {
  std::lock_guard lock(mutex_);
  auto it = records_.find(message_id);
  if (it == records_.end()) {
    return {};
  }
  return it->second.parts;
}

std::optional<AssistantMessage> InMemorySessionStore::get_message(const MessageId &message_id) {
  std::lock_guard lock(mutex_);
  auto it = records_.find(message_id);
  if (it == records_.end()) {
    return std::nullopt;
  }
  return it->second.message;
}

std::vector<AssistantMessage> InMemorySessionStore::list_children(const SessionId &session_id, const MessageId &parent_id) {
  std::lock_guard lock(mutex_);
  std::vector<AssistantMessage> children;
  for (const auto &[id, record] : records_) {
    if (record.message && record.message->session_id() == session_id && record.message->parent_id() == parent_id) {
      children.push_back(*record.message);
    }
  }
  // Ascending ids: map order is creation order
  return children;
}

size_t InMemorySessionStore::part_writes() const {
  std::lock_guard lock(mutex_);
  return part_writes_;
}

}  // namespace coderun

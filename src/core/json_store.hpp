#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <vector>

#include "core/store.hpp"

namespace coderun {

// JSON file-based session store
// Storage layout:
//   base_dir/
//     {session_id}/
//       {message_id}.json            message plus its parts
class JsonSessionStore : public SessionStore {
 public:
  explicit JsonSessionStore(const std::filesystem::path &base_dir);

  // SessionStore interface
  void update_part(const Part &part, const std::optional<std::string> &delta = std::nullopt) override;
  void update_message(const AssistantMessage &message) override;
  std::vector<Part> list_parts(const MessageId &message_id) override;
  std::optional<AssistantMessage> get_message(const MessageId &message_id) override;
  std::vector<AssistantMessage> list_children(const SessionId &session_id, const MessageId &parent_id) override;

  // Message ids stored for a session, oldest first
  std::vector<MessageId> list_messages(const SessionId &session_id);

  const std::filesystem::path &base_dir() const {
    return base_dir_;
  }

 private:
  struct Record {
    SessionId session_id;
    std::optional<AssistantMessage> message;
    std::vector<Part> parts;
  };

  std::filesystem::path base_dir_;
  mutable std::mutex mutex_;

  // Records already read from or written to disk
  std::map<MessageId, Record> cache_;

  // Path helpers
  std::filesystem::path session_dir(const SessionId &id) const;
  std::filesystem::path message_file(const SessionId &session_id, const MessageId &message_id) const;

  // Atomic write: write to .tmp then rename
  void atomic_write(const std::filesystem::path &path, const std::string &content);

  // Internal: locate a record in the cache or on disk
  Record *find_record(const MessageId &message_id);
  std::vector<MessageId> message_ids(const SessionId &session_id) const;
  std::optional<Record> load_record(const std::filesystem::path &path);
  void save_record(const MessageId &message_id, const Record &record);
};

}  // namespace coderun

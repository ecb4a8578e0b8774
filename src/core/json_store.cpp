#include "core/json_store.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>

namespace coderun {

namespace fs = std::filesystem;

JsonSessionStore::JsonSessionStore(const fs::path &base_dir) : base_dir_(base_dir) {
  std::error_code ec;
  fs::create_directories(base_dir_, ec);
  if (ec) {
    spdlog::warn("Failed to create store directory {}: {}", base_dir_.string(), ec.message());
  }
}

// --- Path helpers ---

fs::path JsonSessionStore::session_dir(const SessionId &id) const {
  return base_dir_ / id;
}

fs::path JsonSessionStore::message_file(const SessionId &session_id, const MessageId &message_id) const {
  return session_dir(session_id) / (message_id + ".json");
}

// --- Atomic write ---

void JsonSessionStore::atomic_write(const fs::path &path, const std::string &content) {
  auto tmp_path = path;
  tmp_path += ".tmp";

  std::ofstream file(tmp_path, std::ios::trunc);
  if (!file.is_open()) {
    spdlog::warn("Failed to open temp file for writing: {}", tmp_path.string());
    return;
  }

  file << content;
  file.close();

  if (file.fail()) {
    spdlog::warn("Failed to write temp file: {}", tmp_path.string());
    std::error_code ec;
    fs::remove(tmp_path, ec);
    return;
  }

  std::error_code ec;
  fs::rename(tmp_path, path, ec);
  if (ec) {
    spdlog::warn("Failed to rename temp file {} -> {}: {}", tmp_path.string(), path.string(), ec.message());
    fs::remove(tmp_path, ec);
  }
}

// --- Internal: record files ---

std::optional<JsonSessionStore::Record> JsonSessionStore::load_record(const fs::path &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    spdlog::warn("Failed to open message file: {}", path.string());
    return std::nullopt;
  }

  try {
    json j = json::parse(file);
    Record record;
    record.session_id = j.value("session_id", path.parent_path().filename().string());
    if (j.contains("message") && !j["message"].is_null()) {
      record.message = AssistantMessage::from_json(j["message"]);
    }
    for (const auto &part_json : j.value("parts", json::array())) {
      record.parts.push_back(part_from_json(part_json));
    }
    return record;
  } catch (const std::exception &e) {
    spdlog::warn("Failed to parse message file {}: {}", path.string(), e.what());
    return std::nullopt;
  }
}

void JsonSessionStore::save_record(const MessageId &message_id, const Record &record) {
  auto dir = session_dir(record.session_id);
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    spdlog::warn("Failed to create session directory {}: {}", dir.string(), ec.message());
    return;
  }

  json j;
  j["session_id"] = record.session_id;
  j["message"] = record.message ? record.message->to_json() : json();
  j["parts"] = json::array();
  for (const auto &part : record.parts) {
    j["parts"].push_back(part_to_json(part));
  }

  atomic_write(message_file(record.session_id, message_id), j.dump(2));
}

JsonSessionStore::Record *JsonSessionStore::find_record(const MessageId &message_id) {
  auto it = cache_.find(message_id);
  if (it != cache_.end()) {
    return &it->second;
  }

  // Scan all session directories for the message
  if (!fs::exists(base_dir_)) {
    return nullptr;
  }

  for (const auto &entry : fs::directory_iterator(base_dir_)) {
    if (!entry.is_directory()) continue;

    auto path = entry.path() / (message_id + ".json");
    if (!fs::exists(path)) continue;

    if (auto record = load_record(path)) {
      auto [inserted, _] = cache_.emplace(message_id, std::move(*record));
      return &inserted->second;
    }
  }

  return nullptr;
}

// --- SessionStore interface ---

void JsonSessionStore::update_part(const Part &part, const std::optional<std::string> &delta) {
  {
    std::lock_guard lock(mutex_);

    const auto &message_id = part_message_id(part);
    auto *record = find_record(message_id);
    if (!record) {
      record = &cache_[message_id];
      record->session_id = std::visit(
          [](const auto &p) {
            return p.session_id;
          },
          part);
    }

    auto it = std::find_if(record->parts.begin(), record->parts.end(), [&](const Part &existing) {
      return part_id(existing) == part_id(part);
    });
    if (it != record->parts.end()) {
      *it = part;
    } else {
      record->parts.push_back(part);
    }

    save_record(message_id, *record);
  }
  broadcast_part(part, delta);
}

void JsonSessionStore::update_message(const AssistantMessage &message) {
  {
    std::lock_guard lock(mutex_);

    auto *record = find_record(message.id());
    if (!record) {
      record = &cache_[message.id()];
    }
    record->session_id = message.session_id();
    record->message = message;

    save_record(message.id(), *record);
  }
  broadcast_message(message);
}

std::vector<Part> JsonSessionStore::list_parts(const MessageId &message_id) {
  std::lock_guard lock(mutex_);
  auto *record = find_record(message_id);
  if (!record) {
    return {};
  }
  return record->parts;
}

std::optional<AssistantMessage> JsonSessionStore::get_message(const MessageId &message_id) {
  std::lock_guard lock(mutex_);
  auto *record = find_record(message_id);
  if (!record) {
    return std::nullopt;
  }
  return record->message;
}

std::vector<MessageId> JsonSessionStore::list_messages(const SessionId &session_id) {
  std::lock_guard lock(mutex_);
  return message_ids(session_id);
}

std::vector<AssistantMessage> JsonSessionStore::list_children(const SessionId &session_id, const MessageId &parent_id) {
  std::lock_guard lock(mutex_);

  std::vector<AssistantMessage> children;
  for (const auto &id : message_ids(session_id)) {
    auto *record = find_record(id);
    if (record && record->message && record->message->parent_id() == parent_id) {
      children.push_back(*record->message);
    }
  }
  return children;
}

std::vector<MessageId> JsonSessionStore::message_ids(const SessionId &session_id) const {
  std::vector<MessageId> ids;
  auto dir = session_dir(session_id);
  if (!fs::exists(dir)) {
    return ids;
  }

  for (const auto &entry : fs::directory_iterator(dir)) {
    if (entry.is_regular_file() && entry.path().extension() == ".json") {
      ids.push_back(entry.path().stem().string());
    }
  }

  // Ascending identifiers sort by creation time
  std::sort(ids.begin(), ids.end());
  return ids;
}

}  // namespace coderun

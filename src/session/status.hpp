#pragma once

#include <map>
#include <mutex>
#include <string>

#include "core/types.hpp"

namespace coderun {

// What a session is doing right now
struct StatusInfo {
  enum class Type { Idle, Busy, Retry };

  Type type = Type::Idle;

  // Retry only
  int attempt = 0;
  std::string message;
  Timestamp next{};

  static StatusInfo idle() {
    return {};
  }

  static StatusInfo busy() {
    return {Type::Busy};
  }

  static StatusInfo retry(int attempt, std::string message, Timestamp next) {
    return {Type::Retry, attempt, std::move(message), next};
  }
};

std::string to_string(StatusInfo::Type type);

// Process-wide session status registry. Every change is published as
// events::SessionStatusChanged; idle sessions are dropped from the registry.
class SessionStatus {
 public:
  static SessionStatus &instance();

  void set(const SessionId &session_id, const StatusInfo &status);

  StatusInfo get(const SessionId &session_id) const;

  // Non-idle sessions
  std::map<SessionId, StatusInfo> list() const;

 private:
  mutable std::mutex mutex_;
  std::map<SessionId, StatusInfo> statuses_;
};

}  // namespace coderun

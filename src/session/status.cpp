#include "session/status.hpp"

#include <spdlog/spdlog.h>

#include "bus/bus.hpp"

namespace coderun {

std::string to_string(StatusInfo::Type type) {
  switch (type) {
    case StatusInfo::Type::Idle:
      return "idle";
    case StatusInfo::Type::Busy:
      return "busy";
    case StatusInfo::Type::Retry:
      return "retry";
  }
  return "idle";
}

SessionStatus &SessionStatus::instance() {
  static SessionStatus instance;
  return instance;
}

void SessionStatus::set(const SessionId &session_id, const StatusInfo &status) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (status.type == StatusInfo::Type::Idle) {
      statuses_.erase(session_id);
    } else {
      statuses_[session_id] = status;
    }
  }

  events::SessionStatusChanged event{session_id, to_string(status.type)};
  if (status.type == StatusInfo::Type::Retry) {
    event.attempt = status.attempt;
    event.message = status.message;
    event.next = status.next;
    spdlog::info("[Status {}] retry attempt {}: {}", session_id, status.attempt, status.message);
  } else {
    spdlog::debug("[Status {}] {}", session_id, event.type);
  }
  Bus::instance().publish(event);
}

StatusInfo SessionStatus::get(const SessionId &session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = statuses_.find(session_id);
  if (it == statuses_.end()) {
    return StatusInfo::idle();
  }
  return it->second;
}

std::map<SessionId, StatusInfo> SessionStatus::list() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return statuses_;
}

}  // namespace coderun

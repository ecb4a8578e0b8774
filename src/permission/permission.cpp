#include "permission/permission.hpp"

#include <spdlog/spdlog.h>

#include "bus/bus.hpp"
#include "core/errors.hpp"
#include "core/uuid.hpp"

namespace coderun {

std::string to_string(PermissionReply reply) {
  switch (reply) {
    case PermissionReply::Once:
      return "once";
    case PermissionReply::Always:
      return "always";
    case PermissionReply::Reject:
      return "reject";
  }
  return "reject";
}

namespace wildcard {

bool match(const std::string &text, const std::string &pattern) {
  size_t t = 0, p = 0;
  size_t star = std::string::npos, resume = 0;

  while (t < text.size()) {
    if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == text[t])) {
      ++t;
      ++p;
    } else if (p < pattern.size() && pattern[p] == '*') {
      star = p++;
      resume = t;
    } else if (star != std::string::npos) {
      p = star + 1;
      t = ++resume;
    } else {
      return false;
    }
  }

  while (p < pattern.size() && pattern[p] == '*') {
    ++p;
  }
  return p == pattern.size();
}

}  // namespace wildcard

PermissionNext::PermissionNext(Ruleset defaults) : defaults_(std::move(defaults)) {}

void PermissionNext::set_handler(Handler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  handler_ = std::move(handler);
}

Ruleset PermissionNext::approved() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return approved_;
}

PermissionAction PermissionNext::evaluate(const std::string &permission, const std::string &pattern, const Ruleset &ruleset) const {
  std::lock_guard<std::mutex> lock(mutex_);

  std::optional<PermissionAction> action;
  for (const auto *rules : {&defaults_, &ruleset, &approved_}) {
    for (const auto &rule : *rules) {
      if (wildcard::match(permission, rule.permission) && wildcard::match(pattern, rule.pattern)) {
        action = rule.action;
      }
    }
  }
  return action.value_or(PermissionAction::Ask);
}

PermissionReply PermissionNext::wait_reply(const PermissionRequest &request, std::future<PermissionReply> future, AbortSignal *abort) {
  // Poll so an abort can interrupt the wait
  while (future.wait_for(std::chrono::milliseconds(50)) != std::future_status::ready) {
    if (abort && abort->aborted()) {
      spdlog::info("[Permission {}] Aborted while waiting for reply", request.id);
      throw AbortError();
    }
  }
  return future.get();
}

void PermissionNext::ask(const PermissionRequest &request, AbortSignal *abort) {
  bool needs_reply = false;
  for (const auto &pattern : request.patterns) {
    auto action = evaluate(request.permission, pattern, request.ruleset);
    if (action == PermissionAction::Deny) {
      spdlog::info("[Permission] Denied by rule: {} {}", request.permission, pattern);
      throw PermissionDeniedError(request.permission);
    }
    if (action == PermissionAction::Ask) {
      needs_reply = true;
    }
  }
  if (!needs_reply) {
    return;
  }

  PermissionRequest pending = request;
  if (pending.id.empty()) {
    pending.id = Identifier::ascending("per");
  }

  Bus::instance().publish(events::PermissionAsked{pending.id, pending.session_id, pending.permission, pending.patterns, pending.metadata});

  Handler handler;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    handler = handler_;
  }

  PermissionReply reply = PermissionReply::Once;
  if (handler) {
    reply = wait_reply(pending, handler(pending), abort);
  } else {
    spdlog::warn("[Permission {}] No handler installed, approving {}", pending.id, pending.permission);
  }

  Bus::instance().publish(events::PermissionReplied{pending.id, pending.session_id, to_string(reply)});
  spdlog::info("[Permission {}] {} -> {}", pending.id, pending.permission, to_string(reply));

  if (reply == PermissionReply::Reject) {
    throw PermissionRejectedError(pending.permission);
  }

  if (reply == PermissionReply::Always) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &pattern : pending.always) {
      approved_.push_back({pending.permission, pattern, PermissionAction::Allow});
    }
  }
}

}  // namespace coderun

#pragma once

#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/abort.hpp"
#include "core/types.hpp"

namespace coderun {

// Approval request raised for a tool call or a suspected doom loop
struct PermissionRequest {
  std::string id;
  SessionId session_id;
  std::string permission;
  std::vector<std::string> patterns;
  json metadata = json::object();

  // Patterns approved for good when the user answers "always"
  std::vector<std::string> always;

  // Agent rules evaluated on top of the gate's defaults
  Ruleset ruleset;

  std::optional<CallId> call_id;
};

enum class PermissionReply { Once, Always, Reject };

std::string to_string(PermissionReply reply);

// Approval gate consulted by the turn processor.
// ask() returns when approved and throws PermissionRejectedError when the
// user rejects, PermissionDeniedError when a rule denies, AbortError when
// the abort signal fires while waiting.
class PermissionGate {
 public:
  virtual ~PermissionGate() = default;

  virtual void ask(const PermissionRequest &request, AbortSignal *abort = nullptr) = 0;
};

namespace wildcard {

// Glob match over the whole string: '*' any run, '?' one character
bool match(const std::string &text, const std::string &pattern);

}  // namespace wildcard

// Rule-based gate. Rules are evaluated defaults first, then the request's
// ruleset, then "always" approvals; the last matching rule wins and no
// match means ask.
class PermissionNext : public PermissionGate {
 public:
  using Handler = std::function<std::future<PermissionReply>(const PermissionRequest &)>;

  explicit PermissionNext(Ruleset defaults = {});

  // Interactive responder; without one every "ask" is approved
  void set_handler(Handler handler);

  void ask(const PermissionRequest &request, AbortSignal *abort = nullptr) override;

  PermissionAction evaluate(const std::string &permission, const std::string &pattern, const Ruleset &ruleset = {}) const;

  // Rules added by "always" replies
  Ruleset approved() const;

 private:
  PermissionReply wait_reply(const PermissionRequest &request, std::future<PermissionReply> future, AbortSignal *abort);

  mutable std::mutex mutex_;
  Ruleset defaults_;
  Ruleset approved_;
  Handler handler_;
};

}  // namespace coderun

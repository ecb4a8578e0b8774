#include "session/doom_loop.hpp"

#include <spdlog/spdlog.h>

namespace coderun {

bool DoomLoopDetector::detect(const std::vector<Part> &parts, const std::string &tool, const json &input) const {
  if (threshold_ == 0 || parts.size() < threshold_) {
    return false;
  }

  const auto expected = input.dump();
  for (auto it = parts.end() - static_cast<std::ptrdiff_t>(threshold_); it != parts.end(); ++it) {
    auto *part = std::get_if<ToolPart>(&*it);
    if (!part || part->tool != tool || part->status() == ToolStatus::Pending) {
      return false;
    }
    if (part->input().dump() != expected) {
      return false;
    }
  }
  return true;
}

PermissionRequest DoomLoopDetector::request(const ToolPart &call, const Ruleset &ruleset) const {
  PermissionRequest req;
  req.session_id = call.session_id;
  req.permission = "doom_loop";
  req.patterns = {call.tool};
  req.always = {call.tool};
  req.metadata = {{"tool", call.tool}, {"input", call.input()}};
  req.ruleset = ruleset;
  req.call_id = call.call_id;
  return req;
}

void DoomLoopDetector::check(const std::vector<Part> &parts, const ToolPart &call, PermissionGate &gate, const Ruleset &ruleset,
                             AbortSignal *abort) const {
  if (!detect(parts, call.tool, call.input())) {
    return;
  }

  spdlog::warn("[DoomLoop] {} called {} times in a row with the same input, asking for approval", call.tool, threshold_);
  gate.ask(request(call, ruleset), abort);
}

}  // namespace coderun

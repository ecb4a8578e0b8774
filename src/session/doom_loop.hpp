#pragma once

#include <optional>
#include <vector>

#include "core/abort.hpp"
#include "core/message.hpp"
#include "permission/permission.hpp"

namespace coderun {

// Detects the model repeating the same tool call with the same input and
// asks the approval gate before letting it continue.
class DoomLoopDetector {
 public:
  static constexpr size_t kThreshold = 3;

  explicit DoomLoopDetector(size_t threshold = kThreshold) : threshold_(threshold) {}

  // True when the last `threshold` parts are all tool parts past pending,
  // naming `tool` with the same serialized input. Key order in the input
  // does not matter: objects serialize with sorted keys.
  bool detect(const std::vector<Part> &parts, const std::string &tool, const json &input) const;

  // Build the approval request for a detected loop
  PermissionRequest request(const ToolPart &call, const Ruleset &ruleset) const;

  // Detect and, on a hit, ask the gate. Rejection propagates as
  // PermissionRejectedError.
  void check(const std::vector<Part> &parts, const ToolPart &call, PermissionGate &gate, const Ruleset &ruleset,
             AbortSignal *abort = nullptr) const;

  size_t threshold() const {
    return threshold_;
  }

 private:
  size_t threshold_;
};

}  // namespace coderun

#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "core/types.hpp"

namespace coderun::plugin {

// Context passed to post-processing hooks
struct TextCompleteInput {
  SessionId session_id;
  MessageId message_id;
  PartId part_id;
};

// Registry of post-processing hooks run on finalized text
class Hooks {
 public:
  // A hook receives {text} and returns the (possibly rewritten) {text}
  using TextCompleteHook = std::function<json(const TextCompleteInput &, json)>;
  using HookId = uint64_t;

  static Hooks &instance();

  HookId on_text_complete(TextCompleteHook hook);

  void remove(HookId id);

  // Chain every registered hook; a failing hook is logged and skipped
  std::string trigger_text_complete(const TextCompleteInput &input, const std::string &text);

  void clear();

 private:
  Hooks() = default;

  struct Entry {
    HookId id;
    TextCompleteHook hook;
  };

  std::mutex mutex_;
  HookId next_id_ = 1;
  std::vector<Entry> text_complete_;
};

}  // namespace coderun::plugin

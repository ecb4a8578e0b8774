#pragma once

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "llm/provider.hpp"

namespace coderun::llm {

// One step of a scripted stream: wait, then emit an event or stall forever
struct ScriptStep {
  std::chrono::milliseconds after{0};
  std::optional<StreamEvent> event;
  bool stall = false;

  static ScriptStep emit(StreamEvent event, std::chrono::milliseconds after = std::chrono::milliseconds(0)) {
    return ScriptStep{after, std::move(event), false};
  }

  static ScriptStep hang(std::chrono::milliseconds after = std::chrono::milliseconds(0)) {
    return ScriptStep{after, std::nullopt, true};
  }
};

using Script = std::vector<ScriptStep>;

// Replays prerecorded event scripts on an asio io_context, one script per
// stream attempt. Timing comes from steady timers so idle deadlines and
// flush intervals see realistic gaps.
//
// JSON form:
//   {"attempts": [[{"after_ms": 10, "event": {"type": "text-delta", ...}},
//                  {"after_ms": 0, "stall": true}], ...]}
class ScriptedProvider : public Provider, public std::enable_shared_from_this<ScriptedProvider> {
 public:
  ScriptedProvider(asio::io_context &io_ctx, std::vector<Script> attempts);

  static std::shared_ptr<ScriptedProvider> from_json(const json &j, asio::io_context &io_ctx);

  std::string name() const override {
    return "scripted";
  }

  void stream(const StreamRequest &request, EventCallback on_event, CompleteCallback on_complete) override;

  void cancel() override;

  // Number of stream() calls so far
  int streams_started() const;

  // Requests received, in call order
  std::vector<StreamRequest> requests() const;

 private:
  struct Run {
    Script script;
    size_t index = 0;
    EventCallback on_event;
    CompleteCallback on_complete;
    std::shared_ptr<asio::steady_timer> timer;
    std::atomic<bool> cancelled{false};
  };

  void schedule_next(std::shared_ptr<Run> run);

  asio::io_context &io_ctx_;
  std::vector<Script> attempts_;

  mutable std::mutex mutex_;
  std::shared_ptr<Run> current_;
  std::vector<StreamRequest> requests_;
};

}  // namespace coderun::llm

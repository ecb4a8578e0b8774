#include "llm/scripted.hpp"

#include <spdlog/spdlog.h>

#include "core/errors.hpp"

namespace coderun::llm {

ScriptedProvider::ScriptedProvider(asio::io_context &io_ctx, std::vector<Script> attempts)
    : io_ctx_(io_ctx), attempts_(std::move(attempts)) {}

std::shared_ptr<ScriptedProvider> ScriptedProvider::from_json(const json &j, asio::io_context &io_ctx) {
  std::vector<Script> attempts;
  for (const auto &attempt_json : j.value("attempts", json::array())) {
    Script script;
    for (const auto &step_json : attempt_json) {
      ScriptStep step;
      step.after = std::chrono::milliseconds(step_json.value("after_ms", int64_t(0)));
      step.stall = step_json.value("stall", false);
      if (step_json.contains("event")) {
        step.event = event_from_json(step_json["event"]);
      }
      script.push_back(std::move(step));
    }
    attempts.push_back(std::move(script));
  }
  return std::make_shared<ScriptedProvider>(io_ctx, std::move(attempts));
}

void ScriptedProvider::stream(const StreamRequest &request, EventCallback on_event, CompleteCallback on_complete) {
  auto run = std::make_shared<Run>();
  run->on_event = std::move(on_event);
  run->on_complete = std::move(on_complete);
  run->timer = std::make_shared<asio::steady_timer>(io_ctx_);

  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto attempt = requests_.size();
    requests_.push_back(request);

    if (attempt < attempts_.size()) {
      run->script = attempts_[attempt];
    } else {
      // Nothing left to replay: fail the stream terminally
      run->script.push_back(ScriptStep::emit(ErrorEvent{std::make_exception_ptr(
          ProviderError(ProviderError::Kind::Terminal, "No scripted response for attempt " + std::to_string(attempt + 1)))}));
    }
    current_ = run;
  }

  spdlog::debug("[ScriptedProvider] Stream {} started ({} steps)", streams_started(), run->script.size());

  auto self = shared_from_this();
  asio::post(io_ctx_, [self, run] {
    self->schedule_next(run);
  });
}

void ScriptedProvider::schedule_next(std::shared_ptr<Run> run) {
  if (run->cancelled) return;

  if (run->index >= run->script.size()) {
    spdlog::debug("[ScriptedProvider] Script finished");
    if (run->on_complete) {
      run->on_complete();
    }
    return;
  }

  const auto &step = run->script[run->index];
  run->timer->expires_after(step.after);

  auto self = shared_from_this();
  run->timer->async_wait([self, run](const asio::error_code &ec) {
    if (ec || run->cancelled) return;

    const auto &step = run->script[run->index++];
    if (step.stall) {
      spdlog::debug("[ScriptedProvider] Stalling stream");
      return;
    }
    if (step.event && run->on_event) {
      run->on_event(*step.event);
    }
    self->schedule_next(run);
  });
}

void ScriptedProvider::cancel() {
  std::shared_ptr<Run> run;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    run = std::move(current_);
  }
  if (!run) return;

  run->cancelled = true;

  // Timers belong to the io_context thread
  asio::post(io_ctx_, [run] {
    run->timer->cancel();
  });
}

int ScriptedProvider::streams_started() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<int>(requests_.size());
}

std::vector<StreamRequest> ScriptedProvider::requests() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return requests_;
}

}  // namespace coderun::llm

#include "plugin/hooks.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace coderun::plugin {

Hooks &Hooks::instance() {
  static Hooks instance;
  return instance;
}

Hooks::HookId Hooks::on_text_complete(TextCompleteHook hook) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto id = next_id_++;
  text_complete_.push_back({id, std::move(hook)});
  return id;
}

void Hooks::remove(HookId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  text_complete_.erase(std::remove_if(text_complete_.begin(), text_complete_.end(),
                                      [id](const Entry &entry) {
                                        return entry.id == id;
                                      }),
                       text_complete_.end());
}

void Hooks::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  text_complete_.clear();
}

std::string Hooks::trigger_text_complete(const TextCompleteInput &input, const std::string &text) {
  std::vector<Entry> hooks;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    hooks = text_complete_;
  }

  json output = {{"text", text}};
  for (const auto &entry : hooks) {
    try {
      auto result = entry.hook(input, output);
      if (result.is_object() && result.contains("text") && result["text"].is_string()) {
        output = std::move(result);
      } else {
        spdlog::warn("[Hooks] text.complete hook {} returned no text, ignoring", entry.id);
      }
    } catch (const std::exception &e) {
      spdlog::error("[Hooks] text.complete hook {} failed: {}", entry.id, e.what());
    }
  }
  return output["text"].get<std::string>();
}

}  // namespace coderun::plugin

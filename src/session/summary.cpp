#include "session/summary.hpp"

#include <spdlog/spdlog.h>

#include <set>

#include "bus/bus.hpp"

namespace coderun {

BackgroundSummarizer::BackgroundSummarizer(asio::io_context &io_ctx, Job job) : io_ctx_(io_ctx), job_(std::move(job)) {}

BackgroundSummarizer::Job BackgroundSummarizer::diff_summary(std::shared_ptr<SessionStore> store) {
  return [store](const SessionId &session_id, const MessageId &message_id) {
    std::set<std::string> files;
    int tool_calls = 0;
    // Parts of the message itself plus every assistant reply to it
    std::vector<MessageId> ids{message_id};
    for (const auto &child : store->list_children(session_id, message_id)) {
      ids.push_back(child.id());
    }

    for (const auto &id : ids) {
      for (const auto &part : store->list_parts(id)) {
        if (auto *patch = std::get_if<PatchPart>(&part)) {
          files.insert(patch->files.begin(), patch->files.end());
        } else if (std::holds_alternative<ToolPart>(part)) {
          ++tool_calls;
        }
      }
    }

    spdlog::debug("[Summary {}] {} files changed, {} tool calls", message_id, files.size(), tool_calls);
    Bus::instance().publish(events::MessageSummarized{session_id, message_id, {files.begin(), files.end()}, tool_calls});
  };
}

void BackgroundSummarizer::summarize(const SessionId &session_id, const MessageId &message_id) {
  auto job = job_;
  asio::post(io_ctx_, [job, session_id, message_id] {
    try {
      job(session_id, message_id);
    } catch (const std::exception &e) {
      spdlog::error("[Summary {}] Failed to summarize: {}", message_id, e.what());
    }
  });
}

}  // namespace coderun

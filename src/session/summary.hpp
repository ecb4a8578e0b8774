#pragma once

#include <asio.hpp>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "core/store.hpp"
#include "core/types.hpp"

namespace coderun {

// Fire-and-forget summarization of a message
class Summarizer {
 public:
  virtual ~Summarizer() = default;

  // Must return without waiting for the work to finish
  virtual void summarize(const SessionId &session_id, const MessageId &message_id) = 0;
};

// Runs summary jobs on an io_context. Failures are logged and dropped.
class BackgroundSummarizer : public Summarizer {
 public:
  using Job = std::function<void(const SessionId &, const MessageId &)>;

  BackgroundSummarizer(asio::io_context &io_ctx, Job job);

  // Default job: collect the files changed by the patch parts of a user
  // message's replies and their tool calls, then publish
  // events::MessageSummarized
  static Job diff_summary(std::shared_ptr<SessionStore> store);

  void summarize(const SessionId &session_id, const MessageId &message_id) override;

 private:
  asio::io_context &io_ctx_;
  Job job_;
};

}  // namespace coderun

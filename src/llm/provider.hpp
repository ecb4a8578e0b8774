#pragma once

#include <asio.hpp>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/types.hpp"
#include "llm/stream.hpp"

namespace coderun::llm {

// Stream callbacks. on_event may be called from any thread; on_complete
// is called once after the last event unless the stream was cancelled.
using EventCallback = std::function<void(const StreamEvent &)>;
using CompleteCallback = std::function<void()>;

// One model call for one turn attempt
struct StreamRequest {
  SessionId session_id;
  MessageId message_id;
  ModelInfo model;
  std::string agent = "build";
  std::string system_prompt;
  json messages = json::array();
  json tools = json::array();
  int attempt = 0;
};

// Abstract model stream provider
class Provider {
 public:
  virtual ~Provider() = default;

  // Provider name
  virtual std::string name() const = 0;

  // Available models
  virtual std::vector<ModelInfo> models() const {
    return {};
  }

  // Get model info
  virtual std::optional<ModelInfo> get_model(const std::string &model_id) const;

  // Streaming completion
  virtual void stream(const StreamRequest &request, EventCallback on_event, CompleteCallback on_complete) = 0;

  // Cancel current request; no callbacks fire afterwards
  virtual void cancel() = 0;
};

// Provider factory
class ProviderFactory {
 public:
  static ProviderFactory &instance();

  // Create provider by name; nullptr when unknown
  std::shared_ptr<Provider> create(const std::string &name, const json &options, asio::io_context &io_ctx);

  // Register custom provider factory
  using FactoryFunc = std::function<std::shared_ptr<Provider>(const json &, asio::io_context &)>;
  void register_provider(const std::string &name, FactoryFunc factory);

 private:
  std::mutex mutex_;
  std::map<std::string, FactoryFunc> factories_;
};

}  // namespace coderun::llm

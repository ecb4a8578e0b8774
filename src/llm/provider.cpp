#include "llm/provider.hpp"

#include "llm/scripted.hpp"

namespace coderun::llm {

std::optional<ModelInfo> Provider::get_model(const std::string &model_id) const {
  auto all_models = models();
  for (const auto &model : all_models) {
    if (model.id == model_id) {
      return model;
    }
  }
  return std::nullopt;
}

ProviderFactory &ProviderFactory::instance() {
  static ProviderFactory instance;
  return instance;
}

std::shared_ptr<Provider> ProviderFactory::create(const std::string &name, const json &options, asio::io_context &io_ctx) {
  FactoryFunc factory;
  {
    std::lock_guard<std::mutex> lock(mutex_);

    // Ensure default providers are registered
    if (factories_.find("scripted") == factories_.end()) {
      factories_["scripted"] = [](const json &opts, asio::io_context &ctx) {
        return ScriptedProvider::from_json(opts, ctx);
      };
    }

    auto it = factories_.find(name);
    if (it == factories_.end()) {
      return nullptr;
    }
    factory = it->second;
  }
  return factory(options, io_ctx);
}

void ProviderFactory::register_provider(const std::string &name, FactoryFunc factory) {
  std::lock_guard<std::mutex> lock(mutex_);
  factories_[name] = std::move(factory);
}

}  // namespace coderun::llm

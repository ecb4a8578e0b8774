#include "session/usage.hpp"

#include <algorithm>
#include <cmath>

namespace coderun::usage {

namespace {

constexpr int64_t kOver200kThreshold = 200000;

int64_t number(const json &j, const char *key) {
  if (!j.is_object() || !j.contains(key)) return 0;
  const auto &v = j[key];
  if (v.is_number_integer()) return v.get<int64_t>();
  if (v.is_number()) {
    double d = v.get<double>();
    return std::isfinite(d) ? static_cast<int64_t>(d) : 0;
  }
  return 0;
}

int64_t cache_write_tokens(const json &metadata) {
  if (!metadata.is_object()) return 0;
  if (metadata.contains("anthropic")) {
    auto write = number(metadata["anthropic"], "cacheCreationInputTokens");
    if (write) return write;
  }
  if (metadata.contains("bedrock") && metadata["bedrock"].contains("usage")) {
    return number(metadata["bedrock"]["usage"], "cacheWriteInputTokens");
  }
  return 0;
}

}  // namespace

StepUsage compute(const ModelInfo &model, const json &usage, const json &metadata) {
  StepUsage result;

  int64_t cached = number(usage, "cachedInputTokens");
  bool excludes_cached = metadata.is_object() && (metadata.contains("anthropic") || metadata.contains("bedrock"));
  int64_t input = number(usage, "inputTokens");

  result.tokens.input = std::max<int64_t>(excludes_cached ? input : input - cached, 0);
  result.tokens.output = std::max<int64_t>(number(usage, "outputTokens"), 0);
  result.tokens.reasoning = std::max<int64_t>(number(usage, "reasoningTokens"), 0);
  result.tokens.cache.read = std::max<int64_t>(cached, 0);
  result.tokens.cache.write = std::max<int64_t>(cache_write_tokens(metadata), 0);

  if (!model.cost) {
    return result;
  }

  ModelInfo::Price price = *model.cost;
  if (model.cost->over_200k && result.tokens.input + result.tokens.cache.read > kOver200kThreshold) {
    price = *model.cost->over_200k;
  }

  const auto &t = result.tokens;
  double cost = (t.input * price.input + t.output * price.output + t.cache.read * price.cache_read + t.cache.write * price.cache_write +
                 t.reasoning * price.output) /
                1'000'000.0;
  result.cost = std::isfinite(cost) && cost > 0 ? cost : 0;
  return result;
}

}  // namespace coderun::usage

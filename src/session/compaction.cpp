#include "session/compaction.hpp"

#include <algorithm>

namespace coderun::compaction {

bool is_overflow(const Tokens &tokens, const ModelInfo &model, const Config::Compaction &config) {
  if (!config.auto_compact) return false;

  int64_t context = model.limit.context;
  if (context == 0) return false;

  int64_t count = tokens.input + tokens.cache.read + tokens.output;
  int64_t output = model.limit.output > 0 ? std::min(model.limit.output, kOutputTokenMax) : kOutputTokenMax;
  int64_t usable = model.limit.input > 0 ? model.limit.input : context - output;
  return count > usable;
}

}  // namespace coderun::compaction

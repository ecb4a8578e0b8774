#pragma once

#include "core/types.hpp"

namespace coderun::usage {

struct StepUsage {
  double cost = 0;
  Tokens tokens;
};

// Convert raw provider usage into tokens and cost for one step.
// usage:    {inputTokens, outputTokens, reasoningTokens, cachedInputTokens}
// metadata: provider metadata; anthropic/bedrock report cached input separately
//           and carry the cache write count.
StepUsage compute(const ModelInfo &model, const json &usage, const json &metadata);

}  // namespace coderun::usage

#pragma once

#include "core/config.hpp"
#include "core/types.hpp"

namespace coderun::compaction {

// Largest output reservation taken out of the context window
inline constexpr int64_t kOutputTokenMax = 32000;

// True when a step's tokens no longer fit the model's usable input window
bool is_overflow(const Tokens &tokens, const ModelInfo &model, const Config::Compaction &config = {});

}  // namespace coderun::compaction

#include <gtest/gtest.h>

#include "session/compaction.hpp"
#include "session/usage.hpp"

using namespace coderun;

namespace {

ModelInfo priced_model() {
  ModelInfo model;
  model.id = "claude-sonnet";
  model.provider_id = "anthropic";
  model.limit.context = 200000;
  model.limit.output = 64000;

  ModelInfo::Cost cost;
  cost.input = 3;
  cost.output = 15;
  cost.cache_read = 0.3;
  cost.cache_write = 3.75;
  model.cost = cost;
  return model;
}

}  // namespace

// --- usage::compute ---

TEST(UsageTest, CachedTokensAreSubtractedFromInput) {
  auto step = usage::compute(priced_model(), {{"inputTokens", 1000}, {"outputTokens", 200}, {"cachedInputTokens", 400}}, json::object());

  EXPECT_EQ(step.tokens.input, 600);
  EXPECT_EQ(step.tokens.output, 200);
  EXPECT_EQ(step.tokens.cache.read, 400);
  EXPECT_EQ(step.tokens.cache.write, 0);
  EXPECT_NEAR(step.cost, (600 * 3 + 200 * 15 + 400 * 0.3) / 1e6, 1e-12);
}

TEST(UsageTest, AnthropicReportsCachedInputSeparately) {
  json metadata = {{"anthropic", {{"cacheCreationInputTokens", 50}}}};
  auto step = usage::compute(priced_model(), {{"inputTokens", 1000}, {"outputTokens", 10}, {"cachedInputTokens", 400}}, metadata);

  EXPECT_EQ(step.tokens.input, 1000);
  EXPECT_EQ(step.tokens.cache.read, 400);
  EXPECT_EQ(step.tokens.cache.write, 50);
  EXPECT_NEAR(step.cost, (1000 * 3 + 10 * 15 + 400 * 0.3 + 50 * 3.75) / 1e6, 1e-12);
}

TEST(UsageTest, BedrockCacheWrites) {
  json metadata = {{"bedrock", {{"usage", {{"cacheWriteInputTokens", 70}}}}}};
  auto step = usage::compute(priced_model(), {{"inputTokens", 10}}, metadata);

  EXPECT_EQ(step.tokens.input, 10);
  EXPECT_EQ(step.tokens.cache.write, 70);
}

TEST(UsageTest, ReasoningIsBilledAsOutput) {
  auto step = usage::compute(priced_model(), {{"outputTokens", 100}, {"reasoningTokens", 100}}, json::object());

  EXPECT_EQ(step.tokens.reasoning, 100);
  EXPECT_NEAR(step.cost, 200 * 15 / 1e6, 1e-12);
}

TEST(UsageTest, NegativeAndMissingValuesClampToZero) {
  auto step = usage::compute(priced_model(), {{"inputTokens", 100}, {"cachedInputTokens", 300}, {"outputTokens", -5}}, json());

  EXPECT_EQ(step.tokens.input, 0);
  EXPECT_EQ(step.tokens.output, 0);
  EXPECT_GE(step.cost, 0.0);

  auto empty = usage::compute(priced_model(), json(), json());
  EXPECT_EQ(empty.tokens.total(), 0);
  EXPECT_EQ(empty.cost, 0.0);
}

TEST(UsageTest, UnpricedModelCostsNothing) {
  ModelInfo model;
  model.id = "local";
  auto step = usage::compute(model, {{"inputTokens", 5000}, {"outputTokens", 5000}}, json::object());

  EXPECT_EQ(step.tokens.input, 5000);
  EXPECT_EQ(step.cost, 0.0);
}

TEST(UsageTest, Over200kTier) {
  auto model = priced_model();
  ModelInfo::Price expensive;
  expensive.input = 6;
  expensive.output = 22.5;
  model.cost->over_200k = expensive;

  auto small = usage::compute(model, {{"inputTokens", 150000}}, json::object());
  EXPECT_NEAR(small.cost, 150000 * 3 / 1e6, 1e-9);

  auto large = usage::compute(model, {{"inputTokens", 250000}}, json::object());
  EXPECT_NEAR(large.cost, 250000 * 6 / 1e6, 1e-9);
}

// --- compaction::is_overflow ---

TEST(CompactionTest, OverflowAgainstUsableWindow) {
  auto model = priced_model();
  // usable = 200000 - min(64000, 32000)
  Tokens tokens;
  tokens.input = 160000;
  tokens.output = 8000;
  EXPECT_FALSE(compaction::is_overflow(tokens, model));

  tokens.cache.read = 1;
  EXPECT_TRUE(compaction::is_overflow(tokens, model));
}

TEST(CompactionTest, ExplicitInputLimit) {
  auto model = priced_model();
  model.limit.input = 100000;

  Tokens tokens;
  tokens.input = 100001;
  EXPECT_TRUE(compaction::is_overflow(tokens, model));
}

TEST(CompactionTest, DisabledOrUnknownContext) {
  auto model = priced_model();
  Tokens tokens;
  tokens.input = 1000000;

  Config::Compaction off;
  off.auto_compact = false;
  EXPECT_FALSE(compaction::is_overflow(tokens, model, off));

  model.limit.context = 0;
  EXPECT_FALSE(compaction::is_overflow(tokens, model));
}

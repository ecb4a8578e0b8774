#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace coderun {

using json = nlohmann::json;

// Type aliases
using SessionId = std::string;
using MessageId = std::string;
using PartId = std::string;
using CallId = std::string;

using Timestamp = std::chrono::system_clock::time_point;

// Milliseconds since epoch, the persisted form of Timestamp
int64_t to_epoch_ms(const Timestamp& ts);
Timestamp from_epoch_ms(int64_t ms);

// Result type for operations that can fail
template <typename T>
struct Result {
  std::optional<T> value;
  std::optional<std::string> error;

  bool ok() const {
    return value.has_value();
  }

  bool failed() const {
    return error.has_value();
  }

  static Result success(T val) {
    return Result{std::move(val), std::nullopt};
  }

  static Result failure(std::string err) {
    return Result{std::nullopt, std::move(err)};
  }
};

// Token accounting for one step or one message
struct Tokens {
  int64_t input = 0;
  int64_t output = 0;
  int64_t reasoning = 0;

  struct Cache {
    int64_t read = 0;
    int64_t write = 0;
  } cache;

  int64_t total() const {
    return input + output + reasoning + cache.read + cache.write;
  }

  Tokens& operator+=(const Tokens& other) {
    input += other.input;
    output += other.output;
    reasoning += other.reasoning;
    cache.read += other.cache.read;
    cache.write += other.cache.write;
    return *this;
  }

  json to_json() const;
  static Tokens from_json(const json& j);
};

// Finish reason reported by the provider for a step
enum class FinishReason { Stop, Length, ContentFilter, ToolCalls, Error, Other, Unknown };

std::string to_string(FinishReason reason);

FinishReason finish_reason_from_string(const std::string& str);

// Model info
struct ModelInfo {
  std::string id;
  std::string provider_id;
  std::string name;

  struct Limit {
    int64_t context = 0;
    int64_t input = 0;  // 0 = derive from context - output
    int64_t output = 0;
  } limit;

  struct Price {
    double input = 0;
    double output = 0;
    double cache_read = 0;
    double cache_write = 0;
  };

  struct Cost : Price {
    std::optional<Price> over_200k;
  };
  std::optional<Cost> cost;

  json to_json() const;
  static ModelInfo from_json(const json& j);
};

// Permission rules: last matching rule wins
enum class PermissionAction { Allow, Deny, Ask };

std::string to_string(PermissionAction action);
PermissionAction permission_action_from_string(const std::string& str);

struct PermissionRule {
  std::string permission;  // "*" wildcards allowed
  std::string pattern = "*";
  PermissionAction action = PermissionAction::Ask;
};

using Ruleset = std::vector<PermissionRule>;

json ruleset_to_json(const Ruleset& rules);
Ruleset ruleset_from_json(const json& j);

// Replace invalid UTF-8 sequences with U+FFFD
std::string sanitize_utf8(const std::string& input);

// Trim trailing whitespace
std::string trim_end(const std::string& input);

}  // namespace coderun

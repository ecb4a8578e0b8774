#include "core/types.hpp"

namespace coderun {

int64_t to_epoch_ms(const Timestamp& ts) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

Timestamp from_epoch_ms(int64_t ms) {
  return Timestamp(std::chrono::milliseconds(ms));
}

json Tokens::to_json() const {
  return {{"input", input}, {"output", output}, {"reasoning", reasoning}, {"cache", {{"read", cache.read}, {"write", cache.write}}}};
}

Tokens Tokens::from_json(const json& j) {
  Tokens tokens;
  tokens.input = j.value("input", int64_t(0));
  tokens.output = j.value("output", int64_t(0));
  tokens.reasoning = j.value("reasoning", int64_t(0));
  if (j.contains("cache")) {
    tokens.cache.read = j["cache"].value("read", int64_t(0));
    tokens.cache.write = j["cache"].value("write", int64_t(0));
  }
  return tokens;
}

std::string to_string(FinishReason reason) {
  switch (reason) {
    case FinishReason::Stop:
      return "stop";
    case FinishReason::Length:
      return "length";
    case FinishReason::ContentFilter:
      return "content-filter";
    case FinishReason::ToolCalls:
      return "tool-calls";
    case FinishReason::Error:
      return "error";
    case FinishReason::Other:
      return "other";
    case FinishReason::Unknown:
      return "unknown";
  }
  return "unknown";
}

FinishReason finish_reason_from_string(const std::string& str) {
  if (str == "stop" || str == "end_turn") return FinishReason::Stop;
  if (str == "length" || str == "max_tokens") return FinishReason::Length;
  if (str == "content-filter" || str == "content_filter") return FinishReason::ContentFilter;
  if (str == "tool-calls" || str == "tool_calls" || str == "tool_use") return FinishReason::ToolCalls;
  if (str == "error") return FinishReason::Error;
  if (str == "other") return FinishReason::Other;
  return FinishReason::Unknown;
}

namespace {

json price_to_json(const ModelInfo::Price& price) {
  return {{"input", price.input}, {"output", price.output}, {"cache_read", price.cache_read}, {"cache_write", price.cache_write}};
}

ModelInfo::Price price_from_json(const json& j) {
  ModelInfo::Price price;
  price.input = j.value("input", 0.0);
  price.output = j.value("output", 0.0);
  price.cache_read = j.value("cache_read", 0.0);
  price.cache_write = j.value("cache_write", 0.0);
  return price;
}

}  // namespace

json ModelInfo::to_json() const {
  json j;
  j["id"] = id;
  j["provider_id"] = provider_id;
  j["name"] = name;
  j["limit"] = {{"context", limit.context}, {"input", limit.input}, {"output", limit.output}};
  if (cost) {
    auto c = price_to_json(*cost);
    if (cost->over_200k) {
      c["context_over_200k"] = price_to_json(*cost->over_200k);
    }
    j["cost"] = c;
  }
  return j;
}

ModelInfo ModelInfo::from_json(const json& j) {
  ModelInfo model;
  model.id = j.value("id", "");
  model.provider_id = j.value("provider_id", "");
  model.name = j.value("name", model.id);
  if (j.contains("limit")) {
    const auto& l = j["limit"];
    model.limit.context = l.value("context", int64_t(0));
    model.limit.input = l.value("input", int64_t(0));
    model.limit.output = l.value("output", int64_t(0));
  }
  if (j.contains("cost")) {
    Cost cost;
    static_cast<Price&>(cost) = price_from_json(j["cost"]);
    if (j["cost"].contains("context_over_200k")) {
      cost.over_200k = price_from_json(j["cost"]["context_over_200k"]);
    }
    model.cost = cost;
  }
  return model;
}

std::string to_string(PermissionAction action) {
  switch (action) {
    case PermissionAction::Allow:
      return "allow";
    case PermissionAction::Deny:
      return "deny";
    case PermissionAction::Ask:
      return "ask";
  }
  return "ask";
}

PermissionAction permission_action_from_string(const std::string& str) {
  if (str == "allow") return PermissionAction::Allow;
  if (str == "deny") return PermissionAction::Deny;
  return PermissionAction::Ask;
}

json ruleset_to_json(const Ruleset& rules) {
  json j = json::array();
  for (const auto& rule : rules) {
    j.push_back({{"permission", rule.permission}, {"pattern", rule.pattern}, {"action", to_string(rule.action)}});
  }
  return j;
}

Ruleset ruleset_from_json(const json& j) {
  Ruleset rules;
  if (!j.is_array()) {
    return rules;
  }
  for (const auto& r : j) {
    rules.push_back({r.value("permission", "*"), r.value("pattern", "*"), permission_action_from_string(r.value("action", "ask"))});
  }
  return rules;
}

std::string sanitize_utf8(const std::string& input) {
  std::string output;
  output.reserve(input.size());

  size_t i = 0;
  while (i < input.size()) {
    unsigned char c = static_cast<unsigned char>(input[i]);

    if (c <= 0x7F) {
      output.push_back(static_cast<char>(c));
      i++;
    } else if ((c & 0xE0) == 0xC0) {
      if (i + 1 < input.size() && (static_cast<unsigned char>(input[i + 1]) & 0xC0) == 0x80) {
        uint32_t cp = ((c & 0x1F) << 6) | (static_cast<unsigned char>(input[i + 1]) & 0x3F);
        if (cp >= 0x80) {
          output.append(input, i, 2);
        } else {
          output.append("\xEF\xBF\xBD");
        }
        i += 2;
      } else {
        output.append("\xEF\xBF\xBD");
        i++;
      }
    } else if ((c & 0xF0) == 0xE0) {
      if (i + 2 < input.size() && (static_cast<unsigned char>(input[i + 1]) & 0xC0) == 0x80 &&
          (static_cast<unsigned char>(input[i + 2]) & 0xC0) == 0x80) {
        uint32_t cp =
            ((c & 0x0F) << 12) | ((static_cast<unsigned char>(input[i + 1]) & 0x3F) << 6) | (static_cast<unsigned char>(input[i + 2]) & 0x3F);
        if (cp >= 0x800 && (cp < 0xD800 || cp > 0xDFFF)) {
          output.append(input, i, 3);
        } else {
          output.append("\xEF\xBF\xBD");
        }
        i += 3;
      } else {
        output.append("\xEF\xBF\xBD");
        i++;
      }
    } else if ((c & 0xF8) == 0xF0) {
      if (i + 3 < input.size() && (static_cast<unsigned char>(input[i + 1]) & 0xC0) == 0x80 &&
          (static_cast<unsigned char>(input[i + 2]) & 0xC0) == 0x80 && (static_cast<unsigned char>(input[i + 3]) & 0xC0) == 0x80) {
        uint32_t cp = ((c & 0x07) << 18) | ((static_cast<unsigned char>(input[i + 1]) & 0x3F) << 12) |
                      ((static_cast<unsigned char>(input[i + 2]) & 0x3F) << 6) | (static_cast<unsigned char>(input[i + 3]) & 0x3F);
        if (cp >= 0x10000 && cp <= 0x10FFFF) {
          output.append(input, i, 4);
        } else {
          output.append("\xEF\xBF\xBD");
        }
        i += 4;
      } else {
        output.append("\xEF\xBF\xBD");
        i++;
      }
    } else {
      // Invalid leading byte
      output.append("\xEF\xBF\xBD");
      i++;
    }
  }

  return output;
}

std::string trim_end(const std::string& input) {
  auto end = input.find_last_not_of(" \t\r\n\f\v");
  if (end == std::string::npos) return "";
  return input.substr(0, end + 1);
}

}  // namespace coderun

#include "config.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>

namespace coderun {

namespace fs = std::filesystem;

namespace {

bool is_truthy(const char* value) {
  if (!value) return false;
  std::string v(value);
  return v == "true" || v == "1" || v == "yes";
}

}  // namespace

Config Config::from_json(const json& j) {
  Config config;

  if (j.contains("experimental")) {
    const auto& exp = j["experimental"];
    config.experimental.stream_idle_timeout = std::chrono::milliseconds(exp.value("stream_idle_timeout", int64_t(60000)));
    config.experimental.tool_input_pending_timeout = std::chrono::milliseconds(exp.value("tool_input_pending_timeout", int64_t(300000)));
    config.experimental.continue_loop_on_deny = exp.value("continue_loop_on_deny", false);
  }

  if (j.contains("streaming")) {
    config.streaming.delta_flush_interval = std::chrono::milliseconds(j["streaming"].value("delta_flush_interval", int64_t(50)));
  }

  if (j.contains("retry")) {
    const auto& r = j["retry"];
    config.retry.max_idle_timeout_retries = r.value("max_idle_timeout_retries", 3);
    config.retry.initial_delay = std::chrono::milliseconds(r.value("initial_delay", int64_t(2000)));
    config.retry.backoff_factor = r.value("backoff_factor", 2.0);
    config.retry.max_delay_no_headers = std::chrono::milliseconds(r.value("max_delay_no_headers", int64_t(30000)));
  }

  if (j.contains("compaction")) {
    config.compaction.auto_compact = j["compaction"].value("auto", true);
  }

  config.snapshot = j.value("snapshot", true);

  if (j.contains("permission")) {
    config.permission = ruleset_from_json(j["permission"]);
  }

  config.log_level = j.value("log_level", "info");
  if (j.contains("log_file")) {
    config.log_file = j["log_file"].get<std::string>();
  }

  return config;
}

json Config::to_json() const {
  json j;

  j["experimental"] = {{"stream_idle_timeout", experimental.stream_idle_timeout.count()},
                       {"tool_input_pending_timeout", experimental.tool_input_pending_timeout.count()},
                       {"continue_loop_on_deny", experimental.continue_loop_on_deny}};

  j["streaming"] = {{"delta_flush_interval", streaming.delta_flush_interval.count()}};

  j["retry"] = {{"max_idle_timeout_retries", retry.max_idle_timeout_retries},
                {"initial_delay", retry.initial_delay.count()},
                {"backoff_factor", retry.backoff_factor},
                {"max_delay_no_headers", retry.max_delay_no_headers.count()}};

  j["compaction"] = {{"auto", compaction.auto_compact}};
  j["snapshot"] = snapshot;
  j["permission"] = ruleset_to_json(permission);

  j["log_level"] = log_level;
  if (log_file) {
    j["log_file"] = log_file->string();
  }

  return j;
}

Config Config::load(const fs::path& path) {
  if (!fs::exists(path)) {
    return Config{};
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    spdlog::warn("Failed to open config file: {}", path.string());
    return Config{};
  }

  try {
    return from_json(json::parse(file));
  } catch (const std::exception& e) {
    spdlog::warn("Failed to parse config file {}: {}, using defaults", path.string(), e.what());
    return Config{};
  }
}

Config Config::load_default() {
  // Try to load from project config first, then global
  auto project_config = config_paths::project_config_file();
  if (fs::exists(project_config)) {
    return load(project_config);
  }

  auto global_config = config_paths::default_config_file();
  if (fs::exists(global_config)) {
    return load(global_config);
  }

  return Config{};
}

Config Config::from_env() {
  Config config = load_default();

  if (const char* idle = std::getenv("CODERUN_STREAM_IDLE_TIMEOUT")) {
    try {
      config.experimental.stream_idle_timeout = std::chrono::milliseconds(std::stoll(idle));
    } catch (const std::exception& e) {
      spdlog::warn("Ignoring invalid CODERUN_STREAM_IDLE_TIMEOUT '{}': {}", idle, e.what());
    }
  }

  if (const char* deny = std::getenv("CODERUN_CONTINUE_ON_DENY")) {
    config.experimental.continue_loop_on_deny = is_truthy(deny);
  }

  if (const char* level = std::getenv("CODERUN_LOG_LEVEL")) {
    config.log_level = level;
  }

  return config;
}

void Config::save(const fs::path& path) const {
  std::error_code ec;
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
  }

  std::ofstream file(path);
  if (!file.is_open()) {
    spdlog::warn("Failed to write config file: {}", path.string());
    return;
  }
  file << to_json().dump(2);
}

namespace config_paths {

fs::path home_dir() {
  const char* home = std::getenv("HOME");
  if (home) {
    return fs::path(home);
  }
  return fs::current_path();
}

fs::path config_dir() {
  return home_dir() / ".config" / "coderun";
}

fs::path default_config_file() {
  return config_dir() / "config.json";
}

fs::path project_config_file() {
  return fs::current_path() / ".coderun" / "config.json";
}

fs::path data_dir() {
  if (const char* xdg = std::getenv("XDG_DATA_HOME")) {
    return fs::path(xdg) / "coderun";
  }
  return home_dir() / ".local" / "share" / "coderun";
}

}  // namespace config_paths

}  // namespace coderun

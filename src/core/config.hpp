#pragma once

#include <chrono>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

namespace coderun {

// Runtime configuration
struct Config {
  // Experimental stream settings
  struct Experimental {
    // Idle deadline for the model stream; 0 disables the watchdog
    std::chrono::milliseconds stream_idle_timeout{60000};

    // Deadline used while tool arguments are still buffering upstream
    std::chrono::milliseconds tool_input_pending_timeout{300000};

    // Keep looping after a rejected permission instead of stopping the turn
    bool continue_loop_on_deny = false;
  } experimental;

  struct Streaming {
    std::chrono::milliseconds delta_flush_interval{50};
  } streaming;

  struct Retry {
    int max_idle_timeout_retries = 3;
    std::chrono::milliseconds initial_delay{2000};
    double backoff_factor = 2;
    std::chrono::milliseconds max_delay_no_headers{30000};
  } retry;

  struct Compaction {
    bool auto_compact = true;
  } compaction;

  // Record working tree snapshots per step
  bool snapshot = true;

  // Default permission ruleset for the agent
  Ruleset permission;

  // Logging
  std::string log_level = "info";
  std::optional<std::filesystem::path> log_file;

  // Load from file
  static Config load(const std::filesystem::path& path);

  // Load default config from project/global config files
  static Config load_default();

  // Load config from environment variables, with file config as base
  // Reads: CODERUN_STREAM_IDLE_TIMEOUT (ms), CODERUN_CONTINUE_ON_DENY (true/1/yes),
  //        CODERUN_LOG_LEVEL
  static Config from_env();

  // Save to file
  void save(const std::filesystem::path& path) const;

  json to_json() const;
  static Config from_json(const json& j);
};

// Configuration paths
namespace config_paths {
std::filesystem::path home_dir();

std::filesystem::path config_dir();

std::filesystem::path default_config_file();

std::filesystem::path project_config_file();

// Where sessions, snapshots and logs are kept
std::filesystem::path data_dir();
}  // namespace config_paths

}  // namespace coderun

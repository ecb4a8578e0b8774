#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "core/config.hpp"
#include "core/uuid.hpp"

using namespace coderun;

namespace fs = std::filesystem;

// --- ConfigTest ---

TEST(ConfigTest, Defaults) {
  Config config;

  EXPECT_EQ(config.experimental.stream_idle_timeout.count(), 60000);
  EXPECT_EQ(config.experimental.tool_input_pending_timeout.count(), 300000);
  EXPECT_FALSE(config.experimental.continue_loop_on_deny);
  EXPECT_EQ(config.streaming.delta_flush_interval.count(), 50);
  EXPECT_EQ(config.retry.max_idle_timeout_retries, 3);
  EXPECT_EQ(config.retry.initial_delay.count(), 2000);
  EXPECT_DOUBLE_EQ(config.retry.backoff_factor, 2.0);
  EXPECT_EQ(config.retry.max_delay_no_headers.count(), 30000);
  EXPECT_TRUE(config.compaction.auto_compact);
  EXPECT_TRUE(config.snapshot);
  EXPECT_TRUE(config.permission.empty());
  EXPECT_EQ(config.log_level, "info");
}

TEST(ConfigTest, FromJsonPartialKeepsDefaults) {
  json j = {{"experimental", {{"stream_idle_timeout", 1500}}}, {"compaction", {{"auto", false}}}};

  auto config = Config::from_json(j);

  EXPECT_EQ(config.experimental.stream_idle_timeout.count(), 1500);
  EXPECT_EQ(config.experimental.tool_input_pending_timeout.count(), 300000);
  EXPECT_FALSE(config.compaction.auto_compact);
  EXPECT_EQ(config.streaming.delta_flush_interval.count(), 50);
}

TEST(ConfigTest, PermissionRules) {
  json j = {{"permission",
             json::array({{{"permission", "bash"}, {"pattern", "rm *"}, {"action", "deny"}},
                          {{"permission", "doom_loop"}, {"action", "allow"}}})}};

  auto config = Config::from_json(j);

  ASSERT_EQ(config.permission.size(), 2u);
  EXPECT_EQ(config.permission[0].permission, "bash");
  EXPECT_EQ(config.permission[0].pattern, "rm *");
  EXPECT_EQ(config.permission[0].action, PermissionAction::Deny);
  EXPECT_EQ(config.permission[1].pattern, "*");
  EXPECT_EQ(config.permission[1].action, PermissionAction::Allow);
}

TEST(ConfigTest, SaveAndLoad) {
  auto path = fs::temp_directory_path() / ("coderun_config_" + UUID::generate()) / "config.json";

  Config config;
  config.experimental.stream_idle_timeout = std::chrono::milliseconds(0);
  config.experimental.continue_loop_on_deny = true;
  config.retry.max_idle_timeout_retries = 5;
  config.snapshot = false;
  config.log_file = "/tmp/coderun.log";
  config.save(path);

  auto loaded = Config::load(path);
  EXPECT_EQ(loaded.experimental.stream_idle_timeout.count(), 0);
  EXPECT_TRUE(loaded.experimental.continue_loop_on_deny);
  EXPECT_EQ(loaded.retry.max_idle_timeout_retries, 5);
  EXPECT_FALSE(loaded.snapshot);
  ASSERT_TRUE(loaded.log_file.has_value());
  EXPECT_EQ(loaded.log_file->string(), "/tmp/coderun.log");

  std::error_code ec;
  fs::remove_all(path.parent_path(), ec);
}

TEST(ConfigTest, LoadMissingOrInvalidFileFallsBack) {
  auto dir = fs::temp_directory_path() / ("coderun_config_" + UUID::generate());
  EXPECT_EQ(Config::load(dir / "missing.json").streaming.delta_flush_interval.count(), 50);

  fs::create_directories(dir);
  {
    std::ofstream file(dir / "broken.json");
    file << "{ not json";
  }
  EXPECT_EQ(Config::load(dir / "broken.json").experimental.stream_idle_timeout.count(), 60000);

  std::error_code ec;
  fs::remove_all(dir, ec);
}

TEST(ConfigTest, EnvironmentOverrides) {
  setenv("CODERUN_STREAM_IDLE_TIMEOUT", "1234", 1);
  setenv("CODERUN_CONTINUE_ON_DENY", "yes", 1);
  setenv("CODERUN_LOG_LEVEL", "debug", 1);

  auto config = Config::from_env();
  EXPECT_EQ(config.experimental.stream_idle_timeout.count(), 1234);
  EXPECT_TRUE(config.experimental.continue_loop_on_deny);
  EXPECT_EQ(config.log_level, "debug");

  setenv("CODERUN_STREAM_IDLE_TIMEOUT", "soon", 1);
  EXPECT_EQ(Config::from_env().experimental.stream_idle_timeout.count(), Config::load_default().experimental.stream_idle_timeout.count());

  unsetenv("CODERUN_STREAM_IDLE_TIMEOUT");
  unsetenv("CODERUN_CONTINUE_ON_DENY");
  unsetenv("CODERUN_LOG_LEVEL");
}

// --- ConfigPathsTest ---

TEST(ConfigPathsTest, DataDirHonoursXdg) {
  setenv("XDG_DATA_HOME", "/tmp/xdg-data", 1);
  EXPECT_EQ(config_paths::data_dir(), fs::path("/tmp/xdg-data/coderun"));
  unsetenv("XDG_DATA_HOME");

  EXPECT_EQ(config_paths::data_dir(), config_paths::home_dir() / ".local" / "share" / "coderun");
  EXPECT_EQ(config_paths::default_config_file(), config_paths::home_dir() / ".config" / "coderun" / "config.json");
}

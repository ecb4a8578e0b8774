#include "log/log.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>

#include "core/config.hpp"

namespace coderun {

namespace {

// Rotate on startup: stem.log -> stem.0.log -> ... -> stem.{max_files-1}.log
void rotate_logs_on_startup(const std::filesystem::path& current_log, size_t max_files) {
  namespace fs = std::filesystem;

  if (!fs::exists(current_log) || max_files == 0) {
    return;
  }

  auto log_dir = current_log.parent_path();
  auto stem = current_log.stem().string();
  auto numbered = [&](size_t i) {
    return log_dir / (stem + "." + std::to_string(i) + ".log");
  };

  std::error_code ec;
  fs::remove(numbered(max_files - 1), ec);

  for (int i = static_cast<int>(max_files) - 2; i >= 0; --i) {
    auto from = numbered(static_cast<size_t>(i));
    if (fs::exists(from)) {
      fs::rename(from, numbered(static_cast<size_t>(i) + 1), ec);
    }
  }

  fs::rename(current_log, numbered(0), ec);
  if (ec) {
    std::cerr << "Failed to rotate log " << current_log << ": " << ec.message() << "\n";
  }
}

}  // namespace

void init_log(const std::string& log_path, size_t /* max_size */, size_t max_files, const std::string& level) {
  try {
    namespace fs = std::filesystem;

    fs::path actual_path = log_path.empty() ? config_paths::config_dir() / "log" / "coderun.log" : fs::path(log_path);

    std::error_code ec;
    if (actual_path.has_parent_path()) {
      fs::create_directories(actual_path.parent_path(), ec);
      if (ec) {
        std::cerr << "Failed to create log directory: " << ec.message() << "\n";
        return;
      }
    }

    rotate_logs_on_startup(actual_path, max_files);

    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(actual_path.string(), true);

    // Replace any logger left from a previous init
    spdlog::drop("coderun");
    auto logger = std::make_shared<spdlog::logger>("coderun", file_sink);

    logger->set_level(spdlog::level::from_str(level));
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");

    // Flush every record so a crash mid-turn keeps its trail
    logger->flush_on(spdlog::level::trace);

    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);

    spdlog::info("=== coderun started (log: {}) ===", actual_path.string());
  } catch (const spdlog::spdlog_ex& ex) {
    std::cerr << "Failed to init logger: " << ex.what() << "\n";
  }
}

std::shared_ptr<spdlog::logger> get_logger() {
  return spdlog::default_logger();
}

}  // namespace coderun

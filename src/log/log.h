#ifndef CODERUN_LOG_H
#define CODERUN_LOG_H

#include <memory>
#include <string>

namespace spdlog {
class logger;
}

namespace coderun {

/**
 * Initialize logging
 *
 * Logs rotate per process start:
 * - the current coderun.log is renamed to coderun.0.log and a fresh file is opened
 * - older logs shift back: coderun.0.log -> coderun.1.log -> ... -> coderun.{max_files-1}.log
 * - the oldest log is deleted
 *
 * @param log_path  log file path (default ~/.config/coderun/log/coderun.log)
 * @param max_size  maximum size of one file in bytes, currently unused
 * @param max_files number of rotated files kept
 * @param level     trace, debug, info, warn, err, critical or off
 */
void init_log(const std::string& log_path = "", size_t max_size = 10 * 1024 * 1024, size_t max_files = 10, const std::string& level = "info");

/**
 * Default logger
 */
std::shared_ptr<spdlog::logger> get_logger();

}  // namespace coderun

#endif  // CODERUN_LOG_H

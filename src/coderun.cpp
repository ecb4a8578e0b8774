// Library initialization
#include "coderun/coderun.hpp"

#include <spdlog/spdlog.h>

#include "core/version.hpp"
#include "log/log.h"

namespace coderun {

void init(const Config &config) {
  init_log(config.log_file ? config.log_file->string() : "", 10 * 1024 * 1024, 10, config.log_level);
  spdlog::info("coderun {} initialized (idle timeout {}ms, flush interval {}ms)", version(),
               config.experimental.stream_idle_timeout.count(), config.streaming.delta_flush_interval.count());
}

void shutdown() {
  plugin::Hooks::instance().clear();
  Bus::instance().reset();
  spdlog::shutdown();
}

std::string version() {
  return CODERUN_VERSION_STRING;
}

}  // namespace coderun

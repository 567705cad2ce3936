#include "adaptive_cache/logging.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace adaptive_cache {

std::shared_ptr<spdlog::logger> logger() {
  static std::once_flag once;
  std::call_once(once, [] {
    if (!spdlog::get(kLoggerName))
      spdlog::stdout_color_mt(kLoggerName);
  });
  auto l = spdlog::get(kLoggerName);
  return l ? l : spdlog::default_logger();
}

} // namespace adaptive_cache

#pragma once

#include <memory>

#include <spdlog/spdlog.h>

namespace adaptive_cache {

inline constexpr const char *kLoggerName = "adaptive_cache";

// Named logger shared by every cache instance in the process. Created with
// a colored stdout sink on first use unless the host registered one under
// kLoggerName already.
std::shared_ptr<spdlog::logger> logger();

} // namespace adaptive_cache

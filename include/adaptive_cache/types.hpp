#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace adaptive_cache {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;

// Source of "now" for everything time dependent. Tests swap in a manual
// clock; production uses Clock::now.
using NowFn = std::function<TimePoint()>;

inline NowFn system_now() {
  return [] { return Clock::now(); };
}

struct ScoreWeights {
  double priority{2.0};
  double frequency{1.5};
  double freshness{1.0};
  double size{0.1};
};

} // namespace adaptive_cache

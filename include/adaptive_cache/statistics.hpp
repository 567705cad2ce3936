#pragma once

#include "adaptive_cache/types.hpp"

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace adaptive_cache {

struct StatsCounters {
  std::uint64_t hits{0};
  std::uint64_t misses{0};
  std::uint64_t sets{0};
  std::uint64_t removes{0};
  std::uint64_t evictions{0};
  std::uint64_t expirations{0};
  std::uint64_t rejected{0};
  std::uint64_t compressed_items{0};
  // bytes saved across every compressed write
  std::uint64_t compression_savings{0};
};

struct EfficiencyMetrics {
  double hit_rate{0.0};
  double miss_rate{0.0};
  // sets / (hits + misses + sets)
  double write_ratio{0.0};
  // removes / sets
  double churn_ratio{0.0};
  double requests_per_second{0.0};
};

// Thread-safe accumulator. Every cache operation reports here explicitly;
// derived figures are computed when asked for.
class Statistics {
public:
  explicit Statistics(NowFn now = system_now());

  void record_hit(const std::string &key);
  void record_miss(const std::string &key);
  void record_set(const std::string &key);
  void record_remove(const std::string &key);
  void record_eviction();
  void record_expiration();
  void record_rejection();
  void record_compression(std::size_t saved_bytes);

  StatsCounters snapshot() const;
  double hit_rate() const;
  // Mean time since last access over the tracked keys, in milliseconds.
  double average_access_time() const;
  EfficiencyMetrics efficiency() const;
  std::size_t tracked_keys() const;

  void reset();

private:
  static double ratio(std::uint64_t num, std::uint64_t den);

  NowFn now_;
  mutable std::mutex mu_;
  StatsCounters counters_;
  std::unordered_map<std::string, TimePoint> last_access_;
  TimePoint started_at_;
};

} // namespace adaptive_cache

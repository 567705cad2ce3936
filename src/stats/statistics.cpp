#include "adaptive_cache/statistics.hpp"

#include <chrono>

namespace adaptive_cache {

Statistics::Statistics(NowFn now) : now_(std::move(now)), started_at_(now_()) {}

void Statistics::record_hit(const std::string &key) {
  const auto now = now_();
  std::lock_guard lock(mu_);
  ++counters_.hits;
  last_access_[key] = now;
}

void Statistics::record_miss(const std::string &) {
  std::lock_guard lock(mu_);
  ++counters_.misses;
}

void Statistics::record_set(const std::string &key) {
  const auto now = now_();
  std::lock_guard lock(mu_);
  ++counters_.sets;
  last_access_[key] = now;
}

void Statistics::record_remove(const std::string &key) {
  std::lock_guard lock(mu_);
  ++counters_.removes;
  last_access_.erase(key);
}

void Statistics::record_eviction() {
  std::lock_guard lock(mu_);
  ++counters_.evictions;
}

void Statistics::record_expiration() {
  std::lock_guard lock(mu_);
  ++counters_.expirations;
}

void Statistics::record_rejection() {
  std::lock_guard lock(mu_);
  ++counters_.rejected;
}

void Statistics::record_compression(std::size_t saved_bytes) {
  std::lock_guard lock(mu_);
  ++counters_.compressed_items;
  counters_.compression_savings += saved_bytes;
}

StatsCounters Statistics::snapshot() const {
  std::lock_guard lock(mu_);
  return counters_;
}

double Statistics::ratio(std::uint64_t num, std::uint64_t den) {
  if (den == 0)
    return 0.0;
  return static_cast<double>(num) / static_cast<double>(den);
}

double Statistics::hit_rate() const {
  std::lock_guard lock(mu_);
  return ratio(counters_.hits, counters_.hits + counters_.misses);
}

double Statistics::average_access_time() const {
  const auto now = now_();
  std::lock_guard lock(mu_);
  if (last_access_.empty())
    return 0.0;
  double total_ms = 0.0;
  for (const auto &[key, at] : last_access_)
    total_ms += std::chrono::duration<double, std::milli>(now - at).count();
  return total_ms / static_cast<double>(last_access_.size());
}

EfficiencyMetrics Statistics::efficiency() const {
  const auto now = now_();
  std::lock_guard lock(mu_);
  const auto lookups = counters_.hits + counters_.misses;
  EfficiencyMetrics m;
  m.hit_rate = ratio(counters_.hits, lookups);
  m.miss_rate = ratio(counters_.misses, lookups);
  m.write_ratio = ratio(counters_.sets, lookups + counters_.sets);
  m.churn_ratio = ratio(counters_.removes, counters_.sets);
  const double uptime_s =
      std::chrono::duration<double>(now - started_at_).count();
  if (uptime_s > 0.0)
    m.requests_per_second =
        static_cast<double>(lookups + counters_.sets) / uptime_s;
  return m;
}

std::size_t Statistics::tracked_keys() const {
  std::lock_guard lock(mu_);
  return last_access_.size();
}

void Statistics::reset() {
  const auto now = now_();
  std::lock_guard lock(mu_);
  counters_ = {};
  last_access_.clear();
  started_at_ = now;
}

} // namespace adaptive_cache

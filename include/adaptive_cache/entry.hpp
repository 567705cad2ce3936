#pragma once

#include "adaptive_cache/types.hpp"

#include <any>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace adaptive_cache {

inline constexpr int kMinPriority = 0;
inline constexpr int kMaxPriority = 100;

class CacheEntry {
public:
  CacheEntry(std::any value, std::size_t size_bytes, int priority,
             TimePoint now, std::optional<Duration> ttl = std::nullopt);

  const std::any &value() const { return value_; }
  std::size_t size_bytes() const { return size_bytes_; }
  int priority() const { return priority_; }
  std::uint64_t frequency() const { return frequency_; }
  TimePoint created_at() const { return created_at_; }
  TimePoint last_accessed() const { return last_accessed_; }
  const std::optional<TimePoint> &expires_at() const { return expires_at_; }

  bool is_expired(TimePoint now) const;
  std::int64_t age_seconds(TimePoint now) const;

  void update_access(TimePoint now);
  void increment_frequency(TimePoint now);

  // Higher priority, higher frequency, younger age and smaller size each
  // raise the score. Size penalty saturates at 100 KiB.
  double adaptive_score(TimePoint now, const ScoreWeights &weights = {}) const;

  CacheEntry copy_with_new_ttl(Duration ttl, TimePoint now) const;

private:
  std::any value_;
  std::size_t size_bytes_{0};
  int priority_{0};
  std::uint64_t frequency_{1};
  TimePoint created_at_{};
  TimePoint last_accessed_{};
  std::optional<TimePoint> expires_at_;
};

} // namespace adaptive_cache

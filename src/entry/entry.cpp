#include "adaptive_cache/entry.hpp"

#include <algorithm>
#include <chrono>

namespace adaptive_cache {

CacheEntry::CacheEntry(std::any value, std::size_t size_bytes, int priority,
                       TimePoint now, std::optional<Duration> ttl)
    : value_(std::move(value)), size_bytes_(size_bytes),
      priority_(std::clamp(priority, kMinPriority, kMaxPriority)),
      created_at_(now), last_accessed_(now) {
  if (ttl.has_value())
    expires_at_ = now + *ttl;
}

bool CacheEntry::is_expired(TimePoint now) const {
  return expires_at_.has_value() && now > *expires_at_;
}

std::int64_t CacheEntry::age_seconds(TimePoint now) const {
  const auto ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(now - created_at_)
          .count();
  // ceil(ms / 1000) without going through floating point
  const std::int64_t secs = ms <= 0 ? 0 : (ms + 999) / 1000;
  return std::max<std::int64_t>(1, secs);
}

void CacheEntry::update_access(TimePoint now) { last_accessed_ = now; }

void CacheEntry::increment_frequency(TimePoint now) {
  ++frequency_;
  update_access(now);
}

double CacheEntry::adaptive_score(TimePoint now,
                                  const ScoreWeights &weights) const {
  const double freshness =
      100.0 / (static_cast<double>(age_seconds(now)) + 1.0);
  const double size_penalty =
      std::min(static_cast<double>(size_bytes_) / 1024.0, 100.0);
  return static_cast<double>(priority_) * weights.priority +
         static_cast<double>(frequency_) * weights.frequency +
         freshness * weights.freshness - size_penalty * weights.size;
}

CacheEntry CacheEntry::copy_with_new_ttl(Duration ttl, TimePoint now) const {
  CacheEntry copy(*this);
  copy.expires_at_ = now + ttl;
  return copy;
}

} // namespace adaptive_cache

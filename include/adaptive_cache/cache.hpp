#pragma once

#include "adaptive_cache/backing_store.hpp"
#include "adaptive_cache/cleanup_service.hpp"
#include "adaptive_cache/config.hpp"
#include "adaptive_cache/errors.hpp"
#include "adaptive_cache/operations.hpp"
#include "adaptive_cache/policy.hpp"
#include "adaptive_cache/statistics.hpp"

#include <any>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace adaptive_cache {

struct CacheStats {
  std::size_t total_entries{0};
  std::size_t total_size{0};
  double hit_rate{0.0};
  // milliseconds
  double average_access_time{0.0};
  std::optional<TimePoint> last_cleanup;
  StatsCounters counters;
};

// The cache a host application talks to. Owns the entry table, the
// statistics, the eviction policy and the background cleanup thread.
class AdaptiveCache {
public:
  explicit AdaptiveCache(CacheConfig cfg = {},
                         std::unique_ptr<IEvictionPolicy> policy = nullptr,
                         std::shared_ptr<IBackingStore> store = nullptr,
                         NowFn now = system_now());
  ~AdaptiveCache();

  AdaptiveCache(const AdaptiveCache &) = delete;
  AdaptiveCache &operator=(const AdaptiveCache &) = delete;

  template <class T> std::optional<T> get(const std::string &key) {
    ensure_active("get", &key);
    return ops_->get<T>(key);
  }

  // compress packs large text and byte payloads with zlib; it is implied
  // for every set when compression_enabled is configured.
  template <class T>
  bool set(const std::string &key, T value,
           std::optional<Duration> ttl = std::nullopt,
           std::optional<int> priority = std::nullopt,
           std::string *err = nullptr, bool compress = false) {
    ensure_active("set", &key);
    return ops_->set_any(key, detail::make_stored(std::move(value)), ttl,
                         priority, {}, err, compress);
  }

  template <class T>
  bool set_with_tags(const std::string &key, T value,
                     const std::vector<std::string> &tags,
                     std::optional<Duration> ttl = std::nullopt,
                     std::optional<int> priority = std::nullopt,
                     std::string *err = nullptr, bool compress = false) {
    ensure_active("set_with_tags", &key);
    return ops_->set_any(key, detail::make_stored(std::move(value)), ttl,
                         priority, tags, err, compress);
  }

  template <class T, class F>
  T get_or_compute(const std::string &key, F &&compute,
                   std::optional<Duration> ttl = std::nullopt) {
    ensure_active("get_or_compute", &key);
    return ops_->get_or_compute<T>(key, std::forward<F>(compute), ttl);
  }

  bool expire(const std::string &key, Duration ttl);
  bool invalidate(const std::string &key);
  std::size_t invalidate_by_tag(const std::string &tag);
  // '*' and '?' make an anchored glob; otherwise a substring match.
  std::size_t invalidate_pattern(const std::string &pattern);
  std::size_t invalidate_all();
  std::vector<std::string> get_keys_by_tag(const std::string &tag) const;

  bool contains(const std::string &key) const;
  std::size_t size() const;
  std::size_t memory_used() const;
  std::vector<std::string> keys() const;

  std::size_t warm(const std::map<std::string, std::any> &data,
                   std::optional<Duration> ttl = std::nullopt);
  // Removes expired entries, then trims to 90% of max_cache_size.
  std::size_t trigger_garbage_collection();
  std::size_t persist_to_storage();
  std::size_t restore_from_storage();

  CacheStats get_stats() const;
  EfficiencyMetrics get_efficiency() const;
  CleanupReport get_cleanup_report() const;
  CleanupStats get_cleanup_stats() const;
  CleanupResult force_cleanup(bool include_optimization = true);
  void reset_stats();
  std::string info() const;

  void start_background_cleanup();
  void stop_background_cleanup();
  // Stops maintenance and releases every entry. Idempotent.
  void dispose();
  bool disposed() const { return state_.disposed; }

  const CacheConfig &config() const { return cfg_; }
  const IEvictionPolicy &policy() const { return *policy_; }

private:
  void ensure_active(const char *operation,
                     const std::string *key = nullptr) const;

  CacheConfig cfg_;
  NowFn now_;
  std::unique_ptr<IEvictionPolicy> policy_;
  CacheState state_;
  Statistics stats_;
  std::unique_ptr<OperationsService> ops_;
  // Declared last so the thread stops before anything it touches goes away.
  std::unique_ptr<CleanupService> cleanup_;
};

} // namespace adaptive_cache

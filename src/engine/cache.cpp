#include "adaptive_cache/cache.hpp"
#include "adaptive_cache/logging.hpp"
#include "adaptive_cache/size_estimator.hpp"

#include <sstream>

namespace adaptive_cache {

AdaptiveCache::AdaptiveCache(CacheConfig cfg,
                             std::unique_ptr<IEvictionPolicy> policy,
                             std::shared_ptr<IBackingStore> store, NowFn now)
    : cfg_(std::move(cfg)), now_(std::move(now)),
      policy_(policy ? std::move(policy) : make_policy_by_name(cfg_.policy)),
      stats_(now_) {
  auto params = policy_->params();
  params.weights = cfg_.weights;
  policy_->set_params(params);

  ops_ = std::make_unique<OperationsService>(cfg_, state_, stats_, *policy_,
                                             now_, std::move(store));
  cleanup_ = std::make_unique<CleanupService>(
      std::vector<ICacheSystem *>{ops_.get()}, cfg_.cleanup_interval, now_);
  if (cfg_.enable_background_cleanup)
    cleanup_->start_background_cleanup();
  logger()->info("cache created: policy={} max_entries={} max_memory={}",
                 policy_->name(), cfg_.max_cache_size,
                 cfg_.max_memory_bytes > 0 ? format_size(cfg_.max_memory_bytes)
                                           : std::string("unlimited"));
}

AdaptiveCache::~AdaptiveCache() { dispose(); }

void AdaptiveCache::ensure_active(const char *operation,
                                  const std::string *key) const {
  if (!state_.disposed)
    return;
  if (key)
    throw CacheError(operation, "cache has been disposed", *key);
  throw CacheError(operation, "cache has been disposed");
}

bool AdaptiveCache::expire(const std::string &key, Duration ttl) {
  ensure_active("expire", &key);
  return ops_->expire(key, ttl);
}

bool AdaptiveCache::invalidate(const std::string &key) {
  ensure_active("invalidate", &key);
  return ops_->invalidate(key);
}

std::size_t AdaptiveCache::invalidate_by_tag(const std::string &tag) {
  ensure_active("invalidate_by_tag");
  return ops_->invalidate_by_tag(tag);
}

std::size_t AdaptiveCache::invalidate_pattern(const std::string &pattern) {
  ensure_active("invalidate_pattern");
  return ops_->invalidate_pattern(pattern);
}

std::size_t AdaptiveCache::invalidate_all() {
  ensure_active("invalidate_all");
  return ops_->invalidate_all();
}

std::vector<std::string>
AdaptiveCache::get_keys_by_tag(const std::string &tag) const {
  ensure_active("get_keys_by_tag");
  return ops_->keys_by_tag(tag);
}

bool AdaptiveCache::contains(const std::string &key) const {
  ensure_active("contains", &key);
  return ops_->contains(key);
}

std::size_t AdaptiveCache::size() const { return ops_->size(); }

std::size_t AdaptiveCache::memory_used() const { return ops_->memory_used(); }

std::vector<std::string> AdaptiveCache::keys() const {
  ensure_active("keys");
  return ops_->keys();
}

std::size_t AdaptiveCache::warm(const std::map<std::string, std::any> &data,
                                std::optional<Duration> ttl) {
  ensure_active("warm");
  std::size_t stored = 0;
  for (const auto &[key, value] : data) {
    std::string err;
    if (ops_->set_any(key, value, ttl, std::nullopt, {}, &err))
      ++stored;
    else
      logger()->warn("warm skipped {}: {}", key, err);
  }
  return stored;
}

std::size_t AdaptiveCache::trigger_garbage_collection() {
  ensure_active("trigger_garbage_collection");
  const auto expired = ops_->remove_expired_entries();
  // ceil(90% of capacity)
  const auto target = (cfg_.max_cache_size * 9 + 9) / 10;
  const auto trimmed = ops_->trim_to(target);
  logger()->debug("garbage collection: {} expired, {} trimmed", expired,
                  trimmed);
  return expired + trimmed;
}

std::size_t AdaptiveCache::persist_to_storage() {
  ensure_active("persist_to_storage");
  return ops_->persist_to_store();
}

std::size_t AdaptiveCache::restore_from_storage() {
  ensure_active("restore_from_storage");
  return ops_->restore_from_store();
}

CacheStats AdaptiveCache::get_stats() const {
  CacheStats s;
  s.total_entries = ops_->size();
  s.total_size = ops_->memory_used();
  s.hit_rate = stats_.hit_rate();
  s.average_access_time = stats_.average_access_time();
  s.last_cleanup = cleanup_->last_cleanup();
  s.counters = stats_.snapshot();
  return s;
}

EfficiencyMetrics AdaptiveCache::get_efficiency() const {
  return stats_.efficiency();
}

CleanupReport AdaptiveCache::get_cleanup_report() const {
  return cleanup_->cleanup_report();
}

CleanupStats AdaptiveCache::get_cleanup_stats() const {
  return cleanup_->cleanup_stats();
}

CleanupResult AdaptiveCache::force_cleanup(bool include_optimization) {
  ensure_active("force_cleanup");
  return cleanup_->force_cleanup(include_optimization);
}

void AdaptiveCache::reset_stats() { stats_.reset(); }

std::string AdaptiveCache::info() const {
  const auto counters = stats_.snapshot();
  const auto eff = stats_.efficiency();
  const auto sys = ops_->system_stats();
  const auto cleanup = cleanup_->cleanup_stats();
  std::ostringstream os;
  os << "policy_mode:" << policy_->name() << "\n";
  os << "policy_params_version:" << policy_->params().version << "\n";
  os << "keys:" << sys.entries << "\n";
  os << "expired_keys:" << sys.expired_entries << "\n";
  os << "max_keys:" << cfg_.max_cache_size << "\n";
  os << "utilization:" << sys.utilization << "\n";
  os << "memory_used_bytes:" << sys.size_bytes << "\n";
  os << "memory_used_human:" << format_size(sys.size_bytes) << "\n";
  os << "memory_limit_bytes:" << cfg_.max_memory_bytes << "\n";
  os << "in_flight:" << ops_->in_flight_count() << "\n";
  os << "hits:" << counters.hits << "\n";
  os << "misses:" << counters.misses << "\n";
  os << "sets:" << counters.sets << "\n";
  os << "removes:" << counters.removes << "\n";
  os << "evictions:" << counters.evictions << "\n";
  os << "expirations:" << counters.expirations << "\n";
  os << "admissions_rejected:" << counters.rejected << "\n";
  os << "compressed_items:" << counters.compressed_items << "\n";
  os << "compression_savings_bytes:" << counters.compression_savings << "\n";
  os << "hit_rate:" << eff.hit_rate << "\n";
  os << "write_ratio:" << eff.write_ratio << "\n";
  os << "churn_ratio:" << eff.churn_ratio << "\n";
  os << "average_access_time_ms:" << stats_.average_access_time() << "\n";
  os << "cleanup_active:" << (cleanup.background_active ? 1 : 0) << "\n";
  os << "cleanup_runs:" << cleanup.background_runs << "\n";
  os << "cleanup_expired_removed:" << cleanup.total_expired_removed << "\n";
  os << "disposed:" << (state_.disposed ? 1 : 0) << "\n";
  return os.str();
}

void AdaptiveCache::start_background_cleanup() {
  ensure_active("start_background_cleanup");
  cleanup_->start_background_cleanup();
}

void AdaptiveCache::stop_background_cleanup() {
  cleanup_->stop_background_cleanup();
}

void AdaptiveCache::dispose() {
  if (state_.disposed.exchange(true))
    return;
  cleanup_->dispose();
  ops_->release_all();
  logger()->info("cache disposed");
}

} // namespace adaptive_cache

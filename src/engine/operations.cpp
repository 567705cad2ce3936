#include "adaptive_cache/operations.hpp"
#include "adaptive_cache/compression.hpp"
#include "adaptive_cache/logging.hpp"
#include "adaptive_cache/size_estimator.hpp"

#include <algorithm>
#include <regex>

namespace adaptive_cache {
namespace {

bool has_wildcard(const std::string &pattern) {
  return pattern.find_first_of("*?") != std::string::npos;
}

// Anchored glob when the pattern has '*' or '?', substring match otherwise.
std::function<bool(const std::string &)>
make_key_matcher(const std::string &pattern) {
  if (!has_wildcard(pattern)) {
    return [pattern](const std::string &key) {
      return key.find(pattern) != std::string::npos;
    };
  }
  std::string re = "^";
  for (char c : pattern) {
    switch (c) {
    case '*':
      re += ".*";
      break;
    case '?':
      re += '.';
      break;
    case '.': case '+': case '(': case ')': case '[': case ']': case '{':
    case '}': case '^': case '$': case '|': case '\\':
      re += '\\';
      re += c;
      break;
    default:
      re += c;
    }
  }
  re += '$';
  auto compiled = std::make_shared<std::regex>(re);
  return [compiled](const std::string &key) {
    return std::regex_match(key, *compiled);
  };
}

const char *cause_name(RemovalCause cause) {
  switch (cause) {
  case RemovalCause::Eviction:
    return "evicted";
  case RemovalCause::Expiration:
    return "expired";
  default:
    return "invalidated";
  }
}

} // namespace

OperationsService::OperationsService(const CacheConfig &cfg, CacheState &state,
                                     Statistics &stats,
                                     IEvictionPolicy &policy, NowFn now,
                                     std::shared_ptr<IBackingStore> store)
    : cfg_(cfg), state_(state), stats_(stats), policy_(policy),
      now_(std::move(now)), store_(std::move(store)) {}

std::optional<std::any> OperationsService::get_any(const std::string &key) {
  {
    std::lock_guard lock(state_.mu);
    const auto now = now_();
    tick_locked(now);
    auto it = state_.entries.find(key);
    if (it != state_.entries.end() && !it->second.is_expired(now)) {
      stats_.record_hit(key);
      it->second.increment_frequency(now);
      touch_locked(key);
      return materialize(it->second.value());
    }
    stats_.record_miss(key);
    if (it != state_.entries.end())
      remove_locked(key, RemovalCause::Expiration);
  }

  auto restored = load_from_store(key);
  if (!restored.has_value())
    return std::nullopt;
  std::lock_guard lock(state_.mu);
  // a concurrent set wins over the stored copy
  if (!state_.entries.contains(key))
    set_locked(key, *restored, std::nullopt, std::nullopt, {}, nullptr,
               now_());
  return restored;
}

bool OperationsService::set_any(const std::string &key, std::any value,
                                std::optional<Duration> ttl,
                                std::optional<int> priority,
                                const std::vector<std::string> &tags,
                                std::string *err, bool compress) {
  std::lock_guard lock(state_.mu);
  const auto now = now_();
  tick_locked(now);
  return set_locked(key, std::move(value), ttl, priority, tags, err, now,
                    compress);
}

bool OperationsService::expire(const std::string &key, Duration ttl) {
  std::lock_guard lock(state_.mu);
  const auto now = now_();
  auto it = state_.entries.find(key);
  if (it == state_.entries.end() || it->second.is_expired(now))
    return false;
  it->second = it->second.copy_with_new_ttl(ttl, now);
  arm_timer_locked(key, *it->second.expires_at());
  return true;
}

bool OperationsService::invalidate(const std::string &key) {
  bool removed;
  {
    std::lock_guard lock(state_.mu);
    removed = remove_locked(key, RemovalCause::Explicit);
  }
  remove_from_store({key});
  return removed;
}

std::size_t OperationsService::invalidate_by_tag(const std::string &tag) {
  std::vector<std::string> keys;
  std::size_t removed = 0;
  {
    std::lock_guard lock(state_.mu);
    keys = state_.tags.take(tag);
    for (const auto &key : keys)
      if (remove_locked(key, RemovalCause::Explicit))
        ++removed;
  }
  remove_from_store(keys);
  logger()->debug("invalidated {} keys tagged {}", removed, tag);
  return removed;
}

std::size_t OperationsService::invalidate_pattern(const std::string &pattern) {
  const auto matches = make_key_matcher(pattern);
  std::vector<std::string> keys;
  {
    std::lock_guard lock(state_.mu);
    for (const auto &[key, entry] : state_.entries)
      if (matches(key))
        keys.push_back(key);
    for (const auto &key : keys)
      remove_locked(key, RemovalCause::Explicit);
  }
  if (fallback_enabled()) {
    try {
      std::vector<std::string> stored;
      for (const auto &key : store_->keys())
        if (matches(key))
          stored.push_back(key);
      remove_from_store(stored);
    } catch (const std::exception &e) {
      logger()->warn("backing store key listing failed: {}", e.what());
    }
  }
  return keys.size();
}

std::size_t OperationsService::invalidate_all() {
  std::size_t removed = 0;
  {
    std::lock_guard lock(state_.mu);
    std::vector<std::string> keys;
    keys.reserve(state_.entries.size());
    for (const auto &[key, entry] : state_.entries)
      keys.push_back(key);
    for (const auto &key : keys)
      if (remove_locked(key, RemovalCause::Explicit))
        ++removed;
    state_.expiry_heap = {};
    state_.expiry_generation.clear();
    state_.tags.clear();
    state_.memory_used = 0;
  }
  if (fallback_enabled()) {
    try {
      store_->clear();
    } catch (const std::exception &e) {
      logger()->warn("backing store clear failed: {}", e.what());
    }
  }
  return removed;
}

std::vector<std::string>
OperationsService::keys_by_tag(const std::string &tag) const {
  std::lock_guard lock(state_.mu);
  return state_.tags.keys_for(tag);
}

std::vector<std::string> OperationsService::keys() const {
  std::lock_guard lock(state_.mu);
  std::vector<std::string> out;
  out.reserve(state_.entries.size());
  for (const auto &[key, entry] : state_.entries)
    out.push_back(key);
  std::sort(out.begin(), out.end());
  return out;
}

bool OperationsService::contains(const std::string &key) const {
  std::lock_guard lock(state_.mu);
  auto it = state_.entries.find(key);
  return it != state_.entries.end() && !it->second.is_expired(now_());
}

std::optional<CacheEntry>
OperationsService::peek_entry(const std::string &key) const {
  std::lock_guard lock(state_.mu);
  auto it = state_.entries.find(key);
  if (it == state_.entries.end())
    return std::nullopt;
  return it->second;
}

std::size_t OperationsService::size() const {
  std::lock_guard lock(state_.mu);
  return state_.entries.size();
}

std::size_t OperationsService::memory_used() const {
  std::lock_guard lock(state_.mu);
  return state_.memory_used;
}

std::size_t OperationsService::in_flight_count() const {
  std::lock_guard lock(state_.mu);
  return state_.in_flight.size();
}

std::size_t OperationsService::trim_to(std::size_t target) {
  std::lock_guard lock(state_.mu);
  const auto now = now_();
  std::size_t removed = 0;
  while (state_.entries.size() > target) {
    auto victim = policy_.pick_victim(
        {state_.entries, state_.access_order, now, nullptr});
    if (!victim.has_value())
      break;
    remove_locked(*victim, RemovalCause::Eviction);
    ++removed;
  }
  return removed;
}

std::size_t OperationsService::persist_to_store() {
  if (!store_)
    return 0;
  std::vector<std::pair<std::string, std::any>> snapshot;
  {
    std::lock_guard lock(state_.mu);
    const auto now = now_();
    for (const auto &[key, entry] : state_.entries)
      if (!entry.is_expired(now))
        snapshot.emplace_back(key, materialize(entry.value()));
  }
  std::size_t written = 0;
  for (const auto &[key, value] : snapshot) {
    try {
      store_->put(key, value);
      ++written;
    } catch (const std::exception &e) {
      logger()->warn("backing store put failed for {}: {}", key, e.what());
    }
  }
  return written;
}

std::size_t OperationsService::restore_from_store() {
  if (!store_)
    return 0;
  std::vector<std::string> stored;
  try {
    stored = store_->keys();
  } catch (const std::exception &e) {
    logger()->warn("backing store key listing failed: {}", e.what());
    return 0;
  }
  std::size_t restored = 0;
  for (const auto &key : stored) {
    std::optional<std::any> value;
    try {
      value = store_->get(key);
    } catch (const std::exception &e) {
      logger()->warn("backing store get failed for {}: {}", key, e.what());
      continue;
    }
    if (!value.has_value())
      continue;
    std::lock_guard lock(state_.mu);
    if (state_.entries.contains(key))
      continue;
    if (set_locked(key, std::move(*value), std::nullopt, std::nullopt, {},
                   nullptr, now_()))
      ++restored;
  }
  return restored;
}

void OperationsService::release_all() {
  std::lock_guard lock(state_.mu);
  state_.entries.clear();
  state_.access_order.clear();
  state_.order_index.clear();
  state_.expiry_heap = {};
  state_.expiry_generation.clear();
  state_.in_flight.clear();
  state_.tags.clear();
  state_.memory_used = 0;
}

std::size_t OperationsService::remove_expired_entries() {
  std::vector<std::pair<std::string, std::uint64_t>> due;
  {
    std::lock_guard lock(state_.mu);
    const auto now = now_();
    while (!state_.expiry_heap.empty() &&
           state_.expiry_heap.top().deadline < now) {
      const auto &node = state_.expiry_heap.top();
      auto g = state_.expiry_generation.find(node.key);
      if (g != state_.expiry_generation.end() &&
          g->second == node.generation)
        due.emplace_back(node.key, node.generation);
      state_.expiry_heap.pop();
    }
  }

  std::size_t removed = 0;
  for (const auto &[key, generation] : due) {
    std::lock_guard lock(state_.mu);
    auto g = state_.expiry_generation.find(key);
    if (g == state_.expiry_generation.end() || g->second != generation)
      continue;
    auto it = state_.entries.find(key);
    if (it != state_.entries.end() && it->second.is_expired(now_()) &&
        remove_locked(key, RemovalCause::Expiration))
      ++removed;
  }
  return removed;
}

CacheSystemStats OperationsService::system_stats() const {
  std::lock_guard lock(state_.mu);
  const auto now = now_();
  CacheSystemStats s;
  s.type = "memory";
  s.strategy = policy_.name();
  s.entries = state_.entries.size();
  s.size_bytes = state_.memory_used;
  for (const auto &[key, entry] : state_.entries)
    if (entry.is_expired(now))
      ++s.expired_entries;
  if (cfg_.max_cache_size > 0)
    s.utilization = static_cast<double>(s.entries) /
                    static_cast<double>(cfg_.max_cache_size);
  return s;
}

void OperationsService::optimize() {
  const auto expired = remove_expired_entries();
  std::lock_guard lock(state_.mu);
  decltype(state_.expiry_heap) live;
  while (!state_.expiry_heap.empty()) {
    const auto &node = state_.expiry_heap.top();
    auto g = state_.expiry_generation.find(node.key);
    if (g != state_.expiry_generation.end() && g->second == node.generation)
      live.push(node);
    state_.expiry_heap.pop();
  }
  state_.expiry_heap = std::move(live);
  evict_locked(nullptr, now_());
  logger()->debug("optimize: {} expired removed, {} timers live", expired,
                  state_.expiry_heap.size());
}

OperationsService::InFlightTicket
OperationsService::lookup_or_join(const std::string &key) {
  std::lock_guard lock(state_.mu);
  const auto now = now_();
  tick_locked(now);
  auto it = state_.entries.find(key);
  if (it != state_.entries.end() && !it->second.is_expired(now)) {
    stats_.record_hit(key);
    it->second.increment_frequency(now);
    touch_locked(key);
    std::promise<std::any> ready;
    ready.set_value(materialize(it->second.value()));
    return {ready.get_future().share(), nullptr};
  }
  stats_.record_miss(key);
  if (it != state_.entries.end())
    remove_locked(key, RemovalCause::Expiration);

  auto pending = state_.in_flight.find(key);
  if (pending != state_.in_flight.end())
    return {pending->second, nullptr};

  auto promise = std::make_shared<std::promise<std::any>>();
  auto result = promise->get_future().share();
  state_.in_flight.emplace(key, result);
  return {result, promise};
}

void OperationsService::finish_in_flight(const std::string &key,
                                         std::promise<std::any> &promise,
                                         const std::any &value,
                                         std::optional<Duration> ttl) {
  {
    std::lock_guard lock(state_.mu);
    if (!state_.disposed) {
      std::string err;
      if (!set_locked(key, value, ttl, std::nullopt, {}, &err, now_()))
        logger()->warn("computed value for {} not cached: {}", key, err);
    }
    state_.in_flight.erase(key);
  }
  promise.set_value(value);
}

void OperationsService::abandon_in_flight(const std::string &key,
                                          std::promise<std::any> &promise,
                                          std::exception_ptr error) {
  {
    std::lock_guard lock(state_.mu);
    state_.in_flight.erase(key);
  }
  promise.set_exception(error);
}

bool OperationsService::set_locked(const std::string &key, std::any value,
                                   std::optional<Duration> ttl,
                                   std::optional<int> priority,
                                   const std::vector<std::string> &tags,
                                   std::string *err, TimePoint now,
                                   bool compress) {
  auto size = estimate_size(value);
  // zero-cost values (empty text) are admitted
  if (size > 0 &&
      !is_reasonable_size(static_cast<std::int64_t>(size),
                          cfg_.max_entry_size_mb)) {
    stats_.record_rejection();
    if (err)
      *err = "value too large for cache (" + format_size(size) + ")";
    logger()->warn("rejected {}: {} exceeds per-entry limit", key,
                   format_size(size));
    return false;
  }
  if (compress || cfg_.compression_enabled) {
    std::string zerr;
    auto packed = compress_value(value, &zerr);
    if (packed && packed->data.size() < size) {
      const auto packed_size = packed->data.size();
      stats_.record_compression(size - packed_size);
      value = std::move(*packed);
      size = packed_size;
    } else if (!zerr.empty()) {
      logger()->warn("storing {} uncompressed: {}", key, zerr);
    }
  }
  // a single value may not exceed the whole byte budget
  if (cfg_.max_memory_bytes > 0 && size > cfg_.max_memory_bytes) {
    stats_.record_rejection();
    if (err)
      *err = "value too large for memory budget (" + format_size(size) + ")";
    logger()->warn("rejected {}: {} exceeds memory budget", key,
                   format_size(size));
    return false;
  }

  auto existing = state_.entries.find(key);
  if (existing != state_.entries.end()) {
    state_.memory_used -= existing->second.size_bytes();
    state_.entries.erase(existing);
    state_.tags.remove_key(key);
    state_.expiry_generation.erase(key);
  }

  CacheEntry entry(std::move(value), size,
                   priority.value_or(cfg_.default_priority), now,
                   ttl.has_value() ? ttl : cfg_.default_ttl);
  const auto deadline = entry.expires_at();
  state_.entries.insert_or_assign(key, std::move(entry));
  state_.memory_used += size;
  touch_locked(key);
  if (deadline.has_value())
    arm_timer_locked(key, *deadline);
  if (!tags.empty())
    state_.tags.add(key, tags);
  stats_.record_set(key);

  evict_locked(&key, now);
  return true;
}

bool OperationsService::remove_locked(const std::string &key,
                                      RemovalCause cause) {
  auto it = state_.entries.find(key);
  if (it == state_.entries.end())
    return false;
  state_.memory_used -= it->second.size_bytes();
  state_.entries.erase(it);
  auto pos = state_.order_index.find(key);
  if (pos != state_.order_index.end()) {
    state_.access_order.erase(pos->second);
    state_.order_index.erase(pos);
  }
  state_.expiry_generation.erase(key);
  state_.tags.remove_key(key);

  stats_.record_remove(key);
  if (cause == RemovalCause::Eviction)
    stats_.record_eviction();
  else if (cause == RemovalCause::Expiration)
    stats_.record_expiration();
  if (cause != RemovalCause::Explicit)
    logger()->debug("{} {}", cause_name(cause), key);
  return true;
}

void OperationsService::touch_locked(const std::string &key) {
  auto pos = state_.order_index.find(key);
  if (pos != state_.order_index.end()) {
    state_.access_order.splice(state_.access_order.end(), state_.access_order,
                               pos->second);
    return;
  }
  state_.order_index[key] =
      state_.access_order.insert(state_.access_order.end(), key);
}

void OperationsService::arm_timer_locked(const std::string &key,
                                         TimePoint deadline) {
  const auto gen = ++state_.next_generation;
  state_.expiry_generation[key] = gen;
  state_.expiry_heap.push({deadline, key, gen});
}

void OperationsService::tick_locked(TimePoint now) {
  std::size_t cleaned = 0;
  while (!state_.expiry_heap.empty() &&
         cleaned < cfg_.expiry_sweep_per_tick) {
    const auto &node = state_.expiry_heap.top();
    if (!(node.deadline < now))
      break;
    const auto key = node.key;
    const auto gen = node.generation;
    state_.expiry_heap.pop();
    auto g = state_.expiry_generation.find(key);
    if (g == state_.expiry_generation.end() || g->second != gen)
      continue;
    auto it = state_.entries.find(key);
    if (it != state_.entries.end() && it->second.is_expired(now))
      remove_locked(key, RemovalCause::Expiration);
    ++cleaned;
  }
}

bool OperationsService::over_capacity_locked() const {
  if (state_.entries.size() > cfg_.max_cache_size)
    return true;
  return cfg_.max_memory_bytes > 0 &&
         state_.memory_used > cfg_.max_memory_bytes;
}

void OperationsService::evict_locked(const std::string *protected_key,
                                     TimePoint now) {
  std::size_t safety = state_.entries.size() + 1;
  while (over_capacity_locked() && safety-- > 0) {
    auto victim = policy_.pick_victim(
        {state_.entries, state_.access_order, now, protected_key});
    if (!victim.has_value())
      break;
    remove_locked(*victim, RemovalCause::Eviction);
  }
}

std::optional<std::any>
OperationsService::load_from_store(const std::string &key) {
  if (!fallback_enabled())
    return std::nullopt;
  try {
    return store_->get(key);
  } catch (const std::exception &e) {
    logger()->warn("backing store get failed for {}: {}", key, e.what());
    return std::nullopt;
  }
}

void OperationsService::remove_from_store(
    const std::vector<std::string> &keys) {
  if (!fallback_enabled())
    return;
  for (const auto &key : keys) {
    try {
      store_->remove(key);
    } catch (const std::exception &e) {
      logger()->warn("backing store remove failed for {}: {}", key, e.what());
    }
  }
}

} // namespace adaptive_cache

#pragma once

#include "adaptive_cache/backing_store.hpp"
#include "adaptive_cache/cache_system.hpp"
#include "adaptive_cache/config.hpp"
#include "adaptive_cache/entry.hpp"
#include "adaptive_cache/policy.hpp"
#include "adaptive_cache/statistics.hpp"
#include "adaptive_cache/tag_index.hpp"

#include <any>
#include <atomic>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace adaptive_cache {

struct ExpiryNode {
  TimePoint deadline;
  std::string key;
  std::uint64_t generation;
  bool operator>(const ExpiryNode &other) const {
    return deadline > other.deadline;
  }
};

// Mutable state of one cache instance. Owned by the coordinator, mutated
// only through OperationsService, every member guarded by mu.
struct CacheState {
  std::mutex mu;
  EntryTable entries;
  AccessOrder access_order;
  std::unordered_map<std::string, AccessOrder::iterator> order_index;
  // Per-key expiration timers. A node fires only while its generation is
  // the key's current one; erasing the generation cancels the timer.
  std::priority_queue<ExpiryNode, std::vector<ExpiryNode>,
                      std::greater<ExpiryNode>>
      expiry_heap;
  std::unordered_map<std::string, std::uint64_t> expiry_generation;
  std::uint64_t next_generation{0};
  std::unordered_map<std::string, std::shared_future<std::any>> in_flight;
  TagIndex tags;
  std::size_t memory_used{0};
  std::atomic<bool> disposed{false};
};

enum class RemovalCause { Explicit, Eviction, Expiration };

namespace detail {
template <class R> struct is_future : std::false_type {};
template <class U> struct is_future<std::future<U>> : std::true_type {};
template <class U> struct is_future<std::shared_future<U>> : std::true_type {};

// C strings are copied into std::string so the cache never holds a borrowed
// pointer.
template <class T>
using stored_t = std::conditional_t<
    std::is_same_v<std::decay_t<T>, const char *> ||
        std::is_same_v<std::decay_t<T>, char *>,
    std::string, std::decay_t<T>>;

template <class T> std::any make_stored(T &&value) {
  return std::any(stored_t<T>(std::forward<T>(value)));
}

template <class T, class F> T run_compute(F &compute) {
  using R = std::invoke_result_t<F &>;
  if constexpr (is_future<R>::value)
    return compute().get();
  else
    return compute();
}
} // namespace detail

class OperationsService final : public ICacheSystem, public Optimizable {
public:
  OperationsService(const CacheConfig &cfg, CacheState &state,
                    Statistics &stats, IEvictionPolicy &policy, NowFn now,
                    std::shared_ptr<IBackingStore> store = nullptr);

  template <class T> std::optional<T> get(const std::string &key) {
    auto v = get_any(key);
    if (!v.has_value())
      return std::nullopt;
    return std::any_cast<T>(std::move(*v));
  }

  template <class T>
  bool set(const std::string &key, T value,
           std::optional<Duration> ttl = std::nullopt,
           std::optional<int> priority = std::nullopt,
           std::string *err = nullptr, bool compress = false) {
    return set_any(key, detail::make_stored(std::move(value)), ttl, priority,
                   {}, err, compress);
  }

  // At most one computation runs per key; concurrent callers for the same
  // key wait for it and observe its value or its exception. compute may
  // return T or std::future<T>.
  template <class T, class F>
  T get_or_compute(const std::string &key, F &&compute,
                   std::optional<Duration> ttl = std::nullopt) {
    auto ticket = lookup_or_join(key);
    if (!ticket.promise)
      return std::any_cast<T>(ticket.result.get());

    std::any value;
    try {
      auto restored = load_from_store(key);
      if (restored.has_value())
        value = std::move(*restored);
      else
        value = std::any(detail::run_compute<T>(compute));
    } catch (...) {
      abandon_in_flight(key, *ticket.promise, std::current_exception());
      throw;
    }
    finish_in_flight(key, *ticket.promise, value, ttl);
    return std::any_cast<T>(value);
  }

  std::optional<std::any> get_any(const std::string &key);
  bool set_any(const std::string &key, std::any value,
               std::optional<Duration> ttl, std::optional<int> priority,
               const std::vector<std::string> &tags,
               std::string *err = nullptr, bool compress = false);
  bool expire(const std::string &key, Duration ttl);

  bool invalidate(const std::string &key);
  std::size_t invalidate_by_tag(const std::string &tag);
  std::size_t invalidate_pattern(const std::string &pattern);
  std::size_t invalidate_all();

  std::vector<std::string> keys_by_tag(const std::string &tag) const;
  std::vector<std::string> keys() const;
  bool contains(const std::string &key) const;
  std::optional<CacheEntry> peek_entry(const std::string &key) const;
  std::size_t size() const;
  std::size_t memory_used() const;
  std::size_t in_flight_count() const;

  std::size_t trim_to(std::size_t target);
  std::size_t persist_to_store();
  std::size_t restore_from_store();
  void release_all();

  std::size_t remove_expired_entries() override;
  CacheSystemStats system_stats() const override;
  Optimizable *as_optimizable() override { return this; }
  void optimize() override;

private:
  struct InFlightTicket {
    std::shared_future<std::any> result;
    // Set only for the caller that must run the computation.
    std::shared_ptr<std::promise<std::any>> promise;
  };

  InFlightTicket lookup_or_join(const std::string &key);
  void finish_in_flight(const std::string &key, std::promise<std::any> &promise,
                        const std::any &value, std::optional<Duration> ttl);
  void abandon_in_flight(const std::string &key,
                         std::promise<std::any> &promise,
                         std::exception_ptr error);

  bool set_locked(const std::string &key, std::any value,
                  std::optional<Duration> ttl, std::optional<int> priority,
                  const std::vector<std::string> &tags, std::string *err,
                  TimePoint now, bool compress = false);
  bool remove_locked(const std::string &key, RemovalCause cause);
  void touch_locked(const std::string &key);
  void arm_timer_locked(const std::string &key, TimePoint deadline);
  void tick_locked(TimePoint now);
  bool over_capacity_locked() const;
  void evict_locked(const std::string *protected_key, TimePoint now);

  std::optional<std::any> load_from_store(const std::string &key);
  void remove_from_store(const std::vector<std::string> &keys);
  bool fallback_enabled() const {
    return cfg_.persistent_fallback_enabled && store_ != nullptr;
  }

  const CacheConfig &cfg_;
  CacheState &state_;
  Statistics &stats_;
  IEvictionPolicy &policy_;
  NowFn now_;
  std::shared_ptr<IBackingStore> store_;
};

} // namespace adaptive_cache

#pragma once

#include "adaptive_cache/entry.hpp"
#include "adaptive_cache/types.hpp"

#include <list>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace adaptive_cache {

using EntryTable = std::unordered_map<std::string, CacheEntry>;
// Least recently used key at the front, most recently used at the back.
using AccessOrder = std::list<std::string>;

struct PolicyParams {
  ScoreWeights weights{};
  std::string version{"defaults-v1"};
};

struct EvictionContext {
  const EntryTable &entries;
  const AccessOrder &access_order;
  TimePoint now;
  const std::string *protected_key{nullptr};
};

class IEvictionPolicy {
public:
  virtual ~IEvictionPolicy() = default;
  virtual std::string name() const = 0;
  virtual std::optional<std::string>
  pick_victim(const EvictionContext &ctx) const = 0;
  virtual void set_params(const PolicyParams &params) = 0;
  virtual const PolicyParams &params() const = 0;
};

// "adaptive" (default), "lru", "lfu" or "ttl". Unknown names fall back to
// adaptive.
std::unique_ptr<IEvictionPolicy> make_policy_by_name(const std::string &mode);

} // namespace adaptive_cache

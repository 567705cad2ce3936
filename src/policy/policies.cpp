#include "adaptive_cache/policy.hpp"

#include <limits>

namespace adaptive_cache {
namespace {

// Walks the access order from least to most recently used and keeps the
// first candidate with the smallest rank, so equal ranks resolve to the
// least recently used key.
template <class Rank>
std::optional<std::string> scan_lru_first(const EvictionContext &ctx,
                                          Rank rank) {
  std::optional<std::string> victim;
  auto best = std::numeric_limits<double>::infinity();
  for (const auto &key : ctx.access_order) {
    if (ctx.protected_key && key == *ctx.protected_key)
      continue;
    auto it = ctx.entries.find(key);
    if (it == ctx.entries.end())
      continue;
    const double r = rank(it->second);
    if (!victim || r < best) {
      best = r;
      victim = key;
    }
  }
  return victim;
}

class AdaptivePolicy final : public IEvictionPolicy {
public:
  std::string name() const override { return "adaptive"; }
  std::optional<std::string>
  pick_victim(const EvictionContext &ctx) const override {
    return scan_lru_first(ctx, [&](const CacheEntry &e) {
      return e.adaptive_score(ctx.now, params_.weights);
    });
  }
  void set_params(const PolicyParams &params) override { params_ = params; }
  const PolicyParams &params() const override { return params_; }

private:
  PolicyParams params_{};
};

class LruPolicy final : public IEvictionPolicy {
public:
  std::string name() const override { return "lru"; }
  std::optional<std::string>
  pick_victim(const EvictionContext &ctx) const override {
    for (const auto &key : ctx.access_order) {
      if (ctx.protected_key && key == *ctx.protected_key)
        continue;
      if (ctx.entries.contains(key))
        return key;
    }
    return std::nullopt;
  }
  void set_params(const PolicyParams &params) override { params_ = params; }
  const PolicyParams &params() const override { return params_; }

private:
  PolicyParams params_{};
};

class LfuPolicy final : public IEvictionPolicy {
public:
  std::string name() const override { return "lfu"; }
  std::optional<std::string>
  pick_victim(const EvictionContext &ctx) const override {
    return scan_lru_first(ctx, [](const CacheEntry &e) {
      return static_cast<double>(e.frequency());
    });
  }
  void set_params(const PolicyParams &params) override { params_ = params; }
  const PolicyParams &params() const override { return params_; }

private:
  PolicyParams params_{};
};

class TtlPolicy final : public IEvictionPolicy {
public:
  std::string name() const override { return "ttl"; }
  std::optional<std::string>
  pick_victim(const EvictionContext &ctx) const override {
    return scan_lru_first(ctx, [&](const CacheEntry &e) {
      if (!e.expires_at().has_value())
        return std::numeric_limits<double>::max();
      return std::chrono::duration<double>(*e.expires_at() - ctx.now).count();
    });
  }
  void set_params(const PolicyParams &params) override { params_ = params; }
  const PolicyParams &params() const override { return params_; }

private:
  PolicyParams params_{};
};

} // namespace

std::unique_ptr<IEvictionPolicy> make_policy_by_name(const std::string &mode) {
  if (mode == "lru")
    return std::make_unique<LruPolicy>();
  if (mode == "lfu")
    return std::make_unique<LfuPolicy>();
  if (mode == "ttl")
    return std::make_unique<TtlPolicy>();
  return std::make_unique<AdaptivePolicy>();
}

} // namespace adaptive_cache

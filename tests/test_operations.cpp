#include "adaptive_cache/operations.hpp"
#include "manual_clock.hpp"

#include <catch2/catch.hpp>

#include <map>
#include <stdexcept>

using namespace adaptive_cache;
using namespace std::chrono_literals;

namespace {

struct Harness {
  explicit Harness(CacheConfig c = {},
                   std::shared_ptr<IBackingStore> store = nullptr)
      : cfg(std::move(c)), stats(clock.fn()),
        policy(make_policy_by_name(cfg.policy)),
        ops(cfg, state, stats, *policy, clock.fn(), std::move(store)) {}

  ManualClock clock;
  CacheConfig cfg;
  CacheState state;
  Statistics stats;
  std::unique_ptr<IEvictionPolicy> policy;
  OperationsService ops;
};

class MapStore : public IBackingStore {
public:
  std::optional<std::any> get(const std::string &key) override {
    ++gets;
    if (fail)
      throw std::runtime_error("store offline");
    auto it = data.find(key);
    if (it == data.end())
      return std::nullopt;
    return it->second;
  }
  void put(const std::string &key, const std::any &value) override {
    data[key] = value;
  }
  void remove(const std::string &key) override { data.erase(key); }
  void clear() override { data.clear(); }
  std::vector<std::string> keys() const override {
    std::vector<std::string> out;
    for (const auto &[k, v] : data)
      out.push_back(k);
    return out;
  }

  std::map<std::string, std::any> data;
  int gets{0};
  bool fail{false};
};

} // namespace

TEST_CASE("set then get returns the value and counts a hit", "[ops]") {
  Harness h;
  REQUIRE(h.ops.set("a", std::string("v1")));
  auto v = h.ops.get<std::string>("a");
  REQUIRE(v.has_value());
  CHECK(*v == "v1");
  CHECK_FALSE(h.ops.get<std::string>("missing").has_value());

  const auto c = h.stats.snapshot();
  CHECK(c.sets == 1);
  CHECK(c.hits == 1);
  CHECK(c.misses == 1);
  CHECK(h.ops.peek_entry("a")->frequency() == 2);
}

TEST_CASE("type mismatch surfaces as bad_any_cast", "[ops]") {
  Harness h;
  REQUIRE(h.ops.set("n", 5));
  CHECK_THROWS_AS(h.ops.get<std::string>("n"), std::bad_any_cast);
}

TEST_CASE("replacing a key resets frequency and accounting", "[ops]") {
  Harness h;
  REQUIRE(h.ops.set("k", std::string("aaaa")));
  h.ops.get<std::string>("k");
  CHECK(h.ops.memory_used() == 8);
  REQUIRE(h.ops.set("k", std::string("bb"), std::nullopt, 7));
  CHECK(h.ops.size() == 1);
  CHECK(h.ops.memory_used() == 4);
  auto e = h.ops.peek_entry("k");
  REQUIRE(e.has_value());
  CHECK(e->frequency() == 1);
  CHECK(e->priority() == 7);
}

TEST_CASE("expired entries read as misses and are removed", "[ops][ttl]") {
  Harness h;
  REQUIRE(h.ops.set("a", std::string("v1"), Duration(100)));
  REQUIRE(h.ops.get<std::string>("a").has_value());
  h.clock.advance(150ms);
  CHECK_FALSE(h.ops.get<std::string>("a").has_value());
  CHECK_FALSE(h.ops.contains("a"));
  CHECK(h.ops.size() == 0);
  const auto c = h.stats.snapshot();
  CHECK(c.expirations == 1);
  CHECK(h.stats.hit_rate() == 0.5);
}

TEST_CASE("default ttl applies when none is given", "[ops][ttl]") {
  CacheConfig cfg;
  cfg.default_ttl = Duration(1000);
  Harness h(cfg);
  REQUIRE(h.ops.set("a", 1));
  REQUIRE(h.ops.set("b", 2, Duration(5000)));
  h.clock.advance(2s);
  CHECK(h.ops.remove_expired_entries() == 1);
  CHECK(h.ops.keys() == std::vector<std::string>{"b"});
}

TEST_CASE("expiry sweep on access is bounded per tick", "[ops][ttl]") {
  CacheConfig cfg;
  cfg.expiry_sweep_per_tick = 8;
  Harness h(cfg);
  for (int i = 0; i < 32; ++i)
    REQUIRE(h.ops.set("ttl" + std::to_string(i), i, Duration(1)));
  h.clock.advance(5ms);
  h.ops.get<int>("other");
  CHECK(h.stats.snapshot().expirations == 8);
  CHECK(h.ops.remove_expired_entries() == 24);
  CHECK(h.ops.size() == 0);
}

TEST_CASE("replaced timers never fire for the new value", "[ops][ttl]") {
  Harness h;
  REQUIRE(h.ops.set("k", 1, Duration(10)));
  REQUIRE(h.ops.set("k", 2));
  h.clock.advance(1s);
  CHECK(h.ops.remove_expired_entries() == 0);
  CHECK(*h.ops.get<int>("k") == 2);
}

TEST_CASE("expire rearms a live entry", "[ops][ttl]") {
  Harness h;
  REQUIRE(h.ops.set("k", 1, Duration(100)));
  h.ops.get<int>("k");
  REQUIRE(h.ops.expire("k", Duration(10000)));
  h.clock.advance(1s);
  CHECK(h.ops.contains("k"));
  CHECK(h.ops.peek_entry("k")->frequency() == 2);
  CHECK_FALSE(h.ops.expire("nope", Duration(10)));

  REQUIRE(h.ops.expire("k", Duration(1)));
  h.clock.advance(2ms);
  CHECK(h.ops.remove_expired_entries() == 1);
}

TEST_CASE("capacity eviction keeps the table bounded", "[ops][eviction]") {
  CacheConfig cfg;
  cfg.max_cache_size = 2;
  Harness h(cfg);
  REQUIRE(h.ops.set("a", 1, std::nullopt, 0));
  REQUIRE(h.ops.set("b", 2, std::nullopt, 5));
  REQUIRE(h.ops.set("c", 3, std::nullopt, 5));
  CHECK(h.ops.keys() == std::vector<std::string>{"b", "c"});
  CHECK(h.stats.snapshot().evictions == 1);
}

TEST_CASE("the key just written is not evicted", "[ops][eviction]") {
  CacheConfig cfg;
  cfg.max_cache_size = 2;
  Harness h(cfg);
  REQUIRE(h.ops.set("a", 1, std::nullopt, 50));
  REQUIRE(h.ops.set("b", 2, std::nullopt, 50));
  REQUIRE(h.ops.set("c", 3, std::nullopt, 0));
  CHECK(h.ops.contains("c"));
  CHECK(h.ops.size() == 2);
}

TEST_CASE("memory budget evicts by bytes", "[ops][eviction]") {
  CacheConfig cfg;
  cfg.max_memory_bytes = 100;
  Harness h(cfg);
  REQUIRE(h.ops.set("a", std::string(20, 'x')));
  REQUIRE(h.ops.set("b", std::string(20, 'y')));
  REQUIRE(h.ops.set("c", std::string(20, 'z')));
  CHECK(h.ops.memory_used() <= 100);
  CHECK(h.ops.contains("c"));
  CHECK(h.stats.snapshot().evictions >= 1);
}

TEST_CASE("a value larger than the whole byte budget is refused",
          "[ops][limits]") {
  CacheConfig cfg;
  cfg.max_memory_bytes = 100;
  Harness h(cfg);
  REQUIRE(h.ops.set("a", std::string(10, 'x')));
  REQUIRE(h.ops.set("b", std::string(10, 'y')));
  std::string err;
  CHECK_FALSE(h.ops.set("huge", std::string(60, 'z'), std::nullopt,
                        std::nullopt, &err));
  CHECK(err.find("memory budget") != std::string::npos);
  CHECK(h.ops.contains("a"));
  CHECK(h.ops.contains("b"));
  CHECK(h.ops.memory_used() == 40);
  CHECK(h.stats.snapshot().evictions == 0);
  CHECK(h.stats.snapshot().rejected == 1);
}

TEST_CASE("oversized values are rejected distinguishably", "[ops][limits]") {
  CacheConfig cfg;
  cfg.max_entry_size_mb = 1;
  Harness h(cfg);
  std::string err;
  CHECK_FALSE(h.ops.set("big", std::vector<std::uint8_t>(200 * 1024, 1),
                        std::nullopt, std::nullopt, &err));
  CHECK(err.find("too large") != std::string::npos);
  CHECK_FALSE(h.ops.contains("big"));
  CHECK(h.stats.snapshot().rejected == 1);
  CHECK(h.stats.snapshot().sets == 0);
  CHECK(h.ops.set("empty", std::string()));
}

TEST_CASE("tags are indexed and invalidated together", "[ops][tags]") {
  Harness h;
  REQUIRE(h.ops.set_any("u1", 1, std::nullopt, std::nullopt, {"users"}));
  REQUIRE(h.ops.set_any("u2", 2, std::nullopt, std::nullopt,
                        {"users", "vip"}));
  REQUIRE(h.ops.set_any("p1", 3, std::nullopt, std::nullopt, {"posts"}));
  CHECK(h.ops.keys_by_tag("users") == std::vector<std::string>{"u1", "u2"});

  CHECK(h.ops.invalidate_by_tag("users") == 2);
  CHECK_FALSE(h.ops.contains("u1"));
  CHECK_FALSE(h.ops.contains("u2"));
  CHECK(h.ops.contains("p1"));
  CHECK(h.ops.keys_by_tag("vip").empty());
  CHECK(h.ops.invalidate_by_tag("users") == 0);
}

TEST_CASE("evicted and expired keys leave every tag", "[ops][tags]") {
  CacheConfig cfg;
  cfg.max_cache_size = 1;
  Harness h(cfg);
  REQUIRE(h.ops.set_any("a", 1, Duration(10), std::nullopt, {"t"}));
  REQUIRE(h.ops.set_any("b", 2, Duration(10), std::nullopt, {"t"}));
  CHECK(h.ops.keys_by_tag("t") == std::vector<std::string>{"b"});
  h.clock.advance(20ms);
  h.ops.remove_expired_entries();
  CHECK(h.ops.keys_by_tag("t").empty());
}

TEST_CASE("untagged overwrite drops previous tags", "[ops][tags]") {
  Harness h;
  REQUIRE(h.ops.set_any("k", 1, std::nullopt, std::nullopt, {"t"}));
  REQUIRE(h.ops.set("k", 2));
  CHECK(h.ops.keys_by_tag("t").empty());
}

TEST_CASE("pattern invalidation supports globs and substrings",
          "[ops][pattern]") {
  Harness h;
  for (const auto *k : {"user:1", "user:2", "user.x", "session:1", "xuser"})
    REQUIRE(h.ops.set(k, 1));
  CHECK(h.ops.invalidate_pattern("user:*") == 2);
  CHECK(h.ops.keys() ==
        std::vector<std::string>{"session:1", "user.x", "xuser"});
  CHECK(h.ops.invalidate_pattern("user?x") == 1);
  CHECK(h.ops.invalidate_pattern("user") == 1);
  CHECK(h.ops.keys() == std::vector<std::string>{"session:1"});
}

TEST_CASE("invalidate all empties the table", "[ops]") {
  Harness h;
  REQUIRE(h.ops.set_any("a", 1, Duration(10), std::nullopt, {"t"}));
  REQUIRE(h.ops.set("b", 2));
  CHECK(h.ops.invalidate_all() == 2);
  CHECK(h.ops.size() == 0);
  CHECK(h.ops.memory_used() == 0);
  CHECK(h.ops.keys_by_tag("t").empty());
  CHECK(h.stats.snapshot().removes == 2);
  CHECK(h.ops.invalidate("a") == false);
}

TEST_CASE("trim evicts down to a target", "[ops][eviction]") {
  Harness h;
  for (int i = 0; i < 10; ++i)
    REQUIRE(h.ops.set("k" + std::to_string(i), i, std::nullopt, i * 10));
  CHECK(h.ops.trim_to(4) == 6);
  CHECK(h.ops.keys() ==
        std::vector<std::string>{"k6", "k7", "k8", "k9"});
}

TEST_CASE("system stats describe the table", "[ops][stats]") {
  CacheConfig cfg;
  cfg.max_cache_size = 4;
  Harness h(cfg);
  REQUIRE(h.ops.set("a", 1, Duration(10)));
  REQUIRE(h.ops.set("b", true));
  h.clock.advance(20ms);
  const auto s = h.ops.system_stats();
  CHECK(s.type == "memory");
  CHECK(s.strategy == "adaptive");
  CHECK(s.entries == 2);
  CHECK(s.expired_entries == 1);
  CHECK(s.size_bytes == 9);
  CHECK(s.utilization == 0.5);
  REQUIRE(h.ops.as_optimizable() != nullptr);
  h.ops.as_optimizable()->optimize();
  CHECK(h.ops.size() == 1);
}

TEST_CASE("backing store answers misses when the fallback is enabled",
          "[ops][store]") {
  auto store = std::make_shared<MapStore>();
  store->data["cold"] = std::string("from-disk");
  CacheConfig cfg;
  cfg.persistent_fallback_enabled = true;
  Harness h(cfg, store);

  auto v = h.ops.get<std::string>("cold");
  REQUIRE(v.has_value());
  CHECK(*v == "from-disk");
  CHECK(h.ops.contains("cold"));
  CHECK(h.stats.snapshot().misses == 1);

  REQUIRE(h.ops.invalidate("cold"));
  CHECK(store->data.empty());
}

TEST_CASE("backing store failures degrade to misses", "[ops][store]") {
  auto store = std::make_shared<MapStore>();
  store->fail = true;
  CacheConfig cfg;
  cfg.persistent_fallback_enabled = true;
  Harness h(cfg, store);
  CHECK_FALSE(h.ops.get<int>("x").has_value());
  CHECK(store->gets == 1);
}

TEST_CASE("backing store is ignored while the fallback is disabled",
          "[ops][store]") {
  auto store = std::make_shared<MapStore>();
  store->data["cold"] = 1;
  Harness h({}, store);
  CHECK_FALSE(h.ops.get<int>("cold").has_value());
  CHECK(store->gets == 0);
}

TEST_CASE("persist and restore round through the store", "[ops][store]") {
  auto store = std::make_shared<MapStore>();
  Harness h({}, store);
  REQUIRE(h.ops.set("a", 1));
  REQUIRE(h.ops.set("b", std::string("two")));
  CHECK(h.ops.persist_to_store() == 2);
  h.ops.release_all();
  CHECK(h.ops.size() == 0);

  CHECK(h.ops.restore_from_store() == 2);
  CHECK(*h.ops.get<std::string>("b") == "two");
  CHECK(h.ops.restore_from_store() == 0);
}

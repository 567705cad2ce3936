#include "adaptive_cache/cache.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <random>

#include <spdlog/spdlog.h>

using namespace adaptive_cache;

namespace {

struct Workload {
  std::string name;
  // percentage of operations that write
  int write_pct;
  bool skewed;
};

using Payload = std::vector<std::uint8_t>;

// One operation of the named workload. "tagged" groups keys under 16 tags
// and drops a whole group every 500 operations; "compute" reads through
// get_or_compute; "compressed" writes 4 KiB text with compression on.
void run_op(AdaptiveCache &cache, const Workload &w, int i, int k,
            bool write) {
  const std::string key = "k" + std::to_string(k % 1000);
  if (w.name == "tagged") {
    const auto tag = "g" + std::to_string(k % 16);
    if (i % 500 == 499)
      cache.invalidate_by_tag(tag);
    else if (write)
      cache.set_with_tags(key, Payload(64, i % 255), {tag});
    else
      cache.get<Payload>(key);
    return;
  }
  if (w.name == "compute") {
    cache.get_or_compute<Payload>(key, [i] { return Payload(64, i % 255); });
    return;
  }
  if (w.name == "compressed") {
    if (write)
      cache.set(key, std::string(4096, static_cast<char>('a' + k % 26)),
                std::nullopt, std::nullopt, nullptr, true);
    else
      cache.get<std::string>(key);
    return;
  }
  if (write) {
    std::optional<Duration> ttl;
    if (w.name == "mixed" && i % 3 == 0)
      ttl = Duration(50);
    cache.set(key, Payload(64, i % 255), ttl, k % 100);
  } else {
    cache.get<Payload>(key);
  }
}

} // namespace

int main() {
  spdlog::set_level(spdlog::level::warn);
  const std::vector<std::string> policies = {"lru", "lfu", "ttl", "adaptive"};
  const std::vector<Workload> workloads = {
      {"hotset", 20, true},     {"uniform", 20, false},
      {"writeheavy", 50, false}, {"mixed", 20, false},
      {"tagged", 30, true},     {"compute", 0, true},
      {"compressed", 20, true}};

  for (const auto &w : workloads) {
    std::cout << "workload=" << w.name << "\n";
    for (const auto &pname : policies) {
      CacheConfig cfg;
      cfg.max_cache_size = 256;
      cfg.enable_background_cleanup = false;
      cfg.policy = pname;
      AdaptiveCache cache(cfg);
      std::mt19937_64 rng(42);
      std::uniform_int_distribution<int> u(0, 999);
      const int ops = 10000;
      auto start = std::chrono::steady_clock::now();
      std::vector<double> lat;
      lat.reserve(ops);
      for (int i = 0; i < ops; ++i) {
        auto t0 = std::chrono::steady_clock::now();
        int k = u(rng);
        if (w.skewed)
          k = static_cast<int>(std::pow((u(rng) % 100) + 1, 1.4));
        run_op(cache, w, i, k, u(rng) % 100 < w.write_pct);
        auto t1 = std::chrono::steady_clock::now();
        lat.push_back(
            std::chrono::duration<double, std::micro>(t1 - t0).count());
      }
      auto end = std::chrono::steady_clock::now();
      std::sort(lat.begin(), lat.end());
      auto pct = [&](double p) {
        return lat[static_cast<std::size_t>(p * (lat.size() - 1))];
      };
      double seconds = std::chrono::duration<double>(end - start).count();
      const auto stats = cache.get_stats();
      std::cout << "policy=" << pname << " ops/s=" << std::fixed
                << std::setprecision(2) << (ops / seconds)
                << " p50_us=" << pct(0.50) << " p95_us=" << pct(0.95)
                << " p99_us=" << pct(0.99) << " hit_rate=" << stats.hit_rate
                << " evictions=" << stats.counters.evictions
                << " compressed=" << stats.counters.compressed_items
                << " memory_used=" << stats.total_size << "\n";
    }
  }
  return 0;
}

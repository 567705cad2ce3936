#include "adaptive_cache/config.hpp"
#include "adaptive_cache/logging.hpp"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <regex>
#include <sstream>

namespace adaptive_cache {
namespace {
bool extract_double(const std::string &text, const std::string &key,
                    double &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*(-?[0-9]+(?:\\.[0-9]+)?)");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = std::stod(m[1].str());
  return true;
}
bool extract_u64(const std::string &text, const std::string &key,
                 std::uint64_t &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*([0-9]+)");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = static_cast<std::uint64_t>(std::stoull(m[1].str()));
  return true;
}
bool extract_string(const std::string &text, const std::string &key,
                    std::string &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*\"([^\"]*)\"");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = m[1].str();
  return true;
}
bool extract_bool(const std::string &text, const std::string &key,
                  bool &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*(true|false)");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = m[1].str() == "true";
  return true;
}

std::uint64_t clamp_u64(std::uint64_t v, std::uint64_t lo, std::uint64_t hi) {
  return std::clamp(v, lo, hi);
}
} // namespace

bool parse_config(const std::string &text, CacheConfig &cfg,
                  std::string *err) {
  if (text.find('{') == std::string::npos ||
      text.find('}') == std::string::npos) {
    if (err)
      *err = "invalid schema";
    return false;
  }

  CacheConfig c = cfg;
  auto clamp_d = [](double v, double lo, double hi) {
    return std::min(hi, std::max(lo, v));
  };

  double d;
  std::uint64_t u;
  std::string s;
  bool b;
  try {
    if (extract_u64(text, "max_cache_size", u))
      c.max_cache_size =
          static_cast<std::size_t>(clamp_u64(u, 1, 100'000'000ULL));
    if (extract_u64(text, "max_memory_bytes", u))
      c.max_memory_bytes =
          static_cast<std::size_t>(clamp_u64(u, 0, 1ULL << 40));
    if (extract_u64(text, "max_entry_size_mb", u))
      c.max_entry_size_mb = static_cast<std::size_t>(clamp_u64(u, 1, 1 << 20));
    if (extract_u64(text, "cleanup_interval_ms", u))
      c.cleanup_interval = Duration(static_cast<Duration::rep>(
          clamp_u64(u, 10, 24ULL * 60 * 60 * 1000)));
    if (extract_bool(text, "enable_background_cleanup", b))
      c.enable_background_cleanup = b;
    if (extract_u64(text, "default_ttl_ms", u)) {
      if (u == 0)
        c.default_ttl.reset();
      else
        c.default_ttl = Duration(static_cast<Duration::rep>(
            clamp_u64(u, 1, 365ULL * 24 * 60 * 60 * 1000)));
    }
    if (extract_u64(text, "default_priority", u))
      c.default_priority = static_cast<int>(clamp_u64(u, 0, 100));
    if (extract_u64(text, "expiry_sweep_per_tick", u))
      c.expiry_sweep_per_tick =
          static_cast<std::size_t>(clamp_u64(u, 1, 1'000'000));
    if (extract_bool(text, "persistent_fallback_enabled", b))
      c.persistent_fallback_enabled = b;
    if (extract_bool(text, "compression_enabled", b))
      c.compression_enabled = b;
    if (extract_string(text, "policy", s)) {
      if (s != "adaptive" && s != "lru" && s != "lfu" && s != "ttl") {
        if (err)
          *err = "unknown policy: " + s;
        return false;
      }
      c.policy = s;
    }
    if (extract_double(text, "w_priority", d))
      c.weights.priority = clamp_d(d, 0.0, 1000.0);
    if (extract_double(text, "w_frequency", d))
      c.weights.frequency = clamp_d(d, 0.0, 1000.0);
    if (extract_double(text, "w_freshness", d))
      c.weights.freshness = clamp_d(d, 0.0, 1000.0);
    if (extract_double(text, "w_size", d))
      c.weights.size = clamp_d(d, 0.0, 1000.0);
  } catch (const std::out_of_range &) {
    if (err)
      *err = "numeric value out of range";
    return false;
  }

  cfg = std::move(c);
  return true;
}

bool load_config(const std::string &path, CacheConfig &cfg, std::string *err) {
  std::ifstream in(path);
  if (!in.is_open()) {
    if (err)
      *err = "config file not found";
    return false;
  }
  std::stringstream ss;
  ss << in.rdbuf();
  if (!parse_config(ss.str(), cfg, err))
    return false;
  logger()->info("loaded cache config from {}", path);
  return true;
}

} // namespace adaptive_cache

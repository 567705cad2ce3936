#pragma once

#include "adaptive_cache/types.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace adaptive_cache {

struct CacheConfig {
  // Entry-count capacity.
  std::size_t max_cache_size{1000};
  // Optional byte budget on top of the entry count, 0 disables it.
  std::size_t max_memory_bytes{0};
  // Per-entry admission bound, see is_reasonable_size.
  std::size_t max_entry_size_mb{20};
  Duration cleanup_interval{std::chrono::minutes(1)};
  bool enable_background_cleanup{true};
  std::optional<Duration> default_ttl;
  int default_priority{0};
  std::size_t expiry_sweep_per_tick{128};
  bool persistent_fallback_enabled{false};
  // Compress text and byte payloads on every set, not only when asked.
  bool compression_enabled{false};
  std::string policy{"adaptive"};
  ScoreWeights weights{};
};

// Reads a flat JSON object. Known keys are clamped into range, unknown keys
// are ignored. On failure cfg is left untouched.
bool load_config(const std::string &path, CacheConfig &cfg,
                 std::string *err = nullptr);
bool parse_config(const std::string &text, CacheConfig &cfg,
                  std::string *err = nullptr);

} // namespace adaptive_cache

#pragma once

#include <cstddef>
#include <string>

namespace adaptive_cache {

struct CacheSystemStats {
  std::string type;
  std::string strategy;
  std::size_t entries{0};
  std::size_t expired_entries{0};
  std::size_t size_bytes{0};
  // entries / capacity
  double utilization{0.0};
};

// Capability for systems that can reorganize themselves on demand.
class Optimizable {
public:
  virtual ~Optimizable() = default;
  virtual void optimize() = 0;
};

// What the cleanup service needs from a cache it maintains.
class ICacheSystem {
public:
  virtual ~ICacheSystem() = default;
  virtual std::size_t remove_expired_entries() = 0;
  virtual CacheSystemStats system_stats() const = 0;
  // nullptr when the system does not support optimization.
  virtual Optimizable *as_optimizable() { return nullptr; }
};

} // namespace adaptive_cache

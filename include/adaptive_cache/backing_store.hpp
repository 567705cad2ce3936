#pragma once

#include <any>
#include <optional>
#include <string>
#include <vector>

namespace adaptive_cache {

// Opaque durable store consulted on misses when the persistent fallback is
// enabled. Implementations may throw; the cache logs and degrades to a miss.
class IBackingStore {
public:
  virtual ~IBackingStore() = default;
  virtual std::optional<std::any> get(const std::string &key) = 0;
  virtual void put(const std::string &key, const std::any &value) = 0;
  virtual void remove(const std::string &key) = 0;
  virtual void clear() = 0;
  virtual std::vector<std::string> keys() const = 0;
};

} // namespace adaptive_cache

#include "adaptive_cache/errors.hpp"

namespace adaptive_cache {
namespace {
std::string describe(const std::string &operation, const std::string &message,
                     const std::optional<std::string> &key) {
  std::string out = "cache error in " + operation;
  if (key)
    out += " (key: " + *key + ")";
  return out + ": " + message;
}
} // namespace

CacheError::CacheError(std::string operation, const std::string &message,
                       std::optional<std::string> key)
    : std::runtime_error(describe(operation, message, key)),
      operation_(std::move(operation)), key_(std::move(key)) {}

} // namespace adaptive_cache

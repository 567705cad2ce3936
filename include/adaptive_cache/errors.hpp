#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace adaptive_cache {

class CacheError : public std::runtime_error {
public:
  CacheError(std::string operation, const std::string &message,
             std::optional<std::string> key = std::nullopt);

  const std::string &operation() const { return operation_; }
  const std::optional<std::string> &key() const { return key_; }

private:
  std::string operation_;
  std::optional<std::string> key_;
};

} // namespace adaptive_cache

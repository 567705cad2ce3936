#pragma once

#include <any>
#include <cstddef>
#include <cstdint>
#include <string>

namespace adaptive_cache {

inline constexpr std::size_t kContainerOverheadBytes = 24;
inline constexpr std::size_t kNumericBytes = 8;
inline constexpr std::size_t kBooleanBytes = 1;
inline constexpr std::size_t kUnknownTypeBytes = 100;

// Rough memory footprint of a cached value, used for capacity accounting
// only. Scalars cost a fixed amount, text costs 2 bytes per UTF-16 code
// unit, containers cost a fixed overhead plus their elements (recursively
// for nested std::any). Unrecognized types cost kUnknownTypeBytes.
std::size_t estimate_size(const std::any &value);

// False for non-positive sizes, sizes above max_size_mb, and sizes above a
// tenth of max_size_mb so no single entry can monopolize the cache.
bool is_reasonable_size(std::int64_t bytes, std::size_t max_size_mb);

std::string format_size(std::size_t bytes);

} // namespace adaptive_cache

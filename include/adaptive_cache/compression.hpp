#pragma once

#include <any>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace adaptive_cache {

// Payloads smaller than this are stored as is.
inline constexpr std::size_t kCompressionMinBytes = 1024;

// A std::string or byte vector packed with zlib. Entries hold this in place
// of the original value; reads unpack it transparently.
struct CompressedValue {
  enum class Kind { Text, Bytes };
  Kind kind{Kind::Text};
  std::size_t original_size{0};
  std::vector<std::uint8_t> data;
};

// Returns nullopt when the value is not text or bytes, is below
// kCompressionMinBytes, or would not shrink.
std::optional<CompressedValue> compress_value(const std::any &value,
                                              std::string *err = nullptr);
bool decompress_value(const CompressedValue &packed, std::any &out,
                      std::string *err = nullptr);

// Unpacks a CompressedValue, copies anything else.
std::any materialize(const std::any &stored);

} // namespace adaptive_cache

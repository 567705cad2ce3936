#include "adaptive_cache/compression.hpp"
#include "adaptive_cache/errors.hpp"

#include <zlib.h>

namespace adaptive_cache {
namespace {

std::optional<CompressedValue> deflate_raw(const std::uint8_t *src,
                                           std::size_t len,
                                           CompressedValue::Kind kind,
                                           std::string *err) {
  if (len < kCompressionMinBytes)
    return std::nullopt;
  uLongf bound = compressBound(static_cast<uLong>(len));
  CompressedValue out;
  out.kind = kind;
  out.original_size = len;
  out.data.resize(bound);
  const int rc = compress2(out.data.data(), &bound, src,
                           static_cast<uLong>(len), Z_DEFAULT_COMPRESSION);
  if (rc != Z_OK) {
    if (err)
      *err = "zlib compress failed: " + std::to_string(rc);
    return std::nullopt;
  }
  if (bound >= len)
    return std::nullopt;
  out.data.resize(bound);
  out.data.shrink_to_fit();
  return out;
}

} // namespace

std::optional<CompressedValue> compress_value(const std::any &value,
                                              std::string *err) {
  if (const auto *s = std::any_cast<std::string>(&value))
    return deflate_raw(reinterpret_cast<const std::uint8_t *>(s->data()),
                       s->size(), CompressedValue::Kind::Text, err);
  if (const auto *b = std::any_cast<std::vector<std::uint8_t>>(&value))
    return deflate_raw(b->data(), b->size(), CompressedValue::Kind::Bytes,
                       err);
  return std::nullopt;
}

bool decompress_value(const CompressedValue &packed, std::any &out,
                      std::string *err) {
  std::vector<std::uint8_t> raw(packed.original_size);
  uLongf len = static_cast<uLongf>(raw.size());
  const int rc = uncompress(raw.data(), &len, packed.data.data(),
                            static_cast<uLong>(packed.data.size()));
  if (rc != Z_OK || len != packed.original_size) {
    if (err)
      *err = "zlib uncompress failed: " + std::to_string(rc);
    return false;
  }
  if (packed.kind == CompressedValue::Kind::Text)
    out = std::string(raw.begin(), raw.end());
  else
    out = std::move(raw);
  return true;
}

std::any materialize(const std::any &stored) {
  const auto *packed = std::any_cast<CompressedValue>(&stored);
  if (!packed)
    return stored;
  std::any out;
  std::string err;
  if (!decompress_value(*packed, out, &err))
    throw CacheError("get", err);
  return out;
}

} // namespace adaptive_cache

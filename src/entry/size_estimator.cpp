#include "adaptive_cache/size_estimator.hpp"
#include "adaptive_cache/compression.hpp"

#include <cstdio>
#include <deque>
#include <list>
#include <map>
#include <set>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace adaptive_cache {
namespace {

std::size_t text_bytes(std::string_view utf8) {
  std::size_t units = 0;
  for (unsigned char c : utf8) {
    if ((c & 0xC0) == 0x80)
      continue;
    // 4-byte sequences are outside the BMP and need a surrogate pair
    units += c >= 0xF0 ? 2 : 1;
  }
  return units * 2;
}

std::size_t estimate_static(const std::any &v) { return estimate_size(v); }
std::size_t estimate_static(const std::string &s) { return text_bytes(s); }
std::size_t estimate_static(const std::u16string &s) { return s.size() * 2; }
std::size_t estimate_static(const CompressedValue &c) {
  return c.data.size();
}

template <class T>
std::enable_if_t<std::is_arithmetic_v<T>, std::size_t> estimate_static(T) {
  return std::is_same_v<T, bool> ? kBooleanBytes : kNumericBytes;
}

template <class C> std::size_t sequence_bytes(const C &c) {
  std::size_t total = kContainerOverheadBytes;
  // vector<bool> yields proxies, not bools
  if constexpr (std::is_same_v<typename C::value_type, bool>)
    return total + c.size() * kBooleanBytes;
  for (const auto &e : c)
    total += estimate_static(e);
  return total;
}

template <class M> std::size_t mapping_bytes(const M &m) {
  std::size_t total = kContainerOverheadBytes;
  for (const auto &[k, v] : m)
    total += estimate_static(k) + estimate_static(v);
  return total;
}

template <class T, class A>
std::size_t estimate_static(const std::vector<T, A> &c) {
  return sequence_bytes(c);
}
template <class T, class A>
std::size_t estimate_static(const std::list<T, A> &c) {
  return sequence_bytes(c);
}
template <class T, class A>
std::size_t estimate_static(const std::deque<T, A> &c) {
  return sequence_bytes(c);
}
template <class T, class C, class A>
std::size_t estimate_static(const std::set<T, C, A> &c) {
  return sequence_bytes(c);
}
template <class T, class H, class E, class A>
std::size_t estimate_static(const std::unordered_set<T, H, E, A> &c) {
  return sequence_bytes(c);
}
template <class K, class V, class C, class A>
std::size_t estimate_static(const std::map<K, V, C, A> &m) {
  return mapping_bytes(m);
}
template <class K, class V, class H, class E, class A>
std::size_t estimate_static(const std::unordered_map<K, V, H, E, A> &m) {
  return mapping_bytes(m);
}

template <class T> bool try_as(const std::any &v, std::size_t &out) {
  if (const auto *p = std::any_cast<T>(&v)) {
    out = estimate_static(*p);
    return true;
  }
  return false;
}

template <class... Ts> bool try_any_of(const std::any &v, std::size_t &out) {
  return (try_as<Ts>(v, out) || ...);
}

template <class E> bool try_sequences_of(const std::any &v, std::size_t &out) {
  return try_any_of<std::vector<E>, std::list<E>, std::deque<E>>(v, out);
}

template <class V> bool try_mappings_to(const std::any &v, std::size_t &out) {
  return try_any_of<std::map<std::string, V>,
                    std::unordered_map<std::string, V>>(v, out);
}

} // namespace

std::size_t estimate_size(const std::any &value) {
  if (!value.has_value())
    return 0;
  std::size_t out = 0;
  if (try_any_of<bool, char, signed char, unsigned char, short,
                 unsigned short, int, unsigned, long, unsigned long, long long,
                 unsigned long long, float, double, long double>(value, out))
    return out;
  if (try_any_of<std::string, std::u16string, CompressedValue>(value, out))
    return out;
  if (try_sequences_of<std::any>(value, out) ||
      try_sequences_of<std::string>(value, out) ||
      try_sequences_of<std::uint8_t>(value, out) ||
      try_sequences_of<int>(value, out) ||
      try_sequences_of<long>(value, out) ||
      try_sequences_of<long long>(value, out) ||
      try_sequences_of<double>(value, out) ||
      try_sequences_of<bool>(value, out))
    return out;
  if (try_any_of<std::set<std::string>, std::unordered_set<std::string>,
                 std::set<int>, std::unordered_set<int>>(value, out))
    return out;
  if (try_mappings_to<std::any>(value, out) ||
      try_mappings_to<std::string>(value, out) ||
      try_mappings_to<int>(value, out) ||
      try_mappings_to<long>(value, out) ||
      try_mappings_to<long long>(value, out) ||
      try_mappings_to<double>(value, out) ||
      try_mappings_to<bool>(value, out))
    return out;
  return kUnknownTypeBytes;
}

bool is_reasonable_size(std::int64_t bytes, std::size_t max_size_mb) {
  if (bytes <= 0)
    return false;
  const double max_bytes = static_cast<double>(max_size_mb) * 1024.0 * 1024.0;
  const auto b = static_cast<double>(bytes);
  if (b > max_bytes)
    return false;
  return b <= max_bytes * 0.1;
}

std::string format_size(std::size_t bytes) {
  char buf[64];
  if (bytes < 1024) {
    std::snprintf(buf, sizeof(buf), "%zu B", bytes);
  } else if (bytes < 1024 * 1024) {
    std::snprintf(buf, sizeof(buf), "%.2f KB",
                  static_cast<double>(bytes) / 1024.0);
  } else {
    std::snprintf(buf, sizeof(buf), "%.2f MB",
                  static_cast<double>(bytes) / (1024.0 * 1024.0));
  }
  return buf;
}

} // namespace adaptive_cache

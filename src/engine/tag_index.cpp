#include "adaptive_cache/tag_index.hpp"

#include <algorithm>

namespace adaptive_cache {

void TagIndex::add(const std::string &key,
                   const std::vector<std::string> &tags) {
  for (const auto &tag : tags) {
    by_tag_[tag].insert(key);
    by_key_[key].insert(tag);
  }
}

void TagIndex::remove_key(const std::string &key) {
  auto it = by_key_.find(key);
  if (it == by_key_.end())
    return;
  for (const auto &tag : it->second) {
    auto t = by_tag_.find(tag);
    if (t == by_tag_.end())
      continue;
    t->second.erase(key);
    if (t->second.empty())
      by_tag_.erase(t);
  }
  by_key_.erase(it);
}

std::vector<std::string> TagIndex::take(const std::string &tag) {
  auto it = by_tag_.find(tag);
  if (it == by_tag_.end())
    return {};
  std::vector<std::string> keys(it->second.begin(), it->second.end());
  by_tag_.erase(it);
  for (const auto &key : keys) {
    auto k = by_key_.find(key);
    if (k == by_key_.end())
      continue;
    k->second.erase(tag);
    if (k->second.empty())
      by_key_.erase(k);
  }
  std::sort(keys.begin(), keys.end());
  return keys;
}

std::vector<std::string> TagIndex::keys_for(const std::string &tag) const {
  auto it = by_tag_.find(tag);
  if (it == by_tag_.end())
    return {};
  std::vector<std::string> keys(it->second.begin(), it->second.end());
  std::sort(keys.begin(), keys.end());
  return keys;
}

std::vector<std::string> TagIndex::tags_for(const std::string &key) const {
  auto it = by_key_.find(key);
  if (it == by_key_.end())
    return {};
  std::vector<std::string> tags(it->second.begin(), it->second.end());
  std::sort(tags.begin(), tags.end());
  return tags;
}

void TagIndex::clear() {
  by_tag_.clear();
  by_key_.clear();
}

} // namespace adaptive_cache

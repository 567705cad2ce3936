#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace adaptive_cache {

// tag -> keys, with the reverse key -> tags map so removing a key only
// touches the tags it carries. Not synchronized; the owning cache guards
// it with its state mutex.
class TagIndex {
public:
  void add(const std::string &key, const std::vector<std::string> &tags);
  void remove_key(const std::string &key);
  // Detaches every key from the tag and returns them.
  std::vector<std::string> take(const std::string &tag);

  std::vector<std::string> keys_for(const std::string &tag) const;
  std::vector<std::string> tags_for(const std::string &key) const;
  bool has_tag(const std::string &tag) const { return by_tag_.contains(tag); }
  std::size_t tag_count() const { return by_tag_.size(); }
  void clear();

private:
  std::unordered_map<std::string, std::unordered_set<std::string>> by_tag_;
  std::unordered_map<std::string, std::unordered_set<std::string>> by_key_;
};

} // namespace adaptive_cache

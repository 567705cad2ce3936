#include "adaptive_cache/tag_index.hpp"

#include <catch2/catch.hpp>

using namespace adaptive_cache;

TEST_CASE("tags map to sorted key sets", "[tags]") {
  TagIndex idx;
  idx.add("user:2", {"users", "hot"});
  idx.add("user:1", {"users"});
  CHECK(idx.keys_for("users") == std::vector<std::string>{"user:1", "user:2"});
  CHECK(idx.keys_for("hot") == std::vector<std::string>{"user:2"});
  CHECK(idx.tags_for("user:2") == std::vector<std::string>{"hot", "users"});
  CHECK(idx.keys_for("missing").empty());
  CHECK(idx.tag_count() == 2);
}

TEST_CASE("removing a key leaves no dangling references", "[tags]") {
  TagIndex idx;
  idx.add("a", {"t1", "t2"});
  idx.add("b", {"t1"});
  idx.remove_key("a");
  CHECK(idx.keys_for("t1") == std::vector<std::string>{"b"});
  CHECK_FALSE(idx.has_tag("t2"));
  CHECK(idx.tags_for("a").empty());

  idx.remove_key("b");
  CHECK(idx.tag_count() == 0);
  idx.remove_key("never-added");
}

TEST_CASE("take detaches every key from the tag", "[tags]") {
  TagIndex idx;
  idx.add("a", {"t", "keep"});
  idx.add("b", {"t"});
  auto keys = idx.take("t");
  CHECK(keys == std::vector<std::string>{"a", "b"});
  CHECK_FALSE(idx.has_tag("t"));
  CHECK(idx.tags_for("a") == std::vector<std::string>{"keep"});
  CHECK(idx.tags_for("b").empty());
  CHECK(idx.take("t").empty());
}

TEST_CASE("duplicate registrations collapse", "[tags]") {
  TagIndex idx;
  idx.add("a", {"t", "t"});
  idx.add("a", {"t"});
  CHECK(idx.keys_for("t").size() == 1);
  idx.clear();
  CHECK(idx.tag_count() == 0);
}

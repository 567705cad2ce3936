#include "adaptive_cache/cache.hpp"
#include "adaptive_cache/config.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace adaptive_cache;

namespace {

std::vector<std::string> split(const std::string &s, char sep) {
  std::vector<std::string> out;
  std::stringstream ss(s);
  std::string item;
  while (std::getline(ss, item, sep))
    if (!item.empty())
      out.push_back(item);
  return out;
}

std::optional<Duration> parse_ttl(std::istringstream &in) {
  long long ms = 0;
  if (in >> ms && ms > 0)
    return Duration(ms);
  return std::nullopt;
}

void print_keys(const std::vector<std::string> &keys) {
  for (const auto &k : keys)
    std::cout << k << "\n";
  std::cout << "(" << keys.size() << " keys)" << std::endl;
}

} // namespace

int main(int argc, char **argv) {
  CacheConfig cfg;
  if (argc > 1) {
    std::string err;
    if (!load_config(argv[1], cfg, &err)) {
      std::cerr << "config error: " << err << "\n";
      return 1;
    }
  }
  AdaptiveCache cache(cfg);

  std::string line;
  while (std::getline(std::cin, line)) {
    std::istringstream in(line);
    std::string cmd;
    if (!(in >> cmd))
      continue;
    if (cmd == "quit")
      break;

    std::string key;
    std::string err;
    if (cmd == "set") {
      std::string value;
      in >> key >> value;
      auto ttl = parse_ttl(in);
      int priority = 0;
      in >> priority;
      std::cout << (cache.set(key, value, ttl, priority, &err) ? "OK"
                                                              : "ERR " + err)
                << std::endl;
    } else if (cmd == "tag") {
      std::string value, tags;
      in >> key >> value >> tags;
      auto ttl = parse_ttl(in);
      std::cout << (cache.set_with_tags(key, value, split(tags, ','), ttl,
                                        std::nullopt, &err)
                        ? "OK"
                        : "ERR " + err)
                << std::endl;
    } else if (cmd == "get") {
      in >> key;
      auto v = cache.get<std::string>(key);
      std::cout << (v ? *v : "(nil)") << std::endl;
    } else if (cmd == "expire") {
      long long ms = 0;
      in >> key >> ms;
      std::cout << (cache.expire(key, Duration(ms)) ? 1 : 0) << std::endl;
    } else if (cmd == "del") {
      in >> key;
      std::cout << (cache.invalidate(key) ? 1 : 0) << std::endl;
    } else if (cmd == "deltag") {
      in >> key;
      std::cout << cache.invalidate_by_tag(key) << std::endl;
    } else if (cmd == "delpattern") {
      in >> key;
      std::cout << cache.invalidate_pattern(key) << std::endl;
    } else if (cmd == "flush") {
      std::cout << cache.invalidate_all() << std::endl;
    } else if (cmd == "keys") {
      print_keys(cache.keys());
    } else if (cmd == "tagged") {
      in >> key;
      print_keys(cache.get_keys_by_tag(key));
    } else if (cmd == "gc") {
      std::cout << cache.trigger_garbage_collection() << std::endl;
    } else if (cmd == "cleanup") {
      const auto r = cache.force_cleanup();
      std::cout << (r.success ? "OK" : "ERR") << " removed="
                << r.expired_removed << " ms=" << r.duration.count()
                << std::endl;
    } else if (cmd == "info" || cmd == "stats") {
      std::cout << cache.info() << std::flush;
    } else if (cmd == "report") {
      std::cout << render_cleanup_report(cache.get_cleanup_report())
                << std::flush;
    } else if (cmd == "reset") {
      cache.reset_stats();
      std::cout << "OK" << std::endl;
    } else {
      std::cout << "ERR unknown command '" << cmd << "'" << std::endl;
    }
  }
  return 0;
}

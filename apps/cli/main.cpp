#include "bounded_cache/config.hpp"
#include "bounded_cache/expiring.hpp"
#include "bounded_cache/logging.hpp"
#include "bounded_cache/policy.hpp"

#include <iostream>
#include <sstream>
#include <string>

using namespace bounded_cache;

namespace {

DynamicValue *store(PriorityCache<DynamicValue> &cache, Key key,
                    Metric priority) {
  bool existed;
  return cache.get_update_or_create(key, priority, existed);
}

template <class Inner>
DynamicValue *store(ExpiringCache<Inner> &cache, Key key, Metric) {
  return cache.create(key);
}

template <class CacheT> int run(CacheT &cache) {
  std::string line;
  while (std::getline(std::cin, line)) {
    std::istringstream in(line);
    std::string cmd;
    in >> cmd;
    if (cmd.empty())
      continue;
    if (cmd == "quit")
      break;

    std::string name;
    if (cmd == "put") {
      std::string value;
      Metric priority = 0;
      in >> name >> value >> priority;
      if (name.empty()) {
        std::cout << "-ERR usage: put <key> <value> [priority]\n";
        continue;
      }
      if (DynamicValue *dst = store(cache, key_from_string(name), priority)) {
        dst->assign(value);
        std::cout << "+OK\n";
      } else {
        std::cout << "-ERR rejected\n";
      }
    } else if (cmd == "get") {
      in >> name;
      if (const DynamicValue *v = cache.get(key_from_string(name)))
        std::cout << "$" << v->text() << "\n";
      else
        std::cout << "(nil)\n";
    } else if (cmd == "del") {
      in >> name;
      std::cout << ":" << (cache.remove(key_from_string(name)) ? 1 : 0) << "\n";
    } else if (cmd == "len") {
      std::cout << ":" << cache.length() << "\n";
    } else if (cmd == "info") {
      std::cout << cache.info();
    } else if (cmd == "dump") {
      cache.visit_ascending([](Key key, DynamicValue &value, Metric metric) {
        std::cout << key << " " << metric << " " << value.text() << "\n";
      });
    } else if (cmd == "clear") {
      cache.clear();
      std::cout << "+OK\n";
    } else {
      std::cout << "-ERR unknown command " << cmd << "\n";
    }
  }
  return 0;
}

} // namespace

int main(int argc, char **argv) {
  CacheConfig cfg;
  std::string err;
  if (argc > 1 && !load_config(argv[1], cfg, &err)) {
    std::cerr << "config: " << err << "\n";
    return 1;
  }
  if (!apply_log_level(cfg, &err)) {
    std::cerr << "config: " << err << "\n";
    return 1;
  }
  logger()->info("starting with policy {} and {} slots", cfg.policy,
                 cfg.max_items);

  switch (policy_kind_from_name(cfg.policy)) {
  case PolicyKind::Priority: {
    PriorityCache<DynamicValue> cache(cfg.max_items);
    return run(cache);
  }
  case PolicyKind::Access: {
    ExpiringAccessCache<DynamicValue> cache(cfg.max_items, cfg.lifetime_s,
                                            cfg.empty_lifetime_s);
    return run(cache);
  }
  case PolicyKind::Lru: {
    ExpiringLruCache<DynamicValue> cache(cfg.max_items, cfg.lifetime_s,
                                         cfg.empty_lifetime_s);
    return run(cache);
  }
  }
  return 0;
}

#include "bounded_cache/expiring.hpp"

#include <catch2/catch.hpp>

#include <stdexcept>
#include <string>
#include <vector>

using namespace bounded_cache;

TEST_CASE("Entries expire once their age reaches the lifetime",
          "[expiring]") {
  // Every clock read advances time by one second.
  Metric t = 0;
  ExpiringAccessCache<std::string> cache(4, 10, 10, {}, [&t] { return ++t; });

  CHECK(cache.length() == 0);
  *cache.create(1) = "hello world";
  CHECK(cache.length() == 1);
  CHECK(cache.exists(1));
  REQUIRE(cache.get(1));
  CHECK(*cache.get(1) == "hello world");

  REQUIRE(t <= 5);
  t = 5;
  *cache.create(2) = "goodbye world";
  CHECK(cache.length() == 2);
  CHECK(cache.exists(2));
  REQUIRE(cache.get(2));
  CHECK(*cache.get(2) == "goodbye world");

  REQUIRE(t <= 10);
  t = 10;
  CHECK_FALSE(cache.exists(1));

  REQUIRE(t <= 17);
  t = 17;
  CHECK(cache.get(2) == nullptr);
  CHECK(cache.length() == 0);
  CHECK(cache.expired() == 2);

  t = 5;
  *cache.create(1) = "hello world";
  *cache.create(2) = "goodbye world";
  CHECK(cache.length() == 2);
  cache.clear();
  CHECK(cache.length() == 0);
  CHECK_FALSE(cache.exists(1));
  CHECK_FALSE(cache.exists(2));
  CHECK(cache.check_invariants());
}

TEST_CASE("Empty values use the empty lifetime", "[expiring][empty]") {
  Metric t = 0;
  ExpiringAccessCache<DynamicValue> cache(4, 10, 5, {}, [&t] { return t; });

  REQUIRE(cache.create(1));
  cache.create(2)->assign(std::string("payload"));
  t = 6;
  CHECK(cache.get(1) == nullptr);
  REQUIRE(cache.get(2));
  CHECK(cache.get(2)->text() == "payload");
  t = 10;
  CHECK_FALSE(cache.exists(2));
}

TEST_CASE("Expired lookups report expiry and call the eviction hook",
          "[expiring][hooks]") {
  Metric t = 100;
  std::vector<Key> evicted;
  CacheHooks<int> hooks;
  hooks.on_evicted = [&](Key key, int &) { evicted.push_back(key); };
  ExpiringLruCache<int> cache(4, 3, 3, hooks, [&t] { return t; });

  *cache.create(7) = 70;
  t = 102;
  bool expired = true;
  REQUIRE(cache.get(7, expired));
  CHECK_FALSE(expired);

  t = 103;
  CHECK(cache.get(7, expired) == nullptr);
  CHECK(expired);
  CHECK(evicted == std::vector<Key>{7});

  // A missing key is not an expiry.
  CHECK_FALSE(cache.exists(7, expired));
  CHECK_FALSE(expired);

  // create() is a lookup that missed; the expired read counts as a miss too.
  const auto &stats = cache.stats();
  CHECK(stats.expired == 1);
  CHECK(stats.lookups == 4);
  CHECK(stats.misses == 3);
}

TEST_CASE("exists reports an entry that had to expire", "[expiring]") {
  Metric t = 0;
  ExpiringAccessCache<int> cache(2, 5, 5, {}, [&t] { return t; });
  *cache.create(1) = 1;
  bool expired = true;
  t = 4;
  CHECK(cache.exists(1, expired));
  CHECK_FALSE(expired);

  t = 5;
  CHECK_FALSE(cache.exists(1, expired));
  CHECK(expired);
  CHECK(cache.length() == 0);
  CHECK(cache.expired() == 1);
}

TEST_CASE("get_or_create replaces an expired entry with a fresh one",
          "[expiring][create]") {
  Metric t = 0;
  std::vector<Key> evicted;
  CacheHooks<int> hooks;
  hooks.on_evicted = [&](Key key, int &) { evicted.push_back(key); };
  ExpiringAccessCache<int> cache(2, 4, 4, hooks, [&t] { return t; });

  bool existed = true;
  *cache.get_or_create(1, existed) = 11;
  CHECK_FALSE(existed);
  t = 2;
  REQUIRE(cache.get_or_create(1, existed));
  CHECK(existed);
  CHECK(*cache.get_or_create(1, existed) == 11);

  t = 4;
  int *fresh = cache.get_or_create(1, existed);
  REQUIRE(fresh);
  CHECK_FALSE(existed);
  CHECK(*fresh == 0);
  CHECK(cache.create_time(1) == 4);
  CHECK(evicted == std::vector<Key>{1});
  CHECK(cache.length() == 1);
  CHECK(cache.check_invariants());
}

TEST_CASE("create resets the age of a live entry", "[expiring][create]") {
  Metric t = 0;
  ExpiringAccessCache<int> cache(2, 5, 5, {}, [&t] { return t; });
  *cache.create(1) = 1;
  t = 4;
  REQUIRE(cache.create(1));
  CHECK(*cache.get(1) == 1);
  t = 8;
  CHECK(cache.exists(1));
  t = 9;
  CHECK_FALSE(cache.exists(1));
}

TEST_CASE("purge_expired drops stale entries in one pass",
          "[expiring][purge]") {
  Metric t = 0;
  ExpiringLruCache<int> cache(8, 10, 10, {}, [&t] { return t; });
  for (Key k = 0; k < 4; ++k) {
    t = k;
    *cache.create(k) = static_cast<int>(k);
  }
  t = 11;
  const auto misses = cache.stats().misses;
  CHECK(cache.purge_expired() == 2);
  CHECK(cache.length() == 2);
  CHECK(cache.inner().exists(2));
  CHECK(cache.inner().exists(3));
  CHECK(cache.expired() == 2);
  CHECK(cache.stats().misses == misses);
  CHECK(cache.purge_expired() == 0);
  CHECK(cache.check_invariants());
}

TEST_CASE("A clock that steps back does not expire entries",
          "[expiring][clock]") {
  Metric t = 50;
  ExpiringAccessCache<int> cache(2, 5, 5, {}, [&t] { return t; });
  cache.create(1);
  t = 10;
  CHECK(cache.exists(1));
}

TEST_CASE("Lifetimes must be positive", "[expiring][config]") {
  CHECK_THROWS_AS(ExpiringAccessCache<int>(4, 0), std::invalid_argument);
  CHECK_THROWS_AS(ExpiringLruCache<int>(4, 10, -1), std::invalid_argument);

  ExpiringAccessCache<int> cache(4, 10);
  CHECK(cache.lifetime() == 10);
  CHECK(cache.empty_lifetime() == 10);
  cache.set_empty_lifetime(2);
  CHECK(cache.empty_lifetime() == 2);
  CHECK_THROWS_AS(cache.set_lifetime(0), std::invalid_argument);
  CHECK(cache.lifetime() == 10);

  const auto info = cache.info();
  CHECK(info.find("policy_mode:access\n") != std::string::npos);
  CHECK(info.find("lifetime_s:10\n") != std::string::npos);
  CHECK(info.find("empty_lifetime_s:2\n") != std::string::npos);
}

#include "bounded_cache/key_index.hpp"
#include "bounded_cache/order_index.hpp"

#include <catch2/catch.hpp>

#include <map>
#include <random>
#include <set>
#include <vector>

using namespace bounded_cache;

namespace {
std::vector<OrderKey> ascending(const OrderIndex &index) {
  std::vector<OrderKey> out;
  for (auto h = index.first(); h != OrderIndex::npos; h = index.next(h))
    out.push_back(index.key(h));
  return out;
}
} // namespace

TEST_CASE("order index keeps composite keys sorted", "[order_index]") {
  OrderIndex index(8);
  CHECK(index.first() == OrderIndex::npos);
  CHECK(index.last() == OrderIndex::npos);

  index.insert({5, 0});
  index.insert({1, 3});
  index.insert({5, 1});
  index.insert({9, 2});
  index.insert({1, 4});
  REQUIRE(index.check());
  REQUIRE(index.size() == 5);

  const std::vector<OrderKey> expected = {
      {1, 3}, {1, 4}, {5, 0}, {5, 1}, {9, 2}};
  CHECK(ascending(index) == expected);
  CHECK(index.key(index.first()) == OrderKey{1, 3});
  CHECK(index.key(index.last()) == OrderKey{9, 2});

  std::vector<OrderKey> backwards;
  for (auto h = index.last(); h != OrderIndex::npos; h = index.prev(h))
    backwards.push_back(index.key(h));
  CHECK(backwards ==
        std::vector<OrderKey>(expected.rbegin(), expected.rend()));
}

TEST_CASE("order index update keeps the handle", "[order_index][update]") {
  OrderIndex index(4);
  const auto a = index.insert({10, 0});
  const auto b = index.insert({20, 1});
  CHECK(index.update(a, {30, 0}) == a);
  CHECK(index.key(index.first()) == OrderKey{20, 1});
  CHECK(index.first() == b);
  CHECK(index.last() == a);
  CHECK(index.update(a, {30, 0}) == a);
  REQUIRE(index.check());
}

TEST_CASE("order index reuses freed nodes up to capacity",
          "[order_index][pool]") {
  OrderIndex index(3);
  auto a = index.insert({1, 0});
  index.insert({2, 1});
  index.insert({3, 2});
  CHECK(index.size() == index.capacity());
  index.remove(a);
  index.insert({0, 0});
  CHECK(index.key(index.first()) == OrderKey{0, 0});
  REQUIRE(index.check());

  index.clear();
  CHECK(index.empty());
  CHECK(index.first() == OrderIndex::npos);
  for (std::size_t i = 0; i < 3; ++i)
    index.insert({i, i});
  REQUIRE(index.check());
}

TEST_CASE("order index matches an ordered set under random churn",
          "[order_index][fuzz]") {
  constexpr std::size_t kCap = 257;
  OrderIndex index(kCap);
  std::set<OrderKey> model;
  std::map<std::size_t, OrderIndex::Handle> by_slot;
  std::mt19937_64 rng(7);

  for (int i = 0; i < 20000; ++i) {
    const std::size_t slot = rng() % kCap;
    const Metric metric = rng() % 64;
    auto it = by_slot.find(slot);
    if (it == by_slot.end()) {
      by_slot[slot] = index.insert({metric, slot});
      model.insert({metric, slot});
    } else if (rng() % 2) {
      model.erase(index.key(it->second));
      index.remove(it->second);
      by_slot.erase(it);
    } else {
      model.erase(index.key(it->second));
      it->second = index.update(it->second, {metric, slot});
      model.insert({metric, slot});
    }
    if (i % 997 == 0)
      REQUIRE(index.check());
  }
  REQUIRE(index.check());
  REQUIRE(index.size() == model.size());
  CHECK(ascending(index) == std::vector<OrderKey>(model.begin(), model.end()));
}

TEST_CASE("key index maps keys to node handles", "[key_index]") {
  KeyIndex keys(2);
  CHECK(keys.find(1) == nullptr);
  keys.put(1) = 7;
  keys.put(2) = 8;
  REQUIRE(keys.find(1) != nullptr);
  CHECK(*keys.find(1) == 7);
  keys.put(1) = 9;
  CHECK(*keys.find(1) == 9);
  CHECK(keys.size() == 2);
  CHECK(keys.remove(2));
  CHECK_FALSE(keys.remove(2));
  keys.clear();
  CHECK(keys.size() == 0);
  CHECK(keys.capacity() == 2);
}

TEST_CASE("key index survives churn at full capacity", "[key_index][fuzz]") {
  constexpr std::size_t kCap = 100;
  KeyIndex keys(kCap);
  std::map<Key, KeyIndex::Handle> model;
  std::mt19937_64 rng(11);

  for (int i = 0; i < 50000; ++i) {
    // Sparse keys keep the table near its load limit with many removals.
    const Key key = (rng() % 300) * 64;
    if (model.count(key) && rng() % 2) {
      REQUIRE(keys.remove(key));
      model.erase(key);
    } else if (!model.count(key) && model.size() < kCap) {
      keys.put(key) = static_cast<KeyIndex::Handle>(i);
      model[key] = static_cast<KeyIndex::Handle>(i);
    } else if (!model.count(key)) {
      CHECK_FALSE(keys.remove(key));
    }
    REQUIRE(keys.size() == model.size());
  }
  for (Key key = 0; key < 300 * 64; key += 64) {
    const auto *found = keys.find(key);
    const auto it = model.find(key);
    REQUIRE((found != nullptr) == (it != model.end()));
    if (found)
      CHECK(*found == it->second);
  }
}

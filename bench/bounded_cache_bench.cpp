#include "bounded_cache/expiring.hpp"
#include "bounded_cache/policy.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <vector>

using namespace bounded_cache;

namespace {

constexpr std::size_t kSlots = 256;
constexpr int kKeys = 1000;

DynamicValue *write(PriorityCache<DynamicValue> &cache, Key key) {
  bool existed;
  return cache.get_update_or_create(key, kKeys - key, existed);
}
DynamicValue *write(ExpiringAccessCache<DynamicValue> &cache, Key key) {
  return cache.create(key);
}
DynamicValue *write(LruCache<DynamicValue> &cache, Key key) {
  return cache.get_refresh_or_create(key);
}

DynamicValue *read(PriorityCache<DynamicValue> &cache, Key key) {
  return cache.get(key);
}
DynamicValue *read(ExpiringAccessCache<DynamicValue> &cache, Key key) {
  return cache.get(key);
}
DynamicValue *read(LruCache<DynamicValue> &cache, Key key) {
  return cache.get_and_refresh(key);
}

template <class CacheT>
void run(const std::string &pname, const std::string &preset, CacheT &cache) {
  std::mt19937_64 rng(42);
  std::uniform_int_distribution<int> u(0, kKeys - 1);
  const int ops = 200000;
  auto start = std::chrono::steady_clock::now();
  int hits = 0;
  std::vector<double> lat;
  lat.reserve(ops);
  const std::vector<std::uint8_t> payload(64, 0xAB);
  for (int i = 0; i < ops; ++i) {
    auto t0 = std::chrono::steady_clock::now();
    int k = u(rng);
    if (preset == "hotset")
      k = static_cast<int>(std::pow((u(rng) % 100) + 1, 1.4));
    const Key key = static_cast<Key>(k % kKeys);
    const bool do_write = preset == "writeheavy" ? (i % 2 == 0) : (i % 5 == 0);
    if (do_write) {
      if (DynamicValue *dst = write(cache, key))
        dst->assign(payload);
    } else if (read(cache, key)) {
      ++hits;
    }
    auto t1 = std::chrono::steady_clock::now();
    lat.push_back(std::chrono::duration<double, std::micro>(t1 - t0).count());
  }
  auto end = std::chrono::steady_clock::now();
  std::sort(lat.begin(), lat.end());
  auto pct = [&](double p) {
    return lat[static_cast<std::size_t>(p * (lat.size() - 1))];
  };
  double seconds = std::chrono::duration<double>(end - start).count();
  std::cout << "policy=" << pname << " ops/s=" << std::fixed
            << std::setprecision(2) << (ops / seconds)
            << " p50_us=" << pct(0.50) << " p95_us=" << pct(0.95)
            << " p99_us=" << pct(0.99)
            << " hit_rate=" << (static_cast<double>(hits) / ops)
            << " evictions=" << cache.stats().evictions
            << " consistent=" << (cache.check_invariants() ? "yes" : "no")
            << "\n";
}

} // namespace

int main() {
  const std::vector<std::string> presets = {"hotset", "uniform", "writeheavy"};

  for (const auto &preset : presets) {
    std::cout << "workload=" << preset << "\n";
    {
      PriorityCache<DynamicValue> cache(kSlots);
      run("priority", preset, cache);
    }
    {
      ExpiringAccessCache<DynamicValue> cache(kSlots, 3600);
      run("access", preset, cache);
    }
    {
      LruCache<DynamicValue> cache(kSlots);
      run("lru", preset, cache);
    }
  }
  return 0;
}

#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <string_view>
#include <vector>

namespace bounded_cache {

using Clock = std::chrono::system_clock;
using Key = std::uint64_t;
using Metric = std::uint64_t;

// Returns the current time used as ordering metric by the time based caches.
using TimeSource = std::function<Metric()>;

Metric wall_clock_seconds();
TimeSource default_time_source();

// Hashes a textual key to the 64-bit key space used by the caches.
Key key_from_string(std::string_view text);

template <std::size_t N> struct FixedValue {
  static_assert(N > 0, "zero sized fixed value");

  std::array<std::uint8_t, N> bytes{};

  static constexpr std::size_t size() { return N; }
  std::uint8_t *data() { return bytes.data(); }
  const std::uint8_t *data() const { return bytes.data(); }

  // Copies at most N bytes of src, zero filling the remainder.
  void assign(std::span<const std::uint8_t> src) {
    const auto n = src.size() < N ? src.size() : N;
    for (std::size_t i = 0; i < N; ++i)
      bytes[i] = i < n ? src[i] : 0;
  }
  std::span<const std::uint8_t> view() const { return bytes; }
};

struct DynamicValue {
  std::vector<std::uint8_t> bytes;

  std::size_t size() const { return bytes.size(); }
  bool empty() const { return bytes.empty(); }

  // Reuses the existing buffer where possible.
  void assign(std::span<const std::uint8_t> src) {
    bytes.assign(src.begin(), src.end());
  }
  void assign(std::string_view src) {
    bytes.assign(src.begin(), src.end());
  }
  std::span<const std::uint8_t> view() const { return bytes; }
  std::string_view text() const {
    return {reinterpret_cast<const char *>(bytes.data()), bytes.size()};
  }
};

// Length of the stored payload; types without size() count as full.
template <class Value> std::size_t payload_size(const Value &value) {
  if constexpr (requires { value.size(); })
    return static_cast<std::size_t>(value.size());
  else
    return sizeof(Value);
}

struct CacheStats {
  std::uint64_t lookups{0};
  std::uint64_t misses{0};
  std::uint64_t expired{0};
  std::uint64_t evictions{0};
  std::uint64_t rejected{0};
};

template <class Value> struct CacheHooks {
  // Called with the outgoing entry before its slot is reused.
  std::function<void(Key, Value &)> on_evicted;
  // Consulted only when full and the new metric is below the current minimum.
  std::function<bool(Metric new_metric, Metric current_min)> accept_replacement;
};

template <class Value> struct EntryView {
  Key key;
  Value *value;
  Metric metric;
};

} // namespace bounded_cache

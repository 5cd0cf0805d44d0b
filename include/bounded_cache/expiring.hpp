#pragma once

#include "bounded_cache/logging.hpp"
#include "bounded_cache/policy.hpp"
#include "bounded_cache/types.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace bounded_cache {

// Adds a lifetime to AccessOrderedCache or LruCache. An entry whose age
// (access time minus create time) reached the lifetime is reported absent by
// the next lookup and removed at that point. Entries holding an empty value
// use empty_lifetime instead.
template <class Inner> class ExpiringCache {
public:
  using Value = typename Inner::ValueType;
  using ValueType = Value;

  ExpiringCache(std::size_t max_items, std::int64_t lifetime_s,
                std::int64_t empty_lifetime_s, CacheHooks<Value> hooks = {},
                TimeSource now = default_time_source())
      : lifetime_(checked_lifetime(lifetime_s)),
        empty_lifetime_(checked_lifetime(empty_lifetime_s)),
        inner_(max_items, std::move(hooks), std::move(now)),
        log_(logger()) {}

  ExpiringCache(std::size_t max_items, std::int64_t lifetime_s)
      : ExpiringCache(max_items, lifetime_s, lifetime_s) {}

  Value *get(Key key) {
    bool expired;
    return get(key, expired);
  }

  // expired is set when key was found but had to be removed.
  Value *get(Key key, bool &expired) {
    expired = false;
    auto *slot = inner_.touch(key);
    if (!slot)
      return nullptr;
    if (is_expired(*slot, *inner_.engine().metric(key))) {
      expire(key);
      expired = true;
      return nullptr;
    }
    return &slot->value;
  }

  // An expired entry is replaced by a fresh one and existed is false.
  Value *get_or_create(Key key, bool &existed) {
    auto *slot = inner_.touch_or_create(key, existed);
    if (!slot || !existed)
      return slot ? &slot->value : nullptr;
    const Metric access = *inner_.engine().metric(key);
    if (!is_expired(*slot, access))
      return &slot->value;
    expire(key);
    existed = false;
    slot = inner_.engine().insert(key, access);
    return slot ? &slot->value : nullptr;
  }

  // Creates key or resets its create time when present.
  Value *create(Key key) {
    bool existed;
    auto *slot = inner_.touch_or_create(key, existed);
    if (!slot)
      return nullptr;
    slot->create_metric = *inner_.engine().metric(key);
    return &slot->value;
  }

  bool exists(Key key) {
    bool expired;
    return exists(key, expired);
  }

  bool exists(Key key, bool &expired) { return get(key, expired) != nullptr; }

  bool remove(Key key) { return inner_.remove(key); }
  void clear() { inner_.clear(); }

  // Removes every expired entry now instead of on its next lookup.
  std::size_t purge_expired() {
    const Metric t = inner_.now();
    std::vector<Key> stale;
    auto &engine = inner_.engine();
    engine.visit_ascending([&](Key key, Value &, Metric) {
      if (is_expired(*engine.peek(key), t))
        stale.push_back(key);
    });
    for (const Key key : stale) {
      engine.record_expired(false);
      engine.remove(key, false);
    }
    if (!stale.empty())
      log_->debug("purged {} expired entries", stale.size());
    return stale.size();
  }

  Metric create_time(Key key) {
    auto *slot = inner_.engine().find(key);
    return slot ? slot->create_metric : 0;
  }

  std::int64_t lifetime() const { return static_cast<std::int64_t>(lifetime_); }
  std::int64_t empty_lifetime() const {
    return static_cast<std::int64_t>(empty_lifetime_);
  }
  void set_lifetime(std::int64_t seconds) {
    lifetime_ = checked_lifetime(seconds);
  }
  void set_empty_lifetime(std::int64_t seconds) {
    empty_lifetime_ = checked_lifetime(seconds);
  }

  template <class Fn> void visit_ascending(Fn &&fn) {
    inner_.visit_ascending(std::forward<Fn>(fn));
  }
  template <class Fn> void visit_descending(Fn &&fn) {
    inner_.visit_descending(std::forward<Fn>(fn));
  }

  std::size_t length() const { return inner_.length(); }
  std::size_t capacity() const { return inner_.capacity(); }
  std::uint64_t expired() const { return inner_.stats().expired; }
  const CacheStats &stats() const { return inner_.stats(); }
  void reset_stats() { inner_.reset_stats(); }
  bool check_invariants() const { return inner_.check_invariants(); }

  std::string info() const {
    std::ostringstream os;
    os << inner_.info();
    os << "lifetime_s:" << lifetime_ << "\n";
    os << "empty_lifetime_s:" << empty_lifetime_ << "\n";
    return os.str();
  }

  Inner &inner() { return inner_; }

private:
  static Metric checked_lifetime(std::int64_t seconds) {
    if (seconds <= 0)
      throw std::invalid_argument("cache lifetime must be at least 1 second");
    return static_cast<Metric>(seconds);
  }

  Metric limit_for(const Value &value) const {
    return payload_size(value) == 0 ? empty_lifetime_ : lifetime_;
  }

  // A create time after the access time means the clock went backwards; such
  // entries are treated as fresh.
  bool is_expired(const Slot<Value> &slot, Metric access) const {
    if (access < slot.create_metric)
      return false;
    return access - slot.create_metric >= limit_for(slot.value);
  }

  void expire(Key key) {
    log_->debug("key {} expired", key);
    inner_.engine().record_expired();
    inner_.engine().remove(key, false);
  }

  Metric lifetime_;
  Metric empty_lifetime_;
  Inner inner_;
  std::shared_ptr<spdlog::logger> log_;
};

template <class Value>
using ExpiringAccessCache = ExpiringCache<AccessOrderedCache<Value>>;

template <class Value> using ExpiringLruCache = ExpiringCache<LruCache<Value>>;

} // namespace bounded_cache

#pragma once

#include "bounded_cache/engine.hpp"
#include "bounded_cache/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>

namespace bounded_cache {

enum class PolicyKind { Priority, Access, Lru };

PolicyKind policy_kind_from_name(const std::string &name);
const char *policy_name(PolicyKind kind);

// Keeps the max_items entries with the highest caller supplied priority.
template <class Value> class PriorityCache {
public:
  using ValueType = Value;

  explicit PriorityCache(std::size_t max_items, CacheHooks<Value> hooks = {})
      : engine_(max_items, std::move(hooks)) {}

  Value *get(Key key, bool track_misses = true) {
    auto *slot = engine_.find(key, track_misses);
    return slot ? &slot->value : nullptr;
  }

  // Returns nullptr when the cache is full and the admission hook declined.
  Value *create(Key key, Metric priority) {
    bool existed;
    return get_or_create(key, priority, existed);
  }

  // The priority is ignored when the key already exists.
  Value *get_or_create(Key key, Metric priority, bool &existed,
                       bool track_misses = true) {
    auto *slot = engine_.create_or_get(key, priority, existed, track_misses);
    return slot ? &slot->value : nullptr;
  }

  Value *get_update_or_create(Key key, Metric priority, bool &existed,
                              bool track_misses = true) {
    auto *slot = engine_.update_metric(key, priority, track_misses);
    existed = slot != nullptr;
    if (!slot)
      slot = engine_.insert(key, priority);
    return slot ? &slot->value : nullptr;
  }

  Value *update_priority(Key key, Metric priority, bool track_misses = true) {
    auto *slot = engine_.update_metric(key, priority, track_misses);
    return slot ? &slot->value : nullptr;
  }

  Value *get_priority(Key key, Metric &priority) {
    auto *slot = engine_.find(key);
    if (!slot)
      return nullptr;
    priority = *engine_.metric(key);
    return &slot->value;
  }

  bool exists(Key key) { return engine_.find(key) != nullptr; }
  bool remove(Key key) { return engine_.remove(key); }
  void clear() { engine_.clear(); }

  std::optional<EntryView<Value>> highest() { return engine_.last(); }
  std::optional<EntryView<Value>> lowest() { return engine_.first(); }

  template <class Fn> void visit_ascending(Fn &&fn) {
    engine_.visit_ascending(std::forward<Fn>(fn));
  }
  template <class Fn> void visit_descending(Fn &&fn) {
    engine_.visit_descending(std::forward<Fn>(fn));
  }

  std::size_t length() const { return engine_.size(); }
  std::size_t capacity() const { return engine_.capacity(); }
  const CacheStats &stats() const { return engine_.stats(); }
  void reset_stats() { engine_.reset_stats(); }
  std::string info() const { return engine_.info("priority"); }
  bool check_invariants() const { return engine_.check_invariants(); }

private:
  CacheEngine<Value> engine_;
};

// Orders entries by the wall clock second they were last created or read.
// Reads through get() and create() move the entry to the newest position;
// exists() does not.
template <class Value> class AccessOrderedCache {
public:
  using ValueType = Value;

  explicit AccessOrderedCache(std::size_t max_items,
                              CacheHooks<Value> hooks = {},
                              TimeSource now = default_time_source())
      : engine_(max_items, std::move(hooks)), now_(std::move(now)) {}

  // Creates key, or refreshes it when present; the create time is reset
  // either way.
  Value *create(Key key) {
    bool existed;
    auto *slot = touch_or_create(key, existed);
    if (!slot)
      return nullptr;
    slot->create_metric = *engine_.metric(key);
    return &slot->value;
  }

  Value *get(Key key) {
    auto *slot = touch(key);
    return slot ? &slot->value : nullptr;
  }

  Value *get_or_create(Key key, bool &existed) {
    auto *slot = touch_or_create(key, existed);
    return slot ? &slot->value : nullptr;
  }

  // Returns true when key was already present.
  bool put(Key key, const Value &value) {
    bool existed;
    if (Value *dst = get_or_create(key, existed))
      *dst = value;
    return existed;
  }

  bool exists(Key key) { return engine_.find(key) != nullptr; }

  // Last access time of key, 0 when absent.
  Metric access_time(Key key) {
    return engine_.find(key) ? *engine_.metric(key) : 0;
  }

  Metric create_time(Key key) {
    auto *slot = engine_.find(key);
    return slot ? slot->create_metric : 0;
  }

  bool remove(Key key) { return engine_.remove(key); }
  void clear() { engine_.clear(); }

  std::optional<EntryView<Value>> oldest() { return engine_.first(); }
  std::optional<EntryView<Value>> newest() { return engine_.last(); }

  template <class Fn> void visit_ascending(Fn &&fn) {
    engine_.visit_ascending(std::forward<Fn>(fn));
  }
  template <class Fn> void visit_descending(Fn &&fn) {
    engine_.visit_descending(std::forward<Fn>(fn));
  }

  std::size_t length() const { return engine_.size(); }
  std::size_t capacity() const { return engine_.capacity(); }
  const CacheStats &stats() const { return engine_.stats(); }
  void reset_stats() { engine_.reset_stats(); }
  std::string info() const { return engine_.info("access"); }
  bool check_invariants() const { return engine_.check_invariants(); }

  // Primitives used by ExpiringCache.
  Metric now() const { return now_(); }
  Slot<Value> *touch(Key key) { return engine_.update_metric(key, now()); }
  Slot<Value> *touch_or_create(Key key, bool &existed) {
    const Metric t = now();
    auto *slot = engine_.update_metric(key, t);
    existed = slot != nullptr;
    return slot ? slot : engine_.insert(key, t);
  }
  CacheEngine<Value> &engine() { return engine_; }
  const CacheEngine<Value> &engine() const { return engine_; }

private:
  CacheEngine<Value> engine_;
  TimeSource now_;
};

// Least recently used cache: every touch refreshes the entry to the current
// time, so the entry untouched for longest is evicted first. get() reads
// without refreshing.
template <class Value> class LruCache {
public:
  using ValueType = Value;

  explicit LruCache(std::size_t max_items, CacheHooks<Value> hooks = {},
                    TimeSource now = default_time_source())
      : engine_(max_items, std::move(hooks)), now_(std::move(now)) {}

  // Returns true when an existing entry was overwritten.
  bool put(Key key, Value value) {
    bool existed;
    if (Value *dst = get_refresh_or_create(key, existed))
      *dst = std::move(value);
    return existed;
  }

  Value *get_and_refresh(Key key) {
    auto *slot = touch(key);
    return slot ? &slot->value : nullptr;
  }

  Value *get_refresh_or_create(Key key, bool &existed) {
    auto *slot = touch_or_create(key, existed);
    return slot ? &slot->value : nullptr;
  }

  Value *get_refresh_or_create(Key key) {
    bool existed;
    return get_refresh_or_create(key, existed);
  }

  Value *get(Key key, bool track_misses = true) {
    auto *slot = engine_.find(key, track_misses);
    return slot ? &slot->value : nullptr;
  }

  bool exists(Key key) { return engine_.find(key) != nullptr; }

  Metric access_time(Key key) {
    return engine_.find(key) ? *engine_.metric(key) : 0;
  }

  Metric create_time(Key key) {
    auto *slot = engine_.find(key);
    return slot ? slot->create_metric : 0;
  }

  bool remove(Key key) { return engine_.remove(key); }
  void clear() { engine_.clear(); }

  std::optional<EntryView<Value>> least_recent() { return engine_.first(); }
  std::optional<EntryView<Value>> most_recent() { return engine_.last(); }

  template <class Fn> void visit_ascending(Fn &&fn) {
    engine_.visit_ascending(std::forward<Fn>(fn));
  }
  template <class Fn> void visit_descending(Fn &&fn) {
    engine_.visit_descending(std::forward<Fn>(fn));
  }

  std::size_t length() const { return engine_.size(); }
  std::size_t capacity() const { return engine_.capacity(); }
  const CacheStats &stats() const { return engine_.stats(); }
  void reset_stats() { engine_.reset_stats(); }
  std::string info() const { return engine_.info("lru"); }
  bool check_invariants() const { return engine_.check_invariants(); }

  Metric now() const { return now_(); }
  Slot<Value> *touch(Key key) { return engine_.update_metric(key, now()); }
  Slot<Value> *touch_or_create(Key key, bool &existed) {
    const Metric t = now();
    auto *slot = engine_.update_metric(key, t);
    existed = slot != nullptr;
    if (slot)
      return slot;
    return engine_.insert(key, t);
  }
  CacheEngine<Value> &engine() { return engine_; }
  const CacheEngine<Value> &engine() const { return engine_; }

private:
  CacheEngine<Value> engine_;
  TimeSource now_;
};

} // namespace bounded_cache

#pragma once

#include "bounded_cache/key_index.hpp"
#include "bounded_cache/logging.hpp"
#include "bounded_cache/order_index.hpp"
#include "bounded_cache/slot_store.hpp"
#include "bounded_cache/types.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace bounded_cache {

// Fixed capacity key/value store ordered by a metric. The entry with the
// lowest metric is the eviction candidate when the store is full.
//
// Pointers returned by any lookup or create are invalidated by the next
// structural mutation (create that evicts, remove, clear). Not thread safe.
template <class Value> class CacheEngine {
public:
  using Handle = OrderIndex::Handle;
  using SlotType = Slot<Value>;

  explicit CacheEngine(std::size_t max_items, CacheHooks<Value> hooks = {})
      : order_(checked_capacity(max_items)), keys_(max_items),
        slots_(max_items), hooks_(std::move(hooks)), log_(logger()) {
    log_->debug("cache engine created with {} slots", max_items);
  }

  CacheEngine(const CacheEngine &) = delete;
  CacheEngine &operator=(const CacheEngine &) = delete;

  // Looks up key without reordering it.
  SlotType *find(Key key, bool track_misses = true) {
    const Handle *node = keys_.find(key);
    if (track_misses) {
      ++stats_.lookups;
      if (!node)
        ++stats_.misses;
    }
    return node ? &slots_[order_.key(*node).slot] : nullptr;
  }

  // Returns the existing entry for key, or creates it with metric. Returns
  // nullptr only when the cache is full and accept_replacement declined.
  SlotType *create_or_get(Key key, Metric metric, bool &existed,
                          bool track_misses = true) {
    SlotType *slot = find(key, track_misses);
    existed = slot != nullptr;
    return slot ? slot : insert(key, metric);
  }

  // Adds an entry for a key that is not in the cache.
  SlotType *insert(Key key, Metric metric) {
    BOUNDED_CACHE_CHECK(!keys_.find(key), "insert of a live key");
    if (!slots_.full())
      return &enter(slots_.acquire(), key, metric);

    const Handle min_node = order_.first();
    BOUNDED_CACHE_CHECK(min_node != OrderIndex::npos,
                        "full cache without order entries");
    const OrderKey min_key = order_.key(min_node);
    if (metric < min_key.metric && hooks_.accept_replacement &&
        !hooks_.accept_replacement(metric, min_key.metric)) {
      ++stats_.rejected;
      log_->debug("rejected key {} metric {} below minimum {}", key, metric,
                  min_key.metric);
      return nullptr;
    }
    const Key outgoing = slots_[min_key.slot].key;
    order_.remove(min_node);
    keys_.remove(outgoing);
    ++stats_.evictions;
    log_->debug("evicting key {} metric {} for key {}", outgoing,
                min_key.metric, key);
    // The new entry owns the slot before on_evicted runs, so a throwing hook
    // leaves the indices consistent.
    SlotType &slot = enter(min_key.slot, key, metric);
    drop(outgoing, slot);
    return &slot;
  }

  // Changes the metric of key; relocates the node only when it differs.
  SlotType *update_metric(Key key, Metric metric, bool track_misses = true) {
    Handle *node = keys_.find(key);
    if (track_misses) {
      ++stats_.lookups;
      if (!node)
        ++stats_.misses;
    }
    if (!node)
      return nullptr;
    OrderKey order_key = order_.key(*node);
    if (order_key.metric != metric) {
      order_key.metric = metric;
      *node = order_.update(*node, order_key);
    }
    return &slots_[order_key.slot];
  }

  // Reads the metric of key without touching the counters.
  std::optional<Metric> metric(Key key) const {
    const Handle *node = keys_.find(key);
    if (!node)
      return std::nullopt;
    return order_.key(*node).metric;
  }

  SlotType *peek(Key key) {
    const Handle *node = keys_.find(key);
    return node ? &slots_[order_.key(*node).slot] : nullptr;
  }

  bool remove(Key key, bool track_misses = true) {
    Handle *node = keys_.find(key);
    if (track_misses) {
      ++stats_.lookups;
      if (!node)
        ++stats_.misses;
    }
    if (!node)
      return false;
    erase(key, *node);
    return true;
  }

  // Drops every entry without calling on_evicted.
  void clear() {
    order_.clear();
    keys_.clear();
    slots_.clear();
  }

  std::optional<EntryView<Value>> first() { return view(order_.first()); }
  std::optional<EntryView<Value>> last() { return view(order_.last()); }

  // Calls fn(key, value, metric) in ascending metric order. A visitor that
  // returns bool stops the walk by returning false. The visitor may modify
  // values but must not add or remove entries.
  template <class Fn> void visit_ascending(Fn &&fn) {
    for (Handle h = order_.first(); h != OrderIndex::npos; h = order_.next(h))
      if (!visit_one(h, fn))
        break;
  }

  template <class Fn> void visit_descending(Fn &&fn) {
    for (Handle h = order_.last(); h != OrderIndex::npos; h = order_.prev(h))
      if (!visit_one(h, fn))
        break;
  }

  std::size_t size() const { return slots_.size(); }
  std::size_t capacity() const { return slots_.capacity(); }

  const CacheStats &stats() const { return stats_; }
  void reset_stats() { stats_ = CacheStats{}; }

  // Counts an entry found expired; a lookup that hit one is also a miss.
  void record_expired(bool count_miss = true) {
    ++stats_.expired;
    if (count_miss)
      ++stats_.misses;
  }

  std::string info(std::string_view mode) const {
    std::ostringstream os;
    os << "policy_mode:" << mode << "\n";
    os << "keys:" << size() << "\n";
    os << "capacity:" << capacity() << "\n";
    os << "lookups:" << stats_.lookups << "\n";
    os << "misses:" << stats_.misses << "\n";
    os << "expired:" << stats_.expired << "\n";
    os << "evictions:" << stats_.evictions << "\n";
    os << "rejected:" << stats_.rejected << "\n";
    const Handle lo = order_.first();
    const Handle hi = order_.last();
    if (lo != OrderIndex::npos) {
      os << "min_metric:" << order_.key(lo).metric << "\n";
      os << "max_metric:" << order_.key(hi).metric << "\n";
    }
    return os.str();
  }

  // Verifies that the three structures describe the same dense set of
  // entries.
  bool check_invariants() const {
    if (!order_.check())
      return false;
    const std::size_t n = slots_.size();
    if (n > slots_.capacity() || order_.size() != n || keys_.size() != n)
      return false;
    for (std::size_t i = 0; i < n; ++i) {
      const Handle *node = keys_.find(slots_[i].key);
      if (!node || order_.key(*node).slot != i)
        return false;
    }
    std::size_t walked = 0;
    for (Handle h = order_.first(); h != OrderIndex::npos; h = order_.next(h)) {
      if (order_.key(h).slot >= n)
        return false;
      ++walked;
    }
    return walked == n;
  }

private:
  static std::size_t checked_capacity(std::size_t max_items) {
    if (max_items == 0)
      throw std::invalid_argument("cache capacity must be at least 1");
    return max_items;
  }

  void erase(Key key, Handle node) {
    const std::size_t index = order_.key(node).slot;
    order_.remove(node);
    keys_.remove(key);
    if (const auto moved = slots_.release(index)) {
      Handle *moved_node = keys_.find(*moved);
      BOUNDED_CACHE_CHECK(moved_node, "moved slot has no key mapping");
      OrderKey order_key = order_.key(*moved_node);
      order_key.slot = index;
      *moved_node = order_.update(*moved_node, order_key);
    }
    drop(key, slots_.spare());
  }

  SlotType &enter(std::size_t index, Key key, Metric metric) {
    SlotType &slot = slots_[index];
    slot.key = key;
    slot.create_metric = metric;
    keys_.put(key) = order_.insert({metric, index});
    return slot;
  }

  // Hands the outgoing value to on_evicted, then clears it. The value is
  // cleared even when the hook throws.
  void drop(Key key, SlotType &slot) {
    if (hooks_.on_evicted) {
      try {
        hooks_.on_evicted(key, slot.value);
      } catch (...) {
        slot.value = Value{};
        throw;
      }
    }
    slot.value = Value{};
  }

  std::optional<EntryView<Value>> view(Handle node) {
    if (node == OrderIndex::npos)
      return std::nullopt;
    const OrderKey &order_key = order_.key(node);
    SlotType &slot = slots_[order_key.slot];
    return EntryView<Value>{slot.key, &slot.value, order_key.metric};
  }

  template <class Fn> bool visit_one(Handle node, Fn &fn) {
    const OrderKey &order_key = order_.key(node);
    SlotType &slot = slots_[order_key.slot];
    const Key key = slot.key;
    if constexpr (std::is_same_v<std::invoke_result_t<Fn &, Key, Value &,
                                                      Metric>,
                                 bool>)
      return fn(key, slot.value, order_key.metric);
    else {
      fn(key, slot.value, order_key.metric);
      return true;
    }
  }

  OrderIndex order_;
  KeyIndex keys_;
  SlotStore<Value> slots_;
  CacheHooks<Value> hooks_;
  CacheStats stats_;
  std::shared_ptr<spdlog::logger> log_;
};

} // namespace bounded_cache

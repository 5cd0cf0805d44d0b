#pragma once

#include "bounded_cache/logging.hpp"
#include "bounded_cache/types.hpp"

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace bounded_cache {

template <class Value> struct Slot {
  Key key{0};
  Value value{};
  // Only maintained by the time based caches.
  Metric create_metric{0};
};

// Dense array of max_items slots allocated once. Slots [0, size()) are live;
// removal moves the last live slot into the hole so the live range stays
// contiguous.
template <class Value> class SlotStore {
public:
  explicit SlotStore(std::size_t max_items) : slots_(max_items) {}

  std::size_t acquire() {
    BOUNDED_CACHE_CHECK(count_ < slots_.size(), "slot store full");
    return count_++;
  }

  // Releases the live slot at index. The last live slot is swapped into index
  // and its key returned so the caller can repoint the indices; the released
  // entry ends up at spare() until the next acquire.
  std::optional<Key> release(std::size_t index) {
    BOUNDED_CACHE_CHECK(index < count_, "release of dead slot");
    --count_;
    if (index == count_)
      return std::nullopt;
    std::swap(slots_[index], slots_[count_]);
    return slots_[index].key;
  }

  Slot<Value> &spare() { return slots_[count_]; }

  Slot<Value> &operator[](std::size_t index) { return slots_[index]; }
  const Slot<Value> &operator[](std::size_t index) const {
    return slots_[index];
  }

  std::size_t size() const { return count_; }
  std::size_t capacity() const { return slots_.size(); }
  bool full() const { return count_ == slots_.size(); }

  void clear() {
    for (std::size_t i = 0; i < count_; ++i)
      slots_[i] = Slot<Value>{};
    count_ = 0;
  }

private:
  std::vector<Slot<Value>> slots_;
  std::size_t count_{0};
};

} // namespace bounded_cache

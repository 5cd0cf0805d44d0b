#include "bounded_cache/key_index.hpp"

#include "bounded_cache/logging.hpp"

#include <algorithm>

namespace bounded_cache {
namespace {
std::size_t table_size(std::size_t capacity) {
  std::size_t n = 2;
  while (n < capacity * 2)
    n <<= 1;
  return n;
}
} // namespace

KeyIndex::KeyIndex(std::size_t capacity)
    : capacity_(capacity), mask_(table_size(capacity) - 1),
      buckets_(mask_ + 1) {}

// splitmix64 finalizer; keys are often small sequential integers.
std::size_t KeyIndex::home(Key key) const {
  key ^= key >> 30;
  key *= 0xbf58476d1ce4e5b9ULL;
  key ^= key >> 27;
  key *= 0x94d049bb133111ebULL;
  key ^= key >> 31;
  return static_cast<std::size_t>(key) & mask_;
}

// Bucket holding key, or the empty bucket where it would go.
std::size_t KeyIndex::probe(Key key) const {
  std::size_t i = home(key);
  while (buckets_[i].used && buckets_[i].key != key)
    i = (i + 1) & mask_;
  return i;
}

KeyIndex::Handle &KeyIndex::put(Key key) {
  Bucket &b = buckets_[probe(key)];
  if (b.used)
    return b.handle;
  BOUNDED_CACHE_CHECK(size_ < capacity_, "key index over capacity");
  b = Bucket{key, OrderIndex::npos, true};
  ++size_;
  return b.handle;
}

KeyIndex::Handle *KeyIndex::find(Key key) {
  Bucket &b = buckets_[probe(key)];
  return b.used ? &b.handle : nullptr;
}

const KeyIndex::Handle *KeyIndex::find(Key key) const {
  const Bucket &b = buckets_[probe(key)];
  return b.used ? &b.handle : nullptr;
}

bool KeyIndex::remove(Key key) {
  std::size_t hole = probe(key);
  if (!buckets_[hole].used)
    return false;
  // Move back every later entry of the run whose home does not lie in the
  // cyclic range (hole, j].
  for (std::size_t j = (hole + 1) & mask_; buckets_[j].used;
       j = (j + 1) & mask_) {
    const std::size_t h = home(buckets_[j].key);
    const bool reachable =
        hole <= j ? (hole < h && h <= j) : (hole < h || h <= j);
    if (reachable)
      continue;
    buckets_[hole] = buckets_[j];
    hole = j;
  }
  buckets_[hole] = Bucket{};
  --size_;
  return true;
}

void KeyIndex::clear() {
  if (size_ == 0)
    return;
  std::fill(buckets_.begin(), buckets_.end(), Bucket{});
  size_ = 0;
}

} // namespace bounded_cache

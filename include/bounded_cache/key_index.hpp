#pragma once

#include "bounded_cache/order_index.hpp"
#include "bounded_cache/types.hpp"

#include <cstddef>
#include <vector>

namespace bounded_cache {

// Maps a cache key to the order index node of its entry. Open addressing with
// linear probing over a table allocated once at construction, at most half
// full when the cache is at capacity. Removal shifts later entries back, so
// no tombstones are left behind.
class KeyIndex {
public:
  using Handle = OrderIndex::Handle;

  explicit KeyIndex(std::size_t capacity);

  // Returns the mapping for key, adding it when missing.
  Handle &put(Key key);
  Handle *find(Key key);
  const Handle *find(Key key) const;
  bool remove(Key key);
  void clear();

  std::size_t size() const { return size_; }
  std::size_t capacity() const { return capacity_; }

private:
  struct Bucket {
    Key key{0};
    Handle handle{OrderIndex::npos};
    bool used{false};
  };

  std::size_t home(Key key) const;
  std::size_t probe(Key key) const;

  std::size_t capacity_;
  std::size_t size_{0};
  std::size_t mask_;
  std::vector<Bucket> buckets_;
};

} // namespace bounded_cache

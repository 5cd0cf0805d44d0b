#pragma once

#include "bounded_cache/types.hpp"

#include <compare>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <vector>

namespace bounded_cache {

// Composite ordering key. Entries sort by metric; the slot index breaks ties
// so that every live entry has a distinct position.
struct OrderKey {
  Metric metric{0};
  std::size_t slot{0};

  auto operator<=>(const OrderKey &) const = default;
};

// Red-black tree over OrderKey with a node pool allocated once at
// construction. Node handles stay valid until the node is removed; update()
// keeps the handle.
class OrderIndex {
public:
  using Handle = std::uint32_t;
  static constexpr Handle npos = std::numeric_limits<Handle>::max();

  explicit OrderIndex(std::size_t capacity);

  Handle insert(const OrderKey &key);
  void remove(Handle node);
  Handle update(Handle node, const OrderKey &key);

  const OrderKey &key(Handle node) const { return nodes_[node].key; }

  Handle first() const;
  Handle last() const;
  Handle next(Handle node) const;
  Handle prev(Handle node) const;

  std::size_t size() const { return size_; }
  std::size_t capacity() const { return nodes_.size() - 1; }
  bool empty() const { return size_ == 0; }
  void clear();

  // Verifies ordering, red-black colouring, parent links and the node count.
  bool check() const;

private:
  struct Node {
    OrderKey key;
    Handle parent;
    Handle left;
    Handle right;
    bool red{false};
  };

  void link(Handle z);
  void unlink(Handle z);
  void insert_fixup(Handle z);
  void erase_fixup(Handle x);
  void rotate_left(Handle x);
  void rotate_right(Handle x);
  void transplant(Handle u, Handle v);
  Handle minimum(Handle x) const;
  Handle maximum(Handle x) const;
  Handle external(Handle x) const { return x == nil_ ? npos : x; }
  int black_height(Handle x, const OrderKey *lo, const OrderKey *hi,
                   std::size_t &count) const;

  std::vector<Node> nodes_;
  std::vector<Handle> free_;
  Handle nil_;
  Handle root_;
  std::size_t size_{0};
};

} // namespace bounded_cache

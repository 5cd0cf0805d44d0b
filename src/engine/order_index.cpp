#include "bounded_cache/order_index.hpp"

#include "bounded_cache/logging.hpp"

#include <stdexcept>

namespace bounded_cache {

OrderIndex::OrderIndex(std::size_t capacity) {
  if (capacity >= static_cast<std::size_t>(npos))
    throw std::invalid_argument("order index capacity too large");
  nodes_.resize(capacity + 1);
  nil_ = static_cast<Handle>(capacity);
  nodes_[nil_] = Node{{}, nil_, nil_, nil_, false};
  free_.reserve(capacity);
  clear();
}

void OrderIndex::clear() {
  free_.clear();
  for (Handle h = nil_; h > 0; --h)
    free_.push_back(h - 1);
  root_ = nil_;
  nodes_[nil_].parent = nil_;
  size_ = 0;
}

OrderIndex::Handle OrderIndex::insert(const OrderKey &key) {
  BOUNDED_CACHE_CHECK(!free_.empty(), "order index node pool exhausted");
  const Handle z = free_.back();
  free_.pop_back();
  nodes_[z].key = key;
  link(z);
  ++size_;
  return z;
}

void OrderIndex::remove(Handle node) {
  BOUNDED_CACHE_CHECK(node < nil_ && size_ > 0, "remove of invalid node");
  unlink(node);
  free_.push_back(node);
  --size_;
}

OrderIndex::Handle OrderIndex::update(Handle node, const OrderKey &key) {
  BOUNDED_CACHE_CHECK(node < nil_, "update of invalid node");
  if (nodes_[node].key == key)
    return node;
  unlink(node);
  nodes_[node].key = key;
  link(node);
  return node;
}

OrderIndex::Handle OrderIndex::first() const {
  return root_ == nil_ ? npos : minimum(root_);
}

OrderIndex::Handle OrderIndex::last() const {
  return root_ == nil_ ? npos : maximum(root_);
}

OrderIndex::Handle OrderIndex::next(Handle x) const {
  if (nodes_[x].right != nil_)
    return minimum(nodes_[x].right);
  Handle y = nodes_[x].parent;
  while (y != nil_ && x == nodes_[y].right) {
    x = y;
    y = nodes_[y].parent;
  }
  return external(y);
}

OrderIndex::Handle OrderIndex::prev(Handle x) const {
  if (nodes_[x].left != nil_)
    return maximum(nodes_[x].left);
  Handle y = nodes_[x].parent;
  while (y != nil_ && x == nodes_[y].left) {
    x = y;
    y = nodes_[y].parent;
  }
  return external(y);
}

OrderIndex::Handle OrderIndex::minimum(Handle x) const {
  while (nodes_[x].left != nil_)
    x = nodes_[x].left;
  return x;
}

OrderIndex::Handle OrderIndex::maximum(Handle x) const {
  while (nodes_[x].right != nil_)
    x = nodes_[x].right;
  return x;
}

void OrderIndex::link(Handle z) {
  Handle y = nil_;
  Handle x = root_;
  const OrderKey &key = nodes_[z].key;
  while (x != nil_) {
    y = x;
    x = key < nodes_[x].key ? nodes_[x].left : nodes_[x].right;
  }
  nodes_[z].parent = y;
  if (y == nil_)
    root_ = z;
  else if (key < nodes_[y].key)
    nodes_[y].left = z;
  else
    nodes_[y].right = z;
  nodes_[z].left = nil_;
  nodes_[z].right = nil_;
  nodes_[z].red = true;
  insert_fixup(z);
}

void OrderIndex::insert_fixup(Handle z) {
  while (nodes_[nodes_[z].parent].red) {
    Handle p = nodes_[z].parent;
    Handle g = nodes_[p].parent;
    if (p == nodes_[g].left) {
      const Handle uncle = nodes_[g].right;
      if (nodes_[uncle].red) {
        nodes_[p].red = false;
        nodes_[uncle].red = false;
        nodes_[g].red = true;
        z = g;
        continue;
      }
      if (z == nodes_[p].right) {
        z = p;
        rotate_left(z);
        p = nodes_[z].parent;
        g = nodes_[p].parent;
      }
      nodes_[p].red = false;
      nodes_[g].red = true;
      rotate_right(g);
    } else {
      const Handle uncle = nodes_[g].left;
      if (nodes_[uncle].red) {
        nodes_[p].red = false;
        nodes_[uncle].red = false;
        nodes_[g].red = true;
        z = g;
        continue;
      }
      if (z == nodes_[p].left) {
        z = p;
        rotate_right(z);
        p = nodes_[z].parent;
        g = nodes_[p].parent;
      }
      nodes_[p].red = false;
      nodes_[g].red = true;
      rotate_left(g);
    }
  }
  nodes_[root_].red = false;
}

void OrderIndex::unlink(Handle z) {
  Handle y = z;
  Handle x;
  bool y_was_red = nodes_[y].red;
  if (nodes_[z].left == nil_) {
    x = nodes_[z].right;
    transplant(z, nodes_[z].right);
  } else if (nodes_[z].right == nil_) {
    x = nodes_[z].left;
    transplant(z, nodes_[z].left);
  } else {
    y = minimum(nodes_[z].right);
    y_was_red = nodes_[y].red;
    x = nodes_[y].right;
    if (nodes_[y].parent == z) {
      nodes_[x].parent = y;
    } else {
      transplant(y, nodes_[y].right);
      nodes_[y].right = nodes_[z].right;
      nodes_[nodes_[y].right].parent = y;
    }
    transplant(z, y);
    nodes_[y].left = nodes_[z].left;
    nodes_[nodes_[y].left].parent = y;
    nodes_[y].red = nodes_[z].red;
  }
  if (!y_was_red)
    erase_fixup(x);
  nodes_[nil_].parent = nil_;
  nodes_[nil_].red = false;
}

void OrderIndex::erase_fixup(Handle x) {
  while (x != root_ && !nodes_[x].red) {
    const Handle p = nodes_[x].parent;
    if (x == nodes_[p].left) {
      Handle w = nodes_[p].right;
      if (nodes_[w].red) {
        nodes_[w].red = false;
        nodes_[p].red = true;
        rotate_left(p);
        w = nodes_[p].right;
      }
      if (!nodes_[nodes_[w].left].red && !nodes_[nodes_[w].right].red) {
        nodes_[w].red = true;
        x = p;
      } else {
        if (!nodes_[nodes_[w].right].red) {
          nodes_[nodes_[w].left].red = false;
          nodes_[w].red = true;
          rotate_right(w);
          w = nodes_[p].right;
        }
        nodes_[w].red = nodes_[p].red;
        nodes_[p].red = false;
        nodes_[nodes_[w].right].red = false;
        rotate_left(p);
        x = root_;
      }
    } else {
      Handle w = nodes_[p].left;
      if (nodes_[w].red) {
        nodes_[w].red = false;
        nodes_[p].red = true;
        rotate_right(p);
        w = nodes_[p].left;
      }
      if (!nodes_[nodes_[w].right].red && !nodes_[nodes_[w].left].red) {
        nodes_[w].red = true;
        x = p;
      } else {
        if (!nodes_[nodes_[w].left].red) {
          nodes_[nodes_[w].right].red = false;
          nodes_[w].red = true;
          rotate_left(w);
          w = nodes_[p].left;
        }
        nodes_[w].red = nodes_[p].red;
        nodes_[p].red = false;
        nodes_[nodes_[w].left].red = false;
        rotate_right(p);
        x = root_;
      }
    }
  }
  nodes_[x].red = false;
}

void OrderIndex::rotate_left(Handle x) {
  const Handle y = nodes_[x].right;
  nodes_[x].right = nodes_[y].left;
  if (nodes_[y].left != nil_)
    nodes_[nodes_[y].left].parent = x;
  nodes_[y].parent = nodes_[x].parent;
  if (nodes_[x].parent == nil_)
    root_ = y;
  else if (x == nodes_[nodes_[x].parent].left)
    nodes_[nodes_[x].parent].left = y;
  else
    nodes_[nodes_[x].parent].right = y;
  nodes_[y].left = x;
  nodes_[x].parent = y;
}

void OrderIndex::rotate_right(Handle x) {
  const Handle y = nodes_[x].left;
  nodes_[x].left = nodes_[y].right;
  if (nodes_[y].right != nil_)
    nodes_[nodes_[y].right].parent = x;
  nodes_[y].parent = nodes_[x].parent;
  if (nodes_[x].parent == nil_)
    root_ = y;
  else if (x == nodes_[nodes_[x].parent].right)
    nodes_[nodes_[x].parent].right = y;
  else
    nodes_[nodes_[x].parent].left = y;
  nodes_[y].right = x;
  nodes_[x].parent = y;
}

void OrderIndex::transplant(Handle u, Handle v) {
  const Handle p = nodes_[u].parent;
  if (p == nil_)
    root_ = v;
  else if (u == nodes_[p].left)
    nodes_[p].left = v;
  else
    nodes_[p].right = v;
  nodes_[v].parent = p;
}

bool OrderIndex::check() const {
  if (nodes_[nil_].red)
    return false;
  if (root_ == nil_)
    return size_ == 0 && free_.size() == capacity();
  if (nodes_[root_].red || nodes_[root_].parent != nil_)
    return false;
  std::size_t count = 0;
  if (black_height(root_, nullptr, nullptr, count) < 0)
    return false;
  return count == size_ && size_ + free_.size() == capacity();
}

int OrderIndex::black_height(Handle x, const OrderKey *lo, const OrderKey *hi,
                             std::size_t &count) const {
  if (x == nil_)
    return 1;
  const Node &n = nodes_[x];
  if ((lo && !(*lo < n.key)) || (hi && !(n.key < *hi)))
    return -1;
  if (n.left != nil_ && nodes_[n.left].parent != x)
    return -1;
  if (n.right != nil_ && nodes_[n.right].parent != x)
    return -1;
  if (n.red && (nodes_[n.left].red || nodes_[n.right].red))
    return -1;
  ++count;
  const int left = black_height(n.left, lo, &n.key, count);
  const int right = black_height(n.right, &n.key, hi, count);
  if (left < 0 || right < 0 || left != right)
    return -1;
  return left + (n.red ? 0 : 1);
}

} // namespace bounded_cache

/* Revset
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

/// @file
#pragma once

#include "revset/container/container_fwd.hpp"
#include <cassert>
#include <cstdint>
#include <vector>

namespace revset::container
{

// Types.

/**
 * The insertion-order backbone of Reverse_iterable_set: a doubly linked sequence of nodes, where the nodes live
 * in a growable arena (`vector`) and reference each other by integer slot index rather than by pointer.  Each
 * node refers (without owning it) to a `Key` stored elsewhere; in practice inside the set's membership index,
 * whose nodes are address-stable.
 *
 * Linking at either end and unlinking any live slot are constant-time (amortized, for linking, due to arena
 * growth).  A removed node's slot goes onto a free list threaded through Node::m_next and is reused by the next
 * link operation; so a slot index alone does not identify a node for all time.  For that each node carries a
 * *stamp*: a counter value assigned at link time, unique for the lifetime of `*this` (never reused, not even after
 * clear()).  A holder of `(slot, stamp)` can therefore ask is_live() whether its node still exists.
 *
 * Ordering vocabulary: "first" is the oldest-appended end (or most recently prepended); "last" is the other.
 * "Forward" means first-to-last.
 *
 * ### Thread safety ###
 * Same as for a `vector`.
 *
 * @tparam Key
 *         Type of the referred-to values.  Never copied or compared by this class.
 */
template<typename Key>
class Order_chain
{
public:
  // Types.

  /// Index of a node's slot within the arena.
  using slot_idx_t = size_t;

  /// Type of Node::m_stamp.
  using stamp_t = uint64_t;

  // Constants.

  /// Sentinel slot index meaning "no node"; e.g., the successor of the last node.
  static constexpr slot_idx_t S_NO_SLOT = slot_idx_t(-1);

  // Constructors/destructor.

  /// Constructs empty chain.  No memory is allocated.
  Order_chain();

  // Methods.

  /**
   * Creates a node referring to `*key` and links it after the current last node (or as the sole node).
   * Strong exception guarantee: if arena growth throws, `*this` is unchanged.
   *
   * @param key
   *        Non-null pointer to the value; must stay valid until the node is unlinked.
   * @return Slot of the new node.
   */
  slot_idx_t link_last(const Key* key);

  /**
   * Same as link_last() but links before the current first node.
   *
   * @param key
   *        See link_last().
   * @return See link_last().
   */
  slot_idx_t link_first(const Key* key);

  /**
   * Splices out the live node at `slot` and recycles the slot.  Behavior undefined if `slot` is not live.
   *
   * @param slot
   *        Slot of a live node.
   */
  void unlink(slot_idx_t slot);

  /// Unlinks all nodes.  Arena capacity is kept; stamps continue from where they were.
  void clear();

  /**
   * Slot of the first node, or #S_NO_SLOT if empty.
   * @return See above.
   */
  slot_idx_t first() const;

  /**
   * Slot of the last node, or #S_NO_SLOT if empty.
   * @return See above.
   */
  slot_idx_t last() const;

  /**
   * Returns the endpoint at which a walk in the given direction begins: first() or last().
   *
   * @param forward
   *        `true` for first-to-last.
   * @return See above.
   */
  slot_idx_t start(bool forward) const;

  /**
   * Slot of the node after the live node at `slot`, or #S_NO_SLOT if it is the last one.
   *
   * @param slot
   *        Slot of a live node.
   * @return See above.
   */
  slot_idx_t next(slot_idx_t slot) const;

  /**
   * Slot of the node before the live node at `slot`, or #S_NO_SLOT if it is the first one.
   *
   * @param slot
   *        Slot of a live node.
   * @return See above.
   */
  slot_idx_t prev(slot_idx_t slot) const;

  /**
   * next() or prev(), depending on `forward`.
   *
   * @param slot
   *        Slot of a live node.
   * @param forward
   *        `true` to get next().
   * @return See above.
   */
  slot_idx_t neighbor(slot_idx_t slot, bool forward) const;

  /**
   * The value the live node at `slot` refers to.
   *
   * @param slot
   *        Slot of a live node.
   * @return See above.
   */
  const Key& key(slot_idx_t slot) const;

  /**
   * The stamp of the live node at `slot`.
   *
   * @param slot
   *        Slot of a live node.
   * @return See above.
   */
  stamp_t stamp(slot_idx_t slot) const;

  /**
   * Returns `true` if and only if the node that had stamp `stamp`, when it was at `slot`, is still linked there.
   * Any `slot` value is allowed, including out-of-range ones and #S_NO_SLOT (`false`).
   *
   * @param slot
   *        Slot index.
   * @param stamp
   *        The stamp observed via stamp() while the node was live.
   * @return See above.
   */
  bool is_live(slot_idx_t slot, stamp_t stamp) const;

  /**
   * Number of linked nodes.
   * @return See above.
   */
  size_t length() const;

  /**
   * Number of slots in the arena, live or free.
   * @return See above.
   */
  size_t slot_count() const;

  /**
   * Exchanges contents with `other` in constant time.  Stamp counters are exchanged too.
   *
   * @param other
   *        The other chain.
   */
  void swap(Order_chain& other);

private:
  // Types.

  /// One arena slot.  Free iff `m_key` is null.
  struct Node
  {
    /// The value referred to; null for a free slot.
    const Key* m_key;
    /// Predecessor slot or #S_NO_SLOT.  Unused for a free slot.
    slot_idx_t m_prev;
    /// Successor slot or #S_NO_SLOT; for a free slot, the next free slot or #S_NO_SLOT.
    slot_idx_t m_next;
    /// See class doc header.
    stamp_t m_stamp;
  };

  // Methods.

  /**
   * Takes a slot off the free list, or appends one to the arena, and initializes it for `key` with no neighbors.
   *
   * @param key
   *        See link_last().
   * @return The slot.
   */
  slot_idx_t acquire_slot(const Key* key);

  // Data.

  /// The arena.
  std::vector<Node> m_slots;

  /// See first().
  slot_idx_t m_first;

  /// See last().
  slot_idx_t m_last;

  /// Head of the free-slot list, threaded through Node::m_next.
  slot_idx_t m_free_head;

  /// See length().
  size_t m_n_live;

  /// Stamp for the next linked node.
  stamp_t m_next_stamp;
}; // class Order_chain

// Template implementations.

template<typename Key>
Order_chain<Key>::Order_chain() :
  m_first(S_NO_SLOT),
  m_last(S_NO_SLOT),
  m_free_head(S_NO_SLOT),
  m_n_live(0),
  m_next_stamp(0)
{
  // That's it.
}

template<typename Key>
typename Order_chain<Key>::slot_idx_t Order_chain<Key>::acquire_slot(const Key* key)
{
  assert(key);

  slot_idx_t slot;
  if (m_free_head == S_NO_SLOT)
  {
    // May throw; nothing has been touched yet.
    m_slots.push_back(Node{nullptr, S_NO_SLOT, S_NO_SLOT, 0});
    slot = m_slots.size() - 1;
  }
  else
  {
    slot = m_free_head;
    m_free_head = m_slots[slot].m_next;
  }

  auto& node = m_slots[slot];
  node.m_key = key;
  node.m_prev = S_NO_SLOT;
  node.m_next = S_NO_SLOT;
  node.m_stamp = m_next_stamp++;
  ++m_n_live;

  return slot;
}

template<typename Key>
typename Order_chain<Key>::slot_idx_t Order_chain<Key>::link_last(const Key* key)
{
  const auto slot = acquire_slot(key);

  if (m_last == S_NO_SLOT)
  {
    assert(m_first == S_NO_SLOT);
    m_first = slot;
  }
  else
  {
    m_slots[slot].m_prev = m_last;
    m_slots[m_last].m_next = slot;
  }
  m_last = slot;

  return slot;
}

template<typename Key>
typename Order_chain<Key>::slot_idx_t Order_chain<Key>::link_first(const Key* key)
{
  const auto slot = acquire_slot(key);

  if (m_first == S_NO_SLOT)
  {
    assert(m_last == S_NO_SLOT);
    m_last = slot;
  }
  else
  {
    m_slots[slot].m_next = m_first;
    m_slots[m_first].m_prev = slot;
  }
  m_first = slot;

  return slot;
}

template<typename Key>
void Order_chain<Key>::unlink(slot_idx_t slot)
{
  assert(slot < m_slots.size());
  auto& node = m_slots[slot];
  assert(node.m_key);

  const auto prev = node.m_prev;
  const auto next = node.m_next;

  /* Sole node must be handled before the first-only and last-only cases, as it is both; otherwise only one of
   * m_first, m_last would be reset. */
  if ((prev == S_NO_SLOT) && (next == S_NO_SLOT))
  {
    assert((m_first == slot) && (m_last == slot));
    m_first = S_NO_SLOT;
    m_last = S_NO_SLOT;
  }
  else if (prev == S_NO_SLOT)
  {
    assert(m_first == slot);
    m_first = next;
    m_slots[next].m_prev = S_NO_SLOT;
  }
  else if (next == S_NO_SLOT)
  {
    assert(m_last == slot);
    m_last = prev;
    m_slots[prev].m_next = S_NO_SLOT;
  }
  else // Interior.
  {
    m_slots[prev].m_next = next;
    m_slots[next].m_prev = prev;
  }

  node.m_key = nullptr;
  node.m_prev = S_NO_SLOT;
  node.m_next = m_free_head;
  m_free_head = slot;
  --m_n_live;
} // Order_chain::unlink()

template<typename Key>
void Order_chain<Key>::clear()
{
  m_slots.clear();
  m_first = S_NO_SLOT;
  m_last = S_NO_SLOT;
  m_free_head = S_NO_SLOT;
  m_n_live = 0;
  // m_next_stamp is kept: a (slot, stamp) taken before clear() must never test live afterwards.
}

template<typename Key>
typename Order_chain<Key>::slot_idx_t Order_chain<Key>::first() const
{
  return m_first;
}

template<typename Key>
typename Order_chain<Key>::slot_idx_t Order_chain<Key>::last() const
{
  return m_last;
}

template<typename Key>
typename Order_chain<Key>::slot_idx_t Order_chain<Key>::start(bool forward) const
{
  return forward ? m_first : m_last;
}

template<typename Key>
typename Order_chain<Key>::slot_idx_t Order_chain<Key>::next(slot_idx_t slot) const
{
  assert((slot < m_slots.size()) && m_slots[slot].m_key);
  return m_slots[slot].m_next;
}

template<typename Key>
typename Order_chain<Key>::slot_idx_t Order_chain<Key>::prev(slot_idx_t slot) const
{
  assert((slot < m_slots.size()) && m_slots[slot].m_key);
  return m_slots[slot].m_prev;
}

template<typename Key>
typename Order_chain<Key>::slot_idx_t Order_chain<Key>::neighbor(slot_idx_t slot, bool forward) const
{
  return forward ? next(slot) : prev(slot);
}

template<typename Key>
const Key& Order_chain<Key>::key(slot_idx_t slot) const
{
  assert((slot < m_slots.size()) && m_slots[slot].m_key);
  return *m_slots[slot].m_key;
}

template<typename Key>
typename Order_chain<Key>::stamp_t Order_chain<Key>::stamp(slot_idx_t slot) const
{
  assert((slot < m_slots.size()) && m_slots[slot].m_key);
  return m_slots[slot].m_stamp;
}

template<typename Key>
bool Order_chain<Key>::is_live(slot_idx_t slot, stamp_t stamp) const
{
  if (slot >= m_slots.size()) // Includes S_NO_SLOT.
  {
    return false;
  }
  // else
  const auto& node = m_slots[slot];
  return node.m_key && (node.m_stamp == stamp);
}

template<typename Key>
size_t Order_chain<Key>::length() const
{
  return m_n_live;
}

template<typename Key>
size_t Order_chain<Key>::slot_count() const
{
  return m_slots.size();
}

template<typename Key>
void Order_chain<Key>::swap(Order_chain& other)
{
  using std::swap;

  swap(m_slots, other.m_slots); // Constant-time; Node::m_key pointers still refer to the same (moved-along) keys.
  swap(m_first, other.m_first);
  swap(m_last, other.m_last);
  swap(m_free_head, other.m_free_head);
  swap(m_n_live, other.m_n_live);
  swap(m_next_stamp, other.m_next_stamp);
}

} // namespace revset::container

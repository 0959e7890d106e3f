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

#include "revset/container/detail/order_chain.hpp"
#include "revset/log/log.hpp"
#include <cassert>
#include <cstddef>
#include <iterator>
#include <optional>
#include <utility>

namespace revset::container
{

// Types.

/**
 * Output shape for Basic_traversal_cursor yielding each element by value.
 *
 * @tparam Key
 *         Element type.
 */
template<typename Key>
struct Value_shape
{
  /// What a cursor step yields.
  using Output = Key;

  /**
   * Builds the step output for an element.
   *
   * @param key
   *        Element.
   * @return Copy of `key`.
   */
  static Output shape(const Key& key);
};

/**
 * Output shape for Basic_traversal_cursor yielding each element as a pair `(key, key)`; the pair form of
 * set traversal (in the tradition of map-style `(key, mapped)` entries where, in a set, the key is its own mapped
 * value).
 *
 * @tparam Key
 *         Element type.
 */
template<typename Key>
struct Pair_shape
{
  /// What a cursor step yields.
  using Output = std::pair<Key, Key>;

  /**
   * Builds the step output for an element.
   *
   * @param key
   *        Element.
   * @return `Output{key, key}`.
   */
  static Output shape(const Key& key);
};

/**
 * A lazy, single-pass, direction-aware walk over the elements of a Reverse_iterable_set, obtained from one of
 * its `iterate_*()` methods or reverse_view().  Each next() yields the element at the current position (shaped per
 * `Shape`, e.g., as the value or as a pair) and advances to its neighbor in the current direction.  Nothing is
 * copied up-front; the walk reads the set's order chain as it goes.
 *
 * ### Anchor and reverse() ###
 * A cursor may be *anchored* at a member element (Reverse_iterable_set::iterate_from()), in which case it starts
 * there; otherwise it starts at the endpoint appropriate for its direction.  reverse() flips the direction and
 * restarts the walk from the anchor, if any, else from the opposite endpoint.  Thus, for elements `a b c d e`:
 *   - `iterate_from(c)` yields `c d e`;
 *   - `iterate_from(c)`, then `reverse()`, yields `c b a`;
 *   - `iterate_values().reverse()` yields `e d c b a` (this is reverse_view()).
 *
 * ### States ###
 * A cursor is Active or Exhausted.  It becomes Exhausted when a step finds no element at the current position
 * (it fell off an end); or immediately, if it was anchored at a value not in the set.  Exhausted is terminal:
 * next() keeps returning `nullopt`, and reverse() does nothing.  To traverse again, get a new cursor.
 *
 * ### Mutation while traversing ###
 * Structurally changing the set while a cursor is in use is allowed but gives few guarantees: appended or
 * prepended elements may or may not be reached, depending on where the cursor is.  Removal of the element at the
 * cursor's current position, or of its anchor, is detected at the next step (or reverse()), logged as a WARNING,
 * and makes the cursor Exhausted; it will never yield a value from a recycled slot.  The set must outlive the
 * cursor, and it must not be swapped or assigned-to while the cursor is in use (clear() is fine: that is detected
 * like any removal).
 *
 * Range-`for` is supported via begin() and end(), which give single-pass input iterators consuming `*this`.
 *
 * @tparam Set
 *         The Reverse_iterable_set type.
 * @tparam Shape
 *         Value_shape or Pair_shape (or anything with the same interface).
 */
template<typename Set, typename Shape>
class Basic_traversal_cursor :
  public log::Log_context
{
public:
  // Types.

  /// What each step yields.
  using Output = typename Shape::Output;

  /// Short-hand for the set's element type.
  using Key = typename Set::Key;

  /**
   * Single-pass input iterator over the remaining output of a Basic_traversal_cursor.  Incrementing it steps the
   * cursor; hence all iterators from one cursor share its position.
   */
  class Iterator
  {
  public:
    // Types.

    /// For iterator compliance.
    using iterator_category = std::input_iterator_tag;
    /// For iterator compliance.
    using value_type = Output;
    /// For iterator compliance.
    using difference_type = std::ptrdiff_t;
    /// For iterator compliance.
    using pointer = const Output*;
    /// For iterator compliance.
    using reference = const Output&;

    // Constructors/destructor.

    /// Constructs the past-the-end iterator.
    Iterator();

    // Methods.

    /**
     * The current output.  Behavior undefined if `*this` is past-the-end.
     * @return See above.
     */
    reference operator*() const;

    /**
     * Pointer to the current output.  Behavior undefined if `*this` is past-the-end.
     * @return See above.
     */
    pointer operator->() const;

    /**
     * Steps the underlying cursor.
     * @return `*this`.
     */
    Iterator& operator++();

    /**
     * `true` iff both are past-the-end, or both wrap the same cursor and neither is past-the-end.
     *
     * @param other
     *        Other iterator.
     * @return See above.
     */
    bool operator==(const Iterator& other) const;

    /**
     * Negation of `==`.
     *
     * @param other
     *        Other iterator.
     * @return See above.
     */
    bool operator!=(const Iterator& other) const;

  private:
    // Friends.

    /// Creates non-end iterators.
    friend class Basic_traversal_cursor;

    // Constructors.

    /**
     * Constructs iterator positioned at the cursor's next output (stepping it once).
     *
     * @param cursor
     *        The cursor.
     */
    explicit Iterator(Basic_traversal_cursor* cursor);

    // Data.

    /// The cursor being consumed; null if past-the-end.
    Basic_traversal_cursor* m_cursor;

    /// The current output; empty iff past-the-end.
    std::optional<Output> m_output;
  }; // class Iterator

  // Methods.

  /**
   * Yields the element at the current position (shaped per `Shape`) and advances; or returns `nullopt` and becomes
   * (or stays) Exhausted if there is no element there.
   *
   * @return See above.
   */
  std::optional<Output> next();

  /**
   * Flips the traversal direction; the walk restarts at the anchor (if anchored) or else at the endpoint from
   * which the new direction begins.  No-op if exhausted().
   *
   * @return `*this`.
   */
  Basic_traversal_cursor& reverse();

  /**
   * Returns `true` if and only if the cursor is in the terminal Exhausted state.  Note that a cursor that has
   * yielded the last element but not yet been stepped again is still Active.
   *
   * @return See above.
   */
  bool exhausted() const;

  /**
   * Returns `true` if the current direction is first-to-last (insertion order); `false` if reversed.
   * @return See above.
   */
  bool forward() const;

  /**
   * Returns `true` if and only if the cursor was created anchored at a member element.
   * @return See above.
   */
  bool anchored() const;

  /**
   * Iterator over remaining outputs; steps the cursor once.
   * @return See above.
   */
  Iterator begin();

  /**
   * Past-the-end iterator.
   * @return See above.
   */
  Iterator end();

private:
  // Types.

  /// Short-hand for the chain type.
  using Chain = Order_chain<Key>;

  /// Short-hand for slot index.
  using slot_idx_t = typename Chain::slot_idx_t;

  /// Short-hand for node stamp.
  using stamp_t = typename Chain::stamp_t;

  // Friends.

  /// The set creates cursors.
  friend Set;

  // Constructors.

  /**
   * Constructs cursor.  Invoked by the set only.
   *
   * @param set
   *        The set; must outlive `*this`.
   * @param anchor_or_none
   *        Slot of the anchor element; or `Chain::S_NO_SLOT` for an unanchored walk.
   * @param forward
   *        Initial direction.
   * @param exhausted
   *        If `true`, the cursor starts Exhausted (anchor value not found).
   */
  explicit Basic_traversal_cursor(const Set* set, slot_idx_t anchor_or_none, bool forward, bool exhausted);

  // Methods.

  /**
   * The set's chain.
   * @return See above.
   */
  const Chain& chain() const;

  /**
   * Positions at `slot` (may be `S_NO_SLOT`), recording its stamp if it is a node.
   *
   * @param slot
   *        Position.
   */
  void seek(slot_idx_t slot);

  // Data.

  /// The set being walked.
  const Set* m_set;

  /// Anchor slot, or `S_NO_SLOT` if unanchored.
  slot_idx_t m_anchor;

  /// Stamp of the anchor node when the cursor was created; meaningless if unanchored.
  stamp_t m_anchor_stamp;

  /// Slot of the element the next step yields; `S_NO_SLOT` if the walk fell off an end.
  slot_idx_t m_current;

  /// Stamp of the #m_current node; meaningless if `m_current == S_NO_SLOT`.
  stamp_t m_current_stamp;

  /// See forward().
  bool m_forward;

  /// See exhausted().
  bool m_exhausted;
}; // class Basic_traversal_cursor

// Template implementations.

template<typename Key>
typename Value_shape<Key>::Output Value_shape<Key>::shape(const Key& key) // Static.
{
  return key;
}

template<typename Key>
typename Pair_shape<Key>::Output Pair_shape<Key>::shape(const Key& key) // Static.
{
  return Output{key, key};
}

template<typename Set, typename Shape>
Basic_traversal_cursor<Set, Shape>::Basic_traversal_cursor(const Set* set, slot_idx_t anchor_or_none,
                                                           bool forward, bool exhausted) :
  log::Log_context(set->get_logger(), Revset_log_component::S_CONTAINER),
  m_set(set),
  m_anchor(anchor_or_none),
  m_anchor_stamp(0),
  m_current(Chain::S_NO_SLOT),
  m_current_stamp(0),
  m_forward(forward),
  m_exhausted(exhausted)
{
  if (m_exhausted)
  {
    return;
  }
  // else

  if (m_anchor == Chain::S_NO_SLOT)
  {
    seek(chain().start(m_forward));
  }
  else
  {
    m_anchor_stamp = chain().stamp(m_anchor);
    seek(m_anchor);
  }
}

template<typename Set, typename Shape>
const typename Basic_traversal_cursor<Set, Shape>::Chain& Basic_traversal_cursor<Set, Shape>::chain() const
{
  return m_set->m_chain;
}

template<typename Set, typename Shape>
void Basic_traversal_cursor<Set, Shape>::seek(slot_idx_t slot)
{
  m_current = slot;
  if (slot != Chain::S_NO_SLOT)
  {
    m_current_stamp = chain().stamp(slot);
  }
}

template<typename Set, typename Shape>
std::optional<typename Basic_traversal_cursor<Set, Shape>::Output> Basic_traversal_cursor<Set, Shape>::next()
{
  if (m_exhausted)
  {
    return std::nullopt;
  }
  // else

  if (m_current == Chain::S_NO_SLOT)
  {
    REVSET_LOG_TRACE("Cursor over [" << *m_set << "]: walk reached the "
                     "[" << (m_forward ? "last" : "first") << "] end; exhausted.");
    m_exhausted = true;
    return std::nullopt;
  }
  // else

  const auto& chain = this->chain();
  if (!chain.is_live(m_current, m_current_stamp))
  {
    REVSET_LOG_WARNING("Cursor over [" << *m_set << "]: the element at its position (slot [" << m_current << "]) "
                       "was removed from the set since the previous step.  Treating the cursor as exhausted.");
    m_exhausted = true;
    return std::nullopt;
  }
  // else

  std::optional<Output> output(Shape::shape(chain.key(m_current)));
  seek(chain.neighbor(m_current, m_forward));
  return output;
} // Basic_traversal_cursor::next()

template<typename Set, typename Shape>
Basic_traversal_cursor<Set, Shape>& Basic_traversal_cursor<Set, Shape>::reverse()
{
  if (m_exhausted)
  {
    return *this;
  }
  // else

  m_forward = !m_forward;

  if (m_anchor == Chain::S_NO_SLOT)
  {
    seek(chain().start(m_forward));
  }
  else if (chain().is_live(m_anchor, m_anchor_stamp))
  {
    seek(m_anchor);
  }
  else
  {
    REVSET_LOG_WARNING("Cursor over [" << *m_set << "]: its anchor element (slot [" << m_anchor << "]) was removed "
                       "from the set; cannot restart from it.  Treating the cursor as exhausted.");
    m_exhausted = true;
  }

  return *this;
}

template<typename Set, typename Shape>
bool Basic_traversal_cursor<Set, Shape>::exhausted() const
{
  return m_exhausted;
}

template<typename Set, typename Shape>
bool Basic_traversal_cursor<Set, Shape>::forward() const
{
  return m_forward;
}

template<typename Set, typename Shape>
bool Basic_traversal_cursor<Set, Shape>::anchored() const
{
  return m_anchor != Chain::S_NO_SLOT;
}

template<typename Set, typename Shape>
typename Basic_traversal_cursor<Set, Shape>::Iterator Basic_traversal_cursor<Set, Shape>::begin()
{
  return Iterator(this);
}

template<typename Set, typename Shape>
typename Basic_traversal_cursor<Set, Shape>::Iterator Basic_traversal_cursor<Set, Shape>::end()
{
  return Iterator();
}

template<typename Set, typename Shape>
Basic_traversal_cursor<Set, Shape>::Iterator::Iterator() :
  m_cursor(nullptr)
{
  // That's it.
}

template<typename Set, typename Shape>
Basic_traversal_cursor<Set, Shape>::Iterator::Iterator(Basic_traversal_cursor* cursor) :
  m_cursor(cursor),
  m_output(cursor->next())
{
  if (!m_output)
  {
    m_cursor = nullptr; // Equal to end() from the start.
  }
}

template<typename Set, typename Shape>
typename Basic_traversal_cursor<Set, Shape>::Iterator::reference
  Basic_traversal_cursor<Set, Shape>::Iterator::operator*() const
{
  assert(m_output);
  return *m_output;
}

template<typename Set, typename Shape>
typename Basic_traversal_cursor<Set, Shape>::Iterator::pointer
  Basic_traversal_cursor<Set, Shape>::Iterator::operator->() const
{
  assert(m_output);
  return &(*m_output);
}

template<typename Set, typename Shape>
typename Basic_traversal_cursor<Set, Shape>::Iterator& Basic_traversal_cursor<Set, Shape>::Iterator::operator++()
{
  assert(m_cursor);
  m_output = m_cursor->next();
  if (!m_output)
  {
    m_cursor = nullptr;
  }
  return *this;
}

template<typename Set, typename Shape>
bool Basic_traversal_cursor<Set, Shape>::Iterator::operator==(const Iterator& other) const
{
  return m_cursor == other.m_cursor;
}

template<typename Set, typename Shape>
bool Basic_traversal_cursor<Set, Shape>::Iterator::operator!=(const Iterator& other) const
{
  return !operator==(other);
}

} // namespace revset::container

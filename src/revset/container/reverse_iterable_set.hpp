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

#include "revset/container/traversal_cursor.hpp"
#include "revset/container/detail/order_chain.hpp"
#include "revset/container/error/error.hpp"
#include "revset/error/error.hpp"
#include "revset/log/log.hpp"
#include "revset/util/util.hpp"
#include <boost/unordered_map.hpp>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <utility>

namespace revset::container
{

/**
 * A hash set that remembers the order in which its elements were inserted and can be traversed in that order, in
 * its reverse, or from any member element in either direction.  Lookup, insertion at either end, and removal of any
 * element are constant-time (amortized), like those of an `unordered_set<>`.
 *
 * ### Ordering ###
 * append() adds an element after all others; prepend() before all others.  Crucially, **adding an element that is
 * already present changes nothing: it stays where it was**, whichever of append() or prepend() is used.  To move
 * an element to an end, remove() it and add it again.
 *
 * ### Traversal ###
 * There are two families:
 *   - Standard iteration: begin()/end() (insertion order; so range-`for` works), rbegin()/rend() (reverse),
 *     find().  These are bidirectional `const` iterators, invalidated by removal of their element (and by clear()).
 *   - Cursors (Basic_traversal_cursor): iterate_values(), iterate_value_pairs(), iterate_from(), reverse_view().
 *     A cursor is a stateful one-shot generator with a next() method, a reverse() operation that turns it around
 *     at its anchor, and detection of removal of the element it is about to yield.  See its doc header.
 *
 * for_each_forward() and for_each_backward() call a function on each element, with an optional context object.
 *
 * ### Logging ###
 * A Logger may be given at construction; mutations are logged at TRACE (clear() at DEBUG), anomalies at WARNING.
 * Element values are never logged, so `Key` need not be printable.
 *
 * ### Thread safety ###
 * Same as for `unordered_set<>`.
 *
 * @internal
 * ### Impl notes ###
 * The membership index #m_index maps each element to its slot in the Order_chain #m_chain; the chain's nodes point
 * back at the element *as stored in the index* (`boost::unordered_map` node addresses are stable), so each
 * element is stored exactly once.  The chain's slot/stamp pairs let cursors and iterators refer to positions
 * without handing out node references.
 * @endinternal
 *
 * @tparam Key_t
 *         Element type.  Must be copy- or move-constructible and hashable/comparable via `Hash_t`, `Pred_t`.
 * @tparam Hash_t
 *         Hasher type; `boost::hash<Key_t>` by default, so `hash_value(const Key_t&)` via ADL works.
 * @tparam Pred_t
 *         Equality functor type.
 */
template<typename Key_t, typename Hash_t, typename Pred_t>
class Reverse_iterable_set :
  public log::Log_context
{
public:
  // Types.

  /// Convenience alias for template arg.
  using Key = Key_t;

  /// Convenience alias for template arg.
  using Hash = Hash_t;

  /// Convenience alias for template arg.
  using Pred = Pred_t;

private:
  // Types. These are here in the middle of public block due to inability to forward-declare aliases.

  /// The order chain type.
  using Chain = Order_chain<Key>;

  /// Short-hand for chain slot index.
  using slot_idx_t = typename Chain::slot_idx_t;

  /// Membership index type: element to its chain slot.
  using Index = boost::unordered_map<Key, slot_idx_t, Hash, Pred>;

public:

  // Types (continued).

  /// Expresses sizes/lengths of relevant things.
  using size_type = std::size_t;
  /// Type for difference of `size_type`s.
  using difference_type = std::ptrdiff_t;

  /// Bidirectional iterator over the elements, in insertion order.  Elements cannot be modified through it.
  class Const_iterator
  {
  public:
    // Types.

    /// For iterator compliance.
    using iterator_category = std::bidirectional_iterator_tag;
    /// For iterator compliance.
    using value_type = Key;
    /// For iterator compliance.
    using difference_type = std::ptrdiff_t;
    /// For iterator compliance.
    using pointer = const Key*;
    /// For iterator compliance.
    using reference = const Key&;

    // Constructors/destructor.

    /// Constructs singular iterator; only assignment and destruction are allowed.
    Const_iterator();

    // Methods.

    /**
     * The element.
     * @return See above.
     */
    reference operator*() const;

    /**
     * Pointer to the element.
     * @return See above.
     */
    pointer operator->() const;

    /**
     * Advances to the next element in insertion order.
     * @return `*this`.
     */
    Const_iterator& operator++();

    /**
     * Advances to the next element in insertion order.
     * @return Copy of `*this` pre-increment.
     */
    Const_iterator operator++(int);

    /**
     * Moves to the previous element in insertion order; from end() that is the last element.
     * @return `*this`.
     */
    Const_iterator& operator--();

    /**
     * Moves to the previous element in insertion order.
     * @return Copy of `*this` pre-decrement.
     */
    Const_iterator operator--(int);

    /**
     * Equality: same set, same position.
     *
     * @param other
     *        Other iterator.
     * @return See above.
     */
    bool operator==(const Const_iterator& other) const;

    /**
     * Negation of `==`.
     *
     * @param other
     *        Other iterator.
     * @return See above.
     */
    bool operator!=(const Const_iterator& other) const;

  private:
    // Friends.

    /// Creates real iterators.
    friend class Reverse_iterable_set;

    // Constructors.

    /**
     * Constructs iterator at `slot` (`S_NO_SLOT` means end()).
     *
     * @param chain
     *        The chain.
     * @param slot
     *        Position.
     */
    explicit Const_iterator(const Chain* chain, slot_idx_t slot);

    // Data.

    /// The chain walked.
    const Chain* m_chain;

    /// Position; `S_NO_SLOT` for end().
    slot_idx_t m_slot;
  }; // class Const_iterator

  /**
   * Type for iterator pointing into a mutable structure of this type but actually that is not possible;
   * so alias to #Const_iterator.  Note these are standard semantics (see `std::set`, etc.).
   */
  using Iterator = Const_iterator;

  /// Type for reverse iterator pointing into an immutable structure of this type.
  using Const_reverse_iterator = std::reverse_iterator<Const_iterator>;

  /// Same as #Const_reverse_iterator; elements are never mutable in place.
  using Reverse_iterator = Const_reverse_iterator;

  /// Cursor yielding elements.
  using Value_cursor = Basic_traversal_cursor<Reverse_iterable_set, Value_shape<Key>>;

  /// Cursor yielding `(element, element)` pairs.
  using Pair_cursor = Basic_traversal_cursor<Reverse_iterable_set, Pair_shape<Key>>;

  /// For container compliance (hence the irregular capitalization): #Key type.
  using key_type = Key;
  /// For container compliance (hence the irregular capitalization): #Key type.
  using value_type = Key;
  /// For container compliance (hence the irregular capitalization): #Hash type.
  using hasher = Hash;
  /// For container compliance (hence the irregular capitalization): #Pred type.
  using key_equal = Pred;
  /// For container compliance (hence the irregular capitalization): reference to `const Key` type.
  using const_reference = const Key&;
  /// For container compliance (hence the irregular capitalization): `Iterator` type.
  using iterator = Iterator;
  /// For container compliance (hence the irregular capitalization): `Const_iterator` type.
  using const_iterator = Const_iterator;

  // Constants.

  /// Fixed label identifying this type in generic printing; see `operator<<()`.
  static constexpr util::String_view S_TYPE_TAG = "Reverse_iterable_set";

  // Constructors/destructor.

  /**
   * Constructs empty structure.
   *
   * @param logger_ptr
   *        Logger to use subsequently; null to not log.
   * @param n_buckets
   *        Number of buckets for the membership index.  Special value -1 (default) will cause us to use
   *        whatever `unordered_map<>` would use by default.
   * @param hasher_obj
   *        Instance of the hash function type.
   * @param pred
   *        Instance of the equality function type.
   */
  explicit Reverse_iterable_set(log::Logger* logger_ptr = nullptr,
                                size_type n_buckets = size_type(-1),
                                const Hash& hasher_obj = Hash{},
                                const Pred& pred = Pred{});

  /**
   * Constructs structure holding the given values, as if by append() of each in list order.  Thus iteration
   * yields them in list order, minus repeats (the first occurrence of each counts).
   *
   * @param values
   *        Values, e.g., `{ a, b, c }`.
   * @param logger_ptr
   *        See other constructor.
   */
  Reverse_iterable_set(std::initializer_list<Key> values, log::Logger* logger_ptr = nullptr);

  /**
   * Constructs structure holding the values in `[first, last)`, as if by append() of each in order.
   *
   * @tparam Input_it
   *         Input iterator whose `*` yields something convertible to `Key`.
   * @param first
   *        Start of range.
   * @param last
   *        End of range.
   * @param logger_ptr
   *        See other constructor.
   */
  template<typename Input_it>
  explicit Reverse_iterable_set(Input_it first, Input_it last, log::Logger* logger_ptr = nullptr);

  /**
   * Constructs object that is an independent copy of `src`, with the same order, Logger, hasher and predicate.
   *
   * @param src
   *        Source object.
   */
  Reverse_iterable_set(const Reverse_iterable_set& src);

  /**
   * Constructs object by making it equal to the given source, while the given source becomes empty.
   * Constant-time.
   *
   * @param src
   *        Source object which is emptied.
   */
  Reverse_iterable_set(Reverse_iterable_set&& src);

  // Methods.

  /**
   * Overwrites this object with a copy of the given source.  Strong exception guarantee.
   *
   * @param src
   *        Source object.  No-op if `this == &src`.
   * @return `*this`.
   */
  Reverse_iterable_set& operator=(const Reverse_iterable_set& src);

  /**
   * Overwrites this object making it identical to the given source, while the given source becomes empty.
   * Constant-time, plus the cost of `this->clear()`.
   *
   * @param src
   *        Source object which is emptied; except no-op if `this == &src`.
   * @return `*this`.
   */
  Reverse_iterable_set& operator=(Reverse_iterable_set&& src);

  /**
   * Swaps the contents (and Logger) of this structure and `other`.  Constant-time.  Iterators and cursors into
   * either become invalid.
   *
   * @param other
   *        The other structure.
   */
  void swap(Reverse_iterable_set& other);

  /**
   * Adds a copy of `key` after all other elements; or does nothing if an equal element is present (it keeps its
   * position).  If copying `key` or allocating throws, `*this` is unchanged.
   *
   * @param key
   *        Value to add.
   * @return `*this`, for chaining: `s.append(a).append(b)`.
   */
  Reverse_iterable_set& append(const Key& key);

  /**
   * Identical to the other overload, except that (if an equal element is not already present) `key` is moved
   * into `*this`.
   *
   * @param key
   *        Value to add (moved-from, if added).
   * @return `*this`.
   */
  Reverse_iterable_set& append(Key&& key);

  /**
   * Adds a copy of `key` before all other elements; or does nothing if an equal element is present: it is *not*
   * moved to the front.
   *
   * @param key
   *        Value to add.
   * @return `*this`, for chaining.
   */
  Reverse_iterable_set& prepend(const Key& key);

  /**
   * Identical to the other overload, except that `key` is moved-from if added.
   *
   * @param key
   *        Value to add.
   * @return `*this`.
   */
  Reverse_iterable_set& prepend(Key&& key);

  /**
   * Removes the element equal to `key`, if present; its neighbors become adjacent.
   *
   * @param key
   *        Value whose equal to remove.
   * @return `true` if it was present (and is now removed); `false` if not (nothing changes).
   */
  bool remove(const Key& key);

  /**
   * Removes the element at the given valid, dereferenceable iterator.  `it` becomes invalid.
   *
   * @param it
   *        Iterator of element to erase.
   * @return Iterator to the element that followed `*it` in insertion order, or end().
   */
  Const_iterator erase(const Const_iterator& it);

  /// Makes it so that `size() == 0`.  Outstanding cursors detect this at their next step.
  void clear();

  /**
   * Returns `true` iff an element equal to `key` is present.
   *
   * @param key
   *        Value to look up.
   * @return See above.
   */
  bool contains(const Key& key) const;

  /**
   * Returns 1 if an element equal to `key` is present, else 0.
   *
   * @param key
   *        Value to look up.
   * @return See above.
   */
  size_type count(const Key& key) const;

  /**
   * Returns iterator to the element equal to `key`, or end().  Incrementing/decrementing it walks insertion order
   * from that element.
   *
   * @param key
   *        Value to look up.
   * @return See above.
   */
  Const_iterator find(const Key& key) const;

  /**
   * Returns a cursor yielding the elements from first to last.
   * @return See above.
   */
  Value_cursor iterate_values() const;

  /**
   * Returns a cursor yielding `(element, element)` from first to last.
   * @return See above.
   */
  Pair_cursor iterate_value_pairs() const;

  /**
   * Returns a cursor anchored at the element equal to `key`, yielding it and then the elements after it; its
   * reverse() yields the element and then the ones before it.  If `key` is not present, the cursor is
   * exhausted from the start (this is not an error).
   *
   * @param key
   *        Anchor value.
   * @return See above.
   */
  Value_cursor iterate_from(const Key& key) const;

  /**
   * Returns a cursor yielding the elements from last to first.  Equivalent to `iterate_values()` followed by
   * its `reverse()`.
   *
   * @return See above.
   */
  Value_cursor reverse_view() const;

  /**
   * Calls `func(key, key, *this)` for each element, first to last.  `func` may remove the element it was given
   * (only that one) from `*this` via a non-`const` path the caller holds; other mutation during the walk is
   * undefined behavior.
   *
   * @tparam Func
   *         Callable as above.
   * @param func
   *        The function.
   */
  template<typename Func>
  void for_each_forward(const Func& func) const;

  /**
   * Like the other overload, but `func` is given a context: the call is `std::invoke(func, ctx, key, key, *this)`.
   * So a pointer to a member function of `Ctx` is called on `*ctx`; any other callable gets `ctx` first.
   *
   * @tparam Func
   *         Callable as above.
   * @tparam Ctx
   *         Context type.
   * @param func
   *        The function.
   * @param ctx
   *        The context.
   */
  template<typename Func, typename Ctx>
  void for_each_forward(const Func& func, Ctx* ctx) const;

  /**
   * Same as for_each_forward() but last to first.
   *
   * @tparam Func
   *         See for_each_forward().
   * @param func
   *        See for_each_forward().
   */
  template<typename Func>
  void for_each_backward(const Func& func) const;

  /**
   * Same as for_each_forward() with context, but last to first.
   *
   * @tparam Func
   *         See for_each_forward().
   * @tparam Ctx
   *         See for_each_forward().
   * @param func
   *        See for_each_forward().
   * @param ctx
   *        See for_each_forward().
   */
  template<typename Func, typename Ctx>
  void for_each_backward(const Func& func, Ctx* ctx) const;

  /**
   * Returns the first element.  Behavior undefined if empty().
   * @return Ditto.
   */
  const Key& front() const;

  /**
   * Returns the last element.  Behavior undefined if empty().
   * @return Ditto.
   */
  const Key& back() const;

  /**
   * Returns iterator to the first element, or end() if empty.
   * @return Ditto.
   */
  Iterator begin() const;

  /**
   * Returns one-past-last iterator.
   * @return Ditto.
   */
  Iterator end() const;

  /**
   * Synonym of begin().
   * @return Ditto.
   */
  Const_iterator cbegin() const;

  /**
   * Synonym of end().
   * @return Ditto.
   */
  Const_iterator cend() const;

  /**
   * Returns reverse iterator to the last element.
   * @return Ditto.
   */
  Reverse_iterator rbegin() const;

  /**
   * Returns reverse iterator one past the first element.
   * @return Ditto.
   */
  Reverse_iterator rend() const;

  /**
   * Synonym of rbegin().
   * @return Ditto.
   */
  Const_reverse_iterator crbegin() const;

  /**
   * Synonym of rend().
   * @return Ditto.
   */
  Const_reverse_iterator crend() const;

  /**
   * Returns true if and only if container is empty.
   * @return Ditto.
   */
  bool empty() const;

  /**
   * Returns number of elements stored.
   * @return Ditto.
   */
  size_type size() const;

  /**
   * Returns max number of elements that can be stored.
   * @return Ditto.
   */
  size_type max_size() const;

  /**
   * Verifies the internal consistency of the structure: the order chain is doubly linked and terminated properly
   * at both ends; every chain node's element is in the index, which refers back to that node; and the chain and
   * index sizes agree.  Linear-time.  Failure indicates a bug in this class (or memory corruption).
   *
   * @param err_code
   *        See revset::Error_code docs for error reporting semantics.  container::error::Code generated:
   *        any of them.
   */
  void check_invariants(Error_code* err_code = nullptr) const;

private:
  // Friends.

  /// Cursors read #m_chain directly.
  template<typename, typename>
  friend class Basic_traversal_cursor;

  // Methods.

  /**
   * Implementation of append() and prepend() overloads.
   *
   * @tparam Key_ref
   *         `const Key&` or `Key`.
   * @param key
   *        Value to add.
   * @param at_end
   *        `true` for append().
   */
  template<typename Key_ref>
  void insert_impl(Key_ref&& key, bool at_end);

  /**
   * Implementation of the for-each family: invokes `visit(key)` for each element, in the given direction.
   * The successor is determined before the visit.
   *
   * @tparam Visitor
   *         `void (const Key&)` callable.
   * @param visit
   *        Visitor.
   * @param forward
   *        Direction.
   */
  template<typename Visitor>
  void walk(const Visitor& visit, bool forward) const;

  // Data.

  /// Membership index: each element, stored once, mapped to its #m_chain slot.
  Index m_index;

  /// Order of the elements of #m_index.
  Chain m_chain;
}; // class Reverse_iterable_set

// Template implementations.

template<typename Key_t, typename Hash_t, typename Pred_t>
Reverse_iterable_set<Key_t, Hash_t, Pred_t>::Reverse_iterable_set(log::Logger* logger_ptr,
                                                                  size_type n_buckets,
                                                                  const Hash& hasher_obj,
                                                                  const Pred& pred) :
  log::Log_context(logger_ptr, Revset_log_component::S_CONTAINER),
  // @todo Using detail:: here is not great, but unordered_map<> ctor offers no "default bucket count" overload.
  m_index((n_buckets == size_type(-1))
            ? boost::unordered::detail::default_bucket_count
            : n_buckets,
          hasher_obj, pred)
{
  // That's all.
}

template<typename Key_t, typename Hash_t, typename Pred_t>
Reverse_iterable_set<Key_t, Hash_t, Pred_t>::Reverse_iterable_set(std::initializer_list<Key> values,
                                                                  log::Logger* logger_ptr) :
  Reverse_iterable_set(values.begin(), values.end(), logger_ptr)
{
  // That's all.
}

template<typename Key_t, typename Hash_t, typename Pred_t>
template<typename Input_it>
Reverse_iterable_set<Key_t, Hash_t, Pred_t>::Reverse_iterable_set(Input_it first, Input_it last,
                                                                  log::Logger* logger_ptr) :
  Reverse_iterable_set(logger_ptr)
{
  for (; first != last; ++first)
  {
    append(*first);
  }
}

template<typename Key_t, typename Hash_t, typename Pred_t>
Reverse_iterable_set<Key_t, Hash_t, Pred_t>::Reverse_iterable_set(const Reverse_iterable_set& src) :
  log::Log_context(src),
  m_index(src.m_index.bucket_count(), src.m_index.hash_function(), src.m_index.key_eq())
{
  // Rebuild in src order; src's slot numbering is irrelevant.
  src.walk([&](const Key& key) { append(key); }, true);
}

template<typename Key_t, typename Hash_t, typename Pred_t>
Reverse_iterable_set<Key_t, Hash_t, Pred_t>::Reverse_iterable_set(Reverse_iterable_set&& src) :
  log::Log_context(src.get_logger(), Revset_log_component::S_CONTAINER)
  // An empty m_index, m_chain are constructed here but immediately replaced within the {body}.
{
  operator=(std::move(src));
}

template<typename Key_t, typename Hash_t, typename Pred_t>
Reverse_iterable_set<Key_t, Hash_t, Pred_t>&
  Reverse_iterable_set<Key_t, Hash_t, Pred_t>::operator=(const Reverse_iterable_set& src)
{
  if (&src != this)
  {
    Reverse_iterable_set copy(src); // If this throws, *this is untouched.
    swap(copy);
  }
  return *this;
}

template<typename Key_t, typename Hash_t, typename Pred_t>
Reverse_iterable_set<Key_t, Hash_t, Pred_t>&
  Reverse_iterable_set<Key_t, Hash_t, Pred_t>::operator=(Reverse_iterable_set&& src)
{
  if (&src != this)
  {
    clear();
    swap(src);
  }
  return *this;
}

template<typename Key_t, typename Hash_t, typename Pred_t>
void Reverse_iterable_set<Key_t, Hash_t, Pred_t>::swap(Reverse_iterable_set& other)
{
  using std::swap;

  log::Log_context::swap(other);
  swap(m_index, other.m_index); // Nodes change owner but not address, so m_chain's key pointers stay valid.
  m_chain.swap(other.m_chain);
}

template<typename Key_t, typename Hash_t, typename Pred_t>
template<typename Key_ref>
void Reverse_iterable_set<Key_t, Hash_t, Pred_t>::insert_impl(Key_ref&& key, bool at_end)
{
  if (m_index.find(key) != m_index.end())
  {
    REVSET_LOG_TRACE("Set [" << *this << "]: [" << (at_end ? "append" : "prepend") << "] of an element already "
                     "present; position unchanged.");
    return;
  }
  // else

  const auto index_it = m_index.emplace(std::forward<Key_ref>(key), Chain::S_NO_SLOT).first;
  try
  {
    index_it->second = at_end ? m_chain.link_last(&index_it->first) : m_chain.link_first(&index_it->first);
  }
  catch (...) // Only the arena growing can throw; undo the index insertion and re-throw.
  {
    m_index.erase(index_it);
    throw;
  }

  REVSET_LOG_TRACE("Set [" << *this << "]: [" << (at_end ? "append" : "prepend") << "] of a new element into "
                   "slot [" << index_it->second << "].");
}

template<typename Key_t, typename Hash_t, typename Pred_t>
Reverse_iterable_set<Key_t, Hash_t, Pred_t>& Reverse_iterable_set<Key_t, Hash_t, Pred_t>::append(const Key& key)
{
  insert_impl(key, true);
  return *this;
}

template<typename Key_t, typename Hash_t, typename Pred_t>
Reverse_iterable_set<Key_t, Hash_t, Pred_t>& Reverse_iterable_set<Key_t, Hash_t, Pred_t>::append(Key&& key)
{
  insert_impl(std::move(key), true);
  return *this;
}

template<typename Key_t, typename Hash_t, typename Pred_t>
Reverse_iterable_set<Key_t, Hash_t, Pred_t>& Reverse_iterable_set<Key_t, Hash_t, Pred_t>::prepend(const Key& key)
{
  insert_impl(key, false);
  return *this;
}

template<typename Key_t, typename Hash_t, typename Pred_t>
Reverse_iterable_set<Key_t, Hash_t, Pred_t>& Reverse_iterable_set<Key_t, Hash_t, Pred_t>::prepend(Key&& key)
{
  insert_impl(std::move(key), false);
  return *this;
}

template<typename Key_t, typename Hash_t, typename Pred_t>
bool Reverse_iterable_set<Key_t, Hash_t, Pred_t>::remove(const Key& key)
{
  const auto index_it = m_index.find(key);
  if (index_it == m_index.end())
  {
    return false;
  }
  // else

  const auto slot = index_it->second;
  m_chain.unlink(slot); // Does not touch the key; so unlink before erasing it from the index.
  m_index.erase(index_it);

  REVSET_LOG_TRACE("Set [" << *this << "]: removed element from slot [" << slot << "].");
  return true;
}

template<typename Key_t, typename Hash_t, typename Pred_t>
typename Reverse_iterable_set<Key_t, Hash_t, Pred_t>::Const_iterator
  Reverse_iterable_set<Key_t, Hash_t, Pred_t>::erase(const Const_iterator& it)
{
  assert((it.m_chain == &m_chain) && (it.m_slot != Chain::S_NO_SLOT));

  const auto next_slot = m_chain.next(it.m_slot);
  remove(*it);
  return Const_iterator(&m_chain, next_slot);
}

template<typename Key_t, typename Hash_t, typename Pred_t>
void Reverse_iterable_set<Key_t, Hash_t, Pred_t>::clear()
{
  REVSET_LOG_DEBUG("Set [" << *this << "]: clearing.");

  m_chain.clear(); // First: it points into m_index.
  m_index.clear();
}

template<typename Key_t, typename Hash_t, typename Pred_t>
bool Reverse_iterable_set<Key_t, Hash_t, Pred_t>::contains(const Key& key) const
{
  return m_index.find(key) != m_index.end();
}

template<typename Key_t, typename Hash_t, typename Pred_t>
typename Reverse_iterable_set<Key_t, Hash_t, Pred_t>::size_type
  Reverse_iterable_set<Key_t, Hash_t, Pred_t>::count(const Key& key) const
{
  return m_index.count(key);
}

template<typename Key_t, typename Hash_t, typename Pred_t>
typename Reverse_iterable_set<Key_t, Hash_t, Pred_t>::Const_iterator
  Reverse_iterable_set<Key_t, Hash_t, Pred_t>::find(const Key& key) const
{
  const auto index_it = m_index.find(key);
  return Const_iterator(&m_chain, (index_it == m_index.end()) ? Chain::S_NO_SLOT : index_it->second);
}

template<typename Key_t, typename Hash_t, typename Pred_t>
typename Reverse_iterable_set<Key_t, Hash_t, Pred_t>::Value_cursor
  Reverse_iterable_set<Key_t, Hash_t, Pred_t>::iterate_values() const
{
  return Value_cursor(this, Chain::S_NO_SLOT, true, false);
}

template<typename Key_t, typename Hash_t, typename Pred_t>
typename Reverse_iterable_set<Key_t, Hash_t, Pred_t>::Pair_cursor
  Reverse_iterable_set<Key_t, Hash_t, Pred_t>::iterate_value_pairs() const
{
  return Pair_cursor(this, Chain::S_NO_SLOT, true, false);
}

template<typename Key_t, typename Hash_t, typename Pred_t>
typename Reverse_iterable_set<Key_t, Hash_t, Pred_t>::Value_cursor
  Reverse_iterable_set<Key_t, Hash_t, Pred_t>::iterate_from(const Key& key) const
{
  const auto index_it = m_index.find(key);
  if (index_it == m_index.end())
  {
    REVSET_LOG_TRACE("Set [" << *this << "]: cursor requested from an absent element; it starts exhausted.");
    return Value_cursor(this, Chain::S_NO_SLOT, true, true);
  }
  // else
  return Value_cursor(this, index_it->second, true, false);
}

template<typename Key_t, typename Hash_t, typename Pred_t>
typename Reverse_iterable_set<Key_t, Hash_t, Pred_t>::Value_cursor
  Reverse_iterable_set<Key_t, Hash_t, Pred_t>::reverse_view() const
{
  // Same as iterate_values().reverse(), minus the throwaway positioning at the first element.
  return Value_cursor(this, Chain::S_NO_SLOT, false, false);
}

template<typename Key_t, typename Hash_t, typename Pred_t>
template<typename Visitor>
void Reverse_iterable_set<Key_t, Hash_t, Pred_t>::walk(const Visitor& visit, bool forward) const
{
  auto slot = m_chain.start(forward);
  while (slot != Chain::S_NO_SLOT)
  {
    const auto next_slot = m_chain.neighbor(slot, forward);
    visit(m_chain.key(slot));
    slot = next_slot;
  }
}

template<typename Key_t, typename Hash_t, typename Pred_t>
template<typename Func>
void Reverse_iterable_set<Key_t, Hash_t, Pred_t>::for_each_forward(const Func& func) const
{
  walk([&](const Key& key) { func(key, key, *this); }, true);
}

template<typename Key_t, typename Hash_t, typename Pred_t>
template<typename Func, typename Ctx>
void Reverse_iterable_set<Key_t, Hash_t, Pred_t>::for_each_forward(const Func& func, Ctx* ctx) const
{
  walk([&](const Key& key) { std::invoke(func, ctx, key, key, *this); }, true);
}

template<typename Key_t, typename Hash_t, typename Pred_t>
template<typename Func>
void Reverse_iterable_set<Key_t, Hash_t, Pred_t>::for_each_backward(const Func& func) const
{
  walk([&](const Key& key) { func(key, key, *this); }, false);
}

template<typename Key_t, typename Hash_t, typename Pred_t>
template<typename Func, typename Ctx>
void Reverse_iterable_set<Key_t, Hash_t, Pred_t>::for_each_backward(const Func& func, Ctx* ctx) const
{
  walk([&](const Key& key) { std::invoke(func, ctx, key, key, *this); }, false);
}

template<typename Key_t, typename Hash_t, typename Pred_t>
const typename Reverse_iterable_set<Key_t, Hash_t, Pred_t>::Key&
  Reverse_iterable_set<Key_t, Hash_t, Pred_t>::front() const
{
  assert(!empty());
  return m_chain.key(m_chain.first());
}

template<typename Key_t, typename Hash_t, typename Pred_t>
const typename Reverse_iterable_set<Key_t, Hash_t, Pred_t>::Key&
  Reverse_iterable_set<Key_t, Hash_t, Pred_t>::back() const
{
  assert(!empty());
  return m_chain.key(m_chain.last());
}

template<typename Key_t, typename Hash_t, typename Pred_t>
typename Reverse_iterable_set<Key_t, Hash_t, Pred_t>::Iterator
  Reverse_iterable_set<Key_t, Hash_t, Pred_t>::begin() const
{
  return Const_iterator(&m_chain, m_chain.first());
}

template<typename Key_t, typename Hash_t, typename Pred_t>
typename Reverse_iterable_set<Key_t, Hash_t, Pred_t>::Iterator
  Reverse_iterable_set<Key_t, Hash_t, Pred_t>::end() const
{
  return Const_iterator(&m_chain, Chain::S_NO_SLOT);
}

template<typename Key_t, typename Hash_t, typename Pred_t>
typename Reverse_iterable_set<Key_t, Hash_t, Pred_t>::Const_iterator
  Reverse_iterable_set<Key_t, Hash_t, Pred_t>::cbegin() const
{
  return begin();
}

template<typename Key_t, typename Hash_t, typename Pred_t>
typename Reverse_iterable_set<Key_t, Hash_t, Pred_t>::Const_iterator
  Reverse_iterable_set<Key_t, Hash_t, Pred_t>::cend() const
{
  return end();
}

template<typename Key_t, typename Hash_t, typename Pred_t>
typename Reverse_iterable_set<Key_t, Hash_t, Pred_t>::Reverse_iterator
  Reverse_iterable_set<Key_t, Hash_t, Pred_t>::rbegin() const
{
  return Reverse_iterator(end());
}

template<typename Key_t, typename Hash_t, typename Pred_t>
typename Reverse_iterable_set<Key_t, Hash_t, Pred_t>::Reverse_iterator
  Reverse_iterable_set<Key_t, Hash_t, Pred_t>::rend() const
{
  return Reverse_iterator(begin());
}

template<typename Key_t, typename Hash_t, typename Pred_t>
typename Reverse_iterable_set<Key_t, Hash_t, Pred_t>::Const_reverse_iterator
  Reverse_iterable_set<Key_t, Hash_t, Pred_t>::crbegin() const
{
  return rbegin();
}

template<typename Key_t, typename Hash_t, typename Pred_t>
typename Reverse_iterable_set<Key_t, Hash_t, Pred_t>::Const_reverse_iterator
  Reverse_iterable_set<Key_t, Hash_t, Pred_t>::crend() const
{
  return rend();
}

template<typename Key_t, typename Hash_t, typename Pred_t>
bool Reverse_iterable_set<Key_t, Hash_t, Pred_t>::empty() const
{
  return m_index.empty();
}

template<typename Key_t, typename Hash_t, typename Pred_t>
typename Reverse_iterable_set<Key_t, Hash_t, Pred_t>::size_type
  Reverse_iterable_set<Key_t, Hash_t, Pred_t>::size() const
{
  return m_index.size();
}

template<typename Key_t, typename Hash_t, typename Pred_t>
typename Reverse_iterable_set<Key_t, Hash_t, Pred_t>::size_type
  Reverse_iterable_set<Key_t, Hash_t, Pred_t>::max_size() const
{
  return m_index.max_size();
}

template<typename Key_t, typename Hash_t, typename Pred_t>
void Reverse_iterable_set<Key_t, Hash_t, Pred_t>::check_invariants(Error_code* err_code) const
{
  REVSET_ERROR_EXEC_VOID_AND_THROW_ON_ERROR(check_invariants, _1);
  // If got here, err_code is non-null.

  const size_t n_indexed = m_index.size();
  size_t n_walked = 0;
  auto prev_slot = Chain::S_NO_SLOT;

  for (auto slot = m_chain.first(); slot != Chain::S_NO_SLOT; slot = m_chain.next(slot))
  {
    if (++n_walked > n_indexed) // Also stops a cycle from looping forever.
    {
      REVSET_ERROR_EMIT_ERROR(error::Code::S_SIZE_MISMATCH);
      return;
    }
    // else

    if (m_chain.prev(slot) != prev_slot)
    {
      REVSET_ERROR_EMIT_ERROR(error::Code::S_CHAIN_LINK_MISMATCH);
      return;
    }
    // else

    const Key& key = m_chain.key(slot);
    const auto index_it = m_index.find(key);
    if ((index_it == m_index.end()) || (index_it->second != slot) || (&index_it->first != &key))
    {
      REVSET_ERROR_EMIT_ERROR(error::Code::S_INDEX_SLOT_MISMATCH);
      return;
    }
    // else

    prev_slot = slot;
  } // for (slot)

  if (prev_slot != m_chain.last())
  {
    REVSET_ERROR_EMIT_ERROR(error::Code::S_ENDPOINT_INCONSISTENT);
    return;
  }
  // else

  if ((n_walked != n_indexed) || (m_chain.length() != n_indexed))
  {
    REVSET_ERROR_EMIT_ERROR(error::Code::S_SIZE_MISMATCH);
    return;
  }
  // else

  err_code->clear();
} // Reverse_iterable_set::check_invariants()

template<typename Key_t, typename Hash_t, typename Pred_t>
Reverse_iterable_set<Key_t, Hash_t, Pred_t>::Const_iterator::Const_iterator() :
  m_chain(nullptr),
  m_slot(Chain::S_NO_SLOT)
{
  // That's it.
}

template<typename Key_t, typename Hash_t, typename Pred_t>
Reverse_iterable_set<Key_t, Hash_t, Pred_t>::Const_iterator::Const_iterator(const Chain* chain, slot_idx_t slot) :
  m_chain(chain),
  m_slot(slot)
{
  // That's it.
}

template<typename Key_t, typename Hash_t, typename Pred_t>
typename Reverse_iterable_set<Key_t, Hash_t, Pred_t>::Const_iterator::reference
  Reverse_iterable_set<Key_t, Hash_t, Pred_t>::Const_iterator::operator*() const
{
  return m_chain->key(m_slot);
}

template<typename Key_t, typename Hash_t, typename Pred_t>
typename Reverse_iterable_set<Key_t, Hash_t, Pred_t>::Const_iterator::pointer
  Reverse_iterable_set<Key_t, Hash_t, Pred_t>::Const_iterator::operator->() const
{
  return &(operator*());
}

template<typename Key_t, typename Hash_t, typename Pred_t>
typename Reverse_iterable_set<Key_t, Hash_t, Pred_t>::Const_iterator&
  Reverse_iterable_set<Key_t, Hash_t, Pred_t>::Const_iterator::operator++()
{
  m_slot = m_chain->next(m_slot);
  return *this;
}

template<typename Key_t, typename Hash_t, typename Pred_t>
typename Reverse_iterable_set<Key_t, Hash_t, Pred_t>::Const_iterator
  Reverse_iterable_set<Key_t, Hash_t, Pred_t>::Const_iterator::operator++(int)
{
  const auto pre = *this;
  operator++();
  return pre;
}

template<typename Key_t, typename Hash_t, typename Pred_t>
typename Reverse_iterable_set<Key_t, Hash_t, Pred_t>::Const_iterator&
  Reverse_iterable_set<Key_t, Hash_t, Pred_t>::Const_iterator::operator--()
{
  m_slot = (m_slot == Chain::S_NO_SLOT) ? m_chain->last() : m_chain->prev(m_slot);
  return *this;
}

template<typename Key_t, typename Hash_t, typename Pred_t>
typename Reverse_iterable_set<Key_t, Hash_t, Pred_t>::Const_iterator
  Reverse_iterable_set<Key_t, Hash_t, Pred_t>::Const_iterator::operator--(int)
{
  const auto pre = *this;
  operator--();
  return pre;
}

template<typename Key_t, typename Hash_t, typename Pred_t>
bool Reverse_iterable_set<Key_t, Hash_t, Pred_t>::Const_iterator::operator==(const Const_iterator& other) const
{
  return (m_chain == other.m_chain) && (m_slot == other.m_slot);
}

template<typename Key_t, typename Hash_t, typename Pred_t>
bool Reverse_iterable_set<Key_t, Hash_t, Pred_t>::Const_iterator::operator!=(const Const_iterator& other) const
{
  return !operator==(other);
}

template<typename Key_t, typename Hash_t, typename Pred_t>
void swap(Reverse_iterable_set<Key_t, Hash_t, Pred_t>& val1, Reverse_iterable_set<Key_t, Hash_t, Pred_t>& val2)
{
  val1.swap(val2);
}

template<typename Key_t, typename Hash_t, typename Pred_t>
std::ostream& operator<<(std::ostream& os, const Reverse_iterable_set<Key_t, Hash_t, Pred_t>& val)
{
  return os << Reverse_iterable_set<Key_t, Hash_t, Pred_t>::S_TYPE_TAG
            << "[size=" << val.size() << "]@" << static_cast<const void*>(&val);
}

} // namespace revset::container

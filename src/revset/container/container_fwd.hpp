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

#include "revset/common.hpp"
#include <boost/functional/hash.hpp>
#include <functional>
#include <ostream>

/**
 * Revset module containing the reverse-iterable set: Reverse_iterable_set, a hash set that remembers insertion
 * order and can be traversed in that order, in its reverse, or starting at any member; plus the traversal
 * cursors (Basic_traversal_cursor) it hands out.
 *
 * @see Reverse_iterable_set doc header for the whole story.
 */
namespace revset::container
{

// Types.

// Find doc headers near the bodies of these compound types.

template<typename Key>
class Order_chain;

template<typename Key, typename Hash = boost::hash<Key>, typename Pred = std::equal_to<Key>>
class Reverse_iterable_set;

template<typename Set, typename Shape>
class Basic_traversal_cursor;

template<typename Key>
struct Value_shape;
template<typename Key>
struct Pair_shape;

// Free functions.

/**
 * Equivalent to `val1.swap(val2)`.
 *
 * @relatesalso Reverse_iterable_set
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 */
template<typename Key, typename Hash, typename Pred>
void swap(Reverse_iterable_set<Key, Hash, Pred>& val1, Reverse_iterable_set<Key, Hash, Pred>& val2);

/**
 * Prints a short description of the set: its type tag, size, and address; e.g.,
 * `Reverse_iterable_set[size=3]@0x7ffd5e1c`.  Elements are not printed.
 *
 * @relatesalso Reverse_iterable_set
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
template<typename Key, typename Hash, typename Pred>
std::ostream& operator<<(std::ostream& os, const Reverse_iterable_set<Key, Hash, Pred>& val);

} // namespace revset::container

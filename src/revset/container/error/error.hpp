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
#include <boost/system/error_code.hpp>

/**
 * Namespace containing the revset::container module's extension of boost.system error conventions, so that
 * container APIs can return codes/messages from within their own new set of error codes/messages.
 * Every code here reports a broken internal invariant of Reverse_iterable_set, as found by
 * Reverse_iterable_set::check_invariants(); a correct program never sees them.
 *
 * Usage: `Error_code ec = error::Code::S_SIZE_MISMATCH;` works directly, courtesy of make_error_code() and the
 * `is_error_code_enum<>` specialization below.
 */
namespace revset::container::error
{

// Types.

/// All possible errors returned (via revset::Error_code arguments) by revset::container functions/methods.
enum class Code
{
  /// Internal error: a node's neighbor does not link back to it.
  S_CHAIN_LINK_MISMATCH = 1,
  /// Internal error: the first/last node has a predecessor/successor, or first and last disagree on emptiness.
  S_ENDPOINT_INCONSISTENT,
  /// Internal error: the order chain is longer or shorter than the membership index.
  S_SIZE_MISMATCH,
  /// Internal error: an index entry points to a slot holding a different value, or to a free slot.
  S_INDEX_SLOT_MISMATCH
}; // enum class Code

// Free functions.

/**
 * Given a `Code` `enum` value, creates a lightweight revset::Error_code (`boost::system::error_code`) representing
 * that error.  This is needed to make the `boost::system::error_code::error_code<Code>()` template implementation
 * work.  Or, slightly more in English, it glues the (completely general) revset::Error_code to the
 * container::error::Code set.
 *
 * @param err_code
 *        The `enum` value.
 * @return A corresponding revset::Error_code.
 */
Error_code make_error_code(Code err_code);

} // namespace revset::container::error

/// We may add some ADL-based overloads into this namespace outside `revset`.
namespace boost::system
{

// Types.

/**
 * Ummm -- it specializes this `struct` to -- look -- the end result is boost.system uses this as
 * authorization to make `enum` `Code` convertible to `Error_code`.
 */
template<>
struct is_error_code_enum<::revset::container::error::Code>
{
  /// Means `Code` `enum` values can be used for revset::Error_code.
  static const bool value = true;
};

} // namespace boost::system

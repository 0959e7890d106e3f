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
#include "revset/container/error/error.hpp"
#include <string>

namespace revset::container::error
{

// Types.

/**
 * The boost.system category for errors returned by the revset::container module.  It kicks in when, for
 * `revset::Error_code ec`, something like `ec.message()` is invoked.  Not visible outside this translation unit.
 */
class Category :
  public boost::system::error_category
{
public:
  // Constants.

  /// The one Category.
  static const Category S_CATEGORY;

  // Methods.

  /**
   * Implements superclass API: returns a `static` string naming this category.
   * @return See above.
   */
  const char* name() const noexcept override;

  /**
   * Implements superclass API: given the integer value of a Code, returns its description.
   *
   * @param val
   *        A Code value cast to `int`.
   * @return String describing the error.
   */
  std::string message(int val) const override;

private:
  // Constructors.

  /// Boring constructor.
  explicit Category();
}; // class Category

// Static initializations.

const Category Category::S_CATEGORY;

// Implementations.

Error_code make_error_code(Code err_code)
{
  return Error_code{static_cast<int>(err_code), Category::S_CATEGORY};
}

Category::Category() = default;

const char* Category::name() const noexcept // Virtual.
{
  return "revset_container";
}

std::string Category::message(int val) const // Virtual.
{
  // Keep in sync with the Code member doc headers.
  switch (static_cast<Code>(val))
  {
  case Code::S_CHAIN_LINK_MISMATCH:
    return "Internal error:  Order chain node's neighbor does not link back to it.";
  case Code::S_ENDPOINT_INCONSISTENT:
    return "Internal error:  Order chain first/last node references are inconsistent.";
  case Code::S_SIZE_MISMATCH:
    return "Internal error:  Order chain length differs from membership index size.";
  case Code::S_INDEX_SLOT_MISMATCH:
    return "Internal error:  Membership index entry does not match the order chain slot it refers to.";
  }
  assert(false && "Unknown container::error::Code value; bug?");
  return "";
}

} // namespace revset::container::error

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

#include "revset/util/util_fwd.hpp"
#include <boost/iostreams/stream.hpp>
#include <boost/iostreams/device/back_inserter.hpp>
#include <boost/noncopyable.hpp>
#include <string>

namespace revset::util
{

/**
 * An `ostream` whose output is appended to a caller's `std::string`, with no intermediate copy as with
 * `ostringstream::str()`.  The stream buffers: the string is complete only after `os() << flush` or destruction.
 *
 * A log call site formats its message through one of these; so do ostream_op_to_string() and log::Buffer_logger.
 */
class String_appender :
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Appends to `*target`, which is not cleared and must outlive `*this`.
   *
   * @param target
   *        The string.
   */
  explicit String_appender(std::string* target) :
    m_os(boost::iostreams::back_inserter(*target))
  {
    // That's it.
  }

  // Methods.

  /**
   * The stream.
   * @return See above.
   */
  std::ostream& os()
  {
    return m_os;
  }

private:
  // Data.

  /// Writes through a `back_insert_device` onto the target string.
  boost::iostreams::stream<boost::iostreams::back_insert_device<std::string>> m_os;
}; // class String_appender

} // namespace revset::util

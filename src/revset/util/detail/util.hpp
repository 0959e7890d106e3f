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

namespace revset::util
{

// Free functions.

/**
 * Helper that takes a non-null file or dir path and returns a view of its last path segment: e.g., for
 * `"/x/y/z.cpp"` returns `"z.cpp"`.  With no separator the result is the whole input.  Used at log call sites
 * where it is computed at compile time.
 *
 * @param full_path
 *        Full path.
 * @return View into the tail of `full_path`.
 */
constexpr String_view get_last_path_segment(String_view full_path);

// Template/constexpr implementations.

constexpr String_view get_last_path_segment(String_view full_path)
{
  String_view path(full_path); // This only copies the pointer and length (not the string).
#  ifdef REVSET_OS_WIN
  constexpr char SEP = '\\';
#  else
  constexpr char SEP = '/';
#  endif

  for (auto idx = path.size(); idx != 0; --idx)
  {
    if (path[idx - 1] == SEP)
    {
      path.remove_prefix(idx);
      break;
    }
  }
  // No separator => the whole thing.

  return path;
} // get_last_path_segment()

} // namespace revset::util

// Macros.

/**
 * Helper macro: expands to an `ostream<<` fragment `file:function(line)`.  Used by the log message writer.
 *
 * @param ARG_file
 *        Expression yielding the file name (already shortened).
 * @param ARG_function
 *        Expression yielding the function name.
 * @param ARG_line
 *        Expression yielding the line number.
 */
#define REVSET_UTIL_WHERE_AM_I_FROM_ARGS(ARG_file, ARG_function, ARG_line) \
  ARG_file << ':' << ARG_function << '(' << ARG_line << ')'

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
#include <boost/thread.hpp>
#include <iostream>
#include <string>
#include <string_view>

/**
 * Revset module holding what the log, error and container modules share: stream-to-string helpers, `enum`
 * parsing for log::Sev, code-location strings, and the thread and mutex aliases.  Symbols outside detail/ may be
 * used by applications too.
 */
namespace revset::util
{

// Types.

// Find doc headers near the bodies of these compound types.

class String_appender;

/**
 * Short-hand for a non-owning view into a contiguous `char` sequence.  Used for log metadata (file/function names)
 * and for constant labels such as container::Reverse_iterable_set::S_TYPE_TAG.
 */
using String_view = std::string_view;

/// Short-hand for standard thread class; boost.thread supplies `get_id()` printing and interruption.
using Thread = boost::thread;

/// Thread identity recorded in log::Msg_metadata.
using Thread_id = Thread::id;

/// The mutex type of the loggers and log::Config; locking it twice in one thread deadlocks.
using Mutex_non_recursive = boost::mutex;

/// Short-hand for #Mutex_non_recursive lock; sanity-preserving RAII guard.
using Lock_guard_non_recursive = boost::unique_lock<Mutex_non_recursive>;

// Free functions.

/**
 * `*os << ostream_arg1 << remaining_ostream_args...`, for a parameter pack.
 *
 * @tparam T1
 *         See `ostream_arg1`.
 * @tparam T_rest
 *         See `remaining_ostream_args`.
 * @param os
 *        The stream.
 * @param ostream_arg1
 *        First argument to output.
 * @param remaining_ostream_args
 *        See `ostream_arg1`.
 */
template<typename T1, typename ...T_rest>
void feed_args_to_ostream(std::ostream* os, T1 const & ostream_arg1, T_rest const &... remaining_ostream_args);

/**
 * Last step of the other feed_args_to_ostream().
 *
 * @tparam T
 *         See `only_ostream_arg`.
 * @param os
 *        The stream.
 * @param only_ostream_arg
 *        Argument to output.
 */
template<typename T>
void feed_args_to_ostream(std::ostream* os, T const & only_ostream_arg);

/**
 * Appends to `*target_str` what `ostream << ostream_args...` would print, through a String_appender, so no
 * `ostringstream` copy is made.
 *
 * @tparam T
 *         Types with an `ostream` `<<`.
 * @param target_str
 *        Appended to; not cleared first.
 * @param ostream_args
 *        One or more arguments, such that each argument `arg` is suitable for `os << arg`.
 */
template<typename ...T>
void ostream_op_to_string(std::string* target_str, T const &... ostream_args);

/**
 * ostream_op_to_string() into a fresh string, which is returned.  Verbosity_config builds its messages this way.
 *
 * @tparam T
 *         See ostream_op_to_string().
 * @param ostream_args
 *        See ostream_op_to_string().
 * @return The string.
 */
template<typename ...T>
std::string ostream_op_string(T const &... ostream_args);

/**
 * Reads an `enum class` value (for revset, log::Sev) from `*is_ptr`: consumes letters, digits and underscores
 * and matches that token, yielding `enum_default` on no match.  Matches are:
 *   - "0", "1", ...: Corresponds to the underlying-integer conversion to that `Enum`.  (Can be disabled.)
 *   - Case-[in]sensitive string encoding of the `Enum`, as emitted via `ostream << Enum`.
 *
 * @tparam Enum
 *         An `enum class` which must satisfy: it starts at 0 (`enum_lowest` permitting); is consecutive;
 *         `enum_sentinel` is one past the last valid value; `ostream << Enum` is defined for each valid value.
 * @param is_ptr
 *        Stream from which to deserialize.
 * @param enum_default
 *        Value to return if the token does not match either supported encoding.
 * @param enum_sentinel
 *        See `Enum`.
 * @param accept_num_encoding
 *        If `true`, a token starting with a digit is read as the underlying integer.
 * @param case_sensitive
 *        If `true`, then the string must exactly equal an output of `ostream << Enum`; otherwise it can be
 *        equal modulo case.
 * @param enum_lowest
 *        The lowest `Enum` value.
 * @return See above.
 */
template<typename Enum>
Enum istream_to_enum(std::istream* is_ptr, Enum enum_default, Enum enum_sentinel,
                     bool accept_num_encoding = true, bool case_sensitive = false,
                     Enum enum_lowest = Enum(0));

/**
 * Helper for REVSET_UTIL_WHERE_AM_I_STR().  Returns `"file:function(line)"` as a new string.
 *
 * @param file
 *        File name (usually already shortened by get_last_path_segment()).
 * @param function
 *        Function name.
 * @param line
 *        Line number.
 * @return See above.
 */
std::string get_where_am_i_str(String_view file, String_view function, unsigned int line);

// Macros.

/**
 * Expands to an `std::string` like `"file.cpp:func(123)"` describing the code location of the macro invocation.
 * Used to give context in test assertion messages and error reports.
 */
#define REVSET_UTIL_WHERE_AM_I_STR() \
  ::revset::util::get_where_am_i_str(::revset::util::get_last_path_segment \
                                       (::revset::util::String_view(__FILE__, sizeof(__FILE__) - 1)), \
                                     ::revset::util::String_view(__FUNCTION__, sizeof(__FUNCTION__) - 1), \
                                     __LINE__)

/**
 * Wraps statements as one `do { } while (false)` statement, so a multi-statement macro can be used like a function
 * call, semicolon included.  Commas in the argument must be inside parentheses.
 *
 * @param ARG_func_macro_definition
 *        The statements.
 */
#define REVSET_UTIL_SEMICOLON_SAFE(ARG_func_macro_definition) \
  do \
  { \
    ARG_func_macro_definition \
  } \
  while (false)

} // namespace revset::util

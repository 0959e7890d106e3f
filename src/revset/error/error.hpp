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

#include "revset/error/error_fwd.hpp"
#include "revset/log/log.hpp"
#include <boost/system/system_error.hpp>

namespace revset::error
{

// Types.

/**
 * Thrown by a revset API whose `err_code` argument was null, carrying the #Error_code it would otherwise have
 * reported.  `what()` is `"<context>: <code message>"`.
 */
class Runtime_error :
  public boost::system::system_error
{
public:
  // Constructors/destructor.

  /**
   * Constructs the exception.
   *
   * @param err_code
   *        The failure; must be truthy.
   * @param context
   *        Where it happened, e.g., REVSET_UTIL_WHERE_AM_I_STR().
   */
  explicit Runtime_error(const Error_code& err_code, util::String_view context);
}; // class Runtime_error

// Template implementations.

template<typename Func>
bool exec_void_and_throw_on_error(const Func& func, Error_code* err_code, util::String_view context)
{
  if (err_code)
  {
    return false;
  }
  // else: Run it against our own code; throw if that comes back set.

  Error_code our_err_code;
  func(&our_err_code);
  if (our_err_code)
  {
    throw Runtime_error(our_err_code, context);
  }
  return true;
}

} // namespace revset::error

// Macros.

/**
 * Sets `*err_code` to `ARG_val`, logging a WARNING that names the code.  `err_code` must be non-null there;
 * `get_logger()` and `get_log_component()` must be in scope as for REVSET_LOG_WARNING().
 *
 * @param ARG_val
 *        Value convertible to #Error_code.
 */
#define REVSET_ERROR_EMIT_ERROR(ARG_val) \
  REVSET_UTIL_SEMICOLON_SAFE \
  ( \
    ::revset::Error_code REVSET_ERROR_EMIT_ERR_val(ARG_val); \
    REVSET_LOG_WARNING("Error code emitted: [" << REVSET_ERROR_EMIT_ERR_val << "] " \
                       "[" << REVSET_ERROR_EMIT_ERR_val.message() << "]."); \
    *err_code = REVSET_ERROR_EMIT_ERR_val; \
  )

/**
 * First statement of a `void` function taking `Error_code* err_code`.  With a null `err_code`, it re-invokes the
 * function as `ARG_function_name(...)`, where `_1` among the arguments stands for a non-null `Error_code*`; then it
 * throws error::Runtime_error if that call failed and returns if not.  With a non-null `err_code` it does nothing.
 *
 * @param ARG_function_name
 *        The invoking function's name.
 * @param ...
 *        The invoking function's arguments, with `_1` in place of `err_code`.
 */
#define REVSET_ERROR_EXEC_VOID_AND_THROW_ON_ERROR(ARG_function_name, ...) \
  REVSET_UTIL_SEMICOLON_SAFE \
  ( \
    if (::revset::error::exec_void_and_throw_on_error \
          ([&](::revset::Error_code* _1) { ARG_function_name(__VA_ARGS__); }, \
           err_code, REVSET_UTIL_WHERE_AM_I_STR())) \
    { \
      return; \
    } \
  )

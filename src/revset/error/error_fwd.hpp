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
#include "revset/util/util_fwd.hpp"

/**
 * Revset module for reporting errors.  A revset API that can fail takes `Error_code* err_code = nullptr`: if
 * `err_code` is non-null, the outcome goes to `*err_code`; if null, a failure is thrown as Runtime_error.  The
 * function's body handles the first case; REVSET_ERROR_EXEC_VOID_AND_THROW_ON_ERROR() at its top turns the second
 * case into the first.  container::Reverse_iterable_set::check_invariants() is the user.
 */
namespace revset::error
{

// Types.

class Runtime_error;

// Free functions.

/**
 * Does the work of REVSET_ERROR_EXEC_VOID_AND_THROW_ON_ERROR().  If `err_code` is non-null, returns `false` at once.
 * Otherwise calls `func()` with a local #Error_code, throws Runtime_error if that is then truthy, and returns
 * `true`.
 *
 * @tparam Func
 *         Callable `void (Error_code*)`.
 * @param func
 *        The operation; typically the calling function again, given a non-null `Error_code*`.
 * @param err_code
 *        The calling function's `err_code`.
 * @param context
 *        Prefix for the exception's message; typically REVSET_UTIL_WHERE_AM_I_STR().
 * @return Whether `func()` ran (and succeeded).
 */
template<typename Func>
bool exec_void_and_throw_on_error(const Func& func, Error_code* err_code, util::String_view context);

} // namespace revset::error

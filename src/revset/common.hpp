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

#include <boost/system/error_code.hpp>
#include <boost/unordered_map.hpp>
#include <string>
#include <cstddef>

#if (!defined(__cplusplus)) || (__cplusplus < 201703L)
#  error "To compile a translation unit that `#include`s any revset/ API headers, use C++17 compile mode or later."
#endif

// Macros.  These (conceptually) belong to the `revset` namespace (hence the prefix for each macro).

#ifdef REVSET_DOXYGEN_ONLY // Compiler ignores; Doxygen sees.

/// Macro that is defined if and only if the compiling environment is Linux.
#  define REVSET_OS_LINUX
/// Macro that is defined if and only if the compiling environment is Mac OS X or higher macOS.
#  define REVSET_OS_MAC
/// Macro that is defined if and only if the compiling environment is Windows.
#  define REVSET_OS_WIN

#else // if !defined(REVSET_DOXYGEN_ONLY)

#  ifdef __linux__
#    define REVSET_OS_LINUX
#  elif defined(__APPLE__)
#    define REVSET_OS_MAC
#  elif defined(_WIN32) || defined(_WIN64)
#    define REVSET_OS_WIN
#  endif

#endif // elif !defined(REVSET_DOXYGEN_ONLY)

/**
 * Catch-all namespace for the Revset project: an insertion-ordered set that can be walked forward, backward, and
 * from any member outward, plus the small logging/error/utility stack it is built on.
 *
 * Each symbol therein is either a module namespace (revset::container, revset::log, revset::error, revset::util)
 * or one of the few short-hands used so often that putting them in a module would only add noise.
 *
 * ### Modules ###
 *   - revset::container: Reverse_iterable_set itself, its traversal cursors, and its error codes.
 *   - revset::log: logging with severities, components, and pluggable Logger back-ends.
 *   - revset::error: boost.system-based error reporting; `Error_code* err_code` out-arg convention.
 *   - revset::util: stream and string helpers shared by the above.
 */
namespace revset
{

// Types.

/**
 * Short-hand for a boost.system error code (which basically encapsulates an integer/`enum` error code and a pointer
 * through which to obtain a statically stored message string); this is how Revset modules report errors to the
 * user.  When a Revset API takes `Error_code* err_code`, a null `err_code` means "throw error::Runtime_error on
 * error"; otherwise `*err_code` is set (falsy on success).
 */
using Error_code = boost::system::error_code;

/**
 * The revset::log::Component payload `enum` used by Revset's own log call sites.  A user's Logger can filter
 * these per component (by name) via revset::log::Config.
 *
 * Value 0 is reserved for uncategorized messages, as the config machinery expects; revset::log::Config registers
 * names for these values from #S_REVSET_LOG_COMPONENT_NAME_MAP, with `"REVSET-"` prepended by convention.
 */
enum class Revset_log_component : unsigned int
{
  /// Messages that do not belong anywhere else.
  S_UNCAT = 0,
  /// The logging machinery itself.
  S_LOG,
  /// The container and its cursors (revset::container).
  S_CONTAINER,
  /// Sentinel: not a component; one past the last valid value.
  S_END_SENTINEL
}; // enum class Revset_log_component

// Data.

/**
 * Name of each Revset_log_component value (except the sentinel), e.g., `S_CONTAINER` maps to `"CONTAINER"`.
 * Pass to log::Config::init_component_names().
 */
extern const boost::unordered_multimap<Revset_log_component, std::string> S_REVSET_LOG_COMPONENT_NAME_MAP;

} // namespace revset

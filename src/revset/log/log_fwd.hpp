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
#include <iostream>

/**
 * Revset module providing logging functionality.  A log call site (`REVSET_LOG_WARNING("...")` and friends) hands
 * a message, a severity (Sev), and a Component to a Logger, which decides (via Logger::should_log()) whether the
 * message is worth building and then writes it somewhere (Logger::do_log()).  A class that logs typically derives
 * from Log_context, which stores the `Logger*` and Component for it.
 *
 * Out of the box: Simple_ostream_logger (console) and Buffer_logger (in-memory string); both filter by a Config
 * and format via Ostream_log_msg_writer.  A null `Logger*` means "do not log," which is always allowed.
 */
namespace revset::log
{

// Types.

// Find doc headers near the bodies of these compound types.

class Buffer_logger;
class Component;
class Config;
class Logger;
class Log_context;
struct Msg_metadata;
class Ostream_log_msg_writer;
class Simple_ostream_logger;
class Verbosity_config;

/**
 * Message severity, most severe first; the more verbose a level, the more messages it is expected to carry.
 *
 * As the Logger::should_log() API makes clear, a message of severity `S` is logged iff `S <= V`, where `V` is the
 * verbosity configured for the message's Component.
 *
 * ### Informal semantics ###
 * Revset's own code uses WARNING (something went wrong, e.g., a stale cursor), INFO (rare, human-interesting
 * events), DEBUG (whole-container operations like `clear()`), and TRACE (per-element operations).  One MUST be
 * able to set verbosity to INFO and confidently count that logging will not affect performance.
 */
enum class Sev : size_t
{
  /// Sentinel log level: no message may use it, but a filter set to it shows nothing at all.
  S_NONE = 0,
  /// Message indicates a "fatally bad" condition, such that the program shall imminently abort.
  S_FATAL,
  /// Message indicates a "bad" condition with "worse" impact than that of Sev::S_WARNING.
  S_ERROR,
  /// Message indicates a "bad" condition that is not frequent enough to be of severity Sev::S_TRACE.
  S_WARNING,
  /// Message indicates a not-"bad" condition that is not frequent enough to be of severity Sev::S_TRACE.
  S_INFO,
  /// Message of subjectively less interest than INFO but still cheap enough to leave enabled.
  S_DEBUG,
  /// Message indicates any condition that may occur with great frequency (thus verbose if logged).
  S_TRACE,
  /// Message satisfies Sev::S_TRACE description AND contains variable-length structure dumps.
  S_DATA,
  /// One past the last level; bounds checks and tables indexed by Sev use it.
  S_END_SENTINEL
}; // enum class Sev

// Free functions.

/**
 * Deserializes a log::Sev from a standard input stream.  Accepts what `operator<<(ostream&, Sev)` emits
 * (`"WARNING"`, case-insensitively) or the integer encoding (`"3"`).  An unrecognized token yields Sev::S_NONE.
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Sev& val);

/**
 * Serializes a log::Sev to a standard output stream, e.g., `"WARNING"`.
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Sev val);

/**
 * Free `swap()`, found by ADL: `val1.swap(val2)`.
 *
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 */
void swap(Log_context& val1, Log_context& val2);

} // namespace revset::log

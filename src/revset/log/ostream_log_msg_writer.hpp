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

#include "revset/log/log.hpp"
#include <boost/io/ios_state.hpp>
#include <boost/noncopyable.hpp>
#include <array>
#include <chrono>
#include <ostream>
#include <string>

namespace revset::log
{

// Types.

/**
 * Utility class, each object of which wraps a given `ostream` and outputs discrete messages to it adorned with time
 * stamps and other formatting such as separating newlines.  A Logger implementation owns one per output stream and
 * calls log() under its own lock: an Ostream_log_msg_writer is not thread-safe, and nobody else may write to the
 * stream while it exists.  The stream's formatting state is restored when `*this` is destroyed.
 *
 * Each line is:
 *
 *   ~~~
 *   <time stamp> [<sev>]: T<thread ID>: <COMPONENT>: <file>:<function>(<line>): <message>
 *   ~~~
 *
 * where `<sev>` is a 4-letter abbreviation (e.g., `warn`), `<COMPONENT>: ` is omitted if the Config does not know
 * the component, and the time stamp is either `2023-11-30 13:04:05.123456 -0500` (Config::m_use_human_friendly_time_stamps)
 * or `1701367445.123456` (seconds since the POSIX epoch).
 */
class Ostream_log_msg_writer :
  private boost::noncopyable
{
public:
  // Constants.

  /// Mapping from Sev to its brief string description, indexed by the Sev's integer value.
  static const std::array<util::String_view, size_t(Sev::S_END_SENTINEL)> S_SEV_STRS;

  // Constructors/destructor.

  /**
   * Constructs object wrapping the given `ostream`.
   *
   * @param config
   *        Controls behavior of `*this`; must outlive it.  Only the time stamp mode and component names matter here.
   * @param os
   *        Stream to which to write subsequently via log().
   */
  explicit Ostream_log_msg_writer(const Config& config, std::ostream& os);

  // Methods.

  /**
   * Logs to the wrapped `ostream` the given message and associated metadata.
   *
   * @param metadata
   *        See Logger::do_log().
   * @param msg
   *        See Logger::do_log().
   */
  void log(const Msg_metadata& metadata, util::String_view msg);

private:
  // Methods.

  /**
   * Writes the time stamp, human-friendly style.
   * @param called_when
   *        Time stamp.
   */
  void write_human_friendly_time_stamp(Msg_metadata::Time_stamp called_when);

  /**
   * Writes the time stamp, seconds.usec since epoch.
   * @param called_when
   *        Time stamp.
   */
  void write_epoch_time_stamp(Msg_metadata::Time_stamp called_when);

  // Data.

  /// Reference to the config object passed to constructor.
  const Config& m_config;

  /// Reference to stream to which to log messages.
  std::ostream& m_os;

  /// Formatter state of #m_os at construction; restored at destruction.
  boost::io::ios_all_saver m_clean_os_state;

  /// Whole-second time stamp for which #m_cached_time_stamp_prefix was computed.
  std::chrono::time_point<std::chrono::system_clock, std::chrono::seconds> m_cached_rounded_time_stamp;

  /// `YYYY-MM-DD HH:MM:SS` for #m_cached_rounded_time_stamp; local time.
  std::string m_cached_time_stamp_prefix;

  /// ` -0500 ` (time zone) for #m_cached_rounded_time_stamp.
  std::string m_cached_time_stamp_suffix;
}; // class Ostream_log_msg_writer

} // namespace revset::log

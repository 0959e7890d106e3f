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

#include "revset/log/simple_ostream_logger.hpp"
#include "revset/util/string_appender.hpp"
#include <string>

namespace revset::log
{

// Types.

/**
 * Logger that keeps every line in memory, formatted as Simple_ostream_logger formats it, so that a test can
 * assert on what was logged (see test::Test_buffer_logger).  All severities go to the one buffer.
 *
 * Thread-safe, including buffer_str_copy() and buffer_clear() against concurrent logging.
 */
class Buffer_logger :
  public Logger
{
public:
  // Constructors/destructor.

  /**
   * Constructs the logger with an empty buffer.
   *
   * @param config
   *        Filter and format settings; must outlive `*this`.
   */
  explicit Buffer_logger(const Config* config);

  // Methods.

  /**
   * Asks the Config.
   *
   * @param sev
   *        See Logger::should_log().
   * @param component
   *        See Logger::should_log().
   * @return See above.
   */
  bool should_log(Sev sev, const Component& component) const override;

  /**
   * Appends one line to the buffer.
   *
   * @param metadata
   *        See Logger::do_log().
   * @param msg
   *        See Logger::do_log().
   */
  void do_log(Msg_metadata* metadata, util::String_view msg) override;

  /**
   * Everything logged since construction or the last buffer_clear().
   * @return A copy of the buffer.
   */
  std::string buffer_str_copy() const;

  /// Empties the buffer.
  void buffer_clear();

private:
  // Data.

  /// The lines.
  std::string m_buffer;

  /// Appends to #m_buffer; the line writer flushes it after each line.
  util::String_appender m_appender;

  /// Does the filtering and formatting, with both of its streams being #m_appender.
  Simple_ostream_logger m_logger;

  /// Protects #m_buffer from do_log() running concurrently with reading or clearing it.
  mutable util::Mutex_non_recursive m_buffer_mutex;
}; // class Buffer_logger

} // namespace revset::log

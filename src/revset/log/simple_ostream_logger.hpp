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
#include "revset/log/ostream_log_msg_writer.hpp"
#include <iostream>
#include <optional>

namespace revset::log
{

// Types.

/**
 * Logger writing text lines to `ostream`s: WARNING and worse to one, everything else to another (by default
 * `cerr` and `cout`).  Config decides what passes; Ostream_log_msg_writer decides how a line looks.  revset_demo
 * logs through one of these; so does test::Test_logger.
 *
 * Thread-safe; lines from concurrent callers do not interleave.  Nothing else should write to the streams meanwhile.
 */
class Simple_ostream_logger :
  public Logger
{
public:
  // Constructors/destructor.

  /**
   * Constructs the logger.  Nothing is written until something is logged.
   *
   * @param config
   *        Filter and format settings; must outlive `*this`.
   * @param os
   *        Destination of INFO and more verbose messages.
   * @param os_for_err
   *        Destination of WARNING and more severe messages; may be the same object as `os`.
   */
  explicit Simple_ostream_logger(const Config* config,
                                 std::ostream& os = std::cout, std::ostream& os_for_err = std::cerr);

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
   * Writes one line to the stream chosen by severity.
   *
   * @param metadata
   *        See Logger::do_log().
   * @param msg
   *        See Logger::do_log().
   */
  void do_log(Msg_metadata* metadata, util::String_view msg) override;

private:
  // Data.

  /// See constructor.
  const Config* const m_config;

  /// Writes to `os`; and to `os_for_err` too if #m_err_writer is empty.
  Ostream_log_msg_writer m_writer;

  /// Writes to `os_for_err` if it differs from `os`.  One stream must have one writer, which saves its state once.
  std::optional<Ostream_log_msg_writer> m_err_writer;

  /// Serializes do_log() calls.
  util::Mutex_non_recursive m_log_mutex;
}; // class Simple_ostream_logger

} // namespace revset::log

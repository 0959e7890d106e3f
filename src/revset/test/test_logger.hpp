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

#include "revset/test/test_config.hpp"
#include "revset/log/buffer_logger.hpp"
#include "revset/log/config.hpp"
#include "revset/log/simple_ostream_logger.hpp"
#include "revset/common.hpp"

namespace revset::test
{

/**
 * Logger used for testing purposes: logs to the console, with Revset's components registered under the `"revset-"`
 * prefix, so that a failing test's output shows what the library was doing.
 */
class Test_logger :
  public log::Logger
{
public:
  /**
   * Constructor.
   *
   * @param most_verbose_sev
   *        Most verbose severity that will pass through logging filter.
   */
  explicit Test_logger(log::Sev most_verbose_sev = Test_config::get_singleton().m_sev) :
    m_config(most_verbose_sev),
    m_logger(&m_config)
  {
    // Fine to do this after the Logger took the m_config ptr, as nothing has been logged yet.
    m_config.init_component_names(S_REVSET_LOG_COMPONENT_NAME_MAP, "revset-");
  }

  /**
   * Returns the logging configuration.
   *
   * @return See above.
   */
  log::Config& get_config()
  {
    return m_config;
  }

  /// Forwards to console Logger.
  bool should_log(log::Sev sev, const log::Component& component) const override
  {
    return m_logger.should_log(sev, component);
  }

  /// Forwards to console Logger.
  void do_log(log::Msg_metadata* metadata, util::String_view msg) override
  {
    m_logger.do_log(metadata, msg);
  }

private:
  /// Logging configuration.
  log::Config m_config;

  /// The real logger.
  log::Simple_ostream_logger m_logger;
}; // class Test_logger

/**
 * Like Test_logger but captures messages in memory instead, so a test can check what was logged.
 */
class Test_buffer_logger :
  public log::Logger
{
public:
  /**
   * Constructor.
   *
   * @param most_verbose_sev
   *        Most verbose severity that will pass through logging filter.
   */
  explicit Test_buffer_logger(log::Sev most_verbose_sev = Test_config::get_singleton().m_sev) :
    m_config(most_verbose_sev),
    m_logger(&m_config)
  {
    m_config.init_component_names(S_REVSET_LOG_COMPONENT_NAME_MAP, "revset-");
  }

  /// Forwards to buffer Logger.
  bool should_log(log::Sev sev, const log::Component& component) const override
  {
    return m_logger.should_log(sev, component);
  }

  /// Forwards to buffer Logger.
  void do_log(log::Msg_metadata* metadata, util::String_view msg) override
  {
    m_logger.do_log(metadata, msg);
  }

  /**
   * Everything logged so far.
   * @return See above.
   */
  std::string logged() const
  {
    return m_logger.buffer_str_copy();
  }

  /// Forgets everything logged so far.
  void clear_logged()
  {
    m_logger.buffer_clear();
  }

private:
  /// Logging configuration.
  log::Config m_config;

  /// The real logger.
  log::Buffer_logger m_logger;
}; // class Test_buffer_logger

} // namespace revset::test

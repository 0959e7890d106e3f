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
#include "revset/log/buffer_logger.hpp"

namespace revset::log
{

Buffer_logger::Buffer_logger(const Config* config) :
  m_appender(&m_buffer),
  m_logger(config, m_appender.os(), m_appender.os())
{
  // That's it.
}

bool Buffer_logger::should_log(Sev sev, const Component& component) const // Virtual.
{
  return m_logger.should_log(sev, component);
}

void Buffer_logger::do_log(Msg_metadata* metadata, util::String_view msg) // Virtual.
{
  util::Lock_guard_non_recursive lock(m_buffer_mutex);
  m_logger.do_log(metadata, msg);
}

std::string Buffer_logger::buffer_str_copy() const
{
  util::Lock_guard_non_recursive lock(m_buffer_mutex);
  return m_buffer;
}

void Buffer_logger::buffer_clear()
{
  util::Lock_guard_non_recursive lock(m_buffer_mutex);
  m_buffer.clear();
}

} // namespace revset::log

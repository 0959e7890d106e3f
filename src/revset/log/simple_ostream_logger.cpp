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
#include "revset/log/simple_ostream_logger.hpp"
#include "revset/log/config.hpp"

namespace revset::log
{

Simple_ostream_logger::Simple_ostream_logger(const Config* config, std::ostream& os, std::ostream& os_for_err) :
  m_config(config),
  m_writer(*m_config, os)
{
  if (&os_for_err != &os)
  {
    m_err_writer.emplace(*m_config, os_for_err);
  }
}

bool Simple_ostream_logger::should_log(Sev sev, const Component& component) const // Virtual.
{
  return m_config->output_whether_should_log(sev, component);
}

void Simple_ostream_logger::do_log(Msg_metadata* metadata, util::String_view msg) // Virtual.
{
  assert(metadata);

  util::Lock_guard_non_recursive lock(m_log_mutex);
  auto& writer = (m_err_writer && (metadata->m_msg_sev <= Sev::S_WARNING)) ? *m_err_writer : m_writer;
  writer.log(*metadata, msg);
}

} // namespace revset::log

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
#include "revset/log/config.hpp"
#include <boost/algorithm/string.hpp>
#include <locale>

namespace revset::log
{

// Static initializations.

// By definition INFO is the most-verbose severity meant to avoid affecting performance.
const Sev Config::S_MOST_VERBOSE_SEV_DEFAULT = Sev::S_INFO;

// Implementations.

Config::Config(Sev most_verbose_sev_default) :
  m_use_human_friendly_time_stamps(true),
  m_verbosity_default(most_verbose_sev_default)
{
  // Nothing.
}

Config::Config(const Config& src) :
  m_use_human_friendly_time_stamps(src.m_use_human_friendly_time_stamps),
  m_verbosity_default(src.m_verbosity_default.load(std::memory_order_relaxed)),
  m_component_names(src.m_component_names),
  m_components_by_name(src.m_components_by_name),
  m_registered_payload_types(src.m_registered_payload_types)
{
  util::Lock_guard_non_recursive lock(src.m_mutex);
  m_verbosities_by_component = src.m_verbosities_by_component;
}

size_t Config::Component_key_hash::operator()(const Component_key& key) const
{
  size_t seed = std::hash<std::type_index>()(key.first);
  boost::hash_combine(seed, key.second);
  return seed;
}

Config::Component_key Config::component_key(const Component& component) // Static.
{
  return Component_key(component.payload_type_index(), component.payload_enum_raw_value());
}

void Config::configure_default_verbosity(Sev most_verbose_sev_default, bool reset)
{
  /* Relaxed suffices: a concurrent output_whether_should_log() acting on the old value "a moment later" is
   * indistinguishable from the message having been logged a moment earlier. */
  m_verbosity_default.store(most_verbose_sev_default, std::memory_order_relaxed);

  if (reset)
  {
    util::Lock_guard_non_recursive lock(m_mutex);
    m_verbosities_by_component.clear();
  }
}

bool Config::configure_component_verbosity_by_name(Sev most_verbose_sev, util::String_view component_name)
{
  const auto key_it = m_components_by_name.find(normalized_component_name(component_name));
  if (key_it == m_components_by_name.end())
  {
    return false;
  }
  // else

  util::Lock_guard_non_recursive lock(m_mutex);
  m_verbosities_by_component[key_it->second] = most_verbose_sev;
  return true;
}

bool Config::output_component_to_ostream(std::ostream* os_ptr, const Component& component) const
{
  assert(os_ptr);
  auto& os = *os_ptr;

  if (component.empty()
      || (m_registered_payload_types.find(component.payload_type_index()) == m_registered_payload_types.end()))
  {
    return false;
  }
  // else

  const auto name_it = m_component_names.find(component_key(component));
  if (name_it == m_component_names.end())
  {
    os << component.payload_enum_raw_value();
  }
  else
  {
    os << name_it->second;
  }
  return true;
}

bool Config::output_whether_should_log(Sev sev, const Component& component) const
{
  assert(sev != Sev::S_NONE);

  if (!component.empty())
  {
    util::Lock_guard_non_recursive lock(m_mutex);
    const auto sev_it = m_verbosities_by_component.find(component_key(component));
    if (sev_it != m_verbosities_by_component.end())
    {
      return sev <= sev_it->second;
    }
  }
  // else: No component, or none configured for it specifically.  Default applies.

  return sev <= m_verbosity_default.load(std::memory_order_relaxed);
}

std::string Config::normalized_component_name(util::String_view name) // Static.
{
  using boost::algorithm::to_upper_copy;
  using std::locale;
  using std::string;

  return to_upper_copy(string(name), locale::classic());
}

} // namespace revset::log

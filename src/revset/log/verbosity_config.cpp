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
#include "revset/log/verbosity_config.hpp"
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <locale>

namespace revset::log
{

// Static initializations.

const std::string Verbosity_config::S_ALL_COMPONENT_NAME_ALIAS("ALL");
const char Verbosity_config::S_TOKEN_SEPARATOR(';');
const char Verbosity_config::S_PAIR_SEPARATOR(':');

// Implementations.

Verbosity_config::Verbosity_config() :
  m_component_sev_pairs({ { std::string(), Config::S_MOST_VERBOSE_SEV_DEFAULT } })
{
  // Nothing else.
}

bool Verbosity_config::parse(util::String_view spec)
{
  using boost::algorithm::split;
  using boost::algorithm::is_any_of;
  using std::string;
  using std::vector;

  Component_sev_pair_seq result_pairs;

  if (!spec.empty())
  {
    const string spec_str(spec);
    vector<string> tokens;
    split(tokens, spec_str, is_any_of(string(1, S_TOKEN_SEPARATOR)));

    for (const auto& token : tokens)
    {
      std::pair<string, Sev> pair;
      auto err_msg = parse_pair(token, &pair);
      if (!err_msg.empty())
      {
        m_last_result_message = util::ostream_op_string(std::move(err_msg), "  (In [", spec, "].)");
        return false;
      }
      // else
      result_pairs.push_back(std::move(pair));
    }
  }

  // The leading pair always sets the default.
  if (result_pairs.empty() || (!result_pairs.front().first.empty()))
  {
    result_pairs.insert(result_pairs.begin(), { string(), Config::S_MOST_VERBOSE_SEV_DEFAULT });
  }

  m_component_sev_pairs = std::move(result_pairs);
  m_last_result_message.clear();
  return true;
} // Verbosity_config::parse()

std::string Verbosity_config::parse_pair(const std::string& token, std::pair<std::string, Sev>* result) // Static.
{
  using boost::algorithm::to_upper_copy;
  using boost::lexical_cast;
  using boost::bad_lexical_cast;
  using util::ostream_op_string;
  using std::string;

  if (token.empty())
  {
    return "A pair token is empty.";
  }
  // else

  string name;
  string sev_str;
  const auto sep_pos = token.find(S_PAIR_SEPARATOR);
  if (sep_pos == string::npos)
  {
    sev_str = token;
  }
  else
  {
    if (token.find(S_PAIR_SEPARATOR, sep_pos + 1) != string::npos)
    {
      return ostream_op_string("Pair token [", token, "] must be `<component>", S_PAIR_SEPARATOR,
                               "<sev>` or `", S_PAIR_SEPARATOR, "<sev>` or `<sev>`.");
    }
    name = to_upper_copy(token.substr(0, sep_pos), std::locale::classic());
    sev_str = token.substr(sep_pos + 1);
  }

  if (name == S_ALL_COMPONENT_NAME_ALIAS)
  {
    name.clear();
  }

  Sev sev;
  try
  {
    // Throws also if `>>` stopped early, e.g., on "INFO,TRACE".
    sev = lexical_cast<Sev>(sev_str);
  }
  catch (const bad_lexical_cast&)
  {
    return ostream_op_string("Severity [", sev_str, "] must consist of alphanumerics and underscores.");
  }

  if (sev == Sev::S_NONE)
  {
    /* `>>` maps unknown words to NONE, which is also a legal explicit setting; so only accept NONE if they
     * actually said it (or its number). */
    const string sev_str_upper = to_upper_copy(sev_str, std::locale::classic());
    if ((sev_str_upper != "NONE") && (sev_str != "0"))
    {
      return ostream_op_string("Severity [", sev_str, "] is unknown.");
    }
  }

  *result = { std::move(name), sev };
  return string();
} // Verbosity_config::parse_pair()

bool Verbosity_config::apply_to_config(Config* target_config_ptr)
{
  assert(target_config_ptr);
  auto& target_config = *target_config_ptr;

  assert((!m_component_sev_pairs.empty()) && m_component_sev_pairs.front().first.empty());
  target_config.configure_default_verbosity(m_component_sev_pairs.front().second, true); // Reset.

  for (size_t idx = 1; idx != m_component_sev_pairs.size(); ++idx)
  {
    const auto& component_name = m_component_sev_pairs[idx].first;
    const auto sev = m_component_sev_pairs[idx].second;

    if (component_name.empty())
    {
      target_config.configure_default_verbosity(sev, false);
    }
    else if (!target_config.configure_component_verbosity_by_name(sev, component_name))
    {
      m_last_result_message = util::ostream_op_string("Component name [", component_name, "] is unknown.");
      return false;
    }
  }

  m_last_result_message.clear();
  return true;
} // Verbosity_config::apply_to_config()

const std::string& Verbosity_config::last_result_message() const
{
  return m_last_result_message;
}

const Verbosity_config::Component_sev_pair_seq& Verbosity_config::component_sev_pairs() const
{
  return m_component_sev_pairs;
}

std::istream& operator>>(std::istream& is, Verbosity_config& val)
{
  std::string token;
  is >> token;
  if (!val.parse(token))
  {
    is.setstate(std::ios_base::failbit);
  }
  return is;
}

std::ostream& operator<<(std::ostream& os, const Verbosity_config& val)
{
  const auto& pairs = val.component_sev_pairs();
  for (size_t idx = 0; idx != pairs.size(); ++idx)
  {
    if (idx != 0)
    {
      os << Verbosity_config::S_TOKEN_SEPARATOR;
    }
    os << (pairs[idx].first.empty() ? Verbosity_config::S_ALL_COMPONENT_NAME_ALIAS : pairs[idx].first)
       << Verbosity_config::S_PAIR_SEPARATOR << pairs[idx].second;
  }
  return os;
}

} // namespace revset::log

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
#include "revset/util/detail/util.hpp"
#include "revset/util/string_appender.hpp"
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <cassert>
#include <cctype>
#include <locale>

namespace revset::util
{

// Template implementations.

template<typename T1, typename ...T_rest>
void feed_args_to_ostream(std::ostream* os, T1 const & ostream_arg1, T_rest const &... remaining_ostream_args)
{
  // Induction step for variadic template.
  feed_args_to_ostream(os, ostream_arg1);
  feed_args_to_ostream(os, remaining_ostream_args...);
}

template<typename T>
void feed_args_to_ostream(std::ostream* os, T const & only_ostream_arg)
{
  // Induction base.
  *os << only_ostream_arg;
}

template<typename ...T>
void ostream_op_to_string(std::string* target_str, T const &... ostream_args)
{
  using std::flush;

  // Characters go straight onto *target_str; no ostringstream copy at the end.
  String_appender os(target_str);
  feed_args_to_ostream(&(os.os()), ostream_args...);
  os.os() << flush;
}

template<typename ...T>
std::string ostream_op_string(T const &... ostream_args)
{
  std::string result;
  ostream_op_to_string(&result, ostream_args...);
  return result;
}

template<typename Enum>
Enum istream_to_enum(std::istream* is_ptr, Enum enum_default, Enum enum_sentinel,
                     bool accept_num_encoding, bool case_sensitive,
                     Enum enum_lowest)
{
  using boost::lexical_cast;
  using boost::bad_lexical_cast;
  using boost::algorithm::equals;
  using boost::algorithm::is_iequal;
  using std::locale;
  using std::string;
  using std::isdigit;
  using std::isalnum;
  using Traits = std::char_traits<char>;
  using enum_t = std::underlying_type_t<Enum>;

  assert(enum_t(enum_lowest) >= 0);
  auto& is = *is_ptr;
  const is_iequal i_equal_func(locale::classic());

  // Token = everything up to (not including) the first non-alphanumeric/underscore character or stream end.
  string token;
  Traits::int_type ch;
  while (((ch = is.peek()) != Traits::eof()) && (isalnum(ch) || (ch == '_')))
  {
    token += Traits::to_char_type(ch);
    is.get();
  }

  if (token.empty())
  {
    return enum_default;
  }
  // else

  if (accept_num_encoding && isdigit(token.front()))
  {
    try
    {
      const auto num_enum = lexical_cast<enum_t>(token);
      return ((num_enum >= enum_t(enum_sentinel)) || (num_enum < enum_t(enum_lowest)))
               ? enum_default : Enum(num_enum);
    }
    catch (const bad_lexical_cast&)
    {
      return enum_default;
    }
  }
  // else: symbolic encoding, i.e., whatever `ostream << Enum` prints.

  for (auto idx = enum_t(enum_lowest); idx != enum_t(enum_sentinel); ++idx)
  {
    const auto candidate = Enum(idx);
    const auto candidate_str = lexical_cast<string>(candidate);
    if (case_sensitive ? equals(token, candidate_str)
                       : equals(token, candidate_str, i_equal_func))
    {
      return candidate;
    }
  }

  return enum_default;
} // istream_to_enum()

} // namespace revset::util

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

#include "revset/util/util.hpp"
#include "revset/log/log.hpp"
#include <gtest/gtest.h>
#include <iomanip>
#include <sstream>

namespace revset::util::test
{

namespace
{
using std::string;
} // Anonymous namespace

TEST(Util_misc, Interface)
{
  // ostream_op_string() is built on String_appender and feed_args_to_ostream(), so this checks all of them.
  EXPECT_EQ(ostream_op_string("abc[", 2, "] flag[", true, "]:", std::hex, 12),
            "abc[2] flag[1]:c");

  string target("x=");
  ostream_op_to_string(&target, 5, ';');
  EXPECT_EQ(target, "x=5;");

  string appended("pre:");
  {
    String_appender appender(&appended);
    appender.os() << "abc" << 1 << std::flush;
    EXPECT_EQ(appended, "pre:abc1") << "Existing contents must be kept; flush must expose the new ones.";
    appender.os() << "def";
  }
  EXPECT_EQ(appended, "pre:abc1def") << "Destruction must flush.";

  static_assert(get_last_path_segment("a/b/c.cpp") == "c.cpp", "Path segment must be computable at compile time.");
  EXPECT_EQ(get_last_path_segment("c.cpp"), "c.cpp");
  EXPECT_EQ(get_last_path_segment("/c.cpp"), "c.cpp");
  EXPECT_EQ(get_last_path_segment(""), "");

  const auto where = REVSET_UTIL_WHERE_AM_I_STR();
  EXPECT_EQ(where.find("util_test.cpp:"), 0u) << where;
  EXPECT_NE(where.find('('), string::npos) << where;
  EXPECT_EQ(where.back(), ')') << where;
} // TEST(Util_misc, Interface)

TEST(Util_istream_to_enum, Interface)
{
  using log::Sev;

  const auto parse = [](const string& str, bool accept_num, bool case_sensitive) -> Sev
  {
    std::istringstream is(str);
    return istream_to_enum(&is, Sev::S_END_SENTINEL, Sev::S_END_SENTINEL, accept_num, case_sensitive,
                           Sev::S_FATAL);
  };

  EXPECT_EQ(parse("ERROR", true, true), Sev::S_ERROR);
  EXPECT_EQ(parse("error", true, true), Sev::S_END_SENTINEL);
  EXPECT_EQ(parse("error", true, false), Sev::S_ERROR);
  EXPECT_EQ(parse("2", true, false), Sev::S_ERROR);
  EXPECT_EQ(parse("2", false, false), Sev::S_END_SENTINEL);
  EXPECT_EQ(parse("0", true, false), Sev::S_END_SENTINEL) << "Below enum_lowest.";
  EXPECT_EQ(parse("NONE", true, false), Sev::S_END_SENTINEL) << "Below enum_lowest.";
  EXPECT_EQ(parse("", true, false), Sev::S_END_SENTINEL);
  EXPECT_EQ(parse("-3", true, false), Sev::S_END_SENTINEL);
} // TEST(Util_istream_to_enum, Interface)

} // namespace revset::util::test

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

#include "revset/container/reverse_iterable_set.hpp"
#include "revset/test/test_logger.hpp"
#include "revset/util/util.hpp"
#include <boost/algorithm/string/predicate.hpp>
#include <boost/random/mersenne_twister.hpp>
#include <boost/random/uniform_int_distribution.hpp>
#include <boost/unordered_set.hpp>
#include <gtest/gtest.h>
#include <cctype>
#include <string>
#include <vector>

namespace revset::container::test
{

namespace
{
using std::string;
using std::vector;
using revset::test::Test_logger;
using revset::test::Test_buffer_logger;
using Int_set = Reverse_iterable_set<int>;
using Str_set = Reverse_iterable_set<string>;

using uint = unsigned int;
static uint s_n_copies = 0;

struct Obj
{
  string m_str;
  Obj() = default;
  Obj(const char* str) : m_str(str) {}
  Obj(const Obj& src) : m_str(src.m_str) { ++s_n_copies; }
  Obj(Obj&&) = default;
  Obj& operator=(const Obj& src) { if (this != &src) { m_str = src.m_str; ++s_n_copies; }
                                   return *this; }
  Obj& operator=(Obj&&) = default;
  bool operator==(const Obj& rhs) const { return m_str == rhs.m_str; }
};

size_t hash_value(const Obj& obj) { return boost::hash_value(obj.m_str); }

/// Collects the set's contents by walking begin()..end(), checking the reverse walk mirrors it on the way.
template<typename Set>
vector<typename Set::Key> contents(const Set& set)
{
  vector<typename Set::Key> fwd(set.begin(), set.end());
  const vector<typename Set::Key> bwd(set.rbegin(), set.rend());
  EXPECT_EQ(vector<typename Set::Key>(fwd.rbegin(), fwd.rend()), bwd) << "Reverse iteration must mirror forward.";
  EXPECT_EQ(fwd.size(), set.size());
  EXPECT_EQ(fwd.empty(), set.empty());
  EXPECT_NO_THROW(set.check_invariants());
  return fwd;
}

} // Anonymous namespace

// Yes... this is very cheesy... but this is a test, so I don't really care.
#define CTX util::ostream_op_string("Caller context [", REVSET_UTIL_WHERE_AM_I_STR(), "].")

TEST(Reverse_iterable_set, Construction_and_order)
{
  Test_logger logger;

  Int_set empty_set(&logger);
  EXPECT_TRUE(empty_set.empty());
  EXPECT_EQ(empty_set.size(), 0u);
  EXPECT_EQ(empty_set.begin(), empty_set.end());
  EXPECT_EQ(empty_set.rbegin(), empty_set.rend());
  EXPECT_EQ(empty_set.get_logger(), &logger);
  EXPECT_TRUE(contents(empty_set).empty());

  const Str_set set1{"a", "b", "c"};
  EXPECT_EQ(contents(set1), (vector<string>{"a", "b", "c"}));
  EXPECT_EQ(set1.front(), "a");
  EXPECT_EQ(set1.back(), "c");
  EXPECT_EQ(set1.get_logger(), nullptr);

  // Repeats in the source: the first occurrence decides the position.
  const vector<int> src{5, 3, 5, 1, 3, 9};
  const Int_set set2(src.begin(), src.end(), &logger);
  EXPECT_EQ(contents(set2), (vector<int>{5, 3, 1, 9}));

  const Int_set set3{{7, 8, 7}, &logger};
  EXPECT_EQ(contents(set3), (vector<int>{7, 8}));

  // Custom bucket count, hasher, predicate: an ASCII-case-insensitive set.
  struct Ci_hash
  {
    size_t operator()(const string& str) const
    {
      size_t seed = 0;
      for (const char ch : str) { boost::hash_combine(seed, std::tolower(static_cast<unsigned char>(ch))); }
      return seed;
    }
  };
  struct Ci_equal
  {
    bool operator()(const string& lhs, const string& rhs) const
    {
      return boost::algorithm::iequals(lhs, rhs);
    }
  };
  Reverse_iterable_set<string, Ci_hash, Ci_equal> ci_set(nullptr, 64);
  ci_set.append("Hello").append("WORLD").append("hello");
  EXPECT_EQ(contents(ci_set), (vector<string>{"Hello", "WORLD"}));
  EXPECT_TRUE(ci_set.contains("world"));
} // TEST(Reverse_iterable_set, Construction_and_order)

TEST(Reverse_iterable_set, Append_prepend)
{
  Test_buffer_logger logger(log::Sev::S_TRACE);
  Str_set set(&logger);

  // Fluent chaining: same object returned.
  EXPECT_EQ(&(set.append("b").append("c").prepend("a")), &set);
  EXPECT_EQ(contents(set), (vector<string>{"a", "b", "c"}));
  EXPECT_NE(logger.logged().find("append"), string::npos) << logger.logged();
  EXPECT_NE(logger.logged().find("REVSET-CONTAINER"), string::npos) << logger.logged();

  // Re-inserting keeps the existing position, at either end.
  set.append("a");
  EXPECT_EQ(contents(set), (vector<string>{"a", "b", "c"})) << "append() of a present value must not move it.";
  set.prepend("c");
  EXPECT_EQ(contents(set), (vector<string>{"a", "b", "c"})) << "prepend() of a present value must not move it.";
  EXPECT_NE(logger.logged().find("position unchanged"), string::npos) << logger.logged();

  // Prepend into empty then append: both endpoints set by the first insertion.
  Str_set set2;
  set2.prepend("x");
  EXPECT_EQ(set2.front(), "x");
  EXPECT_EQ(set2.back(), "x");
  set2.append("y").prepend("w");
  EXPECT_EQ(contents(set2), (vector<string>{"w", "x", "y"}));

  // The moving overloads move only if inserting.
  string val("z");
  set2.append(std::move(val));
  EXPECT_TRUE(set2.contains("z"));
  string dup("x");
  set2.prepend(std::move(dup));
  EXPECT_EQ(dup, "x") << "Not inserted, so not moved-from.";
  EXPECT_EQ(contents(set2), (vector<string>{"w", "x", "y", "z"}));

  // No copies of the key beyond the one stored.
  using Obj_set = Reverse_iterable_set<Obj>;
  Obj_set obj_set;
  s_n_copies = 0;
  obj_set.append(Obj{"a"});
  EXPECT_EQ(s_n_copies, 0u) << "Moving append() must not copy.";
  const Obj b{"b"};
  obj_set.prepend(b);
  EXPECT_EQ(s_n_copies, 1u) << "Copying prepend() must copy exactly once.";
  obj_set.append(b);
  EXPECT_EQ(s_n_copies, 1u) << "No copy when already present.";
  EXPECT_EQ(obj_set.front().m_str, "b");
  EXPECT_EQ(obj_set.back().m_str, "a");
} // TEST(Reverse_iterable_set, Append_prepend)

TEST(Reverse_iterable_set, Uniqueness)
{
  boost::random::mt19937 rnd(12345);
  boost::random::uniform_int_distribution<int> val_dist(0, 49);
  boost::random::uniform_int_distribution<int> op_dist(0, 2);

  Int_set set;
  boost::unordered_set<int> distinct;
  for (size_t idx = 0; idx != 1000; ++idx)
  {
    const int val = val_dist(rnd);
    switch (op_dist(rnd))
    {
    case 0:
      set.append(val);
      distinct.insert(val);
      break;
    case 1:
      set.prepend(val);
      distinct.insert(val);
      break;
    default:
      EXPECT_EQ(set.remove(val), distinct.erase(val) == 1);
    }
    ASSERT_EQ(set.size(), distinct.size()) << "After op [" << idx << "].";
  }

  const auto vals = contents(set);
  EXPECT_EQ(boost::unordered_set<int>(vals.begin(), vals.end()), distinct);
  for (const int val : distinct)
  {
    EXPECT_TRUE(set.contains(val));
    EXPECT_EQ(set.count(val), 1u);
  }
} // TEST(Reverse_iterable_set, Uniqueness)

TEST(Reverse_iterable_set, Remove)
{
  const auto check_remove = [](int val, const vector<int>& exp, const string& ctx)
  {
    Int_set set{1, 2, 3};
    EXPECT_TRUE(set.remove(val)) << ctx;
    EXPECT_FALSE(set.contains(val)) << ctx;
    EXPECT_EQ(contents(set), exp) << ctx;
    EXPECT_EQ(set.size(), 2u) << ctx;
    // Still linked properly at both ends: grow it from each.
    set.append(10).prepend(0);
    auto exp2 = exp;
    exp2.insert(exp2.begin(), 0);
    exp2.push_back(10);
    EXPECT_EQ(contents(set), exp2) << ctx;
  };

  check_remove(1, {2, 3}, CTX); // First.
  check_remove(2, {1, 3}, CTX); // Interior.
  check_remove(3, {1, 2}, CTX); // Last.

  // Sole element.
  Int_set single{42};
  EXPECT_TRUE(single.remove(42));
  EXPECT_TRUE(single.empty());
  EXPECT_EQ(single.size(), 0u);
  EXPECT_EQ(single.begin(), single.end());
  EXPECT_TRUE(contents(single).empty());
  single.append(1).append(2);
  EXPECT_EQ(contents(single), (vector<int>{1, 2})) << "Both endpoints must have been reset.";

  // Absent.
  Int_set set{1, 2, 3};
  EXPECT_FALSE(set.remove(4));
  EXPECT_EQ(set.size(), 3u);
  EXPECT_TRUE(set.remove(2));
  EXPECT_FALSE(set.remove(2)) << "Second removal of the same value must fail.";
  EXPECT_EQ(contents(set), (vector<int>{1, 3}));

  // Re-adding a removed value puts it at the chosen end.
  set.append(2);
  EXPECT_EQ(contents(set), (vector<int>{1, 3, 2}));
  set.remove(1);
  set.prepend(1);
  EXPECT_EQ(contents(set), (vector<int>{1, 3, 2}));
} // TEST(Reverse_iterable_set, Remove)

TEST(Reverse_iterable_set, Erase_and_find)
{
  Int_set set{1, 2, 3, 4};

  auto it = set.find(2);
  ASSERT_NE(it, set.end());
  EXPECT_EQ(*it, 2);
  EXPECT_EQ(*(++it), 3);
  EXPECT_EQ(*(--it), 2);
  EXPECT_EQ(set.find(99), set.end());

  it = set.erase(it);
  ASSERT_NE(it, set.end());
  EXPECT_EQ(*it, 3);
  EXPECT_EQ(contents(set), (vector<int>{1, 3, 4}));

  it = set.erase(set.find(4));
  EXPECT_EQ(it, set.end()) << "Erasing the last element yields end().";
  EXPECT_EQ(*(--it), 3) << "Decrementing end() yields the last element.";

  // Erase everything front-to-back.
  for (auto erase_it = set.cbegin(); erase_it != set.cend();)
  {
    erase_it = set.erase(erase_it);
  }
  EXPECT_TRUE(set.empty());
  EXPECT_TRUE(contents(set).empty());

  // Postfix forms and reverse iterators on a fresh set.
  const Int_set set2{5, 6, 7};
  auto it2 = set2.begin();
  EXPECT_EQ(*(it2++), 5);
  EXPECT_EQ(*it2, 6);
  EXPECT_EQ(*(it2--), 6);
  EXPECT_EQ(*it2, 5);
  auto rit = set2.crbegin();
  EXPECT_EQ(*rit, 7);
  ++rit;
  EXPECT_EQ(*rit, 6);
  EXPECT_EQ(std::distance(set2.crbegin(), set2.crend()), 3);
} // TEST(Reverse_iterable_set, Erase_and_find)

TEST(Reverse_iterable_set, Clear)
{
  Test_buffer_logger logger(log::Sev::S_DEBUG);
  Str_set set(&logger);
  set.append("a").append("b").append("c");
  logger.clear_logged();

  set.clear();
  EXPECT_EQ(set.size(), 0u);
  EXPECT_TRUE(set.empty());
  for (const auto& val : {"a", "b", "c"})
  {
    EXPECT_FALSE(set.contains(val)) << val;
  }
  EXPECT_TRUE(contents(set).empty());
  EXPECT_NE(logger.logged().find("[debg]"), string::npos) << logger.logged();
  EXPECT_NE(logger.logged().find("clearing"), string::npos) << logger.logged();

  set.append("c").append("a");
  EXPECT_EQ(contents(set), (vector<string>{"c", "a"})) << "Reusable after clear().";

  set.clear();
  set.clear(); // Harmless when already empty.
  EXPECT_TRUE(set.empty());
} // TEST(Reverse_iterable_set, Clear)

TEST(Reverse_iterable_set, Copy_move_swap)
{
  using std::swap; // This enables proper ADL.

  Test_logger logger1;
  Test_logger logger2;

  Int_set set1{{1, 2, 3}, &logger1};
  set1.remove(2); // So set1's slots have a hole: copies must still come out compact and in order.
  set1.prepend(0);

  Int_set copy(set1);
  EXPECT_EQ(contents(copy), (vector<int>{0, 1, 3}));
  EXPECT_EQ(copy.get_logger(), &logger1);
  set1.append(4);
  copy.remove(0);
  EXPECT_EQ(contents(set1), (vector<int>{0, 1, 3, 4})) << "Copies must be independent.";
  EXPECT_EQ(contents(copy), (vector<int>{1, 3}));

  Int_set set2{{9}, &logger2};
  set2 = set1; // Copy-assign.
  EXPECT_EQ(contents(set2), (vector<int>{0, 1, 3, 4}));
  EXPECT_EQ(set2.get_logger(), &logger1);
  set2 = set2; // Self-assign is a no-op.
  EXPECT_EQ(contents(set2), (vector<int>{0, 1, 3, 4}));

  Int_set moved(std::move(set2)); // Move-ct.
  EXPECT_EQ(contents(moved), (vector<int>{0, 1, 3, 4}));
  EXPECT_TRUE(set2.empty());
  EXPECT_TRUE(contents(set2).empty());
  set2.append(5); // Moved-from is usable.
  EXPECT_EQ(contents(set2), (vector<int>{5}));

  Int_set set3{{7, 8}, &logger2};
  set3 = std::move(moved); // Move-assign.
  EXPECT_EQ(contents(set3), (vector<int>{0, 1, 3, 4}));
  EXPECT_EQ(set3.get_logger(), &logger1);
  EXPECT_TRUE(moved.empty());

  swap(set2, set3);
  EXPECT_EQ(contents(set2), (vector<int>{0, 1, 3, 4}));
  EXPECT_EQ(contents(set3), (vector<int>{5}));
  EXPECT_EQ(set2.get_logger(), &logger1);
  set3.swap(set2);
  EXPECT_EQ(contents(set3), (vector<int>{0, 1, 3, 4}));
  EXPECT_EQ(contents(set2), (vector<int>{5}));

  // Keys must still be found (and removable) after everything was moved around.
  EXPECT_TRUE(set3.remove(1));
  EXPECT_EQ(contents(set3), (vector<int>{0, 3, 4}));
} // TEST(Reverse_iterable_set, Copy_move_swap)

TEST(Reverse_iterable_set, For_each)
{
  const Str_set set{"a", "b", "c"};

  vector<string> seen;
  set.for_each_forward([&](const string& val1, const string& val2, const Str_set& coll)
  {
    EXPECT_EQ(val1, val2);
    EXPECT_EQ(&coll, &set) << "Callback must receive the set itself.";
    seen.push_back(val1);
  });
  EXPECT_EQ(seen, (vector<string>{"a", "b", "c"}));

  seen.clear();
  set.for_each_backward([&](const string& val1, const string&, const Str_set&) { seen.push_back(val1); });
  EXPECT_EQ(seen, (vector<string>{"c", "b", "a"}));

  // Context as the receiver of a member function.
  struct Collector
  {
    vector<string> m_seen;
    const Str_set* m_coll = nullptr;
    void visit(const string& val1, const string& val2, const Str_set& coll)
    {
      EXPECT_EQ(val1, val2);
      m_coll = &coll;
      m_seen.push_back(val1 + val2);
    }
  };
  Collector collector;
  set.for_each_forward(&Collector::visit, &collector);
  EXPECT_EQ(collector.m_seen, (vector<string>{"aa", "bb", "cc"}));
  EXPECT_EQ(collector.m_coll, &set);
  collector.m_seen.clear();
  set.for_each_backward(&Collector::visit, &collector);
  EXPECT_EQ(collector.m_seen, (vector<string>{"cc", "bb", "aa"}));

  // Context as the first argument of any other callable.
  size_t count = 0;
  set.for_each_forward([](size_t* n, const string&, const string&, const Str_set&) { ++(*n); }, &count);
  EXPECT_EQ(count, 3u);

  // Nothing happens on an empty set.
  Str_set().for_each_backward([&](const string&, const string&, const Str_set&)
  {
    ADD_FAILURE() << "No elements; no calls.";
  });

  // Removing the element being visited is allowed.
  Str_set set2{"x", "y", "z"};
  set2.for_each_forward([&](const string& val, const string&, const Str_set&)
  {
    if (val != "y")
    {
      set2.remove(string(val));
    }
  });
  EXPECT_EQ(contents(set2), (vector<string>{"y"}));
} // TEST(Reverse_iterable_set, For_each)

TEST(Reverse_iterable_set, Type_tag_and_print)
{
  EXPECT_EQ(Int_set::S_TYPE_TAG, "Reverse_iterable_set");
  EXPECT_EQ(Str_set::S_TYPE_TAG, Int_set::S_TYPE_TAG);

  const Int_set set{1, 2, 3};
  const auto str = util::ostream_op_string(set);
  EXPECT_EQ(str.find("Reverse_iterable_set[size=3]@"), 0u) << str;
} // TEST(Reverse_iterable_set, Type_tag_and_print)

TEST(Reverse_iterable_set, Check_invariants)
{
  Int_set set;
  Error_code err_code = container::error::Code::S_SIZE_MISMATCH;
  set.check_invariants(&err_code);
  EXPECT_FALSE(err_code) << "Success must clear a pre-set code.";

  for (int val = 0; val != 20; ++val)
  {
    if ((val % 2) == 0)
    {
      set.append(val);
    }
    else
    {
      set.prepend(val);
    }
    set.check_invariants(&err_code);
    ASSERT_FALSE(err_code) << "After inserting [" << val << "]: [" << err_code.message() << "].";
  }
  for (int val = 0; val < 20; val += 3)
  {
    set.remove(val);
    EXPECT_NO_THROW(set.check_invariants()) << "After removing [" << val << "].";
  }
  set.clear();
  EXPECT_NO_THROW(set.check_invariants());
} // TEST(Reverse_iterable_set, Check_invariants)

} // namespace revset::container::test

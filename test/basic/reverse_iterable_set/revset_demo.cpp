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
#include "revset/log/simple_ostream_logger.hpp"
#include "revset/log/verbosity_config.hpp"
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <iterator>
#include <string>
#include <vector>

/* This simple program exercises a Reverse_iterable_set of words.
 *   <executable> [--verbosity=<verbosity spec>] [<word>...]
 * The words (or a built-in list, if none are given) are appended in order, repeats being ignored; then the set is
 * walked forward, backward, from its middle element in both directions, and pair-wise; each result is logged.
 * The verbosity spec is as understood by revset::log::Verbosity_config, e.g., "info;revset-container:trace" to
 * see the set's own TRACE-level logging.  Default is INFO. */
int main(int argc, const char** argv)
{
  using revset::log::Simple_ostream_logger;
  using revset::log::Config;
  using revset::log::Verbosity_config;
  using revset::log::Sev;
  using revset::Revset_log_component;
  using Set = revset::container::Reverse_iterable_set<std::string>;
  using String_view = revset::util::String_view;
  using boost::algorithm::join;
  using boost::algorithm::starts_with;
  using std::string;
  using std::vector;
  using std::exception;

  const int BAD_EXIT = 1;
  const String_view VERBOSITY_OPT = "--verbosity=";

  Config log_config(Sev::S_INFO);
  log_config.init_component_names(revset::S_REVSET_LOG_COMPONENT_NAME_MAP, "revset-");
  Simple_ostream_logger logger(&log_config);
  REVSET_LOG_SET_CONTEXT(&logger, Revset_log_component::S_UNCAT);

  vector<string> words;
  for (int arg_idx = 1; arg_idx < argc; ++arg_idx)
  {
    const String_view arg(argv[arg_idx]);
    if (!starts_with(arg, VERBOSITY_OPT))
    {
      words.emplace_back(arg);
      continue;
    }
    // else

    Verbosity_config verbosity;
    if ((!verbosity.parse(arg.substr(VERBOSITY_OPT.size()))) || (!verbosity.apply_to_config(&log_config)))
    {
      REVSET_LOG_WARNING("Bad verbosity [" << arg << "]: [" << verbosity.last_result_message() << "].");
      REVSET_LOG_WARNING("Usage: " << argv[0] << " [" << VERBOSITY_OPT << "<verbosity spec>] [<word>...]");
      return BAD_EXIT;
    }
    // else
    REVSET_LOG_INFO("Verbosity now [" << verbosity << "].");
  }
  if (words.empty())
  {
    words = { "alpha", "beta", "gamma", "delta", "epsilon" };
  }

  const auto log_walk = [&](String_view what, auto&& cursor)
  {
    vector<string> seen;
    for (const auto& word : cursor)
    {
      seen.push_back(word);
    }
    REVSET_LOG_INFO(what << ": [" << join(seen, " ") << "].");
  };

  // For simplicity, choose the exception-throwing error handling.  Do not pass in &Error_code.
  try
  {
    const Set set(words.begin(), words.end(), &logger);
    REVSET_LOG_INFO("Built [" << set << "] from [" << words.size() << "] words.");
    if (set.empty())
    {
      return 0;
    }
    // else

    log_walk("Forward", set.iterate_values());
    log_walk("Backward", set.reverse_view());

    const string& middle = *std::next(set.begin(), set.size() / 2);
    log_walk("Forward from [" + middle + "]", set.iterate_from(middle));
    log_walk("Backward from [" + middle + "]", set.iterate_from(middle).reverse());

    vector<string> pairs;
    for (auto cursor = set.iterate_value_pairs(); const auto pair = cursor.next();)
    {
      pairs.push_back(pair->first + '=' + pair->second);
    }
    REVSET_LOG_INFO("Pairs: [" << join(pairs, " ") << "].");

    size_t total_length = 0;
    set.for_each_backward([](size_t* total, const string& word, const string&, const Set&)
    {
      *total += word.size();
    }, &total_length);
    REVSET_LOG_INFO("Total length of distinct words: [" << total_length << "].");

    set.check_invariants(); // Throws on failure.
    REVSET_LOG_INFO("Structure verified.  Done!");
  }
  catch (const exception& exc)
  {
    REVSET_LOG_WARNING("Caught exception: [" << exc.what() << "].");
    return BAD_EXIT;
  }

  return 0;
} // main()

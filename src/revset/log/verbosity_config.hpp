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

#include "revset/log/config.hpp"
#include <string>
#include <utility>
#include <vector>

namespace revset::log
{

// Types.

/**
 * Verbosity settings for a log::Config in one concise, human-typeable string, such as one passed on a command
 * line: `"WARNING;REVSET-CONTAINER:TRACE"` sets the default verbosity to WARNING and the container's to TRACE.
 *
 * Grammar: pairs separated by #S_TOKEN_SEPARATOR; each pair is one of
 *   - `sev` or `:sev` or `ALL:sev` (#S_ALL_COMPONENT_NAME_ALIAS): default verbosity;
 *   - `name:sev`: verbosity of the component registered (Config::init_component_names()) as `name`.
 *
 * `sev` is anything `istream >> Sev` accepts (`"INFO"`, `"info"`, `"4"`).  The first pair always resets the
 * Config; if the string does not start with a default-verbosity pair, one with Config::S_MOST_VERBOSE_SEV_DEFAULT
 * is assumed.
 */
class Verbosity_config
{
public:
  // Types.

  /// Sequence of (normalized component name or "" for default, severity) pairs, applied in order.
  using Component_sev_pair_seq = std::vector<std::pair<std::string, Sev>>;

  // Constants.

  /// Component name meaning "the default verbosity."
  static const std::string S_ALL_COMPONENT_NAME_ALIAS;

  /// Separates component/severity pairs.
  static const char S_TOKEN_SEPARATOR;

  /// Separates component and severity within a pair.
  static const char S_PAIR_SEPARATOR;

  // Constructors/destructor.

  /// Constructs config equivalent to parsing `""`: reset everything, default verbosity Config::S_MOST_VERBOSE_SEV_DEFAULT.
  Verbosity_config();

  // Methods.

  /**
   * Parses `spec` into `*this`.  On failure `*this` is unchanged, and last_result_message() explains the problem.
   *
   * @param spec
   *        String in the grammar described in the class doc header.  Empty is allowed.
   * @return `true` on success.
   */
  bool parse(util::String_view spec);

  /**
   * Resets `*target_config` verbosities and applies `*this` to it.  On failure (an unknown component name) the
   * earlier pairs remain applied, and last_result_message() explains the problem.
   *
   * @param target_config
   *        Config to modify.
   * @return `true` on success.
   */
  bool apply_to_config(Config* target_config);

  /**
   * "" after a successful parse() or apply_to_config(); otherwise what went wrong.
   * @return See above.
   */
  const std::string& last_result_message() const;

  /**
   * The parsed pairs; the first is always the default verbosity (empty name).
   * @return See above.
   */
  const Component_sev_pair_seq& component_sev_pairs() const;

private:
  // Methods.

  /**
   * Parses one `[name:]sev` token.
   *
   * @param token
   *        The token.
   * @param result
   *        On success, the pair.
   * @return "" on success; else an error message.
   */
  static std::string parse_pair(const std::string& token, std::pair<std::string, Sev>* result);

  // Data.

  /// See component_sev_pairs().
  Component_sev_pair_seq m_component_sev_pairs;

  /// See last_result_message().
  std::string m_last_result_message;
}; // class Verbosity_config

// Free functions.

/**
 * Reads one whitespace-delimited token from `is` and Verbosity_config::parse()s it into `val`.  Sets `failbit` on
 * parse failure, so that `boost::lexical_cast<Verbosity_config>` reports it.
 *
 * @param is
 *        Stream.
 * @param val
 *        Target.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Verbosity_config& val);

/**
 * Serializes `val` in the grammar accepted by Verbosity_config::parse(), e.g., `"ALL:INFO;REVSET-CONTAINER:TRACE"`.
 *
 * @param os
 *        Stream.
 * @param val
 *        Object.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Verbosity_config& val);

} // namespace revset::log

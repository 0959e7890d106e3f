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

#include "revset/log/log.hpp"
#include <boost/functional/hash.hpp>
#include <boost/unordered_map.hpp>
#include <boost/unordered_set.hpp>
#include <atomic>
#include <utility>

namespace revset::log
{

// Types.

/**
 * Filter and format settings shared by Simple_ostream_logger and Buffer_logger (a custom Logger may consult one
 * too).  revset_demo fills one from `--verbosity` through Verbosity_config.
 *
 * It answers three questions:
 *   - Should a message with Sev `S` and Component `C` be logged (output_whether_should_log())?  Yes iff
 *     `S <= V`, where `V` is the verbosity configured for `C` specifically, or the default verbosity if none is.
 *   - What is `C`'s printable name (output_component_to_ostream())?
 *   - Are time stamps printed human-friendly or as seconds since epoch (#m_use_human_friendly_time_stamps)?
 *
 * ### Components ###
 * Each component `enum` used at log call sites is registered via init_component_names(), which gives each value
 * a name (optionally prefixed, e.g., `"REVSET-"`, to keep different `enum`s apart); thereafter verbosity can be
 * set by value (configure_component_verbosity()) or by name (configure_component_verbosity_by_name()).  A
 * Component whose `enum` type was never registered is still legal: it is filtered by the default verbosity and
 * printed as nothing.
 *
 * ### Thread safety ###
 * Setup (init_component_names()) must complete before `*this` is used by any Logger.  After that,
 * output_whether_should_log() and output_component_to_ostream() may be called concurrently with each other and
 * with the `configure_*()` methods.
 */
class Config
{
public:
  // Constants.

  /// Recommended default/catch-all most-verbose-severity value if no specific config is given.
  static const Sev S_MOST_VERBOSE_SEV_DEFAULT;

  // Constructors/destructor.

  /**
   * Constructs a conceptually blank but functional set of Config: no registered components; every message at
   * `most_verbose_sev_default` or more severe passes.  Time stamps are human-friendly.
   *
   * @param most_verbose_sev_default
   *        Default verbosity.  Sev::S_NONE means log nothing.
   */
  explicit Config(Sev most_verbose_sev_default = S_MOST_VERBOSE_SEV_DEFAULT);

  /**
   * Copy-constructs `*this` to be equal to `src` config object.  `src` must not be concurrently modified.
   *
   * @param src
   *        Source object.
   */
  Config(const Config& src);

  // Methods.

  /// Disallowed: replacing a Config under a live Logger would be a data race.
  void operator=(const Config&) = delete;

  /**
   * Given the attributes of a hypothetical message, returns `true` if it should be logged; `false` otherwise.
   * Intended as the body of Logger::should_log() for `Logger`s that use a Config.
   *
   * @param sev
   *        Severity of the message.  Must not be Sev::S_NONE.
   * @param component
   *        Component of the message; may be empty.
   * @return See above.
   */
  bool output_whether_should_log(Sev sev, const Component& component) const;

  /**
   * Outputs the name of `component` to `*os`, if it is registered by name; or its integer value if its `enum` is
   * registered but this value has no name; or nothing at all if empty or unregistered.
   *
   * @param os
   *        Pointer to stream to which to write.
   * @param component
   *        Component to print.
   * @return `true` if something was written.
   */
  bool output_component_to_ostream(std::ostream* os, const Component& component) const;

  /**
   * Registers the names of a component `enum`'s values, so that they can be printed and configured by name.
   * Names are normalized to upper case; `payload_type_prefix_or_empty` is prepended to each (also normalized).
   * If an `enum` value appears more than once in `component_names` (aliases), each name can be used to
   * configure it, while the first one encountered is the one printed.
   *
   * @tparam Component_payload
   *         `enum class : Component::enum_raw_t`.
   * @param component_names
   *        Value-to-name pairs, e.g., revset::S_REVSET_LOG_COMPONENT_NAME_MAP.
   * @param payload_type_prefix_or_empty
   *        Prefix for each name; e.g., `"revset-"`.
   */
  template<typename Component_payload>
  void init_component_names(const boost::unordered_multimap<Component_payload, std::string>& component_names,
                            util::String_view payload_type_prefix_or_empty = util::String_view());

  /**
   * Sets the default verbosity, which applies to any component without its own configured verbosity.
   *
   * @param most_verbose_sev_default
   *        New default verbosity.
   * @param reset
   *        If `true`, also forgets all per-component verbosities, so the default applies everywhere.
   */
  void configure_default_verbosity(Sev most_verbose_sev_default, bool reset);

  /**
   * Sets the verbosity for one component value, overriding the default for it.
   *
   * @tparam Component_payload
   *         `enum class : Component::enum_raw_t`.
   * @param most_verbose_sev
   *        Verbosity for the component.
   * @param component_payload
   *        The component value.
   */
  template<typename Component_payload>
  void configure_component_verbosity(Sev most_verbose_sev, Component_payload component_payload);

  /**
   * Like configure_component_verbosity() but identifies the component by its registered name
   * (case-insensitive, prefix included).
   *
   * @param most_verbose_sev
   *        Verbosity for the component.
   * @param component_name
   *        Name as registered with init_component_names().
   * @return `true` on success; `false` if the name is not registered (nothing changes).
   */
  bool configure_component_verbosity_by_name(Sev most_verbose_sev, util::String_view component_name);

  // Data.  (Public!)

  /// `true` to print time stamps as `YYYY-MM-DD HH:MM:SS.uuuuuu +ZZZZ`; `false` for `seconds.usec` since epoch.
  bool m_use_human_friendly_time_stamps;

private:
  // Types.

  /// A component identity: its `enum` type together with its integer value.
  using Component_key = std::pair<std::type_index, Component::enum_raw_t>;

  /// Hasher for #Component_key.
  struct Component_key_hash
  {
    /**
     * Hashes the key.
     * @param key
     *        Key.
     * @return Hash.
     */
    size_t operator()(const Component_key& key) const;
  };

  /// Short-hand for map from component to its verbosity.
  using Component_to_sev_map = boost::unordered_map<Component_key, Sev, Component_key_hash>;

  /// Short-hand for map from component to its printable name.
  using Component_to_name_map = boost::unordered_map<Component_key, std::string, Component_key_hash>;

  /// Short-hand for map from normalized name to component.
  using Name_to_component_map = boost::unordered_map<std::string, Component_key>;

  // Methods.

  /**
   * Returns the upper-case version of `name`.
   *
   * @param name
   *        Name.
   * @return See above.
   */
  static std::string normalized_component_name(util::String_view name);

  /**
   * Returns the key for `component`, which must not be empty.
   *
   * @param component
   *        Component.
   * @return See above.
   */
  static Component_key component_key(const Component& component);

  // Data.

  /// Default verbosity; see configure_default_verbosity().
  std::atomic<Sev> m_verbosity_default;

  /// Per-component verbosities.  Protected by #m_mutex.
  Component_to_sev_map m_verbosities_by_component;

  /// Printable component names; written only during init_component_names().
  Component_to_name_map m_component_names;

  /// Name-to-component lookup; written only during init_component_names().
  Name_to_component_map m_components_by_name;

  /// Set of `enum` types given to init_component_names(); written only during it.
  boost::unordered_set<std::type_index, std::hash<std::type_index>> m_registered_payload_types;

  /// Protects #m_verbosities_by_component.
  mutable util::Mutex_non_recursive m_mutex;
}; // class Config

// Template implementations.

template<typename Component_payload>
void Config::init_component_names(const boost::unordered_multimap<Component_payload, std::string>& component_names,
                                  util::String_view payload_type_prefix_or_empty)
{
  using std::string;

  const string prefix_normalized(normalized_component_name(payload_type_prefix_or_empty));
  m_registered_payload_types.insert(std::type_index(typeid(Component_payload)));

  for (const auto& enum_val_and_name : component_names)
  {
    assert(!enum_val_and_name.second.empty());
    const auto key = component_key(Component(enum_val_and_name.first));
    string name_normalized(prefix_normalized);
    name_normalized += normalized_component_name(enum_val_and_name.second);

    // A name collision across `enum`s is a setup bug; the later one would silently steal the name otherwise.
    assert(m_components_by_name.find(name_normalized) == m_components_by_name.end());
    m_components_by_name.emplace(name_normalized, key);
    // First name wins for output; any others are configuration aliases only.
    m_component_names.emplace(key, std::move(name_normalized));
  }
}

template<typename Component_payload>
void Config::configure_component_verbosity(Sev most_verbose_sev, Component_payload component_payload)
{
  const auto key = component_key(Component(component_payload));

  util::Lock_guard_non_recursive lock(m_mutex);
  m_verbosities_by_component[key] = most_verbose_sev;
}

} // namespace revset::log

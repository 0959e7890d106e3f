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

#include "revset/log/log_fwd.hpp"
#include "revset/util/util.hpp"
#include "revset/util/detail/util.hpp"
#include <boost/noncopyable.hpp>
#include <cassert>
#include <chrono>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <type_traits>

// Macros.  Log call sites; `REVSET_LOG_` stands in for the revset::log namespace.

/**
 * If `get_logger()` is non-null and lets WARNING messages of `get_log_component()` through, builds a message from
 * an `ostream` fragment and hands it to that Logger:
 *
 *   ~~~
 *   REVSET_LOG_WARNING("Cursor anchored at slot [" << slot << "] went stale; exhausting.");
 *   ~~~
 *
 * `get_logger` and `get_log_component` must be callable in the calling scope; usually the caller is a member of a
 * class deriving from revset::log::Log_context; otherwise use REVSET_LOG_SET_CONTEXT() first.
 * The fragment is evaluated only if Logger::should_log() returned `true`.  A null `get_logger()` is fine: nothing
 * is logged.
 *
 * @param ARG_stream_fragment
 *        Fragment of code as if writing to a standard `ostream`; no terminating newline.  It must not contain a
 *        comma outside parentheses.
 */
#define REVSET_LOG_WARNING(ARG_stream_fragment) \
  REVSET_LOG_WITH_CHECKING(::revset::log::Sev::S_WARNING, ARG_stream_fragment)

/**
 * Logs an INFO message; analogous to REVSET_LOG_WARNING().  The demo program's progress reports use this.
 * @param ARG_stream_fragment
 *        Same as in REVSET_LOG_WARNING().
 */
#define REVSET_LOG_INFO(ARG_stream_fragment) \
  REVSET_LOG_WITH_CHECKING(::revset::log::Sev::S_INFO, ARG_stream_fragment)

/**
 * Logs a DEBUG message; analogous to REVSET_LOG_WARNING().  Whole-set operations such as
 * container::Reverse_iterable_set::clear() log at this level.
 * @param ARG_stream_fragment
 *        Same as in REVSET_LOG_WARNING().
 */
#define REVSET_LOG_DEBUG(ARG_stream_fragment) \
  REVSET_LOG_WITH_CHECKING(::revset::log::Sev::S_DEBUG, ARG_stream_fragment)

/**
 * Logs a TRACE message; analogous to REVSET_LOG_WARNING().  Per-element container operations log at this level.
 * @param ARG_stream_fragment
 *        Same as in REVSET_LOG_WARNING().
 */
#define REVSET_LOG_TRACE(ARG_stream_fragment) \
  REVSET_LOG_WITH_CHECKING(::revset::log::Sev::S_TRACE, ARG_stream_fragment)

/**
 * Declares local `get_logger()` and `get_log_component()` returning `ARG_logger_ptr` and
 * `Component(ARG_component_payload)`, so the `REVSET_LOG_...()` calls after it in the same block use those.  For code
 * with no Log_context base, such as free functions, tests and `main()`.
 *
 * @param ARG_logger_ptr
 *        `Logger*` to use in subsequent log call sites in this block.  Null is allowed.
 * @param ARG_component_payload
 *        Component payload to use in subsequent log call sites in this block.
 */
#define REVSET_LOG_SET_CONTEXT(ARG_logger_ptr, ARG_component_payload) \
  REVSET_LOG_SET_LOGGER(ARG_logger_ptr); \
  REVSET_LOG_SET_COMPONENT(ARG_component_payload);

/**
 * The `get_logger()` half of REVSET_LOG_SET_CONTEXT().
 *
 * @param ARG_logger_ptr
 *        See REVSET_LOG_SET_CONTEXT().
 */
#define REVSET_LOG_SET_LOGGER(ARG_logger_ptr) \
  [[maybe_unused]] \
    const auto get_logger \
      = [logger_ptr_copy = static_cast<::revset::log::Logger*>(ARG_logger_ptr)] \
          () -> ::revset::log::Logger* { return logger_ptr_copy; }

/**
 * The `get_log_component()` half of REVSET_LOG_SET_CONTEXT().
 *
 * @param ARG_component_payload
 *        See REVSET_LOG_SET_CONTEXT().
 */
#define REVSET_LOG_SET_COMPONENT(ARG_component_payload) \
  [[maybe_unused]] \
    const auto get_log_component = [component = ::revset::log::Component(ARG_component_payload)] \
                                     () -> const ::revset::log::Component & \
  { \
    return component; \
  }

/**
 * What the per-severity macros above expand to: asks `get_logger()->should_log()` and, only if it says yes,
 * evaluates the fragment and calls REVSET_LOG_DO_LOG().
 *
 * @param ARG_sev
 *        Severity (type log::Sev).
 * @param ARG_stream_fragment
 *        Same as in REVSET_LOG_WARNING().
 */
#define REVSET_LOG_WITH_CHECKING(ARG_sev, ARG_stream_fragment) \
  REVSET_UTIL_SEMICOLON_SAFE \
  ( \
    ::revset::log::Logger* const REVSET_LOG_W_CHK_logger = get_logger(); \
    if (REVSET_LOG_W_CHK_logger && REVSET_LOG_W_CHK_logger->should_log(ARG_sev, get_log_component())) \
    { \
      REVSET_LOG_DO_LOG(REVSET_LOG_W_CHK_logger, ARG_sev, ARG_stream_fragment); \
    } \
  )

/**
 * Internal to REVSET_LOG_WITH_CHECKING(): builds the message and its Msg_metadata (call site file, function and
 * line; time stamp; thread ID) on the stack and hands both to Logger::do_log(), which may not keep references to
 * either past its return.  The Logger has already agreed to the severity.
 *
 * @param ARG_logger_ptr
 *        Non-null `Logger*`.
 * @param ARG_sev
 *        Severity (type log::Sev).
 * @param ARG_stream_fragment
 *        Same as in REVSET_LOG_WARNING().
 */
#define REVSET_LOG_DO_LOG(ARG_logger_ptr, ARG_sev, ARG_stream_fragment) \
  REVSET_UTIL_SEMICOLON_SAFE \
  ( \
    using ::revset::log::Msg_metadata; \
    using ::revset::util::String_view; \
    using ::revset::util::String_appender; \
    using ::revset::util::get_last_path_segment; \
    /* Time-of-day clock: not monotonic, but convertible to a calendar time, which is what a log reader wants. */ \
    const auto REVSET_LOG_DO_LOG_time_stamp = ::std::chrono::system_clock::now(); \
    constexpr char const * REVSET_LOG_DO_LOG_file_ptr = __FILE__; \
    constexpr size_t REVSET_LOG_DO_LOG_file_sz = sizeof(__FILE__) - 1; \
    constexpr char const * REVSET_LOG_DO_LOG_func_ptr = __FUNCTION__; \
    constexpr size_t REVSET_LOG_DO_LOG_func_sz = sizeof(__FUNCTION__) - 1; \
    constexpr String_view REVSET_LOG_DO_LOG_full_file_str(REVSET_LOG_DO_LOG_file_ptr, REVSET_LOG_DO_LOG_file_sz); \
    constexpr String_view REVSET_LOG_DO_LOG_file_str = get_last_path_segment(REVSET_LOG_DO_LOG_full_file_str); \
    constexpr String_view REVSET_LOG_DO_LOG_func_str(REVSET_LOG_DO_LOG_func_ptr, REVSET_LOG_DO_LOG_func_sz); \
    ::std::string REVSET_LOG_DO_LOG_msg; \
    { \
      String_appender REVSET_LOG_DO_LOG_os(&REVSET_LOG_DO_LOG_msg); \
      REVSET_LOG_DO_LOG_os.os() << ARG_stream_fragment << ::std::flush; \
    } \
    /* () keeps the braced initializer's commas from splitting the enclosing macro's argument. */ \
    auto REVSET_LOG_DO_LOG_metadata \
      = (Msg_metadata{ get_log_component(), ARG_sev, REVSET_LOG_DO_LOG_file_str, __LINE__, \
                       REVSET_LOG_DO_LOG_func_str, REVSET_LOG_DO_LOG_time_stamp, ::boost::this_thread::get_id() }); \
    (ARG_logger_ptr)->do_log(&REVSET_LOG_DO_LOG_metadata, String_view(REVSET_LOG_DO_LOG_msg)); \
  )

namespace revset::log
{

// Types.

/**
 * Identifies which part of a program a log message comes from: a value of some `enum class` (revset's own is
 * Revset_log_component; an application may register more) together with that `enum` type's identity, so that
 * equal integer values of unrelated `enum`s stay distinct.  Config maps a Component to a verbosity and a name.
 *
 * A default-constructed Component is empty ("uncategorized"); Loggers must accept such messages too.
 */
class Component
{
public:
  // Types.

  /// Every component `enum` must be `enum class X : enum_raw_t`.
  using enum_raw_t = unsigned int;

  // Constructors/destructor.

  /// Constructs an empty Component.
  Component();

  /**
   * Constructs a Component holding `payload`.  Implicit, so an `enum` value can be passed where a Component is
   * expected.
   *
   * @tparam Payload
   *         `enum class Payload : enum_raw_t`.
   * @param payload
   *        The value.
   */
  template<typename Payload>
  Component(Payload payload);

  // Methods.

  /**
   * Whether `*this` was default-constructed.
   * @return See above.
   */
  bool empty() const;

  /**
   * The held value, which must be of type `Payload`.  Not for empty Components.
   * @return See above.
   */
  template<typename Payload>
  Payload payload() const;

  /**
   * Identity of the held value's `enum` type.  Not for empty Components.
   * @return See above.
   */
  std::type_index payload_type_index() const;

  /**
   * The held value as an integer.  Not for empty Components.
   * @return See above.
   */
  enum_raw_t payload_enum_raw_value() const;

private:
  // Data.

  /// `typeid` of the payload `enum`; null iff empty().
  std::type_info const * m_payload_type;

  /// The payload as an integer; 0 if empty().
  enum_raw_t m_payload_raw;
}; // class Component

/// What a log call site knows besides the message text.  Put together by REVSET_LOG_DO_LOG().
struct Msg_metadata
{
  // Types.

  /// Calendar time, so it can be printed as a date.
  using Time_stamp = std::chrono::system_clock::time_point;

  // Data.

  /// Component of the Log_context (or REVSET_LOG_SET_CONTEXT()) in effect.
  Component m_msg_component;

  /// Severity, chosen by the macro used.
  Sev m_msg_sev;

  /// File name (no directories) of the call site; static storage.
  util::String_view m_msg_src_file;

  /// Line of the call site.
  unsigned int m_msg_src_line;

  /// Function containing the call site; static storage.
  util::String_view m_msg_src_function;

  /// When the call site was reached.
  Time_stamp m_called_when;

  /// Calling thread.
  util::Thread_id m_call_thread_id;
}; // struct Msg_metadata

/**
 * Destination of log messages.  A revset object that logs (container::Reverse_iterable_set and its cursors) takes
 * a `Logger*` at construction; null disables its logging.  should_log() is asked first, so a message that would be
 * filtered out is never formatted; do_log() then writes it.  Both may be called from several threads at once.
 */
class Logger :
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /// Polymorphic base.
  virtual ~Logger();

  // Methods.

  /**
   * Whether a message of severity `sev` from `component` (possibly empty) would be written.
   *
   * @param sev
   *        Severity.
   * @param component
   *        Component.
   * @return See above.
   */
  virtual bool should_log(Sev sev, const Component& component) const = 0;

  /**
   * Writes a message for which should_log() returned `true`.  Neither argument may be used after return.
   *
   * @param metadata
   *        Call site information.
   * @param msg
   *        Message text, without a trailing newline.
   */
  virtual void do_log(Msg_metadata* metadata, util::String_view msg) = 0;
}; // class Logger

/**
 * Holds the `Logger*` and Component for the `REVSET_LOG_*()` macros used inside a class's members: derive from it,
 * and `get_logger()`/`get_log_component()` are in scope.  A copy gets both values; a move takes them, leaving the
 * source as if default-constructed.
 */
class Log_context
{
public:
  // Constructors/destructor.

  /**
   * Stores `logger` and an empty Component.
   *
   * @param logger
   *        Null means do not log.
   */
  explicit Log_context(Logger* logger = nullptr);

  /**
   * Stores `logger` and `Component(component_payload)`.
   *
   * @tparam Component_payload
   *         See Component.
   * @param logger
   *        Null means do not log.
   * @param component_payload
   *        See Component.
   */
  template<typename Component_payload>
  explicit Log_context(Logger* logger, Component_payload component_payload);

  /**
   * Copies both values.
   *
   * @param src
   *        Source.
   */
  Log_context(const Log_context& src) = default;

  /**
   * Takes both values from `src`, which becomes as if default-constructed.
   *
   * @param src
   *        Source.
   */
  Log_context(Log_context&& src);

  // Methods.

  /**
   * Copies both values.
   *
   * @param src
   *        Source.
   * @return `*this`.
   */
  Log_context& operator=(const Log_context& src) = default;

  /**
   * Takes both values from `src`, which becomes as if default-constructed.
   *
   * @param src
   *        Source.
   * @return `*this`.
   */
  Log_context& operator=(Log_context&& src);

  /**
   * Exchanges both values with `other`.
   *
   * @param other
   *        Other object.
   */
  void swap(Log_context& other);

  /**
   * The `Logger*`, possibly null.
   * @return See above.
   */
  Logger* get_logger() const;

  /**
   * The Component.
   * @return See above.
   */
  const Component& get_log_component() const;

private:
  // Data.

  /// See get_logger().
  Logger* m_logger;

  /// See get_log_component().
  Component m_component;
}; // class Log_context

// Template implementations.

template<typename Payload>
Component::Component(Payload payload) :
  m_payload_type(&(typeid(Payload))),
  m_payload_raw(static_cast<enum_raw_t>(payload))
{
  static_assert(std::is_enum_v<Payload>, "Component payload must be an enum.");
  static_assert(std::is_same_v<std::underlying_type_t<Payload>, enum_raw_t>,
                "Component payload enum must have underlying type Component::enum_raw_t.");
}

template<typename Payload>
Payload Component::payload() const
{
  assert(m_payload_type && (*m_payload_type == typeid(Payload)));
  return static_cast<Payload>(m_payload_raw);
}

template<typename Component_payload>
Log_context::Log_context(Logger* logger, Component_payload component_payload) :
  m_logger(logger),
  m_component(component_payload)
{
  // That's it.
}

} // namespace revset::log

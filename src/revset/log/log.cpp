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
#include "revset/log/log.hpp"
#include <array>
#include <utility>

namespace revset::log
{

namespace
{

/// Sev names indexed by value; what `operator<<` prints and (case-insensitively) what `operator>>` accepts.
const std::array<util::String_view, size_t(Sev::S_END_SENTINEL)> S_SEV_NAMES
  = { "NONE", "FATAL", "ERROR", "WARNING", "INFO", "DEBUG", "TRACE", "DATA" };

} // Anonymous namespace

// Logger implementations.

Logger::~Logger() = default;

// Component implementations.

Component::Component() :
  m_payload_type(nullptr),
  m_payload_raw(0)
{
  // That's it.
}

bool Component::empty() const
{
  return m_payload_type == nullptr;
}

std::type_index Component::payload_type_index() const
{
  assert(!empty());
  return *m_payload_type;
}

Component::enum_raw_t Component::payload_enum_raw_value() const
{
  assert(!empty());
  return m_payload_raw;
}

// Log_context implementations.

Log_context::Log_context(Logger* logger) :
  m_logger(logger)
{
  // That's it.
}

Log_context::Log_context(Log_context&& src) :
  Log_context()
{
  swap(src);
}

Log_context& Log_context::operator=(Log_context&& src)
{
  if (&src != this)
  {
    Log_context().swap(*this);
    swap(src);
  }
  return *this;
}

void Log_context::swap(Log_context& other)
{
  std::swap(m_logger, other.m_logger);
  std::swap(m_component, other.m_component);
}

Logger* Log_context::get_logger() const
{
  return m_logger;
}

const Component& Log_context::get_log_component() const
{
  return m_component;
}

void swap(Log_context& val1, Log_context& val2)
{
  val1.swap(val2);
}

// Sev implementations.

std::ostream& operator<<(std::ostream& os, Sev val)
{
  const auto idx = size_t(val);
  assert(idx < S_SEV_NAMES.size());
  return os << S_SEV_NAMES[idx];
}

std::istream& operator>>(std::istream& is, Sev& val)
{
  // istream_to_enum() matches against operator<<() output, ignoring case, or takes the integer.
  val = util::istream_to_enum(&is, Sev::S_NONE, Sev::S_END_SENTINEL);
  return is;
}

} // namespace revset::log

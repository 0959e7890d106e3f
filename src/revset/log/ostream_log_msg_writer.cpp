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
#include "revset/log/ostream_log_msg_writer.hpp"
#include "revset/log/config.hpp"
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <iomanip>

namespace revset::log
{

// Static initializations.

const std::array<util::String_view, size_t(Sev::S_END_SENTINEL)> Ostream_log_msg_writer::S_SEV_STRS
  = { { "null", // Never used (sentinel).
        "fatl", "eror", "warn", "info", "debg", "trce", "data" } };

// Implementations.

Ostream_log_msg_writer::Ostream_log_msg_writer(const Config& config, std::ostream& os) :
  m_config(config),
  m_os(os),
  m_clean_os_state(m_os) // Memorize this before any messing with formatting.
{
  // Nothing else.  m_cached_rounded_time_stamp is the epoch, so the first human-friendly log() recomputes the cache.
}

void Ostream_log_msg_writer::log(const Msg_metadata& metadata, util::String_view msg)
{
  using std::flush;

  assert(metadata.m_msg_sev != Sev::S_NONE); // S_NONE can be used only as a sentinel.

  if (m_config.m_use_human_friendly_time_stamps)
  {
    write_human_friendly_time_stamp(metadata.m_called_when);
  }
  else
  {
    write_epoch_time_stamp(metadata.m_called_when);
  }

  m_os << '[' << S_SEV_STRS[static_cast<size_t>(metadata.m_msg_sev)] << "]: T" << metadata.m_call_thread_id << ": ";

  if (m_config.output_component_to_ostream(&m_os, metadata.m_msg_component))
  {
    m_os << ": ";
  }

  m_os << REVSET_UTIL_WHERE_AM_I_FROM_ARGS(metadata.m_msg_src_file, metadata.m_msg_src_function,
                                           metadata.m_msg_src_line)
       << ": "
       << msg << '\n'
       << flush;
} // Ostream_log_msg_writer::log()

void Ostream_log_msg_writer::write_epoch_time_stamp(Msg_metadata::Time_stamp called_when)
{
  using std::setw;
  using std::setfill;
  using std::chrono::duration_cast;
  using std::chrono::microseconds;

  const auto usec_since_epoch = duration_cast<microseconds>(called_when.time_since_epoch()).count();

  m_os << (usec_since_epoch / 1000000) << '.'
       << setfill('0') << setw(6) << (usec_since_epoch % 1000000) << setfill(' ') << ' ';
}

void Ostream_log_msg_writer::write_human_friendly_time_stamp(Msg_metadata::Time_stamp called_when)
{
  using std::chrono::time_point_cast;
  using std::chrono::duration_cast;
  using std::chrono::seconds;
  using std::chrono::microseconds;
  using std::chrono::system_clock;

  /* The date/time up to whole seconds (and the zone) rarely changes between consecutive messages and is not cheap
   * to compute (localtime(), formatting); so recompute only when the whole second changes. */
  const auto rounded_time_stamp = time_point_cast<seconds>(called_when);
  if ((m_cached_rounded_time_stamp != rounded_time_stamp) || m_cached_time_stamp_prefix.empty())
  {
    // Local time zone, not UTC.
    const auto local_tm = fmt::localtime(system_clock::to_time_t(called_when));
    m_cached_time_stamp_prefix = fmt::format("{:%Y-%m-%d %H:%M:%S}", local_tm);
    m_cached_time_stamp_suffix = fmt::format(" {:%z} ", local_tm);
    m_cached_rounded_time_stamp = rounded_time_stamp;
  }

  const auto usec = duration_cast<microseconds>(called_when - rounded_time_stamp).count();
  m_os << m_cached_time_stamp_prefix << fmt::format(".{:06}", usec) << m_cached_time_stamp_suffix;
}

} // namespace revset::log

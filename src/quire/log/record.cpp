/* Quire
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
#include "quire/log/record.hpp"
#include <boost/core/demangle.hpp>
#include <boost/stacktrace.hpp>
#include <algorithm>
#include <array>
#include <typeinfo>

namespace quire::log
{

namespace
{

/// The names Record owns at the top level of its rendering.  Keep in sync with Json_formatter output.
constexpr std::array<util::String_view, 10> S_RESERVED_FIELD_NAMES
  = { "timestamp", "level", "logger", "message", "module", "function", "line", "context", "extra", "error" };

/// Frames to skip at the top of a captured stack: capture_error() and capture_current_error() themselves.
constexpr size_t S_CAPTURE_FRAMES_SKIPPED = 2;

} // namespace (anon)

// Implementations.

bool is_reserved_field_name(util::String_view name)
{
  return std::find(S_RESERVED_FIELD_NAMES.begin(), S_RESERVED_FIELD_NAMES.end(), name)
           != S_RESERVED_FIELD_NAMES.end();
}

Record make_record(Sev sev, util::String_view logger_name, util::String_view message, Msg_origin origin,
                   Fields context, Fields extra, bool capture_error)
{
  Record record;
  record.m_time_stamp = Record::Clock::now();
  record.m_sev = sev;
  record.m_logger_name = logger_name;
  record.m_message = message;
  record.m_origin = std::move(origin);

  context.erase_if(is_reserved_field_name);
  extra.erase_if(is_reserved_field_name);
  record.m_context = std::move(context);
  record.m_extra = std::move(extra);

  if (capture_error)
  {
    record.m_error = capture_current_error();
  }
  return record;
} // make_record()

std::optional<Error_info> capture_current_error()
{
  return capture_error(std::current_exception());
}

std::optional<Error_info> capture_error(std::exception_ptr exc_ptr)
{
  using boost::stacktrace::stacktrace;

  if (!exc_ptr)
  {
    return std::nullopt;
  }
  // else

  Error_info info;
  try
  {
    std::rethrow_exception(exc_ptr);
  }
  catch (const std::exception& exc)
  {
    info.m_type = boost::core::demangle(typeid(exc).name());
    info.m_message = exc.what();
  }
  catch (...)
  {
    // Not an std::exception: the type is opaque to us, but the capture itself still stands (with its stack).
    info.m_type = "unknown";
  }

  for (const auto& frame : stacktrace(S_CAPTURE_FRAMES_SKIPPED, static_cast<size_t>(-1)))
  {
    info.m_frames.emplace_back(boost::stacktrace::to_string(frame));
  }
  return info;
} // capture_error()

} // namespace quire::log

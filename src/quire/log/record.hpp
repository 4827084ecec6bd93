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
#pragma once

#include "quire/log/field.hpp"
#include <chrono>
#include <optional>
#include <exception>

namespace quire::log
{

// Types.

/**
 * Where a log call was made.  Typically filled by the `QUIRE_LOG_*()` macros from `__FILE__` (reduced to its
 * stem, e.g. `"order_service"`), `__FUNCTION__` and `__LINE__`; all-empty/zero when the call came in
 * without origin information.
 */
struct Msg_origin
{
  // Data.

  /// Source module: file name without directory or extension.
  std::string m_module;

  /// Function name.
  std::string m_function;

  /// Line number; 0 if unknown.
  unsigned int m_line = 0;
}; // struct Msg_origin

/**
 * Snapshot of an exception captured at log time: its type, message and the stack at the capture site.
 * See capture_current_error().
 */
struct Error_info
{
  // Data.

  /// Demangled dynamic type name, e.g. `"std::runtime_error"`; `"unknown"` if not an `std::exception`.
  std::string m_type;

  /// `what()`, or empty if not an `std::exception`.
  std::string m_message;

  /// One human-readable entry per stack frame, innermost first.
  std::vector<std::string> m_frames;
}; // struct Error_info

/**
 * One log event.  A Record is built once, by make_record(), in the thread making the log call; after that only
 * Filter stages touch it (to veto it or to sanitize field values) before handlers render it.
 *
 * Invariant: neither #m_context nor #m_extra contains a key that is_reserved_field_name(); make_record() drops such
 * keys, so that they can never be confused with (or overwrite) the Record's own members in the rendered output.
 */
struct Record
{
  // Types.

  /// Clock for #m_time_stamp: wall-clock; rendered in UTC by the JSON formatter.
  using Clock = std::chrono::system_clock;

  // Data.

  /// When the Record was built.
  Clock::time_point m_time_stamp;

  /// Severity.
  Sev m_sev = Sev::S_NONE;

  /// Name of the Logger that built it.
  std::string m_logger_name;

  /// The human-authored message.
  std::string m_message;

  /// Call site.
  Msg_origin m_origin;

  /// Thread context in effect when the Record was built (merged Context_store frames).
  Fields m_context;

  /// Fields supplied by this particular call.
  Fields m_extra;

  /// Captured exception, if the call asked for one and one was in flight.
  std::optional<Error_info> m_error;
}; // struct Record

// Free functions.

/**
 * Returns `true` if and only if `name` is one of the names the Record itself renders at the top level:
 * `timestamp`, `level`, `logger`, `message`, `module`, `function`, `line`, `context`, `extra`, `error`.
 * Matching is exact (case-sensitive).
 *
 * @param name
 *        Field name.
 * @return See above.
 */
bool is_reserved_field_name(util::String_view name);

/**
 * Builds a Record stamped with the current time.  Keys in `context` or `extra` for which
 * is_reserved_field_name() holds are dropped.  Never throws (save for `std::bad_alloc`).
 *
 * @param sev
 *        Severity.
 * @param logger_name
 *        Logger name.
 * @param message
 *        Message.
 * @param origin
 *        Call site.
 * @param context
 *        Merged thread context.
 * @param extra
 *        Call-supplied fields.
 * @param capture_error
 *        If `true` and an exception is being handled (`std::current_exception()` is non-null), it is captured into
 *        Record::m_error via capture_current_error().
 * @return See above.
 */
Record make_record(Sev sev, util::String_view logger_name, util::String_view message, Msg_origin origin,
                   Fields context, Fields extra, bool capture_error);

/**
 * Captures the exception being handled in the current thread (if any) as an Error_info, along with the current
 * stack.  Must be called from within (the dynamic extent of) a `catch` block to find anything.
 *
 * @return Captured info; or `std::nullopt` if no exception is being handled.
 */
std::optional<Error_info> capture_current_error();

/**
 * Like capture_current_error() but for the given exception pointer.
 *
 * @param exc_ptr
 *        Exception; if null the result is `std::nullopt`.
 * @return See above.
 */
std::optional<Error_info> capture_error(std::exception_ptr exc_ptr);

} // namespace quire::log

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

#include "quire/log/record.hpp"

namespace quire::log
{

// Types.

/**
 * Interface for turning a Record into one rendered log entry.  The result carries no trailing newline; the Handler
 * terminates each entry.  A single rendered entry may still span lines when it is meant to (see
 * Console_formatter and errors).
 *
 * render() is `const` and must be safe to call concurrently; a Formatter may be shared by several handlers.
 */
class Formatter
{
public:
  // Constructors/destructor.

  /// Boring virtual destructor.
  virtual ~Formatter();

  // Methods.

  /**
   * Renders the Record.
   *
   * @param record
   *        Record, post-filter.
   * @return See above.
   */
  virtual std::string render(const Record& record) const = 0;
}; // class Formatter

/**
 * Formatter emitting one JSON object per entry:
 *
 *   ~~~
 *   {"timestamp":"2024-05-01T12:00:00.123456Z","level":"INFO","logger":"svc","message":"hi",
 *    "module":"main","function":"run","line":42,"context":{"request_id":"r1"},"extra":{"code":1},
 *    "error":{"type":"std::runtime_error","message":"boom","frames":["..."]}}
 *   ~~~
 *
 * (all on one line).  `error` appears only if the Record has one.  The time stamp is UTC with microseconds.
 * Field values keep their type: strings are JSON strings (escaped, non-ASCII passed through as UTF-8),
 * integers and booleans are bare, null is `null`.  Floating-point values are written in shortest round-trip form,
 * always with a decimal point or exponent (so they don't come back as integers); non-finite ones become `null`.
 */
class Json_formatter :
  public Formatter
{
public:
  // Constructors/destructor.

  /// Constructs formatter.
  Json_formatter();

  // Methods.

  /**
   * See class doc header.
   *
   * @param record
   *        See Formatter::render().
   * @return See above.
   */
  std::string render(const Record& record) const override;
}; // class Json_formatter

/**
 * Formatter emitting a human-readable line:
 *
 *   ~~~
 *   [2024-05-01 14:00:00.123] WARNING svc.db: slow query | request_id=r1 elapsed_ms=1200
 *   ~~~
 *
 * Local time with milliseconds; then the level (ANSI-colored if so configured); logger name; message; then, if
 * there are any, `" | "` followed by context fields and then extra fields as space-separated `key=value`.
 * If the Record has an error, a traceback block follows on subsequent lines: a header, one indented line per
 * frame, and `type: message`.
 */
class Console_formatter :
  public Formatter
{
public:
  // Constructors/destructor.

  /**
   * Constructs formatter.
   *
   * @param use_colors
   *        Whether to wrap the level in ANSI color escapes.
   */
  explicit Console_formatter(bool use_colors);

  // Methods.

  /**
   * See class doc header.
   *
   * @param record
   *        See Formatter::render().
   * @return See above.
   */
  std::string render(const Record& record) const override;

  /**
   * Ctor arg.
   * @return See above.
   */
  bool use_colors() const;

private:
  // Data.

  /// See ctor.
  const bool m_use_colors;
}; // class Console_formatter

} // namespace quire::log

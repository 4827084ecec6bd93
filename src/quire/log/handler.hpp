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

#include "quire/log/formatter.hpp"
#include <ostream>
#include <iostream>

namespace quire::log
{

// Types.

/**
 * Interface for a sink of rendered log entries, with its own level threshold and Formatter.  A Logger hands each
 * Record that survived its filters to every one of its handlers via handle(); the handler then, in the calling
 * thread:
 *   -# drops the Record if its severity is below threshold() (so a handler can be stricter than its Logger, though
 *      never more permissive, as the Logger's level filter runs first);
 *   -# renders it with formatter(), appending a newline;
 *   -# locks its mutex and calls do_write(), which subclasses implement for their particular sink.
 *
 * Because do_write() (and any pre-write work a subclass does there, such as file rotation) runs under that one
 * mutex, entries from concurrent threads never interleave and rotation never races with a write.
 *
 * ### Failure policy ###
 * handle() never throws.  If rendering or do_write() fails, the handler writes a one-line diagnostic and then the
 * entry itself (if it was rendered) to its *fallback stream* (`std::cerr` unless configured otherwise), so the entry
 * is not lost and other handlers of the same Logger proceed unaffected.  A subclass reports failure from
 * do_write() by setting its #Error_code out-arg (preferred) or by throwing an `std::exception`.
 *
 * ### Extension ###
 * To add a sink, subclass Handler and implement do_write() (and do_flush() if buffered); then list it in a
 * Logger_config via a Handler_spec of kind Handler_spec::Kind::S_CUSTOM.
 */
class Handler
{
public:
  // Constructors/destructor.

  /// Boring virtual destructor.
  virtual ~Handler();

  /// Forbid copying.
  Handler(const Handler&) = delete;

  // Methods.

  /// Forbid copying.
  Handler& operator=(const Handler&) = delete;

  /**
   * Renders and writes the Record if its severity passes threshold(); see class doc header.  Never throws.
   *
   * @param record
   *        Record, post-filter.
   */
  void handle(const Record& record);

  /**
   * Returns `sev >= threshold()`.
   *
   * @param sev
   *        Severity.
   * @return See above.
   */
  bool should_handle(Sev sev) const;

  /// Flushes buffered output, if any, to the sink.  Never throws.
  void flush();

  /**
   * Least severe Sev this handler writes.
   * @return See above.
   */
  Sev threshold() const;

  /**
   * The formatter.
   * @return See above.  Not null.
   */
  const Formatter_ptr& formatter() const;

  /**
   * Brief human-readable identification of `*this`, e.g. `"File_handler @ [logs/svc.log]"`; used in diagnostics.
   * @return See above.
   */
  virtual std::string description() const = 0;

protected:
  // Constructors/destructor.

  /**
   * Constructs handler.
   *
   * @param threshold
   *        See threshold().
   * @param formatter
   *        See formatter().  Must not be null (behavior undefined otherwise; Logger_config validation ensures this
   *        for configured handlers).
   * @param fallback_os
   *        Fallback stream; see class doc header.  Must not be null and must outlive `*this`.
   */
  explicit Handler(Sev threshold, Formatter_ptr formatter, std::ostream* fallback_os);

  // Methods.

  /**
   * Writes one rendered entry (newline-terminated) to the sink.  Called with the handler's mutex locked.
   *
   * @param entry
   *        The entry.
   * @param err_code
   *        Set to a truthy value on failure; untouched on success.  Not null.
   */
  virtual void do_write(util::String_view entry, Error_code* err_code) = 0;

  /**
   * Flushes the sink.  Called with the handler's mutex locked.  Default implementation does nothing.
   *
   * @param err_code
   *        See do_write().
   */
  virtual void do_flush(Error_code* err_code);

  /**
   * Writes a diagnostic line `"quire: <description()>: <problem>"` to the fallback stream.  For use by subclasses
   * (e.g., to report a failed rotation that did not prevent the write itself).  Call only with the mutex locked
   * (i.e., from do_write() or do_flush()), or from a constructor.
   *
   * @param problem
   *        What went wrong.
   */
  void report_problem(util::String_view problem);

private:
  // Data.

  /// See threshold().
  const Sev m_threshold;

  /// See formatter().
  const Formatter_ptr m_formatter;

  /// See ctor.
  std::ostream* const m_fallback_os;

  /// Serializes do_write(), do_flush() and fallback output.
  util::Mutex_non_recursive m_mutex;
}; // class Handler

/**
 * Handler writing to an `std::ostream` it does not own (typically `std::cout` or `std::cerr`), flushing after each
 * entry.  No rotation.
 *
 * The stream should not be written by anything else concurrently (unless externally synchronized), as the
 * handler's mutex protects only its own writes.
 */
class Stream_handler :
  public Handler
{
public:
  // Constructors/destructor.

  /**
   * Constructs handler.
   *
   * @param threshold
   *        See Handler.
   * @param formatter
   *        See Handler.
   * @param os
   *        Target stream; must outlive `*this`.
   * @param fallback_os
   *        See Handler.
   */
  explicit Stream_handler(Sev threshold, Formatter_ptr formatter, std::ostream& os,
                          std::ostream* fallback_os = &std::cerr);

  // Methods.

  /**
   * See Handler::description().
   * @return See above.
   */
  std::string description() const override;

protected:
  // Methods.

  /**
   * Writes and flushes; a bad stream state afterwards is reported as `errc::io_error` (and cleared, so the next
   * entry is attempted normally).
   *
   * @param entry
   *        See Handler::do_write().
   * @param err_code
   *        See Handler::do_write().
   */
  void do_write(util::String_view entry, Error_code* err_code) override;

  /**
   * Flushes the stream.
   *
   * @param err_code
   *        See Handler::do_flush().
   */
  void do_flush(Error_code* err_code) override;

private:
  // Data.

  /// See ctor.
  std::ostream& m_os;
}; // class Stream_handler

} // namespace quire::log

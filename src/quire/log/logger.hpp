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

#include "quire/log/config.hpp"
#include "quire/log/context_store.hpp"
#include "quire/util/util.hpp"
#include "quire/util/fmt.hpp"
#include <boost/get_pointer.hpp>
#include <boost/chrono/duration.hpp>
#include <iostream>
#include <type_traits>

namespace quire::log
{

// Types.

/**
 * The object user code logs through.  Built from a Logger_config (usually by Logger_registry / get_logger()), a
 * Logger owns the configured handlers and filters and, for each call whose severity passes level():
 *   -# takes the calling thread's merged context from its Context_store;
 *   -# builds a Record via make_record() (reserved-name keys dropped; exception captured if asked);
 *   -# runs the filters in order, stopping silently at the first veto;
 *   -# passes the Record to each Handler, in configured order.
 *
 * All of that runs synchronously in the calling thread.  Any number of threads may use one Logger concurrently:
 * configuration is immutable after construction, context is per thread, and each Handler serializes its own
 * writes.
 *
 * ### Failure policy ###
 * Construction throws error::Runtime_error on any configuration problem.  After that no logging method throws:
 * unusable fields are dropped, sink failures are absorbed by the Handler (see Handler), and anything else
 * unexpected is reported on the fallback stream and the entry dropped.  The one exception, by design of its
 * contract, is measure_time(), which rethrows the exception thrown by the timed function, unchanged.
 *
 * ### Redaction ###
 * If the configured filters include no Sensitive_data_filter, a default-constructed one is appended, so that no
 * Logger ever writes blocklisted fields in the clear.
 *
 * ### Call-site macros ###
 * `QUIRE_LOG_INFO("message")`, `QUIRE_LOG_WARNING("message", {{"code", 1}})` etc. log to `get_logger()` (from
 * Log_context or QUIRE_LOG_SET_LOGGER()), filling in the call-site origin, and skip all work (including evaluating
 * the fields) if should_log() says no.
 */
class Logger
{
public:
  // Constructors/destructor.

  /**
   * Builds the handlers and filter pipeline described by `config`.
   *
   * @param config
   *        Configuration; copied.
   * @param context_store
   *        Source of thread context; must outlive `*this`.
   * @param fallback_os
   *        Where handlers and the Logger itself report their own problems (and where entries go that a handler
   *        could not write); must outlive `*this`.
   * @throws error::Runtime_error with an error::Code describing the configuration problem.
   */
  explicit Logger(const Logger_config& config,
                  Context_store* context_store = Context_store::default_store(),
                  std::ostream* fallback_os = &std::cerr);

  /// Flushes the handlers.
  ~Logger();

  /// Forbid copying.
  Logger(const Logger&) = delete;

  // Methods.

  /// Forbid copying.
  Logger& operator=(const Logger&) = delete;

  /**
   * Whether a record of severity `sev` would be processed at all: `sev >= level()` (and `sev` is a real
   * severity).  Filters may still veto it afterwards.
   *
   * @param sev
   *        Severity.
   * @return See above.
   */
  bool should_log(Sev sev) const;

  /**
   * Logs, with full control.  Never throws.
   *
   * @param sev
   *        Severity.  Sev::S_NONE and Sev::S_END_SENTINEL are ignored.
   * @param message
   *        Message.
   * @param extra
   *        Fields for this call.
   * @param capture_error
   *        Whether to capture the exception being handled, if any, into the Record.
   * @param origin
   *        Call site.
   */
  void log(Sev sev, util::String_view message, Fields extra = Fields(), bool capture_error = false,
           Msg_origin origin = Msg_origin());

  /**
   * Same as log() with the origin given first; this is what the `QUIRE_LOG_*()` macros call.
   *
   * @param origin
   *        See log().
   * @param sev
   *        See log().
   * @param capture_error
   *        See log().
   * @param message
   *        See log().
   * @param extra
   *        See log().
   */
  void log_at(Msg_origin origin, Sev sev, bool capture_error, util::String_view message, Fields extra = Fields());

  /**
   * log() at Sev::S_DEBUG.
   *
   * @param message
   *        See log().
   * @param extra
   *        See log().
   */
  void debug(util::String_view message, Fields extra = Fields());

  /**
   * log() at Sev::S_INFO.
   *
   * @param message
   *        See log().
   * @param extra
   *        See log().
   */
  void info(util::String_view message, Fields extra = Fields());

  /**
   * log() at Sev::S_WARNING.
   *
   * @param message
   *        See log().
   * @param extra
   *        See log().
   */
  void warning(util::String_view message, Fields extra = Fields());

  /**
   * log() at Sev::S_ERROR.
   *
   * @param message
   *        See log().
   * @param extra
   *        See log().
   * @param capture_error
   *        See log().
   */
  void error(util::String_view message, Fields extra = Fields(), bool capture_error = false);

  /**
   * log() at Sev::S_CRITICAL; unlike error(), captures the exception being handled (if any) unless told not to.
   *
   * @param message
   *        See log().
   * @param extra
   *        See log().
   * @param capture_error
   *        See log().
   */
  void critical(util::String_view message, Fields extra = Fields(), bool capture_error = true);

  /**
   * error() with capture: call from a `catch` block.
   *
   * @param message
   *        See log().
   * @param extra
   *        See log().
   */
  void exception(util::String_view message, Fields extra = Fields());

  /**
   * Runs `func()` and logs its timing:
   *   - before: DEBUG `"Starting <operation>"` with `extra`;
   *   - if it returns: INFO `"Completed <operation>"` with `extra` and `duration_ms` (a `double`);
   *   - if it throws: ERROR `"Failed <operation>"` with `extra`, `duration_ms` and the captured exception; then the
   *     very same exception is rethrown.
   *
   * Elapsed time is measured on #Steady_clock.
   *
   * @tparam Func
   *         Callable with no arguments.
   * @param operation
   *        Name of what is timed.
   * @param extra
   *        Fields for all 3 records.
   * @param func
   *        The work.
   * @return Whatever `func()` returns.
   */
  template<typename Func>
  auto measure_time(util::String_view operation, Fields extra, Func&& func) -> decltype(func());

  /**
   * measure_time() without extra fields.
   *
   * @tparam Func
   *         See other overload.
   * @param operation
   *        See other overload.
   * @param func
   *        See other overload.
   * @return See other overload.
   */
  template<typename Func>
  auto measure_time(util::String_view operation, Func&& func) -> decltype(func());

  /// Flushes every handler.  Never throws.
  void flush();

  /**
   * Logger name.
   * @return See above.
   */
  const std::string& name() const;

  /**
   * Least severe Sev processed.
   * @return See above.
   */
  Sev level() const;

  /**
   * The configuration `*this` was built from.
   * @return See above.
   */
  const Logger_config& config() const;

  /**
   * `config().fingerprint()`, computed once.
   * @return See above.
   */
  size_t config_fingerprint() const;

  /**
   * The handlers, in dispatch order.
   * @return See above.
   */
  const std::vector<Handler_ptr>& handlers() const;

  /**
   * The filter pipeline actually in effect (the configured one, plus possibly the default Sensitive_data_filter).
   * @return See above.
   */
  const std::vector<Filter_ptr>& filters() const;

private:
  // Methods.

  /**
   * Computes milliseconds elapsed since `start`.
   *
   * @param start
   *        Start.
   * @return See above.
   */
  static double ms_since(Steady_clock::time_point start);

  /**
   * Writes a one-line "dropped entry" notice to the fallback stream, serialized against concurrent notices.
   *
   * @param message
   *        The message of the entry that was dropped.
   * @param reason
   *        What went wrong.
   */
  void report_dropped(util::String_view message, util::String_view reason);

  // Data.

  /// See config().
  const Logger_config m_config;

  /// See config_fingerprint().
  const size_t m_config_fingerprint;

  /// See ctor.
  Context_store* const m_context_store;

  /// See ctor.
  std::ostream* const m_fallback_os;

  /// Protects writes by report_dropped() to `*m_fallback_os`.
  util::Mutex_non_recursive m_fallback_mutex;

  /// See filters().
  std::vector<Filter_ptr> m_filters;

  /// See handlers().
  std::vector<Handler_ptr> m_handlers;
}; // class Logger

/**
 * Convenience class that simply stores a Logger, to be returned by its get_logger(), which is what the
 * `QUIRE_LOG_*()` macros call.  Derive from it (or keep one as a member and forward get_logger()) to log from a
 * class without passing the Logger around.
 *
 *   ~~~
 *   class Order_service : public quire::log::Log_context
 *   {
 *   public:
 *     Order_service() : Log_context(quire::log::get_logger("svc.orders")) {}
 *     void place() { QUIRE_LOG_INFO("Order placed", {{"items", 3}}); }
 *   };
 *   ~~~
 */
class Log_context
{
public:
  // Constructors/destructor.

  /**
   * Constructs object storing the given Logger.
   *
   * @param logger
   *        Logger, or null (then the macros do nothing).
   */
  explicit Log_context(Logger_ptr logger = Logger_ptr());

  // Methods.

  /**
   * Returns the stored Logger.
   * @return See above.
   */
  Logger* get_logger() const;

  /**
   * Returns the stored Logger, shared.
   * @return See above.
   */
  const Logger_ptr& get_logger_ptr() const;

private:
  // Data.

  /// See ctor.
  Logger_ptr m_logger;
}; // class Log_context

// Template implementations.

template<typename Func>
auto Logger::measure_time(util::String_view operation, Fields extra, Func&& func) -> decltype(func())
{
  using Result = decltype(func());

  log(Sev::S_DEBUG, fmt::format("Starting {}", operation), extra);
  const auto start = Steady_clock::now();
  try
  {
    if constexpr (std::is_void_v<Result>)
    {
      func();
      extra.set("duration_ms", ms_since(start));
      log(Sev::S_INFO, fmt::format("Completed {}", operation), std::move(extra));
    }
    else
    {
      Result result = func();
      extra.set("duration_ms", ms_since(start));
      log(Sev::S_INFO, fmt::format("Completed {}", operation), std::move(extra));
      return static_cast<Result&&>(result);
    }
  }
  catch (...)
  {
    // Logged, then rethrown as-is: nothing is swallowed here.
    extra.set("duration_ms", ms_since(start));
    log(Sev::S_ERROR, fmt::format("Failed {}", operation), std::move(extra), true);
    throw;
  }
} // Logger::measure_time()

template<typename Func>
auto Logger::measure_time(util::String_view operation, Func&& func) -> decltype(func())
{
  return measure_time(operation, Fields(), std::forward<Func>(func));
}

} // namespace quire::log

// Macros.

/**
 * Builds the quire::log::Msg_origin of the call site in which it is expanded.
 */
#define QUIRE_LOG_ORIGIN() \
  ::quire::log::Msg_origin{ std::string(::quire::util::get_path_stem(__FILE__)), __FUNCTION__, \
                            static_cast<unsigned int>(__LINE__) }

/**
 * Logs through `get_logger()` (a quire::log::Logger\*, possibly null) at the given severity, if that Logger's
 * `should_log()` allows; the variadic arguments are the message and, optionally, the extra fields.  The arguments
 * are not evaluated unless logging proceeds.
 *
 *   ~~~
 *   QUIRE_LOG_WITH_CHECKING(quire::log::Sev::S_INFO, false, "Cache warmed", {{"entries", n}});
 *   ~~~
 *
 * @param ARG_sev
 *        quire::log::Sev.
 * @param ARG_capture_error
 *        Whether to capture the exception being handled.
 * @param ...
 *        Message, then optionally quire::log::Fields.
 */
#define QUIRE_LOG_WITH_CHECKING(ARG_sev, ARG_capture_error, ...) \
  QUIRE_UTIL_SEMICOLON_SAFE \
  ( \
    ::quire::log::Logger* const QUIRE_LOG_W_CHK_logger = get_logger(); \
    if (QUIRE_LOG_W_CHK_logger && QUIRE_LOG_W_CHK_logger->should_log(ARG_sev)) \
    { \
      QUIRE_LOG_W_CHK_logger->log_at(QUIRE_LOG_ORIGIN(), ARG_sev, ARG_capture_error, __VA_ARGS__); \
    } \
  )

/**
 * Logs a DEBUG message into `*get_logger()`; see QUIRE_LOG_WITH_CHECKING().
 *
 * @param ...
 *        Message, then optionally quire::log::Fields.
 */
#define QUIRE_LOG_DEBUG(...) \
  QUIRE_LOG_WITH_CHECKING(::quire::log::Sev::S_DEBUG, false, __VA_ARGS__)

/**
 * Logs an INFO message into `*get_logger()`; see QUIRE_LOG_WITH_CHECKING().
 *
 * @param ...
 *        Message, then optionally quire::log::Fields.
 */
#define QUIRE_LOG_INFO(...) \
  QUIRE_LOG_WITH_CHECKING(::quire::log::Sev::S_INFO, false, __VA_ARGS__)

/**
 * Logs a WARNING message into `*get_logger()`; see QUIRE_LOG_WITH_CHECKING().
 *
 * @param ...
 *        Message, then optionally quire::log::Fields.
 */
#define QUIRE_LOG_WARNING(...) \
  QUIRE_LOG_WITH_CHECKING(::quire::log::Sev::S_WARNING, false, __VA_ARGS__)

/**
 * Logs an ERROR message into `*get_logger()`, without exception capture; see QUIRE_LOG_WITH_CHECKING().
 *
 * @param ...
 *        Message, then optionally quire::log::Fields.
 */
#define QUIRE_LOG_ERROR(...) \
  QUIRE_LOG_WITH_CHECKING(::quire::log::Sev::S_ERROR, false, __VA_ARGS__)

/**
 * Logs a CRITICAL message into `*get_logger()`, capturing the exception being handled if any;
 * see QUIRE_LOG_WITH_CHECKING().
 *
 * @param ...
 *        Message, then optionally quire::log::Fields.
 */
#define QUIRE_LOG_CRITICAL(...) \
  QUIRE_LOG_WITH_CHECKING(::quire::log::Sev::S_CRITICAL, true, __VA_ARGS__)

/**
 * Logs an ERROR message into `*get_logger()` capturing the exception being handled; use in a `catch` block.
 * See QUIRE_LOG_WITH_CHECKING().
 *
 * @param ...
 *        Message, then optionally quire::log::Fields.
 */
#define QUIRE_LOG_EXCEPTION(...) \
  QUIRE_LOG_WITH_CHECKING(::quire::log::Sev::S_ERROR, true, __VA_ARGS__)

/**
 * Defines a local `get_logger()` returning the given Logger, so that `QUIRE_LOG_*()` can be used in a free function
 * or a lambda (or to override the one from a Log_context).
 *
 *   ~~~
 *   void handle_request(const quire::log::Logger_ptr& logger)
 *   {
 *     QUIRE_LOG_SET_LOGGER(logger);
 *     QUIRE_LOG_INFO("Handling");
 *   }
 *   ~~~
 *
 * @param ARG_logger_ptr
 *        quire::log::Logger\* or quire::log::Logger_ptr; must remain valid while `get_logger()` is in use.
 */
#define QUIRE_LOG_SET_LOGGER(ARG_logger_ptr) \
  [[maybe_unused]] \
    const auto get_logger \
      = [logger_ptr_copy = static_cast<::quire::log::Logger*>(::boost::get_pointer(ARG_logger_ptr))] \
          () -> ::quire::log::Logger* { return logger_ptr_copy; }

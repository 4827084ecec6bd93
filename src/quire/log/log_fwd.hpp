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

#include "quire/util/util_fwd.hpp"
#include <boost/shared_ptr.hpp>
#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include <iosfwd>
#include <string>

/**
 * Quire module providing the structured logging pipeline.
 *
 * ### Pipeline ###
 * User code calls a Logger (directly, or through the `QUIRE_LOG_*()` macros which also capture the call site).
 * The Logger then, synchronously in the calling thread:
 *   -# merges the calling thread's Context_store frames into one Fields set (innermost frame wins);
 *   -# builds a Record (make_record()), which drops any context/extra key colliding with a reserved name;
 *   -# runs its Filter list in order, any of which may veto the Record or rewrite (e.g., redact) its fields;
 *   -# hands the surviving Record to each Handler, which checks its own threshold, renders the Record via its
 *      Formatter and writes the result to its sink under its own mutex.
 *
 * Filters, formatters and handlers are capability interfaces; new variants are added by implementing
 * Filter::apply(), Formatter::render() or Handler::do_write() and listing them in a Logger_config.  The
 * built-in variants are Level_filter, Sensitive_data_filter; Json_formatter, Console_formatter; Stream_handler,
 * File_handler, Size_rotating_file_handler, Daily_rotating_file_handler.
 *
 * ### Configuration ###
 * A Logger is built from a Logger_config, which is usually obtained from Logger_config::for_environment() (one of
 * 4 presets keyed by Environment).  Logger_registry caches Logger instances by name (and config fingerprint);
 * get_logger() and clear_loggers() operate on the process-wide registry.
 *
 * ### Failure policy ###
 * Configuration-time problems throw error::Runtime_error from Logger construction.  Logging calls themselves never
 * throw: bad fields are dropped, and a failing sink degrades to its fallback stream.
 */
namespace quire::log
{

// Types.

/**
 * @namespace quire::log::fs
 * @brief Short-hand for `namespace boost::filesystem`.
 */
namespace fs = boost::filesystem;

class Field_value;
class Fields;
struct Msg_origin;
struct Error_info;
struct Record;
class Filter;
class Level_filter;
class Sensitive_data_filter;
class Formatter;
class Json_formatter;
class Console_formatter;
class Handler;
class Stream_handler;
class File_handler;
class Size_rotating_file_handler;
class Daily_rotating_file_handler;
class Context_store;
class Context_scope;
struct Handler_spec;
struct Logger_config;
struct Env_settings;
class Logger;
class Log_context;
class Logger_registry;

/// Short-hand for ref-counted pointer to Logger.  Registry entries and user code share ownership this way.
using Logger_ptr = boost::shared_ptr<Logger>;
/// Short-hand for ref-counted pointer to immutable Filter.
using Filter_ptr = boost::shared_ptr<const Filter>;
/// Short-hand for ref-counted pointer to immutable Formatter.
using Formatter_ptr = boost::shared_ptr<const Formatter>;
/// Short-hand for ref-counted pointer to Handler.
using Handler_ptr = boost::shared_ptr<Handler>;

/**
 * Enumeration containing one of several message severity levels, ordered from least to most severe.  The ordering
 * is significant: a level threshold `L` admits exactly the records whose severity compares `>= L`.
 *
 * The `ostream<<` encoding is the upper-case name without the `S_` prefix (e.g., `"WARNING"`); that is also
 * what both built-in formatters print.
 */
enum class Sev : size_t
{
  /**
   * Sentinel meaning "no threshold": never used for an actual record, but as a threshold it admits everything.
   * Also what `istream>>` yields for unrecognized input.
   */
  S_NONE = 0,

  /// Diagnostic detail of interest while developing or debugging.
  S_DEBUG,

  /// Normal, not-"bad" condition worth noting in production.
  S_INFO,

  /// "Bad" condition that the program handles and continues past.
  S_WARNING,

  /// "Bad" condition that failed the operation at hand.
  S_ERROR,

  /// "Bad" condition that threatens the process or the service as a whole.
  S_CRITICAL,

  /// Not an actual value but rather stores the highest numerical payload, useful for validity checks.
  S_END_SENTINEL
}; // enum class Sev

/**
 * Named deployment environment; each selects one configuration preset (Logger_config::for_environment()).
 * The `ostream<<` encoding is the lower-case name (e.g., `"production"`), which is also the value expected in the
 * `ENVIRONMENT` variable.
 */
enum class Environment : size_t
{
  /// Verbose human-readable console output.
  S_DEVELOPMENT = 0,
  /// Console output at WARNING and above only; no color.
  S_TESTING,
  /// JSON to console plus size-rotating JSON file.
  S_STAGING,
  /// JSON to console (WARNING and above) plus daily-rotating JSON file.
  S_PRODUCTION,
  /// Not an actual value; see Sev::S_END_SENTINEL.
  S_END_SENTINEL
}; // enum class Environment

// Free functions.

/**
 * Serializes a log::Sev to a standard output stream: e.g., `"WARNING"` for Sev::S_WARNING.
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Sev val);

/**
 * Returns the name of a log::Sev as written by its `ostream<<`: e.g., `"CRITICAL"`.  Out-of-range values yield
 * `"UNKNOWN"`.
 *
 * @param val
 *        Value.
 * @return Statically stored string.
 */
util::String_view sev_to_string(Sev val);

/**
 * Deserializes a log::Sev from a standard input stream.  Case-insensitive name (`"warning"`, `"Warning"`, ...)
 * or integer encoding are accepted; anything else yields Sev::S_NONE.
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Sev& val);

/**
 * Serializes a log::Environment to a standard output stream: e.g., `"staging"`.
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Environment val);

/**
 * Deserializes a log::Environment from a standard input stream, case-insensitively.  Unrecognized input yields
 * Environment::S_END_SENTINEL (which no preset accepts); use parse_environment() when that distinction matters.
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Environment& val);

/**
 * Maps an environment name (case-insensitive, surrounding whitespace ignored) to Environment.
 *
 * @param name
 *        E.g., `"production"`.
 * @param env
 *        On success set to the result; untouched otherwise.
 * @return `true` if and only if `name` named one of the 4 environments.
 */
bool parse_environment(util::String_view name, Environment* env);

/**
 * Returns the Logger named `name` from the process-wide Logger_registry (Logger_registry::process_registry()),
 * building it, if not yet cached, from the preset selected by the `ENVIRONMENT` and `LOG_DIR` variables
 * (see Env_settings::from_process_env()).
 *
 * @param name
 *        Logger name; dot-separated hierarchy by convention (e.g., `"svc.db"`).
 * @return See above.
 * @throws error::Runtime_error on configuration error (such as an unrecognized `ENVIRONMENT` value or an
 *         unwritable log directory); only possible when a new Logger must be built.
 */
Logger_ptr get_logger(util::String_view name);

/**
 * Like get_logger(util::String_view) but with an explicit configuration; see Logger_registry::get() for the
 * caching rules when a cached instance exists with a different configuration.
 *
 * @param name
 *        See other overload.
 * @param config
 *        Configuration to build from, if a new Logger is needed.  Its `m_name` is overridden by `name`.
 * @return See above.
 * @throws error::Runtime_error on configuration error.
 */
Logger_ptr get_logger(util::String_view name, const Logger_config& config);

/**
 * Like get_logger(util::String_view) but with an explicit environment and log directory instead of the ones from
 * the process environment variables.
 *
 * @param name
 *        See other overload.
 * @param env
 *        Preset to use.
 * @param log_dir
 *        Directory for preset file handlers.
 * @return See above.
 * @throws error::Runtime_error on configuration error.
 */
Logger_ptr get_logger(util::String_view name, Environment env, const std::string& log_dir);

/// Empties the process-wide Logger_registry.  Loggers already handed out remain usable by their holders.
void clear_loggers();

} // namespace quire::log

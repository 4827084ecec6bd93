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

#include "quire/log/filter.hpp"
#include "quire/log/handler.hpp"
#include <vector>

namespace quire::log
{

// Types.

/**
 * Description of one Handler to be built for a Logger: what kind of sink, its threshold, and how entries are
 * rendered.  Plain data; build() turns it into a live Handler.
 *
 * Only the members relevant to #m_kind matter; e.g., #m_path is ignored for Kind::S_STREAM.
 */
struct Handler_spec
{
  // Types.

  /// Sink kind.
  enum class Kind
  {
    /// Stream_handler on #m_stream (or `std::cout`/`std::cerr` per #m_stream_target).
    S_STREAM,
    /// File_handler on #m_path.
    S_FILE,
    /// Size_rotating_file_handler on #m_path with #m_max_bytes and #m_backup_count.
    S_SIZE_ROTATING_FILE,
    /// Daily_rotating_file_handler on #m_path with #m_backup_count.
    S_DAILY_ROTATING_FILE,
    /// Whatever #m_factory returns; the other members are ignored.
    S_CUSTOM
  };

  /// Built-in formatter choice.
  enum class Format
  {
    /// Json_formatter.
    S_JSON,
    /// Console_formatter.
    S_CONSOLE
  };

  /// Whether Console_formatter colors the level.
  enum class Color_mode
  {
    /// Colors if and only if the target is `std::cout`/`std::cerr` and that is a terminal.
    S_AUTO,
    /// Always.
    S_ALWAYS,
    /// Never.
    S_NEVER
  };

  /// Standard stream used by Kind::S_STREAM when #m_stream is null.
  enum class Stream_target
  {
    /// `std::cout`.
    S_STDOUT,
    /// `std::cerr`.
    S_STDERR
  };

  /// Builds a custom Handler; see Kind::S_CUSTOM.
  using Factory = Function<Handler_ptr ()>;

  // Data.

  /// Sink kind.
  Kind m_kind = Kind::S_STREAM;

  /// Handler threshold; see Handler::threshold().
  Sev m_threshold = Sev::S_NONE;

  /// Built-in formatter, unless #m_formatter is set.
  Format m_format = Format::S_CONSOLE;

  /// If not null, used instead of the built-in formatter selected by #m_format.
  Formatter_ptr m_formatter;

  /// See Color_mode.
  Color_mode m_color_mode = Color_mode::S_AUTO;

  /// See Stream_target.
  Stream_target m_stream_target = Stream_target::S_STDOUT;

  /// If not null, Kind::S_STREAM writes here (must outlive the Handler).
  std::ostream* m_stream = nullptr;

  /// File for the file kinds.
  fs::path m_path;

  /// Size limit for Kind::S_SIZE_ROTATING_FILE.
  uintmax_t m_max_bytes = 0;

  /// Backups kept by the rotating kinds.
  unsigned int m_backup_count = 0;

  /// See Kind::S_CUSTOM.
  Factory m_factory;

  // Methods.

  /**
   * Builds the handler.
   *
   * @param fallback_os
   *        Fallback stream for the handler; see Handler.
   * @return The handler.  Not null.
   * @throws error::Runtime_error with error::Code::S_INVALID_HANDLER_SPEC if the spec is inconsistent (file kind
   *         with empty path; custom kind with no factory, or whose factory returns null), or with
   *         error::Code::S_LOG_PATH_UNWRITABLE if a file cannot be opened.
   */
  Handler_ptr build(std::ostream* fallback_os = &std::cerr) const;

  /**
   * Hash of the members relevant to #m_kind.  Explicit formatters count by identity (address), custom factories by
   * target type.
   *
   * @return See above.
   */
  size_t fingerprint() const;

  /**
   * Convenience: spec for a Stream_handler on a standard stream.
   *
   * @param threshold
   *        See #m_threshold.
   * @param format
   *        See #m_format.
   * @param color_mode
   *        See #m_color_mode.
   * @param target
   *        See #m_stream_target.
   * @return See above.
   */
  static Handler_spec stream(Sev threshold, Format format, Color_mode color_mode = Color_mode::S_AUTO,
                             Stream_target target = Stream_target::S_STDOUT);

  /**
   * Convenience: spec for a Size_rotating_file_handler.
   *
   * @param threshold
   *        See #m_threshold.
   * @param format
   *        See #m_format.
   * @param path
   *        See #m_path.
   * @param max_bytes
   *        See #m_max_bytes.
   * @param backup_count
   *        See #m_backup_count.
   * @return See above.
   */
  static Handler_spec size_rotating_file(Sev threshold, Format format, const fs::path& path,
                                         uintmax_t max_bytes, unsigned int backup_count);

  /**
   * Convenience: spec for a Daily_rotating_file_handler.
   *
   * @param threshold
   *        See #m_threshold.
   * @param format
   *        See #m_format.
   * @param path
   *        See #m_path.
   * @param backup_count
   *        See #m_backup_count.
   * @return See above.
   */
  static Handler_spec daily_rotating_file(Sev threshold, Format format, const fs::path& path,
                                          unsigned int backup_count);

  /**
   * Convenience: spec for a custom handler.
   *
   * @param factory
   *        See #m_factory.
   * @return See above.
   */
  static Handler_spec custom(Factory factory);
}; // struct Handler_spec

/**
 * Everything needed to build a Logger: its name, level, handlers and filter pipeline.  Usually obtained from
 * for_environment() and possibly tweaked.
 *
 * The Logger applies #m_level itself (before building a Record), then runs #m_filters in order.  Presets list a
 * Level_filter first anyway, so the pipeline is self-describing.
 */
struct Logger_config
{
  // Constants.

  /// Size limit of the staging preset's rotating file: 10 MiB.
  static constexpr uintmax_t S_STAGING_MAX_BYTES = 10 * 1024 * 1024;

  /// Backups kept by the staging preset.
  static constexpr unsigned int S_STAGING_BACKUP_COUNT = 5;

  /// Days of backups kept by the production preset.
  static constexpr unsigned int S_PRODUCTION_BACKUP_DAYS = 30;

  // Data.

  /// Logger name.
  std::string m_name;

  /// Least severe Sev the Logger processes at all.
  Sev m_level = Sev::S_INFO;

  /// Preset this came from; informational.
  Environment m_environment = Environment::S_DEVELOPMENT;

  /// Handlers, in dispatch order.
  std::vector<Handler_spec> m_handlers;

  /// Filter pipeline, in order.  Nulls are a configuration error.
  std::vector<Filter_ptr> m_filters;

  // Methods.

  /**
   * Content hash over all the above (except #m_environment), used by Logger_registry to decide whether a cached
   * Logger matches a requested config.
   *
   * @return See above.
   */
  size_t fingerprint() const;

  /**
   * The preset for the given environment:
   *
   * | env         | level   | handlers                                                                      |
   * |-------------|---------|-------------------------------------------------------------------------------|
   * | development | DEBUG   | stdout, console format, color if terminal                                     |
   * | testing     | WARNING | stdout, console format, no color                                              |
   * | staging     | INFO    | stdout JSON; `<log_dir>/<name>.log` JSON, rotating at 10 MiB, 5 backups      |
   * | production  | INFO    | stdout JSON at WARNING; `<log_dir>/<name>.log` JSON, daily, 30 days of backups |
   *
   * Filters, always: Level_filter at the level, then Sensitive_data_filter.
   *
   * @param name
   *        Logger name.
   * @param env
   *        Environment.
   * @param log_dir
   *        Directory for file handlers.
   * @return See above.
   * @throws error::Runtime_error with error::Code::S_UNKNOWN_ENVIRONMENT if `env` is not a valid value.
   */
  static Logger_config for_environment(util::String_view name, Environment env, const fs::path& log_dir);

  /**
   * Like the other for_environment() but taking the environment by name (see parse_environment()).
   *
   * @param name
   *        Logger name.
   * @param env_name
   *        E.g., `"staging"`.
   * @param log_dir
   *        Directory for file handlers.
   * @return See above.
   * @throws error::Runtime_error with error::Code::S_UNKNOWN_ENVIRONMENT if `env_name` names no environment.
   */
  static Logger_config for_environment(util::String_view name, util::String_view env_name,
                                       const fs::path& log_dir);
}; // struct Logger_config

/// Settings taken from process environment variables.
struct Env_settings
{
  // Constants.

  /// Variable selecting the Environment.
  static const std::string S_ENVIRONMENT_VAR;

  /// Variable giving the log directory.
  static const std::string S_LOG_DIR_VAR;

  /// Log directory when #S_LOG_DIR_VAR is unset.
  static const std::string S_DEFAULT_LOG_DIR;

  // Data.

  /// From `ENVIRONMENT`; Environment::S_DEVELOPMENT if unset or empty.
  Environment m_environment = Environment::S_DEVELOPMENT;

  /// From `LOG_DIR`; #S_DEFAULT_LOG_DIR if unset or empty.
  fs::path m_log_dir = S_DEFAULT_LOG_DIR;

  // Methods.

  /**
   * Reads the settings from the process environment.
   *
   * @return See above.
   * @throws error::Runtime_error with error::Code::S_UNKNOWN_ENVIRONMENT if `ENVIRONMENT` is set to a non-empty
   *         value naming no environment.
   */
  static Env_settings from_process_env();
}; // struct Env_settings

} // namespace quire::log

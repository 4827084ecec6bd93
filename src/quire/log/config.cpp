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
#include "quire/log/config.hpp"
#include "quire/log/file_handler.hpp"
#include "quire/log/error/error.hpp"
#include "quire/error/error.hpp"
#include "quire/util/fmt.hpp"
#include <boost/program_options.hpp>
#include <boost/functional/hash.hpp>
#include <boost/make_shared.hpp>
#include <iostream>
#include <unistd.h>

namespace quire::log
{

namespace
{

/**
 * Returns `true` if `os` is `std::cout` or `std::cerr` and the corresponding descriptor is a terminal.
 *
 * @param os
 *        Stream.
 * @return See above.
 */
bool is_terminal(const std::ostream& os)
{
  if (&os == &std::cout)
  {
    return ::isatty(STDOUT_FILENO) == 1;
  }
  if ((&os == &std::cerr) || (&os == &std::clog))
  {
    return ::isatty(STDERR_FILENO) == 1;
  }
  return false;
}

} // namespace (anon)

// Handler_spec implementations.

Handler_ptr Handler_spec::build(std::ostream* fallback_os) const
{

  if (m_kind == Kind::S_CUSTOM)
  {
    if (!m_factory)
    {
      throw error::Runtime_error(error::Code::S_INVALID_HANDLER_SPEC, "custom handler without factory");
    }
    auto handler = m_factory();
    if (!handler)
    {
      throw error::Runtime_error(error::Code::S_INVALID_HANDLER_SPEC, "custom handler factory returned null");
    }
    return handler;
  }
  // else

  std::ostream& os = m_stream
                       ? *m_stream
                       : ((m_stream_target == Stream_target::S_STDERR) ? std::cerr : std::cout);

  Formatter_ptr formatter = m_formatter;
  if (!formatter)
  {
    if (m_format == Format::S_JSON)
    {
      formatter = boost::make_shared<Json_formatter>();
    }
    else
    {
      // Color only makes sense on a console stream; file kinds never get it in auto mode.
      const bool use_colors = (m_color_mode == Color_mode::S_ALWAYS)
                              || ((m_color_mode == Color_mode::S_AUTO) && (m_kind == Kind::S_STREAM)
                                  && is_terminal(os));
      formatter = boost::make_shared<Console_formatter>(use_colors);
    }
  }

  if ((m_kind != Kind::S_STREAM) && m_path.empty())
  {
    throw error::Runtime_error(error::Code::S_INVALID_HANDLER_SPEC, "file handler without path");
  }

  switch (m_kind)
  {
  case Kind::S_STREAM:
    return boost::make_shared<Stream_handler>(m_threshold, formatter, os, fallback_os);
  case Kind::S_FILE:
    return boost::make_shared<File_handler>(m_threshold, formatter, m_path, fallback_os);
  case Kind::S_SIZE_ROTATING_FILE:
    return boost::make_shared<Size_rotating_file_handler>(m_threshold, formatter, m_path, m_max_bytes, m_backup_count,
                                                   fallback_os);
  case Kind::S_DAILY_ROTATING_FILE:
    return boost::make_shared<Daily_rotating_file_handler>(m_threshold, formatter, m_path, m_backup_count, fallback_os);
  case Kind::S_CUSTOM:
    break; // Handled above.
  }
  throw error::Runtime_error(error::Code::S_INVALID_HANDLER_SPEC, "unknown handler kind");
} // Handler_spec::build()

size_t Handler_spec::fingerprint() const
{
  using boost::hash_combine;

  size_t seed = 0;
  hash_combine(seed, static_cast<int>(m_kind));
  hash_combine(seed, static_cast<size_t>(m_threshold));
  if (m_kind == Kind::S_CUSTOM)
  {
    hash_combine(seed, m_factory ? m_factory.target_type().hash_code() : 0);
    return seed;
  }
  // else

  hash_combine(seed, static_cast<int>(m_format));
  hash_combine(seed, static_cast<const void*>(m_formatter.get()));
  hash_combine(seed, static_cast<int>(m_color_mode));
  if (m_kind == Kind::S_STREAM)
  {
    hash_combine(seed, static_cast<int>(m_stream_target));
    hash_combine(seed, static_cast<const void*>(m_stream));
    return seed;
  }
  // else

  hash_combine(seed, m_path.string());
  hash_combine(seed, m_max_bytes);
  hash_combine(seed, m_backup_count);
  return seed;
} // Handler_spec::fingerprint()

Handler_spec Handler_spec::stream(Sev threshold, Format format, Color_mode color_mode,
                                  Stream_target target) // Static.
{
  Handler_spec spec;
  spec.m_kind = Kind::S_STREAM;
  spec.m_threshold = threshold;
  spec.m_format = format;
  spec.m_color_mode = color_mode;
  spec.m_stream_target = target;
  return spec;
}

Handler_spec Handler_spec::size_rotating_file(Sev threshold, Format format, const fs::path& path,
                                              uintmax_t max_bytes, unsigned int backup_count) // Static.
{
  Handler_spec spec;
  spec.m_kind = Kind::S_SIZE_ROTATING_FILE;
  spec.m_threshold = threshold;
  spec.m_format = format;
  spec.m_path = path;
  spec.m_max_bytes = max_bytes;
  spec.m_backup_count = backup_count;
  return spec;
}

Handler_spec Handler_spec::daily_rotating_file(Sev threshold, Format format, const fs::path& path,
                                               unsigned int backup_count) // Static.
{
  Handler_spec spec;
  spec.m_kind = Kind::S_DAILY_ROTATING_FILE;
  spec.m_threshold = threshold;
  spec.m_format = format;
  spec.m_path = path;
  spec.m_backup_count = backup_count;
  return spec;
}

Handler_spec Handler_spec::custom(Factory factory) // Static.
{
  Handler_spec spec;
  spec.m_kind = Kind::S_CUSTOM;
  spec.m_factory = std::move(factory);
  return spec;
}

// Logger_config implementations.

size_t Logger_config::fingerprint() const
{
  using boost::hash_combine;

  size_t seed = 0;
  hash_combine(seed, m_name);
  hash_combine(seed, static_cast<size_t>(m_level));
  for (const auto& spec : m_handlers)
  {
    hash_combine(seed, spec.fingerprint());
  }
  for (const auto& filter : m_filters)
  {
    hash_combine(seed, filter ? filter->fingerprint() : 0);
  }
  return seed;
}

Logger_config Logger_config::for_environment(util::String_view name, Environment env,
                                             const fs::path& log_dir) // Static.
{
  using Format = Handler_spec::Format;
  using Color_mode = Handler_spec::Color_mode;

  Logger_config config;
  config.m_name = name;
  config.m_environment = env;

  const auto log_path = log_dir / (std::string(name) + ".log");

  switch (env)
  {
  case Environment::S_DEVELOPMENT:
    config.m_level = Sev::S_DEBUG;
    config.m_handlers.push_back(Handler_spec::stream(Sev::S_DEBUG, Format::S_CONSOLE, Color_mode::S_AUTO));
    break;
  case Environment::S_TESTING:
    config.m_level = Sev::S_WARNING;
    config.m_handlers.push_back(Handler_spec::stream(Sev::S_WARNING, Format::S_CONSOLE, Color_mode::S_NEVER));
    break;
  case Environment::S_STAGING:
    config.m_level = Sev::S_INFO;
    config.m_handlers.push_back(Handler_spec::stream(Sev::S_INFO, Format::S_JSON));
    config.m_handlers.push_back(Handler_spec::size_rotating_file(Sev::S_INFO, Format::S_JSON, log_path,
                                                                 S_STAGING_MAX_BYTES, S_STAGING_BACKUP_COUNT));
    break;
  case Environment::S_PRODUCTION:
    config.m_level = Sev::S_INFO;
    config.m_handlers.push_back(Handler_spec::stream(Sev::S_WARNING, Format::S_JSON));
    config.m_handlers.push_back(Handler_spec::daily_rotating_file(Sev::S_INFO, Format::S_JSON, log_path,
                                                                  S_PRODUCTION_BACKUP_DAYS));
    break;
  case Environment::S_END_SENTINEL:
    throw error::Runtime_error(error::Code::S_UNKNOWN_ENVIRONMENT, "(sentinel)");
  }

  config.m_filters.push_back(boost::make_shared<Level_filter>(config.m_level));
  config.m_filters.push_back(boost::make_shared<Sensitive_data_filter>());
  return config;
} // Logger_config::for_environment()

Logger_config Logger_config::for_environment(util::String_view name, util::String_view env_name,
                                             const fs::path& log_dir) // Static.
{
  Environment env;
  if (!parse_environment(env_name, &env))
  {
    throw error::Runtime_error(error::Code::S_UNKNOWN_ENVIRONMENT, env_name);
  }
  return for_environment(name, env, log_dir);
}

// Env_settings implementations.

// Static initializations.

const std::string Env_settings::S_ENVIRONMENT_VAR = "ENVIRONMENT";
const std::string Env_settings::S_LOG_DIR_VAR = "LOG_DIR";
const std::string Env_settings::S_DEFAULT_LOG_DIR = "logs";

Env_settings Env_settings::from_process_env() // Static.
{
  namespace opts = boost::program_options;
  using std::string;

  string env_name;
  string log_dir;

  opts::options_description desc;
  desc.add_options()
    ("environment", opts::value<string>(&env_name))
    ("log-dir", opts::value<string>(&log_dir));

  // Only our 2 variables get a non-empty option name; everything else in the environment is skipped.
  const auto var_to_option = [](const string& var) -> string
  {
    if (var == S_ENVIRONMENT_VAR)
    {
      return "environment";
    }
    if (var == S_LOG_DIR_VAR)
    {
      return "log-dir";
    }
    return string();
  };

  opts::variables_map vars;
  try
  {
    opts::store(opts::parse_environment(desc, var_to_option), vars);
    opts::notify(vars);
  }
  catch (const opts::error& exc)
  {
    throw error::Runtime_error(error::Code::S_UNKNOWN_ENVIRONMENT, exc.what());
  }

  Env_settings settings;
  if (!env_name.empty())
  {
    if (!parse_environment(env_name, &settings.m_environment))
    {
      throw error::Runtime_error(error::Code::S_UNKNOWN_ENVIRONMENT,
                                 fmt::format("{}={}", S_ENVIRONMENT_VAR, env_name));
    }
  }
  if (!log_dir.empty())
  {
    settings.m_log_dir = log_dir;
  }
  return settings;
} // Env_settings::from_process_env()

} // namespace quire::log

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
#include "quire/log/logger_registry.hpp"
#include <boost/make_shared.hpp>

namespace quire::log
{

// Logger_registry implementations.

Logger_registry::Logger_registry(Context_store* context_store, std::ostream* fallback_os) :
  m_context_store(context_store),
  m_fallback_os(fallback_os)
{
  // Nothing.
}

Logger_ptr Logger_registry::get(util::String_view name)
{
  util::Lock_guard<util::Mutex_non_recursive> lock(m_mutex);

  const std::string name_str(name);
  const auto it = m_loggers.find(name_str);
  if (it != m_loggers.end())
  {
    return it->second;
  }
  // else

  const auto settings = Env_settings::from_process_env();
  auto logger = build(Logger_config::for_environment(name, settings.m_environment, settings.m_log_dir));
  m_loggers.emplace(name_str, logger);
  return logger;
}

Logger_ptr Logger_registry::get(util::String_view name, const Logger_config& config)
{
  auto named_config = config;
  named_config.m_name = name;
  const auto fingerprint = named_config.fingerprint();

  util::Lock_guard<util::Mutex_non_recursive> lock(m_mutex);

  auto& entry = m_loggers[named_config.m_name];
  if ((!entry) || (entry->config_fingerprint() != fingerprint))
  {
    try
    {
      entry = build(named_config);
    }
    catch (const std::exception&)
    {
      if (!entry)
      {
        m_loggers.erase(named_config.m_name); // Don't leave the null placeholder behind.
      }
      throw;
    }
  }
  return entry;
}

Logger_ptr Logger_registry::get(util::String_view name, Environment env, const fs::path& log_dir)
{
  return get(name, Logger_config::for_environment(name, env, log_dir));
}

void Logger_registry::clear()
{
  util::Lock_guard<util::Mutex_non_recursive> lock(m_mutex);
  m_loggers.clear();
}

size_t Logger_registry::size() const
{
  util::Lock_guard<util::Mutex_non_recursive> lock(m_mutex);
  return m_loggers.size();
}

bool Logger_registry::contains(util::String_view name) const
{
  util::Lock_guard<util::Mutex_non_recursive> lock(m_mutex);
  return m_loggers.find(std::string(name)) != m_loggers.end();
}

Logger_ptr Logger_registry::build(const Logger_config& config) const
{
  return boost::make_shared<Logger>(config, m_context_store, m_fallback_os);
}

Logger_registry* Logger_registry::process_registry() // Static.
{
  static Logger_registry s_process_registry;
  return &s_process_registry;
}

// Free function implementations.

Logger_ptr get_logger(util::String_view name)
{
  return Logger_registry::process_registry()->get(name);
}

Logger_ptr get_logger(util::String_view name, const Logger_config& config)
{
  return Logger_registry::process_registry()->get(name, config);
}

Logger_ptr get_logger(util::String_view name, Environment env, const std::string& log_dir)
{
  return Logger_registry::process_registry()->get(name, env, fs::path(log_dir));
}

void clear_loggers()
{
  Logger_registry::process_registry()->clear();
}

} // namespace quire::log

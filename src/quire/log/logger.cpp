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
#include "quire/log/logger.hpp"
#include "quire/log/error/error.hpp"
#include "quire/error/error.hpp"
#include <boost/make_shared.hpp>

namespace quire::log
{

// Logger implementations.

Logger::Logger(const Logger_config& config, Context_store* context_store, std::ostream* fallback_os) :
  m_config(config),
  m_config_fingerprint(m_config.fingerprint()),
  m_context_store(context_store),
  m_fallback_os(fallback_os),
  m_filters(m_config.m_filters)
{
  bool has_redaction = false;
  for (const auto& filter : m_filters)
  {
    if (!filter)
    {
      throw error::Runtime_error(error::Code::S_NULL_FILTER, m_config.m_name);
    }
    has_redaction = has_redaction || (dynamic_cast<const Sensitive_data_filter*>(filter.get()) != nullptr);
  }
  if (!has_redaction)
  {
    m_filters.push_back(boost::make_shared<Sensitive_data_filter>());
  }

  // Any of these may throw; already-built handlers are released on the way out.
  m_handlers.reserve(m_config.m_handlers.size());
  for (const auto& spec : m_config.m_handlers)
  {
    m_handlers.push_back(spec.build(m_fallback_os));
  }
} // Logger::Logger()

Logger::~Logger()
{
  flush();
}

bool Logger::should_log(Sev sev) const
{
  return (sev != Sev::S_NONE) && (sev < Sev::S_END_SENTINEL) && (sev >= m_config.m_level);
}

void Logger::log(Sev sev, util::String_view message, Fields extra, bool capture_error, Msg_origin origin)
{
  if (!should_log(sev))
  {
    return;
  }
  // else

  try
  {
    auto record = make_record(sev, m_config.m_name, message, std::move(origin),
                              m_context_store->current_merged(), std::move(extra), capture_error);

    for (const auto& filter : m_filters)
    {
      if (!filter->apply(&record))
      {
        return;
      }
    }

    for (const auto& handler : m_handlers)
    {
      handler->handle(record); // Never throws.
    }
  }
  catch (const std::exception& exc)
  {
    // A filter (probably user-supplied) threw, or we ran out of memory.  Either way: report, drop, carry on.
    report_dropped(message, exc.what());
  }
  catch (...)
  {
    report_dropped(message, "unknown exception");
  }
} // Logger::log()

void Logger::report_dropped(util::String_view message, util::String_view reason)
{
  util::Lock_guard<util::Mutex_non_recursive> lock(m_fallback_mutex);
  *m_fallback_os << "quire: Logger [" << m_config.m_name << "]: Dropped entry [" << message << "] ("
                 << reason << ")." << std::endl;
}

void Logger::log_at(Msg_origin origin, Sev sev, bool capture_error, util::String_view message, Fields extra)
{
  log(sev, message, std::move(extra), capture_error, std::move(origin));
}

void Logger::debug(util::String_view message, Fields extra)
{
  log(Sev::S_DEBUG, message, std::move(extra));
}

void Logger::info(util::String_view message, Fields extra)
{
  log(Sev::S_INFO, message, std::move(extra));
}

void Logger::warning(util::String_view message, Fields extra)
{
  log(Sev::S_WARNING, message, std::move(extra));
}

void Logger::error(util::String_view message, Fields extra, bool capture_error)
{
  log(Sev::S_ERROR, message, std::move(extra), capture_error);
}

void Logger::critical(util::String_view message, Fields extra, bool capture_error)
{
  log(Sev::S_CRITICAL, message, std::move(extra), capture_error);
}

void Logger::exception(util::String_view message, Fields extra)
{
  log(Sev::S_ERROR, message, std::move(extra), true);
}

void Logger::flush()
{
  for (const auto& handler : m_handlers)
  {
    handler->flush();
  }
}

double Logger::ms_since(Steady_clock::time_point start) // Static.
{
  return boost::chrono::duration<double, boost::milli>(Steady_clock::now() - start).count();
}

const std::string& Logger::name() const
{
  return m_config.m_name;
}

Sev Logger::level() const
{
  return m_config.m_level;
}

const Logger_config& Logger::config() const
{
  return m_config;
}

size_t Logger::config_fingerprint() const
{
  return m_config_fingerprint;
}

const std::vector<Handler_ptr>& Logger::handlers() const
{
  return m_handlers;
}

const std::vector<Filter_ptr>& Logger::filters() const
{
  return m_filters;
}

// Log_context implementations.

Log_context::Log_context(Logger_ptr logger) :
  m_logger(std::move(logger))
{
  // Nothing.
}

Logger* Log_context::get_logger() const
{
  return m_logger.get();
}

const Logger_ptr& Log_context::get_logger_ptr() const
{
  return m_logger;
}

} // namespace quire::log

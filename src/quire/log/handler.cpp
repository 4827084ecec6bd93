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
#include "quire/log/handler.hpp"
#include "quire/util/fmt.hpp"
#include <boost/system/error_code.hpp>

namespace quire::log
{

// Handler implementations.

Handler::Handler(Sev threshold, Formatter_ptr formatter, std::ostream* fallback_os) :
  m_threshold(threshold),
  m_formatter(std::move(formatter)),
  m_fallback_os(fallback_os)
{
  // Nothing.
}

Handler::~Handler() = default;

bool Handler::should_handle(Sev sev) const
{
  return sev >= m_threshold;
}

void Handler::handle(const Record& record)
{
  using util::Lock_guard;
  using util::Mutex_non_recursive;

  if (!should_handle(record.m_sev))
  {
    return;
  }
  // else

  std::string entry;
  try
  {
    entry = m_formatter->render(record);
  }
  catch (const std::exception& exc)
  {
    Lock_guard<Mutex_non_recursive> lock(m_mutex);
    report_problem(fmt::format("Formatter failed ({}); dropping entry [{}].", exc.what(), record.m_message));
    return;
  }
  catch (...)
  {
    Lock_guard<Mutex_non_recursive> lock(m_mutex);
    report_problem(fmt::format("Formatter failed (unknown exception); dropping entry [{}].", record.m_message));
    return;
  }
  entry.push_back('\n');

  Lock_guard<Mutex_non_recursive> lock(m_mutex);

  Error_code err_code;
  try
  {
    do_write(entry, &err_code);
  }
  catch (const std::exception& exc)
  {
    err_code = boost::system::errc::make_error_code(boost::system::errc::io_error);
    report_problem(fmt::format("Sink threw ({}).", exc.what()));
  }
  catch (...)
  {
    err_code = boost::system::errc::make_error_code(boost::system::errc::io_error);
    report_problem("Sink threw (unknown exception).");
  }

  if (err_code)
  {
    report_problem(fmt::format("Write failed ({}); entry follows.", err_code.message()));
    *m_fallback_os << entry << std::flush;
  }
} // Handler::handle()

void Handler::flush()
{
  util::Lock_guard<util::Mutex_non_recursive> lock(m_mutex);

  Error_code err_code;
  try
  {
    do_flush(&err_code);
  }
  catch (const std::exception& exc)
  {
    report_problem(fmt::format("Flush threw ({}).", exc.what()));
    return;
  }
  catch (...)
  {
    report_problem("Flush threw (unknown exception).");
    return;
  }
  if (err_code)
  {
    report_problem(fmt::format("Flush failed ({}).", err_code.message()));
  }
}

void Handler::do_flush(Error_code*) // Virtual.
{
  // Nothing to flush by default.
}

void Handler::report_problem(util::String_view problem)
{
  *m_fallback_os << "quire: " << description() << ": " << problem << std::endl;
}

Sev Handler::threshold() const
{
  return m_threshold;
}

const Formatter_ptr& Handler::formatter() const
{
  return m_formatter;
}

// Stream_handler implementations.

Stream_handler::Stream_handler(Sev threshold, Formatter_ptr formatter, std::ostream& os, std::ostream* fallback_os) :
  Handler(threshold, std::move(formatter), fallback_os),
  m_os(os)
{
  // Nothing.
}

void Stream_handler::do_write(util::String_view entry, Error_code* err_code) // Virtual.
{
  m_os << entry << std::flush;
  if (!m_os)
  {
    m_os.clear();
    *err_code = boost::system::errc::make_error_code(boost::system::errc::io_error);
  }
}

void Stream_handler::do_flush(Error_code* err_code) // Virtual.
{
  m_os.flush();
  if (!m_os)
  {
    m_os.clear();
    *err_code = boost::system::errc::make_error_code(boost::system::errc::io_error);
  }
}

std::string Stream_handler::description() const // Virtual.
{
  return "Stream_handler";
}

} // namespace quire::log

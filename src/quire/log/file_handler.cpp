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
#include "quire/log/file_handler.hpp"
#include "quire/log/error/error.hpp"
#include "quire/error/error.hpp"
#include "quire/util/fmt.hpp"
#include <boost/system/error_code.hpp>
#include <algorithm>
#include <ctime>
#include <cctype>

namespace quire::log
{

// File_handler implementations.

File_handler::File_handler(Sev threshold, Formatter_ptr formatter, const fs::path& path, std::ostream* fallback_os) :
  Handler(threshold, std::move(formatter), fallback_os),
  m_path(path),
  m_size(0)
{
  Error_code err_code;
  open(false, &err_code);
  if (err_code)
  {
    throw error::Runtime_error(error::Code::S_LOG_PATH_UNWRITABLE,
                               fmt::format("{} ({})", m_path.string(), err_code.message()));
  }
}

File_handler::~File_handler() // Virtual.
{
  close();
}

void File_handler::open(bool truncate, Error_code* err_code)
{
  const auto parent = m_path.parent_path();
  if (!parent.empty())
  {
    fs::create_directories(parent, *err_code);
    if (*err_code)
    {
      return;
    }
  }

  m_ofs.clear();
  m_ofs.open(m_path, truncate ? (std::ios_base::out | std::ios_base::trunc)
                              : (std::ios_base::out | std::ios_base::app));
  if (!m_ofs)
  {
    *err_code = boost::system::errc::make_error_code(boost::system::errc::permission_denied);
    return;
  }
  // else

  Error_code size_err_code;
  const auto size = fs::file_size(m_path, size_err_code);
  m_size = size_err_code ? 0 : size;
} // File_handler::open()

bool File_handler::reopen(bool truncate)
{
  close();

  Error_code err_code;
  open(truncate, &err_code);
  if (err_code)
  {
    report_problem(fmt::format("Could not open ({}).  Will retry on next write.", err_code.message()));
    return false;
  }
  return true;
}

void File_handler::close()
{
  if (m_ofs.is_open())
  {
    m_ofs.flush();
    m_ofs.close();
  }
}

void File_handler::before_write(size_t) // Virtual.
{
  // No rotation by default.
}

void File_handler::do_write(util::String_view entry, Error_code* err_code) // Virtual.
{
  before_write(entry.size());

  if ((!m_ofs.is_open()) || (!m_ofs))
  {
    // Bad state from a previous op (or a failed rotation); try to get back on our feet before giving up on this one.
    if (!reopen())
    {
      *err_code = boost::system::errc::make_error_code(boost::system::errc::io_error);
      return;
    }
  }

  m_ofs.write(entry.data(), entry.size());
  m_ofs.flush();
  if (!m_ofs)
  {
    // Leave the stream bad: next write will reopen.
    *err_code = boost::system::errc::make_error_code(boost::system::errc::io_error);
    return;
  }
  m_size += entry.size();
} // File_handler::do_write()

void File_handler::do_flush(Error_code* err_code) // Virtual.
{
  if (m_ofs.is_open())
  {
    m_ofs.flush();
    if (!m_ofs)
    {
      *err_code = boost::system::errc::make_error_code(boost::system::errc::io_error);
    }
  }
}

void File_handler::rotate_to(const fs::path& target)
{
  close();

  Error_code err_code;
  fs::rename(m_path, target, err_code); // Replaces target if it exists.
  if (err_code)
  {
    report_problem(fmt::format("Could not rotate to [{}] ({}); continuing in current file.",
                               target.string(), err_code.message()));
  }
  reopen();
}

uintmax_t File_handler::current_size() const
{
  return m_size;
}

const fs::path& File_handler::path() const
{
  return m_path;
}

std::string File_handler::description() const // Virtual.
{
  return fmt::format("File_handler @ [{}]", m_path.string());
}

// Size_rotating_file_handler implementations.

Size_rotating_file_handler::Size_rotating_file_handler(Sev threshold, Formatter_ptr formatter, const fs::path& path,
                                                       uintmax_t max_bytes, unsigned int backup_count,
                                                       std::ostream* fallback_os) :
  File_handler(threshold, std::move(formatter), path, fallback_os),
  m_max_bytes(max_bytes),
  m_backup_count(backup_count)
{
  // Nothing.
}

void Size_rotating_file_handler::before_write(size_t entry_size) // Virtual.
{
  if ((m_max_bytes != 0) && (current_size() != 0) && ((current_size() + entry_size) > m_max_bytes))
  {
    rotate();
  }
}

void Size_rotating_file_handler::rotate()
{
  if (m_backup_count == 0)
  {
    reopen(true);
    return;
  }
  // else

  Error_code err_code;
  fs::remove(backup_path(m_backup_count), err_code);
  if (err_code)
  {
    report_problem(fmt::format("Could not remove oldest backup ({}).", err_code.message()));
  }

  for (auto idx = m_backup_count - 1; idx >= 1; --idx)
  {
    const auto src = backup_path(idx);
    if (fs::exists(src, err_code))
    {
      fs::rename(src, backup_path(idx + 1), err_code);
      if (err_code)
      {
        report_problem(fmt::format("Could not shift backup [{}] ({}).", src.string(), err_code.message()));
      }
    }
  }

  rotate_to(backup_path(1));
} // Size_rotating_file_handler::rotate()

fs::path Size_rotating_file_handler::backup_path(unsigned int idx) const
{
  return fs::path(path().string() + '.' + std::to_string(idx));
}

std::string Size_rotating_file_handler::description() const // Virtual.
{
  return fmt::format("Size_rotating_file_handler @ [{}]", path().string());
}

// Daily_rotating_file_handler implementations.

Daily_rotating_file_handler::Daily_rotating_file_handler(Sev threshold, Formatter_ptr formatter,
                                                         const fs::path& path, unsigned int backup_count,
                                                         std::ostream* fallback_os, Now_func now_func) :
  File_handler(threshold, std::move(formatter), path, fallback_os),
  m_backup_count(backup_count),
  m_now_func(now_func ? std::move(now_func) : Now_func([]() { return Clock::now(); }))
{
  // A non-empty pre-existing file holds entries from when it was last written, which may be an earlier day.
  auto period_start = m_now_func();
  if (current_size() != 0)
  {
    Error_code err_code;
    const auto mtime = fs::last_write_time(this->path(), err_code);
    if (!err_code)
    {
      period_start = std::min(period_start, Clock::from_time_t(mtime));
    }
  }

  m_period_date = local_date(period_start);
  m_rollover_at = next_local_midnight(period_start);
}

void Daily_rotating_file_handler::before_write(size_t) // Virtual.
{
  const auto now = m_now_func();
  if (now < m_rollover_at)
  {
    return;
  }
  // else

  const auto target = backup_path(m_period_date);
  rotate_to(target);
  prune_backups();

  m_period_date = local_date(now);
  m_rollover_at = next_local_midnight(now);
}

void Daily_rotating_file_handler::prune_backups()
{
  using std::string;
  using std::vector;

  if (m_backup_count == 0)
  {
    return;
  }
  // else

  const auto dir = path().has_parent_path() ? path().parent_path() : fs::path(".");
  const auto prefix = path().filename().string() + '.';
  constexpr size_t DATE_SZ = 10; // YYYY-MM-DD

  // Collect "<name>.YYYY-MM-DD" entries; the date format sorts chronologically as plain text.
  vector<string> backups;
  Error_code err_code;
  for (fs::directory_iterator it(dir, err_code), end_it; (!err_code) && (it != end_it); it.increment(err_code))
  {
    const auto name = it->path().filename().string();
    if ((name.size() != prefix.size() + DATE_SZ) || (name.compare(0, prefix.size(), prefix) != 0))
    {
      continue;
    }
    const auto date = name.substr(prefix.size());
    const bool is_date = std::all_of(date.begin(), date.end(), [&](char ch) -> bool
    {
      return (ch == '-') || std::isdigit(static_cast<unsigned char>(ch));
    }) && (date[4] == '-') && (date[7] == '-');
    if (is_date)
    {
      backups.push_back(name);
    }
  }
  if (err_code)
  {
    report_problem(fmt::format("Could not scan [{}] for old backups ({}).", dir.string(), err_code.message()));
    return;
  }

  if (backups.size() <= m_backup_count)
  {
    return;
  }
  // else
  std::sort(backups.begin(), backups.end());
  const auto n_doomed = backups.size() - m_backup_count;
  for (size_t idx = 0; idx != n_doomed; ++idx)
  {
    fs::remove(dir / backups[idx], err_code);
    if (err_code)
    {
      report_problem(fmt::format("Could not remove old backup [{}] ({}).", backups[idx], err_code.message()));
    }
  }
} // Daily_rotating_file_handler::prune_backups()

fs::path Daily_rotating_file_handler::backup_path(util::String_view date) const
{
  return fs::path(path().string() + '.' + std::string(date));
}

Daily_rotating_file_handler::Clock::time_point
  Daily_rotating_file_handler::next_local_midnight(Clock::time_point time) // Static.
{
  const auto time_t_val = Clock::to_time_t(time);
  std::tm tm_val = fmt::localtime(time_t_val);
  tm_val.tm_hour = 0;
  tm_val.tm_min = 0;
  tm_val.tm_sec = 0;
  ++tm_val.tm_mday; // mktime() normalizes month/year overflow.
  tm_val.tm_isdst = -1; // Let mktime() figure out DST for the new date.
  return Clock::from_time_t(std::mktime(&tm_val));
}

std::string Daily_rotating_file_handler::local_date(Clock::time_point time) // Static.
{
  return fmt::format("{:%Y-%m-%d}", fmt::localtime(Clock::to_time_t(time)));
}

std::string Daily_rotating_file_handler::description() const // Virtual.
{
  return fmt::format("Daily_rotating_file_handler @ [{}]", path().string());
}

} // namespace quire::log

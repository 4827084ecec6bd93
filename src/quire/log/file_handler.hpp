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

#include "quire/log/handler.hpp"

namespace quire::log
{

// Types.

/**
 * Handler appending entries to a file, flushing after each.  The parent directory is created if needed.
 *
 * The file is opened at construction; failure to create the directory or open the file is a configuration error
 * and throws.  After that, if the stream is found in a bad state (say the disk filled up, or someone removed the
 * directory), each subsequent write first closes and reopens the file; an entry that cannot be written goes to the
 * fallback stream (see Handler).
 *
 * Subclasses add rotation by overriding before_write(), which runs under the handler mutex right before each
 * write, and using rotate_to() / reopen().
 */
class File_handler :
  public Handler
{
public:
  // Constructors/destructor.

  /**
   * Opens `path` for appending.
   *
   * @param threshold
   *        See Handler.
   * @param formatter
   *        See Handler.
   * @param path
   *        Log file.
   * @param fallback_os
   *        See Handler.
   * @throws error::Runtime_error with error::Code::S_LOG_PATH_UNWRITABLE if the directory could not be created or
   *         the file could not be opened.
   */
  explicit File_handler(Sev threshold, Formatter_ptr formatter, const fs::path& path,
                        std::ostream* fallback_os = &std::cerr);

  /// Flushes and closes the file.
  ~File_handler() override;

  // Methods.

  /**
   * The log file.
   * @return See above.
   */
  const fs::path& path() const;

  /**
   * See Handler::description().
   * @return See above.
   */
  std::string description() const override;

protected:
  // Methods.

  /**
   * Hook invoked under the mutex before writing an entry of the given size.  Default does nothing.
   *
   * @param entry_size
   *        Bytes about to be written.
   */
  virtual void before_write(size_t entry_size);

  /**
   * Calls before_write(), then reopens the file if it's in a bad state, then writes and flushes.
   *
   * @param entry
   *        See Handler::do_write().
   * @param err_code
   *        See Handler::do_write().
   */
  void do_write(util::String_view entry, Error_code* err_code) override;

  /**
   * Flushes the file.
   *
   * @param err_code
   *        See Handler::do_flush().
   */
  void do_flush(Error_code* err_code) override;

  /**
   * Closes (flushing first) the file, if open.
   */
  void close();

  /**
   * Opens the file (closing it first if open).
   *
   * @param truncate
   *        If `true` truncate to zero length; else append.
   * @return `true` on success; on failure the problem has been reported via report_problem().
   */
  bool reopen(bool truncate = false);

  /**
   * Closes the file and renames it to `target` (replacing `target` if it exists); then opens a fresh file at
   * path().  If the rename fails, this is reported, and the current file is simply reopened for append.
   *
   * @param target
   *        New name for the current file.
   */
  void rotate_to(const fs::path& target);

  /**
   * Size of the file as of the last open or write through `*this`.
   * @return See above.
   */
  uintmax_t current_size() const;

private:
  // Methods.

  /**
   * Creates parent directory if needed and opens the file.
   *
   * @param truncate
   *        See reopen().
   * @param err_code
   *        Set on failure.
   */
  void open(bool truncate, Error_code* err_code);

  // Data.

  /// See path().
  const fs::path m_path;

  /// The file stream.
  fs::ofstream m_ofs;

  /// See current_size().
  uintmax_t m_size;
}; // class File_handler

/**
 * File_handler that rotates when an entry would push the file past a byte limit.
 *
 * Rotation happens before writing the entry that would make the file exceed `max_bytes` (an entry is never split;
 * an entry larger than `max_bytes` is written whole to a fresh file).  The current file becomes `<path>.1`; the
 * existing `<path>.<i>` becomes `<path>.<i+1>` for i up to `backup_count - 1`; `<path>.<backup_count>` is deleted.
 * So at most `backup_count` backups exist, `.1` being the newest.  With `backup_count == 0`, rotation truncates the
 * file instead (no backups); with `max_bytes == 0` there is no rotation at all.
 */
class Size_rotating_file_handler :
  public File_handler
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
   * @param path
   *        See File_handler.
   * @param max_bytes
   *        Size limit; 0 disables rotation.
   * @param backup_count
   *        Number of backups kept.
   * @param fallback_os
   *        See Handler.
   * @throws error::Runtime_error; see File_handler.
   */
  explicit Size_rotating_file_handler(Sev threshold, Formatter_ptr formatter, const fs::path& path,
                                      uintmax_t max_bytes, unsigned int backup_count,
                                      std::ostream* fallback_os = &std::cerr);

  // Methods.

  /**
   * See Handler::description().
   * @return See above.
   */
  std::string description() const override;

  /**
   * Name of the backup with the given index.
   *
   * @param idx
   *        1 is the newest.
   * @return `<path>.<idx>`.
   */
  fs::path backup_path(unsigned int idx) const;

protected:
  // Methods.

  /**
   * Rotates if writing `entry_size` bytes would exceed the limit (and the file is not empty).
   *
   * @param entry_size
   *        See File_handler::before_write().
   */
  void before_write(size_t entry_size) override;

private:
  // Methods.

  /// Performs the rotation; see class doc header.
  void rotate();

  // Data.

  /// See ctor.
  const uintmax_t m_max_bytes;

  /// See ctor.
  const unsigned int m_backup_count;
}; // class Size_rotating_file_handler

/**
 * File_handler that rotates at each local midnight, regardless of size.  The rotated file is named after the local
 * date whose entries it holds: `<path>.YYYY-MM-DD`.  After each rotation, backups beyond the newest
 * `backup_count` (by date) are deleted; `backup_count == 0` keeps all.
 *
 * The first rotation deadline is the local midnight following the existing file's last modification time (if the
 * file already exists) or else following the present time; so a process restarted on a later day rotates the
 * stale file on its first write.
 *
 * Rotation is checked only when an entry is written; a quiet day produces no (empty) backup.
 */
class Daily_rotating_file_handler :
  public File_handler
{
public:
  // Types.

  /// Short-hand for the wall clock.
  using Clock = Record::Clock;

  /// Function returning the present time.  Replaceable for testing.
  using Now_func = Function<Clock::time_point ()>;

  // Constructors/destructor.

  /**
   * Constructs handler.
   *
   * @param threshold
   *        See Handler.
   * @param formatter
   *        See Handler.
   * @param path
   *        See File_handler.
   * @param backup_count
   *        Number of days of backups kept; 0 means all.
   * @param fallback_os
   *        See Handler.
   * @param now_func
   *        Source of the present time; default is `Clock::now()`.
   * @throws error::Runtime_error; see File_handler.
   */
  explicit Daily_rotating_file_handler(Sev threshold, Formatter_ptr formatter, const fs::path& path,
                                       unsigned int backup_count, std::ostream* fallback_os = &std::cerr,
                                       Now_func now_func = Now_func());

  // Methods.

  /**
   * See Handler::description().
   * @return See above.
   */
  std::string description() const override;

  /**
   * Name of the backup for the given local date.
   *
   * @param date
   *        `"YYYY-MM-DD"`.
   * @return `<path>.<date>`.
   */
  fs::path backup_path(util::String_view date) const;

  /**
   * Returns the first local midnight strictly after `time`.
   *
   * @param time
   *        Time.
   * @return See above.
   */
  static Clock::time_point next_local_midnight(Clock::time_point time);

  /**
   * Returns the local date of `time` as `"YYYY-MM-DD"`.
   *
   * @param time
   *        Time.
   * @return See above.
   */
  static std::string local_date(Clock::time_point time);

protected:
  // Methods.

  /**
   * Rotates if the present time has reached the rotation deadline.
   *
   * @param entry_size
   *        See File_handler::before_write().  Ignored.
   */
  void before_write(size_t entry_size) override;

private:
  // Methods.

  /// Deletes the oldest date backups so that at most #m_backup_count remain.
  void prune_backups();

  // Data.

  /// See ctor.
  const unsigned int m_backup_count;

  /// See ctor.
  const Now_func m_now_func;

  /// Local date of the entries in the current file: the backup suffix at the next rotation.
  std::string m_period_date;

  /// When the next rotation is due.
  Clock::time_point m_rollover_at;
}; // class Daily_rotating_file_handler

} // namespace quire::log

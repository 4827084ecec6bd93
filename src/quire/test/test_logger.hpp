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

#include "quire/log/logger.hpp"
#include <boost/make_shared.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <sstream>

namespace quire::test
{

/**
 * Handler keeping every rendered entry in memory, for inspection by tests.  Defaults to JSON rendering, which
 * tests can take apart with parse_json().
 */
class Capture_handler :
  public log::Handler
{
public:
  /**
   * Constructor.
   *
   * @param threshold
   *        Handler threshold.
   * @param formatter
   *        Formatter.
   */
  explicit Capture_handler(log::Sev threshold = log::Sev::S_NONE,
                           log::Formatter_ptr formatter = boost::make_shared<log::Json_formatter>()) :
    log::Handler(threshold, std::move(formatter), &std::cerr)
  {
    // Nothing.
  }

  /**
   * Entries written so far, without their trailing newlines.
   *
   * @return Copy (so it's safe to call concurrently with logging).
   */
  std::vector<std::string> entries() const
  {
    util::Lock_guard<util::Mutex_non_recursive> lock(m_entries_mutex);
    return m_entries;
  }

  /// Forgets captured entries.
  void reset()
  {
    util::Lock_guard<util::Mutex_non_recursive> lock(m_entries_mutex);
    m_entries.clear();
  }

  std::string description() const override
  {
    return "Capture_handler";
  }

protected:
  void do_write(util::String_view entry, Error_code*) override
  {
    util::Lock_guard<util::Mutex_non_recursive> lock(m_entries_mutex);
    entry.remove_suffix(1); // Newline.
    m_entries.emplace_back(entry);
  }

private:
  /// Protects #m_entries; entries() may be called while another thread logs.
  mutable util::Mutex_non_recursive m_entries_mutex;

  /// See entries().
  std::vector<std::string> m_entries;
}; // class Capture_handler

/// Filter keeping a copy of every Record it sees (and vetoing none).
class Capture_filter :
  public log::Filter
{
public:
  bool apply(log::Record* record) const override
  {
    util::Lock_guard<util::Mutex_non_recursive> lock(m_mutex);
    m_records.push_back(*record);
    return true;
  }

  /**
   * Records seen so far.
   * @return Copy.
   */
  std::vector<log::Record> records() const
  {
    util::Lock_guard<util::Mutex_non_recursive> lock(m_mutex);
    return m_records;
  }

private:
  /// Protects #m_records.
  mutable util::Mutex_non_recursive m_mutex;

  /// See records().
  mutable std::vector<log::Record> m_records;
}; // class Capture_filter

/**
 * Config with the given level, one custom handler returning `handler`, a Level_filter at `level`, and the given
 * extra filters after that.
 *
 * @param name
 *        Logger name.
 * @param level
 *        Level.
 * @param handler
 *        Handler.
 * @param filters
 *        Additional filters.
 * @return See above.
 */
inline log::Logger_config make_capture_config(const std::string& name, log::Sev level,
                                              const boost::shared_ptr<Capture_handler>& handler,
                                              const std::vector<log::Filter_ptr>& filters = {})
{
  log::Logger_config config;
  config.m_name = name;
  config.m_level = level;
  config.m_handlers.push_back(log::Handler_spec::custom([handler]() -> log::Handler_ptr { return handler; }));
  config.m_filters.push_back(boost::make_shared<log::Level_filter>(level));
  config.m_filters.insert(config.m_filters.end(), filters.begin(), filters.end());
  return config;
}

/**
 * Parses one JSON entry.  Throws `boost::property_tree::json_parser_error` if it's not valid JSON.
 *
 * @param entry
 *        JSON text.
 * @return See above.
 */
inline boost::property_tree::ptree parse_json(const std::string& entry)
{
  std::istringstream is(entry);
  boost::property_tree::ptree tree;
  boost::property_tree::read_json(is, tree);
  return tree;
}

} // namespace quire::test

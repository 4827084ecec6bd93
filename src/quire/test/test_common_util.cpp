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
#include "quire/test/test_common_util.hpp"
#include <gtest/gtest.h>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <regex>
#include <sstream>
#include <cstdlib>

using std::string;
using std::ostream;
using std::vector;

namespace quire::test
{

Env_var_setter::Env_var_setter(const string& name, const std::optional<string>& value) :
  m_name(name)
{
  const char* const old_value = ::getenv(m_name.c_str());
  if (old_value)
  {
    m_old_value = old_value;
  }

  if (value)
  {
    ::setenv(m_name.c_str(), value->c_str(), 1);
  }
  else
  {
    ::unsetenv(m_name.c_str());
  }
}

Env_var_setter::~Env_var_setter()
{
  if (m_old_value)
  {
    ::setenv(m_name.c_str(), m_old_value->c_str(), 1);
  }
  else
  {
    ::unsetenv(m_name.c_str());
  }
}

string get_test_suite_name()
{
  return ::testing::UnitTest::GetInstance()->current_test_info()->test_suite_name();
}

string collect_output(const std::function<void()>& func, ostream& os, bool output_buffer)
{
  std::ostringstream captured;

  std::streambuf* const original_buffer = os.rdbuf(captured.rdbuf());
  func();
  os.flush();
  os.rdbuf(original_buffer);

  if (output_buffer)
  {
    os << captured.str() << std::flush;
  }
  return captured.str();
}

bool check_output(const string& output, const vector<string>& regex_matches)
{
  bool result = true;
  for (const auto& regex_str : regex_matches)
  {
    if (!std::regex_search(output, std::regex(regex_str)))
    {
      result = false;
    }
  }
  return result;
}

vector<string> split_lines(const string& text)
{
  vector<string> lines;
  if (text.empty())
  {
    return lines;
  }
  boost::algorithm::split(lines, text, boost::algorithm::is_any_of("\n"));
  if (lines.back().empty())
  {
    lines.pop_back();
  }
  return lines;
}

} // namespace quire::test

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
#include "quire/log/log_fwd.hpp"
#include "quire/util/util.hpp"
#include <boost/algorithm/string/trim.hpp>
#include <array>
#include <ostream>
#include <sstream>

namespace quire::log
{

namespace
{

/// Names of Sev values, indexed by their integer encoding.
constexpr std::array<util::String_view, size_t(Sev::S_END_SENTINEL)> S_SEV_STRS
  = { "NONE", "DEBUG", "INFO", "WARNING", "ERROR", "CRITICAL" };

/// Names of Environment values, indexed by their integer encoding.
constexpr std::array<util::String_view, size_t(Environment::S_END_SENTINEL)> S_ENVIRONMENT_STRS
  = { "development", "testing", "staging", "production" };

} // namespace (anon)

// Implementations.

util::String_view sev_to_string(Sev val)
{
  const auto idx = static_cast<size_t>(val);
  return (idx < S_SEV_STRS.size()) ? S_SEV_STRS[idx] : util::String_view("UNKNOWN");
}

std::ostream& operator<<(std::ostream& os, Sev val)
{
  return os << sev_to_string(val);
}

std::istream& operator>>(std::istream& is, Sev& val)
{
  val = util::istream_to_enum(&is, Sev::S_NONE, Sev::S_END_SENTINEL);
  return is;
}

std::ostream& operator<<(std::ostream& os, Environment val)
{
  const auto idx = static_cast<size_t>(val);
  return os << ((idx < S_ENVIRONMENT_STRS.size()) ? S_ENVIRONMENT_STRS[idx] : util::String_view("unknown"));
}

std::istream& operator>>(std::istream& is, Environment& val)
{
  // No numeric encoding: "ENVIRONMENT=1" is more likely a mistake than a request for the testing preset.
  val = util::istream_to_enum(&is, Environment::S_END_SENTINEL, Environment::S_END_SENTINEL, false);
  return is;
}

bool parse_environment(util::String_view name, Environment* env)
{
  const auto trimmed = boost::algorithm::trim_copy(std::string(name));
  if (trimmed.empty())
  {
    return false;
  }
  // else

  std::istringstream is(trimmed);
  Environment result;
  is >> result;
  // The whole token must have been consumed: "production2" or "prod uction" is not an environment.
  if ((result == Environment::S_END_SENTINEL) || (is.peek() != std::istringstream::traits_type::eof()))
  {
    return false;
  }
  // else
  *env = result;
  return true;
}

} // namespace quire::log

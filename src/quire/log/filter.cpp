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
#include "quire/log/filter.hpp"
#include <boost/algorithm/string/predicate.hpp>
#include <boost/functional/hash.hpp>
#include <typeinfo>

namespace quire::log
{

// Filter implementations.

Filter::~Filter() = default;

size_t Filter::fingerprint() const // Virtual.
{
  size_t seed = 0;
  boost::hash_combine(seed, std::string(typeid(*this).name()));
  boost::hash_combine(seed, static_cast<const void*>(this));
  return seed;
}

// Level_filter implementations.

Level_filter::Level_filter(Sev min_sev) :
  m_min_sev(min_sev)
{
  // Nothing.
}

bool Level_filter::apply(Record* record) const // Virtual.
{
  return record->m_sev >= m_min_sev;
}

size_t Level_filter::fingerprint() const // Virtual.
{
  size_t seed = 0;
  boost::hash_combine(seed, std::string("Level_filter"));
  boost::hash_combine(seed, static_cast<size_t>(m_min_sev));
  return seed;
}

Sev Level_filter::min_sev() const
{
  return m_min_sev;
}

// Sensitive_data_filter implementations.

// Static initializations.

const std::string Sensitive_data_filter::S_REDACTED = "***REDACTED***";

Sensitive_data_filter::Sensitive_data_filter(const std::vector<std::string>& additional_keys,
                                             util::String_view sentinel) :
  m_blocklist(default_blocklist()),
  m_sentinel(sentinel)
{
  for (const auto& key : additional_keys)
  {
    if (!key.empty())
    {
      m_blocklist.push_back(key);
    }
  }
}

bool Sensitive_data_filter::apply(Record* record) const // Virtual.
{
  redact(&record->m_context);
  redact(&record->m_extra);
  return true;
}

size_t Sensitive_data_filter::redact(Fields* fields) const
{
  size_t n_redacted = 0;
  for (auto& field : *fields)
  {
    if (is_sensitive(field.first))
    {
      field.second = m_sentinel;
      ++n_redacted;
    }
  }
  return n_redacted;
}

bool Sensitive_data_filter::is_sensitive(util::String_view key) const
{
  using boost::algorithm::icontains;

  for (const auto& entry : m_blocklist)
  {
    if (icontains(key, entry))
    {
      return true;
    }
  }
  return false;
}

size_t Sensitive_data_filter::fingerprint() const // Virtual.
{
  size_t seed = 0;
  boost::hash_combine(seed, std::string("Sensitive_data_filter"));
  boost::hash_combine(seed, m_sentinel);
  for (const auto& entry : m_blocklist)
  {
    boost::hash_combine(seed, entry);
  }
  return seed;
}

const std::vector<std::string>& Sensitive_data_filter::blocklist() const
{
  return m_blocklist;
}

const std::string& Sensitive_data_filter::sentinel() const
{
  return m_sentinel;
}

const std::vector<std::string>& Sensitive_data_filter::default_blocklist() // Static.
{
  static const std::vector<std::string> s_default_blocklist
    = { "password", "token", "secret", "api_key", "authorization", "credential", "private_key", "ssn",
        "credit_card", "cvv", "pin", "session_id", "cookie", "csrf_token" };
  return s_default_blocklist;
}

} // namespace quire::log

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
#include "quire/log/field.hpp"
#include "quire/util/fmt.hpp"
#include <ostream>
#include <limits>

namespace quire::log
{

// Field_value implementations.

Field_value::Field_value() = default;

Field_value::Field_value(std::nullptr_t) :
  Field_value()
{
  // Nothing.
}

Field_value::Field_value(bool val) :
  m_val(val)
{
  // Nothing.
}

Field_value::Field_value(int val) :
  m_val(static_cast<int64_t>(val))
{
  // Nothing.
}

Field_value::Field_value(long val) :
  m_val(static_cast<int64_t>(val))
{
  // Nothing.
}

Field_value::Field_value(long long val) :
  m_val(static_cast<int64_t>(val))
{
  // Nothing.
}

Field_value::Field_value(unsigned int val) :
  m_val(static_cast<int64_t>(val))
{
  // Nothing.
}

Field_value::Field_value(unsigned long val) :
  Field_value(static_cast<unsigned long long>(val))
{
  // Nothing.
}

Field_value::Field_value(unsigned long long val)
{
  if (val <= static_cast<unsigned long long>(std::numeric_limits<int64_t>::max()))
  {
    m_val = static_cast<int64_t>(val);
  }
  else
  {
    m_val = static_cast<uint64_t>(val);
  }
}

Field_value::Field_value(double val) :
  m_val(val)
{
  // Nothing.
}

Field_value::Field_value(const char* val) :
  m_val(std::string(val))
{
  // Nothing.
}

Field_value::Field_value(std::string val) :
  m_val(std::move(val))
{
  // Nothing.
}

Field_value::Field_value(util::String_view val) :
  m_val(std::string(val))
{
  // Nothing.
}

Field_value::Type Field_value::type() const
{
  return static_cast<Type>(m_val.index());
}

bool Field_value::is_null() const
{
  return type() == Type::S_NULL;
}

bool Field_value::as_bool() const
{
  return std::get<bool>(m_val);
}

int64_t Field_value::as_int() const
{
  return std::get<int64_t>(m_val);
}

uint64_t Field_value::as_uint() const
{
  return std::get<uint64_t>(m_val);
}

double Field_value::as_double() const
{
  return std::get<double>(m_val);
}

const std::string& Field_value::as_string() const
{
  return std::get<std::string>(m_val);
}

bool Field_value::operator==(const Field_value& other) const
{
  return m_val == other.m_val;
}

bool Field_value::operator!=(const Field_value& other) const
{
  return !(*this == other);
}

std::ostream& operator<<(std::ostream& os, const Field_value& val)
{
  using Type = Field_value::Type;

  switch (val.type())
  {
  case Type::S_NULL:
    return os << "null";
  case Type::S_BOOL:
    return os << (val.as_bool() ? "true" : "false");
  case Type::S_INT:
    return os << val.as_int();
  case Type::S_UINT:
    return os << val.as_uint();
  case Type::S_DOUBLE:
    // {fmt} default is the shortest representation that parses back to the same double.
    return os << fmt::format("{}", val.as_double());
  case Type::S_STRING:
    return os << val.as_string();
  }
  return os;
}

// Fields implementations.

Fields::Fields() = default;

Fields::Fields(std::initializer_list<Field> init)
{
  m_fields.reserve(init.size());
  for (const auto& field : init)
  {
    set(field.first, field.second);
  }
}

void Fields::set(util::String_view key, Field_value val)
{
  const auto existing = find(key);
  if (existing)
  {
    *existing = std::move(val);
    return;
  }
  // else
  m_fields.emplace_back(std::string(key), std::move(val));
}

void Fields::merge(const Fields& other)
{
  for (const auto& field : other)
  {
    set(field.first, field.second);
  }
}

const Field_value* Fields::find(util::String_view key) const
{
  const auto it = std::find_if(m_fields.begin(), m_fields.end(),
                               [&](const Field& field) -> bool { return field.first == key; });
  return (it == m_fields.end()) ? nullptr : &it->second;
}

Field_value* Fields::find(util::String_view key)
{
  return const_cast<Field_value*>(static_cast<const Fields*>(this)->find(key));
}

bool Fields::contains(util::String_view key) const
{
  return find(key) != nullptr;
}

bool Fields::erase(util::String_view key)
{
  return erase_if([&](const std::string& name) -> bool { return name == key; }) != 0;
}

size_t Fields::size() const
{
  return m_fields.size();
}

bool Fields::empty() const
{
  return m_fields.empty();
}

void Fields::clear()
{
  m_fields.clear();
}

Fields::const_iterator Fields::begin() const
{
  return m_fields.begin();
}

Fields::const_iterator Fields::end() const
{
  return m_fields.end();
}

Fields::iterator Fields::begin()
{
  return m_fields.begin();
}

Fields::iterator Fields::end()
{
  return m_fields.end();
}

bool Fields::operator==(const Fields& other) const
{
  return m_fields == other.m_fields;
}

} // namespace quire::log

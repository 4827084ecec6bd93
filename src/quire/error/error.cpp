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
#include "quire/error/error.hpp"
#include "quire/util/fmt.hpp"

namespace quire::error
{

namespace
{

/**
 * Composes Runtime_error::what() text.
 *
 * @param err_code
 *        Code; may be falsy.
 * @param context
 *        Context; may be empty.
 * @return See Runtime_error doc header.
 */
std::string compose_what(const Error_code& err_code, util::String_view context)
{
  if (!err_code)
  {
    return std::string(context);
  }
  // else
  const auto code_part = fmt::format("{} [{}:{}]", err_code.message(), err_code.category().name(), err_code.value());
  return context.empty() ? code_part : fmt::format("{}: {}", context, code_part);
}

} // namespace (anon)

// Implementations.

Runtime_error::Runtime_error(const Error_code& err_code_or_success, util::String_view context) :
  boost::system::system_error(err_code_or_success),
  m_context(context),
  m_what(compose_what(err_code_or_success, context))
{
  // Nothing.
}

Runtime_error::Runtime_error(util::String_view context) :
  Runtime_error(Error_code(), context)
{
  // Nothing.
}

const char* Runtime_error::what() const noexcept // Virtual.
{
  return m_what.c_str();
}

const std::string& Runtime_error::context() const
{
  return m_context;
}

} // namespace quire::error

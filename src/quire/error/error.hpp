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

#include "quire/util/util_fwd.hpp"
#include <boost/system/system_error.hpp>
#include <string>

/**
 * Quire module that facilitates working with error codes and exceptions; essentially comprised of niceties on top
 * boost.system's error facility.  The error codes themselves live with the module that raises them; e.g.,
 * quire::log::error::Code.
 */
namespace quire::error
{

// Types.

/**
 * An `std::runtime_error` (which is an `std::exception`) that stores an #Error_code.  Quire throws this for
 * failures that must be fatal to the caller: in practice, configuration-time problems found while building a
 * quire::log::Logger (unknown environment name, unwritable log path, malformed handler spec).  Per-call logging
 * never throws it.
 *
 * `what()` is `"<context>: <code message> [<category>:<value>]"`; the context part is omitted when empty; and if
 * the code is falsy (success) it is just the context string.
 */
class Runtime_error :
  public boost::system::system_error
{
public:
  // Constructors/destructor.

  /**
   * Constructs Runtime_error.
   *
   * @param err_code_or_success
   *        The #Error_code describing the error; or a falsy (success) code if none applies.
   * @param context
   *        Context string, such as the path or name that was the subject of the failure.
   */
  explicit Runtime_error(const Error_code& err_code_or_success, util::String_view context = "");

  /**
   * Constructs Runtime_error, when one only has a context string and no applicable error code.
   *
   * @param context
   *        See other ctor.
   */
  explicit Runtime_error(util::String_view context);

  // Methods.

  /**
   * Returns a message describing the exception; see class doc header.
   *
   * @return See above.
   */
  const char* what() const noexcept override;

  /**
   * The context string given at construction, without the code's message.
   *
   * @return See above.
   */
  const std::string& context() const;

private:
  // Data.

  /// See context().
  const std::string m_context;

  /// Full message returned by what(), composed once at construction.
  const std::string m_what;
}; // class Runtime_error

} // namespace quire::error

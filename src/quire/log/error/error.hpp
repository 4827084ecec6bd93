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

#include "quire/common.hpp"
#include "quire/error/error.hpp"

/**
 * Namespace containing the `log` module's extension of boost.system error conventions, so that configuration-time
 * failures can be reported as an #Error_code (typically wrapped in a quire::error::Runtime_error).
 *
 * ### Synopsis ###
 *
 *   ~~~
 *   quire::Error_code code = quire::log::error::Code::S_LOG_PATH_UNWRITABLE;
 *   throw quire::error::Runtime_error(code, "/var/log/svc/svc.log");
 *   ~~~
 *
 * @internal
 *
 * The usual recipe: `enum` plus make_error_code() here; a non-public `error_category` subclass mapping
 * each value to a message in the .cpp; the `is_error_code_enum<>` specialization at the bottom of this file.
 */
namespace quire::log::error
{

// Types.

/// Short-hand for the exception type thrown by `log` configuration-time failures.
using Runtime_error = ::quire::error::Runtime_error;

/// All possible errors returned (via #Error_code arguments or exceptions) by `quire::log` functions and methods.
enum class Code
{
  /// Environment name is not one of development, testing, staging, production.
  S_UNKNOWN_ENVIRONMENT = 1,

  /// Log file (or its parent directory) could not be created or opened for appending.
  S_LOG_PATH_UNWRITABLE,

  /// Handler spec is inconsistent (file handler without a path, custom handler without a usable factory).
  S_INVALID_HANDLER_SPEC,

  /// Logger config lists a null filter.
  S_NULL_FILTER
}; // enum class Code

// Free functions.

/**
 * Given a `Code` `enum` value, creates a lightweight quire::Error_code (boost.system `error_code`) representing
 * that error.  This is needed to make the `boost::system::error_code::error_code<Code>()` template implementation
 * work.  Or, slightly more in English, it glues the (completely general) quire::Error_code to the (`log`-specific)
 * error code set `log::error::Code`, so that one can implicitly covert from the latter to the former.
 *
 * @param err_code
 *        The `enum` value.
 * @return A corresponding quire::Error_code.
 */
Error_code make_error_code(Code err_code);

} // namespace quire::log::error

/// We may add some ADL-based overloads into this namespace outside `quire`.
namespace boost::system
{

// Types.

/**
 * Ummm -- it specializes this `struct` to -- look -- the end result is boost.system uses this as
 * authorization to make `enum` `Code` convertible to `Error_code`.
 */
template<>
struct is_error_code_enum<::quire::log::error::Code>
{
  /// Means `Code` `enum` values can be used for quire::Error_code.
  static const bool value = true;
};

} // namespace boost::system

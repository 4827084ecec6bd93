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
#include "quire/log/error/error.hpp"
#include <string>

namespace quire::log::error
{

// Types.

/**
 * The boost.system category for errors returned by the `log` Quire module.  Think of it as the polymorphic
 * counterpart of error::Code; it kicks in when, for `quire::Error_code ec`, something like `ec.message()` is
 * invoked.  Not visible outside this translation unit.
 */
class Category :
  public boost::system::error_category
{
public:
  // Constants.

  /// The one Category.
  static const Category S_CATEGORY;

  // Methods.

  /**
   * Implements superclass API: returns a `static` string representing this `error_category`.
   *
   * @return See above.
   */
  const char* name() const noexcept override;

  /**
   * Implements superclass API: given the integer error code of an error in this category, returns a description of
   * that error (similarly in spirit to `std::strerror()`).
   *
   * @param val
   *        Error code of a Category error (realistically, an error::Code `enum` value cast to `int`).
   * @return String describing the error.
   */
  std::string message(int val) const override;

private:
  // Constructors.

  /// Boring constructor.
  explicit Category();
}; // class Category

// Static initializations.

const Category Category::S_CATEGORY;

// Implementations.

Error_code make_error_code(Code err_code)
{
  return Error_code{static_cast<int>(err_code), Category::S_CATEGORY};
}

Category::Category() = default;

const char* Category::name() const noexcept // Virtual.
{
  return "quire-log";
}

std::string Category::message(int val) const // Virtual.
{
  // KEEP THESE STRINGS IN SYNC WITH COMMENTS ON THE INDIVIDUAL ENUM MEMBERS IN error.hpp!

  switch (static_cast<Code>(val))
  {
  case Code::S_UNKNOWN_ENVIRONMENT:
    return "Environment name is not one of development, testing, staging, production.";
  case Code::S_LOG_PATH_UNWRITABLE:
    return "Log file (or its parent directory) could not be created or opened for appending.";
  case Code::S_INVALID_HANDLER_SPEC:
    return "Handler spec is inconsistent (file handler without a path, custom handler without a usable factory).";
  case Code::S_NULL_FILTER:
    return "Logger config lists a null filter.";
  }
  return "UNKNOWN-quire-log-error";
} // Category::message()

} // namespace quire::log::error

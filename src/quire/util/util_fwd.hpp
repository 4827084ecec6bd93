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
#include <boost/thread/mutex.hpp>
#include <boost/thread/locks.hpp>
#include <string_view>
#include <string>
#include <iosfwd>

/**
 * Quire module containing miscellaneous general-use facilities that don't fit into any other Quire module.
 *
 * Each symbol therein is typically used by at least 1 other Quire module; but all public symbols (except ones
 * under a detail/ subdirectory) are intended for use by Quire user as well.
 */
namespace quire::util
{

// Types.

/// Short-hand for non-reentrant, exclusive mutex.  ("Reentrant" means one can lock an already-locked-in-that-thread mutex.)
using Mutex_non_recursive = boost::mutex;

/**
 * Short-hand for advanced-capability RAII lock guard for any mutex, ensuring exclusive ownership of that mutex.
 * Note the advanced API available for the underlying type: it is possible to relinquish ownership without unlocking,
 * gain ownership of a locked mutex; and so on.
 *
 * @tparam Mutex
 *         A non-recursive or recursive mutex type.  Recommend one of Mutex_non_recursive or its siblings.
 */
template<typename Mutex>
using Lock_guard = boost::unique_lock<Mutex>;

/**
 * Commonly used `char`-based `std::basic_string_view`.  Used throughout to accept file names, messages and field
 * keys without copying them.
 */
using String_view = std::string_view;

// Free functions.

/**
 * Deserializes an `enum class` value from a standard input stream.  Reads up to but not including the next
 * non-alphanumeric-or-underscore character; the resulting string is then mapped to an `Enum`.  If none is
 * recognized, `enum_default` is the result.  The recognized values are:
 *   - "0", "1", ...: Corresponds to the underlying-integer conversion to that `Enum`.  (Can be disabled.)
 *   - Case-[in]sensitive string encoding of the `Enum`, as determined by `operator<<(ostream&)`.
 *
 * @tparam Enum
 *         An `enum class` which must satisfy the following requirements or else risk undefined behavior:
 *         it must have an `ostream<<` operator; the sentinel value must be greater than all others; and values
 *         must be ordered sequentially from `enum_lowest`.
 * @param is_ptr
 *        Stream from which to deserialize.
 * @param enum_default
 *        Value to return if the token does not match either the numeric encoding (if enabled) or the string encoding.
 * @param enum_sentinel
 *        Value just above the highest value recognized.
 * @param accept_num_encoding
 *        If `true`, numeric encodings are accepted.
 * @param case_sensitive
 *        If `true`, then the string encoding is matched case-sensitively.
 * @param enum_lowest
 *        The lowest `Enum` value.  Typically the default is correct.
 * @return See above.
 */
template<typename Enum>
Enum istream_to_enum(std::istream* is_ptr, Enum enum_default, Enum enum_sentinel,
                     bool accept_num_encoding = true, bool case_sensitive = false,
                     Enum enum_lowest = Enum(0));

} // namespace quire::util

// Macros.

/**
 * Use this to create a semicolon-safe version of a "void" functional macro definition consisting of at least two
 * statements; or of one statement that would become two statements by appending a semicolon.
 *
 * @param ARG_func_macro_definition
 *        The intended definition of a void macro.
 */
#define QUIRE_UTIL_SEMICOLON_SAFE(ARG_func_macro_definition) \
  do \
  { \
    ARG_func_macro_definition \
  } \
  while (false)

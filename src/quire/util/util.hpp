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
#include <boost/lexical_cast.hpp>
#include <boost/algorithm/string.hpp>
#include <istream>
#include <locale>
#include <cctype>
#include <type_traits>

namespace quire::util
{

// Free functions.

/**
 * Helper that takes a non-null-terminated string, possibly containing directory separators, and returns the
 * portion after the last separator (or the whole thing if there is none).  `constexpr`, so that when fed
 * `__FILE__` the work happens at compile time.
 *
 * @param full_path
 *        Full path, as from `__FILE__`.
 * @return View into `full_path` starting just past the last `/`.
 */
constexpr String_view get_last_path_segment(String_view full_path)
{
  String_view path(full_path);
  constexpr char SEP = '/';
  // Must stay usable in constant expressions (see QUIRE_LOG_ORIGIN()).
  for (size_t idx = path.size(); idx != 0; --idx)
  {
    if (path[idx - 1] == SEP)
    {
      path.remove_prefix(idx);
      break;
    }
  }

  return path;
} // get_last_path_segment()

/**
 * Like get_last_path_segment() but also strips the last extension, if any, from the result: `"a/b/logger.cpp"`
 * becomes `"logger"`.  This is what Quire records as the "module" portion of a call-site origin.
 *
 * @param full_path
 *        Full path, as from `__FILE__`.
 * @return See above.
 */
constexpr String_view get_path_stem(String_view full_path)
{
  String_view stem = get_last_path_segment(full_path);
  const auto stem_sz = stem.size();
  // A leading dot (".hidden") is not an extension.
  for (size_t idx = stem_sz; idx > 1; --idx)
  {
    if (stem[idx - 1] == '.')
    {
      stem.remove_suffix(stem_sz - (idx - 1));
      break;
    }
  }
  return stem;
}

// Template implementations.

template<typename Enum>
Enum istream_to_enum(std::istream* is_ptr, Enum enum_default, Enum enum_sentinel,
                     bool accept_num_encoding, bool case_sensitive,
                     Enum enum_lowest)
{
  using boost::lexical_cast;
  using boost::bad_lexical_cast;
  using boost::algorithm::equals;
  using boost::algorithm::is_iequal;
  using std::locale;
  using std::string;
  using std::isdigit;
  using std::isalnum;
  using Traits = std::char_traits<char>;
  using enum_t = std::underlying_type_t<Enum>;

  auto& is = *is_ptr;
  const is_iequal i_equal_func(locale::classic());

  // Read into `token` until (and not including) the first non-alphanumeric/underscore character or stream end.
  string token;
  Traits::int_type ch;
  while (((ch = is.peek()) != Traits::eof()) && (isalnum(ch) || (ch == '_')))
  {
    token += Traits::to_char_type(ch);
    is.get();
  }

  Enum val = enum_default;
  if (token.empty())
  {
    return val;
  }

  if (accept_num_encoding && isdigit(static_cast<unsigned char>(token.front())))
  {
    try
    {
      const auto num_enum = lexical_cast<enum_t>(token);
      // This assumes a vanilla enum integer value ordering.
      if ((num_enum < enum_t(enum_sentinel)) && (num_enum >= enum_t(enum_lowest)))
      {
        val = Enum(num_enum);
      }
    }
    catch (const bad_lexical_cast&)
    {
      // Digit-led garbage like "3x": leave val == enum_default, as advertised.
    }
    return val;
  }
  // else

  for (auto idx = enum_t(enum_lowest); idx != enum_t(enum_sentinel); ++idx)
  {
    const auto candidate = Enum(idx);
    // lexical_cast<string>(Enum) is the ostream<< (symbolic) encoding.
    if (case_sensitive ? equals(token, lexical_cast<string>(candidate))
                       : equals(token, lexical_cast<string>(candidate), i_equal_func))
    {
      val = candidate;
      break;
    }
  }

  return val;
} // istream_to_enum()

} // namespace quire::util

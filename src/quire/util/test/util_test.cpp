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

#include "quire/util/util.hpp"
#include <gtest/gtest.h>
#include <sstream>

namespace quire::util::test
{

namespace
{
enum class Color
{
  S_RED = 0,
  S_GREEN,
  S_END_SENTINEL
};

std::ostream& operator<<(std::ostream& os, Color val)
{
  return os << ((val == Color::S_RED) ? "RED" : ((val == Color::S_GREEN) ? "GREEN" : "?"));
}

Color read_color(const std::string& str, bool accept_num)
{
  std::istringstream is(str);
  return istream_to_enum(&is, Color::S_END_SENTINEL, Color::S_END_SENTINEL, accept_num);
}
} // Anonymous namespace.

TEST(Util, Path_segments)
{
  static_assert(get_last_path_segment("a/b/c.cpp") == "c.cpp");
  static_assert(get_path_stem("/x/y/logger_test.cpp") == "logger_test");

  EXPECT_EQ(get_last_path_segment("plain.hpp"), "plain.hpp");
  EXPECT_EQ(get_last_path_segment("dir/"), "");
  EXPECT_EQ(get_path_stem("a/archive.tar.gz"), "archive.tar");
  EXPECT_EQ(get_path_stem("a/.hidden"), ".hidden");
  EXPECT_EQ(get_path_stem("noext"), "noext");
  EXPECT_EQ(get_path_stem(""), "");
}

TEST(Util, Istream_to_enum)
{
  EXPECT_EQ(read_color("green", false), Color::S_GREEN);
  EXPECT_EQ(read_color("RED rest", false), Color::S_RED);
  EXPECT_EQ(read_color("1", true), Color::S_GREEN);
  EXPECT_EQ(read_color("1", false), Color::S_END_SENTINEL);
  EXPECT_EQ(read_color("2", true), Color::S_END_SENTINEL);
  EXPECT_EQ(read_color("blue", true), Color::S_END_SENTINEL);
  EXPECT_EQ(read_color("", true), Color::S_END_SENTINEL);

  // Stops at the first character outside the token, leaving it in the stream.
  std::istringstream is("green,red");
  EXPECT_EQ(istream_to_enum(&is, Color::S_END_SENTINEL, Color::S_END_SENTINEL), Color::S_GREEN);
  EXPECT_EQ(is.get(), ',');
}

} // namespace quire::util::test

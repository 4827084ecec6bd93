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

#include "quire/log/log_fwd.hpp"
#include "quire/log/error/error.hpp"
#include "quire/error/error.hpp"
#include <gtest/gtest.h>
#include <boost/lexical_cast.hpp>
#include <sstream>

namespace quire::log::test
{

namespace
{
using boost::lexical_cast;
using std::string;

Sev read_sev(const string& str)
{
  std::istringstream is(str);
  Sev sev = Sev::S_END_SENTINEL;
  is >> sev;
  return sev;
}
} // Anonymous namespace.

TEST(Sev, Order_and_names)
{
  EXPECT_LT(Sev::S_DEBUG, Sev::S_INFO);
  EXPECT_LT(Sev::S_INFO, Sev::S_WARNING);
  EXPECT_LT(Sev::S_WARNING, Sev::S_ERROR);
  EXPECT_LT(Sev::S_ERROR, Sev::S_CRITICAL);

  EXPECT_EQ(lexical_cast<string>(Sev::S_WARNING), "WARNING");
  EXPECT_EQ(sev_to_string(Sev::S_CRITICAL), "CRITICAL");
  EXPECT_EQ(sev_to_string(Sev::S_END_SENTINEL), "UNKNOWN");

  EXPECT_EQ(read_sev("error"), Sev::S_ERROR);
  EXPECT_EQ(read_sev("Info"), Sev::S_INFO);
  EXPECT_EQ(read_sev("5"), Sev::S_CRITICAL);
  EXPECT_EQ(read_sev("9"), Sev::S_NONE);
  EXPECT_EQ(read_sev("loud"), Sev::S_NONE);
}

TEST(Environment, Parse)
{
  Environment env = Environment::S_DEVELOPMENT;
  EXPECT_TRUE(parse_environment("production", &env));
  EXPECT_EQ(env, Environment::S_PRODUCTION);
  EXPECT_TRUE(parse_environment("  Staging\n", &env));
  EXPECT_EQ(env, Environment::S_STAGING);
  EXPECT_EQ(lexical_cast<string>(Environment::S_TESTING), "testing");

  env = Environment::S_TESTING;
  EXPECT_FALSE(parse_environment("", &env));
  EXPECT_FALSE(parse_environment("prod", &env));
  EXPECT_FALSE(parse_environment("production2", &env));
  EXPECT_FALSE(parse_environment("production x", &env));
  EXPECT_FALSE(parse_environment("1", &env));
  EXPECT_EQ(env, Environment::S_TESTING); // Untouched on failure.
}

TEST(Error, Codes)
{
  const Error_code err_code = error::Code::S_UNKNOWN_ENVIRONMENT;
  EXPECT_TRUE(err_code);
  EXPECT_STREQ(err_code.category().name(), "quire-log");
  EXPECT_NE(err_code.message().find("development"), string::npos);

  const quire::error::Runtime_error exc(err_code, "ENVIRONMENT=qa");
  EXPECT_EQ(exc.code(), err_code);
  EXPECT_EQ(exc.context(), "ENVIRONMENT=qa");
  EXPECT_EQ(string(exc.what()).find("ENVIRONMENT=qa: "), 0u) << exc.what();
  EXPECT_NE(string(exc.what()).find("[quire-log:1]"), string::npos) << exc.what();

  const quire::error::Runtime_error plain("just context");
  EXPECT_FALSE(plain.code());
  EXPECT_STREQ(plain.what(), "just context");
}

} // namespace quire::log::test

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

#include "quire/log/logger_registry.hpp"
#include "quire/log/error/error.hpp"
#include "quire/error/error.hpp"
#include "quire/test/test_logger.hpp"
#include "quire/test/test_common_util.hpp"
#include "quire/test/test_file_util.hpp"
#include <gtest/gtest.h>
#include <boost/make_shared.hpp>
#include <boost/thread/thread.hpp>
#include <boost/thread/barrier.hpp>

namespace quire::log::test
{

namespace
{
using quire::test::Capture_handler;
using quire::test::make_capture_config;
using quire::test::Env_var_setter;
using quire::test::Temp_dir;
using quire::test::get_test_suite_name;
using std::string;
using std::vector;
} // Anonymous namespace.

TEST(Logger_registry, Same_instance)
{
  Context_store store;
  Logger_registry registry(&store);
  const auto capture = boost::make_shared<Capture_handler>();
  const auto config = make_capture_config("ignored", Sev::S_INFO, capture);

  const auto logger = registry.get("svc.api", config);
  ASSERT_TRUE(logger);
  EXPECT_EQ(logger->name(), "svc.api"); // The requested name wins over the config's.
  EXPECT_EQ(registry.get("svc.api", config), logger);
  EXPECT_EQ(registry.get("svc.api"), logger); // No config: whatever is cached.
  EXPECT_EQ(registry.size(), 1u);
  EXPECT_TRUE(registry.contains("svc.api"));
  EXPECT_FALSE(registry.contains("svc"));

  EXPECT_NE(registry.get("svc.db", config), logger);
  EXPECT_EQ(registry.size(), 2u);
}

TEST(Logger_registry, Changed_config_replaces)
{
  Context_store store;
  Logger_registry registry(&store);
  const auto capture = boost::make_shared<Capture_handler>();

  const auto info_logger = registry.get("svc", make_capture_config("svc", Sev::S_INFO, capture));
  const auto debug_logger = registry.get("svc", make_capture_config("svc", Sev::S_DEBUG, capture));
  EXPECT_NE(debug_logger, info_logger);
  EXPECT_EQ(debug_logger->level(), Sev::S_DEBUG);
  EXPECT_EQ(registry.size(), 1u);
  EXPECT_EQ(registry.get("svc", make_capture_config("svc", Sev::S_DEBUG, capture)), debug_logger);

  // The replaced instance stays usable by whoever still holds it.
  info_logger->warning("old instance");
  EXPECT_EQ(capture->entries().size(), 1u);
}

TEST(Logger_registry, Clear)
{
  Context_store store;
  Logger_registry registry(&store);
  const auto config = make_capture_config("svc", Sev::S_INFO, boost::make_shared<Capture_handler>());

  const auto first = registry.get("svc", config);
  registry.clear();
  EXPECT_EQ(registry.size(), 0u);
  EXPECT_FALSE(registry.contains("svc"));
  const auto second = registry.get("svc", config);
  EXPECT_NE(second, first);
  EXPECT_EQ(registry.get("svc", config), second);
}

TEST(Logger_registry, Failed_build_not_cached)
{
  Context_store store;
  Logger_registry registry(&store);
  Logger_config config;
  config.m_handlers.push_back(Handler_spec::custom([]() { return Handler_ptr(); }));

  EXPECT_THROW(registry.get("broken", config), error::Runtime_error);
  EXPECT_FALSE(registry.contains("broken"));
  EXPECT_EQ(registry.size(), 0u);
}

TEST(Logger_registry, Environment_driven)
{
  Context_store store;
  Logger_registry registry(&store);
  Temp_dir dir;

  {
    Env_var_setter env_var(Env_settings::S_ENVIRONMENT_VAR, string("testing"));
    const auto logger = registry.get("from.env");
    EXPECT_EQ(logger->level(), Sev::S_WARNING);
    EXPECT_EQ(logger->config().m_environment, Environment::S_TESTING);
  }
  {
    Env_var_setter env_var(Env_settings::S_ENVIRONMENT_VAR, string("nonsense"));
    EXPECT_EQ(registry.get("from.env")->level(), Sev::S_WARNING); // Cached: environment not consulted again.
    try
    {
      registry.get("from.env.2");
      ADD_FAILURE() << "Expected exception.";
    }
    catch (const error::Runtime_error& exc)
    {
      EXPECT_EQ(exc.code(), Error_code(error::Code::S_UNKNOWN_ENVIRONMENT));
    }
    EXPECT_FALSE(registry.contains("from.env.2"));
  }

  // Explicit environment and directory.
  const auto staging = registry.get("svc", Environment::S_STAGING, dir.path());
  EXPECT_EQ(staging->handlers().size(), 2u);
  EXPECT_TRUE(fs::exists(dir.path() / "svc.log"));
  EXPECT_EQ(registry.get("svc", Environment::S_STAGING, dir.path()), staging);
  EXPECT_NE(registry.get("svc", Environment::S_STAGING, dir.path() / "other"), staging);
  EXPECT_TRUE(fs::exists(dir.path() / "other" / "svc.log"));
}

TEST(Logger_registry, Concurrent_get)
{
  constexpr size_t N_THREADS = 8;
  Context_store store;
  Logger_registry registry(&store);
  const auto config = make_capture_config("svc", Sev::S_INFO, boost::make_shared<Capture_handler>());
  boost::barrier start(N_THREADS);
  vector<Logger_ptr> results(N_THREADS);

  boost::thread_group threads;
  for (size_t idx = 0; idx != N_THREADS; ++idx)
  {
    threads.create_thread([&, idx]()
    {
      start.wait();
      results[idx] = registry.get("shared", config);
    });
  }
  threads.join_all();

  for (const auto& result : results)
  {
    EXPECT_EQ(result, results.front());
  }
  EXPECT_EQ(registry.size(), 1u);
}

TEST(Logger_registry, Process_wide)
{
  Env_var_setter env_var(Env_settings::S_ENVIRONMENT_VAR, string("testing"));
  const auto name = get_test_suite_name() + ".process";

  const auto logger = get_logger(name);
  EXPECT_EQ(get_logger(name), logger);
  EXPECT_TRUE(Logger_registry::process_registry()->contains(name));

  clear_loggers();
  EXPECT_FALSE(Logger_registry::process_registry()->contains(name));
  EXPECT_NE(get_logger(name), logger);

  const auto capture = boost::make_shared<Capture_handler>();
  const auto configured = get_logger(name, make_capture_config(name, Sev::S_DEBUG, capture));
  EXPECT_EQ(configured->level(), Sev::S_DEBUG);
  EXPECT_EQ(get_logger(name), configured);
  clear_loggers();
}

} // namespace quire::log::test

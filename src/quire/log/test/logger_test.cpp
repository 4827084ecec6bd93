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

#include "quire/log/logger.hpp"
#include "quire/log/error/error.hpp"
#include "quire/error/error.hpp"
#include "quire/test/test_logger.hpp"
#include "quire/test/test_common_util.hpp"
#include "quire/test/test_file_util.hpp"
#include <gtest/gtest.h>
#include <boost/make_shared.hpp>
#include <boost/pointer_cast.hpp>
#include <boost/thread/thread.hpp>
#include <stdexcept>
#include <sstream>

namespace quire::log::test
{

namespace
{
using quire::test::Capture_handler;
using quire::test::Capture_filter;
using quire::test::make_capture_config;
using quire::test::parse_json;
using quire::test::collect_output;
using quire::test::split_lines;
using quire::test::check_output;
using quire::test::Temp_dir;
using boost::property_tree::ptree;
using std::string;
using std::vector;

struct Op_failure :
  public std::runtime_error
{
  explicit Op_failure(int id) :
    std::runtime_error("op failed"),
    m_id(id)
  {
  }
  int m_id;
};

/// Vetoes any record whose extra fields include "drop".
class Drop_filter :
  public Filter
{
public:
  bool apply(Record* record) const override
  {
    return !record->m_extra.contains("drop");
  }
};

class Throwing_filter :
  public Filter
{
public:
  bool apply(Record*) const override
  {
    throw std::runtime_error("filter exploded");
  }
};

/// Throws something that is not an `std::exception`.
class Int_throwing_filter :
  public Filter
{
public:
  bool apply(Record*) const override
  {
    throw 42;
  }
};

class Int_throwing_formatter :
  public Formatter
{
public:
  std::string render(const Record&) const override
  {
    throw 7;
  }
};

class Int_throwing_sink :
  public Handler
{
public:
  explicit Int_throwing_sink(std::ostream* fallback_os) :
    Handler(Sev::S_NONE, boost::make_shared<Json_formatter>(), fallback_os)
  {
  }

  std::string description() const override
  {
    return "Int_throwing_sink";
  }

protected:
  void do_write(util::String_view, Error_code*) override
  {
    throw 13;
  }
};

vector<ptree> parse_all(const Capture_handler& handler)
{
  vector<ptree> trees;
  for (const auto& entry : handler.entries())
  {
    trees.push_back(parse_json(entry));
  }
  return trees;
}

/// Logs through a Log_context, as a class in user code would.
class Widget :
  public Log_context
{
public:
  explicit Widget(Logger_ptr logger) :
    Log_context(std::move(logger))
  {
  }

  void run()
  {
    QUIRE_LOG_WARNING("widget running", Fields{ { "k", 1 } });
  }
};
} // Anonymous namespace.

TEST(Logger, Levels)
{
  Context_store store;
  const auto capture = boost::make_shared<Capture_handler>();
  Logger logger(make_capture_config("svc", Sev::S_INFO, capture), &store);

  EXPECT_EQ(logger.name(), "svc");
  EXPECT_EQ(logger.level(), Sev::S_INFO);
  EXPECT_FALSE(logger.should_log(Sev::S_DEBUG));
  EXPECT_TRUE(logger.should_log(Sev::S_INFO));
  EXPECT_FALSE(logger.should_log(Sev::S_NONE));

  logger.debug("d");
  logger.info("i");
  logger.warning("w");
  logger.error("e");
  logger.critical("c");

  const auto trees = parse_all(*capture);
  ASSERT_EQ(trees.size(), 4u);
  EXPECT_EQ(trees[0].get<string>("level"), "INFO");
  EXPECT_EQ(trees[0].get<string>("message"), "i");
  EXPECT_EQ(trees[1].get<string>("level"), "WARNING");
  EXPECT_EQ(trees[2].get<string>("level"), "ERROR");
  EXPECT_EQ(trees[3].get<string>("level"), "CRITICAL");
  EXPECT_EQ(trees[3].get<string>("logger"), "svc");
  // Nothing in flight: no error member even though critical() asks for one.
  EXPECT_FALSE(trees[3].get_child_optional("error"));
}

TEST(Logger, Handler_threshold_stricter)
{
  Context_store store;
  const auto loose = boost::make_shared<Capture_handler>();
  const auto strict = boost::make_shared<Capture_handler>(Sev::S_ERROR);
  auto config = make_capture_config("svc", Sev::S_DEBUG, loose);
  config.m_handlers.push_back(Handler_spec::custom([strict]() -> Handler_ptr { return strict; }));
  Logger logger(config, &store);

  logger.debug("a");
  logger.warning("b");
  logger.error("c");
  EXPECT_EQ(loose->entries().size(), 3u);
  ASSERT_EQ(strict->entries().size(), 1u);
  EXPECT_EQ(parse_json(strict->entries()[0]).get<string>("message"), "c");
}

TEST(Logger, Measure_time_success)
{
  Context_store store;
  const auto capture = boost::make_shared<Capture_handler>();
  Logger logger(make_capture_config("svc", Sev::S_DEBUG, capture), &store);

  const int result = logger.measure_time("compute", Fields{ { "order", 5 } }, []() { return 42; });
  EXPECT_EQ(result, 42);
  bool ran = false;
  logger.measure_time("side effect", [&]() { ran = true; });
  EXPECT_TRUE(ran);

  const auto trees = parse_all(*capture);
  ASSERT_EQ(trees.size(), 4u);
  EXPECT_EQ(trees[0].get<string>("level"), "DEBUG");
  EXPECT_EQ(trees[0].get<string>("message"), "Starting compute");
  EXPECT_EQ(trees[0].get<int>("extra.order"), 5);
  EXPECT_FALSE(trees[0].get_child_optional("extra.duration_ms"));
  EXPECT_EQ(trees[1].get<string>("level"), "INFO");
  EXPECT_EQ(trees[1].get<string>("message"), "Completed compute");
  EXPECT_EQ(trees[1].get<int>("extra.order"), 5);
  EXPECT_GE(trees[1].get<double>("extra.duration_ms"), 0.0);
  EXPECT_EQ(trees[3].get<string>("message"), "Completed side effect");
}

TEST(Logger, Measure_time_failure)
{
  Context_store store;
  const auto capture = boost::make_shared<Capture_handler>();
  Logger logger(make_capture_config("svc", Sev::S_DEBUG, capture), &store);

  try
  {
    logger.measure_time("charge", Fields{ { "order", 9 } }, []() -> int { throw Op_failure(17); });
    ADD_FAILURE() << "Expected exception.";
  }
  catch (const Op_failure& exc)
  {
    EXPECT_EQ(exc.m_id, 17); // The very same exception, not a copy of its message.
  }

  const auto trees = parse_all(*capture);
  ASSERT_EQ(trees.size(), 2u);
  EXPECT_EQ(trees[0].get<string>("message"), "Starting charge");
  EXPECT_EQ(trees[1].get<string>("level"), "ERROR");
  EXPECT_EQ(trees[1].get<string>("message"), "Failed charge");
  EXPECT_EQ(trees[1].get<int>("extra.order"), 9);
  EXPECT_GE(trees[1].get<double>("extra.duration_ms"), 0.0);
  EXPECT_NE(trees[1].get<string>("error.type").find("Op_failure"), string::npos);
  EXPECT_EQ(trees[1].get<string>("error.message"), "op failed");
  for (const auto& entry : capture->entries())
  {
    EXPECT_EQ(entry.find("Completed"), string::npos);
  }
}

TEST(Logger, Exception_capture)
{
  Context_store store;
  const auto capture = boost::make_shared<Capture_handler>();
  Logger logger(make_capture_config("svc", Sev::S_DEBUG, capture), &store);

  try
  {
    throw std::out_of_range("index 7");
  }
  catch (const std::exception&)
  {
    logger.exception("lookup failed", Fields{ { "idx", 7 } });
    logger.error("plain error");
    logger.error("error with capture", Fields(), true);
    logger.critical("critical");
  }

  const auto trees = parse_all(*capture);
  ASSERT_EQ(trees.size(), 4u);
  EXPECT_EQ(trees[0].get<string>("level"), "ERROR");
  EXPECT_EQ(trees[0].get<string>("error.type"), "std::out_of_range");
  EXPECT_EQ(trees[0].get<string>("error.message"), "index 7");
  EXPECT_FALSE(trees[1].get_child_optional("error"));
  EXPECT_TRUE(trees[2].get_child_optional("error"));
  EXPECT_EQ(trees[3].get<string>("error.type"), "std::out_of_range");
}

TEST(Logger, Testing_preset_to_stdout)
{
  Temp_dir dir;
  Context_store store;
  Logger logger(Logger_config::for_environment("app", Environment::S_TESTING, dir.path()), &store);

  const auto quiet = collect_output([&]() { logger.info("x"); });
  EXPECT_TRUE(quiet.empty()) << quiet;

  const auto output = collect_output([&]() { logger.warning("y", Fields{ { "code", 1 } }); });
  const auto lines = split_lines(output);
  ASSERT_EQ(lines.size(), 1u) << output;
  EXPECT_TRUE(check_output(output, { R"(^\[[-0-9 :.]+\] WARNING app: y \| code=1\n$)" })) << output;
  EXPECT_EQ(lines[0].find('\x1b'), string::npos); // Never colored.
}

TEST(Logger, Nested_request_context)
{
  Context_store store;
  const auto capture = boost::make_shared<Capture_handler>();
  Logger logger(make_capture_config("svc", Sev::S_DEBUG, capture), &store);

  {
    Context_scope outer(Fields{ { "request_id", "r1" } }, &store);
    {
      Context_scope inner(Fields{ { "request_id", "r2" } }, &store);
      logger.info("inner");
    }
    logger.info("outer");
  }
  logger.info("none");

  const auto trees = parse_all(*capture);
  ASSERT_EQ(trees.size(), 3u);
  EXPECT_EQ(trees[0].get<string>("context.request_id"), "r2");
  EXPECT_EQ(trees[1].get<string>("context.request_id"), "r1");
  EXPECT_TRUE(trees[2].get_child("context").empty());
}

TEST(Logger, Password_redacted_by_default)
{
  Context_store store;
  const auto capture = boost::make_shared<Capture_handler>();
  // No redaction filter configured; the logger adds one.
  Logger logger(make_capture_config("svc", Sev::S_DEBUG, capture), &store);
  ASSERT_EQ(logger.filters().size(), 2u);
  EXPECT_TRUE(boost::dynamic_pointer_cast<const Sensitive_data_filter>(logger.filters().back()));

  Context_scope scope(Fields{ { "session_id", "sess-1" } }, &store);
  logger.info("login", Fields{ { "user", "bob" }, { "password", "hunter2" } });

  const auto entries = capture->entries();
  ASSERT_EQ(entries.size(), 1u);
  const auto& entry = entries[0];
  EXPECT_EQ(entry.find("hunter2"), string::npos);
  EXPECT_EQ(entry.find("sess-1"), string::npos);
  const auto tree = parse_json(entry);
  EXPECT_EQ(tree.get<string>("extra.password"), Sensitive_data_filter::S_REDACTED);
  EXPECT_EQ(tree.get<string>("context.session_id"), Sensitive_data_filter::S_REDACTED);
  EXPECT_EQ(tree.get<string>("extra.user"), "bob");

  // Configured explicitly: used as-is, not doubled up.
  Logger logger2(make_capture_config("svc2", Sev::S_DEBUG, capture,
                                     { boost::make_shared<Sensitive_data_filter>(std::vector<string>{ "user" }) }),
                 &store);
  EXPECT_EQ(logger2.filters().size(), 2u);
  capture->reset();
  logger2.info("login", Fields{ { "user", "bob" } });
  EXPECT_EQ(capture->entries()[0].find("bob"), string::npos);
}

TEST(Logger, Reserved_extra_dropped)
{
  Context_store store;
  const auto capture = boost::make_shared<Capture_handler>();
  Logger logger(make_capture_config("svc", Sev::S_DEBUG, capture), &store);

  logger.info("real", Fields{ { "message", "fake" }, { "level", "CRITICAL" }, { "kept", 1 } });
  const auto tree = parse_json(capture->entries().at(0));
  EXPECT_EQ(tree.get<string>("message"), "real");
  EXPECT_EQ(tree.get<string>("level"), "INFO");
  EXPECT_EQ(tree.get_child("extra").size(), 1u);
  EXPECT_EQ(tree.get<int>("extra.kept"), 1);
}

TEST(Logger, Filters_veto_in_order)
{
  Context_store store;
  const auto capture = boost::make_shared<Capture_handler>();
  const auto seen = boost::make_shared<Capture_filter>();
  Logger logger(make_capture_config("svc", Sev::S_DEBUG, capture, { boost::make_shared<Drop_filter>(), seen }), &store);

  logger.info("kept");
  logger.info("dropped", Fields{ { "drop", true } });

  ASSERT_EQ(capture->entries().size(), 1u);
  // The veto short-circuits: later stages never see the record.
  ASSERT_EQ(seen->records().size(), 1u);
  EXPECT_EQ(seen->records()[0].m_message, "kept");
}

TEST(Logger, Never_throws)
{
  Context_store store;
  std::ostringstream fallback;
  const auto capture = boost::make_shared<Capture_handler>();

  Logger logger(make_capture_config("svc", Sev::S_DEBUG, capture, { boost::make_shared<Throwing_filter>() }),
                &store, &fallback);
  logger.info("lost");
  EXPECT_TRUE(capture->entries().empty());
  EXPECT_NE(fallback.str().find("Dropped entry [lost]"), string::npos) << fallback.str();
  EXPECT_NE(fallback.str().find("filter exploded"), string::npos);

  // A broken sink is reported on its fallback; the other handlers still get the entry.
  std::ostringstream bad_os;
  bad_os.setstate(std::ios_base::badbit);
  std::ostringstream sink_fallback;
  const auto capture2 = boost::make_shared<Capture_handler>();
  auto config = make_capture_config("svc2", Sev::S_DEBUG, capture2);
  auto bad_spec = Handler_spec::stream(Sev::S_NONE, Handler_spec::Format::S_JSON);
  bad_spec.m_stream = &bad_os;
  config.m_handlers.insert(config.m_handlers.begin(), bad_spec);
  Logger logger2(config, &store, &sink_fallback);

  logger2.warning("still delivered");
  ASSERT_EQ(capture2->entries().size(), 1u);
  EXPECT_NE(sink_fallback.str().find("Write failed"), string::npos) << sink_fallback.str();
  EXPECT_NE(sink_fallback.str().find("still delivered"), string::npos);

  // Same with things thrown that aren't `std::exception`s.
  std::ostringstream odd_fallback;
  const auto capture3 = boost::make_shared<Capture_handler>();
  Logger logger3(make_capture_config("svc3", Sev::S_DEBUG, capture3, { boost::make_shared<Int_throwing_filter>() }),
                 &store, &odd_fallback);
  EXPECT_NO_THROW(logger3.info("int from filter"));
  EXPECT_TRUE(capture3->entries().empty());
  EXPECT_NE(odd_fallback.str().find("Dropped entry [int from filter] (unknown exception)"), string::npos)
    << odd_fallback.str();

  const auto bad_format = boost::make_shared<Capture_handler>(Sev::S_NONE,
                                                              boost::make_shared<Int_throwing_formatter>());
  const auto capture4 = boost::make_shared<Capture_handler>();
  auto config4 = make_capture_config("svc4", Sev::S_DEBUG, capture4);
  config4.m_handlers.insert(config4.m_handlers.begin(),
                            Handler_spec::custom([bad_format]() -> Handler_ptr { return bad_format; }));
  std::ostringstream sink_fallback4;
  const auto bad_sink = boost::make_shared<Int_throwing_sink>(&sink_fallback4);
  config4.m_handlers.push_back(Handler_spec::custom([bad_sink]() -> Handler_ptr { return bad_sink; }));
  Logger logger4(config4, &store, &odd_fallback);
  EXPECT_NO_THROW(logger4.error("int from formatter and sink"));
  EXPECT_TRUE(bad_format->entries().empty());
  ASSERT_EQ(capture4->entries().size(), 1u);
  EXPECT_NE(sink_fallback4.str().find("Sink threw (unknown exception)"), string::npos) << sink_fallback4.str();
  EXPECT_NE(sink_fallback4.str().find("int from formatter and sink"), string::npos);
  EXPECT_NO_THROW(logger4.flush());
}

TEST(Logger, Null_filter_rejected)
{
  Context_store store;
  const auto capture = boost::make_shared<Capture_handler>();
  try
  {
    Logger logger(make_capture_config("svc", Sev::S_DEBUG, capture, { Filter_ptr() }), &store);
    ADD_FAILURE() << "Expected exception.";
  }
  catch (const error::Runtime_error& exc)
  {
    EXPECT_EQ(exc.code(), Error_code(error::Code::S_NULL_FILTER));
  }
}

TEST(Logger, Macros)
{
  Context_store store;
  const auto capture = boost::make_shared<Capture_handler>();
  const auto logger = boost::make_shared<Logger>(make_capture_config("svc", Sev::S_INFO, capture), &store);

  Widget widget(logger);
  widget.run();

  {
    QUIRE_LOG_SET_LOGGER(logger);
    int n_evaluated = 0;
    const auto costly = [&]() { ++n_evaluated; return string("costly"); };
    QUIRE_LOG_DEBUG(costly()); // Below level: arguments never evaluated.
    EXPECT_EQ(n_evaluated, 0);
    QUIRE_LOG_INFO(costly());
    EXPECT_EQ(n_evaluated, 1);

    try
    {
      throw std::logic_error("bad state");
    }
    catch (const std::exception&)
    {
      QUIRE_LOG_EXCEPTION("caught");
      QUIRE_LOG_CRITICAL("fatal", Fields{ { "phase", "shutdown" } });
    }
  }

  const auto trees = parse_all(*capture);
  ASSERT_EQ(trees.size(), 4u);
  EXPECT_EQ(trees[0].get<string>("message"), "widget running");
  EXPECT_EQ(trees[0].get<string>("module"), "logger_test");
  EXPECT_EQ(trees[0].get<string>("function"), "run");
  EXPECT_GT(trees[0].get<int>("line"), 0);
  EXPECT_EQ(trees[0].get<int>("extra.k"), 1);

  EXPECT_EQ(trees[1].get<string>("message"), "costly");
  EXPECT_EQ(trees[1].get<string>("function"), "TestBody");

  EXPECT_EQ(trees[2].get<string>("level"), "ERROR");
  EXPECT_EQ(trees[2].get<string>("error.type"), "std::logic_error");
  EXPECT_EQ(trees[3].get<string>("level"), "CRITICAL");
  EXPECT_EQ(trees[3].get<string>("error.message"), "bad state");
  EXPECT_EQ(trees[3].get<string>("extra.phase"), "shutdown");
}

TEST(Logger, Concurrent)
{
  constexpr int N_THREADS = 8;
  constexpr int N_PER_THREAD = 200;

  Context_store store;
  const auto capture = boost::make_shared<Capture_handler>();
  Logger logger(make_capture_config("svc", Sev::S_DEBUG, capture), &store);

  boost::thread_group threads;
  for (int thread_idx = 0; thread_idx != N_THREADS; ++thread_idx)
  {
    threads.create_thread([&, thread_idx]()
    {
      Context_scope scope(Fields{ { "thread", thread_idx } }, &store);
      for (int idx = 0; idx != N_PER_THREAD; ++idx)
      {
        logger.info("tick", Fields{ { "idx", idx } });
      }
    });
  }
  threads.join_all();

  const auto entries = capture->entries();
  ASSERT_EQ(entries.size(), size_t(N_THREADS * N_PER_THREAD));
  vector<int> per_thread(N_THREADS, 0);
  for (const auto& entry : entries)
  {
    ++per_thread.at(parse_json(entry).get<int>("context.thread"));
  }
  for (const auto count : per_thread)
  {
    EXPECT_EQ(count, N_PER_THREAD);
  }
}

} // namespace quire::log::test

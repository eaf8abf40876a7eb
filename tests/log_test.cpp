#include "flowcore/util/log.hpp"

#include "test_utils.hpp"

#include <cstdio>
#include <fstream>
#include <regex>
#include <sstream>
#include <string>

#include "gtest/gtest.h"

using namespace flowcore;

namespace {

auto read_all(const std::string &path) -> std::string {
  std::ifstream in(path);
  std::stringstream buf;
  buf << in.rdbuf();
  return buf.str();
}

} // namespace

TEST(LogTest, LineCarriesTimestampLevelAndThread) {
  const auto path = test::make_temp_path("flowcore_log_");
  ASSERT_FALSE(path.empty());
  {
    log::Logger logger;
    ASSERT_TRUE(logger.set_output_file(path));
    logger.log(log::Level::Warn, "step {} timed out", "extract");
  }
  const auto text = read_all(path);
  std::remove(path.c_str());

  const std::regex line(
      R"(\[\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}(\.\d+)?\] \[warn\] \[\d+\] step extract timed out\n)");
  EXPECT_TRUE(std::regex_match(text, line)) << text;
}

TEST(LogTest, QueuedLinesAreFlushedOnStop) {
  const auto path = test::make_temp_path("flowcore_log_");
  ASSERT_FALSE(path.empty());
  {
    log::Logger logger;
    ASSERT_TRUE(logger.set_output_file(path));
    logger.set_level(log::Level::Debug);
    logger.start();
    for (int i = 0; i < 10; ++i) {
      logger.log(log::Level::Debug, "line {}", i);
    }
    logger.log(log::Level::Trace, "below the level");
    logger.stop();
  }
  const auto text = read_all(path);
  std::remove(path.c_str());

  EXPECT_NE(text.find("] [debug] ["), std::string::npos);
  EXPECT_NE(text.find("line 0\n"), std::string::npos);
  EXPECT_NE(text.find("line 9\n"), std::string::npos);
  EXPECT_EQ(text.find("below the level"), std::string::npos);
}

TEST(LogTest, ParseLevelAcceptsKnownNamesOnly) {
  EXPECT_EQ(log::parse_level("warn"), log::Level::Warn);
  EXPECT_EQ(log::parse_level("trace"), log::Level::Trace);
  EXPECT_FALSE(log::parse_level("verbose").has_value());
  EXPECT_FALSE(log::parse_level("WARN").has_value());
}

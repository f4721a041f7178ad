/**
 * @file Args_uTest.cpp
 * @brief Unit tests for cascade::helpers::args.
 */

#include "src/helpers/inc/Args.hpp"

#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <vector>

using cascade::helpers::args::ArgMap;
using cascade::helpers::args::has;
using cascade::helpers::args::ParsedArgs;
using cascade::helpers::args::parseArgs;
using cascade::helpers::args::value;

namespace {

enum Key : std::uint8_t { HELP = 0, PORT = 1, CONFIG = 2 };

ArgMap makeMap(bool configRequired = false) {
  ArgMap map;
  map[HELP] = {"--help", 0, false, "Show help"};
  map[PORT] = {"--port", 1, false, "Listen port"};
  map[CONFIG] = {"--config", 1, configRequired, "Config path"};
  return map;
}

} // namespace

class ArgsTest : public ::testing::Test {
protected:
  ParsedArgs pargs_;
  std::string error_;
};

/** @test Flags with values are captured and unknown tokens ignored. */
TEST_F(ArgsTest, CapturesValues) {
  const std::vector<std::string_view> ARGS{"stray", "--port", "9000", "--help"};
  ASSERT_TRUE(parseArgs(ARGS, makeMap(), pargs_, &error_)) << error_;
  EXPECT_TRUE(has(pargs_, HELP));
  ASSERT_TRUE(value(pargs_, PORT).has_value());
  EXPECT_EQ(*value(pargs_, PORT), "9000");
  EXPECT_FALSE(has(pargs_, CONFIG));
}

/** @test A flag at the end without its value fails. */
TEST_F(ArgsTest, MissingValueFails) {
  const std::vector<std::string_view> ARGS{"--port"};
  EXPECT_FALSE(parseArgs(ARGS, makeMap(), pargs_, &error_));
  EXPECT_NE(error_.find("--port"), std::string::npos);
}

/** @test Required flags are enforced, including on empty input. */
TEST_F(ArgsTest, RequiredEnforced) {
  const std::vector<std::string_view> NONE;
  EXPECT_FALSE(parseArgs(NONE, makeMap(true), pargs_, &error_));
  EXPECT_NE(error_.find("--config"), std::string::npos);

  pargs_.clear();
  EXPECT_TRUE(parseArgs(NONE, makeMap(false), pargs_, &error_));
}

/** @test A repeated flag keeps the last value. */
TEST_F(ArgsTest, LastValueWins) {
  const std::vector<std::string_view> ARGS{"--port", "1", "--port", "2"};
  ASSERT_TRUE(parseArgs(ARGS, makeMap(), pargs_));
  EXPECT_EQ(*value(pargs_, PORT), "2");
}

/**
 * @file Log_uTest.cpp
 * @brief Unit tests for cascade::helpers::log.
 */

#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Log.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>

using cascade::helpers::log::Level;
using cascade::helpers::log::Logger;
using cascade::helpers::log::parseLevel;

class LogTest : public ::testing::Test {
protected:
  std::filesystem::path path_;

  void SetUp() override {
    path_ = std::filesystem::temp_directory_path() / "cascade_log_test.log";
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    Logger::instance().setConsole(false);
    ASSERT_TRUE(Logger::instance().setFile(path_.string()));
  }

  void TearDown() override {
    Logger::instance().setLevel(Level::Info);
    (void)Logger::instance().setFile("");
    Logger::instance().setConsole(true);
    std::error_code ec;
    std::filesystem::remove(path_, ec);
  }
};

/** @test Level names parse case-insensitively. */
TEST_F(LogTest, ParseLevel) {
  Level level = Level::Info;
  EXPECT_TRUE(parseLevel("DEBUG", level));
  EXPECT_EQ(level, Level::Debug);
  EXPECT_TRUE(parseLevel("warn", level));
  EXPECT_EQ(level, Level::Warn);
  EXPECT_FALSE(parseLevel("verbose", level));
  EXPECT_EQ(level, Level::Warn);
}

/** @test Lines carry level, category and formatted message. */
TEST_F(LogTest, WritesFormattedLine) {
  cascade::helpers::log::warn("composer", "adapter {} failed: {}", "gpu", 3);
  const std::string TEXT = cascade::helpers::files::readFile(path_);
  EXPECT_NE(TEXT.find("[WARN] [composer] adapter gpu failed: 3"), std::string::npos) << TEXT;
}

/** @test Messages below the threshold are dropped. */
TEST_F(LogTest, FiltersBelowLevel) {
  Logger::instance().setLevel(Level::Error);
  cascade::helpers::log::info("test", "hidden");
  cascade::helpers::log::error("test", "shown");
  const std::string TEXT = cascade::helpers::files::readFile(path_);
  EXPECT_EQ(TEXT.find("hidden"), std::string::npos);
  EXPECT_NE(TEXT.find("shown"), std::string::npos);
}

/** @test Debug lines appear only once the threshold is lowered to Debug. */
TEST_F(LogTest, DebugNeedsDebugLevel) {
  Logger::instance().setLevel(Level::Info);
  cascade::helpers::log::debug("hub", "dropped {}", 1);
  Logger::instance().setLevel(Level::Debug);
  cascade::helpers::log::debug("hub", "kept {}", 2);
  const std::string TEXT = cascade::helpers::files::readFile(path_);
  EXPECT_EQ(TEXT.find("dropped 1"), std::string::npos);
  EXPECT_NE(TEXT.find("[DEBUG] [hub] kept 2"), std::string::npos) << TEXT;
}

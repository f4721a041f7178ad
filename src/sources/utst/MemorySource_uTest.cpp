/**
 * @file MemorySource_uTest.cpp
 * @brief Unit tests for cascade::sources::MemorySource.
 */

#include "src/helpers/utst/FakeRoot.hpp"
#include "src/sources/inc/MemorySource.hpp"

#include <gtest/gtest.h>

using cascade::sources::MemorySource;
using cascade::sources::parseMeminfo;
using cascade::testing::FakeRoot;

/** @test Used memory is total minus available. */
TEST(MemorySourceTest, ParseMeminfo) {
  const auto MEM = parseMeminfo("MemTotal:       1000 kB\n"
                                "MemFree:         100 kB\n"
                                "MemAvailable:    250 kB\n"
                                "SwapTotal:       400 kB\n"
                                "SwapFree:        300 kB\n");
  ASSERT_TRUE(MEM.has_value());
  EXPECT_EQ(MEM->totalBytes, 1000U * 1024U);
  EXPECT_EQ(MEM->usedBytes, 750U * 1024U);
  EXPECT_EQ(MEM->swapUsedBytes, 100U * 1024U);
  EXPECT_DOUBLE_EQ(MEM->usedPercent, 75.0);
}

/** @test MemFree stands in when MemAvailable is missing. */
TEST(MemorySourceTest, FallbackToMemFree) {
  const auto MEM = parseMeminfo("MemTotal: 200 kB\nMemFree: 50 kB\n");
  ASSERT_TRUE(MEM.has_value());
  EXPECT_DOUBLE_EQ(MEM->usedPercent, 75.0);
}

/** @test Missing MemTotal is a failed pull. */
TEST(MemorySourceTest, MissingTotalFails) {
  EXPECT_FALSE(parseMeminfo("MemFree: 50 kB\n").has_value());
  FakeRoot root;
  MemorySource source(root.path());
  EXPECT_FALSE(source.collect().has_value());
}

/** @test Live host: usage is within bounds. */
TEST(MemorySourceTest, LiveHostInvariants) {
  MemorySource source;
  const auto MEM = source.collect();
  if (!MEM) {
    GTEST_SKIP() << "/proc/meminfo not readable";
  }
  EXPECT_GT(MEM->totalBytes, 0U);
  EXPECT_LE(MEM->usedBytes, MEM->totalBytes);
  EXPECT_GE(MEM->usedPercent, 0.0);
  EXPECT_LE(MEM->usedPercent, 100.0);
}

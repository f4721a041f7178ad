/**
 * @file MonitorSettings_uTest.cpp
 * @brief Unit tests for cascade::snapshot::MonitorSettings and categories.
 */

#include "src/snapshot/inc/MonitorSettings.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using cascade::snapshot::ALL_CATEGORIES;
using cascade::snapshot::Category;
using cascade::snapshot::EnabledSet;
using cascade::snapshot::MonitorSettings;
using cascade::snapshot::parseCategory;

/** @test Category names parse back to the same category. */
TEST(MonitorSettingsTest, CategoryNamesParse) {
  for (const Category C : ALL_CATEGORIES) {
    const auto PARSED = parseCategory(cascade::snapshot::toString(C));
    ASSERT_TRUE(PARSED.has_value());
    EXPECT_EQ(*PARSED, C);
  }
  EXPECT_EQ(parseCategory("disks"), Category::Disk);
  EXPECT_FALSE(parseCategory("fans").has_value());
}

/** @test Everything is enabled by default. */
TEST(MonitorSettingsTest, DefaultsAllEnabled) {
  MonitorSettings settings;
  for (const Category C : ALL_CATEGORIES) {
    EXPECT_TRUE(settings.isEnabled(C));
  }
}

/** @test Changes are visible in later copies only. */
TEST(MonitorSettingsTest, CopyIsDetached) {
  MonitorSettings settings;
  const EnabledSet BEFORE = settings.enabled();
  settings.setEnabled(Category::Network, false);
  EXPECT_TRUE(BEFORE.test(Category::Network));
  EXPECT_FALSE(settings.enabled().test(Category::Network));
}

/** @test Name lists convert both ways; unknown names are rejected. */
TEST(MonitorSettingsTest, FromNames) {
  std::string error;
  const auto SET = EnabledSet::fromNames({"cpu", "memory"}, &error);
  ASSERT_TRUE(SET.has_value()) << error;
  EXPECT_EQ(SET->names(), (std::vector<std::string>{"cpu", "memory"}));

  EXPECT_FALSE(EnabledSet::fromNames({"cpu", "psu"}, &error).has_value());
  EXPECT_NE(error.find("psu"), std::string::npos);
}

/**
 * @file MonitorConfig_uTest.cpp
 * @brief Defaults, range checks, partial updates and file handling.
 */

#include "src/service/inc/MonitorConfig.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Json.hpp"
#include "src/helpers/utst/FakeRoot.hpp"

#include <gtest/gtest.h>

#include <string>

using cascade::service::MonitorConfig;
using cascade::testing::FakeRoot;

namespace {

Json::Value doc(const char* text) {
  Json::Value v;
  EXPECT_TRUE(cascade::helpers::json::parse(text, v)) << text;
  return v;
}

} // namespace

/* ----------------------------- Validation ----------------------------- */

TEST(MonitorConfigTest, DefaultsAreValid) {
  const MonitorConfig C{};
  std::string err;
  EXPECT_TRUE(cascade::service::validate(C, &err)) << err;
  EXPECT_EQ(C.pollingInterval, 1000U);
  EXPECT_EQ(C.historyRetention, 3600);
  EXPECT_EQ(C.wsPort, 8086);
  EXPECT_EQ(C.enabledSensors.size(), 5U);
}

TEST(MonitorConfigTest, RangeBoundaries) {
  MonitorConfig c{};
  c.pollingInterval = 100;
  EXPECT_TRUE(cascade::service::validate(c));
  c.pollingInterval = 99;
  EXPECT_FALSE(cascade::service::validate(c));
  c.pollingInterval = 60000;
  EXPECT_TRUE(cascade::service::validate(c));
  c.pollingInterval = 60001;
  EXPECT_FALSE(cascade::service::validate(c));

  c = MonitorConfig{};
  c.historyRetention = 59;
  EXPECT_FALSE(cascade::service::validate(c));
  c.historyRetention = 2592000;
  EXPECT_TRUE(cascade::service::validate(c));

  c = MonitorConfig{};
  c.unifiedInterval = 999;
  EXPECT_FALSE(cascade::service::validate(c));

  c = MonitorConfig{};
  c.wsPort = 1023;
  EXPECT_FALSE(cascade::service::validate(c));
}

TEST(MonitorConfigTest, AuthRequiresApiKey) {
  MonitorConfig c{};
  c.enableAuth = true;
  std::string err;
  EXPECT_FALSE(cascade::service::validate(c, &err));
  EXPECT_NE(err.find("apiKey"), std::string::npos);
  c.apiKey = "secret";
  EXPECT_TRUE(cascade::service::validate(c));
}

TEST(MonitorConfigTest, UnknownCategoryRejected) {
  MonitorConfig c{};
  c.enabledSensors = {"cpu", "fans"};
  std::string err;
  EXPECT_FALSE(cascade::service::validate(c, &err));
  EXPECT_NE(err.find("fans"), std::string::npos);
}

/* ----------------------------- applyJson ----------------------------- */

TEST(MonitorConfigTest, ApplyJsonOverlaysPresentFields) {
  MonitorConfig c{};
  ASSERT_TRUE(cascade::service::applyJson(
      doc(R"({"pollingInterval":2000,"enabledSensors":["cpu"],"enableHistory":false})"), c));
  EXPECT_EQ(c.pollingInterval, 2000U);
  EXPECT_EQ(c.enabledSensors, (std::vector<std::string>{"cpu"}));
  EXPECT_FALSE(c.enableHistory);
  EXPECT_EQ(c.wsPort, 8086);
}

TEST(MonitorConfigTest, ApplyJsonTypeErrorsLeaveConfig) {
  MonitorConfig c{};
  std::string err;
  EXPECT_FALSE(cascade::service::applyJson(doc(R"({"pollingInterval":"fast"})"), c, &err));
  EXPECT_NE(err.find("pollingInterval"), std::string::npos);
  EXPECT_FALSE(cascade::service::applyJson(doc(R"({"enableAuth":1})"), c));
  EXPECT_FALSE(cascade::service::applyJson(doc(R"({"enabledSensors":"cpu"})"), c));
  EXPECT_FALSE(cascade::service::applyJson(doc(R"({"enabledSensors":[1]})"), c));
  EXPECT_FALSE(cascade::service::applyJson(doc(R"([1,2])"), c));
  EXPECT_EQ(c, MonitorConfig{});
}

TEST(MonitorConfigTest, ApplyJsonOutOfRangeIntegers) {
  MonitorConfig c{};
  ASSERT_TRUE(cascade::service::applyJson(doc(R"({"pollingInterval":-5})"), c));
  EXPECT_FALSE(cascade::service::validate(c));

  MonitorConfig d{};
  EXPECT_FALSE(cascade::service::applyJson(doc(R"({"wsPort":70000})"), d));
  EXPECT_EQ(d.wsPort, 8086);
}

TEST(MonitorConfigTest, JsonRoundTrip) {
  MonitorConfig c{};
  c.apiKey = "k";
  c.enableAuth = true;
  c.wsPort = 9000;
  MonitorConfig back{};
  ASSERT_TRUE(cascade::service::applyJson(cascade::service::toJson(c), back));
  EXPECT_EQ(back, c);
}

/* ----------------------------- updateConfig ----------------------------- */

TEST(MonitorConfigTest, UpdateUnchangedOnFailure) {
  MonitorConfig c{};
  std::string err;
  EXPECT_FALSE(cascade::service::updateConfig(c, doc(R"({"pollingInterval":50})"), &err));
  EXPECT_FALSE(err.empty());
  EXPECT_EQ(c, MonitorConfig{});

  EXPECT_FALSE(cascade::service::updateConfig(c, doc(R"({"enableAuth":true})")));
  EXPECT_FALSE(c.enableAuth);

  ASSERT_TRUE(cascade::service::updateConfig(c, doc(R"({"historyRetention":120})")));
  EXPECT_EQ(c.historyRetention, 120);
}

/* ----------------------------- Files ----------------------------- */

TEST(MonitorConfigTest, LoadMissingWritesDefaults) {
  FakeRoot root;
  const auto PATH = root.path() / "config" / "cascade.json";
  const MonitorConfig C = cascade::service::loadConfig(PATH);
  EXPECT_EQ(C, MonitorConfig{});
  ASSERT_TRUE(cascade::helpers::files::pathExists(PATH));

  Json::Value written;
  ASSERT_TRUE(cascade::helpers::json::loadFile(PATH, written));
  EXPECT_EQ(written["pollingInterval"].asInt(), 1000);
}

TEST(MonitorConfigTest, LoadInvalidFallsBackToDefaults) {
  FakeRoot root;
  root.write("bad.json", "{ not json");
  EXPECT_EQ(cascade::service::loadConfig(root.path() / "bad.json"), MonitorConfig{});

  root.write("range.json", R"({"pollingInterval":5})");
  EXPECT_EQ(cascade::service::loadConfig(root.path() / "range.json"), MonitorConfig{});
}

TEST(MonitorConfigTest, LoadPartialDocument) {
  FakeRoot root;
  root.write("c.json", R"({"pollingInterval":250,"bindAddress":"0.0.0.0"})");
  const MonitorConfig C = cascade::service::loadConfig(root.path() / "c.json");
  EXPECT_EQ(C.pollingInterval, 250U);
  EXPECT_EQ(C.bindAddress, "0.0.0.0");
  EXPECT_EQ(C.unifiedInterval, 5000U);
}

TEST(MonitorConfigTest, SaveRejectsInvalid) {
  FakeRoot root;
  MonitorConfig c{};
  c.pollingInterval = 1;
  const auto PATH = root.path() / "out.json";
  EXPECT_FALSE(cascade::service::saveConfig(PATH, c));
  EXPECT_FALSE(cascade::helpers::files::pathExists(PATH));

  c.pollingInterval = 500;
  ASSERT_TRUE(cascade::service::saveConfig(PATH, c));
  EXPECT_EQ(cascade::service::loadConfig(PATH), c);
}

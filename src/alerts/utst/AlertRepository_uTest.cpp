/**
 * @file AlertRepository_uTest.cpp
 * @brief Loading and saving the alert rule file.
 */

#include "src/alerts/inc/AlertRepository.hpp"
#include "src/helpers/utst/FakeRoot.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using cascade::alerts::Alert;
using cascade::alerts::AlertRepository;
using cascade::alerts::Condition;
using cascade::testing::FakeRoot;

TEST(AlertRepositoryTest, MissingFileIsEmpty) {
  FakeRoot root;
  AlertRepository repo(root.path() / "alerts.json");
  std::vector<Alert> out{Alert{}};
  EXPECT_TRUE(repo.load(out));
  EXPECT_TRUE(out.empty());
}

TEST(AlertRepositoryTest, EmptyPathDisablesPersistence) {
  AlertRepository repo;
  std::vector<Alert> out;
  EXPECT_TRUE(repo.save({Alert{}}));
  EXPECT_TRUE(repo.load(out));
  EXPECT_TRUE(out.empty());
}

TEST(AlertRepositoryTest, SaveThenLoad) {
  FakeRoot root;
  AlertRepository repo(root.path() / "config" / "alerts.json");

  Alert a{};
  a.id = "a1";
  a.name = "Hot CPU";
  a.sensorPath = "cpu.temperature";
  a.condition = Condition::Above;
  a.thresholdMax = 85.0;
  a.lastTriggered = 1000;
  a.triggerCount = 2;
  ASSERT_TRUE(repo.save({a}));

  std::vector<Alert> out;
  ASSERT_TRUE(repo.load(out));
  ASSERT_EQ(out.size(), 1U);
  EXPECT_EQ(out[0].id, "a1");
  EXPECT_EQ(out[0].name, "Hot CPU");
  EXPECT_DOUBLE_EQ(out[0].thresholdMax, 85.0);
  EXPECT_EQ(out[0].triggerCount, 2U);
}

/** @test Invalid entries are dropped; entries without an id get one. */
TEST(AlertRepositoryTest, SkipsInvalidEntries) {
  FakeRoot root;
  root.write("alerts.json", R"([
    {"name":"ok","sensorPath":"cpu.load","condition":"above","thresholdMax":90},
    {"name":"","sensorPath":"cpu.load","condition":"above"},
    {"name":"bad range","sensorPath":"x","condition":"between","thresholdMin":5,"thresholdMax":1},
    42
  ])");
  AlertRepository repo(root.path() / "alerts.json");
  std::vector<Alert> out;
  ASSERT_TRUE(repo.load(out));
  ASSERT_EQ(out.size(), 1U);
  EXPECT_EQ(out[0].name, "ok");
  EXPECT_FALSE(out[0].id.empty());
}

/** @test Bad persisted counters never abort the load. */
TEST(AlertRepositoryTest, MalformedCountersDoNotThrow) {
  FakeRoot root;
  root.write("alerts.json", R"([
    {"id":"a","name":"neg","sensorPath":"cpu.load","condition":"above","triggerCount":-1},
    {"id":"b","name":"huge","sensorPath":"cpu.load","condition":"above","triggerCount":1e30,
     "lastTriggered":1e30},
    {"id":"c","name":"frac","sensorPath":"cpu.load","condition":"above","triggerCount":2.5,
     "lastTriggered":1700000000000}
  ])");
  AlertRepository repo(root.path() / "alerts.json");
  std::vector<Alert> out;
  std::string err;
  ASSERT_NO_THROW(EXPECT_TRUE(repo.load(out, &err)) << err);
  ASSERT_EQ(out.size(), 3U);
  for (const Alert& A : out) {
    EXPECT_EQ(A.triggerCount, 0U) << A.name;
  }
  EXPECT_FALSE(out[1].lastTriggered.has_value());
  EXPECT_EQ(out[2].lastTriggered.value_or(0), 1700000000000);
}

/** @test Windows longer than a year are rejected on load. */
TEST(AlertRepositoryTest, SkipsOversizedCooldown) {
  FakeRoot root;
  root.write("alerts.json", R"([
    {"name":"forever","sensorPath":"cpu.load","condition":"above","cooldown":1e17},
    {"name":"yearly","sensorPath":"cpu.load","condition":"above","cooldown":31536000}
  ])");
  AlertRepository repo(root.path() / "alerts.json");
  std::vector<Alert> out;
  ASSERT_TRUE(repo.load(out));
  ASSERT_EQ(out.size(), 1U);
  EXPECT_EQ(out[0].name, "yearly");
}

TEST(AlertRepositoryTest, NonArrayIsError) {
  FakeRoot root;
  root.write("alerts.json", R"({"name":"x"})");
  AlertRepository repo(root.path() / "alerts.json");
  std::vector<Alert> out;
  std::string err;
  EXPECT_FALSE(repo.load(out, &err));
  EXPECT_FALSE(err.empty());

  root.write("broken.json", "[{");
  AlertRepository broken(root.path() / "broken.json");
  EXPECT_FALSE(broken.load(out));
}

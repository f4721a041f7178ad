/**
 * @file UnifiedNormalizer_uTest.cpp
 * @brief Merge behavior with fake sources.
 */

#include "src/unified/inc/UnifiedNormalizer.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cmath>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

using cascade::unified::NormalizationSource;
using cascade::unified::RawSensor;
using cascade::unified::SensorType;
using cascade::unified::Status;
using cascade::unified::UnifiedNormalizer;

namespace {

RawSensor raw(std::string id, std::string label, double value) {
  RawSensor s{};
  s.id = std::move(id);
  s.name = s.id;
  s.typeLabel = std::move(label);
  s.value = value;
  return s;
}

class FakeSource final : public NormalizationSource {
public:
  FakeSource(const char* tag, std::vector<RawSensor> sensors, bool available = true)
      : tag_(tag), sensors_(std::move(sensors)), available_(available) {}

  const char* name() const noexcept override { return tag_; }
  const char* tag() const noexcept override { return tag_; }
  bool available() override { return available_; }

  std::vector<RawSensor> read() override {
    const int NOW = ++inFlight_;
    int prev = peak_.load();
    while (NOW > prev && !peak_.compare_exchange_weak(prev, NOW)) {
    }
    std::this_thread::sleep_for(delay_);
    --inFlight_;
    if (throws_) {
      throw std::runtime_error("device gone");
    }
    return sensors_;
  }

  bool throws_{false};
  std::chrono::milliseconds delay_{0};

  static std::atomic<int> inFlight_;
  static std::atomic<int> peak_;

private:
  const char* tag_;
  std::vector<RawSensor> sensors_;
  bool available_;
};

std::atomic<int> FakeSource::inFlight_{0};
std::atomic<int> FakeSource::peak_{0};

} // namespace

/** @test Sources keep registration order; sensors keep source order; no dedup. */
TEST(UnifiedNormalizerTest, MergeOrderAndIds) {
  UnifiedNormalizer norm([] { return std::int64_t{42}; });
  norm.addSource(std::make_shared<FakeSource>(
      "lm", std::vector<RawSensor>{raw("core0", "temperature", 50), raw("fan1", "fan", 900)}));
  norm.addSource(
      std::make_shared<FakeSource>("lhm", std::vector<RawSensor>{raw("core0", "level", 30)}));

  const auto DATA = norm.merge();
  ASSERT_EQ(DATA.sensors.size(), 3U);
  EXPECT_EQ(DATA.sensors[0].id, "lm-core0");
  EXPECT_EQ(DATA.sensors[1].id, "lm-fan1");
  EXPECT_EQ(DATA.sensors[2].id, "lhm-core0");
  EXPECT_EQ(DATA.sensors[2].type, SensorType::Load);
  EXPECT_EQ(DATA.timestamp, 42);
  ASSERT_EQ(DATA.sources.size(), 2U);
  EXPECT_TRUE(DATA.sources[0].available);
  EXPECT_EQ(DATA.sources[0].sensorCount, 2U);
}

/** @test Unavailable and throwing sources contribute nothing; the merge succeeds. */
TEST(UnifiedNormalizerTest, FailingSourcesIsolated) {
  auto broken = std::make_shared<FakeSource>(
      "ipmi", std::vector<RawSensor>{raw("x", "temperature", 99)});
  broken->throws_ = true;

  UnifiedNormalizer norm;
  norm.addSource(std::make_shared<FakeSource>(
      "hwinfo", std::vector<RawSensor>{raw("y", "temperature", 99)}, false));
  norm.addSource(broken);
  norm.addSource(
      std::make_shared<FakeSource>("lm", std::vector<RawSensor>{raw("z", "temperature", 99)}));

  const auto DATA = norm.merge();
  ASSERT_EQ(DATA.sensors.size(), 1U);
  EXPECT_EQ(DATA.sensors[0].id, "lm-z");
  EXPECT_EQ(DATA.sensors[0].status, Status::Critical);
  EXPECT_FALSE(DATA.sources[0].available);
  EXPECT_FALSE(DATA.sources[1].available);
  EXPECT_TRUE(DATA.sources[2].available);
}

/** @test Non-finite values are dropped. */
TEST(UnifiedNormalizerTest, NonFiniteDropped) {
  UnifiedNormalizer norm;
  norm.addSource(std::make_shared<FakeSource>(
      "lm", std::vector<RawSensor>{raw("nan", "voltage", std::nan("")),
                                   raw("inf", "voltage",
                                       std::numeric_limits<double>::infinity()),
                                   raw("ok", "voltage", 1.2)}));
  const auto DATA = norm.merge();
  ASSERT_EQ(DATA.sensors.size(), 1U);
  EXPECT_EQ(DATA.sensors[0].id, "lm-ok");
}

/** @test Sources are read concurrently and the last merge is cached. */
TEST(UnifiedNormalizerTest, ConcurrentReadsAndCache) {
  FakeSource::peak_ = 0;
  auto a = std::make_shared<FakeSource>("a", std::vector<RawSensor>{raw("1", "load", 1)});
  auto b = std::make_shared<FakeSource>("b", std::vector<RawSensor>{raw("1", "load", 1)});
  a->delay_ = std::chrono::milliseconds(100);
  b->delay_ = std::chrono::milliseconds(100);

  UnifiedNormalizer norm;
  EXPECT_FALSE(norm.last().has_value());
  norm.addSource(a);
  norm.addSource(b);
  (void)norm.collect();
  EXPECT_EQ(FakeSource::peak_.load(), 2);
  ASSERT_TRUE(norm.last().has_value());
  EXPECT_EQ(norm.last()->sensors.size(), 2U);
}

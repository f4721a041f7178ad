/**
 * @file ReadingExtractor_uTest.cpp
 * @brief Unit tests for cascade::snapshot::extractReadings.
 */

#include "src/snapshot/inc/ReadingExtractor.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using cascade::snapshot::CpuData;
using cascade::snapshot::DiskData;
using cascade::snapshot::extractReadings;
using cascade::snapshot::GpuData;
using cascade::snapshot::NetworkData;
using cascade::snapshot::ReadingList;
using cascade::snapshot::ReadingType;
using cascade::snapshot::Snapshot;

namespace {

Snapshot makeFullSnapshot() {
  Snapshot snap{};
  snap.timestamp = 1'700'000'000'000;

  snap.cpu.present = true;
  snap.cpu.load = 37.5;
  snap.cpu.temperature = 61.0;
  snap.cpu.temperatureMax = 105.0;

  GpuData gpu{};
  gpu.name = "Radeon";
  gpu.utilization = 12.0;
  gpu.temperature = 48.0;
  gpu.memoryUtilization = 30.0;
  gpu.fan = 22.0;
  snap.gpus.push_back(gpu);

  snap.memory.present = true;
  snap.memory.usedPercent = 55.0;

  DiskData disk{};
  disk.mount = "/";
  disk.usePercent = 71.0;
  disk.temperature = 39.0;
  snap.disks.push_back(disk);

  NetworkData eth{};
  eth.iface = "eth0";
  eth.rxSec = 1000.0;
  eth.txSec = 200.0;
  NetworkData wlan{};
  wlan.iface = "wlan0";
  wlan.rxSec = 24.0;
  wlan.txSec = 6.0;
  snap.network = {eth, wlan};
  return snap;
}

std::vector<std::string> paths(const ReadingList& readings) {
  std::vector<std::string> out;
  for (const auto& R : readings) {
    out.push_back(R.source);
  }
  return out;
}

} // namespace

/** @test Full snapshot yields the canonical paths in canonical order. */
TEST(ReadingExtractorTest, CanonicalOrder) {
  const ReadingList READINGS = extractReadings(makeFullSnapshot());
  const std::vector<std::string> EXPECTED{
      "cpu.load",   "cpu.temperature", "gpu.0.load",   "gpu.0.temperature",    "gpu.0.memory",
      "gpu.0.fan",  "memory.used",     "disk.0.usage", "disk.0.temperature",   "network.rx",
      "network.tx"};
  EXPECT_EQ(paths(READINGS), EXPECTED);
}

/** @test Identical snapshots give identical lists. */
TEST(ReadingExtractorTest, Deterministic) {
  const Snapshot SNAP = makeFullSnapshot();
  const ReadingList A = extractReadings(SNAP);
  for (int i = 0; i < 5; ++i) {
    EXPECT_EQ(extractReadings(SNAP), A);
  }
}

/** @test Every reading carries the snapshot timestamp. */
TEST(ReadingExtractorTest, StampedWithSnapshotTime) {
  const Snapshot SNAP = makeFullSnapshot();
  for (const auto& R : extractReadings(SNAP)) {
    EXPECT_EQ(R.timestamp, SNAP.timestamp) << R.source;
  }
}

/** @test Network rates are summed across interfaces. */
TEST(ReadingExtractorTest, NetworkSummed) {
  const ReadingList READINGS = extractReadings(makeFullSnapshot());
  ASSERT_GE(READINGS.size(), 2U);
  EXPECT_EQ(READINGS[READINGS.size() - 2].source, "network.rx");
  EXPECT_DOUBLE_EQ(READINGS[READINGS.size() - 2].value, 1024.0);
  EXPECT_DOUBLE_EQ(READINGS.back().value, 206.0);
}

/** @test Absent sub-records and optional fields are omitted, not zero-filled. */
TEST(ReadingExtractorTest, AbsentOmitted) {
  Snapshot snap{};
  snap.timestamp = 5;
  snap.cpu.present = true;
  snap.cpu.load = 10.0; // no temperature
  GpuData gpu{};
  gpu.temperature = 50.0; // only temperature
  snap.gpus.push_back(gpu);
  DiskData disk{};
  disk.usePercent = 10.0;
  disk.temperature = 0.0; // reported as zero: dropped
  snap.disks.push_back(disk);

  const std::vector<std::string> EXPECTED{"cpu.load", "gpu.0.temperature", "disk.0.usage"};
  EXPECT_EQ(paths(extractReadings(snap)), EXPECTED);
}

/** @test An empty snapshot yields no readings. */
TEST(ReadingExtractorTest, EmptySnapshot) {
  EXPECT_TRUE(extractReadings(Snapshot{}).empty());
}

/** @test Temperature max falls back to 100 when the source gives none. */
TEST(ReadingExtractorTest, TemperatureMaxFallback) {
  Snapshot snap{};
  snap.cpu.present = true;
  snap.cpu.temperature = 70.0;
  const ReadingList READINGS = extractReadings(snap);
  ASSERT_EQ(READINGS.size(), 2U);
  EXPECT_EQ(READINGS[1].type, ReadingType::Temperature);
  EXPECT_DOUBLE_EQ(READINGS[1].max, 100.0);
  EXPECT_EQ(READINGS[1].unit, "°C");
}

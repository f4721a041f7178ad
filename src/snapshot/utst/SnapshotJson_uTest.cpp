/**
 * @file SnapshotJson_uTest.cpp
 * @brief Unit tests for the snapshot JSON views.
 */

#include "src/snapshot/inc/SnapshotJson.hpp"

#include <gtest/gtest.h>

using cascade::snapshot::GpuData;
using cascade::snapshot::Snapshot;
using cascade::snapshot::toJson;

/** @test Disabled categories keep the snapshot shape complete. */
TEST(SnapshotJsonTest, EmptyShapeComplete) {
  const Json::Value V = toJson(Snapshot{});
  EXPECT_TRUE(V["cpu"].isObject());
  EXPECT_TRUE(V["cpu"].empty());
  EXPECT_TRUE(V["memory"].isObject());
  EXPECT_TRUE(V["gpu"].isArray());
  EXPECT_TRUE(V["disks"].isArray());
  EXPECT_TRUE(V["network"].isArray());
  EXPECT_EQ(V["timestamp"].asInt64(), 0);
}

/** @test Absent optional values serialize as null. */
TEST(SnapshotJsonTest, OptionalsAsNull) {
  GpuData gpu{};
  gpu.utilization = 80.0;
  const Json::Value V = toJson(gpu);
  EXPECT_DOUBLE_EQ(V["utilizationGpu"].asDouble(), 80.0);
  EXPECT_TRUE(V["temperature"].isNull());
}

/** @test Present CPU data carries its fields. */
TEST(SnapshotJsonTest, CpuFields) {
  Snapshot snap{};
  snap.timestamp = 42;
  snap.cpu.present = true;
  snap.cpu.brand = "Test CPU";
  snap.cpu.coreLoads = {1.0, 2.0};
  const Json::Value V = toJson(snap);
  EXPECT_EQ(V["cpu"]["brand"].asString(), "Test CPU");
  EXPECT_EQ(V["cpu"]["coreLoads"].size(), 2U);
  EXPECT_EQ(V["timestamp"].asInt64(), 42);
}

/**
 * @file DiskSource_uTest.cpp
 * @brief Unit tests for cascade::sources::DiskSource.
 */

#include "src/sources/inc/DiskSource.hpp"

#include <gtest/gtest.h>

using cascade::sources::DiskSource;
using cascade::sources::parseMounts;

/** @test Only /dev devices are kept, each once. */
TEST(DiskSourceTest, ParseMountsFilters) {
  const auto MOUNTS = parseMounts("proc /proc proc rw 0 0\n"
                                  "/dev/sda2 / ext4 rw,relatime 0 0\n"
                                  "tmpfs /tmp tmpfs rw 0 0\n"
                                  "/dev/sda2 /var/snap ext4 rw 0 0\n"
                                  "/dev/sdb1 /mnt/my\\040disk vfat rw 0 0\n");
  ASSERT_EQ(MOUNTS.size(), 2U);
  EXPECT_EQ(MOUNTS[0].device, "/dev/sda2");
  EXPECT_EQ(MOUNTS[0].mount, "/");
  EXPECT_EQ(MOUNTS[0].fsType, "ext4");
  EXPECT_EQ(MOUNTS[1].mount, "/mnt/my disk");
}

/** @test Live host: usage figures are consistent. */
TEST(DiskSourceTest, LiveHostInvariants) {
  DiskSource source;
  const auto DISKS = source.collect();
  if (!DISKS) {
    GTEST_SKIP() << "/proc/mounts not readable";
  }
  for (const auto& D : *DISKS) {
    EXPECT_LE(D.usedBytes, D.sizeBytes) << D.mount;
    EXPECT_GE(D.usePercent, 0.0) << D.mount;
    EXPECT_LE(D.usePercent, 100.0) << D.mount;
  }
}

/**
 * @file DeviceTypes_uTest.cpp
 * @brief Unit tests for blkref::storage device number parsing and status strings.
 */

#include "src/storage/inc/DeviceTypes.hpp"

#include <gtest/gtest.h>

#include <cstring>

using blkref::storage::DeviceNumber;
using blkref::storage::DeviceStatus;
using blkref::storage::Geometry;
using blkref::storage::parseDeviceNumber;

/* ----------------------------- parseDeviceNumber Tests ----------------------------- */

/** @test Kernel "dev" records parse with their trailing newline. */
TEST(ParseDeviceNumberTest, KernelRecord) {
  DeviceNumber num{};
  ASSERT_TRUE(parseDeviceNumber("8:0\n", num));
  EXPECT_EQ(num.major, 8U);
  EXPECT_EQ(num.minor, 0U);

  ASSERT_TRUE(parseDeviceNumber("259:3", num));
  EXPECT_EQ(num.major, 259U);
  EXPECT_EQ(num.minor, 3U);
}

/** @test Anything but "<digits>:<digits>" is rejected. */
TEST(ParseDeviceNumberTest, Malformed) {
  DeviceNumber num{};
  EXPECT_FALSE(parseDeviceNumber("", num));
  EXPECT_FALSE(parseDeviceNumber("8", num));
  EXPECT_FALSE(parseDeviceNumber("8:", num));
  EXPECT_FALSE(parseDeviceNumber(":0", num));
  EXPECT_FALSE(parseDeviceNumber("a:b", num));
  EXPECT_FALSE(parseDeviceNumber("8:0:1", num));
  EXPECT_FALSE(parseDeviceNumber("-1:0", num));
  EXPECT_FALSE(parseDeviceNumber("8 :0", num));
}

/** @test toString renders "major:minor". */
TEST(DeviceNumberTest, ToString) {
  const DeviceNumber NUM{8, 16};
  EXPECT_EQ(NUM.toString(), "8:16");
  EXPECT_EQ(NUM, (DeviceNumber{8, 16}));
}

/* ----------------------------- Geometry Tests ----------------------------- */

/** @test Default geometry has nothing known. */
TEST(GeometryTest, DefaultEmpty) {
  Geometry geo{};
  EXPECT_TRUE(geo.empty());
  geo.sectorSizeBytes = 512;
  EXPECT_FALSE(geo.empty());
}

/* ----------------------------- toString Tests ----------------------------- */

/** @test Every status has a non-empty name. */
TEST(DeviceStatusTest, ToString) {
  EXPECT_STREQ(toString(DeviceStatus::OK), "OK");
  EXPECT_STREQ(toString(DeviceStatus::DEVICE_NOT_FOUND), "DEVICE_NOT_FOUND");
  EXPECT_GT(std::strlen(toString(DeviceStatus::RESOLUTION_FAILED)), 0U);
  EXPECT_GT(std::strlen(toString(DeviceStatus::METADATA_UNAVAILABLE)), 0U);
  EXPECT_GT(std::strlen(toString(DeviceStatus::MALFORMED_RECORD)), 0U);
}

/**
 * @file BlockDevice_uTest.cpp
 * @brief Unit tests for blkref::storage::BlockDevice.
 *
 * Notes:
 *  - Most tests run against in-memory fakes so results are exact.
 *  - LinuxSystemTest asserts invariants only and skips without block devices.
 */

#include "src/storage/inc/BlockDevice.hpp"
#include "src/storage/utst/FakeDeviceServices.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

using blkref::storage::BlockDevice;
using blkref::storage::DeviceNumber;
using blkref::storage::DeviceServices;
using blkref::storage::DeviceStatus;
using blkref::storage::Geometry;
using blkref::storage::LinuxDeviceServices;
using blkref::storage::test::FakeSystem;

namespace {

constexpr const char* ATA_ALIAS = "/dev/disk/by-id/ata-Samsung_SSD_870_S6PNNX0R";
constexpr const char* WWN_ALIAS = "/dev/disk/by-id/wwn-0x5002538e40a0b1c2";
constexpr const char* PATH_ALIAS = "/dev/disk/by-path/pci-0000:00:17.0-ata-1";

} // namespace

class BlockDeviceTest : public ::testing::Test {
protected:
  FakeSystem sys_{};
  DeviceServices services_ = sys_.services();

  void SetUp() override {
    sys_.fs.blockDevices = {"/dev/sda", "/dev/sda1", "/dev/sdb", "/dev/sdc"};
    sys_.fs.links[ATA_ALIAS] = "/dev/sda";
    sys_.fs.links[WWN_ALIAS] = "/dev/sda";
    sys_.fs.links["/dev/block/8:0"] = "/dev/sda";

    auto& sda = sys_.metadata.properties["/dev/sda"];
    sda["DEVLINKS"] = std::string(WWN_ALIAS) + " " + PATH_ALIAS + " " + ATA_ALIAS;
    sda["ID_MODEL"] = "Samsung_SSD_870_EVO_1TB";
    sda["ID_SERIAL_SHORT"] = "S6PNNX0R";

    sys_.metadata.properties["/dev/sdc"]["DEVLINKS"] = PATH_ALIAS;

    sys_.kernel.records["sda/dev"] = "8:0\n";
    sys_.kernel.records["sda/size"] = "1953525168\n";
    sys_.kernel.records["sda/queue/logical_block_size"] = "512\n";
    sys_.kernel.records["sda/queue/physical_block_size"] = "4096\n";
    sys_.kernel.records["sda1/dev"] = "8:1\n";
    sys_.kernel.records["sda1/size"] = "2048\n";
    sys_.kernel.records["sda1/../queue/logical_block_size"] = "512\n";
    sys_.kernel.records["sda1/../queue/physical_block_size"] = "4096\n";
    sys_.kernel.records["sdc/dev"] = "garbage\n";
    sys_.kernel.records["sdc/size"] = "n/a\n";
  }
};

/* ----------------------------- Existence Tests ----------------------------- */

/** @test Block special files exist; anything else does not. */
TEST_F(BlockDeviceTest, Exists) {
  EXPECT_TRUE(BlockDevice("/dev/sda", services_).exists());
  EXPECT_TRUE(BlockDevice(ATA_ALIAS, services_).exists());
  EXPECT_FALSE(BlockDevice("/tmp/regular-file", services_).exists());
}

/** @test assertExists reports DEVICE_NOT_FOUND for missing devices. */
TEST_F(BlockDeviceTest, AssertExists) {
  EXPECT_EQ(BlockDevice("/dev/sda", services_).assertExists(), DeviceStatus::OK);
  EXPECT_EQ(BlockDevice("/dev/sdz", services_).assertExists(), DeviceStatus::DEVICE_NOT_FOUND);
}

/* ----------------------------- Path Tests ----------------------------- */

/** @test A kernel path is held as given. */
TEST_F(BlockDeviceTest, KernelPathKept) {
  const BlockDevice DEV("/dev/sda", services_);
  EXPECT_EQ(DEV.getDeviceFile(), "/dev/sda");
}

/** @test A by-id input is canonicalized and the preferred alias still wins. */
TEST_F(BlockDeviceTest, ByIdInputPrioritized) {
  BlockDevice dev(WWN_ALIAS, services_);
  EXPECT_EQ(dev.getDeviceFile(), "/dev/sda");

  const auto BY_ID = dev.getDeviceFileById();
  ASSERT_TRUE(BY_ID.has_value());
  EXPECT_EQ(*BY_ID, ATA_ALIAS);
}

/** @test Every name of one disk yields the same stored reference. */
TEST_F(BlockDeviceTest, SameReferenceForEveryEntryPath) {
  for (const char* entry : {"/dev/sda", "/dev/block/8:0", WWN_ALIAS, ATA_ALIAS}) {
    BlockDevice dev(entry, services_);
    EXPECT_EQ(dev.getDeviceFileById().value_or(""), ATA_ALIAS) << entry;
    EXPECT_EQ(dev.getPredictableDeviceFile(), ATA_ALIAS) << entry;
  }
}

/** @test An unresolvable by-id path stays as given. */
TEST_F(BlockDeviceTest, ByIdInputUnresolved) {
  BlockDevice dev("/dev/disk/by-id/ata-Missing", services_);
  EXPECT_EQ(dev.getDeviceFile(), "/dev/disk/by-id/ata-Missing");
  EXPECT_FALSE(dev.exists());
  EXPECT_EQ(dev.getDeviceName(), "disk/by-id/ata-Missing");
}

/** @test Only the literal "/dev/" prefix is removed from the name. */
TEST_F(BlockDeviceTest, DeviceName) {
  EXPECT_EQ(BlockDevice("/dev/sda", services_).getDeviceName(), "sda");

  BlockDevice dev("/dev/block/8:0", services_);
  EXPECT_EQ(dev.getDeviceName(), "block/8:0");
  EXPECT_EQ(dev.getDeviceName(true), "sda");

  BlockDevice outside("/srv/images/disk0", services_);
  EXPECT_EQ(outside.getDeviceName(), "/srv/images/disk0");
}

/** @test The canonical path is resolved once and then kept. */
TEST_F(BlockDeviceTest, CanonicalSnapshot) {
  BlockDevice dev("/dev/block/8:0", services_);
  std::string canonical;
  ASSERT_EQ(dev.getCanonicalDeviceFile(canonical), DeviceStatus::OK);
  EXPECT_EQ(canonical, "/dev/sda");

  sys_.fs.links["/dev/block/8:0"] = "/dev/sdb";
  ASSERT_EQ(dev.getCanonicalDeviceFile(canonical), DeviceStatus::OK);
  EXPECT_EQ(canonical, "/dev/sda");
  EXPECT_EQ(sys_.fs.realPathCalls, 1);
}

/** @test Resolution failure is reported and leaves out untouched. */
TEST_F(BlockDeviceTest, CanonicalFailure) {
  BlockDevice dev("/dev/gone", services_);
  std::string canonical = "untouched";
  EXPECT_EQ(dev.getCanonicalDeviceFile(canonical), DeviceStatus::RESOLUTION_FAILED);
  EXPECT_EQ(canonical, "untouched");
}

/* ----------------------------- Alias Tests ----------------------------- */

/** @test The ata alias outranks wwn regardless of listing order. */
TEST_F(BlockDeviceTest, ByIdSelectsBestAlias) {
  BlockDevice dev("/dev/sda", services_);
  EXPECT_TRUE(dev.hasDeviceFileById());
  EXPECT_EQ(dev.getDeviceFileById().value_or(""), ATA_ALIAS);
}

/** @test The provider is consulted once per handle. */
TEST_F(BlockDeviceTest, ByIdCached) {
  BlockDevice dev("/dev/sda", services_);
  const auto FIRST = dev.getDeviceFileById();
  const auto SECOND = dev.getDeviceFileById();
  EXPECT_EQ(FIRST, SECOND);
  EXPECT_EQ(sys_.metadata.queries, 1);
}

/** @test A miss is cached too. */
TEST_F(BlockDeviceTest, ByIdMissCached) {
  BlockDevice dev("/dev/sdb", services_);
  EXPECT_FALSE(dev.getDeviceFileById().has_value());
  EXPECT_FALSE(dev.hasDeviceFileById());
  EXPECT_EQ(sys_.metadata.queries, 1);
}

/** @test invalidate() forces the next lookup to query again. */
TEST_F(BlockDeviceTest, Invalidate) {
  BlockDevice dev("/dev/sdb", services_);
  EXPECT_FALSE(dev.hasDeviceFileById());

  sys_.metadata.properties["/dev/sdb"]["DEVLINKS"] = "/dev/disk/by-id/scsi-1";
  EXPECT_FALSE(dev.hasDeviceFileById());

  dev.invalidate();
  EXPECT_EQ(dev.getDeviceFileById().value_or(""), "/dev/disk/by-id/scsi-1");
  EXPECT_EQ(sys_.metadata.queries, 2);
}

/** @test by-path aliases are looked up independently. */
TEST_F(BlockDeviceTest, ByPath) {
  BlockDevice dev("/dev/sda", services_);
  EXPECT_TRUE(dev.hasDeviceFileByPath());
  EXPECT_EQ(dev.getDeviceFileByPath().value_or(""), PATH_ALIAS);
}

/** @test by-path names are ordered naturally, without the by-id class ranks. */
TEST_F(BlockDeviceTest, ByPathNaturalOrder) {
  sys_.fs.blockDevices.insert("/dev/sdd");
  sys_.metadata.properties["/dev/sdd"]["DEVLINKS"] =
      "/dev/disk/by-path/scsi-2 /dev/disk/by-path/pci-10 /dev/disk/by-path/pci-9";

  BlockDevice dev("/dev/sdd", services_);
  EXPECT_EQ(dev.getDeviceFileByPath().value_or(""), "/dev/disk/by-path/pci-9");
}

/** @test by-id is preferred, then by-path, then the device file. */
TEST_F(BlockDeviceTest, PredictableDeviceFile) {
  BlockDevice sda("/dev/sda", services_);
  EXPECT_EQ(sda.getPredictableDeviceFile(), ATA_ALIAS);

  BlockDevice sdc("/dev/sdc", services_);
  EXPECT_EQ(sdc.getPredictableDeviceFile(), PATH_ALIAS);

  BlockDevice sdb("/dev/sdb", services_);
  EXPECT_EQ(sdb.getPredictableDeviceFile(), "/dev/sdb");
}

/** @test Canonical node first, then every distinct link. */
TEST_F(BlockDeviceTest, DeviceFiles) {
  BlockDevice dev("/dev/block/8:0", services_);
  const std::vector<std::string> EXPECTED{"/dev/sda", WWN_ALIAS, PATH_ALIAS, ATA_ALIAS};
  EXPECT_EQ(dev.getDeviceFiles(), EXPECTED);
}

/* ----------------------------- Device Number Tests ----------------------------- */

/** @test The kernel record is parsed into major and minor. */
TEST_F(BlockDeviceTest, DeviceNumber) {
  BlockDevice dev(ATA_ALIAS, services_);
  DeviceNumber num{};
  ASSERT_EQ(dev.readDeviceNumber(num), DeviceStatus::OK);
  EXPECT_EQ(num, (DeviceNumber{8, 0}));
  EXPECT_EQ(dev.getMajor().value_or(99), 8U);
  EXPECT_EQ(dev.getMinor().value_or(99), 0U);
  EXPECT_EQ(dev.getDescription(), "Block device sda [8:0]");
}

/** @test Missing and malformed records are distinguished. */
TEST_F(BlockDeviceTest, DeviceNumberFailures) {
  BlockDevice sdb("/dev/sdb", services_);
  DeviceNumber num{};
  EXPECT_EQ(sdb.readDeviceNumber(num), DeviceStatus::DEVICE_NOT_FOUND);
  EXPECT_FALSE(sdb.getMajor().has_value());
  EXPECT_EQ(sdb.getDescription(), "Block device sdb [unknown]");

  BlockDevice sdc("/dev/sdc", services_);
  EXPECT_EQ(sdc.readDeviceNumber(num), DeviceStatus::MALFORMED_RECORD);
  EXPECT_FALSE(sdc.getDeviceNumber().has_value());
}

/* ----------------------------- Geometry Tests ----------------------------- */

/** @test Nothing is known before loading. */
TEST_F(BlockDeviceTest, GeometryUnset) {
  const BlockDevice DEV("/dev/sda", services_);
  EXPECT_TRUE(DEV.geometry().empty());
  EXPECT_FALSE(DEV.getSize().has_value());
  EXPECT_FALSE(DEV.getBlockSize().has_value());
  EXPECT_FALSE(DEV.getSectorSize().has_value());
}

/** @test Size is reported in 512-byte units; queue limits give block sizes. */
TEST_F(BlockDeviceTest, LoadGeometry) {
  BlockDevice dev("/dev/sda", services_);
  ASSERT_EQ(dev.loadGeometry(), DeviceStatus::OK);
  EXPECT_EQ(dev.getSize().value_or(0), 1953525168ULL * 512ULL);
  EXPECT_EQ(dev.getSectorSize().value_or(0), 512U);
  EXPECT_EQ(dev.getBlockSize().value_or(0), 4096U);
}

/** @test A partition takes its queue limits from the parent disk. */
TEST_F(BlockDeviceTest, LoadGeometryPartition) {
  BlockDevice dev("/dev/sda1", services_);
  ASSERT_EQ(dev.loadGeometry(), DeviceStatus::OK);
  EXPECT_EQ(dev.getSize().value_or(0), 2048ULL * 512ULL);
  EXPECT_EQ(dev.getSectorSize().value_or(0), 512U);
  EXPECT_EQ(dev.getBlockSize().value_or(0), 4096U);
}

/** @test Failed loads keep the previous geometry. */
TEST_F(BlockDeviceTest, LoadGeometryFailures) {
  Geometry preset{};
  preset.sizeBytes = 4096;

  BlockDevice sdb("/dev/sdb", services_);
  sdb.setGeometry(preset);
  EXPECT_EQ(sdb.loadGeometry(), DeviceStatus::DEVICE_NOT_FOUND);
  EXPECT_EQ(sdb.getSize().value_or(0), 4096U);

  BlockDevice sdc("/dev/sdc", services_);
  sdc.setGeometry(preset);
  EXPECT_EQ(sdc.loadGeometry(), DeviceStatus::MALFORMED_RECORD);
  EXPECT_EQ(sdc.getSize().value_or(0), 4096U);
}

/* ----------------------------- Metadata Tests ----------------------------- */

/** @test Identification strings are made readable; missing ones are empty. */
TEST_F(BlockDeviceTest, Identification) {
  const BlockDevice DEV("/dev/sda", services_);
  EXPECT_EQ(DEV.getModel(), "Samsung SSD 870 EVO 1TB");
  EXPECT_EQ(DEV.getSerialNumber(), "S6PNNX0R");
  EXPECT_EQ(DEV.getVendor(), "");
  EXPECT_TRUE(DEV.hasUdevProperty("ID_MODEL"));
  EXPECT_FALSE(DEV.hasUdevProperty("ID_VENDOR"));
}

/* ----------------------------- Linux System Tests ----------------------------- */

/** @test Any real block device reports a number and a consistent description. */
TEST(LinuxSystemTest, RealDeviceInvariants) {
  const LinuxDeviceServices SYSTEM;
  std::error_code ec;
  for (const auto& ENTRY : std::filesystem::directory_iterator("/sys/class/block", ec)) {
    const std::string NODE = "/dev/" + ENTRY.path().filename().string();
    BlockDevice dev(NODE, SYSTEM.services());
    if (!dev.exists()) {
      continue;
    }

    const auto NUM = dev.getDeviceNumber();
    ASSERT_TRUE(NUM.has_value()) << NODE;
    EXPECT_EQ(dev.getDescription(), "Block device " + dev.getDeviceName() + " [" +
                                        NUM->toString() + "]");

    const std::string PREDICTABLE = dev.getPredictableDeviceFile();
    EXPECT_FALSE(PREDICTABLE.empty());
    if (const auto BY_ID = dev.getDeviceFileById()) {
      EXPECT_EQ(BY_ID->rfind("/dev/disk/by-id/", 0), 0U);
    }
    return;
  }
  GTEST_SKIP() << "No block devices visible";
}

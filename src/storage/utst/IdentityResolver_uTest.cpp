/**
 * @file IdentityResolver_uTest.cpp
 * @brief Unit tests for blkref::storage::IdentityResolver against fake services.
 */

#include "src/storage/inc/IdentityResolver.hpp"
#include "src/storage/utst/FakeDeviceServices.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using blkref::storage::BY_PATH_DIR;
using blkref::storage::DeviceStatus;
using blkref::storage::IdentityResolver;
using blkref::storage::test::FakeSystem;

class IdentityResolverTest : public ::testing::Test {
protected:
  FakeSystem sys_{};

  void SetUp() override {
    sys_.fs.blockDevices = {"/dev/sda"};
    sys_.fs.links["/dev/disk/by-id/ata-Samsung_SSD_1"] = "/dev/sda";
    sys_.metadata.properties["/dev/sda"]["DEVLINKS"] =
        "/dev/disk/by-id/wwn-0x5002  /dev/disk/by-path/pci-0000:00:17.0-ata-1\n"
        "disk/by-id/ata-Samsung_SSD_1 /dev/disk/by-id/sub/nested";
  }
};

/* ----------------------------- resolveCanonical Tests ----------------------------- */

/** @test Symlinks resolve to the kernel node. */
TEST_F(IdentityResolverTest, ResolvesLink) {
  const IdentityResolver RES(sys_.fs, sys_.metadata);
  std::string out;
  ASSERT_EQ(RES.resolveCanonical("/dev/disk/by-id/ata-Samsung_SSD_1", out), DeviceStatus::OK);
  EXPECT_EQ(out, "/dev/sda");
}

/** @test Missing and empty paths fail. */
TEST_F(IdentityResolverTest, ResolveFailures) {
  const IdentityResolver RES(sys_.fs, sys_.metadata);
  std::string out = "untouched";
  EXPECT_EQ(RES.resolveCanonical("/dev/sdz", out), DeviceStatus::RESOLUTION_FAILED);
  EXPECT_EQ(RES.resolveCanonical("", out), DeviceStatus::RESOLUTION_FAILED);
  EXPECT_EQ(out, "untouched");
}

/* ----------------------------- listDeviceLinks Tests ----------------------------- */

/** @test Entries split on any whitespace and become absolute. */
TEST_F(IdentityResolverTest, DeviceLinksAbsolute) {
  const IdentityResolver RES(sys_.fs, sys_.metadata);
  const std::vector<std::string> LINKS = RES.listDeviceLinks("/dev/sda");
  const std::vector<std::string> EXPECTED{
      "/dev/disk/by-id/wwn-0x5002", "/dev/disk/by-path/pci-0000:00:17.0-ata-1",
      "/dev/disk/by-id/ata-Samsung_SSD_1", "/dev/disk/by-id/sub/nested"};
  EXPECT_EQ(LINKS, EXPECTED);
}

/** @test No metadata means no links. */
TEST_F(IdentityResolverTest, NoMetadata) {
  const IdentityResolver RES(sys_.fs, sys_.metadata);
  EXPECT_TRUE(RES.listDeviceLinks("/dev/sdb").empty());
  EXPECT_TRUE(RES.listAliases("/dev/sdb").empty());
}

/* ----------------------------- listAliases Tests ----------------------------- */

/** @test Only direct children of the directory are returned, by last segment. */
TEST_F(IdentityResolverTest, AliasesInById) {
  const IdentityResolver RES(sys_.fs, sys_.metadata);
  const std::vector<std::string> EXPECTED{"wwn-0x5002", "ata-Samsung_SSD_1"};
  EXPECT_EQ(RES.listAliases("/dev/sda"), EXPECTED);
}

/** @test Another directory filters on that directory instead. */
TEST_F(IdentityResolverTest, AliasesInByPath) {
  const IdentityResolver RES(sys_.fs, sys_.metadata);
  const std::vector<std::string> EXPECTED{"pci-0000:00:17.0-ata-1"};
  EXPECT_EQ(RES.listAliases("/dev/sda", BY_PATH_DIR), EXPECTED);
}

/** @test An empty directory returns every link unfiltered. */
TEST_F(IdentityResolverTest, AliasesUnfiltered) {
  const IdentityResolver RES(sys_.fs, sys_.metadata);
  EXPECT_EQ(RES.listAliases("/dev/sda", ""), RES.listDeviceLinks("/dev/sda"));
}

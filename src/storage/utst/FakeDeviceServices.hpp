#ifndef BLKREF_STORAGE_FAKE_DEVICE_SERVICES_HPP
#define BLKREF_STORAGE_FAKE_DEVICE_SERVICES_HPP
/**
 * @file FakeDeviceServices.hpp
 * @brief In-memory capability implementations for storage unit tests.
 *
 * Each fake counts its calls so tests can assert caching behavior.
 */

#include "src/storage/inc/DeviceServices.hpp"

#include <functional>
#include <map>
#include <set>
#include <string>
#include <string_view>

namespace blkref {

namespace storage {

namespace test {

/// Block devices plus symlinks (link path -> real path).
class FakeFilesystem final : public FilesystemProbe {
public:
  std::set<std::string> blockDevices;
  std::map<std::string, std::string> links;
  mutable int realPathCalls{0};

  [[nodiscard]] bool isBlockSpecial(const std::string& path) const override {
    const auto LINK = links.find(path);
    const std::string& TARGET = (LINK == links.end()) ? path : LINK->second;
    return blockDevices.count(TARGET) != 0;
  }

  [[nodiscard]] DeviceStatus realPath(const std::string& path, std::string& out) const override {
    ++realPathCalls;
    const auto LINK = links.find(path);
    if (LINK != links.end()) {
      out = LINK->second;
      return DeviceStatus::OK;
    }
    if (blockDevices.count(path) != 0) {
      out = path;
      return DeviceStatus::OK;
    }
    return DeviceStatus::RESOLUTION_FAILED;
  }
};

/// Properties per device path.
class FakeMetadata final : public DeviceMetadataProvider {
public:
  std::map<std::string, std::map<std::string, std::string, std::less<>>> properties;
  mutable int queries{0};

  [[nodiscard]] DeviceStatus getProperty(const std::string& devicePath, std::string_view key,
                                         std::string& out) const override {
    ++queries;
    const auto DEV = properties.find(devicePath);
    if (DEV == properties.end()) {
      return DeviceStatus::METADATA_UNAVAILABLE;
    }
    const auto PROP = DEV->second.find(key);
    if (PROP == DEV->second.end()) {
      return DeviceStatus::METADATA_UNAVAILABLE;
    }
    out = PROP->second;
    return DeviceStatus::OK;
  }
};

/// Records keyed by "<name>/<attr>".
class FakeKernel final : public KernelRecordReader {
public:
  std::map<std::string, std::string> records;

  [[nodiscard]] DeviceStatus readAttribute(std::string_view deviceName, std::string_view attr,
                                           std::string& out) const override {
    std::string key(deviceName);
    key.push_back('/');
    key += attr;
    const auto IT = records.find(key);
    if (IT == records.end()) {
      return DeviceStatus::DEVICE_NOT_FOUND;
    }
    out = IT->second;
    return DeviceStatus::OK;
  }
};

/// One of each fake.
struct FakeSystem {
  FakeFilesystem fs;
  FakeMetadata metadata;
  FakeKernel kernel;

  [[nodiscard]] DeviceServices services() const noexcept { return {fs, metadata, kernel}; }
};

} // namespace test

} // namespace storage

} // namespace blkref

#endif // BLKREF_STORAGE_FAKE_DEVICE_SERVICES_HPP

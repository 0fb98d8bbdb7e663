/**
 * @file BlockDevice.cpp
 * @brief Block device handle: alias caching, device numbers and geometry.
 */

#include "src/storage/inc/BlockDevice.hpp"
#include "src/storage/inc/AliasPrioritizer.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <algorithm>
#include <charconv>
#include <utility>

#include <fmt/core.h>

namespace blkref {

namespace storage {

using blkref::helpers::strings::startsWith;
using blkref::helpers::strings::stripPrefix;
using blkref::helpers::strings::trim;

namespace {

/// sysfs reports sizes in 512-byte units regardless of the sector size.
constexpr std::uint64_t SYSFS_SECTOR_BYTES = 512;

constexpr std::string_view SIZE_ATTR = "size";
constexpr std::string_view DEV_ATTR = "dev";
constexpr std::string_view LOGICAL_BLOCK_ATTR = "queue/logical_block_size";
constexpr std::string_view PHYSICAL_BLOCK_ATTR = "queue/physical_block_size";

/// True if path lies directly or indirectly below dir.
bool isBelow(std::string_view path, std::string_view dir) noexcept {
  return path.size() > dir.size() && startsWith(path, dir) && path[dir.size()] == '/';
}

/// Parse a whole (trimmed) decimal field.
template <typename T> bool parseUnsigned(std::string_view text, T& out) noexcept {
  const std::string_view BODY = trim(text);
  if (BODY.empty()) {
    return false;
  }
  const auto [PTR, EC] = std::from_chars(BODY.data(), BODY.data() + BODY.size(), out);
  return EC == std::errc{} && PTR == BODY.data() + BODY.size();
}

} // namespace

/* ----------------------------- Construction ----------------------------- */

BlockDevice::BlockDevice(std::string deviceFile, const DeviceServices& services)
    : services_(services), resolver_(services.fs, services.metadata),
      deviceFile_(std::move(deviceFile)) {
  if (!isBelow(deviceFile_, BY_ID_DIR)) {
    return;
  }

  // Work on the kernel node. The by-id reference is still chosen by the
  // prioritizer, so every alias of one disk yields the same stored name.
  std::string canonical;
  if (resolver_.resolveCanonical(deviceFile_, canonical) == DeviceStatus::OK) {
    canonical_ = canonical;
    deviceFile_ = std::move(canonical);
  }
}

/* ----------------------------- Existence ----------------------------- */

bool BlockDevice::exists() const { return services_.fs.isBlockSpecial(deviceFile_); }

DeviceStatus BlockDevice::assertExists() const {
  return exists() ? DeviceStatus::OK : DeviceStatus::DEVICE_NOT_FOUND;
}

/* ----------------------------- Paths ----------------------------- */

DeviceStatus BlockDevice::getCanonicalDeviceFile(std::string& out) {
  if (!canonical_) {
    std::string resolved;
    const DeviceStatus STATUS = resolver_.resolveCanonical(deviceFile_, resolved);
    if (STATUS != DeviceStatus::OK) {
      return STATUS;
    }
    canonical_ = std::move(resolved);
  }
  out = *canonical_;
  return DeviceStatus::OK;
}

std::optional<std::string> BlockDevice::lookupAlias(std::string_view dir,
                                                    std::optional<std::string>& cache) {
  if (!cache) {
    std::string target;
    if (getCanonicalDeviceFile(target) != DeviceStatus::OK) {
      target = deviceFile_;
    }
    const std::vector<std::string> NAMES = resolver_.listAliases(target, dir);
    const std::optional<std::string> CHOSEN =
        dir == BY_PATH_DIR ? selectFirstNatural(NAMES, dir) : selectBest(NAMES, dir);
    cache = CHOSEN.value_or(deviceFile_);
  }

  if (!isBelow(*cache, dir)) {
    return std::nullopt;
  }
  return *cache;
}

std::optional<std::string> BlockDevice::getDeviceFileById() {
  return lookupAlias(BY_ID_DIR, byIdCache_);
}

bool BlockDevice::hasDeviceFileById() { return getDeviceFileById().has_value(); }

std::optional<std::string> BlockDevice::getDeviceFileByPath() {
  return lookupAlias(BY_PATH_DIR, byPathCache_);
}

bool BlockDevice::hasDeviceFileByPath() { return getDeviceFileByPath().has_value(); }

std::string BlockDevice::getPredictableDeviceFile() {
  if (std::optional<std::string> byId = getDeviceFileById()) {
    return std::move(*byId);
  }
  if (std::optional<std::string> byPath = getDeviceFileByPath()) {
    return std::move(*byPath);
  }
  return deviceFile_;
}

std::vector<std::string> BlockDevice::getDeviceFiles() {
  std::string canonical;
  if (getCanonicalDeviceFile(canonical) != DeviceStatus::OK) {
    canonical = deviceFile_;
  }

  std::vector<std::string> files{canonical};
  for (std::string& link : resolver_.listDeviceLinks(canonical)) {
    if (std::find(files.begin(), files.end(), link) == files.end()) {
      files.push_back(std::move(link));
    }
  }
  return files;
}

void BlockDevice::invalidate() noexcept {
  byIdCache_.reset();
  byPathCache_.reset();
}

std::string BlockDevice::getDeviceName(bool canonical) {
  std::string path = deviceFile_;
  if (canonical) {
    std::string resolved;
    if (getCanonicalDeviceFile(resolved) == DeviceStatus::OK) {
      path = std::move(resolved);
    }
  }
  return std::string(stripPrefix(path, DEV_PREFIX));
}

/* ----------------------------- Device Number ----------------------------- */

DeviceStatus BlockDevice::readDeviceNumber(DeviceNumber& out) {
  std::string record;
  const DeviceStatus STATUS = services_.kernel.readAttribute(getDeviceName(true), DEV_ATTR, record);
  if (STATUS != DeviceStatus::OK) {
    return STATUS;
  }
  return parseDeviceNumber(record, out) ? DeviceStatus::OK : DeviceStatus::MALFORMED_RECORD;
}

std::optional<DeviceNumber> BlockDevice::getDeviceNumber() {
  DeviceNumber number{};
  if (readDeviceNumber(number) != DeviceStatus::OK) {
    return std::nullopt;
  }
  return number;
}

std::optional<unsigned int> BlockDevice::getMajor() {
  const std::optional<DeviceNumber> NUMBER = getDeviceNumber();
  return NUMBER ? std::optional<unsigned int>(NUMBER->major) : std::nullopt;
}

std::optional<unsigned int> BlockDevice::getMinor() {
  const std::optional<DeviceNumber> NUMBER = getDeviceNumber();
  return NUMBER ? std::optional<unsigned int>(NUMBER->minor) : std::nullopt;
}

std::string BlockDevice::getDescription() {
  const std::optional<DeviceNumber> NUMBER = getDeviceNumber();
  return fmt::format("Block device {} [{}]", getDeviceName(),
                     NUMBER ? NUMBER->toString() : std::string("unknown"));
}

/* ----------------------------- Geometry ----------------------------- */

DeviceStatus BlockDevice::loadGeometry() {
  const std::string NAME = getDeviceName(true);
  const KernelRecordReader& KERNEL = services_.kernel;

  std::string record;
  const DeviceStatus STATUS = KERNEL.readAttribute(NAME, SIZE_ATTR, record);
  if (STATUS != DeviceStatus::OK) {
    return STATUS;
  }

  std::uint64_t sectors = 0;
  if (!parseUnsigned(record, sectors)) {
    return DeviceStatus::MALFORMED_RECORD;
  }

  Geometry loaded{};
  loaded.sizeBytes = sectors * SYSFS_SECTOR_BYTES;

  // Queue limits; a partition reads its parent's.
  const auto READ_QUEUE = [&](std::string_view attr) -> std::optional<std::uint32_t> {
    std::string text;
    if (KERNEL.readAttribute(NAME, attr, text) != DeviceStatus::OK &&
        KERNEL.readAttribute(NAME, fmt::format("../{}", attr), text) != DeviceStatus::OK) {
      return std::nullopt;
    }
    std::uint32_t value = 0;
    if (!parseUnsigned(text, value) || value == 0) {
      return std::nullopt;
    }
    return value;
  };

  loaded.sectorSizeBytes = READ_QUEUE(LOGICAL_BLOCK_ATTR);
  loaded.blockSizeBytes = READ_QUEUE(PHYSICAL_BLOCK_ATTR);

  geometry_ = loaded;
  return DeviceStatus::OK;
}

/* ----------------------------- Metadata ----------------------------- */

DeviceStatus BlockDevice::getUdevProperty(std::string_view key, std::string& out) const {
  return services_.metadata.getProperty(deviceFile_, key, out);
}

bool BlockDevice::hasUdevProperty(std::string_view key) const {
  std::string unused;
  return getUdevProperty(key, unused) == DeviceStatus::OK;
}

std::string BlockDevice::readableProperty(std::string_view key) const {
  std::string value;
  if (getUdevProperty(key, value) != DeviceStatus::OK) {
    return {};
  }
  std::replace(value.begin(), value.end(), '_', ' ');
  return std::string(trim(value));
}

std::string BlockDevice::getModel() const { return readableProperty(MODEL_PROPERTY); }

std::string BlockDevice::getVendor() const { return readableProperty(VENDOR_PROPERTY); }

std::string BlockDevice::getSerialNumber() const { return readableProperty(SERIAL_PROPERTY); }

} // namespace storage

} // namespace blkref

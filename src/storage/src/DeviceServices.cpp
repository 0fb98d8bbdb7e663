/**
 * @file DeviceServices.cpp
 * @brief Linux implementations of the storage capability interfaces.
 */

#include "src/storage/inc/DeviceServices.hpp"
#include "src/helpers/inc/Files.hpp"

#include <libudev.h>
#include <sys/stat.h>      // stat, S_ISBLK
#include <sys/sysmacros.h> // major, minor, makedev

#include <array>
#include <memory>
#include <utility>

#include <fmt/core.h>

namespace blkref {

namespace storage {

using blkref::helpers::files::FILE_READ_BUFFER_SIZE;
using blkref::helpers::files::isBlockDevice;
using blkref::helpers::files::readFileToBuffer;
using blkref::helpers::files::resolveRealPath;

namespace {

struct DeviceDeleter {
  void operator()(udev_device* dev) const noexcept { udev_device_unref(dev); }
};

using DevicePtr = std::unique_ptr<udev_device, DeviceDeleter>;

} // namespace

/* ----------------------------- SystemFilesystemProbe ----------------------------- */

bool SystemFilesystemProbe::isBlockSpecial(const std::string& path) const {
  return isBlockDevice(path.c_str());
}

DeviceStatus SystemFilesystemProbe::realPath(const std::string& path, std::string& out) const {
  return resolveRealPath(path.c_str(), out) ? DeviceStatus::OK : DeviceStatus::RESOLUTION_FAILED;
}

/* ----------------------------- UdevMetadata ----------------------------- */

void UdevMetadata::ContextDeleter::operator()(struct ::udev* ctx) const noexcept {
  udev_unref(ctx);
}

UdevMetadata::UdevMetadata() : udev_(udev_new()) {}

DeviceStatus UdevMetadata::getProperty(const std::string& devicePath, std::string_view key,
                                       std::string& out) const {
  struct stat st{};
  if (::stat(devicePath.c_str(), &st) != 0 || !S_ISBLK(st.st_mode)) {
    return DeviceStatus::METADATA_UNAVAILABLE;
  }

  const DeviceNumber NUMBER{static_cast<unsigned int>(major(st.st_rdev)),
                            static_cast<unsigned int>(minor(st.st_rdev))};
  return getPropertyByNumber(NUMBER, key, out);
}

DeviceStatus UdevMetadata::getPropertyByNumber(const DeviceNumber& number, std::string_view key,
                                               std::string& out) const {
  if (!udev_ || key.empty()) {
    return DeviceStatus::METADATA_UNAVAILABLE;
  }

  const DevicePtr DEV(
      udev_device_new_from_devnum(udev_.get(), 'b', makedev(number.major, number.minor)));
  if (!DEV) {
    return DeviceStatus::METADATA_UNAVAILABLE;
  }

  const std::string KEY(key);
  if (const char* value = udev_device_get_property_value(DEV.get(), KEY.c_str())) {
    out.assign(value);
    return DeviceStatus::OK;
  }
  if (key != DEVLINKS_PROPERTY) {
    return DeviceStatus::METADATA_UNAVAILABLE;
  }

  std::string links;
  udev_list_entry* entry = nullptr;
  udev_list_entry_foreach(entry, udev_device_get_devlinks_list_entry(DEV.get())) {
    const char* LINK = udev_list_entry_get_name(entry);
    if (LINK == nullptr || LINK[0] == '\0') {
      continue;
    }
    if (!links.empty()) {
      links.push_back(' ');
    }
    links += LINK;
  }
  if (links.empty()) {
    return DeviceStatus::METADATA_UNAVAILABLE;
  }
  out = std::move(links);
  return DeviceStatus::OK;
}

/* ----------------------------- SysfsReader ----------------------------- */

SysfsReader::SysfsReader(std::string root) : root_(std::move(root)) {}

DeviceStatus SysfsReader::readAttribute(std::string_view deviceName, std::string_view attr,
                                        std::string& out) const {
  if (deviceName.empty() || attr.empty()) {
    return DeviceStatus::DEVICE_NOT_FOUND;
  }

  const std::string PATH = fmt::format("{}/{}/{}", root_, deviceName, attr);

  // Missing and unreadable records are both unavailable; only a successful
  // read, even an empty one, is OK.
  std::array<char, FILE_READ_BUFFER_SIZE> buf{};
  std::size_t len = 0;
  if (!readFileToBuffer(PATH.c_str(), buf.data(), buf.size(), len)) {
    return DeviceStatus::DEVICE_NOT_FOUND;
  }
  out.assign(buf.data(), len);
  return DeviceStatus::OK;
}

/* ----------------------------- LinuxDeviceServices ----------------------------- */

LinuxDeviceServices::LinuxDeviceServices(std::string sysRoot) : sysfs_(std::move(sysRoot)) {}

} // namespace storage

} // namespace blkref

#ifndef BLKREF_STORAGE_DEVICE_SERVICES_HPP
#define BLKREF_STORAGE_DEVICE_SERVICES_HPP
/**
 * @file DeviceServices.hpp
 * @brief System capabilities consumed by the storage module.
 * @note Linux-only implementations. Tests substitute their own.
 *
 * Three narrow interfaces cover everything a BlockDevice needs from the system:
 *  - FilesystemProbe: stat()/realpath() on device paths
 *  - DeviceMetadataProvider: udev per-device properties (DEVLINKS, ID_*)
 *  - KernelRecordReader: sysfs attributes under /sys/class/block/\<name\>/
 *
 * DeviceServices bundles references to one implementation of each; the
 * referenced objects must outlive every handle built from the bundle.
 */

#include "src/storage/inc/DeviceTypes.hpp"

#include <memory>
#include <string>
#include <string_view>

struct udev;

namespace blkref {

namespace storage {

/* ----------------------------- Interfaces ----------------------------- */

/**
 * @brief Filesystem queries on device paths.
 */
class FilesystemProbe {
public:
  virtual ~FilesystemProbe() = default;

  /// @brief True iff path (after following symlinks) is a block special file.
  [[nodiscard]] virtual bool isBlockSpecial(const std::string& path) const = 0;

  /**
   * @brief Resolve symlinks and relative components.
   * @param path Path to resolve.
   * @param out Absolute real path on success.
   * @return OK or RESOLUTION_FAILED.
   */
  [[nodiscard]] virtual DeviceStatus realPath(const std::string& path, std::string& out) const = 0;
};

/**
 * @brief Per-device metadata (udev-like).
 */
class DeviceMetadataProvider {
public:
  virtual ~DeviceMetadataProvider() = default;

  /**
   * @brief Read one property of a device.
   * @param devicePath Device node path (symlinks allowed).
   * @param key Property name, e.g. "DEVLINKS" or "ID_MODEL".
   * @param out Property value on success.
   * @return OK, or METADATA_UNAVAILABLE if the device or key has no record.
   */
  [[nodiscard]] virtual DeviceStatus getProperty(const std::string& devicePath,
                                                 std::string_view key,
                                                 std::string& out) const = 0;
};

/**
 * @brief Kernel block device attributes (sysfs-like).
 */
class KernelRecordReader {
public:
  virtual ~KernelRecordReader() = default;

  /**
   * @brief Read an attribute of a kernel block device.
   * @param deviceName Kernel name, e.g. "sda" or "nvme0n1p2".
   * @param attr Attribute path relative to the device directory, e.g. "dev".
   * @param out Attribute contents with trailing whitespace removed.
   * @return OK, or DEVICE_NOT_FOUND if there is no such record or it cannot be read.
   */
  [[nodiscard]] virtual DeviceStatus readAttribute(std::string_view deviceName,
                                                   std::string_view attr,
                                                   std::string& out) const = 0;
};

/**
 * @brief Capability bundle handed to BlockDevice.
 */
struct DeviceServices {
  const FilesystemProbe& fs;
  const DeviceMetadataProvider& metadata;
  const KernelRecordReader& kernel;
};

/* ----------------------------- Linux Implementations ----------------------------- */

/**
 * @brief FilesystemProbe over stat() and realpath().
 */
class SystemFilesystemProbe final : public FilesystemProbe {
public:
  [[nodiscard]] bool isBlockSpecial(const std::string& path) const override;
  [[nodiscard]] DeviceStatus realPath(const std::string& path, std::string& out) const override;
};

/**
 * @brief DeviceMetadataProvider backed by libudev.
 *
 * Devices are looked up by block device number (stat() of the given path),
 * so any symlink to the node works. DEVLINKS falls back to the device's
 * link list, joined by spaces, when udev exports no such property.
 *
 * If the udev context cannot be created every query reports
 * METADATA_UNAVAILABLE.
 */
class UdevMetadata final : public DeviceMetadataProvider {
public:
  UdevMetadata();

  [[nodiscard]] DeviceStatus getProperty(const std::string& devicePath, std::string_view key,
                                         std::string& out) const override;

  /**
   * @brief Look a property up by block device number.
   * @return OK, or METADATA_UNAVAILABLE if udev knows no such device or key.
   */
  [[nodiscard]] DeviceStatus getPropertyByNumber(const DeviceNumber& number,
                                                 std::string_view key, std::string& out) const;

  /// @brief True if the udev context was created.
  [[nodiscard]] bool available() const noexcept { return udev_ != nullptr; }

private:
  struct ContextDeleter {
    void operator()(struct ::udev* ctx) const noexcept;
  };

  std::unique_ptr<struct ::udev, ContextDeleter> udev_;
};

/// Default sysfs block class directory.
inline constexpr std::string_view SYS_CLASS_BLOCK = "/sys/class/block";

/**
 * @brief KernelRecordReader over /sys/class/block.
 */
class SysfsReader final : public KernelRecordReader {
public:
  explicit SysfsReader(std::string root = std::string(SYS_CLASS_BLOCK));

  [[nodiscard]] DeviceStatus readAttribute(std::string_view deviceName, std::string_view attr,
                                           std::string& out) const override;

private:
  std::string root_;
};

/**
 * @brief Owns one instance of each Linux implementation.
 *
 * Tools construct one at startup and pass services() to every BlockDevice.
 */
class LinuxDeviceServices {
public:
  LinuxDeviceServices() = default;
  explicit LinuxDeviceServices(std::string sysRoot);

  LinuxDeviceServices(const LinuxDeviceServices&) = delete;
  LinuxDeviceServices& operator=(const LinuxDeviceServices&) = delete;

  [[nodiscard]] DeviceServices services() const noexcept { return {fs_, udev_, sysfs_}; }

private:
  SystemFilesystemProbe fs_{};
  UdevMetadata udev_{};
  SysfsReader sysfs_{};
};

} // namespace storage

} // namespace blkref

#endif // BLKREF_STORAGE_DEVICE_SERVICES_HPP

#ifndef BLKREF_STORAGE_BLOCK_DEVICE_HPP
#define BLKREF_STORAGE_BLOCK_DEVICE_HPP
/**
 * @file BlockDevice.hpp
 * @brief Handle to one block device with stable alias resolution.
 * @note Linux-only. Queries go through the DeviceServices capabilities.
 * @note NOT thread-safe: resolution results are cached inside the handle.
 *
 * A handle is built from any path naming the device:
 *  - "/dev/disk/by-id/ata-XYZ" is canonicalized immediately; the by-id path
 *    reported later is the preferred alias, not necessarily the one given
 *  - anything else ("/dev/sda", "/dev/mapper/vg-lv") is kept as given
 *
 * The preferred by-id alias is the reference to persist in configuration: it
 * survives "/dev/sdX" renames across reboots. See AliasPrioritizer.hpp for the
 * selection rule.
 *
 * Geometry and existence are never checked implicitly; call exists() or
 * assertExists() before relying on identity or geometry queries.
 */

#include "src/storage/inc/DeviceServices.hpp"
#include "src/storage/inc/DeviceTypes.hpp"
#include "src/storage/inc/IdentityResolver.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace blkref {

namespace storage {

/// udev properties behind getModel(), getVendor(), getSerialNumber().
inline constexpr std::string_view MODEL_PROPERTY = "ID_MODEL";
inline constexpr std::string_view VENDOR_PROPERTY = "ID_VENDOR";
inline constexpr std::string_view SERIAL_PROPERTY = "ID_SERIAL_SHORT";

/* ----------------------------- BlockDevice ----------------------------- */

/**
 * @brief Block device identity, device number and geometry.
 */
class BlockDevice {
public:
  /**
   * @brief Create a handle.
   * @param deviceFile Device path as supplied by the caller.
   * @param services System capabilities; must outlive the handle.
   */
  BlockDevice(std::string deviceFile, const DeviceServices& services);

  /* ---------- Existence ---------- */

  /// @brief True iff the device file currently is a block special file.
  [[nodiscard]] bool exists() const;

  /// @brief OK, or DEVICE_NOT_FOUND if exists() is false.
  [[nodiscard]] DeviceStatus assertExists() const;

  /* ---------- Paths ---------- */

  /// @brief Device file as held by the handle (see class notes).
  [[nodiscard]] const std::string& getDeviceFile() const noexcept { return deviceFile_; }

  /**
   * @brief Canonical kernel device path, e.g. "/dev/sda".
   * @param out Receives the path on success.
   * @return OK or RESOLUTION_FAILED.
   * @note Resolved at most once per handle; later calls return the snapshot.
   */
  [[nodiscard]] DeviceStatus getCanonicalDeviceFile(std::string& out);

  /**
   * @brief Preferred alias under /dev/disk/by-id.
   * @return Absolute alias path, or nullopt if the device has none.
   * @note The metadata provider is queried once; a miss is cached too.
   */
  [[nodiscard]] std::optional<std::string> getDeviceFileById();

  /// @brief True iff getDeviceFileById() yields an alias.
  [[nodiscard]] bool hasDeviceFileById();

  /// @brief First alias under /dev/disk/by-path in natural order, cached like by-id.
  [[nodiscard]] std::optional<std::string> getDeviceFileByPath();

  /// @brief True iff getDeviceFileByPath() yields an alias.
  [[nodiscard]] bool hasDeviceFileByPath();

  /**
   * @brief Most stable name available: by-id, else by-path, else getDeviceFile().
   */
  [[nodiscard]] std::string getPredictableDeviceFile();

  /**
   * @brief Canonical path followed by every device link, unfiltered.
   * @note Not cached.
   */
  [[nodiscard]] std::vector<std::string> getDeviceFiles();

  /// @brief Forget cached by-id/by-path results. The canonical snapshot is kept.
  void invalidate() noexcept;

  /**
   * @brief Device file without the literal "/dev/" prefix.
   * @param canonical Use the canonical path (falls back to the device file if
   *        resolution fails).
   * @return e.g. "sda", or "disk/by-id/ata-XYZ" for an unresolved alias.
   */
  [[nodiscard]] std::string getDeviceName(bool canonical = false);

  /* ---------- Device number ---------- */

  /**
   * @brief Read the kernel major:minor record of the canonical device.
   * @return OK, DEVICE_NOT_FOUND (no record) or MALFORMED_RECORD.
   */
  [[nodiscard]] DeviceStatus readDeviceNumber(DeviceNumber& out);

  /// @brief readDeviceNumber() as an optional.
  [[nodiscard]] std::optional<DeviceNumber> getDeviceNumber();

  [[nodiscard]] std::optional<unsigned int> getMajor();
  [[nodiscard]] std::optional<unsigned int> getMinor();

  /// @brief "Block device \<name\> [\<major:minor\>]" ("unknown" if unreadable).
  [[nodiscard]] std::string getDescription();

  /* ---------- Geometry ---------- */

  /**
   * @brief Populate geometry from kernel records.
   *
   * Sources (relative to the canonical device's record directory):
   *  - size                          512-byte sectors
   *  - queue/logical_block_size      sector size
   *  - queue/physical_block_size     block size
   * Partitions have no queue/ of their own and use their parent's.
   *
   * @return OK, DEVICE_NOT_FOUND (no size record) or MALFORMED_RECORD.
   *         Geometry is left untouched on failure.
   */
  [[nodiscard]] DeviceStatus loadGeometry();

  /// @brief Replace geometry with values from another source.
  void setGeometry(const Geometry& geometry) noexcept { geometry_ = geometry; }

  [[nodiscard]] const Geometry& geometry() const noexcept { return geometry_; }
  [[nodiscard]] std::optional<std::uint64_t> getSize() const noexcept {
    return geometry_.sizeBytes;
  }
  [[nodiscard]] std::optional<std::uint32_t> getBlockSize() const noexcept {
    return geometry_.blockSizeBytes;
  }
  [[nodiscard]] std::optional<std::uint32_t> getSectorSize() const noexcept {
    return geometry_.sectorSizeBytes;
  }

  /* ---------- Metadata ---------- */

  /**
   * @brief Read a udev property of the device.
   * @return OK or METADATA_UNAVAILABLE.
   */
  [[nodiscard]] DeviceStatus getUdevProperty(std::string_view key, std::string& out) const;

  [[nodiscard]] bool hasUdevProperty(std::string_view key) const;

  /// @brief Model, vendor and serial with '_' shown as ' '; empty if unknown.
  [[nodiscard]] std::string getModel() const;
  [[nodiscard]] std::string getVendor() const;
  [[nodiscard]] std::string getSerialNumber() const;

private:
  /// Fill cache with the best alias in dir, or the device file on a miss.
  [[nodiscard]] std::optional<std::string> lookupAlias(std::string_view dir,
                                                       std::optional<std::string>& cache);

  /// Property with '_' replaced by ' ', or empty.
  [[nodiscard]] std::string readableProperty(std::string_view key) const;

  DeviceServices services_;
  IdentityResolver resolver_;

  std::string deviceFile_;
  std::optional<std::string> canonical_{};
  std::optional<std::string> byIdCache_{};
  std::optional<std::string> byPathCache_{};
  Geometry geometry_{};
};

} // namespace storage

} // namespace blkref

#endif // BLKREF_STORAGE_BLOCK_DEVICE_HPP

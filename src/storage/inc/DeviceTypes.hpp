#ifndef BLKREF_STORAGE_DEVICE_TYPES_HPP
#define BLKREF_STORAGE_DEVICE_TYPES_HPP
/**
 * @file DeviceTypes.hpp
 * @brief Status codes, device numbers and geometry shared by the storage module.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace blkref {

namespace storage {

/* ----------------------------- Path Constants ----------------------------- */

/// Literal prefix stripped by BlockDevice::getDeviceName().
inline constexpr std::string_view DEV_PREFIX = "/dev/";

/// Identity-derived alias directory.
inline constexpr std::string_view BY_ID_DIR = "/dev/disk/by-id";

/// Topology-derived alias directory.
inline constexpr std::string_view BY_PATH_DIR = "/dev/disk/by-path";

/// Metadata property holding the device's symlinks.
inline constexpr std::string_view DEVLINKS_PROPERTY = "DEVLINKS";

/* ----------------------------- DeviceStatus ----------------------------- */

/**
 * @brief Status codes for device queries.
 */
enum class DeviceStatus : std::uint8_t {
  OK = 0,
  DEVICE_NOT_FOUND,     ///< Not a block special file, or no kernel record
  RESOLUTION_FAILED,    ///< Canonicalization failed (path vanished, permission denied)
  METADATA_UNAVAILABLE, ///< Metadata provider has no record or no such property
  MALFORMED_RECORD,     ///< Kernel record present but unparsable
};

/**
 * @brief Human-readable status string.
 * @return Static string, never nullptr.
 */
[[nodiscard]] const char* toString(DeviceStatus status) noexcept;

/* ----------------------------- DeviceNumber ----------------------------- */

/**
 * @brief Kernel device number (driver class and instance).
 */
struct DeviceNumber {
  unsigned int major{0};
  unsigned int minor{0};

  /// @brief "major:minor".
  [[nodiscard]] std::string toString() const;

  [[nodiscard]] bool operator==(const DeviceNumber& other) const noexcept = default;
};

/**
 * @brief Parse a sysfs "dev" record.
 * @param text Record contents, e.g. "8:0\n". Surrounding whitespace is ignored.
 * @param out Receives the parsed number on success.
 * @return true if text is exactly two decimal fields separated by ':'.
 */
[[nodiscard]] bool parseDeviceNumber(std::string_view text, DeviceNumber& out) noexcept;

/* ----------------------------- Geometry ----------------------------- */

/**
 * @brief Device geometry. Fields stay empty until a collaborator fills them.
 */
struct Geometry {
  std::optional<std::uint64_t> sizeBytes{};       ///< Capacity in bytes
  std::optional<std::uint32_t> blockSizeBytes{};  ///< Physical block size
  std::optional<std::uint32_t> sectorSizeBytes{}; ///< Logical sector size

  /// @brief True if no field is populated.
  [[nodiscard]] bool empty() const noexcept {
    return !sizeBytes && !blockSizeBytes && !sectorSizeBytes;
  }
};

} // namespace storage

} // namespace blkref

#endif // BLKREF_STORAGE_DEVICE_TYPES_HPP

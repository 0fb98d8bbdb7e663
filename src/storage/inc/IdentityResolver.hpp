#ifndef BLKREF_STORAGE_IDENTITY_RESOLVER_HPP
#define BLKREF_STORAGE_IDENTITY_RESOLVER_HPP
/**
 * @file IdentityResolver.hpp
 * @brief Canonical path and alias discovery for a device file.
 * @note Blocking, read-only queries. No caching at this layer.
 */

#include "src/storage/inc/DeviceServices.hpp"
#include "src/storage/inc/DeviceTypes.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace blkref {

namespace storage {

/**
 * @brief Resolves a device path to its kernel node and its symlink aliases.
 */
class IdentityResolver {
public:
  IdentityResolver(const FilesystemProbe& fs, const DeviceMetadataProvider& metadata) noexcept
      : fs_(fs), metadata_(metadata) {}

  /**
   * @brief Resolve symlinks and relative components.
   * @param path Device path, e.g. "/dev/disk/by-id/ata-XYZ".
   * @param out Absolute real path, e.g. "/dev/sda".
   * @return OK or RESOLUTION_FAILED if path does not exist now.
   */
  [[nodiscard]] DeviceStatus resolveCanonical(const std::string& path, std::string& out) const;

  /**
   * @brief Every symlink the metadata provider reports for path.
   * @return Absolute paths in provider order. Relative entries are taken as
   *         relative to /dev. Empty when metadata is unavailable.
   */
  [[nodiscard]] std::vector<std::string> listDeviceLinks(const std::string& path) const;

  /**
   * @brief Aliases of path located directly in dir.
   * @param path Device path.
   * @param dir Alias directory without trailing '/'. Empty passes every link
   *        through unfiltered as an absolute path.
   * @return Last path segments (e.g. "ata-XYZ"), or absolute paths when dir is empty.
   */
  [[nodiscard]] std::vector<std::string> listAliases(const std::string& path,
                                                     std::string_view dir = BY_ID_DIR) const;

private:
  const FilesystemProbe& fs_;
  const DeviceMetadataProvider& metadata_;
};

} // namespace storage

} // namespace blkref

#endif // BLKREF_STORAGE_IDENTITY_RESOLVER_HPP

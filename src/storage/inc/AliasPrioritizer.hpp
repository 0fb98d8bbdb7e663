#ifndef BLKREF_STORAGE_ALIAS_PRIORITIZER_HPP
#define BLKREF_STORAGE_ALIAS_PRIORITIZER_HPP
/**
 * @file AliasPrioritizer.hpp
 * @brief Deterministic choice of the most stable alias for a device.
 * @note Thread-safe: All functions are stateless.
 *
 * Aliases are ranked by their first character:
 *  - 'a' (ata-*)  physical identity, survives controller and cable changes
 *  - 'w' (wwn-*)  world wide name, unique but opaque
 *  - 's' (scsi-*) bus identity
 *  - anything else
 *
 * Only the first character is inspected, so "abc-device" ranks with ata-*.
 * Stored references depend on this ordering; do not tighten it to full
 * prefixes without migrating them.
 *
 * Equal ranks are ordered naturally ("ata-disk-2" before "ata-disk-10").
 */

#include "src/storage/inc/DeviceTypes.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace blkref {

namespace storage {

/* ----------------------------- AliasCandidate ----------------------------- */

/// Rank of names that match none of the known classes.
inline constexpr int OTHER_ALIAS_RANK = 3;

/**
 * @brief Alias name with its precedence class (lower is better).
 */
struct AliasCandidate {
  std::string_view name; ///< Last path segment, e.g. "ata-XYZ"
  int classRank{OTHER_ALIAS_RANK};

  /// @brief Classify name.
  [[nodiscard]] static AliasCandidate from(std::string_view name) noexcept;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Precedence class of an alias name.
 * @return 0 ('a'), 1 ('w'), 2 ('s') or 3 (anything else, including empty).
 */
[[nodiscard]] int classRank(std::string_view name) noexcept;

/**
 * @brief Strict weak ordering used for alias selection.
 * @return true if a is preferred over b: lower class rank, then natural order.
 */
[[nodiscard]] bool aliasLess(std::string_view a, std::string_view b) noexcept;

/**
 * @brief Pick the preferred alias.
 * @param names Alias names (last path segments). Order does not matter;
 *        empty names are ignored.
 * @param dir Directory the names live in.
 * @return "<dir>/<name>" for the best name, or nullopt if there is none.
 */
[[nodiscard]] std::optional<std::string> selectBest(const std::vector<std::string>& names,
                                                    std::string_view dir = BY_ID_DIR);

/**
 * @brief Pick the first alias in natural order, ignoring class ranks.
 *
 * Used for by-path names, whose first characters ("pci", "platform", "usb")
 * carry no stability meaning.
 */
[[nodiscard]] std::optional<std::string>
selectFirstNatural(const std::vector<std::string>& names, std::string_view dir = BY_PATH_DIR);

/**
 * @brief All names sorted from most to least preferred.
 */
[[nodiscard]] std::vector<std::string> orderByPriority(std::vector<std::string> names);

} // namespace storage

} // namespace blkref

#endif // BLKREF_STORAGE_ALIAS_PRIORITIZER_HPP

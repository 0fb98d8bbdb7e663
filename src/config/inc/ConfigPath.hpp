#ifndef BLKREF_CONFIG_CONFIG_PATH_HPP
#define BLKREF_CONFIG_CONFIG_PATH_HPP
/**
 * @file ConfigPath.hpp
 * @brief Path expressions addressing nodes of the configuration tree.
 *
 * Grammar:
 *   path     := "/" | ("/" segment)+
 *   segment  := key [ "[" selector "]" ]
 *   selector := index | key "=" value
 *
 *  - "/storage/pools"                         mapping lookup
 *  - "/storage/pools/pool[0]"                 first element of sequence "pool"
 *  - "/storage/pools/pool[name=tank]"         elements whose "name" is "tank"
 *  - "/storage/pools/pool[devicefile=/dev/disk/by-id/ata-X]"  values may contain '/'
 *
 * A value may be wrapped in single or double quotes; the quotes are dropped.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace blkref {

namespace config {

/* ----------------------------- DatabaseStatus ----------------------------- */

/**
 * @brief Status codes for configuration database operations.
 */
enum class DatabaseStatus : std::uint8_t {
  OK = 0,
  NOT_LOADED,     ///< No tree loaded
  NOT_FOUND,      ///< Path expression matched nothing
  INVALID_PATH,   ///< Malformed path expression
  NOT_APPLICABLE, ///< Matched node has the wrong kind for the operation
  IO_FAILED,      ///< File could not be read or written
  PARSE_FAILED,   ///< File contents are not a YAML mapping
};

/**
 * @brief Human-readable status string.
 * @return Static string, never nullptr.
 */
[[nodiscard]] const char* toString(DatabaseStatus status) noexcept;

/* ----------------------------- PathSegment ----------------------------- */

/**
 * @brief One "/"-separated step of a path expression.
 */
struct PathSegment {
  enum class Selector : std::uint8_t {
    NONE = 0, ///< Plain mapping key
    INDEX,    ///< [N]
    MATCH,    ///< [key=value]
  };

  std::string key;
  Selector selector{Selector::NONE};
  std::size_t index{0};
  std::string matchKey{};
  std::string matchValue{};

  /// @brief Canonical text form, e.g. "pool[name=tank]".
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- ConfigPath ----------------------------- */

/**
 * @brief Parsed path expression.
 */
struct ConfigPath {
  std::vector<PathSegment> segments{};

  /// @brief True for "/".
  [[nodiscard]] bool isRoot() const noexcept { return segments.empty(); }

  /// @brief Path without its last segment ("/" stays "/").
  [[nodiscard]] ConfigPath parent() const;

  /// @brief Canonical text form.
  [[nodiscard]] std::string toString() const;
};

/**
 * @brief Parse a path expression.
 * @param text Expression, e.g. "/storage/pools/pool[name=tank]".
 * @param out Receives the parsed path on success.
 * @return OK or INVALID_PATH.
 */
[[nodiscard]] DatabaseStatus parsePath(std::string_view text, ConfigPath& out);

} // namespace config

} // namespace blkref

#endif // BLKREF_CONFIG_CONFIG_PATH_HPP

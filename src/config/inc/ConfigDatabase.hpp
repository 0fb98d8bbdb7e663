#ifndef BLKREF_CONFIG_CONFIG_DATABASE_HPP
#define BLKREF_CONFIG_CONFIG_DATABASE_HPP
/**
 * @file ConfigDatabase.hpp
 * @brief Path-addressed access to a hierarchical YAML configuration tree.
 * @note NOT thread-safe: callers serialize mutations. No transactions.
 *
 * The application constructs one ConfigDatabase at startup, loads it, and
 * passes it by reference to whatever needs configuration access. Every
 * operation fails with NOT_LOADED until load() or loadFromString() succeeds.
 *
 * Device references are stored as plain path strings, preferably the value of
 * storage::BlockDevice::getPredictableDeviceFile().
 */

#include "src/config/inc/ConfigObject.hpp"
#include "src/config/inc/ConfigPath.hpp"

#include <string>
#include <string_view>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace blkref {

namespace config {

/* ----------------------------- ConfigDatabase ----------------------------- */

/**
 * @brief Loaded configuration tree with get/set/replace/update/remove.
 */
class ConfigDatabase {
public:
  ConfigDatabase() = default;

  ConfigDatabase(const ConfigDatabase&) = delete;
  ConfigDatabase& operator=(const ConfigDatabase&) = delete;

  /* ---------- Lifecycle ---------- */

  /**
   * @brief Load a YAML file. An empty file yields an empty tree.
   * @return OK, IO_FAILED or PARSE_FAILED (previous tree kept on failure).
   */
  [[nodiscard]] DatabaseStatus load(const std::string& file);

  /// @brief Load from YAML text. @return OK or PARSE_FAILED.
  [[nodiscard]] DatabaseStatus loadFromString(const std::string& text);

  /// @brief Write the tree back to the file it was loaded from.
  /// @return OK, NOT_LOADED, or IO_FAILED (also when loaded from a string).
  [[nodiscard]] DatabaseStatus save() const;

  /// @brief Write the tree to file. @return OK, NOT_LOADED or IO_FAILED.
  [[nodiscard]] DatabaseStatus save(const std::string& file) const;

  [[nodiscard]] bool isLoaded() const noexcept { return loaded_; }

  /// @brief File the tree was loaded from (empty for loadFromString()).
  [[nodiscard]] const std::string& file() const noexcept { return file_; }

  /// @brief YAML text of the whole tree (empty if not loaded).
  [[nodiscard]] std::string dump() const;

  /* ---------- Queries ---------- */

  /**
   * @brief First node matching path.
   * @return OK, NOT_LOADED, INVALID_PATH or NOT_FOUND.
   */
  [[nodiscard]] DatabaseStatus get(std::string_view path, ConfigObject& out) const;

  /**
   * @brief Every node matching path. A path ending in a plain key that names a
   *        sequence yields the sequence's elements.
   * @return OK (out non-empty), NOT_LOADED, INVALID_PATH or NOT_FOUND.
   */
  [[nodiscard]] DatabaseStatus getList(std::string_view path,
                                       std::vector<ConfigObject>& out) const;

  /// @brief True if path is valid and matches at least one node.
  [[nodiscard]] bool exists(std::string_view path) const;

  /**
   * @brief First matching scalar as text.
   * @return OK, NOT_LOADED, INVALID_PATH, NOT_FOUND or NOT_APPLICABLE (not a scalar).
   */
  [[nodiscard]] DatabaseStatus getValue(std::string_view path, std::string& out) const;

  /* ---------- Mutations ---------- */

  /**
   * @brief Create or overwrite.
   *
   * Existing matches are overwritten. Otherwise the node is created: missing
   * mappings on the way are added, and a final [key=value] selector appends a
   * new sequence element (with key set to value if the object lacks it).
   *
   * @return OK, NOT_LOADED, INVALID_PATH, NOT_FOUND (unmatched intermediate
   *         selector or [N] out of range) or NOT_APPLICABLE.
   */
  [[nodiscard]] DatabaseStatus set(std::string_view path, const ConfigObject& object);

  /// @brief set() for a scalar value.
  [[nodiscard]] DatabaseStatus setValue(std::string_view path, const std::string& value);

  /**
   * @brief Overwrite every existing match.
   * @return OK, NOT_LOADED, INVALID_PATH or NOT_FOUND.
   */
  [[nodiscard]] DatabaseStatus replace(std::string_view path, const ConfigObject& object);

  /**
   * @brief Merge object's top-level keys into every matching mapping.
   * @return OK, NOT_LOADED, INVALID_PATH, NOT_FOUND or NOT_APPLICABLE.
   */
  [[nodiscard]] DatabaseStatus update(std::string_view path, const ConfigObject& object);

  /**
   * @brief Delete every matching node.
   * @return OK, NOT_LOADED, INVALID_PATH, NOT_FOUND or NOT_APPLICABLE (root).
   */
  [[nodiscard]] DatabaseStatus remove(std::string_view path);

private:
  /// Parse path, checking the database is loaded first.
  [[nodiscard]] DatabaseStatus prepare(std::string_view text, ConfigPath& path) const;

  /// All nodes matching path. The handles share storage with the tree.
  [[nodiscard]] std::vector<YAML::Node> select(const ConfigPath& path) const;

  /// Overwrite matches of path with value, or create it.
  [[nodiscard]] DatabaseStatus assign(const ConfigPath& path, const YAML::Node& value);

  YAML::Node root_{YAML::NodeType::Map};
  bool loaded_{false};
  std::string file_{};
};

} // namespace config

} // namespace blkref

#endif // BLKREF_CONFIG_CONFIG_DATABASE_HPP

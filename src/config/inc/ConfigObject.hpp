#ifndef BLKREF_CONFIG_CONFIG_OBJECT_HPP
#define BLKREF_CONFIG_CONFIG_OBJECT_HPP
/**
 * @file ConfigObject.hpp
 * @brief Structured configuration value exchanged with ConfigDatabase.
 *
 * A ConfigObject owns a private copy of a YAML mapping. Copies are deep, so an
 * object read from the database can be edited freely and written back with
 * set()/replace()/update().
 */

#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace blkref {

namespace config {

/* ----------------------------- ConfigObject ----------------------------- */

/**
 * @brief Key/value configuration object backed by a YAML node.
 */
class ConfigObject {
public:
  /// @brief Empty mapping.
  ConfigObject();

  ConfigObject(const ConfigObject& other);
  ConfigObject(ConfigObject&& other) noexcept;
  ConfigObject& operator=(const ConfigObject& other);
  ConfigObject& operator=(ConfigObject&& other) noexcept;
  ~ConfigObject() = default;

  /// @brief Deep copy of node.
  [[nodiscard]] static ConfigObject fromNode(const YAML::Node& node);

  /**
   * @brief Parse a YAML mapping.
   * @return false if text is not valid YAML, not a mapping, or has a
   *         non-scalar key (out untouched).
   */
  [[nodiscard]] static bool fromYaml(const std::string& text, ConfigObject& out);

  /// @brief Deep copy of the backing node.
  [[nodiscard]] YAML::Node toNode() const;

  /// @brief Read-only view of the backing node.
  [[nodiscard]] const YAML::Node& node() const noexcept { return node_; }

  [[nodiscard]] bool isMap() const { return node_.IsMap(); }
  [[nodiscard]] bool isEmpty() const { return node_.size() == 0; }
  [[nodiscard]] bool has(const std::string& key) const;

  /// @brief Set a scalar value.
  template <typename T> void set(const std::string& key, const T& value) { node_[key] = value; }
  void set(const std::string& key, const char* value) { node_[key] = std::string(value); }

  /// @brief Set a nested object (deep copy).
  void setObject(const std::string& key, const ConfigObject& value);

  /**
   * @brief Read a scalar value.
   * @return The converted value, or fallback if missing or not convertible.
   */
  template <typename T> [[nodiscard]] T get(const std::string& key, const T& fallback) const {
    if (!has(key)) {
      return fallback;
    }
    const YAML::Node& view = node_;
    return view[key].as<T>(fallback);
  }

  /// @brief Nested object (empty mapping if missing).
  [[nodiscard]] ConfigObject getObject(const std::string& key) const;

  /// @brief Remove a key. @return true if it was present.
  bool remove(const std::string& key);

  /// @brief Top-level scalar keys in document order.
  [[nodiscard]] std::vector<std::string> keys() const;

  /// @brief YAML text.
  [[nodiscard]] std::string toString() const;

private:
  YAML::Node node_;
};

/**
 * @brief True if node is a mapping whose keys are all scalars.
 *
 * Only such mappings can be addressed by name; sequence or mapping keys
 * ("? [x, y]") are valid YAML but have no path.
 */
[[nodiscard]] bool hasScalarKeys(const YAML::Node& node);

} // namespace config

} // namespace blkref

#endif // BLKREF_CONFIG_CONFIG_OBJECT_HPP

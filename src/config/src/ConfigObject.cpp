/**
 * @file ConfigObject.cpp
 * @brief Deep-copying wrapper around a YAML mapping.
 *
 * YAML::Node assignment rebinds shared storage instead of copying, so every
 * copy path here goes through YAML::Clone() and Node::reset().
 */

#include "src/config/inc/ConfigObject.hpp"

namespace blkref {

namespace config {

bool hasScalarKeys(const YAML::Node& node) {
  if (!node.IsMap()) {
    return false;
  }
  for (const auto& ENTRY : node) {
    if (!ENTRY.first.IsScalar()) {
      return false;
    }
  }
  return true;
}

ConfigObject::ConfigObject() : node_(YAML::NodeType::Map) {}

ConfigObject::ConfigObject(const ConfigObject& other) : node_(YAML::Clone(other.node_)) {}

// The source is left an empty mapping of its own; a plain handle copy would
// leave both objects on one tree.
ConfigObject::ConfigObject(ConfigObject&& other) noexcept : node_(other.node_) {
  other.node_.reset(YAML::Node(YAML::NodeType::Map));
}

ConfigObject& ConfigObject::operator=(const ConfigObject& other) {
  if (this != &other) {
    node_.reset(YAML::Clone(other.node_));
  }
  return *this;
}

ConfigObject& ConfigObject::operator=(ConfigObject&& other) noexcept {
  if (this != &other) {
    node_.reset(other.node_);
    other.node_.reset(YAML::Node(YAML::NodeType::Map));
  }
  return *this;
}

ConfigObject ConfigObject::fromNode(const YAML::Node& node) {
  ConfigObject object;
  object.node_.reset(YAML::Clone(node));
  return object;
}

bool ConfigObject::fromYaml(const std::string& text, ConfigObject& out) {
  YAML::Node parsed;
  try {
    parsed = YAML::Load(text);
  } catch (const YAML::Exception&) {
    return false;
  }
  if (!parsed.IsMap() || !hasScalarKeys(parsed)) {
    return false;
  }
  out.node_.reset(parsed);
  return true;
}

YAML::Node ConfigObject::toNode() const { return YAML::Clone(node_); }

bool ConfigObject::has(const std::string& key) const {
  if (!node_.IsMap()) {
    return false;
  }
  const YAML::Node& view = node_;
  return view[key].IsDefined();
}

void ConfigObject::setObject(const std::string& key, const ConfigObject& value) {
  node_[key] = value.toNode();
}

ConfigObject ConfigObject::getObject(const std::string& key) const {
  if (!has(key)) {
    return ConfigObject{};
  }
  const YAML::Node& view = node_;
  return fromNode(view[key]);
}

bool ConfigObject::remove(const std::string& key) {
  if (!has(key)) {
    return false;
  }
  return node_.remove(key);
}

std::vector<std::string> ConfigObject::keys() const {
  std::vector<std::string> out;
  if (!node_.IsMap()) {
    return out;
  }
  for (const auto& ENTRY : node_) {
    if (ENTRY.first.IsScalar()) {
      out.push_back(ENTRY.first.Scalar());
    }
  }
  return out;
}

std::string ConfigObject::toString() const { return YAML::Dump(node_); }

} // namespace config

} // namespace blkref

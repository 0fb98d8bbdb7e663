/**
 * @file ConfigDatabase.cpp
 * @brief Path-expression evaluation and mutation over a YAML tree.
 *
 * yaml-cpp notes:
 *  - Node::operator= on a handle into the tree overwrites the tree node, so
 *    local cursors are moved with reset() instead.
 *  - Non-const operator[] creates keys; lookups go through const references.
 */

#include "src/config/inc/ConfigDatabase.hpp"

#include <fstream>
#include <utility>

namespace blkref {

namespace config {

namespace {

using Selector = PathSegment::Selector;

/// True if element is a mapping whose seg.matchKey scalar equals seg.matchValue.
bool matchesSelector(const YAML::Node& element, const PathSegment& seg) {
  if (!element.IsMap()) {
    return false;
  }
  const YAML::Node VALUE = element[seg.matchKey];
  return VALUE.IsDefined() && VALUE.IsScalar() && VALUE.Scalar() == seg.matchValue;
}

/// Apply one path segment to node, appending every match to out.
void step(const YAML::Node& node, const PathSegment& seg, std::vector<YAML::Node>& out) {
  if (!node.IsMap()) {
    return;
  }
  const YAML::Node CHILD = node[seg.key];
  if (!CHILD.IsDefined()) {
    return;
  }

  switch (seg.selector) {
  case Selector::NONE:
    out.push_back(CHILD);
    break;
  case Selector::INDEX:
    if (CHILD.IsSequence() && seg.index < CHILD.size()) {
      out.push_back(CHILD[seg.index]);
    }
    break;
  case Selector::MATCH:
    if (CHILD.IsSequence()) {
      for (std::size_t i = 0; i < CHILD.size(); ++i) {
        const YAML::Node ELEMENT = CHILD[i];
        if (matchesSelector(ELEMENT, seg)) {
          out.push_back(ELEMENT);
        }
      }
    }
    break;
  }
}

/// Accept a mapping or an empty document (turned into an empty mapping).
bool normalizeRoot(YAML::Node& node) {
  if (!node.IsDefined() || node.IsNull()) {
    node.reset(YAML::Node(YAML::NodeType::Map));
    return true;
  }
  return node.IsMap();
}

} // namespace

/* ----------------------------- Lifecycle ----------------------------- */

DatabaseStatus ConfigDatabase::load(const std::string& file) {
  YAML::Node loaded;
  try {
    loaded.reset(YAML::LoadFile(file));
  } catch (const YAML::BadFile&) {
    return DatabaseStatus::IO_FAILED;
  } catch (const YAML::ParserException&) {
    return DatabaseStatus::PARSE_FAILED;
  }

  if (!normalizeRoot(loaded)) {
    return DatabaseStatus::PARSE_FAILED;
  }
  root_.reset(loaded);
  file_ = file;
  loaded_ = true;
  return DatabaseStatus::OK;
}

DatabaseStatus ConfigDatabase::loadFromString(const std::string& text) {
  YAML::Node loaded;
  try {
    loaded.reset(YAML::Load(text));
  } catch (const YAML::ParserException&) {
    return DatabaseStatus::PARSE_FAILED;
  }

  if (!normalizeRoot(loaded)) {
    return DatabaseStatus::PARSE_FAILED;
  }
  root_.reset(loaded);
  file_.clear();
  loaded_ = true;
  return DatabaseStatus::OK;
}

DatabaseStatus ConfigDatabase::save() const {
  if (!loaded_) {
    return DatabaseStatus::NOT_LOADED;
  }
  if (file_.empty()) {
    return DatabaseStatus::IO_FAILED;
  }
  return save(file_);
}

DatabaseStatus ConfigDatabase::save(const std::string& file) const {
  if (!loaded_) {
    return DatabaseStatus::NOT_LOADED;
  }

  YAML::Emitter emitter;
  emitter << root_;
  if (!emitter.good()) {
    return DatabaseStatus::IO_FAILED;
  }

  std::ofstream out(file, std::ios::out | std::ios::trunc);
  if (!out) {
    return DatabaseStatus::IO_FAILED;
  }
  out << emitter.c_str() << '\n';
  out.flush();
  return out.good() ? DatabaseStatus::OK : DatabaseStatus::IO_FAILED;
}

std::string ConfigDatabase::dump() const { return loaded_ ? YAML::Dump(root_) : std::string(); }

/* ----------------------------- Queries ----------------------------- */

DatabaseStatus ConfigDatabase::prepare(std::string_view text, ConfigPath& path) const {
  if (!loaded_) {
    return DatabaseStatus::NOT_LOADED;
  }
  return parsePath(text, path);
}

std::vector<YAML::Node> ConfigDatabase::select(const ConfigPath& path) const {
  std::vector<YAML::Node> current{root_};
  std::vector<YAML::Node> next;
  for (const PathSegment& SEG : path.segments) {
    next.clear();
    for (const YAML::Node& NODE : current) {
      step(NODE, SEG, next);
    }
    current.swap(next);
    if (current.empty()) {
      break;
    }
  }
  return current;
}

DatabaseStatus ConfigDatabase::get(std::string_view path, ConfigObject& out) const {
  ConfigPath parsed;
  const DatabaseStatus STATUS = prepare(path, parsed);
  if (STATUS != DatabaseStatus::OK) {
    return STATUS;
  }

  const std::vector<YAML::Node> MATCHES = select(parsed);
  if (MATCHES.empty()) {
    return DatabaseStatus::NOT_FOUND;
  }
  out = ConfigObject::fromNode(MATCHES.front());
  return DatabaseStatus::OK;
}

DatabaseStatus ConfigDatabase::getList(std::string_view path,
                                       std::vector<ConfigObject>& out) const {
  ConfigPath parsed;
  const DatabaseStatus STATUS = prepare(path, parsed);
  if (STATUS != DatabaseStatus::OK) {
    return STATUS;
  }

  const bool EXPAND = parsed.isRoot() || parsed.segments.back().selector == Selector::NONE;

  std::vector<ConfigObject> found;
  for (const YAML::Node& MATCH : select(parsed)) {
    if (EXPAND && MATCH.IsSequence()) {
      for (std::size_t i = 0; i < MATCH.size(); ++i) {
        found.push_back(ConfigObject::fromNode(MATCH[i]));
      }
    } else {
      found.push_back(ConfigObject::fromNode(MATCH));
    }
  }

  if (found.empty()) {
    return DatabaseStatus::NOT_FOUND;
  }
  out = std::move(found);
  return DatabaseStatus::OK;
}

bool ConfigDatabase::exists(std::string_view path) const {
  ConfigPath parsed;
  if (prepare(path, parsed) != DatabaseStatus::OK) {
    return false;
  }
  return !select(parsed).empty();
}

DatabaseStatus ConfigDatabase::getValue(std::string_view path, std::string& out) const {
  ConfigPath parsed;
  const DatabaseStatus STATUS = prepare(path, parsed);
  if (STATUS != DatabaseStatus::OK) {
    return STATUS;
  }

  const std::vector<YAML::Node> MATCHES = select(parsed);
  if (MATCHES.empty()) {
    return DatabaseStatus::NOT_FOUND;
  }
  if (!MATCHES.front().IsScalar()) {
    return DatabaseStatus::NOT_APPLICABLE;
  }
  out = MATCHES.front().Scalar();
  return DatabaseStatus::OK;
}

/* ----------------------------- Mutations ----------------------------- */

DatabaseStatus ConfigDatabase::assign(const ConfigPath& path, const YAML::Node& value) {
  if (path.isRoot()) {
    if (!value.IsMap()) {
      return DatabaseStatus::NOT_APPLICABLE;
    }
    root_.reset(YAML::Clone(value));
    return DatabaseStatus::OK;
  }

  std::vector<YAML::Node> matches = select(path);
  if (!matches.empty()) {
    for (YAML::Node& match : matches) {
      match = YAML::Clone(value);
    }
    return DatabaseStatus::OK;
  }

  // Create: walk the parent path, adding mappings for missing plain keys.
  YAML::Node cursor = root_;
  const std::size_t LAST = path.segments.size() - 1;
  for (std::size_t i = 0; i < LAST; ++i) {
    const PathSegment& SEG = path.segments[i];
    if (!cursor.IsMap()) {
      return DatabaseStatus::NOT_APPLICABLE;
    }

    if (SEG.selector == Selector::NONE) {
      const YAML::Node& view = cursor;
      const YAML::Node CHILD = view[SEG.key];
      if (!CHILD.IsDefined() || CHILD.IsNull()) {
        cursor[SEG.key] = YAML::Node(YAML::NodeType::Map);
      }
      cursor.reset(cursor[SEG.key]);
      continue;
    }

    std::vector<YAML::Node> found;
    step(cursor, SEG, found);
    if (found.empty()) {
      return DatabaseStatus::NOT_FOUND;
    }
    cursor.reset(found.front());
  }

  if (cursor.IsNull()) {
    cursor = YAML::Node(YAML::NodeType::Map);
  }
  if (!cursor.IsMap()) {
    return DatabaseStatus::NOT_APPLICABLE;
  }

  const PathSegment& SEG = path.segments[LAST];
  switch (SEG.selector) {
  case Selector::NONE:
    cursor[SEG.key] = YAML::Clone(value);
    return DatabaseStatus::OK;
  case Selector::INDEX:
    return DatabaseStatus::NOT_FOUND;
  case Selector::MATCH:
    break;
  }

  {
    const YAML::Node& view = cursor;
    const YAML::Node EXISTING = view[SEG.key];
    if (!EXISTING.IsDefined() || EXISTING.IsNull()) {
      cursor[SEG.key] = YAML::Node(YAML::NodeType::Sequence);
    } else if (!EXISTING.IsSequence()) {
      return DatabaseStatus::NOT_APPLICABLE;
    }
  }

  YAML::Node element = YAML::Clone(value);
  if (element.IsMap()) {
    const YAML::Node& elementView = element;
    if (!elementView[SEG.matchKey].IsDefined()) {
      element[SEG.matchKey] = SEG.matchValue;
    }
  }
  cursor[SEG.key].push_back(element);
  return DatabaseStatus::OK;
}

DatabaseStatus ConfigDatabase::set(std::string_view path, const ConfigObject& object) {
  ConfigPath parsed;
  const DatabaseStatus STATUS = prepare(path, parsed);
  if (STATUS != DatabaseStatus::OK) {
    return STATUS;
  }

  try {
    return assign(parsed, object.node());
  } catch (const YAML::Exception&) {
    return DatabaseStatus::NOT_APPLICABLE;
  }
}

DatabaseStatus ConfigDatabase::setValue(std::string_view path, const std::string& value) {
  ConfigPath parsed;
  const DatabaseStatus STATUS = prepare(path, parsed);
  if (STATUS != DatabaseStatus::OK) {
    return STATUS;
  }

  try {
    return assign(parsed, YAML::Node(value));
  } catch (const YAML::Exception&) {
    return DatabaseStatus::NOT_APPLICABLE;
  }
}

DatabaseStatus ConfigDatabase::replace(std::string_view path, const ConfigObject& object) {
  ConfigPath parsed;
  const DatabaseStatus STATUS = prepare(path, parsed);
  if (STATUS != DatabaseStatus::OK) {
    return STATUS;
  }
  if (parsed.isRoot()) {
    return assign(parsed, object.node());
  }

  std::vector<YAML::Node> matches = select(parsed);
  if (matches.empty()) {
    return DatabaseStatus::NOT_FOUND;
  }
  for (YAML::Node& match : matches) {
    match = object.toNode();
  }
  return DatabaseStatus::OK;
}

DatabaseStatus ConfigDatabase::update(std::string_view path, const ConfigObject& object) {
  ConfigPath parsed;
  const DatabaseStatus STATUS = prepare(path, parsed);
  if (STATUS != DatabaseStatus::OK) {
    return STATUS;
  }
  if (!hasScalarKeys(object.node())) {
    return DatabaseStatus::NOT_APPLICABLE;
  }

  std::vector<YAML::Node> matches = select(parsed);
  if (matches.empty()) {
    return DatabaseStatus::NOT_FOUND;
  }
  for (const YAML::Node& MATCH : matches) {
    if (!MATCH.IsMap()) {
      return DatabaseStatus::NOT_APPLICABLE;
    }
  }

  for (YAML::Node& match : matches) {
    for (const auto& ENTRY : object.node()) {
      match[ENTRY.first.Scalar()] = YAML::Clone(ENTRY.second);
    }
  }
  return DatabaseStatus::OK;
}

DatabaseStatus ConfigDatabase::remove(std::string_view path) {
  ConfigPath parsed;
  const DatabaseStatus STATUS = prepare(path, parsed);
  if (STATUS != DatabaseStatus::OK) {
    return STATUS;
  }
  if (parsed.isRoot()) {
    return DatabaseStatus::NOT_APPLICABLE;
  }

  const PathSegment& SEG = parsed.segments.back();
  std::size_t removed = 0;

  for (YAML::Node& parent : select(parsed.parent())) {
    if (!parent.IsMap()) {
      continue;
    }
    const YAML::Node& view = parent;
    YAML::Node child = view[SEG.key];
    if (!child.IsDefined()) {
      continue;
    }

    switch (SEG.selector) {
    case Selector::NONE:
      if (parent.remove(SEG.key)) {
        ++removed;
      }
      break;
    case Selector::INDEX:
      if (child.IsSequence() && child.remove(SEG.index)) {
        ++removed;
      }
      break;
    case Selector::MATCH:
      if (!child.IsSequence()) {
        break;
      }
      // Back to front so earlier indices stay valid.
      for (std::size_t i = child.size(); i-- > 0;) {
        const YAML::Node& childView = child;
        if (matchesSelector(childView[i], SEG) && child.remove(i)) {
          ++removed;
        }
      }
      break;
    }
  }

  return (removed == 0) ? DatabaseStatus::NOT_FOUND : DatabaseStatus::OK;
}

} // namespace config

} // namespace blkref

/**
 * @file IdentityResolver.cpp
 * @brief Canonical path resolution and DEVLINKS filtering.
 */

#include "src/storage/inc/IdentityResolver.hpp"
#include "src/helpers/inc/Strings.hpp"

namespace blkref {

namespace storage {

using blkref::helpers::strings::baseName;
using blkref::helpers::strings::dirName;
using blkref::helpers::strings::splitWhitespace;

DeviceStatus IdentityResolver::resolveCanonical(const std::string& path, std::string& out) const {
  if (path.empty()) {
    return DeviceStatus::RESOLUTION_FAILED;
  }
  return fs_.realPath(path, out);
}

std::vector<std::string> IdentityResolver::listDeviceLinks(const std::string& path) const {
  std::vector<std::string> links;

  std::string value;
  if (metadata_.getProperty(path, DEVLINKS_PROPERTY, value) != DeviceStatus::OK) {
    // No metadata means no aliases.
    return links;
  }

  for (const std::string_view ENTRY : splitWhitespace(value)) {
    if (ENTRY.front() == '/') {
      links.emplace_back(ENTRY);
    } else {
      std::string absolute(DEV_PREFIX);
      absolute += ENTRY;
      links.push_back(std::move(absolute));
    }
  }
  return links;
}

std::vector<std::string> IdentityResolver::listAliases(const std::string& path,
                                                       std::string_view dir) const {
  std::vector<std::string> links = listDeviceLinks(path);
  if (dir.empty()) {
    return links;
  }

  std::vector<std::string> names;
  for (const std::string& LINK : links) {
    const std::string_view NAME = baseName(LINK);
    if (!NAME.empty() && dirName(LINK) == dir) {
      names.emplace_back(NAME);
    }
  }
  return names;
}

} // namespace storage

} // namespace blkref

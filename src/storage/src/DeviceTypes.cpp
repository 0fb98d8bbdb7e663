/**
 * @file DeviceTypes.cpp
 * @brief Status strings and device number parsing.
 */

#include "src/storage/inc/DeviceTypes.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <charconv>

#include <fmt/core.h>

namespace blkref {

namespace storage {

namespace {

/// Parse a non-empty run of decimal digits that must cover the whole field.
bool parseField(std::string_view field, unsigned int& out) noexcept {
  if (field.empty()) {
    return false;
  }
  for (const char C : field) {
    if (!helpers::strings::isDigit(C)) {
      return false;
    }
  }
  const auto [PTR, EC] = std::from_chars(field.data(), field.data() + field.size(), out);
  return EC == std::errc{} && PTR == field.data() + field.size();
}

} // namespace

/* ----------------------------- Status Helpers ----------------------------- */

const char* toString(DeviceStatus status) noexcept {
  switch (status) {
  case DeviceStatus::OK:
    return "OK";
  case DeviceStatus::DEVICE_NOT_FOUND:
    return "DEVICE_NOT_FOUND";
  case DeviceStatus::RESOLUTION_FAILED:
    return "RESOLUTION_FAILED";
  case DeviceStatus::METADATA_UNAVAILABLE:
    return "METADATA_UNAVAILABLE";
  case DeviceStatus::MALFORMED_RECORD:
    return "MALFORMED_RECORD";
  }
  return "UNKNOWN";
}

/* ----------------------------- DeviceNumber ----------------------------- */

std::string DeviceNumber::toString() const { return fmt::format("{}:{}", major, minor); }

bool parseDeviceNumber(std::string_view text, DeviceNumber& out) noexcept {
  const std::string_view BODY = helpers::strings::trim(text);
  const std::size_t COLON = BODY.find(':');
  if (COLON == std::string_view::npos) {
    return false;
  }

  DeviceNumber parsed{};
  if (!parseField(BODY.substr(0, COLON), parsed.major) ||
      !parseField(BODY.substr(COLON + 1), parsed.minor)) {
    return false;
  }
  out = parsed;
  return true;
}

} // namespace storage

} // namespace blkref

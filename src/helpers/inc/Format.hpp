#ifndef BLKREF_HELPERS_FORMAT_HPP
#define BLKREF_HELPERS_FORMAT_HPP
/**
 * @file Format.hpp
 * @brief Human-readable formatting for device geometry.
 * @note Cold path only: all functions return std::string.
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include <fmt/core.h>

namespace blkref {
namespace helpers {
namespace format {

/**
 * @brief Format bytes using binary units (KiB, MiB, GiB, TiB, PiB).
 * @param bytes Byte count.
 * @return Formatted string (e.g., "1.5 GiB", "512 B").
 */
[[nodiscard]] inline std::string bytesBinary(std::uint64_t bytes) {
  static constexpr std::array<const char*, 5> UNITS = {"KiB", "MiB", "GiB", "TiB", "PiB"};

  if (bytes < 1024ULL) {
    return fmt::format("{} B", bytes);
  }

  double value = static_cast<double>(bytes) / 1024.0;
  std::size_t unit = 0;
  while (value >= 1024.0 && unit + 1 < UNITS.size()) {
    value /= 1024.0;
    ++unit;
  }
  return fmt::format("{:.1f} {}", value, UNITS[unit]);
}

/// @brief bytesBinary() for a possibly unknown value ("unknown" when empty).
[[nodiscard]] inline std::string bytesBinary(const std::optional<std::uint64_t>& bytes) {
  return bytes ? bytesBinary(*bytes) : std::string("unknown");
}

/// @brief Decimal rendering of a possibly unknown value ("unknown" when empty).
template <typename T> [[nodiscard]] inline std::string valueOrUnknown(const std::optional<T>& v) {
  return v ? fmt::format("{}", *v) : std::string("unknown");
}

} // namespace format
} // namespace helpers
} // namespace blkref

#endif // BLKREF_HELPERS_FORMAT_HPP

#ifndef BLKREF_HELPERS_STRINGS_HPP
#define BLKREF_HELPERS_STRINGS_HPP
/**
 * @file Strings.hpp
 * @brief String helpers for device paths and metadata values.
 *
 * Small, allocation-light operations over std::string_view used by the
 * storage and config modules: prefix handling, whitespace splitting and
 * natural ("human") ordering.
 */

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace blkref {
namespace helpers {
namespace strings {

/* ----------------------------- Predicates ----------------------------- */

/// @brief True for ASCII space, tab, CR and LF.
[[nodiscard]] constexpr bool isSpace(char c) noexcept {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

/// @brief True for ASCII '0'..'9'.
[[nodiscard]] constexpr bool isDigit(char c) noexcept { return c >= '0' && c <= '9'; }

/**
 * @brief Check if string starts with prefix.
 * @param str String to check.
 * @param prefix Prefix to look for.
 * @return true if str starts with prefix (an empty prefix always matches).
 */
[[nodiscard]] inline bool startsWith(std::string_view str, std::string_view prefix) noexcept {
  return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

/* ----------------------------- Manipulation ----------------------------- */

/**
 * @brief Strip trailing whitespace in-place.
 * @param buf Buffer to modify (null-terminated).
 * @param len Current string length (will be updated).
 */
inline void stripTrailingWhitespace(char* buf, std::size_t& len) noexcept {
  if (buf == nullptr) {
    return;
  }

  while (len > 0 && isSpace(buf[len - 1])) {
    --len;
    buf[len] = '\0';
  }
}

/// @brief Return str without leading and trailing whitespace.
[[nodiscard]] inline std::string_view trim(std::string_view str) noexcept {
  while (!str.empty() && isSpace(str.front())) {
    str.remove_prefix(1);
  }
  while (!str.empty() && isSpace(str.back())) {
    str.remove_suffix(1);
  }
  return str;
}

/**
 * @brief Remove a literal prefix.
 * @return str without prefix, or str unchanged when it does not start with prefix.
 * @note Purely textual: "/dev/disk/by-id/x" minus "/dev/" is "disk/by-id/x".
 */
[[nodiscard]] inline std::string_view stripPrefix(std::string_view str,
                                                  std::string_view prefix) noexcept {
  if (startsWith(str, prefix)) {
    str.remove_prefix(prefix.size());
  }
  return str;
}

/// @brief Last '/'-separated segment of a path ("a/b/c" -> "c").
[[nodiscard]] inline std::string_view baseName(std::string_view path) noexcept {
  const std::size_t POS = path.rfind('/');
  return (POS == std::string_view::npos) ? path : path.substr(POS + 1);
}

/// @brief Everything before the last '/' ("a/b/c" -> "a/b", "c" -> "").
[[nodiscard]] inline std::string_view dirName(std::string_view path) noexcept {
  const std::size_t POS = path.rfind('/');
  return (POS == std::string_view::npos) ? std::string_view{} : path.substr(0, POS);
}

/**
 * @brief Split on runs of whitespace, dropping empty tokens.
 * @note Allocates the returned vector; tokens view into str.
 */
[[nodiscard]] inline std::vector<std::string_view> splitWhitespace(std::string_view str) {
  std::vector<std::string_view> out;
  std::size_t i = 0;
  while (i < str.size()) {
    while (i < str.size() && isSpace(str[i])) {
      ++i;
    }
    const std::size_t START = i;
    while (i < str.size() && !isSpace(str[i])) {
      ++i;
    }
    if (i > START) {
      out.emplace_back(str.substr(START, i - START));
    }
  }
  return out;
}

/* ----------------------------- Ordering ----------------------------- */

/**
 * @brief Natural ("human") string comparison.
 *
 * Runs of ASCII digits compare by numeric value, everything else byte by byte,
 * so "disk-2" < "disk-10". Leading zeros do not change a run's value; when two
 * runs have equal value the one with fewer leading zeros sorts first. Strings
 * that are still equal under these rules fall back to plain byte ordering, so
 * the result is a strict total order.
 *
 * @return <0, 0 or >0 like std::string_view::compare.
 */
[[nodiscard]] inline int naturalCompare(std::string_view a, std::string_view b) noexcept {
  std::size_t i = 0;
  std::size_t j = 0;
  int zeroBias = 0;

  while (i < a.size() && j < b.size()) {
    if (isDigit(a[i]) && isDigit(b[j])) {
      const std::size_t A_START = i;
      const std::size_t B_START = j;
      while (i < a.size() && a[i] == '0') {
        ++i;
      }
      while (j < b.size() && b[j] == '0') {
        ++j;
      }
      const std::size_t A_SIG = i;
      const std::size_t B_SIG = j;
      while (i < a.size() && isDigit(a[i])) {
        ++i;
      }
      while (j < b.size() && isDigit(b[j])) {
        ++j;
      }

      // Longer significant run is the larger number.
      const std::size_t A_LEN = i - A_SIG;
      const std::size_t B_LEN = j - B_SIG;
      if (A_LEN != B_LEN) {
        return (A_LEN < B_LEN) ? -1 : 1;
      }
      const int CMP = a.substr(A_SIG, A_LEN).compare(b.substr(B_SIG, B_LEN));
      if (CMP != 0) {
        return CMP;
      }
      if (zeroBias == 0) {
        const std::size_t A_ZEROS = A_SIG - A_START;
        const std::size_t B_ZEROS = B_SIG - B_START;
        if (A_ZEROS != B_ZEROS) {
          zeroBias = (A_ZEROS < B_ZEROS) ? -1 : 1;
        }
      }
      continue;
    }

    if (a[i] != b[j]) {
      return (static_cast<unsigned char>(a[i]) < static_cast<unsigned char>(b[j])) ? -1 : 1;
    }
    ++i;
    ++j;
  }

  if (i < a.size()) {
    return 1;
  }
  if (j < b.size()) {
    return -1;
  }
  if (zeroBias != 0) {
    return zeroBias;
  }
  const int CMP = a.compare(b);
  return (CMP < 0) ? -1 : (CMP > 0 ? 1 : 0);
}

} // namespace strings
} // namespace helpers
} // namespace blkref

#endif // BLKREF_HELPERS_STRINGS_HPP

#ifndef BLKREF_HELPERS_FILES_HPP
#define BLKREF_HELPERS_FILES_HPP
/**
 * @file Files.hpp
 * @brief File I/O and path probes for sysfs and /dev.
 *
 * Reads use C-style I/O (open/read/close) into bounded buffers. Probes wrap
 * stat()/realpath() and never throw.
 */

#include "src/helpers/inc/Strings.hpp"

#include <fcntl.h>    // open, O_RDONLY, O_CLOEXEC
#include <sys/stat.h> // stat, S_ISBLK
#include <unistd.h>   // read, close

#include <array>
#include <climits> // PATH_MAX
#include <cstddef>
#include <cstdlib> // realpath
#include <string>

namespace blkref {
namespace helpers {
namespace files {

/* ----------------------------- Constants ----------------------------- */

/// Default buffer size for attribute reads.
inline constexpr std::size_t FILE_READ_BUFFER_SIZE = 256;

/* ----------------------------- File Reading ----------------------------- */

/**
 * @brief Read file contents into buffer.
 * @param path File path to read.
 * @param buf Output buffer.
 * @param bufSize Size of output buffer.
 * @param len Receives the number of bytes kept (excluding null terminator).
 * @return false if the file could not be opened or a read failed; an empty
 *         file is a successful read with len == 0.
 *
 * Strips trailing whitespace. Always null-terminates. Contents beyond
 * bufSize - 1 bytes are dropped.
 */
[[nodiscard]] inline bool readFileToBuffer(const char* path, char* buf, std::size_t bufSize,
                                           std::size_t& len) noexcept {
  len = 0;
  if (buf == nullptr || bufSize == 0) {
    return false;
  }
  buf[0] = '\0';
  if (path == nullptr) {
    return false;
  }

  const int FD = ::open(path, O_RDONLY | O_CLOEXEC);
  if (FD < 0) {
    return false;
  }

  std::size_t total = 0;
  bool ok = true;
  while (total < bufSize - 1) {
    const ssize_t N = ::read(FD, buf + total, bufSize - 1 - total);
    if (N < 0) {
      ok = false;
      break;
    }
    if (N == 0) {
      break;
    }
    total += static_cast<std::size_t>(N);
  }

  ::close(FD);
  if (!ok) {
    buf[0] = '\0';
    return false;
  }
  buf[total] = '\0';

  blkref::helpers::strings::stripTrailingWhitespace(buf, total);
  len = total;
  return true;
}

/* ----------------------------- Path Probes ----------------------------- */

/**
 * @brief Check if path is a block special file (follows symlinks).
 * @return false for regular files, directories, char devices and missing paths.
 */
[[nodiscard]] inline bool isBlockDevice(const char* path) noexcept {
  if (path == nullptr) {
    return false;
  }
  struct stat st{};
  if (::stat(path, &st) != 0) {
    return false;
  }
  return S_ISBLK(st.st_mode);
}

/**
 * @brief Resolve symlinks, "." and ".." to an absolute path.
 * @param path Path to resolve.
 * @param out Receives the resolved path on success, untouched otherwise.
 * @return true on success; false if any component is missing or unreadable.
 */
[[nodiscard]] inline bool resolveRealPath(const char* path, std::string& out) {
  if (path == nullptr || path[0] == '\0') {
    return false;
  }
  std::array<char, PATH_MAX> resolved{};
  if (::realpath(path, resolved.data()) == nullptr) {
    return false;
  }
  out.assign(resolved.data());
  return true;
}

} // namespace files
} // namespace helpers
} // namespace blkref

#endif // BLKREF_HELPERS_FILES_HPP

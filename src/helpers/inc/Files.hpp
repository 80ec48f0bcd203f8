#ifndef CPUFETCH_HELPERS_FILES_HPP
#define CPUFETCH_HELPERS_FILES_HPP
/**
 * @file Files.hpp
 * @brief File I/O and path utilities for pseudo-filesystem readers.
 *
 * Uses C-style I/O (open/read/close) so errno is available for diagnostics.
 * procfs and sysfs report a size of 0 for their files, so whole-file reads loop
 * until EOF instead of trusting stat().
 */

#include <fcntl.h>    // open, O_RDONLY, O_CLOEXEC
#include <sys/stat.h> // stat, S_ISDIR
#include <unistd.h>   // read, close

#include <array>
#include <cerrno>
#include <cstddef>
#include <cstring> // strerror
#include <string>

namespace cpufetch {
namespace helpers {
namespace files {

/* ----------------------------- Constants ----------------------------- */

/// Default buffer size for small sysfs attribute reads.
inline constexpr std::size_t FILE_READ_BUFFER_SIZE = 256;

/// Chunk size for whole-file reads.
inline constexpr std::size_t FILE_CHUNK_SIZE = 4096;

/* ----------------------------- File Reading ----------------------------- */

/**
 * @brief Read file contents into buffer using C-style I/O.
 * @param path File path to read.
 * @param buf Output buffer.
 * @param bufSize Size of output buffer.
 * @return Number of bytes read (excluding null terminator), 0 on error.
 *
 * Strips trailing newlines and whitespace. Always null-terminates.
 */
[[nodiscard]] inline std::size_t readFileToBuffer(const char* path, char* buf,
                                                  std::size_t bufSize) noexcept {
  if (path == nullptr || buf == nullptr || bufSize == 0) {
    if (buf != nullptr && bufSize > 0) {
      buf[0] = '\0';
    }
    return 0;
  }

  buf[0] = '\0';

  const int FD = ::open(path, O_RDONLY | O_CLOEXEC);
  if (FD < 0) {
    return 0;
  }

  std::size_t total = 0;
  while (total < bufSize - 1) {
    const ssize_t N = ::read(FD, buf + total, bufSize - 1 - total);
    if (N <= 0) {
      break;
    }
    total += static_cast<std::size_t>(N);
  }

  ::close(FD);
  buf[total] = '\0';

  while (total > 0) {
    const char C = buf[total - 1];
    if (C == '\n' || C == '\r' || C == ' ' || C == '\t') {
      --total;
      buf[total] = '\0';
    } else {
      break;
    }
  }

  return total;
}

/**
 * @brief Read a small attribute file into a std::string.
 * @param path File path to read.
 * @param out Output: trimmed content (cleared on failure).
 * @return true if the file was readable and non-empty.
 */
[[nodiscard]] inline bool readAttribute(const char* path, std::string& out) {
  std::array<char, FILE_READ_BUFFER_SIZE> buf{};
  const std::size_t LEN = readFileToBuffer(path, buf.data(), buf.size());
  out.assign(buf.data(), LEN);
  return LEN > 0;
}

/**
 * @brief Read an entire text file.
 * @param path File path to read.
 * @param out Output: file content, unmodified.
 * @param error Output: "<path>: <strerror>" on failure.
 * @return true on success (an empty file is a success).
 */
[[nodiscard]] inline bool readFileToString(const char* path, std::string& out,
                                           std::string& error) {
  out.clear();
  if (path == nullptr) {
    error = "no path given";
    return false;
  }

  const int FD = ::open(path, O_RDONLY | O_CLOEXEC);
  if (FD < 0) {
    error = std::string(path) + ": " + std::strerror(errno);
    return false;
  }

  std::array<char, FILE_CHUNK_SIZE> chunk{};
  for (;;) {
    const ssize_t N = ::read(FD, chunk.data(), chunk.size());
    if (N < 0) {
      if (errno == EINTR) {
        continue;
      }
      error = std::string(path) + ": " + std::strerror(errno);
      ::close(FD);
      out.clear();
      return false;
    }
    if (N == 0) {
      break;
    }
    out.append(chunk.data(), static_cast<std::size_t>(N));
  }

  ::close(FD);
  return true;
}

/* ----------------------------- Path Utilities ----------------------------- */

/**
 * @brief Check if path is a directory.
 */
[[nodiscard]] inline bool isDirectory(const char* path) noexcept {
  if (path == nullptr) {
    return false;
  }
  struct stat st{};
  if (::stat(path, &st) != 0) {
    return false;
  }
  return S_ISDIR(st.st_mode);
}

} // namespace files
} // namespace helpers
} // namespace cpufetch

#endif // CPUFETCH_HELPERS_FILES_HPP

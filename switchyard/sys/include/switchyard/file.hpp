#pragma once

#include <cstddef>
#include <limits>
#include <span>
#include <string>
#include <string_view>

#include "switchyard/base-fd.hpp"

namespace switchyard {

// Read-only regular file, opened by path.
class File {
 public:
  static constexpr std::size_t kError = std::numeric_limits<std::size_t>::max();

  File() noexcept = default;

  // Opens 'path'. Does not throw on open failure: operator bool() returns false and openErrno() tells why.
  // A path designating something else than a regular file (a directory for instance) fails with EISDIR.
  explicit File(const std::string& path);

  explicit operator bool() const noexcept { return static_cast<bool>(_fd); }

  // errno of the failed open, 0 if the file is opened.
  [[nodiscard]] int openErrno() const noexcept { return _openErrno; }

  // True if the open failure means that there is nothing to serve at this path.
  [[nodiscard]] bool notFound() const noexcept;

  // File size in bytes at the time of opening.
  [[nodiscard]] std::size_t size() const noexcept { return _fileSize; }

  // Reads up to dst.size() bytes at the given absolute offset, without moving the file offset (pread).
  // Returns the number of bytes read (0 at EOF), or kError on error.
  [[nodiscard]] std::size_t readAt(std::span<char> dst, std::size_t offset) const;

  // Probable content type based on the file extension, 'application/octet-stream' if unknown.
  [[nodiscard]] std::string_view detectedContentType() const;

 private:
  BaseFd _fd;
  std::string _path;
  std::size_t _fileSize{kError};
  int _openErrno{0};
};

}  // namespace switchyard

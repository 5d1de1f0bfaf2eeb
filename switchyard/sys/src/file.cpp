#include "switchyard/file.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <cstring>
#include <span>
#include <string>
#include <string_view>

#include "switchyard/log.hpp"
#include "switchyard/mime-mappings.hpp"

namespace switchyard {

File::File(const std::string& path) : _fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC)), _path(path) {
  if (!_fd) {
    _openErrno = errno;
    log::debug("Unable to open '{}': {}", _path, std::strerror(_openErrno));
    return;
  }
  struct stat st{};
  if (::fstat(_fd.fd(), &st) != 0) {
    _openErrno = errno;
    log::error("fstat failed for '{}': {}", _path, std::strerror(_openErrno));
    _fd.close();
    return;
  }
  if (!S_ISREG(st.st_mode)) {
    _openErrno = EISDIR;
    log::debug("'{}' is not a regular file", _path);
    _fd.close();
    return;
  }
  _fileSize = static_cast<std::size_t>(st.st_size);
}

bool File::notFound() const noexcept {
  return _openErrno == ENOENT || _openErrno == ENOTDIR || _openErrno == EISDIR;
}

std::size_t File::readAt(std::span<char> dst, std::size_t offset) const {
  while (true) {
    const auto nbRead = ::pread(_fd.fd(), dst.data(), dst.size(), static_cast<off_t>(offset));
    if (nbRead >= 0) {
      return static_cast<std::size_t>(nbRead);
    }
    if (errno != EINTR) {
      log::error("pread failed for '{}' at offset {}: {}", _path, offset, std::strerror(errno));
      return kError;
    }
  }
}

std::string_view File::detectedContentType() const {
  std::string_view mimeType = DetermineMIMETypeStr(_path);
  if (mimeType.empty()) {
    mimeType = "application/octet-stream";
  }
  return mimeType;
}

}  // namespace switchyard

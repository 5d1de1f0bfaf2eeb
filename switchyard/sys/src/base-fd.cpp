#include "switchyard/base-fd.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include "switchyard/log.hpp"

namespace switchyard {

BaseFd& BaseFd::operator=(BaseFd&& other) noexcept {
  if (this != &other) {
    close();
    _fd = other.release();
  }
  return *this;
}

void BaseFd::close() noexcept {
  if (_fd == kClosedFd) {
    return;
  }
  // On Linux the descriptor is released even when close() reports EINTR, so it must not be retried.
  if (::close(_fd) != 0 && errno != EINTR) [[unlikely]] {
    log::error("close fd # {} failed: {}", _fd, std::strerror(errno));
  } else {
    log::trace("fd # {} closed", _fd);
  }
  _fd = kClosedFd;
}

int BaseFd::release() noexcept { return std::exchange(_fd, kClosedFd); }

}  // namespace switchyard

#pragma once

namespace switchyard {

// RAII owner of a POSIX file descriptor (socket, epoll instance, eventfd, regular file).
class BaseFd {
 public:
  static constexpr int kClosedFd = -1;

  explicit BaseFd(int fd = kClosedFd) noexcept : _fd(fd) {}

  BaseFd(const BaseFd&) = delete;
  BaseFd(BaseFd&& other) noexcept : _fd(other.release()) {}
  BaseFd& operator=(const BaseFd&) = delete;
  BaseFd& operator=(BaseFd&& other) noexcept;

  ~BaseFd() { close(); }

  [[nodiscard]] int fd() const noexcept { return _fd; }

  explicit operator bool() const noexcept { return _fd != kClosedFd; }

  // Gives up ownership of the descriptor without closing it.
  [[nodiscard]] int release() noexcept;

  // Closes the descriptor now instead of at destruction. Idempotent.
  void close() noexcept;

 private:
  int _fd;
};

}  // namespace switchyard

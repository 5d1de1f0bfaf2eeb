#include "switchyard/event-fd.hpp"

#include <sys/eventfd.h>

#include <cerrno>
#include <cstring>

#include "switchyard/errno-throw.hpp"
#include "switchyard/log.hpp"

namespace switchyard {

EventFd::EventFd() : _baseFd(::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC)) {
  if (!_baseFd) {
    throw_errno("Unable to create a new EventFd");
  }
  log::trace("EventFd fd # {} opened", fd());
}

void EventFd::send() const noexcept {
  if (::eventfd_write(fd(), 1) == -1) {
    const auto savedErr = errno;
    // EAGAIN means the counter is saturated, so a wakeup is pending anyway.
    if (savedErr != EAGAIN) {
      log::error("EventFd fd # {} send failed err={}: {}", fd(), savedErr, std::strerror(savedErr));
    }
  }
}

bool EventFd::read() const noexcept {
  eventfd_t counterValue{};
  if (::eventfd_read(fd(), &counterValue) == -1) {
    const auto savedErr = errno;
    if (savedErr != EAGAIN) {
      log::error("EventFd fd # {} read failed err={}: {}", fd(), savedErr, std::strerror(savedErr));
    }
    return false;
  }
  return counterValue != 0;
}

}  // namespace switchyard

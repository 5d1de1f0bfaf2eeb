#include "switchyard/event-loop.hpp"

#include <sys/epoll.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <span>
#include <utility>

#include "switchyard/base-fd.hpp"
#include "switchyard/errno-throw.hpp"
#include "switchyard/event.hpp"
#include "switchyard/log.hpp"

namespace switchyard {

static_assert(EventIn == EPOLLIN, "EventIn value mismatch");
static_assert(EventOut == EPOLLOUT, "EventOut value mismatch");
static_assert(EventErr == EPOLLERR, "EventErr value mismatch");
static_assert(EventHup == EPOLLHUP, "EventHup value mismatch");
static_assert(EventRdHup == EPOLLRDHUP, "EventRdHup value mismatch");
static_assert(EventExclusive == EPOLLEXCLUSIVE, "EventExclusive value mismatch");
static_assert(EventEt == EPOLLET, "EventEt value mismatch");

EventLoop::EventLoop(std::chrono::milliseconds pollTimeout, uint32_t initialCapacity)
    : _epollEvents(std::max(1U, initialCapacity)),
      _nbAllocatedEvents(static_cast<uint32_t>(_epollEvents.size())),
      _readyEvents(_epollEvents.size()),
      _pollTimeoutMs(static_cast<int>(pollTimeout.count())),
      _baseFd(::epoll_create1(EPOLL_CLOEXEC)) {
  if (!_baseFd) {
    throw_errno("epoll_create1 failed");
  }
  log::trace("EventLoop fd # {} opened", _baseFd.fd());
}

EventLoop::EventLoop(EventLoop&&) noexcept = default;
EventLoop& EventLoop::operator=(EventLoop&&) noexcept = default;
EventLoop::~EventLoop() = default;

void EventLoop::addOrThrow(EventFd event) const {
  if (!add(event)) [[unlikely]] {
    throw_errno("epoll_ctl ADD failed (fd # {}, events=0x{:x})", event.fd, event.eventBmp);
  }
}

bool EventLoop::add(EventFd event) const {
  epoll_event ev{event.eventBmp, epoll_data_t{.fd = event.fd}};
  if (::epoll_ctl(_baseFd.fd(), EPOLL_CTL_ADD, event.fd, &ev) != 0) [[unlikely]] {
    const auto err = errno;
    log::error("epoll_ctl ADD failed (fd # {}, events=0x{:x}, errno={}, msg={})", event.fd, event.eventBmp, err,
               std::strerror(err));
    errno = err;
    return false;
  }
  return true;
}

bool EventLoop::mod(EventFd event) const {
  epoll_event ev{event.eventBmp, epoll_data_t{.fd = event.fd}};
  if (::epoll_ctl(_baseFd.fd(), EPOLL_CTL_MOD, event.fd, &ev) != 0) [[unlikely]] {
    const auto err = errno;
    log::error("epoll_ctl MOD failed (fd # {}, events=0x{:x}, errno={}, msg={})", event.fd, event.eventBmp, err,
               std::strerror(err));
    return false;
  }
  return true;
}

void EventLoop::del(int fd) const {
  if (::epoll_ctl(_baseFd.fd(), EPOLL_CTL_DEL, fd, nullptr) != 0) [[unlikely]] {
    const auto err = errno;
    log::debug("epoll_ctl DEL failed (fd # {}, errno={}, msg={})", fd, err, std::strerror(err));
  }
}

std::span<const EventLoop::EventFd> EventLoop::poll() {
  if (_readyEvents.size() < _epollEvents.size()) {
    _readyEvents.resize(_epollEvents.size());
  }
  const auto capacityBeforePoll = _epollEvents.size();
  const int nbReadyFds =
      ::epoll_wait(_baseFd.fd(), _epollEvents.data(), static_cast<int>(capacityBeforePoll), _pollTimeoutMs);
  if (nbReadyFds == -1) {
    const auto err = errno;
    if (err == EINTR) {
      return {_readyEvents.data(), 0U};
    }
    log::error("epoll_wait failed (timeout_ms={}, errno={}, msg={})", _pollTimeoutMs, err, std::strerror(err));
    return {};
  }

  const auto nbReady = static_cast<std::size_t>(nbReadyFds);
  for (std::size_t eventPos = 0; eventPos < nbReady; ++eventPos) {
    _readyEvents[eventPos] = EventFd{_epollEvents[eventPos].data.fd, _epollEvents[eventPos].events};
  }
  std::span<const EventFd> ready(_readyEvents.data(), nbReady);

  if (nbReady == capacityBeforePoll) {
    // Saturated: grow for the next polls. _readyEvents follows on the next call, keeping the returned span valid.
    _epollEvents.resize(2U * capacityBeforePoll);
    _nbAllocatedEvents = static_cast<uint32_t>(_epollEvents.size());
    log::debug("EventLoop fd # {} grew its event buffer to {}", _baseFd.fd(), _epollEvents.size());
  }
  return ready;
}

}  // namespace switchyard

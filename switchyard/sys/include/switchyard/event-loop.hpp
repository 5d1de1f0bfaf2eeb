#pragma once

#include <chrono>
#include <cstdint>
#include <span>
#include <vector>

#include "switchyard/base-fd.hpp"
#include "switchyard/event.hpp"

struct epoll_event;

namespace switchyard {

// Thin RAII wrapper over an epoll instance.
// The ready events buffer starts at 'initialCapacity' slots and doubles each time a poll fills it completely.
// It never shrinks.
class EventLoop {
 public:
  static constexpr uint32_t kInitialCapacity = 64;

  struct EventFd {
    int fd;
    EventBmp eventBmp;
  };

  // Throws std::system_error if the epoll instance cannot be created.
  explicit EventLoop(std::chrono::milliseconds pollTimeout, uint32_t initialCapacity = kInitialCapacity);

  EventLoop(const EventLoop&) = delete;
  EventLoop(EventLoop&&) noexcept;
  EventLoop& operator=(const EventLoop&) = delete;
  EventLoop& operator=(EventLoop&&) noexcept;

  ~EventLoop();

  // Registers fd for the given events, throws std::system_error on failure.
  void addOrThrow(EventFd event) const;

  // Registers fd for the given events. Returns false on failure (logged).
  [[nodiscard]] bool add(EventFd event) const;

  // Changes the events of an already registered fd. Returns false on failure (logged).
  [[nodiscard]] bool mod(EventFd event) const;

  // Stops monitoring fd. Failures are logged at debug level only, as the fd may already be closed.
  void del(int fd) const;

  // Waits for ready events up to the poll timeout.
  // Returns a view over an internal buffer, valid until the next call:
  //  - ready events on success,
  //  - an empty span with non-null data() on timeout or EINTR,
  //  - an empty span with null data() on unrecoverable epoll_wait failure (logged).
  [[nodiscard]] std::span<const EventFd> poll();

  // Number of event slots available to the next poll.
  [[nodiscard]] uint32_t capacity() const noexcept { return _nbAllocatedEvents; }

 private:
  std::vector<epoll_event> _epollEvents;
  uint32_t _nbAllocatedEvents;
  std::vector<EventFd> _readyEvents;
  int _pollTimeoutMs;
  BaseFd _baseFd;
};

}  // namespace switchyard

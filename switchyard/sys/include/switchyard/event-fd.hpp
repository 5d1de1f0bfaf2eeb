#pragma once

#include "switchyard/base-fd.hpp"

namespace switchyard {

// Non-blocking eventfd used to wake up a listener event loop from another thread
// (completed responses handed back by workers, stop requests).
class EventFd {
 public:
  // Throws std::system_error if the eventfd cannot be created.
  EventFd();

  void send() const noexcept;

  // Drains pending wakeups. Returns true if at least one was pending.
  bool read() const noexcept;

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

 private:
  BaseFd _baseFd;
};

}  // namespace switchyard

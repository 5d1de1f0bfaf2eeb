#include "switchyard/connection.hpp"

#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>

#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <exception>
#include <memory>
#include <mutex>
#include <string_view>
#include <utility>
#include <vector>

#include "switchyard/base-fd.hpp"
#include "switchyard/log.hpp"
#include "switchyard/timedef.hpp"

namespace switchyard {

void ListenerMailbox::post(Completion completion) {
  {
    std::lock_guard lock(_mutex);
    if (_closed) {
      return;
    }
    _completions.push_back(std::move(completion));
  }
  _wakeupFd.send();
}

std::vector<ListenerMailbox::Completion> ListenerMailbox::drain() {
  std::lock_guard lock(_mutex);
  return std::exchange(_completions, {});
}

void ListenerMailbox::close() {
  std::vector<Completion> dropped;
  {
    std::lock_guard lock(_mutex);
    _closed = true;
    dropped.swap(_completions);
  }
  // connections are released outside of the lock
}

HttpConnection::HttpConnection(BaseFd fd, std::shared_ptr<ListenerMailbox> mailbox,
                               std::chrono::milliseconds writeTimeout)
    : _fd(std::move(fd)), _mailbox(std::move(mailbox)), _writeTimeout(writeTimeout), _lastActivity(SteadyClock::now()) {}

HttpConnection::ReadStatus HttpConnection::readAvailable() {
  std::array<char, 16UL * 1024UL> buf;
  bool gotData = false;
  while (true) {
    const auto nbRead = ::recv(fd(), buf.data(), buf.size(), 0);
    if (nbRead > 0) {
      _inBuffer.append(buf.data(), static_cast<std::size_t>(nbRead));
      gotData = true;
      continue;
    }
    if (nbRead == 0) {
      log::debug("Peer closed fd # {}", fd());
      _peerClosed = true;
      return gotData ? ReadStatus::Data : ReadStatus::Closed;
    }
    const auto err = errno;
    if (err == EINTR) {
      continue;
    }
    if (err == EAGAIN || err == EWOULDBLOCK) {
      return gotData ? ReadStatus::Data : ReadStatus::WouldBlock;
    }
    log::debug("recv failed on fd # {}: {}", fd(), std::strerror(err));
    return ReadStatus::Closed;
  }
}

bool HttpConnection::write(std::string_view data) {
  if (_writeFailed.load(std::memory_order_relaxed)) {
    return false;
  }
  while (!data.empty()) {
    const auto nbSent = ::send(fd(), data.data(), data.size(), MSG_NOSIGNAL);
    if (nbSent >= 0) {
      data.remove_prefix(static_cast<std::size_t>(nbSent));
      continue;
    }
    const auto err = errno;
    if (err == EINTR) {
      continue;
    }
    if (err != EAGAIN && err != EWOULDBLOCK) {
      log::debug("send failed on fd # {}: {}", fd(), std::strerror(err));
      _writeFailed.store(true, std::memory_order_relaxed);
      return false;
    }
    if (_nonBlockingWrites) {
      log::debug("Peer of fd # {} is not reading, dropping {} bytes", fd(), data.size());
      _writeFailed.store(true, std::memory_order_relaxed);
      return false;
    }
    pollfd pfd{fd(), POLLOUT, 0};
    const auto pollRet = ::poll(&pfd, 1, static_cast<int>(_writeTimeout.count()));
    if (pollRet == 0) {
      log::warn("Write timeout on fd # {} with {} bytes left", fd(), data.size());
      _writeFailed.store(true, std::memory_order_relaxed);
      return false;
    }
    if (pollRet < 0 && errno != EINTR) {
      log::error("poll failed on fd # {}: {}", fd(), std::strerror(errno));
      _writeFailed.store(true, std::memory_order_relaxed);
      return false;
    }
  }
  return true;
}

void HttpConnection::complete(bool keepAlive) noexcept {
  log::trace("Response complete on fd # {} keepAlive={}", fd(), keepAlive);
  try {
    _mailbox->post({shared_from_this(), keepAlive && !_writeFailed.load(std::memory_order_relaxed)});
  } catch (const std::exception& ex) {
    log::error("Unable to hand back fd # {} to its listener: {}", fd(), ex.what());
  }
}

}  // namespace switchyard

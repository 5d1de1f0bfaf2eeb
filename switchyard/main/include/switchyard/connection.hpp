#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "switchyard/base-fd.hpp"
#include "switchyard/event-fd.hpp"
#include "switchyard/response-sink.hpp"
#include "switchyard/timedef.hpp"

namespace switchyard {

class HttpConnection;

// Hands the connections whose response is complete back to the listener thread owning them.
// Workers post, the listener drains after being woken up by the eventfd.
class ListenerMailbox {
 public:
  struct Completion {
    std::shared_ptr<HttpConnection> connection;
    bool keepAlive;
  };

  // Throws std::system_error if the wakeup eventfd cannot be created.
  ListenerMailbox() = default;

  // Queues 'completion' and wakes up the listener. Once closed, the completion is dropped, which closes the
  // connection when its last reference goes away.
  void post(Completion completion);

  [[nodiscard]] std::vector<Completion> drain();

  // Wakes up the listener without posting anything.
  void wakeup() const noexcept { _wakeupFd.send(); }

  // Drops pending completions and refuses further ones.
  void close();

  [[nodiscard]] int wakeupFd() const noexcept { return _wakeupFd.fd(); }

  // Consumes the pending wakeup notifications.
  bool acknowledgeWakeup() const noexcept { return _wakeupFd.read(); }

 private:
  std::mutex _mutex;
  std::vector<Completion> _completions;
  EventFd _wakeupFd;
  bool _closed{false};
};

// One accepted client connection.
//
// Reads and request parsing happen on the owning listener thread, while the connection is idle.
// Once a request is dispatched, the connection is 'busy': it is removed from the listener's event loop and the
// response is written to it (as ResponseSink) from the thread handling the request, with blocking semantics
// bounded by the write timeout. complete() then returns it to the listener through the mailbox.
class HttpConnection final : public ResponseSink, public std::enable_shared_from_this<HttpConnection> {
 public:
  enum class ReadStatus : uint8_t { Data, WouldBlock, Closed };

  HttpConnection(BaseFd fd, std::shared_ptr<ListenerMailbox> mailbox, std::chrono::milliseconds writeTimeout);

  [[nodiscard]] int fd() const noexcept { return _fd.fd(); }

  // Reads everything currently available into the input buffer.
  // Closed means the peer closed its side or a read error occurred, with nothing new received.
  // Data received just before the peer shut down its writing side is still reported as Data, peerClosed()
  // then tells that no more input will come.
  ReadStatus readAvailable();

  [[nodiscard]] bool peerClosed() const noexcept { return _peerClosed; }

  [[nodiscard]] std::string_view inBuffer() const noexcept { return _inBuffer; }

  // Drops the first 'nbBytes' bytes of the input buffer.
  void consume(std::size_t nbBytes) { _inBuffer.erase(0, nbBytes); }

  // Writes all of 'data', waiting for the socket to become writable when needed.
  // Returns false if the peer is gone or made no progress for the write timeout. Every later write fails too.
  [[nodiscard]] bool write(std::string_view data) override;

  void complete(bool keepAlive) noexcept override;

  // In non blocking mode, a write that cannot complete immediately fails instead of waiting for the peer.
  // Used by the listener thread for the answers it writes itself, set back before handing over to a worker.
  void setNonBlockingWrites(bool nonBlockingWrites) noexcept { _nonBlockingWrites = nonBlockingWrites; }

  // Accessed by the owning listener thread only.
  [[nodiscard]] bool busy() const noexcept { return _busy; }
  void setBusy(bool busy) noexcept { _busy = busy; }

  [[nodiscard]] SteadyTimePoint lastActivity() const noexcept { return _lastActivity; }
  void touch(SteadyTimePoint now) noexcept { _lastActivity = now; }

  // Number of requests dispatched on this connection so far.
  [[nodiscard]] uint32_t nbRequests() const noexcept { return _nbRequests; }
  uint32_t incrementRequests() noexcept { return ++_nbRequests; }

 private:
  BaseFd _fd;
  std::shared_ptr<ListenerMailbox> _mailbox;
  std::string _inBuffer;
  std::chrono::milliseconds _writeTimeout;
  SteadyTimePoint _lastActivity;
  uint32_t _nbRequests{0};
  bool _busy{false};
  bool _peerClosed{false};
  bool _nonBlockingWrites{false};
  std::atomic<bool> _writeFailed{false};
};

}  // namespace switchyard

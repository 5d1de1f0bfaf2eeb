#pragma once

#include <string_view>

namespace switchyard {

// Destination of the bytes of one response: the client connection in the server, a string in tests.
// A sink is used by a single thread at a time (the one owning the response writer or stream).
class ResponseSink {
 public:
  virtual ~ResponseSink() = default;

  // Writes all of 'data' in order, blocking until it is handed to the peer.
  // Returns false if the peer is gone or the write timed out. Later writes should not be attempted.
  [[nodiscard]] virtual bool write(std::string_view data) = 0;

  // Called exactly once when the response is complete. If keepAlive is false the connection is closed,
  // otherwise it may serve the next request.
  virtual void complete(bool keepAlive) noexcept = 0;
};

}  // namespace switchyard

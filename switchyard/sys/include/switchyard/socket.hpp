#pragma once

#include <cstdint>
#include <string_view>

#include "switchyard/base-fd.hpp"

namespace switchyard {

// RAII IPv4 TCP socket.
class Socket {
 public:
  enum class Type : std::uint8_t { Stream, StreamNonBlock };

  Socket() noexcept = default;

  // Throws std::system_error on failure.
  explicit Socket(Type type);

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

  explicit operator bool() const noexcept { return static_cast<bool>(_baseFd); }

  // Binds to 'address' (dotted IPv4, "0.0.0.0" for any) and starts listening.
  // If port is 0, an ephemeral port is chosen and written back to 'port'.
  // Throws std::invalid_argument on a malformed address, std::system_error on socket failures.
  void bindAndListen(std::string_view address, bool tcpNoDelay, uint16_t& port);

  // Returns a new descriptor (close-on-exec) referring to the same socket, so that several event loops
  // can each own a handle on one listening socket.
  // Throws std::system_error on failure.
  [[nodiscard]] BaseFd duplicate() const;

  void close() noexcept { _baseFd.close(); }

 private:
  BaseFd _baseFd;
};

// Accepts one pending connection on a non-blocking listening socket.
// The returned descriptor is non-blocking and close-on-exec. It is empty when no connection is pending
// (EAGAIN) or on accept failure (logged).
BaseFd AcceptConnection(int listenFd) noexcept;

// Returns false on failure (logged).
bool SetTcpNoDelay(int fd) noexcept;

}  // namespace switchyard

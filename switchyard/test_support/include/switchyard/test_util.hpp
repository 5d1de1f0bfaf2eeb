#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "switchyard/http-status-code.hpp"
#include "switchyard/socket.hpp"

namespace switchyard::test {
using namespace std::chrono_literals;

// Blocking client socket connected to 127.0.0.1:port, with a receive timeout so that reads never hang a test.
class ClientConnection {
 public:
  // Retries until 'timeout' while the connection is refused. Throws std::runtime_error on failure.
  explicit ClientConnection(uint16_t port, std::chrono::milliseconds timeout = 1000ms,
                            std::chrono::milliseconds recvTimeout = 3000ms);

  [[nodiscard]] int fd() const noexcept { return _socket.fd(); }

 private:
  Socket _socket;
};

// Minimal parsed HTTP response for test assertions.
struct ParsedResponse {
  http::StatusCode statusCode{0};
  std::string reason;
  bool chunked{false};
  std::map<std::string, std::string> headers;  // keys as received
  std::string body;                            // de-chunked if needed

  [[nodiscard]] std::optional<std::string_view> header(std::string_view name) const;
};

struct RequestOptions {
  std::string method{"GET"};
  std::string target{"/"};
  std::string connection{"close"};
  std::string body;
  std::vector<std::pair<std::string, std::string>> headers;
};

bool sendAll(int fd, std::string_view data);

// Reads until the peer closes the connection or the receive timeout expires.
std::string recvUntilClosed(int fd);

// Reads exactly one complete response (Content-Length or chunked framing), or what was received until the
// peer closed or the timeout expired. Bytes received past the response are kept in 'pending' for the next call.
std::string recvResponse(int fd, std::string& pending);

// Size of the complete response at the start of 'raw', or 0 if it is not complete yet.
std::size_t CompleteResponseSize(std::string_view raw);

std::optional<ParsedResponse> parseResponse(std::string_view raw);

// Throws std::runtime_error if 'raw' cannot be parsed.
ParsedResponse parseResponseOrThrow(std::string_view raw);

std::string buildRequest(const RequestOptions& opt);

// Sends one request on a new connection and returns the raw response bytes.
std::string requestRaw(uint16_t port, const RequestOptions& opt = {});

// Sends one request on a new connection and parses the response. Throws std::runtime_error on failure.
ParsedResponse request(uint16_t port, const RequestOptions& opt = {});

ParsedResponse get(uint16_t port, std::string_view target);

// Raw bytes sent as is on a new connection, response read until close.
std::string sendAndCollect(uint16_t port, std::string_view raw);

}  // namespace switchyard::test

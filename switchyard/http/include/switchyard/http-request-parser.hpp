#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "switchyard/http-request.hpp"
#include "switchyard/http-status-code.hpp"

namespace switchyard {

// Minimal HTTP/1.x request parser: request line, header fields and a Content-Length delimited body.
// It is stateless and re-parses from the start of the connection buffer, which is fine for the small
// request heads it is given.
class HttpRequestParser {
 public:
  enum class Status : uint8_t { NeedMore, Complete, Error };

  struct Result {
    Status status;
    // Only meaningful for Status::Error.
    http::StatusCode errorStatus{http::StatusCodeBadRequest};
    // Number of bytes of the buffer making up the request, for Status::Complete.
    std::size_t consumedBytes{0};
  };

  HttpRequestParser(std::size_t maxHeaderBytes, std::size_t maxBodyBytes) noexcept
      : _maxHeaderBytes(maxHeaderBytes), _maxBodyBytes(maxBodyBytes) {}

  // Tries to parse one request from the front of 'buffer' into 'request'.
  // Errors map to the status to answer with:
  //   400 malformed request line, header line, target or Content-Length
  //   413 body larger than maxBodyBytes
  //   431 header block larger than maxHeaderBytes
  //   501 unknown method, or a Transfer-Encoding request body
  //   505 unsupported HTTP version
  [[nodiscard]] Result parse(std::string_view buffer, HttpRequest& request) const;

 private:
  std::size_t _maxHeaderBytes;
  std::size_t _maxBodyBytes;
};

}  // namespace switchyard

#pragma once

#include <stdexcept>
#include <string>

#include "switchyard/http-status-code.hpp"

namespace switchyard {

// Thrown by handlers (or by request helpers they call) to answer the current request with 'status' and the
// exception message as a plain text body. It only affects the request being handled.
class HttpError : public std::runtime_error {
 public:
  HttpError(http::StatusCode status, const std::string& message) : std::runtime_error(message), _status(status) {}

  [[nodiscard]] http::StatusCode status() const noexcept { return _status; }

 private:
  http::StatusCode _status;
};

// Malformed application/x-www-form-urlencoded body, answered with 400 Bad Request.
class FormParseError : public HttpError {
 public:
  explicit FormParseError(const std::string& message) : HttpError(http::StatusCodeBadRequest, message) {}
};

}  // namespace switchyard

#include "switchyard/http-status-code.hpp"

#include <string_view>

namespace switchyard::http {

std::string_view ReasonPhraseFor(StatusCode statusCode) noexcept {
  switch (statusCode) {
    case StatusCodeOK:
      return "OK";
    case StatusCodeCreated:
      return "Created";
    case StatusCodeNoContent:
      return "No Content";
    case StatusCodeMovedPermanently:
      return "Moved Permanently";
    case StatusCodeFound:
      return "Found";
    case StatusCodeSeeOther:
      return "See Other";
    case StatusCodeNotModified:
      return "Not Modified";
    case StatusCodeTemporaryRedirect:
      return "Temporary Redirect";
    case StatusCodePermanentRedirect:
      return "Permanent Redirect";
    case StatusCodeBadRequest:
      return "Bad Request";
    case StatusCodeUnauthorized:
      return "Unauthorized";
    case StatusCodeForbidden:
      return "Forbidden";
    case StatusCodeNotFound:
      return "Not Found";
    case StatusCodeMethodNotAllowed:
      return "Method Not Allowed";
    case StatusCodePayloadTooLarge:
      return "Payload Too Large";
    case StatusCodeUnprocessableEntity:
      return "Unprocessable Entity";
    case StatusCodeRequestHeaderFieldsTooLarge:
      return "Request Header Fields Too Large";
    case StatusCodeInternalServerError:
      return "Internal Server Error";
    case StatusCodeNotImplemented:
      return "Not Implemented";
    case StatusCodeServiceUnavailable:
      return "Service Unavailable";
    case StatusCodeHTTPVersionNotSupported:
      return "HTTP Version Not Supported";
    default:
      return "Unknown";
  }
}

}  // namespace switchyard::http

#include "switchyard/http-request-parser.hpp"

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include "switchyard/http-constants.hpp"
#include "switchyard/http-method.hpp"
#include "switchyard/http-request.hpp"
#include "switchyard/http-status-code.hpp"
#include "switchyard/http-version.hpp"
#include "switchyard/string-equal-ignore-case.hpp"
#include "switchyard/string-trim.hpp"
#include "switchyard/url-decode.hpp"

namespace switchyard {

namespace {

using Result = HttpRequestParser::Result;
using Status = HttpRequestParser::Status;

constexpr Result Error(http::StatusCode statusCode) { return Result{Status::Error, statusCode, 0}; }

constexpr bool IsTokenChar(char ch) {
  return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') ||
         std::string_view("!#$%&'*+-.^_`|~").find(ch) != std::string_view::npos;
}

std::optional<std::size_t> ParseContentLength(std::string_view value) {
  std::size_t length{};
  const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), length);
  if (ec != std::errc{} || ptr != value.data() + value.size() || value.empty()) {
    return std::nullopt;
  }
  return length;
}

}  // namespace

Result HttpRequestParser::parse(std::string_view buffer, HttpRequest& request) const {
  const auto headEnd = buffer.find(http::DoubleCRLF);
  if (headEnd == std::string_view::npos) {
    if (buffer.size() > _maxHeaderBytes) {
      return Error(http::StatusCodeRequestHeaderFieldsTooLarge);
    }
    return Result{Status::NeedMore};
  }
  const std::size_t headSize = headEnd + http::DoubleCRLF.size();
  if (headSize > _maxHeaderBytes) {
    return Error(http::StatusCodeRequestHeaderFieldsTooLarge);
  }

  std::string_view head = buffer.substr(0, headEnd);

  // Request line: METHOD SP target SP version
  const auto lineEnd = head.find(http::CRLF);
  const std::string_view requestLine = head.substr(0, lineEnd);
  head.remove_prefix(lineEnd == std::string_view::npos ? head.size() : lineEnd + http::CRLF.size());

  const auto firstSp = requestLine.find(' ');
  const auto lastSp = requestLine.rfind(' ');
  if (firstSp == std::string_view::npos || firstSp == lastSp) {
    return Error(http::StatusCodeBadRequest);
  }
  const std::string_view methodStr = requestLine.substr(0, firstSp);
  const std::string_view target = requestLine.substr(firstSp + 1U, lastSp - firstSp - 1U);
  const std::string_view versionStr = requestLine.substr(lastSp + 1U);

  if (methodStr.empty() || !std::ranges::all_of(methodStr, IsTokenChar)) {
    return Error(http::StatusCodeBadRequest);
  }
  const auto method = http::MethodFromStr(methodStr);
  if (!method) {
    return Error(http::StatusCodeNotImplemented);
  }
  if (versionStr == http::HTTP11Sv) {
    request._version = http::Version::Http11;
  } else if (versionStr == http::HTTP10Sv) {
    request._version = http::Version::Http10;
  } else if (versionStr.starts_with("HTTP/")) {
    return Error(http::StatusCodeHTTPVersionNotSupported);
  } else {
    return Error(http::StatusCodeBadRequest);
  }
  if (target.empty() || target.front() != '/' || target.find(' ') != std::string_view::npos) {
    return Error(http::StatusCodeBadRequest);
  }
  request._method = *method;
  request._target.assign(target);

  const auto queryPos = target.find('?');
  request._path.assign(target.substr(0, queryPos));
  char* pathEnd = url::DecodeInPlace(request._path.data(), request._path.data() + request._path.size(), '+', true);
  if (pathEnd == nullptr) {
    return Error(http::StatusCodeBadRequest);
  }
  request._path.resize(static_cast<std::size_t>(pathEnd - request._path.data()));

  request._queryParams.clear();
  if (queryPos != std::string_view::npos) {
    url::DecodeFormUrlEncoded(target.substr(queryPos + 1U), request._queryParams, false);
  }

  // Header fields
  request._headers.clear();
  std::size_t contentLength = 0;
  bool hasContentLength = false;
  while (!head.empty()) {
    const auto headerLineEnd = head.find(http::CRLF);
    const std::string_view line = head.substr(0, headerLineEnd);
    head.remove_prefix(headerLineEnd == std::string_view::npos ? head.size() : headerLineEnd + http::CRLF.size());

    const auto colonPos = line.find(':');
    if (colonPos == std::string_view::npos || colonPos == 0 ||
        !std::ranges::all_of(line.substr(0, colonPos), IsTokenChar)) {
      return Error(http::StatusCodeBadRequest);
    }
    const std::string_view name = line.substr(0, colonPos);
    const std::string_view value = TrimOws(line.substr(colonPos + 1U));

    if (CaseInsensitiveEqual(name, http::ContentLength)) {
      const auto length = ParseContentLength(value);
      if (!length || (hasContentLength && *length != contentLength)) {
        return Error(http::StatusCodeBadRequest);
      }
      contentLength = *length;
      hasContentLength = true;
    } else if (CaseInsensitiveEqual(name, http::TransferEncoding)) {
      return Error(http::StatusCodeNotImplemented);
    }
    request._headers.emplace_back(std::string(name), std::string(value));
  }

  if (contentLength > _maxBodyBytes) {
    return Error(http::StatusCodePayloadTooLarge);
  }
  if (buffer.size() - headSize < contentLength) {
    return Result{Status::NeedMore};
  }
  request._body.assign(buffer.substr(headSize, contentLength));
  request._pathParams.clear();
  request._attributes.clear();
  return Result{Status::Complete, http::StatusCodeOK, headSize + contentLength};
}

}  // namespace switchyard

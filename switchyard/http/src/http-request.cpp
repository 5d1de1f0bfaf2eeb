#include "switchyard/http-request.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "switchyard/cookie.hpp"
#include "switchyard/http-constants.hpp"
#include "switchyard/path-segments.hpp"
#include "switchyard/string-equal-ignore-case.hpp"

namespace switchyard {

std::vector<std::string_view> HttpRequest::pathSegments() const {
  std::vector<std::string_view> segments;
  SplitPathSegments(_path, segments);
  return segments;
}

std::optional<std::string_view> HttpRequest::headerValue(std::string_view name) const noexcept {
  const auto it =
      std::ranges::find_if(_headers, [name](const HttpHeader& header) { return CaseInsensitiveEqual(header.name, name); });
  if (it == _headers.end()) {
    return std::nullopt;
  }
  return std::string_view(it->value);
}

std::optional<std::string_view> HttpRequest::queryParamValue(std::string_view key) const noexcept {
  const auto it = std::ranges::find(_queryParams, key, &QueryParam::key);
  if (it == _queryParams.end()) {
    return std::nullopt;
  }
  return std::string_view(it->value);
}

std::optional<std::string_view> HttpRequest::pathParam(std::string_view key) const noexcept {
  const auto it = std::ranges::find(_pathParams, key, &PathParamCapture::key);
  if (it == _pathParams.end()) {
    return std::nullopt;
  }
  return std::string_view(it->value);
}

std::vector<Cookie> HttpRequest::cookies() const {
  std::vector<Cookie> cookies;
  for (const HttpHeader& header : _headers) {
    if (CaseInsensitiveEqual(header.name, http::Cookie)) {
      ParseCookieHeader(header.value, cookies);
    }
  }
  return cookies;
}

std::optional<std::string> HttpRequest::cookie(std::string_view name) const {
  std::vector<Cookie> all = cookies();
  const auto it = std::ranges::find(all, name, &Cookie::name);
  if (it == all.end()) {
    return std::nullopt;
  }
  return std::move(it->value);
}

std::optional<std::string_view> HttpRequest::attribute(std::string_view key) const noexcept {
  const auto it = _attributes.find(key);
  if (it == _attributes.end()) {
    return std::nullopt;
  }
  return std::string_view(it->second);
}

bool HttpRequest::keepAlive() const noexcept {
  const std::string_view connection = headerValueOrEmpty(http::Connection);
  if (_version == http::Version::Http10) {
    return CaseInsensitiveEqual(connection, http::ConnectionKeepAlive);
  }
  return !CaseInsensitiveEqual(connection, http::ConnectionClose);
}

}  // namespace switchyard

#pragma once

#include <functional>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "switchyard/cookie.hpp"
#include "switchyard/form-data.hpp"
#include "switchyard/http-header.hpp"
#include "switchyard/http-method.hpp"
#include "switchyard/http-version.hpp"
#include "switchyard/path-param-capture.hpp"
#include "switchyard/url-decode.hpp"

namespace switchyard {

// A parsed HTTP request. It owns all its data, so it can be handed from the listener thread that parsed it
// to the worker thread that handles it.
// Handlers see it as const; only the middleware hook gets a mutable reference.
class HttpRequest {
 public:
  using QueryParam = url::DecodedPair;

  HttpRequest() = default;

  [[nodiscard]] http::Method method() const noexcept { return _method; }

  [[nodiscard]] http::Version version() const noexcept { return _version; }

  // Raw request target, as received ("/hello/Jane%20Doe?lang=en").
  [[nodiscard]] std::string_view target() const noexcept { return _target; }

  // Percent-decoded path, without the query string ("/hello/Jane Doe").
  [[nodiscard]] std::string_view path() const noexcept { return _path; }

  // Non-empty segments of path(), in order. The views point into this request.
  [[nodiscard]] std::vector<std::string_view> pathSegments() const;

  [[nodiscard]] std::span<const HttpHeader> headers() const noexcept { return _headers; }

  // Value of the first header named 'name' (case insensitive), if present.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept;

  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view name) const noexcept {
    return headerValue(name).value_or(std::string_view{});
  }

  // Decoded query parameters, in order of appearance.
  [[nodiscard]] std::span<const QueryParam> queryParams() const noexcept { return _queryParams; }

  [[nodiscard]] std::optional<std::string_view> queryParamValue(std::string_view key) const noexcept;

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  // Parameters bound by the matched route, in pattern order.
  [[nodiscard]] std::span<const PathParamCapture> pathParams() const noexcept { return _pathParams; }

  [[nodiscard]] std::optional<std::string_view> pathParam(std::string_view key) const noexcept;

  // Set by the server once the request is routed.
  void setPathParams(std::vector<PathParamCapture> pathParams) { _pathParams = std::move(pathParams); }

  // All cookies sent by the client (every Cookie header), in order.
  [[nodiscard]] std::vector<Cookie> cookies() const;

  [[nodiscard]] std::optional<std::string> cookie(std::string_view name) const;

  // Parses the body as application/x-www-form-urlencoded data.
  // Throws FormParseError (answered with 400 Bad Request) if it is malformed.
  [[nodiscard]] FormData form() const { return FormData::Parse(_body); }

  // Free-form attributes, typically derived by the middleware hook for the route handler.
  void setAttribute(std::string key, std::string value) { _attributes.insert_or_assign(std::move(key), std::move(value)); }

  [[nodiscard]] std::optional<std::string_view> attribute(std::string_view key) const noexcept;

  // Whether the client accepts to keep the connection open after the response, from its HTTP version and
  // its Connection header.
  [[nodiscard]] bool keepAlive() const noexcept;

 private:
  friend class HttpRequestParser;

  std::string _target;
  std::string _path;
  std::string _body;
  std::vector<HttpHeader> _headers;
  std::vector<QueryParam> _queryParams;
  std::vector<PathParamCapture> _pathParams;
  std::map<std::string, std::string, std::less<>> _attributes;
  http::Method _method{http::Method::GET};
  http::Version _version{http::Version::Http11};
};

}  // namespace switchyard

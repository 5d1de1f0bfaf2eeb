#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "switchyard/cookie.hpp"
#include "switchyard/http-constants.hpp"
#include "switchyard/http-header.hpp"
#include "switchyard/http-response-stream.hpp"
#include "switchyard/http-status-code.hpp"
#include "switchyard/http-version.hpp"
#include "switchyard/response-sink.hpp"
#include "switchyard/template-engine.hpp"

namespace switchyard {

// Builds and commits the single response of a request.
//
// State machine:
//   Building  -> Committed  through send(), redirect(), sendFile(), render() or end()
//   Building  -> Streaming  through stream(): the returned HttpResponseStream then owns the rest of the response
//   any       -> Failed     when the peer goes away while writing
// Once out of Building, every setter or commit is ignored (with a warning) and commits return false.
// A writer destroyed while still Building commits what was set so far with an empty body, so that every request
// gets exactly one response.
//
// The writer is movable: a handler may move it, or the stream, into a thread of its own.
class HttpResponseWriter {
 public:
  enum class State : uint8_t { Building, Streaming, Committed, Failed };

  struct Options {
    // HEAD request: the body is never sent, but Content-Length still tells its size.
    bool headRequest{false};
    // Whether the connection can serve another request after this response.
    bool keepAlive{true};
    // HTTP/1.0 clients do not understand chunked framing: streamed bodies are then delimited by the connection
    // close.
    http::Version version{http::Version::Http11};
    // Used by render(), may be null.
    const TemplateEngine* pTemplateEngine{nullptr};
  };

  // Size of the blocks read from disk by sendFile().
  static constexpr std::size_t kFileBlockSize = 64UL * 1024UL;

  HttpResponseWriter(std::shared_ptr<ResponseSink> sink, Options options) noexcept;

  HttpResponseWriter(const HttpResponseWriter&) = delete;
  HttpResponseWriter(HttpResponseWriter&& other) noexcept;
  HttpResponseWriter& operator=(const HttpResponseWriter&) = delete;
  HttpResponseWriter& operator=(HttpResponseWriter&& other) noexcept;

  ~HttpResponseWriter();

  // Sets the status code (200 by default).
  HttpResponseWriter& status(http::StatusCode statusCode);

  [[nodiscard]] http::StatusCode status() const noexcept { return _statusCode; }

  // Sets or replaces header 'name' (case insensitive), keeping at most one instance.
  // Throws std::invalid_argument if 'name' is not a token or 'value' holds control characters (CR, LF...).
  HttpResponseWriter& header(std::string_view name, std::string_view value);

  // Appends a header line, duplicates allowed (Set-Cookie for instance). Validated like header().
  HttpResponseWriter& addHeader(std::string_view name, std::string_view value);

  HttpResponseWriter& contentType(std::string_view contentType) { return header(http::ContentType, contentType); }

  // Appends a Set-Cookie header for 'cookie'.
  HttpResponseWriter& cookie(const Cookie& cookie) { return addHeader(http::SetCookie, cookie.toSetCookieValue()); }

  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept;

  // Commits the response with 'body', framed by Content-Length.
  // A non-empty body without Content-Type is sent as application/octet-stream.
  // Returns true if the whole response was handed to the peer.
  bool send(std::string_view body);

  // Commits the current status and headers with an empty body.
  bool end() { return send({}); }

  // Commits a redirection to 'url' with an empty body.
  // Throws std::invalid_argument if statusCode is not a 3xx code or if 'url' is not a valid header value.
  bool redirect(std::string_view url, http::StatusCode statusCode = http::StatusCodeFound);

  // Commits the content of the file at 'path' as the body, with a Content-Type deduced from its extension
  // (unless one is already set). Missing files or non regular files give a 404, other errors a 500.
  bool sendFile(const std::string& path);

  // Commits the rendering of template 'name' with 'data' as a text/html body (unless a Content-Type is already
  // set). Missing template engine or render failure give a 500 with a plain text message.
  bool render(std::string_view name, const TemplateData& data);

  // Sends the head and switches to streaming. The body is then written through the returned stream.
  // If the writer is not Building, the returned stream is already closed.
  [[nodiscard]] HttpResponseStream stream();

  [[nodiscard]] State state() const noexcept { return _state; }

  // True while nothing was sent yet for this request through this writer.
  [[nodiscard]] bool isBuilding() const noexcept { return _state == State::Building && _sink != nullptr; }

  [[nodiscard]] const Options& options() const noexcept { return _options; }

 private:
  [[nodiscard]] bool checkBuilding(std::string_view operation) const;

  // Status line and headers, with the framing headers computed from 'contentLength' (nullopt for a streamed body).
  [[nodiscard]] std::string buildHead(std::optional<std::size_t> contentLength, bool chunked) const;

  bool commitError(http::StatusCode statusCode, std::string_view message);

  void finish(bool ok) noexcept;

  std::shared_ptr<ResponseSink> _sink;
  std::vector<HttpHeader> _headers;
  Options _options;
  http::StatusCode _statusCode{http::StatusCodeOK};
  State _state{State::Building};
};

}  // namespace switchyard

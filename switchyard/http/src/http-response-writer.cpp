#include "switchyard/http-response-writer.hpp"

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "switchyard/file.hpp"
#include "switchyard/http-constants.hpp"
#include "switchyard/http-header.hpp"
#include "switchyard/http-response-stream.hpp"
#include "switchyard/http-status-code.hpp"
#include "switchyard/log.hpp"
#include "switchyard/string-equal-ignore-case.hpp"
#include "switchyard/template-engine.hpp"

namespace switchyard {

namespace {

std::string_view StateName(HttpResponseWriter::State state) {
  switch (state) {
    case HttpResponseWriter::State::Building:
      return "building";
    case HttpResponseWriter::State::Streaming:
      return "streaming";
    case HttpResponseWriter::State::Committed:
      return "committed";
    default:
      return "failed";
  }
}

void AppendHeaderLine(std::string& out, std::string_view name, std::string_view value) {
  out.append(name).append(http::HeaderSep).append(value).append(http::CRLF);
}

void CheckHeader(std::string_view name, std::string_view value) {
  if (!http::IsValidHeaderName(name)) {
    throw std::invalid_argument("Invalid response header name '" + std::string(name) + "'");
  }
  if (!http::IsValidHeaderValue(value)) {
    throw std::invalid_argument("Invalid value for response header '" + std::string(name) + "'");
  }
}

}  // namespace

HttpResponseWriter::HttpResponseWriter(std::shared_ptr<ResponseSink> sink, Options options) noexcept
    : _sink(std::move(sink)), _options(options) {}

HttpResponseWriter::HttpResponseWriter(HttpResponseWriter&& other) noexcept
    : _sink(std::move(other._sink)),
      _headers(std::move(other._headers)),
      _options(other._options),
      _statusCode(other._statusCode),
      _state(std::exchange(other._state, State::Committed)) {}

HttpResponseWriter& HttpResponseWriter::operator=(HttpResponseWriter&& other) noexcept {
  if (this != &other) {
    if (isBuilding()) {
      end();
    }
    _sink = std::move(other._sink);
    _headers = std::move(other._headers);
    _options = other._options;
    _statusCode = other._statusCode;
    _state = std::exchange(other._state, State::Committed);
  }
  return *this;
}

HttpResponseWriter::~HttpResponseWriter() {
  if (isBuilding()) {
    log::debug("Response writer destroyed while building, committing status {} with an empty body", _statusCode);
    end();
  }
}

bool HttpResponseWriter::checkBuilding(std::string_view operation) const {
  if (isBuilding()) [[likely]] {
    return true;
  }
  log::warn("Response: {} ignored, response is already {}", operation, StateName(_state));
  return false;
}

HttpResponseWriter& HttpResponseWriter::status(http::StatusCode statusCode) {
  if (checkBuilding("status")) {
    _statusCode = statusCode;
  }
  return *this;
}

HttpResponseWriter& HttpResponseWriter::header(std::string_view name, std::string_view value) {
  CheckHeader(name, value);
  if (checkBuilding("header")) {
    const auto it = std::ranges::find_if(
        _headers, [name](const HttpHeader& httpHeader) { return CaseInsensitiveEqual(httpHeader.name, name); });
    if (it == _headers.end()) {
      _headers.emplace_back(std::string(name), std::string(value));
    } else {
      it->value.assign(value);
    }
  }
  return *this;
}

HttpResponseWriter& HttpResponseWriter::addHeader(std::string_view name, std::string_view value) {
  CheckHeader(name, value);
  if (checkBuilding("header")) {
    _headers.emplace_back(std::string(name), std::string(value));
  }
  return *this;
}

std::optional<std::string_view> HttpResponseWriter::headerValue(std::string_view name) const noexcept {
  const auto it = std::ranges::find_if(
      _headers, [name](const HttpHeader& httpHeader) { return CaseInsensitiveEqual(httpHeader.name, name); });
  if (it == _headers.end()) {
    return std::nullopt;
  }
  return std::string_view(it->value);
}

std::string HttpResponseWriter::buildHead(std::optional<std::size_t> contentLength, bool chunked) const {
  const std::string_view reason = http::ReasonPhraseFor(_statusCode);

  std::string head;
  head.reserve(128U + _headers.size() * 48U);
  head.append(http::HTTP11Sv).append(1, ' ');
  char codeBuf[8];
  head.append(codeBuf, std::to_chars(codeBuf, codeBuf + sizeof(codeBuf), _statusCode).ptr);
  head.append(1, ' ').append(reason).append(http::CRLF);

  for (const HttpHeader& httpHeader : _headers) {
    AppendHeaderLine(head, httpHeader.name, httpHeader.value);
  }
  if (contentLength) {
    AppendHeaderLine(head, http::ContentLength, std::to_string(*contentLength));
  } else if (chunked) {
    AppendHeaderLine(head, http::TransferEncoding, http::TransferEncodingChunked);
  }
  const bool keepAlive = _options.keepAlive && (contentLength || chunked);
  if (!keepAlive) {
    AppendHeaderLine(head, http::Connection, http::ConnectionClose);
  } else if (_options.version == http::Version::Http10) {
    AppendHeaderLine(head, http::Connection, http::ConnectionKeepAlive);
  }
  head.append(http::CRLF);
  return head;
}

void HttpResponseWriter::finish(bool ok) noexcept {
  _state = ok ? State::Committed : State::Failed;
  std::exchange(_sink, nullptr)->complete(ok && _options.keepAlive);
}

bool HttpResponseWriter::send(std::string_view body) {
  if (!checkBuilding("send")) {
    return false;
  }
  if (!body.empty() && !headerValue(http::ContentType)) {
    _headers.emplace_back(std::string(http::ContentType), std::string(http::ContentTypeApplicationOctetStream));
  }
  std::string response = buildHead(body.size(), false);
  if (!_options.headRequest) {
    response.append(body);
  }
  const bool ok = _sink->write(response);
  if (!ok) {
    log::debug("Response: peer gone while sending status {}", _statusCode);
  }
  finish(ok);
  return ok;
}

bool HttpResponseWriter::redirect(std::string_view url, http::StatusCode statusCode) {
  if (!http::IsRedirection(statusCode)) {
    throw std::invalid_argument("Redirection status code must be 3xx, got " + std::to_string(statusCode));
  }
  CheckHeader(http::Location, url);
  status(statusCode);
  header(http::Location, url);
  return end();
}

bool HttpResponseWriter::commitError(http::StatusCode statusCode, std::string_view message) {
  std::erase_if(_headers,
                [](const HttpHeader& httpHeader) { return CaseInsensitiveEqual(httpHeader.name, http::ContentType); });
  _statusCode = statusCode;
  contentType(http::ContentTypeTextPlain);
  return send(message);
}

bool HttpResponseWriter::sendFile(const std::string& path) {
  if (!checkBuilding("sendFile")) {
    return false;
  }
  File file(path);
  if (!file) {
    if (file.notFound()) {
      return commitError(http::StatusCodeNotFound, http::ReasonPhraseFor(http::StatusCodeNotFound));
    }
    log::error("Unable to serve file '{}' (errno={})", path, file.openErrno());
    return commitError(http::StatusCodeInternalServerError,
                       http::ReasonPhraseFor(http::StatusCodeInternalServerError));
  }
  if (!headerValue(http::ContentType)) {
    contentType(file.detectedContentType());
  }

  const std::size_t fileSize = file.size();
  if (!_sink->write(buildHead(fileSize, false))) {
    finish(false);
    return false;
  }
  if (_options.headRequest) {
    finish(true);
    return true;
  }

  std::string block(std::min(fileSize, kFileBlockSize), '\0');
  for (std::size_t offset = 0; offset < fileSize;) {
    const std::size_t nbRead = file.readAt(block, offset);
    if (nbRead == File::kError || nbRead == 0) {
      // The head is already sent: the only way to signal the error is to cut the connection.
      log::error("Read failure on '{}' after {} bytes out of {}", path, offset, fileSize);
      finish(false);
      return false;
    }
    if (!_sink->write(std::string_view(block.data(), std::min(nbRead, fileSize - offset)))) {
      log::debug("Response: peer gone while sending file '{}'", path);
      finish(false);
      return false;
    }
    offset += nbRead;
  }
  log::debug("Served file '{}' ({} bytes)", path, fileSize);
  finish(true);
  return true;
}

bool HttpResponseWriter::render(std::string_view name, const TemplateData& data) {
  if (!checkBuilding("render")) {
    return false;
  }
  if (_options.pTemplateEngine == nullptr) {
    log::error("Cannot render template '{}': no template engine configured", name);
    return commitError(http::StatusCodeInternalServerError, "No template engine configured");
  }
  std::string rendered;
  try {
    rendered = _options.pTemplateEngine->render(name, data);
  } catch (const TemplateRenderError& ex) {
    log::error("Rendering of template '{}' failed: {}", name, ex.what());
    return commitError(http::StatusCodeInternalServerError, "Template rendering failed");
  }
  if (!headerValue(http::ContentType)) {
    contentType(http::ContentTypeTextHtml);
  }
  return send(rendered);
}

HttpResponseStream HttpResponseWriter::stream() {
  if (!checkBuilding("stream")) {
    HttpResponseStream closedStream(nullptr, false, false, false);
    closedStream._state = HttpResponseStream::State::Closed;
    return closedStream;
  }
  const bool chunked = _options.version == http::Version::Http11;
  if (!headerValue(http::ContentType)) {
    contentType(http::ContentTypeApplicationOctetStream);
  }
  const bool keepAlive = _options.keepAlive && chunked;
  const bool headWritten = _sink->write(buildHead(std::nullopt, chunked));
  _state = State::Streaming;

  HttpResponseStream responseStream(std::exchange(_sink, nullptr), chunked, _options.headRequest, keepAlive);
  if (!headWritten) {
    log::debug("Response: peer gone while sending streamed head");
    responseStream.fail();
  }
  return responseStream;
}

}  // namespace switchyard

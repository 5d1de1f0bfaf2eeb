#include "switchyard/http-response-stream.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "switchyard/char-hexadecimal-converter.hpp"
#include "switchyard/http-constants.hpp"
#include "switchyard/log.hpp"

namespace switchyard {

namespace {

constexpr std::string_view kLastChunk = "0\r\n\r\n";

}  // namespace

HttpResponseStream::HttpResponseStream(std::shared_ptr<ResponseSink> sink, bool chunked, bool headRequest,
                                       bool keepAlive) noexcept
    : _sink(std::move(sink)), _chunked(chunked), _headRequest(headRequest), _keepAlive(keepAlive) {}

HttpResponseStream::HttpResponseStream(HttpResponseStream&& other) noexcept
    : _sink(std::move(other._sink)),
      _bytesWritten(other._bytesWritten),
      _state(std::exchange(other._state, State::Closed)),
      _chunked(other._chunked),
      _headRequest(other._headRequest),
      _keepAlive(other._keepAlive) {}

HttpResponseStream& HttpResponseStream::operator=(HttpResponseStream&& other) noexcept {
  if (this != &other) {
    close();
    _sink = std::move(other._sink);
    _bytesWritten = other._bytesWritten;
    _state = std::exchange(other._state, State::Closed);
    _chunked = other._chunked;
    _headRequest = other._headRequest;
    _keepAlive = other._keepAlive;
  }
  return *this;
}

bool HttpResponseStream::append(std::string_view data) {
  if (_state != State::Open) {
    log::debug("Streaming: append ignored size={} reason={}", data.size(),
               _state == State::Failed ? "failed" : "closed");
    return false;
  }
  if (data.empty()) {
    return true;
  }
  _bytesWritten += data.size();
  if (_headRequest) {
    return true;
  }
  bool written;
  if (_chunked) {
    // A zero sized chunk would end the body, so empty data never reaches this point.
    std::string chunk;
    chunk.reserve(2U * sizeof(std::size_t) + 2U * http::CRLF.size() + data.size());
    char sizeBuf[2U * sizeof(std::size_t)];
    chunk.append(sizeBuf, to_lower_hex_number(data.size(), sizeBuf));
    chunk.append(http::CRLF).append(data).append(http::CRLF);
    written = _sink->write(chunk);
  } else {
    written = _sink->write(data);
  }
  if (!written) {
    log::debug("Streaming: peer gone after {} bytes", _bytesWritten - data.size());
    fail();
    return false;
  }
  log::trace("Streaming: append size={} total={}", data.size(), _bytesWritten);
  return true;
}

void HttpResponseStream::close() noexcept {
  if (_state != State::Open) {
    return;
  }
  _state = State::Closed;
  bool keepAlive = _keepAlive && _chunked;
  if (_chunked && !_headRequest && !_sink->write(kLastChunk)) {
    keepAlive = false;
    _state = State::Failed;
  }
  log::debug("Streaming: end bytesWritten={} chunked={}", _bytesWritten, _chunked);
  std::exchange(_sink, nullptr)->complete(keepAlive);
}

void HttpResponseStream::fail() noexcept {
  _state = State::Failed;
  std::exchange(_sink, nullptr)->complete(false);
}

}  // namespace switchyard

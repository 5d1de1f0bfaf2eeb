#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>

#include "switchyard/response-sink.hpp"

namespace switchyard {

class HttpResponseWriter;

// Append-only handle on a response whose head is already sent, obtained from HttpResponseWriter::stream().
// Each append() is written to the connection immediately, as one chunk, in call order.
// The response is finalized by close(), or by the destructor if the stream is still open.
// It is move-only and may be handed to another thread, but must only be used by one thread at a time.
class HttpResponseStream {
 public:
  enum class State : uint8_t { Open, Closed, Failed };

  HttpResponseStream(const HttpResponseStream&) = delete;
  HttpResponseStream(HttpResponseStream&& other) noexcept;
  HttpResponseStream& operator=(const HttpResponseStream&) = delete;
  HttpResponseStream& operator=(HttpResponseStream&& other) noexcept;

  ~HttpResponseStream() { close(); }

  // Writes 'data' as the next part of the body. Empty data is accepted and sends nothing.
  // Returns false once the stream is closed or the peer went away (the stream then becomes Failed,
  // and the connection is released).
  bool append(std::string_view data);

  // Emits the end of the body and releases the connection. Idempotent.
  void close() noexcept;

  [[nodiscard]] State state() const noexcept { return _state; }

  [[nodiscard]] bool isOpen() const noexcept { return _state == State::Open; }

  [[nodiscard]] std::size_t bytesWritten() const noexcept { return _bytesWritten; }

 private:
  friend class HttpResponseWriter;

  HttpResponseStream(std::shared_ptr<ResponseSink> sink, bool chunked, bool headRequest, bool keepAlive) noexcept;

  void fail() noexcept;

  std::shared_ptr<ResponseSink> _sink;
  std::size_t _bytesWritten{0};
  State _state{State::Open};
  bool _chunked;
  bool _headRequest;
  bool _keepAlive;
};

}  // namespace switchyard

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "switchyard/http-request-parser.hpp"
#include "switchyard/http-request.hpp"
#include "switchyard/response-sink.hpp"

namespace switchyard::test {

// ResponseSink accumulating everything in memory. Each write() is recorded separately so that tests can check
// how a response was split. Writes start failing after 'failAfterNbWrites' successful writes, to simulate a peer
// going away.
class StringSink : public ResponseSink {
 public:
  StringSink() noexcept = default;

  explicit StringSink(std::size_t failAfterNbWrites) noexcept : _failAfterNbWrites(failAfterNbWrites) {}

  bool write(std::string_view data) override {
    if (_failAfterNbWrites && _writes.size() >= *_failAfterNbWrites) {
      return false;
    }
    _writes.emplace_back(data);
    _out.append(data);
    return true;
  }

  void complete(bool keepAlive) noexcept override {
    ++_nbCompletions;
    _keepAlive = keepAlive;
  }

  [[nodiscard]] const std::string& out() const noexcept { return _out; }

  [[nodiscard]] const std::vector<std::string>& writes() const noexcept { return _writes; }

  [[nodiscard]] int nbCompletions() const noexcept { return _nbCompletions; }

  [[nodiscard]] bool keepAlive() const noexcept { return _keepAlive; }

 private:
  std::string _out;
  std::vector<std::string> _writes;
  std::optional<std::size_t> _failAfterNbWrites;
  int _nbCompletions{0};
  bool _keepAlive{false};
};

// Parses a complete raw request ("GET / HTTP/1.1\r\n\r\n"), throwing std::invalid_argument if it is not one.
inline HttpRequest MakeRequest(std::string_view raw) {
  HttpRequest request;
  const HttpRequestParser parser(1UL << 16, 1UL << 20);
  const auto result = parser.parse(raw, request);
  if (result.status != HttpRequestParser::Status::Complete) {
    throw std::invalid_argument("Incomplete or invalid test request");
  }
  return request;
}

}  // namespace switchyard::test

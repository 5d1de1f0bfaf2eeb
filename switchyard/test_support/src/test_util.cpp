#include "switchyard/test_util.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>

#include <array>
#include <cerrno>
#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

#include "switchyard/log.hpp"
#include "switchyard/socket.hpp"
#include "switchyard/string-equal-ignore-case.hpp"

namespace switchyard::test {

namespace {

constexpr std::string_view kCRLF = "\r\n";
constexpr std::string_view kDoubleCRLF = "\r\n\r\n";

std::optional<std::string_view> FindHeader(std::string_view head, std::string_view name) {
  for (std::size_t lineBeg = head.find(kCRLF); lineBeg != std::string_view::npos;) {
    lineBeg += kCRLF.size();
    const auto lineEnd = head.find(kCRLF, lineBeg);
    const std::string_view line = head.substr(lineBeg, lineEnd - lineBeg);
    const auto colonPos = line.find(':');
    if (colonPos != std::string_view::npos && CaseInsensitiveEqual(line.substr(0, colonPos), name)) {
      std::string_view value = line.substr(colonPos + 1U);
      while (!value.empty() && value.front() == ' ') {
        value.remove_prefix(1U);
      }
      return value;
    }
    lineBeg = lineEnd;
  }
  return std::nullopt;
}

// Decodes chunked 'data' into 'out'. Returns the number of bytes consumed including the last chunk,
// or 0 if the chunked body is not complete.
std::size_t Dechunk(std::string_view data, std::string& out) {
  std::size_t pos = 0;
  while (true) {
    const auto lineEnd = data.find(kCRLF, pos);
    if (lineEnd == std::string_view::npos) {
      return 0;
    }
    std::size_t chunkSize = 0;
    const auto [ptr, ec] = std::from_chars(data.data() + pos, data.data() + lineEnd, chunkSize, 16);
    if (ec != std::errc{}) {
      return 0;
    }
    pos = lineEnd + kCRLF.size();
    if (chunkSize == 0) {
      return data.size() >= pos + kCRLF.size() ? pos + kCRLF.size() : 0;
    }
    if (data.size() < pos + chunkSize + kCRLF.size()) {
      return 0;
    }
    out.append(data.substr(pos, chunkSize));
    pos += chunkSize + kCRLF.size();
  }
}

}  // namespace

std::optional<std::string_view> ParsedResponse::header(std::string_view name) const {
  for (const auto& [key, value] : headers) {
    if (CaseInsensitiveEqual(key, name)) {
      return std::string_view(value);
    }
  }
  return std::nullopt;
}

ClientConnection::ClientConnection(uint16_t port, std::chrono::milliseconds timeout,
                                   std::chrono::milliseconds recvTimeout)
    : _socket(Socket::Type::Stream) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (::connect(_socket.fd(), reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) != 0) {
    if (errno != ECONNREFUSED || std::chrono::steady_clock::now() >= deadline) {
      throw std::runtime_error(std::string("Unable to connect to test server: ") + std::strerror(errno));
    }
    std::this_thread::sleep_for(5ms);
  }

  timeval tv{};
  const auto recvTimeoutUs = std::chrono::duration_cast<std::chrono::microseconds>(recvTimeout).count();
  tv.tv_sec = static_cast<decltype(tv.tv_sec)>(recvTimeoutUs / 1000000);
  tv.tv_usec = static_cast<decltype(tv.tv_usec)>(recvTimeoutUs % 1000000);
  if (::setsockopt(_socket.fd(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0) {
    log::error("setsockopt(SO_RCVTIMEO) failed: {}", std::strerror(errno));
  }
}

bool sendAll(int fd, std::string_view data) {
  while (!data.empty()) {
    const auto sent = ::send(fd, data.data(), data.size(), MSG_NOSIGNAL);
    if (sent < 0) {
      if (errno == EINTR) {
        continue;
      }
      log::error("sendAll failed: {}", std::strerror(errno));
      return false;
    }
    data.remove_prefix(static_cast<std::size_t>(sent));
  }
  return true;
}

std::string recvUntilClosed(int fd) {
  std::string out;
  std::array<char, 16UL * 1024UL> buf;
  while (true) {
    const auto nbRead = ::recv(fd, buf.data(), buf.size(), 0);
    if (nbRead > 0) {
      out.append(buf.data(), static_cast<std::size_t>(nbRead));
    } else if (nbRead < 0 && errno == EINTR) {
      continue;
    } else {
      break;
    }
  }
  return out;
}

std::size_t CompleteResponseSize(std::string_view raw) {
  const auto headEnd = raw.find(kDoubleCRLF);
  if (headEnd == std::string_view::npos) {
    return 0;
  }
  const std::string_view head = raw.substr(0, headEnd + kCRLF.size());
  const std::size_t bodyBeg = headEnd + kDoubleCRLF.size();
  if (const auto contentLength = FindHeader(head, "Content-Length")) {
    std::size_t length = 0;
    std::from_chars(contentLength->data(), contentLength->data() + contentLength->size(), length);
    return raw.size() >= bodyBeg + length ? bodyBeg + length : 0;
  }
  if (const auto transferEncoding = FindHeader(head, "Transfer-Encoding");
      transferEncoding && CaseInsensitiveEqual(*transferEncoding, "chunked")) {
    std::string ignored;
    const auto chunkedSize = Dechunk(raw.substr(bodyBeg), ignored);
    return chunkedSize == 0 ? 0 : bodyBeg + chunkedSize;
  }
  // delimited by the connection close
  return 0;
}

std::string recvResponse(int fd, std::string& pending) {
  std::array<char, 16UL * 1024UL> buf;
  while (CompleteResponseSize(pending) == 0) {
    const auto nbRead = ::recv(fd, buf.data(), buf.size(), 0);
    if (nbRead > 0) {
      pending.append(buf.data(), static_cast<std::size_t>(nbRead));
    } else if (nbRead < 0 && errno == EINTR) {
      continue;
    } else {
      return std::exchange(pending, {});
    }
  }
  const auto responseSize = CompleteResponseSize(pending);
  std::string response = pending.substr(0, responseSize);
  pending.erase(0, responseSize);
  return response;
}

std::optional<ParsedResponse> parseResponse(std::string_view raw) {
  const auto headEnd = raw.find(kDoubleCRLF);
  if (headEnd == std::string_view::npos) {
    return std::nullopt;
  }
  const std::string_view head = raw.substr(0, headEnd + kCRLF.size());
  const auto statusLineEnd = head.find(kCRLF);
  const std::string_view statusLine = head.substr(0, statusLineEnd);
  const auto firstSpace = statusLine.find(' ');
  if (firstSpace == std::string_view::npos || statusLine.size() < firstSpace + 4U) {
    return std::nullopt;
  }

  ParsedResponse resp;
  const auto codeBeg = statusLine.data() + firstSpace + 1;
  if (std::from_chars(codeBeg, codeBeg + 3, resp.statusCode).ec != std::errc{}) {
    return std::nullopt;
  }
  if (statusLine.size() > firstSpace + 5U) {
    resp.reason = statusLine.substr(firstSpace + 5U);
  }

  for (std::size_t lineBeg = statusLineEnd + kCRLF.size(); lineBeg < head.size();) {
    const auto lineEnd = head.find(kCRLF, lineBeg);
    const std::string_view line = head.substr(lineBeg, lineEnd - lineBeg);
    const auto colonPos = line.find(':');
    if (colonPos != std::string_view::npos) {
      std::string_view value = line.substr(colonPos + 1U);
      while (!value.empty() && value.front() == ' ') {
        value.remove_prefix(1U);
      }
      resp.headers[std::string(line.substr(0, colonPos))] = std::string(value);
    }
    lineBeg = lineEnd + kCRLF.size();
  }

  const std::string_view rawBody = raw.substr(headEnd + kDoubleCRLF.size());
  const auto transferEncoding = resp.header("Transfer-Encoding");
  resp.chunked = transferEncoding && CaseInsensitiveEqual(*transferEncoding, "chunked");
  if (resp.chunked) {
    if (Dechunk(rawBody, resp.body) == 0) {
      return std::nullopt;
    }
  } else {
    resp.body = rawBody;
  }
  return resp;
}

ParsedResponse parseResponseOrThrow(std::string_view raw) {
  auto resp = parseResponse(raw);
  if (!resp) {
    throw std::runtime_error("Unable to parse response: '" + std::string(raw) + "'");
  }
  return *resp;
}

std::string buildRequest(const RequestOptions& opt) {
  std::string req;
  req.append(opt.method).append(1, ' ').append(opt.target).append(" HTTP/1.1\r\nHost: localhost\r\n");
  if (!opt.connection.empty()) {
    req.append("Connection: ").append(opt.connection).append(kCRLF);
  }
  for (const auto& [name, value] : opt.headers) {
    req.append(name).append(": ").append(value).append(kCRLF);
  }
  if (!opt.body.empty()) {
    req.append("Content-Length: ").append(std::to_string(opt.body.size())).append(kCRLF);
  }
  req.append(kCRLF).append(opt.body);
  return req;
}

std::string requestRaw(uint16_t port, const RequestOptions& opt) { return sendAndCollect(port, buildRequest(opt)); }

ParsedResponse request(uint16_t port, const RequestOptions& opt) {
  return parseResponseOrThrow(requestRaw(port, opt));
}

ParsedResponse get(uint16_t port, std::string_view target) {
  RequestOptions opt;
  opt.target = target;
  return request(port, opt);
}

std::string sendAndCollect(uint16_t port, std::string_view raw) {
  ClientConnection cnx(port);
  if (!sendAll(cnx.fd(), raw)) {
    throw std::runtime_error("Unable to send request");
  }
  return recvUntilClosed(cnx.fd());
}

}  // namespace switchyard::test

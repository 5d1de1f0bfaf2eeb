#include "switchyard/socket.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <string_view>

#include "switchyard/base-fd.hpp"
#include "switchyard/errno-throw.hpp"
#include "switchyard/log.hpp"

namespace switchyard {

namespace {

constexpr int kListenBacklog = SOMAXCONN;

void SetIntOption(int fd, int level, int optName, std::string_view optLabel) {
  static constexpr int kEnable = 1;
  if (::setsockopt(fd, level, optName, &kEnable, sizeof(kEnable)) != 0) {
    throw_errno("setsockopt({}) failed on fd # {}", optLabel, fd);
  }
}

}  // namespace

Socket::Socket(Type type) {
  int sockType = SOCK_STREAM | SOCK_CLOEXEC;
  if (type == Type::StreamNonBlock) {
    sockType |= SOCK_NONBLOCK;
  }
  _baseFd = BaseFd(::socket(AF_INET, sockType, 0));
  if (!_baseFd) {
    throw_errno("Unable to create a new socket");
  }
  log::debug("Socket fd # {} opened", _baseFd.fd());
}

void Socket::bindAndListen(std::string_view address, bool tcpNoDelay, uint16_t& port) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  const std::string addressStr(address);
  if (::inet_pton(AF_INET, addressStr.c_str(), &addr.sin_addr) != 1) {
    throw std::invalid_argument("Invalid IPv4 bind address '" + addressStr + "'");
  }

  const int fd = _baseFd.fd();
  SetIntOption(fd, SOL_SOCKET, SO_REUSEADDR, "SO_REUSEADDR");
  if (tcpNoDelay) {
    SetIntOption(fd, IPPROTO_TCP, TCP_NODELAY, "TCP_NODELAY");
  }
  if (::bind(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) != 0) {
    throw_errno("bind failed on {}:{}", addressStr, port);
  }
  if (::listen(fd, kListenBacklog) != 0) {
    throw_errno("listen failed on {}:{}", addressStr, port);
  }
  if (port == 0) {
    sockaddr_in actual{};
    socklen_t len = sizeof(actual);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&actual), &len) != 0) {
      throw_errno("getsockname failed on fd # {}", fd);
    }
    port = ntohs(actual.sin_port);
  }
  log::debug("Socket fd # {} listening on {}:{}", fd, addressStr, port);
}

BaseFd Socket::duplicate() const {
  BaseFd dupFd(::fcntl(_baseFd.fd(), F_DUPFD_CLOEXEC, 0));
  if (!dupFd) {
    throw_errno("Unable to duplicate socket fd # {}", _baseFd.fd());
  }
  return dupFd;
}

BaseFd AcceptConnection(int listenFd) noexcept {
  sockaddr_in peer{};
  socklen_t len = sizeof(peer);
  BaseFd cnxFd(::accept4(listenFd, reinterpret_cast<sockaddr*>(&peer), &len, SOCK_NONBLOCK | SOCK_CLOEXEC));
  if (!cnxFd) {
    const auto err = errno;
    if (err == EAGAIN || err == EWOULDBLOCK) {
      log::trace("No more pending connections on fd # {}", listenFd);
    } else {
      log::error("accept4 failed on fd # {}: {}", listenFd, std::strerror(err));
    }
    return cnxFd;
  }
  log::debug("Accepted connection fd # {} on listen fd # {}", cnxFd.fd(), listenFd);
  return cnxFd;
}

bool SetTcpNoDelay(int fd) noexcept {
  static constexpr int kEnable = 1;
  if (::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &kEnable, sizeof(kEnable)) != 0) {
    log::error("setsockopt(TCP_NODELAY) failed on fd # {}: {}", fd, std::strerror(errno));
    return false;
  }
  return true;
}

}  // namespace switchyard

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace switchyard {

struct ServerConfig {
  // ============================
  // Listener / socket parameters
  // ============================
  // Dotted IPv4 address to bind. Default: all interfaces.
  std::string bindAddress{"0.0.0.0"};

  // TCP port to bind. 0 (default) lets the OS pick an ephemeral free port, retrieved with Server::port().
  uint16_t port{0};

  // Disables the Nagle algorithm on the listening socket and on each accepted connection. Default: false.
  bool tcpNoDelay{false};

  // ============================
  // Threads
  // ============================
  // Number of listener threads, each running its own event loop on a handle of the same listening socket.
  // 0 (default) means max(hardware concurrency / 2, 1).
  uint32_t nbListenerThreads{0};

  // Number of worker threads executing the handlers. 0 (default) means max(hardware concurrency / 2, 1).
  uint32_t nbWorkerThreads{0};

  // ===========================================
  // Keep-Alive / connection lifecycle controls
  // ===========================================
  // When false, the server closes the connection after each response regardless of client headers.
  bool enableKeepAlive{true};

  // Maximum number of requests served over a single persistent connection before forcing close.
  uint32_t maxRequestsPerConnection{100};

  // Idle keep-alive connections are closed after this duration without a new request.
  std::chrono::milliseconds keepAliveTimeout{std::chrono::milliseconds{5000}};

  // ============================
  // Request parsing & body limits
  // ============================
  // Maximum size of the request head (request line + headers + CRLFCRLF). Exceeding it answers 431.
  std::size_t maxHeaderBytes{8192};

  // Maximum size of a request body. Exceeding it answers 413. Default: 16 MiB.
  std::size_t maxBodyBytes{1UL << 24};

  // ============================
  // Event loop & writes
  // ============================
  // Maximum duration of one event loop wait. Bounds the reaction time to stop requests and signals.
  std::chrono::milliseconds pollInterval{std::chrono::milliseconds{500}};

  // A write to a slow peer is abandoned (and the connection closed) after this duration without progress.
  std::chrono::milliseconds writeTimeout{std::chrono::milliseconds{30000}};

  ServerConfig& withBindAddress(std::string bindAddress);

  ServerConfig& withPort(uint16_t port);

  ServerConfig& withTcpNoDelay(bool tcpNoDelay = true);

  ServerConfig& withNbListenerThreads(uint32_t nbListenerThreads);

  ServerConfig& withNbWorkerThreads(uint32_t nbWorkerThreads);

  ServerConfig& withKeepAliveMode(bool enableKeepAlive = true);

  ServerConfig& withMaxRequestsPerConnection(uint32_t maxRequestsPerConnection);

  ServerConfig& withKeepAliveTimeout(std::chrono::milliseconds keepAliveTimeout);

  ServerConfig& withMaxHeaderBytes(std::size_t maxHeaderBytes);

  ServerConfig& withMaxBodyBytes(std::size_t maxBodyBytes);

  ServerConfig& withPollInterval(std::chrono::milliseconds pollInterval);

  ServerConfig& withWriteTimeout(std::chrono::milliseconds writeTimeout);

  // Throws std::invalid_argument if the configuration is not usable.
  void validate() const;

  [[nodiscard]] uint32_t resolvedListenerThreads() const noexcept;

  [[nodiscard]] uint32_t resolvedWorkerThreads() const noexcept;

  bool operator==(const ServerConfig&) const noexcept = default;
};

}  // namespace switchyard

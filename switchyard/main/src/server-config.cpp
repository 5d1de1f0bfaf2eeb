#include "switchyard/server-config.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

namespace switchyard {

namespace {

uint32_t HalfHardwareConcurrency() noexcept { return std::max(std::thread::hardware_concurrency() / 2U, 1U); }

}  // namespace

ServerConfig& ServerConfig::withBindAddress(std::string bindAddress) {
  this->bindAddress = std::move(bindAddress);
  return *this;
}

ServerConfig& ServerConfig::withPort(uint16_t port) {
  this->port = port;
  return *this;
}

ServerConfig& ServerConfig::withTcpNoDelay(bool tcpNoDelay) {
  this->tcpNoDelay = tcpNoDelay;
  return *this;
}

ServerConfig& ServerConfig::withNbListenerThreads(uint32_t nbListenerThreads) {
  this->nbListenerThreads = nbListenerThreads;
  return *this;
}

ServerConfig& ServerConfig::withNbWorkerThreads(uint32_t nbWorkerThreads) {
  this->nbWorkerThreads = nbWorkerThreads;
  return *this;
}

ServerConfig& ServerConfig::withKeepAliveMode(bool enableKeepAlive) {
  this->enableKeepAlive = enableKeepAlive;
  return *this;
}

ServerConfig& ServerConfig::withMaxRequestsPerConnection(uint32_t maxRequestsPerConnection) {
  this->maxRequestsPerConnection = maxRequestsPerConnection;
  return *this;
}

ServerConfig& ServerConfig::withKeepAliveTimeout(std::chrono::milliseconds keepAliveTimeout) {
  this->keepAliveTimeout = keepAliveTimeout;
  return *this;
}

ServerConfig& ServerConfig::withMaxHeaderBytes(std::size_t maxHeaderBytes) {
  this->maxHeaderBytes = maxHeaderBytes;
  return *this;
}

ServerConfig& ServerConfig::withMaxBodyBytes(std::size_t maxBodyBytes) {
  this->maxBodyBytes = maxBodyBytes;
  return *this;
}

ServerConfig& ServerConfig::withPollInterval(std::chrono::milliseconds pollInterval) {
  this->pollInterval = pollInterval;
  return *this;
}

ServerConfig& ServerConfig::withWriteTimeout(std::chrono::milliseconds writeTimeout) {
  this->writeTimeout = writeTimeout;
  return *this;
}

void ServerConfig::validate() const {
  if (bindAddress.empty()) {
    throw std::invalid_argument("bindAddress must not be empty");
  }
  if (maxRequestsPerConnection == 0) {
    throw std::invalid_argument("maxRequestsPerConnection must be > 0");
  }
  if (keepAliveTimeout.count() <= 0) {
    throw std::invalid_argument("keepAliveTimeout must be positive");
  }
  if (maxHeaderBytes < 128U) {
    throw std::invalid_argument("maxHeaderBytes must be >= 128");
  }
  if (pollInterval.count() <= 0 || pollInterval.count() > std::numeric_limits<int>::max()) {
    throw std::invalid_argument("pollInterval must be positive and fit in an int number of milliseconds");
  }
  if (writeTimeout.count() <= 0 || writeTimeout.count() > std::numeric_limits<int>::max()) {
    throw std::invalid_argument("writeTimeout must be positive and fit in an int number of milliseconds");
  }
}

uint32_t ServerConfig::resolvedListenerThreads() const noexcept {
  return nbListenerThreads == 0 ? HalfHardwareConcurrency() : nbListenerThreads;
}

uint32_t ServerConfig::resolvedWorkerThreads() const noexcept {
  return nbWorkerThreads == 0 ? HalfHardwareConcurrency() : nbWorkerThreads;
}

}  // namespace switchyard

#include "switchyard/server-config.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <thread>

namespace switchyard {

TEST(ServerConfig, DefaultIsValid) {
  ServerConfig config;
  EXPECT_NO_THROW(config.validate());
  EXPECT_EQ(config.bindAddress, "0.0.0.0");
  EXPECT_EQ(config.port, 0);
  EXPECT_TRUE(config.enableKeepAlive);
}

TEST(ServerConfig, Builders) {
  const auto config = ServerConfig{}
                          .withBindAddress("127.0.0.1")
                          .withPort(8080)
                          .withTcpNoDelay()
                          .withNbListenerThreads(3)
                          .withNbWorkerThreads(5)
                          .withKeepAliveMode(false)
                          .withMaxRequestsPerConnection(10)
                          .withKeepAliveTimeout(std::chrono::milliseconds{100})
                          .withMaxHeaderBytes(1024)
                          .withMaxBodyBytes(2048)
                          .withPollInterval(std::chrono::milliseconds{10})
                          .withWriteTimeout(std::chrono::milliseconds{1000});
  EXPECT_EQ(config.bindAddress, "127.0.0.1");
  EXPECT_EQ(config.port, 8080);
  EXPECT_TRUE(config.tcpNoDelay);
  EXPECT_EQ(config.resolvedListenerThreads(), 3U);
  EXPECT_EQ(config.resolvedWorkerThreads(), 5U);
  EXPECT_FALSE(config.enableKeepAlive);
  EXPECT_EQ(config.maxRequestsPerConnection, 10U);
  EXPECT_EQ(config.maxHeaderBytes, 1024U);
  EXPECT_EQ(config.maxBodyBytes, 2048U);
  EXPECT_NO_THROW(config.validate());
}

TEST(ServerConfig, ThreadCountsDefaultToHalfTheHardware) {
  const ServerConfig config;
  const auto expected = std::max(std::thread::hardware_concurrency() / 2U, 1U);
  EXPECT_EQ(config.resolvedListenerThreads(), expected);
  EXPECT_EQ(config.resolvedWorkerThreads(), expected);
  EXPECT_GE(config.resolvedWorkerThreads(), 1U);
}

TEST(ServerConfig, InvalidValues) {
  EXPECT_THROW(ServerConfig{}.withBindAddress("").validate(), std::invalid_argument);
  EXPECT_THROW(ServerConfig{}.withMaxRequestsPerConnection(0).validate(), std::invalid_argument);
  EXPECT_THROW(ServerConfig{}.withKeepAliveTimeout(std::chrono::milliseconds{0}).validate(), std::invalid_argument);
  EXPECT_THROW(ServerConfig{}.withMaxHeaderBytes(64).validate(), std::invalid_argument);
  EXPECT_THROW(ServerConfig{}.withPollInterval(std::chrono::milliseconds{0}).validate(), std::invalid_argument);
  EXPECT_THROW(ServerConfig{}.withWriteTimeout(std::chrono::milliseconds{-1}).validate(), std::invalid_argument);
}

}  // namespace switchyard

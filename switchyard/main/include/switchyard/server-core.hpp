#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

#include "switchyard/request-dispatch.hpp"
#include "switchyard/server-config.hpp"
#include "switchyard/socket.hpp"
#include "switchyard/template-engine.hpp"

namespace switchyard {

class Listener;

// Application independent part of a server: listening socket, listener threads and worker pool.
//
// The socket is bound at construction, so port() is known (and connections are queued by the kernel) before
// run() is called.
class ServerCore {
 public:
  // Validates 'config', then binds and listens.
  // Throws std::invalid_argument for an invalid configuration, std::system_error if the socket cannot be set up.
  explicit ServerCore(ServerConfig config);

  ServerCore(const ServerCore&) = delete;
  ServerCore(ServerCore&&) = delete;
  ServerCore& operator=(const ServerCore&) = delete;
  ServerCore& operator=(ServerCore&&) = delete;

  ~ServerCore();

  [[nodiscard]] uint16_t port() const noexcept { return _config.port; }

  [[nodiscard]] const ServerConfig& config() const noexcept { return _config; }

  // Template engine used by HttpResponseWriter::render(). Throws std::logic_error while running.
  void setTemplateEngine(std::shared_ptr<const TemplateEngine> templateEngine);

  [[nodiscard]] const TemplateEngine* templateEngine() const noexcept { return _templateEngine.get(); }

  // Serves requests with 'resolver' on the calling thread until stop() is called or a stop signal is received
  // (see SignalHandler). A stop requested before run() makes it return immediately.
  // Stop sequence: listeners stop and close their idle connections, then queued tasks are drained by the
  // workers before they are joined.
  // Throws std::logic_error if the server is already running. An exception ending a listener thread stops the
  // whole server and is rethrown here.
  void run(RequestResolver resolver);

  // Requests run() to return. Thread safe.
  void stop() noexcept;

  [[nodiscard]] bool isRunning() const noexcept { return _running.load(std::memory_order_acquire); }

 private:
  void wakeupListeners() noexcept;

  ServerConfig _config;
  Socket _listenSocket;
  std::shared_ptr<const TemplateEngine> _templateEngine;
  std::atomic<bool> _running{false};
  std::atomic<bool> _stopRequested{false};
  std::mutex _listenersMutex;
  std::vector<Listener*> _listeners;
};

}  // namespace switchyard

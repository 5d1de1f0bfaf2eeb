#pragma once

#include <atomic>
#include <memory>
#include <unordered_map>

#include "switchyard/base-fd.hpp"
#include "switchyard/connection.hpp"
#include "switchyard/event-loop.hpp"
#include "switchyard/http-request-parser.hpp"
#include "switchyard/http-request.hpp"
#include "switchyard/http-status-code.hpp"
#include "switchyard/request-dispatch.hpp"
#include "switchyard/server-config.hpp"
#include "switchyard/template-engine.hpp"
#include "switchyard/timedef.hpp"
#include "switchyard/worker-pool.hpp"

namespace switchyard {

// Accept-and-serve loop of one listener thread.
//
// It owns its own handle on the shared listening socket (the kernel spreads incoming connections among the
// listeners) and an epoll loop over it, over its idle connections and over its mailbox wakeup fd.
// For each complete request, it answers routing misses and malformed requests itself and submits the rest to
// the worker pool. Connections come back through the mailbox once their response is complete.
class Listener {
 public:
  // Throws std::system_error if the event loop cannot be set up.
  Listener(const ServerConfig& config, BaseFd listenFd, const RequestResolver& resolver, WorkerPool& workerPool,
           const TemplateEngine* pTemplateEngine);

  Listener(const Listener&) = delete;
  Listener(Listener&&) = delete;
  Listener& operator=(const Listener&) = delete;
  Listener& operator=(Listener&&) = delete;

  ~Listener();

  // Serves until 'stopRequested' becomes true or a stop signal is received, then closes all connections.
  void run(const std::atomic<bool>& stopRequested);

  // Makes a blocked run() re-check its stop conditions now. Thread safe.
  void wakeup() const noexcept { _mailbox->wakeup(); }

  [[nodiscard]] std::size_t nbConnections() const noexcept { return _connections.size(); }

 private:
  using ConnectionPtr = std::shared_ptr<HttpConnection>;

  void acceptNewConnections();

  void handleConnectionEvent(int fd);

  // Parses the buffered input of 'cnx' and dispatches a complete request. 'registered' tells whether the
  // connection is currently monitored by the event loop.
  void processInput(const ConnectionPtr& cnx, bool registered);

  void dispatch(const ConnectionPtr& cnx, HttpRequest request);

  // Answers from the listener thread itself. The write never waits: a peer that does not read loses its connection.
  void sendDirect(const ConnectionPtr& cnx, HttpResponseWriter::Options options, http::StatusCode statusCode);

  void handleCompletions();

  void sweepIdleConnections(SteadyTimePoint now);

  void closeConnection(int fd);

  const ServerConfig& _config;
  BaseFd _listenFd;
  EventLoop _eventLoop;
  std::shared_ptr<ListenerMailbox> _mailbox;
  HttpRequestParser _parser;
  const RequestResolver& _resolver;
  WorkerPool& _workerPool;
  const TemplateEngine* _pTemplateEngine;
  std::unordered_map<int, ConnectionPtr> _connections;
};

}  // namespace switchyard

#include "switchyard/listener.hpp"

#include <atomic>
#include <exception>
#include <memory>
#include <unordered_map>
#include <utility>

#include "switchyard/base-fd.hpp"
#include "switchyard/connection.hpp"
#include "switchyard/event-loop.hpp"
#include "switchyard/event.hpp"
#include "switchyard/http-constants.hpp"
#include "switchyard/http-method.hpp"
#include "switchyard/http-request-parser.hpp"
#include "switchyard/http-request.hpp"
#include "switchyard/http-response-writer.hpp"
#include "switchyard/http-status-code.hpp"
#include "switchyard/http-version.hpp"
#include "switchyard/log.hpp"
#include "switchyard/signal-handler.hpp"
#include "switchyard/socket.hpp"
#include "switchyard/timedef.hpp"

namespace switchyard {

namespace {

constexpr EventBmp kConnectionEvents = EventIn | EventRdHup;

}  // namespace

Listener::Listener(const ServerConfig& config, BaseFd listenFd, const RequestResolver& resolver,
                   WorkerPool& workerPool, const TemplateEngine* pTemplateEngine)
    : _config(config),
      _listenFd(std::move(listenFd)),
      _eventLoop(config.pollInterval),
      _mailbox(std::make_shared<ListenerMailbox>()),
      _parser(config.maxHeaderBytes, config.maxBodyBytes),
      _resolver(resolver),
      _workerPool(workerPool),
      _pTemplateEngine(pTemplateEngine) {
  // Exclusive wakeup: one listener per incoming connection instead of all of them.
  _eventLoop.addOrThrow(EventLoop::EventFd{_listenFd.fd(), EventIn | EventExclusive});
  _eventLoop.addOrThrow(EventLoop::EventFd{_mailbox->wakeupFd(), EventIn});
}

Listener::~Listener() {
  _mailbox->close();
  _connections.clear();
}

void Listener::run(const std::atomic<bool>& stopRequested) {
  log::debug("Listener on fd # {} started", _listenFd.fd());
  while (!stopRequested.load(std::memory_order_relaxed) && !SignalHandler::IsStopRequested()) {
    const auto events = _eventLoop.poll();
    if (events.data() == nullptr) [[unlikely]] {
      log::error("Listener on fd # {} stops after an event loop failure", _listenFd.fd());
      break;
    }
    for (const EventLoop::EventFd& event : events) {
      if (event.fd == _listenFd.fd()) {
        acceptNewConnections();
      } else if (event.fd == _mailbox->wakeupFd()) {
        _mailbox->acknowledgeWakeup();
        handleCompletions();
      } else {
        handleConnectionEvent(event.fd);
      }
    }
    sweepIdleConnections(SteadyClock::now());
  }
  log::debug("Listener on fd # {} stopping, closing {} connection(s)", _listenFd.fd(), _connections.size());
  _mailbox->close();
  _connections.clear();
}

void Listener::acceptNewConnections() {
  while (true) {
    BaseFd cnxFd = AcceptConnection(_listenFd.fd());
    if (!cnxFd) {
      break;
    }
    const int fd = cnxFd.fd();
    if (_config.tcpNoDelay) {
      SetTcpNoDelay(fd);
    }
    auto cnx = std::make_shared<HttpConnection>(std::move(cnxFd), _mailbox, _config.writeTimeout);
    if (!_eventLoop.add(EventLoop::EventFd{fd, kConnectionEvents})) {
      continue;
    }
    _connections.emplace(fd, std::move(cnx));
  }
}

void Listener::handleConnectionEvent(int fd) {
  const auto it = _connections.find(fd);
  if (it == _connections.end() || it->second->busy()) {
    return;
  }
  const ConnectionPtr cnx = it->second;
  const auto readStatus = cnx->readAvailable();
  cnx->touch(SteadyClock::now());
  switch (readStatus) {
    case HttpConnection::ReadStatus::Closed:
      closeConnection(fd);
      break;
    case HttpConnection::ReadStatus::WouldBlock:
      break;
    default:
      processInput(cnx, true);
      // half closed peer with an incomplete request: nothing more can complete it
      if (cnx->peerClosed() && !cnx->busy()) {
        closeConnection(fd);
      }
      break;
  }
}

void Listener::processInput(const ConnectionPtr& cnx, bool registered) {
  if (cnx->inBuffer().empty()) {
    return;
  }
  HttpRequest request;
  const auto result = _parser.parse(cnx->inBuffer(), request);
  if (result.status == HttpRequestParser::Status::NeedMore) {
    return;
  }
  if (registered) {
    _eventLoop.del(cnx->fd());
  }
  cnx->setBusy(true);
  if (result.status == HttpRequestParser::Status::Error) {
    log::debug("Malformed request on fd # {}, answering {}", cnx->fd(), result.errorStatus);
    sendDirect(cnx, HttpResponseWriter::Options{.keepAlive = false}, result.errorStatus);
    return;
  }
  cnx->consume(result.consumedBytes);
  dispatch(cnx, std::move(request));
}

void Listener::dispatch(const ConnectionPtr& cnx, HttpRequest request) {
  const auto nbRequests = cnx->incrementRequests();
  const HttpResponseWriter::Options options{
      .headRequest = request.method() == http::Method::HEAD,
      .keepAlive = _config.enableKeepAlive && request.keepAlive() && !cnx->peerClosed() &&
                   nbRequests < _config.maxRequestsPerConnection,
      .version = request.version(),
      .pTemplateEngine = _pTemplateEngine};

  DispatchTask task;
  try {
    task = _resolver(request);
  } catch (const std::exception& ex) {
    log::error("Routing of {} failed: {}", request.path(), ex.what());
    sendDirect(cnx, options, http::StatusCodeInternalServerError);
    return;
  }
  if (!task) {
    log::debug("No route for {} {}", http::MethodToStr(request.method()), request.path());
    sendDirect(cnx, options, http::StatusCodeNotFound);
    return;
  }

  cnx->setNonBlockingWrites(false);
  const bool submitted =
      _workerPool.submit([cnx, options, task = std::move(task), request = std::move(request)]() mutable {
        HttpResponseWriter writer(cnx, options);
        RunDispatchTask(task, request, writer);
      });
  if (!submitted) [[unlikely]] {
    log::warn("Worker pool is stopping, answering 503 on fd # {}", cnx->fd());
    sendDirect(cnx, HttpResponseWriter::Options{.headRequest = options.headRequest, .keepAlive = false},
               http::StatusCodeServiceUnavailable);
  }
}

void Listener::sendDirect(const ConnectionPtr& cnx, HttpResponseWriter::Options options,
                          http::StatusCode statusCode) {
  cnx->setNonBlockingWrites(true);
  HttpResponseWriter writer(cnx, options);
  writer.status(statusCode).contentType(http::ContentTypeTextPlain).send(http::ReasonPhraseFor(statusCode));
}

void Listener::handleCompletions() {
  const auto now = SteadyClock::now();
  for (auto& [cnx, keepAlive] : _mailbox->drain()) {
    const int fd = cnx->fd();
    const auto it = _connections.find(fd);
    if (it == _connections.end() || it->second != cnx) {
      continue;
    }
    if (!keepAlive) {
      closeConnection(fd);
      continue;
    }
    cnx->setBusy(false);
    cnx->touch(now);
    // pipelined requests already buffered are served before reading again
    processInput(cnx, false);
    if (!cnx->busy() && !_eventLoop.add(EventLoop::EventFd{fd, kConnectionEvents})) {
      closeConnection(fd);
    }
  }
}

void Listener::sweepIdleConnections(SteadyTimePoint now) {
  std::erase_if(_connections, [this, now](const auto& entry) {
    const ConnectionPtr& cnx = entry.second;
    if (cnx->busy() || now - cnx->lastActivity() < _config.keepAliveTimeout) {
      return false;
    }
    log::debug("Closing idle connection fd # {}", cnx->fd());
    _eventLoop.del(cnx->fd());
    return true;
  });
}

void Listener::closeConnection(int fd) {
  const auto it = _connections.find(fd);
  if (it == _connections.end()) {
    return;
  }
  if (!it->second->busy()) {
    _eventLoop.del(fd);
  }
  log::debug("Closing connection fd # {}", fd);
  _connections.erase(it);
}

}  // namespace switchyard

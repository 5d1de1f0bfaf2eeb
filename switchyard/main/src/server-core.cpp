#include "switchyard/server-core.hpp"

#include <atomic>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

#include "switchyard/listener.hpp"
#include "switchyard/log.hpp"
#include "switchyard/request-dispatch.hpp"
#include "switchyard/server-config.hpp"
#include "switchyard/socket.hpp"
#include "switchyard/template-engine.hpp"
#include "switchyard/worker-pool.hpp"

namespace switchyard {

namespace {

ServerConfig Validated(ServerConfig config) {
  config.validate();
  return config;
}

}  // namespace

ServerCore::ServerCore(ServerConfig config)
    : _config(Validated(std::move(config))), _listenSocket(Socket::Type::StreamNonBlock) {
  _listenSocket.bindAndListen(_config.bindAddress, _config.tcpNoDelay, _config.port);
  log::debug("Server bound to {}:{} (fd # {})", _config.bindAddress, _config.port, _listenSocket.fd());
}

ServerCore::~ServerCore() { stop(); }

void ServerCore::setTemplateEngine(std::shared_ptr<const TemplateEngine> templateEngine) {
  if (isRunning()) {
    throw std::logic_error("Cannot change the template engine of a running server");
  }
  _templateEngine = std::move(templateEngine);
}

void ServerCore::run(RequestResolver resolver) {
  if (_running.exchange(true, std::memory_order_acq_rel)) {
    throw std::logic_error("Server is already running");
  }

  const uint32_t nbListeners = _config.resolvedListenerThreads();
  const uint32_t nbWorkers = _config.resolvedWorkerThreads();
  std::exception_ptr firstError;
  std::mutex firstErrorMutex;
  try {
    WorkerPool workerPool(nbWorkers);
    std::vector<std::unique_ptr<Listener>> listeners;
    listeners.reserve(nbListeners);
    for (uint32_t listenerPos = 0; listenerPos < nbListeners; ++listenerPos) {
      listeners.push_back(std::make_unique<Listener>(_config, _listenSocket.duplicate(), resolver, workerPool,
                                                     _templateEngine.get()));
    }
    {
      std::lock_guard lock(_listenersMutex);
      for (const auto& pListener : listeners) {
        _listeners.push_back(pListener.get());
      }
    }

    log::info("Serving on {}:{} with {} listener thread(s) and {} worker thread(s)", _config.bindAddress,
              _config.port, nbListeners, nbWorkers);
    {
      std::vector<std::jthread> threads;
      threads.reserve(listeners.size());
      for (const auto& pListener : listeners) {
        threads.emplace_back([this, &listener = *pListener, &firstError, &firstErrorMutex] {
          // Called from a catch block only.
          auto recordFailure = [this, &firstError, &firstErrorMutex] {
            {
              std::lock_guard lock(firstErrorMutex);
              if (!firstError) {
                firstError = std::current_exception();
              }
            }
            stop();
          };
          try {
            listener.run(_stopRequested);
          } catch (const std::exception& ex) {
            log::error("Listener thread failed: {}", ex.what());
            recordFailure();
          } catch (...) {
            log::error("Listener thread failed with an unknown exception");
            recordFailure();
          }
        });
      }
    }

    {
      std::lock_guard lock(_listenersMutex);
      _listeners.clear();
    }
    workerPool.stop();
  } catch (...) {
    {
      std::lock_guard lock(_listenersMutex);
      _listeners.clear();
    }
    _stopRequested.store(false, std::memory_order_release);
    _running.store(false, std::memory_order_release);
    throw;
  }

  log::info("Server on port {} stopped", _config.port);
  _stopRequested.store(false, std::memory_order_release);
  _running.store(false, std::memory_order_release);
  if (firstError) {
    std::rethrow_exception(firstError);
  }
}

void ServerCore::stop() noexcept {
  if (!_stopRequested.exchange(true, std::memory_order_acq_rel)) {
    log::debug("Stop requested for server on port {}", _config.port);
  }
  wakeupListeners();
}

void ServerCore::wakeupListeners() noexcept {
  std::lock_guard lock(_listenersMutex);
  for (const Listener* pListener : _listeners) {
    pListener->wakeup();
  }
}

}  // namespace switchyard

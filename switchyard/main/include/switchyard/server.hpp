#pragma once

#include <concepts>
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

#include "switchyard/application-factory.hpp"
#include "switchyard/http-constants.hpp"
#include "switchyard/http-request.hpp"
#include "switchyard/http-response-writer.hpp"
#include "switchyard/http-status-code.hpp"
#include "switchyard/log.hpp"
#include "switchyard/path-handlers.hpp"
#include "switchyard/request-dispatch.hpp"
#include "switchyard/router.hpp"
#include "switchyard/server-config.hpp"
#include "switchyard/server-core.hpp"
#include "switchyard/template-engine.hpp"

namespace switchyard {

// HTTP server whose handlers work on a per-request instance of App.
//
// Usage:
//   Server<MyApp> server(ServerConfig{}.withPort(8080));
//   server.router().get("/hello/:name", &MyApp::hello).mountStatic("/static", StaticFileHandler("web"));
//   server.start();  // blocks until stop()
//
// For each routed request, a worker thread creates the App instance (default constructed with start(),
// copied from the seed with startWith()), calls the middleware on it, then the matched handler.
// A failure to create the instance answers 500 to that request only.
template <class App>
class Server {
 public:
  // Binds and listens, see ServerCore.
  explicit Server(ServerConfig config, Router<App> router = {})
      : _core(std::move(config)), _router(std::move(router)) {}

  // Routes can only be changed while not serving. Throws std::logic_error otherwise.
  Router<App>& router() {
    if (_core.isRunning()) {
      throw std::logic_error("Routes cannot be changed while the server is running");
    }
    return _router;
  }

  [[nodiscard]] const Router<App>& router() const noexcept { return _router; }

  void setTemplateEngine(std::shared_ptr<const TemplateEngine> templateEngine) {
    _core.setTemplateEngine(std::move(templateEngine));
  }

  // Serves with a fresh App per request. Blocks until stop().
  void start()
    requires std::default_initializable<App>
  {
    serve(ApplicationFactory<App>::Fresh());
  }

  // Serves with a copy of 'seed' per request. Blocks until stop().
  void startWith(App seed)
    requires std::copy_constructible<App>
  {
    serve(ApplicationFactory<App>::Cloning(std::move(seed)));
  }

  // Thread safe.
  void stop() noexcept { _core.stop(); }

  [[nodiscard]] bool isRunning() const noexcept { return _core.isRunning(); }

  [[nodiscard]] uint16_t port() const noexcept { return _core.port(); }

  [[nodiscard]] const ServerConfig& config() const noexcept { return _core.config(); }

 private:
  void serve(ApplicationFactory<App> factory) {
    _core.run([this, &factory](HttpRequest& request) -> DispatchTask {
      auto routingResult = _router.match(request.method(), request.path());
      if (!routingResult) {
        return {};
      }
      request.setPathParams(std::move(routingResult->params));
      return std::visit(
          [this, &factory](const auto& handler) -> DispatchTask {
            using HandlerType = std::decay_t<decltype(handler)>;
            if constexpr (std::is_same_v<HandlerType, StaticHandler>) {
              return [&handler](HttpRequest& req, HttpResponseWriter& writer) { handler(req, writer); };
            } else {
              return [this, &handler, &factory](HttpRequest& req, HttpResponseWriter& writer) {
                runInstanceHandler(factory, handler, req, writer);
              };
            }
          },
          *routingResult->pHandler);
    });
  }

  void runInstanceHandler(const ApplicationFactory<App>& factory, const InstanceHandler<App>& handler,
                          HttpRequest& request, HttpResponseWriter& writer) const {
    std::optional<App> app;
    try {
      app.emplace(factory.create());
    } catch (const std::exception& ex) {
      log::error("Unable to create the application instance for {}: {}", request.path(), ex.what());
      SendConstructionFailure(writer);
      return;
    } catch (...) {
      log::error("Unable to create the application instance for {}: unknown exception", request.path());
      SendConstructionFailure(writer);
      return;
    }
    if (const auto& middleware = _router.middleware(); middleware) {
      middleware(*app, request);
    }
    handler(*app, request, writer);
  }

  static void SendConstructionFailure(HttpResponseWriter& writer) {
    writer.status(http::StatusCodeInternalServerError)
        .contentType(http::ContentTypeTextPlain)
        .send(http::ReasonPhraseFor(http::StatusCodeInternalServerError));
  }

  ServerCore _core;
  Router<App> _router;
};

}  // namespace switchyard
